//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "plugin/device_plugin.hpp"

#include "gpushare/platform/posix_utils.hpp"
#include "plugin/device.hpp"
#include "plugin/plugin_config.hpp"
#include "plugin/plugin_server.hpp"
#include "plugin/resource_manager.hpp"
#include "plugin/stop_signal.hpp"
#include "plugin_gtest_helpers.hpp"
#include "resource_manager_mock.hpp"

#include <deviceplugin/v1beta1/api.grpc.pb.h>
#include <deviceplugin/v1beta1/api.pb.h>

#include <cetl/pf17/cetlpf.hpp>

#include <grpcpp/grpcpp.h>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <chrono>
#include <condition_variable>
#include <cstdlib>
#include <fstream>
#include <memory>
#include <mutex>
#include <string>
#include <unistd.h>
#include <utility>
#include <vector>

namespace
{

using namespace gpushare::daemon::engine::plugin;  // NOLINT This our main concern here in the unit tests.

using gpushare::platform::pathExists;

using testing::_;
using testing::Pair;
using testing::Return;
using testing::Invoke;
using testing::IsEmpty;
using testing::HasSubstr;
using testing::StrictMock;
using testing::ElementsAre;

// https://github.com/llvm/llvm-project/issues/53444
// NOLINTBEGIN(misc-unused-using-decls, misc-include-cleaner)
using std::literals::chrono_literals::operator""s;
using std::literals::chrono_literals::operator""ms;
// NOLINTEND(misc-unused-using-decls, misc-include-cleaner)

// NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

/// Kubelet registration endpoint which records the requests.
///
class FakeKubelet final : public v1beta1::Registration::Service
{
public:
    grpc::Status Register(grpc::ServerContext*,
                          const v1beta1::RegisterRequest* request,
                          v1beta1::Empty*) override
    {
        const std::lock_guard<std::mutex> lock{mutex_};
        requests_.push_back(*request);
        return status_;
    }

    void reject(const std::string& message)
    {
        const std::lock_guard<std::mutex> lock{mutex_};
        status_ = grpc::Status{grpc::StatusCode::INVALID_ARGUMENT, message};
    }

    std::vector<v1beta1::RegisterRequest> requests() const
    {
        const std::lock_guard<std::mutex> lock{mutex_};
        return requests_;
    }

private:
    mutable std::mutex                    mutex_;
    grpc::Status                          status_{grpc::Status::OK};
    std::vector<v1beta1::RegisterRequest> requests_;

};  // FakeKubelet

class TestDevicePlugin : public testing::Test
{
protected:
    void SetUp() override
    {
        std::string dir_template{"/tmp/gpushare-XXXXXX"};
        ASSERT_THAT(::mkdtemp(&dir_template[0]), testing::NotNull());
        temp_dir_ = dir_template;

        config_.resource_name       = "nvidia.com/gpu";
        config_.socket_path         = temp_dir_ + "/plugin.sock";
        config_.kubelet_socket_path = temp_dir_ + "/kubelet.sock";
        config_.replication         = ReplicationPolicy{2, false};

        devices_ = {makeDevice("GPU-a", "0"), makeDevice("GPU-b", "1")};
    }

    void TearDown() override
    {
        if (plugin_)
        {
            EXPECT_CALL(rm_mock_, deinit()).Times(1);
            plugin_.reset();
        }
        if (kubelet_server_)
        {
            kubelet_server_->Shutdown();
            kubelet_server_.reset();
        }
        (void) gpushare::platform::removeFileIfExists(config_.kubelet_socket_path);
        (void) gpushare::platform::removeFileIfExists(config_.socket_path);
        (void) ::rmdir(temp_dir_.c_str());
    }

    void startKubelet()
    {
        grpc::ServerBuilder builder;
        builder.AddListeningPort("unix:" + config_.kubelet_socket_path, grpc::InsecureServerCredentials());
        builder.RegisterService(&kubelet_);
        kubelet_server_ = builder.BuildAndStart();
        ASSERT_THAT(kubelet_server_, testing::NotNull());
    }

    void makePlugin()
    {
        plugin_ = DevicePlugin::make(
            config_,
            ResourceManagerMock::wrap(rm_mock_),
            nullptr,
            [this](const std::string& reason) {
                //
                const std::lock_guard<std::mutex> lock{mutex_};
                fatal_reasons_.push_back(reason);
            },
            [](const std::string&) { return false; });
    }

    /// Expects one health watching session, which captures the unhealthy handler and blocks until stopped.
    ///
    void expectHealthChecking()
    {
        EXPECT_CALL(rm_mock_, checkHealth(_, ElementsAre(DeviceIdIs("GPU-a"), DeviceIdIs("GPU-b")), _))
            .WillOnce(Invoke([this](const StopSignal&                       stop,
                                    const Devices&,
                                    const ResourceManager::UnhealthyHandler& on_unhealthy) {
                {
                    const std::lock_guard<std::mutex> lock{mutex_};
                    on_unhealthy_ = on_unhealthy;
                }
                cv_.notify_all();
                while (!stop.waitFor(10ms))
                {
                }
            }));
    }

    ResourceManager::UnhealthyHandler waitForHealthChecking()
    {
        std::unique_lock<std::mutex> lock{mutex_};
        cv_.wait_for(lock, 5s, [this] { return static_cast<bool>(on_unhealthy_); });
        return on_unhealthy_;
    }

    void startPlugin()
    {
        startKubelet();
        makePlugin();
        EXPECT_CALL(rm_mock_, devices()).WillOnce(Return(devices_));
        expectHealthChecking();
        const auto failure = plugin_->start();
        ASSERT_FALSE(failure.has_value()) << failure.value();
        ASSERT_TRUE(plugin_->isStarted());
    }

    std::unique_ptr<v1beta1::DevicePlugin::Stub> makeStub() const
    {
        const auto channel = dialUnixSocket(config_.socket_path, 5s);
        EXPECT_THAT(channel, testing::NotNull());
        return v1beta1::DevicePlugin::NewStub(channel);
    }

    static std::vector<std::pair<std::string, std::string>> devicesOf(const v1beta1::ListAndWatchResponse& response)
    {
        std::vector<std::pair<std::string, std::string>> devices;
        for (const auto& device : response.devices())
        {
            devices.emplace_back(device.id(), device.health());
        }
        return devices;
    }

    // NOLINTBEGIN
    std::string                       temp_dir_;
    PluginConfig                      config_;
    Devices                           devices_;
    StrictMock<ResourceManagerMock>   rm_mock_;
    FakeKubelet                       kubelet_;
    std::unique_ptr<grpc::Server>     kubelet_server_;
    DevicePlugin::Ptr                 plugin_;
    std::mutex                        mutex_;
    std::condition_variable           cv_;
    ResourceManager::UnhealthyHandler on_unhealthy_;
    std::vector<std::string>          fatal_reasons_;
    // NOLINTEND
};

// MARK: - Tests:

TEST_F(TestDevicePlugin, start_serves_and_registers)
{
    startPlugin();

    EXPECT_TRUE(pathExists(config_.socket_path));

    const auto requests = kubelet_.requests();
    ASSERT_THAT(requests.size(), 1);
    EXPECT_THAT(requests[0].version(), "v1beta1");
    EXPECT_THAT(requests[0].endpoint(), "plugin.sock");
    EXPECT_THAT(requests[0].resource_name(), "nvidia.com/gpu");
    EXPECT_TRUE(requests[0].options().get_preferred_allocation_available());

    EXPECT_TRUE(waitForHealthChecking());

    const auto failure = plugin_->start();
    EXPECT_THAT(failure, testing::Optional(HasSubstr("already started")));
}

TEST_F(TestDevicePlugin, list_and_watch_follows_health)
{
    startPlugin();
    const auto on_unhealthy = waitForHealthChecking();
    ASSERT_TRUE(on_unhealthy);

    const auto          stub = makeStub();
    grpc::ClientContext context;
    const auto          reader = stub->ListAndWatch(&context, v1beta1::Empty{});

    v1beta1::ListAndWatchResponse response;
    ASSERT_TRUE(reader->Read(&response));
    EXPECT_THAT(devicesOf(response),
                ElementsAre(Pair("GPU-a::0", "Healthy"),
                            Pair("GPU-a::1", "Healthy"),
                            Pair("GPU-b::0", "Healthy"),
                            Pair("GPU-b::1", "Healthy")));

    on_unhealthy("GPU-b");
    ASSERT_TRUE(reader->Read(&response));
    EXPECT_THAT(devicesOf(response),
                ElementsAre(Pair("GPU-a::0", "Healthy"),
                            Pair("GPU-a::1", "Healthy"),
                            Pair("GPU-b::0", "Unhealthy"),
                            Pair("GPU-b::1", "Unhealthy")));

    // Stopping the plugin ends the stream.
    EXPECT_FALSE(plugin_->stop().has_value());
    EXPECT_FALSE(reader->Read(&response));
    EXPECT_TRUE(reader->Finish().ok());
}

TEST_F(TestDevicePlugin, options_and_allocate)
{
    startPlugin();
    const auto stub = makeStub();

    {
        grpc::ClientContext          context;
        v1beta1::DevicePluginOptions options;
        ASSERT_TRUE(stub->GetDevicePluginOptions(&context, v1beta1::Empty{}, &options).ok());
        EXPECT_TRUE(options.get_preferred_allocation_available());
        EXPECT_FALSE(options.pre_start_required());
    }
    {
        grpc::ClientContext                context;
        v1beta1::PreStartContainerRequest  request;
        v1beta1::PreStartContainerResponse response;
        request.add_devices_ids("GPU-a::0");
        EXPECT_TRUE(stub->PreStartContainer(&context, request, &response).ok());
    }
    {
        v1beta1::AllocateRequest request;
        auto* const              container = request.add_container_requests();
        container->add_devices_ids("GPU-b::1");
        container->add_devices_ids("GPU-b::0");
        container->add_devices_ids("GPU-a::0");

        grpc::ClientContext       context;
        v1beta1::AllocateResponse response;
        ASSERT_TRUE(stub->Allocate(&context, request, &response).ok());
        ASSERT_THAT(response.container_responses_size(), 1);
        const auto& envs = response.container_responses(0).envs();
        ASSERT_THAT(envs.count("NVIDIA_VISIBLE_DEVICES"), 1);
        EXPECT_THAT(envs.at("NVIDIA_VISIBLE_DEVICES"), "GPU-b,GPU-a");
    }
    {
        v1beta1::AllocateRequest request;
        request.add_container_requests()->add_devices_ids("GPU-z::0");

        grpc::ClientContext       context;
        v1beta1::AllocateResponse response;
        const auto                status = stub->Allocate(&context, request, &response);
        EXPECT_THAT(status.error_code(), grpc::StatusCode::INVALID_ARGUMENT);
        EXPECT_THAT(status.error_message(), HasSubstr("unknown device: GPU-z::0"));
    }
}

TEST_F(TestDevicePlugin, preferred_allocation)
{
    startPlugin();
    const auto stub = makeStub();

    v1beta1::PreferredAllocationRequest request;
    for (int i = 0; i < 2; ++i)
    {
        auto* const container = request.add_container_requests();
        for (const auto* const id : {"GPU-a::0", "GPU-a::1", "GPU-b::0", "GPU-b::1"})
        {
            container->add_available_deviceids(id);
        }
        container->set_allocation_size(1);
    }

    grpc::ClientContext                  context;
    v1beta1::PreferredAllocationResponse response;
    ASSERT_TRUE(stub->GetPreferredAllocation(&context, request, &response).ok());
    ASSERT_THAT(response.container_responses_size(), 2);
    EXPECT_THAT(response.container_responses(0).deviceids(), ElementsAre("GPU-a::0"));
    EXPECT_THAT(response.container_responses(1).deviceids(), ElementsAre("GPU-b::0"));
}

TEST_F(TestDevicePlugin, preferred_allocation_unimplemented_without_replicas_and_policy)
{
    config_.replication = ReplicationPolicy{1, false};
    startPlugin();
    const auto stub = makeStub();

    v1beta1::PreferredAllocationRequest request;
    auto* const                         container = request.add_container_requests();
    container->add_available_deviceids("GPU-a");
    container->add_available_deviceids("GPU-b");
    container->set_allocation_size(1);

    grpc::ClientContext                  context;
    v1beta1::PreferredAllocationResponse response;
    const auto                           status = stub->GetPreferredAllocation(&context, request, &response);
    EXPECT_THAT(status.error_code(), grpc::StatusCode::UNIMPLEMENTED);
    EXPECT_THAT(status.error_message(), HasSubstr("not implemented"));
}

TEST_F(TestDevicePlugin, stop_is_idempotent_and_removes_socket)
{
    startPlugin();
    EXPECT_TRUE(waitForHealthChecking());

    EXPECT_FALSE(plugin_->stop().has_value());
    EXPECT_FALSE(plugin_->isStarted());
    EXPECT_FALSE(pathExists(config_.socket_path));

    EXPECT_FALSE(plugin_->stop().has_value());
    EXPECT_FALSE(pathExists(config_.socket_path));

    // A stopped plugin serves nothing.
    v1beta1::AllocateRequest  request;
    v1beta1::AllocateResponse response;
    request.add_container_requests()->add_devices_ids("GPU-a::0");
    EXPECT_THAT(plugin_->Allocate(nullptr, &request, &response).error_code(), grpc::StatusCode::UNAVAILABLE);
}

TEST_F(TestDevicePlugin, restart_starts_new_session)
{
    startPlugin();
    const auto first_handler = waitForHealthChecking();
    ASSERT_TRUE(first_handler);
    first_handler("GPU-a");
    EXPECT_FALSE(plugin_->stop().has_value());

    {
        const std::lock_guard<std::mutex> lock{mutex_};
        on_unhealthy_ = nullptr;
    }
    EXPECT_CALL(rm_mock_, devices()).WillOnce(Return(devices_));
    expectHealthChecking();
    const auto failure = plugin_->start();
    ASSERT_FALSE(failure.has_value()) << failure.value();
    EXPECT_TRUE(waitForHealthChecking());
    EXPECT_THAT(kubelet_.requests().size(), 2);

    const auto          stub = makeStub();
    grpc::ClientContext context;
    const auto          reader = stub->ListAndWatch(&context, v1beta1::Empty{});

    v1beta1::ListAndWatchResponse response;
    ASSERT_TRUE(reader->Read(&response));
    for (const auto& device : devicesOf(response))
    {
        EXPECT_THAT(device.second, "Healthy") << device.first;
    }

    EXPECT_FALSE(plugin_->stop().has_value());
    EXPECT_FALSE(reader->Read(&response));
    EXPECT_TRUE(reader->Finish().ok());
}

TEST_F(TestDevicePlugin, start_replaces_stale_socket_file)
{
    {
        std::ofstream stale{config_.socket_path};
        stale << "left over by a previous run";
    }
    ASSERT_TRUE(pathExists(config_.socket_path));

    startPlugin();
    EXPECT_TRUE(waitForHealthChecking());

    const auto                   stub = makeStub();
    grpc::ClientContext          context;
    v1beta1::DevicePluginOptions options;
    EXPECT_TRUE(stub->GetDevicePluginOptions(&context, v1beta1::Empty{}, &options).ok());
}

TEST_F(TestDevicePlugin, rejected_registration_fails_start)
{
    startKubelet();
    kubelet_.reject("nope");
    makePlugin();
    EXPECT_CALL(rm_mock_, devices()).WillOnce(Return(devices_));

    const auto failure = plugin_->start();
    EXPECT_THAT(failure, testing::Optional(HasSubstr("nope")));
    EXPECT_FALSE(plugin_->isStarted());
    EXPECT_FALSE(pathExists(config_.socket_path));
    EXPECT_THAT(kubelet_.requests().size(), 1);
}

TEST_F(TestDevicePlugin, missing_kubelet_fails_start)
{
    makePlugin();
    EXPECT_CALL(rm_mock_, devices()).WillOnce(Return(devices_));

    const auto failure = plugin_->start();
    EXPECT_THAT(failure, testing::Optional(HasSubstr("kubelet socket")));
    EXPECT_FALSE(plugin_->isStarted());
    EXPECT_FALSE(pathExists(config_.socket_path));

    const std::lock_guard<std::mutex> lock{mutex_};
    EXPECT_THAT(fatal_reasons_, IsEmpty());
}

// NOLINTEND(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

}  // namespace
