//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "device_plugin.hpp"

#include "allocation_resolver.hpp"
#include "common_helpers.hpp"
#include "gpushare/platform/posix_utils.hpp"
#include "plugin_server.hpp"
#include "resource_materializer.hpp"
#include "session_state.hpp"
#include "stop_signal.hpp"

#include <deviceplugin/v1beta1/api.grpc.pb.h>
#include <deviceplugin/v1beta1/api.pb.h>

#include <cetl/pf17/cetlpf.hpp>

#include <grpcpp/grpcpp.h>

#include <chrono>
#include <cstddef>
#include <cstring>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace gpushare
{
namespace daemon
{
namespace engine
{
namespace plugin
{
namespace
{

std::string baseNameOf(const std::string& path)
{
    const auto slash_pos = path.rfind('/');
    return (slash_pos == std::string::npos) ? path : path.substr(slash_pos + 1);
}

v1beta1::ListAndWatchResponse makeListAndWatchResponse(const SessionState::Snapshot& snapshot)
{
    v1beta1::ListAndWatchResponse response;
    for (const auto& device : snapshot.devices)
    {
        auto* const api_device = response.add_devices();
        api_device->set_id(device.id);
        api_device->set_health(healthToString(device.health));
    }
    return response;
}

void fillContainerResponse(const ContainerAllocation& allocation, v1beta1::ContainerAllocateResponse& response)
{
    auto& envs = *response.mutable_envs();
    for (const auto& env : allocation.envs)
    {
        envs[env.first] = env.second;
    }
    for (const auto& mount : allocation.mounts)
    {
        auto* const api_mount = response.add_mounts();
        api_mount->set_container_path(mount.container_path);
        api_mount->set_host_path(mount.host_path);
    }
    for (const auto& spec : allocation.device_specs)
    {
        auto* const api_spec = response.add_devices();
        api_spec->set_container_path(spec.container_path);
        api_spec->set_host_path(spec.host_path);
        api_spec->set_permissions(spec.permissions);
    }
}

}  // namespace

constexpr std::chrono::milliseconds DevicePlugin::DialTimeout;
constexpr std::chrono::milliseconds DevicePlugin::WatchPollPeriod;

DevicePlugin::Session::Session(const PluginConfig&        config,
                               Devices                    devices,
                               const AllocatePolicy::Ptr& policy,
                               const PathExistsPredicate& path_exists)
    : state{SessionState::make(std::move(devices), config.replication)}
    , resolver{config, state, policy, path_exists}
{
}

DevicePlugin::Ptr DevicePlugin::make(PluginConfig               config,
                                     ResourceManager::Ptr       resource_manager,
                                     AllocatePolicy::Ptr        policy,
                                     PluginServer::FatalHandler on_fatal,
                                     PathExistsPredicate        path_exists)
{
    return std::make_unique<DevicePlugin>(std::move(config),
                                          std::move(resource_manager),
                                          std::move(policy),
                                          std::move(on_fatal),
                                          std::move(path_exists));
}

DevicePlugin::DevicePlugin(PluginConfig               config,
                           ResourceManager::Ptr       resource_manager,
                           AllocatePolicy::Ptr        policy,
                           PluginServer::FatalHandler on_fatal,
                           PathExistsPredicate        path_exists)
    : config_{std::move(config)}
    , resource_manager_{std::move(resource_manager)}
    , policy_{std::move(policy)}
    , on_fatal_{std::move(on_fatal)}
    , path_exists_{std::move(path_exists)}
{
    CETL_DEBUG_ASSERT(resource_manager_, "");
}

DevicePlugin::~DevicePlugin()
{
    if (const auto failure = stop())
    {
        logger_->warn("Failed to stop plugin for '{}': {}", config_.resource_name, failure.value());
    }
}

cetl::optional<std::string> DevicePlugin::start()
{
    if (isStarted())
    {
        return "Plugin for '" + config_.resource_name + "' is already started.";
    }

    auto session = std::make_shared<Session>(config_, resource_manager_->devices(), policy_, path_exists_);
    const auto devices = session->state->devices();
    {
        const std::lock_guard<std::mutex> lock{session_mutex_};
        session_ = session;
    }
    health_stop_ = std::make_unique<StopSignal>();
    server_      = std::make_unique<PluginServer>(config_.socket_path, *this, on_fatal_);

    if (auto failure = server_->serve())
    {
        logger_->error("Could not start device plugin for '{}': {}", config_.resource_name, failure.value());
        if (const auto stop_failure = stop())
        {
            logger_->warn("{}", stop_failure.value());
        }
        return failure;
    }
    logger_->info("Starting to serve '{}' on '{}'.", config_.resource_name, config_.socket_path);

    if (auto failure = registerWithKubelet())
    {
        logger_->error("Could not register device plugin: {}", failure.value());
        if (const auto stop_failure = stop())
        {
            logger_->warn("{}", stop_failure.value());
        }
        return failure;
    }
    logger_->info("Registered device plugin for '{}' with Kubelet.", config_.resource_name);

    health_thread_ = std::thread{[this, devices] {
        //
        const bool ok = common::performWithoutThrowing([this, &devices] {
            //
            resource_manager_->checkHealth(*health_stop_, devices, [this](const std::string& device_id) {
                //
                onUnhealthy(device_id);
            });
        });
        if (!ok)
        {
            logger_->error("Health checking of '{}' devices has failed.", config_.resource_name);
        }
    }};

    return cetl::nullopt;
}

cetl::optional<std::string> DevicePlugin::stop()
{
    std::shared_ptr<Session> session;
    {
        const std::lock_guard<std::mutex> lock{session_mutex_};
        session = session_;
    }
    if (!session && !server_)
    {
        return cetl::nullopt;
    }
    logger_->info("Stopping to serve '{}' on '{}'.", config_.resource_name, config_.socket_path);

    // Unblock all list-and-watch streams first, so that the server shutdown doesn't wait for them.
    if (session)
    {
        session->state->close();
    }
    if (health_stop_)
    {
        health_stop_->request();
    }
    if (server_)
    {
        server_->stop();
    }

    cetl::optional<std::string> failure;
    if (const auto err = platform::removeFileIfExists(config_.socket_path))
    {
        failure = "Failed to remove socket '" + config_.socket_path + "': " + std::strerror(err);
    }

    if (health_thread_.joinable())
    {
        health_thread_.join();
    }
    server_.reset();
    health_stop_.reset();
    {
        const std::lock_guard<std::mutex> lock{session_mutex_};
        session_.reset();
    }
    return failure;
}

bool DevicePlugin::isStarted() const
{
    const std::lock_guard<std::mutex> lock{session_mutex_};
    return static_cast<bool>(session_);
}

cetl::optional<std::string> DevicePlugin::registerWithKubelet() const
{
    const auto channel = dialUnixSocket(config_.kubelet_socket_path, DialTimeout);
    if (!channel)
    {
        return "Failed to connect to kubelet socket '" + config_.kubelet_socket_path + "'.";
    }

    v1beta1::RegisterRequest request;
    request.set_version(DevicePluginApiVersion);
    request.set_endpoint(baseNameOf(config_.socket_path));
    request.set_resource_name(config_.resource_name);
    request.mutable_options()->set_get_preferred_allocation_available(config_.isPreferredAllocationAvailable());

    grpc::ClientContext context;
    context.set_deadline(std::chrono::system_clock::now() + DialTimeout);

    v1beta1::Empty response;
    const auto     stub   = v1beta1::Registration::NewStub(channel);
    const auto     status = stub->Register(&context, request, &response);
    if (!status.ok())
    {
        return "Kubelet has rejected registration of '" + config_.resource_name + "' (code=" +
               std::to_string(status.error_code()) + "): " + status.error_message();
    }
    return cetl::nullopt;
}

std::shared_ptr<DevicePlugin::Session> DevicePlugin::currentSession() const
{
    const std::lock_guard<std::mutex> lock{session_mutex_};
    return session_;
}

void DevicePlugin::onUnhealthy(const std::string& device_id)
{
    const auto session = currentSession();
    if (session && session->state->markUnhealthy(device_id))
    {
        logger_->warn("'{}' device marked unhealthy: {}", config_.resource_name, device_id);
    }
}

grpc::Status DevicePlugin::toStatus(const ResolveFailure& failure)
{
    switch (failure.code)
    {
    case ResolveFailure::Code::Unimplemented:
        return grpc::Status{grpc::StatusCode::UNIMPLEMENTED, failure.message};
    case ResolveFailure::Code::UnknownDevice:
        return grpc::Status{grpc::StatusCode::INVALID_ARGUMENT, failure.message};
    }
    return grpc::Status{grpc::StatusCode::UNKNOWN, failure.message};
}

grpc::Status DevicePlugin::GetDevicePluginOptions(grpc::ServerContext*,
                                                  const v1beta1::Empty*,
                                                  v1beta1::DevicePluginOptions* response)
{
    response->set_get_preferred_allocation_available(config_.isPreferredAllocationAvailable());
    return grpc::Status::OK;
}

grpc::Status DevicePlugin::ListAndWatch(grpc::ServerContext* context,
                                        const v1beta1::Empty*,
                                        grpc::ServerWriter<v1beta1::ListAndWatchResponse>* writer)
{
    const auto session = currentSession();
    if (!session)
    {
        return grpc::Status{grpc::StatusCode::UNAVAILABLE, "Plugin is not started."};
    }
    auto& state = *session->state;

    auto snapshot = state.snapshot();
    logger_->debug("List-and-watch of '{}' has started (devices={}).", config_.resource_name, snapshot.devices.size());
    if (!writer->Write(makeListAndWatchResponse(snapshot)))
    {
        return grpc::Status::OK;
    }

    while (true)
    {
        switch (state.waitForChange(snapshot.generation, WatchPollPeriod))
        {
        case SessionState::WaitResult::Closed:
            logger_->debug("List-and-watch of '{}' has ended.", config_.resource_name);
            return grpc::Status::OK;

        case SessionState::WaitResult::Timeout:
            if (context->IsCancelled())
            {
                logger_->debug("List-and-watch of '{}' is cancelled by client.", config_.resource_name);
                return grpc::Status::CANCELLED;
            }
            break;

        case SessionState::WaitResult::Changed:
            snapshot = state.snapshot();
            if (!writer->Write(makeListAndWatchResponse(snapshot)))
            {
                return grpc::Status::OK;
            }
            break;
        }
    }
}

grpc::Status DevicePlugin::GetPreferredAllocation(grpc::ServerContext*,
                                                  const v1beta1::PreferredAllocationRequest* request,
                                                  v1beta1::PreferredAllocationResponse*      response)
{
    const auto session = currentSession();
    if (!session)
    {
        return grpc::Status{grpc::StatusCode::UNAVAILABLE, "Plugin is not started."};
    }

    std::vector<PreferredAllocationRequest> requests;
    requests.reserve(static_cast<std::size_t>(request->container_requests_size()));
    for (const auto& container_request : request->container_requests())
    {
        const auto size = (container_request.allocation_size() > 0)
                              ? static_cast<std::size_t>(container_request.allocation_size())
                              : std::size_t{0};
        requests.push_back(PreferredAllocationRequest{{container_request.available_deviceids().begin(),
                                                       container_request.available_deviceids().end()},
                                                      {container_request.must_include_deviceids().begin(),
                                                       container_request.must_include_deviceids().end()},
                                                      size});
    }

    auto result = session->resolver.preferredAllocation(requests);
    if (const auto* const failure = cetl::get_if<AllocationResolver::PreferredResult::Failure>(&result))
    {
        return toStatus(*failure);
    }

    for (const auto& ids : cetl::get<AllocationResolver::PreferredResult::Success>(result))
    {
        auto* const container_response = response->add_container_responses();
        for (const auto& id : ids)
        {
            container_response->add_deviceids(id);
        }
    }
    return grpc::Status::OK;
}

grpc::Status DevicePlugin::Allocate(grpc::ServerContext*,
                                    const v1beta1::AllocateRequest* request,
                                    v1beta1::AllocateResponse*      response)
{
    const auto session = currentSession();
    if (!session)
    {
        return grpc::Status{grpc::StatusCode::UNAVAILABLE, "Plugin is not started."};
    }

    std::vector<std::vector<std::string>> requests;
    requests.reserve(static_cast<std::size_t>(request->container_requests_size()));
    for (const auto& container_request : request->container_requests())
    {
        requests.emplace_back(container_request.devices_ids().begin(), container_request.devices_ids().end());
    }

    auto result = session->resolver.allocate(requests);
    if (const auto* const failure = cetl::get_if<AllocationResolver::AllocateResult::Failure>(&result))
    {
        return toStatus(*failure);
    }

    for (const auto& allocation : cetl::get<AllocationResolver::AllocateResult::Success>(result))
    {
        fillContainerResponse(allocation, *response->add_container_responses());
    }
    return grpc::Status::OK;
}

grpc::Status DevicePlugin::PreStartContainer(grpc::ServerContext*,
                                             const v1beta1::PreStartContainerRequest*,
                                             v1beta1::PreStartContainerResponse*)
{
    return grpc::Status::OK;
}

}  // namespace plugin
}  // namespace engine
}  // namespace daemon
}  // namespace gpushare
