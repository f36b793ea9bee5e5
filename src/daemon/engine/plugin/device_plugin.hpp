//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef GPUSHARE_DAEMON_ENGINE_PLUGIN_DEVICE_PLUGIN_HPP_INCLUDED
#define GPUSHARE_DAEMON_ENGINE_PLUGIN_DEVICE_PLUGIN_HPP_INCLUDED

#include "allocate_policy.hpp"
#include "allocation_resolver.hpp"
#include "plugin_config.hpp"
#include "plugin_server.hpp"
#include "resource_manager.hpp"
#include "resource_materializer.hpp"
#include "session_state.hpp"
#include "stop_signal.hpp"

#include "logging.hpp"

#include <deviceplugin/v1beta1/api.grpc.pb.h>
#include <deviceplugin/v1beta1/api.pb.h>

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <grpcpp/grpcpp.h>

#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace gpushare
{
namespace daemon
{
namespace engine
{
namespace plugin
{

constexpr const char* DevicePluginApiVersion = "v1beta1";

/// Serves one resource to the kubelet.
///
/// Each `start`/`stop` segment has its own session: devices & replicas, gRPC server and health watcher.
/// `start` and `stop` must not be called concurrently; gRPC handlers may run concurrently with anything.
///
class DevicePlugin final : public v1beta1::DevicePlugin::Service
{
public:
    using Ptr = std::unique_ptr<DevicePlugin>;

    static constexpr std::chrono::milliseconds DialTimeout{5000};
    static constexpr std::chrono::milliseconds WatchPollPeriod{1000};

    CETL_NODISCARD static Ptr make(PluginConfig               config,
                                   ResourceManager::Ptr       resource_manager,
                                   AllocatePolicy::Ptr        policy,
                                   PluginServer::FatalHandler on_fatal,
                                   PathExistsPredicate        path_exists);

    DevicePlugin(PluginConfig               config,
                 ResourceManager::Ptr       resource_manager,
                 AllocatePolicy::Ptr        policy,
                 PluginServer::FatalHandler on_fatal,
                 PathExistsPredicate        path_exists);

    DevicePlugin(const DevicePlugin&)                = delete;
    DevicePlugin(DevicePlugin&&) noexcept            = delete;
    DevicePlugin& operator=(const DevicePlugin&)     = delete;
    DevicePlugin& operator=(DevicePlugin&&) noexcept = delete;

    ~DevicePlugin() override;

    /// Starts serving, registers with the kubelet, and launches the health watcher.
    ///
    /// On failure nothing is left running (and the socket file is removed).
    ///
    /// @return Failure description, or `nullopt` on success.
    ///
    CETL_NODISCARD cetl::optional<std::string> start();

    /// Stops serving. Stopping a not started (or already stopped) plugin is a success.
    ///
    /// @return Failure description (f.e. the socket file can't be removed), or `nullopt` on success.
    ///
    cetl::optional<std::string> stop();

    CETL_NODISCARD bool isStarted() const;

    const PluginConfig& config() const noexcept
    {
        return config_;
    }

    // v1beta1::DevicePlugin::Service

    grpc::Status GetDevicePluginOptions(grpc::ServerContext*          context,
                                        const v1beta1::Empty*         request,
                                        v1beta1::DevicePluginOptions* response) override;

    grpc::Status ListAndWatch(grpc::ServerContext*                               context,
                              const v1beta1::Empty*                              request,
                              grpc::ServerWriter<v1beta1::ListAndWatchResponse>* writer) override;

    grpc::Status GetPreferredAllocation(grpc::ServerContext*                       context,
                                        const v1beta1::PreferredAllocationRequest* request,
                                        v1beta1::PreferredAllocationResponse*      response) override;

    grpc::Status Allocate(grpc::ServerContext*            context,
                          const v1beta1::AllocateRequest* request,
                          v1beta1::AllocateResponse*      response) override;

    grpc::Status PreStartContainer(grpc::ServerContext*                     context,
                                   const v1beta1::PreStartContainerRequest* request,
                                   v1beta1::PreStartContainerResponse*      response) override;

private:
    struct Session
    {
        Session(const PluginConfig&        config,
                Devices                    devices,
                const AllocatePolicy::Ptr& policy,
                const PathExistsPredicate& path_exists);

        const SessionState::Ptr  state;
        const AllocationResolver resolver;

    };  // Session

    CETL_NODISCARD cetl::optional<std::string> registerWithKubelet() const;

    std::shared_ptr<Session> currentSession() const;

    void onUnhealthy(const std::string& device_id);

    static grpc::Status toStatus(const ResolveFailure& failure);

    const PluginConfig               config_;
    const ResourceManager::Ptr       resource_manager_;
    const AllocatePolicy::Ptr        policy_;
    const PluginServer::FatalHandler on_fatal_;
    const PathExistsPredicate        path_exists_;
    common::LoggerPtr                logger_{common::getLogger("plugin")};

    mutable std::mutex            session_mutex_;
    std::shared_ptr<Session>      session_;
    std::unique_ptr<PluginServer> server_;
    std::unique_ptr<StopSignal>   health_stop_;
    std::thread                   health_thread_;

};  // DevicePlugin

}  // namespace plugin
}  // namespace engine
}  // namespace daemon
}  // namespace gpushare

#endif  // GPUSHARE_DAEMON_ENGINE_PLUGIN_DEVICE_PLUGIN_HPP_INCLUDED
