//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef GPUSHARE_DAEMON_ENGINE_PLUGIN_PLUGIN_SERVER_HPP_INCLUDED
#define GPUSHARE_DAEMON_ENGINE_PLUGIN_PLUGIN_SERVER_HPP_INCLUDED

#include "crash_loop_breaker.hpp"

#include "logging.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <grpcpp/grpcpp.h>

#include <chrono>
#include <functional>
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

/// gRPC server of one service bound to a Unix domain socket.
///
/// The server runs on its own thread. Whenever it exits without being asked to,
/// it is restarted, until the crash-loop breaker declares the crashes fatal.
///
class PluginServer final
{
public:
    using FatalHandler = std::function<void(const std::string& reason)>;

    /// Blocks while the given server is running. Defaults to `grpc::Server::Wait`.
    ///
    using ServeWaiter = std::function<void(grpc::Server& server)>;

    static constexpr std::chrono::milliseconds DefaultReadyTimeout{5000};

    PluginServer(std::string socket_path,
                 grpc::Service& service,
                 FatalHandler   on_fatal,
                 ServeWaiter    wait_for_exit = {});

    PluginServer(const PluginServer&)                = delete;
    PluginServer(PluginServer&&) noexcept            = delete;
    PluginServer& operator=(const PluginServer&)     = delete;
    PluginServer& operator=(PluginServer&&) noexcept = delete;

    ~PluginServer();

    /// Removes a stale socket file, starts serving, and waits until the socket accepts connections.
    ///
    /// On failure the server may be partially started; `stop` cleans it up.
    ///
    /// @return Failure description, or `nullopt` on success.
    ///
    CETL_NODISCARD cetl::optional<std::string> serve(
        const std::chrono::milliseconds ready_timeout = DefaultReadyTimeout);

    /// Shuts the server down and joins its thread. Repeated calls are no-op.
    ///
    /// Does not remove the socket file.
    ///
    void stop();

    const std::string& socketPath() const noexcept
    {
        return socket_path_;
    }

private:
    CETL_NODISCARD cetl::optional<std::string> buildAndStart();

    void runLoop();

    const std::string             socket_path_;
    grpc::Service&                service_;
    const FatalHandler            on_fatal_;
    const ServeWaiter             wait_for_exit_;
    common::LoggerPtr             logger_{common::getLogger("server")};
    CrashLoopBreaker              crash_loop_breaker_{CrashLoopBreaker::Clock::now()};
    std::mutex                    mutex_;
    std::unique_ptr<grpc::Server> server_;
    bool                          is_stop_requested_{false};
    std::thread                   loop_thread_;

};  // PluginServer

/// Opens a channel to the given Unix socket and waits (up to `timeout`) until it is connected.
///
/// @return The connected channel, or `nullptr` if the connection wasn't established in time.
///
std::shared_ptr<grpc::Channel> dialUnixSocket(const std::string& socket_path, const std::chrono::milliseconds timeout);

}  // namespace plugin
}  // namespace engine
}  // namespace daemon
}  // namespace gpushare

#endif  // GPUSHARE_DAEMON_ENGINE_PLUGIN_PLUGIN_SERVER_HPP_INCLUDED
