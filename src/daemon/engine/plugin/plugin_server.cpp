//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "plugin_server.hpp"

#include "crash_loop_breaker.hpp"
#include "gpushare/platform/posix_utils.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <grpcpp/grpcpp.h>

#include <chrono>
#include <cstring>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <utility>

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

constexpr std::chrono::milliseconds ShutdownGracePeriod{1000};

std::string unixTarget(const std::string& socket_path)
{
    return "unix://" + socket_path;
}

}  // namespace

constexpr std::chrono::milliseconds PluginServer::DefaultReadyTimeout;

PluginServer::PluginServer(std::string    socket_path,
                           grpc::Service& service,
                           FatalHandler   on_fatal,
                           ServeWaiter    wait_for_exit)
    : socket_path_{std::move(socket_path)}
    , service_{service}
    , on_fatal_{std::move(on_fatal)}
    , wait_for_exit_{wait_for_exit ? std::move(wait_for_exit)
                                   : ServeWaiter{[](grpc::Server& server) { server.Wait(); }}}
{
}

PluginServer::~PluginServer()
{
    stop();
}

cetl::optional<std::string> PluginServer::serve(const std::chrono::milliseconds ready_timeout)
{
    if (const auto err = platform::removeFileIfExists(socket_path_))
    {
        return "Failed to remove stale socket '" + socket_path_ + "': " + std::strerror(err);
    }

    {
        const std::lock_guard<std::mutex> lock{mutex_};

        if (is_stop_requested_ || loop_thread_.joinable())
        {
            return "Server on '" + socket_path_ + "' can't be served twice.";
        }
        if (auto failure = buildAndStart())
        {
            return failure;
        }
        loop_thread_ = std::thread{[this] { runLoop(); }};
    }

    // Wait for the server to start by making a blocking connection.
    if (!dialUnixSocket(socket_path_, ready_timeout))
    {
        return "Server on '" + socket_path_ + "' is not ready within " + std::to_string(ready_timeout.count()) + "ms.";
    }
    return cetl::nullopt;
}

void PluginServer::stop()
{
    grpc::Server* server = nullptr;
    {
        const std::lock_guard<std::mutex> lock{mutex_};
        is_stop_requested_ = true;
        server             = server_.get();
    }

    // No restart happens once the stop is requested, so the server can't be replaced under our feet.
    if (server != nullptr)
    {
        server->Shutdown(std::chrono::system_clock::now() + ShutdownGracePeriod);
    }
    if (loop_thread_.joinable())
    {
        loop_thread_.join();
    }

    const std::lock_guard<std::mutex> lock{mutex_};
    server_.reset();
}

cetl::optional<std::string> PluginServer::buildAndStart()
{
    int selected_port = 0;

    grpc::ServerBuilder builder;
    builder.AddListeningPort(unixTarget(socket_path_), grpc::InsecureServerCredentials(), &selected_port);
    builder.RegisterService(&service_);

    logger_->debug("Starting gRPC server on '{}'.", socket_path_);
    server_ = builder.BuildAndStart();
    if (!server_ || (selected_port == 0))
    {
        server_.reset();
        return "Failed to start gRPC server on '" + socket_path_ + "'.";
    }
    return cetl::nullopt;
}

// `grpc::Server::Wait` returns only after `Shutdown`, so a crash here means the waiter
// returned without a stop request.
void PluginServer::runLoop()
{
    cetl::optional<std::string> fatal_reason;
    while (!fatal_reason.has_value())
    {
        grpc::Server* server = nullptr;
        {
            const std::lock_guard<std::mutex> lock{mutex_};
            if (is_stop_requested_)
            {
                return;
            }
            server = server_.get();
        }

        if (server != nullptr)
        {
            wait_for_exit_(*server);
        }

        const std::lock_guard<std::mutex> lock{mutex_};
        if (is_stop_requested_)
        {
            return;
        }

        logger_->error("gRPC server on '{}' has crashed.", socket_path_);
        if (crash_loop_breaker_.onCrash(CrashLoopBreaker::Clock::now()))
        {
            fatal_reason = "gRPC server on '" + socket_path_ + "' has repeatedly crashed recently.";
            continue;
        }

        logger_->info("Restarting gRPC server on '{}' (restart_count={}).",
                      socket_path_,
                      crash_loop_breaker_.restartCount());
        server_.reset();
        if (const auto err = platform::removeFileIfExists(socket_path_))
        {
            logger_->warn("Failed to remove socket '{}': {}.", socket_path_, std::strerror(err));
        }
        if (const auto failure = buildAndStart())
        {
            logger_->error("{}", failure.value());
        }
    }

    // The handler may call back into this server, so it runs without the lock.
    logger_->critical("{} Quitting.", fatal_reason.value());
    on_fatal_(fatal_reason.value());
}

std::shared_ptr<grpc::Channel> dialUnixSocket(const std::string& socket_path, const std::chrono::milliseconds timeout)
{
    auto channel = grpc::CreateChannel(unixTarget(socket_path), grpc::InsecureChannelCredentials());
    if (!channel->WaitForConnected(std::chrono::system_clock::now() + timeout))
    {
        return nullptr;
    }
    return channel;
}

}  // namespace plugin
}  // namespace engine
}  // namespace daemon
}  // namespace gpushare
