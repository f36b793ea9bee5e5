//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "engine.hpp"

#include "config.hpp"
#include "gpushare/platform/posix_utils.hpp"
#include "kubelet_watcher.hpp"
#include "plugin/allocate_policy.hpp"
#include "plugin/device_plugin.hpp"
#include "plugin/plugin_config.hpp"
#include "plugin/static_resource_manager.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <spdlog/spdlog.h>

#include <chrono>
#include <cstdlib>
#include <functional>
#include <memory>
#include <string>
#include <thread>
#include <utility>

namespace gpushare
{
namespace daemon
{
namespace engine
{

constexpr std::chrono::seconds Engine::RestartRetryTimeout;

Engine::Engine(Config::Ptr config)
    : config_{std::move(config)}
{
}

Engine::~Engine()
{
    stopPlugin();
}

cetl::optional<std::string> Engine::init()
{
    logger_->trace("Initializing engine...");

    if (auto failure = makePlugin())
    {
        if (config_->getPluginFailOnInitError())
        {
            logger_->error("{}", failure.value());
            return failure;
        }
        logger_->error("Failed to initialize plugin: {}", failure.value());
        logger_->warn("Plugin is inactive - 'fail_on_init_error' is disabled, so waiting indefinitely.");
        return cetl::nullopt;
    }

    auto maybe_watcher = KubeletWatcher::make(plugin_->config().kubelet_socket_path);
    if (const auto* const failure = cetl::get_if<KubeletWatcher::MakeResult::Failure>(&maybe_watcher))
    {
        logger_->warn("Kubelet restarts won't be detected: {}", *failure);
    }
    else
    {
        kubelet_watcher_ = cetl::get<KubeletWatcher::MakeResult::Success>(std::move(maybe_watcher));
    }

    startPlugin();

    logger_->debug("Engine is initialized.");
    return cetl::nullopt;
}

void Engine::runWhile(const std::function<bool()>& loop_predicate, const std::function<bool()>& restart_predicate)
{
    using std::chrono_literals::operator""s;

    while (loop_predicate())
    {
        // Poll kubelet socket events but awake at least once per second.
        bool is_kubelet_restarted = false;
        if (kubelet_watcher_)
        {
            is_kubelet_restarted = kubelet_watcher_->pollCreated(1s);
        }
        else
        {
            std::this_thread::sleep_for(1s);
        }

        if (!plugin_)
        {
            continue;
        }
        if (is_kubelet_restarted)
        {
            restartPlugin("kubelet socket has been re-created");
        }
        else if (restart_predicate())
        {
            restartPlugin("restart signal has been received");
        }
        else if (retry_at_ && (Clock::now() >= retry_at_.value()))
        {
            restartPlugin("retry timeout has elapsed");
        }
    }
    spdlog::debug("Run loop predicate is fulfilled.");

    stopPlugin();
}

cetl::optional<std::string> Engine::makePlugin()
{
    auto maybe_plugin_config = plugin::PluginConfig::make(*config_);
    if (const auto* const failure = cetl::get_if<plugin::PluginConfig::MakeResult::Failure>(&maybe_plugin_config))
    {
        return "Invalid plugin configuration. " + *failure;
    }
    auto plugin_config = cetl::get<plugin::PluginConfig::MakeResult::Success>(std::move(maybe_plugin_config));

    const plugin::StaticResourceManager::HealthSettings health_settings{
        config_->getHealthEnabled(),
        config_->getHealthCheckInterval().value_or(plugin::StaticResourceManager::DefaultCheckInterval)};
    if (health_settings.check_interval.count() <= 0)
    {
        return "Health check interval must be positive.";
    }
    resource_manager_ = plugin::StaticResourceManager::make(config_->getDevices(), health_settings, platform::pathExists);

    plugin::AllocatePolicy::Ptr policy;
    if (plugin_config.allocate_policy == plugin::AllocatePolicyKind::Simple)
    {
        policy = plugin::SimpleAllocatePolicy::make();
    }

    logger_->info("Plugin config (resource='{}', socket='{}', replicas={}, auto_replicas={}).",
                  plugin_config.resource_name,
                  plugin_config.socket_path,
                  plugin_config.replication.replicas,
                  plugin_config.replication.auto_replicas);

    plugin_ = plugin::DevicePlugin::make(std::move(plugin_config),
                                         resource_manager_,
                                         std::move(policy),
                                         [](const std::string& reason) {
                                             //
                                             spdlog::critical("Fatal: {}", reason);
                                             spdlog::shutdown();
                                             std::_Exit(EXIT_FAILURE);
                                         },
                                         platform::pathExists);
    return cetl::nullopt;
}

void Engine::startPlugin()
{
    retry_at_.reset();

    if (resource_manager_->devices().empty())
    {
        logger_->info("No devices found. Waiting indefinitely.");
        return;
    }

    if (const auto failure = plugin_->start())
    {
        logger_->error("Could not contact Kubelet ({}), retrying in {}s. Did you enable the device plugin feature gate?",
                       failure.value(),
                       RestartRetryTimeout.count());
        retry_at_ = Clock::now() + RestartRetryTimeout;
    }
}

void Engine::restartPlugin(const char* const reason)
{
    logger_->info("Restarting plugin ({}).", reason);
    stopPlugin();
    startPlugin();
}

void Engine::stopPlugin()
{
    if (!plugin_)
    {
        return;
    }
    if (const auto failure = plugin_->stop())
    {
        logger_->warn("Failed to stop plugin: {}", failure.value());
    }
}

}  // namespace engine
}  // namespace daemon
}  // namespace gpushare
