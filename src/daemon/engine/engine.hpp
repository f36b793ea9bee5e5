//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef GPUSHARE_DAEMON_ENGINE_HPP_INCLUDED
#define GPUSHARE_DAEMON_ENGINE_HPP_INCLUDED

#include "config.hpp"
#include "kubelet_watcher.hpp"
#include "logging.hpp"
#include "plugin/allocate_policy.hpp"
#include "plugin/device_plugin.hpp"
#include "plugin/plugin_config.hpp"
#include "plugin/resource_manager.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <chrono>
#include <functional>
#include <string>

namespace gpushare
{
namespace daemon
{
namespace engine
{

class Engine
{
public:
    using Clock = std::chrono::steady_clock;

    static constexpr std::chrono::seconds RestartRetryTimeout{30};

    explicit Engine(Config::Ptr config);

    Engine(const Engine&)                = delete;
    Engine(Engine&&) noexcept            = delete;
    Engine& operator=(const Engine&)     = delete;
    Engine& operator=(Engine&&) noexcept = delete;

    ~Engine();

    CETL_NODISCARD cetl::optional<std::string> init();

    /// Supervises the plugin until the loop predicate is fulfilled; then stops the plugin.
    ///
    /// The plugin is restarted when the kubelet re-creates its socket, when `restart_predicate` returns `true`
    /// (f.e. on SIGHUP), or when the retry timeout of a failed start has elapsed.
    ///
    void runWhile(const std::function<bool()>& loop_predicate, const std::function<bool()>& restart_predicate);

private:
    CETL_NODISCARD cetl::optional<std::string> makePlugin();

    void startPlugin();
    void restartPlugin(const char* const reason);
    void stopPlugin();

    Config::Ptr                       config_;
    common::LoggerPtr                 logger_{common::getLogger("engine")};
    plugin::ResourceManager::Ptr      resource_manager_;
    plugin::DevicePlugin::Ptr         plugin_;
    KubeletWatcher::Ptr               kubelet_watcher_;
    cetl::optional<Clock::time_point> retry_at_;

};  // Engine

}  // namespace engine
}  // namespace daemon
}  // namespace gpushare

#endif  // GPUSHARE_DAEMON_ENGINE_HPP_INCLUDED
