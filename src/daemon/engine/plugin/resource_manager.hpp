//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef GPUSHARE_DAEMON_ENGINE_PLUGIN_RESOURCE_MANAGER_HPP_INCLUDED
#define GPUSHARE_DAEMON_ENGINE_PLUGIN_RESOURCE_MANAGER_HPP_INCLUDED

#include "device.hpp"
#include "stop_signal.hpp"

#include <functional>
#include <memory>
#include <string>

namespace gpushare
{
namespace daemon
{
namespace engine
{
namespace plugin
{

/// Source of physical devices, and their health watcher.
///
class ResourceManager
{
public:
    using Ptr = std::shared_ptr<ResourceManager>;

    /// Invoked (from the health watcher thread) with the id of a device which became unhealthy.
    ///
    using UnhealthyHandler = std::function<void(const std::string& device_id)>;

    ResourceManager(const ResourceManager&)                = delete;
    ResourceManager(ResourceManager&&) noexcept            = delete;
    ResourceManager& operator=(const ResourceManager&)     = delete;
    ResourceManager& operator=(ResourceManager&&) noexcept = delete;

    virtual ~ResourceManager() = default;

    /// Enumerates currently present physical devices (all reported as healthy).
    ///
    virtual Devices devices() = 0;

    /// Watches health of the given devices until the stop is requested.
    ///
    /// Blocks the calling thread; the plugin runs it on its own health watcher thread.
    ///
    virtual void checkHealth(const StopSignal& stop, const Devices& devices, const UnhealthyHandler& on_unhealthy) = 0;

protected:
    ResourceManager() = default;

};  // ResourceManager

}  // namespace plugin
}  // namespace engine
}  // namespace daemon
}  // namespace gpushare

#endif  // GPUSHARE_DAEMON_ENGINE_PLUGIN_RESOURCE_MANAGER_HPP_INCLUDED
