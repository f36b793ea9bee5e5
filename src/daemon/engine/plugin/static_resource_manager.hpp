//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef GPUSHARE_DAEMON_ENGINE_PLUGIN_STATIC_RESOURCE_MANAGER_HPP_INCLUDED
#define GPUSHARE_DAEMON_ENGINE_PLUGIN_STATIC_RESOURCE_MANAGER_HPP_INCLUDED

#include "device.hpp"
#include "resource_manager.hpp"
#include "resource_materializer.hpp"
#include "stop_signal.hpp"

#include "logging.hpp"

#include <chrono>
#include <memory>
#include <string>
#include <utility>

namespace gpushare
{
namespace daemon
{
namespace engine
{
namespace plugin
{

/// Resource manager over a fixed (configured) list of devices.
///
/// A device is considered unhealthy once any of its device nodes disappears.
///
class StaticResourceManager final : public ResourceManager
{
public:
    static constexpr std::chrono::milliseconds DefaultCheckInterval{5000};

    struct HealthSettings
    {
        bool                      enabled;
        std::chrono::milliseconds check_interval;

    };  // HealthSettings

    static Ptr make(Devices devices, const HealthSettings& health_settings, PathExistsPredicate path_exists)
    {
        return std::make_shared<StaticResourceManager>(std::move(devices), health_settings, std::move(path_exists));
    }

    StaticResourceManager(Devices devices, const HealthSettings& health_settings, PathExistsPredicate path_exists);

    // ResourceManager

    Devices devices() override;

    void checkHealth(const StopSignal& stop, const Devices& devices, const UnhealthyHandler& on_unhealthy) override;

private:
    const Devices             devices_;
    const HealthSettings      health_settings_;
    const PathExistsPredicate path_exists_;
    common::LoggerPtr         logger_{common::getLogger("plugin")};

};  // StaticResourceManager

}  // namespace plugin
}  // namespace engine
}  // namespace daemon
}  // namespace gpushare

#endif  // GPUSHARE_DAEMON_ENGINE_PLUGIN_STATIC_RESOURCE_MANAGER_HPP_INCLUDED
