//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "static_resource_manager.hpp"

#include "device.hpp"
#include "stop_signal.hpp"

#include <algorithm>
#include <chrono>
#include <set>
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

constexpr std::chrono::milliseconds StaticResourceManager::DefaultCheckInterval;

StaticResourceManager::StaticResourceManager(Devices               devices,
                                             const HealthSettings& health_settings,
                                             PathExistsPredicate   path_exists)
    : devices_{std::move(devices)}
    , health_settings_{health_settings}
    , path_exists_{std::move(path_exists)}
{
}

Devices StaticResourceManager::devices()
{
    auto devices = devices_;
    for (auto& device : devices)
    {
        device.health = Health::Healthy;
    }
    return devices;
}

void StaticResourceManager::checkHealth(const StopSignal&       stop,
                                        const Devices&          devices,
                                        const UnhealthyHandler& on_unhealthy)
{
    if (!health_settings_.enabled)
    {
        logger_->info("Health checking is disabled.");
        while (!stop.waitFor(std::chrono::hours{1}))
        {
        }
        return;
    }

    logger_->debug("Health checking of {} devices every {}ms.", devices.size(), health_settings_.check_interval.count());

    std::set<std::string> reported;
    while (!stop.waitFor(health_settings_.check_interval))
    {
        for (const auto& device : devices)
        {
            if (reported.count(device.id) != 0)
            {
                continue;
            }

            const auto missing = std::find_if_not(device.paths.cbegin(), device.paths.cend(), path_exists_);
            if (missing != device.paths.cend())
            {
                logger_->warn("Device node '{}' of '{}' is missing.", *missing, device.id);
                reported.insert(device.id);
                on_unhealthy(device.id);
            }
        }
    }
}

}  // namespace plugin
}  // namespace engine
}  // namespace daemon
}  // namespace gpushare
