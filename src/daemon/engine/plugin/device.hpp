//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef GPUSHARE_DAEMON_ENGINE_PLUGIN_DEVICE_HPP_INCLUDED
#define GPUSHARE_DAEMON_ENGINE_PLUGIN_DEVICE_HPP_INCLUDED

#include <cstdint>
#include <string>
#include <vector>

namespace gpushare
{
namespace daemon
{
namespace engine
{
namespace plugin
{

/// Health of a device as advertised to the kubelet.
///
/// Transitions are one-way: once `Unhealthy` a device stays so until the plugin is restarted.
///
enum class Health : std::uint8_t
{
    Healthy,
    Unhealthy,
};

/// Wire representation of the health (`"Healthy"` or `"Unhealthy"`).
///
inline const char* healthToString(const Health health)
{
    return (health == Health::Healthy) ? "Healthy" : "Unhealthy";
}

/// Represents one physical accelerator.
///
struct Device
{
    std::string              id;            ///< Stable identity (f.e. GPU UUID).
    std::string              index;         ///< Presentation index (f.e. "0").
    std::uint64_t            total_memory;  ///< Total memory in MiB.
    std::vector<std::string> paths;         ///< Device nodes exposing the device to user space.
    Health                   health;

};  // Device

using Devices = std::vector<Device>;

}  // namespace plugin
}  // namespace engine
}  // namespace daemon
}  // namespace gpushare

#endif  // GPUSHARE_DAEMON_ENGINE_PLUGIN_DEVICE_HPP_INCLUDED
