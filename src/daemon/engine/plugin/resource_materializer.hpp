//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef GPUSHARE_DAEMON_ENGINE_PLUGIN_RESOURCE_MATERIALIZER_HPP_INCLUDED
#define GPUSHARE_DAEMON_ENGINE_PLUGIN_RESOURCE_MATERIALIZER_HPP_INCLUDED

#include "device.hpp"

#include <functional>
#include <map>
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

constexpr const char* ContainerDevicesRoot = "/var/run/nvidia-container-devices";
constexpr const char* DeviceSpecPermissions = "rw";

using Envs = std::map<std::string, std::string>;

struct Mount
{
    std::string container_path;
    std::string host_path;

};  // Mount

struct DeviceSpec
{
    std::string container_path;
    std::string host_path;
    std::string permissions;

};  // DeviceSpec

/// Container-visible resources of one allocated container.
///
struct ContainerAllocation
{
    Envs                    envs;
    std::vector<Mount>      mounts;
    std::vector<DeviceSpec> device_specs;

};  // ContainerAllocation

using PathExistsPredicate = std::function<bool(const std::string& path)>;

/// `{<envvar>: "id1,id2,..."}`
///
Envs envsFor(const std::string& envvar, const std::vector<std::string>& ids);

/// `{<envvar>: "/var/run/nvidia-container-devices"}`, paired with `mountsFor`.
///
Envs volumeMountEnvsFor(const std::string& envvar);

/// One `/dev/null` bind mount per id, at `/var/run/nvidia-container-devices/<id>`.
///
std::vector<Mount> mountsFor(const std::vector<std::string>& ids);

/// Device nodes to expose: the driver control nodes present on the host, followed by the allocated devices' paths.
///
std::vector<DeviceSpec> deviceSpecsFor(const std::string&         driver_root,
                                       const Devices&             devices,
                                       const PathExistsPredicate& path_exists);

}  // namespace plugin
}  // namespace engine
}  // namespace daemon
}  // namespace gpushare

#endif  // GPUSHARE_DAEMON_ENGINE_PLUGIN_RESOURCE_MATERIALIZER_HPP_INCLUDED
