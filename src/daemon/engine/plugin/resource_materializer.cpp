//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "resource_materializer.hpp"

#include "common_helpers.hpp"
#include "device.hpp"

#include <spdlog/fmt/fmt.h>
#include <spdlog/fmt/ranges.h>

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
namespace
{

constexpr const char* ControlDevicePaths[] = {
    "/dev/nvidiactl",
    "/dev/nvidia-uvm",
    "/dev/nvidia-uvm-tools",
    "/dev/nvidia-modeset",
};

}  // namespace

Envs envsFor(const std::string& envvar, const std::vector<std::string>& ids)
{
    return Envs{{envvar, fmt::format("{}", fmt::join(ids, ","))}};
}

Envs volumeMountEnvsFor(const std::string& envvar)
{
    return Envs{{envvar, ContainerDevicesRoot}};
}

std::vector<Mount> mountsFor(const std::vector<std::string>& ids)
{
    std::vector<Mount> mounts;
    mounts.reserve(ids.size());
    for (const auto& id : ids)
    {
        mounts.push_back(Mount{common::joinPath(ContainerDevicesRoot, id), "/dev/null"});
    }
    return mounts;
}

std::vector<DeviceSpec> deviceSpecsFor(const std::string&         driver_root,
                                       const Devices&             devices,
                                       const PathExistsPredicate& path_exists)
{
    std::vector<DeviceSpec> specs;

    const auto add_spec = [&specs, &driver_root](const std::string& path) {
        //
        specs.push_back(DeviceSpec{path, common::joinPath(driver_root, path), DeviceSpecPermissions});
    };

    for (const auto* const control_path : ControlDevicePaths)
    {
        if (path_exists(control_path))
        {
            add_spec(control_path);
        }
    }
    for (const auto& device : devices)
    {
        for (const auto& path : device.paths)
        {
            add_spec(path);
        }
    }
    return specs;
}

}  // namespace plugin
}  // namespace engine
}  // namespace daemon
}  // namespace gpushare
