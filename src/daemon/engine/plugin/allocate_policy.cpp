//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "allocate_policy.hpp"

#include "device.hpp"

#include <algorithm>
#include <cstddef>

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

bool containsDevice(const Devices& devices, const Device& device)
{
    return std::any_of(devices.begin(), devices.end(), [&device](const Device& other) {
        //
        return other.id == device.id;
    });
}

}  // namespace

Devices SimpleAllocatePolicy::allocate(const Devices& available, const Devices& required, const std::size_t size)
{
    Devices allocated;
    for (const auto& device : required)
    {
        if (!containsDevice(allocated, device))
        {
            allocated.push_back(device);
        }
    }

    for (const auto& device : available)
    {
        if (allocated.size() >= size)
        {
            break;
        }
        if (!containsDevice(allocated, device))
        {
            allocated.push_back(device);
        }
    }
    return allocated;
}

}  // namespace plugin
}  // namespace engine
}  // namespace daemon
}  // namespace gpushare
