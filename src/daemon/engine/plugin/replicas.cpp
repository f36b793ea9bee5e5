//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "replicas.hpp"

#include "device.hpp"
#include "logging.hpp"

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <iterator>
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

std::uint64_t replicaCountFor(const Device& device, const ReplicationPolicy& policy)
{
    if (policy.auto_replicas)
    {
        // Dividing the total memory keeps the number of advertised devices well below the kubelet limits.
        return device.total_memory / AutoReplicaMemoryUnit;
    }
    return policy.replicas;
}

Replicas replicate(const Devices& devices, const ReplicationPolicy& policy)
{
    const auto logger = common::getLogger("plugin");

    Replicas replicas;
    for (std::size_t device_index = 0; device_index < devices.size(); ++device_index)
    {
        const auto& device = devices[device_index];
        const auto  count  = replicaCountFor(device, policy);
        if (count == 0)
        {
            logger->warn("Device '{}' is not advertised - it has no replicas (total_memory={}MiB).",
                         device.id,
                         device.total_memory);
            continue;
        }

        logger->info("Replicating device '{}' {} times.", device.id, count);
        for (std::uint64_t replica_index = 0; replica_index < count; ++replica_index)
        {
            replicas.push_back(Replica{makeReplicaId(device.id, replica_index), device_index});
        }
    }
    return replicas;
}

std::string makeReplicaId(const std::string& device_id, const std::uint64_t replica_index)
{
    return device_id + ReplicaSeparator + std::to_string(replica_index);
}

std::string stripReplica(const std::string& id)
{
    const auto sep_pos = id.rfind(ReplicaSeparator);
    if (sep_pos == std::string::npos)
    {
        return id;
    }

    const auto suffix_pos = sep_pos + std::strlen(ReplicaSeparator);
    if (suffix_pos == id.size())
    {
        return id;
    }
    const bool is_index = std::all_of(id.begin() + static_cast<std::ptrdiff_t>(suffix_pos), id.end(), [](const char ch) {
        //
        return std::isdigit(static_cast<unsigned char>(ch)) != 0;
    });
    return is_index ? id.substr(0, sep_pos) : id;
}

std::vector<std::string> stripReplicas(const std::vector<std::string>& ids)
{
    std::vector<std::string> stripped;
    stripped.reserve(ids.size());
    std::transform(ids.begin(), ids.end(), std::back_inserter(stripped), stripReplica);
    return stripped;
}

}  // namespace plugin
}  // namespace engine
}  // namespace daemon
}  // namespace gpushare
