//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef GPUSHARE_DAEMON_ENGINE_PLUGIN_REPLICAS_HPP_INCLUDED
#define GPUSHARE_DAEMON_ENGINE_PLUGIN_REPLICAS_HPP_INCLUDED

#include "device.hpp"

#include <cstddef>
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

/// Separator between a physical device id and its replica index, f.e. `GPU-abcd::0`.
///
constexpr const char* ReplicaSeparator = "::";

/// Amount of device memory (in MiB) represented by one replica in the auto replication mode.
///
constexpr std::uint64_t AutoReplicaMemoryUnit = 1000;

/// How many replicas each physical device is expanded into.
///
struct ReplicationPolicy
{
    std::uint32_t replicas;       ///< Fixed replica count; ignored if `auto_replicas` is set.
    bool          auto_replicas;  ///< Derive the count from device memory (`total_memory / 1000`).

    bool isReplicating() const
    {
        return auto_replicas || (replicas > 1);
    }

};  // ReplicationPolicy

/// One externally advertised identity of a physical device.
///
struct Replica
{
    std::string id;            ///< `<physical id>::<replica index>`
    std::size_t device_index;  ///< Position of the physical device in the cached device list.

};  // Replica

using Replicas = std::vector<Replica>;

/// Number of replicas the given device is expanded into under the policy.
///
/// NB! In the auto mode a device with less than 1000 MiB of memory gets zero replicas.
///
std::uint64_t replicaCountFor(const Device& device, const ReplicationPolicy& policy);

/// Builds the full replica list, ordered by device order and then by replica index.
///
Replicas replicate(const Devices& devices, const ReplicationPolicy& policy);

std::string makeReplicaId(const std::string& device_id, const std::uint64_t replica_index);

/// Removes the `::<index>` suffix from a replica id.
///
/// Ids without such suffix are returned unchanged.
///
std::string stripReplica(const std::string& id);

std::vector<std::string> stripReplicas(const std::vector<std::string>& ids);

}  // namespace plugin
}  // namespace engine
}  // namespace daemon
}  // namespace gpushare

#endif  // GPUSHARE_DAEMON_ENGINE_PLUGIN_REPLICAS_HPP_INCLUDED
