//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "allocation_resolver.hpp"

#include "allocate_policy.hpp"
#include "device.hpp"
#include "plugin_config.hpp"
#include "prioritize.hpp"
#include "replicas.hpp"
#include "resource_materializer.hpp"
#include "session_state.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <spdlog/fmt/ranges.h>

#include <algorithm>
#include <set>
#include <string>
#include <utility>
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

std::vector<std::string> uniqueInOrder(const std::vector<std::string>& ids)
{
    std::set<std::string>    seen;
    std::vector<std::string> unique;
    for (const auto& id : ids)
    {
        if (seen.insert(id).second)
        {
            unique.push_back(id);
        }
    }
    return unique;
}

}  // namespace

AllocationResolver::AllocationResolver(const PluginConfig& config,
                                       SessionState::Ptr   session,
                                       AllocatePolicy::Ptr policy,
                                       PathExistsPredicate path_exists)
    : config_{config}
    , session_{std::move(session)}
    , policy_{std::move(policy)}
    , path_exists_{std::move(path_exists)}
{
}

AllocationResolver::PreferredResult::Var AllocationResolver::preferredAllocation(
    const std::vector<PreferredAllocationRequest>& requests) const
{
    const bool is_replicating = config_.replication.isReplicating();

    PreferredResult::Success responses;
    responses.reserve(requests.size());

    std::set<std::string> taken;
    for (const auto& request : requests)
    {
        const auto available_ids = uniqueInOrder(stripReplicas(request.available_ids));
        const auto required_ids  = uniqueInOrder(stripReplicas(request.must_include_ids));

        Devices available;
        if (auto failure = collectDevices("preferred allocation", available_ids, available))
        {
            return failure.value();
        }
        Devices required;
        if (auto failure = collectDevices("preferred allocation", required_ids, required))
        {
            return failure.value();
        }

        if (is_replicating)
        {
            auto result = prioritizeDevices(request.available_ids, request.must_include_ids, request.size, taken);
            if (const auto& non_unique = result.non_unique)
            {
                logger_->warn("Ignoring: device '{}' is assigned {} times (ids=[{}]).",
                              non_unique->device_id,
                              non_unique->replicas,
                              fmt::join(result.ids, ", "));
            }
            for (const auto& id : result.ids)
            {
                taken.insert(stripReplica(id));
            }
            responses.push_back(std::move(result.ids));
        }
        else if (policy_)
        {
            const auto               allocated = policy_->allocate(available, required, request.size);
            std::vector<std::string> ids;
            ids.reserve(allocated.size());
            for (const auto& device : allocated)
            {
                ids.push_back(device.id);
            }
            responses.push_back(std::move(ids));
        }
        else
        {
            return ResolveFailure{ResolveFailure::Code::Unimplemented,
                                  "GetPreferredAllocation() is not implemented without replicas or allocate policy."};
        }
    }
    return responses;
}

AllocationResolver::AllocateResult::Var AllocationResolver::allocate(
    const std::vector<std::vector<std::string>>& requests) const
{
    AllocateResult::Success responses;
    responses.reserve(requests.size());

    for (const auto& replica_ids : requests)
    {
        for (const auto& id : replica_ids)
        {
            if (!session_->hasReplica(id))
            {
                return unknownDevice("allocation", id);
            }
        }

        const auto physical_ids = uniqueInOrder(stripReplicas(replica_ids));
        logger_->debug("Kubelet requests devices [{}], using physical devices [{}].",
                       fmt::join(replica_ids, ", "),
                       fmt::join(physical_ids, ", "));

        Devices devices;
        if (auto failure = collectDevices("allocation", physical_ids, devices))
        {
            return failure.value();
        }

        // Indices and device nodes follow the cached device order, which is the CUDA ordinal order.
        const auto cached_order = inCachedOrder(physical_ids);
        const auto visible_ids  = visibleIdsOf(physical_ids, cached_order);

        ContainerAllocation allocation;
        switch (config_.device_list_strategy)
        {
        case DeviceListStrategy::Envvar:
            allocation.envs = envsFor(config_.device_list_envvar, visible_ids);
            break;
        case DeviceListStrategy::VolumeMounts:
            allocation.envs   = volumeMountEnvsFor(config_.device_list_envvar);
            allocation.mounts = mountsFor(visible_ids);
            break;
        }
        if (config_.pass_device_specs)
        {
            allocation.device_specs = deviceSpecsFor(config_.driver_root, cached_order, path_exists_);
        }
        responses.push_back(std::move(allocation));
    }
    return responses;
}

cetl::optional<ResolveFailure> AllocationResolver::collectDevices(const char* const               request_kind,
                                                                  const std::vector<std::string>& physical_ids,
                                                                  Devices&                        devices) const
{
    devices.reserve(devices.size() + physical_ids.size());
    for (const auto& id : physical_ids)
    {
        auto device = session_->findDevice(id);
        if (!device)
        {
            return unknownDevice(request_kind, id);
        }
        devices.push_back(std::move(device.value()));
    }
    return cetl::nullopt;
}

Devices AllocationResolver::inCachedOrder(const std::vector<std::string>& physical_ids) const
{
    const std::set<std::string> requested{physical_ids.begin(), physical_ids.end()};

    Devices devices;
    for (auto& device : session_->devices())
    {
        if (requested.count(device.id) != 0)
        {
            devices.push_back(std::move(device));
        }
    }
    return devices;
}

std::vector<std::string> AllocationResolver::visibleIdsOf(const std::vector<std::string>& physical_ids,
                                                          const Devices&                  cached_order) const
{
    switch (config_.device_id_strategy)
    {
    case DeviceIdStrategy::Uuid:
        return physical_ids;
    case DeviceIdStrategy::Index:
        break;
    }

    std::vector<std::string> ids;
    ids.reserve(cached_order.size());
    for (const auto& device : cached_order)
    {
        ids.push_back(device.index);
    }
    return ids;
}

ResolveFailure AllocationResolver::unknownDevice(const char* const request_kind, const std::string& id) const
{
    auto message = fmt::format("invalid {} request for '{}': unknown device: {}", request_kind, config_.resource_name, id);
    logger_->warn("{}", message);
    return ResolveFailure{ResolveFailure::Code::UnknownDevice, std::move(message)};
}

}  // namespace plugin
}  // namespace engine
}  // namespace daemon
}  // namespace gpushare
