//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef GPUSHARE_DAEMON_ENGINE_PLUGIN_ALLOCATION_RESOLVER_HPP_INCLUDED
#define GPUSHARE_DAEMON_ENGINE_PLUGIN_ALLOCATION_RESOLVER_HPP_INCLUDED

#include "allocate_policy.hpp"
#include "device.hpp"
#include "plugin_config.hpp"
#include "resource_materializer.hpp"
#include "session_state.hpp"

#include "logging.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

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

/// Preferred allocation request of one container.
///
struct PreferredAllocationRequest
{
    std::vector<std::string> available_ids;
    std::vector<std::string> must_include_ids;
    std::size_t              size;

};  // PreferredAllocationRequest

struct ResolveFailure
{
    enum class Code : std::uint8_t
    {
        UnknownDevice,
        Unimplemented,
    };

    Code        code;
    std::string message;

};  // ResolveFailure

/// Turns kubelet allocation requests (in terms of replica ids) into physical devices,
/// and then into container-visible resources.
///
/// Stateless apart from the session it reads; safe to use concurrently from the gRPC handlers.
///
class AllocationResolver final
{
public:
    struct PreferredResult
    {
        using Success = std::vector<std::vector<std::string>>;
        using Failure = ResolveFailure;
        using Var     = cetl::variant<Success, Failure>;
    };

    struct AllocateResult
    {
        using Success = std::vector<ContainerAllocation>;
        using Failure = ResolveFailure;
        using Var     = cetl::variant<Success, Failure>;
    };

    AllocationResolver(const PluginConfig&   config,
                       SessionState::Ptr     session,
                       AllocatePolicy::Ptr   policy,
                       PathExistsPredicate   path_exists);

    /// Per container preferred ids, in the order of the containers in the request.
    ///
    /// Containers of the same request avoid each other's physical devices when possible.
    ///
    CETL_NODISCARD PreferredResult::Var preferredAllocation(
        const std::vector<PreferredAllocationRequest>& requests) const;

    /// Per container resources for the given replica ids.
    ///
    /// Any unknown id fails the whole request.
    ///
    CETL_NODISCARD AllocateResult::Var allocate(const std::vector<std::vector<std::string>>& requests) const;

private:
    CETL_NODISCARD cetl::optional<ResolveFailure> collectDevices(const char* const               request_kind,
                                                                 const std::vector<std::string>& physical_ids,
                                                                 Devices&                        devices) const;

    /// Cached devices with the given ids, in the order of the cached device list.
    ///
    Devices inCachedOrder(const std::vector<std::string>& physical_ids) const;

    /// Uuids are passed in the request order, indices in the cached device order.
    ///
    std::vector<std::string> visibleIdsOf(const std::vector<std::string>& physical_ids,
                                          const Devices&                  cached_order) const;

    ResolveFailure unknownDevice(const char* const request_kind, const std::string& id) const;

    const PluginConfig        config_;
    const SessionState::Ptr   session_;
    const AllocatePolicy::Ptr policy_;
    const PathExistsPredicate path_exists_;
    common::LoggerPtr         logger_{common::getLogger("plugin")};

};  // AllocationResolver

}  // namespace plugin
}  // namespace engine
}  // namespace daemon
}  // namespace gpushare

#endif  // GPUSHARE_DAEMON_ENGINE_PLUGIN_ALLOCATION_RESOLVER_HPP_INCLUDED
