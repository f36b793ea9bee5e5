//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef GPUSHARE_DAEMON_ENGINE_PLUGIN_PRIORITIZE_HPP_INCLUDED
#define GPUSHARE_DAEMON_ENGINE_PLUGIN_PRIORITIZE_HPP_INCLUDED

#include <cetl/pf17/cetlpf.hpp>

#include <cstddef>
#include <set>
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

/// Describes a selection which has to reuse a physical device for several replicas.
///
struct NonUniqueAssignment
{
    std::string device_id;  ///< Physical device id.
    std::size_t replicas;   ///< Number of its replicas in the selection.

};  // NonUniqueAssignment

struct PrioritizeResult
{
    std::vector<std::string>            ids;
    cetl::optional<NonUniqueAssignment> non_unique;

};  // PrioritizeResult

/// Ranks replica ids for a preferred allocation.
///
/// The selection always starts with the `required` ids. Then, until `size` ids are selected,
/// it adds the available replica whose physical device has the fewest replicas selected so far,
/// avoiding (if possible) devices listed in `taken`, with ties broken by the order of `available`.
///
/// @param available Replica ids to choose from.
/// @param required Replica ids which must be part of the selection.
/// @param size Requested number of ids; the selection is never smaller than `required`.
/// @param taken Physical device ids already picked for other containers of the same request.
///
PrioritizeResult prioritizeDevices(const std::vector<std::string>& available,
                                   const std::vector<std::string>& required,
                                   const std::size_t               size,
                                   const std::set<std::string>&    taken = {});

}  // namespace plugin
}  // namespace engine
}  // namespace daemon
}  // namespace gpushare

#endif  // GPUSHARE_DAEMON_ENGINE_PLUGIN_PRIORITIZE_HPP_INCLUDED
