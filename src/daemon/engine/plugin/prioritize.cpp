//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "prioritize.hpp"

#include "replicas.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <cstddef>
#include <set>
#include <string>
#include <unordered_map>
#include <unordered_set>
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

class Selection final
{
public:
    explicit Selection(const std::set<std::string>& taken)
        : taken_{taken}
    {
    }

    std::size_t size() const
    {
        return ids_.size();
    }

    bool contains(const std::string& replica_id) const
    {
        return selected_.count(replica_id) != 0;
    }

    void add(const std::string& replica_id)
    {
        if (selected_.insert(replica_id).second)
        {
            ids_.push_back(replica_id);
            ++per_device_[stripReplica(replica_id)];
        }
    }

    /// Lower rank is better: first by already selected replicas of the same device,
    /// then by whether the device is taken by another container.
    ///
    std::pair<std::size_t, bool> rankOf(const std::string& replica_id) const
    {
        const auto device_id = stripReplica(replica_id);
        const auto it        = per_device_.find(device_id);
        return {(it != per_device_.end()) ? it->second : 0, taken_.count(device_id) != 0};
    }

    cetl::optional<NonUniqueAssignment> findNonUnique() const
    {
        for (const auto& id : ids_)
        {
            const auto device_id = stripReplica(id);
            const auto count     = per_device_.at(device_id);
            if (count > 1)
            {
                return NonUniqueAssignment{device_id, count};
            }
        }
        return cetl::nullopt;
    }

    std::vector<std::string> release()
    {
        return std::move(ids_);
    }

private:
    const std::set<std::string>&                 taken_;
    std::vector<std::string>                     ids_;
    std::unordered_set<std::string>              selected_;
    std::unordered_map<std::string, std::size_t> per_device_;

};  // Selection

}  // namespace

PrioritizeResult prioritizeDevices(const std::vector<std::string>& available,
                                   const std::vector<std::string>& required,
                                   const std::size_t               size,
                                   const std::set<std::string>&    taken)
{
    Selection selection{taken};
    for (const auto& id : required)
    {
        selection.add(id);
    }

    while (selection.size() < size)
    {
        const std::string*           best = nullptr;
        std::pair<std::size_t, bool> best_rank{};
        for (const auto& id : available)
        {
            if (selection.contains(id))
            {
                continue;
            }
            const auto rank = selection.rankOf(id);
            if ((best == nullptr) || (rank < best_rank))
            {
                best      = &id;
                best_rank = rank;
            }
        }
        if (best == nullptr)
        {
            break;  // Nothing left to choose from.
        }
        selection.add(*best);
    }

    PrioritizeResult result;
    result.non_unique = selection.findNonUnique();
    result.ids        = selection.release();
    return result;
}

}  // namespace plugin
}  // namespace engine
}  // namespace daemon
}  // namespace gpushare
