//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef GPUSHARE_DAEMON_ENGINE_PLUGIN_ALLOCATE_POLICY_HPP_INCLUDED
#define GPUSHARE_DAEMON_ENGINE_PLUGIN_ALLOCATE_POLICY_HPP_INCLUDED

#include "device.hpp"

#include <cstddef>
#include <memory>

namespace gpushare
{
namespace daemon
{
namespace engine
{
namespace plugin
{

/// Topology allocation policy - picks `size` physical devices out of the available ones.
///
class AllocatePolicy
{
public:
    using Ptr = std::shared_ptr<AllocatePolicy>;

    AllocatePolicy(const AllocatePolicy&)                = delete;
    AllocatePolicy(AllocatePolicy&&) noexcept            = delete;
    AllocatePolicy& operator=(const AllocatePolicy&)     = delete;
    AllocatePolicy& operator=(AllocatePolicy&&) noexcept = delete;

    virtual ~AllocatePolicy() = default;

    virtual Devices allocate(const Devices& available, const Devices& required, const std::size_t size) = 0;

protected:
    AllocatePolicy() = default;

};  // AllocatePolicy

/// Takes all required devices first, and then the available ones in their order.
///
class SimpleAllocatePolicy final : public AllocatePolicy
{
public:
    static Ptr make()
    {
        return std::make_shared<SimpleAllocatePolicy>();
    }

    SimpleAllocatePolicy() = default;

    // AllocatePolicy

    Devices allocate(const Devices& available, const Devices& required, const std::size_t size) override;

};  // SimpleAllocatePolicy

}  // namespace plugin
}  // namespace engine
}  // namespace daemon
}  // namespace gpushare

#endif  // GPUSHARE_DAEMON_ENGINE_PLUGIN_ALLOCATE_POLICY_HPP_INCLUDED
