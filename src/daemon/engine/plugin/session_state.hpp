//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef GPUSHARE_DAEMON_ENGINE_PLUGIN_SESSION_STATE_HPP_INCLUDED
#define GPUSHARE_DAEMON_ENGINE_PLUGIN_SESSION_STATE_HPP_INCLUDED

#include "device.hpp"
#include "replicas.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
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

/// Replica identity as advertised to the kubelet.
///
struct AdvertisedDevice
{
    std::string id;
    Health      health;

};  // AdvertisedDevice

/// Devices and replicas of one start/stop segment of the plugin.
///
/// The only mutable part is the physical devices health. Every health change bumps the generation,
/// and wakes up all `waitForChange` callers, so each list-and-watch subscriber observes every change.
///
class SessionState final
{
public:
    using Ptr = std::shared_ptr<SessionState>;

    struct Snapshot
    {
        std::uint64_t                 generation;
        std::vector<AdvertisedDevice> devices;

    };  // Snapshot

    enum class WaitResult : std::uint8_t
    {
        Changed,
        Closed,
        Timeout,
    };

    CETL_NODISCARD static Ptr make(Devices devices, const ReplicationPolicy& replication)
    {
        return std::make_shared<SessionState>(std::move(devices), replication);
    }

    SessionState(Devices devices, const ReplicationPolicy& replication);

    SessionState(const SessionState&)                = delete;
    SessionState(SessionState&&) noexcept            = delete;
    SessionState& operator=(const SessionState&)     = delete;
    SessionState& operator=(SessionState&&) noexcept = delete;

    ~SessionState() = default;

    /// Copy of the physical devices (with their current health).
    ///
    Devices devices() const;

    /// Replica identities; immutable for the whole session.
    ///
    const Replicas& replicas() const noexcept
    {
        return replicas_;
    }

    Snapshot snapshot() const;

    CETL_NODISCARD cetl::optional<Device> findDevice(const std::string& device_id) const;

    bool hasReplica(const std::string& replica_id) const;

    /// Marks the physical device unhealthy.
    ///
    /// @return `true` if the health has changed (and so subscribers were woken up);
    ///         `false` for an unknown or an already unhealthy device.
    ///
    bool markUnhealthy(const std::string& device_id);

    /// Blocks until the generation differs from `last_generation`, the state is closed, or the timeout expires.
    ///
    /// Closing takes precedence over a pending change.
    ///
    WaitResult waitForChange(const std::uint64_t last_generation, const std::chrono::milliseconds timeout) const;

    /// Closes the state and wakes up all waiters. Repeated calls are no-op.
    ///
    void close();

    bool isClosed() const;

private:
    mutable std::mutex              mutex_;
    mutable std::condition_variable cv_;
    Devices                         devices_;
    const Replicas                  replicas_;
    std::uint64_t                   generation_{0};
    bool                            is_closed_{false};

};  // SessionState

}  // namespace plugin
}  // namespace engine
}  // namespace daemon
}  // namespace gpushare

#endif  // GPUSHARE_DAEMON_ENGINE_PLUGIN_SESSION_STATE_HPP_INCLUDED
