//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "session_state.hpp"

#include "device.hpp"
#include "replicas.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>
#include <utility>

namespace gpushare
{
namespace daemon
{
namespace engine
{
namespace plugin
{

SessionState::SessionState(Devices devices, const ReplicationPolicy& replication)
    : devices_{std::move(devices)}
    , replicas_{replicate(devices_, replication)}
{
}

Devices SessionState::devices() const
{
    const std::lock_guard<std::mutex> lock{mutex_};
    return devices_;
}

SessionState::Snapshot SessionState::snapshot() const
{
    const std::lock_guard<std::mutex> lock{mutex_};

    Snapshot snapshot{generation_, {}};
    snapshot.devices.reserve(replicas_.size());
    for (const auto& replica : replicas_)
    {
        snapshot.devices.push_back(AdvertisedDevice{replica.id, devices_[replica.device_index].health});
    }
    return snapshot;
}

cetl::optional<Device> SessionState::findDevice(const std::string& device_id) const
{
    const std::lock_guard<std::mutex> lock{mutex_};

    const auto it = std::find_if(devices_.cbegin(), devices_.cend(), [&device_id](const Device& device) {
        //
        return device.id == device_id;
    });
    if (it == devices_.cend())
    {
        return cetl::nullopt;
    }
    return *it;
}

bool SessionState::hasReplica(const std::string& replica_id) const
{
    return std::any_of(replicas_.cbegin(), replicas_.cend(), [&replica_id](const Replica& replica) {
        //
        return replica.id == replica_id;
    });
}

bool SessionState::markUnhealthy(const std::string& device_id)
{
    {
        const std::lock_guard<std::mutex> lock{mutex_};

        const auto it = std::find_if(devices_.begin(), devices_.end(), [&device_id](const Device& device) {
            //
            return device.id == device_id;
        });
        if ((it == devices_.end()) || (it->health == Health::Unhealthy))
        {
            return false;
        }

        it->health = Health::Unhealthy;
        ++generation_;
    }
    cv_.notify_all();
    return true;
}

SessionState::WaitResult SessionState::waitForChange(const std::uint64_t             last_generation,
                                                     const std::chrono::milliseconds timeout) const
{
    std::unique_lock<std::mutex> lock{mutex_};
    cv_.wait_for(lock, timeout, [this, last_generation] {
        //
        return is_closed_ || (generation_ != last_generation);
    });

    if (is_closed_)
    {
        return WaitResult::Closed;
    }
    return (generation_ != last_generation) ? WaitResult::Changed : WaitResult::Timeout;
}

void SessionState::close()
{
    {
        const std::lock_guard<std::mutex> lock{mutex_};
        is_closed_ = true;
    }
    cv_.notify_all();
}

bool SessionState::isClosed() const
{
    const std::lock_guard<std::mutex> lock{mutex_};
    return is_closed_;
}

}  // namespace plugin
}  // namespace engine
}  // namespace daemon
}  // namespace gpushare
