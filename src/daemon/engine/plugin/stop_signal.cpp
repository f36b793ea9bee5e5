//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "stop_signal.hpp"

#include <chrono>
#include <mutex>

namespace gpushare
{
namespace daemon
{
namespace engine
{
namespace plugin
{

void StopSignal::request()
{
    {
        const std::lock_guard<std::mutex> lock{mutex_};
        is_requested_ = true;
    }
    cv_.notify_all();
}

bool StopSignal::isRequested() const
{
    const std::lock_guard<std::mutex> lock{mutex_};
    return is_requested_;
}

bool StopSignal::waitFor(const std::chrono::milliseconds timeout) const
{
    std::unique_lock<std::mutex> lock{mutex_};
    return cv_.wait_for(lock, timeout, [this] { return is_requested_; });
}

}  // namespace plugin
}  // namespace engine
}  // namespace daemon
}  // namespace gpushare
