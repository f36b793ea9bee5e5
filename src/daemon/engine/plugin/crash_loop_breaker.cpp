//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "crash_loop_breaker.hpp"

#include <chrono>
#include <cstddef>

namespace gpushare
{
namespace daemon
{
namespace engine
{
namespace plugin
{

constexpr std::size_t          CrashLoopBreaker::DefaultMaxRestarts;
constexpr std::chrono::seconds CrashLoopBreaker::DefaultResetInterval;

bool CrashLoopBreaker::onCrash(const Clock::time_point now)
{
    const auto since_last_crash = now - last_crash_at_;
    last_crash_at_              = now;

    if (since_last_crash > reset_interval_)
    {
        restart_count_ = 1;
    }
    else
    {
        ++restart_count_;
    }
    return restart_count_ > max_restarts_;
}

}  // namespace plugin
}  // namespace engine
}  // namespace daemon
}  // namespace gpushare
