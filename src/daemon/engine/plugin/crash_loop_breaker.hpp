//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef GPUSHARE_DAEMON_ENGINE_PLUGIN_CRASH_LOOP_BREAKER_HPP_INCLUDED
#define GPUSHARE_DAEMON_ENGINE_PLUGIN_CRASH_LOOP_BREAKER_HPP_INCLUDED

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

/// Decides whether a crashing server may be restarted once more.
///
/// Crashes closer than the reset interval to the previous one accumulate;
/// a crash after a longer quiet period restarts the count from one.
///
class CrashLoopBreaker final
{
public:
    using Clock = std::chrono::steady_clock;

    static constexpr std::size_t DefaultMaxRestarts = 5;

    static constexpr std::chrono::seconds DefaultResetInterval{3600};

    explicit CrashLoopBreaker(const Clock::time_point started_at,
                              const std::size_t       max_restarts   = DefaultMaxRestarts,
                              const Clock::duration   reset_interval = DefaultResetInterval)
        : max_restarts_{max_restarts}
        , reset_interval_{reset_interval}
        , last_crash_at_{started_at}
    {
    }

    /// Records a crash which happened at the given time.
    ///
    /// @return `true` if the crash is fatal, i.e. the server must not be restarted anymore.
    ///
    bool onCrash(const Clock::time_point now);

    std::size_t restartCount() const noexcept
    {
        return restart_count_;
    }

private:
    const std::size_t     max_restarts_;
    const Clock::duration reset_interval_;
    Clock::time_point     last_crash_at_;
    std::size_t           restart_count_{0};

};  // CrashLoopBreaker

}  // namespace plugin
}  // namespace engine
}  // namespace daemon
}  // namespace gpushare

#endif  // GPUSHARE_DAEMON_ENGINE_PLUGIN_CRASH_LOOP_BREAKER_HPP_INCLUDED
