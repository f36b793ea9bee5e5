//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef GPUSHARE_DAEMON_ENGINE_PLUGIN_STOP_SIGNAL_HPP_INCLUDED
#define GPUSHARE_DAEMON_ENGINE_PLUGIN_STOP_SIGNAL_HPP_INCLUDED

#include <chrono>
#include <condition_variable>
#include <mutex>

namespace gpushare
{
namespace daemon
{
namespace engine
{
namespace plugin
{

/// One-shot broadcast of a stop request to any number of waiting threads.
///
class StopSignal final
{
public:
    StopSignal() = default;

    StopSignal(const StopSignal&)                = delete;
    StopSignal(StopSignal&&) noexcept            = delete;
    StopSignal& operator=(const StopSignal&)     = delete;
    StopSignal& operator=(StopSignal&&) noexcept = delete;

    ~StopSignal() = default;

    /// Requests the stop and wakes up all waiters. Repeated requests are no-op.
    ///
    void request();

    bool isRequested() const;

    /// Blocks until either the stop is requested or the timeout expires.
    ///
    /// @return `true` if the stop has been requested.
    ///
    bool waitFor(const std::chrono::milliseconds timeout) const;

private:
    mutable std::mutex              mutex_;
    mutable std::condition_variable cv_;
    bool                            is_requested_{false};

};  // StopSignal

}  // namespace plugin
}  // namespace engine
}  // namespace daemon
}  // namespace gpushare

#endif  // GPUSHARE_DAEMON_ENGINE_PLUGIN_STOP_SIGNAL_HPP_INCLUDED
