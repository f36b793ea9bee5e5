//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "plugin/session_state.hpp"

#include "plugin/device.hpp"
#include "plugin/replicas.hpp"
#include "plugin_gtest_helpers.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <chrono>
#include <thread>
#include <vector>

namespace
{

using namespace gpushare::daemon::engine::plugin;  // NOLINT This our main concern here in the unit tests.

using testing::ElementsAre;
using testing::Optional;
using testing::Field;

// https://github.com/llvm/llvm-project/issues/53444
// NOLINTBEGIN(misc-unused-using-decls, misc-include-cleaner)
using std::literals::chrono_literals::operator""s;
using std::literals::chrono_literals::operator""ms;
// NOLINTEND(misc-unused-using-decls, misc-include-cleaner)

// NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

class TestSessionState : public testing::Test
{
protected:
    SessionState::Ptr makeState(const ReplicationPolicy& replication = {2, false}) const
    {
        return SessionState::make({makeDevice("GPU-a", "0"), makeDevice("GPU-b", "1")}, replication);
    }
};

// MARK: - Tests:

TEST_F(TestSessionState, snapshot_lists_all_replicas_healthy)
{
    const auto state = makeState();

    const auto snapshot = state->snapshot();
    EXPECT_THAT(snapshot.generation, 0);
    EXPECT_THAT(snapshot.devices,
                ElementsAre(AdvertisedDevice{"GPU-a::0", Health::Healthy},
                            AdvertisedDevice{"GPU-a::1", Health::Healthy},
                            AdvertisedDevice{"GPU-b::0", Health::Healthy},
                            AdvertisedDevice{"GPU-b::1", Health::Healthy}));
}

TEST_F(TestSessionState, lookups)
{
    const auto state = makeState();

    EXPECT_TRUE(state->hasReplica("GPU-a::1"));
    EXPECT_FALSE(state->hasReplica("GPU-a::2"));
    EXPECT_FALSE(state->hasReplica("GPU-a"));

    EXPECT_THAT(state->findDevice("GPU-b"), Optional(Field(&Device::index, "1")));
    EXPECT_FALSE(state->findDevice("GPU-b::0").has_value());
    EXPECT_FALSE(state->findDevice("GPU-x").has_value());
}

TEST_F(TestSessionState, mark_unhealthy_affects_all_replicas_of_the_device_only)
{
    const auto state = makeState();

    EXPECT_TRUE(state->markUnhealthy("GPU-b"));

    const auto snapshot = state->snapshot();
    EXPECT_THAT(snapshot.generation, 1);
    EXPECT_THAT(snapshot.devices,
                ElementsAre(AdvertisedDevice{"GPU-a::0", Health::Healthy},
                            AdvertisedDevice{"GPU-a::1", Health::Healthy},
                            AdvertisedDevice{"GPU-b::0", Health::Unhealthy},
                            AdvertisedDevice{"GPU-b::1", Health::Unhealthy}));
    EXPECT_THAT(state->findDevice("GPU-b")->health, Health::Unhealthy);
}

TEST_F(TestSessionState, mark_unhealthy_is_one_way_and_ignores_unknown)
{
    const auto state = makeState();

    EXPECT_TRUE(state->markUnhealthy("GPU-a"));
    EXPECT_FALSE(state->markUnhealthy("GPU-a"));
    EXPECT_FALSE(state->markUnhealthy("GPU-x"));
    EXPECT_FALSE(state->markUnhealthy("GPU-b::0"));
    EXPECT_THAT(state->snapshot().generation, 1);
}

TEST_F(TestSessionState, wait_for_change)
{
    const auto state = makeState();

    EXPECT_THAT(state->waitForChange(0, 10ms), SessionState::WaitResult::Timeout);

    std::thread notifier{[&state] {
        //
        std::this_thread::sleep_for(50ms);
        state->markUnhealthy("GPU-a");
    }};
    EXPECT_THAT(state->waitForChange(0, 10s), SessionState::WaitResult::Changed);
    notifier.join();

    // A change which happened before the wait is not missed.
    EXPECT_THAT(state->waitForChange(0, 0ms), SessionState::WaitResult::Changed);
    EXPECT_THAT(state->waitForChange(1, 0ms), SessionState::WaitResult::Timeout);
}

TEST_F(TestSessionState, every_waiter_observes_the_change)
{
    const auto state = makeState();

    std::vector<SessionState::WaitResult> results(3, SessionState::WaitResult::Timeout);
    std::vector<std::thread>              waiters;
    for (auto& result : results)
    {
        waiters.emplace_back([&state, &result] { result = state->waitForChange(0, 10s); });
    }
    std::this_thread::sleep_for(50ms);
    state->markUnhealthy("GPU-b");
    for (auto& waiter : waiters)
    {
        waiter.join();
    }

    EXPECT_THAT(results,
                ElementsAre(SessionState::WaitResult::Changed,
                            SessionState::WaitResult::Changed,
                            SessionState::WaitResult::Changed));
}

TEST_F(TestSessionState, close_wakes_up_waiters)
{
    const auto state = makeState();
    EXPECT_FALSE(state->isClosed());

    std::thread closer{[&state] {
        //
        std::this_thread::sleep_for(50ms);
        state->close();
    }};
    EXPECT_THAT(state->waitForChange(0, 10s), SessionState::WaitResult::Closed);
    closer.join();

    EXPECT_TRUE(state->isClosed());
    state->close();
    EXPECT_TRUE(state->isClosed());

    // Closing takes precedence over a pending change.
    state->markUnhealthy("GPU-a");
    EXPECT_THAT(state->waitForChange(0, 0ms), SessionState::WaitResult::Closed);
}

TEST_F(TestSessionState, auto_replicas)
{
    const auto state = SessionState::make({makeDevice("GPU-a", "0", 2500), makeDevice("GPU-b", "1", 500)},
                                          ReplicationPolicy{1, true});

    EXPECT_THAT(state->snapshot().devices,
                ElementsAre(AdvertisedDevice{"GPU-a::0", Health::Healthy},
                            AdvertisedDevice{"GPU-a::1", Health::Healthy}));
    EXPECT_TRUE(state->findDevice("GPU-b").has_value());
}

// NOLINTEND(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

}  // namespace
