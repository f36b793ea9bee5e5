//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "plugin/replicas.hpp"

#include "plugin/device.hpp"
#include "plugin_gtest_helpers.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <string>
#include <vector>

namespace
{

using namespace gpushare::daemon::engine::plugin;  // NOLINT This our main concern here in the unit tests.

using testing::ElementsAre;
using testing::IsEmpty;

// NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

class TestReplicas : public testing::Test
{
protected:
    static std::vector<std::string> idsOf(const Replicas& replicas)
    {
        std::vector<std::string> ids;
        for (const auto& replica : replicas)
        {
            ids.push_back(replica.id);
        }
        return ids;
    }
};

// MARK: - Tests:

TEST_F(TestReplicas, replicate_fixed_count_keeps_device_then_index_order)
{
    const Devices devices{makeDevice("GPU-a", "0"), makeDevice("GPU-b", "1")};

    const auto replicas = replicate(devices, ReplicationPolicy{3, false});
    EXPECT_THAT(idsOf(replicas), ElementsAre("GPU-a::0", "GPU-a::1", "GPU-a::2", "GPU-b::0", "GPU-b::1", "GPU-b::2"));
    EXPECT_THAT(replicas[2].device_index, 0);
    EXPECT_THAT(replicas[3].device_index, 1);
}

TEST_F(TestReplicas, replicate_single_replica)
{
    const Devices devices{makeDevice("GPU-a", "0")};

    EXPECT_THAT(idsOf(replicate(devices, ReplicationPolicy{1, false})), ElementsAre("GPU-a::0"));
}

TEST_F(TestReplicas, replicate_auto_divides_total_memory)
{
    const Devices devices{makeDevice("GPU-a", "0", 16160), makeDevice("GPU-b", "1", 2999)};

    const auto replicas = replicate(devices, ReplicationPolicy{1, true});
    ASSERT_THAT(replicas.size(), 16 + 2);
    EXPECT_THAT(replicas.front().id, "GPU-a::0");
    EXPECT_THAT(replicas[15].id, "GPU-a::15");
    EXPECT_THAT(replicas[16].id, "GPU-b::0");
    EXPECT_THAT(replicas.back().id, "GPU-b::1");
}

TEST_F(TestReplicas, replicate_auto_small_device_has_no_replicas)
{
    const Devices devices{makeDevice("GPU-small", "0", 999), makeDevice("GPU-b", "1", 1000)};

    EXPECT_THAT(replicaCountFor(devices[0], ReplicationPolicy{1, true}), 0);
    EXPECT_THAT(idsOf(replicate(devices, ReplicationPolicy{1, true})), ElementsAre("GPU-b::0"));
}

TEST_F(TestReplicas, replicate_no_devices)
{
    EXPECT_THAT(replicate({}, ReplicationPolicy{4, false}), IsEmpty());
}

TEST_F(TestReplicas, strip_replica)
{
    EXPECT_THAT(stripReplica("GPU-a::0"), "GPU-a");
    EXPECT_THAT(stripReplica("GPU-a::15"), "GPU-a");
    EXPECT_THAT(stripReplica(makeReplicaId("GPU-a::x", 7)), "GPU-a::x");

    // Ids without a replica suffix are left as is.
    EXPECT_THAT(stripReplica("GPU-a"), "GPU-a");
    EXPECT_THAT(stripReplica("GPU-a::"), "GPU-a::");
    EXPECT_THAT(stripReplica("GPU-a::x"), "GPU-a::x");
    EXPECT_THAT(stripReplica(""), "");
}

TEST_F(TestReplicas, strip_replicas)
{
    EXPECT_THAT(stripReplicas({"GPU-a::0", "GPU-b::3", "GPU-a::1"}), ElementsAre("GPU-a", "GPU-b", "GPU-a"));
    EXPECT_THAT(stripReplicas({}), IsEmpty());
}

TEST_F(TestReplicas, policy_is_replicating)
{
    EXPECT_FALSE((ReplicationPolicy{1, false}.isReplicating()));
    EXPECT_TRUE((ReplicationPolicy{2, false}.isReplicating()));
    EXPECT_TRUE((ReplicationPolicy{1, true}.isReplicating()));
}

// NOLINTEND(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

}  // namespace
