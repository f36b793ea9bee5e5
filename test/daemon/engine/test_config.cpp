//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "config.hpp"

#include "plugin/device.hpp"
#include "plugin/plugin_gtest_helpers.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <chrono>
#include <exception>
#include <string>

namespace
{

using namespace gpushare::daemon::engine;  // NOLINT This our main concern here in the unit tests.

using plugin::Device;
using plugin::DeviceIdIs;
using plugin::Health;

using testing::ElementsAre;
using testing::IsEmpty;
using testing::Optional;

// https://github.com/llvm/llvm-project/issues/53444
// NOLINTBEGIN(misc-unused-using-decls, misc-include-cleaner)
using std::literals::chrono_literals::operator""ms;
// NOLINTEND(misc-unused-using-decls, misc-include-cleaner)

// NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

class TestConfig : public testing::Test
{};

// MARK: - Tests:

TEST_F(TestConfig, empty_config_has_nothing_but_defaults)
{
    const auto config = Config::parse("");
    ASSERT_TRUE(config);

    EXPECT_FALSE(config->getPluginResourceName().has_value());
    EXPECT_FALSE(config->getPluginResourceConfig().has_value());
    EXPECT_FALSE(config->getPluginSocket().has_value());
    EXPECT_FALSE(config->getPluginReplicas().has_value());
    EXPECT_FALSE(config->getPluginAutoReplicas().has_value());
    EXPECT_FALSE(config->getHealthCheckInterval().has_value());
    EXPECT_FALSE(config->getLoggingFile().has_value());
    EXPECT_TRUE(config->getPluginFailOnInitError());
    EXPECT_TRUE(config->getHealthEnabled());
    EXPECT_THAT(config->getDevices(), IsEmpty());
}

TEST_F(TestConfig, full_config)
{
    const auto config = Config::parse(R"(
[plugin]
resource_name        = "nvidia.com/gpu"
resource_config      = "gpu:sharedgpu:4"
socket               = "/tmp/dp/nvidia-gpu.sock"
kubelet_socket       = "/tmp/dp/kubelet.sock"
device_list_strategy = "volume-mounts"
device_id_strategy   = "index"
pass_device_specs    = true
driver_root          = "/run/nvidia/driver"
device_list_envvar   = "VISIBLE"
replicas             = 3
auto_replicas        = true
allocate_policy      = "simple"
fail_on_init_error   = false

[health]
enabled           = false
check_interval_ms = 250

[[devices]]
id           = "GPU-a"
index        = 0
total_memory = 16160
paths        = ["/dev/nvidia0"]

[[devices]]
id           = "GPU-b"
index        = 1
total_memory = 512

[logging]
file        = "/tmp/gpushare.log"
level       = "info,plugin=debug"
flush_level = "warn"
)");

    EXPECT_THAT(config->getPluginResourceName(), Optional(std::string{"nvidia.com/gpu"}));
    EXPECT_THAT(config->getPluginResourceConfig(), Optional(std::string{"gpu:sharedgpu:4"}));
    EXPECT_THAT(config->getPluginSocket(), Optional(std::string{"/tmp/dp/nvidia-gpu.sock"}));
    EXPECT_THAT(config->getPluginKubeletSocket(), Optional(std::string{"/tmp/dp/kubelet.sock"}));
    EXPECT_THAT(config->getPluginDeviceListStrategy(), Optional(std::string{"volume-mounts"}));
    EXPECT_THAT(config->getPluginDeviceIdStrategy(), Optional(std::string{"index"}));
    EXPECT_THAT(config->getPluginPassDeviceSpecs(), Optional(true));
    EXPECT_THAT(config->getPluginDriverRoot(), Optional(std::string{"/run/nvidia/driver"}));
    EXPECT_THAT(config->getPluginDeviceListEnvvar(), Optional(std::string{"VISIBLE"}));
    EXPECT_THAT(config->getPluginReplicas(), Optional(3));
    EXPECT_THAT(config->getPluginAutoReplicas(), Optional(true));
    EXPECT_THAT(config->getPluginAllocatePolicy(), Optional(std::string{"simple"}));
    EXPECT_FALSE(config->getPluginFailOnInitError());
    EXPECT_FALSE(config->getHealthEnabled());
    EXPECT_THAT(config->getHealthCheckInterval(), Optional(250ms));
    EXPECT_THAT(config->getLoggingFile(), Optional(std::string{"/tmp/gpushare.log"}));
    EXPECT_THAT(config->getLoggingLevel(), Optional(std::string{"info,plugin=debug"}));
    EXPECT_THAT(config->getLoggingFlushLevel(), Optional(std::string{"warn"}));

    const auto devices = config->getDevices();
    ASSERT_THAT(devices, ElementsAre(DeviceIdIs("GPU-a"), DeviceIdIs("GPU-b")));
    EXPECT_THAT(devices[0].index, "0");
    EXPECT_THAT(devices[0].total_memory, 16160);
    EXPECT_THAT(devices[0].paths, ElementsAre("/dev/nvidia0"));
    EXPECT_THAT(devices[0].health, Health::Healthy);
    EXPECT_THAT(devices[1].index, "1");
    EXPECT_THAT(devices[1].total_memory, 512);
    EXPECT_THAT(devices[1].paths, IsEmpty());
}

TEST_F(TestConfig, mistyped_settings_are_ignored)
{
    const auto config = Config::parse(R"(
[plugin]
replicas          = "four"
pass_device_specs = "yes"

[health]
check_interval_ms = -5
)");

    EXPECT_FALSE(config->getPluginReplicas().has_value());
    EXPECT_FALSE(config->getPluginPassDeviceSpecs().has_value());
    EXPECT_FALSE(config->getHealthCheckInterval().has_value());
}

TEST_F(TestConfig, malformed_device_entry_fails)
{
    EXPECT_THROW((void) Config::parse("[[devices]]\nindex = 0\ntotal_memory = 1000\n"), std::exception);
    EXPECT_THROW((void) Config::parse("[[devices]]\nid = \"\"\nindex = 0\ntotal_memory = 1000\n"), std::exception);
    EXPECT_THROW((void) Config::parse("[[devices]]\nid = \"GPU-a\"\nindex = -1\ntotal_memory = 1000\n"),
                 std::exception);
    EXPECT_THROW((void) Config::parse("[[devices]]\nid = \"GPU-a\"\nindex = 0\ntotal_memory = -1\n"),
                 std::exception);
}

TEST_F(TestConfig, syntax_error_fails)
{
    EXPECT_THROW((void) Config::parse("[plugin\nreplicas = 2\n"), std::exception);
}

TEST_F(TestConfig, missing_file_fails)
{
    EXPECT_THROW((void) Config::make("/nonexistent/gpushare.toml"), std::exception);
}

// NOLINTEND(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

}  // namespace
