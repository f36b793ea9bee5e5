//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "config.hpp"

#include "plugin/device.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <spdlog/spdlog.h>
#include <toml.hpp>

#include <chrono>
#include <cstdint>
#include <exception>
#include <fstream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace gpushare
{
namespace daemon
{
namespace engine
{
namespace
{

class ConfigImpl final : public Config
{
public:
    using TomlValue = toml::value;

    explicit ConfigImpl(TomlValue&& root)
        : root_{std::move(root)}
        , devices_{parseDevices(root_)}
    {
    }

    // Config

    auto getPluginResourceName() const -> cetl::optional<std::string> override
    {
        return findImpl<std::string>("plugin", "resource_name");
    }

    auto getPluginResourceConfig() const -> cetl::optional<std::string> override
    {
        return findImpl<std::string>("plugin", "resource_config");
    }

    auto getPluginSocket() const -> cetl::optional<std::string> override
    {
        return findImpl<std::string>("plugin", "socket");
    }

    auto getPluginKubeletSocket() const -> cetl::optional<std::string> override
    {
        return findImpl<std::string>("plugin", "kubelet_socket");
    }

    auto getPluginDeviceListStrategy() const -> cetl::optional<std::string> override
    {
        return findImpl<std::string>("plugin", "device_list_strategy");
    }

    auto getPluginDeviceIdStrategy() const -> cetl::optional<std::string> override
    {
        return findImpl<std::string>("plugin", "device_id_strategy");
    }

    auto getPluginPassDeviceSpecs() const -> cetl::optional<bool> override
    {
        return findImpl<bool>("plugin", "pass_device_specs");
    }

    auto getPluginDriverRoot() const -> cetl::optional<std::string> override
    {
        return findImpl<std::string>("plugin", "driver_root");
    }

    auto getPluginDeviceListEnvvar() const -> cetl::optional<std::string> override
    {
        return findImpl<std::string>("plugin", "device_list_envvar");
    }

    auto getPluginReplicas() const -> cetl::optional<std::int64_t> override
    {
        return findImpl<std::int64_t>("plugin", "replicas");
    }

    auto getPluginAutoReplicas() const -> cetl::optional<bool> override
    {
        return findImpl<bool>("plugin", "auto_replicas");
    }

    auto getPluginAllocatePolicy() const -> cetl::optional<std::string> override
    {
        return findImpl<std::string>("plugin", "allocate_policy");
    }

    auto getPluginFailOnInitError() const -> bool override
    {
        return toml::find_or(root_, "plugin", "fail_on_init_error", true);
    }

    auto getHealthEnabled() const -> bool override
    {
        return toml::find_or(root_, "health", "enabled", true);
    }

    auto getHealthCheckInterval() const -> cetl::optional<std::chrono::milliseconds> override
    {
        if (const auto interval_ms = findImpl<std::int64_t>("health", "check_interval_ms"))
        {
            if (interval_ms.value() > 0)
            {
                return std::chrono::milliseconds{interval_ms.value()};
            }
        }
        return cetl::nullopt;
    }

    auto getDevices() const -> plugin::Devices override
    {
        return devices_;
    }

    auto getLoggingFile() const -> cetl::optional<std::string> override
    {
        return findImpl<std::string>("logging", "file");
    }

    auto getLoggingLevel() const -> cetl::optional<std::string> override
    {
        return findImpl<std::string>("logging", "level");
    }

    auto getLoggingFlushLevel() const -> cetl::optional<std::string> override
    {
        return findImpl<std::string>("logging", "flush_level");
    }

private:
    template <typename T, typename... Keys>
    cetl::optional<T> findImpl(Keys&&... keys) const
    {
        try
        {
            return cetl::make_optional(toml::find<T>(root_, std::forward<Keys>(keys)...));

        } catch (const std::out_of_range&)
        {
            return cetl::nullopt;  // Not configured.

        } catch (const std::exception& ex)
        {
            spdlog::warn("Ignoring invalid config setting: {}", ex.what());
            return cetl::nullopt;
        }
    }

    static std::uint64_t findUnsigned(const TomlValue& table, const char* const key)
    {
        const auto value = toml::find<std::int64_t>(table, key);
        if (value < 0)
        {
            throw std::out_of_range(std::string{"Negative device '"} + key + "' value.");
        }
        return static_cast<std::uint64_t>(value);
    }

    /// Eagerly parses `[[devices]]` so that a malformed device entry fails the whole config.
    ///
    static plugin::Devices parseDevices(const TomlValue& root)
    {
        plugin::Devices devices;
        if (!root.is_table() || (root.as_table().count("devices") == 0))
        {
            return devices;
        }

        for (const auto& entry : toml::find(root, "devices").as_array())
        {
            plugin::Device device{};
            device.id           = toml::find<std::string>(entry, "id");
            device.index        = std::to_string(findUnsigned(entry, "index"));
            device.total_memory = findUnsigned(entry, "total_memory");
            device.paths        = toml::find_or(entry, "paths", std::vector<std::string>{});
            device.health       = plugin::Health::Healthy;
            if (device.id.empty())
            {
                throw std::invalid_argument("Device 'id' must not be empty.");
            }
            devices.push_back(std::move(device));
        }
        return devices;
    }

    TomlValue       root_;
    plugin::Devices devices_;

};  // ConfigImpl

}  // namespace

Config::Ptr Config::make(const std::string& file_path)
{
    std::ifstream file{file_path, std::ios_base::in | std::ios_base::binary};
    if (!file)
    {
        throw std::runtime_error("Can't open config file '" + file_path + "'.");
    }
    return std::make_shared<ConfigImpl>(toml::parse(file, file_path));
}

Config::Ptr Config::parse(const std::string& toml_text, const std::string& source_name)
{
    std::istringstream text_stream{toml_text};
    return std::make_shared<ConfigImpl>(toml::parse(text_stream, source_name));
}

}  // namespace engine
}  // namespace daemon
}  // namespace gpushare
