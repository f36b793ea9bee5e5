//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "plugin_config.hpp"

#include "common_helpers.hpp"
#include "config.hpp"
#include "replicas.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <limits>
#include <string>

namespace gpushare
{
namespace daemon
{
namespace engine
{
namespace plugin
{
namespace
{

constexpr const char* SupportedResourceKind = "gpu";

cetl::optional<std::int64_t> parseInteger(const std::string& str)
{
    if (str.empty())
    {
        return cetl::nullopt;
    }

    char* end_ptr = nullptr;
    errno         = 0;
    const auto value = std::strtoll(str.c_str(), &end_ptr, 10);
    if ((errno != 0) || (*end_ptr != '\0'))
    {
        return cetl::nullopt;
    }
    return static_cast<std::int64_t>(value);
}

cetl::optional<std::string> applyReplicas(const std::int64_t replicas, PluginConfig& plugin_config)
{
    if (replicas == -1)
    {
        plugin_config.replication = ReplicationPolicy{1, true};
        return cetl::nullopt;
    }
    if ((replicas < 1) || (replicas > std::numeric_limits<std::uint32_t>::max()))
    {
        return "Invalid replica count " + std::to_string(replicas) + " (expected -1 or a positive number).";
    }
    plugin_config.replication = ReplicationPolicy{static_cast<std::uint32_t>(replicas), false};
    return cetl::nullopt;
}

}  // namespace

cetl::optional<DeviceListStrategy> parseDeviceListStrategy(const std::string& name)
{
    if (name == "envvar")
    {
        return DeviceListStrategy::Envvar;
    }
    if (name == "volume-mounts")
    {
        return DeviceListStrategy::VolumeMounts;
    }
    return cetl::nullopt;
}

cetl::optional<DeviceIdStrategy> parseDeviceIdStrategy(const std::string& name)
{
    if (name == "uuid")
    {
        return DeviceIdStrategy::Uuid;
    }
    if (name == "index")
    {
        return DeviceIdStrategy::Index;
    }
    return cetl::nullopt;
}

cetl::optional<AllocatePolicyKind> parseAllocatePolicyKind(const std::string& name)
{
    if (name.empty() || (name == "none"))
    {
        return AllocatePolicyKind::None;
    }
    if (name == "simple")
    {
        return AllocatePolicyKind::Simple;
    }
    return cetl::nullopt;
}

cetl::optional<std::string> applyResourceConfig(const std::string& resource_config, PluginConfig& plugin_config)
{
    std::size_t gpu_entries = 0;
    for (const auto& entry : common::splitString(resource_config, ','))
    {
        const auto parts = common::splitString(entry, ':');
        if (parts.size() != 3)
        {
            return "Invalid resource config entry '" + entry + "' (expected '<kind>:<rename>:<replicas>').";
        }

        const auto& kind     = parts[0];
        const auto& rename   = parts[1];
        const auto  replicas = parseInteger(parts[2]);
        if (kind != SupportedResourceKind)
        {
            return "Unsupported resource kind '" + kind + "' in resource config entry '" + entry + "'.";
        }
        // One daemon serves one resource.
        if (++gpu_entries > 1)
        {
            return "Only one '" + kind + "' resource config entry is supported (extra entry '" + entry + "').";
        }
        if (rename.empty())
        {
            return "Empty resource name in resource config entry '" + entry + "'.";
        }
        if (!replicas)
        {
            return "Invalid replica count '" + parts[2] + "' in resource config entry '" + entry + "'.";
        }

        plugin_config.resource_name = ResourceNamePrefix + rename;
        if (auto failure = applyReplicas(replicas.value(), plugin_config))
        {
            return failure;
        }
    }
    return cetl::nullopt;
}

std::string defaultSocketPathFor(const std::string& resource_name)
{
    const auto slash_pos  = resource_name.rfind('/');
    const auto short_name = (slash_pos == std::string::npos) ? resource_name : resource_name.substr(slash_pos + 1);
    return std::string{DevicePluginPath} + "nvidia-" + short_name + ".sock";
}

PluginConfig::MakeResult::Var PluginConfig::make(const Config& config)
{
    PluginConfig plugin_config;

    if (const auto resource_name = config.getPluginResourceName())
    {
        plugin_config.resource_name = resource_name.value();
    }
    if (const auto replicas = config.getPluginReplicas())
    {
        if (auto failure = applyReplicas(replicas.value(), plugin_config))
        {
            return failure.value();
        }
    }
    if (config.getPluginAutoReplicas().value_or(false))
    {
        plugin_config.replication.auto_replicas = true;
    }
    // The resource config (if any) takes precedence over the plain name & replicas settings.
    if (const auto resource_config = config.getPluginResourceConfig())
    {
        if (auto failure = applyResourceConfig(resource_config.value(), plugin_config))
        {
            return failure.value();
        }
    }

    plugin_config.socket_path         = config.getPluginSocket().value_or(defaultSocketPathFor(plugin_config.resource_name));
    plugin_config.kubelet_socket_path = config.getPluginKubeletSocket().value_or(DefaultKubeletSocket);
    plugin_config.pass_device_specs   = config.getPluginPassDeviceSpecs().value_or(false);
    plugin_config.driver_root         = config.getPluginDriverRoot().value_or("/");
    plugin_config.device_list_envvar  = config.getPluginDeviceListEnvvar().value_or(DefaultDeviceListEnvvar);

    const auto list_strategy_name = config.getPluginDeviceListStrategy().value_or("envvar");
    const auto list_strategy      = parseDeviceListStrategy(list_strategy_name);
    if (!list_strategy)
    {
        return "Invalid device list strategy '" + list_strategy_name + "'.";
    }
    plugin_config.device_list_strategy = list_strategy.value();

    const auto id_strategy_name = config.getPluginDeviceIdStrategy().value_or("uuid");
    const auto id_strategy      = parseDeviceIdStrategy(id_strategy_name);
    if (!id_strategy)
    {
        return "Invalid device id strategy '" + id_strategy_name + "'.";
    }
    plugin_config.device_id_strategy = id_strategy.value();

    const auto policy_name = config.getPluginAllocatePolicy().value_or("none");
    const auto policy_kind = parseAllocatePolicyKind(policy_name);
    if (!policy_kind)
    {
        return "Invalid allocate policy '" + policy_name + "'.";
    }
    plugin_config.allocate_policy = policy_kind.value();

    if (plugin_config.socket_path.empty() || (plugin_config.socket_path.front() != '/'))
    {
        return "Plugin socket path must be absolute (path='" + plugin_config.socket_path + "').";
    }
    if (plugin_config.device_list_envvar.empty())
    {
        return std::string{"Device list environment variable name must not be empty."};
    }

    return plugin_config;
}

}  // namespace plugin
}  // namespace engine
}  // namespace daemon
}  // namespace gpushare
