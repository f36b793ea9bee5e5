//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef GPUSHARE_DAEMON_ENGINE_PLUGIN_PLUGIN_CONFIG_HPP_INCLUDED
#define GPUSHARE_DAEMON_ENGINE_PLUGIN_PLUGIN_CONFIG_HPP_INCLUDED

#include "replicas.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <cstdint>
#include <string>

namespace gpushare
{
namespace daemon
{
namespace engine
{

class Config;

namespace plugin
{

constexpr const char* ResourceNamePrefix       = "nvidia.com/";
constexpr const char* DevicePluginPath         = "/var/lib/kubelet/device-plugins/";
constexpr const char* DefaultKubeletSocket     = "/var/lib/kubelet/device-plugins/kubelet.sock";
constexpr const char* DefaultDeviceListEnvvar  = "NVIDIA_VISIBLE_DEVICES";
constexpr const char* DefaultResourceShortName = "gpu";

/// How the allocated devices are communicated to a container.
///
enum class DeviceListStrategy : std::uint8_t
{
    Envvar,        ///< "envvar"
    VolumeMounts,  ///< "volume-mounts"
};

/// How the allocated devices are identified to a container.
///
enum class DeviceIdStrategy : std::uint8_t
{
    Uuid,   ///< "uuid"
    Index,  ///< "index"
};

enum class AllocatePolicyKind : std::uint8_t
{
    None,    ///< "none"
    Simple,  ///< "simple"
};

/// Immutable snapshot of the plugin settings.
///
/// Changing any of them requires a full restart of the plugin.
///
struct PluginConfig
{
    struct MakeResult
    {
        using Failure = std::string;
        using Success = PluginConfig;
        using Var     = cetl::variant<Success, Failure>;
    };
    CETL_NODISCARD static MakeResult::Var make(const Config& config);

    std::string        resource_name{std::string{ResourceNamePrefix} + DefaultResourceShortName};
    std::string        socket_path;
    std::string        kubelet_socket_path{DefaultKubeletSocket};
    DeviceListStrategy device_list_strategy{DeviceListStrategy::Envvar};
    DeviceIdStrategy   device_id_strategy{DeviceIdStrategy::Uuid};
    bool               pass_device_specs{false};
    std::string        driver_root{"/"};
    std::string        device_list_envvar{DefaultDeviceListEnvvar};
    ReplicationPolicy  replication{1, false};
    AllocatePolicyKind allocate_policy{AllocatePolicyKind::None};

    /// Whether `GetPreferredAllocation` is supported by the plugin with these settings.
    ///
    bool isPreferredAllocationAvailable() const
    {
        return (allocate_policy != AllocatePolicyKind::None) || replication.isReplicating();
    }

};  // PluginConfig

CETL_NODISCARD cetl::optional<DeviceListStrategy> parseDeviceListStrategy(const std::string& name);
CETL_NODISCARD cetl::optional<DeviceIdStrategy>   parseDeviceIdStrategy(const std::string& name);
CETL_NODISCARD cetl::optional<AllocatePolicyKind> parseAllocatePolicyKind(const std::string& name);

/// Applies a `<kind>:<rename>:<replicas>[,...]` resource configuration to the plugin settings.
///
/// Only the `gpu` kind is supported, and only once. Replica count `-1` enables the auto replication.
///
/// @return Failure description, or `nullopt` on success.
///
CETL_NODISCARD cetl::optional<std::string> applyResourceConfig(const std::string& resource_config,
                                                               PluginConfig&      plugin_config);

/// Default socket path for the given resource, f.e. `.../device-plugins/nvidia-gpu.sock` for `nvidia.com/gpu`.
///
std::string defaultSocketPathFor(const std::string& resource_name);

}  // namespace plugin
}  // namespace engine
}  // namespace daemon
}  // namespace gpushare

#endif  // GPUSHARE_DAEMON_ENGINE_PLUGIN_PLUGIN_CONFIG_HPP_INCLUDED
