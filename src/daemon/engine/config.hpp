//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef GPUSHARE_DAEMON_ENGINE_CONFIG_HPP_INCLUDED
#define GPUSHARE_DAEMON_ENGINE_CONFIG_HPP_INCLUDED

#include "plugin/device.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

namespace gpushare
{
namespace daemon
{
namespace engine
{

/// Read-only view of the daemon configuration file.
///
/// Getters return `nullopt` for absent (or mistyped) settings, so that defaults are applied by consumers.
///
class Config
{
public:
    using Ptr = std::shared_ptr<Config>;

    /// Loads configuration from the given TOML file.
    ///
    /// @throws std::exception (f.e. `toml::syntax_error`) if the file can't be read or parsed.
    ///
    CETL_NODISCARD static Ptr make(const std::string& file_path);

    /// Parses configuration from TOML text (the `source_name` is used in error messages only).
    ///
    CETL_NODISCARD static Ptr parse(const std::string& toml_text, const std::string& source_name = "config");

    Config(const Config&)                = delete;
    Config(Config&&) noexcept            = delete;
    Config& operator=(const Config&)     = delete;
    Config& operator=(Config&&) noexcept = delete;

    virtual ~Config() = default;

    // [plugin]
    CETL_NODISCARD virtual auto getPluginResourceName() const -> cetl::optional<std::string>      = 0;
    CETL_NODISCARD virtual auto getPluginResourceConfig() const -> cetl::optional<std::string>    = 0;
    CETL_NODISCARD virtual auto getPluginSocket() const -> cetl::optional<std::string>            = 0;
    CETL_NODISCARD virtual auto getPluginKubeletSocket() const -> cetl::optional<std::string>     = 0;
    CETL_NODISCARD virtual auto getPluginDeviceListStrategy() const -> cetl::optional<std::string> = 0;
    CETL_NODISCARD virtual auto getPluginDeviceIdStrategy() const -> cetl::optional<std::string>  = 0;
    CETL_NODISCARD virtual auto getPluginPassDeviceSpecs() const -> cetl::optional<bool>          = 0;
    CETL_NODISCARD virtual auto getPluginDriverRoot() const -> cetl::optional<std::string>        = 0;
    CETL_NODISCARD virtual auto getPluginDeviceListEnvvar() const -> cetl::optional<std::string>  = 0;
    CETL_NODISCARD virtual auto getPluginReplicas() const -> cetl::optional<std::int64_t>         = 0;
    CETL_NODISCARD virtual auto getPluginAutoReplicas() const -> cetl::optional<bool>             = 0;
    CETL_NODISCARD virtual auto getPluginAllocatePolicy() const -> cetl::optional<std::string>    = 0;
    CETL_NODISCARD virtual auto getPluginFailOnInitError() const -> bool                          = 0;

    // [health]
    CETL_NODISCARD virtual auto getHealthEnabled() const -> bool                                         = 0;
    CETL_NODISCARD virtual auto getHealthCheckInterval() const -> cetl::optional<std::chrono::milliseconds> = 0;

    // [[devices]]
    CETL_NODISCARD virtual auto getDevices() const -> plugin::Devices = 0;

    // [logging]
    CETL_NODISCARD virtual auto getLoggingFile() const -> cetl::optional<std::string>       = 0;
    CETL_NODISCARD virtual auto getLoggingLevel() const -> cetl::optional<std::string>      = 0;
    CETL_NODISCARD virtual auto getLoggingFlushLevel() const -> cetl::optional<std::string> = 0;

protected:
    Config() = default;

};  // Config

}  // namespace engine
}  // namespace daemon
}  // namespace gpushare

#endif  // GPUSHARE_DAEMON_ENGINE_CONFIG_HPP_INCLUDED
