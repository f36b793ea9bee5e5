//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef GPUSHARE_COMMON_LOGGING_HPP_INCLUDED
#define GPUSHARE_COMMON_LOGGING_HPP_INCLUDED

#include "common_helpers.hpp"

#include <cetl/cetl.hpp>

#include <spdlog/fmt/fmt.h>
#include <spdlog/fmt/ranges.h>
#include <spdlog/logger.h>
#include <spdlog/spdlog.h>

#include <array>
#include <memory>
#include <string>

namespace gpushare
{
namespace common
{

using Logger    = spdlog::logger;
using LoggerPtr = std::shared_ptr<Logger>;

/// Names of the subsystem loggers.
///
/// All of them are registered by the logging setup, so `[logging] level` (like `plugin=debug`)
/// applies to them even before the first `getLogger` call.
///
constexpr std::array<const char*, 3> SubsystemLoggerNames{{"engine", "plugin", "server"}};

/// Registers a clone of the default logger for each subsystem.
///
inline void registerSubsystemLoggers(Logger& default_logger)
{
    for (const auto* const name : SubsystemLoggerNames)
    {
        spdlog::register_logger(default_logger.clone(name));
    }
}

/// Gets a named logger, creating it (as a clone of the default one) if it is not registered yet.
///
inline LoggerPtr getLogger(const std::string& name) noexcept
{
    if (auto logger = spdlog::get(name))
    {
        return logger;
    }

    auto default_logger = spdlog::default_logger();
    CETL_DEBUG_ASSERT(default_logger, "default");

    auto logger = default_logger->clone(name);
    CETL_DEBUG_ASSERT(logger, name.c_str());

    performWithoutThrowing([&logger] {
        //
        spdlog::register_logger(logger);
    });

    return logger;
}

}  // namespace common
}  // namespace gpushare

#endif  // GPUSHARE_COMMON_LOGGING_HPP_INCLUDED
