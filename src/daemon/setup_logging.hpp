//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef GPUSHARE_DAEMON_SETUP_LOGGING_HPP_INCLUDED
#define GPUSHARE_DAEMON_SETUP_LOGGING_HPP_INCLUDED

#include "config.hpp"
#include "logging.hpp"

#include <spdlog/cfg/argv.h>
#include <spdlog/cfg/helpers.h>  // NOLINT
#include <spdlog/common.h>
#include <spdlog/logger.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <cstring>
#include <exception>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace detail
{

inline void loadFlushLevel(const std::string& level_name)
{
    const auto level = spdlog::level::from_str(level_name);
    // Ignore unrecognized level names.
    if ((level == spdlog::level::off) && (level_name != "off"))
    {
        return;
    }

    spdlog::flush_on(level);
    spdlog::apply_all([level](const std::shared_ptr<spdlog::logger>& logger) {
        //
        logger->flush_on(level);
    });
}

/// Search for SPDLOG_FLUSH_LEVEL= in the args and use it as the flush level of all loggers.
///
inline void loadArgvFlushLevel(const int argc, const char** const argv)
{
    const std::string spdlog_flush_level_prefix = "SPDLOG_FLUSH_LEVEL=";
    for (int i = 1; i < argc; i++)
    {
        const std::string arg_str = argv[i];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        if (arg_str.find(spdlog_flush_level_prefix) == 0)
        {
            loadFlushLevel(arg_str.substr(spdlog_flush_level_prefix.size()));
        }
    }
}

}  // namespace detail

/// Sets up the logging system.
///
/// The default logger writes to the standard error (colored); if a log file is configured,
/// then all loggers (including `engine`, `plugin` & `server` subsystem ones) also write into the rotating file.
///
inline void setupLogging(const int argc, const char** const argv, const gpushare::daemon::engine::Config::Ptr& config)
{
    using spdlog::sinks::rotating_file_sink_mt;
    using spdlog::sinks::stderr_color_sink_mt;

    try
    {
        constexpr std::size_t log_files_max     = 4;
        constexpr std::size_t log_file_max_size = 16UL * 1048576UL;  // 16 MB

        // Drop all existing loggers, including the default one, so that we can reconfigure them.
        spdlog::drop_all();

        const auto stderr_sink = std::make_shared<stderr_color_sink_mt>();
        stderr_sink->set_pattern("%^[%Y-%m-%d %H:%M:%S.%e] [%n] [%l]%$ %v");

        std::vector<spdlog::sink_ptr> sinks{stderr_sink};
        if (const auto logging_file = config->getLoggingFile())
        {
            const auto file_sink =
                std::make_shared<rotating_file_sink_mt>(logging_file.value(), log_file_max_size, log_files_max);
            file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%P:%t] [%n] [%l] %v");
            sinks.push_back(file_sink);

            // Insert "--…--" just to have clearer separation in the log file between two different process runs.
            file_sink->log({"", spdlog::level::info, "--------------------------"});
        }

        const auto default_logger = std::make_shared<spdlog::logger>("", sinks.begin(), sinks.end());
        register_logger(default_logger);
        set_default_logger(default_logger);

        // Register specific subsystem loggers.
        //
        gpushare::common::registerSubsystemLoggers(*default_logger);

        // Setup log levels from the configuration file.
        // Also accept `SPDLOG_LEVEL` & `SPDLOG_FLUSH_LEVEL` arguments if any (like `SPDLOG_LEVEL=debug,plugin=trace`).
        //
        if (const auto logging_level = config->getLoggingLevel())
        {
            spdlog::cfg::helpers::load_levels(logging_level.value());
        }
        if (const auto logging_flush_level = config->getLoggingFlushLevel())
        {
            detail::loadFlushLevel(logging_flush_level.value());
        }
        spdlog::cfg::load_argv_levels(argc, argv);
        detail::loadArgvFlushLevel(argc, argv);

    } catch (const std::exception& ex)
    {
        std::cerr << "Failed to setup logging: " << ex.what() << "\n";
        ::exit(EXIT_FAILURE);
    }
}

#endif  // GPUSHARE_DAEMON_SETUP_LOGGING_HPP_INCLUDED
