//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "engine/config.hpp"
#include "engine/engine.hpp"
#include "setup_logging.hpp"

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <cstring>
#include <exception>
#include <iostream>
#include <signal.h>  // NOLINT
#include <string>

namespace
{

// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
volatile sig_atomic_t g_running = 1;

// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
volatile sig_atomic_t g_restart_requested = 0;

extern "C" void signalHandler(const int sig)
{
    switch (sig)
    {
    case SIGTERM:
    case SIGINT:
    case SIGQUIT:
        g_running = 0;
        break;
    case SIGHUP:
        g_restart_requested = 1;
        break;
    default:
        break;
    }
}

void setupSignalHandlers()
{
    struct sigaction sigbreak
    {};
    sigbreak.sa_handler = &signalHandler;
    ::sigaction(SIGINT, &sigbreak, nullptr);
    ::sigaction(SIGTERM, &sigbreak, nullptr);
    ::sigaction(SIGQUIT, &sigbreak, nullptr);
    ::sigaction(SIGHUP, &sigbreak, nullptr);
}

gpushare::daemon::engine::Config::Ptr loadConfig(const bool is_dev, const int argc, const char** const argv)
{
    static const std::string cfg_file_name      = "gpushare.toml";
    static const std::string config_file_prefix = "CONFIG_FILE=";

    const std::string cfg_file_dir  = is_dev ? "./" : "/etc/gpushare/";
    auto              cfg_file_path = cfg_file_dir + cfg_file_name;
    for (int i = 1; i < argc; i++)
    {
        const std::string arg_str = argv[i];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        if (0 == arg_str.compare(0, config_file_prefix.size(), config_file_prefix))
        {
            cfg_file_path = arg_str.substr(config_file_prefix.size());
        }
    }

    try
    {
        return gpushare::daemon::engine::Config::make(cfg_file_path);

    } catch (const std::exception& ex)
    {
        std::cerr << "Failed to load configuration file (path='" << cfg_file_path << "').\n" << ex.what() << "\n";
    }
    ::exit(EXIT_FAILURE);
}

}  // namespace

int main(const int argc, const char** const argv)
{
    bool is_dev = false;
    for (int i = 1; i < argc; ++i)
    {
        if (::strcmp(argv[i], "--dev") == 0)  // NOLINT
        {
            is_dev = true;
        }
    }

    setupSignalHandlers();

    const auto config = loadConfig(is_dev, argc, argv);
    setupLogging(argc, argv, config);

    spdlog::info("gpushare device plugin started (ver='{}.{}').", VERSION_MAJOR, VERSION_MINOR);
    int result = EXIT_SUCCESS;
    {
        try
        {
            gpushare::daemon::engine::Engine engine{config};
            if (const auto failure_str = engine.init())
            {
                spdlog::critical("Failed to init engine: {}", failure_str.value());
                spdlog::shutdown();
                ::exit(EXIT_FAILURE);
            }

            engine.runWhile([] { return g_running == 1; },
                            [] {
                                //
                                const bool is_requested = g_restart_requested == 1;
                                g_restart_requested     = 0;
                                return is_requested;
                            });

        } catch (const std::exception& ex)
        {
            spdlog::critical("Unhandled exception: {}", ex.what());
            result = EXIT_FAILURE;
        }

        if (g_running == 0)
        {
            spdlog::debug("Received termination signal.");
        }
    }
    spdlog::info("gpushare device plugin terminated.");

    return result;
}
