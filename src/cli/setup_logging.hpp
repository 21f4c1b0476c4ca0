//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef DPXFER_CLI_SETUP_LOGGING_HPP_INCLUDED
#define DPXFER_CLI_SETUP_LOGGING_HPP_INCLUDED

#include "config.hpp"

#include <spdlog/cfg/argv.h>
#include <spdlog/cfg/helpers.h>
#include <spdlog/common.h>
#include <spdlog/logger.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_sinks.h>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <exception>
#include <initializer_list>
#include <iostream>
#include <memory>
#include <string>

namespace dpxfer
{
namespace cli
{
namespace detail
{

inline void loadFlushLevels(const std::string& flush_levels)
{
    constexpr std::size_t max_levels_len = 512;
    if (flush_levels.empty() || (flush_levels.size() > max_levels_len))
    {
        return;
    }

    auto key_vals = spdlog::cfg::helpers::extract_key_vals_(flush_levels);  // NOLINT
    for (auto& name_level : key_vals)
    {
        const auto& logger_name = name_level.first;
        auto&       level_name  = spdlog::cfg::helpers::to_lower_(name_level.second);  // NOLINT
        const auto  level       = spdlog::level::from_str(level_name);
        // Ignore unrecognized level names.
        if (level == spdlog::level::off && level_name != "off")
        {
            continue;
        }

        if (const auto logger = spdlog::get(logger_name))
        {
            logger->flush_on(level);
        }
    }

    // Subsystem loggers without an explicit flush level follow the default one.
    //
    const auto default_flush_level = spdlog::default_logger()->flush_level();
    spdlog::apply_all([&key_vals, default_flush_level](const auto& logger) {
        //
        if (!logger->name().empty() && (key_vals.find(logger->name()) == key_vals.end()))
        {
            logger->flush_on(default_flush_level);
        }
    });
}

/// Search for SPDLOG_FLUSH_LEVEL= in the args and use it to init the flush levels.
///
inline void loadArgvFlushLevels(const int argc, const char** const argv)
{
    static const std::string spdlog_level_prefix = "SPDLOG_FLUSH_LEVEL=";

    for (int i = 1; i < argc; i++)
    {
        const std::string arg_str = argv[i];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        if (0 == arg_str.compare(0, spdlog_level_prefix.size(), spdlog_level_prefix))
        {
            loadFlushLevels(arg_str.substr(spdlog_level_prefix.size()));
        }
    }
}

}  // namespace detail

/// Sets up the logging system.
///
/// The rotating file sink is used for all loggers. The default logger also writes
/// its warnings and errors to stderr, so that an operator sees them without the log file.
///
inline void setupLogging(const int argc, const char** const argv, const Config::Ptr& config)
{
    using spdlog::sinks::rotating_file_sink_st;
    using spdlog::sinks::stderr_sink_st;

    try
    {
        constexpr std::size_t log_files_max     = 4;
        constexpr std::size_t log_file_max_size = 16UL * 1048576UL;  // 16 MB

        std::string log_file_path = "./dpxfer.log";
        if (config)
        {
            if (const auto logging_file = config->getLoggingFile())
            {
                log_file_path = logging_file.value();
            }
        }

        // Drop all existing loggers, including the default one, so that we can reconfigure them.
        spdlog::drop_all();

        const auto file_sink = std::make_shared<rotating_file_sink_st>(log_file_path, log_file_max_size, log_files_max);
        file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%P] [%n] [%l] %v");

        const auto stderr_sink = std::make_shared<stderr_sink_st>();
        stderr_sink->set_pattern("dpxfer: [%l] %v");
        stderr_sink->set_level(spdlog::level::warn);

        const std::initializer_list<spdlog::sink_ptr> sinks{stderr_sink, file_sink};
        const auto                                    default_logger = std::make_shared<spdlog::logger>("", sinks);
        register_logger(default_logger);
        set_default_logger(default_logger);

        // Register specific subsystem loggers - they go to the file sink only.
        //
        register_logger(std::make_shared<spdlog::logger>("io", file_sink));
        register_logger(std::make_shared<spdlog::logger>("mount", file_sink));
        register_logger(std::make_shared<spdlog::logger>("http", file_sink));
        register_logger(std::make_shared<spdlog::logger>("upload", file_sink));
        register_logger(std::make_shared<spdlog::logger>("cloud", file_sink));
        register_logger(std::make_shared<spdlog::logger>("dp", file_sink));

        // Setup log levels from the configuration file.
        // Also accept `SPDLOG_LEVEL` & `SPDLOG_FLUSH_LEVEL` arguments if any (like `SPDLOG_LEVEL=debug,mount=trace`).
        //
        if (config)
        {
            if (const auto logging_level = config->getLoggingLevel())
            {
                spdlog::cfg::helpers::load_levels(logging_level.value());
            }
            if (const auto logging_flush_level = config->getLoggingFlushLevel())
            {
                detail::loadFlushLevels(logging_flush_level.value());
            }
        }
        spdlog::cfg::load_argv_levels(argc, argv);
        detail::loadArgvFlushLevels(argc, argv);

        // Insert "--…--" just to have clearer separation in the log file between two different process runs.
        //
        if (spdlog::default_logger()->should_log(spdlog::level::info))
        {
            file_sink->log({"", spdlog::level::info, "--------------------------"});
        }

    } catch (const std::exception& ex)
    {
        std::cerr << "Failed to setup logging: " << ex.what() << '\n';
        std::exit(EXIT_FAILURE);
    }
}

}  // namespace cli
}  // namespace dpxfer

#endif  // DPXFER_CLI_SETUP_LOGGING_HPP_INCLUDED
