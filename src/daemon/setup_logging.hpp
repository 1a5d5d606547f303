//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef BTMUX_DAEMON_SETUP_LOGGING_HPP_INCLUDED
#define BTMUX_DAEMON_SETUP_LOGGING_HPP_INCLUDED

#include "engine/config.hpp"

#include <spdlog/cfg/argv.h>
#include <spdlog/cfg/helpers.h>  // NOLINT
#include <spdlog/common.h>
#include <spdlog/logger.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/syslog_sink.h>
#include <spdlog/spdlog.h>

#include <array>
#include <cstdlib>
#include <cstring>
#include <exception>
#include <initializer_list>
#include <memory>
#include <string>
#include <sys/syslog.h>
#include <unistd.h>

namespace detail
{

/// Subsystem loggers of the daemon. They write to the file sink only.
constexpr std::array<const char*, 2> SubsystemLoggers{"core", "engine"};

/// Applies `name=level,...` flush levels (same syntax as `SPDLOG_LEVEL`).
///
/// Loggers not mentioned explicitly inherit the flush level of the default logger.
///
inline void loadFlushLevels(const std::string& flush_levels)
{
    constexpr std::size_t max_levels_len = 512;
    if (flush_levels.empty() || (flush_levels.size() > max_levels_len))
    {
        return;
    }

    const auto key_vals = spdlog::cfg::helpers::extract_key_vals_(flush_levels);  // NOLINT
    for (const auto& name_level : key_vals)
    {
        auto       level_name = name_level.second;
        const auto level      = spdlog::level::from_str(spdlog::cfg::helpers::to_lower_(level_name));  // NOLINT
        if ((level == spdlog::level::off) && (level_name != "off"))
        {
            continue;  // unrecognized
        }

        if (name_level.first.empty())
        {
            spdlog::default_logger()->flush_on(level);
        }
        else if (const auto logger = spdlog::get(name_level.first))
        {
            logger->flush_on(level);
        }
    }

    const auto default_flush_level = spdlog::default_logger()->flush_level();
    spdlog::apply_all([&key_vals, default_flush_level](const auto& logger) {
        //
        if (!logger->name().empty() && (key_vals.find(logger->name()) == key_vals.end()))
        {
            logger->flush_on(default_flush_level);
        }
    });
}

/// Applies the last `SPDLOG_FLUSH_LEVEL=` argument, if any.
///
inline void loadArgvFlushLevels(const int argc, const char** const argv)
{
    static const std::string flush_level_prefix = "SPDLOG_FLUSH_LEVEL=";

    std::string flush_levels;
    for (int i = 1; i < argc; ++i)
    {
        const std::string arg_str = argv[i];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        if (0 == arg_str.compare(0, flush_level_prefix.size(), flush_level_prefix))
        {
            flush_levels = arg_str.substr(flush_level_prefix.size());
        }
    }
    loadFlushLevels(flush_levels);
}

}  // namespace detail

inline bool writeString(const int fd, const char* const str)
{
    const auto str_len = std::strlen(str);
    return static_cast<ssize_t>(str_len) == ::write(fd, str, str_len);
}

/// Sets up the logging system of the daemon.
///
/// The default logger writes both to syslog and to a rotating log file;
/// subsystem loggers (`core`, `engine`) write to the file only.
/// Levels come from the `[logging]` config section and then from
/// `SPDLOG_LEVEL=`/`SPDLOG_FLUSH_LEVEL=` arguments (like `SPDLOG_LEVEL=info,core=trace`).
///
inline void setupLogging(const int                                 err_fd,
                         const bool                                is_daemonized,
                         const int                                 argc,
                         const char** const                        argv,
                         const btmux::daemon::engine::Config::Ptr& config)
{
    using spdlog::sinks::syslog_sink_mt;
    using spdlog::sinks::rotating_file_sink_mt;

    constexpr std::size_t log_files_max     = 4;
    constexpr std::size_t log_file_max_size = 16UL * 1048576UL;  // 16 MB
    const std::string     ident             = "btmuxd";

    try
    {
        const auto log_file_path =
            config->getLoggingFile().value_or((is_daemonized ? "/var/log/" : "./") + ident + ".log");

        spdlog::drop_all();

        const auto file_sink = std::make_shared<rotating_file_sink_mt>(log_file_path, log_file_max_size, log_files_max);
        file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%P] [%n] [%l] %v");

        const int  facility    = is_daemonized ? LOG_DAEMON : LOG_USER;
        const auto syslog_sink = std::make_shared<syslog_sink_mt>(ident, LOG_PID, facility, true);
        syslog_sink->set_pattern("[%l] '%n' | %v");

        const std::initializer_list<spdlog::sink_ptr> default_sinks{syslog_sink, file_sink};
        const auto default_logger = std::make_shared<spdlog::logger>("", default_sinks);
        spdlog::register_logger(default_logger);
        spdlog::set_default_logger(default_logger);

        for (const auto* const name : detail::SubsystemLoggers)
        {
            spdlog::register_logger(std::make_shared<spdlog::logger>(name, file_sink));
        }

        if (const auto logging_level = config->getLoggingLevel())
        {
            spdlog::cfg::helpers::load_levels(logging_level.value());
        }
        if (const auto logging_flush_level = config->getLoggingFlushLevel())
        {
            detail::loadFlushLevels(logging_flush_level.value());
        }
        spdlog::cfg::load_argv_levels(argc, argv);
        detail::loadArgvFlushLevels(argc, argv);

        // Separates runs in the log file; bypasses syslog.
        if (default_logger->should_log(spdlog::level::info))
        {
            file_sink->log({"", spdlog::level::info, "--------------------------"});
        }

    } catch (const std::exception& ex)
    {
        writeString(err_fd, "Failed to setup logging: ");
        writeString(err_fd, ex.what());
        ::exit(EXIT_FAILURE);
    }
}

#endif  // BTMUX_DAEMON_SETUP_LOGGING_HPP_INCLUDED
