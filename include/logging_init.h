// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later
#pragma once

/**
 * @file logging_init.h
 * @brief spdlog setup for tether-wifid
 *
 * One default logger with a console sink plus one system sink chosen at
 * runtime: systemd journal (when built with TETHER_HAS_SYSTEMD and the journal
 * socket exists), syslog, or a rotating file.
 */

#include <spdlog/spdlog.h>

#include <string>

namespace tether {
namespace logging {

enum class LogTarget {
    Auto,    ///< Journal if available, else syslog (console only off Linux)
    Journal, ///< systemd journal
    Syslog,  ///< syslog(3)
    File,    ///< Rotating file, 5MB x 3
    Console  ///< Console sink only
};

struct LogConfig {
    spdlog::level::level_enum level = spdlog::level::warn;
    LogTarget target = LogTarget::Auto;
    bool enable_console = true;
    std::string file_path; ///< Empty = /var/log/tether-wifid.log or XDG fallback
};

/// Replace the default logger according to @p config
void init(const LogConfig& config);

/// "auto", "journal", "syslog", "file", "console"; anything else is Auto
LogTarget parse_log_target(const std::string& str);

const char* log_target_name(LogTarget target);

/// "trace", "debug", "info", "warn", "error", "critical", "off"
spdlog::level::level_enum parse_level(const std::string& str,
                                      spdlog::level::level_enum fallback = spdlog::level::warn);

/// -v count to level: 0 = warn, 1 = info, 2 = debug, 3+ = trace
spdlog::level::level_enum verbosity_to_level(int verbosity);

} // namespace logging
} // namespace tether
