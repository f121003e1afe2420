/*
 * File:        logging.h
 * Module:      seti-core
 * Purpose:     Logging system implementation
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2025-2026 Simon Inns
 */

#pragma once

#include <spdlog/spdlog.h>
#include <memory>
#include <string>

namespace seti {

/// Pattern used by the analysis log file ("timestamp [level] source: message")
inline constexpr const char* kAnalysisLogPattern = "%Y-%m-%d %H:%M:%S [%l] %n: %v";

/// Initialize the logging system
/// Should be called once at application startup
/// @param level Log level (trace, debug, info, warn, error, critical, off)
/// @param pattern Optional custom pattern (default: "[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v")
/// @param log_file Optional file path to write logs to (in addition to console)
void init_logging(const std::string& level = "info",
                  const std::string& pattern = "[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v",
                  const std::string& log_file = "");

/// Get the default logger
std::shared_ptr<spdlog::logger> get_logger();

/// Set log level at runtime
void set_log_level(const std::string& level);

/// Parse a level name, falling back to info for unknown names
spdlog::level::level_enum parse_log_level(const std::string& level);

/// Create a standalone logger for one analyzer/runner instance
/// The logger is not registered globally; the caller owns it and injects it
/// where it is needed. Console output goes through the core logger sinks,
/// and an append-only file sink is added when log_file is not empty.
/// @param name Logger name (appears as the message source)
/// @param log_file Analysis log file, created if missing
std::shared_ptr<spdlog::logger> create_analysis_logger(const std::string& name,
                                                       const std::string& log_file);

} // namespace seti

// Convenient logging macros
#define SETI_LOG_TRACE(...)    SPDLOG_LOGGER_TRACE(seti::get_logger(), __VA_ARGS__)
#define SETI_LOG_DEBUG(...)    SPDLOG_LOGGER_DEBUG(seti::get_logger(), __VA_ARGS__)
#define SETI_LOG_INFO(...)     SPDLOG_LOGGER_INFO(seti::get_logger(), __VA_ARGS__)
#define SETI_LOG_WARN(...)     SPDLOG_LOGGER_WARN(seti::get_logger(), __VA_ARGS__)
#define SETI_LOG_ERROR(...)    SPDLOG_LOGGER_ERROR(seti::get_logger(), __VA_ARGS__)
#define SETI_LOG_CRITICAL(...) SPDLOG_LOGGER_CRITICAL(seti::get_logger(), __VA_ARGS__)
