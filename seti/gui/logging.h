/*
 * File:        logging.h
 * Module:      seti-gui
 * Purpose:     GUI logging convenience header
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#pragma once

#include <spdlog/spdlog.h>
#include <memory>
#include <string>

namespace seti {

/// Get the GUI-specific logger
std::shared_ptr<spdlog::logger> get_gui_logger();

/// Reset the GUI logger (it will be recreated on next use)
void reset_gui_logger();

/// Create the GUI logger on the core logger's sinks
/// Call after core logging has been initialized so that the log file
/// (if any) is shared rather than opened a second time.
void init_gui_logging(const std::string& level = "info");

} // namespace seti

// GUI-specific logging macros that use the GUI logger
#define SETI_LOG_TRACE(...)    SPDLOG_LOGGER_TRACE(seti::get_gui_logger(), __VA_ARGS__)
#define SETI_LOG_DEBUG(...)    SPDLOG_LOGGER_DEBUG(seti::get_gui_logger(), __VA_ARGS__)
#define SETI_LOG_INFO(...)     SPDLOG_LOGGER_INFO(seti::get_gui_logger(), __VA_ARGS__)
#define SETI_LOG_WARN(...)     SPDLOG_LOGGER_WARN(seti::get_gui_logger(), __VA_ARGS__)
#define SETI_LOG_ERROR(...)    SPDLOG_LOGGER_ERROR(seti::get_gui_logger(), __VA_ARGS__)
#define SETI_LOG_CRITICAL(...) SPDLOG_LOGGER_CRITICAL(seti::get_gui_logger(), __VA_ARGS__)
