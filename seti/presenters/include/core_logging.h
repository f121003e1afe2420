/*
 * File:        core_logging.h
 * Module:      seti-presenters
 * Purpose:     Core logging access for the GUI
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#pragma once

#include <spdlog/common.h>
#include <string>
#include <vector>

namespace seti::presenters {

/**
 * @brief Initialize core logging from the GUI
 *
 * The GUI cannot include core headers; this forwards to seti::init_logging.
 */
void initCoreLogging(const std::string& level, const std::string& pattern, const std::string& log_file);

/**
 * @brief Sinks of the core logger (console, plus the log file if one is open)
 *
 * Loggers created from these write to the same file handle as the core.
 */
std::vector<spdlog::sink_ptr> coreLogSinks();

/**
 * @brief Parse a level name, falling back to info for unknown names
 */
spdlog::level::level_enum parseLogLevel(const std::string& level);

} // namespace seti::presenters
