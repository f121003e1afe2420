/*
 * File:        core_logging.cpp
 * Module:      seti-presenters
 * Purpose:     Core logging access for the GUI
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#include "core_logging.h"
#include "logging.h"

namespace seti::presenters {

void initCoreLogging(const std::string& level, const std::string& pattern, const std::string& log_file) {
    seti::init_logging(level, pattern, log_file);
}

std::vector<spdlog::sink_ptr> coreLogSinks() {
    return seti::get_logger()->sinks();
}

spdlog::level::level_enum parseLogLevel(const std::string& level) {
    return seti::parse_log_level(level);
}

} // namespace seti::presenters
