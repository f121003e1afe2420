/*
 * File:        logging.cpp
 * Module:      seti-gui
 * Purpose:     GUI logger setup
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#include "logging.h"
#include "core_logging.h"

namespace seti {

static std::shared_ptr<spdlog::logger> g_gui_logger;

std::shared_ptr<spdlog::logger> get_gui_logger() {
    if (!g_gui_logger) {
        init_gui_logging();
    }
    return g_gui_logger;
}

void reset_gui_logger() {
    if (g_gui_logger) {
        spdlog::drop(g_gui_logger->name());
    }
    g_gui_logger.reset();
}

void init_gui_logging(const std::string& level) {
    reset_gui_logger();

    // Share the core sinks: one console, one handle on the log file
    auto sinks = seti::presenters::coreLogSinks();
    g_gui_logger = std::make_shared<spdlog::logger>("gui", sinks.begin(), sinks.end());
    spdlog::register_logger(g_gui_logger);
    g_gui_logger->set_level(seti::presenters::parseLogLevel(level));

    // Flush on every log for debugging
    g_gui_logger->flush_on(spdlog::level::trace);
}

} // namespace seti
