/*
 * File:        logging.cpp
 * Module:      seti-core
 * Purpose:     Logging system implementation
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2025-2026 Simon Inns
 */

#include "logging.h"
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <algorithm>
#include <cctype>
#include <mutex>

namespace seti {

static std::shared_ptr<spdlog::logger> g_logger;
static std::mutex g_logger_mutex;

spdlog::level::level_enum parse_log_level(const std::string& level) {
    std::string l = level;
    std::transform(l.begin(), l.end(), l.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (l == "trace") return spdlog::level::trace;
    if (l == "debug") return spdlog::level::debug;
    if (l == "info") return spdlog::level::info;
    if (l == "warn" || l == "warning") return spdlog::level::warn;
    if (l == "error") return spdlog::level::err;
    if (l == "critical") return spdlog::level::critical;
    if (l == "off") return spdlog::level::off;
    return spdlog::level::info;
}

void init_logging(const std::string& level, const std::string& pattern, const std::string& log_file) {
    std::lock_guard<std::mutex> lock(g_logger_mutex);

    // Drop existing logger if present
    if (g_logger) {
        spdlog::drop(g_logger->name());
        g_logger.reset();
    }

    auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    g_logger = std::make_shared<spdlog::logger>("seti", console_sink);
    spdlog::register_logger(g_logger);
    g_logger->set_pattern(pattern);
    g_logger->set_level(parse_log_level(level));

    if (!log_file.empty()) {
        try {
            // Add file sink while keeping console output
            auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, false);
            file_sink->set_pattern(pattern);
            g_logger->sinks().push_back(file_sink);
        } catch (const spdlog::spdlog_ex& e) {
            g_logger->warn("Could not open log file '{}': {}", log_file, e.what());
        }
    }
}

std::shared_ptr<spdlog::logger> get_logger() {
    {
        std::lock_guard<std::mutex> lock(g_logger_mutex);
        if (g_logger) {
            return g_logger;
        }
    }
    // Auto-initialize if not done yet
    init_logging();
    std::lock_guard<std::mutex> lock(g_logger_mutex);
    return g_logger;
}

void set_log_level(const std::string& level) {
    get_logger()->set_level(parse_log_level(level));
}

std::shared_ptr<spdlog::logger> create_analysis_logger(const std::string& name,
                                                       const std::string& log_file) {
    auto core_logger = get_logger();
    auto sinks = core_logger->sinks();
    auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
    logger->set_level(std::min(core_logger->level(), spdlog::level::info));

    if (!log_file.empty()) {
        try {
            auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, false);
            file_sink->set_pattern(kAnalysisLogPattern);
            logger->sinks().push_back(file_sink);
        } catch (const spdlog::spdlog_ex& e) {
            core_logger->warn("Could not open analysis log '{}': {}", log_file, e.what());
        }
    }

    logger->flush_on(spdlog::level::info);
    return logger;
}

} // namespace seti
