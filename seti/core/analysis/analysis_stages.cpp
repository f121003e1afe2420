/*
 * File:        analysis_stages.cpp
 * Module:      seti-core
 * Purpose:     Fixed stage plan of an analysis run and progress arithmetic
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#include "analysis_stages.h"

namespace seti {

const std::vector<std::string>& analysis_stage_names() {
    static const std::vector<std::string> stages = {
        "Loading file",
        "Preprocessing",
        "Building waterfall",
        "Clustering windows",
        "Searching candidates",
        "Writing results",
    };
    return stages;
}

StagePercentRange stage_percent_range(size_t index, size_t total) {
    if (total == 0 || index == 0) {
        return {0, 0};
    }
    if (index > total) {
        index = total;
    }
    // Integer division truncates the same way as the floating point form
    return {
        static_cast<int>((index - 1) * 100 / total),
        static_cast<int>(index * 100 / total)
    };
}

int stage_step_percent(const StagePercentRange& range, int step, int steps) {
    if (steps <= 0) {
        return range.end;
    }
    if (step < 0) step = 0;
    if (step > steps) step = steps;
    return range.start + (step * (range.end - range.start)) / steps;
}

} // namespace seti
