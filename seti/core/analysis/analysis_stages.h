/*
 * File:        analysis_stages.h
 * Module:      seti-core
 * Purpose:     Fixed stage plan of an analysis run and progress arithmetic
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#ifndef SETI_CORE_ANALYSIS_STAGES_H
#define SETI_CORE_ANALYSIS_STAGES_H

#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

namespace seti {

/// Stage reported once after the last stage of a completed run
inline constexpr const char* kDoneStage = "done";

/// Progress updates reported per stage
inline constexpr int kSubStepsPerStage = 5;

/// Pause between progress updates of the stub engine
inline constexpr std::chrono::milliseconds kDefaultSubStepDelay{200};

/**
 * @brief Ordered stage names of an analysis run
 */
const std::vector<std::string>& analysis_stage_names();

/**
 * @brief Percentage span covered by one stage
 */
struct StagePercentRange {
    int start;
    int end;
};

/**
 * @brief Span of stage `index` (1-based) out of `total`
 *
 * start = trunc((index-1)/total*100), end = trunc(index/total*100)
 */
StagePercentRange stage_percent_range(size_t index, size_t total);

/**
 * @brief Progress value after sub-step `step` (1..steps) of a stage
 */
int stage_step_percent(const StagePercentRange& range, int step, int steps);

} // namespace seti

#endif // SETI_CORE_ANALYSIS_STAGES_H
