/*
 * File:        result_writer.h
 * Module:      seti-core
 * Purpose:     YAML summary of an analysis result
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#ifndef SETI_CORE_ANALYSIS_RESULT_WRITER_H
#define SETI_CORE_ANALYSIS_RESULT_WRITER_H

#include "seti_analysis.h"
#include <string>

namespace seti {

/**
 * @brief Serialize a result to YAML text
 */
std::string result_summary_to_yaml(const AnalysisRequest& request, const AnalysisResult& result);

/**
 * @brief Write the YAML summary of a result
 * @throws std::runtime_error if the file cannot be written
 */
void write_result_summary(const AnalysisRequest& request,
                          const AnalysisResult& result,
                          const std::string& filename);

} // namespace seti

#endif // SETI_CORE_ANALYSIS_RESULT_WRITER_H
