/*
 * File:        result_writer.cpp
 * Module:      seti-core
 * Purpose:     YAML summary of an analysis result
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#include "result_writer.h"
#include "version.h"

#include <yaml-cpp/yaml.h>

#include <fstream>
#include <stdexcept>

namespace seti {

namespace {

const char* status_to_string(AnalysisResult::Status status) {
    switch (status) {
    case AnalysisResult::Status::Success:
        return "success";
    case AnalysisResult::Status::Failed:
        return "failed";
    case AnalysisResult::Status::Cancelled:
        return "cancelled";
    }
    return "unknown";
}

} // anonymous namespace

std::string result_summary_to_yaml(const AnalysisRequest& request, const AnalysisResult& result) {
    YAML::Emitter out;
    out << YAML::BeginMap;

    out << YAML::Key << "request";
    out << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "input" << YAML::Value << request.input_path;
    out << YAML::Key << "preset" << YAML::Value << request.preset;
    out << YAML::EndMap;

    out << YAML::Key << "status" << YAML::Value << status_to_string(result.status);
    if (!result.error_message.empty()) {
        out << YAML::Key << "error" << YAML::Value << result.error_message;
    }

    // Metadata is written as a sequence to keep its order
    out << YAML::Key << "metadata";
    out << YAML::Value << YAML::BeginSeq;
    for (const auto& [label, value] : result.metadata) {
        out << YAML::Flow << YAML::BeginMap;
        out << YAML::Key << "label" << YAML::Value << label;
        out << YAML::Key << "value" << YAML::Value << value;
        out << YAML::EndMap;
    }
    out << YAML::EndSeq;

    out << YAML::Key << "artifacts";
    out << YAML::Value << YAML::BeginMap;
    for (const auto& [kind, path] : result.artifacts) {
        out << YAML::Key << artifact_kind_to_string(kind) << YAML::Value << path;
    }
    out << YAML::EndMap;

    out << YAML::Key << "windows";
    out << YAML::Value << YAML::BeginSeq;
    for (const auto& window : result.window_scores) {
        out << YAML::Flow << YAML::BeginMap;
        out << YAML::Key << "id" << YAML::Value << YAML::DoubleQuoted << window.window_id;
        out << YAML::Key << "score" << YAML::Value << window.score;
        out << YAML::Key << "cluster" << YAML::Value << window.cluster;
        out << YAML::EndMap;
    }
    out << YAML::EndSeq;

    out << YAML::Key << "candidates";
    out << YAML::Value << YAML::BeginSeq;
    for (const auto& candidate : result.candidates) {
        out << YAML::Flow << YAML::BeginMap;
        out << YAML::Key << "id" << YAML::Value << candidate.id;
        out << YAML::Key << "frequency" << YAML::Value << candidate.frequency;
        out << YAML::Key << "status" << YAML::Value << candidate.status;
        out << YAML::EndMap;
    }
    out << YAML::EndSeq;

    out << YAML::EndMap;
    return out.c_str();
}

void write_result_summary(const AnalysisRequest& request,
                          const AnalysisResult& result,
                          const std::string& filename) {
    std::ofstream file(filename);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file for writing: " + filename);
    }
    file << "# SETI Analyzer result summary\n";
    file << "# Version: " << SETI_VERSION << "\n\n";
    file << result_summary_to_yaml(request, result) << "\n";
    if (!file) {
        throw std::runtime_error("Failed to write result summary: " + filename);
    }
}

} // namespace seti
