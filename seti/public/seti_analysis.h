/*
 * File:        seti_analysis.h
 * Module:      seti-public
 * Purpose:     Public analysis types shared by core, presenters, GUI and CLI
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#pragma once

#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace seti {

/// Candidate status labels
inline constexpr const char* kCandidateStatusRfi = "RFI";
inline constexpr const char* kCandidateStatusInteresting = "Interesting";

/**
 * @brief Input of a single analysis run
 */
struct AnalysisRequest {
    std::string input_path;     ///< File to analyze
    std::string preset;         ///< Preset label (see analysis presets)
};

/**
 * @brief Information about an analysis preset
 */
struct PresetInfo {
    std::string id;             ///< Stable identifier ("dbscan_fast", ...)
    std::string name;           ///< Label shown to the user and stored in results
    std::string description;    ///< One-line description
};

/**
 * @brief Kinds of preview image produced by a run
 */
enum class ArtifactKind {
    Waterfall,          ///< Overall waterfall of the input
    ActivityMap,        ///< Activity heatmap
    WindowPreview,      ///< Window clusters scatter
    CandidatePreview    ///< Spectrum around candidates
};

inline const char* artifact_kind_to_string(ArtifactKind kind) {
    switch (kind) {
    case ArtifactKind::Waterfall:
        return "waterfall";
    case ArtifactKind::ActivityMap:
        return "activity";
    case ArtifactKind::WindowPreview:
        return "windows";
    case ArtifactKind::CandidatePreview:
        return "candidates";
    }
    return "unknown";
}

/**
 * @brief Scored window row
 */
struct WindowScore {
    std::string window_id;
    std::string score;
    std::string cluster;
};

/**
 * @brief Detected signal candidate row
 */
struct Candidate {
    std::string id;
    std::string frequency;
    std::string status;         ///< kCandidateStatusRfi or kCandidateStatusInteresting
};

/**
 * @brief Result of an analysis run
 *
 * Exactly one result is delivered per run. A failed result carries a
 * non-empty error message and nothing else; a cancelled result carries
 * nothing. Artifacts that were not produced are absent from the map.
 */
struct AnalysisResult {
    enum class Status {
        Success,
        Failed,
        Cancelled
    };

    Status status = Status::Success;
    std::vector<std::pair<std::string, std::string>> metadata;  ///< Ordered label/value pairs
    std::map<ArtifactKind, std::string> artifacts;              ///< Kind -> PNG path
    std::vector<WindowScore> window_scores;
    std::vector<Candidate> candidates;
    std::string error_message;

    bool succeeded() const { return status == Status::Success; }
    bool failed() const { return status == Status::Failed; }
    bool cancelled() const { return status == Status::Cancelled; }

    bool has_artifact(ArtifactKind kind) const {
        return artifacts.find(kind) != artifacts.end();
    }

    std::optional<std::string> artifact(ArtifactKind kind) const {
        auto it = artifacts.find(kind);
        if (it == artifacts.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    static AnalysisResult failure(std::string message) {
        AnalysisResult result;
        result.status = Status::Failed;
        result.error_message = message.empty() ? std::string("Unknown error") : std::move(message);
        return result;
    }

    static AnalysisResult cancellation() {
        AnalysisResult result;
        result.status = Status::Cancelled;
        return result;
    }
};

} // namespace seti
