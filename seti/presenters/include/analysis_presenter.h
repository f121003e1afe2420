/*
 * File:        analysis_presenter.h
 * Module:      seti-presenters
 * Purpose:     Analysis run presenter - MVP architecture
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <seti_analysis.h>  // Public API analysis types

namespace seti::presenters {

/**
 * @brief Presenter configuration
 */
struct AnalysisPresenterConfig {
    std::string output_directory;   ///< Preview/summary directory (empty: system temp)
    std::string log_file;           ///< Analysis log file (empty: console only)
    int step_delay_ms = 200;        ///< Delay between progress steps
};

/**
 * @brief Callbacks of one analysis run
 *
 * All callbacks are invoked on the analysis worker thread. GUI code must
 * marshal them to its own thread before touching widgets. on_done may
 * start the next run; on_stage and on_progress may not.
 */
struct AnalysisCallbacks {
    std::function<void(const std::string& stage)> on_stage;
    std::function<void(int percentage)> on_progress;
    std::function<void(const seti::AnalysisResult& result)> on_done;
};

/**
 * @brief AnalysisPresenter - Runs analyses on behalf of the GUI
 *
 * Owns the analysis logger, the analyzer and the task runner so the GUI
 * never touches core types. One run at a time.
 */
class AnalysisPresenter {
public:
    explicit AnalysisPresenter(AnalysisPresenterConfig config = {});

    /**
     * @brief Destructor (cancels and joins a run in flight)
     */
    ~AnalysisPresenter();

    // Disable copy, enable move
    AnalysisPresenter(const AnalysisPresenter&) = delete;
    AnalysisPresenter& operator=(const AnalysisPresenter&) = delete;
    AnalysisPresenter(AnalysisPresenter&&) noexcept;
    AnalysisPresenter& operator=(AnalysisPresenter&&) noexcept;

    // === Presets ===

    /**
     * @brief Get the presets offered to the user, in display order
     */
    std::vector<seti::PresetInfo> getPresets() const;

    // === Analysis Execution ===

    /**
     * @brief Check a request before running it
     * @param input_path Input file path (surrounding whitespace ignored)
     * @param preset Preset label
     * @return Error message, or nullopt if the request is valid
     */
    std::optional<std::string> validateRequest(const std::string& input_path,
                                               const std::string& preset) const;

    /**
     * @brief Start an analysis run
     *
     * Output directory and step delay are read from the current
     * configuration.
     * @return false if the request is invalid or a run is already in flight
     */
    bool startAnalysis(const seti::AnalysisRequest& request, AnalysisCallbacks callbacks);

    /**
     * @brief Cancel the run in flight (no-op when idle)
     */
    void cancelAnalysis();

    /**
     * @brief Check if a run is in flight
     */
    bool isAnalysisRunning() const;

    /**
     * @brief Block until the workers of the runs started so far have exited
     *
     * Not to be called from inside a callback.
     */
    void waitForCompletion();

    // === Configuration ===

    /**
     * @brief Set the output directory used by subsequent runs
     */
    void setOutputDirectory(const std::string& directory);
    std::string outputDirectory() const;

    /**
     * @brief Set the delay between progress steps of subsequent runs
     */
    void setStepDelay(int milliseconds);

    std::string logFilePath() const;

    // === Formatting ===

    /**
     * @brief Format result metadata as "label: value" lines
     */
    static std::vector<std::string> formatMetadata(const seti::AnalysisResult& result);

    /**
     * @brief Human-readable name of an artifact kind
     */
    static std::string artifactTitle(seti::ArtifactKind kind);

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace seti::presenters
