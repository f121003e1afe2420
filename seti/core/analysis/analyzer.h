/*
 * File:        analyzer.h
 * Module:      seti-core
 * Purpose:     Staged analysis engine (synthetic data stub)
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#ifndef SETI_CORE_ANALYSIS_ANALYZER_H
#define SETI_CORE_ANALYSIS_ANALYZER_H

#if defined(SETI_GUI_BUILD)
#error "GUI code cannot include core/analysis/analyzer.h. Use AnalysisPresenter instead."
#endif

#include "analysis_progress.h"
#include "analysis_stages.h"
#include "preview_renderer.h"
#include "seti_analysis.h"

#include <spdlog/spdlog.h>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace seti {

/**
 * @brief Analyzer configuration
 */
struct AnalyzerConfig {
    std::string output_directory;       ///< Preview and summary directory (empty: <tmp>/seti-analyzer)
    std::chrono::milliseconds sub_step_delay = kDefaultSubStepDelay;
    int sub_steps = kSubStepsPerStage;
    bool write_summary = true;          ///< Write <stem>_summary.yaml in the last stage
    uint32_t seed = 1420;               ///< Seed of the synthetic data generators
};

/// Output directory used when AnalyzerConfig::output_directory is empty
std::filesystem::path default_output_directory();

/**
 * @brief Working state handed to each stage of a run
 */
struct StageContext {
    const AnalysisRequest& request;
    AnalysisResult& draft;              ///< Result under construction
    PreviewRenderer& renderer;
    std::filesystem::path output_directory;
    std::string file_stem;              ///< Prefix of generated file names
};

/**
 * @brief Runs the fixed stage plan and assembles an AnalysisResult
 *
 * The current engine fabricates its data: previews are synthetic plots and
 * the window/candidate tables are fixed. Stage actions and preview
 * generators can be replaced individually.
 *
 * analyze() reports stages and progress through AnalysisProgress and throws
 * on run-level faults; TaskRunner turns those into failure results. A
 * failing preview generator only loses that preview.
 */
class Analyzer {
public:
    using StageAction = std::function<void(StageContext&)>;
    using ArtifactGenerator = std::function<PreviewImage(PreviewRenderer&)>;

    Analyzer(AnalyzerConfig config, std::shared_ptr<spdlog::logger> logger);

    // Stage actions capture this
    Analyzer(const Analyzer&) = delete;
    Analyzer& operator=(const Analyzer&) = delete;

    /**
     * @brief Run all stages
     * @param request Input file and preset
     * @param progress Progress reporter (can be null)
     * @return Success or cancellation result
     */
    AnalysisResult analyze(const AnalysisRequest& request, AnalysisProgress* progress);

    /**
     * @brief Replace the action of stage `index` (0-based)
     * @throws std::out_of_range if index is not a stage
     */
    void setStageAction(size_t index, StageAction action);

    /**
     * @brief Replace the generator of one preview
     */
    void setArtifactGenerator(ArtifactKind kind, ArtifactGenerator generator);

    const AnalyzerConfig& config() const { return config_; }
    std::filesystem::path outputDirectory() const;

    static std::string formatFileSize(uintmax_t bytes);

private:
    void loadFile(StageContext& ctx);
    void preprocess(StageContext& ctx);
    void buildWaterfall(StageContext& ctx);
    void clusterWindows(StageContext& ctx);
    void searchCandidates(StageContext& ctx);
    void writeResults(StageContext& ctx);

    void generateArtifact(ArtifactKind kind, StageContext& ctx);
    bool reportStageProgress(size_t index, size_t total, AnalysisProgress* progress);

    AnalyzerConfig config_;
    std::shared_ptr<spdlog::logger> logger_;
    std::vector<StageAction> stage_actions_;
    std::map<ArtifactKind, ArtifactGenerator> generators_;
};

} // namespace seti

#endif // SETI_CORE_ANALYSIS_ANALYZER_H
