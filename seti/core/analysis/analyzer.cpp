/*
 * File:        analyzer.cpp
 * Module:      seti-core
 * Purpose:     Staged analysis engine (synthetic data stub)
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#include "analyzer.h"
#include "result_writer.h"

#include <fmt/format.h>

#include <stdexcept>
#include <system_error>
#include <thread>

namespace seti {

namespace {

constexpr int kWindowCount = 5;
constexpr int kCandidateCount = 8;
constexpr double kCandidateBaseMHz = 1420.0;
constexpr double kCandidateStepMHz = 0.5;

} // anonymous namespace

std::filesystem::path default_output_directory() {
    return std::filesystem::temp_directory_path() / "seti-analyzer";
}

Analyzer::Analyzer(AnalyzerConfig config, std::shared_ptr<spdlog::logger> logger)
    : config_(std::move(config))
    , logger_(std::move(logger))
{
    if (!logger_) {
        throw std::invalid_argument("Analyzer requires a logger");
    }

    stage_actions_ = {
        [this](StageContext& ctx) { loadFile(ctx); },
        [this](StageContext& ctx) { preprocess(ctx); },
        [this](StageContext& ctx) { buildWaterfall(ctx); },
        [this](StageContext& ctx) { clusterWindows(ctx); },
        [this](StageContext& ctx) { searchCandidates(ctx); },
        [this](StageContext& ctx) { writeResults(ctx); },
    };

    generators_[ArtifactKind::Waterfall] = [](PreviewRenderer& renderer) {
        return renderer.render_waterfall(640, 240);
    };
    generators_[ArtifactKind::ActivityMap] = [](PreviewRenderer& renderer) {
        return renderer.render_activity_map(640, 240);
    };
    generators_[ArtifactKind::WindowPreview] = [](PreviewRenderer& renderer) {
        return renderer.render_cluster_scatter(480, 320, 3, 120);
    };
    generators_[ArtifactKind::CandidatePreview] = [](PreviewRenderer& renderer) {
        return renderer.render_spectrum(640, 240, {{0.11, 2.0}, {0.23, 1.2}, {0.31, 3.0}, {0.42, 0.8}});
    };
}

void Analyzer::setStageAction(size_t index, StageAction action) {
    if (index >= stage_actions_.size()) {
        throw std::out_of_range(fmt::format("No analysis stage with index {}", index));
    }
    stage_actions_[index] = std::move(action);
}

void Analyzer::setArtifactGenerator(ArtifactKind kind, ArtifactGenerator generator) {
    generators_[kind] = std::move(generator);
}

std::filesystem::path Analyzer::outputDirectory() const {
    if (!config_.output_directory.empty()) {
        return std::filesystem::path(config_.output_directory);
    }
    return default_output_directory();
}

std::string Analyzer::formatFileSize(uintmax_t bytes) {
    static const char* units[] = {"B", "KB", "MB", "GB", "TB"};
    double size = static_cast<double>(bytes);
    size_t unit = 0;
    while (size >= 1024.0 && unit < 4) {
        size /= 1024.0;
        ++unit;
    }
    if (unit == 0) {
        return fmt::format("{} B", bytes);
    }
    return fmt::format("{:.1f} {}", size, units[unit]);
}

AnalysisResult Analyzer::analyze(const AnalysisRequest& request, AnalysisProgress* progress) {
    NullProgress null_progress;
    if (!progress) {
        progress = &null_progress;
    }

    const auto& stages = analysis_stage_names();
    const size_t total = stages.size();

    AnalysisResult draft;
    PreviewRenderer renderer(config_.seed);

    std::string stem = std::filesystem::path(request.input_path).stem().string();
    if (stem.empty()) {
        stem = "analysis";
    }
    StageContext ctx{request, draft, renderer, outputDirectory(), stem};

    for (size_t index = 1; index <= total; ++index) {
        if (progress->isCancelled()) {
            logger_->warn("Analysis cancelled before '{}': {}", stages[index - 1], request.input_path);
            return AnalysisResult::cancellation();
        }

        const std::string& stage = stages[index - 1];
        logger_->info("{}: {}", stage, request.input_path);
        progress->setStage(stage);

        stage_actions_[index - 1](ctx);

        if (!reportStageProgress(index, total, progress)) {
            logger_->warn("Analysis cancelled during '{}': {}", stage, request.input_path);
            return AnalysisResult::cancellation();
        }
    }

    progress->setProgress(100);
    progress->setStage(kDoneStage);
    logger_->info("Analysis complete for {}", request.input_path);

    draft.status = AnalysisResult::Status::Success;
    return draft;
}

bool Analyzer::reportStageProgress(size_t index, size_t total, AnalysisProgress* progress) {
    const StagePercentRange range = stage_percent_range(index, total);
    for (int step = 1; step <= config_.sub_steps; ++step) {
        if (progress->isCancelled()) {
            return false;
        }
        if (config_.sub_step_delay.count() > 0) {
            std::this_thread::sleep_for(config_.sub_step_delay);
        }
        progress->setProgress(stage_step_percent(range, step, config_.sub_steps));
    }
    return true;
}

void Analyzer::loadFile(StageContext& ctx) {
    std::filesystem::path path(ctx.request.input_path);

    std::string size_text = "42 MB (demo)";
    std::error_code ec;
    if (std::filesystem::is_regular_file(path, ec)) {
        uintmax_t bytes = std::filesystem::file_size(path, ec);
        if (!ec) {
            size_text = formatFileSize(bytes);
        }
    }

    ctx.draft.metadata = {
        {"Name", path.filename().string()},
        {"Size", size_text},
        {"Preset", ctx.request.preset},
    };
}

void Analyzer::preprocess(StageContext& ctx) {
    // Nothing to prepare for synthetic data
    (void)ctx;
}

void Analyzer::buildWaterfall(StageContext& ctx) {
    generateArtifact(ArtifactKind::Waterfall, ctx);
    generateArtifact(ArtifactKind::ActivityMap, ctx);
}

void Analyzer::clusterWindows(StageContext& ctx) {
    ctx.draft.window_scores.clear();
    for (int i = 0; i < kWindowCount; ++i) {
        ctx.draft.window_scores.push_back({
            fmt::format("{:03d}", i),
            fmt::format("{}%", 90 - i),
            "A"
        });
    }
    generateArtifact(ArtifactKind::WindowPreview, ctx);
}

void Analyzer::searchCandidates(StageContext& ctx) {
    ctx.draft.candidates.clear();
    for (int i = 0; i < kCandidateCount; ++i) {
        ctx.draft.candidates.push_back({
            fmt::format("C-{:02d}", i),
            fmt::format("{:.1f} MHz", kCandidateBaseMHz + i * kCandidateStepMHz),
            (i % 2 == 0) ? kCandidateStatusRfi : kCandidateStatusInteresting
        });
    }
    generateArtifact(ArtifactKind::CandidatePreview, ctx);
}

void Analyzer::writeResults(StageContext& ctx) {
    if (!config_.write_summary) {
        return;
    }

    const auto filename = ctx.output_directory / (ctx.file_stem + "_summary.yaml");
    try {
        std::filesystem::create_directories(ctx.output_directory);
        AnalysisResult summary = ctx.draft;
        summary.status = AnalysisResult::Status::Success;
        write_result_summary(ctx.request, summary, filename.string());
        logger_->info("Result summary written to {}", filename.string());
    } catch (const std::exception& e) {
        logger_->warn("Could not write result summary {}: {}", filename.string(), e.what());
    } catch (...) {
        logger_->warn("Could not write result summary {}: unknown error", filename.string());
    }
}

void Analyzer::generateArtifact(ArtifactKind kind, StageContext& ctx) {
    const char* name = artifact_kind_to_string(kind);

    auto it = generators_.find(kind);
    if (it == generators_.end() || !it->second) {
        logger_->warn("No generator for preview '{}'", name);
        return;
    }

    try {
        PreviewImage image = it->second(ctx.renderer);
        std::filesystem::create_directories(ctx.output_directory);

        const auto filename = ctx.output_directory / fmt::format("{}_{}.png", ctx.file_stem, name);
        if (!PreviewRenderer::save_png(image, filename.string())) {
            logger_->error("Preview '{}' could not be saved to {}", name, filename.string());
            return;
        }
        ctx.draft.artifacts[kind] = filename.string();
    } catch (const std::exception& e) {
        logger_->error("Preview '{}' generation failed: {}", name, e.what());
    } catch (...) {
        logger_->error("Preview '{}' generation failed with an unknown error", name);
    }
}

} // namespace seti
