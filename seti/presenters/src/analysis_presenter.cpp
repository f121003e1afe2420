/*
 * File:        analysis_presenter.cpp
 * Module:      seti-presenters
 * Purpose:     Analysis run presenter implementation
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#include "analysis_presenter.h"
#include "analysis_presets.h"
#include "analyzer.h"
#include "logging.h"
#include "task_runner.h"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <stdexcept>

namespace seti::presenters {

namespace {

std::string trim(const std::string& text) {
    auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };
    auto begin = std::find_if_not(text.begin(), text.end(), is_space);
    auto end = std::find_if_not(text.rbegin(), text.rend(), is_space).base();
    if (begin >= end) {
        return {};
    }
    return std::string(begin, end);
}

} // anonymous namespace

class AnalysisPresenter::Impl {
public:
    explicit Impl(AnalysisPresenterConfig cfg)
        : config(std::move(cfg))
        , logger(seti::create_analysis_logger("analyzer", config.log_file))
        , runner(makeAnalyzer(), logger)
    {
    }

    std::shared_ptr<seti::Analyzer> makeAnalyzer() const {
        seti::AnalyzerConfig analyzer_config;
        analyzer_config.output_directory = config.output_directory;
        analyzer_config.sub_step_delay = std::chrono::milliseconds(std::max(0, config.step_delay_ms));
        return std::make_shared<seti::Analyzer>(analyzer_config, logger);
    }

    AnalysisPresenterConfig config;
    std::shared_ptr<spdlog::logger> logger;
    // Lives as long as the presenter: a run may start the next one from on_done
    seti::TaskRunner runner;
};

AnalysisPresenter::AnalysisPresenter(AnalysisPresenterConfig config)
    : impl_(std::make_unique<Impl>(std::move(config)))
{
}

AnalysisPresenter::~AnalysisPresenter() = default;

AnalysisPresenter::AnalysisPresenter(AnalysisPresenter&&) noexcept = default;
AnalysisPresenter& AnalysisPresenter::operator=(AnalysisPresenter&&) noexcept = default;

std::vector<seti::PresetInfo> AnalysisPresenter::getPresets() const
{
    return seti::analysis_presets();
}

std::optional<std::string> AnalysisPresenter::validateRequest(const std::string& input_path,
                                                              const std::string& preset) const
{
    if (trim(input_path).empty()) {
        return std::string("Please choose an input file first.");
    }
    if (preset.empty()) {
        return std::string("Please choose an analysis preset.");
    }
    return std::nullopt;
}

bool AnalysisPresenter::startAnalysis(const seti::AnalysisRequest& request, AnalysisCallbacks callbacks)
{
    if (auto error = validateRequest(request.input_path, request.preset)) {
        impl_->logger->warn("Rejected analysis request: {}", *error);
        return false;
    }

    seti::AnalysisRequest normalized{trim(request.input_path), request.preset};
    return impl_->runner.start(impl_->makeAnalyzer(),
                               normalized,
                               std::move(callbacks.on_stage),
                               std::move(callbacks.on_progress),
                               std::move(callbacks.on_done));
}

void AnalysisPresenter::cancelAnalysis()
{
    if (impl_->runner.isRunning()) {
        impl_->logger->info("Cancellation requested");
    }
    impl_->runner.cancel();
}

bool AnalysisPresenter::isAnalysisRunning() const
{
    return impl_->runner.isRunning();
}

void AnalysisPresenter::waitForCompletion()
{
    impl_->runner.wait();
}

void AnalysisPresenter::setOutputDirectory(const std::string& directory)
{
    impl_->config.output_directory = directory;
}

std::string AnalysisPresenter::outputDirectory() const
{
    if (!impl_->config.output_directory.empty()) {
        return impl_->config.output_directory;
    }
    return seti::default_output_directory().string();
}

void AnalysisPresenter::setStepDelay(int milliseconds)
{
    impl_->config.step_delay_ms = std::max(0, milliseconds);
}

std::string AnalysisPresenter::logFilePath() const
{
    return impl_->config.log_file;
}

std::vector<std::string> AnalysisPresenter::formatMetadata(const seti::AnalysisResult& result)
{
    std::vector<std::string> lines;
    lines.reserve(result.metadata.size());
    for (const auto& [label, value] : result.metadata) {
        lines.push_back(label + ": " + value);
    }
    return lines;
}

std::string AnalysisPresenter::artifactTitle(seti::ArtifactKind kind)
{
    switch (kind) {
    case seti::ArtifactKind::Waterfall:
        return "Waterfall";
    case seti::ArtifactKind::ActivityMap:
        return "Activity map";
    case seti::ArtifactKind::WindowPreview:
        return "Window clusters";
    case seti::ArtifactKind::CandidatePreview:
        return "Candidate spectrum";
    }
    return "Preview";
}

} // namespace seti::presenters
