/******************************************************************************
 * test_analysis_presenter.cpp
 *
 * Unit tests for the analysis presenter facade
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 ******************************************************************************/

#include "analysis_presenter.h"
#include "core_logging.h"
#include <spdlog/spdlog.h>
#include <chrono>
#include <condition_variable>
#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>
#include <vector>

using namespace seti;
using seti::presenters::AnalysisCallbacks;
using seti::presenters::AnalysisPresenter;
using seti::presenters::AnalysisPresenterConfig;

namespace {

std::filesystem::path make_temp_dir(const std::string& name) {
    auto dir = std::filesystem::temp_directory_path() / ("seti-test-" + name);
    std::filesystem::remove_all(dir);
    std::filesystem::create_directories(dir);
    return dir;
}

std::string read_file(const std::filesystem::path& path) {
    std::ifstream file(path);
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

} // anonymous namespace

void test_presets() {
    AnalysisPresenter presenter;
    auto presets = presenter.getPresets();
    assert(presets.size() == 4);
    assert(presets.front().name == "DBSCAN (fast)");
    assert(presets.back().name == "Spectral analysis");

    std::cout << "test_presets: PASSED\n";
}

void test_validate_request() {
    AnalysisPresenter presenter;

    assert(presenter.validateRequest("", "A").has_value());
    assert(presenter.validateRequest("   \t ", "A").has_value());
    assert(presenter.validateRequest("sample.dat", "").has_value());
    assert(!presenter.validateRequest("sample.dat", "A").has_value());
    assert(!presenter.validateRequest("  sample.dat  ", "A").has_value());

    // Invalid requests never start a run
    bool called = false;
    AnalysisCallbacks callbacks;
    callbacks.on_done = [&called](const AnalysisResult&) { called = true; };
    assert(!presenter.startAnalysis({"  ", "A"}, callbacks));
    assert(!presenter.isAnalysisRunning());
    presenter.waitForCompletion();
    assert(!called);

    std::cout << "test_validate_request: PASSED\n";
}

void test_format_metadata() {
    AnalysisResult result;
    result.metadata = {{"Name", "sample.dat"}, {"Size", "42 MB (demo)"}, {"Preset", "A"}};

    auto lines = AnalysisPresenter::formatMetadata(result);
    assert(lines.size() == 3);
    assert(lines[0] == "Name: sample.dat");
    assert(lines[1] == "Size: 42 MB (demo)");
    assert(lines[2] == "Preset: A");

    assert(AnalysisPresenter::formatMetadata(AnalysisResult::failure("x")).empty());
    assert(AnalysisPresenter::artifactTitle(ArtifactKind::Waterfall) == "Waterfall");

    std::cout << "test_format_metadata: PASSED\n";
}

void test_run_through_presenter() {
    auto dir = make_temp_dir("presenter-run");

    AnalysisPresenterConfig config;
    config.output_directory = (dir / "out").string();
    config.log_file = (dir / "app.log").string();
    config.step_delay_ms = 0;
    AnalysisPresenter presenter(config);

    std::mutex mutex;
    std::vector<std::string> stages;
    std::vector<AnalysisResult> results;

    AnalysisCallbacks callbacks;
    callbacks.on_stage = [&](const std::string& stage) {
        std::lock_guard<std::mutex> lock(mutex);
        stages.push_back(stage);
    };
    callbacks.on_done = [&](const AnalysisResult& result) {
        std::lock_guard<std::mutex> lock(mutex);
        results.push_back(result);
    };

    assert(presenter.startAnalysis({"  sample.dat ", "Local search"}, callbacks));
    presenter.waitForCompletion();
    assert(!presenter.isAnalysisRunning());

    assert(results.size() == 1);
    assert(results.front().succeeded());
    assert(results.front().metadata[0].second == "sample.dat");
    assert(results.front().artifacts.size() == 4);
    assert(stages.size() == 7);
    assert(stages.back() == "done");
    assert(std::filesystem::exists(dir / "out" / "sample_waterfall.png"));

    // Analysis log: "timestamp [level] source: message"
    assert(presenter.logFilePath() == config.log_file);
    const std::string log = read_file(config.log_file);
    assert(log.find("[info] analyzer: Loading file: sample.dat") != std::string::npos);
    assert(log.find("[info] analyzer: Writing results: sample.dat") != std::string::npos);

    // A second run can start once the first has been delivered
    presenter.setOutputDirectory((dir / "second").string());
    assert(presenter.outputDirectory() == (dir / "second").string());
    assert(presenter.startAnalysis({"other.dat", "A"}, callbacks));
    presenter.waitForCompletion();
    assert(results.size() == 2);
    assert(std::filesystem::exists(dir / "second" / "other_candidates.png"));

    std::filesystem::remove_all(dir);
    std::cout << "test_run_through_presenter: PASSED\n";
}

void test_cancel_through_presenter() {
    auto dir = make_temp_dir("presenter-cancel");

    AnalysisPresenterConfig config;
    config.output_directory = dir.string();
    config.step_delay_ms = 50;
    AnalysisPresenter presenter(config);

    std::mutex mutex;
    std::vector<AnalysisResult> results;
    AnalysisCallbacks callbacks;
    callbacks.on_done = [&](const AnalysisResult& result) {
        std::lock_guard<std::mutex> lock(mutex);
        results.push_back(result);
    };

    assert(presenter.startAnalysis({"sample.dat", "A"}, callbacks));
    assert(presenter.isAnalysisRunning());
    assert(!presenter.startAnalysis({"sample.dat", "A"}, callbacks));

    presenter.cancelAnalysis();
    presenter.waitForCompletion();

    assert(results.size() == 1);
    assert(results.front().cancelled());
    assert(!presenter.isAnalysisRunning());

    std::filesystem::remove_all(dir);
    std::cout << "test_cancel_through_presenter: PASSED\n";
}

void test_start_next_run_from_done() {
    auto dir = make_temp_dir("presenter-chain");

    AnalysisPresenterConfig config;
    config.output_directory = dir.string();
    config.step_delay_ms = 0;
    AnalysisPresenter presenter(config);

    std::mutex mutex;
    std::condition_variable cv;
    std::vector<AnalysisResult> results;
    bool chained = false;

    AnalysisCallbacks second;
    second.on_done = [&](const AnalysisResult& result) {
        std::lock_guard<std::mutex> lock(mutex);
        results.push_back(result);
        cv.notify_all();
    };

    AnalysisCallbacks first;
    first.on_done = [&](const AnalysisResult& result) {
        {
            std::lock_guard<std::mutex> lock(mutex);
            results.push_back(result);
        }
        chained = presenter.startAnalysis({"second.dat", "A"}, second);
    };

    assert(presenter.startAnalysis({"first.dat", "A"}, first));
    {
        std::unique_lock<std::mutex> lock(mutex);
        assert(cv.wait_for(lock, std::chrono::seconds(10), [&results] { return results.size() == 2; }));
    }
    presenter.waitForCompletion();

    assert(chained);
    assert(results[0].succeeded());
    assert(results[0].metadata[0].second == "first.dat");
    assert(results[1].succeeded());
    assert(results[1].metadata[0].second == "second.dat");
    assert(std::filesystem::exists(dir / "second_waterfall.png"));
    assert(!presenter.isAnalysisRunning());

    std::filesystem::remove_all(dir);
    std::cout << "test_start_next_run_from_done: PASSED\n";
}

void test_default_output_directory() {
    AnalysisPresenter presenter;
    const std::filesystem::path fallback = presenter.outputDirectory();
    assert(fallback.filename() == "seti-analyzer");
    assert(fallback.parent_path() == std::filesystem::temp_directory_path());

    std::cout << "test_default_output_directory: PASSED\n";
}

void test_shared_log_sinks() {
    auto dir = make_temp_dir("presenter-log-sinks");
    const auto log_file = dir / "seti.log";

    presenters::initCoreLogging("debug", "%n: %v", log_file.string());
    auto sinks = presenters::coreLogSinks();
    assert(sinks.size() == 2);

    // A second logger on the same sinks appends through the same handle
    auto gui = std::make_shared<spdlog::logger>("gui-test", sinks.begin(), sinks.end());
    gui->info("from gui");
    gui->flush();

    const std::string log = read_file(log_file);
    assert(log.find("gui-test: from gui") != std::string::npos);

    presenters::initCoreLogging("info", "%v", "");
    assert(presenters::coreLogSinks().size() == 1);

    assert(presenters::parseLogLevel("warning") == spdlog::level::warn);
    assert(presenters::parseLogLevel("DEBUG") == spdlog::level::debug);
    assert(presenters::parseLogLevel("off") == spdlog::level::off);
    assert(presenters::parseLogLevel("loud") == spdlog::level::info);

    std::filesystem::remove_all(dir);
    std::cout << "test_shared_log_sinks: PASSED\n";
}

int main() {
    std::cout << "Running analysis presenter tests...\n\n";

    test_presets();
    test_validate_request();
    test_format_metadata();
    test_run_through_presenter();
    test_cancel_through_presenter();
    test_start_next_run_from_done();
    test_default_output_directory();
    test_shared_log_sinks();

    std::cout << "\nAll analysis presenter tests passed!\n";
    return 0;
}
