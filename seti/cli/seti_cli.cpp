/*
 * File:        seti_cli.cpp
 * Module:      seti-cli
 * Purpose:     Headless analysis runner
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#include "version.h"
#include "analysis_event_queue.h"
#include "analysis_presets.h"
#include "analyzer.h"
#include "logging.h"
#include "task_runner.h"

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

using namespace seti;

namespace {

constexpr int kExitSuccess = 0;
constexpr int kExitFailed = 1;
constexpr int kExitUsage = 2;
constexpr int kExitCancelled = 3;

std::atomic<bool> g_interrupted{false};

void handle_interrupt(int) {
    g_interrupted = true;
}

void print_result(const AnalysisResult& result) {
    std::cout << "\nMetadata:\n";
    for (const auto& [label, value] : result.metadata) {
        std::cout << "  " << label << ": " << value << "\n";
    }

    std::cout << "\nPreviews:\n";
    for (ArtifactKind kind : {ArtifactKind::Waterfall, ArtifactKind::ActivityMap,
                              ArtifactKind::WindowPreview, ArtifactKind::CandidatePreview}) {
        auto path = result.artifact(kind);
        std::cout << "  " << artifact_kind_to_string(kind) << ": "
                  << (path ? *path : std::string("(not generated)")) << "\n";
    }

    std::cout << "\nWindows:\n";
    for (const auto& window : result.window_scores) {
        std::cout << "  " << window.window_id << "  " << window.score << "  " << window.cluster << "\n";
    }

    std::cout << "\nCandidates:\n";
    for (const auto& candidate : result.candidates) {
        std::cout << "  " << candidate.id << "  " << candidate.frequency << "  " << candidate.status << "\n";
    }
}

} // anonymous namespace

void print_usage(const char* program_name) {
    std::cerr << "Usage: " << program_name << " <input-file> [options]\n";
    std::cerr << "\n";
    std::cerr << "Run the staged analysis on a recording and print the results.\n";
    std::cerr << "\n";
    std::cerr << "Options:\n";
    std::cerr << "  --preset NAME                  Analysis preset (id or name)\n";
    std::cerr << "                                 Default: " << analysis_presets().front().name << "\n";
    std::cerr << "  --output DIR                   Directory for previews and the result summary\n";
    std::cerr << "  --log-level LEVEL              Set logging verbosity\n";
    std::cerr << "                                 (trace, debug, info, warn, error, critical, off)\n";
    std::cerr << "                                 Default: info\n";
    std::cerr << "  --log-file FILE                Append the analysis log to FILE\n";
    std::cerr << "  --step-delay-ms N              Delay between progress steps (default: 200)\n";
    std::cerr << "\n";
    std::cerr << "Presets:\n";
    for (const auto& preset : analysis_presets()) {
        std::cerr << "  " << preset.id << " (" << preset.name << "): " << preset.description << "\n";
    }
    std::cerr << "\n";
    std::cerr << "Exit status: 0 success, 1 analysis failed, 2 usage error, 3 cancelled\n";
    std::cerr << "\n";
    std::cerr << "Examples:\n";
    std::cerr << "  " << program_name << " capture.dat\n";
    std::cerr << "  " << program_name << " capture.dat --preset local_search --output results\n";
}

int main(int argc, char* argv[]) {
    std::string input_path;
    std::string preset_arg = analysis_presets().front().id;
    std::string output_dir;
    std::string log_level = "info";
    std::string log_file;
    int step_delay_ms = static_cast<int>(kDefaultSubStepDelay.count());

    if (argc < 2) {
        print_usage(argv[0]);
        return kExitUsage;
    }

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return kExitSuccess;
        } else if (arg == "--version") {
            std::cout << "seti-cli " << SETI_VERSION << "\n";
            return kExitSuccess;
        } else if (arg == "--preset" && i + 1 < argc) {
            preset_arg = argv[++i];
        } else if (arg == "--output" && i + 1 < argc) {
            output_dir = argv[++i];
        } else if (arg == "--log-level" && i + 1 < argc) {
            log_level = argv[++i];
        } else if (arg == "--log-file" && i + 1 < argc) {
            log_file = argv[++i];
        } else if (arg == "--step-delay-ms" && i + 1 < argc) {
            try {
                step_delay_ms = std::stoi(argv[++i]);
            } catch (const std::exception&) {
                std::cerr << "Error: Invalid step delay: " << argv[i] << "\n";
                return kExitUsage;
            }
            if (step_delay_ms < 0) {
                std::cerr << "Error: Step delay cannot be negative\n";
                return kExitUsage;
            }
        } else if (arg[0] != '-') {
            if (input_path.empty()) {
                input_path = arg;
            } else {
                std::cerr << "Error: Multiple input files specified\n";
                print_usage(argv[0]);
                return kExitUsage;
            }
        } else {
            std::cerr << "Error: Unknown option: " << arg << "\n";
            print_usage(argv[0]);
            return kExitUsage;
        }
    }

    if (input_path.empty()) {
        std::cerr << "Error: No input file specified\n";
        print_usage(argv[0]);
        return kExitUsage;
    }

    const PresetInfo* preset = find_preset(preset_arg);
    if (!preset) {
        std::cerr << "Error: Unknown preset: " << preset_arg << "\n";
        print_usage(argv[0]);
        return kExitUsage;
    }

    init_logging(log_level);
    SETI_LOG_DEBUG("seti-cli {} starting", SETI_VERSION);

    AnalyzerConfig config;
    config.output_directory = output_dir;
    config.sub_step_delay = std::chrono::milliseconds(step_delay_ms);

    std::shared_ptr<spdlog::logger> analysis_logger;
    std::shared_ptr<Analyzer> analyzer;
    try {
        analysis_logger = create_analysis_logger("analyzer", log_file);
        analyzer = std::make_shared<Analyzer>(config, analysis_logger);
    } catch (const std::exception& e) {
        SETI_LOG_ERROR("Could not set up the analyzer: {}", e.what());
        return kExitFailed;
    }

    std::signal(SIGINT, handle_interrupt);

    TaskRunner runner(analyzer, analysis_logger);
    AnalysisEventQueue events;

    AnalysisRequest request{input_path, preset->name};
    if (!runner.start(request, events)) {
        SETI_LOG_ERROR("Analysis could not be started");
        return kExitFailed;
    }

    std::shared_ptr<const AnalysisResult> result;
    int last_progress = -1;
    bool cancel_sent = false;

    while (!result) {
        if (g_interrupted && !cancel_sent) {
            std::cerr << "\nInterrupted, cancelling...\n";
            runner.cancel();
            cancel_sent = true;
        }

        auto event = events.tryPop(std::chrono::milliseconds(100));
        if (!event) {
            continue;
        }

        switch (event->type) {
        case AnalysisEvent::Type::Stage:
            std::cout << "[" << event->stage << "]\n";
            break;
        case AnalysisEvent::Type::Progress:
            if (event->progress != last_progress) {
                std::cout << "  " << event->progress << "%\n";
                last_progress = event->progress;
            }
            break;
        case AnalysisEvent::Type::Done:
            result = event->result;
            break;
        }
    }

    runner.wait();

    if (result->failed()) {
        std::cerr << "Analysis failed: " << result->error_message << "\n";
        return kExitFailed;
    }
    if (result->cancelled()) {
        std::cerr << "Analysis cancelled\n";
        return kExitCancelled;
    }

    print_result(*result);
    std::cout << "\nResults written to " << analyzer->outputDirectory().string() << "\n";
    return kExitSuccess;
}
