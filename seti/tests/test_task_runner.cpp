/******************************************************************************
 * test_task_runner.cpp
 *
 * Unit tests for the background task runner and its event queue
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 ******************************************************************************/

#include "task_runner.h"
#include <spdlog/sinks/null_sink.h>
#include <cassert>
#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <iostream>
#include <mutex>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace seti;

namespace {

std::shared_ptr<spdlog::logger> make_test_logger() {
    return std::make_shared<spdlog::logger>("runner-test", std::make_shared<spdlog::sinks::null_sink_mt>());
}

std::filesystem::path test_output_dir(const std::string& name) {
    auto dir = std::filesystem::temp_directory_path() / ("seti-test-" + name);
    std::filesystem::remove_all(dir);
    return dir;
}

std::shared_ptr<Analyzer> make_analyzer(const std::string& name, int delay_ms = 0) {
    AnalyzerConfig config;
    config.output_directory = test_output_dir(name).string();
    config.sub_step_delay = std::chrono::milliseconds(delay_ms);
    return std::make_shared<Analyzer>(config, make_test_logger());
}

/**
 * Records run callbacks in arrival order
 */
struct Recorder {
    std::mutex mutex;
    std::condition_variable cv;
    std::vector<std::string> events;    // "stage:<name>", "progress:<n>", "done"
    std::vector<std::string> stages;
    std::vector<int> progress;
    std::vector<AnalysisResult> results;
    std::thread::id callback_thread;

    bool start(TaskRunner& runner, const AnalysisRequest& request) {
        return runner.start(request,
            [this](const std::string& stage) {
                std::lock_guard<std::mutex> lock(mutex);
                callback_thread = std::this_thread::get_id();
                events.push_back("stage:" + stage);
                stages.push_back(stage);
                cv.notify_all();
            },
            [this](int percentage) {
                std::lock_guard<std::mutex> lock(mutex);
                events.push_back("progress:" + std::to_string(percentage));
                progress.push_back(percentage);
                cv.notify_all();
            },
            [this](const AnalysisResult& result) {
                std::lock_guard<std::mutex> lock(mutex);
                events.push_back("done");
                results.push_back(result);
                cv.notify_all();
            });
    }

    bool waitForProgress(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mutex);
        return cv.wait_for(lock, timeout, [this] { return !progress.empty(); });
    }
};

} // anonymous namespace

void test_end_to_end_run() {
    TaskRunner runner(make_analyzer("runner-e2e"), make_test_logger());
    Recorder recorder;

    assert(recorder.start(runner, {"sample.dat", "A"}));
    runner.wait();

    // Callbacks came from the worker, not this thread
    assert(recorder.callback_thread != std::this_thread::get_id());

    const std::vector<std::string> expected_stages = {
        "Loading file", "Preprocessing", "Building waterfall",
        "Clustering windows", "Searching candidates", "Writing results", "done"
    };
    assert(recorder.stages == expected_stages);

    // Exactly one terminal event, after everything else
    assert(recorder.results.size() == 1);
    assert(recorder.events.back() == "done");
    assert(recorder.events[recorder.events.size() - 2] == "stage:done");

    const AnalysisResult& result = recorder.results.front();
    assert(result.succeeded());
    assert(result.error_message.empty());
    assert(result.window_scores.size() == 5);
    const char* scores[] = {"90%", "89%", "88%", "87%", "86%"};
    for (size_t i = 0; i < 5; ++i) {
        assert(result.window_scores[i].score == scores[i]);
    }
    assert(result.candidates.size() == 8);
    for (size_t i = 0; i < 8; ++i) {
        assert(result.candidates[i].status == (i % 2 == 0 ? "RFI" : "Interesting"));
    }

    assert(runner.state() == TaskRunner::State::Idle);
    assert(runner.lastOutcome() == TaskRunner::State::Succeeded);

    std::filesystem::remove_all(test_output_dir("runner-e2e"));
    std::cout << "test_end_to_end_run: PASSED\n";
}

void test_progress_sequence() {
    TaskRunner runner(make_analyzer("runner-progress"), make_test_logger());
    Recorder recorder;

    assert(recorder.start(runner, {"sample.dat", "A"}));
    runner.wait();

    assert(!recorder.progress.empty());
    for (size_t i = 1; i < recorder.progress.size(); ++i) {
        assert(recorder.progress[i] >= recorder.progress[i - 1]);
    }
    assert(recorder.progress.back() == 100);

    // First stage covers 0..16 in five steps
    const std::vector<int> first_stage(recorder.progress.begin(), recorder.progress.begin() + 5);
    assert((first_stage == std::vector<int>{3, 6, 9, 12, 16}));

    // Stage name count = configured stages + "done"
    std::set<std::string> distinct(recorder.stages.begin(), recorder.stages.end());
    assert(distinct.size() == analysis_stage_names().size() + 1);

    std::filesystem::remove_all(test_output_dir("runner-progress"));
    std::cout << "test_progress_sequence: PASSED\n";
}

void test_stage_failure_becomes_result() {
    auto analyzer = make_analyzer("runner-failure");
    analyzer->setStageAction(3, [](StageContext&) {
        throw std::runtime_error("clustering backend unavailable");
    });

    TaskRunner runner(analyzer, make_test_logger());
    Recorder recorder;

    assert(recorder.start(runner, {"sample.dat", "A"}));
    runner.wait();

    assert(recorder.results.size() == 1);
    const AnalysisResult& result = recorder.results.front();
    assert(result.failed());
    assert(result.error_message == "clustering backend unavailable");
    assert(result.metadata.empty());
    assert(result.artifacts.empty());
    assert(result.window_scores.empty());
    assert(result.candidates.empty());

    // No "done" stage for a failed run
    assert(recorder.stages.back() == "Clustering windows");

    assert(runner.state() == TaskRunner::State::Idle);
    assert(runner.lastOutcome() == TaskRunner::State::Failed);

    std::filesystem::remove_all(test_output_dir("runner-failure"));
    std::cout << "test_stage_failure_becomes_result: PASSED\n";
}

void test_non_standard_exception() {
    auto analyzer = make_analyzer("runner-non-std");
    analyzer->setStageAction(0, [](StageContext&) {
        throw 42;
    });

    TaskRunner runner(analyzer, make_test_logger());
    Recorder recorder;

    assert(recorder.start(runner, {"sample.dat", "A"}));
    runner.wait();

    assert(recorder.results.size() == 1);
    assert(recorder.results.front().failed());
    assert(!recorder.results.front().error_message.empty());

    std::cout << "test_non_standard_exception: PASSED\n";
}

void test_cancel_run() {
    TaskRunner runner(make_analyzer("runner-cancel", 20), make_test_logger());
    Recorder recorder;

    assert(recorder.start(runner, {"sample.dat", "A"}));
    assert(recorder.waitForProgress(std::chrono::seconds(10)));
    runner.cancel();
    runner.wait();

    assert(recorder.results.size() == 1);
    assert(recorder.results.front().cancelled());
    assert(recorder.results.front().error_message.empty());
    for (const auto& stage : recorder.stages) {
        assert(stage != "done");
    }
    assert(recorder.progress.back() < 100);

    assert(runner.state() == TaskRunner::State::Idle);
    assert(runner.lastOutcome() == TaskRunner::State::Cancelled);

    std::filesystem::remove_all(test_output_dir("runner-cancel"));
    std::cout << "test_cancel_run: PASSED\n";
}

void test_second_start_rejected() {
    TaskRunner runner(make_analyzer("runner-reject", 20), make_test_logger());
    Recorder first;
    Recorder second;

    assert(first.start(runner, {"sample.dat", "A"}));
    assert(runner.isRunning());
    assert(!second.start(runner, {"other.dat", "B"}));

    runner.cancel();
    runner.wait();

    assert(first.results.size() == 1);
    assert(second.events.empty());

    std::filesystem::remove_all(test_output_dir("runner-reject"));
    std::cout << "test_second_start_rejected: PASSED\n";
}

void test_restart_after_completion() {
    TaskRunner runner(make_analyzer("runner-restart"), make_test_logger());

    Recorder first;
    assert(first.start(runner, {"first.dat", "A"}));
    runner.wait();
    assert(first.results.size() == 1);

    Recorder second;
    assert(second.start(runner, {"second.dat", "B"}));
    runner.wait();
    assert(second.results.size() == 1);
    assert(second.results.front().succeeded());
    assert(second.results.front().metadata[0].second == "second.dat");

    std::filesystem::remove_all(test_output_dir("runner-restart"));
    std::cout << "test_restart_after_completion: PASSED\n";
}

void test_throwing_consumer() {
    TaskRunner runner(make_analyzer("runner-consumer"), make_test_logger());

    bool done_called = false;
    assert(runner.start({"sample.dat", "A"}, nullptr, nullptr,
        [&done_called](const AnalysisResult&) {
            done_called = true;
            throw std::runtime_error("consumer bug");
        }));
    runner.wait();

    assert(done_called);
    assert(runner.state() == TaskRunner::State::Idle);
    assert(runner.lastOutcome() == TaskRunner::State::Succeeded);

    std::filesystem::remove_all(test_output_dir("runner-consumer"));
    std::cout << "test_throwing_consumer: PASSED\n";
}

void test_throwing_consumer_non_standard() {
    TaskRunner runner(make_analyzer("runner-consumer-int"), make_test_logger());

    bool done_called = false;
    assert(runner.start({"sample.dat", "A"}, nullptr, nullptr,
        [&done_called](const AnalysisResult&) {
            done_called = true;
            throw 7;
        }));
    runner.wait();

    assert(done_called);
    assert(runner.state() == TaskRunner::State::Idle);
    assert(runner.lastOutcome() == TaskRunner::State::Succeeded);

    std::filesystem::remove_all(test_output_dir("runner-consumer-int"));
    std::cout << "test_throwing_consumer_non_standard: PASSED\n";
}

void test_start_from_done_callback() {
    TaskRunner runner(make_analyzer("runner-chain"), make_test_logger());
    Recorder second;
    bool chained = false;

    assert(runner.start({"first.dat", "A"}, nullptr, nullptr,
        [&](const AnalysisResult& result) {
            assert(result.succeeded());
            chained = second.start(runner, {"second.dat", "B"});
        }));

    {
        std::unique_lock<std::mutex> lock(second.mutex);
        assert(second.cv.wait_for(lock, std::chrono::seconds(10),
                                  [&second] { return !second.results.empty(); }));
    }
    runner.wait();

    assert(chained);
    assert(second.results.size() == 1);
    assert(second.results.front().succeeded());
    assert(second.results.front().metadata[0].second == "second.dat");
    assert(second.stages.back() == "done");
    assert(runner.state() == TaskRunner::State::Idle);
    assert(runner.lastOutcome() == TaskRunner::State::Succeeded);

    // The runner is still usable once the chained run has finished
    Recorder third;
    assert(third.start(runner, {"third.dat", "C"}));
    runner.wait();
    assert(third.results.size() == 1);

    std::filesystem::remove_all(test_output_dir("runner-chain"));
    std::cout << "test_start_from_done_callback: PASSED\n";
}

void test_start_from_stage_callback_rejected() {
    TaskRunner runner(make_analyzer("runner-nested"), make_test_logger());
    Recorder nested;
    bool attempted = false;
    bool accepted = true;

    assert(runner.start({"sample.dat", "A"},
        [&](const std::string&) {
            if (!attempted) {
                attempted = true;
                accepted = nested.start(runner, {"nested.dat", "B"});
            }
        },
        nullptr, nullptr));
    runner.wait();

    assert(attempted);
    assert(!accepted);
    assert(nested.events.empty());
    assert(runner.lastOutcome() == TaskRunner::State::Succeeded);

    std::filesystem::remove_all(test_output_dir("runner-nested"));
    std::cout << "test_start_from_stage_callback_rejected: PASSED\n";
}

void test_start_with_other_analyzer() {
    TaskRunner runner(make_analyzer("runner-default"), make_test_logger());

    auto other = make_analyzer("runner-other");
    other->setStageAction(2, [](StageContext&) {
        throw std::runtime_error("waterfall unavailable");
    });

    Recorder recorder;
    assert(runner.start(other, {"sample.dat", "A"},
        [&recorder](const std::string& stage) {
            std::lock_guard<std::mutex> lock(recorder.mutex);
            recorder.stages.push_back(stage);
        },
        nullptr,
        [&recorder](const AnalysisResult& result) {
            std::lock_guard<std::mutex> lock(recorder.mutex);
            recorder.results.push_back(result);
        }));
    other.reset();
    runner.wait();

    assert(recorder.results.size() == 1);
    assert(recorder.results.front().failed());
    assert(recorder.results.front().error_message == "waterfall unavailable");
    assert(recorder.stages.size() == 3);

    // The default analyzer is untouched
    Recorder fallback;
    assert(fallback.start(runner, {"sample.dat", "A"}));
    runner.wait();
    assert(fallback.results.size() == 1);
    assert(fallback.results.front().succeeded());

    assert(!runner.start(nullptr, {"sample.dat", "A"}, nullptr, nullptr, nullptr));

    std::filesystem::remove_all(test_output_dir("runner-default"));
    std::filesystem::remove_all(test_output_dir("runner-other"));
    std::cout << "test_start_with_other_analyzer: PASSED\n";
}

void test_wait_from_other_thread() {
    TaskRunner runner(make_analyzer("runner-wait", 5), make_test_logger());
    Recorder recorder;

    assert(recorder.start(runner, {"sample.dat", "A"}));
    std::thread waiter([&runner] { runner.wait(); });
    waiter.join();

    assert(recorder.results.size() == 1);
    assert(recorder.results.front().succeeded());

    std::filesystem::remove_all(test_output_dir("runner-wait"));
    std::cout << "test_wait_from_other_thread: PASSED\n";
}

void test_event_queue_order() {
    TaskRunner runner(make_analyzer("runner-queue"), make_test_logger());
    AnalysisEventQueue queue;

    assert(runner.start({"sample.dat", "A"}, queue));

    std::vector<AnalysisEvent> events;
    while (true) {
        auto event = queue.tryPop(std::chrono::seconds(10));
        assert(event.has_value());
        events.push_back(*event);
        if (event->type == AnalysisEvent::Type::Done) {
            break;
        }
    }
    runner.wait();

    // 7 stages, 31 progress updates, 1 done
    assert(events.size() == 7 + 31 + 1);
    assert(events.front().type == AnalysisEvent::Type::Stage);
    assert(events.front().stage == "Loading file");
    assert(events[events.size() - 2].type == AnalysisEvent::Type::Stage);
    assert(events[events.size() - 2].stage == "done");
    assert(events.back().result != nullptr);
    assert(events.back().result->succeeded());
    assert(queue.empty());

    std::filesystem::remove_all(test_output_dir("runner-queue"));
    std::cout << "test_event_queue_order: PASSED\n";
}

void test_event_queue_threads() {
    AnalysisEventQueue queue;

    std::thread producer([&queue]() {
        for (int i = 0; i <= 100; ++i) {
            queue.push(AnalysisEvent::makeProgress(i));
        }
        queue.push(AnalysisEvent::makeDone(AnalysisResult::cancellation()));
    });

    int expected = 0;
    while (true) {
        AnalysisEvent event = queue.waitPop();
        if (event.type == AnalysisEvent::Type::Done) {
            assert(event.result->cancelled());
            break;
        }
        assert(event.progress == expected);
        ++expected;
    }
    producer.join();

    assert(expected == 101);
    assert(!queue.tryPop(std::chrono::milliseconds(1)).has_value());

    std::cout << "test_event_queue_threads: PASSED\n";
}

void test_destructor_cancels() {
    auto started = std::chrono::steady_clock::now();
    Recorder recorder;
    {
        TaskRunner runner(make_analyzer("runner-destructor", 200), make_test_logger());
        assert(recorder.start(runner, {"sample.dat", "A"}));
    }
    auto elapsed = std::chrono::steady_clock::now() - started;

    assert(recorder.results.size() == 1);
    assert(recorder.results.front().cancelled());

    // A full run would take 30 x 200 ms
    assert(elapsed < std::chrono::seconds(3));

    std::filesystem::remove_all(test_output_dir("runner-destructor"));
    std::cout << "test_destructor_cancels: PASSED\n";
}

int main() {
    std::cout << "Running task runner tests...\n\n";

    test_end_to_end_run();
    test_progress_sequence();
    test_stage_failure_becomes_result();
    test_non_standard_exception();
    test_cancel_run();
    test_second_start_rejected();
    test_restart_after_completion();
    test_throwing_consumer();
    test_throwing_consumer_non_standard();
    test_start_from_done_callback();
    test_start_from_stage_callback_rejected();
    test_start_with_other_analyzer();
    test_wait_from_other_thread();
    test_event_queue_order();
    test_event_queue_threads();
    test_destructor_cancels();

    std::cout << "\nAll task runner tests passed!\n";
    return 0;
}
