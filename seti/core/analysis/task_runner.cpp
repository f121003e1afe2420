/*
 * File:        task_runner.cpp
 * Module:      seti-core
 * Purpose:     Runs one analysis at a time on a worker thread
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#include "task_runner.h"

#include <algorithm>
#include <stdexcept>
#include <system_error>

namespace seti {

/**
 * @brief Forwards analyzer progress to the run callbacks
 *
 * Clamps progress to 0-100 and never reports a value lower than the
 * previous one.
 */
class TaskRunner::CallbackProgress : public AnalysisProgress {
public:
    CallbackProgress(const StageCallback& on_stage,
                     const ProgressCallback& on_progress,
                     const std::atomic<bool>& cancelled)
        : on_stage_(on_stage), on_progress_(on_progress), cancelled_(cancelled) {}

    void setStage(const std::string& stage) override {
        if (on_stage_) {
            on_stage_(stage);
        }
    }

    void setProgress(int percentage) override {
        percentage = std::clamp(percentage, 0, 100);
        last_progress_ = std::max(last_progress_, percentage);
        if (on_progress_) {
            on_progress_(last_progress_);
        }
    }

    bool isCancelled() const override {
        return cancelled_.load();
    }

private:
    const StageCallback& on_stage_;
    const ProgressCallback& on_progress_;
    const std::atomic<bool>& cancelled_;
    int last_progress_ = 0;
};

TaskRunner::TaskRunner(std::shared_ptr<Analyzer> analyzer, std::shared_ptr<spdlog::logger> logger)
    : analyzer_(std::move(analyzer))
    , logger_(std::move(logger))
{
    if (!analyzer_) {
        throw std::invalid_argument("TaskRunner requires an analyzer");
    }
    if (!logger_) {
        throw std::invalid_argument("TaskRunner requires a logger");
    }
}

TaskRunner::~TaskRunner() {
    cancel();
    wait();
}

bool TaskRunner::start(const AnalysisRequest& request,
                       StageCallback on_stage,
                       ProgressCallback on_progress,
                       DoneCallback on_done) {
    return start(analyzer_, request, std::move(on_stage), std::move(on_progress), std::move(on_done));
}

bool TaskRunner::start(std::shared_ptr<Analyzer> analyzer,
                       const AnalysisRequest& request,
                       StageCallback on_stage,
                       ProgressCallback on_progress,
                       DoneCallback on_done) {
    if (!analyzer) {
        logger_->error("Cannot start an analysis without an analyzer");
        return false;
    }

    const std::thread::id self = std::this_thread::get_id();
    std::vector<std::thread> finished;
    bool started = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);

        if (state_ == State::Running) {
            if (worker_.joinable() && worker_.get_id() == self) {
                logger_->error("Cannot start an analysis from inside a stage or progress callback");
            } else {
                logger_->warn("Analysis already running; ignoring request for {}", request.input_path);
            }
            return false;
        }

        const uint64_t generation = generation_ + 1;
        logger_->info("Starting analysis of {} with preset '{}'", request.input_path, request.preset);

        cancelled_ = false;
        try {
            std::thread worker(&TaskRunner::run, this, generation, std::move(analyzer), request,
                               std::move(on_stage), std::move(on_progress), std::move(on_done));

            // The previous worker has delivered its result and is exiting. It
            // cannot join itself when this start comes from its on_done.
            if (worker_.joinable()) {
                if (worker_.get_id() == self) {
                    retired_.push_back(std::move(worker_));
                } else {
                    finished.push_back(std::move(worker_));
                }
            }
            worker_ = std::move(worker);
            generation_ = generation;
            state_ = State::Running;
            started = true;
        } catch (const std::system_error& e) {
            logger_->error("Could not start analysis thread: {}", e.what());
        }

        for (auto it = retired_.begin(); it != retired_.end();) {
            if (it->get_id() != self) {
                finished.push_back(std::move(*it));
                it = retired_.erase(it);
            } else {
                ++it;
            }
        }
    }

    for (auto& thread : finished) {
        thread.join();
    }
    return started;
}

bool TaskRunner::start(const AnalysisRequest& request, AnalysisEventQueue& queue) {
    return start(request,
        [&queue](const std::string& stage) { queue.push(AnalysisEvent::makeStage(stage)); },
        [&queue](int percentage) { queue.push(AnalysisEvent::makeProgress(percentage)); },
        [&queue](const AnalysisResult& result) { queue.push(AnalysisEvent::makeDone(result)); });
}

void TaskRunner::cancel() {
    cancelled_ = true;
}

void TaskRunner::wait() {
    const std::thread::id self = std::this_thread::get_id();
    std::vector<std::thread> threads;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (worker_.joinable() && worker_.get_id() != self) {
            threads.push_back(std::move(worker_));
        }
        for (auto it = retired_.begin(); it != retired_.end();) {
            if (it->get_id() != self) {
                threads.push_back(std::move(*it));
                it = retired_.erase(it);
            } else {
                ++it;
            }
        }
    }
    for (auto& thread : threads) {
        thread.join();
    }
}

TaskRunner::State TaskRunner::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

TaskRunner::State TaskRunner::lastOutcome() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_outcome_;
}

bool TaskRunner::isRunning() const {
    return state() == State::Running;
}

const char* TaskRunner::stateToString(State state) {
    switch (state) {
    case State::Idle:
        return "idle";
    case State::Running:
        return "running";
    case State::Succeeded:
        return "succeeded";
    case State::Failed:
        return "failed";
    case State::Cancelled:
        return "cancelled";
    }
    return "unknown";
}

void TaskRunner::run(uint64_t generation,
                     std::shared_ptr<Analyzer> analyzer,
                     AnalysisRequest request,
                     StageCallback on_stage,
                     ProgressCallback on_progress,
                     DoneCallback on_done) {
    CallbackProgress progress(on_stage, on_progress, cancelled_);

    AnalysisResult result;
    try {
        result = analyzer->analyze(request, &progress);
    } catch (const std::exception& e) {
        logger_->error("Analysis of {} failed: {}", request.input_path, e.what());
        result = AnalysisResult::failure(e.what());
    } catch (...) {
        logger_->error("Analysis of {} failed with an unknown error", request.input_path);
        result = AnalysisResult::failure("Unknown internal error");
    }

    State outcome = State::Succeeded;
    if (result.failed()) {
        outcome = State::Failed;
    } else if (result.cancelled()) {
        outcome = State::Cancelled;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (generation == generation_) {
            state_ = outcome;
            last_outcome_ = outcome;
        }
    }
    logger_->info("Analysis of {} finished: {}", request.input_path, stateToString(outcome));

    if (on_done) {
        try {
            on_done(result);
        } catch (const std::exception& e) {
            logger_->error("Result consumer raised an exception: {}", e.what());
        } catch (...) {
            logger_->error("Result consumer raised an unknown exception");
        }
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (generation == generation_) {
        state_ = State::Idle;
    }
}

} // namespace seti
