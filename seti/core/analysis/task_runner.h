/*
 * File:        task_runner.h
 * Module:      seti-core
 * Purpose:     Runs one analysis at a time on a worker thread
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#ifndef SETI_CORE_ANALYSIS_TASK_RUNNER_H
#define SETI_CORE_ANALYSIS_TASK_RUNNER_H

#if defined(SETI_GUI_BUILD)
#error "GUI code cannot include core/analysis/task_runner.h. Use AnalysisPresenter instead."
#endif

#include "analyzer.h"
#include "analysis_event_queue.h"
#include "seti_analysis.h"

#include <spdlog/spdlog.h>

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace seti {

/**
 * @brief Runs an Analyzer off the caller's thread and reports back
 *
 * Callbacks are invoked on the worker thread, in emission order:
 * on_stage/on_progress for each stage, then exactly one on_done. Progress
 * never decreases within a run. Exceptions thrown by the analyzer are
 * logged and delivered as a failed result; they never reach the caller.
 *
 * States: Idle -> Running -> Succeeded | Failed | Cancelled -> Idle.
 * The terminal state is entered before on_done is called and the runner
 * is back to Idle once on_done has returned. A new run may be started as
 * soon as the terminal state is reached, including from inside on_done.
 * start() from on_stage or on_progress is rejected.
 *
 * The runner must not be destroyed from inside one of its own callbacks.
 */
class TaskRunner {
public:
    using StageCallback = std::function<void(const std::string&)>;
    using ProgressCallback = std::function<void(int)>;
    using DoneCallback = std::function<void(const AnalysisResult&)>;

    enum class State {
        Idle,
        Running,
        Succeeded,
        Failed,
        Cancelled
    };

    TaskRunner(std::shared_ptr<Analyzer> analyzer, std::shared_ptr<spdlog::logger> logger);

    /**
     * @brief Cancels and joins any run in flight
     */
    ~TaskRunner();

    TaskRunner(const TaskRunner&) = delete;
    TaskRunner& operator=(const TaskRunner&) = delete;

    /**
     * @brief Start a run
     * @return false if a run is in the Running state (the request is ignored)
     */
    bool start(const AnalysisRequest& request,
               StageCallback on_stage,
               ProgressCallback on_progress,
               DoneCallback on_done);

    /**
     * @brief Start a run on a different analyzer
     *
     * The analyzer is used for this run only and kept alive until it ends.
     */
    bool start(std::shared_ptr<Analyzer> analyzer,
               const AnalysisRequest& request,
               StageCallback on_stage,
               ProgressCallback on_progress,
               DoneCallback on_done);

    /**
     * @brief Start a run whose events are pushed to a queue
     */
    bool start(const AnalysisRequest& request, AnalysisEventQueue& queue);

    /**
     * @brief Request cancellation of the run in flight
     *
     * Checked between stages and progress steps; the run then finishes
     * with a Cancelled result.
     */
    void cancel();

    /**
     * @brief Block until the worker threads started so far have exited
     *
     * A run started from on_done while waiting is not waited for. Called
     * from a worker thread, the calling thread itself is skipped.
     */
    void wait();

    State state() const;
    State lastOutcome() const;
    bool isRunning() const;

    static const char* stateToString(State state);

private:
    class CallbackProgress;

    void run(uint64_t generation,
             std::shared_ptr<Analyzer> analyzer,
             AnalysisRequest request,
             StageCallback on_stage,
             ProgressCallback on_progress,
             DoneCallback on_done);

    std::shared_ptr<Analyzer> analyzer_;
    std::shared_ptr<spdlog::logger> logger_;

    mutable std::mutex mutex_;
    State state_ = State::Idle;
    State last_outcome_ = State::Idle;
    uint64_t generation_ = 0;
    std::atomic<bool> cancelled_{false};
    std::thread worker_;
    std::vector<std::thread> retired_;  ///< Workers that started their successor from on_done
};

} // namespace seti

#endif // SETI_CORE_ANALYSIS_TASK_RUNNER_H
