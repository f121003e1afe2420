/*
 * File:        analysis_event_queue.h
 * Module:      seti-core
 * Purpose:     Thread-safe FIFO of analysis run events
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#ifndef SETI_CORE_ANALYSIS_EVENT_QUEUE_H
#define SETI_CORE_ANALYSIS_EVENT_QUEUE_H

#include "seti_analysis.h"

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <queue>
#include <string>

namespace seti {

/**
 * @brief One event of an analysis run
 */
struct AnalysisEvent {
    enum class Type {
        Stage,      ///< A stage started (stage holds its name)
        Progress,   ///< Progress changed (progress holds 0-100)
        Done        ///< Terminal event (result holds the outcome)
    };

    Type type = Type::Stage;
    std::string stage;
    int progress = 0;
    std::shared_ptr<const AnalysisResult> result;

    static AnalysisEvent makeStage(std::string name);
    static AnalysisEvent makeProgress(int percentage);
    static AnalysisEvent makeDone(AnalysisResult result);
};

/**
 * @brief Multi-producer, single-consumer event queue
 *
 * Lets a consumer thread without an event loop process run events in
 * the order the worker emitted them.
 */
class AnalysisEventQueue {
public:
    void push(AnalysisEvent event);

    /**
     * @brief Block until an event is available and remove it
     */
    AnalysisEvent waitPop();

    /**
     * @brief Wait up to `timeout` for an event
     * @return The event, or nullopt on timeout
     */
    std::optional<AnalysisEvent> tryPop(std::chrono::milliseconds timeout);

    size_t size() const;
    bool empty() const;

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::queue<AnalysisEvent> events_;
};

} // namespace seti

#endif // SETI_CORE_ANALYSIS_EVENT_QUEUE_H
