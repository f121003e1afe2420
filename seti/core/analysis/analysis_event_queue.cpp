/*
 * File:        analysis_event_queue.cpp
 * Module:      seti-core
 * Purpose:     Thread-safe FIFO of analysis run events
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#include "analysis_event_queue.h"

namespace seti {

AnalysisEvent AnalysisEvent::makeStage(std::string name) {
    AnalysisEvent event;
    event.type = Type::Stage;
    event.stage = std::move(name);
    return event;
}

AnalysisEvent AnalysisEvent::makeProgress(int percentage) {
    AnalysisEvent event;
    event.type = Type::Progress;
    event.progress = percentage;
    return event;
}

AnalysisEvent AnalysisEvent::makeDone(AnalysisResult result) {
    AnalysisEvent event;
    event.type = Type::Done;
    event.result = std::make_shared<const AnalysisResult>(std::move(result));
    return event;
}

void AnalysisEventQueue::push(AnalysisEvent event) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        events_.push(std::move(event));
    }
    cv_.notify_one();
}

AnalysisEvent AnalysisEventQueue::waitPop() {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return !events_.empty(); });
    AnalysisEvent event = std::move(events_.front());
    events_.pop();
    return event;
}

std::optional<AnalysisEvent> AnalysisEventQueue::tryPop(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!cv_.wait_for(lock, timeout, [this] { return !events_.empty(); })) {
        return std::nullopt;
    }
    AnalysisEvent event = std::move(events_.front());
    events_.pop();
    return event;
}

size_t AnalysisEventQueue::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return events_.size();
}

bool AnalysisEventQueue::empty() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return events_.empty();
}

} // namespace seti
