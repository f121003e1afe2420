/*
 * File:        analysis_runner.cpp
 * Module:      seti-gui
 * Purpose:     Delivers analysis run events on the GUI thread
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#include "analysis_runner.h"
#include "../logging.h"
#include <QMetaObject>

namespace seti {
namespace gui {

AnalysisRunner::AnalysisRunner(seti::presenters::AnalysisPresenter& presenter, QObject* parent)
    : QObject(parent), presenter_(presenter) {
}

bool AnalysisRunner::start(const seti::AnalysisRequest& request) {
    seti::presenters::AnalysisCallbacks callbacks;

    callbacks.on_stage = [this](const std::string& stage) {
        QString qstage = QString::fromStdString(stage);
        QMetaObject::invokeMethod(this, [this, qstage]() {
            emit stageChanged(qstage);
        }, Qt::QueuedConnection);
    };

    callbacks.on_progress = [this](int percentage) {
        QMetaObject::invokeMethod(this, [this, percentage]() {
            emit progressChanged(percentage);
        }, Qt::QueuedConnection);
    };

    callbacks.on_done = [this](const seti::AnalysisResult& result) {
        QMetaObject::invokeMethod(this, [this, result]() {
            emit analysisComplete(result);
        }, Qt::QueuedConnection);
    };

    if (!presenter_.startAnalysis(request, std::move(callbacks))) {
        SETI_LOG_WARN("Analysis request for '{}' was rejected", request.input_path);
        return false;
    }
    return true;
}

void AnalysisRunner::cancel() {
    presenter_.cancelAnalysis();
}

bool AnalysisRunner::isRunning() const {
    return presenter_.isAnalysisRunning();
}

} // namespace gui
} // namespace seti
