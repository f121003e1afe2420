/*
 * File:        analysis_runner.h
 * Module:      seti-gui
 * Purpose:     Delivers analysis run events on the GUI thread
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#ifndef SETI_GUI_ANALYSIS_RUNNER_H
#define SETI_GUI_ANALYSIS_RUNNER_H

#include "analysis_presenter.h"
#include <seti_analysis.h>
#include <QObject>
#include <QString>

namespace seti {
namespace gui {

/**
 * @brief Qt bridge for AnalysisPresenter runs
 *
 * Presenter callbacks arrive on the worker thread; each one is re-posted
 * to this object's thread with a queued invocation, so signals are
 * emitted on the GUI thread in the order the worker produced them.
 */
class AnalysisRunner : public QObject {
    Q_OBJECT

public:
    explicit AnalysisRunner(seti::presenters::AnalysisPresenter& presenter,
                            QObject* parent = nullptr);

    /**
     * @return false if the presenter rejected the request
     */
    bool start(const seti::AnalysisRequest& request);
    void cancel();
    bool isRunning() const;

signals:
    void stageChanged(const QString& stage);
    void progressChanged(int percentage);
    void analysisComplete(const seti::AnalysisResult& result);

private:
    seti::presenters::AnalysisPresenter& presenter_;
};

} // namespace gui
} // namespace seti

#endif // SETI_GUI_ANALYSIS_RUNNER_H
