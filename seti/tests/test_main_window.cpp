/******************************************************************************
 * test_main_window.cpp
 *
 * Unit tests for the main window results display
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 ******************************************************************************/

#include "mainwindow.h"
#include <QApplication>
#include <QDir>
#include <QElapsedTimer>
#include <QLabel>
#include <QLineEdit>
#include <QPushButton>
#include <QStandardPaths>
#include <QTableWidget>
#include <QTemporaryDir>
#include <QTextEdit>
#include <QThread>
#include <cassert>
#include <functional>
#include <iostream>

namespace {

bool wait_for(const std::function<bool()>& condition, int timeout_ms) {
    QElapsedTimer timer;
    timer.start();
    while (!condition()) {
        if (timer.elapsed() > timeout_ms) {
            return false;
        }
        QCoreApplication::processEvents(QEventLoop::AllEvents, 50);
        QThread::msleep(10);
    }
    return true;
}

template <typename T>
T* child(MainWindow& window, const char* name) {
    T* widget = window.findChild<T*>(QString::fromLatin1(name));
    assert(widget);
    return widget;
}

} // anonymous namespace

void test_new_run_clears_previous_results() {
    QTemporaryDir data;
    assert(data.isValid());

    AppSettings settings;
    settings.resultsPath = QDir(data.path()).filePath("results");
    MainWindow window(data.path(), settings);

    auto *input = child<QLineEdit>(window, "inputEdit");
    auto *run = child<QPushButton>(window, "runButton");
    auto *metadata = child<QTextEdit>(window, "metadataView");
    auto *windows = child<QTableWidget>(window, "windowsTable");
    auto *candidates = child<QTableWidget>(window, "candidatesTable");
    auto *waterfall = child<QLabel>(window, "waterfallView");
    auto *activity = child<QLabel>(window, "activityView");
    auto *window_preview = child<QLabel>(window, "windowPreview");
    auto *candidate_preview = child<QLabel>(window, "candidatePreview");

    // First run fills the results tab
    input->setText("sample.dat");
    assert(QMetaObject::invokeMethod(&window, "onRunAnalysis", Qt::DirectConnection));
    assert(!run->isEnabled());
    assert(wait_for([run] { return run->isEnabled(); }, 30000));

    assert(metadata->toPlainText().contains("Name: sample.dat"));
    assert(windows->rowCount() == 5);
    assert(candidates->rowCount() == 8);
    assert(!waterfall->pixmap().isNull());
    assert(!candidate_preview->pixmap().isNull());

    // Starting the next run drops them before any new data arrives
    input->setText("other.dat");
    assert(QMetaObject::invokeMethod(&window, "onRunAnalysis", Qt::DirectConnection));
    assert(!run->isEnabled());

    assert(metadata->toPlainText().isEmpty());
    assert(windows->rowCount() == 0);
    assert(candidates->rowCount() == 0);
    assert(waterfall->pixmap().isNull());
    assert(waterfall->text() == "No waterfall preview");
    assert(activity->text() == "No activity map");
    assert(window_preview->text() == "No window preview");
    assert(candidate_preview->text() == "No candidate preview");

    // A cancelled run leaves the results tab empty
    assert(QMetaObject::invokeMethod(&window, "onCancelAnalysis", Qt::DirectConnection));
    assert(wait_for([run] { return run->isEnabled(); }, 30000));
    assert(metadata->toPlainText().isEmpty());
    assert(windows->rowCount() == 0);
    assert(waterfall->text() == "No waterfall preview");

    std::cout << "test_new_run_clears_previous_results: PASSED\n";
}

int main(int argc, char *argv[]) {
    qputenv("QT_QPA_PLATFORM", "offscreen");
    QStandardPaths::setTestModeEnabled(true);
    QApplication app(argc, argv);
    app.setOrganizationName("seti-analyzer-tests");

    std::cout << "Running main window tests...\n\n";

    test_new_run_clears_previous_results();

    std::cout << "\nAll main window tests passed!\n";
    return 0;
}
