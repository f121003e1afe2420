/*
 * File:        mainwindow.h
 * Module:      seti-gui
 * Purpose:     Main application window
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#ifndef MAINWINDOW_H
#define MAINWINDOW_H

#include <QMainWindow>
#include <QString>
#include <memory>
#include <optional>
#include <string>
#include "analysis_presenter.h"
#include "recent_files_store.h"
#include "settings_store.h"

namespace seti::gui {
    class AnalysisRunner;
}

class QCheckBox;
class QComboBox;
class QDoubleSpinBox;
class QLabel;
class QLineEdit;
class QListWidget;
class QListWidgetItem;
class QProgressBar;
class QPushButton;
class QSpinBox;
class QTabWidget;
class QTableWidget;
class QTextEdit;

/**
 * Main window for seti-gui
 *
 * Tabs:
 * - Home (input file, preset, recent files, run button)
 * - Progress (progress bar, current stage, stage log, cancel, log file)
 * - Results (overview, windows, candidates)
 * - Settings
 *
 * Architecture: This window is a thin display client. Analysis runs go
 * through seti::presenters::AnalysisPresenter; run events arrive on the
 * GUI thread via seti::gui::AnalysisRunner.
 */
class MainWindow : public QMainWindow
{
    Q_OBJECT

public:
    /**
     * @param dataDirectory Directory holding settings.json, history.json and logs
     * @param settings Settings loaded at start-up
     */
    MainWindow(const QString& dataDirectory, const AppSettings& settings, QWidget *parent = nullptr);
    ~MainWindow() override;

    /// Directory of the analysis log for the given settings
    static QString logsDirectory(const QString& dataDirectory, const AppSettings& settings);

protected:
    void closeEvent(QCloseEvent *event) override;

private slots:
    void onBrowseInput();
    void onRunAnalysis();
    void onCancelAnalysis();
    void onRecentFileActivated(QListWidgetItem *item);
    void onStageChanged(const QString& stage);
    void onProgressChanged(int percentage);
    void onAnalysisComplete(const seti::AnalysisResult& result);
    void onOpenLogFile();
    void onSaveSettings();
    void onBrowseResultsPath();
    void applyWindowFilter();
    void applyCandidateFilter();

private:
    void setupUI();
    QWidget* createHomeTab();
    QWidget* createProgressTab();
    QWidget* createResultsTab();
    QWidget* createOverviewTab();
    QWidget* createWindowsTab();
    QWidget* createCandidatesTab();
    QWidget* createSettingsTab();

    void saveSettings();
    void restoreSettings();
    void loadSettingsIntoForm();
    void refreshRecentFiles();
    void setRunning(bool running);
    void clearResults();
    void populateResults(const seti::AnalysisResult& result);
    void showPreview(QLabel *label, const std::optional<std::string>& path, const QString& fallback);

    QString data_directory_;
    AppSettings settings_;
    SettingsStore settings_store_;
    RecentFilesStore recent_files_;

    std::unique_ptr<seti::presenters::AnalysisPresenter> presenter_;
    seti::gui::AnalysisRunner *runner_;

    QTabWidget *main_tabs_;
    QTabWidget *results_tabs_;

    // Home
    QLineEdit *input_edit_;
    QComboBox *preset_combo_;
    QListWidget *recent_list_;
    QPushButton *run_button_;
    QLabel *home_status_label_;

    // Progress
    QProgressBar *progress_bar_;
    QLabel *stage_label_;
    QTextEdit *stage_log_;
    QPushButton *cancel_button_;

    // Results
    QTextEdit *metadata_view_;
    QLabel *waterfall_view_;
    QLabel *activity_view_;
    QLineEdit *window_filter_edit_;
    QTableWidget *windows_table_;
    QLabel *window_preview_;
    QLineEdit *candidate_filter_edit_;
    QCheckBox *rfi_only_check_;
    QCheckBox *interesting_only_check_;
    QTableWidget *candidates_table_;
    QLabel *candidate_preview_;

    // Settings
    QDoubleSpinBox *eps_spin_;
    QSpinBox *min_samples_spin_;
    QCheckBox *denoise_check_;
    QCheckBox *normalize_check_;
    QLineEdit *results_path_edit_;
    QLineEdit *logs_path_edit_;
    QComboBox *theme_combo_;
};

#endif // MAINWINDOW_H
