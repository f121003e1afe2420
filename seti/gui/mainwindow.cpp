/*
 * File:        mainwindow.cpp
 * Module:      seti-gui
 * Purpose:     Main application window
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#include "mainwindow.h"
#include "analysis/analysis_runner.h"
#include "logging.h"

#include <QCheckBox>
#include <QCloseEvent>
#include <QComboBox>
#include <QDesktopServices>
#include <QDir>
#include <QDoubleSpinBox>
#include <QFileDialog>
#include <QFileInfo>
#include <QFormLayout>
#include <QGroupBox>
#include <QHBoxLayout>
#include <QHeaderView>
#include <QLabel>
#include <QLineEdit>
#include <QListWidget>
#include <QMessageBox>
#include <QPixmap>
#include <QProgressBar>
#include <QPushButton>
#include <QSettings>
#include <QSpinBox>
#include <QStatusBar>
#include <QTabWidget>
#include <QTableWidget>
#include <QTextEdit>
#include <QUrl>
#include <QVBoxLayout>

namespace {

enum MainTab {
    HomeTab = 0,
    ProgressTab = 1,
    ResultsTab = 2,
    SettingsTab = 3
};

const char *kNoWaterfall = "No waterfall preview";
const char *kNoActivityMap = "No activity map";
const char *kNoWindowPreview = "No window preview";
const char *kNoCandidatePreview = "No candidate preview";

QString defaultResultsDirectory(const QString& dataDirectory)
{
    return QDir(dataDirectory).filePath("results");
}

void fillRow(QTableWidget *table, int row, const QStringList& cells)
{
    for (int column = 0; column < cells.size(); ++column) {
        auto *item = new QTableWidgetItem(cells[column]);
        item->setFlags(item->flags() & ~Qt::ItemIsEditable);
        table->setItem(row, column, item);
    }
}

bool rowContains(const QTableWidget *table, int row, const QString& text)
{
    if (text.isEmpty()) {
        return true;
    }
    for (int column = 0; column < table->columnCount(); ++column) {
        const QTableWidgetItem *item = table->item(row, column);
        if (item && item->text().contains(text, Qt::CaseInsensitive)) {
            return true;
        }
    }
    return false;
}

} // anonymous namespace

MainWindow::MainWindow(const QString& dataDirectory, const AppSettings& settings, QWidget *parent)
    : QMainWindow(parent)
    , data_directory_(dataDirectory)
    , settings_(settings)
    , settings_store_(QDir(dataDirectory).filePath("settings.json"))
    , recent_files_(QDir(dataDirectory).filePath("history.json"))
    , runner_(nullptr)
{
    const QString logsDir = logsDirectory(data_directory_, settings_);
    QDir().mkpath(logsDir);

    seti::presenters::AnalysisPresenterConfig config;
    config.output_directory = (settings_.resultsPath.isEmpty()
        ? defaultResultsDirectory(data_directory_)
        : settings_.resultsPath).toStdString();
    config.log_file = QDir(logsDir).filePath("app.log").toStdString();
    presenter_ = std::make_unique<seti::presenters::AnalysisPresenter>(config);

    runner_ = new seti::gui::AnalysisRunner(*presenter_, this);
    connect(runner_, &seti::gui::AnalysisRunner::stageChanged,
            this, &MainWindow::onStageChanged);
    connect(runner_, &seti::gui::AnalysisRunner::progressChanged,
            this, &MainWindow::onProgressChanged);
    connect(runner_, &seti::gui::AnalysisRunner::analysisComplete,
            this, &MainWindow::onAnalysisComplete);

    recent_files_.load();

    setupUI();
    loadSettingsIntoForm();
    refreshRecentFiles();
    restoreSettings();

    setWindowTitle("SETI Analyzer");
    statusBar()->showMessage("Ready");

    SETI_LOG_DEBUG("Main window created (data directory: {})", data_directory_.toStdString());
}

MainWindow::~MainWindow()
{
    // The worker posts to runner_; make sure it has exited first
    presenter_->cancelAnalysis();
    presenter_->waitForCompletion();
}

QString MainWindow::logsDirectory(const QString& dataDirectory, const AppSettings& settings)
{
    if (!settings.logsPath.isEmpty()) {
        return settings.logsPath;
    }
    return QDir(dataDirectory).filePath("logs");
}

void MainWindow::closeEvent(QCloseEvent *event)
{
    if (presenter_->isAnalysisRunning()) {
        SETI_LOG_INFO("Window closing; cancelling running analysis");
        presenter_->cancelAnalysis();
    }
    saveSettings();
    event->accept();
}

void MainWindow::setupUI()
{
    main_tabs_ = new QTabWidget(this);
    main_tabs_->addTab(createHomeTab(), "Home");
    main_tabs_->addTab(createProgressTab(), "Progress");
    main_tabs_->addTab(createResultsTab(), "Results");
    main_tabs_->addTab(createSettingsTab(), "Settings");
    setCentralWidget(main_tabs_);

    setRunning(false);
}

QWidget* MainWindow::createHomeTab()
{
    auto *tab = new QWidget(this);
    auto *layout = new QVBoxLayout(tab);

    auto *file_layout = new QHBoxLayout();
    input_edit_ = new QLineEdit(tab);
    input_edit_->setObjectName("inputEdit");
    input_edit_->setPlaceholderText("Path of the recording to analyze");
    auto *browse_button = new QPushButton("Browse...", tab);
    connect(browse_button, &QPushButton::clicked, this, &MainWindow::onBrowseInput);
    file_layout->addWidget(new QLabel("Input file:", tab));
    file_layout->addWidget(input_edit_, 1);
    file_layout->addWidget(browse_button);
    layout->addLayout(file_layout);

    auto *preset_layout = new QHBoxLayout();
    preset_combo_ = new QComboBox(tab);
    for (const auto& preset : presenter_->getPresets()) {
        preset_combo_->addItem(QString::fromStdString(preset.name), QString::fromStdString(preset.id));
        preset_combo_->setItemData(preset_combo_->count() - 1,
                                   QString::fromStdString(preset.description), Qt::ToolTipRole);
    }
    preset_layout->addWidget(new QLabel("Analysis preset:", tab));
    preset_layout->addWidget(preset_combo_, 1);
    layout->addLayout(preset_layout);

    layout->addWidget(new QLabel("Recent files:", tab));
    recent_list_ = new QListWidget(tab);
    connect(recent_list_, &QListWidget::itemDoubleClicked, this, &MainWindow::onRecentFileActivated);
    layout->addWidget(recent_list_, 1);

    run_button_ = new QPushButton("Run analysis", tab);
    run_button_->setObjectName("runButton");
    run_button_->setDefault(true);
    connect(run_button_, &QPushButton::clicked, this, &MainWindow::onRunAnalysis);
    layout->addWidget(run_button_);

    home_status_label_ = new QLabel("Ready to run", tab);
    layout->addWidget(home_status_label_);

    return tab;
}

QWidget* MainWindow::createProgressTab()
{
    auto *tab = new QWidget(this);
    auto *layout = new QVBoxLayout(tab);

    layout->addWidget(new QLabel("Progress", tab));
    progress_bar_ = new QProgressBar(tab);
    progress_bar_->setRange(0, 100);
    progress_bar_->setValue(0);
    layout->addWidget(progress_bar_);

    stage_label_ = new QLabel("Waiting for a run...", tab);
    layout->addWidget(stage_label_);

    stage_log_ = new QTextEdit(tab);
    stage_log_->setReadOnly(true);
    layout->addWidget(stage_log_, 1);

    auto *buttons = new QHBoxLayout();
    cancel_button_ = new QPushButton("Cancel", tab);
    connect(cancel_button_, &QPushButton::clicked, this, &MainWindow::onCancelAnalysis);
    auto *log_button = new QPushButton("Open log file", tab);
    connect(log_button, &QPushButton::clicked, this, &MainWindow::onOpenLogFile);
    buttons->addWidget(cancel_button_);
    buttons->addStretch();
    buttons->addWidget(log_button);
    layout->addLayout(buttons);

    return tab;
}

QWidget* MainWindow::createResultsTab()
{
    auto *tab = new QWidget(this);
    auto *layout = new QVBoxLayout(tab);

    results_tabs_ = new QTabWidget(tab);
    results_tabs_->addTab(createOverviewTab(), "Overview");
    results_tabs_->addTab(createWindowsTab(), "Windows");
    results_tabs_->addTab(createCandidatesTab(), "Candidates");
    layout->addWidget(results_tabs_);

    return tab;
}

QWidget* MainWindow::createOverviewTab()
{
    auto *tab = new QWidget(this);
    auto *layout = new QVBoxLayout(tab);

    auto *meta_group = new QGroupBox("Metadata", tab);
    auto *meta_layout = new QVBoxLayout(meta_group);
    metadata_view_ = new QTextEdit(meta_group);
    metadata_view_->setObjectName("metadataView");
    metadata_view_->setReadOnly(true);
    meta_layout->addWidget(metadata_view_);

    auto *waterfall_group = new QGroupBox("Waterfall", tab);
    auto *waterfall_layout = new QVBoxLayout(waterfall_group);
    waterfall_view_ = new QLabel("The waterfall is shown after an analysis", waterfall_group);
    waterfall_view_->setObjectName("waterfallView");
    waterfall_view_->setMinimumHeight(220);
    waterfall_view_->setScaledContents(true);
    waterfall_layout->addWidget(waterfall_view_);

    auto *activity_group = new QGroupBox("Activity map", tab);
    auto *activity_layout = new QVBoxLayout(activity_group);
    activity_view_ = new QLabel("The activity map is shown after an analysis", activity_group);
    activity_view_->setObjectName("activityView");
    activity_view_->setMinimumHeight(220);
    activity_view_->setScaledContents(true);
    activity_layout->addWidget(activity_view_);

    layout->addWidget(meta_group);
    layout->addWidget(waterfall_group);
    layout->addWidget(activity_group);

    return tab;
}

QWidget* MainWindow::createWindowsTab()
{
    auto *tab = new QWidget(this);
    auto *layout = new QVBoxLayout(tab);

    auto *controls = new QHBoxLayout();
    window_filter_edit_ = new QLineEdit(tab);
    window_filter_edit_->setPlaceholderText("Filter windows");
    window_filter_edit_->setClearButtonEnabled(true);
    connect(window_filter_edit_, &QLineEdit::textChanged, this, &MainWindow::applyWindowFilter);
    controls->addWidget(new QLabel("Filter:", tab));
    controls->addWidget(window_filter_edit_, 1);
    layout->addLayout(controls);

    windows_table_ = new QTableWidget(0, 3, tab);
    windows_table_->setObjectName("windowsTable");
    windows_table_->setHorizontalHeaderLabels({"Window", "Score", "Cluster"});
    windows_table_->horizontalHeader()->setStretchLastSection(true);
    windows_table_->setSelectionBehavior(QAbstractItemView::SelectRows);
    layout->addWidget(windows_table_, 1);

    window_preview_ = new QLabel("Window clusters are shown after an analysis", tab);
    window_preview_->setObjectName("windowPreview");
    window_preview_->setMinimumHeight(240);
    window_preview_->setScaledContents(true);
    layout->addWidget(window_preview_);

    return tab;
}

QWidget* MainWindow::createCandidatesTab()
{
    auto *tab = new QWidget(this);
    auto *layout = new QVBoxLayout(tab);

    auto *filters = new QHBoxLayout();
    candidate_filter_edit_ = new QLineEdit(tab);
    candidate_filter_edit_->setPlaceholderText("Search candidates");
    candidate_filter_edit_->setClearButtonEnabled(true);
    rfi_only_check_ = new QCheckBox("RFI only", tab);
    interesting_only_check_ = new QCheckBox("Interesting only", tab);
    filters->addWidget(new QLabel("Search:", tab));
    filters->addWidget(candidate_filter_edit_, 1);
    filters->addWidget(rfi_only_check_);
    filters->addWidget(interesting_only_check_);
    layout->addLayout(filters);

    connect(candidate_filter_edit_, &QLineEdit::textChanged, this, &MainWindow::applyCandidateFilter);

    // The two status toggles are mutually exclusive
    connect(rfi_only_check_, &QCheckBox::toggled, this, [this](bool checked) {
        if (checked) {
            interesting_only_check_->setChecked(false);
        }
        applyCandidateFilter();
    });
    connect(interesting_only_check_, &QCheckBox::toggled, this, [this](bool checked) {
        if (checked) {
            rfi_only_check_->setChecked(false);
        }
        applyCandidateFilter();
    });

    candidates_table_ = new QTableWidget(0, 3, tab);
    candidates_table_->setObjectName("candidatesTable");
    candidates_table_->setHorizontalHeaderLabels({"ID", "Frequency", "Status"});
    candidates_table_->horizontalHeader()->setStretchLastSection(true);
    candidates_table_->setSelectionBehavior(QAbstractItemView::SelectRows);
    layout->addWidget(candidates_table_, 1);

    candidate_preview_ = new QLabel("The candidate spectrum is shown after an analysis", tab);
    candidate_preview_->setObjectName("candidatePreview");
    candidate_preview_->setMinimumHeight(240);
    candidate_preview_->setScaledContents(true);
    layout->addWidget(candidate_preview_);

    return tab;
}

QWidget* MainWindow::createSettingsTab()
{
    auto *tab = new QWidget(this);
    auto *layout = new QVBoxLayout(tab);

    auto *dbscan_group = new QGroupBox("DBSCAN", tab);
    auto *dbscan_layout = new QFormLayout(dbscan_group);
    eps_spin_ = new QDoubleSpinBox(dbscan_group);
    eps_spin_->setRange(AppSettings::kMinEps, AppSettings::kMaxEps);
    eps_spin_->setSingleStep(0.05);
    eps_spin_->setDecimals(2);
    min_samples_spin_ = new QSpinBox(dbscan_group);
    min_samples_spin_->setRange(AppSettings::kMinMinSamples, AppSettings::kMaxMinSamples);
    dbscan_layout->addRow("EPS", eps_spin_);
    dbscan_layout->addRow("Min samples", min_samples_spin_);

    auto *preprocessing_group = new QGroupBox("Preprocessing", tab);
    auto *preprocessing_layout = new QVBoxLayout(preprocessing_group);
    denoise_check_ = new QCheckBox("Denoise", preprocessing_group);
    normalize_check_ = new QCheckBox("Normalize per band", preprocessing_group);
    preprocessing_layout->addWidget(denoise_check_);
    preprocessing_layout->addWidget(normalize_check_);

    auto *paths_group = new QGroupBox("Output locations", tab);
    auto *paths_layout = new QFormLayout(paths_group);
    auto *results_row = new QHBoxLayout();
    results_path_edit_ = new QLineEdit(paths_group);
    results_path_edit_->setPlaceholderText(defaultResultsDirectory(data_directory_));
    auto *results_browse = new QPushButton("Browse...", paths_group);
    connect(results_browse, &QPushButton::clicked, this, &MainWindow::onBrowseResultsPath);
    results_row->addWidget(results_path_edit_, 1);
    results_row->addWidget(results_browse);
    logs_path_edit_ = new QLineEdit(paths_group);
    logs_path_edit_->setPlaceholderText(QDir(data_directory_).filePath("logs"));
    paths_layout->addRow("Results", results_row);
    paths_layout->addRow("Logs", logs_path_edit_);

    auto *theme_group = new QGroupBox("Theme", tab);
    auto *theme_layout = new QVBoxLayout(theme_group);
    theme_combo_ = new QComboBox(theme_group);
    theme_combo_->addItem("System", "auto");
    theme_combo_->addItem("Light", "light");
    theme_combo_->addItem("Dark", "dark");
    theme_layout->addWidget(theme_combo_);

    auto *save_button = new QPushButton("Save settings", tab);
    connect(save_button, &QPushButton::clicked, this, &MainWindow::onSaveSettings);

    layout->addWidget(dbscan_group);
    layout->addWidget(preprocessing_group);
    layout->addWidget(paths_group);
    layout->addWidget(theme_group);
    layout->addStretch();
    layout->addWidget(save_button);

    return tab;
}

void MainWindow::loadSettingsIntoForm()
{
    eps_spin_->setValue(settings_.dbscanEps);
    min_samples_spin_->setValue(settings_.dbscanMinSamples);
    denoise_check_->setChecked(settings_.denoise);
    normalize_check_->setChecked(settings_.normalize);
    results_path_edit_->setText(settings_.resultsPath);
    logs_path_edit_->setText(settings_.logsPath);

    const int theme_index = theme_combo_->findData(settings_.theme);
    theme_combo_->setCurrentIndex(theme_index >= 0 ? theme_index : 0);
}

void MainWindow::saveSettings()
{
    QSettings settings("seti-analyzer", "seti-gui");

    // Save main window geometry and state
    settings.setValue("mainwindow/geometry", saveGeometry());
    settings.setValue("mainwindow/state", saveState());
    settings.setValue("mainwindow/preset", preset_combo_->currentData().toString());
}

void MainWindow::restoreSettings()
{
    QSettings settings("seti-analyzer", "seti-gui");

    // Restore main window geometry and state
    if (settings.contains("mainwindow/geometry")) {
        restoreGeometry(settings.value("mainwindow/geometry").toByteArray());
    } else {
        resize(1200, 800);
    }

    if (settings.contains("mainwindow/state")) {
        restoreState(settings.value("mainwindow/state").toByteArray());
    }

    const int preset_index = preset_combo_->findData(settings.value("mainwindow/preset").toString());
    if (preset_index >= 0) {
        preset_combo_->setCurrentIndex(preset_index);
    }
}

void MainWindow::refreshRecentFiles()
{
    recent_list_->clear();
    recent_list_->addItems(recent_files_.entries());
}

void MainWindow::setRunning(bool running)
{
    run_button_->setEnabled(!running);
    cancel_button_->setEnabled(running);
}

void MainWindow::onBrowseInput()
{
    QString start_dir = QFileInfo(input_edit_->text().trimmed()).absolutePath();
    if (input_edit_->text().trimmed().isEmpty()) {
        start_dir = QDir::homePath();
    }

    const QString path = QFileDialog::getOpenFileName(this, "Select a file to analyze", start_dir);
    if (path.isEmpty()) {
        return;
    }

    input_edit_->setText(path);
    if (!recent_files_.add(path)) {
        SETI_LOG_WARN("Could not save recent files to {}", recent_files_.filePath().toStdString());
    }
    refreshRecentFiles();
}

void MainWindow::onRecentFileActivated(QListWidgetItem *item)
{
    if (item) {
        input_edit_->setText(item->text());
    }
}

void MainWindow::onRunAnalysis()
{
    const QString path = input_edit_->text().trimmed();
    const QString preset = preset_combo_->currentText();

    if (auto error = presenter_->validateRequest(path.toStdString(), preset.toStdString())) {
        QMessageBox::warning(this, "Cannot start analysis", QString::fromStdString(*error));
        return;
    }

    stage_log_->clear();
    progress_bar_->setValue(0);
    stage_label_->setText("Starting...");

    seti::AnalysisRequest request{path.toStdString(), preset.toStdString()};
    if (!runner_->start(request)) {
        QMessageBox::warning(this, "Cannot start analysis", "An analysis is already running.");
        return;
    }

    SETI_LOG_INFO("Analysis started: {} ({})", request.input_path, request.preset);
    // Results of an earlier run must not pass for those of this one
    clearResults();
    setRunning(true);
    home_status_label_->setText(QString("Running analysis: %1").arg(preset));
    statusBar()->showMessage("Analysis running");
    main_tabs_->setCurrentIndex(ProgressTab);

    if (!recent_files_.add(path)) {
        SETI_LOG_WARN("Could not save recent files to {}", recent_files_.filePath().toStdString());
    }
    refreshRecentFiles();
}

void MainWindow::onCancelAnalysis()
{
    if (!runner_->isRunning()) {
        return;
    }
    cancel_button_->setEnabled(false);
    stage_label_->setText("Cancelling...");
    runner_->cancel();
}

void MainWindow::onStageChanged(const QString& stage)
{
    stage_label_->setText(stage);
    stage_log_->append(stage);
    statusBar()->showMessage(stage);
}

void MainWindow::onProgressChanged(int percentage)
{
    progress_bar_->setValue(percentage);
}

void MainWindow::onAnalysisComplete(const seti::AnalysisResult& result)
{
    setRunning(false);

    if (result.failed()) {
        SETI_LOG_WARN("Analysis failed: {}", result.error_message);
        home_status_label_->setText("Analysis failed");
        statusBar()->showMessage("Analysis failed");
        QMessageBox::warning(this, "Analysis failed", QString::fromStdString(result.error_message));
        return;
    }

    if (result.cancelled()) {
        home_status_label_->setText("Analysis cancelled");
        stage_label_->setText("Cancelled");
        statusBar()->showMessage("Analysis cancelled");
        return;
    }

    populateResults(result);
    home_status_label_->setText("Analysis complete");
    statusBar()->showMessage("Analysis complete", 5000);
    main_tabs_->setCurrentIndex(ResultsTab);
}

void MainWindow::clearResults()
{
    metadata_view_->clear();
    windows_table_->setRowCount(0);
    candidates_table_->setRowCount(0);
    showPreview(waterfall_view_, std::nullopt, kNoWaterfall);
    showPreview(activity_view_, std::nullopt, kNoActivityMap);
    showPreview(window_preview_, std::nullopt, kNoWindowPreview);
    showPreview(candidate_preview_, std::nullopt, kNoCandidatePreview);
}

void MainWindow::populateResults(const seti::AnalysisResult& result)
{
    clearResults();

    QStringList lines;
    for (const auto& line : seti::presenters::AnalysisPresenter::formatMetadata(result)) {
        lines << QString::fromStdString(line);
    }
    metadata_view_->setPlainText(lines.join('\n'));

    showPreview(waterfall_view_, result.artifact(seti::ArtifactKind::Waterfall), kNoWaterfall);
    showPreview(activity_view_, result.artifact(seti::ArtifactKind::ActivityMap), kNoActivityMap);
    showPreview(window_preview_, result.artifact(seti::ArtifactKind::WindowPreview), kNoWindowPreview);
    showPreview(candidate_preview_, result.artifact(seti::ArtifactKind::CandidatePreview),
                kNoCandidatePreview);

    windows_table_->setRowCount(static_cast<int>(result.window_scores.size()));
    for (size_t row = 0; row < result.window_scores.size(); ++row) {
        const auto& window = result.window_scores[row];
        fillRow(windows_table_, static_cast<int>(row), {
            QString::fromStdString(window.window_id),
            QString::fromStdString(window.score),
            QString::fromStdString(window.cluster)
        });
    }

    candidates_table_->setRowCount(static_cast<int>(result.candidates.size()));
    for (size_t row = 0; row < result.candidates.size(); ++row) {
        const auto& candidate = result.candidates[row];
        fillRow(candidates_table_, static_cast<int>(row), {
            QString::fromStdString(candidate.id),
            QString::fromStdString(candidate.frequency),
            QString::fromStdString(candidate.status)
        });
    }

    applyWindowFilter();
    applyCandidateFilter();
}

void MainWindow::showPreview(QLabel *label, const std::optional<std::string>& path, const QString& fallback)
{
    if (path) {
        const QString file = QString::fromStdString(*path);
        if (QFileInfo::exists(file)) {
            QPixmap pixmap(file);
            if (!pixmap.isNull()) {
                label->setText(QString());
                label->setPixmap(pixmap);
                return;
            }
        }
        SETI_LOG_DEBUG("Preview {} is not readable", *path);
    }

    label->setPixmap(QPixmap());
    label->setText(fallback);
}

void MainWindow::applyWindowFilter()
{
    const QString text = window_filter_edit_->text().trimmed();
    for (int row = 0; row < windows_table_->rowCount(); ++row) {
        windows_table_->setRowHidden(row, !rowContains(windows_table_, row, text));
    }
}

void MainWindow::applyCandidateFilter()
{
    const QString text = candidate_filter_edit_->text().trimmed();

    QString required_status;
    if (rfi_only_check_->isChecked()) {
        required_status = QString::fromUtf8(seti::kCandidateStatusRfi);
    } else if (interesting_only_check_->isChecked()) {
        required_status = QString::fromUtf8(seti::kCandidateStatusInteresting);
    }

    for (int row = 0; row < candidates_table_->rowCount(); ++row) {
        bool visible = rowContains(candidates_table_, row, text);
        if (visible && !required_status.isEmpty()) {
            const QTableWidgetItem *status = candidates_table_->item(row, 2);
            visible = status && status->text() == required_status;
        }
        candidates_table_->setRowHidden(row, !visible);
    }
}

void MainWindow::onOpenLogFile()
{
    const QString path = QString::fromStdString(presenter_->logFilePath());
    if (path.isEmpty() || !QFileInfo::exists(path)) {
        QMessageBox::information(this, "Log file", "No analysis log has been written yet.");
        return;
    }
    if (!QDesktopServices::openUrl(QUrl::fromLocalFile(path))) {
        SETI_LOG_WARN("Could not open log file {}", path.toStdString());
        QMessageBox::warning(this, "Log file", QString("Could not open %1").arg(path));
    }
}

void MainWindow::onBrowseResultsPath()
{
    const QString dir = QFileDialog::getExistingDirectory(this, "Select results directory",
                                                          results_path_edit_->text());
    if (!dir.isEmpty()) {
        results_path_edit_->setText(dir);
    }
}

void MainWindow::onSaveSettings()
{
    AppSettings updated;
    updated.dbscanEps = eps_spin_->value();
    updated.dbscanMinSamples = min_samples_spin_->value();
    updated.denoise = denoise_check_->isChecked();
    updated.normalize = normalize_check_->isChecked();
    updated.resultsPath = results_path_edit_->text().trimmed();
    updated.logsPath = logs_path_edit_->text().trimmed();
    updated.theme = theme_combo_->currentData().toString();

    if (!settings_store_.save(updated)) {
        QMessageBox::warning(this, "Settings",
                             QString("Could not write %1").arg(settings_store_.filePath()));
        return;
    }

    const bool needs_restart = updated.theme != settings_.theme || updated.logsPath != settings_.logsPath;
    settings_ = updated;

    presenter_->setOutputDirectory((settings_.resultsPath.isEmpty()
        ? defaultResultsDirectory(data_directory_)
        : settings_.resultsPath).toStdString());

    SETI_LOG_INFO("Settings saved to {}", settings_store_.filePath().toStdString());
    statusBar()->showMessage(needs_restart
        ? "Settings saved; theme and log location apply after restart"
        : "Settings saved", 5000);
}
