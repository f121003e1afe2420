/*
 * File:        main.cpp
 * Module:      seti-gui
 * Purpose:     Application entry point
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#include "mainwindow.h"
#include "core_logging.h"
#include "logging.h"
#include "settings_store.h"
#include "theme_manager.h"
#include "version.h"
#include <QApplication>
#include <QCommandLineParser>
#include <QDir>
#include <QStandardPaths>

namespace {

const char* kLogPattern = "[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v";

} // anonymous namespace

// Qt message handler that bridges to spdlog
void qtMessageHandler(QtMsgType type, const QMessageLogContext& /*context*/, const QString& msg)
{
    switch (type) {
    case QtDebugMsg:
        SETI_LOG_DEBUG("[Qt] {}", msg.toStdString());
        break;
    case QtInfoMsg:
        SETI_LOG_INFO("[Qt] {}", msg.toStdString());
        break;
    case QtWarningMsg:
        SETI_LOG_WARN("[Qt] {}", msg.toStdString());
        break;
    case QtCriticalMsg:
        SETI_LOG_ERROR("[Qt] {}", msg.toStdString());
        break;
    case QtFatalMsg:
        SETI_LOG_CRITICAL("[Qt] {}", msg.toStdString());
        break;
    }
}

int main(int argc, char *argv[])
{
    QApplication app(argc, argv);

    app.setApplicationName("seti-gui");
    app.setApplicationVersion(SETI_VERSION);
    app.setOrganizationName("seti-analyzer");

    // Command-line argument parsing
    QCommandLineParser parser;
    parser.setApplicationDescription("SETI Analyzer - radio signal analysis GUI");
    parser.addHelpOption();
    parser.addVersionOption();

    QCommandLineOption logLevelOption(
        "log-level",
        "Set logging verbosity (trace, debug, info, warn, error, critical, off)",
        "level",
        "info"
    );
    parser.addOption(logLevelOption);

    QCommandLineOption logFileOption(
        "log-file",
        "Write logs to specified file (in addition to console)",
        "filename"
    );
    parser.addOption(logFileOption);

    QCommandLineOption themeOption(
        "theme",
        "Colour theme (auto, light, dark); overrides the saved setting",
        "mode"
    );
    parser.addOption(themeOption);

    parser.process(app);

    // Initialize logging system
    const std::string logLevel = parser.value(logLevelOption).toStdString();
    const std::string logFile = parser.value(logFileOption).toStdString();

    seti::presenters::initCoreLogging(logLevel, kLogPattern, logFile);
    seti::init_gui_logging(logLevel);

    // Install Qt message handler to bridge Qt messages to spdlog
    qInstallMessageHandler(qtMessageHandler);

    SETI_LOG_INFO("seti-gui {} starting", SETI_VERSION);

    const QString dataDirectory = QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
    if (!QDir().mkpath(dataDirectory)) {
        SETI_LOG_WARN("Could not create data directory {}", dataDirectory.toStdString());
    }

    SettingsStore settingsStore(QDir(dataDirectory).filePath("settings.json"));
    const AppSettings settings = settingsStore.load();

    // Theme: command line wins over the saved setting
    const bool themeFromCli = parser.isSet(themeOption);
    ThemeManager theme(themeFromCli ? parser.value(themeOption) : settings.theme,
                       themeFromCli ? QStringLiteral("command line") : QStringLiteral("settings"));
    if (theme.hadInvalidMode()) {
        SETI_LOG_WARN("Unknown theme '{}', using auto", theme.invalidMode().toStdString());
    }
    const ThemeManager::Resolution resolution = theme.apply(app);
    SETI_LOG_DEBUG("Theme {} resolved to {} ({})",
                   theme.modeName().toStdString(),
                   ThemeManager::colorSchemeToString(resolution.scheme).toStdString(),
                   resolution.source.toStdString());

    MainWindow window(dataDirectory, settings);
    window.show();
    SETI_LOG_DEBUG("Main window shown, entering event loop");

    int result = app.exec();
    SETI_LOG_INFO("seti-gui exiting");
    return result;
}
