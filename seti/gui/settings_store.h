/*
 * File:        settings_store.h
 * Module:      seti-gui
 * Purpose:     Application settings file (settings.json)
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#pragma once

#include <QJsonObject>
#include <QString>

/**
 * @brief User-editable application settings
 */
struct AppSettings {
    static constexpr double kDefaultEps = 0.35;
    static constexpr double kMinEps = 0.01;
    static constexpr double kMaxEps = 5.0;
    static constexpr int kDefaultMinSamples = 8;
    static constexpr int kMinMinSamples = 1;
    static constexpr int kMaxMinSamples = 100;

    double dbscanEps = kDefaultEps;
    int dbscanMinSamples = kDefaultMinSamples;
    bool denoise = false;
    bool normalize = false;
    QString resultsPath;        ///< Preview output directory (empty: system temp)
    QString logsPath;           ///< Directory of app.log (empty: data directory)
    QString theme = QStringLiteral("auto");   ///< auto, light or dark

    bool operator==(const AppSettings &other) const;
    bool operator!=(const AppSettings &other) const { return !(*this == other); }
};

/**
 * @brief Reads and writes AppSettings as a flat JSON object
 *
 * Missing keys, wrong types and out-of-range numbers fall back to the
 * defaults; a missing or malformed file loads as all defaults.
 */
class SettingsStore
{
public:
    explicit SettingsStore(const QString &filePath);

    AppSettings load() const;

    /**
     * @return false if the file could not be written
     */
    bool save(const AppSettings &settings) const;

    QString filePath() const;

    static AppSettings fromJson(const QJsonObject &object);
    static QJsonObject toJson(const AppSettings &settings);

private:
    QString filePath_;
};
