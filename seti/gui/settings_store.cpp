/*
 * File:        settings_store.cpp
 * Module:      seti-gui
 * Purpose:     Application settings file (settings.json)
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#include "settings_store.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QJsonValue>
#include <QSaveFile>

#include <cmath>

bool AppSettings::operator==(const AppSettings &other) const
{
    return std::abs(dbscanEps - other.dbscanEps) < 1e-9
        && dbscanMinSamples == other.dbscanMinSamples
        && denoise == other.denoise
        && normalize == other.normalize
        && resultsPath == other.resultsPath
        && logsPath == other.logsPath
        && theme == other.theme;
}

SettingsStore::SettingsStore(const QString &filePath)
    : filePath_(filePath)
{
}

AppSettings SettingsStore::load() const
{
    QFile file(filePath_);
    if (!file.exists()) {
        return AppSettings {};
    }
    if (!file.open(QIODevice::ReadOnly)) {
        qWarning("Could not read settings from %s", qPrintable(filePath_));
        return AppSettings {};
    }

    QJsonParseError error;
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &error);
    if (error.error != QJsonParseError::NoError || !doc.isObject()) {
        qWarning("Ignoring malformed settings file %s: %s",
                 qPrintable(filePath_), qPrintable(error.errorString()));
        return AppSettings {};
    }

    return fromJson(doc.object());
}

bool SettingsStore::save(const AppSettings &settings) const
{
    QDir().mkpath(QFileInfo(filePath_).absolutePath());

    QSaveFile file(filePath_);
    if (!file.open(QIODevice::WriteOnly)) {
        qWarning("Could not write settings to %s", qPrintable(filePath_));
        return false;
    }

    file.write(QJsonDocument(toJson(settings)).toJson(QJsonDocument::Indented));
    return file.commit();
}

QString SettingsStore::filePath() const
{
    return filePath_;
}

AppSettings SettingsStore::fromJson(const QJsonObject &object)
{
    AppSettings settings;

    const QJsonValue eps = object.value("dbscan_eps");
    if (eps.isDouble()) {
        const double value = eps.toDouble();
        if (value >= AppSettings::kMinEps && value <= AppSettings::kMaxEps) {
            settings.dbscanEps = value;
        }
    }

    const QJsonValue minSamples = object.value("dbscan_min_samples");
    if (minSamples.isDouble()) {
        const double value = minSamples.toDouble();
        if (value >= AppSettings::kMinMinSamples && value <= AppSettings::kMaxMinSamples
            && value == std::floor(value)) {
            settings.dbscanMinSamples = static_cast<int>(value);
        }
    }

    if (object.value("denoise").isBool()) {
        settings.denoise = object.value("denoise").toBool();
    }
    if (object.value("normalize").isBool()) {
        settings.normalize = object.value("normalize").toBool();
    }
    if (object.value("results_path").isString()) {
        settings.resultsPath = object.value("results_path").toString();
    }
    if (object.value("logs_path").isString()) {
        settings.logsPath = object.value("logs_path").toString();
    }

    const QString theme = object.value("theme").toString().trimmed().toLower();
    if (theme == "auto" || theme == "light" || theme == "dark") {
        settings.theme = theme;
    }

    return settings;
}

QJsonObject SettingsStore::toJson(const AppSettings &settings)
{
    QJsonObject object;
    object.insert("dbscan_eps", settings.dbscanEps);
    object.insert("dbscan_min_samples", settings.dbscanMinSamples);
    object.insert("denoise", settings.denoise);
    object.insert("normalize", settings.normalize);
    object.insert("results_path", settings.resultsPath);
    object.insert("logs_path", settings.logsPath);
    object.insert("theme", settings.theme);
    return object;
}
