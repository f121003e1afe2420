/*
 * File:        recent_files_store.cpp
 * Module:      seti-gui
 * Purpose:     Persistent most-recent-first list of analyzed files
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#include "recent_files_store.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QSaveFile>

RecentFilesStore::RecentFilesStore(const QString &filePath)
    : filePath_(filePath)
{
}

void RecentFilesStore::load()
{
    entries_.clear();

    QFile file(filePath_);
    if (!file.exists()) {
        return;
    }
    if (!file.open(QIODevice::ReadOnly)) {
        qWarning("Could not read recent files from %s", qPrintable(filePath_));
        return;
    }

    entries_ = parse(file.readAll());
}

bool RecentFilesStore::save() const
{
    QDir().mkpath(QFileInfo(filePath_).absolutePath());

    QSaveFile file(filePath_);
    if (!file.open(QIODevice::WriteOnly)) {
        qWarning("Could not write recent files to %s", qPrintable(filePath_));
        return false;
    }

    const QJsonDocument doc(QJsonArray::fromStringList(entries_));
    file.write(doc.toJson(QJsonDocument::Indented));
    return file.commit();
}

bool RecentFilesStore::add(const QString &path)
{
    entries_ = insertPath(entries_, path);
    return save();
}

QStringList RecentFilesStore::entries() const
{
    return entries_;
}

QString RecentFilesStore::filePath() const
{
    return filePath_;
}

QStringList RecentFilesStore::insertPath(QStringList list, const QString &path)
{
    if (path.isEmpty()) {
        return list;
    }
    list.removeAll(path);
    list.prepend(path);
    while (list.size() > kMaxEntries) {
        list.removeLast();
    }
    return list;
}

QStringList RecentFilesStore::parse(const QByteArray &json)
{
    QJsonParseError error;
    const QJsonDocument doc = QJsonDocument::fromJson(json, &error);
    if (error.error != QJsonParseError::NoError || !doc.isArray()) {
        return {};
    }

    QStringList entries;
    const QJsonArray array = doc.array();
    for (const QJsonValue &value : array) {
        if (!value.isString()) {
            continue;
        }
        const QString path = value.toString();
        if (path.isEmpty() || entries.contains(path)) {
            continue;
        }
        entries.append(path);
        if (entries.size() == kMaxEntries) {
            break;
        }
    }
    return entries;
}
