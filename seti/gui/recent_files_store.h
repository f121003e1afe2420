/*
 * File:        recent_files_store.h
 * Module:      seti-gui
 * Purpose:     Persistent most-recent-first list of analyzed files
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#pragma once

#include <QString>
#include <QStringList>

/**
 * @brief Recent input files, stored as a JSON array of strings
 *
 * At most kMaxEntries paths, most recent first, no duplicates. A missing
 * or malformed file loads as an empty list; non-string entries are
 * skipped.
 */
class RecentFilesStore
{
public:
    static constexpr int kMaxEntries = 10;

    explicit RecentFilesStore(const QString &filePath);

    /**
     * @brief Reload the list from disk
     */
    void load();

    /**
     * @brief Write the list to disk
     * @return false if the file could not be written
     */
    bool save() const;

    /**
     * @brief Move (or insert) a path to the front and save
     * @return false if the file could not be written (the list is still updated)
     */
    bool add(const QString &path);

    QStringList entries() const;
    QString filePath() const;

    /**
     * @brief Insert a path at the front of a list, removing duplicates and
     *        trimming the list to kMaxEntries
     */
    static QStringList insertPath(QStringList list, const QString &path);

    /**
     * @brief Parse the JSON array format
     */
    static QStringList parse(const QByteArray &json);

private:
    QString filePath_;
    QStringList entries_;
};
