/*
 * File:        theme_manager.h
 * Module:      seti-gui
 * Purpose:     Applies the light/dark/auto theme choice
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#pragma once

#include <QApplication>
#include <QPalette>
#include <QString>

/**
 * Theme choice of the GUI. The value comes from the "theme" key of
 * settings.json or from --theme on the command line. Unknown values
 * fall back to Auto.
 */
class ThemeManager
{
public:
    enum class Mode {
        Auto,
        Light,
        Dark,
    };

    struct Resolution {
        Qt::ColorScheme scheme;
        QString source;
    };

    /**
     * @param value "auto", "light" or "dark" (case-insensitive)
     * @param origin Where the value came from, for logging
     */
    ThemeManager(const QString &value, const QString &origin);

    bool hadInvalidMode() const { return !invalidValue_.isEmpty(); }
    QString invalidMode() const { return invalidValue_; }
    Mode mode() const { return mode_; }
    QString modeName() const;

    /**
     * @brief Install the palette for an explicit mode and report the result
     *
     * Auto keeps the platform palette and reports the scheme the platform
     * uses.
     */
    Resolution apply(QApplication &app) const;

    static QString colorSchemeToString(Qt::ColorScheme scheme);

private:
    Resolution detectPlatformScheme(const QApplication &app) const;
    static QPalette darkPalette();

    Mode mode_ = Mode::Auto;
    QString origin_;
    QString invalidValue_;
};
