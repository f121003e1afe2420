/*
 * File:        theme_manager.cpp
 * Module:      seti-gui
 * Purpose:     Applies the light/dark/auto theme choice
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#include "theme_manager.h"

#include <QStyle>
#include <QStyleFactory>
#include <QStyleHints>

namespace {

struct ModeName {
    ThemeManager::Mode mode;
    const char *name;
};

constexpr ModeName kModeNames[] = {
    { ThemeManager::Mode::Auto, "auto" },
    { ThemeManager::Mode::Light, "light" },
    { ThemeManager::Mode::Dark, "dark" },
};

} // anonymous namespace

ThemeManager::ThemeManager(const QString &value, const QString &origin)
    : origin_(origin)
{
    const QString key = value.trimmed().toLower();
    if (key.isEmpty()) {
        return;
    }

    for (const auto &entry : kModeNames) {
        if (key == QLatin1String(entry.name)) {
            mode_ = entry.mode;
            return;
        }
    }
    invalidValue_ = value;
}

QString ThemeManager::modeName() const
{
    for (const auto &entry : kModeNames) {
        if (entry.mode == mode_) {
            return QString::fromLatin1(entry.name);
        }
    }
    return QStringLiteral("auto");
}

ThemeManager::Resolution ThemeManager::apply(QApplication &app) const
{
    if (mode_ == Mode::Auto) {
        return detectPlatformScheme(app);
    }

    // Native styles on some platforms ignore the application palette
    if (QStyle *fusion = QStyleFactory::create(QStringLiteral("Fusion"))) {
        app.setStyle(fusion);
    }

    if (mode_ == Mode::Dark) {
        app.setPalette(darkPalette());
        return Resolution { Qt::ColorScheme::Dark, origin_ };
    }

    app.setPalette(app.style()->standardPalette());
    return Resolution { Qt::ColorScheme::Light, origin_ };
}

ThemeManager::Resolution ThemeManager::detectPlatformScheme(const QApplication &app) const
{
    const QStyleHints *hints = app.styleHints();
    if (hints && hints->colorScheme() != Qt::ColorScheme::Unknown) {
        return Resolution { hints->colorScheme(), QStringLiteral("platform style hints") };
    }

    // No hint from the platform: a window lighter than its text is light
    const QPalette palette = app.palette();
    const bool dark = palette.color(QPalette::Window).lightness()
                      < palette.color(QPalette::WindowText).lightness();
    return Resolution { dark ? Qt::ColorScheme::Dark : Qt::ColorScheme::Light,
                        QStringLiteral("platform palette") };
}

QString ThemeManager::colorSchemeToString(Qt::ColorScheme scheme)
{
    if (scheme == Qt::ColorScheme::Dark) {
        return QStringLiteral("dark");
    }
    if (scheme == Qt::ColorScheme::Light) {
        return QStringLiteral("light");
    }
    return QStringLiteral("unknown");
}

QPalette ThemeManager::darkPalette()
{
    QPalette palette;
    const QColor base(37, 37, 38);
    const QColor window(45, 45, 48);
    const QColor text(220, 220, 220);
    const QColor disabledText(127, 127, 127);
    const QColor highlight(42, 130, 218);

    palette.setColor(QPalette::Window, window);
    palette.setColor(QPalette::WindowText, text);
    palette.setColor(QPalette::Base, base);
    palette.setColor(QPalette::AlternateBase, window);
    palette.setColor(QPalette::ToolTipBase, window);
    palette.setColor(QPalette::ToolTipText, text);
    palette.setColor(QPalette::Text, text);
    palette.setColor(QPalette::Button, window);
    palette.setColor(QPalette::ButtonText, text);
    palette.setColor(QPalette::BrightText, Qt::red);
    palette.setColor(QPalette::Link, highlight);
    palette.setColor(QPalette::Highlight, highlight);
    palette.setColor(QPalette::HighlightedText, Qt::black);
    palette.setColor(QPalette::PlaceholderText, disabledText);
    palette.setColor(QPalette::Disabled, QPalette::Text, disabledText);
    palette.setColor(QPalette::Disabled, QPalette::ButtonText, disabledText);
    palette.setColor(QPalette::Disabled, QPalette::WindowText, disabledText);
    return palette;
}
