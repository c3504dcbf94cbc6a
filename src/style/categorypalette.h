/*
 * categorypalette.h - Category tag colors for card headers
 *
 * Maps an English category tag ("Fire", "Water", ...) to its header
 * color.  Unknown tags fall back to the "Normal" color.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef CARDBINDER_CATEGORYPALETTE_H
#define CARDBINDER_CATEGORYPALETTE_H

#include <QColor>
#include <QHash>
#include <QString>

class CategoryPalette
{
public:
    CategoryPalette();

    QColor color(const QString &category) const;
    bool contains(const QString &category) const { return m_colors.contains(category); }

    // Channel-wise scale, truncated toward zero (0.6 gives the footer index color).
    static QColor darken(const QColor &color, qreal factor);

    static const QColor &fallbackColor();

private:
    QHash<QString, QColor> m_colors;
};

#endif // CARDBINDER_CATEGORYPALETTE_H
