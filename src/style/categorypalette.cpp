/*
 * categorypalette.cpp - Category tag colors for card headers
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "categorypalette.h"

static const QColor s_normal{0xA8, 0xA8, 0x78};

CategoryPalette::CategoryPalette()
{
    m_colors = {
        {QStringLiteral("Normal"),   s_normal},
        {QStringLiteral("Fire"),     QColor(0xF0, 0x80, 0x30)},
        {QStringLiteral("Water"),    QColor(0x68, 0x90, 0xF0)},
        {QStringLiteral("Electric"), QColor(0xF8, 0xD0, 0x30)},
        {QStringLiteral("Grass"),    QColor(0x78, 0xC8, 0x50)},
        {QStringLiteral("Ice"),      QColor(0x98, 0xD8, 0xD8)},
        {QStringLiteral("Fighting"), QColor(0xC0, 0x30, 0x28)},
        {QStringLiteral("Poison"),   QColor(0xA0, 0x40, 0xA0)},
        {QStringLiteral("Ground"),   QColor(0xE0, 0xC0, 0x68)},
        {QStringLiteral("Flying"),   QColor(0xA8, 0x90, 0xF0)},
        {QStringLiteral("Psychic"),  QColor(0xF8, 0x58, 0x88)},
        {QStringLiteral("Bug"),      QColor(0xA8, 0xB8, 0x20)},
        {QStringLiteral("Rock"),     QColor(0xB8, 0xA0, 0x38)},
        {QStringLiteral("Ghost"),    QColor(0x70, 0x58, 0x98)},
        {QStringLiteral("Dragon"),   QColor(0x70, 0x38, 0xF8)},
        {QStringLiteral("Dark"),     QColor(0x70, 0x58, 0x48)},
        {QStringLiteral("Steel"),    QColor(0xB8, 0xB8, 0xD0)},
        {QStringLiteral("Fairy"),    QColor(0xEE, 0x99, 0xAC)},
    };
}

const QColor &CategoryPalette::fallbackColor()
{
    return s_normal;
}

QColor CategoryPalette::color(const QString &category) const
{
    auto it = m_colors.constFind(category);
    return (it != m_colors.constEnd()) ? it.value() : s_normal;
}

QColor CategoryPalette::darken(const QColor &color, qreal factor)
{
    return QColor(static_cast<int>(color.red() * factor),
                  static_cast<int>(color.green() * factor),
                  static_cast<int>(color.blue() * factor));
}
