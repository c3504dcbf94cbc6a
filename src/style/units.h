/*
 * units.h - Length conversion for the 72 dpi page coordinate system
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef CARDBINDER_UNITS_H
#define CARDBINDER_UNITS_H

#include <QtGlobal>

namespace Units {

// 1 point = 1/72 inch = 0.3528 mm
constexpr qreal kMmToPt = 72.0 / 25.4;

constexpr qreal mm(qreal millimetres)
{
    return millimetres * kMmToPt;
}

} // namespace Units

#endif // CARDBINDER_UNITS_H
