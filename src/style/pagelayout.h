/*
 * pagelayout.h - Card grid geometry for binder pages
 *
 * All lengths are stored in millimetres and returned in points
 * (72 dpi, origin at the top-left of the page).
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef CARDBINDER_PAGELAYOUT_H
#define CARDBINDER_PAGELAYOUT_H

#include <QLineF>
#include <QList>
#include <QPageSize>
#include <QRectF>
#include <QSizeF>

struct PageLayout
{
    QPageSize::PageSizeId pageSizeId = QPageSize::A4;

    qreal cellWidth = 63.5;   // mm
    qreal cellHeight = 88.9;  // mm
    int columns = 3;
    int rows = 3;
    qreal gap = 5.0;          // mm, both axes
    qreal margin = 4.75;      // mm, left and top

    // Footer and guide styling (points)
    static constexpr qreal kFooterBaseline = 8.0;  // above the bottom edge
    static constexpr qreal kFooterFontSize = 6.0;
    static constexpr qreal kGuideWidth = 0.5;
    static constexpr qreal kGuideDash = 2.0;       // dash and space length

    int capacity() const { return columns * rows; }

    QSizeF pageSizePoints() const;
    QSizeF cellSizePoints() const;

    // Rectangle of the index-th cell on a page (row-major).
    QRectF cellRect(int index) const;

    // True when the next card (after placedCount cards) needs a fresh page.
    bool startsNewPage(int placedCount) const;

    int gridPageCount(int cardCount) const;
    int cellsOnPage(int cardCount, int page) const;

    // Dashed guides through the middle of every gap, outer frame included.
    QList<QLineF> cuttingGuides() const;
};

#endif // CARDBINDER_PAGELAYOUT_H
