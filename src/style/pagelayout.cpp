/*
 * pagelayout.cpp - Card grid geometry for binder pages
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "pagelayout.h"
#include "units.h"

using Units::mm;

QSizeF PageLayout::pageSizePoints() const
{
    return QPageSize(pageSizeId).size(QPageSize::Point);
}

QSizeF PageLayout::cellSizePoints() const
{
    return QSizeF(mm(cellWidth), mm(cellHeight));
}

QRectF PageLayout::cellRect(int index) const
{
    const int col = index % columns;
    const int row = index / columns;
    return QRectF(mm(margin + col * (cellWidth + gap)),
                  mm(margin + row * (cellHeight + gap)),
                  mm(cellWidth), mm(cellHeight));
}

bool PageLayout::startsNewPage(int placedCount) const
{
    return placedCount > 0 && placedCount % capacity() == 0;
}

int PageLayout::gridPageCount(int cardCount) const
{
    if (cardCount <= 0)
        return 0;
    return (cardCount + capacity() - 1) / capacity();
}

int PageLayout::cellsOnPage(int cardCount, int page) const
{
    const int pages = gridPageCount(cardCount);
    if (page < 0 || page >= pages)
        return 0;
    if (page < pages - 1)
        return capacity();
    const int rest = cardCount % capacity();
    return rest == 0 ? capacity() : rest;
}

QList<QLineF> PageLayout::cuttingGuides() const
{
    QList<QLineF> lines;

    const qreal left = margin - gap / 2.0;
    const qreal top = margin - gap / 2.0;
    const qreal right = margin + columns * cellWidth + (columns - 1) * gap + gap / 2.0;
    const qreal bottom = margin + rows * cellHeight + (rows - 1) * gap + gap / 2.0;

    for (int col = 0; col <= columns; ++col) {
        const qreal x = margin + col * cellWidth + (col - 0.5) * gap;
        lines.append(QLineF(mm(x), mm(top), mm(x), mm(bottom)));
    }
    for (int row = 0; row <= rows; ++row) {
        const qreal y = margin + row * cellHeight + (row - 0.5) * gap;
        lines.append(QLineF(mm(left), mm(y), mm(right), mm(y)));
    }
    return lines;
}
