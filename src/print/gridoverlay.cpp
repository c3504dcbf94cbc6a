/*
 * gridoverlay.cpp - Cutting guides and footer for card grid pages
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "gridoverlay.h"
#include "pagelayout.h"

#include <QFontMetricsF>
#include <QPainter>
#include <QPen>

namespace GridOverlay {

static const QColor s_guideColor(0x9C, 0x9C, 0x9C);
static const QColor s_footerColor(0xAA, 0xAA, 0xAA);

void drawCuttingGuides(QPainter *painter, const PageLayout &layout)
{
    painter->save();

    QPen pen(s_guideColor);
    pen.setWidthF(PageLayout::kGuideWidth);
    // Dash pattern entries are in units of the pen width
    const qreal dash = PageLayout::kGuideDash / PageLayout::kGuideWidth;
    pen.setDashPattern({dash, dash});
    pen.setCapStyle(Qt::FlatCap);
    painter->setPen(pen);

    const QList<QLineF> guides = layout.cuttingGuides();
    for (const QLineF &line : guides)
        painter->drawLine(line);

    painter->restore();
}

void drawFooter(QPainter *painter, const PageLayout &layout, const QFont &font,
                const QString &caption)
{
    const QString text = caption.trimmed();
    if (text.isEmpty())
        return;

    const QSizeF page = layout.pageSizePoints();
    QFont footerFont = font;
    footerFont.setPointSizeF(PageLayout::kFooterFontSize);
    const qreal width = QFontMetricsF(footerFont, painter->device()).horizontalAdvance(text);

    painter->save();
    painter->setFont(footerFont);
    painter->setPen(s_footerColor);
    painter->drawText(QPointF((page.width() - width) / 2.0,
                              page.height() - PageLayout::kFooterBaseline),
                      text);
    painter->restore();
}

} // namespace GridOverlay
