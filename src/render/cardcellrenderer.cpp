/*
 * cardcellrenderer.cpp - One card cell on a grid page
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "cardcellrenderer.h"
#include "assetcache.h"
#include "fontregistry.h"
#include "rendercontext.h"
#include "stringtable.h"
#include "tokencompositor.h"
#include "units.h"
#include "variantname.h"

#include <QDebug>
#include <QFontMetricsF>
#include <QPainter>

using Units::mm;

namespace {
constexpr qreal kHeaderHeight = 12.0;   // mm
constexpr qreal kIndexLift = 4.0;       // mm, index baseline above the bottom
constexpr qreal kImagePadding = 2.0;    // mm
constexpr qreal kTypeInset = 3.0;       // pt from the right edge
constexpr qreal kTypeBaseline = 6.0;    // pt above the header bottom
constexpr qreal kNameBaseline = 11.0;   // pt above the header bottom
constexpr qreal kEnglishBaseline = 3.0; // pt above the header bottom

constexpr qreal kNameSize = 8.0;
constexpr qreal kTypeSize = 5.0;
constexpr qreal kIndexSize = 16.0;
constexpr qreal kEnglishSize = 4.0;

const QColor kBorderColor(0xCC, 0xCC, 0xCC);
const QColor kTypeColor(0x5D, 0x5D, 0x5D);
const QColor kNameColor(0x2D, 0x2D, 0x2D);
const QColor kEnglishColor(0x99, 0x99, 0x99);
} // namespace

CardCellRenderer::CardCellRenderer(const RenderContext &context)
    : m_context(context)
{
}

QRectF CardCellRenderer::headerRect(const QRectF &cell)
{
    return QRectF(cell.left(), cell.top(), cell.width(), mm(kHeaderHeight));
}

QRectF CardCellRenderer::artworkBox(const QRectF &cell)
{
    const qreal imageHeight = cell.height() - mm(kHeaderHeight) - mm(kIndexLift);
    const qreal padding = mm(kImagePadding);
    const qreal boxWidth = (cell.width() - 2 * padding) / 2.0;
    const qreal boxHeight = (imageHeight - 2 * padding) / 2.0;

    const qreal left = cell.left() + (cell.width() - boxWidth) / 2.0;
    const qreal bottom = cell.bottom() - (imageHeight - boxHeight) / 2.0 - padding;
    return QRectF(left, bottom - boxHeight, boxWidth, boxHeight);
}

QString CardCellRenderer::displayName(const Binder::CardRecord &record,
                                      const Binder::Section &section) const
{
    return FontRegistry::substituteSymbols(
        VariantName::compose(record, section, m_context.language), m_context.language);
}

bool CardCellRenderer::render(QPainter *painter, const Binder::CardRecord &record,
                              const Binder::Section &section, const QRectF &cell)
{
    m_errorString.clear();
    if (record.types.isEmpty()) {
        m_errorString = QStringLiteral("Card #%1 has no category tags (language %2)")
                            .arg(record.displayId, m_context.language);
        qWarning() << "CardCellRenderer:" << m_errorString;
        return false;
    }

    const QString primary = record.primaryType();
    const QColor headerColor = m_context.palette.color(primary);
    const QRectF header = headerRect(cell);
    const qreal headerBottom = header.bottom();
    const qreal centerX = cell.center().x();

    painter->save();
    painter->setPen(Qt::NoPen);

    // Header band, 10% of the category color
    QColor tint = headerColor;
    tint.setAlphaF(0.1);
    painter->fillRect(header, tint);

    // Category label, right-aligned
    const QString typeLabel = m_context.strings
        ? m_context.strings->typeName(primary, m_context.language) : primary;
    const QFont typeFont = RenderContext::sized(m_context.regular, kTypeSize);
    const QFontMetricsF typeMetrics(typeFont, painter->device());
    painter->setFont(typeFont);
    painter->setPen(kTypeColor);
    painter->drawText(QPointF(cell.right() - kTypeInset - typeMetrics.horizontalAdvance(typeLabel),
                              headerBottom - kTypeBaseline),
                      typeLabel);

    // Name, token aware
    const QFont nameFont = RenderContext::sized(m_context.bold, kNameSize);
    painter->setPen(kNameColor);
    const QString name = displayName(record, section);
    if (m_context.compositor) {
        m_context.compositor->draw(painter, name, m_context.language, nameFont,
                                   TokenCompositor::Context::Card,
                                   QPointF(centerX, headerBottom - kNameBaseline));
    } else {
        painter->setFont(nameFont);
        const qreal width = QFontMetricsF(nameFont, painter->device()).horizontalAdvance(name);
        painter->drawText(QPointF(centerX - width / 2.0, headerBottom - kNameBaseline), name);
    }

    // English subtitle for other languages
    const QString localized = record.name(m_context.language);
    if (m_context.language != QLatin1String("en") && !record.englishName.isEmpty()
        && record.englishName != localized) {
        const QFont englishFont = RenderContext::sized(m_context.latinRegular, kEnglishSize);
        const QString english = FontRegistry::substituteSymbols(record.englishName,
                                                                QStringLiteral("en"));
        const qreal width = QFontMetricsF(englishFont, painter->device()).horizontalAdvance(english);
        painter->setFont(englishFont);
        painter->setPen(kEnglishColor);
        painter->drawText(QPointF(centerX - width / 2.0, headerBottom - kEnglishBaseline), english);
    }

    // Footer index in the darkened header color
    const QString index = QLatin1Char('#') + record.displayId;
    const QFont indexFont = RenderContext::sized(m_context.latinBold, kIndexSize);
    const qreal indexWidth = QFontMetricsF(indexFont, painter->device()).horizontalAdvance(index);
    painter->setFont(indexFont);
    painter->setPen(CategoryPalette::darken(headerColor, 0.6));
    painter->drawText(QPointF(centerX - indexWidth / 2.0, cell.bottom() - mm(kIndexLift)), index);

    // Artwork, aspect ratio preserved inside the centered box
    if (m_context.cache && !record.artwork.isEmpty()) {
        const QImage image = m_context.cache->get(record.numericId, record.artwork, SizeClass::Cell);
        if (!image.isNull()) {
            const QRectF box = artworkBox(cell);
            const QSizeF fitted = QSizeF(image.size()).scaled(box.size(), Qt::KeepAspectRatio);
            const QRectF target(box.left() + (box.width() - fitted.width()) / 2.0,
                                box.top() + (box.height() - fitted.height()) / 2.0,
                                fitted.width(), fitted.height());
            painter->setRenderHint(QPainter::SmoothPixmapTransform, true);
            painter->drawImage(target, image);
        } else {
            qDebug() << "CardCellRenderer: No artwork for" << record.displayId;
        }
    }

    // Border last so the header tint does not cover it
    QPen border(kBorderColor);
    border.setWidthF(0.5);
    painter->setPen(border);
    painter->setBrush(Qt::NoBrush);
    painter->drawRect(cell);

    painter->restore();
    return true;
}
