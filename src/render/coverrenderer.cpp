/*
 * coverrenderer.cpp - Full-page section cover
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "coverrenderer.h"
#include "assetcache.h"
#include "rendercontext.h"
#include "stringtable.h"
#include "units.h"

#include <QDebug>
#include <QFontMetricsF>
#include <QPainter>
#include <QVariantHash>

using Units::mm;
using Context = TokenCompositor::Context;

namespace {
// Vertical positions, measured from the top of the page
constexpr qreal kStripeHeight = 100.0;     // mm
constexpr qreal kBrandBaseline = 30.0;     // mm
constexpr qreal kUnderlineDrop = 8.0;      // pt below the brand baseline
constexpr qreal kUnderlineInset = 40.0;    // mm from each side
constexpr qreal kTitleBaseline = 55.0;     // mm
constexpr qreal kCenteredBaseline = 60.0;  // mm
constexpr qreal kSubtitleBaseline = 65.0;  // mm

// Measured from the bottom of the page
constexpr qreal kRangeBaseline = 110.0;    // mm
constexpr qreal kCountBaseline = 100.0;    // mm
constexpr qreal kRuleY = 95.0;             // mm
constexpr qreal kFeaturedBottom = 10.0;    // mm
constexpr qreal kFooterBaseline = 2.5;     // mm

constexpr qreal kFeaturedWidth = 65.0;     // mm per slot
constexpr qreal kFeaturedHeight = 90.0;    // mm
constexpr qreal kFeaturedScale = 0.72;

constexpr qreal kBrandSize = 42.0;
constexpr qreal kTitleSize = 14.0;
constexpr qreal kSubtitleSize = 18.0;
constexpr qreal kRangeSize = 16.0;
constexpr qreal kCountSize = 14.0;
constexpr qreal kFooterSize = 6.0;

const QColor kRangeColor(0x33, 0x33, 0x33);
const QColor kCountColor(0x66, 0x66, 0x66);
const QColor kFooterColor(0xCC, 0xCC, 0xCC);
} // namespace

CoverRenderer::CoverRenderer(const RenderContext &context, const QSizeF &pageSize)
    : m_context(context)
    , m_pageSize(pageSize)
{
}

QList<Binder::FeaturedArtwork> CoverRenderer::featuredFor(const Binder::Section &section)
{
    QList<Binder::FeaturedArtwork> result;
    for (const Binder::FeaturedArtwork &art : section.featured) {
        if (result.size() == Binder::Section::kMaxFeatured)
            break;
        result.append(art);
    }
    if (!result.isEmpty())
        return result;

    for (int id : section.iconicIds) {
        if (result.size() == Binder::Section::kMaxFeatured)
            break;
        for (const Binder::CardRecord &card : section.cards) {
            if (card.numericId == id && !card.artwork.isEmpty()) {
                result.append({card.numericId, card.artwork, card.englishName});
                break;
            }
        }
    }
    return result;
}

QString CoverRenderer::footerText() const
{
    const QString follow = m_context.strings
        ? m_context.strings->translate(QStringLiteral("cover_follow_cutting"), m_context.language,
                                       {}, QStringLiteral("Follow cutting guides"))
        : QStringLiteral("Follow cutting guides");
    const QString bullet = QStringLiteral(" • ");
    return follow + bullet + m_context.projectName + QStringLiteral(" Project")
         + bullet + m_context.date.toString(QStringLiteral("yyyy-MM-dd"));
}

bool CoverRenderer::render(QPainter *painter, const Binder::Section &section, int cardCount,
                           const QList<Binder::FeaturedArtwork> &featured)
{
    m_errorString.clear();
    if (!painter || !painter->isActive()) {
        m_errorString = QStringLiteral("Cover for section %1: painter is not active")
                            .arg(section.id);
        qWarning() << "CoverRenderer:" << m_errorString;
        return false;
    }

    painter->save();
    painter->fillRect(QRectF(QPointF(0, 0), m_pageSize), Qt::white);

    drawStripe(painter, section);
    drawTitles(painter, section);
    drawCount(painter, section, cardCount);
    drawFeatured(painter, featured);
    drawFooter(painter);

    painter->restore();
    return true;
}

void CoverRenderer::drawCentered(QPainter *painter, const QString &text, const QFont &font,
                                 qreal baseline, Context context)
{
    const QPointF anchor(m_pageSize.width() / 2.0, baseline);
    if (m_context.compositor) {
        m_context.compositor->draw(painter, text, m_context.language, font, context, anchor);
        return;
    }
    const QString run = text.trimmed();
    const qreal width = QFontMetricsF(font, painter->device()).horizontalAdvance(run);
    painter->setFont(font);
    painter->drawText(QPointF(anchor.x() - width / 2.0, baseline), run);
}

void CoverRenderer::drawStripe(QPainter *painter, const Binder::Section &section)
{
    const QRectF stripe(0, 0, m_pageSize.width(), mm(kStripeHeight));
    painter->fillRect(stripe, section.color);
    painter->fillRect(stripe, QColor(0, 0, 0, qRound(255 * 0.05)));

    const QFont brandFont = RenderContext::sized(m_context.latinBold, kBrandSize);
    const qreal brandBaseline = mm(kBrandBaseline);
    const qreal width = QFontMetricsF(brandFont, painter->device())
                            .horizontalAdvance(m_context.projectName);
    painter->setFont(brandFont);
    painter->setPen(Qt::white);
    painter->drawText(QPointF((m_pageSize.width() - width) / 2.0, brandBaseline),
                      m_context.projectName);

    QPen underline(Qt::white);
    underline.setWidthF(1.5);
    painter->setPen(underline);
    painter->drawLine(QPointF(mm(kUnderlineInset), brandBaseline + kUnderlineDrop),
                      QPointF(m_pageSize.width() - mm(kUnderlineInset),
                              brandBaseline + kUnderlineDrop));
}

void CoverRenderer::drawTitles(QPainter *painter, const Binder::Section &section)
{
    const QString title = section.title(m_context.language);
    const QString subtitle = section.subtitle(m_context.language);
    const QFont plainFont = RenderContext::sized(m_context.regular, kTitleSize);
    const QFont boldFont = RenderContext::sized(m_context.bold, kSubtitleSize);

    painter->setPen(Qt::white);

    switch (section.titleMode) {
    case Binder::TitleMode::WithSubtitle:
        if (!title.isEmpty())
            drawCentered(painter, title, plainFont, mm(kTitleBaseline), Context::Title);
        if (!subtitle.isEmpty())
            drawCentered(painter, subtitle, boldFont, mm(kSubtitleBaseline), Context::Subtitle);
        break;
    case Binder::TitleMode::NoSubtitle:
        drawCentered(painter, title, boldFont, mm(kCenteredBaseline), Context::Title);
        break;
    case Binder::TitleMode::Separator:
        if (!section.separatorTitle.isEmpty())
            drawCentered(painter, section.separatorTitle, boldFont, mm(kSubtitleBaseline),
                         Context::Separator);
        else if (!title.isEmpty())
            drawCentered(painter, title, plainFont, mm(kTitleBaseline), Context::Title);
        break;
    case Binder::TitleMode::SeparatorWithSubtitle:
        drawCentered(painter,
                     section.separatorTitle.isEmpty() ? title : section.separatorTitle,
                     plainFont, mm(kTitleBaseline), Context::Separator);
        if (!subtitle.isEmpty())
            drawCentered(painter, subtitle, boldFont, mm(kSubtitleBaseline), Context::Subtitle);
        break;
    }
}

void CoverRenderer::drawCount(QPainter *painter, const Binder::Section &section, int cardCount)
{
    const qreal height = m_pageSize.height();

    if (section.hasRange) {
        QVariantHash args;
        args.insert(QStringLiteral("start"), QString::asprintf("#%03d", section.rangeStart));
        args.insert(QStringLiteral("end"), QString::asprintf("#%03d", section.rangeEnd));
        const QString text = m_context.strings
            ? m_context.strings->translate(QStringLiteral("pokedex_range"), m_context.language, args,
                                           QStringLiteral("Pokédex {{start}} – {{end}}"))
            : StringTable::substitute(QStringLiteral("Pokédex {{start}} – {{end}}"), args);
        painter->setPen(kRangeColor);
        drawCentered(painter, text, RenderContext::sized(m_context.regular, kRangeSize),
                     height - mm(kRangeBaseline), Context::Title);
    }

    QVariantHash args;
    args.insert(QStringLiteral("count"), cardCount);
    const QString countText = m_context.strings
        ? m_context.strings->translate(QStringLiteral("pokemon_count_text"), m_context.language,
                                       args, QStringLiteral("{{count}} Pokémon in this collection"))
        : StringTable::substitute(QStringLiteral("{{count}} Pokémon in this collection"), args);
    painter->setPen(kCountColor);
    drawCentered(painter, countText, RenderContext::sized(m_context.regular, kCountSize),
                 height - mm(kCountBaseline), Context::Title);

    QPen rule(section.color);
    rule.setWidthF(1.0);
    painter->setPen(rule);
    painter->drawLine(QPointF(mm(kUnderlineInset), height - mm(kRuleY)),
                      QPointF(m_pageSize.width() - mm(kUnderlineInset), height - mm(kRuleY)));
}

void CoverRenderer::drawFeatured(QPainter *painter, const QList<Binder::FeaturedArtwork> &featured)
{
    if (!m_context.cache || featured.isEmpty())
        return;

    const int count = qMin(int(featured.size()), int(Binder::Section::kMaxFeatured));
    const qreal slotWidth = mm(kFeaturedWidth);
    const qreal startX = (m_pageSize.width() - slotWidth * count) / 2.0;
    const QSizeF box(slotWidth * kFeaturedScale, mm(kFeaturedHeight) * kFeaturedScale);
    const qreal bottom = m_pageSize.height() - mm(kFeaturedBottom);

    painter->setRenderHint(QPainter::SmoothPixmapTransform, true);
    for (int i = 0; i < count; ++i) {
        const Binder::FeaturedArtwork &art = featured.at(i);
        const QImage image = m_context.cache->get(art.numericId, art.artwork, SizeClass::Featured);
        if (image.isNull()) {
            qDebug() << "CoverRenderer: No featured artwork for" << art.numericId;
            continue;
        }

        const qreal centerX = startX + slotWidth * (i + 0.5);
        const QSizeF fitted = QSizeF(image.size()).scaled(box, Qt::KeepAspectRatio);
        const QRectF target(centerX - fitted.width() / 2.0,
                            bottom - box.height() + (box.height() - fitted.height()) / 2.0,
                            fitted.width(), fitted.height());
        painter->drawImage(target, image);
    }
}

void CoverRenderer::drawFooter(QPainter *painter)
{
    const QFont font = RenderContext::sized(m_context.regular, kFooterSize);
    const QString text = footerText();
    const qreal width = QFontMetricsF(font, painter->device()).horizontalAdvance(text);
    painter->setFont(font);
    painter->setPen(kFooterColor);
    painter->drawText(QPointF((m_pageSize.width() - width) / 2.0,
                              m_pageSize.height() - mm(kFooterBaseline)),
                      text);
}
