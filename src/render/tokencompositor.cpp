/*
 * tokencompositor.cpp - Centered text with inline logos and images
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "tokencompositor.h"
#include "assetcache.h"
#include "logolibrary.h"
#include "units.h"

#include <QFontMetricsF>
#include <QPainter>

using Units::mm;

static const QString kImageOpen = QStringLiteral("[image]");
static const QString kImageClose = QStringLiteral("[/image]");

TokenCompositor::TokenCompositor(LogoLibrary *logos, AssetCache *cache)
    : m_logos(logos)
    , m_cache(cache)
{
}

qreal TokenCompositor::segmentGap()
{
    return mm(1.5);
}

qreal TokenCompositor::logoLift()
{
    return mm(1.2);
}

QSizeF TokenCompositor::logoSize(const QString &token, Context context)
{
    const bool card = context == Context::Card;
    if (token == QLatin1String("EX") || token == QLatin1String("EX_NEW")
        || token == QLatin1String("EX_TERA"))
        return card ? QSizeF(mm(6.0), mm(7.2)) : QSizeF(mm(7.3), mm(8.8));
    if (token == QLatin1String("M"))
        return card ? QSizeF(mm(5.0), mm(4.0)) : QSizeF(mm(6.65), mm(5.3));
    if (token == QLatin1String("MEGA"))
        return card ? QSizeF(mm(65.0), mm(32.5)) : QSizeF(mm(80.0), mm(40.0));
    return {};
}

QSizeF TokenCompositor::imageSize(Context context)
{
    switch (context) {
    case Context::Card:
        return QSizeF(mm(12.0), mm(6.0));
    case Context::Title:
        return QSizeF(mm(50.0), mm(20.0));
    case Context::Subtitle:
    case Context::Separator:
        return QSizeF(mm(60.0), mm(25.0));
    }
    return {};
}

// --- Parsing ---

bool TokenCompositor::containsTokens(const QString &text)
{
    if (!text.contains(QLatin1Char('[')))
        return false;
    const QList<InlineToken> tokens = tokenize(text);
    for (const InlineToken &token : tokens) {
        if (token.kind != InlineToken::Text)
            return true;
    }
    return false;
}

QList<InlineToken> TokenCompositor::tokenize(const QString &text)
{
    QList<InlineToken> tokens;
    QString pending;

    auto flushText = [&]() {
        const QString run = pending.trimmed();
        if (!run.isEmpty())
            tokens.append({InlineToken::Text, run});
        pending.clear();
    };
    auto malformed = [&text]() {
        QList<InlineToken> plain;
        const QString run = text.trimmed();
        if (!run.isEmpty())
            plain.append({InlineToken::Text, run});
        return plain;
    };

    const QStringList logoNames = LogoLibrary::tokenNames();
    int i = 0;
    while (i < text.size()) {
        if (text.at(i) != QLatin1Char('[')) {
            pending += text.at(i++);
            continue;
        }

        if (QStringView(text).mid(i).startsWith(kImageOpen)) {
            const int payloadStart = i + kImageOpen.size();
            const int close = text.indexOf(kImageClose, payloadStart);
            if (close < 0)
                return malformed();
            const QString payload = text.mid(payloadStart, close - payloadStart).trimmed();
            if (payload.contains(kImageOpen))
                return malformed();
            flushText();
            tokens.append({InlineToken::Image, payload});
            i = close + kImageClose.size();
            continue;
        }
        if (QStringView(text).mid(i).startsWith(kImageClose))
            return malformed();

        bool matched = false;
        for (const QString &name : logoNames) {
            const QString bracketed = QLatin1Char('[') + name + QLatin1Char(']');
            if (QStringView(text).mid(i).startsWith(bracketed)) {
                flushText();
                tokens.append({InlineToken::Logo, name});
                i += bracketed.size();
                matched = true;
                break;
            }
        }
        if (!matched)
            pending += text.at(i++);
    }
    flushText();
    return tokens;
}

// --- Layout ---

TokenCompositor::Layout TokenCompositor::layout(const QString &text, const QString &language,
                                                const QFont &font, Context context,
                                                const QPointF &anchor,
                                                QPaintDevice *device) const
{
    Layout result;
    result.baseline = anchor.y();
    const QFontMetricsF metrics(font, device);

    if (!containsTokens(text)) {
        // Fast path: one centered run
        result.plain = true;
        const QString run = text.trimmed();
        if (!run.isEmpty()) {
            Segment seg;
            seg.text = run;
            seg.advance = metrics.horizontalAdvance(run);
            result.segments.append(seg);
            result.totalWidth = seg.advance;
        }
        result.startX = anchor.x() - result.totalWidth / 2.0;
        if (!result.segments.isEmpty())
            result.segments.first().x = result.startX;
        return result;
    }

    const QList<InlineToken> tokens = tokenize(text);
    const qreal gap = segmentGap();

    for (const InlineToken &token : tokens) {
        Segment seg;
        seg.kind = token.kind;

        switch (token.kind) {
        case InlineToken::Text:
            seg.text = token.value;
            break;
        case InlineToken::Logo:
            seg.image = m_logos ? m_logos->image(token.value, language) : QImage();
            seg.box = logoSize(token.value, context);
            seg.advance = seg.box.width() + gap;
            break;
        case InlineToken::Image:
            seg.image = m_cache ? m_cache->inlineImage(token.value) : QImage();
            seg.box = imageSize(context);
            seg.advance = seg.box.width() + gap;
            break;
        }

        // Unresolvable logos and images vanish together with their gap
        if (seg.kind != InlineToken::Text && seg.image.isNull())
            continue;

        result.segments.append(seg);
    }

    // Text runs are separated from whatever survived after them by one space
    for (int i = 0; i < result.segments.size(); ++i) {
        Segment &seg = result.segments[i];
        if (seg.kind == InlineToken::Text) {
            if (i + 1 < result.segments.size())
                seg.text += QLatin1Char(' ');
            seg.advance = metrics.horizontalAdvance(seg.text);
        }
        result.totalWidth += seg.advance;
    }

    result.startX = anchor.x() - result.totalWidth / 2.0;
    qreal x = result.startX;
    for (Segment &seg : result.segments) {
        seg.x = x;
        x += seg.advance;
    }
    return result;
}

// --- Painting ---

void TokenCompositor::draw(QPainter *painter, const Layout &layout, const QFont &font) const
{
    painter->save();
    painter->setFont(font);
    painter->setRenderHint(QPainter::SmoothPixmapTransform, true);

    for (const Segment &seg : layout.segments) {
        if (seg.kind == InlineToken::Text) {
            painter->drawText(QPointF(seg.x, layout.baseline), seg.text);
            continue;
        }

        // Fit the bitmap into its nominal box, centered 1.2 mm above the baseline
        QSizeF fitted = QSizeF(seg.image.size()).scaled(seg.box, Qt::KeepAspectRatio);
        const qreal centerY = layout.baseline - logoLift();
        const QRectF target(seg.x + (seg.box.width() - fitted.width()) / 2.0,
                            centerY - fitted.height() / 2.0,
                            fitted.width(), fitted.height());
        painter->drawImage(target, seg.image);
    }

    painter->restore();
}

void TokenCompositor::draw(QPainter *painter, const QString &text, const QString &language,
                           const QFont &font, Context context, const QPointF &anchor) const
{
    draw(painter, layout(text, language, font, context, anchor, painter->device()), font);
}
