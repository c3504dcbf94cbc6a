/*
 * tokencompositor.h - Centered text with inline logos and images
 *
 * A localized string may embed named logo tokens ([EX], [EX_NEW],
 * [EX_TERA], [M], [MEGA]) and [image]URL[/image] spans.  The
 * compositor splits it into segments, measures them, and draws them
 * left to right so the whole run is centered on an anchor point.
 *
 * Logos and images have a fixed nominal box per context, independent
 * of the font size.  Layout is separate from painting so callers (and
 * tests) can inspect segment positions without a painter.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef CARDBINDER_TOKENCOMPOSITOR_H
#define CARDBINDER_TOKENCOMPOSITOR_H

#include <QFont>
#include <QImage>
#include <QList>
#include <QPointF>
#include <QSizeF>
#include <QString>

class AssetCache;
class LogoLibrary;
class QPaintDevice;
class QPainter;

struct InlineToken {
    enum Kind { Text, Logo, Image };

    Kind kind = Text;
    QString value; // text, token name, or image source
};

class TokenCompositor
{
public:
    enum class Context {
        Card,
        Title,
        Subtitle,
        Separator,
    };

    struct Segment {
        InlineToken::Kind kind = InlineToken::Text;
        QString text;        // Text: run as drawn (may carry a trailing space)
        QImage image;        // Logo / Image
        QSizeF box;          // nominal box for Logo / Image
        qreal x = 0;         // left edge
        qreal advance = 0;   // horizontal space consumed, gap included
    };

    struct Layout {
        QList<Segment> segments;
        qreal totalWidth = 0;
        qreal startX = 0;
        qreal baseline = 0;
        bool plain = false;  // drawn with one centered call
    };

    TokenCompositor(LogoLibrary *logos, AssetCache *cache);

    // True when the string has at least one recognized token.
    static bool containsTokens(const QString &text);

    // Left-to-right tokens.  Unbalanced [image] markup turns the whole
    // string into a single text token.
    static QList<InlineToken> tokenize(const QString &text);

    static QSizeF logoSize(const QString &token, Context context);
    static QSizeF imageSize(Context context);
    static qreal segmentGap();
    static qreal logoLift();

    // anchor.x() is the center line, anchor.y() the text baseline.
    Layout layout(const QString &text, const QString &language, const QFont &font,
                  Context context, const QPointF &anchor,
                  QPaintDevice *device = nullptr) const;

    void draw(QPainter *painter, const Layout &layout, const QFont &font) const;
    void draw(QPainter *painter, const QString &text, const QString &language,
              const QFont &font, Context context, const QPointF &anchor) const;

private:
    LogoLibrary *m_logos = nullptr;
    AssetCache *m_cache = nullptr;
};

#endif // CARDBINDER_TOKENCOMPOSITOR_H
