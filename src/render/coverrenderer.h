/*
 * coverrenderer.h - Full-page section cover
 *
 * Colored title stripe with the project brand, the section title in
 * one of four title modes, an optional number range, the card count,
 * up to three featured artworks and the cover footer.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef CARDBINDER_COVERRENDERER_H
#define CARDBINDER_COVERRENDERER_H

#include <QList>
#include <QSizeF>
#include <QString>

#include "documentmodel.h"
#include "tokencompositor.h"

class QPainter;
struct RenderContext;

class CoverRenderer
{
public:
    CoverRenderer(const RenderContext &context, const QSizeF &pageSize);

    bool render(QPainter *painter, const Binder::Section &section, int cardCount,
                const QList<Binder::FeaturedArtwork> &featured);

    QString errorString() const { return m_errorString; }

    // Featured artwork for the cover: explicit entries first, else the
    // section's iconic ids looked up among its cards.  At most three.
    static QList<Binder::FeaturedArtwork> featuredFor(const Binder::Section &section);

    QString footerText() const;

private:
    void drawStripe(QPainter *painter, const Binder::Section &section);
    void drawTitles(QPainter *painter, const Binder::Section &section);
    void drawCount(QPainter *painter, const Binder::Section &section, int cardCount);
    void drawFeatured(QPainter *painter, const QList<Binder::FeaturedArtwork> &featured);
    void drawFooter(QPainter *painter);

    void drawCentered(QPainter *painter, const QString &text, const QFont &font,
                      qreal baseline, TokenCompositor::Context context);

    const RenderContext &m_context;
    QSizeF m_pageSize;
    QString m_errorString;
};

#endif // CARDBINDER_COVERRENDERER_H
