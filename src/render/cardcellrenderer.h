/*
 * cardcellrenderer.h - One card cell on a grid page
 *
 * Draws the tinted header band (category label and composed name),
 * the artwork box and the footer index of a single record.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef CARDBINDER_CARDCELLRENDERER_H
#define CARDBINDER_CARDCELLRENDERER_H

#include <QRectF>
#include <QString>

#include "documentmodel.h"

class QPainter;
struct RenderContext;

class CardCellRenderer
{
public:
    explicit CardCellRenderer(const RenderContext &context);

    // Returns false for a record without category tags.
    bool render(QPainter *painter, const Binder::CardRecord &record,
                const Binder::Section &section, const QRectF &cell);

    QString errorString() const { return m_errorString; }

    static QRectF headerRect(const QRectF &cell);
    static QRectF artworkBox(const QRectF &cell);

    // Name as drawn: affixes resolved, gender glyphs substituted.
    QString displayName(const Binder::CardRecord &record,
                        const Binder::Section &section) const;

private:
    const RenderContext &m_context;
    QString m_errorString;
};

#endif // CARDBINDER_CARDCELLRENDERER_H
