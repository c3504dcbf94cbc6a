/*
 * rendercontext.h - Per-document rendering state shared by the renderers
 *
 * Built once per (document, language) by DocumentAssembler after the
 * fonts for that language have been resolved.  Holds non-owning
 * pointers to the long-lived collaborators.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef CARDBINDER_RENDERCONTEXT_H
#define CARDBINDER_RENDERCONTEXT_H

#include <QDate>
#include <QFont>
#include <QString>

#include "categorypalette.h"

class AssetCache;
class StringTable;
class TokenCompositor;

struct RenderContext {
    QString language;

    // Fonts resolved for the language; sized copies are made per element
    QFont regular;
    QFont bold;
    QFont latinRegular;
    QFont latinBold;

    QString projectName{QStringLiteral("Binder Pokédex")};
    QString footerCaption{QStringLiteral("Binder Pokédex Project | github.com/BinderPokedex")};
    QDate date = QDate::currentDate();

    CategoryPalette palette;
    const StringTable *strings = nullptr;
    TokenCompositor *compositor = nullptr;
    AssetCache *cache = nullptr;

    static QFont sized(QFont font, qreal pointSize)
    {
        font.setPointSizeF(pointSize);
        return font;
    }
};

#endif // CARDBINDER_RENDERCONTEXT_H
