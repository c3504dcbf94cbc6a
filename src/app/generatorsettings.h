/*
 * generatorsettings.h - Generator configuration from cardbinderrc
 *
 * Read through KSharedConfig; command-line options are applied on top
 * by the caller.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef CARDBINDER_GENERATORSETTINGS_H
#define CARDBINDER_GENERATORSETTINGS_H

#include <QString>
#include <QStringList>

#include <KSharedConfig>

#include "assetcache.h"

struct GeneratorSettings
{
    // [Cache]
    AssetCache::Options cache;
    int fetchTimeoutMs = 5000;

    // [Fonts]
    QString latinFamily{QStringLiteral("Helvetica")};
    QStringList collectionPaths;

    // [Output]
    QString outputDirectory;
    QString projectName{QStringLiteral("Binder Pokédex")};
    QString footerCaption{QStringLiteral("Binder Pokédex Project | github.com/BinderPokedex")};

    // [Data]
    QString translationsFile;
    QString logoDirectory;

    // Defaults rooted in the standard cache/data locations.
    static GeneratorSettings defaults();

    static GeneratorSettings load(KSharedConfig::Ptr config);
    void save(KSharedConfig::Ptr config) const;
};

#endif // CARDBINDER_GENERATORSETTINGS_H
