/*
 * generatorsettings.cpp - Generator configuration from cardbinderrc
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "generatorsettings.h"
#include "fontregistry.h"

#include <KConfigGroup>

#include <QDir>
#include <QStandardPaths>

GeneratorSettings GeneratorSettings::defaults()
{
    GeneratorSettings s;
    s.cache.directory = QStandardPaths::writableLocation(QStandardPaths::CacheLocation)
                      + QStringLiteral("/images");
    s.collectionPaths = FontRegistry::defaultCollectionPaths();
    s.outputDirectory = QDir::currentPath() + QStringLiteral("/output");

    const QString dataDir = QStandardPaths::locate(QStandardPaths::AppDataLocation,
                                                   QString(), QStandardPaths::LocateDirectory);
    if (!dataDir.isEmpty()) {
        s.translationsFile = dataDir + QStringLiteral("/i18n/translations.json");
        s.logoDirectory = dataDir + QStringLiteral("/logos");
    }
    return s;
}

GeneratorSettings GeneratorSettings::load(KSharedConfig::Ptr config)
{
    GeneratorSettings s = defaults();

    KConfigGroup cache(config, QStringLiteral("Cache"));
    s.cache.directory = cache.readPathEntry("Directory", s.cache.directory);
    s.cache.maxEntries = cache.readEntry("MaxEntries", s.cache.maxEntries);
    s.cache.cellEdge = cache.readEntry("CellSize", s.cache.cellEdge);
    s.cache.featuredEdge = cache.readEntry("FeaturedSize", s.cache.featuredEdge);
    s.cache.jpegQuality = cache.readEntry("JpegQuality", s.cache.jpegQuality);
    s.cache.networkFallback = cache.readEntry("NetworkFallback", s.cache.networkFallback);
    s.fetchTimeoutMs = cache.readEntry("FetchTimeoutMs", s.fetchTimeoutMs);

    KConfigGroup fonts(config, QStringLiteral("Fonts"));
    s.latinFamily = fonts.readEntry("LatinFamily", s.latinFamily);
    s.collectionPaths = fonts.readPathEntry("CjkCollections", s.collectionPaths);

    KConfigGroup output(config, QStringLiteral("Output"));
    s.outputDirectory = output.readPathEntry("Directory", s.outputDirectory);
    s.projectName = output.readEntry("ProjectName", s.projectName);
    s.footerCaption = output.readEntry("FooterCaption", s.footerCaption);

    KConfigGroup data(config, QStringLiteral("Data"));
    s.translationsFile = data.readPathEntry("TranslationsFile", s.translationsFile);
    s.logoDirectory = data.readPathEntry("LogoDirectory", s.logoDirectory);

    return s;
}

void GeneratorSettings::save(KSharedConfig::Ptr config) const
{
    KConfigGroup cacheGroup(config, QStringLiteral("Cache"));
    cacheGroup.writePathEntry("Directory", cache.directory);
    cacheGroup.writeEntry("MaxEntries", cache.maxEntries);
    cacheGroup.writeEntry("CellSize", cache.cellEdge);
    cacheGroup.writeEntry("FeaturedSize", cache.featuredEdge);
    cacheGroup.writeEntry("JpegQuality", cache.jpegQuality);
    cacheGroup.writeEntry("NetworkFallback", cache.networkFallback);
    cacheGroup.writeEntry("FetchTimeoutMs", fetchTimeoutMs);

    KConfigGroup fonts(config, QStringLiteral("Fonts"));
    fonts.writeEntry("LatinFamily", latinFamily);
    fonts.writePathEntry("CjkCollections", collectionPaths);

    KConfigGroup output(config, QStringLiteral("Output"));
    output.writePathEntry("Directory", outputDirectory);
    output.writeEntry("ProjectName", projectName);
    output.writeEntry("FooterCaption", footerCaption);

    KConfigGroup data(config, QStringLiteral("Data"));
    data.writePathEntry("TranslationsFile", translationsFile);
    data.writePathEntry("LogoDirectory", logoDirectory);

    config->sync();
}
