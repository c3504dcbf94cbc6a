/*
 * test_generatorsettings.cpp - Reading and writing the generator configuration file
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include <gtest/gtest.h>

#include <QFile>
#include <QTemporaryDir>

#include <KConfigGroup>
#include <KSharedConfig>

#include "generatorsettings.h"

TEST(GeneratorSettingsTest, MissingFileYieldsDefaults) {
    QTemporaryDir dir;
    const GeneratorSettings s = GeneratorSettings::load(
        KSharedConfig::openConfig(dir.path() + QStringLiteral("/absentrc"), KConfig::SimpleConfig));

    EXPECT_EQ(s.cache.maxEntries, 500);
    EXPECT_EQ(s.cache.cellEdge, 180);
    EXPECT_EQ(s.cache.featuredEdge, 500);
    EXPECT_EQ(s.cache.jpegQuality, 75);
    EXPECT_TRUE(s.cache.networkFallback);
    EXPECT_EQ(s.fetchTimeoutMs, 5000);
    EXPECT_EQ(s.latinFamily, QStringLiteral("Helvetica"));
    EXPECT_FALSE(s.collectionPaths.isEmpty());
}

TEST(GeneratorSettingsTest, ReadsGroupsFromFile) {
    QTemporaryDir dir;
    const QString path = dir.path() + QStringLiteral("/cardbinderrc");
    QFile file(path);
    ASSERT_TRUE(file.open(QIODevice::WriteOnly));
    file.write("[Cache]\n"
               "Directory=/var/cache/cards\n"
               "MaxEntries=64\n"
               "NetworkFallback=false\n"
               "\n"
               "[Fonts]\n"
               "LatinFamily=DejaVu Sans\n"
               "\n"
               "[Output]\n"
               "ProjectName=My Binder\n");
    file.close();

    const GeneratorSettings s =
        GeneratorSettings::load(KSharedConfig::openConfig(path, KConfig::SimpleConfig));

    EXPECT_EQ(s.cache.directory, QStringLiteral("/var/cache/cards"));
    EXPECT_EQ(s.cache.maxEntries, 64);
    EXPECT_FALSE(s.cache.networkFallback);
    EXPECT_EQ(s.latinFamily, QStringLiteral("DejaVu Sans"));
    EXPECT_EQ(s.projectName, QStringLiteral("My Binder"));
    EXPECT_EQ(s.cache.jpegQuality, 75);
}

TEST(GeneratorSettingsTest, SavedSettingsReloadUnchanged) {
    QTemporaryDir dir;
    const QString path = dir.path() + QStringLiteral("/cardbinderrc");

    GeneratorSettings s = GeneratorSettings::defaults();
    s.cache.maxEntries = 42;
    s.collectionPaths = {QStringLiteral("/fonts/a.ttc"), QStringLiteral("/fonts/b.ttc")};
    s.footerCaption = QStringLiteral("Page {page} of {pages}");
    s.save(KSharedConfig::openConfig(path, KConfig::SimpleConfig));

    const GeneratorSettings reloaded =
        GeneratorSettings::load(KSharedConfig::openConfig(path, KConfig::SimpleConfig));
    EXPECT_EQ(reloaded.cache.maxEntries, 42);
    EXPECT_EQ(reloaded.collectionPaths, s.collectionPaths);
    EXPECT_EQ(reloaded.footerCaption, s.footerCaption);
}
