/*
 * test_fontregistry.cpp - Language support checks and font resolution failures
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include <gtest/gtest.h>

#include "fontregistry.h"

TEST(FontRegistryTest, KnowsSupportedLanguages) {
    EXPECT_TRUE(FontRegistry::isSupportedLanguage(QStringLiteral("en")));
    EXPECT_TRUE(FontRegistry::isSupportedLanguage(QStringLiteral("zh_hant")));
    EXPECT_FALSE(FontRegistry::isSupportedLanguage(QStringLiteral("xx")));
    EXPECT_TRUE(FontRegistry::isLogographic(QStringLiteral("ko")));
    EXPECT_FALSE(FontRegistry::isLogographic(QStringLiteral("fr")));
}

TEST(FontRegistryTest, LatinLanguagesUseConfiguredFamily) {
    FontRegistry registry(QStringLiteral("Helvetica"), {});
    registry.setFontconfigEnabled(false);

    const std::optional<QFont> font = registry.font(QStringLiteral("de"), true, 12.0);
    ASSERT_TRUE(font.has_value());
    EXPECT_EQ(font->family(), QStringLiteral("Helvetica"));
    EXPECT_TRUE(font->bold());
    EXPECT_DOUBLE_EQ(font->pointSizeF(), 12.0);
}

TEST(FontRegistryTest, UnknownLanguageIsAnError) {
    FontRegistry registry;
    QString error;
    EXPECT_FALSE(registry.font(QStringLiteral("xx"), false, 10.0, &error).has_value());
    EXPECT_TRUE(error.contains(QStringLiteral("xx")));
}

TEST(FontRegistryTest, MissingCollectionNamesTheLanguage) {
    FontRegistry registry(QStringLiteral("Helvetica"),
                          {QStringLiteral("/nonexistent/fonts/collection.ttc")});
    registry.setFontconfigEnabled(false);

    QString error;
    EXPECT_FALSE(registry.font(QStringLiteral("ja"), false, 10.0, &error).has_value());
    EXPECT_TRUE(error.contains(QStringLiteral("ja")));
    EXPECT_TRUE(registry.family(QStringLiteral("ja")).isEmpty());
}

TEST(FontRegistryTest, RegistrationIsIdempotent) {
    FontRegistry registry(QStringLiteral("Helvetica"), {});
    registry.setFontconfigEnabled(false);
    registry.registerFonts();
    registry.registerFonts();
    EXPECT_TRUE(registry.isRegistered());
}

TEST(FontRegistryTest, GenderSymbolsAreSpelledOutForLatinScripts) {
    const QString name = QStringLiteral("Nidoran") + QChar(0x2640);
    EXPECT_EQ(FontRegistry::substituteSymbols(name, QStringLiteral("en")),
              QStringLiteral("Nidoran(F)"));
    EXPECT_EQ(FontRegistry::substituteSymbols(QStringLiteral("Nidoran") + QChar(0x2642),
                                              QStringLiteral("fr")),
              QStringLiteral("Nidoran(M)"));
    EXPECT_EQ(FontRegistry::substituteSymbols(name, QStringLiteral("ja")), name);
}

TEST(FontRegistryTest, FontconfigIsLoadedOncePerRegistration) {
    FontRegistry registry(QStringLiteral("Helvetica"), {});
    registry.registerFonts();
    registry.registerFonts();
    EXPECT_EQ(registry.fontconfigLoads(), 1);

    FontRegistry disabled(QStringLiteral("Helvetica"), {});
    disabled.setFontconfigEnabled(false);
    disabled.registerFonts();
    EXPECT_EQ(disabled.fontconfigLoads(), 0);
}

TEST(FontRegistryTest, FontconfigListsOnlyCollections) {
    EXPECT_TRUE(FontRegistry::fontconfigCollections(nullptr, QStringLiteral("ja")).isEmpty());

    FcConfig *config = FcInitLoadConfigAndFonts();
    ASSERT_NE(config, nullptr);
    EXPECT_TRUE(FontRegistry::fontconfigCollections(config, QStringLiteral("de")).isEmpty());
    for (const QString &language : {QStringLiteral("ja"), QStringLiteral("ko"),
                                    QStringLiteral("zh_hans"), QStringLiteral("zh_hant")}) {
        const QStringList paths = FontRegistry::fontconfigCollections(config, language);
        QStringList sorted = paths;
        sorted.sort();
        EXPECT_EQ(paths, sorted);
        for (const QString &path : paths) {
            EXPECT_TRUE(path.endsWith(QLatin1String(".ttc"), Qt::CaseInsensitive)
                        || path.endsWith(QLatin1String(".otc"), Qt::CaseInsensitive))
                << path.toStdString();
        }
    }
    FcConfigDestroy(config);
}
