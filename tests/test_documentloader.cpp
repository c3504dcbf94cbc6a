/*
 * test_documentloader.cpp - Document parsing, card shapes, section ordering and display names
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include <gtest/gtest.h>

#include <QFile>
#include <QJsonDocument>
#include <QJsonObject>
#include <QTemporaryDir>

#include "documentloader.h"
#include "testhelpers.h"
#include "variantname.h"

using namespace Binder;

namespace {

QJsonObject objectFrom(const char *json)
{
    return QJsonDocument::fromJson(QByteArray(json)).object();
}

} // namespace

// ============================================================================
// Card shapes
// ============================================================================

TEST(DocumentLoaderTest, DetectsLegacyWrappedCard) {
    const QJsonObject card = objectFrom(R"({
        "pokemon_id": 6, "name": {"en": "Charizard"}, "types": ["Fire"],
        "tcg_card": {"image_url": "https://img.example.org/base/4/high.png"}
    })");
    EXPECT_EQ(DocumentLoader::detectKind(card), CardKind::LegacyWrapped);
}

TEST(DocumentLoaderTest, DetectsFlatSetCard) {
    const QJsonObject card = objectFrom(R"({"localId": "013", "name": "Pikachu"})");
    EXPECT_EQ(DocumentLoader::detectKind(card), CardKind::FlatSetCard);
}

TEST(DocumentLoaderTest, DetectsCatalogEntry) {
    const QJsonObject card = objectFrom(R"({"id": 25, "image_url": "https://img.example.org/25.png"})");
    EXPECT_EQ(DocumentLoader::detectKind(card), CardKind::CatalogEntry);
}

TEST(DocumentLoaderTest, ParsesEveryCardShapeIntoOneRecordType) {
    const QByteArray json = R"({
        "scope": "mixed",
        "sections": [{
            "id": "s1",
            "cards": [
                {"pokemon_id": 6, "name": {"en": "Charizard", "de": "Glurak"},
                 "types": ["Fire", "Flying"],
                 "tcg_card": {"image_url": "https://img.example.org/base/4/high.png"}},
                {"id": 25, "localId": "013", "name": "Pikachu", "types": ["Lightning"],
                 "image_url": "https://img.example.org/sv/013.png"},
                {"id": "#151", "name_en": "Mew", "name_fr": "Mew", "type": "Psychic",
                 "image_path": "/data/images/151.png"}
            ]
        }]
    })";

    DocumentLoader loader;
    Document document;
    ASSERT_TRUE(loader.loadData(json, &document)) << loader.errorString().toStdString();
    ASSERT_EQ(document.sections.size(), 1);
    const QList<CardRecord> &cards = document.sections.first().cards;
    ASSERT_EQ(cards.size(), 3);

    EXPECT_EQ(cards.at(0).kind, CardKind::LegacyWrapped);
    EXPECT_EQ(cards.at(0).numericId, 6);
    EXPECT_EQ(cards.at(0).displayId, QStringLiteral("006"));
    EXPECT_EQ(cards.at(0).name(QStringLiteral("de")), QStringLiteral("Glurak"));
    EXPECT_EQ(cards.at(0).artwork, QStringLiteral("https://img.example.org/base/4/high.png"));
    EXPECT_EQ(cards.at(0).types.size(), 2);

    EXPECT_EQ(cards.at(1).kind, CardKind::FlatSetCard);
    EXPECT_EQ(cards.at(1).numericId, 25);
    EXPECT_EQ(cards.at(1).displayId, QStringLiteral("013"));
    EXPECT_EQ(cards.at(1).englishName, QStringLiteral("Pikachu"));

    EXPECT_EQ(cards.at(2).kind, CardKind::CatalogEntry);
    EXPECT_EQ(cards.at(2).numericId, 151);
    EXPECT_EQ(cards.at(2).displayId, QStringLiteral("151"));
    EXPECT_EQ(cards.at(2).primaryType(), QStringLiteral("Psychic"));
    EXPECT_EQ(cards.at(2).artwork, QStringLiteral("/data/images/151.png"));
}

TEST(DocumentLoaderTest, MissingLocalizedNameFallsBackToEnglish) {
    CardRecord card = TestHelpers::makeCard(1, QStringLiteral("Bulbasaur"));
    EXPECT_EQ(card.name(QStringLiteral("ja")), QStringLiteral("Bulbasaur"));
}

// ============================================================================
// Sections
// ============================================================================

TEST(DocumentLoaderTest, ArraySectionsKeepTheirOrder) {
    const QByteArray json = R"({"sections": [{"id": "b"}, {"id": "a"}, {}]})";
    DocumentLoader loader;
    Document document;
    ASSERT_TRUE(loader.loadData(json, &document));
    ASSERT_EQ(document.sections.size(), 3);
    EXPECT_EQ(document.sections.at(0).id, QStringLiteral("b"));
    EXPECT_EQ(document.sections.at(1).id, QStringLiteral("a"));
    EXPECT_EQ(document.sections.at(2).id, QStringLiteral("3"));
}

TEST(DocumentLoaderTest, ObjectSectionsSortByOrderThenNaturalKey) {
    const QByteArray json = R"({"sections": {
        "gen10": {}, "gen2": {}, "gen1": {},
        "special": {"section_order": 0}
    }})";
    DocumentLoader loader;
    Document document;
    ASSERT_TRUE(loader.loadData(json, &document));
    ASSERT_EQ(document.sections.size(), 4);
    EXPECT_EQ(document.sections.at(0).id, QStringLiteral("special"));
    EXPECT_EQ(document.sections.at(1).id, QStringLiteral("gen1"));
    EXPECT_EQ(document.sections.at(2).id, QStringLiteral("gen2"));
    EXPECT_EQ(document.sections.at(3).id, QStringLiteral("gen10"));
}

TEST(DocumentLoaderTest, ParsesCoverSettings) {
    const QByteArray json = R"({"sections": [{
        "id": "mega",
        "title": {"en": "Mega Evolutions", "de": "Mega-Entwicklungen"},
        "subtitle": "Kalos",
        "color": "#F08030",
        "title_mode": "separator",
        "section_title": "[MEGA]",
        "range": [1, 151],
        "iconic_pokemon_ids": [6, "#025", 0],
        "featured_elements": [{"pokemon_id": 6, "image_url": "https://img.example.org/6.png"}]
    }]})";
    DocumentLoader loader;
    Document document;
    ASSERT_TRUE(loader.loadData(json, &document));
    const Section &section = document.sections.first();

    EXPECT_EQ(section.title(QStringLiteral("de")), QStringLiteral("Mega-Entwicklungen"));
    EXPECT_EQ(section.title(QStringLiteral("ja")), QStringLiteral("Mega Evolutions"));
    EXPECT_EQ(section.subtitle(QStringLiteral("en")), QStringLiteral("Kalos"));
    EXPECT_EQ(section.color, QColor(0xF0, 0x80, 0x30));
    EXPECT_EQ(section.titleMode, TitleMode::Separator);
    EXPECT_EQ(section.separatorTitle, QStringLiteral("[MEGA]"));
    EXPECT_TRUE(section.hasRange);
    EXPECT_EQ(section.rangeEnd, 151);
    EXPECT_EQ(section.iconicIds, QList<int>({6, 25}));
    ASSERT_EQ(section.featured.size(), 1);
    EXPECT_EQ(section.featured.first().numericId, 6);
}

TEST(DocumentLoaderTest, InvalidColorKeepsDefault) {
    const QByteArray json = R"({"sections": [{"color": "not-a-color"}]})";
    DocumentLoader loader;
    Document document;
    ASSERT_TRUE(loader.loadData(json, &document));
    EXPECT_EQ(document.sections.first().color, QColor(0xA8, 0xA8, 0x78));
}

TEST(DocumentLoaderTest, RejectsMalformedJson) {
    DocumentLoader loader;
    Document document;
    EXPECT_FALSE(loader.loadData(QByteArrayLiteral("{\"sections\": ["), &document));
    EXPECT_FALSE(loader.errorString().isEmpty());
}

TEST(DocumentLoaderTest, RejectsDocumentWithoutSections) {
    DocumentLoader loader;
    Document document;
    EXPECT_FALSE(loader.loadData(QByteArrayLiteral("{\"scope\": \"x\"}"), &document));
    EXPECT_TRUE(loader.errorString().contains(QStringLiteral("sections")));
}

TEST(DocumentLoaderTest, ScopeDefaultsToFileName) {
    QTemporaryDir dir;
    const QString path = dir.path() + QStringLiteral("/national.json");
    QFile file(path);
    ASSERT_TRUE(file.open(QIODevice::WriteOnly));
    file.write(R"({"available_languages": ["en", "de"], "sections": []})");
    file.close();

    DocumentLoader loader;
    Document document;
    ASSERT_TRUE(loader.loadFile(path, &document));
    EXPECT_EQ(document.scope, QStringLiteral("national"));
    EXPECT_TRUE(document.supportsLanguage(QStringLiteral("de")));
    EXPECT_FALSE(document.supportsLanguage(QStringLiteral("ja")));
}

// ============================================================================
// Display names
// ============================================================================

TEST(VariantNameTest, RecordAffixBeatsSectionDefault) {
    Section section = TestHelpers::makeSection(0);
    section.hasSuffix = true;
    section.suffix = QStringLiteral("[EX_NEW]");

    CardRecord card = TestHelpers::makeCard(6, QStringLiteral("Charizard"));
    card.hasSuffix = true;
    card.suffix = QStringLiteral("ex");

    EXPECT_EQ(VariantName::compose(card, section, QStringLiteral("en")),
              QStringLiteral("Charizard ex"));
}

TEST(VariantNameTest, EmptyRecordAffixSuppressesSectionDefault) {
    Section section = TestHelpers::makeSection(0);
    section.hasPrefix = true;
    section.prefix = QStringLiteral("[MEGA]");

    CardRecord card = TestHelpers::makeCard(6, QStringLiteral("Charizard"));
    card.hasPrefix = true;

    EXPECT_EQ(VariantName::compose(card, section, QStringLiteral("en")),
              QStringLiteral("Charizard"));
}

TEST(VariantNameTest, SectionDefaultAppliesWhenRecordIsUnset) {
    Section section = TestHelpers::makeSection(0);
    section.hasPrefix = true;
    section.prefix = QStringLiteral("[MEGA]");

    const CardRecord card = TestHelpers::makeCard(6, QStringLiteral("Charizard"));
    EXPECT_EQ(VariantName::compose(card, section, QStringLiteral("en")),
              QStringLiteral("[MEGA] Charizard"));
}

TEST(VariantNameTest, PairedFormAndDeltaAreAppended) {
    const Section section = TestHelpers::makeSection(0);

    CardRecord card = TestHelpers::makeCard(6, QStringLiteral("Charizard"));
    card.pairedForm = QStringLiteral("x");
    card.hasSuffix = true;
    card.suffix = QStringLiteral("[EX]");
    card.delta = true;

    EXPECT_EQ(VariantName::compose(card, section, QStringLiteral("en")),
              QStringLiteral("Charizard X [EX] δ"));
}

TEST(VariantNameTest, LoaderReadsFormsAndNullAffixes) {
    const QByteArray json = R"({"sections": [{"suffix": "ex", "cards": [
        {"id": 6, "name": "Charizard", "form": "y", "suffix": null},
        {"id": 9, "name": "Blastoise", "variant_form": "delta", "suffix": ""}
    ]}]})";
    DocumentLoader loader;
    Document document;
    ASSERT_TRUE(loader.loadData(json, &document));
    const Section &section = document.sections.first();

    EXPECT_EQ(VariantName::compose(section.cards.at(0), section, QStringLiteral("en")),
              QStringLiteral("Charizard Y ex"));
    EXPECT_EQ(VariantName::compose(section.cards.at(1), section, QStringLiteral("en")),
              QStringLiteral("Blastoise δ"));
}
