/*
 * test_coverrenderer.cpp - Cover title modes, featured artwork selection and footer text
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include <gtest/gtest.h>

#include <QImage>
#include <QJsonDocument>
#include <QJsonObject>
#include <QPainter>
#include <QtMath>

#include "coverrenderer.h"
#include "pagelayout.h"
#include "rendercontext.h"
#include "stringtable.h"
#include "testhelpers.h"

using Binder::TitleMode;

namespace {

class CoverRendererTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        m_context.language = QStringLiteral("en");
        m_context.regular = QFont(QStringLiteral("Helvetica"));
        m_context.bold = m_context.regular;
        m_context.bold.setBold(true);
        m_context.latinRegular = m_context.regular;
        m_context.latinBold = m_context.bold;
        m_context.date = QDate(2026, 3, 14);

        m_pageSize = PageLayout().pageSizePoints();
        m_canvas = QImage(qCeil(m_pageSize.width()), qCeil(m_pageSize.height()),
                          QImage::Format_ARGB32);
        // 72 dpi, so one point is one pixel as in the generated PDF
        m_canvas.setDotsPerMeterX(2835);
        m_canvas.setDotsPerMeterY(2835);
        m_canvas.fill(Qt::white);
    }

    Binder::Section sectionWith(TitleMode mode, const QString &separator = QString()) const
    {
        Binder::Section section = TestHelpers::makeSection(0);
        section.titles.insert(QStringLiteral("en"), QStringLiteral("HHHH"));
        section.subtitles.insert(QStringLiteral("en"), QStringLiteral("HHHH"));
        section.color = QColor(0x20, 0x30, 0x80);
        section.titleMode = mode;
        section.separatorTitle = separator;
        return section;
    }

    void renderCover(const Binder::Section &section)
    {
        CoverRenderer cover(m_context, m_pageSize);
        QPainter painter(&m_canvas);
        ASSERT_TRUE(cover.render(&painter, section, 0, {})) << cover.errorString().toStdString();
        painter.end();
    }

    // White pixels on the stripe within [top, bottom], around the center line
    int whitePixels(int top, int bottom) const
    {
        const int center = m_canvas.width() / 2;
        int count = 0;
        for (int y = top; y <= bottom; ++y) {
            for (int x = center - 150; x <= center + 150; ++x) {
                if (m_canvas.pixelColor(x, y).lightness() > 200)
                    ++count;
            }
        }
        return count;
    }

    // Rows just above each title baseline: 55 mm, 60 mm and 65 mm from the top
    int inTitleBand() const { return whitePixels(148, 154); }
    int inCenteredBand() const { return whitePixels(159, 168); }
    int inSubtitleBand() const { return whitePixels(174, 182); }

    RenderContext m_context;
    QSizeF m_pageSize;
    QImage m_canvas;
};

} // namespace

// ============================================================================
// Title modes
// ============================================================================

TEST_F(CoverRendererTest, StripeLeavesTitleBandsEmpty) {
    Binder::Section section = sectionWith(TitleMode::WithSubtitle);
    section.titles.clear();
    section.subtitles.clear();
    renderCover(section);

    EXPECT_EQ(inTitleBand(), 0);
    EXPECT_EQ(inCenteredBand(), 0);
    EXPECT_EQ(inSubtitleBand(), 0);
}

TEST_F(CoverRendererTest, WithSubtitleDrawsTitleAndSubtitle) {
    renderCover(sectionWith(TitleMode::WithSubtitle));
    EXPECT_GT(inTitleBand(), 0);
    EXPECT_EQ(inCenteredBand(), 0);
    EXPECT_GT(inSubtitleBand(), 0);
}

TEST_F(CoverRendererTest, NoSubtitleCentersTitleAlone) {
    renderCover(sectionWith(TitleMode::NoSubtitle));
    EXPECT_EQ(inTitleBand(), 0);
    EXPECT_GT(inCenteredBand(), 0);
    EXPECT_EQ(inSubtitleBand(), 0);
}

TEST_F(CoverRendererTest, SeparatorDrawsOverrideOnly) {
    renderCover(sectionWith(TitleMode::Separator, QStringLiteral("HHHH")));
    EXPECT_EQ(inTitleBand(), 0);
    EXPECT_EQ(inCenteredBand(), 0);
    EXPECT_GT(inSubtitleBand(), 0);
}

TEST_F(CoverRendererTest, SeparatorWithoutOverrideFallsBackToTitle) {
    renderCover(sectionWith(TitleMode::Separator));
    EXPECT_GT(inTitleBand(), 0);
    EXPECT_EQ(inCenteredBand(), 0);
    EXPECT_EQ(inSubtitleBand(), 0);
}

TEST_F(CoverRendererTest, SeparatorWithSubtitleDrawsBothLines) {
    renderCover(sectionWith(TitleMode::SeparatorWithSubtitle, QStringLiteral("HHHH")));
    EXPECT_GT(inTitleBand(), 0);
    EXPECT_EQ(inCenteredBand(), 0);
    EXPECT_GT(inSubtitleBand(), 0);
}

TEST_F(CoverRendererTest, InactivePainterIsAnError) {
    CoverRenderer cover(m_context, m_pageSize);
    QPainter painter;
    EXPECT_FALSE(cover.render(&painter, sectionWith(TitleMode::WithSubtitle), 0, {}));
    EXPECT_TRUE(cover.errorString().contains(QStringLiteral("gen1")));
}

// ============================================================================
// Featured artwork
// ============================================================================

TEST(CoverFeaturedTest, ExplicitEntriesAreCappedAtThree) {
    Binder::Section section = TestHelpers::makeSection(0);
    for (int id = 1; id <= 5; ++id)
        section.featured.append({id, QStringLiteral("https://img.example.org/%1.png").arg(id), {}});
    section.iconicIds = {25};

    const QList<Binder::FeaturedArtwork> featured = CoverRenderer::featuredFor(section);
    ASSERT_EQ(featured.size(), 3);
    EXPECT_EQ(featured.at(0).numericId, 1);
    EXPECT_EQ(featured.at(1).numericId, 2);
    EXPECT_EQ(featured.at(2).numericId, 3);
}

TEST(CoverFeaturedTest, IconicIdsAreLookedUpAmongCards) {
    Binder::Section section = TestHelpers::makeSection(0);
    for (int id : {1, 4, 6, 7, 25}) {
        Binder::CardRecord card = TestHelpers::makeCard(id, QStringLiteral("Card %1").arg(id));
        if (id != 7)
            card.artwork = QStringLiteral("https://img.example.org/%1.png").arg(id);
        section.cards.append(card);
    }
    // 999 is not in the section and 7 has no artwork
    section.iconicIds = {25, 999, 7, 6, 1, 4};

    const QList<Binder::FeaturedArtwork> featured = CoverRenderer::featuredFor(section);
    ASSERT_EQ(featured.size(), 3);
    EXPECT_EQ(featured.at(0).numericId, 25);
    EXPECT_EQ(featured.at(1).numericId, 6);
    EXPECT_EQ(featured.at(2).numericId, 1);
    EXPECT_EQ(featured.at(0).artwork, QStringLiteral("https://img.example.org/25.png"));
}

TEST(CoverFeaturedTest, NothingToFeature) {
    EXPECT_TRUE(CoverRenderer::featuredFor(TestHelpers::makeSection(4)).isEmpty());
}

// ============================================================================
// Footer
// ============================================================================

TEST_F(CoverRendererTest, FooterUsesContextDate) {
    CoverRenderer cover(m_context, m_pageSize);
    EXPECT_EQ(cover.footerText(),
              QStringLiteral("Follow cutting guides • Binder Pokédex Project • 2026-03-14"));
}

TEST_F(CoverRendererTest, FooterIsTranslated) {
    StringTable strings;
    const QByteArray json = R"({"ui": {
        "en": {"cover_follow_cutting": "Follow cutting guides"},
        "de": {"cover_follow_cutting": "Entlang der Schnittlinien schneiden"}
    }})";
    strings.loadJson(QJsonDocument::fromJson(json).object());
    m_context.strings = &strings;
    m_context.language = QStringLiteral("de");
    m_context.projectName = QStringLiteral("Kanto");

    CoverRenderer cover(m_context, m_pageSize);
    EXPECT_EQ(cover.footerText(),
              QStringLiteral("Entlang der Schnittlinien schneiden • Kanto Project • 2026-03-14"));
}
