/*
 * documentassembler.cpp - Writes one binder PDF per (document, language)
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "documentassembler.h"
#include "cardcellrenderer.h"
#include "coverrenderer.h"
#include "fontregistry.h"
#include "gridoverlay.h"
#include "rendercontext.h"
#include "stringtable.h"
#include "tokencompositor.h"

#include <QDebug>
#include <QDir>
#include <QFileInfo>
#include <QPageLayout>
#include <QPainter>
#include <QPdfWriter>
#include <QSaveFile>

DocumentAssembler::DocumentAssembler(FontRegistry *fonts, AssetCache *cache,
                                     LogoLibrary *logos, const StringTable *strings)
    : m_fonts(fonts)
    , m_cache(cache)
    , m_logos(logos)
    , m_strings(strings)
{
}

QString DocumentAssembler::outputFileName(const QString &scope, const QString &language)
{
    return scope + QLatin1Char('_') + language.toUpper() + QStringLiteral(".pdf");
}

QString DocumentAssembler::outputPath(const QString &directory, const QString &scope,
                                      const QString &language)
{
    return directory + QLatin1Char('/') + language + QLatin1Char('/')
         + outputFileName(scope, language);
}

QList<DocumentAssembler::PlannedPage>
DocumentAssembler::planPages(const Binder::Document &document) const
{
    QList<PlannedPage> pages;
    for (int s = 0; s < document.sections.size(); ++s) {
        const int cards = document.sections.at(s).cards.size();

        PlannedPage cover;
        cover.kind = PageKind::Cover;
        cover.section = s;
        cover.cardCount = cards;
        pages.append(cover);

        const int gridPages = m_pageLayout.gridPageCount(cards);
        for (int p = 0; p < gridPages; ++p) {
            PlannedPage grid;
            grid.kind = PageKind::Grid;
            grid.section = s;
            grid.firstCard = p * m_pageLayout.capacity();
            grid.cardCount = m_pageLayout.cellsOnPage(cards, p);
            pages.append(grid);
        }
    }
    return pages;
}

bool DocumentAssembler::prepareContext(const Binder::Document &document,
                                       const QString &language, RenderContext *context)
{
    if (!m_fonts) {
        m_errorString = QStringLiteral("No font registry configured");
        return false;
    }

    QString fontError;
    std::optional<QFont> regular = m_fonts->font(language, false, 10.0, &fontError);
    std::optional<QFont> bold = regular ? m_fonts->font(language, true, 10.0, &fontError)
                                        : std::nullopt;
    if (!regular || !bold) {
        m_errorString = QStringLiteral("Cannot render %1 in language %2: %3")
                            .arg(document.scope, language, fontError);
        return false;
    }

    std::optional<QFont> latinRegular = m_fonts->font(QStringLiteral("en"), false, 10.0, &fontError);
    std::optional<QFont> latinBold = m_fonts->font(QStringLiteral("en"), true, 10.0, &fontError);

    context->language = language;
    context->regular = *regular;
    context->bold = *bold;
    context->latinRegular = latinRegular.value_or(*regular);
    context->latinBold = latinBold.value_or(*bold);
    if (!m_projectName.isEmpty())
        context->projectName = m_projectName;
    if (!m_footerCaption.isEmpty())
        context->footerCaption = m_footerCaption;
    context->cache = m_cache;
    return true;
}

bool DocumentAssembler::generate(const Binder::Document &document, const QString &language,
                                 const QString &outputPath)
{
    m_errorString.clear();
    m_pagesWritten = 0;

    RenderContext context;
    if (!prepareContext(document, language, &context)) {
        qWarning() << "DocumentAssembler:" << m_errorString;
        return false;
    }

    // Document-level type names override the shared table for this run only
    StringTable strings = m_strings ? *m_strings : StringTable();
    strings.setTypeOverrides(document.typeTranslations);
    context.strings = &strings;

    TokenCompositor compositor(m_logos, m_cache);
    context.compositor = &compositor;

    const QList<PlannedPage> plan = planPages(document);
    if (plan.isEmpty()) {
        m_errorString = QStringLiteral("Document %1 has no sections").arg(document.scope);
        qWarning() << "DocumentAssembler:" << m_errorString;
        return false;
    }

    QDir().mkpath(QFileInfo(outputPath).absolutePath());
    QSaveFile file(outputPath);
    if (!file.open(QIODevice::WriteOnly)) {
        m_errorString = QStringLiteral("Cannot open %1 for writing: %2")
                            .arg(outputPath, file.errorString());
        qWarning() << "DocumentAssembler:" << m_errorString;
        return false;
    }

    QPdfWriter writer(&file);
    writer.setResolution(72);
    writer.setPageLayout(QPageLayout(QPageSize(m_pageLayout.pageSizeId),
                                     QPageLayout::Portrait, QMarginsF(0, 0, 0, 0)));
    writer.setCreator(QStringLiteral("CardBinder"));
    writer.setTitle(document.scope + QLatin1Char(' ') + language.toUpper());

    QPainter painter;
    if (!painter.begin(&writer)) {
        m_errorString = QStringLiteral("Cannot start PDF output for %1").arg(outputPath);
        qWarning() << "DocumentAssembler:" << m_errorString;
        file.cancelWriting();
        return false;
    }
    painter.setRenderHint(QPainter::Antialiasing, true);

    CoverRenderer cover(context, m_pageLayout.pageSizePoints());
    bool ok = true;

    for (int i = 0; i < plan.size() && ok; ++i) {
        const PlannedPage &page = plan.at(i);
        if (i > 0 && !writer.newPage()) {
            m_errorString = QStringLiteral("Cannot add page %1 to %2").arg(i + 1).arg(outputPath);
            ok = false;
            break;
        }

        if (page.kind == PageKind::Cover) {
            const Binder::Section &section = document.sections.at(page.section);
            ok = cover.render(&painter, section, page.cardCount,
                              CoverRenderer::featuredFor(section));
            if (!ok)
                m_errorString = cover.errorString();
        } else {
            ok = renderGridPage(&painter, page, document, context);
        }

        if (ok)
            ++m_pagesWritten;
    }

    painter.end();

    if (!ok) {
        file.cancelWriting();
        qWarning() << "DocumentAssembler: Aborted" << outputPath << "-" << m_errorString;
        return false;
    }

    if (!file.commit()) {
        m_errorString = QStringLiteral("Cannot write %1: %2").arg(outputPath, file.errorString());
        qWarning() << "DocumentAssembler:" << m_errorString;
        return false;
    }

    qInfo() << "DocumentAssembler: Wrote" << outputPath << m_pagesWritten << "pages";
    return true;
}

bool DocumentAssembler::renderGridPage(QPainter *painter, const PlannedPage &page,
                                       const Binder::Document &document,
                                       const RenderContext &context)
{
    const Binder::Section &section = document.sections.at(page.section);
    CardCellRenderer cells(context);

    for (int i = 0; i < page.cardCount; ++i) {
        const Binder::CardRecord &record = section.cards.at(page.firstCard + i);
        if (!cells.render(painter, record, section, m_pageLayout.cellRect(i))) {
            m_errorString = QStringLiteral("Section %1: %2").arg(section.id, cells.errorString());
            return false;
        }
    }

    GridOverlay::drawFooter(painter, m_pageLayout, context.latinRegular, context.footerCaption);
    GridOverlay::drawCuttingGuides(painter, m_pageLayout);
    return true;
}
