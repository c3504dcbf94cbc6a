/*
 * documentassembler.h - Writes one binder PDF per (document, language)
 *
 * Plans the page sequence (a cover, then ceil(cards / capacity) grid
 * pages for every section) and paints it onto a QPdfWriter at 72 dpi,
 * so one painter unit is one point.  The file is written through
 * QSaveFile: a failed run leaves no partial output behind.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef CARDBINDER_DOCUMENTASSEMBLER_H
#define CARDBINDER_DOCUMENTASSEMBLER_H

#include <QList>
#include <QString>

#include "documentmodel.h"
#include "pagelayout.h"

class AssetCache;
class FontRegistry;
class LogoLibrary;
class QPainter;
class StringTable;
struct RenderContext;

class DocumentAssembler
{
public:
    enum class PageKind {
        Cover,
        Grid,
    };

    struct PlannedPage {
        PageKind kind = PageKind::Cover;
        int section = 0;
        int firstCard = 0;  // Grid: index into the section's cards
        int cardCount = 0;  // Grid: cells on this page; Cover: cards in the section
    };

    DocumentAssembler(FontRegistry *fonts, AssetCache *cache, LogoLibrary *logos,
                      const StringTable *strings);

    void setPageLayout(const PageLayout &layout) { m_pageLayout = layout; }
    const PageLayout &pageLayout() const { return m_pageLayout; }
    void setProjectName(const QString &name) { m_projectName = name; }
    void setFooterCaption(const QString &caption) { m_footerCaption = caption; }

    QList<PlannedPage> planPages(const Binder::Document &document) const;

    // Returns false on any hard failure; errorString() names the record
    // and language involved.
    bool generate(const Binder::Document &document, const QString &language,
                  const QString &outputPath);

    QString errorString() const { return m_errorString; }
    int pagesWritten() const { return m_pagesWritten; }

    // "<scope>_<LANG>.pdf", e.g. "national_DE.pdf"
    static QString outputFileName(const QString &scope, const QString &language);
    static QString outputPath(const QString &directory, const QString &scope,
                              const QString &language);

private:
    bool prepareContext(const Binder::Document &document, const QString &language,
                        RenderContext *context);
    bool renderGridPage(QPainter *painter, const PlannedPage &page,
                        const Binder::Document &document, const RenderContext &context);

    FontRegistry *m_fonts = nullptr;
    AssetCache *m_cache = nullptr;
    LogoLibrary *m_logos = nullptr;
    const StringTable *m_strings = nullptr;

    PageLayout m_pageLayout;
    QString m_projectName;
    QString m_footerCaption;

    QString m_errorString;
    int m_pagesWritten = 0;
};

#endif // CARDBINDER_DOCUMENTASSEMBLER_H
