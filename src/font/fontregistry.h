/*
 * fontregistry.h - Per-language font selection for generated documents
 *
 * Latin-script languages use a built-in sans family.  Logographic
 * languages (ja, ko, zh_hans, zh_hant) need an outline font collection
 * (.ttc/.otc); it is located from a candidate path list, then through
 * fontconfig, probed with FreeType for the face that covers each
 * script, and registered once with QFontDatabase.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef CARDBINDER_FONTREGISTRY_H
#define CARDBINDER_FONTREGISTRY_H

#include <QFont>
#include <QHash>
#include <QString>
#include <QStringList>

#include <optional>

#include <fontconfig/fontconfig.h>
#include <ft2build.h>
#include FT_FREETYPE_H

class FontRegistry
{
public:
    explicit FontRegistry(const QString &latinFamily = QStringLiteral("Helvetica"),
                          const QStringList &collectionPaths = defaultCollectionPaths());
    ~FontRegistry();

    FontRegistry(const FontRegistry &) = delete;
    FontRegistry &operator=(const FontRegistry &) = delete;

    // Discover and register collections.  Safe to call repeatedly; a
    // missing collection is logged, not fatal.
    void registerFonts();
    bool isRegistered() const { return m_registered; }

    // Font for the language at the given size.  Empty on an unknown
    // language or when no collection covers a logographic language;
    // errorMessage then names the language.
    std::optional<QFont> font(const QString &language, bool bold, qreal pointSize,
                              QString *errorMessage = nullptr);

    // Family name chosen for a language, empty if unavailable.
    QString family(const QString &language) const;
    QString collectionPath(const QString &language) const;

    void setFontconfigEnabled(bool enabled) { m_useFontconfig = enabled; }
    int fontconfigLoads() const { return m_fontconfigLoads; }

    static bool isSupportedLanguage(const QString &language);
    static bool isLogographic(const QString &language);
    static QStringList supportedLanguages();
    static QStringList defaultCollectionPaths();

    // Latin fonts lack the gender glyphs; spell them out instead.
    static QString substituteSymbols(const QString &text, const QString &language);

    // Sorted .ttc/.otc files that fontconfig lists for the language.
    static QStringList fontconfigCollections(FcConfig *config, const QString &language);

private:
    struct FaceMatch {
        QString path;
        QString family;
    };

    std::optional<FaceMatch> probeCollection(const QString &path,
                                             const QString &language) const;
    bool registerCollection(const QString &path);

    QString m_latinFamily;
    QStringList m_collectionPaths;
    bool m_useFontconfig = true;
    bool m_registered = false;
    int m_fontconfigLoads = 0;

    QHash<QString, FaceMatch> m_logographic;   // language -> chosen face
    QHash<QString, int> m_registeredIds;       // collection path -> QFontDatabase id
    FT_Library m_ftLibrary = nullptr;
};

#endif // CARDBINDER_FONTREGISTRY_H
