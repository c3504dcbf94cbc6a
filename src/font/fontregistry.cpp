/*
 * fontregistry.cpp - Per-language font selection for generated documents
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "fontregistry.h"

#include <QDebug>
#include <QFile>
#include <QFileInfo>
#include <QFontDatabase>

#include <fontconfig/fontconfig.h>

namespace {

struct ScriptProbe {
    const char *language;
    const char *fcLang;     // fontconfig language tag
    char32_t sample;        // code point the face must cover
    const char *familyHint; // preferred face in multi-region collections
};

const ScriptProbe kProbes[] = {
    {"ja",      "ja",    U'あ', "JP"},  // HIRAGANA A
    {"ko",      "ko",    U'한', "KR"},  // HANGUL HAN
    {"zh_hans", "zh-cn", U'简', "SC"},  // simplified "jian"
    {"zh_hant", "zh-tw", U'繁', "TC"},  // traditional "fan"
};

const char *const kLatinLanguages[] = {"de", "en", "es", "fr", "it"};

const ScriptProbe *probeFor(const QString &language)
{
    for (const ScriptProbe &probe : kProbes) {
        if (language == QLatin1String(probe.language))
            return &probe;
    }
    return nullptr;
}

} // namespace

FontRegistry::FontRegistry(const QString &latinFamily, const QStringList &collectionPaths)
    : m_latinFamily(latinFamily)
    , m_collectionPaths(collectionPaths)
{
    FT_Error err = FT_Init_FreeType(&m_ftLibrary);
    if (err) {
        qWarning() << "FontRegistry: Failed to initialize FreeType:" << err;
        m_ftLibrary = nullptr;
    }
}

FontRegistry::~FontRegistry()
{
    if (m_ftLibrary) {
        FT_Done_FreeType(m_ftLibrary);
        m_ftLibrary = nullptr;
    }
}

QStringList FontRegistry::defaultCollectionPaths()
{
    return {
        QStringLiteral("/System/Library/Fonts/Supplemental/Songti.ttc"),
        QStringLiteral("/usr/share/fonts/opentype/noto/NotoSansCJK-Bold.ttc"),
        QStringLiteral("/usr/share/fonts/opentype/noto/NotoSansCJK-Regular.ttc"),
        QStringLiteral("/usr/share/fonts/truetype/noto/NotoSansCJK-Bold.ttc"),
        QStringLiteral("/usr/share/fonts/truetype/noto/NotoSansCJK-Regular.ttc"),
        QStringLiteral("/usr/share/fonts/noto-cjk/NotoSansCJK-Bold.ttc"),
        QStringLiteral("/usr/share/fonts/noto-cjk/NotoSansCJK-Regular.ttc"),
        QStringLiteral("/usr/share/fonts/truetype/wqy/wqy-zenhei.ttc"),
        QStringLiteral("/usr/share/fonts/truetype/wqy/wqy-microhei.ttc"),
        QStringLiteral("/usr/share/fonts/wenquanyi/wqy-zenhei.ttc"),
        QStringLiteral("/usr/share/fonts/wenquanyi/wqy-microhei.ttc"),
    };
}

QStringList FontRegistry::supportedLanguages()
{
    QStringList languages;
    for (const char *lang : kLatinLanguages)
        languages << QLatin1String(lang);
    for (const ScriptProbe &probe : kProbes)
        languages << QLatin1String(probe.language);
    return languages;
}

bool FontRegistry::isLogographic(const QString &language)
{
    return probeFor(language) != nullptr;
}

bool FontRegistry::isSupportedLanguage(const QString &language)
{
    return supportedLanguages().contains(language);
}

QString FontRegistry::substituteSymbols(const QString &text, const QString &language)
{
    if (isLogographic(language))
        return text;
    QString result = text;
    result.replace(QChar(0x2642), QStringLiteral("(M)"));
    result.replace(QChar(0x2640), QStringLiteral("(F)"));
    return result;
}

// --- Discovery ---

std::optional<FontRegistry::FaceMatch>
FontRegistry::probeCollection(const QString &path, const QString &language) const
{
    const ScriptProbe *probe = probeFor(language);
    if (!probe || !m_ftLibrary || !QFileInfo::exists(path))
        return std::nullopt;

    const QByteArray encodedPath = QFile::encodeName(path);
    FT_Face face = nullptr;
    if (FT_New_Face(m_ftLibrary, encodedPath.constData(), 0, &face)) {
        qWarning() << "FontRegistry: FreeType cannot open" << path;
        return std::nullopt;
    }
    const FT_Long faceCount = face->num_faces;
    FT_Done_Face(face);

    std::optional<FaceMatch> fallback;
    for (FT_Long index = 0; index < faceCount; ++index) {
        if (FT_New_Face(m_ftLibrary, encodedPath.constData(), index, &face))
            continue;

        const bool covers = FT_Get_Char_Index(face, probe->sample) != 0;
        const QString familyName = face->family_name
            ? QString::fromUtf8(face->family_name) : QString();
        FT_Done_Face(face);

        if (!covers || familyName.isEmpty())
            continue;
        FaceMatch match{path, familyName};
        if (familyName.contains(QLatin1String(probe->familyHint)))
            return match;
        if (!fallback)
            fallback = match;
    }
    return fallback;
}

QStringList FontRegistry::fontconfigCollections(FcConfig *config, const QString &language)
{
    const ScriptProbe *probe = probeFor(language);
    if (!probe || !config)
        return {};

    QStringList paths;

    FcPattern *pat = FcPatternCreate();
    FcLangSet *langs = FcLangSetCreate();
    FcLangSetAdd(langs, reinterpret_cast<const FcChar8 *>(probe->fcLang));
    FcPatternAddLangSet(pat, FC_LANG, langs);
    FcObjectSet *objects = FcObjectSetBuild(FC_FILE, nullptr);

    FcFontSet *fonts = FcFontList(config, pat, objects);
    if (fonts) {
        for (int i = 0; i < fonts->nfont; ++i) {
            FcChar8 *file = nullptr;
            if (FcPatternGetString(fonts->fonts[i], FC_FILE, 0, &file) != FcResultMatch || !file)
                continue;
            const QString path = QString::fromUtf8(reinterpret_cast<const char *>(file));
            if ((path.endsWith(QLatin1String(".ttc"), Qt::CaseInsensitive)
                 || path.endsWith(QLatin1String(".otc"), Qt::CaseInsensitive))
                && !paths.contains(path))
                paths << path;
        }
        FcFontSetDestroy(fonts);
    }

    FcObjectSetDestroy(objects);
    FcLangSetDestroy(langs);
    FcPatternDestroy(pat);

    paths.sort();
    return paths;
}

bool FontRegistry::registerCollection(const QString &path)
{
    if (m_registeredIds.contains(path))
        return true;

    const int id = QFontDatabase::addApplicationFont(path);
    if (id < 0) {
        qWarning() << "FontRegistry: QFontDatabase rejected" << path;
        return false;
    }
    m_registeredIds.insert(path, id);
    qDebug() << "FontRegistry: Registered" << path
             << QFontDatabase::applicationFontFamilies(id);
    return true;
}

void FontRegistry::registerFonts()
{
    if (m_registered)
        return;
    m_registered = true;

    FcConfig *config = nullptr;
    if (m_useFontconfig) {
        ++m_fontconfigLoads;
        config = FcInitLoadConfigAndFonts();
        if (!config)
            qWarning() << "FontRegistry: fontconfig configuration could not be loaded";
    }

    for (const ScriptProbe &probe : kProbes) {
        const QString language = QLatin1String(probe.language);

        QStringList candidates = m_collectionPaths;
        candidates += fontconfigCollections(config, language);

        std::optional<FaceMatch> match;
        for (const QString &path : std::as_const(candidates)) {
            match = probeCollection(path, language);
            if (match)
                break;
        }

        if (!match) {
            qWarning() << "FontRegistry: No outline collection covers" << language;
            continue;
        }
        if (!registerCollection(match->path))
            continue;

        // Register the bold sibling of a regular collection (and vice versa)
        // so QFont can pick real bold faces from the same family.
        for (const QString &path : std::as_const(candidates)) {
            if (path != match->path
                && QFileInfo(path).absolutePath() == QFileInfo(match->path).absolutePath()
                && probeCollection(path, language))
                registerCollection(path);
        }

        m_logographic.insert(language, *match);
    }

    if (config)
        FcConfigDestroy(config);
}

// --- Lookup ---

QString FontRegistry::family(const QString &language) const
{
    if (isLogographic(language))
        return m_logographic.value(language).family;
    if (isSupportedLanguage(language))
        return m_latinFamily;
    return {};
}

QString FontRegistry::collectionPath(const QString &language) const
{
    return m_logographic.value(language).path;
}

std::optional<QFont> FontRegistry::font(const QString &language, bool bold,
                                        qreal pointSize, QString *errorMessage)
{
    if (!isSupportedLanguage(language)) {
        if (errorMessage)
            *errorMessage = QStringLiteral("Unsupported language \"%1\"").arg(language);
        return std::nullopt;
    }

    registerFonts();

    const QString familyName = family(language);
    if (familyName.isEmpty()) {
        if (errorMessage)
            *errorMessage = QStringLiteral("No font collection available for language \"%1\"")
                                .arg(language);
        return std::nullopt;
    }

    QFont font(familyName);
    font.setPointSizeF(pointSize);
    font.setBold(bold);
    font.setStyleHint(QFont::SansSerif);
    return font;
}
