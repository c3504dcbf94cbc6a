/*
 * documentmodel.h - Immutable binder document model
 *
 * A Document is an ordered list of Sections; each Section owns its
 * cards, featured artwork and cover settings.  Everything here is
 * plain data filled in once by DocumentLoader and never mutated by
 * the renderers.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef CARDBINDER_DOCUMENTMODEL_H
#define CARDBINDER_DOCUMENTMODEL_H

#include <QColor>
#include <QHash>
#include <QList>
#include <QString>
#include <QStringList>

namespace Binder {

// Upstream card shape, resolved once at load time.
enum class CardKind {
    LegacyWrapped,  // nested "tcg_card" object
    FlatSetCard,    // flat set card carrying "localId"
    CatalogEntry,   // plain catalog entry with an artwork URL
};

enum class TitleMode {
    WithSubtitle,
    NoSubtitle,
    Separator,
    SeparatorWithSubtitle,
};

struct CardRecord {
    int numericId = 0;
    QString displayId;                 // "#" is prepended when drawn
    QHash<QString, QString> names;     // language -> localized name
    QString englishName;
    QStringList types;                 // one or two category tags
    QString artwork;                   // URL or local path

    // Per-record overrides; the has* flags distinguish "empty" from "unset"
    bool hasPrefix = false;
    QString prefix;
    bool hasSuffix = false;
    QString suffix;

    QString pairedForm;                // "X" / "Y"
    bool delta = false;
    CardKind kind = CardKind::CatalogEntry;

    QString name(const QString &language) const
    {
        QString localized = names.value(language);
        if (!localized.isEmpty())
            return localized;
        return englishName;
    }

    QString primaryType() const
    {
        return types.isEmpty() ? QString() : types.first();
    }
};

struct FeaturedArtwork {
    int numericId = 0;
    QString artwork;
    QString caption;
};

struct Section {
    QString id;
    QHash<QString, QString> titles;     // language -> title
    QHash<QString, QString> subtitles;  // language -> subtitle
    QColor color{0xA8, 0xA8, 0x78};
    TitleMode titleMode = TitleMode::NoSubtitle;
    QString separatorTitle;             // overrides the title in separator modes

    QList<CardRecord> cards;
    QList<FeaturedArtwork> featured;    // at most three are drawn
    QList<int> iconicIds;               // used when featured is empty

    bool hasPrefix = false;
    QString prefix;
    bool hasSuffix = false;
    QString suffix;

    bool hasRange = false;
    int rangeStart = 0;
    int rangeEnd = 0;

    static constexpr int kMaxFeatured = 3;

    QString title(const QString &language) const
    {
        return localized(titles, language);
    }

    QString subtitle(const QString &language) const
    {
        return localized(subtitles, language);
    }

private:
    static QString localized(const QHash<QString, QString> &map, const QString &language)
    {
        QString value = map.value(language);
        if (value.isEmpty())
            value = map.value(QStringLiteral("en"));
        return value;
    }
};

struct Document {
    QString scope;                      // output identifier, e.g. "national"
    QString language{QStringLiteral("en")};
    QStringList availableLanguages;     // empty = no restriction
    QList<Section> sections;

    // type_translations embedded in the document: language -> English -> text
    QHash<QString, QHash<QString, QString>> typeTranslations;

    bool supportsLanguage(const QString &lang) const
    {
        return availableLanguages.isEmpty() || availableLanguages.contains(lang);
    }

    int cardCount() const
    {
        int count = 0;
        for (const Section &section : sections)
            count += section.cards.size();
        return count;
    }
};

} // namespace Binder

#endif // CARDBINDER_DOCUMENTMODEL_H
