/*
 * documentloader.cpp - Parse a binder JSON document into Binder::Document
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "documentloader.h"

#include <QDebug>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QRegularExpression>

#include <algorithm>
#include <climits>

using namespace Binder;

// --- Helpers ---

// "#003_EX1" -> 3, "25" -> 25, 151 -> 151
static int parseNumericId(const QJsonValue &value)
{
    if (value.isDouble())
        return value.toInt();
    if (!value.isString())
        return 0;

    static const QRegularExpression leadingDigits(QStringLiteral("^#?0*(\\d+)"));
    QRegularExpressionMatch m = leadingDigits.match(value.toString().trimmed());
    return m.hasMatch() ? m.captured(1).toInt() : 0;
}

static QString displayIdFor(const QJsonValue &value)
{
    if (value.isDouble())
        return QString::asprintf("%03d", value.toInt());
    QString text = value.toString().trimmed();
    if (text.startsWith(QLatin1Char('#')))
        text.remove(0, 1);
    return text;
}

static QHash<QString, QString> parseLocalizedMap(const QJsonValue &value)
{
    QHash<QString, QString> map;
    const QJsonObject obj = value.toObject();
    for (auto it = obj.begin(); it != obj.end(); ++it) {
        if (it.value().isString())
            map.insert(it.key(), it.value().toString());
    }
    return map;
}

// Reads a string field that may also be null; null counts as "not set".
static bool readOptionalString(const QJsonObject &obj, const QString &key,
                               QString *out)
{
    QJsonValue v = obj.value(key);
    if (!v.isString())
        return false;
    *out = v.toString();
    return true;
}

static bool naturalKeyLess(const QString &a, const QString &b)
{
    static const QRegularExpression number(QStringLiteral("(\\d+)"));
    QRegularExpressionMatch ma = number.match(a);
    QRegularExpressionMatch mb = number.match(b);
    if (ma.hasMatch() && mb.hasMatch()) {
        const QString prefixA = a.left(ma.capturedStart(1));
        const QString prefixB = b.left(mb.capturedStart(1));
        if (prefixA == prefixB) {
            const qlonglong na = ma.captured(1).toLongLong();
            const qlonglong nb = mb.captured(1).toLongLong();
            if (na != nb)
                return na < nb;
        }
    }
    return a < b;
}

// --- DocumentLoader ---

bool DocumentLoader::loadFile(const QString &path, Document *document)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        m_errorString = QStringLiteral("Cannot open %1: %2").arg(path, file.errorString());
        qWarning() << "DocumentLoader:" << m_errorString;
        return false;
    }
    if (!loadData(file.readAll(), document))
        return false;
    if (document->scope.isEmpty())
        document->scope = QFileInfo(path).completeBaseName();
    return true;
}

bool DocumentLoader::loadData(const QByteArray &json, Document *document)
{
    QJsonParseError parseError;
    QJsonDocument doc = QJsonDocument::fromJson(json, &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        m_errorString = QStringLiteral("Invalid document JSON at offset %1: %2")
                            .arg(parseError.offset)
                            .arg(parseError.errorString());
        qWarning() << "DocumentLoader:" << m_errorString;
        return false;
    }
    return loadObject(doc.object(), document);
}

bool DocumentLoader::loadObject(const QJsonObject &root, Document *document)
{
    m_errorString.clear();
    Document result;

    result.scope = root.value(QLatin1String("scope")).toString();
    result.language = root.value(QLatin1String("language")).toString(QStringLiteral("en"));

    const QJsonArray langs = root.value(QLatin1String("available_languages")).toArray();
    for (const QJsonValue &lang : langs)
        result.availableLanguages.append(lang.toString());

    const QJsonObject typeTr = root.value(QLatin1String("type_translations")).toObject();
    for (auto it = typeTr.begin(); it != typeTr.end(); ++it)
        result.typeTranslations.insert(it.key(), parseLocalizedMap(it.value()));

    const QJsonValue sections = root.value(QLatin1String("sections"));
    if (sections.isArray()) {
        const QJsonArray arr = sections.toArray();
        for (int i = 0; i < arr.size(); ++i) {
            const QJsonObject obj = arr.at(i).toObject();
            QString key = obj.value(QLatin1String("id")).toString();
            if (key.isEmpty())
                key = QString::number(i + 1);
            result.sections.append(parseSection(key, obj, result.language));
        }
    } else if (sections.isObject()) {
        const QJsonObject obj = sections.toObject();
        QStringList keys = obj.keys();
        std::stable_sort(keys.begin(), keys.end(), [&obj](const QString &a, const QString &b) {
            const int oa = obj.value(a).toObject().value(QLatin1String("section_order")).toInt(INT_MAX);
            const int ob = obj.value(b).toObject().value(QLatin1String("section_order")).toInt(INT_MAX);
            if (oa != ob)
                return oa < ob;
            return naturalKeyLess(a, b);
        });
        for (const QString &key : keys)
            result.sections.append(parseSection(key, obj.value(key).toObject(), result.language));
    } else {
        m_errorString = QStringLiteral("Document has no \"sections\"");
        qWarning() << "DocumentLoader:" << m_errorString;
        return false;
    }

    *document = result;
    return true;
}

CardKind DocumentLoader::detectKind(const QJsonObject &card)
{
    if (card.value(QLatin1String("tcg_card")).isObject())
        return CardKind::LegacyWrapped;
    if (card.contains(QLatin1String("localId")))
        return CardKind::FlatSetCard;
    return CardKind::CatalogEntry;
}

TitleMode DocumentLoader::parseTitleMode(const QString &mode)
{
    if (mode == QLatin1String("no_subtitle"))
        return TitleMode::NoSubtitle;
    if (mode == QLatin1String("separator"))
        return TitleMode::Separator;
    if (mode == QLatin1String("separator_with_subtitle"))
        return TitleMode::SeparatorWithSubtitle;
    return TitleMode::WithSubtitle;
}

Section DocumentLoader::parseSection(const QString &key, const QJsonObject &obj,
                                     const QString &language) const
{
    Section section;
    section.id = key;

    const QJsonValue title = obj.value(QLatin1String("title"));
    if (title.isObject())
        section.titles = parseLocalizedMap(title);
    else if (title.isString())
        section.titles.insert(QStringLiteral("en"), title.toString());

    const QJsonValue subtitle = obj.value(QLatin1String("subtitle"));
    if (subtitle.isObject())
        section.subtitles = parseLocalizedMap(subtitle);
    else if (subtitle.isString())
        section.subtitles.insert(QStringLiteral("en"), subtitle.toString());

    const QString color = obj.value(QLatin1String("color")).toString();
    if (QColor::isValidColorName(color))
        section.color = QColor::fromString(color);

    section.titleMode = parseTitleMode(obj.value(QLatin1String("title_mode")).toString());
    section.separatorTitle = obj.value(QLatin1String("section_title")).toString();

    section.hasPrefix = readOptionalString(obj, QStringLiteral("prefix"), &section.prefix);
    section.hasSuffix = readOptionalString(obj, QStringLiteral("suffix"), &section.suffix);

    const QJsonArray range = obj.value(QLatin1String("range")).toArray();
    if (range.size() == 2) {
        section.hasRange = true;
        section.rangeStart = range.at(0).toInt();
        section.rangeEnd = range.at(1).toInt();
    }

    const QJsonArray cards = obj.value(QLatin1String("cards")).toArray();
    for (const QJsonValue &card : cards)
        section.cards.append(parseCard(card.toObject(), language));

    const QJsonArray featured = obj.value(QLatin1String("featured_elements")).toArray();
    for (const QJsonValue &value : featured) {
        const QJsonObject f = value.toObject();
        FeaturedArtwork art;
        art.numericId = parseNumericId(f.value(QLatin1String("pokemon_id")));
        art.artwork = f.value(QLatin1String("local_image_path")).toString();
        if (art.artwork.isEmpty())
            art.artwork = f.value(QLatin1String("image_url")).toString();
        art.caption = f.value(QLatin1String("pokemon_name")).toString();
        if (!art.artwork.isEmpty())
            section.featured.append(art);
    }

    QJsonArray iconic = obj.value(QLatin1String("iconic_pokemon")).toArray();
    if (iconic.isEmpty())
        iconic = obj.value(QLatin1String("iconic_pokemon_ids")).toArray();
    for (const QJsonValue &id : iconic) {
        const int numeric = parseNumericId(id);
        if (numeric > 0)
            section.iconicIds.append(numeric);
    }

    return section;
}

CardRecord DocumentLoader::parseCard(const QJsonObject &obj, const QString &language) const
{
    CardRecord card;
    card.kind = detectKind(obj);

    // Legacy cards keep their artwork inside the nested object
    const QJsonObject nested = obj.value(QLatin1String("tcg_card")).toObject();

    QJsonValue idValue = obj.value(QLatin1String("pokemon_id"));
    if (idValue.isNull() || idValue.isUndefined())
        idValue = obj.value(QLatin1String("id"));
    card.numericId = parseNumericId(idValue);

    switch (card.kind) {
    case CardKind::FlatSetCard:
        card.displayId = displayIdFor(obj.value(QLatin1String("localId")));
        break;
    case CardKind::LegacyWrapped:
    case CardKind::CatalogEntry:
        if (obj.value(QLatin1String("num")).isString())
            card.displayId = displayIdFor(obj.value(QLatin1String("num")));
        else
            card.displayId = displayIdFor(obj.value(QLatin1String("id")));
        break;
    }
    if (card.displayId.isEmpty() && card.numericId > 0)
        card.displayId = QString::asprintf("%03d", card.numericId);

    // Names: a localized map, name_<lang> fields, or one already-localized string
    const QJsonValue name = obj.value(QLatin1String("name"));
    if (name.isObject())
        card.names = parseLocalizedMap(name);
    for (auto it = obj.begin(); it != obj.end(); ++it) {
        if (it.key().startsWith(QLatin1String("name_")) && it.value().isString())
            card.names.insert(it.key().mid(5), it.value().toString());
    }
    card.englishName = card.names.value(QStringLiteral("en"));
    if (name.isString()) {
        if (!card.names.contains(language))
            card.names.insert(language, name.toString());
        if (card.englishName.isEmpty())
            card.englishName = name.toString();
    }

    const QJsonValue types = obj.value(QLatin1String("types"));
    if (types.isArray()) {
        const QJsonArray arr = types.toArray();
        for (const QJsonValue &t : arr) {
            if (!t.toString().isEmpty())
                card.types.append(t.toString());
        }
    } else if (obj.value(QLatin1String("type")).isString()) {
        card.types.append(obj.value(QLatin1String("type")).toString());
    }

    card.artwork = obj.value(QLatin1String("image_path")).toString();
    if (card.artwork.isEmpty())
        card.artwork = obj.value(QLatin1String("image_url")).toString();
    if (card.artwork.isEmpty() && card.kind == CardKind::LegacyWrapped) {
        card.artwork = nested.value(QLatin1String("image_url")).toString();
        if (card.artwork.isEmpty())
            card.artwork = nested.value(QLatin1String("image")).toString();
    }

    card.hasPrefix = readOptionalString(obj, QStringLiteral("prefix"), &card.prefix);
    card.hasSuffix = readOptionalString(obj, QStringLiteral("suffix"), &card.suffix);

    const QString form = obj.value(QLatin1String("form")).toString();
    const QString variantForm = obj.value(QLatin1String("variant_form")).toString();
    if (variantForm.compare(QLatin1String("delta"), Qt::CaseInsensitive) == 0)
        card.delta = true;
    if (!form.isEmpty())
        card.pairedForm = form.toUpper();
    else if (variantForm.size() == 1)
        card.pairedForm = variantForm.toUpper();

    return card;
}
