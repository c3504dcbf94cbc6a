/*
 * stringtable.cpp - Read-only translation table for generated documents
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "stringtable.h"

#include <QDebug>
#include <QFile>
#include <QJsonDocument>

static const QString kFallbackLanguage = QStringLiteral("en");

static QHash<QString, QHash<QString, QString>> parseTable(const QJsonObject &obj)
{
    QHash<QString, QHash<QString, QString>> table;
    for (auto lang = obj.begin(); lang != obj.end(); ++lang) {
        const QJsonObject entries = lang.value().toObject();
        QHash<QString, QString> &target = table[lang.key()];
        for (auto it = entries.begin(); it != entries.end(); ++it)
            target.insert(it.key(), it.value().toString());
    }
    return table;
}

bool StringTable::loadFile(const QString &path, QString *errorMessage)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        if (errorMessage)
            *errorMessage = QStringLiteral("Cannot open translations %1: %2")
                                .arg(path, file.errorString());
        qWarning() << "StringTable: Cannot open" << path;
        return false;
    }

    QJsonParseError parseError;
    QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        if (errorMessage)
            *errorMessage = QStringLiteral("Invalid translations %1: %2")
                                .arg(path, parseError.errorString());
        qWarning() << "StringTable: Invalid JSON in" << path << parseError.errorString();
        return false;
    }

    loadJson(doc.object());
    return true;
}

void StringTable::loadJson(const QJsonObject &root)
{
    m_ui = parseTable(root.value(QLatin1String("ui")).toObject());
    m_types = parseTable(root.value(QLatin1String("types")).toObject());
}

void StringTable::setTypeOverrides(const QHash<QString, QHash<QString, QString>> &overrides)
{
    m_typeOverrides = overrides;
}

QString StringTable::translate(const QString &key, const QString &language,
                               const QVariantHash &args,
                               const QString &defaultText) const
{
    QString text = m_ui.value(language).value(key);
    if (text.isEmpty())
        text = m_ui.value(kFallbackLanguage).value(key);
    if (text.isEmpty())
        text = defaultText.isEmpty() ? key : defaultText;
    return substitute(text, args);
}

QString StringTable::typeName(const QString &englishType, const QString &language) const
{
    QString text = m_typeOverrides.value(language).value(englishType);
    if (text.isEmpty())
        text = m_types.value(language).value(englishType);
    if (text.isEmpty())
        text = englishType;
    return text;
}

QString StringTable::substitute(QString text, const QVariantHash &args)
{
    for (auto it = args.begin(); it != args.end(); ++it) {
        text.replace(QStringLiteral("{{") + it.key() + QStringLiteral("}}"),
                     it.value().toString());
    }
    return text;
}
