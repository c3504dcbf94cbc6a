/*
 * stringtable.h - Read-only translation table for generated documents
 *
 * Backed by a JSON file of the form
 *   { "ui":    { "<lang>": { "<key>": "<text>" } },
 *     "types": { "<lang>": { "<English type>": "<text>" } } }
 * Lookups fall back to English, then to the caller's default text,
 * then to the key itself.  Text may
 * carry {{name}} placeholders.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef CARDBINDER_STRINGTABLE_H
#define CARDBINDER_STRINGTABLE_H

#include <QHash>
#include <QJsonObject>
#include <QString>
#include <QVariantHash>

class StringTable
{
public:
    bool loadFile(const QString &path, QString *errorMessage = nullptr);
    void loadJson(const QJsonObject &root);

    QString translate(const QString &key, const QString &language,
                      const QVariantHash &args = {},
                      const QString &defaultText = QString()) const;
    QString typeName(const QString &englishType, const QString &language) const;

    // Per-document type overrides (type_translations); these win over the file.
    void setTypeOverrides(const QHash<QString, QHash<QString, QString>> &overrides);

    bool isEmpty() const { return m_ui.isEmpty() && m_types.isEmpty(); }

    static QString substitute(QString text, const QVariantHash &args);

private:
    using Table = QHash<QString, QHash<QString, QString>>; // lang -> key -> text

    Table m_ui;
    Table m_types;
    Table m_typeOverrides;
};

#endif // CARDBINDER_STRINGTABLE_H
