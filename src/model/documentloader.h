/*
 * documentloader.h - Parse a binder JSON document into Binder::Document
 *
 * Accepts sections as an ordered array or as an object keyed by
 * section id.  Each card's upstream shape (CardKind) is resolved here,
 * once, so the renderers never have to inspect raw JSON.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef CARDBINDER_DOCUMENTLOADER_H
#define CARDBINDER_DOCUMENTLOADER_H

#include <QJsonObject>
#include <QString>

#include "documentmodel.h"

class DocumentLoader
{
public:
    bool loadFile(const QString &path, Binder::Document *document);
    bool loadData(const QByteArray &json, Binder::Document *document);
    bool loadObject(const QJsonObject &root, Binder::Document *document);

    QString errorString() const { return m_errorString; }

    static Binder::CardKind detectKind(const QJsonObject &card);
    static Binder::TitleMode parseTitleMode(const QString &mode);

private:
    Binder::Section parseSection(const QString &key, const QJsonObject &obj,
                                 const QString &language) const;
    Binder::CardRecord parseCard(const QJsonObject &obj,
                                 const QString &language) const;

    QString m_errorString;
};

#endif // CARDBINDER_DOCUMENTLOADER_H
