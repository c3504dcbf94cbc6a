/*
 * logolibrary.h - Named inline logos ([EX], [MEGA], ...) on disk
 *
 * Each token has a folder under the logo directory holding one PNG per
 * language plus default.png.  Missing files are not errors; callers
 * get a null image and lay out the surrounding text only.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef CARDBINDER_LOGOLIBRARY_H
#define CARDBINDER_LOGOLIBRARY_H

#include <QHash>
#include <QImage>
#include <QString>
#include <QStringList>

class LogoLibrary
{
public:
    explicit LogoLibrary(const QString &directory = QString());

    void setDirectory(const QString &directory);
    QString directory() const { return m_directory; }

    // Token names without brackets, longest first ("EX_TERA" before "EX").
    static QStringList tokenNames();
    static QString folderFor(const QString &token);

    // <dir>/<folder>/<language>.png, else <dir>/<folder>/default.png
    QString path(const QString &token, const QString &language) const;
    QImage image(const QString &token, const QString &language);

private:
    QString m_directory;
    QHash<QString, QImage> m_images; // resolved path -> image
};

#endif // CARDBINDER_LOGOLIBRARY_H
