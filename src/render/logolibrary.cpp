/*
 * logolibrary.cpp - Named inline logos on disk
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "logolibrary.h"

#include <QDebug>
#include <QFileInfo>

LogoLibrary::LogoLibrary(const QString &directory)
    : m_directory(directory)
{
}

void LogoLibrary::setDirectory(const QString &directory)
{
    if (m_directory == directory)
        return;
    m_directory = directory;
    m_images.clear();
}

QStringList LogoLibrary::tokenNames()
{
    return {
        QStringLiteral("EX_TERA"),
        QStringLiteral("EX_NEW"),
        QStringLiteral("MEGA"),
        QStringLiteral("EX"),
        QStringLiteral("M"),
    };
}

QString LogoLibrary::folderFor(const QString &token)
{
    if (token == QLatin1String("EX"))
        return QStringLiteral("ex");
    if (token == QLatin1String("EX_NEW"))
        return QStringLiteral("ex_new");
    if (token == QLatin1String("EX_TERA"))
        return QStringLiteral("ex_tera");
    if (token == QLatin1String("M"))
        return QStringLiteral("m_pokemon");
    if (token == QLatin1String("MEGA"))
        return QStringLiteral("mega_evolution");
    return {};
}

QString LogoLibrary::path(const QString &token, const QString &language) const
{
    const QString folder = folderFor(token);
    if (m_directory.isEmpty() || folder.isEmpty())
        return {};

    const QString base = m_directory + QLatin1Char('/') + folder + QLatin1Char('/');
    const QString localized = base + language + QStringLiteral(".png");
    if (QFileInfo::exists(localized))
        return localized;
    const QString fallback = base + QStringLiteral("default.png");
    if (QFileInfo::exists(fallback))
        return fallback;
    return {};
}

QImage LogoLibrary::image(const QString &token, const QString &language)
{
    const QString file = path(token, language);
    if (file.isEmpty())
        return {};

    auto it = m_images.constFind(file);
    if (it != m_images.constEnd())
        return it.value();

    QImage img(file);
    if (img.isNull())
        qWarning() << "LogoLibrary: Cannot decode" << file;
    m_images.insert(file, img);
    return img;
}
