/*
 * assetfetcher.cpp - Byte source for the asset cache
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "assetfetcher.h"

#include <QDebug>
#include <QEventLoop>
#include <QFile>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QUrl>

#include <memory>

bool AssetFetcher::isRemote(const QString &source)
{
    return source.startsWith(QLatin1String("http://"))
        || source.startsWith(QLatin1String("https://"));
}

NetworkAssetFetcher::NetworkAssetFetcher(int timeoutMs)
    : m_timeoutMs(timeoutMs)
{
}

bool NetworkAssetFetcher::fetch(const QString &source, QByteArray *data, QString *errorMessage)
{
    if (source.isEmpty()) {
        if (errorMessage)
            *errorMessage = QStringLiteral("Empty asset source");
        return false;
    }
    if (isRemote(source))
        return fetchRemote(source, data, errorMessage);
    return fetchLocal(source, data, errorMessage);
}

bool NetworkAssetFetcher::fetchRemote(const QString &url, QByteArray *data, QString *errorMessage)
{
    QNetworkRequest request{QUrl(url)};
    request.setHeader(QNetworkRequest::UserAgentHeader, m_userAgent);
    request.setAttribute(QNetworkRequest::RedirectPolicyAttribute,
                         QNetworkRequest::NoLessSafeRedirectPolicy);
    request.setTransferTimeout(m_timeoutMs);

    std::unique_ptr<QNetworkReply> reply(m_manager.get(request));

    // Single-threaded pipeline: block here until the transfer settles
    QEventLoop loop;
    QObject::connect(reply.get(), &QNetworkReply::finished, &loop, &QEventLoop::quit);
    if (!reply->isFinished())
        loop.exec();

    const int status = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
    if (reply->error() != QNetworkReply::NoError || (status != 0 && status != 200)) {
        if (errorMessage)
            *errorMessage = QStringLiteral("Download of %1 failed (HTTP %2): %3")
                                .arg(url)
                                .arg(status)
                                .arg(reply->errorString());
        return false;
    }

    *data = reply->readAll();
    return true;
}

bool NetworkAssetFetcher::fetchLocal(const QString &path, QByteArray *data, QString *errorMessage)
{
    QString localPath = path;
    if (path.startsWith(QLatin1String("file:")))
        localPath = QUrl(path).toLocalFile();

    QFile file(localPath);
    if (!file.open(QIODevice::ReadOnly)) {
        if (errorMessage)
            *errorMessage = QStringLiteral("Cannot read %1: %2").arg(localPath, file.errorString());
        return false;
    }
    *data = file.readAll();
    return true;
}
