/*
 * assetfetcher.h - Byte source for the asset cache
 *
 * AssetFetcher is the seam between AssetCache and the outside world.
 * NetworkAssetFetcher reads http(s) URLs through QNetworkAccessManager
 * (blocking on a local event loop, with a transfer timeout and no
 * retry) and everything else from the local filesystem.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef CARDBINDER_ASSETFETCHER_H
#define CARDBINDER_ASSETFETCHER_H

#include <QByteArray>
#include <QNetworkAccessManager>
#include <QString>

class AssetFetcher
{
public:
    virtual ~AssetFetcher() = default;

    // Read the raw bytes of source (URL or local path).  On failure,
    // returns false and fills errorMessage.
    virtual bool fetch(const QString &source, QByteArray *data, QString *errorMessage) = 0;

    static bool isRemote(const QString &source);
};

class NetworkAssetFetcher : public AssetFetcher
{
public:
    explicit NetworkAssetFetcher(int timeoutMs = 5000);

    bool fetch(const QString &source, QByteArray *data, QString *errorMessage) override;

    void setUserAgent(const QByteArray &agent) { m_userAgent = agent; }
    int timeout() const { return m_timeoutMs; }

private:
    bool fetchRemote(const QString &url, QByteArray *data, QString *errorMessage);
    bool fetchLocal(const QString &path, QByteArray *data, QString *errorMessage);

    QNetworkAccessManager m_manager;
    int m_timeoutMs;
    QByteArray m_userAgent{"CardBinder/1.0"};
};

#endif // CARDBINDER_ASSETFETCHER_H
