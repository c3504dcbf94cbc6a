/*
 * assetcache.cpp - Two-tier bitmap cache with LRU eviction
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "assetcache.h"
#include "assetfetcher.h"

#include <QBuffer>
#include <QCryptographicHash>
#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QImageReader>
#include <QImageWriter>
#include <QPainter>
#include <QRegularExpression>
#include <QSaveFile>
#include <QUrl>

AssetCache::AssetCache(const Options &options, AssetFetcher *fetcher)
    : m_options(options)
    , m_fetcher(fetcher)
{
    if (m_options.maxEntries < 1)
        m_options.maxEntries = 1;
}

// --- Keys and paths ---

QString AssetCache::variantIdentifier(const QString &source)
{
    QString path = source;
    const QUrl url(source);
    if (url.isValid() && url.scheme().size() > 1)
        path = url.path();

    const QStringList segments = path.split(QLatin1Char('/'), Qt::SkipEmptyParts);
    if (segments.isEmpty())
        return QStringLiteral("default");

    static const QRegularExpression extension(
        QStringLiteral("\\.(png|jpe?g|webp|gif)$"),
        QRegularExpression::CaseInsensitiveOption);
    static const QRegularExpression numeric(QStringLiteral("^\\d+$"));
    static const QRegularExpression unsafe(QStringLiteral("[^A-Za-z0-9._-]"));

    auto distinctive = [](const QString &segment) {
        return !segment.isEmpty()
            && (numeric.match(segment).hasMatch() || segment.contains(QLatin1Char('-')));
    };

    QString leaf = segments.last();
    leaf.remove(extension);

    QString variant;
    if (distinctive(leaf)) {
        variant = leaf;
    } else if (segments.size() >= 2 && distinctive(segments.at(segments.size() - 2))) {
        const QString parent = segments.at(segments.size() - 2);
        variant = leaf.isEmpty() ? parent : parent + QLatin1Char('-') + leaf;
    } else {
        return QStringLiteral("default");
    }

    variant.replace(unsafe, QStringLiteral("_"));
    return variant;
}

CacheKey AssetCache::keyFor(int id, const QString &source, SizeClass sizeClass) const
{
    return CacheKey{id, variantIdentifier(source), sizeClass};
}

QString AssetCache::diskPath(const CacheKey &key) const
{
    if (m_options.directory.isEmpty())
        return {};
    const QString suffix = key.sizeClass == SizeClass::Featured
        ? QStringLiteral("_featured.jpg") : QStringLiteral("_thumb.jpg");
    return m_options.directory
        + QStringLiteral("/pokemon_") + QString::number(key.id)
        + QLatin1Char('/') + key.variant + suffix;
}

int AssetCache::edgeFor(SizeClass sizeClass) const
{
    return sizeClass == SizeClass::Featured ? m_options.featuredEdge : m_options.cellEdge;
}

// --- Image processing ---

QImage AssetCache::normalize(const QImage &image, int edge)
{
    if (image.isNull())
        return {};

    if (edge <= 0)
        edge = qMax(image.width(), image.height());

    // Fit inside the square and center it on a white canvas
    const QImage fitted = image.scaled(edge, edge, Qt::KeepAspectRatio,
                                       Qt::SmoothTransformation);

    QImage canvas(edge, edge, QImage::Format_RGB32);
    canvas.fill(Qt::white);
    QPainter painter(&canvas);
    painter.drawImage((edge - fitted.width()) / 2, (edge - fitted.height()) / 2, fitted);
    painter.end();

    return canvas.convertToFormat(QImage::Format_RGB888);
}

// --- Lookup ---

QImage AssetCache::get(int id, const QString &source, SizeClass sizeClass)
{
    if (source.isEmpty())
        return {};

    const CacheKey key = keyFor(id, source, sizeClass);

    auto it = m_entries.find(key);
    if (it != m_entries.end()) {
        it->lastAccess = ++m_accessCounter;
        ++m_memoryHits;
        return it->image;
    }

    const QString path = diskPath(key);
    if (!path.isEmpty() && QFileInfo::exists(path)) {
        QImage image = loadFromDisk(path);
        if (!image.isNull()) {
            ++m_diskHits;
            qDebug() << "AssetCache: Disk hit" << path;
            insert(key, image, path);
            return image;
        }
    }

    if (AssetFetcher::isRemote(source)) {
        if (!m_options.networkFallback) {
            qWarning() << "AssetCache: Not cached and network fallback disabled:" << source;
            return {};
        }
        qWarning() << "AssetCache: Cache miss, downloading" << source;
    }

    QByteArray bytes;
    if (!fetchBytes(source, &bytes))
        return {};
    return storeFetched(bytes, key, source);
}

QImage AssetCache::loadFromDisk(const QString &path)
{
    QImage image(path);
    if (image.isNull()) {
        qWarning() << "AssetCache: Discarding unreadable cache file" << path;
        QFile::remove(path);
        return {};
    }
    return image.convertToFormat(QImage::Format_RGB888);
}

bool AssetCache::fetchBytes(const QString &source, QByteArray *bytes)
{
    if (!m_fetcher)
        return false;

    ++m_fetches;
    QString error;
    if (!m_fetcher->fetch(source, bytes, &error)) {
        qWarning() << "AssetCache:" << error;
        return false;
    }
    return true;
}

QImage AssetCache::storeFetched(const QByteArray &bytes, const CacheKey &key,
                                const QString &source)
{
    QImage decoded = QImage::fromData(bytes);
    if (decoded.isNull()) {
        qWarning() << "AssetCache: Cannot decode image from" << source;
        return {};
    }

    const QImage normalized = normalize(decoded, edgeFor(key.sizeClass));

    QByteArray encoded;
    QBuffer buffer(&encoded);
    buffer.open(QIODevice::WriteOnly);
    QImageWriter writer(&buffer, "jpg");
    writer.setQuality(m_options.jpegQuality);
    if (!writer.write(normalized)) {
        qWarning() << "AssetCache: JPEG encoding failed for" << source << writer.errorString();
        return {};
    }
    buffer.close();

    const QString path = diskPath(key);
    if (!path.isEmpty()) {
        QDir().mkpath(QFileInfo(path).absolutePath());
        QSaveFile file(path);
        if (!file.open(QIODevice::WriteOnly)
            || file.write(encoded) != encoded.size()
            || !file.commit()) {
            qWarning() << "AssetCache: Cannot write" << path << file.errorString();
        }
    }

    // Decode what was written so memory and disk agree pixel for pixel
    QImage stored = QImage::fromData(encoded, "JPG").convertToFormat(QImage::Format_RGB888);
    if (stored.isNull())
        return {};

    insert(key, stored, path);
    return stored;
}

QImage AssetCache::inlineImage(const QString &source)
{
    if (source.isEmpty())
        return {};

    auto it = m_inlineImages.constFind(source);
    if (it != m_inlineImages.constEnd()) {
        ++m_memoryHits;
        return it.value();
    }

    QString path;
    if (!m_options.directory.isEmpty()) {
        const QByteArray hash = QCryptographicHash::hash(source.toUtf8(),
                                                         QCryptographicHash::Sha1);
        path = m_options.directory + QStringLiteral("/inline/")
             + QString::fromLatin1(hash.toHex()) + QStringLiteral(".png");
        if (QFileInfo::exists(path)) {
            QImage image(path);
            if (!image.isNull()) {
                ++m_diskHits;
                image = image.convertToFormat(QImage::Format_ARGB32);
                m_inlineImages.insert(source, image);
                return image;
            }
        }
    }

    if (AssetFetcher::isRemote(source) && !m_options.networkFallback) {
        qWarning() << "AssetCache: Inline image not cached and network fallback disabled:" << source;
        return {};
    }

    QByteArray bytes;
    if (!fetchBytes(source, &bytes))
        return {};

    QImage image = QImage::fromData(bytes);
    if (image.isNull()) {
        qWarning() << "AssetCache: Cannot decode inline image" << source;
        return {};
    }
    image = image.convertToFormat(QImage::Format_ARGB32);

    if (!path.isEmpty()) {
        QDir().mkpath(QFileInfo(path).absolutePath());
        QSaveFile file(path);
        if (!file.open(QIODevice::WriteOnly) || !image.save(&file, "PNG") || !file.commit())
            qWarning() << "AssetCache: Cannot write" << path;
    }

    m_inlineImages.insert(source, image);
    return image;
}

// --- LRU ---

void AssetCache::insert(const CacheKey &key, const QImage &image, const QString &path)
{
    CacheEntry entry;
    entry.image = image;
    entry.diskPath = path;
    entry.lastAccess = ++m_accessCounter;
    m_entries.insert(key, entry);
    evictIfNeeded();
}

void AssetCache::evictIfNeeded()
{
    while (m_entries.size() > m_options.maxEntries) {
        auto lruIt = m_entries.begin();
        for (auto it = m_entries.begin(); it != m_entries.end(); ++it) {
            if (it->lastAccess < lruIt->lastAccess)
                lruIt = it;
        }
        qDebug() << "AssetCache: Evicting" << lruIt.key().id << lruIt.key().variant;
        m_entries.erase(lruIt);
    }
}

void AssetCache::clearMemory()
{
    m_entries.clear();
    m_inlineImages.clear();
}
