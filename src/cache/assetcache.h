/*
 * assetcache.h - Two-tier bitmap cache with LRU eviction
 *
 * Lookup order is memory, then disk, then the fetcher.  Fetched
 * artwork is flattened onto white, shrunk to the size class's square
 * bound, stored as JPEG under <dir>/pokemon_<id>/ and read back, so
 * the memory tier always holds exactly what the disk tier holds.
 * Eviction only ever drops memory entries.
 *
 * Not thread-safe; the generator is single-threaded.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef CARDBINDER_ASSETCACHE_H
#define CARDBINDER_ASSETCACHE_H

#include <QHash>
#include <QImage>
#include <QString>

class AssetFetcher;

enum class SizeClass {
    Cell,      // card artwork
    Featured,  // cover artwork
};

struct CacheKey {
    int id = 0;
    QString variant;
    SizeClass sizeClass = SizeClass::Cell;

    bool operator==(const CacheKey &o) const
    {
        return id == o.id && variant == o.variant && sizeClass == o.sizeClass;
    }
};

inline size_t qHash(const CacheKey &k, size_t seed = 0)
{
    return qHash(k.id, seed) ^ qHash(k.variant, seed)
         ^ qHash(static_cast<int>(k.sizeClass), seed);
}

class AssetCache
{
public:
    struct Options {
        QString directory;           // empty = memory tier only
        int maxEntries = 500;
        int cellEdge = 180;          // pixels
        int featuredEdge = 500;      // pixels
        int jpegQuality = 75;
        bool networkFallback = true; // fetch remote sources on a disk miss
    };

    AssetCache(const Options &options, AssetFetcher *fetcher);

    // Returns a null image when the artwork cannot be produced.
    QImage get(int id, const QString &source, SizeClass sizeClass);

    // Unresized inline artwork (set logos etc.), alpha preserved.
    QImage inlineImage(const QString &source);

    CacheKey keyFor(int id, const QString &source, SizeClass sizeClass) const;
    QString diskPath(const CacheKey &key) const;
    bool isInMemory(const CacheKey &key) const { return m_entries.contains(key); }
    int memoryEntryCount() const { return m_entries.size(); }
    const Options &options() const { return m_options; }

    void clearMemory();

    qint64 memoryHits() const { return m_memoryHits; }
    qint64 diskHits() const { return m_diskHits; }
    qint64 fetches() const { return m_fetches; }

    // Last URL/path segment, qualified by its parent when the leaf alone
    // is not distinctive ("…/013/high.png" -> "013-high").
    static QString variantIdentifier(const QString &source);

    // Fit into an edge x edge white square, aspect ratio kept.
    static QImage normalize(const QImage &image, int edge);

private:
    struct CacheEntry {
        QImage image;
        QString diskPath;
        qint64 lastAccess = 0;
    };

    int edgeFor(SizeClass sizeClass) const;
    QImage loadFromDisk(const QString &path);
    QImage storeFetched(const QByteArray &bytes, const CacheKey &key, const QString &source);
    bool fetchBytes(const QString &source, QByteArray *bytes);
    void insert(const CacheKey &key, const QImage &image, const QString &path);
    void evictIfNeeded();

    Options m_options;
    AssetFetcher *m_fetcher = nullptr;

    QHash<CacheKey, CacheEntry> m_entries;
    qint64 m_accessCounter = 0;

    QHash<QString, QImage> m_inlineImages; // source -> image

    qint64 m_memoryHits = 0;
    qint64 m_diskHits = 0;
    qint64 m_fetches = 0;
};

#endif // CARDBINDER_ASSETCACHE_H
