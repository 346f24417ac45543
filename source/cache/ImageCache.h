#pragma once

// ============================================================================
// ImageCache - Decoded page images with LRU eviction
// ============================================================================
// Part of the TransDesk workbench engine
//
// Images are keyed by (projectId, fileId). Recency is an ordered key list,
// most recent at the back; storing beyond capacity evicts from the front.
//
// A miss is loaded from LocalImageStore when the page is on disk, otherwise
// from WorkbenchBackend::fetchImage(). Decoding (and the disk read) runs on
// the QtConcurrent pool; results are stored on the UI thread. Concurrent
// requests for the same key share one load.
// ============================================================================

#include "../core/PageDescriptor.h"

#include <QObject>
#include <QHash>
#include <QImage>
#include <QPointer>
#include <QStringList>
#include <QVector>
#include <functional>

class WorkbenchBackend;
class LocalImageStore;

/**
 * @brief Bounded cache of decoded page images.
 */
class ImageCache : public QObject {
    Q_OBJECT

public:
    static constexpr int DEFAULT_CAPACITY = 8;

    /**
     * @brief Result callback. image is null when loading failed; error says why.
     */
    using ImageCallback = std::function<void(const QImage& image, const QString& error)>;

    ImageCache(WorkbenchBackend* backend, LocalImageStore* store = nullptr, QObject* parent = nullptr);
    ~ImageCache() override;

    static QString keyFor(const QString& projectId, const QString& fileId) {
        return projectId + QLatin1Char('/') + fileId;
    }

    // ===== Configuration =====

    void setCapacity(int capacity);
    int capacity() const { return m_capacity; }

    void setLocalStore(LocalImageStore* store) { m_store = store; }

    // ===== Access =====

    /**
     * @brief Get a page image, loading it if needed.
     * @param promote Mark the entry most recently used if it is already cached.
     * @param done Called once, always asynchronously. May be empty.
     */
    void fetch(const QString& projectId, const PageDescriptor& page, bool promote, ImageCallback done = {});

    bool contains(const QString& key) const { return m_images.contains(key); }

    /**
     * @brief Cached image without touching recency; null if absent.
     */
    QImage peek(const QString& key) const { return m_images.value(key); }

    bool isLoading(const QString& key) const { return m_waiters.contains(key); }
    int loadingCount() const { return m_waiters.size(); }

    int size() const { return m_images.size(); }

    /**
     * @brief Keys from least to most recently used.
     */
    QStringList recencyOrder() const { return m_order; }

    /**
     * @brief Drop every cached image. Loads in flight still complete.
     */
    void clear();

signals:
    void imageStored(const QString& key);
    void imageEvicted(const QString& key);

private:
    struct DecodeResult {
        QImage image;
        QString error;
    };

    void promote(const QString& key);
    void store(const QString& key, const QImage& image);
    void enforceCapacity();

    void loadFromDisk(const QString& key, const QString& path, const QString& url);
    void loadFromNetwork(const QString& key, const QString& url);
    void decodeAsync(std::function<DecodeResult()> work,
                     std::function<void(const DecodeResult&)> onDone);
    void finishLoad(const QString& key, const QImage& image, const QString& error);

    WorkbenchBackend* m_backend = nullptr;
    QPointer<LocalImageStore> m_store;

    int m_capacity = DEFAULT_CAPACITY;
    QHash<QString, QImage> m_images;
    QStringList m_order;                                ///< Front = least recently used
    QHash<QString, QVector<ImageCallback>> m_waiters;   ///< Keys with a load in flight
};
