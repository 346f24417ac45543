// ============================================================================
// ImageCache - Implementation
// ============================================================================

#include "ImageCache.h"
#include "LocalImageStore.h"
#include "../net/WorkbenchBackend.h"

#include <QFutureWatcher>
#include <QTimer>
#include <QtConcurrent>
#include <QDebug>

ImageCache::ImageCache(WorkbenchBackend* backend, LocalImageStore* store, QObject* parent)
    : QObject(parent)
    , m_backend(backend)
    , m_store(store)
{
}

ImageCache::~ImageCache() = default;

void ImageCache::setCapacity(int capacity)
{
    m_capacity = qMax(1, capacity);
    enforceCapacity();
}

// ===== Access =====

void ImageCache::fetch(const QString& projectId, const PageDescriptor& page, bool promote, ImageCallback done)
{
    const QString key = keyFor(projectId, page.fileId);

    // Hit: answer on the next event loop turn
    auto hit = m_images.constFind(key);
    if (hit != m_images.constEnd()) {
        if (promote) {
            this->promote(key);
        }
        if (done) {
            const QImage image = hit.value();
            QTimer::singleShot(0, this, [done, image]() {
                done(image, QString());
            });
        }
        return;
    }

    // Already loading: share the request
    auto pending = m_waiters.find(key);
    if (pending != m_waiters.end()) {
        if (done) {
            pending->append(done);
        }
        return;
    }

    QVector<ImageCallback> waiters;
    if (done) {
        waiters.append(done);
    }
    m_waiters.insert(key, waiters);

    const QString localPath = m_store ? m_store->findPage(projectId, page.index) : QString();
    if (!localPath.isEmpty()) {
        loadFromDisk(key, localPath, page.url);
    } else {
        loadFromNetwork(key, page.url);
    }
}

void ImageCache::clear()
{
    m_images.clear();
    m_order.clear();
}

// ===== Recency =====

void ImageCache::promote(const QString& key)
{
    if (m_order.removeOne(key)) {
        m_order.append(key);
    }
}

void ImageCache::store(const QString& key, const QImage& image)
{
    m_images.insert(key, image);
    m_order.removeOne(key);
    m_order.append(key);
    enforceCapacity();
    if (m_images.contains(key)) {
        emit imageStored(key);
    }
}

void ImageCache::enforceCapacity()
{
    while (m_order.size() > m_capacity) {
        const QString oldest = m_order.takeFirst();
        m_images.remove(oldest);
#ifdef TRANSDESK_DEBUG
        qDebug() << "ImageCache: evicted" << oldest;
#endif
        emit imageEvicted(oldest);
    }
}

// ===== Loading =====

void ImageCache::loadFromDisk(const QString& key, const QString& path, const QString& url)
{
    QPointer<ImageCache> self(this);
    decodeAsync(
        [path]() {
            DecodeResult result;
            const QByteArray bytes = LocalImageStore::readFile(path);
            if (bytes.isEmpty() || !result.image.loadFromData(bytes)) {
                result.error = QString("cannot decode %1").arg(path);
            }
            return result;
        },
        [self, key, url](const DecodeResult& result) {
            if (!self) {
                return;
            }
            if (result.image.isNull()) {
                // Corrupt or unreadable file on disk: try the network copy
                qWarning() << "ImageCache:" << result.error << "- falling back to network";
                self->loadFromNetwork(key, url);
                return;
            }
            self->finishLoad(key, result.image, QString());
        });
}

void ImageCache::loadFromNetwork(const QString& key, const QString& url)
{
    if (!m_backend || url.isEmpty()) {
        QPointer<ImageCache> self(this);
        QTimer::singleShot(0, this, [self, key]() {
            if (self) {
                self->finishLoad(key, QImage(), QString("no image source"));
            }
        });
        return;
    }

    QPointer<ImageCache> self(this);
    m_backend->fetchImage(url, [self, key, url](const ImagePayload& payload, const BackendError& error) {
        if (!self) {
            return;
        }
        if (!error.isNull()) {
            self->finishLoad(key, QImage(), error.message);
            return;
        }
        const QByteArray bytes = payload.bytes;
        self->decodeAsync(
            [bytes, url]() {
                DecodeResult result;
                if (!result.image.loadFromData(bytes)) {
                    result.error = QString("cannot decode image from %1").arg(url);
                }
                return result;
            },
            [self, key](const DecodeResult& result) {
                if (self) {
                    self->finishLoad(key, result.image, result.error);
                }
            });
    });
}

void ImageCache::decodeAsync(std::function<DecodeResult()> work,
                             std::function<void(const DecodeResult&)> onDone)
{
    auto* watcher = new QFutureWatcher<DecodeResult>(this);
    connect(watcher, &QFutureWatcher<DecodeResult>::finished, this, [watcher, onDone]() {
        const DecodeResult result = watcher->result();
        watcher->deleteLater();
        onDone(result);
    });
    watcher->setFuture(QtConcurrent::run(std::move(work)));
}

void ImageCache::finishLoad(const QString& key, const QImage& image, const QString& error)
{
    const QVector<ImageCallback> waiters = m_waiters.take(key);

    if (!image.isNull()) {
        store(key, image);
    } else {
        qWarning() << "ImageCache: failed to load" << key << ":" << error;
    }

    for (const ImageCallback& waiter : waiters) {
        waiter(image, error);
    }
}
