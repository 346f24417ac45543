// ============================================================================
// PagePrefetcher - Implementation
// ============================================================================

#include "PagePrefetcher.h"
#include "ImageCache.h"

#include <QDebug>

PagePrefetcher::PagePrefetcher(ImageCache* cache, QObject* parent)
    : QObject(parent)
    , m_cache(cache)
{
}

PagePrefetcher::~PagePrefetcher() = default;

void PagePrefetcher::setProject(const QString& projectId, const QVector<PageDescriptor>& pages)
{
    m_projectId = projectId;
    m_pages = pages;
    m_warmedUp = false;
}

void PagePrefetcher::onEnterPage(int index, int direction)
{
    if (!m_enabled || !m_cache || index < 0 || index >= m_pages.size()) {
        return;
    }

    if (!m_warmedUp) {
        m_warmedUp = true;
        ensure(index - 1, false);
        ensure(index + 1, false);
        ensure(index - 2, false);
        ensure(index + 2, false);
        return;
    }

    ensure(index - 1, false);
    ensure(index + 1, false);
    if (direction != 0) {
        ensure(index + 2 * (direction > 0 ? 1 : -1), true);
    }
}

void PagePrefetcher::ensure(int index, bool promote)
{
    if (index < 0 || index >= m_pages.size()) {
        return;
    }

    const PageDescriptor page = m_pages.at(index);
    m_cache->fetch(m_projectId, page, promote, [index](const QImage& image, const QString& error) {
        if (image.isNull()) {
            qWarning() << "PagePrefetcher: page" << index << "not prefetched:" << error;
        }
    });
}
