#pragma once

// ============================================================================
// PagePrefetcher - Keeps the neighbours of the current page in ImageCache
// ============================================================================
// Part of the TransDesk workbench engine
//
// On entering page n while travelling in direction d (+1 or -1):
// - n-1 and n+1 are ensured without promotion (fill without reordering),
// - n+2d is ensured and promoted (most likely next access).
// The first page entered after setProject() warms up n+-1 and n+-2 instead.
//
// Prefetch failures are logged and never reported to the user.
// ============================================================================

#include "../core/PageDescriptor.h"

#include <QObject>
#include <QPointer>
#include <QVector>

class ImageCache;

class PagePrefetcher : public QObject {
    Q_OBJECT

public:
    explicit PagePrefetcher(ImageCache* cache, QObject* parent = nullptr);
    ~PagePrefetcher() override;

    /**
     * @brief Set the page list and re-arm the warm-up.
     */
    void setProject(const QString& projectId, const QVector<PageDescriptor>& pages);

    void setEnabled(bool enabled) { m_enabled = enabled; }
    bool isEnabled() const { return m_enabled; }

    /**
     * @brief Prefetch around a page that just became current.
     * @param direction +1 forward, -1 backward, 0 for a jump.
     */
    void onEnterPage(int index, int direction);

    bool hasWarmedUp() const { return m_warmedUp; }

private:
    void ensure(int index, bool promote);

    QPointer<ImageCache> m_cache;
    QString m_projectId;
    QVector<PageDescriptor> m_pages;
    bool m_enabled = true;
    bool m_warmedUp = false;
};
