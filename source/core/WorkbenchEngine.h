#pragma once

// ============================================================================
// WorkbenchEngine - Per-session owner of the translation workbench state
// ============================================================================
// Part of the TransDesk workbench engine
//
// One engine exists per open project. It owns every stateful collaborator:
//
//   ViewportTransform   zoom / pan of the current page
//   EditSyncQueue       pending translation edits
//   SourceModel         markers of the current page
//   ImageCache          decoded page images (LRU)
//   PagePrefetcher      neighbor warm-up
//   InputDispatcher     pointer / wheel / keyboard routing
//
// Page loads are tagged with a monotonically increasing request token; any
// answer that arrives after the user moved on is discarded. Before a page is
// left, outstanding marker writes are awaited and pending edits are
// force-flushed so nothing typed is lost.
// ============================================================================

#include "WorkbenchConfig.h"
#include "PageDescriptor.h"
#include "TranslationSource.h"
#include "ViewportTransform.h"

#include <QObject>
#include <QHash>
#include <QImage>
#include <QStringList>
#include <QVector>
#include <functional>

class WorkbenchBackend;
class LocalImageStore;
class EditSyncQueue;
class SourceModel;
class ImageCache;
class PagePrefetcher;
class InputDispatcher;

/**
 * @brief Session facade: page navigation plus access to the marker API.
 */
class WorkbenchEngine : public QObject {
    Q_OBJECT

public:
    /**
     * @param backend Remote API (not owned, must outlive the engine).
     * @param store Offline image store, or nullptr for network-only (not owned).
     */
    WorkbenchEngine(const WorkbenchConfig& config, WorkbenchBackend* backend,
                    LocalImageStore* store = nullptr, QObject* parent = nullptr);
    ~WorkbenchEngine() override;

    // ===== Collaborators =====

    const WorkbenchConfig& config() const { return m_config; }
    ViewportTransform* viewport() { return &m_viewport; }
    const ViewportTransform* viewport() const { return &m_viewport; }
    EditSyncQueue* syncQueue() const { return m_queue; }
    SourceModel* sourceModel() const { return m_model; }
    ImageCache* imageCache() const { return m_images; }
    PagePrefetcher* prefetcher() const { return m_prefetcher; }
    InputDispatcher* inputDispatcher() const { return m_input; }

    // ===== Project =====

    /**
     * @brief Open a project. Resets caches and leaves no page entered.
     */
    void setProject(const QString& projectId, const QString& targetLanguageId,
                    const QVector<PageDescriptor>& pages);

    QString projectId() const { return m_projectId; }
    QString targetLanguageId() const { return m_targetLanguageId; }
    const QVector<PageDescriptor>& pages() const { return m_pages; }
    int pageCount() const { return m_pages.size(); }

    int currentIndex() const { return m_currentIndex; }
    PageDescriptor currentPage() const;
    QImage currentImage() const { return m_currentImage; }

    /**
     * @brief Token of the latest page load; older answers are ignored.
     */
    quint64 requestToken() const { return m_requestToken; }

    bool isNavigating() const { return m_navigating; }
    bool isShutDown() const { return m_shutDown; }

    // ===== Page lifecycle =====

    /**
     * @brief Show a page: target context, sources, image and prefetch.
     * @return False if the index is out of range.
     */
    bool onEnterPage(int index);

    /**
     * @brief Settle every write of the page being left, then cache its markers.
     * @param done Called once marker creates, first translation writes and
     *             the forced flush of pending edits have all completed.
     */
    void onLeavePage(int index, std::function<void()> done = {});

    /**
     * @brief Leave the current page (awaiting its flush) and enter another.
     *
     * While a flush is running, later requests replace the destination.
     */
    bool goToPage(int index);
    bool nextPage();
    bool previousPage();

    /**
     * @brief Canvas resized; fits the image the first time a size is known.
     */
    void setCanvasSize(const QSizeF& size);

    // ===== Teardown =====

    /**
     * @brief Stop input and timers, then force-flush. Emits shutdownFinished().
     */
    void shutdown(std::function<void()> done = {});

    // ===== Source cache =====

    bool hasCachedSources(const QString& fileId) const { return m_sourceCache.contains(fileId); }
    QVector<TranslationSource> cachedSources(const QString& fileId) const { return m_sourceCache.value(fileId); }

signals:
    void pageChanged(int index);
    void pageImageReady(int index);

    /**
     * @brief The current page's image could not be loaded.
     * @param notice User-facing text to show instead of the image.
     */
    void pageImageFailed(int index, const QString& notice);

    void pageSourcesLoaded(int index, bool fromCache);
    void errorRaised(const QString& message);
    void shutdownFinished();

private:
    void settleWrites(std::function<void()> done);
    void loadSources(int index, quint64 token);
    void loadImage(int index, quint64 token);
    bool isCurrent(quint64 token) const { return token == m_requestToken && !m_shutDown; }

    void cacheSources(const QString& fileId, const QVector<TranslationSource>& sources);
    void snapshotCurrentSources();

    void onRecordAcknowledged(const TranslationRecord& record);
    void onRecordDropped(const QString& recordId, const QString& reason);

    WorkbenchConfig m_config;
    WorkbenchBackend* m_backend = nullptr;

    ViewportTransform m_viewport;
    EditSyncQueue* m_queue = nullptr;
    SourceModel* m_model = nullptr;
    ImageCache* m_images = nullptr;
    PagePrefetcher* m_prefetcher = nullptr;
    InputDispatcher* m_input = nullptr;

    QString m_projectId;
    QString m_targetLanguageId;
    QVector<PageDescriptor> m_pages;
    int m_currentIndex = -1;
    QImage m_currentImage;
    bool m_fitPending = false;       ///< Fit the image once the canvas size is known
    bool m_sourcesLoaded = false;    ///< The current page's list arrived (from cache or backend)

    quint64 m_requestToken = 0;
    bool m_navigating = false;
    int m_navigationTarget = -1;
    bool m_shutDown = false;

    // Source lists of visited pages, most recent at the back
    QHash<QString, QVector<TranslationSource>> m_sourceCache;
    QStringList m_sourceCacheOrder;
};
