// ============================================================================
// WorkbenchEngine - Implementation
// ============================================================================
// Part of the TransDesk workbench engine
// ============================================================================

#include "WorkbenchEngine.h"
#include "EditSyncQueue.h"
#include "InputDispatcher.h"
#include "SourceModel.h"
#include "../cache/ImageCache.h"
#include "../cache/PagePrefetcher.h"
#include "../net/WorkbenchBackend.h"
#include "../compat/qt_compat.h"

#include <QPointer>
#include <QSet>
#include <QDebug>

WorkbenchEngine::WorkbenchEngine(const WorkbenchConfig& config, WorkbenchBackend* backend,
                                 LocalImageStore* store, QObject* parent)
    : QObject(parent)
    , m_config(config)
    , m_backend(backend)
{
    m_queue = new EditSyncQueue(backend, this);
    m_queue->setDebounceInterval(config.debounceMs);
    m_queue->setAutoSyncInterval(config.autoSyncMs);
    m_queue->setRetryLimits(config.maxBackoffTicks, config.maxTransientAttempts);

    m_model = new SourceModel(backend, m_queue, this);
    m_model->setViewport(&m_viewport);

    m_images = new ImageCache(backend, store, this);
    m_images->setCapacity(config.imageCacheCapacity);

    m_prefetcher = new PagePrefetcher(m_images, this);
    m_prefetcher->setEnabled(config.prefetchEnabled);

    m_input = new InputDispatcher(&m_viewport, m_model, this);
    m_input->setDragThreshold(config.dragThresholdPx);
    m_input->setHitRadius(config.markerHitRadiusPx);
    m_input->setKeyboardPanStep(config.keyboardPanStepPx);
    m_input->setKeyboardZoomFactor(config.keyboardZoomFactor);

    // Acknowledged edits move the baselines wherever the record lives
    connect(m_queue, &EditSyncQueue::recordAcknowledged, this, &WorkbenchEngine::onRecordAcknowledged);
    connect(m_queue, &EditSyncQueue::recordDropped, this, &WorkbenchEngine::onRecordDropped);
    connect(m_queue, &EditSyncQueue::syncStalled, this, [this](const QString&, const QString& message) {
        emit errorRaised(tr("Changes could not be saved: %1").arg(message));
    });

    connect(m_model, &SourceModel::errorRaised, this, &WorkbenchEngine::errorRaised);

    connect(m_input, &InputDispatcher::nextPageRequested, this, [this]() { nextPage(); });
    connect(m_input, &InputDispatcher::previousPageRequested, this, [this]() { previousPage(); });
}

WorkbenchEngine::~WorkbenchEngine()
{
    if (m_queue->hasPending() && !m_shutDown) {
        qWarning() << "WorkbenchEngine: destroyed with" << m_queue->pendingCount()
                   << "unsaved edits; call shutdown() first";
    }
}

// ===== Project =====

void WorkbenchEngine::setProject(const QString& projectId, const QString& targetLanguageId,
                                 const QVector<PageDescriptor>& pages)
{
    ++m_requestToken;
    m_input->cancelGesture();

    m_projectId = projectId;
    m_targetLanguageId = targetLanguageId;
    m_pages = pages;
    m_currentIndex = -1;
    m_sourcesLoaded = false;
    m_currentImage = QImage();
    m_navigating = false;
    m_navigationTarget = -1;
    m_shutDown = false;

    m_sourceCache.clear();
    m_sourceCacheOrder.clear();
    m_images->clear();
    m_model->clear();
    m_viewport.setImageSize(QSizeF());
    m_viewport.reset();

    m_prefetcher->setProject(projectId, pages);
    m_queue->start();

    qInfo() << "WorkbenchEngine: project" << projectId << "target" << targetLanguageId
            << "pages" << pages.size();
}

PageDescriptor WorkbenchEngine::currentPage() const
{
    if (m_currentIndex < 0 || m_currentIndex >= m_pages.size()) {
        return PageDescriptor();
    }
    return m_pages.at(m_currentIndex);
}

// ===== Page lifecycle =====

bool WorkbenchEngine::onEnterPage(int index)
{
    if (m_shutDown || index < 0 || index >= m_pages.size()) {
        return false;
    }

    const int previous = m_currentIndex;
    const int direction = previous < 0 ? 0 : (index > previous ? 1 : (index < previous ? -1 : 0));

    if (previous >= 0) {
        m_input->cancelGesture();
        snapshotCurrentSources();
    }

    const quint64 token = ++m_requestToken;
    m_currentIndex = index;
    const PageDescriptor& page = m_pages.at(index);

    m_model->setTargetContext(page.fileId, m_targetLanguageId);
    m_model->setActiveSource(QString());

    m_currentImage = QImage();
    m_viewport.setImageSize(QSizeF());
    m_fitPending = false;
    m_sourcesLoaded = false;

#ifdef TRANSDESK_DEBUG
    qDebug() << "WorkbenchEngine: enter page" << index << "token" << token << "direction" << direction;
#endif
    emit pageChanged(index);

    loadSources(index, token);
    loadImage(index, token);
    m_prefetcher->onEnterPage(index, direction);
    return true;
}

void WorkbenchEngine::loadSources(int index, quint64 token)
{
    const PageDescriptor& page = m_pages.at(index);

    if (m_sourceCache.contains(page.fileId)) {
        m_model->setSources(m_sourceCache.value(page.fileId));
        // Refresh recency
        m_sourceCacheOrder.removeAll(page.fileId);
        m_sourceCacheOrder.append(page.fileId);
        m_sourcesLoaded = true;
        emit pageSourcesLoaded(index, true);
        return;
    }

    m_model->setSources(QVector<TranslationSource>());
    if (!m_backend) {
        return;
    }

    QPointer<WorkbenchEngine> self(this);
    const QString fileId = page.fileId;
    m_backend->listPageSources(fileId, m_targetLanguageId,
        [self, token, index, fileId](const QVector<TranslationSource>& sources, const BackendError& error) {
            if (!self) {
                return;
            }
            if (!self->isCurrent(token)) {
#ifdef TRANSDESK_DEBUG
                qDebug() << "WorkbenchEngine: dropping stale sources for page" << index;
#endif
                return;
            }
            if (!error.isNull()) {
                qWarning() << "WorkbenchEngine: loading sources failed:" << error.message;
                emit self->errorRaised(tr("Could not load markers: %1").arg(error.message));
                return;
            }

            // Keep markers placed while the list was loading
            QVector<TranslationSource> merged = sources;
            QSet<QString> known;
            for (const TranslationSource& source : sources) {
                known.insert(source.id);
            }
            for (const TranslationSource& local : self->m_model->sources()) {
                if (!known.contains(local.id)) {
                    merged.append(local);
                }
            }

            const QString active = self->m_model->activeSourceId();
            self->m_model->setSources(merged);
            if (!active.isEmpty()) {
                self->m_model->setActiveSource(active);
            }
            self->m_sourcesLoaded = true;
            self->cacheSources(fileId, merged);
            emit self->pageSourcesLoaded(index, false);
        });
}

void WorkbenchEngine::loadImage(int index, quint64 token)
{
    QPointer<WorkbenchEngine> self(this);
    m_images->fetch(m_projectId, m_pages.at(index), true,
        [self, token, index](const QImage& image, const QString& error) {
            if (!self || !self->isCurrent(token)) {
                return;
            }
            if (image.isNull()) {
                qWarning() << "WorkbenchEngine: page image" << index << "failed:" << error;
                emit self->pageImageFailed(index, tr("Page image unavailable: %1").arg(error));
                return;
            }

            self->m_currentImage = image;
            self->m_viewport.setImageSize(QSizeF(image.size()));
            if (self->m_viewport.canvasSize().isEmpty()) {
                self->m_fitPending = true;
            } else {
                self->m_viewport.fitToCanvas();
            }
            emit self->pageImageReady(index);
        });
}

void WorkbenchEngine::onLeavePage(int index, std::function<void()> done)
{
    if (index == m_currentIndex) {
        m_input->cancelGesture();
    }

    QPointer<WorkbenchEngine> self(this);
    settleWrites([self, index, done]() {
        // Snapshot after the acknowledgements so the cache holds backend ids
        if (self && index == self->m_currentIndex) {
            self->snapshotCurrentSources();
        }
        if (done) {
            done();
        }
    });
}

void WorkbenchEngine::settleWrites(std::function<void()> done)
{
    QPointer<WorkbenchEngine> self(this);

    // A create or first write still has to hand out the ids later edits use
    if (m_model->hasOutstandingWrites()) {
        TD_CONNECT_ONCE(m_model, &SourceModel::writesSettled, this, [self, done]() {
            if (self) {
                self->settleWrites(done);
            }
        });
        return;
    }

    m_queue->forceFlush([self, done]() {
        if (!self) {
            return;
        }
        // Typing during the flush may have started another first write
        if (self->m_model->hasOutstandingWrites()) {
            self->settleWrites(done);
            return;
        }
        if (done) {
            done();
        }
    });
}

bool WorkbenchEngine::goToPage(int index)
{
    if (m_shutDown || index < 0 || index >= m_pages.size()) {
        return false;
    }

    if (m_navigating) {
        m_navigationTarget = index;
        return true;
    }
    if (index == m_currentIndex) {
        return false;
    }
    if (m_currentIndex < 0) {
        return onEnterPage(index);
    }

    m_navigating = true;
    m_navigationTarget = index;

    QPointer<WorkbenchEngine> self(this);
    onLeavePage(m_currentIndex, [self]() {
        if (!self) {
            return;
        }
        self->m_navigating = false;
        const int target = self->m_navigationTarget;
        self->m_navigationTarget = -1;
        if (self->m_shutDown || target == self->m_currentIndex) {
            return;
        }
        self->onEnterPage(target);
    });
    return true;
}

bool WorkbenchEngine::nextPage()
{
    const int from = m_navigating ? m_navigationTarget : m_currentIndex;
    return goToPage(from + 1);
}

bool WorkbenchEngine::previousPage()
{
    const int from = m_navigating ? m_navigationTarget : m_currentIndex;
    if (from <= 0) {
        return false;
    }
    return goToPage(from - 1);
}

void WorkbenchEngine::setCanvasSize(const QSizeF& size)
{
    m_viewport.setCanvasSize(size);
    if (m_fitPending && m_viewport.hasImage() && !size.isEmpty()) {
        m_viewport.fitToCanvas();
        m_fitPending = false;
    }
}

// ===== Teardown =====

void WorkbenchEngine::shutdown(std::function<void()> done)
{
    if (!m_shutDown) {
        qInfo() << "WorkbenchEngine: shutting down," << m_queue->pendingCount() << "edits pending";
    }
    m_shutDown = true;
    ++m_requestToken;

    m_input->detach();
    m_queue->stop();

    QPointer<WorkbenchEngine> self(this);
    settleWrites([self, done]() {
        if (self) {
            emit self->shutdownFinished();
        }
        if (done) {
            done();
        }
    });
}

// ===== Source cache =====

void WorkbenchEngine::cacheSources(const QString& fileId, const QVector<TranslationSource>& sources)
{
    if (fileId.isEmpty() || m_config.sourceCacheCapacity <= 0) {
        return;
    }

    // Placeholders only exist until their create call answers
    QVector<TranslationSource> kept;
    kept.reserve(sources.size());
    for (const TranslationSource& source : sources) {
        if (!source.pendingCreate) {
            kept.append(source);
        }
    }

    m_sourceCache.insert(fileId, kept);
    m_sourceCacheOrder.removeAll(fileId);
    m_sourceCacheOrder.append(fileId);

    while (m_sourceCacheOrder.size() > m_config.sourceCacheCapacity) {
        m_sourceCache.remove(m_sourceCacheOrder.takeFirst());
    }
}

void WorkbenchEngine::snapshotCurrentSources()
{
    // A page left before its list arrived has nothing worth keeping
    const QString fileId = m_model->fileId();
    if (fileId.isEmpty() || !m_sourcesLoaded) {
        return;
    }
    cacheSources(fileId, m_model->sources());
}

void WorkbenchEngine::onRecordAcknowledged(const TranslationRecord& record)
{
    const TranslationSource* owner = m_model->sourceOfRecord(record.id);
    if (owner) {
        m_model->applyRecordToSource(owner->id, record);
        return;
    }

    // The page was left while the flush was in flight
    for (auto it = m_sourceCache.begin(); it != m_sourceCache.end(); ++it) {
        for (TranslationSource& source : it.value()) {
            if (source.record(record.id)) {
                source.applyRecord(record);
                return;
            }
        }
    }
}

void WorkbenchEngine::onRecordDropped(const QString& recordId, const QString& reason)
{
    qWarning() << "WorkbenchEngine: record" << recordId << "no longer exists:" << reason;

    m_model->dropRecord(recordId);

    for (auto it = m_sourceCache.begin(); it != m_sourceCache.end(); ++it) {
        for (TranslationSource& source : it.value()) {
            for (int i = 0; i < source.records.size(); ++i) {
                if (source.records.at(i).id == recordId) {
                    source.records.removeAt(i);
                    source.refreshDerivedState();
                    return;
                }
            }
        }
    }
}
