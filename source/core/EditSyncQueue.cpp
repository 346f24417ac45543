// ============================================================================
// EditSyncQueue - Implementation
// ============================================================================
// Part of the TransDesk workbench engine
// ============================================================================

#include "EditSyncQueue.h"

#include <QPointer>
#include <QSet>
#include <QDebug>

EditSyncQueue::EditSyncQueue(WorkbenchBackend* backend, QObject* parent)
    : QObject(parent)
    , m_backend(backend)
{
    // Debounce timer: restarted by every keystroke, fires once per pause
    m_debounceTimer.setSingleShot(true);
    m_debounceTimer.setInterval(500);
    connect(&m_debounceTimer, &QTimer::timeout, this, &EditSyncQueue::flush);

    // Auto-sync timer: bounds staleness under continuous typing
    m_autoSyncTimer.setSingleShot(false);
    m_autoSyncTimer.setInterval(2000);
    connect(&m_autoSyncTimer, &QTimer::timeout, this, &EditSyncQueue::flush);
}

EditSyncQueue::~EditSyncQueue()
{
    m_debounceTimer.stop();
    m_autoSyncTimer.stop();

    if (hasPending()) {
        qWarning() << "EditSyncQueue: destroyed with" << pendingCount() << "unsent edits";
    }
}

// ===== Configuration =====

void EditSyncQueue::setDebounceInterval(int ms)
{
    m_debounceTimer.setInterval(qMax(0, ms));
}

void EditSyncQueue::setAutoSyncInterval(int ms)
{
    m_autoSyncTimer.setInterval(qMax(1, ms));
}

void EditSyncQueue::setRetryLimits(int maxBackoffFlushes, int maxAttempts)
{
    m_maxBackoffFlushes = qMax(1, maxBackoffFlushes);
    m_maxAttempts = qMax(1, maxAttempts);
}

// ===== Lifecycle =====

void EditSyncQueue::start()
{
    m_autoSyncTimer.start();
}

void EditSyncQueue::stop()
{
    m_debounceTimer.stop();
    m_autoSyncTimer.stop();
}

// ===== Enqueue =====

void EditSyncQueue::enqueueContent(const QString& recordId, const QString& value, const QString& baseline)
{
    if (recordId.isEmpty()) {
        return;
    }
    enqueueText(m_pendingContent, m_sentContent, recordId, value, baseline);
    noteActivity(recordId);
}

void EditSyncQueue::enqueueProofread(const QString& recordId, const QString& value, const QString& baseline)
{
    if (recordId.isEmpty()) {
        return;
    }
    enqueueText(m_pendingProofread, m_sentProofread, recordId, value, baseline);
    noteActivity(recordId);
}

void EditSyncQueue::enqueueText(QHash<QString, QString>& pending, const QHash<QString, QString>& sent,
                                const QString& recordId, const QString& value, const QString& baseline)
{
    // An in-flight write is about to become the baseline
    auto sentIt = sent.constFind(recordId);
    const QString& reference = sentIt != sent.constEnd() ? sentIt.value() : baseline;
    if (value == reference) {
        pending.remove(recordId);
    } else {
        pending.insert(recordId, value);
    }
}

void EditSyncQueue::enqueueSelected(const QString& recordId, bool selected)
{
    if (recordId.isEmpty()) {
        return;
    }
    m_pendingSelected.insert(recordId, selected);
    noteActivity(recordId);
}

void EditSyncQueue::discard(const QString& recordId)
{
    m_pendingContent.remove(recordId);
    m_pendingProofread.remove(recordId);
    m_pendingSelected.remove(recordId);
    m_retry.remove(recordId);
}

void EditSyncQueue::noteActivity(const QString& recordId)
{
    // A fresh edit gives a parked or backing-off record another chance
    m_retry.remove(recordId);

    // Restart the shared debounce window
    m_debounceTimer.start();
}

// ===== Flush =====

void EditSyncQueue::flush()
{
    flushInternal(false);
}

void EditSyncQueue::forceFlush(std::function<void()> done)
{
    m_debounceTimer.stop();
    if (done) {
        m_flushWaiters.append(std::move(done));
    }
    flushInternal(true);

    // Nothing in flight: answer on the next event loop turn
    if (m_inFlight == 0) {
        QPointer<EditSyncQueue> self(this);
        QTimer::singleShot(0, this, [self]() {
            if (self) {
                self->notifyWaitersIfIdle();
            }
        });
    }
}

void EditSyncQueue::flushInternal(bool force)
{
    if (!m_backend) {
        qWarning() << "EditSyncQueue: no backend, cannot flush";
        return;
    }

    // Union of record ids across the three maps
    QSet<QString> ids;
    for (auto it = m_pendingContent.constBegin(); it != m_pendingContent.constEnd(); ++it) {
        ids.insert(it.key());
    }
    for (auto it = m_pendingProofread.constBegin(); it != m_pendingProofread.constEnd(); ++it) {
        ids.insert(it.key());
    }
    for (auto it = m_pendingSelected.constBegin(); it != m_pendingSelected.constEnd(); ++it) {
        ids.insert(it.key());
    }

    // Drain a snapshot synchronously, merged into one update per record
    QVector<QPair<QString, TranslationUpdate>> batch;
    for (const QString& recordId : ids) {
        auto retryIt = m_retry.find(recordId);
        if (!force && retryIt != m_retry.end()) {
            if (retryIt->parked) {
                continue;
            }
            if (retryIt->skipFlushes > 0) {
                retryIt->skipFlushes--;
                continue;
            }
        }

        TranslationUpdate update;
        if (m_pendingContent.contains(recordId)) {
            update.content = m_pendingContent.take(recordId);
        }
        if (m_pendingProofread.contains(recordId)) {
            update.proofreadContent = m_pendingProofread.take(recordId);
        }
        if (m_pendingSelected.contains(recordId)) {
            update.selected = m_pendingSelected.take(recordId);
        }
        if (!update.isEmpty()) {
            batch.append(qMakePair(recordId, update));
        }
    }

    if (batch.isEmpty()) {
        return;
    }

#ifdef TRANSDESK_DEBUG
    qDebug() << "EditSyncQueue: flushing" << batch.size() << "record(s)" << (force ? "(forced)" : "");
#endif

    emit flushStarted(batch.size());

    // I/O only after the snapshot is complete
    for (const auto& entry : batch) {
        issueUpdate(entry.first, entry.second);
    }
}

void EditSyncQueue::issueUpdate(const QString& recordId, const TranslationUpdate& update)
{
    m_inFlight++;
    if (update.content) {
        m_sentContent.insert(recordId, *update.content);
    }
    if (update.proofreadContent) {
        m_sentProofread.insert(recordId, *update.proofreadContent);
    }

    QPointer<EditSyncQueue> self(this);
    m_backend->updateTranslation(recordId, update,
        [self, recordId, update](const TranslationRecord& record, const BackendError& error) {
            if (!self) {
                return;
            }
            self->onUpdateFinished(recordId, update, record, error);
        });
}

void EditSyncQueue::onUpdateFinished(const QString& recordId, const TranslationUpdate& sent,
                                     const TranslationRecord& record, const BackendError& error)
{
    // A newer request for the same field keeps its entry
    if (sent.content && m_sentContent.value(recordId) == *sent.content) {
        m_sentContent.remove(recordId);
    }
    if (sent.proofreadContent && m_sentProofread.value(recordId) == *sent.proofreadContent) {
        m_sentProofread.remove(recordId);
    }

    if (error.isNull()) {
        m_retry.remove(recordId);
        TranslationRecord acknowledged = record;
        if (acknowledged.id.isEmpty()) {
            acknowledged.id = recordId;
        }
        emit recordAcknowledged(acknowledged);
    } else if (error.isNotFound()) {
        // Stale reference: the record or its source is gone. Retrying would
        // only recreate inconsistent state, so the edit counts as settled.
        qWarning() << "EditSyncQueue: record" << recordId << "no longer exists, dropping edit:" << error.message;
        discard(recordId);
        emit recordDropped(recordId, error.message);
    } else {
        qWarning() << "EditSyncQueue: update of" << recordId << "failed:" << error.message;
        restorePending(recordId, sent);

        RetryState& state = m_retry[recordId];
        state.failures++;
        if (state.failures >= m_maxAttempts) {
            state.parked = true;
            state.skipFlushes = 0;
            qWarning() << "EditSyncQueue: parking" << recordId << "after" << state.failures << "failures";
            emit syncStalled(recordId, error.message);
        } else {
            // 1, 2, 4, ... flush cycles, capped
            state.skipFlushes = qMin(1 << (state.failures - 1), m_maxBackoffFlushes);
        }
    }

    requestCompleted();
}

void EditSyncQueue::restorePending(const QString& recordId, const TranslationUpdate& sent)
{
    // Newer edits that arrived while the request was in flight win
    if (sent.content.has_value() && !m_pendingContent.contains(recordId)) {
        m_pendingContent.insert(recordId, *sent.content);
    }
    if (sent.proofreadContent.has_value() && !m_pendingProofread.contains(recordId)) {
        m_pendingProofread.insert(recordId, *sent.proofreadContent);
    }
    if (sent.selected.has_value() && !m_pendingSelected.contains(recordId)) {
        m_pendingSelected.insert(recordId, *sent.selected);
    }
}

void EditSyncQueue::requestCompleted()
{
    m_inFlight = qMax(0, m_inFlight - 1);
    if (m_inFlight == 0) {
        emit flushFinished();
        notifyWaitersIfIdle();
    }
}

void EditSyncQueue::notifyWaitersIfIdle()
{
    if (m_inFlight != 0 || m_flushWaiters.isEmpty()) {
        return;
    }
    // Waiters may enqueue or flush again; detach the list first
    QVector<std::function<void()>> waiters;
    waiters.swap(m_flushWaiters);
    for (const auto& waiter : waiters) {
        waiter();
    }
}

// ===== Inspection =====

bool EditSyncQueue::hasPending() const
{
    return !m_pendingContent.isEmpty() || !m_pendingProofread.isEmpty() || !m_pendingSelected.isEmpty();
}

int EditSyncQueue::pendingCount() const
{
    QSet<QString> ids;
    for (auto it = m_pendingContent.constBegin(); it != m_pendingContent.constEnd(); ++it) {
        ids.insert(it.key());
    }
    for (auto it = m_pendingProofread.constBegin(); it != m_pendingProofread.constEnd(); ++it) {
        ids.insert(it.key());
    }
    for (auto it = m_pendingSelected.constBegin(); it != m_pendingSelected.constEnd(); ++it) {
        ids.insert(it.key());
    }
    return ids.size();
}

TranslationUpdate EditSyncQueue::pendingUpdate(const QString& recordId) const
{
    TranslationUpdate update;
    if (m_pendingContent.contains(recordId)) {
        update.content = m_pendingContent.value(recordId);
    }
    if (m_pendingProofread.contains(recordId)) {
        update.proofreadContent = m_pendingProofread.value(recordId);
    }
    if (m_pendingSelected.contains(recordId)) {
        update.selected = m_pendingSelected.value(recordId);
    }
    return update;
}

bool EditSyncQueue::isParked(const QString& recordId) const
{
    auto it = m_retry.constFind(recordId);
    return it != m_retry.constEnd() && it->parked;
}
