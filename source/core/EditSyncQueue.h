#pragma once

// ============================================================================
// EditSyncQueue - Debounced, batched write-back of translation edits
// ============================================================================
// Part of the TransDesk workbench engine
//
// Text and selection edits are recorded per translation record and sent to
// the backend in batches:
// - a debounce timer fires after a pause in typing,
// - an independent auto-sync timer fires periodically regardless of typing,
// - forceFlush() is called before page changes and before exit.
//
// Pending maps are drained synchronously into a snapshot before any request
// goes out, so an edit arriving while a flush is in flight simply waits for
// the next flush. No locking is needed: everything runs on the UI thread.
// ============================================================================

#include "../net/WorkbenchBackend.h"

#include <QObject>
#include <QHash>
#include <QString>
#include <QTimer>
#include <QVector>
#include <functional>

/**
 * @brief Owned queue of pending translation edits.
 *
 * One instance per workbench session. Emits recordAcknowledged() for every
 * record the backend accepted so the owner can move its baselines.
 */
class EditSyncQueue : public QObject {
    Q_OBJECT

public:
    explicit EditSyncQueue(WorkbenchBackend* backend, QObject* parent = nullptr);
    ~EditSyncQueue() override;

    // ===== Configuration =====

    void setDebounceInterval(int ms);
    int debounceInterval() const { return m_debounceTimer.interval(); }

    void setAutoSyncInterval(int ms);
    int autoSyncInterval() const { return m_autoSyncTimer.interval(); }

    /**
     * @brief Bound the retry policy for transient failures.
     * @param maxBackoffFlushes Largest number of flush cycles a failing record sits out.
     * @param maxAttempts Consecutive failures after which a record is parked.
     */
    void setRetryLimits(int maxBackoffFlushes, int maxAttempts);

    // ===== Lifecycle =====

    /**
     * @brief Start the periodic auto-sync timer.
     */
    void start();

    /**
     * @brief Stop both timers. Pending edits are kept.
     */
    void stop();

    bool isRunning() const { return m_autoSyncTimer.isActive(); }

    // ===== Enqueue =====

    /**
     * @brief Record a new translation text for a record.
     * @param baseline Last value the backend acknowledged for this field.
     *
     * While an update of the field is in flight the value is compared with
     * the text last sent instead, since the acknowledgement will move the
     * baseline there. A value equal to that reference removes any pending
     * value for the field. Otherwise the pending value is overwritten and
     * the debounce timer restarts.
     */
    void enqueueContent(const QString& recordId, const QString& value, const QString& baseline);

    /**
     * @brief Record a new proofread text for a record. Same rules as enqueueContent().
     */
    void enqueueProofread(const QString& recordId, const QString& value, const QString& baseline);

    /**
     * @brief Record a selection change for a record.
     */
    void enqueueSelected(const QString& recordId, bool selected);

    /**
     * @brief Forget every pending edit of a record (e.g. its source was deleted).
     */
    void discard(const QString& recordId);

    // ===== Flush =====

    /**
     * @brief Send pending edits, skipping records that are backing off or parked.
     */
    void flush();

    /**
     * @brief Send every pending edit, including backed-off and parked ones.
     * @param done Invoked once all requests issued so far (including ones
     *             already in flight) have completed. Always invoked
     *             asynchronously.
     *
     * Makes a single attempt; failures stay pending for later.
     */
    void forceFlush(std::function<void()> done = {});

    // ===== Inspection =====

    bool hasPending() const;
    int pendingCount() const;
    int inFlightCount() const { return m_inFlight; }

    bool hasPendingContent(const QString& recordId) const { return m_pendingContent.contains(recordId); }
    bool hasPendingProofread(const QString& recordId) const { return m_pendingProofread.contains(recordId); }

    /**
     * @brief Merged pending update for a record (empty if none).
     */
    TranslationUpdate pendingUpdate(const QString& recordId) const;

    bool isParked(const QString& recordId) const;

signals:
    /**
     * @brief The backend accepted an update; record is its authoritative state.
     */
    void recordAcknowledged(const TranslationRecord& record);

    /**
     * @brief A pending edit was dropped because its record no longer exists.
     */
    void recordDropped(const QString& recordId, const QString& reason);

    /**
     * @brief A record kept failing and will not be retried until edited again.
     */
    void syncStalled(const QString& recordId, const QString& message);

    void flushStarted(int requestCount);
    void flushFinished();

private:
    struct RetryState {
        int failures = 0;       ///< Consecutive transient failures
        int skipFlushes = 0;    ///< Flush cycles left to sit out
        bool parked = false;    ///< Gave up until the next edit or forced flush
    };

    void flushInternal(bool force);
    void issueUpdate(const QString& recordId, const TranslationUpdate& update);
    void onUpdateFinished(const QString& recordId, const TranslationUpdate& sent,
                          const TranslationRecord& record, const BackendError& error);
    void restorePending(const QString& recordId, const TranslationUpdate& sent);
    void noteActivity(const QString& recordId);
    static void enqueueText(QHash<QString, QString>& pending, const QHash<QString, QString>& sent,
                            const QString& recordId, const QString& value, const QString& baseline);
    void requestCompleted();
    void notifyWaitersIfIdle();

    WorkbenchBackend* m_backend = nullptr;

    QHash<QString, QString> m_pendingContent;
    QHash<QString, QString> m_pendingProofread;
    QHash<QString, bool> m_pendingSelected;
    QHash<QString, RetryState> m_retry;

    // Text of the newest request in flight per record
    QHash<QString, QString> m_sentContent;
    QHash<QString, QString> m_sentProofread;

    QTimer m_debounceTimer;
    QTimer m_autoSyncTimer;

    int m_inFlight = 0;
    int m_maxBackoffFlushes = 8;
    int m_maxAttempts = 6;
    QVector<std::function<void()>> m_flushWaiters;
};
