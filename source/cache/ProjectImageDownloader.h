#pragma once

// ============================================================================
// ProjectImageDownloader - Fills LocalImageStore with a whole project
// ============================================================================
// Part of the TransDesk workbench engine
//
// Downloads every page of a project that is not on disk yet, with a bounded
// number of concurrent requests and a short retry loop per file. When all
// files are settled the project's metadata is written to the store.
// ============================================================================

#include "../core/PageDescriptor.h"
#include "../net/BackendError.h"

#include <QObject>
#include <QPointer>
#include <QQueue>
#include <QVector>

class WorkbenchBackend;
class LocalImageStore;

/**
 * @brief One-shot downloader of a project's page images.
 */
class ProjectImageDownloader : public QObject {
    Q_OBJECT

public:
    static constexpr int MAX_CONCURRENT = 5;
    static constexpr int MAX_RETRIES = 2;         ///< Extra attempts after the first
    static constexpr int RETRY_DELAY_MS = 500;

    ProjectImageDownloader(WorkbenchBackend* backend, LocalImageStore* store, QObject* parent = nullptr);
    ~ProjectImageDownloader() override;

    /**
     * @brief Start downloading.
     * @return False if a download is already running or the arguments are empty.
     */
    bool start(const QString& projectId, const QString& projectName, const QVector<PageDescriptor>& pages);

    /**
     * @brief Stop issuing new requests. Requests already in flight are ignored.
     */
    void cancel();

    bool isRunning() const { return m_running; }
    int totalCount() const { return m_total; }
    int finishedCount() const { return m_finished; }
    int failedCount() const { return m_failed; }

    void setRetryDelay(int ms) { m_retryDelayMs = qMax(0, ms); }

signals:
    /**
     * @brief A file was written or gave up. Counts include skipped files.
     */
    void progress(int finished, int total);

    /**
     * @brief All files settled; metadata has been written.
     * @param ok False if at least one file could not be downloaded.
     */
    void finished(bool ok, const QString& message);

private:
    struct Job {
        int index = 0;
        QString url;
        int attempt = 0;
    };

    void pump();
    void runJob(const Job& job);
    void onJobDone(const Job& job, const QByteArray& bytes, const BackendError& error);
    void completeOne(bool ok);
    void finish();

    WorkbenchBackend* m_backend = nullptr;
    QPointer<LocalImageStore> m_store;

    QString m_projectId;
    QString m_projectName;
    QQueue<Job> m_queue;
    int m_active = 0;
    int m_total = 0;
    int m_finished = 0;
    int m_failed = 0;
    int m_retryDelayMs = RETRY_DELAY_MS;
    bool m_running = false;
    bool m_cancelled = false;
    QString m_lastError;
};
