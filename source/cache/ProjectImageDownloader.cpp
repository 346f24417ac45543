// ============================================================================
// ProjectImageDownloader - Implementation
// ============================================================================

#include "ProjectImageDownloader.h"
#include "LocalImageStore.h"
#include "../net/WorkbenchBackend.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QTimer>
#include <QDebug>

ProjectImageDownloader::ProjectImageDownloader(WorkbenchBackend* backend, LocalImageStore* store,
                                               QObject* parent)
    : QObject(parent)
    , m_backend(backend)
    , m_store(store)
{
}

ProjectImageDownloader::~ProjectImageDownloader() = default;

bool ProjectImageDownloader::start(const QString& projectId, const QString& projectName,
                                   const QVector<PageDescriptor>& pages)
{
    if (m_running || projectId.isEmpty() || !m_backend || !m_store) {
        return false;
    }

    if (!QDir().mkpath(m_store->projectDir(projectId))) {
        qWarning() << "ProjectImageDownloader: Failed to create" << m_store->projectDir(projectId);
        return false;
    }

    m_projectId = projectId;
    m_projectName = projectName;
    m_queue.clear();
    m_active = 0;
    m_total = pages.size();
    m_finished = 0;
    m_failed = 0;
    m_cancelled = false;
    m_lastError.clear();
    m_running = true;

    // Files already on disk count as done
    for (const PageDescriptor& page : pages) {
        if (QFileInfo::exists(m_store->pagePath(projectId, page.index, page.url))) {
            m_finished++;
            continue;
        }
        m_queue.enqueue(Job{page.index, page.url, 0});
    }

    qInfo() << "ProjectImageDownloader:" << projectId << "total" << m_total
            << "to download" << m_queue.size();

    if (m_queue.isEmpty()) {
        QPointer<ProjectImageDownloader> self(this);
        QTimer::singleShot(0, this, [self]() {
            if (self) {
                self->finish();
            }
        });
        return true;
    }

    emit progress(m_finished, m_total);
    pump();
    return true;
}

void ProjectImageDownloader::cancel()
{
    if (!m_running) {
        return;
    }
    m_cancelled = true;
    m_queue.clear();
    if (m_active == 0) {
        finish();
    }
}

void ProjectImageDownloader::pump()
{
    while (!m_cancelled && m_active < MAX_CONCURRENT && !m_queue.isEmpty()) {
        runJob(m_queue.dequeue());
    }
}

void ProjectImageDownloader::runJob(const Job& job)
{
    m_active++;

    QPointer<ProjectImageDownloader> self(this);
    m_backend->fetchImage(job.url, [self, job](const ImagePayload& payload, const BackendError& error) {
        if (self) {
            self->onJobDone(job, payload.bytes, error);
        }
    });
}

void ProjectImageDownloader::onJobDone(const Job& job, const QByteArray& bytes, const BackendError& error)
{
    if (m_cancelled || !m_store) {
        m_active--;
        completeOne(false);
        return;
    }

    QString failure;
    if (!error.isNull()) {
        failure = error.message;
    } else if (bytes.isEmpty()) {
        failure = QString("empty response");
    } else {
        const QString path = m_store->pagePath(m_projectId, job.index, job.url);
        QFile file(path);
        if (!file.open(QIODevice::WriteOnly) || file.write(bytes) != bytes.size()) {
            failure = QString("cannot write %1: %2").arg(path, file.errorString());
            file.close();
            QFile::remove(path);
        }
    }

    if (failure.isEmpty()) {
        m_active--;
        completeOne(true);
        return;
    }

    // Not-found pages will not appear on retry
    if (job.attempt < MAX_RETRIES && !error.isNotFound()) {
        qWarning() << "ProjectImageDownloader: page" << job.index << "attempt" << job.attempt + 1
                   << "failed, retrying:" << failure;
        Job retry = job;
        retry.attempt++;
        QPointer<ProjectImageDownloader> self(this);
        QTimer::singleShot(m_retryDelayMs, this, [self, retry]() {
            if (!self) {
                return;
            }
            self->m_active--;
            if (self->m_cancelled) {
                self->completeOne(false);
                return;
            }
            self->runJob(retry);
        });
        return;
    }

    qWarning() << "ProjectImageDownloader: page" << job.index << "failed after all retries:" << failure;
    m_lastError = QString("page %1 (%2): %3").arg(job.index).arg(job.url, failure);
    m_active--;
    completeOne(false);
}

void ProjectImageDownloader::completeOne(bool ok)
{
    if (!ok) {
        m_failed++;
    }
    m_finished++;
    emit progress(m_finished, m_total);

    if (m_active == 0 && (m_queue.isEmpty() || m_cancelled)) {
        finish();
        return;
    }
    pump();
}

void ProjectImageDownloader::finish()
{
    if (!m_running) {
        return;
    }
    m_running = false;

    const bool ok = m_failed == 0 && !m_cancelled;

    if (m_store) {
        CachedProjectInfo info;
        info.projectId = m_projectId;
        info.projectName = m_projectName;
        info.status = ok ? QStringLiteral("completed") : QStringLiteral("failed");
        m_store->measureProject(m_projectId, &info.fileCount, &info.totalSizeBytes);
        info.cachedAt = QDateTime::currentDateTimeUtc();
        m_store->upsertProjectInfo(info);
    }

    QString message;
    if (m_cancelled) {
        message = tr("Download cancelled");
    } else if (m_failed > 0) {
        message = tr("%1 of %2 pages failed to download: %3").arg(m_failed).arg(m_total).arg(m_lastError);
    }

    qInfo() << "ProjectImageDownloader:" << m_projectId << (ok ? "completed" : "failed")
            << m_finished << "/" << m_total;
    emit finished(ok, message);
}
