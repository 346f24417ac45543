// ============================================================================
// MockBackend - Implementation
// ============================================================================

#include "MockBackend.h"

#include <QTimer>

MockBackend::MockBackend(QObject* parent)
    : QObject(parent)
{
}

MockBackend::~MockBackend() = default;

// ===== Scripting =====

void MockBackend::clearFailures()
{
    m_failures.clear();
    m_persistentFailures.clear();
}

void MockBackend::addSource(const QString& fileId, const TranslationSource& source)
{
    m_pages[fileId].append(source);
}

void MockBackend::setImage(const QString& url, const QByteArray& bytes, const QString& contentType)
{
    m_images.insert(url, ImagePayload{bytes, contentType});
}

// ===== Inspection =====

int MockBackend::callCount(Op op) const
{
    int count = 0;
    for (const Call& call : m_calls) {
        if (call.op == op) {
            count++;
        }
    }
    return count;
}

QVector<MockBackend::Call> MockBackend::callsOf(Op op) const
{
    QVector<Call> result;
    for (const Call& call : m_calls) {
        if (call.op == op) {
            result.append(call);
        }
    }
    return result;
}

const TranslationSource* MockBackend::serverSource(const QString& sourceId) const
{
    for (auto it = m_pages.constBegin(); it != m_pages.constEnd(); ++it) {
        for (const TranslationSource& source : it.value()) {
            if (source.id == sourceId) {
                return &source;
            }
        }
    }
    return nullptr;
}

QStringList MockBackend::sourceIds(const QString& fileId) const
{
    QStringList ids;
    for (const TranslationSource& source : m_pages.value(fileId)) {
        ids.append(source.id);
    }
    return ids;
}

// ===== Helpers =====

BackendError MockBackend::takeFailure(Op op)
{
    auto queued = m_failures.find(op);
    if (queued != m_failures.end() && !queued->isEmpty()) {
        return queued->dequeue();
    }
    return m_persistentFailures.value(op, BackendError());
}

int MockBackend::takeLatency(Op op)
{
    auto queued = m_nextLatency.find(op);
    if (queued != m_nextLatency.end() && !queued->isEmpty()) {
        return queued->dequeue();
    }
    return m_latencyMs;
}

void MockBackend::deliver(Op op, std::function<void()> answer)
{
    QTimer::singleShot(takeLatency(op), this, std::move(answer));
}

TranslationSource* MockBackend::findSource(const QString& sourceId, QString* fileId)
{
    for (auto it = m_pages.begin(); it != m_pages.end(); ++it) {
        for (TranslationSource& source : it.value()) {
            if (source.id == sourceId) {
                if (fileId) {
                    *fileId = it.key();
                }
                return &source;
            }
        }
    }
    return nullptr;
}

TranslationSource* MockBackend::findSourceOfRecord(const QString& recordId)
{
    for (auto it = m_pages.begin(); it != m_pages.end(); ++it) {
        for (TranslationSource& source : it.value()) {
            if (source.record(recordId)) {
                return &source;
            }
        }
    }
    return nullptr;
}

QString MockBackend::nextId(const QString& prefix)
{
    return QString("%1-%2").arg(prefix).arg(++m_idCounter);
}

// ===== WorkbenchBackend =====

void MockBackend::listPageSources(const QString& fileId, const QString& targetLanguageId,
                                  SourcesCallback done)
{
    m_calls.append(Call{Op::ListPageSources, fileId, {{"target", targetLanguageId}}, {}});
    const BackendError error = takeFailure(Op::ListPageSources);

    deliver(Op::ListPageSources, [this, fileId, error, done]() {
        if (!error.isNull()) {
            done({}, error);
            return;
        }
        done(m_pages.value(fileId), BackendError());
    });
}

void MockBackend::createSource(const QString& fileId, const QString& targetLanguageId,
                               int positionType, qreal x, qreal y, SourceCallback done)
{
    m_calls.append(Call{Op::CreateSource, fileId,
                        {{"target", targetLanguageId}, {"positionType", positionType}, {"x", x}, {"y", y}}, {}});
    const BackendError error = takeFailure(Op::CreateSource);

    deliver(Op::CreateSource, [this, fileId, positionType, x, y, error, done]() {
        if (!error.isNull()) {
            done(TranslationSource(), error);
            return;
        }
        TranslationSource source;
        source.id = nextId("source");
        source.category = TranslationSource::categoryForPositionType(positionType);
        source.position = TranslationSource::clampPosition(QPointF(x, y));
        source.refreshDerivedState();
        m_pages[fileId].append(source);
        done(source, BackendError());
    });
}

void MockBackend::updateSourcePosition(const QString& sourceId, qreal x, qreal y, DoneCallback done)
{
    m_calls.append(Call{Op::UpdateSourcePosition, sourceId, {{"x", x}, {"y", y}}, {}});
    const BackendError error = takeFailure(Op::UpdateSourcePosition);

    deliver(Op::UpdateSourcePosition, [this, sourceId, x, y, error, done]() {
        if (!error.isNull()) {
            done(error);
            return;
        }
        TranslationSource* source = findSource(sourceId);
        if (!source) {
            done(BackendError::notFound(QString("source %1 not found").arg(sourceId)));
            return;
        }
        source->position = TranslationSource::clampPosition(QPointF(x, y));
        done(BackendError());
    });
}

void MockBackend::updateSourceCategory(const QString& sourceId, int positionType, DoneCallback done)
{
    m_calls.append(Call{Op::UpdateSourceCategory, sourceId, {{"positionType", positionType}}, {}});
    const BackendError error = takeFailure(Op::UpdateSourceCategory);

    deliver(Op::UpdateSourceCategory, [this, sourceId, positionType, error, done]() {
        if (!error.isNull()) {
            done(error);
            return;
        }
        TranslationSource* source = findSource(sourceId);
        if (!source) {
            done(BackendError::notFound(QString("source %1 not found").arg(sourceId)));
            return;
        }
        source->category = TranslationSource::categoryForPositionType(positionType);
        done(BackendError());
    });
}

void MockBackend::deleteSource(const QString& sourceId, DoneCallback done)
{
    m_calls.append(Call{Op::DeleteSource, sourceId, {}, {}});
    const BackendError error = takeFailure(Op::DeleteSource);

    deliver(Op::DeleteSource, [this, sourceId, error, done]() {
        if (!error.isNull()) {
            done(error);
            return;
        }
        QString fileId;
        if (!findSource(sourceId, &fileId)) {
            done(BackendError::notFound(QString("source %1 not found").arg(sourceId)));
            return;
        }
        QVector<TranslationSource>& sources = m_pages[fileId];
        for (int i = 0; i < sources.size(); ++i) {
            if (sources[i].id == sourceId) {
                sources.removeAt(i);
                break;
            }
        }
        done(BackendError());
    });
}

void MockBackend::submitTranslation(const QString& sourceId, const QString& targetLanguageId,
                                    const QString& content, RecordCallback done)
{
    m_calls.append(Call{Op::SubmitTranslation, sourceId, {{"target", targetLanguageId}, {"content", content}}, {}});
    const BackendError error = takeFailure(Op::SubmitTranslation);

    deliver(Op::SubmitTranslation, [this, sourceId, content, error, done]() {
        if (!error.isNull()) {
            done(TranslationRecord(), error);
            return;
        }
        TranslationSource* source = findSource(sourceId);
        if (!source) {
            done(TranslationRecord(), BackendError::notFound(QString("source %1 not found").arg(sourceId)));
            return;
        }
        TranslationRecord rec;
        rec.id = nextId("record");
        rec.content = content;
        rec.isMine = true;
        rec.translatorName = m_userId;
        rec.updatedAt = QDateTime::currentDateTimeUtc();
        source->applyRecord(rec);
        done(rec, BackendError());
    });
}

void MockBackend::updateTranslation(const QString& recordId, const TranslationUpdate& update,
                                    RecordCallback done)
{
    m_calls.append(Call{Op::UpdateTranslation, recordId, {}, update});
    const BackendError error = takeFailure(Op::UpdateTranslation);

    deliver(Op::UpdateTranslation, [this, recordId, update, error, done]() {
        if (!error.isNull()) {
            done(TranslationRecord(), error);
            return;
        }
        TranslationSource* source = findSourceOfRecord(recordId);
        if (!source) {
            done(TranslationRecord(), BackendError::notFound(QString("translation %1 not found").arg(recordId)));
            return;
        }
        TranslationRecord rec = *source->record(recordId);
        if (update.content) {
            rec.content = *update.content;
        }
        if (update.proofreadContent) {
            rec.proofreadContent = *update.proofreadContent;
            rec.proofreaderName = m_userId;
        }
        if (update.selected) {
            rec.selected = *update.selected;
        }
        rec.updatedAt = QDateTime::currentDateTimeUtc();
        source->applyRecord(rec);
        done(rec, BackendError());
    });
}

void MockBackend::fetchImage(const QString& url, ImageCallback done)
{
    m_calls.append(Call{Op::FetchImage, url, {}, {}});
    const BackendError error = takeFailure(Op::FetchImage);

    deliver(Op::FetchImage, [this, url, error, done]() {
        if (!error.isNull()) {
            done(ImagePayload(), error);
            return;
        }
        auto it = m_images.constFind(url);
        if (it == m_images.constEnd()) {
            done(ImagePayload(), BackendError::notFound(QString("image %1 not found").arg(url)));
            return;
        }
        done(it.value(), BackendError());
    });
}
