#pragma once

// ============================================================================
// MockBackend - In-process WorkbenchBackend for tests and offline demos
// ============================================================================
// Part of the TransDesk workbench engine
//
// Keeps sources and records in memory and answers every call on the event
// loop after a configurable latency, so callers see the same asynchronous
// behaviour as with a real network. Every call is logged, and failures can be
// scripted per operation.
// ============================================================================

#include "WorkbenchBackend.h"

#include <QObject>
#include <QHash>
#include <QMap>
#include <QQueue>
#include <QVariantMap>

/**
 * @brief Scripted in-memory backend.
 */
class MockBackend : public QObject, public WorkbenchBackend {
    Q_OBJECT

public:
    enum class Op {
        ListPageSources,
        CreateSource,
        UpdateSourcePosition,
        UpdateSourceCategory,
        DeleteSource,
        SubmitTranslation,
        UpdateTranslation,
        FetchImage
    };

    /**
     * @brief One logged call.
     */
    struct Call {
        Op op;
        QString target;             ///< fileId, sourceId, recordId or url
        QVariantMap args;           ///< Remaining arguments by name
        TranslationUpdate update;   ///< Only for UpdateTranslation
    };

    explicit MockBackend(QObject* parent = nullptr);
    ~MockBackend() override;

    // ===== Scripting =====

    /**
     * @brief Delay before each answer (0 = next event loop turn).
     */
    void setLatency(int ms) { m_latencyMs = ms; }

    /**
     * @brief Override the latency of the next call of an operation only.
     */
    void setNextLatency(Op op, int ms) { m_nextLatency[op].enqueue(ms); }

    /**
     * @brief Make the next call of an operation fail with the given error.
     */
    void failNext(Op op, const BackendError& error) { m_failures[op].enqueue(error); }

    /**
     * @brief Fail every call of an operation until cleared.
     */
    void failAlways(Op op, const BackendError& error) { m_persistentFailures.insert(op, error); }
    void clearFailures();

    void setUserId(const QString& userId) { m_userId = userId; }

    /**
     * @brief Seed a source on a page.
     */
    void addSource(const QString& fileId, const TranslationSource& source);

    /**
     * @brief Serve bytes for an image url.
     */
    void setImage(const QString& url, const QByteArray& bytes, const QString& contentType = "image/png");

    // ===== Inspection =====

    const QVector<Call>& calls() const { return m_calls; }
    int callCount(Op op) const;
    QVector<Call> callsOf(Op op) const;
    void clearCalls() { m_calls.clear(); }

    /**
     * @brief Current server-side state of a source (by id), or nullptr.
     */
    const TranslationSource* serverSource(const QString& sourceId) const;

    QStringList sourceIds(const QString& fileId) const;

    // ===== WorkbenchBackend =====

    void listPageSources(const QString& fileId, const QString& targetLanguageId,
                         SourcesCallback done) override;
    void createSource(const QString& fileId, const QString& targetLanguageId,
                      int positionType, qreal x, qreal y, SourceCallback done) override;
    void updateSourcePosition(const QString& sourceId, qreal x, qreal y, DoneCallback done) override;
    void updateSourceCategory(const QString& sourceId, int positionType, DoneCallback done) override;
    void deleteSource(const QString& sourceId, DoneCallback done) override;
    void submitTranslation(const QString& sourceId, const QString& targetLanguageId,
                           const QString& content, RecordCallback done) override;
    void updateTranslation(const QString& recordId, const TranslationUpdate& update,
                           RecordCallback done) override;
    void fetchImage(const QString& url, ImageCallback done) override;

private:
    BackendError takeFailure(Op op);
    int takeLatency(Op op);
    void deliver(Op op, std::function<void()> answer);
    TranslationSource* findSource(const QString& sourceId, QString* fileId = nullptr);
    TranslationSource* findSourceOfRecord(const QString& recordId);
    QString nextId(const QString& prefix);

    int m_latencyMs = 0;
    int m_idCounter = 0;
    QString m_userId = "me";

    QMap<QString, QVector<TranslationSource>> m_pages;   // fileId -> sources
    QHash<QString, ImagePayload> m_images;
    QVector<Call> m_calls;

    QMap<Op, QQueue<BackendError>> m_failures;
    QMap<Op, BackendError> m_persistentFailures;
    QMap<Op, QQueue<int>> m_nextLatency;
};
