#pragma once

// ============================================================================
// RestBackend - WorkbenchBackend over HTTP/JSON
// ============================================================================
// Part of the TransDesk workbench engine
//
// Talks to a moetran-style REST API with QNetworkAccessManager:
//   GET    files/{fileId}/sources?target_id=...
//   POST   files/{fileId}/sources
//   PUT    sources/{sourceId}            {x, y} or {position_type}
//   DELETE sources/{sourceId}
//   POST   sources/{sourceId}/translations
//   PUT    translations/{recordId}
//   GET    <image url>
//
// Every request carries the bearer token and a transfer timeout. Empty
// response bodies are treated as JSON null.
// ============================================================================

#include "WorkbenchBackend.h"

#include <QObject>
#include <QJsonValue>
#include <QNetworkAccessManager>
#include <QNetworkRequest>
#include <QUrl>
#include <QUrlQuery>

class QNetworkReply;
class QJsonObject;

class RestBackend : public QObject, public WorkbenchBackend {
    Q_OBJECT

public:
    static constexpr int DEFAULT_TIMEOUT_MS = 5000;

    RestBackend(const QUrl& baseUrl, const QString& token, QObject* parent = nullptr);
    ~RestBackend() override;

    QUrl baseUrl() const { return m_baseUrl; }

    void setTimeout(int ms) { m_timeoutMs = qMax(0, ms); }
    int timeout() const { return m_timeoutMs; }

    /**
     * @brief Local user id, used to mark own records when the API omits "mine".
     */
    void setUserId(const QString& userId) { m_userId = userId; }

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

    // ===== Helpers (public for tests) =====

    /**
     * @brief JSON body for a partial record update (only set fields).
     */
    static QJsonObject updateBody(const TranslationUpdate& update);

    /**
     * @brief Parse a response body; empty or whitespace-only means null.
     * @return False with errorOut set if the body is not valid JSON.
     */
    static bool parseBody(const QByteArray& body, QJsonValue* valueOut, QString* errorOut);

    /**
     * @brief Error for a finished exchange; null for 2xx.
     * @param status HTTP status, 0 if no response was received.
     * @param transportError Transport-level error text, empty if none.
     */
    static BackendError classify(int status, const QByteArray& body, const QString& transportError);

private:
    using JsonCallback = std::function<void(const QJsonValue&, const BackendError&)>;
    using RawCallback = std::function<void(const QByteArray&, const QString&, const BackendError&)>;

    QNetworkRequest makeRequest(const QUrl& url) const;
    QUrl endpoint(const QString& path, const QUrlQuery& query = QUrlQuery()) const;

    void send(const QByteArray& verb, const QUrl& url, const QJsonValue& body, JsonCallback done);
    void sendRaw(const QByteArray& verb, const QNetworkRequest& request, const QByteArray& data,
                 RawCallback done);

    QNetworkAccessManager m_network;
    QUrl m_baseUrl;
    QString m_token;
    QString m_userId;
    int m_timeoutMs = DEFAULT_TIMEOUT_MS;
};
