// ============================================================================
// RestBackend - Implementation
// ============================================================================

#include "RestBackend.h"

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QNetworkReply>
#include <QDebug>

RestBackend::RestBackend(const QUrl& baseUrl, const QString& token, QObject* parent)
    : QObject(parent)
    , m_baseUrl(baseUrl)
    , m_token(token)
{
    // Relative endpoint paths resolve below the base path only with a trailing slash
    if (!m_baseUrl.path().endsWith('/')) {
        m_baseUrl.setPath(m_baseUrl.path() + '/');
    }
}

RestBackend::~RestBackend() = default;

// ===== Request plumbing =====

QUrl RestBackend::endpoint(const QString& path, const QUrlQuery& query) const
{
    QUrl url = m_baseUrl.resolved(QUrl(path));
    if (!query.isEmpty()) {
        url.setQuery(query);
    }
    return url;
}

QNetworkRequest RestBackend::makeRequest(const QUrl& url) const
{
    QNetworkRequest request(url);
    request.setHeader(QNetworkRequest::ContentTypeHeader, "application/json");
    request.setRawHeader("Accept", "application/json");
    if (!m_token.isEmpty()) {
        request.setRawHeader("Authorization", "Bearer " + m_token.toUtf8());
    }
    if (m_timeoutMs > 0) {
        request.setTransferTimeout(m_timeoutMs);
    }
    return request;
}

void RestBackend::sendRaw(const QByteArray& verb, const QNetworkRequest& request, const QByteArray& data,
                          RawCallback done)
{
#ifdef TRANSDESK_DEBUG
    qDebug() << "RestBackend:" << verb << request.url().toString();
#endif

    QNetworkReply* reply = m_network.sendCustomRequest(request, verb, data);
    connect(reply, &QNetworkReply::finished, this, [reply, done]() {
        reply->deleteLater();

        const int status = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
        const QByteArray body = reply->readAll();

        QString transportError;
        if (status == 0 && reply->error() != QNetworkReply::NoError) {
            transportError = reply->error() == QNetworkReply::OperationCanceledError
                ? QString("request timed out")
                : reply->errorString();
        }

        const BackendError error = classify(status, body, transportError);
        const QString contentType = reply->header(QNetworkRequest::ContentTypeHeader).toString();
        done(body, contentType, error);
    });
}

void RestBackend::send(const QByteArray& verb, const QUrl& url, const QJsonValue& body, JsonCallback done)
{
    QByteArray data;
    if (body.isObject()) {
        data = QJsonDocument(body.toObject()).toJson(QJsonDocument::Compact);
    } else if (body.isArray()) {
        data = QJsonDocument(body.toArray()).toJson(QJsonDocument::Compact);
    }

    sendRaw(verb, makeRequest(url), data,
        [done](const QByteArray& bytes, const QString&, const BackendError& error) {
            if (!error.isNull()) {
                done(QJsonValue(), error);
                return;
            }
            QJsonValue value;
            QString parseError;
            if (!parseBody(bytes, &value, &parseError)) {
                done(QJsonValue(), BackendError{BackendError::Kind::Rejected, 200, parseError});
                return;
            }
            done(value, BackendError());
        });
}

bool RestBackend::parseBody(const QByteArray& body, QJsonValue* valueOut, QString* errorOut)
{
    if (body.trimmed().isEmpty()) {
        if (valueOut) {
            *valueOut = QJsonValue(QJsonValue::Null);
        }
        return true;
    }

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(body, &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        if (errorOut) {
            *errorOut = QString("json parse error: %1").arg(parseError.errorString());
        }
        return false;
    }
    if (valueOut) {
        *valueOut = doc.isArray() ? QJsonValue(doc.array()) : QJsonValue(doc.object());
    }
    return true;
}

BackendError RestBackend::classify(int status, const QByteArray& body, const QString& transportError)
{
    if (!transportError.isEmpty()) {
        return BackendError::transient(QString("request send error: %1").arg(transportError), status);
    }

    const BackendError::Kind kind = BackendError::kindForStatus(status);
    if (kind == BackendError::Kind::None) {
        return BackendError();
    }
    return BackendError{kind, status,
                        QString("http error: status %1 body: %2").arg(status).arg(QString::fromUtf8(body))};
}

QJsonObject RestBackend::updateBody(const TranslationUpdate& update)
{
    QJsonObject body;
    if (update.content) {
        body["content"] = *update.content;
    }
    if (update.proofreadContent) {
        body["proof_content"] = *update.proofreadContent;
    }
    if (update.selected) {
        body["selected"] = *update.selected;
    }
    return body;
}

// ===== WorkbenchBackend =====

void RestBackend::listPageSources(const QString& fileId, const QString& targetLanguageId,
                                  SourcesCallback done)
{
    QUrlQuery query;
    query.addQueryItem("target_id", targetLanguageId);

    const QString userId = m_userId;
    send("GET", endpoint(QString("files/%1/sources").arg(fileId), query), QJsonValue(),
        [done, userId](const QJsonValue& value, const BackendError& error) {
            QVector<TranslationSource> sources;
            if (error.isNull()) {
                const QJsonArray array = value.toArray();
                sources.reserve(array.size());
                for (const QJsonValue& item : array) {
                    TranslationSource source = TranslationSource::fromJson(item.toObject(), userId);
                    if (!source.id.isEmpty()) {
                        sources.append(source);
                    }
                }
            }
            done(sources, error);
        });
}

void RestBackend::createSource(const QString& fileId, const QString& targetLanguageId,
                               int positionType, qreal x, qreal y, SourceCallback done)
{
    QJsonObject body;
    body["x"] = x;
    body["y"] = y;
    body["position_type"] = positionType;

    QUrlQuery query;
    query.addQueryItem("target_id", targetLanguageId);

    const QString userId = m_userId;
    send("POST", endpoint(QString("files/%1/sources").arg(fileId), query), body,
        [done, userId](const QJsonValue& value, const BackendError& error) {
            if (!error.isNull()) {
                done(TranslationSource(), error);
                return;
            }
            const TranslationSource source = TranslationSource::fromJson(value.toObject(), userId);
            if (source.id.isEmpty()) {
                done(source, BackendError::rejected("create source: response has no id", 200));
                return;
            }
            done(source, BackendError());
        });
}

void RestBackend::updateSourcePosition(const QString& sourceId, qreal x, qreal y, DoneCallback done)
{
    QJsonObject body;
    body["x"] = x;
    body["y"] = y;
    send("PUT", endpoint(QString("sources/%1").arg(sourceId)), body,
        [done](const QJsonValue&, const BackendError& error) {
            done(error);
        });
}

void RestBackend::updateSourceCategory(const QString& sourceId, int positionType, DoneCallback done)
{
    QJsonObject body;
    body["position_type"] = positionType;
    send("PUT", endpoint(QString("sources/%1").arg(sourceId)), body,
        [done](const QJsonValue&, const BackendError& error) {
            done(error);
        });
}

void RestBackend::deleteSource(const QString& sourceId, DoneCallback done)
{
    send("DELETE", endpoint(QString("sources/%1").arg(sourceId)), QJsonValue(),
        [done](const QJsonValue&, const BackendError& error) {
            done(error);
        });
}

void RestBackend::submitTranslation(const QString& sourceId, const QString& targetLanguageId,
                                    const QString& content, RecordCallback done)
{
    QJsonObject body;
    body["content"] = content;
    body["target_id"] = targetLanguageId;

    const QString userId = m_userId;
    send("POST", endpoint(QString("sources/%1/translations").arg(sourceId)), body,
        [done, userId](const QJsonValue& value, const BackendError& error) {
            if (!error.isNull()) {
                done(TranslationRecord(), error);
                return;
            }
            TranslationRecord record = TranslationRecord::fromJson(value.toObject(), userId);
            record.isMine = true;
            done(record, BackendError());
        });
}

void RestBackend::updateTranslation(const QString& recordId, const TranslationUpdate& update,
                                    RecordCallback done)
{
    const QString userId = m_userId;
    send("PUT", endpoint(QString("translations/%1").arg(recordId)), updateBody(update),
        [done, userId, recordId](const QJsonValue& value, const BackendError& error) {
            if (!error.isNull()) {
                done(TranslationRecord(), error);
                return;
            }
            TranslationRecord record = TranslationRecord::fromJson(value.toObject(), userId);
            if (record.id.isEmpty()) {
                record.id = recordId;
            }
            done(record, BackendError());
        });
}

void RestBackend::fetchImage(const QString& url, ImageCallback done)
{
    QNetworkRequest request = makeRequest(m_baseUrl.resolved(QUrl(url)));
    request.setHeader(QNetworkRequest::ContentTypeHeader, QVariant());
    request.setRawHeader("Accept", "image/*");

    sendRaw("GET", request, QByteArray(),
        [done](const QByteArray& bytes, const QString& contentType, const BackendError& error) {
            if (!error.isNull()) {
                done(ImagePayload(), error);
                return;
            }
            done(ImagePayload{bytes, contentType}, BackendError());
        });
}
