#ifndef RESTBACKENDTESTS_H
#define RESTBACKENDTESTS_H

#include <QObject>
#include <QTest>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QTcpServer>
#include <QTcpSocket>
#include <memory>

#include "RestBackend.h"

/**
 * @brief Loopback HTTP server that answers every request with one canned response.
 */
class CannedHttpServer {
public:
    CannedHttpServer() {
        QObject::connect(&m_server, &QTcpServer::newConnection, &m_server, [this]() {
            while (QTcpSocket* socket = m_server.nextPendingConnection()) {
                QObject::connect(socket, &QTcpSocket::readyRead, socket, [this, socket]() { onReadyRead(socket); });
                QObject::connect(socket, &QTcpSocket::disconnected, socket, &QObject::deleteLater);
            }
        });
    }

    bool listen() { return m_server.listen(QHostAddress::LocalHost); }
    void close() { m_server.close(); }

    QUrl baseUrl() const { return QUrl(QString("http://127.0.0.1:%1/v1/").arg(m_server.serverPort())); }
    QString urlFor(const QString& path) const {
        return QString("http://127.0.0.1:%1/%2").arg(m_server.serverPort()).arg(path);
    }

    void respond(int status, const QByteArray& body, const QByteArray& contentType = "application/json") {
        m_status = status;
        m_body = body;
        m_contentType = contentType;
    }

    int requestCount() const { return m_requests.size(); }

    QByteArray requestLine(int i = 0) const {
        const QByteArray request = m_requests.value(i);
        return request.left(request.indexOf("\r\n"));
    }

    QByteArray header(const QByteArray& name, int i = 0) const {
        const QByteArray request = m_requests.value(i);
        const QList<QByteArray> lines = request.left(request.indexOf("\r\n\r\n")).split('\n');
        for (const QByteArray& line : lines) {
            const int colon = line.indexOf(':');
            if (colon > 0 && line.left(colon).trimmed().toLower() == name.toLower()) {
                return line.mid(colon + 1).trimmed();
            }
        }
        return QByteArray();
    }

    QJsonObject jsonBody(int i = 0) const {
        const QByteArray request = m_requests.value(i);
        return QJsonDocument::fromJson(request.mid(request.indexOf("\r\n\r\n") + 4)).object();
    }

private:
    void onReadyRead(QTcpSocket* socket) {
        const QByteArray buffer = socket->property("buffer").toByteArray() + socket->readAll();
        socket->setProperty("buffer", buffer);

        const int headerEnd = buffer.indexOf("\r\n\r\n");
        if (headerEnd < 0) {
            return;
        }
        int contentLength = 0;
        for (const QByteArray& line : buffer.left(headerEnd).split('\n')) {
            if (line.toLower().startsWith("content-length:")) {
                contentLength = line.mid(15).trimmed().toInt();
            }
        }
        if (buffer.size() < headerEnd + 4 + contentLength) {
            return;
        }
        m_requests.append(buffer);

        QByteArray response = "HTTP/1.1 " + QByteArray::number(m_status)
                              + (m_status < 300 ? " OK" : " Error") + "\r\n";
        if (!m_contentType.isEmpty()) {
            response += "Content-Type: " + m_contentType + "\r\n";
        }
        response += "Content-Length: " + QByteArray::number(m_body.size()) + "\r\n";
        response += "Connection: close\r\n\r\n";
        response += m_body;
        socket->write(response);
        socket->disconnectFromHost();
    }

    QTcpServer m_server;
    QList<QByteArray> m_requests;
    int m_status = 200;
    QByteArray m_body;
    QByteArray m_contentType;
};

/**
 * Unit tests for RestBackend (status classification, bodies, wire format).
 * Run with: transdesk --test-rest
 */
class RestBackendTests : public QObject {
    Q_OBJECT

private:
    std::unique_ptr<CannedHttpServer> m_server;
    std::unique_ptr<RestBackend> m_backend;

private slots:
    void init() {
        m_server.reset(new CannedHttpServer());
        QVERIFY(m_server->listen());
        m_backend.reset(new RestBackend(m_server->baseUrl(), "secret-token"));
        m_backend->setTimeout(3000);
        m_backend->setUserId("user-7");
    }

    void cleanup() {
        m_backend.reset();
        m_server.reset();
    }

    // ===== Helpers =====

    void testClassifyStatus() {
        QVERIFY(RestBackend::classify(200, "{}", QString()).isNull());
        QVERIFY(RestBackend::classify(204, QByteArray(), QString()).isNull());
        QVERIFY(RestBackend::classify(404, "gone", QString()).isNotFound());
        QVERIFY(RestBackend::classify(410, "gone", QString()).isNotFound());
        QVERIFY(RestBackend::classify(500, "boom", QString()).isTransient());
        QVERIFY(RestBackend::classify(503, "", QString()).isTransient());
        QVERIFY(RestBackend::classify(429, "slow down", QString()).isTransient());

        const BackendError rejected = RestBackend::classify(403, "forbidden", QString());
        QVERIFY(rejected.kind == BackendError::Kind::Rejected);
        QCOMPARE(rejected.httpStatus, 403);
        QVERIFY(rejected.message.contains("forbidden"));

        const BackendError transport = RestBackend::classify(0, QByteArray(), "Connection refused");
        QVERIFY(transport.isTransient());
        QVERIFY(transport.message.startsWith("request send error"));
    }

    void testParseBody() {
        QJsonValue value(42);
        QString error;
        QVERIFY(RestBackend::parseBody(QByteArray(), &value, &error));
        QVERIFY(value.isNull());
        QVERIFY(RestBackend::parseBody(" \n\t", &value, &error));
        QVERIFY(value.isNull());

        QVERIFY(RestBackend::parseBody("{\"id\":\"x\"}", &value, &error));
        QCOMPARE(value.toObject().value("id").toString(), QString("x"));
        QVERIFY(RestBackend::parseBody("[1,2]", &value, &error));
        QCOMPARE(value.toArray().size(), 2);

        QVERIFY(!RestBackend::parseBody("{broken", &value, &error));
        QVERIFY(error.startsWith("json parse error"));
    }

    void testUpdateBodyCarriesOnlySetFields() {
        TranslationUpdate update;
        update.content = QString("hello");
        QJsonObject body = RestBackend::updateBody(update);
        QCOMPARE(body.keys(), QStringList() << "content");

        TranslationUpdate other;
        other.proofreadContent = QString();
        other.selected = false;
        body = RestBackend::updateBody(other);
        QCOMPARE(body.size(), 2);
        QCOMPARE(body.value("proof_content").toString(), QString());
        QCOMPARE(body.value("selected").toBool(true), false);
    }

    void testSourceWireFormat() {
        const QByteArray json = R"({
            "id": "src-1", "x": 1.4, "y": 0.25, "position_type": 2,
            "translations": [
                {"id": "t-1", "content": "hi", "selected": true, "user": {"id": "user-2", "name": "Aki"}},
                {"id": "t-2", "content": "mine", "user": {"id": "user-7", "name": "Me"},
                 "proof_content": "proofed", "proofreader": {"name": "Rin"}}
            ]
        })";
        const TranslationSource source =
            TranslationSource::fromJson(QJsonDocument::fromJson(json).object(), "user-7");

        QCOMPARE(source.id, QString("src-1"));
        QCOMPARE(source.position, QPointF(1.0, 0.25));
        QVERIFY(source.category == TranslationSource::Category::Outside);
        QCOMPARE(source.records.size(), 2);
        QCOMPARE(source.myTranslationId, QString("t-2"));
        QCOMPARE(source.record("t-2")->proofreaderName, QString("Rin"));
        QVERIFY(source.record("t-1")->selected);
        QVERIFY(!source.record("t-1")->isMine);
    }

    // ===== Over HTTP =====

    void testListSourcesRequest() {
        m_server->respond(200, R"([{"id": "a", "x": 0.1, "y": 0.2, "position_type": 1},
                                   {"x": 0.5, "y": 0.5},
                                   {"id": "b", "x": 0.3, "y": 0.4, "position_type": 2,
                                    "my_translation": {"id": "t-9", "content": "draft"}}])");

        bool called = false;
        QVector<TranslationSource> result;
        m_backend->listPageSources("file-1", "en",
            [&](const QVector<TranslationSource>& sources, const BackendError& error) {
                called = true;
                QVERIFY(error.isNull());
                result = sources;
            });
        QTRY_VERIFY(called);

        QCOMPARE(m_server->requestLine(), QByteArray("GET /v1/files/file-1/sources?target_id=en HTTP/1.1"));
        QCOMPARE(m_server->header("Authorization"), QByteArray("Bearer secret-token"));

        // The entry without an id is skipped
        QCOMPARE(result.size(), 2);
        QCOMPARE(result.at(1).id, QString("b"));
        QCOMPARE(result.at(1).myTranslationId, QString("t-9"));
        QVERIFY(result.at(1).record("t-9")->isMine);
    }

    void testCreateSourceSendsPositionType() {
        m_server->respond(201, R"({"id": "new-1", "x": 0.6, "y": 0.7, "position_type": 2})");

        bool called = false;
        TranslationSource created;
        m_backend->createSource("file-3", "ja", 2, 0.6, 0.7,
            [&](const TranslationSource& source, const BackendError& error) {
                called = true;
                QVERIFY(error.isNull());
                created = source;
            });
        QTRY_VERIFY(called);

        QCOMPARE(m_server->requestLine(), QByteArray("POST /v1/files/file-3/sources?target_id=ja HTTP/1.1"));
        const QJsonObject body = m_server->jsonBody();
        QCOMPARE(body.value("position_type").toInt(), 2);
        QCOMPARE(body.value("x").toDouble(), 0.6);
        QCOMPARE(created.id, QString("new-1"));
    }

    void testUpdateTranslationRequest() {
        m_server->respond(200, R"({"id": "r-5", "content": "hi there", "user": {"id": "user-7"}})");

        TranslationUpdate update;
        update.content = QString("hi there");

        bool called = false;
        TranslationRecord record;
        m_backend->updateTranslation("r-5", update,
            [&](const TranslationRecord& rec, const BackendError& error) {
                called = true;
                QVERIFY(error.isNull());
                record = rec;
            });
        QTRY_VERIFY(called);

        QCOMPARE(m_server->requestLine(), QByteArray("PUT /v1/translations/r-5 HTTP/1.1"));
        QCOMPARE(m_server->jsonBody().keys(), QStringList() << "content");
        QCOMPARE(record.content, QString("hi there"));
        QVERIFY(record.isMine);
    }

    void testNotFoundIsClassified() {
        m_server->respond(404, R"({"message": "translation not found"})");

        bool called = false;
        BackendError result;
        m_backend->updateTranslation("gone", TranslationUpdate(),
            [&](const TranslationRecord&, const BackendError& error) {
                called = true;
                result = error;
            });
        QTRY_VERIFY(called);
        QVERIFY(result.isNotFound());
        QCOMPARE(result.httpStatus, 404);
    }

    void testEmptyBodySucceeds() {
        m_server->respond(204, QByteArray(), QByteArray());

        bool called = false;
        BackendError result = BackendError::transient("unset");
        m_backend->deleteSource("src-4", [&](const BackendError& error) {
            called = true;
            result = error;
        });
        QTRY_VERIFY(called);
        QVERIFY(result.isNull());
        QCOMPARE(m_server->requestLine(), QByteArray("DELETE /v1/sources/src-4 HTTP/1.1"));
    }

    void testFetchImageKeepsContentType() {
        m_server->respond(200, "\x89PNG fake", "image/png");

        bool called = false;
        ImagePayload payload;
        m_backend->fetchImage(m_server->urlFor("img/1.png"),
            [&](const ImagePayload& p, const BackendError& error) {
                called = true;
                QVERIFY(error.isNull());
                payload = p;
            });
        QTRY_VERIFY(called);
        QCOMPARE(payload.contentType, QString("image/png"));
        QCOMPARE(payload.bytes, QByteArray("\x89PNG fake"));
        QCOMPARE(m_server->header("Accept"), QByteArray("image/*"));
    }

    void testUnreachableServerIsTransient() {
        const QUrl base = m_server->baseUrl();
        m_server->close();
        RestBackend offline(base, QString());
        offline.setTimeout(2000);

        bool called = false;
        BackendError result;
        offline.deleteSource("src-1", [&](const BackendError& error) {
            called = true;
            result = error;
        });
        QTRY_VERIFY_WITH_TIMEOUT(called, 10000);
        QVERIFY(result.isTransient());
        QCOMPARE(result.httpStatus, 0);
    }
};

#endif // RESTBACKENDTESTS_H
