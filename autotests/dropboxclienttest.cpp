/*
 * SPDX-FileCopyrightText: 2025 dropbox-backup contributors
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 *
 */

#include "../src/dropboxclient.h"

#include <QBuffer>
#include <QHash>
#include <QJsonDocument>
#include <QJsonObject>
#include <QNetworkProxy>
#include <QTcpServer>
#include <QTcpSocket>
#include <QTest>
#include <QUrlQuery>

#include <functional>

using namespace Dropbox;

// Minimal HTTP/1.1 endpoint on the loopback interface. One request per connection.
class LocalHttpServer : public QObject
{
    Q_OBJECT
public:
    struct Request {
        QByteArray method;
        QByteArray path;
        QHash<QByteArray, QByteArray> headers;
        QByteArray body;
    };

    struct Response {
        int status = 200;
        QByteArray contentType = QByteArrayLiteral("application/json");
        QByteArray body;
        // Announce more bytes than are sent, then hang up.
        bool truncated = false;
    };

    using Handler = std::function<Response(const Request &)>;

    explicit LocalHttpServer(Handler handler)
        : m_handler(std::move(handler))
    {
        connect(&m_server, &QTcpServer::newConnection, this, &LocalHttpServer::acceptConnections);
        m_listening = m_server.listen(QHostAddress::LocalHost);
    }

    bool isListening() const
    {
        return m_listening;
    }

    QUrl url() const
    {
        return QUrl(QStringLiteral("http://127.0.0.1:%1").arg(m_server.serverPort()));
    }

    QList<Request> requests;

private:
    void acceptConnections()
    {
        while (QTcpSocket *socket = m_server.nextPendingConnection()) {
            connect(socket, &QTcpSocket::readyRead, this, [this, socket]() {
                serve(socket);
            });
            connect(socket, &QTcpSocket::disconnected, socket, &QObject::deleteLater);
        }
    }

    void serve(QTcpSocket *socket)
    {
        QByteArray &buffer = m_buffers[socket];
        buffer.append(socket->readAll());

        const qsizetype headerEnd = buffer.indexOf("\r\n\r\n");
        if (headerEnd < 0) {
            return;
        }

        Request request;
        const QList<QByteArray> lines = buffer.left(headerEnd).split('\n');
        const QList<QByteArray> requestLine = lines.first().trimmed().split(' ');
        request.method = requestLine.value(0);
        request.path = requestLine.value(1);
        for (qsizetype i = 1; i < lines.size(); ++i) {
            const qsizetype colon = lines.at(i).indexOf(':');
            if (colon > 0) {
                request.headers.insert(lines.at(i).left(colon).trimmed().toLower(), lines.at(i).mid(colon + 1).trimmed());
            }
        }

        const int length = request.headers.value(QByteArrayLiteral("content-length")).toInt();
        if (buffer.size() < headerEnd + 4 + length) {
            return;
        }
        request.body = buffer.mid(headerEnd + 4, length);
        m_buffers.remove(socket);
        requests.append(request);

        const Response response = m_handler(request);
        const qsizetype announced = response.truncated ? response.body.size() * 2 : response.body.size();
        QByteArray out;
        out += "HTTP/1.1 " + QByteArray::number(response.status) + " Status\r\n";
        out += "Content-Type: " + response.contentType + "\r\n";
        out += "Content-Length: " + QByteArray::number(announced) + "\r\n";
        out += "Connection: close\r\n\r\n";
        out += response.body;
        socket->write(out);
        socket->disconnectFromHost();
    }

    QTcpServer m_server;
    bool m_listening = false;
    Handler m_handler;
    QHash<QTcpSocket *, QByteArray> m_buffers;
};

class DropboxClientTest : public QObject
{
    Q_OBJECT

private Q_SLOTS:
    void initTestCase();

    void testParseListFolderReply();
    void testParseListFolderReplyMalformed_data();
    void testParseListFolderReplyMalformed();
    void testApiArgHeader_data();
    void testApiArgHeader();
    void testErrorSummary_data();
    void testErrorSummary();

    void testProbe();
    void testProbeWithoutToken();
    void testListFolder();
    void testListFolderContinue();
    void testListFolderFailure();
    void testDownload();
    void testDownloadErrorWritesNothing();
    void testDownloadInterrupted();
    void testRefreshToken();
    void testRefreshTokenRejected();
};

QTEST_GUILESS_MAIN(DropboxClientTest)

void DropboxClientTest::initTestCase()
{
    QNetworkProxy::setApplicationProxy(QNetworkProxy::NoProxy);
}

void DropboxClientTest::testParseListFolderReply()
{
    const QByteArray payload = R"({
        "entries": [
            {".tag": "file", "name": "A.txt", "path_lower": "/a.txt", "path_display": "/A.txt"},
            {".tag": "folder", "name": "Docs", "path_lower": "/docs", "path_display": "/Docs"},
            {".tag": "deleted", "name": "old.txt", "path_lower": "/old.txt", "path_display": "/old.txt"},
            {".tag": "file", "name": "B.txt", "path_lower": "/b.txt", "path_display": "/B.txt"}
        ],
        "cursor": "AAE-cursor",
        "has_more": true
    })";

    const auto result = Client::parseListFolderReply(payload);
    QVERIFY(result.success);
    QCOMPARE(result.entries.size(), 3);
    QCOMPARE(result.entries.at(0).path, QStringLiteral("/A.txt"));
    QVERIFY(result.entries.at(0).kind == EntryKind::File);
    QCOMPARE(result.entries.at(1).path, QStringLiteral("/Docs"));
    QVERIFY(result.entries.at(1).kind == EntryKind::Folder);
    QCOMPARE(result.entries.at(2).path, QStringLiteral("/B.txt"));
    QVERIFY(result.hasMore);
    QCOMPARE(result.cursor, QStringLiteral("AAE-cursor"));

    const auto lastPage = Client::parseListFolderReply(R"({"entries": [], "cursor": "AAF", "has_more": false})");
    QVERIFY(lastPage.success);
    QVERIFY(lastPage.entries.isEmpty());
    QVERIFY(!lastPage.hasMore);
}

void DropboxClientTest::testParseListFolderReplyMalformed_data()
{
    QTest::addColumn<QByteArray>("payload");

    QTest::newRow("not json") << QByteArrayLiteral("<html>Bad gateway</html>");
    QTest::newRow("array") << QByteArrayLiteral("[]");
    QTest::newRow("no entries") << QByteArrayLiteral(R"({"cursor": "x", "has_more": false})");
    QTest::newRow("entries not an array") << QByteArrayLiteral(R"({"entries": {}, "has_more": false})");
    QTest::newRow("more pages without cursor") << QByteArrayLiteral(R"({"entries": [], "has_more": true})");
}

void DropboxClientTest::testParseListFolderReplyMalformed()
{
    QFETCH(QByteArray, payload);

    const auto result = Client::parseListFolderReply(payload);
    QVERIFY(!result.success);
    QVERIFY(result.entries.isEmpty());
    QVERIFY(result.errorMessage.startsWith(QLatin1String("Malformed listing response")));
}

void DropboxClientTest::testApiArgHeader_data()
{
    QTest::addColumn<QString>("path");
    QTest::addColumn<QByteArray>("expectedHeader");

    QTest::newRow("ascii") << QStringLiteral("/Docs/C.pdf") << QByteArrayLiteral(R"({"path":"/Docs/C.pdf"})");
    QTest::newRow("quote") << QStringLiteral("/say \"hi\".txt") << QByteArrayLiteral(R"({"path":"/say \"hi\".txt"})");
    QTest::newRow("latin1") << QStringLiteral("/Café.txt") << QByteArrayLiteral(R"({"path":"/Caf\u00e9.txt"})");
    QTest::newRow("astral plane") << QStringLiteral("/\U0001F600.txt") << QByteArrayLiteral(R"({"path":"/\ud83d\ude00.txt"})");
}

void DropboxClientTest::testApiArgHeader()
{
    QFETCH(QString, path);
    QFETCH(QByteArray, expectedHeader);

    const QByteArray header = Client::apiArgHeader(path);
    QCOMPARE(header, expectedHeader);
    for (const char c : header) {
        QVERIFY(static_cast<unsigned char>(c) < 0x80);
    }
    QCOMPARE(QJsonDocument::fromJson(header).object().value(QStringLiteral("path")).toString(), path);
}

void DropboxClientTest::testErrorSummary_data()
{
    QTest::addColumn<QByteArray>("payload");
    QTest::addColumn<QString>("expectedSummary");

    QTest::newRow("api error") << QByteArrayLiteral(R"({"error_summary": "path/not_found/..", "error": {".tag": "path"}})")
                               << QStringLiteral("path/not_found/..");
    QTest::newRow("oauth error") << QByteArrayLiteral(R"({"error": "invalid_grant", "error_description": "refresh token is malformed"})")
                                 << QStringLiteral("refresh token is malformed");
    QTest::newRow("oauth error without description") << QByteArrayLiteral(R"({"error": "invalid_grant"})") << QStringLiteral("invalid_grant");
    QTest::newRow("plain text") << QByteArrayLiteral("  Error in call to API function\n") << QStringLiteral("Error in call to API function");
    QTest::newRow("empty") << QByteArray() << QStringLiteral("fallback");
}

void DropboxClientTest::testErrorSummary()
{
    QFETCH(QByteArray, payload);
    QFETCH(QString, expectedSummary);

    QCOMPARE(Client::errorSummary(payload, QStringLiteral("fallback")), expectedSummary);
}

void DropboxClientTest::testProbe()
{
    LocalHttpServer server([](const LocalHttpServer::Request &request) {
        LocalHttpServer::Response response;
        if (request.headers.value(QByteArrayLiteral("authorization")) != QByteArrayLiteral("Bearer good")) {
            response.status = 401;
            response.body = QByteArrayLiteral(R"({"error_summary": "expired_access_token/", "error": {".tag": "expired_access_token"}})");
            return response;
        }
        response.body = QByteArrayLiteral(R"({"account_id": "dbid:1"})");
        return response;
    });
    QVERIFY(server.isListening());

    Client client;
    client.setApiBaseUrl(server.url());

    const auto accepted = client.probe(QStringLiteral("good"));
    QVERIFY(accepted.success);
    QCOMPARE(accepted.httpStatus, HttpOk);

    const auto rejected = client.probe(QStringLiteral("stale"));
    QVERIFY(!rejected.success);
    QCOMPARE(rejected.httpStatus, HttpUnauthorized);
    QCOMPARE(rejected.errorMessage, QStringLiteral("expired_access_token/"));

    QCOMPARE(server.requests.size(), 2);
    QCOMPARE(server.requests.at(0).method, QByteArrayLiteral("POST"));
    QCOMPARE(server.requests.at(0).path, QByteArrayLiteral("/2/users/get_current_account"));
    QCOMPARE(server.requests.at(0).body, QByteArrayLiteral("null"));
}

void DropboxClientTest::testProbeWithoutToken()
{
    Client client;
    client.setApiBaseUrl(QUrl(QStringLiteral("http://127.0.0.1:9")));

    const auto result = client.probe(QString());
    QVERIFY(!result.success);
    QCOMPARE(result.httpStatus, HttpUnauthorized);
}

void DropboxClientTest::testListFolder()
{
    LocalHttpServer server([](const LocalHttpServer::Request &) {
        LocalHttpServer::Response response;
        response.body = QByteArrayLiteral(R"({"entries": [{".tag": "file", "path_display": "/Docs/C.pdf"}], "cursor": "c1", "has_more": true})");
        return response;
    });
    QVERIFY(server.isListening());

    Client client;
    client.setApiBaseUrl(server.url());

    const auto result = client.listFolder(QStringLiteral("token"), QStringLiteral("/Docs"));
    QVERIFY(result.success);
    QCOMPARE(result.httpStatus, HttpOk);
    QCOMPARE(result.entries.size(), 1);
    QCOMPARE(result.entries.first().path, QStringLiteral("/Docs/C.pdf"));
    QVERIFY(result.hasMore);
    QCOMPARE(result.cursor, QStringLiteral("c1"));

    QCOMPARE(server.requests.size(), 1);
    const auto &request = server.requests.first();
    QCOMPARE(request.path, QByteArrayLiteral("/2/files/list_folder"));
    QCOMPARE(request.headers.value(QByteArrayLiteral("authorization")), QByteArrayLiteral("Bearer token"));
    QCOMPARE(request.headers.value(QByteArrayLiteral("content-type")), QByteArrayLiteral("application/json"));
    const QJsonObject body = QJsonDocument::fromJson(request.body).object();
    QCOMPARE(body.value(QStringLiteral("path")).toString(), QStringLiteral("/Docs"));
    QCOMPARE(body.value(QStringLiteral("recursive")).toBool(true), false);
    QCOMPARE(body.value(QStringLiteral("include_deleted")).toBool(true), false);
}

void DropboxClientTest::testListFolderContinue()
{
    LocalHttpServer server([](const LocalHttpServer::Request &) {
        LocalHttpServer::Response response;
        response.body = QByteArrayLiteral(R"({"entries": [{".tag": "folder", "path_display": "/Docs/Old"}], "cursor": "c2", "has_more": false})");
        return response;
    });
    QVERIFY(server.isListening());

    Client client;
    client.setApiBaseUrl(server.url());

    const auto result = client.listFolderContinue(QStringLiteral("token"), QStringLiteral("c1"));
    QVERIFY(result.success);
    QCOMPARE(result.entries.size(), 1);
    QVERIFY(result.entries.first().kind == EntryKind::Folder);
    QVERIFY(!result.hasMore);

    QCOMPARE(server.requests.first().path, QByteArrayLiteral("/2/files/list_folder/continue"));
    QCOMPARE(QJsonDocument::fromJson(server.requests.first().body).object().value(QStringLiteral("cursor")).toString(), QStringLiteral("c1"));
}

void DropboxClientTest::testListFolderFailure()
{
    LocalHttpServer server([](const LocalHttpServer::Request &) {
        LocalHttpServer::Response response;
        response.status = 409;
        response.body = QByteArrayLiteral(R"({"error_summary": "path/not_found/...", "error": {".tag": "path"}})");
        return response;
    });
    QVERIFY(server.isListening());

    Client client;
    client.setApiBaseUrl(server.url());

    const auto result = client.listFolder(QStringLiteral("token"), QStringLiteral("/Missing"));
    QVERIFY(!result.success);
    QCOMPARE(result.httpStatus, 409);
    QCOMPARE(result.errorMessage, QStringLiteral("path/not_found/..."));
    QVERIFY(result.entries.isEmpty());
}

void DropboxClientTest::testDownload()
{
    const QByteArray content(256 * 1024, 'x');
    LocalHttpServer server([&content](const LocalHttpServer::Request &) {
        LocalHttpServer::Response response;
        response.contentType = QByteArrayLiteral("application/octet-stream");
        response.body = content;
        return response;
    });
    QVERIFY(server.isListening());

    Client client;
    client.setContentBaseUrl(server.url());

    QBuffer sink;
    QVERIFY(sink.open(QIODevice::WriteOnly));
    const auto result = client.download(QStringLiteral("token"), QStringLiteral("/Café.txt"), &sink);
    QVERIFY(result.success);
    QCOMPARE(result.httpStatus, HttpOk);
    QCOMPARE(result.bytesWritten, qint64(content.size()));
    QCOMPARE(sink.data(), content);

    const auto &request = server.requests.first();
    QCOMPARE(request.path, QByteArrayLiteral("/2/files/download"));
    QCOMPARE(request.headers.value(QByteArrayLiteral("dropbox-api-arg")), QByteArrayLiteral(R"({"path":"/Caf\u00e9.txt"})"));
    QVERIFY(request.body.isEmpty());
}

void DropboxClientTest::testDownloadErrorWritesNothing()
{
    LocalHttpServer server([](const LocalHttpServer::Request &) {
        LocalHttpServer::Response response;
        response.status = 409;
        response.body = QByteArrayLiteral(R"({"error_summary": "path/not_found/.", "error": {".tag": "path"}})");
        return response;
    });
    QVERIFY(server.isListening());

    Client client;
    client.setContentBaseUrl(server.url());

    QBuffer sink;
    QVERIFY(sink.open(QIODevice::WriteOnly));
    const auto result = client.download(QStringLiteral("token"), QStringLiteral("/D.txt"), &sink);
    QVERIFY(!result.success);
    QCOMPARE(result.httpStatus, 409);
    QCOMPARE(result.errorMessage, QStringLiteral("path/not_found/."));
    QCOMPARE(result.bytesWritten, qint64(0));
    QVERIFY(sink.data().isEmpty());
}

void DropboxClientTest::testDownloadInterrupted()
{
    LocalHttpServer server([](const LocalHttpServer::Request &) {
        LocalHttpServer::Response response;
        response.contentType = QByteArrayLiteral("application/octet-stream");
        response.body = QByteArray(1024, 'y');
        response.truncated = true;
        return response;
    });
    QVERIFY(server.isListening());

    Client client;
    client.setContentBaseUrl(server.url());

    QBuffer sink;
    QVERIFY(sink.open(QIODevice::WriteOnly));
    const auto result = client.download(QStringLiteral("token"), QStringLiteral("/big.bin"), &sink);
    QVERIFY(!result.success);
    QVERIFY(!result.errorMessage.isEmpty());
}

void DropboxClientTest::testRefreshToken()
{
    LocalHttpServer server([](const LocalHttpServer::Request &) {
        LocalHttpServer::Response response;
        response.body = QByteArrayLiteral(R"({"access_token": "sl.new", "token_type": "bearer", "expires_in": 14400, "refresh_token": "rotated"})");
        return response;
    });
    QVERIFY(server.isListening());

    Client client;
    QUrl tokenUrl = server.url();
    tokenUrl.setPath(QStringLiteral("/oauth2/token"));
    client.setTokenUrl(tokenUrl);

    Credential credential;
    credential.refreshToken = QStringLiteral("refresh&token");
    credential.clientId = QStringLiteral("app-key");
    credential.clientSecret = QStringLiteral("app secret");

    const auto result = client.refreshToken(credential);
    QVERIFY(result.success);
    QCOMPARE(result.accessToken, QStringLiteral("sl.new"));
    QCOMPARE(result.refreshToken, QStringLiteral("rotated"));

    const auto &request = server.requests.first();
    QCOMPARE(request.path, QByteArrayLiteral("/oauth2/token"));
    QCOMPARE(request.headers.value(QByteArrayLiteral("content-type")), QByteArrayLiteral("application/x-www-form-urlencoded"));
    QVERIFY(!request.headers.contains(QByteArrayLiteral("authorization")));

    const QUrlQuery form(QString::fromLatin1(request.body));
    QCOMPARE(form.queryItemValue(QStringLiteral("grant_type"), QUrl::FullyDecoded), QStringLiteral("refresh_token"));
    QCOMPARE(form.queryItemValue(QStringLiteral("refresh_token"), QUrl::FullyDecoded), QStringLiteral("refresh&token"));
    QCOMPARE(form.queryItemValue(QStringLiteral("client_id"), QUrl::FullyDecoded), QStringLiteral("app-key"));
    QCOMPARE(form.queryItemValue(QStringLiteral("client_secret"), QUrl::FullyDecoded), QStringLiteral("app secret"));
}

void DropboxClientTest::testRefreshTokenRejected()
{
    LocalHttpServer server([](const LocalHttpServer::Request &) {
        LocalHttpServer::Response response;
        response.status = 400;
        response.body = QByteArrayLiteral(R"({"error": "invalid_grant", "error_description": "refresh token has been revoked"})");
        return response;
    });
    QVERIFY(server.isListening());

    Client client;
    client.setTokenUrl(server.url());

    Credential credential;
    credential.refreshToken = QStringLiteral("revoked");
    credential.clientId = QStringLiteral("app-key");
    credential.clientSecret = QStringLiteral("secret");

    const auto result = client.refreshToken(credential);
    QVERIFY(!result.success);
    QCOMPARE(result.httpStatus, 400);
    QCOMPARE(result.errorMessage, QStringLiteral("refresh token has been revoked"));
    QVERIFY(result.accessToken.isEmpty());

    credential.clientSecret.clear();
    const auto incomplete = client.refreshToken(credential);
    QVERIFY(!incomplete.success);
    QCOMPARE(server.requests.size(), 1);
}

#include "dropboxclienttest.moc"
