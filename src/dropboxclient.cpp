/*
 * SPDX-FileCopyrightText: 2025 dropbox-backup contributors
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "dropboxclient.h"
#include "dropboxdebug.h"

#include <QByteArray>
#include <QEventLoop>
#include <QIODevice>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QThread>
#include <QUrl>

#include <memory>

using namespace Dropbox;

namespace
{
constexpr int TransferTimeoutMs = 60 * 1000;

void waitForFinished(QNetworkReply *reply)
{
    if (reply->isFinished()) {
        return;
    }

    QEventLoop loop;
    QObject::connect(reply, &QNetworkReply::finished, &loop, &QEventLoop::quit);
    loop.exec();
}

int httpStatusOf(const QNetworkReply *reply)
{
    return reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
}

QUrl endpoint(const QUrl &base, const QString &path)
{
    QUrl url(base);
    url.setPath(base.path() + path);
    return url;
}

QByteArray formEncode(const QList<std::pair<QString, QString>> &fields)
{
    QByteArray body;
    for (const auto &[key, value] : fields) {
        if (!body.isEmpty()) {
            body.append('&');
        }
        body.append(QUrl::toPercentEncoding(key));
        body.append('=');
        body.append(QUrl::toPercentEncoding(value));
    }
    return body;
}
}

Client::Client(QObject *parent)
    : QObject(parent)
    , m_apiBaseUrl(QStringLiteral("https://api.dropboxapi.com"))
    , m_contentBaseUrl(QStringLiteral("https://content.dropboxapi.com"))
    , m_tokenUrl(QStringLiteral("https://api.dropboxapi.com/oauth2/token"))
{
}

Client::~Client() = default;

void Client::setApiBaseUrl(const QUrl &url)
{
    m_apiBaseUrl = url;
}

void Client::setContentBaseUrl(const QUrl &url)
{
    m_contentBaseUrl = url;
}

void Client::setTokenUrl(const QUrl &url)
{
    m_tokenUrl = url;
}

CallResult Client::probe(const QString &accessToken)
{
    CallResult result;
    if (accessToken.isEmpty()) {
        result.errorMessage = QStringLiteral("Missing Dropbox access token");
        result.httpStatus = HttpUnauthorized;
        return result;
    }

    QNetworkRequest request = buildRequest(accessToken, endpoint(m_apiBaseUrl, QStringLiteral("/2/users/get_current_account")));
    request.setHeader(QNetworkRequest::ContentTypeHeader, QStringLiteral("application/json"));

    std::unique_ptr<QNetworkReply> reply(network()->post(request, QByteArrayLiteral("null")));
    waitForFinished(reply.get());

    result.httpStatus = httpStatusOf(reply.get());
    const QByteArray payload = reply->readAll();
    if (reply->error() != QNetworkReply::NoError) {
        result.errorMessage = errorSummary(payload, reply->errorString());
        return result;
    }

    result.success = true;
    return result;
}

ListFolderResult Client::listFolder(const QString &accessToken, const QString &path)
{
    const QJsonObject body{
        {QStringLiteral("path"), path},
        {QStringLiteral("recursive"), false},
        {QStringLiteral("include_deleted"), false},
    };
    return postListing(accessToken, QStringLiteral("/2/files/list_folder"), body);
}

ListFolderResult Client::listFolderContinue(const QString &accessToken, const QString &cursor)
{
    const QJsonObject body{
        {QStringLiteral("cursor"), cursor},
    };
    return postListing(accessToken, QStringLiteral("/2/files/list_folder/continue"), body);
}

ListFolderResult Client::postListing(const QString &accessToken, const QString &endpointPath, const QJsonObject &body)
{
    ListFolderResult result;
    if (accessToken.isEmpty()) {
        result.errorMessage = QStringLiteral("Missing Dropbox access token");
        result.httpStatus = HttpUnauthorized;
        return result;
    }

    QNetworkRequest request = buildRequest(accessToken, endpoint(m_apiBaseUrl, endpointPath));
    request.setHeader(QNetworkRequest::ContentTypeHeader, QStringLiteral("application/json"));

    std::unique_ptr<QNetworkReply> reply(network()->post(request, QJsonDocument(body).toJson(QJsonDocument::Compact)));
    waitForFinished(reply.get());

    const int status = httpStatusOf(reply.get());
    const QByteArray payload = reply->readAll();
    if (reply->error() != QNetworkReply::NoError) {
        result.errorMessage = errorSummary(payload, reply->errorString());
        result.httpStatus = status;
        qCDebug(DROPBOX) << "Listing call" << endpointPath << "failed" << status << result.errorMessage;
        return result;
    }

    result = parseListFolderReply(payload);
    result.httpStatus = status;
    return result;
}

DownloadResult Client::download(const QString &accessToken, const QString &path, QIODevice *sink)
{
    DownloadResult result;
    if (accessToken.isEmpty()) {
        result.errorMessage = QStringLiteral("Missing Dropbox access token");
        result.httpStatus = HttpUnauthorized;
        return result;
    }

    QNetworkRequest request = buildRequest(accessToken, endpoint(m_contentBaseUrl, QStringLiteral("/2/files/download")));
    request.setRawHeader("Dropbox-API-Arg", apiArgHeader(path));
    // Content endpoints reject the form-urlencoded type Qt would pick for an empty POST.
    request.setHeader(QNetworkRequest::ContentTypeHeader, QStringLiteral("application/octet-stream"));

    std::unique_ptr<QNetworkReply> reply(network()->post(request, QByteArray()));

    QByteArray errorBody;
    bool sinkFailed = false;
    const auto consume = [&]() {
        const QByteArray chunk = reply->readAll();
        if (chunk.isEmpty()) {
            return;
        }
        if (httpStatusOf(reply.get()) != HttpOk) {
            errorBody.append(chunk);
            return;
        }
        if (sinkFailed) {
            return;
        }
        if (sink->write(chunk) != chunk.size()) {
            sinkFailed = true;
            reply->abort();
            return;
        }
        result.bytesWritten += chunk.size();
    };
    connect(reply.get(), &QNetworkReply::readyRead, reply.get(), consume);

    waitForFinished(reply.get());
    consume();

    result.httpStatus = httpStatusOf(reply.get());
    if (sinkFailed) {
        result.errorMessage = QStringLiteral("Could not write %1 to disk: %2").arg(path, sink->errorString());
        return result;
    }
    if (reply->error() != QNetworkReply::NoError) {
        result.errorMessage = errorSummary(errorBody, reply->errorString());
        return result;
    }
    if (result.httpStatus != HttpOk) {
        result.errorMessage = QStringLiteral("Unexpected HTTP status %1").arg(result.httpStatus);
        return result;
    }

    result.success = true;
    return result;
}

TokenResult Client::refreshToken(const Credential &credential)
{
    TokenResult result;
    if (!credential.canRefresh()) {
        result.errorMessage = QStringLiteral("Missing refresh token, client id or client secret");
        return result;
    }

    QNetworkRequest request(m_tokenUrl);
    request.setAttribute(QNetworkRequest::Http2AllowedAttribute, false);
    request.setTransferTimeout(TransferTimeoutMs);
    request.setHeader(QNetworkRequest::ContentTypeHeader, QStringLiteral("application/x-www-form-urlencoded"));

    const QByteArray body = formEncode({
        {QStringLiteral("grant_type"), QStringLiteral("refresh_token")},
        {QStringLiteral("refresh_token"), credential.refreshToken},
        {QStringLiteral("client_id"), credential.clientId},
        {QStringLiteral("client_secret"), credential.clientSecret},
    });

    std::unique_ptr<QNetworkReply> reply(network()->post(request, body));
    waitForFinished(reply.get());

    result.httpStatus = httpStatusOf(reply.get());
    const QByteArray payload = reply->readAll();
    if (reply->error() != QNetworkReply::NoError) {
        result.errorMessage = errorSummary(payload, reply->errorString());
        return result;
    }

    const QJsonObject tokens = QJsonDocument::fromJson(payload).object();
    result.accessToken = tokens.value(QStringLiteral("access_token")).toString();
    result.refreshToken = tokens.value(QStringLiteral("refresh_token")).toString();
    if (result.accessToken.isEmpty()) {
        result.errorMessage = QStringLiteral("Token endpoint reply carries no access token");
        return result;
    }

    result.success = true;
    return result;
}

ListFolderResult Client::parseListFolderReply(const QByteArray &payload)
{
    ListFolderResult result;

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(payload, &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        result.errorMessage = QStringLiteral("Malformed listing response: %1").arg(parseError.errorString());
        return result;
    }
    if (!doc.isObject()) {
        result.errorMessage = QStringLiteral("Malformed listing response: not a JSON object");
        return result;
    }

    const QJsonObject root = doc.object();
    const QJsonValue entries = root.value(QStringLiteral("entries"));
    if (!entries.isArray()) {
        result.errorMessage = QStringLiteral("Malformed listing response: no entries");
        return result;
    }

    const QJsonArray values = entries.toArray();
    for (const QJsonValue &value : values) {
        const QJsonObject obj = value.toObject();
        const QString tag = obj.value(QStringLiteral(".tag")).toString();
        RemoteEntry entry;
        entry.path = obj.value(QStringLiteral("path_display")).toString();
        if (entry.path.isEmpty()) {
            continue;
        }

        if (tag == QLatin1String("file")) {
            entry.kind = EntryKind::File;
        } else if (tag == QLatin1String("folder")) {
            entry.kind = EntryKind::Folder;
        } else {
            // "deleted" and anything newer than this client.
            continue;
        }
        result.entries.append(entry);
    }

    result.hasMore = root.value(QStringLiteral("has_more")).toBool();
    result.cursor = root.value(QStringLiteral("cursor")).toString();
    if (result.hasMore && result.cursor.isEmpty()) {
        result.entries.clear();
        result.errorMessage = QStringLiteral("Malformed listing response: more pages announced without a cursor");
        return result;
    }

    result.success = true;
    return result;
}

QByteArray Client::apiArgHeader(const QString &path)
{
    const QByteArray json = QJsonDocument(QJsonObject{{QStringLiteral("path"), path}}).toJson(QJsonDocument::Compact);

    // Header values must be ASCII, so everything else goes out as \uXXXX (surrogate pairs included).
    const QString text = QString::fromUtf8(json);
    QByteArray header;
    header.reserve(text.size());
    for (const QChar ch : text) {
        const char16_t code = ch.unicode();
        if (code < 0x7f) {
            header.append(static_cast<char>(code));
        } else {
            header.append(QStringLiteral("\\u%1").arg(static_cast<uint>(code), 4, 16, QLatin1Char('0')).toLatin1());
        }
    }
    return header;
}

QString Client::errorSummary(const QByteArray &payload, const QString &fallback)
{
    const QJsonObject object = QJsonDocument::fromJson(payload).object();
    const QString summary = object.value(QStringLiteral("error_summary")).toString();
    if (!summary.isEmpty()) {
        return summary;
    }
    const QString description = object.value(QStringLiteral("error_description")).toString();
    if (!description.isEmpty()) {
        return description;
    }
    const QString error = object.value(QStringLiteral("error")).toString();
    if (!error.isEmpty()) {
        return error;
    }

    const QString text = QString::fromUtf8(payload).trimmed();
    if (!text.isEmpty()) {
        return text.left(300);
    }
    return fallback;
}

QNetworkAccessManager *Client::network()
{
    if (QThread::currentThread() == thread()) {
        return &m_network;
    }

    // A QNetworkAccessManager must only be used from the thread that created it.
    if (!m_threadNetworks.hasLocalData()) {
        m_threadNetworks.setLocalData(new QNetworkAccessManager);
    }
    return m_threadNetworks.localData();
}

QNetworkRequest Client::buildRequest(const QString &accessToken, const QUrl &url) const
{
    QNetworkRequest request(url);
    request.setAttribute(QNetworkRequest::Http2AllowedAttribute, false);
    request.setAttribute(QNetworkRequest::RedirectPolicyAttribute, QNetworkRequest::NoLessSafeRedirectPolicy);
    request.setTransferTimeout(TransferTimeoutMs);
    request.setRawHeader("Authorization", "Bearer " + accessToken.toUtf8());
    return request;
}
