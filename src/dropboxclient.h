/*
 * SPDX-FileCopyrightText: 2025 dropbox-backup contributors
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#pragma once

#include "abstractdropboxapi.h"

#include <QNetworkAccessManager>
#include <QObject>
#include <QThreadStorage>
#include <QUrl>

class QJsonObject;
class QNetworkRequest;

namespace Dropbox
{
/**
 * Blocking Dropbox HTTP API client.
 *
 * Every call runs a local event loop until its reply has finished. The client can be
 * shared between threads: each calling thread gets its own QNetworkAccessManager.
 */
class Client : public QObject, public AbstractDropboxApi
{
    Q_OBJECT
public:
    explicit Client(QObject *parent = nullptr);
    ~Client() override;

    CallResult probe(const QString &accessToken) override;
    ListFolderResult listFolder(const QString &accessToken, const QString &path) override;
    ListFolderResult listFolderContinue(const QString &accessToken, const QString &cursor) override;
    DownloadResult download(const QString &accessToken, const QString &path, QIODevice *sink) override;
    TokenResult refreshToken(const Credential &credential) override;

    void setApiBaseUrl(const QUrl &url);
    void setContentBaseUrl(const QUrl &url);
    void setTokenUrl(const QUrl &url);

    [[nodiscard]] static ListFolderResult parseListFolderReply(const QByteArray &payload);
    [[nodiscard]] static QByteArray apiArgHeader(const QString &path);
    [[nodiscard]] static QString errorSummary(const QByteArray &payload, const QString &fallback);

private:
    QNetworkAccessManager m_network;
    QThreadStorage<QNetworkAccessManager *> m_threadNetworks;

    QUrl m_apiBaseUrl;
    QUrl m_contentBaseUrl;
    QUrl m_tokenUrl;

    QNetworkAccessManager *network();
    [[nodiscard]] QNetworkRequest buildRequest(const QString &accessToken, const QUrl &url) const;
    [[nodiscard]] ListFolderResult postListing(const QString &accessToken, const QString &endpointPath, const QJsonObject &body);
};
}
