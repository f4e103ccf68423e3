/*
 * SPDX-FileCopyrightText: 2025 dropbox-backup contributors
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 *
 */

#pragma once

#include "abstractdropboxapi.h"

#include <QElapsedTimer>
#include <QHash>
#include <QMutex>
#include <QSet>
#include <QStringList>
#include <QThread>

/**
 * In-memory Dropbox account.
 *
 * Folders list their children in insertion order, split into pages of pageSize() entries.
 * Exactly one access token is accepted at a time; refreshToken() mints a new one and, if
 * rotation is enabled, a new refresh token which must be presented on the next exchange.
 */
class FakeDropboxApi : public AbstractDropboxApi
{
public:
    struct DownloadStart {
        Qt::HANDLE thread;
        qint64 atMs;
    };

    FakeDropboxApi();

    void addFolder(const QString &path);
    void addFile(const QString &path, const QByteArray &content = QByteArray());
    void setPageSize(int size);

    void failListing(const QString &folderPath, int httpStatus, const QString &errorMessage = QStringLiteral("path/not_found/"));
    void failContinuation(const QString &folderPath, int pageIndex, int httpStatus);
    // The next @p count listing calls answer 401 whatever token they carry.
    void rejectNextListingCalls(int count);
    void setDownloadStatus(const QString &path, int httpStatus);
    void interruptDownload(const QString &path, const QByteArray &partialContent);

    void setValidAccessToken(const QString &token);
    void setCurrentRefreshToken(const QString &token);
    void setRotateRefreshTokens(bool rotate);
    void setRefreshFails(bool fails);
    void expireAccessToken();
    void expireAccessTokenAfterDownloads(int downloads);

    void setProbeDelayMs(int ms);
    void setRefreshDelayMs(int ms);
    void setDownloadDelayMs(int ms);

    QStringList calls() const;
    QStringList listingCalls() const;
    int refreshCalls() const;
    int probeCalls() const;
    int downloadCalls() const;
    int maxConcurrentDownloads() const;
    QList<DownloadStart> downloadStarts() const;
    QString validAccessToken() const;
    QString currentRefreshToken() const;

    Dropbox::CallResult probe(const QString &accessToken) override;
    Dropbox::ListFolderResult listFolder(const QString &accessToken, const QString &path) override;
    Dropbox::ListFolderResult listFolderContinue(const QString &accessToken, const QString &cursor) override;
    Dropbox::DownloadResult download(const QString &accessToken, const QString &path, QIODevice *sink) override;
    Dropbox::TokenResult refreshToken(const Dropbox::Credential &credential) override;

private:
    struct CursorState {
        QString folder;
        int offset = 0;
        int pageIndex = 0;
    };

    static QString normalized(const QString &path);
    Dropbox::ListFolderResult pageLocked(const QString &folder, int offset, int pageIndex);
    bool acceptsLocked(const QString &accessToken) const;

    mutable QMutex m_mutex;

    QSet<QString> m_folders;
    QHash<QString, QList<Dropbox::RemoteEntry>> m_children;
    QHash<QString, QByteArray> m_contents;
    int m_pageSize = 1000;
    int m_rejectedListingCalls = 0;

    QHash<QString, std::pair<int, QString>> m_listingFailures;
    QHash<QString, QHash<int, int>> m_continuationFailures;
    QHash<QString, int> m_downloadStatuses;
    QHash<QString, QByteArray> m_interruptedDownloads;

    QHash<QString, CursorState> m_cursors;
    int m_nextCursor = 0;

    QString m_validAccessToken;
    QString m_currentRefreshToken;
    bool m_rotateRefreshTokens = false;
    bool m_refreshFails = false;
    int m_tokenSerial = 0;
    int m_expireAfterDownloads = -1;

    int m_probeDelayMs = 0;
    int m_refreshDelayMs = 0;
    int m_downloadDelayMs = 0;

    QStringList m_calls;
    int m_refreshCalls = 0;
    int m_probeCalls = 0;
    int m_downloadCalls = 0;
    int m_inFlightDownloads = 0;
    int m_maxInFlightDownloads = 0;
    QList<DownloadStart> m_downloadStarts;
    QElapsedTimer m_clock;
};
