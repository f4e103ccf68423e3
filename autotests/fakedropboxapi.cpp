/*
 * SPDX-FileCopyrightText: 2025 dropbox-backup contributors
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 *
 */

#include "fakedropboxapi.h"
#include "dropboxpath.h"

#include <QIODevice>
#include <QMutexLocker>

FakeDropboxApi::FakeDropboxApi()
    : m_validAccessToken(QStringLiteral("access-0"))
    , m_currentRefreshToken(QStringLiteral("refresh-0"))
{
    m_folders.insert(QString());
    m_clock.start();
}

QString FakeDropboxApi::normalized(const QString &path)
{
    return DropboxPath(path).apiPath();
}

void FakeDropboxApi::addFolder(const QString &path)
{
    QMutexLocker locker(&m_mutex);
    QString parent;
    QString folder;
    for (const QString &component : DropboxPath(path).pathComponents()) {
        folder += QLatin1Char('/') + component;
        if (!m_folders.contains(folder)) {
            m_folders.insert(folder);
            m_children[parent].append({folder, Dropbox::EntryKind::Folder});
        }
        parent = folder;
    }
}

void FakeDropboxApi::addFile(const QString &path, const QByteArray &content)
{
    const DropboxPath file(path);
    addFolder(file.parentPath());

    QMutexLocker locker(&m_mutex);
    if (!m_contents.contains(file.apiPath())) {
        m_children[file.parentPath()].append({file.apiPath(), Dropbox::EntryKind::File});
    }
    m_contents.insert(file.apiPath(), content);
}

void FakeDropboxApi::setPageSize(int size)
{
    QMutexLocker locker(&m_mutex);
    m_pageSize = size;
}

void FakeDropboxApi::failListing(const QString &folderPath, int httpStatus, const QString &errorMessage)
{
    QMutexLocker locker(&m_mutex);
    m_listingFailures.insert(normalized(folderPath), {httpStatus, errorMessage});
}

void FakeDropboxApi::failContinuation(const QString &folderPath, int pageIndex, int httpStatus)
{
    QMutexLocker locker(&m_mutex);
    m_continuationFailures[normalized(folderPath)].insert(pageIndex, httpStatus);
}

void FakeDropboxApi::rejectNextListingCalls(int count)
{
    QMutexLocker locker(&m_mutex);
    m_rejectedListingCalls = count;
}

void FakeDropboxApi::setDownloadStatus(const QString &path, int httpStatus)
{
    QMutexLocker locker(&m_mutex);
    m_downloadStatuses.insert(normalized(path), httpStatus);
}

void FakeDropboxApi::interruptDownload(const QString &path, const QByteArray &partialContent)
{
    QMutexLocker locker(&m_mutex);
    m_interruptedDownloads.insert(normalized(path), partialContent);
}

void FakeDropboxApi::setValidAccessToken(const QString &token)
{
    QMutexLocker locker(&m_mutex);
    m_validAccessToken = token;
}

void FakeDropboxApi::setCurrentRefreshToken(const QString &token)
{
    QMutexLocker locker(&m_mutex);
    m_currentRefreshToken = token;
}

void FakeDropboxApi::setRotateRefreshTokens(bool rotate)
{
    QMutexLocker locker(&m_mutex);
    m_rotateRefreshTokens = rotate;
}

void FakeDropboxApi::setRefreshFails(bool fails)
{
    QMutexLocker locker(&m_mutex);
    m_refreshFails = fails;
}

void FakeDropboxApi::expireAccessToken()
{
    QMutexLocker locker(&m_mutex);
    m_validAccessToken.clear();
}

void FakeDropboxApi::expireAccessTokenAfterDownloads(int downloads)
{
    QMutexLocker locker(&m_mutex);
    m_expireAfterDownloads = downloads;
}

void FakeDropboxApi::setProbeDelayMs(int ms)
{
    QMutexLocker locker(&m_mutex);
    m_probeDelayMs = ms;
}

void FakeDropboxApi::setRefreshDelayMs(int ms)
{
    QMutexLocker locker(&m_mutex);
    m_refreshDelayMs = ms;
}

void FakeDropboxApi::setDownloadDelayMs(int ms)
{
    QMutexLocker locker(&m_mutex);
    m_downloadDelayMs = ms;
}

QStringList FakeDropboxApi::calls() const
{
    QMutexLocker locker(&m_mutex);
    return m_calls;
}

QStringList FakeDropboxApi::listingCalls() const
{
    QMutexLocker locker(&m_mutex);
    QStringList listings;
    for (const QString &call : m_calls) {
        if (call.startsWith(QLatin1String("list"))) {
            listings.append(call);
        }
    }
    return listings;
}

int FakeDropboxApi::refreshCalls() const
{
    QMutexLocker locker(&m_mutex);
    return m_refreshCalls;
}

int FakeDropboxApi::probeCalls() const
{
    QMutexLocker locker(&m_mutex);
    return m_probeCalls;
}

int FakeDropboxApi::downloadCalls() const
{
    QMutexLocker locker(&m_mutex);
    return m_downloadCalls;
}

int FakeDropboxApi::maxConcurrentDownloads() const
{
    QMutexLocker locker(&m_mutex);
    return m_maxInFlightDownloads;
}

QList<FakeDropboxApi::DownloadStart> FakeDropboxApi::downloadStarts() const
{
    QMutexLocker locker(&m_mutex);
    return m_downloadStarts;
}

QString FakeDropboxApi::validAccessToken() const
{
    QMutexLocker locker(&m_mutex);
    return m_validAccessToken;
}

QString FakeDropboxApi::currentRefreshToken() const
{
    QMutexLocker locker(&m_mutex);
    return m_currentRefreshToken;
}

bool FakeDropboxApi::acceptsLocked(const QString &accessToken) const
{
    return !accessToken.isEmpty() && accessToken == m_validAccessToken;
}

Dropbox::CallResult FakeDropboxApi::probe(const QString &accessToken)
{
    QMutexLocker locker(&m_mutex);
    ++m_probeCalls;
    const int delay = m_probeDelayMs;
    const bool accepted = acceptsLocked(accessToken);
    locker.unlock();

    if (delay > 0) {
        QThread::msleep(delay);
    }
    if (!accepted) {
        return {false, Dropbox::HttpUnauthorized, QStringLiteral("invalid_access_token/")};
    }
    return {true, Dropbox::HttpOk, QString()};
}

Dropbox::ListFolderResult FakeDropboxApi::pageLocked(const QString &folder, int offset, int pageIndex)
{
    Dropbox::ListFolderResult result;
    result.success = true;
    result.httpStatus = Dropbox::HttpOk;

    const QList<Dropbox::RemoteEntry> children = m_children.value(folder);
    result.entries = children.mid(offset, m_pageSize);

    const int nextOffset = offset + static_cast<int>(result.entries.size());
    if (nextOffset < children.size()) {
        result.hasMore = true;
        result.cursor = QStringLiteral("cursor-%1").arg(++m_nextCursor);
        m_cursors.insert(result.cursor, {folder, nextOffset, pageIndex + 1});
    }
    return result;
}

Dropbox::ListFolderResult FakeDropboxApi::listFolder(const QString &accessToken, const QString &path)
{
    QMutexLocker locker(&m_mutex);
    const QString folder = normalized(path);
    m_calls.append(QStringLiteral("list:%1").arg(folder));

    Dropbox::ListFolderResult result;
    if (m_rejectedListingCalls > 0 || !acceptsLocked(accessToken)) {
        m_rejectedListingCalls = qMax(0, m_rejectedListingCalls - 1);
        result.httpStatus = Dropbox::HttpUnauthorized;
        result.errorMessage = QStringLiteral("invalid_access_token/");
        return result;
    }
    const auto failure = m_listingFailures.constFind(folder);
    if (failure != m_listingFailures.constEnd()) {
        result.httpStatus = failure->first;
        result.errorMessage = failure->second;
        return result;
    }
    if (!m_folders.contains(folder)) {
        result.httpStatus = 409;
        result.errorMessage = QStringLiteral("path/not_found/");
        return result;
    }
    return pageLocked(folder, 0, 0);
}

Dropbox::ListFolderResult FakeDropboxApi::listFolderContinue(const QString &accessToken, const QString &cursor)
{
    QMutexLocker locker(&m_mutex);
    m_calls.append(QStringLiteral("continue:%1").arg(cursor));

    Dropbox::ListFolderResult result;
    if (m_rejectedListingCalls > 0 || !acceptsLocked(accessToken)) {
        m_rejectedListingCalls = qMax(0, m_rejectedListingCalls - 1);
        result.httpStatus = Dropbox::HttpUnauthorized;
        result.errorMessage = QStringLiteral("invalid_access_token/");
        return result;
    }
    const auto state = m_cursors.constFind(cursor);
    if (state == m_cursors.constEnd()) {
        result.httpStatus = 409;
        result.errorMessage = QStringLiteral("reset/");
        return result;
    }
    const int failure = m_continuationFailures.value(state->folder).value(state->pageIndex, 0);
    if (failure != 0) {
        result.httpStatus = failure;
        result.errorMessage = QStringLiteral("other/");
        return result;
    }
    return pageLocked(state->folder, state->offset, state->pageIndex);
}

Dropbox::DownloadResult FakeDropboxApi::download(const QString &accessToken, const QString &path, QIODevice *sink)
{
    const QString file = normalized(path);

    QMutexLocker locker(&m_mutex);
    m_calls.append(QStringLiteral("download:%1").arg(file));
    ++m_downloadCalls;
    m_downloadStarts.append({QThread::currentThreadId(), m_clock.elapsed()});
    const bool accepted = acceptsLocked(accessToken);
    const int status = m_downloadStatuses.value(file, m_contents.contains(file) ? Dropbox::HttpOk : 409);
    const QByteArray content = m_contents.value(file);
    const auto interrupted = m_interruptedDownloads.constFind(file);
    const bool isInterrupted = interrupted != m_interruptedDownloads.constEnd();
    const QByteArray partial = isInterrupted ? *interrupted : QByteArray();
    const int delay = m_downloadDelayMs;
    if (accepted && m_expireAfterDownloads > 0 && --m_expireAfterDownloads == 0) {
        // This download still goes through; the next call with the same token does not.
        m_validAccessToken.clear();
    }
    m_maxInFlightDownloads = qMax(m_maxInFlightDownloads, ++m_inFlightDownloads);
    locker.unlock();

    if (delay > 0) {
        QThread::msleep(delay);
    }

    Dropbox::DownloadResult result;
    if (!accepted) {
        result.httpStatus = Dropbox::HttpUnauthorized;
        result.errorMessage = QStringLiteral("invalid_access_token/");
    } else if (status != Dropbox::HttpOk) {
        result.httpStatus = status;
        result.errorMessage = QStringLiteral("path/not_found/");
    } else if (isInterrupted) {
        result.httpStatus = Dropbox::HttpOk;
        result.bytesWritten = sink->write(partial);
        result.errorMessage = QStringLiteral("Connection closed");
    } else {
        result.httpStatus = Dropbox::HttpOk;
        result.bytesWritten = sink->write(content);
        result.success = result.bytesWritten == content.size();
    }

    locker.relock();
    --m_inFlightDownloads;
    return result;
}

Dropbox::TokenResult FakeDropboxApi::refreshToken(const Dropbox::Credential &credential)
{
    QMutexLocker locker(&m_mutex);
    ++m_refreshCalls;
    m_calls.append(QStringLiteral("refresh"));
    const int delay = m_refreshDelayMs;
    locker.unlock();

    if (delay > 0) {
        QThread::msleep(delay);
    }

    locker.relock();
    Dropbox::TokenResult result;
    if (m_refreshFails || credential.refreshToken != m_currentRefreshToken) {
        result.httpStatus = 400;
        result.errorMessage = QStringLiteral("invalid_grant");
        return result;
    }

    ++m_tokenSerial;
    m_validAccessToken = QStringLiteral("access-%1").arg(m_tokenSerial);
    result.success = true;
    result.httpStatus = Dropbox::HttpOk;
    result.accessToken = m_validAccessToken;
    if (m_rotateRefreshTokens) {
        m_currentRefreshToken = QStringLiteral("refresh-%1").arg(m_tokenSerial);
        result.refreshToken = m_currentRefreshToken;
    }
    return result;
}
