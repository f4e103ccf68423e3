/*
 * SPDX-FileCopyrightText: 2025 dropbox-backup contributors
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 *
 */

#pragma once

#include "dropboxcredential.h"

#include <QList>
#include <QString>

class QIODevice;

namespace Dropbox
{
enum class EntryKind {
    File,
    Folder,
};

struct RemoteEntry {
    QString path;
    EntryKind kind = EntryKind::File;
};

struct CallResult {
    bool success = false;
    int httpStatus = 0;
    QString errorMessage;
};

struct ListFolderResult {
    bool success = false;
    int httpStatus = 0;
    QString errorMessage;
    QList<RemoteEntry> entries;
    bool hasMore = false;
    QString cursor;
};

struct DownloadResult {
    bool success = false;
    int httpStatus = 0;
    QString errorMessage;
    qint64 bytesWritten = 0;
};

struct TokenResult {
    bool success = false;
    int httpStatus = 0;
    QString errorMessage;
    QString accessToken;
    QString refreshToken;
};

constexpr int HttpOk = 200;
constexpr int HttpUnauthorized = 401;
}

class AbstractDropboxApi
{
public:
    virtual ~AbstractDropboxApi();

    /**
     * Lightweight authenticated call used to find out whether @p accessToken is still accepted.
     * An unauthorized token is reported as httpStatus 401.
     */
    virtual Dropbox::CallResult probe(const QString &accessToken) = 0;

    /**
     * Lists the first page of the folder at @p path ("" is the root). Not recursive.
     */
    virtual Dropbox::ListFolderResult listFolder(const QString &accessToken, const QString &path) = 0;

    /**
     * Fetches the page following @p cursor, for the folder the cursor was issued for.
     */
    virtual Dropbox::ListFolderResult listFolderContinue(const QString &accessToken, const QString &cursor) = 0;

    /**
     * Downloads the file at @p path, writing the body to @p sink as it arrives.
     * Nothing is written to @p sink unless the server answers with a success status.
     */
    virtual Dropbox::DownloadResult download(const QString &accessToken, const QString &path, QIODevice *sink) = 0;

    /**
     * Exchanges the refresh token of @p credential for a new access token.
     * The reply may carry a rotated refresh token.
     */
    virtual Dropbox::TokenResult refreshToken(const Dropbox::Credential &credential) = 0;
};
