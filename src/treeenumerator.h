/*
 * SPDX-FileCopyrightText: 2025 dropbox-backup contributors
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 *
 */

#pragma once

#include "abstractdropboxapi.h"

#include <QStringList>

class AbstractProgressReporter;
class TokenManager;

struct EnumerationResult {
    bool success = false;
    QString errorMessage;
    QStringList files;
    int failedFolders = 0;
    int listingCalls = 0;
};

/**
 * Lists every file below a remote folder.
 *
 * Files are returned in depth-first pre-order of discovery: a subfolder is expanded as soon
 * as its entry is met, before the rest of its parent's page and the parent's next pages.
 * Each folder is listed from a fresh initial call and paginates with its own cursor only.
 *
 * A folder whose listing fails contributes no files at all (its whole subtree is dropped)
 * while its siblings are still enumerated. Only a failed credential refresh aborts the walk.
 */
class TreeEnumerator
{
public:
    TreeEnumerator(AbstractDropboxApi *api, TokenManager *tokens, AbstractProgressReporter *reporter = nullptr);

    [[nodiscard]] EnumerationResult enumerate(const QString &rootPath);

private:
    [[nodiscard]] Dropbox::ListFolderResult fetchPage(const QString &folderPath, const QString &cursor, bool continuation, EnumerationResult &result);

    AbstractDropboxApi *const m_api;
    TokenManager *const m_tokens;
    AbstractProgressReporter *const m_reporter;
};
