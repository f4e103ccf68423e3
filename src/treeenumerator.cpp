/*
 * SPDX-FileCopyrightText: 2025 dropbox-backup contributors
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 *
 */

#include "treeenumerator.h"
#include "dropboxdebug.h"
#include "dropboxpath.h"
#include "progressreporter.h"
#include "tokenmanager.h"

#include <vector>

namespace
{
// One folder being listed. The walk keeps these on an explicit stack instead of recursing,
// so arbitrarily deep trees cannot exhaust the call stack.
struct Frame {
    QString path;
    QList<Dropbox::RemoteEntry> page;
    qsizetype next = 0;
    bool listed = false;
    bool hasMore = false;
    QString cursor;
    QStringList files;
};
}

TreeEnumerator::TreeEnumerator(AbstractDropboxApi *api, TokenManager *tokens, AbstractProgressReporter *reporter)
    : m_api(api)
    , m_tokens(tokens)
    , m_reporter(reporter)
{
}

EnumerationResult TreeEnumerator::enumerate(const QString &rootPath)
{
    EnumerationResult result;

    std::vector<Frame> stack;
    stack.push_back(Frame{DropboxPath(rootPath).apiPath()});

    while (!stack.empty()) {
        Frame &frame = stack.back();

        const bool pageDone = frame.next >= frame.page.size();
        if (!frame.listed || (pageDone && frame.hasMore)) {
            const auto page = fetchPage(frame.path, frame.cursor, frame.listed, result);
            if (m_tokens->hasFailed()) {
                result.errorMessage = m_tokens->errorMessage();
                result.files.clear();
                return result;
            }

            if (!page.success) {
                ++result.failedFolders;
                if (m_reporter) {
                    m_reporter->folderFailed(frame.path, page.httpStatus, page.errorMessage, frame.files);
                } else {
                    qCWarning(DROPBOX) << "Listing files for" << frame.path << "failed, dropping" << frame.files.size() << "files found below it";
                }
                stack.pop_back();
                continue;
            }

            frame.listed = true;
            frame.page = page.entries;
            frame.next = 0;
            frame.hasMore = page.hasMore;
            frame.cursor = page.cursor;
            continue;
        }

        if (!pageDone) {
            const Dropbox::RemoteEntry entry = frame.page.at(frame.next++);
            if (entry.kind == Dropbox::EntryKind::File) {
                frame.files.append(entry.path);
                if (m_reporter) {
                    m_reporter->fileFound(entry.path);
                }
            } else {
                // Invalidates `frame`; the loop picks up the new top.
                stack.push_back(Frame{entry.path});
            }
            continue;
        }

        QStringList files = std::move(frame.files);
        stack.pop_back();
        if (stack.empty()) {
            result.files = std::move(files);
        } else {
            stack.back().files.append(files);
        }
    }

    result.success = true;
    return result;
}

Dropbox::ListFolderResult TreeEnumerator::fetchPage(const QString &folderPath, const QString &cursor, bool continuation, EnumerationResult &result)
{
    if (!m_tokens->ensureValid()) {
        return {};
    }

    const auto call = [&](const QString &token) {
        ++result.listingCalls;
        return continuation ? m_api->listFolderContinue(token, cursor) : m_api->listFolder(token, folderPath);
    };

    const QString token = m_tokens->accessToken();
    auto page = call(token);
    if (page.httpStatus == Dropbox::HttpUnauthorized) {
        qCInfo(DROPBOX) << "Listing" << folderPath << "was rejected as unauthorized, retrying after refresh";
        if (!m_tokens->handleUnauthorized(token)) {
            return page;
        }
        page = call(m_tokens->accessToken());
    }
    return page;
}
