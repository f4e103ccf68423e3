/*
 * SPDX-FileCopyrightText: 2025 dropbox-backup contributors
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 *
 */

#pragma once

#include "downloadscheduler.h"
#include "progressreporter.h"

#include <QMutex>
#include <QMutexLocker>
#include <QStringList>

class RecordingReporter : public AbstractProgressReporter
{
public:
    struct Completion {
        QString path;
        bool succeeded = false;
        int httpStatus = 0;
        int completed = 0;
        int total = 0;
        int percent = 0;
    };

    void fileFound(const QString &path) override
    {
        QMutexLocker locker(&mutex);
        found.append(path);
    }

    void folderFailed(const QString &path, int httpStatus, const QString &errorMessage, const QStringList &droppedFiles) override
    {
        Q_UNUSED(httpStatus)
        Q_UNUSED(errorMessage)
        QMutexLocker locker(&mutex);
        failedFolders.append(path);
        dropped.append(droppedFiles);
    }

    void fileDownloaded(const DownloadJob &job, int completed, int total, int percent) override
    {
        QMutexLocker locker(&mutex);
        completions.append({job.remotePath, true, job.httpStatus, completed, total, percent});
    }

    void fileFailed(const DownloadJob &job, int completed, int total, int percent) override
    {
        QMutexLocker locker(&mutex);
        completions.append({job.remotePath, false, job.httpStatus, completed, total, percent});
    }

    void summary(int total, int succeeded, int failed, qint64 elapsedMs) override
    {
        Q_UNUSED(elapsedMs)
        QMutexLocker locker(&mutex);
        summaries.append(QList<int>{total, succeeded, failed});
    }

    QMutex mutex;
    QStringList found;
    QStringList failedFolders;
    QStringList dropped;
    QList<Completion> completions;
    QList<QList<int>> summaries;
};
