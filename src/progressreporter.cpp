/*
 * SPDX-FileCopyrightText: 2025 dropbox-backup contributors
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 *
 */

#include "progressreporter.h"
#include "downloadscheduler.h"
#include "dropboxdebug.h"

AbstractProgressReporter::~AbstractProgressReporter() = default;

void LogProgressReporter::fileFound(const QString &path)
{
    qCInfo(DROPBOX).noquote() << "Found file:" << path;
}

void LogProgressReporter::folderFailed(const QString &path, int httpStatus, const QString &errorMessage, const QStringList &droppedFiles)
{
    qCWarning(DROPBOX).noquote() << "Listing files for" << (path.isEmpty() ? QStringLiteral("/") : path) << "failed (HTTP" << httpStatus
                                 << "):" << errorMessage;
    if (!droppedFiles.isEmpty()) {
        qCWarning(DROPBOX).noquote() << QStringLiteral("Dropping %1 files:").arg(droppedFiles.size()) << droppedFiles.join(QStringLiteral(", "));
    }
}

void LogProgressReporter::fileDownloaded(const DownloadJob &job, int completed, int total, int percent)
{
    qCInfo(DROPBOX).noquote() << "Downloaded" << job.remotePath << QStringLiteral("(HTTP %1)").arg(job.httpStatus);
    qCInfo(DROPBOX).noquote() << QStringLiteral("Progress: %1% (%2/%3 files)").arg(percent).arg(completed).arg(total);
}

void LogProgressReporter::fileFailed(const DownloadJob &job, int completed, int total, int percent)
{
    qCWarning(DROPBOX).noquote() << "Failed to download" << job.remotePath << QStringLiteral("(HTTP %1):").arg(job.httpStatus) << job.errorMessage;
    qCInfo(DROPBOX).noquote() << QStringLiteral("Progress: %1% (%2/%3 files)").arg(percent).arg(completed).arg(total);
}

void LogProgressReporter::summary(int total, int succeeded, int failed, qint64 elapsedMs)
{
    qCInfo(DROPBOX).noquote() << QStringLiteral("Total files: %1, succeeded: %2, failed: %3").arg(total).arg(succeeded).arg(failed);
    qCInfo(DROPBOX).noquote() << QStringLiteral("Elapsed time: %1 seconds").arg(elapsedMs / 1000.0, 0, 'f', 3);
}
