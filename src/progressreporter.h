/*
 * SPDX-FileCopyrightText: 2025 dropbox-backup contributors
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 *
 */

#pragma once

#include <QString>
#include <QStringList>

struct DownloadJob;

/**
 * Receives the auditable events of a backup run.
 * Implementations are called concurrently from download workers.
 */
class AbstractProgressReporter
{
public:
    virtual ~AbstractProgressReporter();

    virtual void fileFound(const QString &path) = 0;

    /**
     * @p droppedFiles lists the files already found below @p path that are not downloaded.
     */
    virtual void folderFailed(const QString &path, int httpStatus, const QString &errorMessage, const QStringList &droppedFiles) = 0;

    /**
     * @p percent is @p completed * 100 / @p total, rounded down.
     */
    virtual void fileDownloaded(const DownloadJob &job, int completed, int total, int percent) = 0;
    virtual void fileFailed(const DownloadJob &job, int completed, int total, int percent) = 0;

    virtual void summary(int total, int succeeded, int failed, qint64 elapsedMs) = 0;
};

class LogProgressReporter : public AbstractProgressReporter
{
public:
    void fileFound(const QString &path) override;
    void folderFailed(const QString &path, int httpStatus, const QString &errorMessage, const QStringList &droppedFiles) override;
    void fileDownloaded(const DownloadJob &job, int completed, int total, int percent) override;
    void fileFailed(const DownloadJob &job, int completed, int total, int percent) override;
    void summary(int total, int succeeded, int failed, qint64 elapsedMs) override;
};
