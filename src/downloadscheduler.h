/*
 * SPDX-FileCopyrightText: 2025 dropbox-backup contributors
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 *
 */

#pragma once

#include <QList>
#include <QString>
#include <QStringList>

class AbstractDropboxApi;
class AbstractProgressReporter;
class QElapsedTimer;
class QTemporaryFile;
class TokenManager;

struct DownloadJob {
    enum class Status {
        Pending,
        Succeeded,
        Failed,
    };

    QString remotePath;
    QString localTempPath;
    QString destinationPath;
    Status status = Status::Pending;
    int httpStatus = 0;
    QString errorMessage;
};

struct DownloadOptions {
    int maxConcurrent = 50;
    // Minimum time between two download calls of the same worker.
    int requestDelayMs = 100;
    QString tempDir;
};

struct DownloadSummary {
    int total = 0;
    int succeeded = 0;
    int failed = 0;
    bool aborted = false;
    QString errorMessage;
    QList<DownloadJob> jobs;
};

/**
 * Downloads a list of remote files into a local folder with a fixed number of workers.
 *
 * Each worker takes the next path from the list and runs it to completion: token check,
 * download into a temporary file, atomic move into the destination. Before each download
 * call a worker waits until requestDelayMs passed since its own previous call.
 *
 * A failed download is recorded and never retried; other workers are not affected. A failed
 * credential refresh stops all workers and marks the run as aborted.
 */
class DownloadScheduler
{
public:
    DownloadScheduler(AbstractDropboxApi *api, TokenManager *tokens, AbstractProgressReporter *reporter, const DownloadOptions &options);

    [[nodiscard]] DownloadSummary downloadAll(const QStringList &remotePaths, const QString &destinationDir);

    /**
     * @return where @p remotePath is stored below @p destinationDir, mirroring the remote tree.
     */
    [[nodiscard]] static QString destinationPathFor(const QString &destinationDir, const QString &remotePath);
    [[nodiscard]] static int percentOf(int completed, int total);

private:
    struct RunState;

    void runWorker(RunState &state);
    void download(DownloadJob &job, const QString &destinationDir, QElapsedTimer &sinceLastCall);
    void throttle(QElapsedTimer &sinceLastCall) const;
    void record(RunState &state, const DownloadJob &job);
    [[nodiscard]] static bool moveIntoPlace(QTemporaryFile &temp, const QString &target, QString *errorMessage);

    AbstractDropboxApi *const m_api;
    TokenManager *const m_tokens;
    AbstractProgressReporter *const m_reporter;
    const DownloadOptions m_options;
};
