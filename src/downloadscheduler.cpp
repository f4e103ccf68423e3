/*
 * SPDX-FileCopyrightText: 2025 dropbox-backup contributors
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 *
 */

#include "downloadscheduler.h"
#include "abstractdropboxapi.h"
#include "dropboxdebug.h"
#include "dropboxpath.h"
#include "progressreporter.h"
#include "tokenmanager.h"

#include <QAtomicInt>
#include <QDir>
#include <QElapsedTimer>
#include <QFileInfo>
#include <QSaveFile>
#include <QTemporaryFile>
#include <QThread>
#include <QThreadPool>

#include <cerrno>
#include <cstdio>
#include <system_error>
#include <vector>

struct DownloadScheduler::RunState {
    QString destinationDir;
    std::vector<DownloadJob> jobs;
    QAtomicInt nextIndex;
    QAtomicInt completed;
    QAtomicInt succeeded;
    QAtomicInt failed;
    QAtomicInt aborted;
};

DownloadScheduler::DownloadScheduler(AbstractDropboxApi *api, TokenManager *tokens, AbstractProgressReporter *reporter, const DownloadOptions &options)
    : m_api(api)
    , m_tokens(tokens)
    , m_reporter(reporter)
    , m_options(options)
{
}

DownloadSummary DownloadScheduler::downloadAll(const QStringList &remotePaths, const QString &destinationDir)
{
    DownloadSummary summary;
    summary.total = remotePaths.size();

    if (!QDir().mkpath(m_options.tempDir)) {
        summary.aborted = true;
        summary.errorMessage = QStringLiteral("Could not create temporary folder %1").arg(m_options.tempDir);
        qCCritical(DROPBOX) << summary.errorMessage;
        return summary;
    }

    RunState state;
    state.destinationDir = destinationDir;
    state.jobs.resize(remotePaths.size());
    for (qsizetype i = 0; i < remotePaths.size(); ++i) {
        state.jobs[i].remotePath = remotePaths.at(i);
    }

    const int workers = qMin(qMax(1, m_options.maxConcurrent), static_cast<int>(remotePaths.size()));
    if (workers > 0) {
        qCInfo(DROPBOX) << "Downloading" << remotePaths.size() << "files with" << workers << "workers";
        QThreadPool pool;
        pool.setMaxThreadCount(workers);
        for (int slot = 0; slot < workers; ++slot) {
            pool.start([this, &state]() {
                runWorker(state);
            });
        }
        pool.waitForDone();
    }

    summary.succeeded = state.succeeded.loadAcquire();
    summary.failed = state.failed.loadAcquire();
    summary.aborted = state.aborted.loadAcquire() != 0;
    if (summary.aborted) {
        summary.errorMessage = m_tokens->errorMessage();
    }
    summary.jobs.reserve(state.jobs.size());
    for (DownloadJob &job : state.jobs) {
        summary.jobs.append(std::move(job));
    }
    return summary;
}

void DownloadScheduler::runWorker(RunState &state)
{
    // Per-worker, so the delay throttles each slot rather than the whole pool.
    QElapsedTimer sinceLastCall;

    while (!state.aborted.loadAcquire()) {
        const int index = state.nextIndex.fetchAndAddOrdered(1);
        if (index >= static_cast<int>(state.jobs.size())) {
            return;
        }

        DownloadJob &job = state.jobs[index];
        if (!m_tokens->ensureValid()) {
            state.aborted.storeRelease(1);
            return;
        }

        download(job, state.destinationDir, sinceLastCall);
        // A job left pending never reached the server with usable credentials.
        if (job.status != DownloadJob::Status::Pending) {
            record(state, job);
        }
        if (m_tokens->hasFailed()) {
            state.aborted.storeRelease(1);
            return;
        }
    }
}

void DownloadScheduler::download(DownloadJob &job, const QString &destinationDir, QElapsedTimer &sinceLastCall)
{
    const auto fail = [&job](int httpStatus, const QString &message) {
        job.status = DownloadJob::Status::Failed;
        job.httpStatus = httpStatus;
        job.errorMessage = message;
    };

    if (!DropboxPath(job.remotePath).isSafeForLocal()) {
        fail(0, QStringLiteral("Remote path cannot be placed below the destination"));
        return;
    }
    job.destinationPath = destinationPathFor(destinationDir, job.remotePath);

    QTemporaryFile temp(QDir(m_options.tempDir).filePath(QStringLiteral("dropbox-backup-XXXXXX.part")));
    if (!temp.open()) {
        fail(0, QStringLiteral("Could not create temporary file: %1").arg(temp.errorString()));
        return;
    }
    job.localTempPath = temp.fileName();

    QString token = m_tokens->accessToken();
    throttle(sinceLastCall);
    auto result = m_api->download(token, job.remotePath, &temp);
    if (result.httpStatus == Dropbox::HttpUnauthorized) {
        // A refused refresh is fatal for the run; the job stays pending.
        if (!m_tokens->handleUnauthorized(token)) {
            return;
        }
        qCInfo(DROPBOX) << "Download of" << job.remotePath << "was rejected as unauthorized, retrying after refresh";
        token = m_tokens->accessToken();
        throttle(sinceLastCall);
        result = m_api->download(token, job.remotePath, &temp);
    }

    if (!result.success) {
        fail(result.httpStatus, result.errorMessage);
        return;
    }

    job.httpStatus = result.httpStatus;
    QString moveError;
    if (!moveIntoPlace(temp, job.destinationPath, &moveError)) {
        fail(result.httpStatus, moveError);
        return;
    }
    job.status = DownloadJob::Status::Succeeded;
}

void DownloadScheduler::throttle(QElapsedTimer &sinceLastCall) const
{
    if (sinceLastCall.isValid()) {
        const qint64 remaining = m_options.requestDelayMs - sinceLastCall.elapsed();
        if (remaining > 0) {
            QThread::msleep(static_cast<unsigned long>(remaining));
        }
    }
    sinceLastCall.start();
}

void DownloadScheduler::record(RunState &state, const DownloadJob &job)
{
    const bool succeeded = job.status == DownloadJob::Status::Succeeded;
    if (succeeded) {
        state.succeeded.ref();
    } else {
        state.failed.ref();
    }

    const int total = static_cast<int>(state.jobs.size());
    const int completed = state.completed.fetchAndAddOrdered(1) + 1;
    const int percent = percentOf(completed, total);
    if (!m_reporter) {
        return;
    }
    if (succeeded) {
        m_reporter->fileDownloaded(job, completed, total, percent);
    } else {
        m_reporter->fileFailed(job, completed, total, percent);
    }
}

bool DownloadScheduler::moveIntoPlace(QTemporaryFile &temp, const QString &target, QString *errorMessage)
{
    const QString targetDir = QFileInfo(target).absolutePath();
    if (!QDir().mkpath(targetDir)) {
        *errorMessage = QStringLiteral("Could not create folder %1").arg(targetDir);
        return false;
    }

    if (!temp.flush()) {
        *errorMessage = QStringLiteral("Could not write temporary file: %1").arg(temp.errorString());
        return false;
    }
    if (!temp.setPermissions(QFileDevice::ReadOwner | QFileDevice::WriteOwner | QFileDevice::ReadGroup | QFileDevice::ReadOther)) {
        qCDebug(DROPBOX) << "Could not relax permissions of" << temp.fileName();
    }
    temp.close();

    // rename(2) replaces an existing file atomically, so the destination never shows a partial file.
    if (std::rename(QFile::encodeName(temp.fileName()).constData(), QFile::encodeName(target).constData()) == 0) {
        temp.setAutoRemove(false);
        return true;
    }

    const int renameError = errno;
    if (renameError != EXDEV) {
        *errorMessage = QStringLiteral("Could not move download to %1: %2").arg(target, QString::fromStdString(std::generic_category().message(renameError)));
        return false;
    }

    // Temporary folder on another filesystem: copy through a QSaveFile, which commits atomically.
    if (!temp.open()) {
        *errorMessage = QStringLiteral("Could not reopen temporary file: %1").arg(temp.errorString());
        return false;
    }
    QSaveFile out(target);
    if (!out.open(QIODevice::WriteOnly)) {
        *errorMessage = QStringLiteral("Could not open %1: %2").arg(target, out.errorString());
        return false;
    }
    while (!temp.atEnd()) {
        const QByteArray chunk = temp.read(1024 * 1024);
        if (chunk.isEmpty() || out.write(chunk) != chunk.size()) {
            out.cancelWriting();
            *errorMessage = QStringLiteral("Could not copy download to %1: %2").arg(target, out.errorString());
            return false;
        }
    }
    if (!out.commit()) {
        *errorMessage = QStringLiteral("Could not commit %1: %2").arg(target, out.errorString());
        return false;
    }
    return true;
}

QString DownloadScheduler::destinationPathFor(const QString &destinationDir, const QString &remotePath)
{
    return QDir(destinationDir).filePath(DropboxPath(remotePath).localRelativePath());
}

int DownloadScheduler::percentOf(int completed, int total)
{
    if (total <= 0) {
        return 100;
    }
    return static_cast<int>(static_cast<qint64>(completed) * 100 / total);
}
