/*
 * SPDX-FileCopyrightText: 2025 dropbox-backup contributors
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 *
 */

#include "../src/downloadscheduler.h"
#include "../src/tokenmanager.h"
#include "fakedropboxapi.h"
#include "recordingreporter.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QHash>
#include <QTemporaryDir>
#include <QTest>

#include <algorithm>
#include <memory>

class DownloadSchedulerTest : public QObject
{
    Q_OBJECT

private Q_SLOTS:
    void init();

    void testAllFilesDownloaded();
    void testFailedDownloadLeavesNoFile();
    void testInterruptedDownloadLeavesNoFile();
    void testRerunOverwrites();
    void testConcurrencyIsBounded_data();
    void testConcurrencyIsBounded();
    void testRequestDelayPerWorker();
    void testTokenExpiryMidRun();
    void testRefreshFailureAborts();
    void testRefreshFailureKeepsFinishedDownloads();
    void testUnsafeRemotePath();
    void testEmptyInput();
    void testPercentOf_data();
    void testPercentOf();

private:
    DownloadOptions options(int maxConcurrent, int requestDelayMs = 0) const;
    QString destination() const;
    QStringList leftoverTempFiles() const;
    static QByteArray readFile(const QString &path);

    std::unique_ptr<QTemporaryDir> m_dir;
};

QTEST_GUILESS_MAIN(DownloadSchedulerTest)

static Dropbox::Credential validCredential()
{
    Dropbox::Credential credential;
    credential.accessToken = QStringLiteral("access-0");
    credential.refreshToken = QStringLiteral("refresh-0");
    credential.clientId = QStringLiteral("app-key");
    credential.clientSecret = QStringLiteral("app-secret");
    return credential;
}

void DownloadSchedulerTest::init()
{
    m_dir = std::make_unique<QTemporaryDir>();
    QVERIFY(m_dir->isValid());
}

DownloadOptions DownloadSchedulerTest::options(int maxConcurrent, int requestDelayMs) const
{
    DownloadOptions options;
    options.maxConcurrent = maxConcurrent;
    options.requestDelayMs = requestDelayMs;
    options.tempDir = m_dir->filePath(QStringLiteral("backup.partial"));
    return options;
}

QString DownloadSchedulerTest::destination() const
{
    return m_dir->filePath(QStringLiteral("backup"));
}

QStringList DownloadSchedulerTest::leftoverTempFiles() const
{
    return QDir(m_dir->filePath(QStringLiteral("backup.partial"))).entryList(QDir::Files | QDir::Hidden | QDir::NoDotAndDotDot);
}

QByteArray DownloadSchedulerTest::readFile(const QString &path)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        return QByteArray();
    }
    return file.readAll();
}

void DownloadSchedulerTest::testAllFilesDownloaded()
{
    FakeDropboxApi api;
    api.addFile(QStringLiteral("/A.txt"), QByteArrayLiteral("alpha"));
    api.addFile(QStringLiteral("/B.txt"), QByteArrayLiteral("bravo"));
    api.addFile(QStringLiteral("/Docs/C.pdf"), QByteArray(300 * 1024, 'c'));

    TokenManager tokens(&api, validCredential());
    RecordingReporter reporter;
    DownloadScheduler scheduler(&api, &tokens, &reporter, options(2));

    const QStringList files{QStringLiteral("/A.txt"), QStringLiteral("/B.txt"), QStringLiteral("/Docs/C.pdf")};
    const auto summary = scheduler.downloadAll(files, destination());

    QCOMPARE(summary.total, 3);
    QCOMPARE(summary.succeeded, 3);
    QCOMPARE(summary.failed, 0);
    QVERIFY(!summary.aborted);
    QCOMPARE(summary.jobs.size(), 3);
    for (int i = 0; i < files.size(); ++i) {
        const DownloadJob &job = summary.jobs.at(i);
        QCOMPARE(job.remotePath, files.at(i));
        QVERIFY(job.status == DownloadJob::Status::Succeeded);
        QCOMPARE(job.httpStatus, 200);
        QCOMPARE(job.destinationPath, DownloadScheduler::destinationPathFor(destination(), files.at(i)));
    }

    QCOMPARE(readFile(destination() + QStringLiteral("/A.txt")), QByteArrayLiteral("alpha"));
    QCOMPARE(readFile(destination() + QStringLiteral("/B.txt")), QByteArrayLiteral("bravo"));
    QCOMPARE(readFile(destination() + QStringLiteral("/Docs/C.pdf")), QByteArray(300 * 1024, 'c'));
    QVERIFY(QFileInfo(destination() + QStringLiteral("/A.txt")).permissions() & QFileDevice::ReadOther);
    QVERIFY(leftoverTempFiles().isEmpty());

    QCOMPARE(reporter.completions.size(), 3);
    auto completions = reporter.completions;
    std::sort(completions.begin(), completions.end(), [](const RecordingReporter::Completion &a, const RecordingReporter::Completion &b) {
        return a.completed < b.completed;
    });
    const QList<int> expectedPercent{33, 66, 100};
    for (int i = 0; i < completions.size(); ++i) {
        QVERIFY(completions.at(i).succeeded);
        QCOMPARE(completions.at(i).completed, i + 1);
        QCOMPARE(completions.at(i).total, 3);
        QCOMPARE(completions.at(i).percent, expectedPercent.at(i));
    }
}

void DownloadSchedulerTest::testFailedDownloadLeavesNoFile()
{
    FakeDropboxApi api;
    api.addFile(QStringLiteral("/A.txt"), QByteArrayLiteral("alpha"));
    api.addFile(QStringLiteral("/B.txt"), QByteArrayLiteral("bravo"));
    api.addFile(QStringLiteral("/C.txt"), QByteArrayLiteral("charlie"));
    api.addFile(QStringLiteral("/D.txt"), QByteArrayLiteral("delta"));
    api.setDownloadStatus(QStringLiteral("/D.txt"), 409);

    TokenManager tokens(&api, validCredential());
    RecordingReporter reporter;
    DownloadScheduler scheduler(&api, &tokens, &reporter, options(4));

    const QStringList files{QStringLiteral("/A.txt"), QStringLiteral("/B.txt"), QStringLiteral("/C.txt"), QStringLiteral("/D.txt")};
    const auto summary = scheduler.downloadAll(files, destination());

    QCOMPARE(summary.succeeded, 3);
    QCOMPARE(summary.failed, 1);
    QVERIFY(!summary.aborted);
    QVERIFY(summary.jobs.at(3).status == DownloadJob::Status::Failed);
    QCOMPARE(summary.jobs.at(3).httpStatus, 409);
    QVERIFY(!summary.jobs.at(3).errorMessage.isEmpty());

    QVERIFY(!QFile::exists(destination() + QStringLiteral("/D.txt")));
    QVERIFY(QFile::exists(destination() + QStringLiteral("/C.txt")));
    QVERIFY(leftoverTempFiles().isEmpty());

    const auto failed = std::find_if(reporter.completions.cbegin(), reporter.completions.cend(), [](const RecordingReporter::Completion &completion) {
        return !completion.succeeded;
    });
    QVERIFY(failed != reporter.completions.cend());
    QCOMPARE(failed->path, QStringLiteral("/D.txt"));
    QCOMPARE(failed->httpStatus, 409);
}

void DownloadSchedulerTest::testInterruptedDownloadLeavesNoFile()
{
    FakeDropboxApi api;
    api.addFile(QStringLiteral("/big.bin"), QByteArray(4096, 'b'));
    api.interruptDownload(QStringLiteral("/big.bin"), QByteArray(1000, 'b'));

    TokenManager tokens(&api, validCredential());
    DownloadScheduler scheduler(&api, &tokens, nullptr, options(1));

    const auto summary = scheduler.downloadAll({QStringLiteral("/big.bin")}, destination());
    QCOMPARE(summary.succeeded, 0);
    QCOMPARE(summary.failed, 1);
    QVERIFY(!summary.jobs.first().localTempPath.isEmpty());
    QVERIFY(!QFile::exists(summary.jobs.first().localTempPath));
    QVERIFY(!QFile::exists(destination() + QStringLiteral("/big.bin")));
    QVERIFY(leftoverTempFiles().isEmpty());
}

void DownloadSchedulerTest::testRerunOverwrites()
{
    FakeDropboxApi api;
    api.addFile(QStringLiteral("/A.txt"), QByteArrayLiteral("first"));
    api.addFile(QStringLiteral("/Docs/C.pdf"), QByteArrayLiteral("first pdf"));

    TokenManager tokens(&api, validCredential());
    const QStringList files{QStringLiteral("/A.txt"), QStringLiteral("/Docs/C.pdf")};

    DownloadScheduler first(&api, &tokens, nullptr, options(2));
    const auto firstRun = first.downloadAll(files, destination());
    QCOMPARE(firstRun.succeeded, 2);

    api.addFile(QStringLiteral("/A.txt"), QByteArrayLiteral("second"));

    DownloadScheduler second(&api, &tokens, nullptr, options(2));
    const auto secondRun = second.downloadAll(files, destination());
    QCOMPARE(secondRun.total, firstRun.total);
    QCOMPARE(secondRun.succeeded, firstRun.succeeded);
    QCOMPARE(secondRun.failed, firstRun.failed);

    QCOMPARE(readFile(destination() + QStringLiteral("/A.txt")), QByteArrayLiteral("second"));
    QCOMPARE(readFile(destination() + QStringLiteral("/Docs/C.pdf")), QByteArrayLiteral("first pdf"));
    QCOMPARE(QDir(destination()).entryList(QDir::AllEntries | QDir::NoDotAndDotDot).size(), 2);
    QVERIFY(leftoverTempFiles().isEmpty());
}

void DownloadSchedulerTest::testConcurrencyIsBounded_data()
{
    QTest::addColumn<int>("maxConcurrent");

    QTest::newRow("one worker") << 1;
    QTest::newRow("three workers") << 3;
    QTest::newRow("more workers than files") << 50;
}

void DownloadSchedulerTest::testConcurrencyIsBounded()
{
    QFETCH(int, maxConcurrent);

    FakeDropboxApi api;
    api.setDownloadDelayMs(20);
    QStringList files;
    for (int i = 0; i < 12; ++i) {
        const QString path = QStringLiteral("/Batch/file%1.txt").arg(i);
        api.addFile(path, path.toUtf8());
        files.append(path);
    }

    TokenManager tokens(&api, validCredential());
    DownloadScheduler scheduler(&api, &tokens, nullptr, options(maxConcurrent));

    const auto summary = scheduler.downloadAll(files, destination());
    QCOMPARE(summary.succeeded, static_cast<int>(files.size()));
    QCOMPARE(api.downloadCalls(), static_cast<int>(files.size()));
    QVERIFY(api.maxConcurrentDownloads() >= 1);
    QVERIFY(api.maxConcurrentDownloads() <= qMin(maxConcurrent, static_cast<int>(files.size())));
    for (const QString &path : std::as_const(files)) {
        QCOMPARE(readFile(destination() + path), path.toUtf8());
    }
}

void DownloadSchedulerTest::testRequestDelayPerWorker()
{
    constexpr int delayMs = 50;

    FakeDropboxApi api;
    QStringList files;
    for (int i = 0; i < 6; ++i) {
        const QString path = QStringLiteral("/f%1").arg(i);
        api.addFile(path);
        files.append(path);
    }

    TokenManager tokens(&api, validCredential());
    DownloadScheduler scheduler(&api, &tokens, nullptr, options(2, delayMs));

    const auto summary = scheduler.downloadAll(files, destination());
    QCOMPARE(summary.succeeded, 6);

    QHash<Qt::HANDLE, QList<qint64>> startsPerWorker;
    for (const auto &start : api.downloadStarts()) {
        startsPerWorker[start.thread].append(start.atMs);
    }
    QVERIFY(!startsPerWorker.isEmpty());
    for (const QList<qint64> &starts : std::as_const(startsPerWorker)) {
        for (qsizetype i = 1; i < starts.size(); ++i) {
            QVERIFY2(starts.at(i) - starts.at(i - 1) >= delayMs - 5,
                     qPrintable(QStringLiteral("%1 ms between downloads").arg(starts.at(i) - starts.at(i - 1))));
        }
    }
}

void DownloadSchedulerTest::testTokenExpiryMidRun()
{
    FakeDropboxApi api;
    api.setDownloadDelayMs(10);
    api.expireAccessTokenAfterDownloads(3);
    QStringList files;
    for (int i = 0; i < 10; ++i) {
        const QString path = QStringLiteral("/f%1.txt").arg(i);
        api.addFile(path, path.toUtf8());
        files.append(path);
    }

    TokenManager tokens(&api, validCredential());
    DownloadScheduler scheduler(&api, &tokens, nullptr, options(4));

    const auto summary = scheduler.downloadAll(files, destination());
    QCOMPARE(summary.succeeded, 10);
    QCOMPARE(summary.failed, 0);
    QVERIFY(!summary.aborted);
    QCOMPARE(api.refreshCalls(), 1);
    QCOMPARE(tokens.accessToken(), QStringLiteral("access-1"));
}

void DownloadSchedulerTest::testRefreshFailureAborts()
{
    FakeDropboxApi api;
    api.expireAccessTokenAfterDownloads(2);
    api.setRefreshFails(true);
    QStringList files;
    for (int i = 0; i < 5; ++i) {
        const QString path = QStringLiteral("/f%1.txt").arg(i);
        api.addFile(path);
        files.append(path);
    }

    TokenManager tokens(&api, validCredential());
    RecordingReporter reporter;
    DownloadScheduler scheduler(&api, &tokens, &reporter, options(1));

    const auto summary = scheduler.downloadAll(files, destination());
    QVERIFY(summary.aborted);
    QCOMPARE(summary.errorMessage, QStringLiteral("invalid_grant"));
    QCOMPARE(summary.total, 5);
    QCOMPARE(summary.succeeded, 2);
    QCOMPARE(summary.failed, 0);
    QCOMPARE(reporter.completions.size(), 2);
    QCOMPARE(api.downloadCalls(), 2);
    QCOMPARE(api.refreshCalls(), 1);
}

void DownloadSchedulerTest::testRefreshFailureKeepsFinishedDownloads()
{
    FakeDropboxApi api;
    api.setDownloadDelayMs(200);
    api.expireAccessTokenAfterDownloads(2);
    api.setRefreshFails(true);
    const QStringList files{QStringLiteral("/a.txt"), QStringLiteral("/b.txt"), QStringLiteral("/c.txt")};
    for (const QString &path : files) {
        api.addFile(path);
    }

    TokenManager tokens(&api, validCredential());
    RecordingReporter reporter;
    DownloadScheduler scheduler(&api, &tokens, &reporter, options(3));

    const auto summary = scheduler.downloadAll(files, destination());
    QVERIFY(summary.aborted);
    QCOMPARE(api.refreshCalls(), 1);

    // Downloads that were in flight with an accepted token still land and are accounted for.
    const QStringList onDisk = QDir(destination()).entryList(QDir::Files | QDir::NoDotAndDotDot);
    QCOMPARE(summary.succeeded, 2);
    QCOMPARE(summary.failed, 0);
    QCOMPARE(static_cast<int>(onDisk.size()), summary.succeeded);
    QCOMPARE(static_cast<int>(reporter.completions.size()), summary.succeeded);

    int succeededJobs = 0;
    for (const DownloadJob &job : summary.jobs) {
        if (job.status == DownloadJob::Status::Succeeded) {
            ++succeededJobs;
            QVERIFY(onDisk.contains(QFileInfo(job.destinationPath).fileName()));
        }
    }
    QCOMPARE(succeededJobs, summary.succeeded);
    QVERIFY(leftoverTempFiles().isEmpty());
}

void DownloadSchedulerTest::testUnsafeRemotePath()
{
    FakeDropboxApi api;
    TokenManager tokens(&api, validCredential());
    DownloadScheduler scheduler(&api, &tokens, nullptr, options(1));

    const auto summary = scheduler.downloadAll({QStringLiteral("/../escape.txt")}, destination());
    QCOMPARE(summary.failed, 1);
    QCOMPARE(api.downloadCalls(), 0);
    QVERIFY(!QFile::exists(m_dir->filePath(QStringLiteral("escape.txt"))));
}

void DownloadSchedulerTest::testEmptyInput()
{
    FakeDropboxApi api;
    TokenManager tokens(&api, validCredential());
    RecordingReporter reporter;
    DownloadScheduler scheduler(&api, &tokens, &reporter, options(4));

    const auto summary = scheduler.downloadAll({}, destination());
    QCOMPARE(summary.total, 0);
    QCOMPARE(summary.succeeded, 0);
    QCOMPARE(summary.failed, 0);
    QVERIFY(!summary.aborted);
    QVERIFY(summary.jobs.isEmpty());
    QVERIFY(reporter.completions.isEmpty());
    QCOMPARE(api.probeCalls(), 0);
}

void DownloadSchedulerTest::testPercentOf_data()
{
    QTest::addColumn<int>("completed");
    QTest::addColumn<int>("total");
    QTest::addColumn<int>("expectedPercent");

    QTest::newRow("first of three") << 1 << 3 << 33;
    QTest::newRow("second of three") << 2 << 3 << 66;
    QTest::newRow("all") << 3 << 3 << 100;
    QTest::newRow("one of seven") << 1 << 7 << 14;
    QTest::newRow("nothing to do") << 0 << 0 << 100;
    QTest::newRow("large totals") << 2147483 << 2147483 << 100;
}

void DownloadSchedulerTest::testPercentOf()
{
    QFETCH(int, completed);
    QFETCH(int, total);
    QFETCH(int, expectedPercent);

    QCOMPARE(DownloadScheduler::percentOf(completed, total), expectedPercent);
}

#include "downloadschedulertest.moc"
