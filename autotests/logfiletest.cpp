/*
 * SPDX-FileCopyrightText: 2025 dropbox-backup contributors
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 *
 */

#include "../src/logfile.h"
#include "dropboxdebug.h"

#include <QFile>
#include <QRegularExpression>
#include <QTemporaryDir>
#include <QTest>

class LogFileTest : public QObject
{
    Q_OBJECT

private Q_SLOTS:
    void testWritesFormattedLines();
    void testOnlyOneLogFileIsActive();
    void testUnwritablePath();
};

QTEST_GUILESS_MAIN(LogFileTest)

static QStringList readLines(const QString &path)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        return {};
    }
    return QString::fromUtf8(file.readAll()).split(QLatin1Char('\n'), Qt::SkipEmptyParts);
}

void LogFileTest::testWritesFormattedLines()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = dir.filePath(QStringLiteral("dropbox-backup.log"));

    {
        LogFile logFile;
        QVERIFY(logFile.open(path));
        qCInfo(DROPBOX) << "Found file:" << "/A.txt";
        qCWarning(DROPBOX).noquote() << QStringLiteral("Failed to download /D.txt (HTTP 409):") << QStringLiteral("path/not_found/");
    }
    qCInfo(DROPBOX) << "After the log file was closed";

    const QStringList lines = readLines(path);
    QCOMPARE(lines.size(), 2);

    const QRegularExpression info(QStringLiteral("^\\d{4}-\\d{2}-\\d{2} \\d{2}:\\d{2}:\\d{2},\\d{3} - info - Found file: /A\\.txt$"));
    QVERIFY2(info.match(lines.at(0)).hasMatch(), qPrintable(lines.at(0)));
    QVERIFY(lines.at(1).endsWith(QLatin1String(" - warning - Failed to download /D.txt (HTTP 409): path/not_found/")));
}

void LogFileTest::testOnlyOneLogFileIsActive()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());

    LogFile first;
    QVERIFY(first.open(dir.filePath(QStringLiteral("first.log"))));

    LogFile second;
    QVERIFY(!second.open(dir.filePath(QStringLiteral("second.log"))));
    QVERIFY(!second.errorString().isEmpty());

    qCInfo(DROPBOX) << "Only in the first log";
    QCOMPARE(readLines(dir.filePath(QStringLiteral("first.log"))).size(), 1);
    QVERIFY(readLines(dir.filePath(QStringLiteral("second.log"))).isEmpty());
}

void LogFileTest::testUnwritablePath()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());

    LogFile logFile;
    QVERIFY(!logFile.open(dir.filePath(QStringLiteral("missing/folder/backup.log"))));
    QVERIFY(!logFile.errorString().isEmpty());
}

#include "logfiletest.moc"
