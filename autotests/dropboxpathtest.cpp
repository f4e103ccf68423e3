/*
 * SPDX-FileCopyrightText: 2025 dropbox-backup contributors
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 *
 */

#include "../src/downloadscheduler.h"
#include "../src/dropboxpath.h"

#include <QTest>

class DropboxPathTest : public QObject
{
    Q_OBJECT

private Q_SLOTS:
    void testDropboxPath_data();
    void testDropboxPath();
    void testDestinationPath_data();
    void testDestinationPath();
};

QTEST_GUILESS_MAIN(DropboxPathTest)

void DropboxPathTest::testDropboxPath_data()
{
    QTest::addColumn<QString>("path");
    QTest::addColumn<QString>("expectedApiPath");
    QTest::addColumn<QString>("expectedParentPath");
    QTest::addColumn<bool>("expectedIsRoot");
    QTest::addColumn<bool>("expectedIsSafeForLocal");
    QTest::addColumn<QStringList>("expectedPathComponents");
    QTest::addColumn<QString>("expectedFilename");

    // clang-format off
    QTest::newRow("empty path")
            << QString()
            << QString()
            << QString()
            << true  // expectedIsRoot
            << false // expectedIsSafeForLocal
            << QStringList()
            << QString();

    QTest::newRow("slash")
            << QStringLiteral("/")
            << QString()
            << QString()
            << true  // expectedIsRoot
            << false // expectedIsSafeForLocal
            << QStringList()
            << QString();

    QTest::newRow("file in root")
            << QStringLiteral("/A.txt")
            << QStringLiteral("/A.txt")
            << QString()
            << false // expectedIsRoot
            << true  // expectedIsSafeForLocal
            << QStringList {QStringLiteral("A.txt")}
            << QStringLiteral("A.txt");

    QTest::newRow("folder - no leading slash")
            << QStringLiteral("Photos")
            << QStringLiteral("/Photos")
            << QString()
            << false // expectedIsRoot
            << true  // expectedIsSafeForLocal
            << QStringList {QStringLiteral("Photos")}
            << QStringLiteral("Photos");

    QTest::newRow("folder - trailing slash")
            << QStringLiteral("/Photos/2024/")
            << QStringLiteral("/Photos/2024")
            << QStringLiteral("/Photos")
            << false // expectedIsRoot
            << true  // expectedIsSafeForLocal
            << QStringList {QStringLiteral("Photos"), QStringLiteral("2024")}
            << QStringLiteral("2024");

    QTest::newRow("file in subfolder")
            << QStringLiteral("/Photos/2024/beach.jpg")
            << QStringLiteral("/Photos/2024/beach.jpg")
            << QStringLiteral("/Photos/2024")
            << false // expectedIsRoot
            << true  // expectedIsSafeForLocal
            << QStringList {QStringLiteral("Photos"), QStringLiteral("2024"), QStringLiteral("beach.jpg")}
            << QStringLiteral("beach.jpg");

    QTest::newRow("doubled separators")
            << QStringLiteral("//Docs///C.pdf")
            << QStringLiteral("/Docs/C.pdf")
            << QStringLiteral("/Docs")
            << false // expectedIsRoot
            << true  // expectedIsSafeForLocal
            << QStringList {QStringLiteral("Docs"), QStringLiteral("C.pdf")}
            << QStringLiteral("C.pdf");

    QTest::newRow("parent traversal")
            << QStringLiteral("/Docs/../../etc/passwd")
            << QStringLiteral("/Docs/../../etc/passwd")
            << QStringLiteral("/Docs/../../etc")
            << false // expectedIsRoot
            << false // expectedIsSafeForLocal
            << QStringList {QStringLiteral("Docs"), QStringLiteral(".."), QStringLiteral(".."), QStringLiteral("etc"), QStringLiteral("passwd")}
            << QStringLiteral("passwd");

    QTest::newRow("current folder component")
            << QStringLiteral("/./A.txt")
            << QStringLiteral("/./A.txt")
            << QStringLiteral("/.")
            << false // expectedIsRoot
            << false // expectedIsSafeForLocal
            << QStringList {QStringLiteral("."), QStringLiteral("A.txt")}
            << QStringLiteral("A.txt");

    QTest::newRow("dotted filename")
            << QStringLiteral("/.hidden/..notes")
            << QStringLiteral("/.hidden/..notes")
            << QStringLiteral("/.hidden")
            << false // expectedIsRoot
            << true  // expectedIsSafeForLocal
            << QStringList {QStringLiteral(".hidden"), QStringLiteral("..notes")}
            << QStringLiteral("..notes");
    // clang-format on
}

void DropboxPathTest::testDropboxPath()
{
    QFETCH(QString, path);
    const auto dropboxPath = DropboxPath(path);

    QFETCH(QString, expectedApiPath);
    QFETCH(QString, expectedParentPath);
    QFETCH(bool, expectedIsRoot);
    QFETCH(bool, expectedIsSafeForLocal);
    QFETCH(QStringList, expectedPathComponents);
    QFETCH(QString, expectedFilename);

    QCOMPARE(dropboxPath.apiPath(), expectedApiPath);
    QCOMPARE(dropboxPath.parentPath(), expectedParentPath);
    QCOMPARE(dropboxPath.isRoot(), expectedIsRoot);
    QCOMPARE(dropboxPath.isSafeForLocal(), expectedIsSafeForLocal);
    QCOMPARE(dropboxPath.pathComponents(), expectedPathComponents);
    QCOMPARE(dropboxPath.filename(), expectedFilename);
    QCOMPARE(dropboxPath.localRelativePath(), expectedPathComponents.join(QLatin1Char('/')));

    if (expectedPathComponents.isEmpty()) {
        QVERIFY(dropboxPath.apiPath().isEmpty());
    } else {
        QCOMPARE(DropboxPath(dropboxPath.apiPath()).apiPath(), dropboxPath.apiPath());
    }
}

void DropboxPathTest::testDestinationPath_data()
{
    QTest::addColumn<QString>("destination");
    QTest::addColumn<QString>("remotePath");
    QTest::addColumn<QString>("expectedPath");

    QTest::newRow("file in root") << QStringLiteral("/backup") << QStringLiteral("/A.txt") << QStringLiteral("/backup/A.txt");
    QTest::newRow("nested file") << QStringLiteral("/backup") << QStringLiteral("/Docs/C.pdf") << QStringLiteral("/backup/Docs/C.pdf");
    QTest::newRow("relative destination") << QStringLiteral("backup") << QStringLiteral("/Docs/2024/x.bin") << QStringLiteral("backup/Docs/2024/x.bin");
}

void DropboxPathTest::testDestinationPath()
{
    QFETCH(QString, destination);
    QFETCH(QString, remotePath);
    QFETCH(QString, expectedPath);

    QCOMPARE(DownloadScheduler::destinationPathFor(destination, remotePath), expectedPath);
}

#include "dropboxpathtest.moc"
