/*
 * SPDX-FileCopyrightText: 2025 dropbox-backup contributors
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 *
 */

#include "../src/tokenmanager.h"
#include "../src/treeenumerator.h"
#include "fakedropboxapi.h"
#include "recordingreporter.h"

#include <QTest>

#include <utility>

class TreeEnumeratorTest : public QObject
{
    Q_OBJECT

private Q_SLOTS:
    void testPaginatedRootWithSubfolder();
    void testDepthFirstOrder_data();
    void testDepthFirstOrder();
    void testEveryPageIsFetchedOnce();
    void testSiblingCursorsStaySeparate();
    void testFailedFolderDropsItsSubtree();
    void testFailedContinuationDropsEarlierPages();
    void testFailedContinuationDropsNestedFolders();
    void testEmptyFolders();
    void testRootPath();
    void testDeepTree();
    void testUnauthorizedListingIsRetried();
    void testRepeatedUnauthorizedListingFailsFolder();
    void testRefreshFailureAborts();
};

QTEST_GUILESS_MAIN(TreeEnumeratorTest)

static Dropbox::Credential validCredential()
{
    Dropbox::Credential credential;
    credential.accessToken = QStringLiteral("access-0");
    credential.refreshToken = QStringLiteral("refresh-0");
    credential.clientId = QStringLiteral("app-key");
    credential.clientSecret = QStringLiteral("app-secret");
    return credential;
}

void TreeEnumeratorTest::testPaginatedRootWithSubfolder()
{
    FakeDropboxApi api;
    api.setPageSize(2);
    api.addFile(QStringLiteral("/A.txt"));
    api.addFile(QStringLiteral("/B.txt"));
    api.addFile(QStringLiteral("/Docs/C.pdf"));

    TokenManager tokens(&api, validCredential());
    RecordingReporter reporter;
    TreeEnumerator enumerator(&api, &tokens, &reporter);

    const auto result = enumerator.enumerate(QString());
    QVERIFY(result.success);
    const QStringList expected{QStringLiteral("/A.txt"), QStringLiteral("/B.txt"), QStringLiteral("/Docs/C.pdf")};
    QCOMPARE(result.files, expected);
    QCOMPARE(reporter.found, expected);
    QCOMPARE(result.failedFolders, 0);
    QCOMPARE(result.listingCalls, 3);

    const QStringList expectedCalls{QStringLiteral("list:"), QStringLiteral("continue:cursor-1"), QStringLiteral("list:/Docs")};
    QCOMPARE(api.listingCalls(), expectedCalls);
    QCOMPARE(api.refreshCalls(), 0);
}

void TreeEnumeratorTest::testDepthFirstOrder_data()
{
    QTest::addColumn<int>("pageSize");

    QTest::newRow("one entry per page") << 1;
    QTest::newRow("two entries per page") << 2;
    QTest::newRow("three entries per page") << 3;
    QTest::newRow("single page") << 1000;
}

void TreeEnumeratorTest::testDepthFirstOrder()
{
    QFETCH(int, pageSize);

    FakeDropboxApi api;
    api.setPageSize(pageSize);
    api.addFile(QStringLiteral("/x.txt"));
    api.addFile(QStringLiteral("/Sub/s.txt"));
    api.addFile(QStringLiteral("/Sub/Deeper/t.txt"));
    api.addFile(QStringLiteral("/Sub/u.txt"));
    api.addFile(QStringLiteral("/y.txt"));
    api.addFile(QStringLiteral("/Other/o.txt"));

    TokenManager tokens(&api, validCredential());
    TreeEnumerator enumerator(&api, &tokens);

    const auto result = enumerator.enumerate(QString());
    QVERIFY(result.success);
    const QStringList expected{
        QStringLiteral("/x.txt"),
        QStringLiteral("/Sub/s.txt"),
        QStringLiteral("/Sub/Deeper/t.txt"),
        QStringLiteral("/Sub/u.txt"),
        QStringLiteral("/y.txt"),
        QStringLiteral("/Other/o.txt"),
    };
    QCOMPARE(result.files, expected);

    // The same remote state gives the same sequence.
    const auto again = enumerator.enumerate(QString());
    QCOMPARE(again.files, expected);
}

void TreeEnumeratorTest::testEveryPageIsFetchedOnce()
{
    FakeDropboxApi api;
    api.setPageSize(2);
    for (int i = 0; i < 6; ++i) {
        api.addFile(QStringLiteral("/Big/file%1.bin").arg(i));
    }

    TokenManager tokens(&api, validCredential());
    TreeEnumerator enumerator(&api, &tokens);

    const auto result = enumerator.enumerate(QStringLiteral("/Big"));
    QVERIFY(result.success);
    QCOMPARE(result.files.size(), 6);
    QCOMPARE(result.listingCalls, 3);

    const QStringList expectedCalls{QStringLiteral("list:/Big"), QStringLiteral("continue:cursor-1"), QStringLiteral("continue:cursor-2")};
    QCOMPARE(api.listingCalls(), expectedCalls);
}

void TreeEnumeratorTest::testSiblingCursorsStaySeparate()
{
    FakeDropboxApi api;
    api.setPageSize(1);
    api.addFile(QStringLiteral("/F1/a.txt"));
    api.addFile(QStringLiteral("/F1/b.txt"));
    api.addFile(QStringLiteral("/F2/a.txt"));
    api.addFile(QStringLiteral("/F2/b.txt"));

    TokenManager tokens(&api, validCredential());
    TreeEnumerator enumerator(&api, &tokens);

    const auto result = enumerator.enumerate(QString());
    QVERIFY(result.success);
    const QStringList expected{QStringLiteral("/F1/a.txt"), QStringLiteral("/F1/b.txt"), QStringLiteral("/F2/a.txt"), QStringLiteral("/F2/b.txt")};
    QCOMPARE(result.files, expected);
    QCOMPARE(result.failedFolders, 0);

    const QStringList expectedCalls{
        QStringLiteral("list:"),
        QStringLiteral("list:/F1"),
        QStringLiteral("continue:cursor-2"),
        QStringLiteral("continue:cursor-1"),
        QStringLiteral("list:/F2"),
        QStringLiteral("continue:cursor-3"),
    };
    QCOMPARE(api.listingCalls(), expectedCalls);
}

void TreeEnumeratorTest::testFailedFolderDropsItsSubtree()
{
    FakeDropboxApi api;
    api.addFile(QStringLiteral("/Good/a.txt"));
    api.addFile(QStringLiteral("/Bad/b.txt"));
    api.addFile(QStringLiteral("/Bad/Inner/c.txt"));
    api.addFile(QStringLiteral("/z.txt"));
    api.failListing(QStringLiteral("/Bad"), 409);

    TokenManager tokens(&api, validCredential());
    RecordingReporter reporter;
    TreeEnumerator enumerator(&api, &tokens, &reporter);

    const auto result = enumerator.enumerate(QString());
    QVERIFY(result.success);
    const QStringList expected{QStringLiteral("/Good/a.txt"), QStringLiteral("/z.txt")};
    QCOMPARE(result.files, expected);
    QCOMPARE(result.failedFolders, 1);
    QCOMPARE(reporter.failedFolders, QStringList{QStringLiteral("/Bad")});
    QVERIFY(!api.listingCalls().contains(QStringLiteral("list:/Bad/Inner")));
    QVERIFY(!tokens.hasFailed());
}

void TreeEnumeratorTest::testFailedContinuationDropsEarlierPages()
{
    FakeDropboxApi api;
    api.setPageSize(1);
    api.addFile(QStringLiteral("/Paged/1.txt"));
    api.addFile(QStringLiteral("/Paged/2.txt"));
    api.addFile(QStringLiteral("/Paged/3.txt"));
    api.addFile(QStringLiteral("/kept.txt"));
    api.failContinuation(QStringLiteral("/Paged"), 1, 500);

    TokenManager tokens(&api, validCredential());
    RecordingReporter reporter;
    TreeEnumerator enumerator(&api, &tokens, &reporter);

    const auto result = enumerator.enumerate(QString());
    QVERIFY(result.success);
    QCOMPARE(result.files, QStringList{QStringLiteral("/kept.txt")});
    QCOMPARE(result.failedFolders, 1);
    // Discovery is still reported as it happens; the failure names what it drops.
    QVERIFY(reporter.found.contains(QStringLiteral("/Paged/1.txt")));
    QVERIFY(reporter.dropped.contains(QStringLiteral("/Paged/1.txt")));
    QCOMPARE(reporter.found.size(), result.files.size() + reporter.dropped.size());
    for (const QString &path : std::as_const(reporter.found)) {
        QVERIFY2(result.files.contains(path) != reporter.dropped.contains(path), qPrintable(path));
    }
}

void TreeEnumeratorTest::testFailedContinuationDropsNestedFolders()
{
    FakeDropboxApi api;
    api.setPageSize(1);
    api.addFile(QStringLiteral("/Outer/Inner/x.txt"));
    api.addFile(QStringLiteral("/Outer/y.txt"));
    api.addFile(QStringLiteral("/Sibling/s.txt"));
    api.failContinuation(QStringLiteral("/Outer"), 1, 500);

    TokenManager tokens(&api, validCredential());
    RecordingReporter reporter;
    TreeEnumerator enumerator(&api, &tokens, &reporter);

    const auto result = enumerator.enumerate(QString());
    QVERIFY(result.success);
    QCOMPARE(result.files, QStringList{QStringLiteral("/Sibling/s.txt")});
    QCOMPARE(result.failedFolders, 1);
    QVERIFY(api.listingCalls().contains(QStringLiteral("list:/Outer/Inner")));
    // Files merged up from the finished subfolder are dropped with it.
    QVERIFY(reporter.dropped.contains(QStringLiteral("/Outer/Inner/x.txt")));
    QCOMPARE(reporter.found.size(), result.files.size() + reporter.dropped.size());
}

void TreeEnumeratorTest::testEmptyFolders()
{
    FakeDropboxApi api;
    TokenManager tokens(&api, validCredential());
    TreeEnumerator enumerator(&api, &tokens);

    auto result = enumerator.enumerate(QString());
    QVERIFY(result.success);
    QVERIFY(result.files.isEmpty());
    QCOMPARE(result.listingCalls, 1);

    api.addFolder(QStringLiteral("/Empty/Nested"));
    result = enumerator.enumerate(QString());
    QVERIFY(result.success);
    QVERIFY(result.files.isEmpty());
    QCOMPARE(result.failedFolders, 0);
    QCOMPARE(result.listingCalls, 3);
}

void TreeEnumeratorTest::testRootPath()
{
    FakeDropboxApi api;
    api.addFile(QStringLiteral("/A.txt"));
    api.addFile(QStringLiteral("/Docs/C.pdf"));
    api.addFile(QStringLiteral("/Docs/2024/D.pdf"));

    TokenManager tokens(&api, validCredential());
    TreeEnumerator enumerator(&api, &tokens);

    const auto result = enumerator.enumerate(QStringLiteral("Docs/"));
    QVERIFY(result.success);
    const QStringList expected{QStringLiteral("/Docs/C.pdf"), QStringLiteral("/Docs/2024/D.pdf")};
    QCOMPARE(result.files, expected);
    QCOMPARE(api.listingCalls().first(), QStringLiteral("list:/Docs"));

    const auto missing = enumerator.enumerate(QStringLiteral("/Nope"));
    QVERIFY(missing.success);
    QVERIFY(missing.files.isEmpty());
    QCOMPARE(missing.failedFolders, 1);
}

void TreeEnumeratorTest::testDeepTree()
{
    constexpr int depth = 2000;

    FakeDropboxApi api;
    QString folder;
    for (int i = 0; i < depth; ++i) {
        folder += QStringLiteral("/d");
    }
    api.addFile(folder + QStringLiteral("/leaf.txt"));
    api.addFile(QStringLiteral("/top.txt"));

    TokenManager tokens(&api, validCredential());
    TreeEnumerator enumerator(&api, &tokens);

    const auto result = enumerator.enumerate(QString());
    QVERIFY(result.success);
    const QStringList expected{folder + QStringLiteral("/leaf.txt"), QStringLiteral("/top.txt")};
    QCOMPARE(result.files, expected);
    QCOMPARE(result.listingCalls, depth + 1);
}

void TreeEnumeratorTest::testUnauthorizedListingIsRetried()
{
    FakeDropboxApi api;
    api.addFile(QStringLiteral("/A.txt"));
    api.rejectNextListingCalls(1);

    TokenManager tokens(&api, validCredential());
    TreeEnumerator enumerator(&api, &tokens);

    const auto result = enumerator.enumerate(QString());
    QVERIFY(result.success);
    QCOMPARE(result.files, QStringList{QStringLiteral("/A.txt")});
    QCOMPARE(result.failedFolders, 0);
    QCOMPARE(result.listingCalls, 2);
    QCOMPARE(api.refreshCalls(), 1);
    QCOMPARE(tokens.accessToken(), QStringLiteral("access-1"));
}

void TreeEnumeratorTest::testRepeatedUnauthorizedListingFailsFolder()
{
    FakeDropboxApi api;
    api.addFile(QStringLiteral("/A.txt"));
    api.rejectNextListingCalls(2);

    TokenManager tokens(&api, validCredential());
    TreeEnumerator enumerator(&api, &tokens);

    const auto result = enumerator.enumerate(QString());
    QVERIFY(result.success);
    QVERIFY(result.files.isEmpty());
    QCOMPARE(result.failedFolders, 1);
    QCOMPARE(result.listingCalls, 2);
    QCOMPARE(api.refreshCalls(), 1);
}

void TreeEnumeratorTest::testRefreshFailureAborts()
{
    FakeDropboxApi api;
    api.addFile(QStringLiteral("/A.txt"));
    api.addFile(QStringLiteral("/Docs/C.pdf"));
    api.setRefreshFails(true);

    Dropbox::Credential credential = validCredential();
    credential.accessToken = QStringLiteral("expired");
    TokenManager tokens(&api, credential);
    TreeEnumerator enumerator(&api, &tokens);

    const auto result = enumerator.enumerate(QString());
    QVERIFY(!result.success);
    QVERIFY(result.files.isEmpty());
    QCOMPARE(result.errorMessage, QStringLiteral("invalid_grant"));
    QCOMPARE(result.listingCalls, 0);
    QCOMPARE(api.refreshCalls(), 1);
}

#include "treeenumeratortest.moc"
