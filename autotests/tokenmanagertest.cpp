/*
 * SPDX-FileCopyrightText: 2025 dropbox-backup contributors
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 *
 */

#include "../src/tokenmanager.h"
#include "fakedropboxapi.h"

#include <QTest>
#include <QThread>

#include <memory>
#include <vector>

class TokenManagerTest : public QObject
{
    Q_OBJECT

private Q_SLOTS:
    void testValidTokenIsKept();
    void testRejectedTokenIsRefreshed();
    void testEmptyAccessTokenIsRefreshed();
    void testRotatedRefreshTokenIsUsedNextTime();
    void testRefreshFailureIsSticky();
    void testMissingAppCredentialsFailRefresh();
    void testConcurrentCallersShareOneRefresh();
    void testUnauthorizedWithReplacedToken();
};

QTEST_GUILESS_MAIN(TokenManagerTest)

static Dropbox::Credential credentialWith(const QString &accessToken)
{
    Dropbox::Credential credential;
    credential.accessToken = accessToken;
    credential.refreshToken = QStringLiteral("refresh-0");
    credential.clientId = QStringLiteral("app-key");
    credential.clientSecret = QStringLiteral("app-secret");
    return credential;
}

void TokenManagerTest::testValidTokenIsKept()
{
    FakeDropboxApi api;
    TokenManager tokens(&api, credentialWith(QStringLiteral("access-0")));

    QVERIFY(tokens.ensureValid());
    QVERIFY(tokens.ensureValid());
    QCOMPARE(api.probeCalls(), 2);
    QCOMPARE(api.refreshCalls(), 0);
    QCOMPARE(tokens.refreshCount(), 0);
    QCOMPARE(tokens.accessToken(), QStringLiteral("access-0"));
    QVERIFY(!tokens.hasFailed());
}

void TokenManagerTest::testRejectedTokenIsRefreshed()
{
    FakeDropboxApi api;
    api.setRotateRefreshTokens(true);
    TokenManager tokens(&api, credentialWith(QStringLiteral("stale")));

    QVERIFY(tokens.ensureValid());
    QCOMPARE(api.refreshCalls(), 1);
    QCOMPARE(tokens.refreshCount(), 1);
    QCOMPARE(tokens.accessToken(), QStringLiteral("access-1"));
    QCOMPARE(tokens.credential().refreshToken, QStringLiteral("refresh-1"));
    QCOMPARE(tokens.credential().clientId, QStringLiteral("app-key"));

    // The new token is accepted, so no further exchange happens.
    QVERIFY(tokens.ensureValid());
    QCOMPARE(api.refreshCalls(), 1);
}

void TokenManagerTest::testEmptyAccessTokenIsRefreshed()
{
    FakeDropboxApi api;
    TokenManager tokens(&api, credentialWith(QString()));

    QVERIFY(tokens.ensureValid());
    QCOMPARE(api.refreshCalls(), 1);
    QCOMPARE(tokens.accessToken(), api.validAccessToken());
    QCOMPARE(tokens.credential().refreshToken, QStringLiteral("refresh-0"));
}

void TokenManagerTest::testRotatedRefreshTokenIsUsedNextTime()
{
    FakeDropboxApi api;
    api.setRotateRefreshTokens(true);
    TokenManager tokens(&api, credentialWith(QStringLiteral("stale")));

    QVERIFY(tokens.ensureValid());
    QCOMPARE(api.currentRefreshToken(), QStringLiteral("refresh-1"));

    // The fake only accepts the latest refresh token, so this fails unless the rotation was adopted.
    api.expireAccessToken();
    QVERIFY(tokens.ensureValid());
    QCOMPARE(api.refreshCalls(), 2);
    QCOMPARE(tokens.accessToken(), QStringLiteral("access-2"));
    QCOMPARE(tokens.credential().refreshToken, QStringLiteral("refresh-2"));

    QVERIFY(tokens.refresh());
    QCOMPARE(tokens.accessToken(), QStringLiteral("access-3"));
    QCOMPARE(tokens.refreshCount(), 3);
}

void TokenManagerTest::testRefreshFailureIsSticky()
{
    FakeDropboxApi api;
    api.setRefreshFails(true);
    TokenManager tokens(&api, credentialWith(QStringLiteral("stale")));

    QVERIFY(!tokens.ensureValid());
    QVERIFY(tokens.hasFailed());
    QCOMPARE(tokens.errorMessage(), QStringLiteral("invalid_grant"));
    QCOMPARE(api.refreshCalls(), 1);

    // Once failed, nothing is retried even if the server would now cooperate.
    api.setRefreshFails(false);
    QVERIFY(!tokens.ensureValid());
    QVERIFY(!tokens.handleUnauthorized(tokens.accessToken()));
    QVERIFY(!tokens.refresh());
    QCOMPARE(api.refreshCalls(), 1);
    QCOMPARE(tokens.accessToken(), QStringLiteral("stale"));
}

void TokenManagerTest::testMissingAppCredentialsFailRefresh()
{
    FakeDropboxApi api;
    Dropbox::Credential credential = credentialWith(QStringLiteral("stale"));
    credential.refreshToken = QStringLiteral("revoked");
    TokenManager tokens(&api, credential);

    QVERIFY(!tokens.ensureValid());
    QVERIFY(tokens.hasFailed());
    QVERIFY(!tokens.errorMessage().isEmpty());
}

void TokenManagerTest::testConcurrentCallersShareOneRefresh()
{
    FakeDropboxApi api;
    api.setProbeDelayMs(20);
    api.setRefreshDelayMs(50);
    TokenManager tokens(&api, credentialWith(QStringLiteral("stale")));

    constexpr int callers = 8;
    std::vector<int> results(callers, -1);
    std::vector<std::unique_ptr<QThread>> threads;
    for (int i = 0; i < callers; ++i) {
        threads.emplace_back(QThread::create([&tokens, &results, i]() {
            results[i] = tokens.ensureValid() ? 1 : 0;
        }));
    }
    for (const auto &thread : threads) {
        thread->start();
    }
    for (const auto &thread : threads) {
        QVERIFY(thread->wait(10000));
    }

    for (int result : results) {
        QCOMPARE(result, 1);
    }
    QCOMPARE(api.refreshCalls(), 1);
    QCOMPARE(tokens.refreshCount(), 1);
    QCOMPARE(tokens.accessToken(), QStringLiteral("access-1"));
}

void TokenManagerTest::testUnauthorizedWithReplacedToken()
{
    FakeDropboxApi api;
    TokenManager tokens(&api, credentialWith(QStringLiteral("stale")));

    QVERIFY(tokens.ensureValid());
    QCOMPARE(api.refreshCalls(), 1);

    // A late 401 for the token that was already replaced must not trigger another exchange.
    QVERIFY(tokens.handleUnauthorized(QStringLiteral("stale")));
    QCOMPARE(api.refreshCalls(), 1);

    QVERIFY(tokens.handleUnauthorized(tokens.accessToken()));
    QCOMPARE(api.refreshCalls(), 2);
    QCOMPARE(tokens.accessToken(), QStringLiteral("access-2"));
}

#include "tokenmanagertest.moc"
