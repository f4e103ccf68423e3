/*
 * SPDX-FileCopyrightText: 2025 dropbox-backup contributors
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 *
 */

#include "../src/backupconfig.h"

#include <QFile>
#include <QProcessEnvironment>
#include <QTemporaryDir>
#include <QTest>

#include <memory>

class BackupConfigTest : public QObject
{
    Q_OBJECT

private Q_SLOTS:
    void init();

    void testParseEnvFile_data();
    void testParseEnvFile();
    void testDefaults();
    void testPrecedence();
    void testMissingFile();
    void testMissingCredentials();
    void testInvalidNumbers_data();
    void testInvalidNumbers();
    void testRequestDelayMs_data();
    void testRequestDelayMs();

private:
    QString writeEnvFile(const QByteArray &contents);

    std::unique_ptr<QTemporaryDir> m_dir;
};

QTEST_GUILESS_MAIN(BackupConfigTest)

static const QByteArray credentials = QByteArrayLiteral(
    "REFRESH_TOKEN=file-refresh\n"
    "CLIENT_ID=file-client\n"
    "CLIENT_SECRET=file-secret\n");

void BackupConfigTest::init()
{
    m_dir = std::make_unique<QTemporaryDir>();
    QVERIFY(m_dir->isValid());
}

QString BackupConfigTest::writeEnvFile(const QByteArray &contents)
{
    const QString path = m_dir->filePath(QStringLiteral(".dropbox-backup.env"));
    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate) || file.write(contents) != contents.size()) {
        return QString();
    }
    return path;
}

void BackupConfigTest::testParseEnvFile_data()
{
    QTest::addColumn<QString>("line");
    QTest::addColumn<QString>("expectedKey");
    QTest::addColumn<QString>("expectedValue");

    QTest::newRow("plain") << QStringLiteral("CLIENT_ID=abc") << QStringLiteral("CLIENT_ID") << QStringLiteral("abc");
    QTest::newRow("spaces around separator") << QStringLiteral("  CLIENT_ID = abc  ") << QStringLiteral("CLIENT_ID") << QStringLiteral("abc");
    QTest::newRow("export prefix") << QStringLiteral("export CLIENT_ID=abc") << QStringLiteral("CLIENT_ID") << QStringLiteral("abc");
    QTest::newRow("double quotes") << QStringLiteral("DESTINATION=\"/mnt/My Backup\"") << QStringLiteral("DESTINATION") << QStringLiteral("/mnt/My Backup");
    QTest::newRow("single quotes") << QStringLiteral("DESTINATION='/mnt/a #b'") << QStringLiteral("DESTINATION") << QStringLiteral("/mnt/a #b");
    QTest::newRow("escaped quote") << QStringLiteral("CLIENT_SECRET=\"x\\\"y\"") << QStringLiteral("CLIENT_SECRET") << QStringLiteral("x\"y");
    QTest::newRow("trailing comment") << QStringLiteral("REQUEST_DELAY=0.5 # seconds") << QStringLiteral("REQUEST_DELAY") << QStringLiteral("0.5");
    QTest::newRow("hash inside value") << QStringLiteral("CLIENT_SECRET=ab#cd") << QStringLiteral("CLIENT_SECRET") << QStringLiteral("ab#cd");
    QTest::newRow("equals inside value") << QStringLiteral("REFRESH_TOKEN=abc==") << QStringLiteral("REFRESH_TOKEN") << QStringLiteral("abc==");
    QTest::newRow("empty value") << QStringLiteral("ROOT_PATH=") << QStringLiteral("ROOT_PATH") << QString();
}

void BackupConfigTest::testParseEnvFile()
{
    QFETCH(QString, line);
    QFETCH(QString, expectedKey);
    QFETCH(QString, expectedValue);

    const auto values = parseEnvFile(QStringLiteral("# comment\n\n") + line + QStringLiteral("\n=orphan\nnot a setting\n"));
    QCOMPARE(values.size(), 1);
    QVERIFY(values.contains(expectedKey));
    QCOMPARE(values.value(expectedKey), expectedValue);
}

void BackupConfigTest::testDefaults()
{
    const QString envFile = writeEnvFile(credentials);
    QVERIFY(!envFile.isEmpty());

    const auto result = loadConfig(envFile, QProcessEnvironment());
    QVERIFY2(result.success, qPrintable(result.errorMessage));

    const BackupConfig &config = result.config;
    QCOMPARE(config.credential.refreshToken, QStringLiteral("file-refresh"));
    QCOMPARE(config.credential.clientId, QStringLiteral("file-client"));
    QCOMPARE(config.credential.clientSecret, QStringLiteral("file-secret"));
    QVERIFY(config.credential.accessToken.isEmpty());
    QVERIFY(config.credential.canRefresh());
    QCOMPARE(config.destination, QStringLiteral("backup"));
    QCOMPARE(config.tempDir, QStringLiteral("backup.partial"));
    QVERIFY(config.rootPath.isEmpty());
    QCOMPARE(config.logFile, QStringLiteral("dropbox-backup.log"));
    QCOMPARE(config.maxConcurrent, 50);
    QCOMPARE(config.requestDelayMs(), 100);
}

void BackupConfigTest::testPrecedence()
{
    const QString envFile = writeEnvFile(credentials
                                         + QByteArrayLiteral("ACCESS_TOKEN=file-access\n"
                                                             "DESTINATION=/srv/file-dest/\n"
                                                             "MAX_CONCURRENT_REQUESTS=4\n"
                                                             "REQUEST_DELAY=2\n"
                                                             "ROOT_PATH=/FromFile\n"));
    QVERIFY(!envFile.isEmpty());

    QProcessEnvironment environment;
    environment.insert(QStringLiteral("ACCESS_TOKEN"), QStringLiteral("env-access"));
    environment.insert(QStringLiteral("MAX_CONCURRENT_REQUESTS"), QStringLiteral("8"));
    environment.insert(QStringLiteral("ROOT_PATH"), QStringLiteral("/FromEnv"));

    const QHash<QString, QString> overrides{
        {ConfigKey::MaxConcurrent, QStringLiteral("16")},
        {ConfigKey::TempDir, QStringLiteral("/tmp/staging")},
    };

    const auto result = loadConfig(envFile, environment, overrides);
    QVERIFY2(result.success, qPrintable(result.errorMessage));

    const BackupConfig &config = result.config;
    QCOMPARE(config.credential.accessToken, QStringLiteral("env-access"));
    QCOMPARE(config.destination, QStringLiteral("/srv/file-dest"));
    QCOMPARE(config.tempDir, QStringLiteral("/tmp/staging"));
    QCOMPARE(config.maxConcurrent, 16);
    QCOMPARE(config.requestDelayMs(), 2000);
    QCOMPARE(config.rootPath, QStringLiteral("/FromEnv"));
}

void BackupConfigTest::testMissingFile()
{
    const QString missing = m_dir->filePath(QStringLiteral("nope.env"));
    const auto result = loadConfig(missing, QProcessEnvironment());
    QVERIFY(!result.success);
    QCOMPARE(result.errorMessage, QStringLiteral("%1 file not found").arg(missing));
}

void BackupConfigTest::testMissingCredentials()
{
    const QString envFile = writeEnvFile(QByteArrayLiteral("CLIENT_ID=abc\nACCESS_TOKEN=only-access\n"));
    QVERIFY(!envFile.isEmpty());

    const auto result = loadConfig(envFile, QProcessEnvironment());
    QVERIFY(!result.success);
    QCOMPARE(result.errorMessage, QStringLiteral("Missing required settings: REFRESH_TOKEN, CLIENT_SECRET"));

    QProcessEnvironment environment;
    environment.insert(QStringLiteral("REFRESH_TOKEN"), QStringLiteral("r"));
    environment.insert(QStringLiteral("CLIENT_SECRET"), QStringLiteral("s"));
    QVERIFY(loadConfig(envFile, environment).success);
}

void BackupConfigTest::testInvalidNumbers_data()
{
    QTest::addColumn<QString>("key");
    QTest::addColumn<QString>("value");

    QTest::newRow("zero workers") << ConfigKey::MaxConcurrent << QStringLiteral("0");
    QTest::newRow("negative workers") << ConfigKey::MaxConcurrent << QStringLiteral("-3");
    QTest::newRow("fractional workers") << ConfigKey::MaxConcurrent << QStringLiteral("2.5");
    QTest::newRow("word workers") << ConfigKey::MaxConcurrent << QStringLiteral("many");
    QTest::newRow("negative delay") << ConfigKey::RequestDelay << QStringLiteral("-0.1");
    QTest::newRow("word delay") << ConfigKey::RequestDelay << QStringLiteral("soon");
    QTest::newRow("infinite delay") << ConfigKey::RequestDelay << QStringLiteral("inf");
    QTest::newRow("delay overflowing milliseconds") << ConfigKey::RequestDelay << QStringLiteral("3000000");
}

void BackupConfigTest::testInvalidNumbers()
{
    QFETCH(QString, key);
    QFETCH(QString, value);

    const QString envFile = writeEnvFile(credentials);
    QVERIFY(!envFile.isEmpty());

    const auto result = loadConfig(envFile, QProcessEnvironment(), QHash<QString, QString>{{key, value}});
    QVERIFY(!result.success);
    QVERIFY(result.errorMessage.startsWith(key));
}

void BackupConfigTest::testRequestDelayMs_data()
{
    QTest::addColumn<double>("seconds");
    QTest::addColumn<int>("expectedMs");

    QTest::newRow("zero") << 0.0 << 0;
    QTest::newRow("default") << 0.1 << 100;
    QTest::newRow("fraction") << 0.25 << 250;
    QTest::newRow("seconds") << 1.5 << 1500;
    QTest::newRow("hour") << 3600.0 << 3600000;
}

void BackupConfigTest::testRequestDelayMs()
{
    QFETCH(double, seconds);
    QFETCH(int, expectedMs);

    BackupConfig config;
    config.requestDelay = seconds;
    QCOMPARE(config.requestDelayMs(), expectedMs);
}

#include "backupconfigtest.moc"
