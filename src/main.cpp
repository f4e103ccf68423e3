/*
 * SPDX-FileCopyrightText: 2025 dropbox-backup contributors
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 *
 */

#include "backupconfig.h"
#include "downloadscheduler.h"
#include "dropboxbackupversion.h"
#include "dropboxclient.h"
#include "dropboxdebug.h"
#include "logfile.h"
#include "progressreporter.h"
#include "tokenmanager.h"
#include "treeenumerator.h"

#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDir>
#include <QElapsedTimer>
#include <QProcessEnvironment>
#include <QTextStream>

#include <KAboutData>
#include <KLocalizedString>

static int fail(const QString &message)
{
    QTextStream(stderr) << i18n("Error: %1", message) << Qt::endl;
    return 1;
}

int main(int argc, char **argv)
{
    QCoreApplication app(argc, argv);
    KLocalizedString::setApplicationDomain("dropbox-backup");

    KAboutData aboutData(QStringLiteral("dropbox-backup"),
                         i18n("Dropbox Backup"),
                         QStringLiteral(DROPBOXBACKUP_VERSION_STRING),
                         i18n("Mirrors the file tree of a Dropbox account into a local folder"),
                         KAboutLicense::GPL_V2);
    KAboutData::setApplicationData(aboutData);

    QCommandLineParser parser;
    const QCommandLineOption envFileOption(QStringLiteral("env-file"),
                                           i18n("Read credentials and settings from <file>."),
                                           QStringLiteral("file"),
                                           QStringLiteral(".dropbox-backup.env"));
    const QCommandLineOption destinationOption(QStringLiteral("destination"), i18n("Store the backup in <dir>."), QStringLiteral("dir"));
    const QCommandLineOption tempDirOption(QStringLiteral("temp-dir"), i18n("Keep partial downloads in <dir>."), QStringLiteral("dir"));
    const QCommandLineOption maxConcurrentOption(QStringLiteral("max-concurrent"), i18n("Run at most <n> downloads at once."), QStringLiteral("n"));
    const QCommandLineOption requestDelayOption(QStringLiteral("request-delay"),
                                                i18n("Wait at least <seconds> between two downloads of the same worker."),
                                                QStringLiteral("seconds"));
    const QCommandLineOption rootOption(QStringLiteral("root"), i18n("Back up the Dropbox folder <path> instead of the whole account."), QStringLiteral("path"));
    const QCommandLineOption logFileOption(QStringLiteral("log-file"), i18n("Write the log to <file>."), QStringLiteral("file"));
    parser.addOptions({envFileOption, destinationOption, tempDirOption, maxConcurrentOption, requestDelayOption, rootOption, logFileOption});

    aboutData.setupCommandLine(&parser);
    parser.process(app);
    aboutData.processCommandLine(&parser);

    QHash<QString, QString> overrides;
    const auto overrideFrom = [&](const QCommandLineOption &option, const QString &key) {
        if (parser.isSet(option)) {
            overrides.insert(key, parser.value(option));
        }
    };
    overrideFrom(destinationOption, ConfigKey::Destination);
    overrideFrom(tempDirOption, ConfigKey::TempDir);
    overrideFrom(maxConcurrentOption, ConfigKey::MaxConcurrent);
    overrideFrom(requestDelayOption, ConfigKey::RequestDelay);
    overrideFrom(rootOption, ConfigKey::RootPath);
    overrideFrom(logFileOption, ConfigKey::LogFile);

    const ConfigResult loaded = loadConfig(parser.value(envFileOption), QProcessEnvironment::systemEnvironment(), overrides);
    if (!loaded.success) {
        return fail(loaded.errorMessage);
    }
    const BackupConfig &config = loaded.config;

    LogFile logFile;
    if (!logFile.open(config.logFile)) {
        return fail(i18n("Cannot write log file %1: %2", config.logFile, logFile.errorString()));
    }

    QElapsedTimer elapsed;
    elapsed.start();

    if (!QDir().mkpath(config.destination)) {
        qCCritical(DROPBOX) << "Could not create destination folder" << config.destination;
        return 1;
    }

    Dropbox::Client client;
    TokenManager tokens(&client, config.credential);
    LogProgressReporter reporter;

    qCInfo(DROPBOX) << "Starting file listing...";
    TreeEnumerator enumerator(&client, &tokens, &reporter);
    const EnumerationResult listing = enumerator.enumerate(config.rootPath);
    if (!listing.success) {
        qCCritical(DROPBOX) << "File listing aborted:" << listing.errorMessage;
        return 1;
    }
    qCInfo(DROPBOX) << "Total files to download:" << listing.files.size();
    if (listing.failedFolders > 0) {
        qCWarning(DROPBOX) << listing.failedFolders << "folders could not be listed";
    }

    DownloadOptions options;
    options.maxConcurrent = config.maxConcurrent;
    options.requestDelayMs = config.requestDelayMs();
    options.tempDir = config.tempDir;

    DownloadScheduler scheduler(&client, &tokens, &reporter, options);
    const DownloadSummary summary = scheduler.downloadAll(listing.files, config.destination);
    reporter.summary(summary.total, summary.succeeded, summary.failed, elapsed.elapsed());
    if (summary.aborted) {
        qCCritical(DROPBOX) << "Download aborted:" << summary.errorMessage;
        return 1;
    }

    QTextStream(stdout) << i18n("Backed up %1 of %2 files into %3, %4 failed.", summary.succeeded, summary.total, config.destination, summary.failed)
                        << Qt::endl;
    return 0;
}
