/*
 * SPDX-FileCopyrightText: 2025 dropbox-backup contributors
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 *
 */

#pragma once

#include "dropboxcredential.h"

#include <QHash>
#include <QString>

class QProcessEnvironment;

struct BackupConfig {
    static constexpr int DefaultMaxConcurrent = 50;
    static constexpr double DefaultRequestDelay = 0.1;

    Dropbox::Credential credential;
    QString destination;
    QString tempDir;
    QString rootPath;
    QString logFile;
    int maxConcurrent = DefaultMaxConcurrent;
    double requestDelay = DefaultRequestDelay; // seconds

    int requestDelayMs() const;
};

struct ConfigResult {
    bool success = false;
    QString errorMessage;
    BackupConfig config;
};

namespace ConfigKey
{
inline const QString AccessToken = QStringLiteral("ACCESS_TOKEN");
inline const QString RefreshToken = QStringLiteral("REFRESH_TOKEN");
inline const QString ClientId = QStringLiteral("CLIENT_ID");
inline const QString ClientSecret = QStringLiteral("CLIENT_SECRET");
inline const QString Destination = QStringLiteral("DESTINATION");
inline const QString TempDir = QStringLiteral("TEMP_DIR");
inline const QString MaxConcurrent = QStringLiteral("MAX_CONCURRENT_REQUESTS");
inline const QString RequestDelay = QStringLiteral("REQUEST_DELAY");
inline const QString RootPath = QStringLiteral("ROOT_PATH");
inline const QString LogFile = QStringLiteral("LOG_FILE");
}

/**
 * Parses dotenv text: KEY=VALUE lines, '#' comments, blank lines, an optional "export "
 * prefix and optional matching single or double quotes around the value.
 */
QHash<QString, QString> parseEnvFile(const QString &text);

/**
 * Builds the run configuration. A key is looked up in @p overrides (command line) first,
 * then in @p environment, then in the env file at @p envFilePath.
 *
 * Fails if the env file is missing, a credential key is missing or a number is invalid.
 */
[[nodiscard]] ConfigResult loadConfig(const QString &envFilePath, const QProcessEnvironment &environment, const QHash<QString, QString> &overrides = {});
