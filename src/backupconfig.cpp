/*
 * SPDX-FileCopyrightText: 2025 dropbox-backup contributors
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 *
 */

#include "backupconfig.h"

#include <QDir>
#include <QFile>
#include <QProcessEnvironment>
#include <QStringList>

#include <cmath>
#include <limits>

int BackupConfig::requestDelayMs() const
{
    return static_cast<int>(std::lround(requestDelay * 1000.0));
}

static QString unquote(const QString &value)
{
    if (value.size() >= 2) {
        const QChar first = value.front();
        if ((first == QLatin1Char('"') || first == QLatin1Char('\'')) && value.back() == first) {
            QString inner = value.mid(1, value.size() - 2);
            if (first == QLatin1Char('"')) {
                inner.replace(QLatin1String("\\\""), QLatin1String("\""));
                inner.replace(QLatin1String("\\n"), QLatin1String("\n"));
            }
            return inner;
        }
    }

    // Unquoted values may carry a trailing comment.
    const qsizetype comment = value.indexOf(QLatin1String(" #"));
    if (comment >= 0) {
        return value.left(comment).trimmed();
    }
    return value;
}

QHash<QString, QString> parseEnvFile(const QString &text)
{
    QHash<QString, QString> values;

    const QStringList lines = text.split(QLatin1Char('\n'));
    for (const QString &rawLine : lines) {
        QString line = rawLine.trimmed();
        if (line.isEmpty() || line.startsWith(QLatin1Char('#'))) {
            continue;
        }
        if (line.startsWith(QLatin1String("export "))) {
            line = line.mid(7).trimmed();
        }

        const qsizetype separator = line.indexOf(QLatin1Char('='));
        if (separator <= 0) {
            continue;
        }

        const QString key = line.left(separator).trimmed();
        if (key.isEmpty()) {
            continue;
        }
        values.insert(key, unquote(line.mid(separator + 1).trimmed()));
    }

    return values;
}

ConfigResult loadConfig(const QString &envFilePath, const QProcessEnvironment &environment, const QHash<QString, QString> &overrides)
{
    ConfigResult result;

    QFile file(envFilePath);
    if (!file.exists()) {
        result.errorMessage = QStringLiteral("%1 file not found").arg(envFilePath);
        return result;
    }
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        result.errorMessage = QStringLiteral("Cannot read %1: %2").arg(envFilePath, file.errorString());
        return result;
    }
    const QHash<QString, QString> fileValues = parseEnvFile(QString::fromUtf8(file.readAll()));

    const auto value = [&](const QString &key, const QString &fallback = QString()) -> QString {
        const QString overridden = overrides.value(key);
        if (!overridden.isEmpty()) {
            return overridden;
        }
        if (environment.contains(key)) {
            return environment.value(key);
        }
        return fileValues.value(key, fallback);
    };

    BackupConfig &config = result.config;
    config.credential.accessToken = value(ConfigKey::AccessToken);
    config.credential.refreshToken = value(ConfigKey::RefreshToken);
    config.credential.clientId = value(ConfigKey::ClientId);
    config.credential.clientSecret = value(ConfigKey::ClientSecret);

    QStringList missing;
    if (config.credential.refreshToken.isEmpty()) {
        missing << ConfigKey::RefreshToken;
    }
    if (config.credential.clientId.isEmpty()) {
        missing << ConfigKey::ClientId;
    }
    if (config.credential.clientSecret.isEmpty()) {
        missing << ConfigKey::ClientSecret;
    }
    if (!missing.isEmpty()) {
        result.errorMessage = QStringLiteral("Missing required settings: %1").arg(missing.join(QStringLiteral(", ")));
        return result;
    }

    config.destination = QDir::cleanPath(value(ConfigKey::Destination, QStringLiteral("./backup")));
    config.tempDir = QDir::cleanPath(value(ConfigKey::TempDir, config.destination + QStringLiteral(".partial")));
    config.rootPath = value(ConfigKey::RootPath);
    config.logFile = value(ConfigKey::LogFile, QStringLiteral("dropbox-backup.log"));

    bool ok = false;
    const QString maxConcurrent = value(ConfigKey::MaxConcurrent);
    if (!maxConcurrent.isEmpty()) {
        config.maxConcurrent = maxConcurrent.toInt(&ok);
        if (!ok || config.maxConcurrent < 1) {
            result.errorMessage = QStringLiteral("%1 must be a positive integer, got \"%2\"").arg(ConfigKey::MaxConcurrent, maxConcurrent);
            return result;
        }
    }

    const QString requestDelay = value(ConfigKey::RequestDelay);
    if (!requestDelay.isEmpty()) {
        config.requestDelay = requestDelay.toDouble(&ok);
        // Must still fit requestDelayMs().
        if (!ok || !std::isfinite(config.requestDelay) || config.requestDelay < 0
            || config.requestDelay * 1000.0 > static_cast<double>(std::numeric_limits<int>::max())) {
            result.errorMessage = QStringLiteral("%1 must be a non-negative number of seconds, got \"%2\"").arg(ConfigKey::RequestDelay, requestDelay);
            return result;
        }
    }

    result.success = true;
    return result;
}
