/*
 * SPDX-FileCopyrightText: 2025 dropbox-backup contributors
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 *
 */

#include "tokenmanager.h"
#include "abstractdropboxapi.h"
#include "dropboxdebug.h"

#include <QMutexLocker>

static QString elideToken(const QString &token)
{
    if (token.size() <= 8) {
        return token;
    }
    return token.left(4) + QStringLiteral("...") + token.right(4);
}

TokenManager::TokenManager(AbstractDropboxApi *api, const Dropbox::Credential &credential)
    : m_api(api)
    , m_credential(credential)
{
}

TokenManager::~TokenManager() = default;

bool TokenManager::ensureValid()
{
    QString token;
    {
        QMutexLocker locker(&m_credentialMutex);
        if (m_failed) {
            return false;
        }
        token = m_credential.accessToken;
    }

    const auto probe = m_api->probe(token);
    if (probe.httpStatus == Dropbox::HttpUnauthorized) {
        qCInfo(DROPBOX) << "Access token" << elideToken(token) << "was rejected, refreshing";
        return handleUnauthorized(token);
    }

    if (!probe.success) {
        // Not an authorization problem; the privileged call that follows reports its own outcome.
        qCWarning(DROPBOX) << "Token probe failed" << probe.httpStatus << probe.errorMessage;
    }
    return true;
}

bool TokenManager::refresh()
{
    QMutexLocker refreshLocker(&m_refreshMutex);
    return refreshLocked();
}

bool TokenManager::handleUnauthorized(const QString &rejectedAccessToken)
{
    QMutexLocker refreshLocker(&m_refreshMutex);
    {
        QMutexLocker locker(&m_credentialMutex);
        if (m_failed) {
            return false;
        }
        if (m_credential.accessToken != rejectedAccessToken) {
            qCDebug(DROPBOX) << "Access token already refreshed by another caller";
            return true;
        }
    }

    return refreshLocked();
}

bool TokenManager::refreshLocked()
{
    Dropbox::Credential current;
    {
        QMutexLocker locker(&m_credentialMutex);
        if (m_failed) {
            return false;
        }
        current = m_credential;
    }

    qCInfo(DROPBOX) << "Refreshing access token...";
    m_refreshCount.ref();
    const auto tokens = m_api->refreshToken(current);

    QMutexLocker locker(&m_credentialMutex);
    if (!tokens.success || tokens.accessToken.isEmpty()) {
        m_failed = true;
        m_errorMessage = tokens.errorMessage.isEmpty() ? QStringLiteral("Token endpoint returned no access token") : tokens.errorMessage;
        qCCritical(DROPBOX) << "Failed to refresh token:" << tokens.httpStatus << m_errorMessage;
        return false;
    }

    m_credential.accessToken = tokens.accessToken;
    if (!tokens.refreshToken.isEmpty() && tokens.refreshToken != m_credential.refreshToken) {
        m_credential.refreshToken = tokens.refreshToken;
        qCInfo(DROPBOX) << "New refresh token:" << elideToken(tokens.refreshToken);
    }
    qCInfo(DROPBOX) << "New access token:" << elideToken(tokens.accessToken);
    return true;
}

QString TokenManager::accessToken() const
{
    QMutexLocker locker(&m_credentialMutex);
    return m_credential.accessToken;
}

Dropbox::Credential TokenManager::credential() const
{
    QMutexLocker locker(&m_credentialMutex);
    return m_credential;
}

bool TokenManager::hasFailed() const
{
    QMutexLocker locker(&m_credentialMutex);
    return m_failed;
}

QString TokenManager::errorMessage() const
{
    QMutexLocker locker(&m_credentialMutex);
    return m_errorMessage;
}

int TokenManager::refreshCount() const
{
    return m_refreshCount.loadRelaxed();
}
