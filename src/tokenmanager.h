/*
 * SPDX-FileCopyrightText: 2025 dropbox-backup contributors
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 *
 */

#pragma once

#include "dropboxcredential.h"

#include <QAtomicInt>
#include <QMutex>

class AbstractDropboxApi;

/**
 * Owns the credential shared by every component talking to Dropbox.
 *
 * Access token expiry is never predicted: ensureValid() probes the API and refreshes on a
 * 401. At most one refresh exchange is in flight; callers racing on the same expired token
 * wait for it and reuse its result.
 *
 * A failed refresh is fatal and sticky: once refresh() failed, every later call fails
 * without touching the network.
 */
class TokenManager
{
public:
    TokenManager(AbstractDropboxApi *api, const Dropbox::Credential &credential);
    ~TokenManager();

    /**
     * Probes the current access token and refreshes it if the API rejects it.
     * @return false only if a required refresh failed.
     */
    [[nodiscard]] bool ensureValid();

    /**
     * Exchanges the refresh token for a new access token (and possibly a rotated refresh token).
     * @return false if the exchange did not yield a usable access token.
     */
    [[nodiscard]] bool refresh();

    /**
     * To be called when a privileged call was answered with 401 although @p rejectedAccessToken
     * had been probed successfully. Refreshes unless another caller already replaced that token.
     * @return whether a usable access token is available for a retry.
     */
    [[nodiscard]] bool handleUnauthorized(const QString &rejectedAccessToken);

    QString accessToken() const;
    Dropbox::Credential credential() const;

    bool hasFailed() const;
    QString errorMessage() const;
    int refreshCount() const;

private:
    Q_DISABLE_COPY(TokenManager)

    [[nodiscard]] bool refreshLocked();

    AbstractDropboxApi *const m_api;

    mutable QMutex m_credentialMutex;
    Dropbox::Credential m_credential;
    bool m_failed = false;
    QString m_errorMessage;

    // Serializes refresh exchanges; always taken before m_credentialMutex.
    QMutex m_refreshMutex;
    QAtomicInt m_refreshCount;
};
