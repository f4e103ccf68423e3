/*
 * SPDX-FileCopyrightText: 2025 dropbox-backup contributors
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#pragma once

#include <QString>

namespace Dropbox
{
struct Credential {
    QString accessToken;
    QString refreshToken;
    QString clientId;
    QString clientSecret;

    bool canRefresh() const
    {
        return !refreshToken.isEmpty() && !clientId.isEmpty() && !clientSecret.isEmpty();
    }
};
}
