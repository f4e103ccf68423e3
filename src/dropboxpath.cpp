/*
 * SPDX-FileCopyrightText: 2025 dropbox-backup contributors
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 *
 */

#include "dropboxpath.h"

DropboxPath::DropboxPath(const QString &path)
{
    m_components = path.trimmed().split(QLatin1Char('/'), Qt::SkipEmptyParts);
}

QString DropboxPath::apiPath() const
{
    // The API addresses the root folder as "" rather than "/".
    if (isRoot()) {
        return QString();
    }

    return QLatin1Char('/') + m_components.join(QLatin1Char('/'));
}

QString DropboxPath::filename() const
{
    if (m_components.isEmpty()) {
        return QString();
    }

    return m_components.last();
}

QString DropboxPath::parentPath() const
{
    if (m_components.size() <= 1) {
        return QString();
    }

    return QLatin1Char('/') + m_components.mid(0, m_components.size() - 1).join(QLatin1Char('/'));
}

QStringList DropboxPath::pathComponents() const
{
    return m_components;
}

bool DropboxPath::isRoot() const
{
    return m_components.isEmpty();
}

bool DropboxPath::isSafeForLocal() const
{
    if (isRoot()) {
        return false;
    }

    for (const QString &component : m_components) {
        if (component == QLatin1String(".") || component == QLatin1String("..")) {
            return false;
        }
    }
    return true;
}

QString DropboxPath::localRelativePath() const
{
    return m_components.join(QLatin1Char('/'));
}
