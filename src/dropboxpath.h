/*
 * SPDX-FileCopyrightText: 2025 dropbox-backup contributors
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 *
 */

#ifndef DROPBOXPATH_H
#define DROPBOXPATH_H

#include <QStringList>

class DropboxPath
{
public:
    explicit DropboxPath(const QString &path);

    QString apiPath() const;
    QString filename() const;
    QString parentPath() const;
    QStringList pathComponents() const;
    bool isRoot() const;
    bool isSafeForLocal() const;
    QString localRelativePath() const;

private:
    QStringList m_components;
};

#endif // DROPBOXPATH_H
