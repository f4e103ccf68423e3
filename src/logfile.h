/*
 * SPDX-FileCopyrightText: 2025 dropbox-backup contributors
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 *
 */

#pragma once

#include <QFile>
#include <QMutex>
#include <QString>

/**
 * Routes all Qt log output of the process into one file, one line per message:
 * "yyyy-MM-dd hh:mm:ss,zzz - <type> - <message>". Critical messages also go to stderr.
 *
 * Only one LogFile may be open at a time; the previous message handler is restored on destruction.
 */
class LogFile
{
public:
    LogFile();
    ~LogFile();

    /**
     * Truncates @p path and starts writing to it.
     */
    [[nodiscard]] bool open(const QString &path);
    QString errorString() const;

private:
    Q_DISABLE_COPY(LogFile)

    static void handleMessage(QtMsgType type, const QMessageLogContext &context, const QString &message);
    void write(QtMsgType type, const QString &line);

    QFile m_file;
    QString m_errorString;
    QMutex m_mutex;
    QtMessageHandler m_previousHandler = nullptr;
};
