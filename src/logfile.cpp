/*
 * SPDX-FileCopyrightText: 2025 dropbox-backup contributors
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 *
 */

#include "logfile.h"

#include <QAtomicPointer>
#include <QMutexLocker>

#include <cstdio>

static QAtomicPointer<LogFile> s_activeLogFile;

LogFile::LogFile() = default;

LogFile::~LogFile()
{
    if (s_activeLogFile.testAndSetOrdered(this, nullptr)) {
        qInstallMessageHandler(m_previousHandler);
    }

    QMutexLocker locker(&m_mutex);
    m_file.close();
}

bool LogFile::open(const QString &path)
{
    if (!s_activeLogFile.testAndSetOrdered(nullptr, this)) {
        m_errorString = QStringLiteral("Another log file is already active");
        return false;
    }

    m_file.setFileName(path);
    if (!m_file.open(QIODevice::WriteOnly | QIODevice::Truncate | QIODevice::Text)) {
        s_activeLogFile.storeRelease(nullptr);
        return false;
    }

    qSetMessagePattern(QStringLiteral("%{time yyyy-MM-dd hh:mm:ss,zzz} - %{type} - %{message}"));
    m_previousHandler = qInstallMessageHandler(&LogFile::handleMessage);
    return true;
}

QString LogFile::errorString() const
{
    return m_errorString.isEmpty() ? m_file.errorString() : m_errorString;
}

void LogFile::handleMessage(QtMsgType type, const QMessageLogContext &context, const QString &message)
{
    LogFile *logFile = s_activeLogFile.loadAcquire();
    const QString line = qFormatLogMessage(type, context, message);
    if (!logFile) {
        std::fprintf(stderr, "%s\n", qPrintable(line));
        return;
    }
    logFile->write(type, line);
}

void LogFile::write(QtMsgType type, const QString &line)
{
    QByteArray bytes = line.toUtf8();
    bytes.append('\n');

    bool written = false;
    {
        QMutexLocker locker(&m_mutex);
        written = m_file.write(bytes) == bytes.size() && m_file.flush();
    }

    // Lines the file did not take still reach the terminal.
    if (!written || type == QtCriticalMsg || type == QtFatalMsg) {
        std::fputs(bytes.constData(), stderr);
    }
}
