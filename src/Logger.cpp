/************************************************************************\

    Ferryman - Rclone transfer manager
    Copyright (C) 2026 Jango73

    This program is free software: you can redistribute it and/or modify
    it under the terms of the GNU General Public License as published by
    the Free Software Foundation, either version 3 of the License, or
    (at your option) any later version.

    This program is distributed in the hope that it will be useful,
    but WITHOUT ANY WARRANTY; without even the implied warranty of
    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
    GNU General Public License for more details.

    You should have received a copy of the GNU General Public License
    along with this program.  If not, see <https://www.gnu.org/licenses/>.

\************************************************************************/

#include "Logger.h"

#include <QAtomicInt>
#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QMutex>
#include <QMutexLocker>
#include <QStandardPaths>
#include <QStringConverter>
#include <QTextStream>

#include <cstdio>
#include <cstdlib>

namespace {

struct LoggerConstants {
    static constexpr qint64 rotateBytes = 2 * 1024 * 1024;
    static constexpr int minimumRetention = 1;
    static constexpr int errorsOnly = 0;
    static constexpr int normal = 1;
    static constexpr int debug = 2;
};

QFile *g_file = nullptr;
QMutex g_mutex;
QString g_path;
QString g_pathOverride;
QAtomicInt g_level(LoggerConstants::normal);
int g_retention = 5;

// Logging from inside the handler must not recurse.
thread_local bool g_inHandler = false;

QString levelToString(QtMsgType type)
{
    switch (type) {
    case QtDebugMsg:
        return QStringLiteral("DEBUG");
    case QtInfoMsg:
        return QStringLiteral("INFO");
    case QtWarningMsg:
        return QStringLiteral("WARN");
    case QtCriticalMsg:
        return QStringLiteral("ERROR");
    case QtFatalMsg:
        return QStringLiteral("FATAL");
    }
    return QStringLiteral("LOG");
}

bool allowMessage(QtMsgType type)
{
    const int level = g_level.loadAcquire();
    if (level <= LoggerConstants::errorsOnly) {
        return type == QtWarningMsg || type == QtCriticalMsg || type == QtFatalMsg;
    }
    if (level == LoggerConstants::normal) {
        return type != QtDebugMsg;
    }
    return true;
}

// One record per physical line.
QString normalizeMessage(QString message)
{
    message.replace(QStringLiteral("\r\n"), QStringLiteral("\n"));
    message.replace(QLatin1Char('\r'), QLatin1Char('\n'));
    message.replace(QLatin1Char('\n'), QLatin1Char(' '));
    message.replace(QLatin1Char('\t'), QLatin1Char(' '));
    return message.simplified();
}

void handler(QtMsgType type, const QMessageLogContext &context, const QString &message)
{
    if (!allowMessage(type) || g_inHandler) {
        if (type == QtFatalMsg) {
            std::abort();
        }
        return;
    }
    g_inHandler = true;

    {
        QMutexLocker lock(&g_mutex);

        const QString timestamp = QDateTime::currentDateTime().toString(QStringLiteral("yyyy-MM-dd HH:mm:ss.zzz"));
        const QString where = (context.file && context.function)
            ? QStringLiteral("%1:%2 %3")
                .arg(QFileInfo(QString::fromUtf8(context.file)).fileName())
                .arg(context.line)
                .arg(QString::fromUtf8(context.function))
            : QString();

        QString line = QStringLiteral("%1 [%2] ").arg(timestamp, levelToString(type));
        if (!where.isEmpty()) {
            line += where + QStringLiteral(" - ");
        }
        line += normalizeMessage(message);

        if (!g_file || !g_file->isOpen()) {
            std::fprintf(stderr, "%s\n", line.toUtf8().constData());
            std::fflush(stderr);
        } else {
            QTextStream out(g_file);
            out.setEncoding(QStringConverter::Utf8);
            out << line << "\n";
            out.flush();
        }
    }

    if (type == QtFatalMsg) {
        std::abort();
    }
    g_inHandler = false;
}

// log -> log.1 -> log.2 ... keeping `keep` rotated files.
void rotateIfNeeded(const QString &path, int keep)
{
    const QFileInfo info(path);
    if (!info.exists() || info.size() < LoggerConstants::rotateBytes) {
        return;
    }
    const QString oldest = path + QLatin1Char('.') + QString::number(keep);
    if (QFileInfo::exists(oldest)) {
        QFile::remove(oldest);
    }
    for (int i = keep - 1; i >= 1; --i) {
        const QString older = path + QLatin1Char('.') + QString::number(i);
        const QString newer = path + QLatin1Char('.') + QString::number(i + 1);
        if (QFileInfo::exists(older)) {
            QFile::rename(older, newer);
        }
    }
    QFile::rename(path, path + QStringLiteral(".1"));
}

void openLogFile(const QString &path)
{
    QDir().mkpath(QFileInfo(path).absolutePath());
    rotateIfNeeded(path, g_retention);

    QMutexLocker lock(&g_mutex);
    if (g_file) {
        g_file->close();
        delete g_file;
        g_file = nullptr;
    }
    g_file = new QFile(path);
    if (!g_file->open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
        std::fprintf(stderr, "Logger: failed to open log file: %s\n", path.toUtf8().constData());
        std::fflush(stderr);
    }
    g_path = path;
}

} // namespace

namespace Logger {

/**
 * @brief Routes Qt messages to the application log file.
 * @param appName Base name of the log file.
 * @param retention Number of rotated files kept next to the live log.
 */
void install(const QString &appName, int retention)
{
    g_retention = qMax(LoggerConstants::minimumRetention, retention);

    const QString defaultDir =
        QStandardPaths::writableLocation(QStandardPaths::AppLocalDataLocation) + QStringLiteral("/logs");
    const QString path = g_pathOverride.isEmpty()
        ? defaultDir + QLatin1Char('/') + appName + QStringLiteral(".log")
        : g_pathOverride;

    openLogFile(path);
    qInstallMessageHandler(handler);
    qInfo().noquote() << QStringLiteral("[Logger] Logging to %1").arg(g_path);
}

void setLogLevel(int level)
{
    g_level.storeRelease(qBound(LoggerConstants::errorsOnly, level, LoggerConstants::debug));
}

int logLevel()
{
    return g_level.loadAcquire();
}

/**
 * @brief Uses an explicit log file instead of the default location.
 * @param absoluteFilePath Log file path, empty to restore the default on the next install().
 */
void setLogFilePathOverride(const QString &absoluteFilePath)
{
    const QString trimmed = absoluteFilePath.trimmed();
    g_pathOverride = trimmed.isEmpty() ? QString() : QDir::cleanPath(trimmed);
    if (!g_pathOverride.isEmpty()) {
        openLogFile(g_pathOverride);
    }
}

QString logFilePath()
{
    QMutexLocker lock(&g_mutex);
    return g_path;
}

QString logDirPath()
{
    const QString path = logFilePath();
    if (path.isEmpty()) {
        return QString();
    }
    return QFileInfo(path).absolutePath();
}

} // namespace Logger
