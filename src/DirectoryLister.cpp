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

#include "DirectoryLister.h"

#include <QCoreApplication>
#include <QDebug>
#include <QDeadlineTimer>
#include <QDir>
#include <QDirIterator>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QRegularExpression>

#include "PlatformUtils.h"
#include "ProcessRunner.h"

namespace {
struct ListerConstants {
    static constexpr int readWaitMs = 100;
    static constexpr int terminateTimeoutMs = 2000;
    static constexpr int killWaitMs = 1000;
    // rclone exit code for "directory not found".
    static constexpr int directoryNotFoundCode = 3;
};

QDateTime parseModTime(const QString &text)
{
    QDateTime time = QDateTime::fromString(text, Qt::ISODateWithMs);
    if (time.isValid()) {
        return time;
    }
    // rclone prints nanoseconds; Qt only understands milliseconds.
    static const QRegularExpression fraction(QStringLiteral("\\.(\\d{3})\\d+"));
    QString trimmed = text;
    trimmed.replace(fraction, QStringLiteral(".\\1"));
    return QDateTime::fromString(trimmed, Qt::ISODateWithMs);
}
} // namespace

/**
 * @brief Picks the lister matching a destination.
 * @param destination Destination root, local path or remote path.
 * @param rclonePath rclone executable used for remote destinations.
 * @param baseArguments Arguments prepended to each rclone call (config, flags).
 * @return Lister for the destination.
 */
std::shared_ptr<DirectoryLister> DirectoryLister::forDestination(const QString &destination,
                                                                 const QString &rclonePath,
                                                                 const QStringList &baseArguments)
{
    if (PlatformUtils::isRemotePath(destination)) {
        return std::make_shared<RcloneDirectoryLister>(rclonePath, baseArguments);
    }
    return std::make_shared<LocalDirectoryLister>();
}

bool LocalDirectoryLister::list(const QString &root, bool recursive, QList<DirectoryEntry> *entries, QString *error) const
{
    if (!entries) {
        return false;
    }
    entries->clear();

    const QFileInfo rootInfo(root);
    if (!rootInfo.exists()) {
        // Nothing was written yet.
        return true;
    }
    if (!rootInfo.isDir()) {
        if (error) {
            *error = QCoreApplication::translate("DirectoryLister", "Not a folder: %1").arg(root);
        }
        return false;
    }

    const QDir rootDir(root);
    QDirIterator it(root,
                    QDir::Files | QDir::Hidden | QDir::System | QDir::NoDotAndDotDot,
                    recursive ? QDirIterator::Subdirectories : QDirIterator::NoIteratorFlags);
    while (it.hasNext()) {
        it.next();
        const QFileInfo info = it.fileInfo();
        DirectoryEntry entry;
        entry.relativePath = rootDir.relativeFilePath(info.absoluteFilePath());
        entry.name = info.fileName();
        entry.size = info.size();
        entry.modified = info.lastModified();
        entry.isDir = false;
        entries->append(entry);
    }
    return true;
}

bool LocalDirectoryLister::removeFile(const QString &root, const QString &relativePath, QString *error) const
{
    return PlatformUtils::removeLocalFile(QDir(root).filePath(relativePath), error);
}

RcloneDirectoryLister::RcloneDirectoryLister(const QString &rclonePath, const QStringList &baseArguments, int timeoutMs)
    : m_rclonePath(rclonePath)
    , m_baseArguments(baseArguments)
    , m_timeoutMs(timeoutMs)
{
}

bool RcloneDirectoryLister::list(const QString &root, bool recursive, QList<DirectoryEntry> *entries, QString *error) const
{
    if (!entries) {
        return false;
    }
    entries->clear();

    QStringList arguments = m_baseArguments;
    arguments << QStringLiteral("lsjson") << QStringLiteral("--files-only") << QStringLiteral("--no-mimetype");
    if (recursive) {
        arguments << QStringLiteral("--recursive");
    }
    arguments << root;

    QByteArray output;
    int exitCode = 0;
    if (!run(arguments, &output, &exitCode, error)) {
        if (exitCode == ListerConstants::directoryNotFoundCode) {
            if (error) {
                error->clear();
            }
            return true;
        }
        return false;
    }
    return parseListing(output, entries, error);
}

bool RcloneDirectoryLister::removeFile(const QString &root, const QString &relativePath, QString *error) const
{
    QStringList arguments = m_baseArguments;
    arguments << QStringLiteral("deletefile") << PlatformUtils::joinPath(root, relativePath);
    int exitCode = 0;
    return run(arguments, nullptr, &exitCode, error);
}

/**
 * @brief Decodes the JSON array printed by `rclone lsjson`.
 * @param json Raw standard output.
 * @param entries Output entries; directories are skipped.
 * @param error Optional output error message.
 * @return True when the document is a JSON array.
 */
bool RcloneDirectoryLister::parseListing(const QByteArray &json, QList<DirectoryEntry> *entries, QString *error)
{
    QJsonParseError parseError;
    const QJsonDocument document = QJsonDocument::fromJson(json, &parseError);
    if (parseError.error != QJsonParseError::NoError || !document.isArray()) {
        if (error) {
            *error = QCoreApplication::translate("DirectoryLister", "Invalid listing: %1").arg(parseError.errorString());
        }
        return false;
    }

    const QJsonArray items = document.array();
    for (const QJsonValue &value : items) {
        const QJsonObject object = value.toObject();
        if (object.value(QStringLiteral("IsDir")).toBool()) {
            continue;
        }
        DirectoryEntry entry;
        entry.relativePath = object.value(QStringLiteral("Path")).toString();
        entry.name = object.value(QStringLiteral("Name")).toString();
        if (entry.name.isEmpty()) {
            entry.name = PlatformUtils::fileName(entry.relativePath);
        }
        entry.size = static_cast<qint64>(object.value(QStringLiteral("Size")).toDouble());
        entry.modified = parseModTime(object.value(QStringLiteral("ModTime")).toString());
        if (!entry.relativePath.isEmpty()) {
            entries->append(entry);
        }
    }
    return true;
}

bool RcloneDirectoryLister::run(const QStringList &arguments, QByteArray *output, int *exitCode, QString *error) const
{
    ProcessRunner runner;
    if (!runner.start(m_rclonePath, arguments, QString(), error)) {
        return false;
    }

    QDeadlineTimer deadline(m_timeoutMs);
    OutputChunk chunk;
    for (;;) {
        const ProcessRunner::ReadStatus status = runner.readChunk(&chunk, ListerConstants::readWaitMs);
        if (status == ProcessRunner::ReadStatus::EndOfStream) {
            break;
        }
        if (status == ProcessRunner::ReadStatus::Data) {
            if (output && chunk.origin == OutputChunk::Origin::StandardOutput) {
                output->append(chunk.data);
            }
            continue;
        }
        if (deadline.hasExpired()) {
            qWarning() << "[DirectoryLister] rclone" << arguments.join(QLatin1Char(' ')) << "timed out";
            runner.terminate(ListerConstants::terminateTimeoutMs, ListerConstants::killWaitMs);
            if (error) {
                *error = QCoreApplication::translate("DirectoryLister", "rclone timed out after %1 ms").arg(m_timeoutMs);
            }
            return false;
        }
    }

    const ExitStatus status = runner.exitStatus();
    if (exitCode) {
        *exitCode = status.code;
    }
    if (!status.success) {
        if (error) {
            *error = status.stderrTail.isEmpty()
                ? QCoreApplication::translate("DirectoryLister", "rclone exited with code %1").arg(status.code)
                : status.stderrTail.last();
        }
        return false;
    }
    return true;
}
