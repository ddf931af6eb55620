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

#include "PlatformUtils.h"

#include <QCoreApplication>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QRegularExpression>

namespace PlatformUtils {

namespace {

struct PathConstants {
    static constexpr QChar separator = QLatin1Char('/');
    static constexpr QChar remoteMarker = QLatin1Char(':');
    static constexpr int driveLetterLength = 1;
};

} // namespace

/**
 * @brief Normalizes a local path for consistent comparisons.
 *
 * Remote specs are returned untouched apart from trailing separators.
 * @param path Input path to normalize.
 * @return Absolute local path with forward slashes, or the cleaned remote path.
 */
QString normalizePath(const QString &path)
{
    if (isRemotePath(path)) {
        QString remote = path;
        while (remote.size() > 1 && remote.endsWith(PathConstants::separator)
               && !remote.endsWith(QStringLiteral(":/"))) {
            remote.chop(1);
        }
        return remote;
    }
    QString normalized = QDir::fromNativeSeparators(path);
    normalized = QDir(normalized).absolutePath();
    return QDir::cleanPath(normalized);
}

/**
 * @brief Tells whether a path names an rclone remote rather than a local path.
 *
 * `remote:path` and on-the-fly backends (`:backend:path`) are remote. A single
 * letter before the colon is a drive letter on Windows.
 */
bool isRemotePath(const QString &path)
{
    if (path.startsWith(PathConstants::remoteMarker)) {
        return true;
    }
    static const QRegularExpression remotePattern(QStringLiteral("^([^/\\\\:]+):"));
    const QRegularExpressionMatch match = remotePattern.match(path);
    if (!match.hasMatch()) {
        return false;
    }
#ifdef Q_OS_WIN
    if (match.captured(1).size() == PathConstants::driveLetterLength) {
        return false;
    }
#endif
    return true;
}

/**
 * @brief Appends a name to an rclone root, local or remote.
 * @param root Root path or remote path. May be empty.
 * @param name Name or relative path to append.
 * @return Joined path using forward slashes.
 */
QString joinPath(const QString &root, const QString &name)
{
    if (root.isEmpty()) {
        return name;
    }
    if (name.isEmpty()) {
        return root;
    }
    QString relative = name;
    while (relative.startsWith(PathConstants::separator)) {
        relative.remove(0, 1);
    }
    if (root.endsWith(PathConstants::separator) || root.endsWith(PathConstants::remoteMarker)) {
        return root + relative;
    }
    return root + PathConstants::separator + relative;
}

QString fileName(const QString &path)
{
    QString trimmed = path;
    while (trimmed.size() > 1 && trimmed.endsWith(PathConstants::separator)) {
        trimmed.chop(1);
    }
    const int cut = qMax(trimmed.lastIndexOf(PathConstants::separator),
                         trimmed.lastIndexOf(PathConstants::remoteMarker));
    return cut < 0 ? trimmed : trimmed.mid(cut + 1);
}

/**
 * @brief Permanently deletes a local file.
 * @param path File path to remove.
 * @param error Optional output error message.
 * @return True if the file was removed, false otherwise.
 */
bool removeLocalFile(const QString &path, QString *error)
{
    if (path.isEmpty()) {
        if (error) {
            *error = QCoreApplication::translate("PlatformUtils", "Path is empty");
        }
        return false;
    }
    const QFileInfo info(path);
    if (!info.exists() && !info.isSymLink()) {
        if (error) {
            *error = QCoreApplication::translate("PlatformUtils", "File not found");
        }
        return false;
    }
    if (info.isDir()) {
        if (error) {
            *error = QCoreApplication::translate("PlatformUtils", "Path is a folder");
        }
        return false;
    }
    QFile file(path);
    if (!file.remove()) {
        if (error) {
            *error = QCoreApplication::translate("PlatformUtils", "Failed to delete: %1").arg(file.errorString());
        }
        return false;
    }
    return true;
}

} // namespace PlatformUtils
