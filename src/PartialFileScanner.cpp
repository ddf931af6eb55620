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

#include "PartialFileScanner.h"

#include <QCoreApplication>
#include <QDebug>

#include <algorithm>

#include "PlatformUtils.h"

namespace {
struct PartialNameConstants {
    static constexpr int tokenMinLength = 6;
    static constexpr int tokenMaxLength = 16;
};
} // namespace

/**
 * @brief Creates a scanner for the artifacts a cancelled copy leaves behind.
 *
 * rclone writes `<name>.<token>.partial` while a file is in flight and renames
 * it on completion. Any survivor after an abort is garbage.
 */
PartialFileScanner::PartialFileScanner(std::shared_ptr<const DirectoryLister> lister, const QString &suffix)
    : m_lister(std::move(lister))
    , m_suffix(suffix.isEmpty() ? QStringLiteral(".partial") : suffix)
    , m_pattern(buildPattern(m_suffix))
{
}

/**
 * @brief Lists partial-file candidates under a destination.
 *
 * A directory transfer is scanned recursively and every match is reported.
 * A file transfer only looks at the destination folder itself, restricted to
 * the transferred names when they are given.
 * @param destinationRoot Folder to scan.
 * @param wasDirectoryTransfer True when a whole folder was being transferred.
 * @param originalNames Names of the transferred files.
 * @param error Optional output set when the listing failed.
 * @return Candidates sorted by relative path.
 */
QList<PartialFileCandidate> PartialFileScanner::scan(const QString &destinationRoot,
                                                     bool wasDirectoryTransfer,
                                                     const QStringList &originalNames,
                                                     QString *error) const
{
    QList<PartialFileCandidate> candidates;
    if (!m_lister) {
        if (error) {
            *error = QCoreApplication::translate("PartialFileScanner", "No directory lister");
        }
        return candidates;
    }

    QList<DirectoryEntry> entries;
    QString listError;
    if (!m_lister->list(destinationRoot, wasDirectoryTransfer, &entries, &listError)) {
        qWarning() << "[PartialFileScanner] Cannot list" << destinationRoot << ":" << listError;
        if (error) {
            *error = listError;
        }
        return candidates;
    }

    for (const DirectoryEntry &entry : entries) {
        if (entry.isDir) {
            continue;
        }
        QString originalName;
        if (!matches(entry.name, &originalName)) {
            continue;
        }
        if (!wasDirectoryTransfer && !originalNames.isEmpty() && !originalNames.contains(originalName)) {
            continue;
        }

        PartialFileCandidate candidate;
        candidate.path = PlatformUtils::joinPath(destinationRoot, entry.relativePath);
        candidate.root = destinationRoot;
        candidate.relativePath = entry.relativePath;
        candidate.originalName = originalName;
        candidate.matchedPattern = QStringLiteral("%1.*%2").arg(originalName, m_suffix);
        candidate.size = entry.size;
        candidate.modified = entry.modified;
        candidates.append(candidate);
    }

    std::sort(candidates.begin(), candidates.end(), [](const PartialFileCandidate &a, const PartialFileCandidate &b) {
        return a.relativePath < b.relativePath;
    });
    qDebug() << "[PartialFileScanner] Found" << candidates.size() << "partial files under" << destinationRoot;
    return candidates;
}

/**
 * @brief Deletes candidates one by one; a failure does not stop the batch.
 * @param candidates Files to delete.
 * @return Report listing deleted paths and per-file failures.
 */
CleanupReport PartialFileScanner::remove(const QList<PartialFileCandidate> &candidates) const
{
    CleanupReport report;
    report.candidates = candidates;
    report.decision = CleanupReport::Decision::Deleted;

    for (const PartialFileCandidate &candidate : candidates) {
        QString error;
        const bool ok = m_lister
            && m_lister->removeFile(candidate.root, candidate.relativePath, &error);
        if (ok) {
            report.deleted.append(candidate.path);
            continue;
        }
        if (error.isEmpty()) {
            error = QCoreApplication::translate("PartialFileScanner", "Delete failed");
        }
        qWarning() << "[PartialFileScanner] Cannot delete" << candidate.path << ":" << error;
        report.failures.append(CleanupFailure{candidate.path, error});
    }
    return report;
}

bool PartialFileScanner::matches(const QString &fileName, QString *originalName) const
{
    return matchWith(m_pattern, fileName, originalName);
}

QString PartialFileScanner::suffix() const
{
    return m_suffix;
}

/**
 * @brief Checks a bare file name against `<original>.<token><suffix>`.
 *
 * The token is 6 to 16 ASCII alphanumerics, rclone uses 8 hex digits.
 * @param fileName File name without folders.
 * @param suffix Partial suffix, usually `.partial`.
 * @param originalName Optional output receiving the original file name.
 * @return True when the name matches.
 */
bool PartialFileScanner::matchesPartialName(const QString &fileName, const QString &suffix, QString *originalName)
{
    return matchWith(buildPattern(suffix), fileName, originalName);
}

QRegularExpression PartialFileScanner::buildPattern(const QString &suffix)
{
    const QString pattern = QStringLiteral("^(.+)\\.([A-Za-z0-9]{%1,%2})%3$")
        .arg(PartialNameConstants::tokenMinLength)
        .arg(PartialNameConstants::tokenMaxLength)
        .arg(QRegularExpression::escape(suffix));
    return QRegularExpression(pattern);
}

bool PartialFileScanner::matchWith(const QRegularExpression &pattern, const QString &fileName, QString *originalName)
{
    const QRegularExpressionMatch match = pattern.match(fileName);
    if (!match.hasMatch()) {
        return false;
    }
    if (originalName) {
        *originalName = match.captured(1);
    }
    return true;
}
