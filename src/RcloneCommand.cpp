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

#include "RcloneCommand.h"

#include <QCoreApplication>

#include "PlatformUtils.h"

namespace RcloneCommand {

namespace {

struct CommandConstants {
    static constexpr int singleItem = 1;
};

QString itemPath(const QString &root, const TransferItem &item)
{
    return PlatformUtils::joinPath(root, item.name);
}

QStringList statsArguments(const TransferSettings &settings)
{
    QStringList arguments;
    if (!settings.statsFlag.isEmpty()) {
        arguments << settings.statsFlag << settings.statsInterval;
    }
    if (!settings.parallelismFlag.isEmpty()) {
        arguments << settings.parallelismFlag << QString::number(settings.parallelism);
    }
    arguments << settings.progressFlags;
    return arguments;
}

bool planTransfer(const TransferJob &job,
                  const TransferSettings &settings,
                  const QString &filterFilePath,
                  QList<RcloneInvocation> *invocations,
                  QString *error)
{
    const QString subcommand = job.kind == TransferJob::Kind::Move ? QStringLiteral("move") : QStringLiteral("copy");
    bool hasDirectory = false;
    for (const TransferItem &item : job.items) {
        hasDirectory = hasDirectory || item.isDir;
    }

    RcloneInvocation invocation;
    invocation.reportsStats = true;
    invocation.arguments = commonArguments(job, settings);
    invocation.arguments << statsArguments(settings);
    invocation.arguments << subcommand;

    if (job.items.size() == CommandConstants::singleItem) {
        const TransferItem &item = job.items.first();
        invocation.arguments << itemPath(job.sourceRoot, item);
        invocation.arguments << (item.isDir ? itemPath(job.destination, item) : job.destination);
        invocation.description = QStringLiteral("%1 %2").arg(subcommand, item.name);
    } else {
        if (filterFilePath.isEmpty()) {
            if (error) {
                *error = QCoreApplication::translate("RcloneCommand", "Filter file is required for several items");
            }
            return false;
        }
        invocation.arguments << job.sourceRoot << job.destination
                             << QStringLiteral("--filter-from") << filterFilePath;
        invocation.description = QCoreApplication::translate("RcloneCommand", "%1 %2 items")
            .arg(subcommand)
            .arg(job.items.size());
    }

    if (job.kind == TransferJob::Kind::Move && hasDirectory) {
        invocation.arguments << QStringLiteral("--delete-empty-src-dirs");
    }
    invocations->append(invocation);
    return true;
}

void planDelete(const TransferJob &job, const TransferSettings &settings, QList<RcloneInvocation> *invocations)
{
    // Delete items live under the source root; fall back to the destination
    // for callers that only name one root.
    const QString root = job.sourceRoot.isEmpty() ? job.destination : job.sourceRoot;
    for (const TransferItem &item : job.items) {
        RcloneInvocation invocation;
        invocation.arguments = commonArguments(job, settings);
        invocation.arguments << (item.isDir ? QStringLiteral("purge") : QStringLiteral("deletefile"))
                             << itemPath(root, item);
        invocation.description = QStringLiteral("delete %1").arg(item.name);
        invocations->append(invocation);
    }
}

void planMakeDirectory(const TransferJob &job, const TransferSettings &settings, QList<RcloneInvocation> *invocations)
{
    if (job.items.isEmpty()) {
        RcloneInvocation invocation;
        invocation.arguments = commonArguments(job, settings);
        invocation.arguments << QStringLiteral("mkdir") << job.destination;
        invocation.description = QStringLiteral("mkdir %1").arg(job.destination);
        invocations->append(invocation);
        return;
    }
    for (const TransferItem &item : job.items) {
        RcloneInvocation invocation;
        invocation.arguments = commonArguments(job, settings);
        invocation.arguments << QStringLiteral("mkdir") << itemPath(job.destination, item);
        invocation.description = QStringLiteral("mkdir %1").arg(item.name);
        invocations->append(invocation);
    }
}

} // namespace

/**
 * @brief Builds the invocations for a job, in execution order.
 * @param job Job to plan.
 * @param settings Flag spellings, parallelism and base arguments.
 * @param filterFilePath Filter file written by the caller when needsFilterFile() is true.
 * @param invocations Output invocations.
 * @param error Optional output error message.
 * @return False when the job is not valid.
 */
bool plan(const TransferJob &job,
          const TransferSettings &settings,
          const QString &filterFilePath,
          QList<RcloneInvocation> *invocations,
          QString *error)
{
    if (!invocations) {
        return false;
    }
    invocations->clear();

    if (job.kind != TransferJob::Kind::MakeDirectory && job.items.isEmpty()) {
        if (error) {
            *error = QCoreApplication::translate("RcloneCommand", "Nothing to %1")
                .arg(TransferTypes::kindName(job.kind));
        }
        return false;
    }
    if (job.kind != TransferJob::Kind::Delete && job.destination.trimmed().isEmpty()) {
        if (error) {
            *error = QCoreApplication::translate("RcloneCommand", "Destination is not set");
        }
        return false;
    }
    if (job.isTransfer() && job.sourceRoot.trimmed().isEmpty()) {
        if (error) {
            *error = QCoreApplication::translate("RcloneCommand", "Source is not set");
        }
        return false;
    }
    for (const TransferItem &item : job.items) {
        if (item.name.trimmed().isEmpty()) {
            if (error) {
                *error = QCoreApplication::translate("RcloneCommand", "Item name is empty");
            }
            return false;
        }
    }

    switch (job.kind) {
    case TransferJob::Kind::Copy:
    case TransferJob::Kind::Move:
        return planTransfer(job, settings, filterFilePath, invocations, error);
    case TransferJob::Kind::Delete:
        planDelete(job, settings, invocations);
        return true;
    case TransferJob::Kind::MakeDirectory:
        planMakeDirectory(job, settings, invocations);
        return true;
    }
    return false;
}

bool needsFilterFile(const TransferJob &job)
{
    return job.isTransfer() && job.items.size() > CommandConstants::singleItem;
}

/**
 * @brief Filter rules selecting exactly the given items at the source root.
 */
QStringList filterRules(const QList<TransferItem> &items)
{
    QStringList rules;
    for (const TransferItem &item : items) {
        const QString pattern = QLatin1Char('/') + escapeFilterPattern(item.name);
        rules << (item.isDir ? QStringLiteral("+ %1/**").arg(pattern) : QStringLiteral("+ %1").arg(pattern));
    }
    rules << QStringLiteral("- **");
    return rules;
}

QString escapeFilterPattern(const QString &name)
{
    static const QString specials = QStringLiteral("\\*?[]{}");
    QString escaped;
    escaped.reserve(name.size());
    for (const QChar c : name) {
        if (specials.contains(c)) {
            escaped += QLatin1Char('\\');
        }
        escaped += c;
    }
    return escaped;
}

QStringList commonArguments(const TransferJob &job, const TransferSettings &settings)
{
    QStringList arguments = settings.baseArguments();
    arguments << job.extraFlags;
    return arguments;
}

} // namespace RcloneCommand
