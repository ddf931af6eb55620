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

#include "TransferTypes.h"

namespace {
struct FormatConstants {
    static constexpr double unitStep = 1024.0;
    static constexpr qint64 msPerSecond = 1000;
    static constexpr qint64 secondsPerMinute = 60;
    static constexpr qint64 secondsPerHour = 3600;
};
} // namespace

namespace TransferTypes {

QString kindName(TransferJob::Kind kind)
{
    switch (kind) {
    case TransferJob::Kind::Copy:
        return QStringLiteral("copy");
    case TransferJob::Kind::Move:
        return QStringLiteral("move");
    case TransferJob::Kind::Delete:
        return QStringLiteral("delete");
    case TransferJob::Kind::MakeDirectory:
        return QStringLiteral("mkdir");
    }
    return QString();
}

QString outcomeName(JobResult::Outcome outcome)
{
    switch (outcome) {
    case JobResult::Outcome::Succeeded:
        return QStringLiteral("succeeded");
    case JobResult::Outcome::Failed:
        return QStringLiteral("failed");
    case JobResult::Outcome::Cancelled:
        return QStringLiteral("cancelled");
    }
    return QString();
}

QString terminationName(JobResult::Termination termination)
{
    switch (termination) {
    case JobResult::Termination::Exited:
        return QStringLiteral("exited");
    case JobResult::Termination::UserCancelled:
        return QStringLiteral("user-cancelled");
    case JobResult::Termination::ForceKilled:
        return QStringLiteral("force-killed");
    }
    return QString();
}

/**
 * @brief Formats a byte count with binary units, "-" when unknown.
 */
QString formatSize(qint64 bytes)
{
    if (bytes < 0) {
        return QStringLiteral("-");
    }
    static const char *const units[] = {"B", "KiB", "MiB", "GiB", "TiB", "PiB"};
    double value = static_cast<double>(bytes);
    int unit = 0;
    while (value >= FormatConstants::unitStep && unit < 5) {
        value /= FormatConstants::unitStep;
        unit += 1;
    }
    if (unit == 0) {
        return QStringLiteral("%1 B").arg(bytes);
    }
    return QStringLiteral("%1 %2").arg(value, 0, 'f', 1).arg(QLatin1String(units[unit]));
}

/**
 * @brief Formats a duration as "1h02m03s", "4m33s" or "51s", "-" when unknown.
 */
QString formatDuration(qint64 milliseconds)
{
    if (milliseconds < 0) {
        return QStringLiteral("-");
    }
    const qint64 totalSeconds = milliseconds / FormatConstants::msPerSecond;
    const qint64 hours = totalSeconds / FormatConstants::secondsPerHour;
    const qint64 minutes = (totalSeconds % FormatConstants::secondsPerHour) / FormatConstants::secondsPerMinute;
    const qint64 seconds = totalSeconds % FormatConstants::secondsPerMinute;
    if (hours > 0) {
        return QStringLiteral("%1h%2m%3s")
            .arg(hours)
            .arg(minutes, 2, 10, QLatin1Char('0'))
            .arg(seconds, 2, 10, QLatin1Char('0'));
    }
    if (minutes > 0) {
        return QStringLiteral("%1m%2s").arg(minutes).arg(seconds, 2, 10, QLatin1Char('0'));
    }
    return QStringLiteral("%1s").arg(seconds);
}

/**
 * @brief Registers the value types carried by queued cross-thread signals.
 */
void registerMetaTypes()
{
    qRegisterMetaType<Snapshot>("Snapshot");
    qRegisterMetaType<JobResult>("JobResult");
    qRegisterMetaType<PartialFileCandidate>("PartialFileCandidate");
    qRegisterMetaType<QList<PartialFileCandidate>>("QList<PartialFileCandidate>");
}

} // namespace TransferTypes
