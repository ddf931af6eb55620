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

#include "StatsBlockParser.h"

#include <QDebug>
#include <QRegularExpression>
#include <QtMath>

namespace {

struct StatsParserConstants {
    static constexpr qint64 unitBase = 1024;
    static constexpr qint64 unknown = -1;
    static constexpr int fullPercent = 100;
    static constexpr qint64 msPerSecond = 1000;
    static constexpr qint64 msPerMinute = 60 * msPerSecond;
    static constexpr qint64 msPerHour = 60 * msPerMinute;
    static constexpr qint64 msPerDay = 24 * msPerHour;
};

// Transferred:   15.031 MiB / 233.367 MiB, 6%, 817.606 KiB/s, ETA 4m33s
const QRegularExpression &globalBytesPattern()
{
    static const QRegularExpression pattern(QStringLiteral(
        "^Transferred:\\s+([\\d.]+\\s*[A-Za-z]*)\\s*/\\s*([\\d.]+\\s*[A-Za-z]*),\\s*(-|\\d+%),"
        "\\s*([\\d.]+\\s*[A-Za-z]*/s),\\s*ETA\\s*(\\S+)$"));
    return pattern;
}

// Transferred:   0 / 1, 0%
const QRegularExpression &globalFilesPattern()
{
    static const QRegularExpression pattern(QStringLiteral(
        "^Transferred:\\s+(\\d+)\\s*/\\s*(\\d+),\\s*(-|\\d+%)$"));
    return pattern;
}

const QRegularExpression &elapsedPattern()
{
    static const QRegularExpression pattern(QStringLiteral("^Elapsed time:\\s*(\\S+)$"));
    return pattern;
}

const QRegularExpression &errorsPattern()
{
    static const QRegularExpression pattern(QStringLiteral("^Errors:\\s+(\\d+)\\b"));
    return pattern;
}

// * name.mp4:  6% /233.367Mi, 817.618Ki/s, 4m33s
const QRegularExpression &perFilePattern()
{
    static const QRegularExpression pattern(QStringLiteral(
        "^\\*\\s+(.+?):\\s+(\\d+)%\\s*/\\s*([\\d.]+\\s*[A-Za-z]*),\\s*([\\d.]+\\s*[A-Za-z]*/s),\\s*(\\S+)$"));
    return pattern;
}

const QRegularExpression &perFilePendingPattern()
{
    static const QRegularExpression pattern(QStringLiteral("^\\*\\s+(.+?):\\s+transferring$"));
    return pattern;
}

// Log header rclone prints in front of each stats block at INFO level.
const QRegularExpression &statsHeaderPattern()
{
    static const QRegularExpression pattern(QStringLiteral(
        "^\\d{4}/\\d{2}/\\d{2} \\d{2}:\\d{2}:\\d{2}\\s+(INFO|NOTICE|DEBUG)\\s*:\\s*$"));
    return pattern;
}

const QRegularExpression &sizePattern()
{
    static const QRegularExpression pattern(QStringLiteral("^(\\d+(?:\\.\\d*)?)\\s*([A-Za-z]*)$"));
    return pattern;
}

const QRegularExpression &clockDurationPattern()
{
    static const QRegularExpression pattern(QStringLiteral(
        "^(?:(\\d+):)?(\\d+):(\\d+(?:\\.\\d+)?)$"));
    return pattern;
}

const QRegularExpression &durationComponentPattern()
{
    static const QRegularExpression pattern(QStringLiteral(
        "(\\d+(?:\\.\\d+)?)(ms|us|\\x{00B5}s|ns|d|h|m|s)"));
    return pattern;
}

int unitExponent(const QString &unit, bool *ok)
{
    *ok = true;
    const QString lower = unit.toLower();
    if (lower.isEmpty() || lower == QLatin1String("b") || lower == QLatin1String("bytes")) {
        return 0;
    }
    static const QString prefixes = QStringLiteral("kmgtpe");
    const int exponent = prefixes.indexOf(lower.at(0)) + 1;
    if (exponent <= 0) {
        *ok = false;
        return 0;
    }
    const QString rest = lower.mid(1);
    static const QStringList suffixes = {
        QString(), QStringLiteral("i"), QStringLiteral("b"), QStringLiteral("ib"),
        QStringLiteral("bytes"), QStringLiteral("ibytes")
    };
    if (!suffixes.contains(rest)) {
        *ok = false;
        return 0;
    }
    return exponent;
}

int parsePercent(const QString &text)
{
    if (text == QLatin1String("-")) {
        return static_cast<int>(StatsParserConstants::unknown);
    }
    QString digits = text;
    digits.remove(QLatin1Char('%'));
    bool ok = false;
    const int value = digits.toInt(&ok);
    return ok ? value : static_cast<int>(StatsParserConstants::unknown);
}

} // namespace

/**
 * @brief Parses a human readable size such as "512MiB", "1.5 G" or "0 B".
 * @param text Size text, optionally followed by "/s" for speeds.
 * @param bytes Output byte count using 1024-based multipliers.
 * @return True when the text was a valid size.
 */
bool StatsBlockParser::parseSize(const QString &text, qint64 *bytes)
{
    QString value = text.trimmed();
    if (value.endsWith(QLatin1String("/s"))) {
        value.chop(2);
    }
    const QRegularExpressionMatch match = sizePattern().match(value.trimmed());
    if (!match.hasMatch()) {
        return false;
    }
    bool ok = false;
    const double number = match.captured(1).toDouble(&ok);
    if (!ok) {
        return false;
    }
    const int exponent = unitExponent(match.captured(2), &ok);
    if (!ok) {
        return false;
    }
    const double multiplier = qPow(static_cast<double>(StatsParserConstants::unitBase), exponent);
    if (bytes) {
        *bytes = qRound64(number * multiplier);
    }
    return true;
}

/**
 * @brief Parses an ETA or elapsed value into milliseconds.
 *
 * Accepts "h:m:s", "m:s", Go style durations ("1d2h3m4.5s", "51s", "250ms")
 * and "-" or an empty string, which map to -1 (unknown).
 * @param text Duration text.
 * @param milliseconds Output duration.
 * @return True when the text was a valid duration.
 */
bool StatsBlockParser::parseDuration(const QString &text, qint64 *milliseconds)
{
    const QString value = text.trimmed();
    if (value.isEmpty() || value == QLatin1String("-")) {
        if (milliseconds) {
            *milliseconds = StatsParserConstants::unknown;
        }
        return true;
    }

    const QRegularExpressionMatch clock = clockDurationPattern().match(value);
    if (clock.hasMatch()) {
        const qint64 hours = clock.captured(1).isEmpty() ? 0 : clock.captured(1).toLongLong();
        const qint64 minutes = clock.captured(2).toLongLong();
        const double seconds = clock.captured(3).toDouble();
        if (milliseconds) {
            *milliseconds = hours * StatsParserConstants::msPerHour
                + minutes * StatsParserConstants::msPerMinute
                + qRound64(seconds * StatsParserConstants::msPerSecond);
        }
        return true;
    }

    double total = 0.0;
    int consumed = 0;
    QRegularExpressionMatchIterator it = durationComponentPattern().globalMatch(value);
    while (it.hasNext()) {
        const QRegularExpressionMatch part = it.next();
        if (part.capturedStart() != consumed) {
            return false;
        }
        consumed = part.capturedEnd();
        const double amount = part.captured(1).toDouble();
        const QString unit = part.captured(2);
        if (unit == QLatin1String("d")) {
            total += amount * StatsParserConstants::msPerDay;
        } else if (unit == QLatin1String("h")) {
            total += amount * StatsParserConstants::msPerHour;
        } else if (unit == QLatin1String("m")) {
            total += amount * StatsParserConstants::msPerMinute;
        } else if (unit == QLatin1String("s")) {
            total += amount * StatsParserConstants::msPerSecond;
        } else if (unit == QLatin1String("ms")) {
            total += amount;
        } else {
            total += amount / (unit == QLatin1String("ns") ? 1000000.0 : 1000.0);
        }
    }
    if (consumed == 0 || consumed != value.size()) {
        return false;
    }
    if (milliseconds) {
        *milliseconds = qRound64(total);
    }
    return true;
}

/**
 * @brief Classifies a single output line.
 * @param line Raw line, surrounding whitespace is ignored.
 * @param fields Optional output of the captured fields for recognised lines.
 * @return The line kind.
 */
StatsBlockParser::LineKind StatsBlockParser::classify(const QString &line, QStringList *fields)
{
    const QString text = line.trimmed();
    if (text.isEmpty()) {
        return LineKind::Noise;
    }

    auto matched = [fields](const QRegularExpressionMatch &match) {
        if (fields) {
            *fields = match.capturedTexts().mid(1);
        }
    };

    if (text.startsWith(QLatin1String("Transferred:"))) {
        QRegularExpressionMatch match = globalBytesPattern().match(text);
        if (match.hasMatch()) {
            matched(match);
            return LineKind::GlobalBytes;
        }
        match = globalFilesPattern().match(text);
        if (match.hasMatch()) {
            matched(match);
            return LineKind::GlobalFiles;
        }
        return LineKind::Malformed;
    }
    if (text.startsWith(QLatin1String("Elapsed time:"))) {
        const QRegularExpressionMatch match = elapsedPattern().match(text);
        if (match.hasMatch()) {
            matched(match);
            return LineKind::Elapsed;
        }
        return LineKind::Malformed;
    }
    if (text.startsWith(QLatin1String("Errors:"))) {
        const QRegularExpressionMatch match = errorsPattern().match(text);
        if (match.hasMatch()) {
            matched(match);
            return LineKind::Errors;
        }
        return LineKind::Malformed;
    }
    if (text.startsWith(QLatin1String("Checks:"))
        || text.startsWith(QLatin1String("Deleted:"))
        || text.startsWith(QLatin1String("Renamed:"))
        || text.startsWith(QLatin1String("Server Side"))) {
        return LineKind::BlockDetail;
    }
    if (text == QLatin1String("Transferring:")) {
        return LineKind::TransferringHeader;
    }
    if (text == QLatin1String("Checking:")) {
        return LineKind::CheckingHeader;
    }
    if (text.startsWith(QLatin1Char('*'))) {
        QRegularExpressionMatch match = perFilePattern().match(text);
        if (match.hasMatch()) {
            matched(match);
            return LineKind::PerFile;
        }
        match = perFilePendingPattern().match(text);
        if (match.hasMatch()) {
            matched(match);
            return LineKind::PerFilePending;
        }
        if (text.contains(QLatin1Char(':'))) {
            return LineKind::Malformed;
        }
    }
    return LineKind::Noise;
}

/**
 * @brief Reports whether a line belongs to a stats block rather than to log text.
 * @param line Raw output line.
 * @return True for stats lines and for the log header that precedes a block.
 */
bool StatsBlockParser::isProgressLine(const QString &line)
{
    if (classify(line) != LineKind::Noise) {
        return true;
    }
    return statsHeaderPattern().match(line.trimmed()).hasMatch();
}

QList<StatsRecord> StatsBlockParser::parse(const OutputChunk &chunk)
{
    QList<StatsRecord> records;
    QByteArray &buffer = (chunk.origin == OutputChunk::Origin::StandardError)
        ? m_stderrBuffer
        : m_stdoutBuffer;
    consume(buffer, chunk.data, records);
    return records;
}

/**
 * @brief Flushes any buffered partial line once the stream has ended.
 * @return Records decoded from the flushed lines.
 */
QList<StatsRecord> StatsBlockParser::finish()
{
    QList<StatsRecord> records;
    consume(m_stdoutBuffer, QByteArrayLiteral("\n"), records);
    consume(m_stderrBuffer, QByteArrayLiteral("\n"), records);
    return records;
}

int StatsBlockParser::anomalyCount() const
{
    return m_anomalies;
}

void StatsBlockParser::consume(QByteArray &buffer, const QByteArray &data, QList<StatsRecord> &records)
{
    if (!data.isEmpty()) {
        buffer.append(data);
    }

    int newLineIndex = buffer.indexOf('\n');
    while (newLineIndex >= 0) {
        const QByteArray lineBytes = buffer.left(newLineIndex).trimmed();
        buffer.remove(0, newLineIndex + 1);

        if (!lineBytes.isEmpty()) {
            parseLine(QString::fromUtf8(lineBytes), records);
        }

        newLineIndex = buffer.indexOf('\n');
    }
}

void StatsBlockParser::parseLine(const QString &line, QList<StatsRecord> &records)
{
    if (m_section == Section::Checking && line.startsWith(QLatin1Char('*'))) {
        return;
    }

    QStringList fields;
    const LineKind kind = classify(line, &fields);
    switch (kind) {
    case LineKind::Noise:
    case LineKind::BlockDetail:
        return;
    case LineKind::Malformed:
        reportAnomaly(line);
        return;
    case LineKind::TransferringHeader:
        m_section = Section::Transferring;
        return;
    case LineKind::CheckingHeader:
        m_section = Section::Checking;
        return;
    case LineKind::GlobalBytes: {
        qint64 transferred = 0;
        qint64 total = 0;
        qint64 speed = 0;
        qint64 eta = 0;
        if (!parseSize(fields.at(0), &transferred)
            || !parseSize(fields.at(1), &total)
            || !parseSize(fields.at(3), &speed)
            || !parseDuration(fields.at(4), &eta)) {
            reportAnomaly(line);
            return;
        }
        const int percent = parsePercent(fields.at(2));
        m_global.bytesTransferred = transferred;
        m_global.bytesTotal = (percent < 0) ? StatsParserConstants::unknown : total;
        m_global.percent = percent;
        m_global.speed = speed;
        m_global.etaMs = eta;
        m_section = Section::None;
        emitGlobal(true, records);
        return;
    }
    case LineKind::GlobalFiles:
        m_global.filesCompleted = fields.at(0).toInt();
        m_global.filesTotal = fields.at(1).toInt();
        emitGlobal(false, records);
        return;
    case LineKind::Errors:
        m_global.errors = fields.at(0).toInt();
        emitGlobal(false, records);
        return;
    case LineKind::Elapsed: {
        qint64 elapsed = 0;
        if (!parseDuration(fields.at(0), &elapsed) || elapsed < 0) {
            reportAnomaly(line);
            return;
        }
        m_global.elapsedMs = elapsed;
        emitGlobal(false, records);
        return;
    }
    case LineKind::PerFile: {
        FileStatsRecord file;
        file.fileName = fields.at(0).trimmed();
        file.percent = fields.at(1).toInt();
        if (!parseSize(fields.at(2), &file.bytesTotal)
            || !parseSize(fields.at(3), &file.speed)
            || !parseDuration(fields.at(4), &file.etaMs)) {
            reportAnomaly(line);
            return;
        }
        file.bytesDone = file.bytesTotal * file.percent / StatsParserConstants::fullPercent;
        StatsRecord record;
        record.kind = StatsRecord::Kind::File;
        record.file = file;
        records.append(record);
        return;
    }
    case LineKind::PerFilePending: {
        StatsRecord record;
        record.kind = StatsRecord::Kind::File;
        record.file.fileName = fields.at(0).trimmed();
        records.append(record);
        return;
    }
    }
}

void StatsBlockParser::emitGlobal(bool startsBlock, QList<StatsRecord> &records) const
{
    StatsRecord record;
    record.kind = StatsRecord::Kind::Global;
    record.global.progress = m_global;
    record.global.startsBlock = startsBlock;
    records.append(record);
}

void StatsBlockParser::reportAnomaly(const QString &line)
{
    m_anomalies += 1;
    qDebug() << "[StatsBlockParser] Malformed progress line:" << line;
}
