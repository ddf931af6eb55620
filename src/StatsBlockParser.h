#pragma once

#include <QByteArray>
#include <QList>
#include <QString>

#include "ProcessRunner.h"
#include "TransferTypes.h"

struct GlobalStatsRecord {
    GlobalProgress progress;
    bool startsBlock = false;
};

struct FileStatsRecord {
    QString fileName;
    int percent = 0;
    qint64 bytesDone = 0;
    qint64 bytesTotal = -1;
    qint64 speed = 0;
    qint64 etaMs = -1;
};

struct StatsRecord {
    enum class Kind {
        Global,
        File
    };

    Kind kind = Kind::Global;
    GlobalStatsRecord global;
    FileStatsRecord file;
};

class StatsBlockParser
{
public:
    enum class LineKind {
        Noise,
        Malformed,
        GlobalBytes,
        GlobalFiles,
        Errors,
        Elapsed,
        BlockDetail,
        TransferringHeader,
        CheckingHeader,
        PerFile,
        PerFilePending
    };

    QList<StatsRecord> parse(const OutputChunk &chunk);
    QList<StatsRecord> finish();

    int anomalyCount() const;

    static LineKind classify(const QString &line, QStringList *fields = nullptr);
    static bool isProgressLine(const QString &line);
    static bool parseSize(const QString &text, qint64 *bytes);
    static bool parseDuration(const QString &text, qint64 *milliseconds);

private:
    enum class Section {
        None,
        Transferring,
        Checking
    };

    void consume(QByteArray &buffer, const QByteArray &data, QList<StatsRecord> &records);
    void parseLine(const QString &line, QList<StatsRecord> &records);
    void emitGlobal(bool startsBlock, QList<StatsRecord> &records) const;
    void reportAnomaly(const QString &line);

    QByteArray m_stdoutBuffer;
    QByteArray m_stderrBuffer;
    GlobalProgress m_global;
    Section m_section = Section::None;
    int m_anomalies = 0;
};
