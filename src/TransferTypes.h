#pragma once

#include <QDateTime>
#include <QList>
#include <QMetaType>
#include <QString>
#include <QStringList>
#include <QVector>

struct TransferItem {
    QString name;
    bool isDir = false;
};

struct TransferJob {
    enum class Kind {
        Copy,
        Move,
        Delete,
        MakeDirectory
    };

    quint64 id = 0;
    Kind kind = Kind::Copy;
    QString sourceRoot;
    QList<TransferItem> items;
    QString destination;
    QStringList extraFlags;

    bool isTransfer() const { return kind == Kind::Copy || kind == Kind::Move; }
};

// Negative values mean "unknown" and are rendered as indeterminate.
struct GlobalProgress {
    qint64 bytesTransferred = 0;
    qint64 bytesTotal = -1;
    int percent = -1;
    qint64 speed = 0;
    qint64 etaMs = -1;
    qint64 elapsedMs = 0;
    int filesCompleted = 0;
    int filesTotal = 0;
    int errors = 0;
};

struct FileSlot {
    enum class State {
        Active,
        Completing
    };

    int slotIndex = -1;
    QString fileName;
    qint64 bytesDone = 0;
    qint64 bytesTotal = -1;
    int percent = 0;
    qint64 speed = 0;
    qint64 etaMs = -1;
    State state = State::Active;
};

struct Snapshot {
    GlobalProgress global;
    QVector<FileSlot> slots;
    int queuedFiles = 0;
    quint64 sequence = 0;
};

struct PartialFileCandidate {
    QString path;
    QString root;
    QString relativePath;
    QString originalName;
    QString matchedPattern;
    qint64 size = 0;
    QDateTime modified;
};

struct CleanupFailure {
    QString path;
    QString error;
};

struct CleanupReport {
    enum class Decision {
        NotNeeded,
        Pending,
        Kept,
        Deleted
    };

    QList<PartialFileCandidate> candidates;
    Decision decision = Decision::NotNeeded;
    QStringList deleted;
    QList<CleanupFailure> failures;
    QString scanError;
};

struct JobResult {
    enum class Outcome {
        Succeeded,
        Failed,
        Cancelled
    };

    enum class ErrorKind {
        None,
        LaunchError,
        ProcessFailure,
        SetupError
    };

    enum class Termination {
        Exited,
        UserCancelled,
        ForceKilled
    };

    quint64 jobId = 0;
    Outcome outcome = Outcome::Failed;
    ErrorKind errorKind = ErrorKind::None;
    Termination termination = Termination::Exited;
    int exitCode = 0;
    QString errorText;
    CleanupReport cleanup;
    Snapshot finalSnapshot;
    int parseAnomalies = 0;
};

namespace TransferTypes {

QString kindName(TransferJob::Kind kind);
QString outcomeName(JobResult::Outcome outcome);
QString terminationName(JobResult::Termination termination);
QString formatSize(qint64 bytes);
QString formatDuration(qint64 milliseconds);
void registerMetaTypes();

} // namespace TransferTypes

Q_DECLARE_METATYPE(Snapshot)
Q_DECLARE_METATYPE(JobResult)
Q_DECLARE_METATYPE(PartialFileCandidate)
Q_DECLARE_METATYPE(QList<PartialFileCandidate>)
