#pragma once

#include <QByteArray>
#include <QList>
#include <QProcess>
#include <QString>
#include <QStringList>

#include <functional>

struct OutputChunk {
    enum class Origin {
        StandardOutput,
        StandardError
    };

    Origin origin = Origin::StandardOutput;
    QByteArray data;
};

struct ExitStatus {
    bool success = false;
    bool crashed = false;
    int code = -1;
    QStringList stderrTail;
};

class ProcessRunner
{
public:
    enum class ReadStatus {
        Data,
        Timeout,
        EndOfStream
    };

    enum class TerminationOutcome {
        AlreadyExited,
        Graceful,
        ForceKilled
    };

    using LineFilter = std::function<bool(const QString &)>;

    ProcessRunner();
    ~ProcessRunner();

    ProcessRunner(const ProcessRunner &) = delete;
    ProcessRunner &operator=(const ProcessRunner &) = delete;

    bool start(const QString &program,
               const QStringList &arguments,
               const QString &workingDirectory,
               QString *error);

    ReadStatus readChunk(OutputChunk *chunk, int waitMs);
    TerminationOutcome terminate(int timeoutMs, int killWaitMs);
    ExitStatus exitStatus() const;

    bool isRunning() const;
    qint64 processId() const;

    void setStderrTailFilter(const LineFilter &filter);
    void setStderrTailLimit(int lines);

private:
    void collectAvailable();
    void appendStderrLines(const QByteArray &data);
    void flushStderrLine();

    QProcess m_process;
    QList<OutputChunk> m_pending;
    QByteArray m_stderrLineBuffer;
    QStringList m_stderrTail;
    LineFilter m_tailFilter;
    int m_tailLimit = 20;
    bool m_started = false;
    bool m_ended = false;
};
