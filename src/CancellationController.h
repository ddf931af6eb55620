#pragma once

#include <QAtomicInt>
#include <QAtomicInteger>
#include <QDateTime>

#include "ProcessRunner.h"
#include "TransferTypes.h"

class CancellationController
{
public:
    enum class State {
        Running = 0,
        CancelRequested,
        Terminating,
        Terminated
    };

    CancellationController(quint64 jobId, int timeoutMs, int killWaitMs);

    bool requestCancel();
    bool isCancelRequested() const;

    JobResult::Termination terminate(ProcessRunner &runner);
    void finishWithoutProcess();
    void markExited();

    State state() const;
    JobResult::Termination reason() const;
    QDateTime requestedAt() const;
    int timeoutMs() const;

private:
    void settle(JobResult::Termination reason);

    quint64 m_jobId = 0;
    int m_timeoutMs = 0;
    int m_killWaitMs = 0;
    QAtomicInt m_state;
    QAtomicInt m_reason;
    QAtomicInteger<qint64> m_requestedAtMs;
};
