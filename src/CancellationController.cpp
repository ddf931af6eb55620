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

#include "CancellationController.h"

#include <QDebug>
#include <QElapsedTimer>

namespace {
struct CancellationConstants {
    static constexpr qint64 notRequested = 0;
    static constexpr int minimumTimeoutMs = 0;
};
} // namespace

/**
 * @brief Creates the abort coordinator of one job.
 *
 * requestCancel() may be called from any thread. The job's worker thread
 * observes the request and drives the process through terminate().
 *
 * Running -> CancelRequested -> Terminating -> Terminated, or
 * Running -> Terminated when the job ends on its own.
 */
CancellationController::CancellationController(quint64 jobId, int timeoutMs, int killWaitMs)
    : m_jobId(jobId)
    , m_timeoutMs(qMax(CancellationConstants::minimumTimeoutMs, timeoutMs))
    , m_killWaitMs(qMax(CancellationConstants::minimumTimeoutMs, killWaitMs))
    , m_state(static_cast<int>(State::Running))
    , m_reason(static_cast<int>(JobResult::Termination::Exited))
    , m_requestedAtMs(CancellationConstants::notRequested)
{
}

/**
 * @brief Asks for the job to be cancelled.
 * @return True when the request was accepted, false when the job already
 *         left the Running state (the request is then a no-op).
 */
bool CancellationController::requestCancel()
{
    if (!m_state.testAndSetOrdered(static_cast<int>(State::Running), static_cast<int>(State::CancelRequested))) {
        return false;
    }
    m_requestedAtMs.storeRelease(QDateTime::currentMSecsSinceEpoch());
    qInfo() << "[CancellationController] Cancel requested for job" << m_jobId;
    return true;
}

bool CancellationController::isCancelRequested() const
{
    return m_state.loadAcquire() == static_cast<int>(State::CancelRequested);
}

/**
 * @brief Terminates the job's process after a cancel request.
 *
 * Runs on the worker thread. Never blocks longer than the graceful timeout
 * plus the kill wait.
 * @param runner Process of the job.
 * @return UserCancelled when the process honoured the terminate signal,
 *         ForceKilled when it had to be killed, Exited when it was already gone.
 */
JobResult::Termination CancellationController::terminate(ProcessRunner &runner)
{
    if (!m_state.testAndSetOrdered(static_cast<int>(State::CancelRequested), static_cast<int>(State::Terminating))) {
        return reason();
    }

    QElapsedTimer timer;
    timer.start();
    JobResult::Termination termination = JobResult::Termination::Exited;
    switch (runner.terminate(m_timeoutMs, m_killWaitMs)) {
    case ProcessRunner::TerminationOutcome::AlreadyExited:
        termination = JobResult::Termination::Exited;
        break;
    case ProcessRunner::TerminationOutcome::Graceful:
        termination = JobResult::Termination::UserCancelled;
        break;
    case ProcessRunner::TerminationOutcome::ForceKilled:
        termination = JobResult::Termination::ForceKilled;
        break;
    }
    settle(termination);
    qInfo() << "[CancellationController] Job" << m_jobId << "terminated:"
            << TransferTypes::terminationName(termination) << "after" << timer.elapsed() << "ms";
    return termination;
}

/**
 * @brief Settles a cancel request that arrived while no process was running.
 */
void CancellationController::finishWithoutProcess()
{
    if (m_state.testAndSetOrdered(static_cast<int>(State::CancelRequested), static_cast<int>(State::Terminating))) {
        settle(JobResult::Termination::UserCancelled);
    }
}

/**
 * @brief Records that the job ended on its own; later cancel requests are no-ops.
 */
void CancellationController::markExited()
{
    if (m_state.testAndSetOrdered(static_cast<int>(State::Running), static_cast<int>(State::Terminated))) {
        return;
    }
    // A request that was never acted upon resolves as "process already exited".
    if (m_state.testAndSetOrdered(static_cast<int>(State::CancelRequested), static_cast<int>(State::Terminating))) {
        settle(JobResult::Termination::Exited);
    }
}

CancellationController::State CancellationController::state() const
{
    return static_cast<State>(m_state.loadAcquire());
}

JobResult::Termination CancellationController::reason() const
{
    return static_cast<JobResult::Termination>(m_reason.loadAcquire());
}

QDateTime CancellationController::requestedAt() const
{
    const qint64 ms = m_requestedAtMs.loadAcquire();
    if (ms == CancellationConstants::notRequested) {
        return QDateTime();
    }
    return QDateTime::fromMSecsSinceEpoch(ms);
}

int CancellationController::timeoutMs() const
{
    return m_timeoutMs;
}

void CancellationController::settle(JobResult::Termination reason)
{
    m_reason.storeRelease(static_cast<int>(reason));
    m_state.storeRelease(static_cast<int>(State::Terminated));
}
