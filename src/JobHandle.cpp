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

#include "JobHandle.h"

#include <QDebug>
#include <QFutureWatcher>
#include <QtConcurrent/QtConcurrentRun>

#include "PartialFileScanner.h"
#include "TransferWorker.h"

/**
 * @brief Creates the UI-facing view of one submitted job.
 *
 * Lives on the thread that submitted the job. Snapshots are picked up from
 * the worker on a fixed tick and re-emitted only when a newer one exists.
 */
JobHandle::JobHandle(const TransferJob &job, const TransferSettings &settings, QObject *parent)
    : QObject(parent)
    , m_job(job)
    , m_settings(settings)
    , m_cancellation(std::make_shared<CancellationController>(job.id, settings.terminateTimeoutMs, settings.killWaitMs))
    , m_handoff(std::make_shared<SnapshotHandoff>())
    , m_lister(DirectoryLister::forDestination(job.destination, settings.rclonePath, settings.baseArguments()))
{
    m_result.jobId = job.id;
    m_snapshotTimer.setInterval(settings.snapshotIntervalMs);
    connect(&m_snapshotTimer, &QTimer::timeout, this, &JobHandle::pollSnapshot);
}

/**
 * @brief Cancels a job still running and waits for its thread.
 */
JobHandle::~JobHandle()
{
    if (m_thread) {
        m_cancellation->requestCancel();
        m_thread->quit();
        m_thread->wait();
    }
}

quint64 JobHandle::id() const
{
    return m_job.id;
}

TransferJob JobHandle::job() const
{
    return m_job;
}

JobHandle::State JobHandle::state() const
{
    return m_state;
}

bool JobHandle::isFinished() const
{
    return m_state == State::Finished;
}

/**
 * @brief Delivers snapshot updates to a callback until the job finishes.
 * @param context Receiver whose thread runs the callback; the connection
 *        ends with it.
 * @param callback Called with each new snapshot.
 * @return Connection that can be used to unsubscribe.
 */
QMetaObject::Connection JobHandle::subscribe(QObject *context, const SnapshotCallback &callback)
{
    if (!context || !callback) {
        return QMetaObject::Connection();
    }
    return connect(this, &JobHandle::snapshotUpdated, context, [callback](const Snapshot &snapshot) {
        callback(snapshot);
    });
}

QSharedPointer<const Snapshot> JobHandle::latestSnapshot() const
{
    return m_handoff->latest();
}

/**
 * @brief Returns the job's result; only meaningful once finished() was emitted.
 */
JobResult JobHandle::result() const
{
    return m_result;
}

/**
 * @brief Asks the job to stop.
 * @return False when the job is no longer running, the request is then ignored.
 */
bool JobHandle::cancel()
{
    if (m_state == State::Finished) {
        return false;
    }
    return m_cancellation->requestCancel();
}

/**
 * @brief Answers a cleanupConfirmationRequested() signal.
 * @param removeFiles True to delete the partial files, false to keep them.
 */
void JobHandle::confirmCleanup(bool removeFiles)
{
    if (m_state != State::AwaitingCleanupDecision) {
        qWarning() << "[JobHandle] Job" << m_job.id << "has no pending cleanup decision";
        return;
    }
    if (!removeFiles) {
        m_result.cleanup.decision = CleanupReport::Decision::Kept;
        qInfo() << "[JobHandle] Job" << m_job.id << "keeps" << m_result.cleanup.candidates.size() << "partial files";
        finish();
        return;
    }
    runCleanup();
}

/**
 * @brief Launches the worker thread.
 */
void JobHandle::start()
{
    if (m_state != State::Pending) {
        return;
    }

    TransferTypes::registerMetaTypes();
    auto *thread = new QThread(this);
    auto *worker = new TransferWorker(m_job, m_settings, m_cancellation, m_handoff, m_lister);
    worker->moveToThread(thread);
    m_thread = thread;

    connect(thread, &QThread::started, worker, &TransferWorker::start);
    connect(worker, &TransferWorker::finished, this, &JobHandle::handleWorkerFinished);
    connect(thread, &QThread::finished, worker, &QObject::deleteLater);
    connect(thread, &QThread::finished, thread, &QObject::deleteLater);

    setState(State::Running);
    m_snapshotTimer.start();
    thread->start();
}

void JobHandle::pollSnapshot()
{
    quint64 generation = 0;
    const QSharedPointer<const Snapshot> snapshot = m_handoff->latest(&generation);
    if (!snapshot || generation == m_lastGeneration) {
        return;
    }
    m_lastGeneration = generation;
    emit snapshotUpdated(*snapshot);
}

void JobHandle::handleWorkerFinished(const JobResult &result)
{
    m_snapshotTimer.stop();
    pollSnapshot();
    if (m_thread) {
        m_thread->quit();
    }

    m_result = result;
    if (m_result.cleanup.decision != CleanupReport::Decision::Pending) {
        finish();
        return;
    }
    if (m_settings.autoCleanupPartial) {
        runCleanup();
        return;
    }
    setState(State::AwaitingCleanupDecision);
    emit cleanupConfirmationRequested(m_result.cleanup.candidates);
}

void JobHandle::runCleanup()
{
    setState(State::Cleaning);

    const std::shared_ptr<const DirectoryLister> lister = m_lister;
    const QString suffix = m_settings.partialSuffix;
    const QList<PartialFileCandidate> candidates = m_result.cleanup.candidates;
    auto future = QtConcurrent::run([lister, suffix, candidates]() {
        PartialFileScanner scanner(lister, suffix);
        return scanner.remove(candidates);
    });

    auto *watcher = new QFutureWatcher<CleanupReport>(this);
    connect(watcher, &QFutureWatcher<CleanupReport>::finished, this, [this, watcher]() {
        const CleanupReport report = watcher->result();
        watcher->deleteLater();

        const QString scanError = m_result.cleanup.scanError;
        m_result.cleanup = report;
        m_result.cleanup.scanError = scanError;
        qInfo() << "[JobHandle] Job" << m_job.id << "deleted" << report.deleted.size()
                << "partial files," << report.failures.size() << "failures";
        finish();
    });
    watcher->setFuture(future);
}

void JobHandle::finish()
{
    setState(State::Finished);
    emit finished(m_result);
}

void JobHandle::setState(State state)
{
    if (m_state == state) {
        return;
    }
    m_state = state;
    emit stateChanged(state);
}
