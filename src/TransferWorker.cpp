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

#include "TransferWorker.h"

#include <QDebug>
#include <QDir>
#include <QFile>
#include <QTemporaryFile>

#include "PartialFileScanner.h"
#include "PlatformUtils.h"

namespace {
struct WorkerConstants {
    static constexpr int maxErrorLines = 5;
};
} // namespace

/**
 * @brief Creates a worker running one job's rclone invocations on its thread.
 *
 * start() blocks until the job is over: it launches each invocation in turn,
 * feeds the output through the parser and aggregator, publishes snapshots and
 * honours cancel requests between reads. The result is delivered through
 * finished().
 */
TransferWorker::TransferWorker(const TransferJob &job,
                               const TransferSettings &settings,
                               std::shared_ptr<CancellationController> cancellation,
                               std::shared_ptr<SnapshotHandoff> handoff,
                               std::shared_ptr<const DirectoryLister> lister,
                               QObject *parent)
    : QObject(parent)
    , m_job(job)
    , m_settings(settings)
    , m_cancellation(std::move(cancellation))
    , m_handoff(std::move(handoff))
    , m_lister(std::move(lister))
{
}

/**
 * @brief Runs the job to completion and emits finished().
 */
void TransferWorker::start()
{
    m_timer.start();

    JobResult result;
    result.jobId = m_job.id;
    result.outcome = JobResult::Outcome::Succeeded;

    ProgressAggregator aggregator(m_settings.parallelism);
    StatsBlockParser parser;

    qInfo() << "[TransferWorker] Job" << m_job.id << "started:" << TransferTypes::kindName(m_job.kind)
            << m_job.items.size() << "items to" << m_job.destination;

    // The filter file must outlive the rclone process that reads it.
    QTemporaryFile filterFile(QDir::temp().filePath(QStringLiteral("ferryman-filter-XXXXXX.txt")));
    QList<RcloneInvocation> invocations;
    QString error;
    bool ready = true;
    if (RcloneCommand::needsFilterFile(m_job)) {
        if (!filterFile.open()) {
            fail(result, JobResult::ErrorKind::SetupError,
                 tr("Cannot create filter file: %1").arg(filterFile.errorString()));
            ready = false;
        } else {
            const QByteArray rules = RcloneCommand::filterRules(m_job.items).join(QLatin1Char('\n')).toUtf8() + '\n';
            if (filterFile.write(rules) != rules.size() || !filterFile.flush()) {
                fail(result, JobResult::ErrorKind::SetupError,
                     tr("Cannot write filter file: %1").arg(filterFile.errorString()));
                ready = false;
            }
            m_filterFilePath = filterFile.fileName();
        }
    }
    if (ready && !RcloneCommand::plan(m_job, m_settings, m_filterFilePath, &invocations, &error)) {
        fail(result, JobResult::ErrorKind::SetupError, error);
        ready = false;
    }

    bool cancelled = false;
    for (int i = 0; ready && i < invocations.size(); ++i) {
        if (m_cancellation->isCancelRequested()) {
            m_cancellation->finishWithoutProcess();
            cancelled = true;
            break;
        }
        const StepOutcome outcome = runInvocation(invocations.at(i), aggregator, parser, result);
        if (outcome == StepOutcome::Cancelled) {
            cancelled = true;
            break;
        }
        if (outcome == StepOutcome::Failed) {
            break;
        }
        if (!invocations.at(i).reportsStats) {
            publishStepProgress(aggregator, i + 1, invocations.size());
        }
    }

    // Requests that arrive from here on find the job already over.
    m_cancellation->markExited();

    if (cancelled) {
        result.outcome = JobResult::Outcome::Cancelled;
        result.termination = m_cancellation->reason();
        if (m_job.isTransfer()) {
            scanForPartialFiles(result);
        }
    }

    result.finalSnapshot = aggregator.snapshot();
    result.parseAnomalies = parser.anomalyCount();
    m_handoff->publish(result.finalSnapshot);

    qInfo() << "[TransferWorker] Job" << m_job.id << TransferTypes::outcomeName(result.outcome)
            << "in" << m_timer.elapsed() << "ms";
    if (result.parseAnomalies > 0) {
        qDebug() << "[TransferWorker] Job" << m_job.id << "had" << result.parseAnomalies << "malformed stats lines";
    }
    emit finished(result);
}

TransferWorker::StepOutcome TransferWorker::runInvocation(const RcloneInvocation &invocation,
                                                          ProgressAggregator &aggregator,
                                                          StatsBlockParser &parser,
                                                          JobResult &result)
{
    ProcessRunner runner;
    runner.setStderrTailFilter([](const QString &line) {
        return !StatsBlockParser::isProgressLine(line);
    });

    QString error;
    if (!runner.start(m_settings.rclonePath, invocation.arguments, QString(), &error)) {
        qWarning() << "[TransferWorker] Job" << m_job.id << ":" << error;
        fail(result, JobResult::ErrorKind::LaunchError, error);
        return StepOutcome::Failed;
    }
    qDebug() << "[TransferWorker] Job" << m_job.id << "running" << invocation.description
             << "pid" << runner.processId();

    OutputChunk chunk;
    for (;;) {
        if (m_cancellation->isCancelRequested()) {
            const JobResult::Termination termination = m_cancellation->terminate(runner);
            if (termination != JobResult::Termination::Exited) {
                return StepOutcome::Cancelled;
            }
            // The process was already gone; its exit status decides.
        }

        const ProcessRunner::ReadStatus status = runner.readChunk(&chunk, m_settings.pollIntervalMs);
        if (status == ProcessRunner::ReadStatus::EndOfStream) {
            break;
        }
        if (status == ProcessRunner::ReadStatus::Data) {
            if (invocation.reportsStats) {
                applyRecords(parser.parse(chunk), aggregator);
            }
            continue;
        }
        if (!invocation.reportsStats) {
            GlobalProgress progress = aggregator.snapshot().global;
            progress.elapsedMs = m_timer.elapsed();
            aggregator.applyGlobal(progress);
            m_handoff->publish(aggregator.snapshot());
        }
    }

    if (invocation.reportsStats) {
        applyRecords(parser.finish(), aggregator);
        aggregator.endOfStream();
        m_handoff->publish(aggregator.snapshot());
    }

    const ExitStatus exit = runner.exitStatus();
    if (exit.success) {
        return StepOutcome::Completed;
    }

    QString message;
    if (!exit.stderrTail.isEmpty()) {
        message = exit.stderrTail.mid(qMax(0, exit.stderrTail.size() - WorkerConstants::maxErrorLines))
            .join(QLatin1Char('\n'));
    } else if (exit.crashed) {
        message = tr("rclone crashed");
    } else {
        message = tr("rclone exited with code %1").arg(exit.code);
    }
    fail(result, JobResult::ErrorKind::ProcessFailure, message);
    result.exitCode = exit.code;
    qWarning() << "[TransferWorker] Job" << m_job.id << invocation.description << "failed with code" << exit.code;
    return StepOutcome::Failed;
}

void TransferWorker::applyRecords(const QList<StatsRecord> &records, ProgressAggregator &aggregator)
{
    if (records.isEmpty()) {
        return;
    }
    for (const StatsRecord &record : records) {
        aggregator.apply(record);
    }
    m_handoff->publish(aggregator.snapshot());
}

// Steps without stats report progress as items completed.
void TransferWorker::publishStepProgress(ProgressAggregator &aggregator, int completed, int total)
{
    GlobalProgress progress;
    progress.filesCompleted = completed;
    progress.filesTotal = total;
    progress.percent = total > 0 ? completed * 100 / total : -1;
    progress.elapsedMs = m_timer.elapsed();
    aggregator.applyGlobal(progress);
    m_handoff->publish(aggregator.snapshot());
}

/**
 * @brief Looks for partial files the aborted transfer left behind.
 *
 * Directory items are scanned recursively under their own destination
 * folder. File items are looked up directly in the destination.
 */
void TransferWorker::scanForPartialFiles(JobResult &result) const
{
    if (result.termination != JobResult::Termination::UserCancelled
        && result.termination != JobResult::Termination::ForceKilled) {
        return;
    }

    PartialFileScanner scanner(m_lister, m_settings.partialSuffix);
    QStringList fileNames;
    QStringList scanErrors;
    for (const TransferItem &item : m_job.items) {
        if (!item.isDir) {
            fileNames.append(item.name);
            continue;
        }
        QString error;
        result.cleanup.candidates.append(
            scanner.scan(PlatformUtils::joinPath(m_job.destination, item.name), true, QStringList(), &error));
        if (!error.isEmpty()) {
            scanErrors.append(error);
        }
    }
    if (!fileNames.isEmpty()) {
        QString error;
        result.cleanup.candidates.append(scanner.scan(m_job.destination, false, fileNames, &error));
        if (!error.isEmpty()) {
            scanErrors.append(error);
        }
    }

    result.cleanup.scanError = scanErrors.join(QLatin1Char('\n'));
    result.cleanup.decision = result.cleanup.candidates.isEmpty()
        ? CleanupReport::Decision::NotNeeded
        : CleanupReport::Decision::Pending;
    qInfo() << "[TransferWorker] Job" << m_job.id << "left" << result.cleanup.candidates.size() << "partial files";
}

void TransferWorker::fail(JobResult &result, JobResult::ErrorKind kind, const QString &message) const
{
    result.outcome = JobResult::Outcome::Failed;
    result.errorKind = kind;
    result.errorText = message;
}
