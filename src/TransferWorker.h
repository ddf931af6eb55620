#pragma once

#include <QElapsedTimer>
#include <QObject>
#include <QString>

#include <memory>

#include "AppSettings.h"
#include "CancellationController.h"
#include "DirectoryLister.h"
#include "ProgressAggregator.h"
#include "RcloneCommand.h"
#include "SnapshotHandoff.h"
#include "StatsBlockParser.h"
#include "TransferTypes.h"

class TransferWorker : public QObject
{
    Q_OBJECT

public:
    TransferWorker(const TransferJob &job,
                   const TransferSettings &settings,
                   std::shared_ptr<CancellationController> cancellation,
                   std::shared_ptr<SnapshotHandoff> handoff,
                   std::shared_ptr<const DirectoryLister> lister,
                   QObject *parent = nullptr);

public slots:
    void start();

signals:
    void finished(JobResult result);

private:
    enum class StepOutcome {
        Completed,
        Failed,
        Cancelled
    };

    StepOutcome runInvocation(const RcloneInvocation &invocation,
                              ProgressAggregator &aggregator,
                              StatsBlockParser &parser,
                              JobResult &result);
    void applyRecords(const QList<StatsRecord> &records, ProgressAggregator &aggregator);
    void publishStepProgress(ProgressAggregator &aggregator, int completed, int total);
    void scanForPartialFiles(JobResult &result) const;
    void fail(JobResult &result, JobResult::ErrorKind kind, const QString &message) const;

    TransferJob m_job;
    TransferSettings m_settings;
    std::shared_ptr<CancellationController> m_cancellation;
    std::shared_ptr<SnapshotHandoff> m_handoff;
    std::shared_ptr<const DirectoryLister> m_lister;
    QElapsedTimer m_timer;
    QString m_filterFilePath;
};
