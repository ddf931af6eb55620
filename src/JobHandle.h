#pragma once

#include <QList>
#include <QMetaObject>
#include <QObject>
#include <QPointer>
#include <QSharedPointer>
#include <QThread>
#include <QTimer>

#include <functional>
#include <memory>

#include "AppSettings.h"
#include "CancellationController.h"
#include "DirectoryLister.h"
#include "SnapshotHandoff.h"
#include "TransferTypes.h"

class TransferWorker;

class JobHandle : public QObject
{
    Q_OBJECT

public:
    enum class State {
        Pending,
        Running,
        AwaitingCleanupDecision,
        Cleaning,
        Finished
    };
    Q_ENUM(State)

    using SnapshotCallback = std::function<void(const Snapshot &)>;

    JobHandle(const TransferJob &job, const TransferSettings &settings, QObject *parent = nullptr);
    ~JobHandle() override;

    quint64 id() const;
    TransferJob job() const;
    State state() const;
    bool isFinished() const;

    QMetaObject::Connection subscribe(QObject *context, const SnapshotCallback &callback);
    QSharedPointer<const Snapshot> latestSnapshot() const;
    JobResult result() const;

    bool cancel();
    void confirmCleanup(bool removeFiles);

public slots:
    void start();

signals:
    void snapshotUpdated(const Snapshot &snapshot);
    void cleanupConfirmationRequested(const QList<PartialFileCandidate> &candidates);
    void stateChanged(JobHandle::State state);
    void finished(const JobResult &result);

private slots:
    void pollSnapshot();
    void handleWorkerFinished(const JobResult &result);

private:
    void runCleanup();
    void finish();
    void setState(State state);

    TransferJob m_job;
    TransferSettings m_settings;
    std::shared_ptr<CancellationController> m_cancellation;
    std::shared_ptr<SnapshotHandoff> m_handoff;
    std::shared_ptr<const DirectoryLister> m_lister;
    QPointer<QThread> m_thread;
    QTimer m_snapshotTimer;
    quint64 m_lastGeneration = 0;
    JobResult m_result;
    State m_state = State::Pending;
};
