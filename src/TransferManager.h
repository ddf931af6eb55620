#pragma once

#include <QHash>
#include <QList>
#include <QObject>

#include "AppSettings.h"
#include "JobHandle.h"
#include "TransferTypes.h"

class TransferManager : public QObject
{
    Q_OBJECT

public:
    explicit TransferManager(const TransferSettings &settings, QObject *parent = nullptr);
    ~TransferManager() override;

    JobHandle *submit(TransferJob job);
    QList<JobHandle *> activeJobs() const;
    JobHandle *job(quint64 id) const;
    int cancelAll();

    TransferSettings settings() const;

signals:
    void jobSubmitted(JobHandle *handle);
    void jobFinished(JobHandle *handle, const JobResult &result);

private:
    TransferSettings m_settings;
    quint64 m_nextId = 1;
    QHash<quint64, JobHandle *> m_active;
};
