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

#include "TransferManager.h"

#include <QDebug>
#include <QMetaObject>

#include <utility>

/**
 * @brief Creates a manager that runs each submitted request as an independent job.
 *
 * Handles are owned by the manager. A finished handle leaves the active list
 * but stays valid until the caller deletes it or the manager goes away.
 */
TransferManager::TransferManager(const TransferSettings &settings, QObject *parent)
    : QObject(parent)
    , m_settings(settings)
{
    TransferTypes::registerMetaTypes();
}

/**
 * @brief Cancels every running job; the handles join their threads as they are destroyed.
 */
TransferManager::~TransferManager()
{
    const int cancelled = cancelAll();
    if (cancelled > 0) {
        qInfo() << "[TransferManager] Cancelled" << cancelled << "jobs on shutdown";
    }
    const QList<JobHandle *> handles = findChildren<JobHandle *>(QString(), Qt::FindDirectChildrenOnly);
    for (JobHandle *handle : handles) {
        delete handle;
    }
}

/**
 * @brief Accepts a job and starts it on the next event loop iteration.
 *
 * Starting asynchronously lets the caller subscribe before the first update.
 * @param job Job description; an id is assigned when it has none.
 * @return Handle for the job, owned by the manager.
 */
JobHandle *TransferManager::submit(TransferJob job)
{
    if (job.id == 0 || m_active.contains(job.id)) {
        job.id = m_nextId;
    }
    m_nextId = qMax(m_nextId, job.id) + 1;

    auto *handle = new JobHandle(job, m_settings, this);
    m_active.insert(job.id, handle);
    connect(handle, &JobHandle::finished, this, [this, handle](const JobResult &result) {
        m_active.remove(handle->id());
        emit jobFinished(handle, result);
    });
    const quint64 id = job.id;
    connect(handle, &QObject::destroyed, this, [this, id]() {
        m_active.remove(id);
    });

    qInfo() << "[TransferManager] Submitted job" << job.id << TransferTypes::kindName(job.kind);
    emit jobSubmitted(handle);
    QMetaObject::invokeMethod(handle, &JobHandle::start, Qt::QueuedConnection);
    return handle;
}

QList<JobHandle *> TransferManager::activeJobs() const
{
    return m_active.values();
}

JobHandle *TransferManager::job(quint64 id) const
{
    return m_active.value(id, nullptr);
}

/**
 * @brief Requests cancellation of every active job.
 * @return Number of jobs that accepted the request.
 */
int TransferManager::cancelAll()
{
    int accepted = 0;
    for (JobHandle *handle : std::as_const(m_active)) {
        if (handle->cancel()) {
            accepted += 1;
        }
    }
    return accepted;
}

TransferSettings TransferManager::settings() const
{
    return m_settings;
}
