#pragma once

#include <QMutex>
#include <QSharedPointer>

#include "TransferTypes.h"

class SnapshotHandoff
{
public:
    void publish(const Snapshot &snapshot);
    QSharedPointer<const Snapshot> latest(quint64 *generation = nullptr) const;
    quint64 generation() const;

private:
    mutable QMutex m_mutex;
    QSharedPointer<const Snapshot> m_latest;
    quint64 m_generation = 0;
};
