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

#include "SnapshotHandoff.h"

#include <QMutexLocker>

/**
 * @brief Publishes a new snapshot to the reader.
 *
 * The writer publishes a new value; readers take a shared reference to the
 * latest one. Nothing is mutated in place, the lock only guards the swap.
 */
void SnapshotHandoff::publish(const Snapshot &snapshot)
{
    QSharedPointer<const Snapshot> next = QSharedPointer<const Snapshot>::create(snapshot);
    QMutexLocker locker(&m_mutex);
    m_latest.swap(next);
    m_generation += 1;
}

/**
 * @brief Returns the most recent snapshot, or null before the first publish.
 * @param generation Optional output receiving the publish count of that snapshot.
 */
QSharedPointer<const Snapshot> SnapshotHandoff::latest(quint64 *generation) const
{
    QMutexLocker locker(&m_mutex);
    if (generation) {
        *generation = m_generation;
    }
    return m_latest;
}

quint64 SnapshotHandoff::generation() const
{
    QMutexLocker locker(&m_mutex);
    return m_generation;
}
