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

#include "ProgressAggregator.h"

#include <QDebug>

#include <algorithm>

namespace {
struct AggregatorConstants {
    static constexpr int minimumCapacity = 1;
    static constexpr int noSlot = -1;
};
} // namespace

/**
 * @brief Creates an aggregator with a fixed number of file slots.
 *
 * Owns a fixed arena of slots, one per concurrently transferring file. A file
 * keeps its slot index until it is released; released indices go back to a
 * sorted free list so the lowest free slot is always reused first. Files
 * reported while every slot is taken wait in a queue until one frees.
 * @param capacity Maximum number of files shown at once, normally the
 *        parallelism passed to the transfer tool.
 */
ProgressAggregator::ProgressAggregator(int capacity)
    : m_capacity(qMax(AggregatorConstants::minimumCapacity, capacity))
    , m_slots(m_capacity)
{
    for (int i = 0; i < m_capacity; ++i) {
        m_slots[i].slot.slotIndex = i;
        m_freeSlots.append(i);
    }
}

/**
 * @brief Applies one parsed record.
 *
 * A global record replaces the global progress wholesale, except that
 * elapsed time and completed files never go backwards. The record that
 * opens a new stats block first closes the previous block, which ages slots
 * whose file was not reported in it.
 * @param record Parsed stats record.
 */
void ProgressAggregator::apply(const StatsRecord &record)
{
    m_sequence += 1;
    if (record.kind == StatsRecord::Kind::File) {
        applyFile(record.file);
        return;
    }
    if (record.global.startsBlock) {
        if (m_blockOpen) {
            sweep();
        }
        m_blockOpen = true;
        m_block += 1;
    }
    mergeGlobal(record.global.progress);
}

/**
 * @brief Replaces global progress for operations that report no stats blocks.
 * @param progress New global progress.
 */
void ProgressAggregator::applyGlobal(const GlobalProgress &progress)
{
    m_sequence += 1;
    mergeGlobal(progress);
}

/**
 * @brief Closes the last block once the stream has ended.
 */
void ProgressAggregator::endOfStream()
{
    if (!m_blockOpen) {
        return;
    }
    m_sequence += 1;
    sweep();
    m_blockOpen = false;
}

Snapshot ProgressAggregator::snapshot() const
{
    Snapshot snapshot;
    snapshot.global = m_global;
    snapshot.queuedFiles = m_queue.size();
    snapshot.sequence = m_sequence;
    snapshot.slots.reserve(m_capacity);
    for (const SlotEntry &entry : m_slots) {
        if (entry.occupied) {
            snapshot.slots.append(entry.slot);
        }
    }
    return snapshot;
}

int ProgressAggregator::capacity() const
{
    return m_capacity;
}

int ProgressAggregator::occupiedSlots() const
{
    return m_capacity - m_freeSlots.size();
}

int ProgressAggregator::queuedFiles() const
{
    return m_queue.size();
}

void ProgressAggregator::applyFile(const FileStatsRecord &record)
{
    const auto existing = m_slotByName.constFind(record.fileName);
    if (existing != m_slotByName.constEnd()) {
        SlotEntry &entry = m_slots[existing.value()];
        fillSlot(entry, record);
        entry.slot.state = FileSlot::State::Active;
        entry.lastSeenBlock = m_block;
        return;
    }

    for (QueuedFile &queued : m_queue) {
        if (queued.record.fileName == record.fileName) {
            queued.record = record;
            queued.lastSeenBlock = m_block;
            return;
        }
    }

    const int index = takeFreeSlot();
    if (index == AggregatorConstants::noSlot) {
        qDebug() << "[ProgressAggregator] All" << m_capacity << "slots busy, queueing" << record.fileName;
        m_queue.append(QueuedFile{record, m_block});
        return;
    }

    SlotEntry &entry = m_slots[index];
    entry.occupied = true;
    entry.lastSeenBlock = m_block;
    fillSlot(entry, record);
    entry.slot.state = FileSlot::State::Active;
    m_slotByName.insert(record.fileName, index);
}

// Active slots missing from the block that just ended start their grace tick;
// completing slots still missing are released. Queued files missing from it
// finished while waiting and never get a slot.
void ProgressAggregator::sweep()
{
    for (int i = 0; i < m_slots.size(); ++i) {
        SlotEntry &entry = m_slots[i];
        if (!entry.occupied || entry.lastSeenBlock == m_block) {
            continue;
        }
        if (entry.slot.state == FileSlot::State::Active) {
            entry.slot.state = FileSlot::State::Completing;
            continue;
        }
        release(i);
    }

    for (auto it = m_queue.begin(); it != m_queue.end();) {
        if (it->lastSeenBlock == m_block) {
            ++it;
            continue;
        }
        qDebug() << "[ProgressAggregator] Dropping" << it->record.fileName << "which finished while queued";
        it = m_queue.erase(it);
    }
    admitQueued();
}

void ProgressAggregator::mergeGlobal(const GlobalProgress &progress)
{
    const qint64 elapsedMs = m_global.elapsedMs;
    const int filesCompleted = m_global.filesCompleted;
    m_global = progress;
    m_global.elapsedMs = qMax(elapsedMs, progress.elapsedMs);
    m_global.filesCompleted = qMax(filesCompleted, progress.filesCompleted);
}

void ProgressAggregator::release(int index)
{
    SlotEntry &entry = m_slots[index];
    m_slotByName.remove(entry.slot.fileName);
    entry = SlotEntry();
    entry.slot.slotIndex = index;

    const auto position = std::lower_bound(m_freeSlots.begin(), m_freeSlots.end(), index);
    m_freeSlots.insert(position, index);
}

void ProgressAggregator::admitQueued()
{
    while (!m_queue.isEmpty() && !m_freeSlots.isEmpty()) {
        const QueuedFile queued = m_queue.takeFirst();
        const int index = takeFreeSlot();
        SlotEntry &entry = m_slots[index];
        entry.occupied = true;
        entry.lastSeenBlock = queued.lastSeenBlock;
        fillSlot(entry, queued.record);
        entry.slot.state = FileSlot::State::Active;
        m_slotByName.insert(queued.record.fileName, index);
    }
}

int ProgressAggregator::takeFreeSlot()
{
    if (m_freeSlots.isEmpty()) {
        return AggregatorConstants::noSlot;
    }
    return m_freeSlots.takeFirst();
}

void ProgressAggregator::fillSlot(SlotEntry &entry, const FileStatsRecord &record) const
{
    entry.slot.fileName = record.fileName;
    entry.slot.bytesDone = record.bytesDone;
    entry.slot.bytesTotal = record.bytesTotal;
    entry.slot.percent = record.percent;
    entry.slot.speed = record.speed;
    entry.slot.etaMs = record.etaMs;
}
