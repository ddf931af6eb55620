#pragma once

#include <QHash>
#include <QList>
#include <QString>
#include <QVector>

#include "StatsBlockParser.h"
#include "TransferTypes.h"

class ProgressAggregator
{
public:
    explicit ProgressAggregator(int capacity = 6);

    void apply(const StatsRecord &record);
    void applyGlobal(const GlobalProgress &progress);
    void endOfStream();

    Snapshot snapshot() const;

    int capacity() const;
    int occupiedSlots() const;
    int queuedFiles() const;

private:
    struct SlotEntry {
        bool occupied = false;
        int lastSeenBlock = 0;
        FileSlot slot;
    };

    struct QueuedFile {
        FileStatsRecord record;
        int lastSeenBlock = 0;
    };

    void applyFile(const FileStatsRecord &record);
    void sweep();
    void mergeGlobal(const GlobalProgress &progress);
    void release(int index);
    void admitQueued();
    int takeFreeSlot();
    void fillSlot(SlotEntry &entry, const FileStatsRecord &record) const;

    int m_capacity = 0;
    QVector<SlotEntry> m_slots;
    QList<int> m_freeSlots;
    QHash<QString, int> m_slotByName;
    QList<QueuedFile> m_queue;
    GlobalProgress m_global;
    int m_block = 0;
    bool m_blockOpen = false;
    quint64 m_sequence = 0;
};
