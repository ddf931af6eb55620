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

/**
 * @file test_progress_aggregator.cpp
 * @brief Unit tests for ProgressAggregator
 */

#include "ProgressAggregator.h"
#include "TestHarness.h"

#include <QCoreApplication>

static StatsRecord blockStart(qint64 elapsedMs, int filesCompleted = 0)
{
    StatsRecord record;
    record.kind = StatsRecord::Kind::Global;
    record.global.startsBlock = true;
    record.global.progress.elapsedMs = elapsedMs;
    record.global.progress.filesCompleted = filesCompleted;
    return record;
}

static StatsRecord fileRecord(const QString &name, int percent = 10)
{
    StatsRecord record;
    record.kind = StatsRecord::Kind::File;
    record.file.fileName = name;
    record.file.percent = percent;
    record.file.bytesTotal = 1000;
    record.file.bytesDone = 10 * percent;
    return record;
}

static int slotIndexOf(const Snapshot &snapshot, const QString &name)
{
    for (const FileSlot &slot : snapshot.slots) {
        if (slot.fileName == name) {
            return slot.slotIndex;
        }
    }
    return -1;
}

static const FileSlot *slotFor(const Snapshot &snapshot, const QString &name)
{
    for (const FileSlot &slot : snapshot.slots) {
        if (slot.fileName == name) {
            return &slot;
        }
    }
    return nullptr;
}

TEST(global_follows_latest_record)
{
    ProgressAggregator aggregator(4);
    qint64 elapsed = 0;
    for (int i = 0; i < 10; ++i) {
        elapsed += 700;
        StatsRecord record = blockStart(elapsed, i);
        record.global.startsBlock = (i % 2) == 0;
        aggregator.apply(record);
        ASSERT_EQ(aggregator.snapshot().global.elapsedMs, elapsed);
        ASSERT_EQ(aggregator.snapshot().global.filesCompleted, i);
    }
}

TEST(lowest_free_slot_first)
{
    ProgressAggregator aggregator(3);
    aggregator.apply(blockStart(1000));
    aggregator.apply(fileRecord(QStringLiteral("a")));
    aggregator.apply(fileRecord(QStringLiteral("b")));
    aggregator.apply(fileRecord(QStringLiteral("c")));
    const Snapshot snapshot = aggregator.snapshot();
    ASSERT_EQ(snapshot.slots.size(), 3);
    ASSERT_EQ(slotIndexOf(snapshot, QStringLiteral("a")), 0);
    ASSERT_EQ(slotIndexOf(snapshot, QStringLiteral("b")), 1);
    ASSERT_EQ(slotIndexOf(snapshot, QStringLiteral("c")), 2);
    for (int i = 0; i < snapshot.slots.size(); ++i) {
        ASSERT_EQ(snapshot.slots.at(i).slotIndex, i);
    }
}

TEST(slot_index_stable_while_active)
{
    ProgressAggregator aggregator(2);
    aggregator.apply(blockStart(1000));
    aggregator.apply(fileRecord(QStringLiteral("a"), 10));
    aggregator.apply(fileRecord(QStringLiteral("b"), 10));
    for (int block = 2; block < 6; ++block) {
        aggregator.apply(blockStart(block * 1000));
        aggregator.apply(fileRecord(QStringLiteral("b"), block * 10));
        aggregator.apply(fileRecord(QStringLiteral("a"), block * 10));
        const Snapshot snapshot = aggregator.snapshot();
        ASSERT_EQ(slotIndexOf(snapshot, QStringLiteral("a")), 0);
        ASSERT_EQ(slotIndexOf(snapshot, QStringLiteral("b")), 1);
        ASSERT_EQ(slotFor(snapshot, QStringLiteral("a"))->percent, block * 10);
    }
}

TEST(finished_file_gets_one_grace_block)
{
    ProgressAggregator aggregator(2);
    aggregator.apply(blockStart(1000));
    aggregator.apply(fileRecord(QStringLiteral("a")));
    aggregator.apply(fileRecord(QStringLiteral("b")));

    // "a" is gone from the second block.
    aggregator.apply(blockStart(2000));
    aggregator.apply(fileRecord(QStringLiteral("b")));
    aggregator.apply(blockStart(3000));
    Snapshot snapshot = aggregator.snapshot();
    ASSERT_EQ(snapshot.slots.size(), 2);
    ASSERT(slotFor(snapshot, QStringLiteral("a"))->state == FileSlot::State::Completing);
    ASSERT(slotFor(snapshot, QStringLiteral("b"))->state == FileSlot::State::Active);

    aggregator.apply(fileRecord(QStringLiteral("b")));
    aggregator.apply(blockStart(4000));
    snapshot = aggregator.snapshot();
    ASSERT_EQ(snapshot.slots.size(), 1);
    ASSERT_EQ(slotIndexOf(snapshot, QStringLiteral("a")), -1);
    ASSERT_EQ(aggregator.occupiedSlots(), 1);
}

TEST(completing_slot_reactivates)
{
    ProgressAggregator aggregator(1);
    aggregator.apply(blockStart(1000));
    aggregator.apply(fileRecord(QStringLiteral("a"), 40));
    aggregator.apply(blockStart(2000));
    aggregator.apply(blockStart(3000));
    ASSERT(aggregator.snapshot().slots.first().state == FileSlot::State::Completing);
    aggregator.apply(fileRecord(QStringLiteral("a"), 60));
    const Snapshot snapshot = aggregator.snapshot();
    ASSERT_EQ(snapshot.slots.size(), 1);
    ASSERT(snapshot.slots.first().state == FileSlot::State::Active);
    ASSERT_EQ(snapshot.slots.first().slotIndex, 0);
    ASSERT_EQ(snapshot.slots.first().percent, 60);
}

TEST(overflow_file_waits_for_a_slot)
{
    const int capacity = 3;
    ProgressAggregator aggregator(capacity);
    aggregator.apply(blockStart(1000));
    for (int i = 0; i <= capacity; ++i) {
        aggregator.apply(fileRecord(QStringLiteral("file%1").arg(i)));
        ASSERT_LE(aggregator.occupiedSlots(), capacity);
    }
    Snapshot snapshot = aggregator.snapshot();
    ASSERT_EQ(snapshot.slots.size(), capacity);
    ASSERT_EQ(snapshot.queuedFiles, 1);
    ASSERT_EQ(slotIndexOf(snapshot, QStringLiteral("file3")), -1);

    // file1 stops being reported: it completes, then is released.
    aggregator.apply(blockStart(2000));
    aggregator.apply(fileRecord(QStringLiteral("file0")));
    aggregator.apply(fileRecord(QStringLiteral("file2")));
    aggregator.apply(fileRecord(QStringLiteral("file3"), 30));
    aggregator.apply(blockStart(3000));
    ASSERT_EQ(aggregator.queuedFiles(), 1);
    aggregator.apply(fileRecord(QStringLiteral("file0")));
    aggregator.apply(fileRecord(QStringLiteral("file2")));
    aggregator.apply(fileRecord(QStringLiteral("file3"), 40));
    aggregator.apply(blockStart(4000));

    snapshot = aggregator.snapshot();
    ASSERT_EQ(snapshot.queuedFiles, 0);
    ASSERT_EQ(snapshot.slots.size(), capacity);
    ASSERT_EQ(slotIndexOf(snapshot, QStringLiteral("file3")), 1);
    ASSERT_EQ(slotFor(snapshot, QStringLiteral("file3"))->percent, 40);
    ASSERT_EQ(slotIndexOf(snapshot, QStringLiteral("file1")), -1);
}

TEST(queued_file_finishing_before_a_slot_frees)
{
    ProgressAggregator aggregator(1);
    aggregator.apply(blockStart(1000));
    aggregator.apply(fileRecord(QStringLiteral("a")));
    aggregator.apply(fileRecord(QStringLiteral("b")));
    ASSERT_EQ(aggregator.queuedFiles(), 1);

    // b is gone from the next block while a still holds the only slot.
    aggregator.apply(blockStart(2000));
    aggregator.apply(fileRecord(QStringLiteral("a")));
    aggregator.apply(fileRecord(QStringLiteral("c")));
    ASSERT_EQ(aggregator.queuedFiles(), 2);

    aggregator.apply(blockStart(3000));
    ASSERT_EQ(aggregator.queuedFiles(), 1);
    aggregator.apply(fileRecord(QStringLiteral("c"), 30));
    aggregator.apply(blockStart(4000));
    aggregator.apply(fileRecord(QStringLiteral("c"), 40));
    ASSERT_EQ(slotIndexOf(aggregator.snapshot(), QStringLiteral("b")), -1);

    aggregator.apply(blockStart(5000));
    const Snapshot snapshot = aggregator.snapshot();
    ASSERT_EQ(snapshot.queuedFiles, 0);
    ASSERT_EQ(snapshot.slots.size(), 1);
    ASSERT_EQ(slotIndexOf(snapshot, QStringLiteral("c")), 0);
    ASSERT_EQ(slotFor(snapshot, QStringLiteral("c"))->percent, 40);
    ASSERT(slotFor(snapshot, QStringLiteral("c"))->state == FileSlot::State::Active);
}

TEST(elapsed_and_completed_never_decrease)
{
    ProgressAggregator aggregator(2);
    aggregator.apply(blockStart(5000, 3));
    StatsRecord stale = blockStart(4000, 2);
    stale.global.startsBlock = false;
    stale.global.progress.percent = 50;
    aggregator.apply(stale);
    ASSERT_EQ(aggregator.snapshot().global.elapsedMs, Q_INT64_C(5000));
    ASSERT_EQ(aggregator.snapshot().global.filesCompleted, 3);
    ASSERT_EQ(aggregator.snapshot().global.percent, 50);

    GlobalProgress progress;
    progress.elapsedMs = 100;
    progress.filesCompleted = 4;
    aggregator.applyGlobal(progress);
    ASSERT_EQ(aggregator.snapshot().global.elapsedMs, Q_INT64_C(5000));
    ASSERT_EQ(aggregator.snapshot().global.filesCompleted, 4);
}

TEST(end_of_stream_closes_last_block)
{
    ProgressAggregator aggregator(2);
    aggregator.apply(blockStart(1000));
    aggregator.apply(fileRecord(QStringLiteral("a")));
    aggregator.endOfStream();
    ASSERT(aggregator.snapshot().slots.first().state == FileSlot::State::Active);
    aggregator.endOfStream();
    ASSERT(aggregator.snapshot().slots.first().state == FileSlot::State::Active);

    aggregator.apply(blockStart(2000));
    aggregator.endOfStream();
    ASSERT(aggregator.snapshot().slots.first().state == FileSlot::State::Completing);
}

TEST(sequence_increases)
{
    ProgressAggregator aggregator;
    ASSERT_EQ(aggregator.capacity(), 6);
    const quint64 first = aggregator.snapshot().sequence;
    aggregator.apply(blockStart(1000));
    const quint64 second = aggregator.snapshot().sequence;
    GlobalProgress progress;
    progress.filesCompleted = 1;
    aggregator.applyGlobal(progress);
    ASSERT_GT(second, first);
    ASSERT_GT(aggregator.snapshot().sequence, second);
    ASSERT_EQ(aggregator.snapshot().global.filesCompleted, 1);
}

TEST(capacity_is_at_least_one)
{
    ProgressAggregator aggregator(0);
    ASSERT_EQ(aggregator.capacity(), 1);
    aggregator.apply(fileRecord(QStringLiteral("a")));
    aggregator.apply(fileRecord(QStringLiteral("b")));
    ASSERT_EQ(aggregator.occupiedSlots(), 1);
    ASSERT_EQ(aggregator.queuedFiles(), 1);
}

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    printf("ProgressAggregator tests\n");

    RUN_TEST(global_follows_latest_record);
    RUN_TEST(lowest_free_slot_first);
    RUN_TEST(slot_index_stable_while_active);
    RUN_TEST(finished_file_gets_one_grace_block);
    RUN_TEST(completing_slot_reactivates);
    RUN_TEST(overflow_file_waits_for_a_slot);
    RUN_TEST(queued_file_finishing_before_a_slot_frees);
    RUN_TEST(elapsed_and_completed_never_decrease);
    RUN_TEST(end_of_stream_closes_last_block);
    RUN_TEST(sequence_increases);
    RUN_TEST(capacity_is_at_least_one);

    return report_results();
}
