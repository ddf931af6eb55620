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
 * @file test_rclone_command.cpp
 * @brief Unit tests for rclone command planning
 */

#include "RcloneCommand.h"
#include "TestHarness.h"

#include <QCoreApplication>
#include <QTemporaryDir>
#include <QFile>

static TransferSettings plainSettings()
{
    TransferSettings settings;
    settings.rcloneConfig.clear();
    return settings;
}

static TransferJob makeJob(TransferJob::Kind kind, const QList<TransferItem> &items)
{
    TransferJob job;
    job.id = 1;
    job.kind = kind;
    job.sourceRoot = QStringLiteral("/src");
    job.destination = QStringLiteral("remote:dst");
    job.items = items;
    return job;
}

static QStringList statsPrefix()
{
    return QStringList{
        QStringLiteral("--stats"), QStringLiteral("1s"),
        QStringLiteral("--transfers"), QStringLiteral("6"),
        QStringLiteral("--stats-file-name-length"), QStringLiteral("0"),
        QStringLiteral("--log-level"), QStringLiteral("INFO")
    };
}

TEST(copy_single_file)
{
    const TransferJob job = makeJob(TransferJob::Kind::Copy, {TransferItem{QStringLiteral("a.txt"), false}});
    QList<RcloneInvocation> invocations;
    QString error;
    ASSERT(!RcloneCommand::needsFilterFile(job));
    ASSERT(RcloneCommand::plan(job, plainSettings(), QString(), &invocations, &error));
    ASSERT_EQ(invocations.size(), 1);
    ASSERT(invocations.first().reportsStats);
    ASSERT_EQ(invocations.first().arguments,
              (statsPrefix() + QStringList{QStringLiteral("copy"), QStringLiteral("/src/a.txt"), QStringLiteral("remote:dst")}));
}

TEST(copy_single_directory)
{
    const TransferJob job = makeJob(TransferJob::Kind::Copy, {TransferItem{QStringLiteral("photos"), true}});
    QList<RcloneInvocation> invocations;
    ASSERT(RcloneCommand::plan(job, plainSettings(), QString(), &invocations, nullptr));
    ASSERT_EQ(invocations.first().arguments,
              (statsPrefix() + QStringList{QStringLiteral("copy"), QStringLiteral("/src/photos"), QStringLiteral("remote:dst/photos")}));
}

TEST(move_directory_deletes_empty_source_dirs)
{
    const TransferJob job = makeJob(TransferJob::Kind::Move, {TransferItem{QStringLiteral("photos"), true}});
    QList<RcloneInvocation> invocations;
    ASSERT(RcloneCommand::plan(job, plainSettings(), QString(), &invocations, nullptr));
    const QStringList arguments = invocations.first().arguments;
    ASSERT(arguments.contains(QStringLiteral("move")));
    ASSERT_STR_EQ(arguments.last(), QStringLiteral("--delete-empty-src-dirs"));
}

TEST(several_items_use_filter_file)
{
    const TransferJob job = makeJob(TransferJob::Kind::Copy,
                                    {TransferItem{QStringLiteral("a.txt"), false},
                                     TransferItem{QStringLiteral("docs"), true}});
    ASSERT(RcloneCommand::needsFilterFile(job));

    QList<RcloneInvocation> invocations;
    QString error;
    ASSERT(!RcloneCommand::plan(job, plainSettings(), QString(), &invocations, &error));
    ASSERT(!error.isEmpty());

    ASSERT(RcloneCommand::plan(job, plainSettings(), QStringLiteral("/tmp/filter.txt"), &invocations, &error));
    ASSERT_EQ(invocations.size(), 1);
    ASSERT_EQ(invocations.first().arguments,
              (statsPrefix() + QStringList{QStringLiteral("copy"), QStringLiteral("/src"), QStringLiteral("remote:dst"),
                                           QStringLiteral("--filter-from"), QStringLiteral("/tmp/filter.txt")}));

    const QStringList rules = RcloneCommand::filterRules(job.items);
    ASSERT_EQ(rules, (QStringList{QStringLiteral("+ /a.txt"), QStringLiteral("+ /docs/**"), QStringLiteral("- **")}));
}

TEST(filter_patterns_are_escaped)
{
    ASSERT_STR_EQ(RcloneCommand::escapeFilterPattern(QStringLiteral("a*b?[c]{d}\\e")),
                  QStringLiteral("a\\*b\\?\\[c\\]\\{d\\}\\\\e"));
    ASSERT_STR_EQ(RcloneCommand::escapeFilterPattern(QStringLiteral("plain name.txt")), QStringLiteral("plain name.txt"));
}

TEST(delete_runs_one_step_per_item)
{
    const TransferJob job = makeJob(TransferJob::Kind::Delete,
                                    {TransferItem{QStringLiteral("a.txt"), false},
                                     TransferItem{QStringLiteral("old"), true}});
    QList<RcloneInvocation> invocations;
    ASSERT(RcloneCommand::plan(job, plainSettings(), QString(), &invocations, nullptr));
    ASSERT_EQ(invocations.size(), 2);
    ASSERT(!invocations.at(0).reportsStats);
    ASSERT_EQ(invocations.at(0).arguments, (QStringList{QStringLiteral("deletefile"), QStringLiteral("/src/a.txt")}));
    ASSERT_EQ(invocations.at(1).arguments, (QStringList{QStringLiteral("purge"), QStringLiteral("/src/old")}));
}

TEST(mkdir_with_and_without_name)
{
    TransferJob job = makeJob(TransferJob::Kind::MakeDirectory, {TransferItem{QStringLiteral("new"), true}});
    QList<RcloneInvocation> invocations;
    ASSERT(RcloneCommand::plan(job, plainSettings(), QString(), &invocations, nullptr));
    ASSERT_EQ(invocations.first().arguments, (QStringList{QStringLiteral("mkdir"), QStringLiteral("remote:dst/new")}));

    job.items.clear();
    ASSERT(RcloneCommand::plan(job, plainSettings(), QString(), &invocations, nullptr));
    ASSERT_EQ(invocations.size(), 1);
    ASSERT_EQ(invocations.first().arguments, (QStringList{QStringLiteral("mkdir"), QStringLiteral("remote:dst")}));
}

TEST(empty_items_are_rejected)
{
    for (TransferJob::Kind kind : {TransferJob::Kind::Copy, TransferJob::Kind::Move, TransferJob::Kind::Delete}) {
        const TransferJob job = makeJob(kind, {});
        QList<RcloneInvocation> invocations;
        QString error;
        ASSERT(!RcloneCommand::plan(job, plainSettings(), QString(), &invocations, &error));
        ASSERT(!error.isEmpty());
        ASSERT(invocations.isEmpty());
    }
}

TEST(common_prefix_order)
{
    QTemporaryDir dir;
    ASSERT(dir.isValid());
    const QString config = dir.filePath(QStringLiteral("rclone.conf"));
    QFile file(config);
    ASSERT(file.open(QIODevice::WriteOnly));
    file.close();

    TransferSettings settings = plainSettings();
    settings.rcloneConfig = config;
    settings.extraFlags = QStringList{QStringLiteral("--fast-list")};
    TransferJob job = makeJob(TransferJob::Kind::Delete, {TransferItem{QStringLiteral("a.txt"), false}});
    job.extraFlags = QStringList{QStringLiteral("--dry-run")};

    QList<RcloneInvocation> invocations;
    ASSERT(RcloneCommand::plan(job, settings, QString(), &invocations, nullptr));
    ASSERT_EQ(invocations.first().arguments,
              (QStringList{QStringLiteral("--config"), config, QStringLiteral("--fast-list"), QStringLiteral("--dry-run"),
                           QStringLiteral("deletefile"), QStringLiteral("/src/a.txt")}));

    settings.rcloneConfig = dir.filePath(QStringLiteral("missing.conf"));
    ASSERT(!settings.baseArguments().contains(QStringLiteral("--config")));
}

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    printf("RcloneCommand tests\n");

    RUN_TEST(copy_single_file);
    RUN_TEST(copy_single_directory);
    RUN_TEST(move_directory_deletes_empty_source_dirs);
    RUN_TEST(several_items_use_filter_file);
    RUN_TEST(filter_patterns_are_escaped);
    RUN_TEST(delete_runs_one_step_per_item);
    RUN_TEST(mkdir_with_and_without_name);
    RUN_TEST(empty_items_are_rejected);
    RUN_TEST(common_prefix_order);

    return report_results();
}
