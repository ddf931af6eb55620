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
 * @file test_process_runner.cpp
 * @brief Unit tests for ProcessRunner and CancellationController
 */

#include "CancellationController.h"
#include "ProcessRunner.h"
#include "StatsBlockParser.h"
#include "TestHarness.h"

#include <QCoreApplication>
#include <QElapsedTimer>

static const QString shell = QStringLiteral("/bin/sh");

static QStringList script(const QString &body)
{
    return QStringList{QStringLiteral("-c"), body};
}

// Reads until end of stream, sorting output by origin.
static void drain(ProcessRunner &runner, QByteArray *out, QByteArray *err, int limitMs = 10000)
{
    QElapsedTimer timer;
    timer.start();
    OutputChunk chunk;
    while (timer.elapsed() < limitMs) {
        const ProcessRunner::ReadStatus status = runner.readChunk(&chunk, 100);
        if (status == ProcessRunner::ReadStatus::EndOfStream) {
            return;
        }
        if (status != ProcessRunner::ReadStatus::Data) {
            continue;
        }
        if (chunk.origin == OutputChunk::Origin::StandardOutput) {
            out->append(chunk.data);
        } else {
            err->append(chunk.data);
        }
    }
    throw std::runtime_error("process did not finish in time");
}

TEST(launch_error_for_missing_executable)
{
    ProcessRunner runner;
    QString error;
    ASSERT(!runner.start(QStringLiteral("/nonexistent/ferryman-no-such-tool"), QStringList(), QString(), &error));
    ASSERT(!error.isEmpty());
    ASSERT(error.contains(QStringLiteral("ferryman-no-such-tool")));
    OutputChunk chunk;
    ASSERT(runner.readChunk(&chunk, 10) == ProcessRunner::ReadStatus::EndOfStream);
    ASSERT(!runner.exitStatus().success);
}

TEST(output_is_tagged_by_origin)
{
    ProcessRunner runner;
    QString error;
    ASSERT(runner.start(shell, script(QStringLiteral("echo to-out; echo to-err 1>&2")), QString(), &error));
    QByteArray out;
    QByteArray err;
    drain(runner, &out, &err);
    ASSERT_EQ(out, QByteArray("to-out\n"));
    ASSERT_EQ(err, QByteArray("to-err\n"));
    const ExitStatus status = runner.exitStatus();
    ASSERT(status.success);
    ASSERT_EQ(status.code, 0);
    ASSERT(!status.crashed);
}

TEST(end_of_stream_is_final)
{
    ProcessRunner runner;
    QString error;
    ASSERT(runner.start(shell, script(QStringLiteral("true")), QString(), &error));
    QByteArray out;
    QByteArray err;
    drain(runner, &out, &err);
    OutputChunk chunk;
    ASSERT(runner.readChunk(&chunk, 10) == ProcessRunner::ReadStatus::EndOfStream);
    ASSERT(!runner.start(shell, script(QStringLiteral("true")), QString(), &error));
}

TEST(nonzero_exit_keeps_stderr_tail)
{
    ProcessRunner runner;
    runner.setStderrTailLimit(2);
    runner.setStderrTailFilter([](const QString &line) {
        return !StatsBlockParser::isProgressLine(line);
    });
    QString error;
    ASSERT(runner.start(shell,
                        script(QStringLiteral(
                            "echo 'first problem' 1>&2; "
                            "echo 'Transferred: 1 / 2, 50%' 1>&2; "
                            "echo 'second problem' 1>&2; "
                            "printf 'third problem' 1>&2; "
                            "exit 3")),
                        QString(), &error));
    QByteArray out;
    QByteArray err;
    drain(runner, &out, &err);
    const ExitStatus status = runner.exitStatus();
    ASSERT(!status.success);
    ASSERT_EQ(status.code, 3);
    ASSERT_EQ(status.stderrTail.size(), 2);
    ASSERT_STR_EQ(status.stderrTail.at(0), QStringLiteral("second problem"));
    ASSERT_STR_EQ(status.stderrTail.at(1), QStringLiteral("third problem"));
}

TEST(graceful_terminate)
{
    ProcessRunner runner;
    QString error;
    ASSERT(runner.start(shell, script(QStringLiteral("exec sleep 30")), QString(), &error));
    QElapsedTimer timer;
    timer.start();
    ASSERT(runner.terminate(5000, 1000) == ProcessRunner::TerminationOutcome::Graceful);
    ASSERT_LE(timer.elapsed(), Q_INT64_C(5000));
    ASSERT(!runner.isRunning());
    ASSERT(runner.terminate(5000, 1000) == ProcessRunner::TerminationOutcome::AlreadyExited);
}

TEST(force_kill_after_timeout)
{
    ProcessRunner runner;
    QString error;
    ASSERT(runner.start(shell,
                        script(QStringLiteral("trap '' TERM; echo ready; while true; do sleep 0.1; done")),
                        QString(), &error));
    // Wait until the trap is installed.
    OutputChunk chunk;
    QElapsedTimer ready;
    ready.start();
    while (ready.elapsed() < 5000) {
        if (runner.readChunk(&chunk, 100) == ProcessRunner::ReadStatus::Data
            && chunk.origin == OutputChunk::Origin::StandardOutput) {
            break;
        }
    }

    const int timeoutMs = 500;
    const int killWaitMs = 1000;
    QElapsedTimer timer;
    timer.start();
    ASSERT(runner.terminate(timeoutMs, killWaitMs) == ProcessRunner::TerminationOutcome::ForceKilled);
    ASSERT_LE(timer.elapsed(), qint64(timeoutMs + killWaitMs + 500));
    ASSERT(!runner.isRunning());
    ASSERT(runner.exitStatus().crashed);
}

TEST(cancel_state_machine)
{
    CancellationController controller(7, 2000, 1000);
    ASSERT(controller.state() == CancellationController::State::Running);
    ASSERT(!controller.requestedAt().isValid());
    ASSERT(controller.requestCancel());
    ASSERT(controller.isCancelRequested());
    ASSERT(controller.requestedAt().isValid());
    ASSERT(!controller.requestCancel());

    ProcessRunner runner;
    QString error;
    ASSERT(runner.start(shell, script(QStringLiteral("exec sleep 30")), QString(), &error));
    ASSERT(controller.terminate(runner) == JobResult::Termination::UserCancelled);
    ASSERT(controller.state() == CancellationController::State::Terminated);
    ASSERT(controller.reason() == JobResult::Termination::UserCancelled);
    ASSERT(!controller.requestCancel());
}

TEST(cancel_after_exit_is_noop)
{
    CancellationController controller(8, 2000, 1000);
    controller.markExited();
    ASSERT(controller.state() == CancellationController::State::Terminated);
    ASSERT(!controller.requestCancel());
    ASSERT(controller.reason() == JobResult::Termination::Exited);
}

TEST(cancel_race_with_exit)
{
    CancellationController controller(9, 2000, 1000);
    ProcessRunner runner;
    QString error;
    ASSERT(runner.start(shell, script(QStringLiteral("true")), QString(), &error));
    QByteArray out;
    QByteArray err;
    drain(runner, &out, &err);
    ASSERT(controller.requestCancel());
    ASSERT(controller.terminate(runner) == JobResult::Termination::Exited);
    ASSERT(controller.state() == CancellationController::State::Terminated);
}

TEST(cancel_before_launch)
{
    CancellationController controller(10, 2000, 1000);
    ASSERT(controller.requestCancel());
    controller.finishWithoutProcess();
    ASSERT(controller.state() == CancellationController::State::Terminated);
    ASSERT(controller.reason() == JobResult::Termination::UserCancelled);
}

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    printf("ProcessRunner tests\n");

    RUN_TEST(launch_error_for_missing_executable);
    RUN_TEST(output_is_tagged_by_origin);
    RUN_TEST(end_of_stream_is_final);
    RUN_TEST(nonzero_exit_keeps_stderr_tail);
    RUN_TEST(graceful_terminate);
    RUN_TEST(force_kill_after_timeout);
    RUN_TEST(cancel_state_machine);
    RUN_TEST(cancel_after_exit_is_noop);
    RUN_TEST(cancel_race_with_exit);
    RUN_TEST(cancel_before_launch);

    return report_results();
}
