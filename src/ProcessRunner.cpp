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

#include "ProcessRunner.h"

#include <QCoreApplication>
#include <QDebug>

namespace {
struct ProcessRunnerConstants {
    static constexpr int startTimeoutMs = 30000;
    static constexpr int destructorKillWaitMs = 1000;
    static constexpr int minimumTailLines = 1;
};
} // namespace

/**
 * @brief Creates a runner for one external process, read as tagged chunks.
 *
 * The runner is driven synchronously from a single worker thread: readChunk()
 * is the only call that blocks, and only for the requested wait. Standard
 * output and standard error stay on separate channels so each chunk can be
 * tagged with its origin.
 */
ProcessRunner::ProcessRunner()
{
    m_process.setProcessChannelMode(QProcess::SeparateChannels);
    // rclone writes its stats blocks to stderr, so waiting on that channel
    // wakes the reader as soon as a block arrives.
    m_process.setReadChannel(QProcess::StandardError);
}

ProcessRunner::~ProcessRunner()
{
    if (m_process.state() != QProcess::NotRunning) {
        qWarning() << "[ProcessRunner] Killing process" << m_process.processId() << "on teardown";
        m_process.kill();
        m_process.waitForFinished(ProcessRunnerConstants::destructorKillWaitMs);
    }
}

/**
 * @brief Launches the external program.
 * @param program Executable name or path.
 * @param arguments Program arguments.
 * @param workingDirectory Working directory, empty to inherit.
 * @param error Optional output carrying the OS-level launch failure.
 * @return True once the process is confirmed running.
 */
bool ProcessRunner::start(const QString &program,
                          const QStringList &arguments,
                          const QString &workingDirectory,
                          QString *error)
{
    if (m_started) {
        if (error) {
            *error = QCoreApplication::translate("ProcessRunner", "Process already started");
        }
        return false;
    }
    if (program.trimmed().isEmpty()) {
        if (error) {
            *error = QCoreApplication::translate("ProcessRunner", "Executable path is not set");
        }
        m_ended = true;
        return false;
    }

    m_process.setProgram(program);
    m_process.setArguments(arguments);
    if (!workingDirectory.trimmed().isEmpty()) {
        m_process.setWorkingDirectory(workingDirectory);
    }

    qDebug() << "[ProcessRunner] Launching" << program << arguments.join(QLatin1Char(' '));
    m_process.start();
    if (!m_process.waitForStarted(ProcessRunnerConstants::startTimeoutMs)) {
        if (error) {
            *error = QCoreApplication::translate("ProcessRunner", "Cannot launch %1: %2")
                .arg(program, m_process.errorString());
        }
        m_ended = true;
        return false;
    }
    m_process.closeWriteChannel();
    m_started = true;
    return true;
}

/**
 * @brief Returns the next chunk of output, waiting at most waitMs for one.
 * @param chunk Output chunk, filled when Data is returned.
 * @param waitMs Maximum time to block when nothing is buffered.
 * @return Data, Timeout while the process is still running, or EndOfStream
 *         once the process exited and every byte was handed out.
 */
ProcessRunner::ReadStatus ProcessRunner::readChunk(OutputChunk *chunk, int waitMs)
{
    if (m_pending.isEmpty() && !m_ended && m_started) {
        collectAvailable();
        if (m_pending.isEmpty() && m_process.state() != QProcess::NotRunning) {
            m_process.waitForReadyRead(waitMs);
            collectAvailable();
        }
    }

    if (!m_pending.isEmpty()) {
        const OutputChunk next = m_pending.takeFirst();
        if (chunk) {
            *chunk = next;
        }
        return ReadStatus::Data;
    }

    if (!m_started || m_ended || m_process.state() == QProcess::NotRunning) {
        if (!m_ended) {
            flushStderrLine();
        }
        m_ended = true;
        return ReadStatus::EndOfStream;
    }
    return ReadStatus::Timeout;
}

/**
 * @brief Stops the process, escalating to a kill when it ignores the request.
 *
 * Safe to call in any state and more than once. Returns within
 * timeoutMs + killWaitMs.
 * @param timeoutMs Grace period after the terminate signal.
 * @param killWaitMs Time allowed for the killed process to be reaped.
 * @return How the process ended.
 */
ProcessRunner::TerminationOutcome ProcessRunner::terminate(int timeoutMs, int killWaitMs)
{
    if (!m_started || m_process.state() == QProcess::NotRunning) {
        return TerminationOutcome::AlreadyExited;
    }

    const qint64 pid = m_process.processId();
    m_process.terminate();
    if (m_process.waitForFinished(timeoutMs)) {
        collectAvailable();
        qDebug() << "[ProcessRunner] Process" << pid << "terminated gracefully";
        return TerminationOutcome::Graceful;
    }

    qWarning() << "[ProcessRunner] Process" << pid << "ignored terminate for" << timeoutMs << "ms, killing";
    m_process.kill();
    if (!m_process.waitForFinished(killWaitMs)) {
        qWarning() << "[ProcessRunner] Process" << pid << "not reaped after kill";
    }
    collectAvailable();
    return TerminationOutcome::ForceKilled;
}

ExitStatus ProcessRunner::exitStatus() const
{
    ExitStatus status;
    status.stderrTail = m_stderrTail;
    if (!m_started) {
        return status;
    }
    status.crashed = m_process.exitStatus() == QProcess::CrashExit;
    status.code = m_process.exitCode();
    status.success = m_process.state() == QProcess::NotRunning
        && !status.crashed
        && status.code == 0;
    return status;
}

bool ProcessRunner::isRunning() const
{
    return m_process.state() != QProcess::NotRunning;
}

qint64 ProcessRunner::processId() const
{
    return m_process.processId();
}

/**
 * @brief Installs a predicate deciding which stderr lines enter the tail.
 * @param filter Returns true for lines worth keeping as error text.
 */
void ProcessRunner::setStderrTailFilter(const LineFilter &filter)
{
    m_tailFilter = filter;
}

void ProcessRunner::setStderrTailLimit(int lines)
{
    m_tailLimit = qMax(ProcessRunnerConstants::minimumTailLines, lines);
}

void ProcessRunner::collectAvailable()
{
    const QByteArray out = m_process.readAllStandardOutput();
    if (!out.isEmpty()) {
        OutputChunk chunk;
        chunk.origin = OutputChunk::Origin::StandardOutput;
        chunk.data = out;
        m_pending.append(chunk);
    }

    const QByteArray err = m_process.readAllStandardError();
    if (!err.isEmpty()) {
        appendStderrLines(err);
        OutputChunk chunk;
        chunk.origin = OutputChunk::Origin::StandardError;
        chunk.data = err;
        m_pending.append(chunk);
    }
}

void ProcessRunner::appendStderrLines(const QByteArray &data)
{
    m_stderrLineBuffer.append(data);

    int newLineIndex = m_stderrLineBuffer.indexOf('\n');
    while (newLineIndex >= 0) {
        const QString line = QString::fromUtf8(m_stderrLineBuffer.left(newLineIndex).trimmed());
        m_stderrLineBuffer.remove(0, newLineIndex + 1);

        if (!line.isEmpty() && (!m_tailFilter || m_tailFilter(line))) {
            m_stderrTail.append(line);
            while (m_stderrTail.size() > m_tailLimit) {
                m_stderrTail.removeFirst();
            }
        }

        newLineIndex = m_stderrLineBuffer.indexOf('\n');
    }
}

void ProcessRunner::flushStderrLine()
{
    if (!m_stderrLineBuffer.isEmpty()) {
        appendStderrLines(QByteArrayLiteral("\n"));
    }
}
