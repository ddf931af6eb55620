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

#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDebug>
#include <QFileInfo>
#include <QHash>
#include <QSocketNotifier>
#include <QTextStream>

#ifdef Q_OS_UNIX
#include <csignal>
#include <sys/socket.h>
#include <unistd.h>
#endif

#include "AppSettings.h"
#include "Logger.h"
#include "PlatformUtils.h"
#include "TransferManager.h"

namespace {

struct ExitCodes {
    static constexpr int success = 0;
    static constexpr int failed = 1;
    static constexpr int usage = 2;
    static constexpr int cancelled = 130;
};

int g_signalFds[2] = {-1, -1};

#ifdef Q_OS_UNIX
void interruptHandler(int)
{
    const char marker = 1;
    if (::write(g_signalFds[0], &marker, sizeof(marker)) != static_cast<ssize_t>(sizeof(marker))) {
        // A full socket already holds a pending marker.
        return;
    }
}
#endif

bool installInterruptHandler()
{
#ifdef Q_OS_UNIX
    if (::socketpair(AF_UNIX, SOCK_STREAM, 0, g_signalFds) != 0) {
        return false;
    }
    struct sigaction action = {};
    action.sa_handler = interruptHandler;
    sigemptyset(&action.sa_mask);
    action.sa_flags = SA_RESTART;
    return ::sigaction(SIGINT, &action, nullptr) == 0 && ::sigaction(SIGTERM, &action, nullptr) == 0;
#else
    return false;
#endif
}

bool drainInterrupt()
{
#ifdef Q_OS_UNIX
    char marker = 0;
    return ::read(g_signalFds[1], &marker, sizeof(marker)) == static_cast<ssize_t>(sizeof(marker));
#else
    return false;
#endif
}

bool parseKind(const QString &text, TransferJob::Kind *kind)
{
    static const QHash<QString, TransferJob::Kind> kinds = {
        {QStringLiteral("copy"), TransferJob::Kind::Copy},
        {QStringLiteral("move"), TransferJob::Kind::Move},
        {QStringLiteral("delete"), TransferJob::Kind::Delete},
        {QStringLiteral("mkdir"), TransferJob::Kind::MakeDirectory},
    };
    const auto it = kinds.constFind(text.toLower());
    if (it == kinds.constEnd()) {
        return false;
    }
    *kind = it.value();
    return true;
}

// A trailing slash marks a folder; local items are also checked on disk.
TransferItem parseItem(const QString &sourceRoot, const QString &text)
{
    TransferItem item;
    item.name = text;
    while (item.name.size() > 1 && item.name.endsWith(QLatin1Char('/'))) {
        item.name.chop(1);
        item.isDir = true;
    }
    if (!item.isDir && !sourceRoot.isEmpty() && !PlatformUtils::isRemotePath(sourceRoot)) {
        item.isDir = QFileInfo(PlatformUtils::joinPath(sourceRoot, item.name)).isDir();
    }
    return item;
}

void printSnapshot(QTextStream &out, const Snapshot &snapshot)
{
    const GlobalProgress &global = snapshot.global;
    const QString percent = global.percent < 0 ? QStringLiteral("  ?") : QStringLiteral("%1").arg(global.percent, 3);
    out << QStringLiteral("[%1%] %2 / %3, %4/s, ETA %5, files %6/%7, elapsed %8")
               .arg(percent,
                    TransferTypes::formatSize(global.bytesTransferred),
                    TransferTypes::formatSize(global.bytesTotal),
                    TransferTypes::formatSize(global.speed),
                    TransferTypes::formatDuration(global.etaMs))
               .arg(global.filesCompleted)
               .arg(global.filesTotal)
               .arg(TransferTypes::formatDuration(global.elapsedMs));
    if (global.errors > 0) {
        out << QStringLiteral(", %1 errors").arg(global.errors);
    }
    out << Qt::endl;
    for (const FileSlot &slot : snapshot.slots) {
        out << QStringLiteral("  #%1 %2% %3 / %4 ")
                   .arg(slot.slotIndex)
                   .arg(slot.percent, 3)
                   .arg(TransferTypes::formatSize(slot.bytesDone), TransferTypes::formatSize(slot.bytesTotal))
            << slot.fileName;
        if (slot.state == FileSlot::State::Completing) {
            out << QStringLiteral(" (done)");
        }
        out << Qt::endl;
    }
    if (snapshot.queuedFiles > 0) {
        out << QStringLiteral("  +%1 waiting").arg(snapshot.queuedFiles) << Qt::endl;
    }
}

bool askYesNo(QTextStream &out, const QString &question)
{
    QTextStream in(stdin);
    out << question << QStringLiteral(" [y/N] ") << Qt::flush;
    const QString answer = in.readLine().trimmed().toLower();
    return answer == QStringLiteral("y") || answer == QStringLiteral("yes");
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setOrganizationName(QStringLiteral("Ferryman"));
    QCoreApplication::setApplicationName(QStringLiteral("Ferryman"));
    QCoreApplication::setApplicationVersion(QStringLiteral("0.1.0"));

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Runs rclone copy, move, delete and mkdir jobs with live progress."));
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument(QStringLiteral("kind"), QStringLiteral("copy, move, delete or mkdir."));
    parser.addPositionalArgument(QStringLiteral("paths"),
                                 QStringLiteral("copy/move: <source> <destination> <items...>; "
                                                "delete: <root> <items...>; mkdir: <destination> [names...]. "
                                                "A trailing slash marks an item as a folder."),
                                 QStringLiteral("paths..."));
    const QCommandLineOption settingsOption(QStringLiteral("settings"),
                                            QStringLiteral("Read settings from <file> instead of the user INI file."),
                                            QStringLiteral("file"));
    const QCommandLineOption flagOption({QStringLiteral("f"), QStringLiteral("flag")},
                                        QStringLiteral("Extra rclone flag for this job (repeatable)."),
                                        QStringLiteral("flag"));
    const QCommandLineOption parallelismOption({QStringLiteral("j"), QStringLiteral("parallelism")},
                                               QStringLiteral("Files transferred at once."),
                                               QStringLiteral("count"));
    const QCommandLineOption yesOption(QStringLiteral("yes"), QStringLiteral("Delete partial files after a cancel without asking."));
    const QCommandLineOption keepOption(QStringLiteral("keep"), QStringLiteral("Keep partial files after a cancel without asking."));
    const QCommandLineOption debugOption(QStringLiteral("debug"), QStringLiteral("Verbose logging."));
    const QCommandLineOption logFileOption(QStringLiteral("log-file"), QStringLiteral("Write the log to <file>."),
                                           QStringLiteral("file"));
    parser.addOptions({settingsOption, flagOption, parallelismOption, yesOption, keepOption, debugOption, logFileOption});
    parser.process(app);

    TransferSettings settings = parser.isSet(settingsOption)
        ? AppSettings::load(parser.value(settingsOption))
        : AppSettings::load();
    if (parser.isSet(parallelismOption)) {
        bool ok = false;
        const int parallelism = parser.value(parallelismOption).toInt(&ok);
        if (!ok || parallelism < 1) {
            qCritical().noquote() << QStringLiteral("Invalid parallelism: %1").arg(parser.value(parallelismOption));
            return ExitCodes::usage;
        }
        settings.parallelism = parallelism;
    }
    if (parser.isSet(yesOption)) {
        settings.autoCleanupPartial = true;
    }

    Logger::setLogLevel(settings.debug || parser.isSet(debugOption) ? 2 : 1);
    if (parser.isSet(logFileOption)) {
        Logger::setLogFilePathOverride(QFileInfo(parser.value(logFileOption)).absoluteFilePath());
    }
    Logger::install(QStringLiteral("ferryman"), settings.logRetention);

    QTextStream out(stdout);
    QTextStream err(stderr);

    const QStringList positional = parser.positionalArguments();
    TransferJob job;
    if (positional.isEmpty() || !parseKind(positional.first(), &job.kind)) {
        err << QStringLiteral("Unknown or missing job kind") << Qt::endl;
        parser.showHelp(ExitCodes::usage);
    }

    QStringList paths = positional.mid(1);
    if (job.isTransfer()) {
        if (paths.size() < 3) {
            err << QStringLiteral("copy and move need a source, a destination and at least one item") << Qt::endl;
            return ExitCodes::usage;
        }
        job.sourceRoot = paths.takeFirst();
        job.destination = paths.takeFirst();
    } else if (job.kind == TransferJob::Kind::Delete) {
        if (paths.size() < 2) {
            err << QStringLiteral("delete needs a root and at least one item") << Qt::endl;
            return ExitCodes::usage;
        }
        job.sourceRoot = paths.takeFirst();
    } else {
        if (paths.isEmpty()) {
            err << QStringLiteral("mkdir needs a destination") << Qt::endl;
            return ExitCodes::usage;
        }
        job.destination = paths.takeFirst();
    }
    for (const QString &path : std::as_const(paths)) {
        job.items.append(parseItem(job.sourceRoot, path));
    }
    job.extraFlags = parser.values(flagOption);

    TransferManager manager(settings);
    JobHandle *handle = manager.submit(job);
    const bool keepPartials = parser.isSet(keepOption);

    handle->subscribe(&app, [&out](const Snapshot &snapshot) {
        printSnapshot(out, snapshot);
    });
    QObject::connect(handle, &JobHandle::cleanupConfirmationRequested, &app,
                     [&out, handle, keepPartials](const QList<PartialFileCandidate> &candidates) {
        out << QStringLiteral("%1 partial files left behind:").arg(candidates.size()) << Qt::endl;
        for (const PartialFileCandidate &candidate : candidates) {
            out << QStringLiteral("  %1 (%2)").arg(candidate.path, TransferTypes::formatSize(candidate.size)) << Qt::endl;
        }
        handle->confirmCleanup(!keepPartials && askYesNo(out, QStringLiteral("Delete them?")));
    });
    QObject::connect(handle, &JobHandle::finished, &app, [&out, &err](const JobResult &result) {
        out << QStringLiteral("Job %1 %2").arg(result.jobId).arg(TransferTypes::outcomeName(result.outcome)) << Qt::endl;
        if (result.outcome == JobResult::Outcome::Failed) {
            err << result.errorText << Qt::endl;
            QCoreApplication::exit(ExitCodes::failed);
            return;
        }
        if (result.outcome == JobResult::Outcome::Cancelled) {
            out << QStringLiteral("Stopped: %1").arg(TransferTypes::terminationName(result.termination)) << Qt::endl;
            for (const QString &path : result.cleanup.deleted) {
                out << QStringLiteral("  deleted %1").arg(path) << Qt::endl;
            }
            for (const CleanupFailure &failure : result.cleanup.failures) {
                err << QStringLiteral("  cannot delete %1: %2").arg(failure.path, failure.error) << Qt::endl;
            }
            if (!result.cleanup.scanError.isEmpty()) {
                err << QStringLiteral("  scan failed: %1").arg(result.cleanup.scanError) << Qt::endl;
            }
            QCoreApplication::exit(ExitCodes::cancelled);
            return;
        }
        QCoreApplication::exit(ExitCodes::success);
    });

    QSocketNotifier *interruptNotifier = nullptr;
    if (installInterruptHandler()) {
        interruptNotifier = new QSocketNotifier(g_signalFds[1], QSocketNotifier::Read, &app);
        QObject::connect(interruptNotifier, &QSocketNotifier::activated, &app, [&err, handle]() {
            if (!drainInterrupt()) {
                qWarning() << "[main] Cannot read the interrupt marker";
                return;
            }
            if (handle->cancel()) {
                err << QStringLiteral("Cancelling...") << Qt::endl;
            }
        });
    } else {
        qWarning() << "[main] Cannot install the interrupt handler; Ctrl+C will not cancel cleanly";
    }

    return app.exec();
}
