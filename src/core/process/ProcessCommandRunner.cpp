#include "ProcessCommandRunner.hpp"

#include <QDeadlineTimer>
#include <QProcess>
#include <boost/log/trivial.hpp>
#include <algorithm>

namespace mdk {

namespace {

int remainingMs(const QDeadlineTimer& deadline)
{
    return static_cast<int>(std::max<qint64>(0, deadline.remainingTime()));
}

} // namespace

CommandOutcome ProcessCommandRunner::run(const CommandSpec& spec)
{
    const QString command = spec.displayName();
    const qint64 timeoutMs = spec.timeout.count();
    QDeadlineTimer deadline(timeoutMs);

    QProcess process;
    process.setProgram(spec.program);
    process.setArguments(spec.arguments);
    process.setStandardInputFile(QProcess::nullDevice());

    BOOST_LOG_TRIVIAL(debug) << "[CommandRunner] Running " << command.toStdString()
                             << " (timeout " << timeoutMs << " ms)";

    CommandOutcome outcome;
    process.start(QIODevice::ReadOnly);

    bool finished = false;
    if (process.waitForStarted(remainingMs(deadline))) {
        finished = process.waitForFinished(remainingMs(deadline));
    } else if (process.error() == QProcess::FailedToStart) {
        BOOST_LOG_TRIVIAL(warning) << "[CommandRunner] " << command.toStdString()
                                   << " failed to start: " << process.errorString().toStdString();
        outcome.error = OperationError::commandFailed(
            command, {}, {}, std::nullopt, ErrorCause::failedToStart(process.errorString()));
        return outcome;
    }

    // Still alive past the deadline: kill and reap so it can no longer write to us.
    if (!finished && process.state() != QProcess::NotRunning) {
        process.kill();
        process.waitForFinished(REAP_TIMEOUT_MS);
        outcome.stdoutText = QString::fromLocal8Bit(process.readAllStandardOutput()).trimmed();
        outcome.stderrText = QString::fromLocal8Bit(process.readAllStandardError()).trimmed();
        BOOST_LOG_TRIVIAL(warning) << "[CommandRunner] " << command.toStdString()
                                   << " timed out after " << timeoutMs << " ms";
        outcome.error = OperationError::timeout(command, ErrorCause::deadlineExceeded(timeoutMs));
        return outcome;
    }

    outcome.stdoutText = QString::fromLocal8Bit(process.readAllStandardOutput()).trimmed();
    outcome.stderrText = QString::fromLocal8Bit(process.readAllStandardError()).trimmed();

    if (process.exitStatus() == QProcess::CrashExit) {
        BOOST_LOG_TRIVIAL(warning) << "[CommandRunner] " << command.toStdString() << " crashed";
        outcome.error = OperationError::commandFailed(
            command, outcome.stdoutText, outcome.stderrText, std::nullopt,
            ErrorCause::crashed(process.errorString()));
        return outcome;
    }

    const int exitCode = process.exitCode();
    if (exitCode != 0) {
        BOOST_LOG_TRIVIAL(warning) << "[CommandRunner] " << command.toStdString()
                                   << " exited with status " << exitCode;
        outcome.error = OperationError::commandFailed(
            command, outcome.stdoutText, outcome.stderrText, exitCode,
            ErrorCause::exitStatus(exitCode));
        return outcome;
    }

    BOOST_LOG_TRIVIAL(debug) << "[CommandRunner] " << command.toStdString() << " finished";
    return outcome;
}

} // namespace mdk
