#include "core/OperationError.hpp"

namespace mdk {

QString kindName(ErrorKind kind)
{
    switch (kind) {
    case ErrorKind::InvalidInput:  return QStringLiteral("invalid_input");
    case ErrorKind::Timeout:       return QStringLiteral("timeout");
    case ErrorKind::CommandFailed: return QStringLiteral("command_failed");
    case ErrorKind::Parse:         return QStringLiteral("parse");
    case ErrorKind::NotRunning:    return QStringLiteral("not_running");
    }
    return QStringLiteral("unknown");
}

// --- ErrorCause ---

ErrorCause ErrorCause::deadlineExceeded(qint64 timeoutMs)
{
    return {Type::DeadlineExceeded,
            QStringLiteral("deadline of %1 ms exceeded").arg(timeoutMs)};
}

ErrorCause ErrorCause::exitStatus(int exitCode)
{
    return {Type::ExitStatus, QStringLiteral("exit status %1").arg(exitCode)};
}

ErrorCause ErrorCause::crashed(const QString& description)
{
    return {Type::Crashed, description};
}

ErrorCause ErrorCause::failedToStart(const QString& description)
{
    return {Type::FailedToStart, description};
}

ErrorCause ErrorCause::detail(const QString& description)
{
    return {Type::Detail, description};
}

// --- OperationError ---

QString OperationError::text() const
{
    if (!message.isEmpty())
        return message;
    if (!command.isEmpty())
        return QStringLiteral("%1: %2").arg(kindName(kind), command);
    return kindName(kind);
}

OperationError OperationError::invalidInput(const QString& message)
{
    OperationError e;
    e.kind = ErrorKind::InvalidInput;
    e.message = message;
    return e;
}

OperationError OperationError::notRunning(const QString& message)
{
    OperationError e;
    e.kind = ErrorKind::NotRunning;
    e.message = message;
    return e;
}

OperationError OperationError::timeout(const QString& command, ErrorCause cause)
{
    OperationError e;
    e.kind = ErrorKind::Timeout;
    e.message = QStringLiteral("timeout while running %1").arg(command);
    e.command = command;
    e.cause = std::move(cause);
    return e;
}

OperationError OperationError::commandFailed(const QString& command,
                                             const QString& stdoutText,
                                             const QString& stderrText,
                                             std::optional<int> exitCode,
                                             ErrorCause cause)
{
    OperationError e;
    e.kind = ErrorKind::CommandFailed;
    e.message = QStringLiteral("command failed: %1").arg(command);
    e.command = command;
    e.stdoutText = stdoutText;
    e.stderrText = stderrText;
    e.exitCode = exitCode;
    e.cause = std::move(cause);
    return e;
}

OperationError OperationError::parse(const QString& command,
                                     const QString& stdoutText,
                                     const QString& stderrText,
                                     ErrorCause cause)
{
    OperationError e;
    e.kind = ErrorKind::Parse;
    e.message = QStringLiteral("unexpected output from %1").arg(command);
    e.command = command;
    e.stdoutText = stdoutText;
    e.stderrText = stderrText;
    e.cause = std::move(cause);
    return e;
}

QString describe(const OperationError* error)
{
    if (!error)
        return QStringLiteral("<nil>");
    return error->text();
}

QDebug operator<<(QDebug debug, const OperationError& error)
{
    QDebugStateSaver saver(debug);
    debug.nospace() << "OperationError(" << kindName(error.kind) << ", "
                    << error.text();
    if (error.exitCode)
        debug << ", exit=" << *error.exitCode;
    if (error.cause)
        debug << ", cause=" << error.cause->description;
    debug << ')';
    return debug;
}

} // namespace mdk
