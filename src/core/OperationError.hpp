#pragma once

#include <QDebug>
#include <QString>
#include <optional>

namespace mdk {

enum class ErrorKind {
    InvalidInput,
    Timeout,
    CommandFailed,
    Parse,
    NotRunning
};

/// Stable snake_case name of an error kind ("invalid_input", "timeout", ...).
QString kindName(ErrorKind kind);

/// Lower-level failure wrapped by an OperationError.
struct ErrorCause {
    enum class Type {
        DeadlineExceeded,   // bounded wait expired
        ExitStatus,         // process exited with a non-zero status
        Crashed,            // process terminated by a signal
        FailedToStart,      // spawn failed (missing binary, permissions, ...)
        Detail              // free-form explanation
    };

    Type type = Type::Detail;
    QString description;

    static ErrorCause deadlineExceeded(qint64 timeoutMs);
    static ErrorCause exitStatus(int exitCode);
    static ErrorCause crashed(const QString& description);
    static ErrorCause failedToStart(const QString& description);
    static ErrorCause detail(const QString& description);
};

/// The single error shape every operation reports.
/// Construction never fails; all fields are plain values.
struct OperationError {
    ErrorKind kind = ErrorKind::CommandFailed;
    QString message;
    QString command;
    QString stdoutText;
    QString stderrText;
    std::optional<int> exitCode;  // empty when the process reported no exit status
    std::optional<ErrorCause> cause;

    /// Human-readable text. Falls back to "<kind>: <command>", then "<kind>".
    QString text() const;

    /// Exit code, or 0 when none is available.
    int exitCodeOrZero() const { return exitCode.value_or(0); }

    /// The wrapped lower-level cause, or nullptr.
    const ErrorCause* unwrap() const { return cause ? &*cause : nullptr; }

    bool is(ErrorKind k) const { return kind == k; }

    static OperationError invalidInput(const QString& message);
    static OperationError notRunning(const QString& message);
    static OperationError timeout(const QString& command, ErrorCause cause);
    static OperationError commandFailed(const QString& command,
                                        const QString& stdoutText,
                                        const QString& stderrText,
                                        std::optional<int> exitCode,
                                        ErrorCause cause);
    static OperationError parse(const QString& command,
                                const QString& stdoutText,
                                const QString& stderrText,
                                ErrorCause cause);
};

/// Message of a possibly-null error. Returns "<nil>" for nullptr.
QString describe(const OperationError* error);

QDebug operator<<(QDebug debug, const OperationError& error);

} // namespace mdk
