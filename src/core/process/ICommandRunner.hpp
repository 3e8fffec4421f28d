#pragma once

#include "core/OperationError.hpp"
#include <QString>
#include <QStringList>
#include <chrono>
#include <optional>

namespace mdk {

struct CommandSpec {
    QString program;
    QStringList arguments;
    std::chrono::milliseconds timeout{10000};
    QString label;  // reported as OperationError::command; empty = program + arguments

    QString displayName() const
    {
        if (!label.isEmpty())
            return label;
        if (arguments.isEmpty())
            return program;
        return program + QLatin1Char(' ') + arguments.join(QLatin1Char(' '));
    }
};

/// Result of one bounded invocation. Both streams are trimmed.
struct CommandOutcome {
    QString stdoutText;
    QString stderrText;
    std::optional<OperationError> error;

    bool ok() const { return !error.has_value(); }
};

class ICommandRunner {
public:
    virtual ~ICommandRunner() = default;

    /// Run spec.program to completion or until spec.timeout elapses.
    /// Deadline expiry reports ErrorKind::Timeout, a non-zero exit or spawn
    /// failure reports ErrorKind::CommandFailed. A zero exit carries no error
    /// regardless of what the process printed.
    /// Thread-safe.
    virtual CommandOutcome run(const CommandSpec& spec) = 0;
};

} // namespace mdk
