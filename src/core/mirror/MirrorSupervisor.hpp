#pragma once

#include "SessionOptions.hpp"
#include "core/OperationError.hpp"
#include <QMutex>
#include <QString>
#include <QStringList>
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <vector>

namespace mdk {

class SessionWatcher;

/// Supervises at most one long-running mirroring process (scrcpy).
///
/// State is Idle or Running; the stored session pointer *is* the state.
/// start() and the watcher's clear-on-exit are serialized by mutex_, which
/// guards only the session/cancel pair. No waits happen under the lock
/// except the spawn itself, so stop() blocking on exit never blocks
/// isRunning() or a concurrent start().
///
/// Each session is a SessionWatcher thread that owns the QProcess, waits for
/// it to exit and returns the supervisor to Idle, so a crash or an external
/// kill is observed without an explicit stop().
class MirrorSupervisor {
public:
    struct Timings {
        std::chrono::milliseconds sessionCeiling{std::chrono::hours(24)};
        std::chrono::milliseconds stopGrace{5000};
    };

    using ExitObserver = std::function<void(int exitCode, bool crashed)>;

    explicit MirrorSupervisor(const QString& program, Timings timings = Timings{});
    ~MirrorSupervisor();

    MirrorSupervisor(const MirrorSupervisor&) = delete;
    MirrorSupervisor& operator=(const MirrorSupervisor&) = delete;

    /// Spawn the mirroring tool. Fails CommandFailed if a session is already
    /// running or the process cannot be spawned. Returns once spawned.
    std::optional<OperationError> start(const QString& deviceId, const SessionOptions& options);

    /// Request graceful termination and wait up to Timings::stopGrace.
    /// Fails NotRunning without a session, Timeout (after forcing a kill)
    /// if the process outlives the grace period.
    std::optional<OperationError> stop();

    bool isRunning() const;

    /// Stop any active session and join every watcher thread.
    void shutdown();

    /// Called from the watcher thread after a session has been cleared.
    void setExitObserver(ExitObserver observer);

    QString program() const { return program_; }
    Timings timings() const { return timings_; }

private:
    friend class SessionWatcher;

    void onSessionExited(SessionWatcher* watcher, int exitCode, bool crashed);
    void reapFinishedWatchers();  // requires mutex_
    QString commandName() const;

    const QString program_;
    const Timings timings_;

    mutable QMutex mutex_;
    std::shared_ptr<SessionWatcher> session_;
    std::function<void()> cancel_;
    ExitObserver exitObserver_;
    std::vector<std::shared_ptr<SessionWatcher>> watchers_;  // joined on reap/shutdown
};

} // namespace mdk
