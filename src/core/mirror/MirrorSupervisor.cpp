#include "MirrorSupervisor.hpp"

#include <QDeadlineTimer>
#include <QFileInfo>
#include <QProcess>
#include <QThread>
#include <boost/log/trivial.hpp>
#include <atomic>
#include <future>

namespace mdk {

// One mirroring process. The QProcess lives on this thread's stack for the
// whole session; other threads only set the request flags.
class SessionWatcher : public QThread {
public:
    static constexpr int SPAWN_TIMEOUT_MS = 5000;
    static constexpr int POLL_INTERVAL_MS = 50;

    SessionWatcher(MirrorSupervisor* supervisor, QStringList arguments)
        : supervisor_(supervisor)
        , arguments_(std::move(arguments))
        , spawnResult_(spawned_.get_future())
        , exited_(exitedPromise_.get_future().share())
    {
    }

    /// Blocks until the process has been spawned or failed to spawn.
    std::optional<OperationError> waitForSpawn() { return spawnResult_.get(); }

    void requestTerminate() { terminateRequested_ = true; }
    void requestKill() { killRequested_ = true; }

    std::shared_future<void> exited() const { return exited_; }

protected:
    void run() override;

private:
    MirrorSupervisor* supervisor_;
    const QStringList arguments_;
    std::atomic<bool> terminateRequested_{false};
    std::atomic<bool> killRequested_{false};
    std::promise<std::optional<OperationError>> spawned_;
    std::future<std::optional<OperationError>> spawnResult_;
    std::promise<void> exitedPromise_;
    std::shared_future<void> exited_;
};

void SessionWatcher::run()
{
    const QString command = supervisor_->commandName();

    QProcess process;
    process.setProgram(supervisor_->program());
    process.setArguments(arguments_);
    process.setStandardInputFile(QProcess::nullDevice());
    process.setStandardOutputFile(QProcess::nullDevice());
    process.setStandardErrorFile(QProcess::nullDevice());
    process.start();

    if (!process.waitForStarted(SPAWN_TIMEOUT_MS)) {
        const QString reason = process.errorString();
        if (process.state() != QProcess::NotRunning) {
            process.kill();
            process.waitForFinished(SPAWN_TIMEOUT_MS);
        }
        BOOST_LOG_TRIVIAL(error) << "[Mirror] Failed to start " << command.toStdString()
                                 << ": " << reason.toStdString();
        spawned_.set_value(OperationError::commandFailed(
            command, {}, {}, std::nullopt, ErrorCause::failedToStart(reason)));
        exitedPromise_.set_value();
        return;
    }
    spawned_.set_value(std::nullopt);

    const QDeadlineTimer ceiling(supervisor_->timings().sessionCeiling.count());
    bool terminateSent = false;
    bool killSent = false;
    while (!process.waitForFinished(POLL_INTERVAL_MS)) {
        if (process.state() == QProcess::NotRunning)
            break;

        if (!killSent && (killRequested_ || ceiling.hasExpired())) {
            if (!killRequested_)
                BOOST_LOG_TRIVIAL(warning) << "[Mirror] Session ceiling reached, killing";
            process.kill();
            killSent = true;
        } else if (!terminateSent && terminateRequested_) {
            process.terminate();
            terminateSent = true;
        }
    }

    const bool crashed = process.exitStatus() == QProcess::CrashExit;
    const int exitCode = process.exitCode();
    BOOST_LOG_TRIVIAL(info) << "[Mirror] Session ended (exit " << exitCode
                            << (crashed ? ", crashed" : "") << ")";

    supervisor_->onSessionExited(this, exitCode, crashed);
    exitedPromise_.set_value();
}

MirrorSupervisor::MirrorSupervisor(const QString& program, Timings timings)
    : program_(program)
    , timings_(timings)
{
}

MirrorSupervisor::~MirrorSupervisor()
{
    shutdown();
}

std::optional<OperationError> MirrorSupervisor::start(const QString& deviceId,
                                                      const SessionOptions& options)
{
    QMutexLocker lock(&mutex_);
    if (session_) {
        auto error = OperationError::commandFailed(
            commandName(), {}, {}, std::nullopt,
            ErrorCause::detail(QStringLiteral("%1 already running").arg(commandName())));
        error.message = QStringLiteral("mirroring session already running");
        return error;
    }

    reapFinishedWatchers();

    const QStringList arguments = buildMirrorArguments(deviceId, options);
    auto watcher = std::make_shared<SessionWatcher>(this, arguments);
    watcher->start();

    auto error = watcher->waitForSpawn();
    if (error) {
        watcher->wait();
        return error;
    }

    // Stored before the lock is released, so a process that exits
    // immediately is still cleared by its own watcher.
    session_ = watcher;
    cancel_ = [watcher]() { watcher->requestTerminate(); };
    watchers_.push_back(watcher);

    BOOST_LOG_TRIVIAL(info) << "[Mirror] Session started: " << commandName().toStdString()
                            << " " << arguments.join(QLatin1Char(' ')).toStdString();
    return std::nullopt;
}

std::optional<OperationError> MirrorSupervisor::stop()
{
    std::shared_ptr<SessionWatcher> session;
    std::function<void()> cancel;
    {
        QMutexLocker lock(&mutex_);
        session = session_;
        cancel = cancel_;
    }

    if (!session || !cancel)
        return OperationError::notRunning(
            QStringLiteral("%1 is not running").arg(commandName()));

    BOOST_LOG_TRIVIAL(info) << "[Mirror] Stopping session";
    cancel();

    if (session->exited().wait_for(timings_.stopGrace) == std::future_status::timeout) {
        BOOST_LOG_TRIVIAL(warning) << "[Mirror] Session ignored termination for "
                                   << timings_.stopGrace.count() << " ms, killing";
        session->requestKill();
        return OperationError::timeout(commandName(),
                                       ErrorCause::deadlineExceeded(timings_.stopGrace.count()));
    }
    return std::nullopt;
}

bool MirrorSupervisor::isRunning() const
{
    QMutexLocker lock(&mutex_);
    return session_ != nullptr;
}

void MirrorSupervisor::shutdown()
{
    if (isRunning()) {
        auto error = stop();
        if (error && !error->is(ErrorKind::NotRunning))
            BOOST_LOG_TRIVIAL(warning) << "[Mirror] Shutdown: " << error->text().toStdString();
    }

    std::vector<std::shared_ptr<SessionWatcher>> watchers;
    {
        QMutexLocker lock(&mutex_);
        watchers.swap(watchers_);
    }
    for (const auto& watcher : watchers)
        watcher->wait();
}

void MirrorSupervisor::setExitObserver(ExitObserver observer)
{
    QMutexLocker lock(&mutex_);
    exitObserver_ = std::move(observer);
}

void MirrorSupervisor::onSessionExited(SessionWatcher* watcher, int exitCode, bool crashed)
{
    ExitObserver observer;
    {
        QMutexLocker lock(&mutex_);
        if (session_.get() == watcher) {
            session_.reset();
            cancel_ = nullptr;
        }
        observer = exitObserver_;
    }

    if (observer)
        observer(exitCode, crashed);
}

void MirrorSupervisor::reapFinishedWatchers()
{
    for (auto it = watchers_.begin(); it != watchers_.end();) {
        if ((*it)->exited().wait_for(std::chrono::seconds(0)) == std::future_status::ready) {
            (*it)->wait();
            it = watchers_.erase(it);
        } else {
            ++it;
        }
    }
}

QString MirrorSupervisor::commandName() const
{
    return QFileInfo(program_).fileName();
}

} // namespace mdk
