#pragma once

#include "core/OperationError.hpp"
#include "core/bridge/BridgeClient.hpp"
#include "core/bridge/Device.hpp"
#include "core/mirror/MirrorSupervisor.hpp"
#include "core/mirror/SessionOptions.hpp"
#include "core/process/ICommandRunner.hpp"
#include <QObject>
#include <QString>
#include <QVector>
#include <chrono>
#include <memory>
#include <optional>

namespace mdk {

struct OrchestratorSettings {
    QString bridgePath;   // empty = "adb" from PATH
    QString mirrorPath;   // empty = "scrcpy" from PATH
    std::chrono::milliseconds bridgeTimeout{BridgeClient::DEFAULT_TIMEOUT};
    MirrorSupervisor::Timings mirrorTimings;
};

/// Entry point for the UI: device discovery, pairing and connection through
/// the bridge tool, and the single supervised mirroring session.
///
/// Every operation returns an empty optional on success. Bridge operations
/// block for at most the bridge timeout; startSession() returns once the
/// mirroring tool is spawned; stopSession() blocks for at most the grace
/// period. All operations may be called from any thread.
class DeviceOrchestrator : public QObject {
    Q_OBJECT
    Q_PROPERTY(bool sessionActive READ isSessionActive NOTIFY sessionActiveChanged)

public:
    static const QString DEFAULT_BRIDGE_PROGRAM;
    static const QString DEFAULT_MIRROR_PROGRAM;

    explicit DeviceOrchestrator(const OrchestratorSettings& settings, QObject* parent = nullptr);

    /// Uses @p runner for bridge commands instead of spawning processes
    /// directly. Does NOT own the runner.
    DeviceOrchestrator(const OrchestratorSettings& settings, ICommandRunner* runner,
                       QObject* parent = nullptr);
    ~DeviceOrchestrator() override;

    std::optional<OperationError> listDevices(QVector<Device>& devices);
    std::optional<OperationError> pairDevice(const QString& address, int port, const QString& code);
    std::optional<OperationError> connectDevice(const QString& address, int port);
    std::optional<OperationError> enableWireless(int port);
    std::optional<OperationError> disconnectDevice(const QString& address, int port);

    std::optional<OperationError> startSession(const QString& deviceId, const SessionOptions& options);
    std::optional<OperationError> stopSession();
    bool isSessionActive() const;

    QString bridgeProgram() const { return bridge_.program(); }
    QString mirrorProgram() const { return mirror_.program(); }

signals:
    /// May be emitted from the session watcher thread.
    void sessionActiveChanged();
    void sessionFinished(int exitCode, bool crashed);

private:
    void watchSessionExit();
    std::optional<OperationError> report(const char* operation,
                                         std::optional<OperationError> error) const;

    std::unique_ptr<ICommandRunner> ownedRunner_;
    BridgeClient bridge_;
    MirrorSupervisor mirror_;
};

} // namespace mdk
