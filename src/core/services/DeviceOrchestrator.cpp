#include "DeviceOrchestrator.hpp"
#include "core/process/ProcessCommandRunner.hpp"
#include <QDebug>

namespace mdk {

const QString DeviceOrchestrator::DEFAULT_BRIDGE_PROGRAM = QStringLiteral("adb");
const QString DeviceOrchestrator::DEFAULT_MIRROR_PROGRAM = QStringLiteral("scrcpy");

namespace {

QString programOrDefault(const QString& path, const QString& fallback)
{
    const QString trimmed = path.trimmed();
    return trimmed.isEmpty() ? fallback : trimmed;
}

} // namespace

DeviceOrchestrator::DeviceOrchestrator(const OrchestratorSettings& settings, QObject* parent)
    : QObject(parent)
    , ownedRunner_(std::make_unique<ProcessCommandRunner>())
    , bridge_(ownedRunner_.get(),
              programOrDefault(settings.bridgePath, DEFAULT_BRIDGE_PROGRAM),
              settings.bridgeTimeout)
    , mirror_(programOrDefault(settings.mirrorPath, DEFAULT_MIRROR_PROGRAM),
              settings.mirrorTimings)
{
    watchSessionExit();
}

DeviceOrchestrator::DeviceOrchestrator(const OrchestratorSettings& settings,
                                       ICommandRunner* runner, QObject* parent)
    : QObject(parent)
    , bridge_(runner,
              programOrDefault(settings.bridgePath, DEFAULT_BRIDGE_PROGRAM),
              settings.bridgeTimeout)
    , mirror_(programOrDefault(settings.mirrorPath, DEFAULT_MIRROR_PROGRAM),
              settings.mirrorTimings)
{
    watchSessionExit();
}

DeviceOrchestrator::~DeviceOrchestrator()
{
    // Join the watcher while signals can still be emitted on a live object
    mirror_.shutdown();
}

void DeviceOrchestrator::watchSessionExit()
{
    mirror_.setExitObserver([this](int exitCode, bool crashed) {
        qInfo() << "[Orchestrator] Mirroring session finished, exit code" << exitCode
                << (crashed ? "(crashed)" : "");
        emit sessionFinished(exitCode, crashed);
        emit sessionActiveChanged();
    });
}

std::optional<OperationError> DeviceOrchestrator::listDevices(QVector<Device>& devices)
{
    return report("listDevices", bridge_.listDevices(devices));
}

std::optional<OperationError> DeviceOrchestrator::pairDevice(const QString& address, int port,
                                                             const QString& code)
{
    return report("pairDevice", bridge_.pairDevice(address, port, code));
}

std::optional<OperationError> DeviceOrchestrator::connectDevice(const QString& address, int port)
{
    return report("connectDevice", bridge_.connectDevice(address, port));
}

std::optional<OperationError> DeviceOrchestrator::enableWireless(int port)
{
    return report("enableWireless", bridge_.enableWireless(port));
}

std::optional<OperationError> DeviceOrchestrator::disconnectDevice(const QString& address, int port)
{
    return report("disconnectDevice", bridge_.disconnectDevice(address, port));
}

std::optional<OperationError> DeviceOrchestrator::startSession(const QString& deviceId,
                                                               const SessionOptions& options)
{
    auto error = mirror_.start(deviceId, options);
    if (!error) {
        qInfo() << "[Orchestrator] Mirroring session started"
                << (deviceId.isEmpty() ? QStringLiteral("(default device)") : deviceId);
        emit sessionActiveChanged();
    }
    return report("startSession", std::move(error));
}

std::optional<OperationError> DeviceOrchestrator::stopSession()
{
    return report("stopSession", mirror_.stop());
}

bool DeviceOrchestrator::isSessionActive() const
{
    return mirror_.isRunning();
}

std::optional<OperationError> DeviceOrchestrator::report(const char* operation,
                                                         std::optional<OperationError> error) const
{
    if (error)
        qWarning() << "[Orchestrator]" << operation << "failed:" << *error;
    return error;
}

} // namespace mdk
