#pragma once

#include "Device.hpp"
#include "OutputClassifier.hpp"
#include "core/OperationError.hpp"
#include "core/process/ICommandRunner.hpp"
#include <QString>
#include <QVector>
#include <chrono>
#include <optional>

namespace mdk {

/// Device discovery and connection management through the bridge tool (adb).
///
/// The tool reports most outcomes only as human-readable text, so each
/// operation validates its inputs, runs one bounded command and classifies
/// stdout against operation-specific phrase groups. Output matching neither
/// group is a parse error, never a silent success.
///
/// Holds no mutable state; all methods may run concurrently.
/// Does NOT own the runner (caller manages lifetime).
class BridgeClient {
public:
    static constexpr std::chrono::milliseconds DEFAULT_TIMEOUT{10000};

    BridgeClient(ICommandRunner* runner, const QString& program,
                 std::chrono::milliseconds timeout = DEFAULT_TIMEOUT);

    QString program() const { return program_; }
    std::chrono::milliseconds timeout() const { return timeout_; }

    std::optional<OperationError> listDevices(QVector<Device>& devices) const;
    std::optional<OperationError> pairDevice(const QString& address, int port,
                                             const QString& code) const;
    std::optional<OperationError> connectDevice(const QString& address, int port) const;
    std::optional<OperationError> enableWireless(int port) const;
    std::optional<OperationError> disconnectDevice(const QString& address, int port) const;

    /// Parse `adb devices` stdout. Skips blank lines and the header; a line
    /// with fewer than two fields fails the whole listing.
    static std::optional<OperationError> parseDeviceList(const QString& command,
                                                         const QString& stdoutText,
                                                         const QString& stderrText,
                                                         QVector<Device>& devices);

    static const PhraseGroups PAIR_PHRASES;
    static const PhraseGroups CONNECT_PHRASES;
    static const PhraseGroups TCPIP_PHRASES;
    static const PhraseGroups DISCONNECT_PHRASES;

private:
    CommandOutcome run(const QString& subcommand, const QStringList& arguments) const;
    std::optional<OperationError> runClassified(const QString& subcommand,
                                                const QStringList& arguments,
                                                const PhraseGroups& phrases) const;
    QString label(const QString& subcommand) const;

    ICommandRunner* runner_;
    QString program_;
    std::chrono::milliseconds timeout_;
};

} // namespace mdk
