#include "BridgeClient.hpp"

#include <QFileInfo>
#include <QRegularExpression>
#include <boost/log/trivial.hpp>

namespace mdk {

namespace {

const QLatin1String DEVICE_LIST_HEADER("List of devices attached");

QString endpoint(const QString& address, int port)
{
    return QStringLiteral("%1:%2").arg(address.trimmed()).arg(port);
}

constexpr int MAX_PORT = 65535;

bool validPort(int port)
{
    return port > 0 && port <= MAX_PORT;
}

bool validEndpoint(const QString& address, int port)
{
    return !address.trimmed().isEmpty() && validPort(port);
}

} // namespace

const PhraseGroups BridgeClient::PAIR_PHRASES{
    {QStringLiteral("successfully paired"), QStringLiteral("already paired")},
    {QStringLiteral("failed"), QStringLiteral("error")}};

const PhraseGroups BridgeClient::CONNECT_PHRASES{
    {QStringLiteral("connected to"), QStringLiteral("already connected")},
    {QStringLiteral("failed"), QStringLiteral("unable")}};

const PhraseGroups BridgeClient::TCPIP_PHRASES{
    {QStringLiteral("restarting in tcp mode"), QStringLiteral("already in tcp")},
    {QStringLiteral("error"), QStringLiteral("failed")}};

const PhraseGroups BridgeClient::DISCONNECT_PHRASES{
    {QStringLiteral("disconnected"), QStringLiteral("no such device")},
    {QStringLiteral("error"), QStringLiteral("failed")}};

BridgeClient::BridgeClient(ICommandRunner* runner, const QString& program,
                           std::chrono::milliseconds timeout)
    : runner_(runner)
    , program_(program)
    , timeout_(timeout)
{
}

std::optional<OperationError> BridgeClient::listDevices(QVector<Device>& devices) const
{
    auto outcome = run(QStringLiteral("devices"), {});
    if (outcome.error)
        return outcome.error;
    return parseDeviceList(label(QStringLiteral("devices")),
                           outcome.stdoutText, outcome.stderrText, devices);
}

std::optional<OperationError> BridgeClient::pairDevice(const QString& address, int port,
                                                       const QString& code) const
{
    if (!validEndpoint(address, port) || code.trimmed().isEmpty())
        return OperationError::invalidInput(QStringLiteral("pair requires ip, port, and code"));

    BOOST_LOG_TRIVIAL(info) << "[Bridge] Pairing with " << endpoint(address, port).toStdString();
    return runClassified(QStringLiteral("pair"),
                         {endpoint(address, port), code.trimmed()}, PAIR_PHRASES);
}

std::optional<OperationError> BridgeClient::connectDevice(const QString& address, int port) const
{
    if (!validEndpoint(address, port))
        return OperationError::invalidInput(QStringLiteral("connect requires ip and port"));

    BOOST_LOG_TRIVIAL(info) << "[Bridge] Connecting to " << endpoint(address, port).toStdString();
    return runClassified(QStringLiteral("connect"), {endpoint(address, port)}, CONNECT_PHRASES);
}

std::optional<OperationError> BridgeClient::enableWireless(int port) const
{
    if (!validPort(port))
        return OperationError::invalidInput(QStringLiteral("tcpip requires a port"));

    BOOST_LOG_TRIVIAL(info) << "[Bridge] Switching device to TCP mode on port " << port;
    return runClassified(QStringLiteral("tcpip"), {QString::number(port)}, TCPIP_PHRASES);
}

std::optional<OperationError> BridgeClient::disconnectDevice(const QString& address, int port) const
{
    if (!validEndpoint(address, port))
        return OperationError::invalidInput(QStringLiteral("disconnect requires ip and port"));

    BOOST_LOG_TRIVIAL(info) << "[Bridge] Disconnecting " << endpoint(address, port).toStdString();
    return runClassified(QStringLiteral("disconnect"), {endpoint(address, port)},
                         DISCONNECT_PHRASES);
}

std::optional<OperationError> BridgeClient::parseDeviceList(const QString& command,
                                                            const QString& stdoutText,
                                                            const QString& stderrText,
                                                            QVector<Device>& devices)
{
    static const QRegularExpression whitespace(QStringLiteral("\\s+"));

    QVector<Device> parsed;
    const auto lines = stdoutText.split(QLatin1Char('\n'));
    for (const auto& rawLine : lines) {
        const QString line = rawLine.trimmed();
        if (line.isEmpty() || line.startsWith(DEVICE_LIST_HEADER))
            continue;

        const auto fields = line.split(whitespace, Qt::SkipEmptyParts);
        if (fields.size() < 2) {
            BOOST_LOG_TRIVIAL(warning) << "[Bridge] Malformed device line: " << line.toStdString();
            return OperationError::parse(
                command, stdoutText, stderrText,
                ErrorCause::detail(QStringLiteral("unexpected device line: \"%1\"").arg(line)));
        }
        parsed.append(Device{fields.at(0), fields.at(1)});
    }

    devices = parsed;
    return std::nullopt;
}

CommandOutcome BridgeClient::run(const QString& subcommand, const QStringList& arguments) const
{
    CommandSpec spec;
    spec.program = program_;
    spec.arguments = QStringList{subcommand} + arguments;
    spec.timeout = timeout_;
    spec.label = label(subcommand);
    return runner_->run(spec);
}

std::optional<OperationError> BridgeClient::runClassified(const QString& subcommand,
                                                          const QStringList& arguments,
                                                          const PhraseGroups& phrases) const
{
    auto outcome = run(subcommand, arguments);
    if (outcome.error)
        return outcome.error;

    const QString command = label(subcommand);
    switch (classifyOutput(outcome.stdoutText, phrases)) {
    case OutputVerdict::Success:
        return std::nullopt;
    case OutputVerdict::Failure:
        BOOST_LOG_TRIVIAL(warning) << "[Bridge] " << command.toStdString()
                                   << " reported failure: " << outcome.stdoutText.toStdString();
        return OperationError::commandFailed(
            command, outcome.stdoutText, outcome.stderrText, 0,
            ErrorCause::detail(QStringLiteral("%1 failed").arg(subcommand)));
    case OutputVerdict::Unrecognized:
        break;
    }

    BOOST_LOG_TRIVIAL(warning) << "[Bridge] " << command.toStdString()
                               << " produced unrecognized output: " << outcome.stdoutText.toStdString();
    return OperationError::parse(command, outcome.stdoutText, outcome.stderrText,
                                 ErrorCause::detail(QStringLiteral("unexpected output")));
}

QString BridgeClient::label(const QString& subcommand) const
{
    return QFileInfo(program_).fileName() + QLatin1Char(' ') + subcommand;
}

} // namespace mdk
