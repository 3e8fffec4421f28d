#include <signal.h>
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDir>
#include <QFile>
#include <QTextStream>
#include <optional>
#include "core/Logging.hpp"
#include "core/OperationError.hpp"
#include "core/YamlConfig.hpp"
#include "core/services/DeviceOrchestrator.hpp"

namespace {

enum ExitStatus {
    ExitOk = 0,
    ExitOperationError = 1,
    ExitUsage = 2
};

QTextStream& out()
{
    static QTextStream stream(stdout);
    return stream;
}

QTextStream& err()
{
    static QTextStream stream(stderr);
    return stream;
}

int usageError(const QString& message, const QCommandLineParser& parser)
{
    err() << message << "\n\n" << parser.helpText();
    err().flush();
    return ExitUsage;
}

int finish(const std::optional<mdk::OperationError>& error)
{
    if (!error)
        return ExitOk;

    err() << "error[" << mdk::kindName(error->kind) << "]: " << error->text() << "\n";
    if (!error->stderrText.isEmpty())
        err() << error->stderrText << "\n";
    err().flush();
    return ExitOperationError;
}

// Empty for non-numeric text. Range checks belong to the operation.
std::optional<int> parseNumber(const QString& text)
{
    bool ok = false;
    const int value = text.trimmed().toInt(&ok);
    if (!ok)
        return std::nullopt;
    return value;
}

std::optional<QString> applyMirrorOptions(const QCommandLineParser& parser,
                                          mdk::SessionOptions& options,
                                          const QStringList& extraArgs)
{
    if (parser.isSet("bit-rate"))
        options.bitRate = parser.value("bit-rate");
    if (parser.isSet("max-size")) {
        const auto maxSize = parseNumber(parser.value("max-size"));
        if (!maxSize)
            return QStringLiteral("--max-size expects a number");
        options.maxSize = *maxSize;
    }
    if (parser.isSet("max-fps")) {
        const auto maxFps = parseNumber(parser.value("max-fps"));
        if (!maxFps)
            return QStringLiteral("--max-fps expects a number");
        options.maxFps = *maxFps;
    }
    if (parser.isSet("turn-screen-off"))
        options.turnScreenOff = true;
    if (parser.isSet("fullscreen"))
        options.fullscreen = true;
    if (parser.isSet("stay-awake"))
        options.stayAwake = true;
    if (parser.isSet("record"))
        options.recordPath = parser.value("record");
    if (parser.isSet("window-title"))
        options.windowTitle = parser.value("window-title");
    options.extraArgs.append(extraArgs);
    return std::nullopt;
}

void requestStop(int)
{
    QMetaObject::invokeMethod(QCoreApplication::instance(),
                              []() { QCoreApplication::quit(); },
                              Qt::QueuedConnection);
}

// Runs the event loop until the session exits on its own or a stop signal
// arrives, then tears the session down.
int runMirror(QCoreApplication& app, mdk::DeviceOrchestrator& orchestrator,
              const QString& deviceId, const mdk::SessionOptions& options)
{
    std::optional<int> finishedCode;
    bool finishedCrashed = false;
    const auto finished = QObject::connect(
        &orchestrator, &mdk::DeviceOrchestrator::sessionFinished, &app,
        [&](int exitCode, bool crashed) {
            finishedCode = exitCode;
            finishedCrashed = crashed;
            QCoreApplication::quit();
        }, Qt::QueuedConnection);

    if (auto error = orchestrator.startSession(deviceId, options)) {
        QObject::disconnect(finished);
        return finish(error);
    }

    signal(SIGINT, requestStop);
    signal(SIGTERM, requestStop);

    app.exec();

    signal(SIGINT, SIG_DFL);
    signal(SIGTERM, SIG_DFL);
    QObject::disconnect(finished);

    if (orchestrator.isSessionActive()) {
        qInfo() << "[CLI] Stop requested";
        auto error = orchestrator.stopSession();
        if (error && !error->is(mdk::ErrorKind::NotRunning))
            return finish(error);
        return ExitOk;
    }

    if (finishedCode && (finishedCrashed || *finishedCode != 0)) {
        auto error = mdk::OperationError::commandFailed(
            orchestrator.mirrorProgram(), {}, {},
            finishedCrashed ? std::nullopt : finishedCode,
            finishedCrashed ? mdk::ErrorCause::crashed(QStringLiteral("mirroring tool crashed"))
                            : mdk::ErrorCause::exitStatus(*finishedCode));
        error.message = QStringLiteral("mirroring session ended abnormally");
        return finish(error);
    }
    return ExitOk;
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName("mirrordeck");
    app.setApplicationVersion("0.1.0");
    app.setOrganizationName("MirrorDeck");

    // Everything after "--" goes to the mirroring tool untouched
    QStringList arguments = app.arguments();
    QStringList extraArgs;
    const int separator = arguments.indexOf(QStringLiteral("--"));
    if (separator >= 0) {
        extraArgs = arguments.mid(separator + 1);
        arguments = arguments.mid(0, separator);
    }

    QCommandLineParser parser;
    parser.setApplicationDescription(
        "Drive the Android bridge tool and supervise a screen mirroring session.");
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addOptions({
        {"config", "Configuration file (default ~/.mirrordeck/config.yaml).", "file"},
        {"adb", "Bridge tool executable.", "path"},
        {"scrcpy", "Mirroring tool executable.", "path"},
        {"verbose", "Log at debug level."},
        {{"s", "serial"}, "Device to mirror.", "serial"},
        {"bit-rate", "Video bit rate (e.g. 8M).", "value"},
        {"max-size", "Longest screen dimension in pixels.", "n"},
        {"max-fps", "Frame rate cap.", "n"},
        {"turn-screen-off", "Turn the device screen off while mirroring."},
        {"fullscreen", "Start fullscreen."},
        {"stay-awake", "Keep the device awake while mirroring."},
        {"record", "Record the session to a file.", "path"},
        {"window-title", "Mirroring window title.", "title"},
    });
    parser.addPositionalArgument("command",
        "devices | pair <address> <port> <code> | connect <address> <port> | "
        "tcpip <port> | disconnect <address> <port> | mirror [-- extra...]");

    if (!parser.parse(arguments))
        return usageError(parser.errorText(), parser);
    if (parser.isSet("help")) {
        out() << parser.helpText();
        return ExitOk;
    }
    if (parser.isSet("version")) {
        out() << app.applicationName() << " " << app.applicationVersion() << "\n";
        return ExitOk;
    }

    const QStringList positional = parser.positionalArguments();
    if (positional.isEmpty())
        return usageError(QStringLiteral("missing command"), parser);

    mdk::YamlConfig config;
    const QString configPath = parser.isSet("config")
        ? parser.value("config")
        : QDir::homePath() + "/.mirrordeck/config.yaml";
    if (parser.isSet("config") && !QFile::exists(configPath))
        return usageError(QStringLiteral("config file not found: %1").arg(configPath), parser);
    if (QFile::exists(configPath)) {
        try {
            config.load(configPath);
        } catch (const YAML::Exception& e) {
            err() << "error[invalid_input]: cannot load " << configPath << ": "
                  << QString::fromStdString(e.what()) << "\n";
            err().flush();
            return ExitOperationError;
        }
    }

    mdk::setLogLevel(parser.isSet("verbose") ? QStringLiteral("debug") : config.logLevel());

    mdk::OrchestratorSettings settings = config.orchestratorSettings();
    if (parser.isSet("adb"))
        settings.bridgePath = parser.value("adb");
    if (parser.isSet("scrcpy"))
        settings.mirrorPath = parser.value("scrcpy");

    mdk::DeviceOrchestrator orchestrator(settings);

    const QString command = positional.first();
    const QStringList params = positional.mid(1);

    if (command == "devices") {
        if (!params.isEmpty())
            return usageError(QStringLiteral("devices takes no arguments"), parser);
        QVector<mdk::Device> devices;
        if (auto error = orchestrator.listDevices(devices))
            return finish(error);
        for (const auto& device : devices)
            out() << device.id << '\t' << device.state << "\n";
        out().flush();
        return ExitOk;
    }

    if (command == "pair") {
        if (params.size() != 3)
            return usageError(QStringLiteral("usage: pair <address> <port> <code>"), parser);
        const auto port = parseNumber(params[1]);
        if (!port)
            return usageError(QStringLiteral("port must be a number: %1").arg(params[1]), parser);
        return finish(orchestrator.pairDevice(params[0], *port, params[2]));
    }

    if (command == "connect") {
        if (params.size() != 2)
            return usageError(QStringLiteral("usage: connect <address> <port>"), parser);
        const auto port = parseNumber(params[1]);
        if (!port)
            return usageError(QStringLiteral("port must be a number: %1").arg(params[1]), parser);
        return finish(orchestrator.connectDevice(params[0], *port));
    }

    if (command == "tcpip") {
        if (params.size() != 1)
            return usageError(QStringLiteral("usage: tcpip <port>"), parser);
        const auto port = parseNumber(params[0]);
        if (!port)
            return usageError(QStringLiteral("port must be a number: %1").arg(params[0]), parser);
        return finish(orchestrator.enableWireless(*port));
    }

    if (command == "disconnect") {
        if (params.size() != 2)
            return usageError(QStringLiteral("usage: disconnect <address> <port>"), parser);
        const auto port = parseNumber(params[1]);
        if (!port)
            return usageError(QStringLiteral("port must be a number: %1").arg(params[1]), parser);
        return finish(orchestrator.disconnectDevice(params[0], *port));
    }

    if (command == "mirror") {
        if (!params.isEmpty())
            return usageError(QStringLiteral("mirror takes options only; pass tool arguments after --"),
                              parser);
        mdk::SessionOptions options = config.defaultSessionOptions();
        if (const auto problem = applyMirrorOptions(parser, options, extraArgs))
            return usageError(*problem, parser);
        return runMirror(app, orchestrator, parser.value("serial"), options);
    }

    return usageError(QStringLiteral("unknown command: %1").arg(command), parser);
}
