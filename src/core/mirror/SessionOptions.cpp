#include "SessionOptions.hpp"

namespace mdk {

QStringList buildMirrorArguments(const QString& deviceId, const SessionOptions& options)
{
    QStringList args;
    if (!deviceId.isEmpty())
        args << QStringLiteral("-s") << deviceId;
    if (!options.bitRate.isEmpty())
        args << QStringLiteral("--bit-rate") << options.bitRate;
    if (options.maxSize > 0)
        args << QStringLiteral("--max-size") << QString::number(options.maxSize);
    if (options.maxFps > 0)
        args << QStringLiteral("--max-fps") << QString::number(options.maxFps);
    if (options.turnScreenOff)
        args << QStringLiteral("--turn-screen-off");
    if (options.fullscreen)
        args << QStringLiteral("--fullscreen");
    if (options.stayAwake)
        args << QStringLiteral("--stay-awake");
    if (!options.recordPath.isEmpty())
        args << QStringLiteral("--record") << options.recordPath;
    if (!options.windowTitle.isEmpty())
        args << QStringLiteral("--window-title") << options.windowTitle;
    args << options.extraArgs;
    return args;
}

} // namespace mdk
