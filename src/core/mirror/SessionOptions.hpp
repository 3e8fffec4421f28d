#pragma once

#include <QString>
#include <QStringList>

namespace mdk {

/// Options for one mirroring launch. Empty / zero / false values are omitted
/// from the command line so the mirroring tool's own defaults apply.
struct SessionOptions {
    QString bitRate;          // e.g. "8M"
    int maxSize = 0;          // longest screen dimension, pixels
    int maxFps = 0;
    bool turnScreenOff = false;
    bool fullscreen = false;
    bool stayAwake = false;
    QString recordPath;
    QString windowTitle;
    QStringList extraArgs;    // appended verbatim
};

/// Argument vector for the mirroring tool. "-s <deviceId>" leads when a
/// device is given.
QStringList buildMirrorArguments(const QString& deviceId, const SessionOptions& options);

} // namespace mdk
