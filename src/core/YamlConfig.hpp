#pragma once

#include "core/mirror/SessionOptions.hpp"
#include "core/services/DeviceOrchestrator.hpp"
#include <QString>
#include <QStringList>
#include <yaml-cpp/yaml.h>

namespace mdk {

class YamlConfig {
public:
    YamlConfig();

    /// Load @p filePath and deep-merge it over the built-in defaults.
    /// Throws YAML::Exception on unreadable or malformed files.
    /// A failed load leaves the previous values in place.
    void load(const QString& filePath);

    // Bridge tool
    QString bridgePath() const;
    int bridgeTimeoutMs() const;

    // Mirroring tool
    QString mirrorPath() const;
    qint64 sessionCeilingMs() const;
    int stopGraceMs() const;

    // Mirroring defaults
    QString defaultBitRate() const;
    int defaultMaxSize() const;
    int defaultMaxFps() const;
    bool defaultTurnScreenOff() const;
    bool defaultFullscreen() const;
    bool defaultStayAwake() const;
    QString defaultRecordPath() const;
    QString defaultWindowTitle() const;
    QStringList defaultExtraArgs() const;

    // Logging
    QString logLevel() const;

    /// Settings for DeviceOrchestrator. Non-positive timeouts use the defaults.
    OrchestratorSettings orchestratorSettings() const;
    SessionOptions defaultSessionOptions() const;

    static YAML::Node mergeYaml(const YAML::Node& base, const YAML::Node& overlay);

private:
    YAML::Node root_;

    void initDefaults();
};

} // namespace mdk
