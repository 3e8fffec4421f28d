#include "core/YamlConfig.hpp"

namespace mdk {

YamlConfig::YamlConfig()
{
    initDefaults();
}

void YamlConfig::initDefaults()
{
    root_ = YAML::Node(YAML::NodeType::Map);

    root_["bridge"]["path"] = "adb";
    root_["bridge"]["timeout_ms"] = 10000;

    root_["mirror"]["path"] = "scrcpy";
    root_["mirror"]["session_ceiling_ms"] = 86400000LL;
    root_["mirror"]["stop_grace_ms"] = 5000;

    YAML::Node defaults;
    defaults["bit_rate"] = "";
    defaults["max_size"] = 0;
    defaults["max_fps"] = 0;
    defaults["turn_screen_off"] = false;
    defaults["fullscreen"] = false;
    defaults["stay_awake"] = false;
    defaults["record"] = "";
    defaults["window_title"] = "";
    defaults["extra_args"] = YAML::Node(YAML::NodeType::Sequence);
    root_["mirror"]["defaults"] = defaults;

    root_["logging"]["level"] = "info";
}

// Deep merge: mappings recurse, sequences and scalars in the overlay win,
// keys missing from the overlay keep their defaults.
YAML::Node YamlConfig::mergeYaml(const YAML::Node& base, const YAML::Node& overlay)
{
    if (!overlay.IsDefined() || overlay.IsNull())
        return YAML::Clone(base);

    if (!base.IsDefined() || base.IsNull() || !base.IsMap() || !overlay.IsMap())
        return YAML::Clone(overlay);

    YAML::Node merged = YAML::Clone(base);
    for (auto it = overlay.begin(); it != overlay.end(); ++it) {
        const auto key = it->first.as<std::string>();
        merged[key] = merged[key] ? mergeYaml(merged[key], it->second)
                                  : YAML::Clone(it->second);
    }
    return merged;
}

void YamlConfig::load(const QString& filePath)
{
    const YAML::Node loaded = YAML::LoadFile(filePath.toStdString());
    YamlConfig defaults;
    root_ = mergeYaml(defaults.root_, loaded);
}

// --- Bridge ---

QString YamlConfig::bridgePath() const
{
    return QString::fromStdString(root_["bridge"]["path"].as<std::string>("adb"));
}

int YamlConfig::bridgeTimeoutMs() const
{
    return root_["bridge"]["timeout_ms"].as<int>(10000);
}

// --- Mirror ---

QString YamlConfig::mirrorPath() const
{
    return QString::fromStdString(root_["mirror"]["path"].as<std::string>("scrcpy"));
}

qint64 YamlConfig::sessionCeilingMs() const
{
    return root_["mirror"]["session_ceiling_ms"].as<long long>(86400000LL);
}

int YamlConfig::stopGraceMs() const
{
    return root_["mirror"]["stop_grace_ms"].as<int>(5000);
}

// --- Mirror defaults ---

QString YamlConfig::defaultBitRate() const
{
    return QString::fromStdString(root_["mirror"]["defaults"]["bit_rate"].as<std::string>(""));
}

int YamlConfig::defaultMaxSize() const
{
    return root_["mirror"]["defaults"]["max_size"].as<int>(0);
}

int YamlConfig::defaultMaxFps() const
{
    return root_["mirror"]["defaults"]["max_fps"].as<int>(0);
}

bool YamlConfig::defaultTurnScreenOff() const
{
    return root_["mirror"]["defaults"]["turn_screen_off"].as<bool>(false);
}

bool YamlConfig::defaultFullscreen() const
{
    return root_["mirror"]["defaults"]["fullscreen"].as<bool>(false);
}

bool YamlConfig::defaultStayAwake() const
{
    return root_["mirror"]["defaults"]["stay_awake"].as<bool>(false);
}

QString YamlConfig::defaultRecordPath() const
{
    return QString::fromStdString(root_["mirror"]["defaults"]["record"].as<std::string>(""));
}

QString YamlConfig::defaultWindowTitle() const
{
    return QString::fromStdString(root_["mirror"]["defaults"]["window_title"].as<std::string>(""));
}

QStringList YamlConfig::defaultExtraArgs() const
{
    QStringList result;
    const YAML::Node args = root_["mirror"]["defaults"]["extra_args"];
    if (args.IsSequence()) {
        for (const auto& node : args) {
            if (node.IsScalar())
                result.append(QString::fromStdString(node.Scalar()));
        }
    }
    return result;
}

// --- Logging ---

QString YamlConfig::logLevel() const
{
    return QString::fromStdString(root_["logging"]["level"].as<std::string>("info"));
}

// --- Conversions ---

OrchestratorSettings YamlConfig::orchestratorSettings() const
{
    OrchestratorSettings settings;
    settings.bridgePath = bridgePath();
    settings.mirrorPath = mirrorPath();
    if (bridgeTimeoutMs() > 0)
        settings.bridgeTimeout = std::chrono::milliseconds(bridgeTimeoutMs());
    if (sessionCeilingMs() > 0)
        settings.mirrorTimings.sessionCeiling = std::chrono::milliseconds(sessionCeilingMs());
    if (stopGraceMs() > 0)
        settings.mirrorTimings.stopGrace = std::chrono::milliseconds(stopGraceMs());
    return settings;
}

SessionOptions YamlConfig::defaultSessionOptions() const
{
    SessionOptions options;
    options.bitRate = defaultBitRate();
    options.maxSize = defaultMaxSize();
    options.maxFps = defaultMaxFps();
    options.turnScreenOff = defaultTurnScreenOff();
    options.fullscreen = defaultFullscreen();
    options.stayAwake = defaultStayAwake();
    options.recordPath = defaultRecordPath();
    options.windowTitle = defaultWindowTitle();
    options.extraArgs = defaultExtraArgs();
    return options;
}

} // namespace mdk
