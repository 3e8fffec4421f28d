#include <QtTest>
#include <QTemporaryDir>
#include "core/YamlConfig.hpp"

class TestYamlConfig : public QObject {
    Q_OBJECT
private slots:
    void initTestCase();
    void testLoadDefaults();
    void testLoadFromFileMergesOverDefaults();
    void testMergeYaml();
    void testOrchestratorSettings();
    void testNonPositiveTimeoutsFallBack();
    void testDefaultSessionOptions();
    void testExtraArgsSkipsNonScalarEntries();
    void testMistypedValuesFallBack();
    void testMalformedFileThrows();
    void testFailedReloadKeepsPreviousValues();

private:
    QString writeConfig(const QString& name, const QByteArray& yaml);

    QTemporaryDir dir_;
};

void TestYamlConfig::initTestCase()
{
    QVERIFY(dir_.isValid());
}

QString TestYamlConfig::writeConfig(const QString& name, const QByteArray& yaml)
{
    const QString path = dir_.filePath(name);
    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate))
        return {};
    file.write(yaml);
    return path;
}

void TestYamlConfig::testLoadDefaults()
{
    mdk::YamlConfig config;
    QCOMPARE(config.bridgePath(), QString("adb"));
    QCOMPARE(config.bridgeTimeoutMs(), 10000);
    QCOMPARE(config.mirrorPath(), QString("scrcpy"));
    QCOMPARE(config.sessionCeilingMs(), qint64(86400000));
    QCOMPARE(config.stopGraceMs(), 5000);
    QCOMPARE(config.defaultBitRate(), QString());
    QCOMPARE(config.defaultMaxSize(), 0);
    QCOMPARE(config.defaultMaxFps(), 0);
    QCOMPARE(config.defaultTurnScreenOff(), false);
    QCOMPARE(config.defaultFullscreen(), false);
    QCOMPARE(config.defaultStayAwake(), false);
    QVERIFY(config.defaultExtraArgs().isEmpty());
    QCOMPARE(config.logLevel(), QString("info"));
}

void TestYamlConfig::testLoadFromFileMergesOverDefaults()
{
    mdk::YamlConfig config;
    config.load(QString(TEST_DATA_DIR) + "/test_config.yaml");

    QCOMPARE(config.bridgePath(), QString("/opt/platform-tools/adb"));
    QCOMPARE(config.bridgeTimeoutMs(), 2500);
    QCOMPARE(config.sessionCeilingMs(), qint64(3600000));
    QCOMPARE(config.defaultBitRate(), QString("4M"));
    QCOMPARE(config.defaultMaxFps(), 30);
    QCOMPARE(config.defaultStayAwake(), true);
    QCOMPARE(config.defaultExtraArgs(), QStringList({"--no-audio", "--verbosity=debug"}));
    QCOMPARE(config.logLevel(), QString("debug"));

    // Keys absent from the file keep their defaults
    QCOMPARE(config.mirrorPath(), QString("scrcpy"));
    QCOMPARE(config.stopGraceMs(), 5000);
    QCOMPARE(config.defaultMaxSize(), 0);
    QCOMPARE(config.defaultFullscreen(), false);
}

void TestYamlConfig::testMergeYaml()
{
    YAML::Node base = YAML::Load("a: 1\nnested: {x: 1, y: 2}\nlist: [1, 2]\n");
    YAML::Node overlay = YAML::Load("nested: {y: 5}\nlist: [9]\nextra: yes\n");

    YAML::Node merged = mdk::YamlConfig::mergeYaml(base, overlay);
    QCOMPARE(merged["a"].as<int>(), 1);
    QCOMPARE(merged["nested"]["x"].as<int>(), 1);
    QCOMPARE(merged["nested"]["y"].as<int>(), 5);
    QCOMPARE(static_cast<int>(merged["list"].size()), 1);
    QCOMPARE(merged["list"][0].as<int>(), 9);
    QVERIFY(merged["extra"].IsDefined());

    // Base is left untouched
    QCOMPARE(base["nested"]["y"].as<int>(), 2);

    // Null overlay keeps base
    YAML::Node kept = mdk::YamlConfig::mergeYaml(base, YAML::Node());
    QCOMPARE(kept["a"].as<int>(), 1);
}

void TestYamlConfig::testOrchestratorSettings()
{
    mdk::YamlConfig config;
    config.load(QString(TEST_DATA_DIR) + "/test_config.yaml");

    auto settings = config.orchestratorSettings();
    QCOMPARE(settings.bridgePath, QString("/opt/platform-tools/adb"));
    QCOMPARE(settings.mirrorPath, QString("scrcpy"));
    QVERIFY(settings.bridgeTimeout == std::chrono::milliseconds(2500));
    QVERIFY(settings.mirrorTimings.sessionCeiling == std::chrono::milliseconds(3600000));
    QVERIFY(settings.mirrorTimings.stopGrace == std::chrono::milliseconds(5000));
}

void TestYamlConfig::testNonPositiveTimeoutsFallBack()
{
    mdk::YamlConfig config;
    config.load(writeConfig("timeouts.yaml",
        "bridge: {timeout_ms: 0}\n"
        "mirror: {session_ceiling_ms: -1, stop_grace_ms: -50}\n"));

    auto settings = config.orchestratorSettings();
    QVERIFY(settings.bridgeTimeout == std::chrono::milliseconds(10000));
    QVERIFY(settings.mirrorTimings.sessionCeiling == std::chrono::hours(24));
    QVERIFY(settings.mirrorTimings.stopGrace == std::chrono::milliseconds(5000));
}

void TestYamlConfig::testDefaultSessionOptions()
{
    mdk::YamlConfig config;
    config.load(writeConfig("options.yaml",
        "mirror:\n"
        "  defaults:\n"
        "    bit_rate: 8M\n"
        "    max_size: 1280\n"
        "    turn_screen_off: true\n"
        "    record: /tmp/out.mkv\n"));

    auto options = config.defaultSessionOptions();
    QCOMPARE(options.bitRate, QString("8M"));
    QCOMPARE(options.maxSize, 1280);
    QCOMPARE(options.maxFps, 0);
    QCOMPARE(options.turnScreenOff, true);
    QCOMPARE(options.fullscreen, false);
    QCOMPARE(options.recordPath, QString("/tmp/out.mkv"));
    QVERIFY(options.windowTitle.isEmpty());
}

void TestYamlConfig::testExtraArgsSkipsNonScalarEntries()
{
    mdk::YamlConfig config;
    config.load(writeConfig("extra_args.yaml",
        "mirror:\n"
        "  defaults:\n"
        "    extra_args:\n"
        "      - --no-audio\n"
        "      - {a: b}\n"
        "      - [nested]\n"
        "      - --show-touches\n"));

    QCOMPARE(config.defaultExtraArgs(), QStringList({"--no-audio", "--show-touches"}));
    QCOMPARE(config.defaultSessionOptions().extraArgs,
             QStringList({"--no-audio", "--show-touches"}));
}

void TestYamlConfig::testMistypedValuesFallBack()
{
    mdk::YamlConfig config;
    config.load(writeConfig("mistyped.yaml",
        "bridge: {path: [adb], timeout_ms: soon}\n"
        "mirror: {defaults: {max_fps: {x: 1}, fullscreen: maybe, extra_args: --oops}}\n"));

    QCOMPARE(config.bridgePath(), QString("adb"));
    QCOMPARE(config.bridgeTimeoutMs(), 10000);
    QCOMPARE(config.defaultMaxFps(), 0);
    QCOMPARE(config.defaultFullscreen(), false);
    QVERIFY(config.defaultExtraArgs().isEmpty());
}

void TestYamlConfig::testMalformedFileThrows()
{
    mdk::YamlConfig config;
    bool threw = false;
    try {
        config.load(writeConfig("malformed.yaml", "bridge: [unterminated\n"));
    } catch (const YAML::Exception&) {
        threw = true;
    }
    QVERIFY(threw);

    threw = false;
    try {
        config.load(dir_.filePath("no_such_config.yaml"));
    } catch (const YAML::BadFile&) {
        threw = true;
    }
    QVERIFY(threw);
    QCOMPARE(config.bridgePath(), QString("adb"));
}

void TestYamlConfig::testFailedReloadKeepsPreviousValues()
{
    mdk::YamlConfig config;
    config.load(QString(TEST_DATA_DIR) + "/test_config.yaml");
    QCOMPARE(config.bridgeTimeoutMs(), 2500);

    bool threw = false;
    try {
        config.load(writeConfig("broken_reload.yaml", "mirror: {path: [\n"));
    } catch (const YAML::Exception&) {
        threw = true;
    }
    QVERIFY(threw);

    QCOMPARE(config.bridgePath(), QString("/opt/platform-tools/adb"));
    QCOMPARE(config.bridgeTimeoutMs(), 2500);
    QCOMPARE(config.defaultExtraArgs(), QStringList({"--no-audio", "--verbosity=debug"}));
}

QTEST_MAIN(TestYamlConfig)
#include "test_yaml_config.moc"
