#include <QtTest>
#include <QElapsedTimer>
#include "core/process/ProcessCommandRunner.hpp"

using mdk::CommandSpec;
using mdk::ErrorCause;
using mdk::ErrorKind;

namespace {

CommandSpec shell(const QString& script, int timeoutMs = 5000)
{
    CommandSpec spec;
    spec.program = "/bin/sh";
    spec.arguments = {"-c", script};
    spec.timeout = std::chrono::milliseconds(timeoutMs);
    return spec;
}

} // namespace

class TestProcessCommandRunner : public QObject {
    Q_OBJECT
private slots:
    void testCapturesTrimmedStdout();
    void testSeparatesStreams();
    void testZeroExitIsSuccessRegardlessOfOutput();
    void testNonZeroExitIsCommandFailed();
    void testMissingProgramFailsToStart();
    void testDeadlineIsTimeout();
    void testDeadlineWinsOverLaterExitStatus();
    void testLabelNamesCommand();
};

void TestProcessCommandRunner::testCapturesTrimmedStdout()
{
    mdk::ProcessCommandRunner runner;
    auto outcome = runner.run(shell("printf '  hello world \\n\\n'"));
    QVERIFY(outcome.ok());
    QCOMPARE(outcome.stdoutText, QString("hello world"));
    QCOMPARE(outcome.stderrText, QString());
}

void TestProcessCommandRunner::testSeparatesStreams()
{
    mdk::ProcessCommandRunner runner;
    auto outcome = runner.run(shell("echo out; echo err >&2"));
    QVERIFY(outcome.ok());
    QCOMPARE(outcome.stdoutText, QString("out"));
    QCOMPARE(outcome.stderrText, QString("err"));
}

void TestProcessCommandRunner::testZeroExitIsSuccessRegardlessOfOutput()
{
    mdk::ProcessCommandRunner runner;
    auto outcome = runner.run(shell("echo 'failed: everything'; echo error >&2; exit 0"));
    QVERIFY(outcome.ok());
    QCOMPARE(outcome.stdoutText, QString("failed: everything"));
}

void TestProcessCommandRunner::testNonZeroExitIsCommandFailed()
{
    mdk::ProcessCommandRunner runner;
    auto outcome = runner.run(shell("echo partial; echo broken >&2; exit 3"));
    QVERIFY(!outcome.ok());
    QVERIFY(outcome.error->is(ErrorKind::CommandFailed));
    QCOMPARE(outcome.error->exitCodeOrZero(), 3);
    QCOMPARE(outcome.error->stdoutText, QString("partial"));
    QCOMPARE(outcome.error->stderrText, QString("broken"));
    QVERIFY(outcome.error->unwrap() != nullptr);
    QVERIFY(outcome.error->unwrap()->type == ErrorCause::Type::ExitStatus);
}

void TestProcessCommandRunner::testMissingProgramFailsToStart()
{
    mdk::ProcessCommandRunner runner;
    CommandSpec spec;
    spec.program = "/nonexistent/mirrordeck-missing-tool";
    spec.arguments = {"devices"};

    auto outcome = runner.run(spec);
    QVERIFY(!outcome.ok());
    QVERIFY(outcome.error->is(ErrorKind::CommandFailed));
    QVERIFY(!outcome.error->exitCode.has_value());
    QVERIFY(outcome.error->unwrap()->type == ErrorCause::Type::FailedToStart);
}

void TestProcessCommandRunner::testDeadlineIsTimeout()
{
    mdk::ProcessCommandRunner runner;
    QElapsedTimer timer;
    timer.start();

    auto outcome = runner.run(shell("sleep 10", 200));

    QVERIFY(timer.elapsed() < 3000);
    QVERIFY(!outcome.ok());
    QVERIFY(outcome.error->is(ErrorKind::Timeout));
    QVERIFY(outcome.error->unwrap()->type == ErrorCause::Type::DeadlineExceeded);
    QCOMPARE(outcome.error->unwrap()->description, QString("deadline of 200 ms exceeded"));
}

void TestProcessCommandRunner::testDeadlineWinsOverLaterExitStatus()
{
    mdk::ProcessCommandRunner runner;
    auto outcome = runner.run(shell("echo started; sleep 10; exit 7", 300));
    QVERIFY(!outcome.ok());
    QVERIFY(outcome.error->is(ErrorKind::Timeout));
    QVERIFY(!outcome.error->is(ErrorKind::CommandFailed));
}

void TestProcessCommandRunner::testLabelNamesCommand()
{
    mdk::ProcessCommandRunner runner;
    auto spec = shell("exit 1");
    spec.label = "adb connect";

    auto outcome = runner.run(spec);
    QVERIFY(!outcome.ok());
    QCOMPARE(outcome.error->command, QString("adb connect"));
    QCOMPARE(outcome.error->text(), QString("command failed: adb connect"));

    spec.label.clear();
    QCOMPARE(spec.displayName(), QString("/bin/sh -c exit 1"));
}

QTEST_MAIN(TestProcessCommandRunner)
#include "test_process_command_runner.moc"
