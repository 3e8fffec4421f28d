#pragma once

#include "ICommandRunner.hpp"

namespace mdk {

/// ICommandRunner backed by a QProcess per call.
/// The process is killed and reaped before run() returns on timeout.
class ProcessCommandRunner : public ICommandRunner {
public:
    CommandOutcome run(const CommandSpec& spec) override;

private:
    static constexpr int REAP_TIMEOUT_MS = 1000;
};

} // namespace mdk
