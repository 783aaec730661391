#pragma once

#include "process/process_runner.hpp"

namespace gitmcp::process {

// fork/execvp based runner. The program is looked up on PATH, stdin is
// /dev/null and no shell is involved.
class PosixProcessRunner final : public ProcessRunner {
public:
    core::errors::Result<ExecutionResult> run(
        const CommandInvocation& invocation) override;
};

}  // namespace gitmcp::process
