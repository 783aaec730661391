#pragma once

#include <filesystem>
#include <string>
#include <vector>
#include "core/errors/gitmcp_errors.hpp"

namespace gitmcp::process {

struct CommandInvocation {
    std::string program;
    std::vector<std::string> arguments;
    std::filesystem::path working_directory = ".";
};

struct ExecutionResult {
    int exit_code = -1;
    std::string stdout_text;
    std::string stderr_text;
    double duration_ms = 0.0;
};

// Runs one external program to completion and captures both output streams.
// A non-zero exit is a value; an error means the program never ran.
class ProcessRunner {
public:
    virtual ~ProcessRunner() = default;

    virtual core::errors::Result<ExecutionResult> run(
        const CommandInvocation& invocation) = 0;
};

std::string describe(const CommandInvocation& invocation);

}  // namespace gitmcp::process
