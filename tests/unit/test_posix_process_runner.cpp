#include <filesystem>
#include <string>
#include <gtest/gtest.h>
#include "core/config/call_id.hpp"
#include "core/errors/gitmcp_errors.hpp"
#include "process/posix_process_runner.hpp"

namespace {

using gitmcp::core::errors::ErrorCategory;
using gitmcp::core::errors::get_error;
using gitmcp::core::errors::get_value;
using gitmcp::core::errors::is_error;
using gitmcp::process::CommandInvocation;
using gitmcp::process::PosixProcessRunner;

class TempWorkspace {
public:
    TempWorkspace() {
        root_ = std::filesystem::current_path() /
                (".tmp_process_runner_" + gitmcp::core::config::generate_call_id());
        std::filesystem::create_directories(root_);
    }

    ~TempWorkspace() {
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
    }

    const std::filesystem::path& root() const { return root_; }

private:
    std::filesystem::path root_;
};

CommandInvocation shell(const std::string& script) {
    CommandInvocation invocation;
    invocation.program = "sh";
    invocation.arguments = {"-c", script};
    return invocation;
}

TEST(PosixProcessRunnerTest, CapturesBothStreamsAndExitCode) {
    PosixProcessRunner runner;
    auto result = runner.run(shell("printf out; printf err >&2; exit 3"));
    ASSERT_FALSE(is_error(result));

    const auto& capture = get_value(result);
    EXPECT_EQ(capture.exit_code, 3);
    EXPECT_EQ(capture.stdout_text, "out");
    EXPECT_EQ(capture.stderr_text, "err");
    EXPECT_GE(capture.duration_ms, 0.0);
}

TEST(PosixProcessRunnerTest, PassesArgumentsVerbatimWithoutShell) {
    PosixProcessRunner runner;
    CommandInvocation invocation;
    invocation.program = "printf";
    invocation.arguments = {"%s|", "two words", "$HOME", "*"};

    auto result = runner.run(invocation);
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).exit_code, 0);
    EXPECT_EQ(get_value(result).stdout_text, "two words|$HOME|*|");
}

TEST(PosixProcessRunnerTest, RunsInRequestedWorkingDirectory) {
    TempWorkspace workspace;
    PosixProcessRunner runner;
    CommandInvocation invocation;
    invocation.program = "pwd";
    invocation.working_directory = workspace.root();

    auto result = runner.run(invocation);
    ASSERT_FALSE(is_error(result));
    std::string printed = get_value(result).stdout_text;
    while (!printed.empty() && printed.back() == '\n') {
        printed.pop_back();
    }
    EXPECT_EQ(printed, std::filesystem::canonical(workspace.root()).string());
}

TEST(PosixProcessRunnerTest, DrainsLargeOutput) {
    PosixProcessRunner runner;
    auto result = runner.run(shell("i=0; while [ $i -lt 4000 ]; do "
                                   "echo 0123456789012345678901234567890123456789; "
                                   "echo e >&2; i=$((i+1)); done"));
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).exit_code, 0);
    EXPECT_EQ(get_value(result).stdout_text.size(), 4000u * 41u);
    EXPECT_EQ(get_value(result).stderr_text.size(), 4000u * 2u);
}

TEST(PosixProcessRunnerTest, ChildStdinIsEmpty) {
    PosixProcessRunner runner;
    CommandInvocation invocation;
    invocation.program = "cat";

    auto result = runner.run(invocation);
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).exit_code, 0);
    EXPECT_TRUE(get_value(result).stdout_text.empty());
}

TEST(PosixProcessRunnerTest, MissingProgramIsLaunchFailure) {
    PosixProcessRunner runner;
    CommandInvocation invocation;
    invocation.program = "gitmcp-no-such-program-for-tests";

    auto result = runner.run(invocation);
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::Execution);
    EXPECT_EQ(get_error(result).code, "launch_failed");
    EXPECT_NE(get_error(result).message.find("gitmcp-no-such-program-for-tests"),
              std::string::npos);
}

TEST(PosixProcessRunnerTest, MissingWorkingDirectoryIsReported) {
    PosixProcessRunner runner;
    CommandInvocation invocation = shell("true");
    invocation.working_directory =
        std::filesystem::current_path() / "__missing_process_runner_dir__";

    auto result = runner.run(invocation);
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_working_directory");
}

TEST(PosixProcessRunnerTest, RejectsEmptyProgram) {
    PosixProcessRunner runner;
    auto result = runner.run(CommandInvocation{});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::Input);
}

TEST(PosixProcessRunnerTest, DescribeQuotesArgumentsWithSpaces) {
    CommandInvocation invocation;
    invocation.program = "git";
    invocation.arguments = {"commit", "-m", "fix the build"};
    EXPECT_EQ(gitmcp::process::describe(invocation), "git commit -m \"fix the build\"");
}

}  // namespace
