#include <filesystem>
#include <string>
#include <variant>
#include <vector>
#include <gtest/gtest.h>
#include "app/cli_parser.hpp"
#include "core/errors/gitmcp_errors.hpp"

namespace {

using gitmcp::app::cli::CliInvocation;
using gitmcp::app::cli::parse_and_validate;
using gitmcp::core::errors::ErrorCategory;
using gitmcp::core::errors::get_error;
using gitmcp::core::errors::get_value;
using gitmcp::core::errors::is_error;
using gitmcp::core::logging::LogLevel;
namespace protocol = gitmcp::protocol;

gitmcp::core::errors::Result<CliInvocation> parse_tokens(
    const std::vector<std::string>& tokens) {
    std::vector<std::string> owned_args;
    owned_args.reserve(tokens.size() + 1);
    owned_args.emplace_back("gitmcp_cli");
    for (const auto& token : tokens) {
        owned_args.push_back(token);
    }

    std::vector<char*> argv;
    argv.reserve(owned_args.size());
    for (auto& arg : owned_args) {
        argv.push_back(arg.data());
    }

    return parse_and_validate(static_cast<int>(argv.size()), argv.data());
}

template <typename Request>
const Request* request_of(const CliInvocation& invocation) {
    const auto* request = std::get_if<protocol::OperationRequest>(&invocation.call);
    if (request == nullptr) {
        return nullptr;
    }
    return std::get_if<Request>(request);
}

TEST(CliParserTest, FailsWhenCommandMissing) {
    auto result = parse_tokens({});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::Input);
    EXPECT_EQ(get_error(result).code, "missing_command");
    EXPECT_FALSE(get_error(result).hint.empty());
}

TEST(CliParserTest, FailsWhenCommandUnknown) {
    auto result = parse_tokens({"rebase"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "unknown_command");
}

TEST(CliParserTest, FailsOnUnknownGlobalFlag) {
    auto result = parse_tokens({"--verbose", "status"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "unknown_argument");
}

TEST(CliParserTest, FailsWhenGlobalFlagValueMissing) {
    auto result = parse_tokens({"--repo"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "missing_value");
}

TEST(CliParserTest, FailsWhenRepoInvalid) {
    const auto missing_dir =
        std::filesystem::current_path() / "__definitely_missing_cli_parser_test_dir__";
    auto result = parse_tokens({"--repo", missing_dir.string(), "status"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_path");
}

TEST(CliParserTest, FailsWhenLogLevelInvalid) {
    auto result = parse_tokens({"--log-level", "loud", "status"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_log_level");
}

TEST(CliParserTest, FailsWhenCommitMessageMissing) {
    auto result = parse_tokens({"commit", "--file", "a.txt"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "missing_required_flag");
}

TEST(CliParserTest, FailsOnExtraStatusArgument) {
    auto result = parse_tokens({"status", "--short"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "unexpected_argument");
}

TEST(CliParserTest, ParsesGlobalConfiguration) {
    const auto cwd = std::filesystem::current_path();
    auto result = parse_tokens({"--repo", cwd.string(), "--git", "/opt/git/bin/git",
                                "--log-level", "debug", "--journal", "calls.jsonl",
                                "--default-remote", "upstream", "--default-branch", "trunk",
                                "--no-checkout-default", "status"});
    ASSERT_FALSE(is_error(result));

    const auto& config = get_value(result).config;
    EXPECT_EQ(config.adapter.working_directory.string(), std::filesystem::canonical(cwd).string());
    EXPECT_EQ(config.adapter.git_executable, "/opt/git/bin/git");
    EXPECT_EQ(config.log_level, LogLevel::DEBUG);
    ASSERT_TRUE(config.journal_path.has_value());
    EXPECT_EQ(config.journal_path->string(), "calls.jsonl");
    EXPECT_EQ(config.adapter.defaults.push.remote, "upstream");
    EXPECT_EQ(config.adapter.defaults.push.branch, "trunk");
    EXPECT_FALSE(config.adapter.defaults.create_branch.checkout);
    EXPECT_NE(request_of<protocol::StatusRequest>(get_value(result)), nullptr);
}

TEST(CliParserTest, DefaultsMatchDocumentedValues) {
    auto result = parse_tokens({"branches"});
    ASSERT_FALSE(is_error(result));

    const auto& config = get_value(result).config;
    EXPECT_EQ(config.adapter.git_executable, "git");
    EXPECT_EQ(config.adapter.defaults.push.remote, "origin");
    EXPECT_EQ(config.adapter.defaults.push.branch, "main");
    EXPECT_TRUE(config.adapter.defaults.create_branch.checkout);
    EXPECT_EQ(config.log_level, LogLevel::INFO);
    EXPECT_FALSE(config.journal_path.has_value());
    EXPECT_NE(request_of<protocol::BranchListRequest>(get_value(result)), nullptr);
}

TEST(CliParserTest, ParsesCloneWithDestination) {
    auto result = parse_tokens({"clone", "https://example.com/r.git", "r"});
    ASSERT_FALSE(is_error(result));
    const auto* clone = request_of<protocol::CloneRequest>(get_value(result));
    ASSERT_NE(clone, nullptr);
    EXPECT_EQ(clone->repository_url, "https://example.com/r.git");
    ASSERT_TRUE(clone->destination.has_value());
    EXPECT_EQ(clone->destination.value(), "r");
}

TEST(CliParserTest, ParsesCommitWithFilesInOrder) {
    auto result = parse_tokens({"commit", "-m", "fix", "--file", "b.txt", "--file", "a.txt"});
    ASSERT_FALSE(is_error(result));
    const auto* commit = request_of<protocol::CommitRequest>(get_value(result));
    ASSERT_NE(commit, nullptr);
    EXPECT_EQ(commit->message, "fix");
    ASSERT_TRUE(commit->files.has_value());
    EXPECT_EQ(commit->files.value(), (std::vector<std::string>{"b.txt", "a.txt"}));
}

TEST(CliParserTest, PushLeavesUnspecifiedValuesToDefaults) {
    auto result = parse_tokens({"push", "--branch", "topic"});
    ASSERT_FALSE(is_error(result));
    const auto* push = request_of<protocol::PushRequest>(get_value(result));
    ASSERT_NE(push, nullptr);
    EXPECT_FALSE(push->remote.has_value());
    ASSERT_TRUE(push->branch.has_value());
    EXPECT_EQ(push->branch.value(), "topic");
}

TEST(CliParserTest, ParsesCreateBranchWithoutCheckout) {
    auto result = parse_tokens({"create-branch", "feature", "--no-checkout"});
    ASSERT_FALSE(is_error(result));
    const auto* create = request_of<protocol::CreateBranchRequest>(get_value(result));
    ASSERT_NE(create, nullptr);
    EXPECT_EQ(create->branch_name, "feature");
    ASSERT_TRUE(create->checkout.has_value());
    EXPECT_FALSE(create->checkout.value());
}

TEST(CliParserTest, ParsesGenericToolCall) {
    auto result = parse_tokens({"call", "git_push", R"({"remote":"fork"})"});
    ASSERT_FALSE(is_error(result));
    const auto* call = std::get_if<protocol::ToolCall>(&get_value(result).call);
    ASSERT_NE(call, nullptr);
    EXPECT_EQ(call->name, "git_push");
    EXPECT_EQ(call->arguments, R"({"remote":"fork"})");
}

TEST(CliParserTest, ToolCallArgumentsDefaultToEmptyObject) {
    auto result = parse_tokens({"call", "git_status"});
    ASSERT_FALSE(is_error(result));
    const auto* call = std::get_if<protocol::ToolCall>(&get_value(result).call);
    ASSERT_NE(call, nullptr);
    EXPECT_EQ(call->arguments, "{}");
}

}  // namespace
