#include "tools/git_command_adapter.hpp"

#include <exception>
#include <sstream>
#include <string_view>
#include <utility>
#include "core/logging/logger.hpp"

namespace gitmcp::tools {

using core::errors::ErrorCategory;
using core::errors::GitMcpError;
using core::errors::Result;
using process::ExecutionResult;
using protocol::BranchListRequest;
using protocol::BranchListResponse;
using protocol::CloneRequest;
using protocol::CloneResponse;
using protocol::CommitRequest;
using protocol::CommitResponse;
using protocol::CreateBranchRequest;
using protocol::CreateBranchResponse;
using protocol::PushRequest;
using protocol::PushResponse;
using protocol::StatusRequest;
using protocol::StatusResponse;

namespace {

constexpr std::string_view kWhitespace = " \t\n\r\f\v";

std::string trim(std::string_view text) {
    const auto first = text.find_first_not_of(kWhitespace);
    if (first == std::string_view::npos) {
        return "";
    }
    const auto last = text.find_last_not_of(kWhitespace);
    return std::string(text.substr(first, last - first + 1));
}

template <typename Response, typename Body>
Result<Response> guarded(const char* operation, Body&& body) {
    try {
        return body();
    } catch (const std::exception& e) {
        GITMCP_LOG_ERROR(std::string(operation) + " raised: " + e.what());
        return GitMcpError{ErrorCategory::Internal,
                           std::string(operation) + " failed unexpectedly: " + e.what(),
                           "unexpected_exception"};
    }
}

}  // namespace

bool is_clean_porcelain(const std::string& porcelain) {
    return trim(porcelain).empty();
}

std::vector<std::string> parse_branch_listing(const std::string& listing) {
    std::vector<std::string> branches;
    std::istringstream in(listing);
    std::string line;
    while (std::getline(in, line)) {
        std::string name = trim(line);
        if (name.empty()) {
            continue;
        }
        if (name.rfind("* ", 0) == 0) {
            name.erase(0, 2);
        }
        branches.push_back(std::move(name));
    }
    return branches;
}

GitCommandAdapter::GitCommandAdapter(process::ProcessRunner& runner,
                                     core::config::AdapterConfig config)
    : runner_(runner), config_(std::move(config)) {}

Result<ExecutionResult> GitCommandAdapter::git(
    std::vector<std::string> arguments) const {
    process::CommandInvocation invocation;
    invocation.program = config_.git_executable;
    invocation.arguments = std::move(arguments);
    invocation.working_directory = config_.working_directory;

    const std::string described = process::describe(invocation);
    GITMCP_LOG_DEBUG("exec: " + described);

    auto executed = runner_.run(invocation);
    if (core::errors::is_error(executed)) {
        const auto& err = core::errors::get_error(executed);
        GITMCP_LOG_ERROR("Launch failed [" + err.code + "]: " + err.message);
        return executed;
    }

    const auto& result = core::errors::get_value(executed);
    GITMCP_LOG_DEBUG("exit " + std::to_string(result.exit_code) + " after " +
                     std::to_string(static_cast<long long>(result.duration_ms)) +
                     " ms: " + described);
    return executed;
}

std::optional<GitMcpError> GitCommandAdapter::stage(const std::string& pathspec) const {
    auto staged = git({"add", pathspec});
    if (core::errors::is_error(staged)) {
        return core::errors::get_error(staged);
    }

    const auto& result = core::errors::get_value(staged);
    if (result.exit_code == 0) {
        return std::nullopt;
    }

    std::string message = "Failed to stage '" + pathspec + "' (exit code " +
                          std::to_string(result.exit_code) + ")";
    const std::string detail = trim(result.stderr_text);
    if (!detail.empty()) {
        message += ": " + detail;
    }
    return GitMcpError{ErrorCategory::Execution, message, "stage_failed"};
}

Result<CloneResponse> GitCommandAdapter::clone(const CloneRequest& request) const {
    return guarded<CloneResponse>("clone", [&]() -> Result<CloneResponse> {
        std::vector<std::string> arguments = {"clone", request.repository_url};
        if (request.destination.has_value() && !request.destination->empty()) {
            arguments.push_back(request.destination.value());
        }

        auto executed = git(std::move(arguments));
        if (core::errors::is_error(executed)) {
            return core::errors::get_error(executed);
        }
        const auto& result = core::errors::get_value(executed);
        return CloneResponse{result.exit_code == 0, result.stdout_text,
                             result.stderr_text};
    });
}

Result<CommitResponse> GitCommandAdapter::commit(const CommitRequest& request) const {
    return guarded<CommitResponse>("commit", [&]() -> Result<CommitResponse> {
        if (request.files.has_value() && !request.files->empty()) {
            for (const auto& path : request.files.value()) {
                if (auto failure = stage(path)) {
                    return failure.value();
                }
            }
        } else if (auto failure = stage(".")) {
            return failure.value();
        }

        auto executed = git({"commit", "-m", request.message});
        if (core::errors::is_error(executed)) {
            return core::errors::get_error(executed);
        }
        const auto& result = core::errors::get_value(executed);
        return CommitResponse{result.exit_code == 0, request.message,
                              result.stdout_text};
    });
}

Result<PushResponse> GitCommandAdapter::push(const PushRequest& request) const {
    return guarded<PushResponse>("push", [&]() -> Result<PushResponse> {
        const auto& defaults = config_.defaults.push;
        const std::string remote = request.remote.value_or(defaults.remote);
        const std::string branch = request.branch.value_or(defaults.branch);

        auto executed = git({"push", remote, branch});
        if (core::errors::is_error(executed)) {
            return core::errors::get_error(executed);
        }
        const auto& result = core::errors::get_value(executed);
        return PushResponse{result.exit_code == 0, result.stdout_text,
                            result.stderr_text};
    });
}

Result<StatusResponse> GitCommandAdapter::status(const StatusRequest&) const {
    return guarded<StatusResponse>("status", [&]() -> Result<StatusResponse> {
        auto executed = git({"status", "--porcelain"});
        if (core::errors::is_error(executed)) {
            return core::errors::get_error(executed);
        }
        const auto& result = core::errors::get_value(executed);
        return StatusResponse{result.exit_code == 0, result.stdout_text,
                              is_clean_porcelain(result.stdout_text)};
    });
}

Result<BranchListResponse> GitCommandAdapter::branch_list(
    const BranchListRequest&) const {
    return guarded<BranchListResponse>("branch_list", [&]() -> Result<BranchListResponse> {
        auto executed = git({"branch", "-a"});
        if (core::errors::is_error(executed)) {
            return core::errors::get_error(executed);
        }
        const auto& result = core::errors::get_value(executed);
        return BranchListResponse{result.exit_code == 0,
                                  parse_branch_listing(result.stdout_text)};
    });
}

Result<CreateBranchResponse> GitCommandAdapter::create_branch(
    const CreateBranchRequest& request) const {
    return guarded<CreateBranchResponse>("create_branch", [&]() -> Result<CreateBranchResponse> {
        const bool checkout =
            request.checkout.value_or(config_.defaults.create_branch.checkout);

        auto created = git({"branch", request.branch_name});
        if (core::errors::is_error(created)) {
            return core::errors::get_error(created);
        }
        const bool success = core::errors::get_value(created).exit_code == 0;

        if (success && checkout) {
            auto switched = git({"checkout", request.branch_name});
            if (core::errors::is_error(switched)) {
                return core::errors::get_error(switched);
            }
            const auto& result = core::errors::get_value(switched);
            if (result.exit_code != 0) {
                GITMCP_LOG_WARN("Checkout of '" + request.branch_name +
                                "' failed with exit code " +
                                std::to_string(result.exit_code) + ": " +
                                trim(result.stderr_text));
            }
        }

        return CreateBranchResponse{success, request.branch_name, checkout};
    });
}

}  // namespace gitmcp::tools
