#pragma once

#include <optional>
#include <string>
#include <vector>
#include "core/config/server_config.hpp"
#include "core/errors/gitmcp_errors.hpp"
#include "process/process_runner.hpp"
#include "protocol/operation_request.hpp"
#include "protocol/tool_response.hpp"

namespace gitmcp::tools {

// Maps each git operation onto one or more invocations of the git CLI and
// normalizes what came back. Non-zero exits are reported through the
// response's success flag; launch failures and unexpected exceptions come
// back as a GitMcpError. Nothing escapes an operation as an exception.
class GitCommandAdapter {
public:
    explicit GitCommandAdapter(process::ProcessRunner& runner,
                               core::config::AdapterConfig config = {});

    core::errors::Result<protocol::CloneResponse> clone(
        const protocol::CloneRequest& request) const;

    // Stages each listed path in order (or the whole tree when no paths are
    // given), then commits. The first failed staging call aborts the
    // operation; paths staged before it stay staged.
    core::errors::Result<protocol::CommitResponse> commit(
        const protocol::CommitRequest& request) const;

    core::errors::Result<protocol::PushResponse> push(
        const protocol::PushRequest& request) const;

    core::errors::Result<protocol::StatusResponse> status(
        const protocol::StatusRequest& request) const;

    core::errors::Result<protocol::BranchListResponse> branch_list(
        const protocol::BranchListRequest& request) const;

    // The checkout step only runs after a successful creation. Its exit
    // status is logged but does not change the response.
    core::errors::Result<protocol::CreateBranchResponse> create_branch(
        const protocol::CreateBranchRequest& request) const;

    const core::config::AdapterConfig& config() const { return config_; }

private:
    core::errors::Result<process::ExecutionResult> git(
        std::vector<std::string> arguments) const;

    std::optional<core::errors::GitMcpError> stage(const std::string& pathspec) const;

    process::ProcessRunner& runner_;
    core::config::AdapterConfig config_;
};

// True when the porcelain text has nothing but whitespace.
bool is_clean_porcelain(const std::string& porcelain);

// Turns `git branch -a` output into branch names in listing order.
std::vector<std::string> parse_branch_listing(const std::string& listing);

}  // namespace gitmcp::tools
