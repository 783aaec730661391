#pragma once
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace gitmcp::protocol {

    // An absent optional field means "use the configured default"
    // (see core::config::OperationDefaults).

    struct CloneRequest {
        std::string repository_url;
        std::optional<std::string> destination;
    };

    struct CommitRequest {
        std::string message;
        std::optional<std::vector<std::string>> files;
    };

    struct PushRequest {
        std::optional<std::string> remote;
        std::optional<std::string> branch;
    };

    struct StatusRequest {};

    struct BranchListRequest {};

    struct CreateBranchRequest {
        std::string branch_name;
        std::optional<bool> checkout;
    };

    // Exactly ONE of the six git operations.
    using OperationRequest = std::variant<
        CloneRequest,
        CommitRequest,
        PushRequest,
        StatusRequest,
        BranchListRequest,
        CreateBranchRequest
    >;

} // namespace gitmcp::protocol
