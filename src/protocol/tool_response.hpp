#pragma once
#include <string>
#include <vector>

namespace gitmcp::protocol {

    // success mirrors exit_code == 0 of the invocation that decides the outcome.

    struct CloneResponse {
        bool success = false;
        std::string output;
        std::string error;
    };

    struct CommitResponse {
        bool success = false;
        std::string commit_message;
        std::string output;
    };

    struct PushResponse {
        bool success = false;
        std::string output;
        std::string error;
    };

    struct StatusResponse {
        bool success = false;
        std::string status;  // raw porcelain text
        bool clean = false;
    };

    struct BranchListResponse {
        bool success = false;
        std::vector<std::string> branches;
    };

    struct CreateBranchResponse {
        bool success = false;
        std::string branch;
        bool checked_out = false;  // as requested, not verified
    };

} // namespace gitmcp::protocol
