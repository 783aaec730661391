#pragma once
#include <array>
#include <string>

namespace gitmcp::protocol {

    // How a client asks for one of the git tools
    struct ToolCall {
        std::string id;
        std::string name;       // e.g., "git_status", "git_commit"
        std::string arguments;  // Raw JSON object text of the arguments
    };

    namespace tool_names {
        inline constexpr const char* kClone = "git_clone";
        inline constexpr const char* kCommit = "git_commit";
        inline constexpr const char* kPush = "git_push";
        inline constexpr const char* kStatus = "git_status";
        inline constexpr const char* kBranchList = "git_branch_list";
        inline constexpr const char* kCreateBranch = "git_create_branch";

        inline constexpr std::array<const char*, 6> kAll = {
            kClone, kCommit, kPush, kStatus, kBranchList, kCreateBranch};
    } // namespace tool_names

} // namespace gitmcp::protocol
