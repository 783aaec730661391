#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include "core/logging/logger.hpp"

namespace gitmcp::core::config {

    // Values used when a request leaves an optional parameter out.
    struct PushDefaults {
        std::string remote = "origin";
        std::string branch = "main";
    };

    struct CreateBranchDefaults {
        bool checkout = true;
    };

    struct OperationDefaults {
        PushDefaults push;
        CreateBranchDefaults create_branch;
    };

    // Everything the command adapter needs to build an invocation.
    struct AdapterConfig {
        std::string git_executable = "git";
        std::filesystem::path working_directory = ".";
        OperationDefaults defaults;
    };

    struct ServerConfig {
        AdapterConfig adapter;
        logging::LogLevel log_level = logging::LogLevel::INFO;
        std::optional<std::filesystem::path> journal_path;
    };

} // namespace gitmcp::core::config
