#pragma once
#include <string>
#include <variant>
#include "core/config/server_config.hpp"
#include "core/errors/gitmcp_errors.hpp"
#include "protocol/operation_request.hpp"
#include "protocol/tool_contract.hpp"

namespace gitmcp::app::cli {

    struct CliInvocation {
        core::config::ServerConfig config;
        // A typed subcommand, or a raw `call <tool> <json>` request.
        std::variant<protocol::OperationRequest, protocol::ToolCall> call;
    };

    gitmcp::core::errors::Result<CliInvocation> parse_and_validate(int argc, char* argv[]);

    std::string usage();
}
