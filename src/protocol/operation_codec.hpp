#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "core/errors/gitmcp_errors.hpp"
#include "protocol/operation_request.hpp"
#include "protocol/tool_contract.hpp"
#include "protocol/tool_response.hpp"

namespace gitmcp::protocol {

// Validates a tool call's name and JSON arguments and builds the typed request.
core::errors::Result<OperationRequest> decode_tool_call(const ToolCall& call);

std::string tool_name(const OperationRequest& request);

// Arguments as the caller supplied them; absent optionals are left out.
nlohmann::json arguments_to_json(const OperationRequest& request);

nlohmann::json response_to_json(const CloneResponse& response);
nlohmann::json response_to_json(const CommitResponse& response);
nlohmann::json response_to_json(const PushResponse& response);
nlohmann::json response_to_json(const StatusResponse& response);
nlohmann::json response_to_json(const BranchListResponse& response);
nlohmann::json response_to_json(const CreateBranchResponse& response);

// {"success": false, "error": message}
nlohmann::json error_to_json(const core::errors::GitMcpError& error);

template <typename Response>
nlohmann::json envelope(const core::errors::Result<Response>& result) {
    if (core::errors::is_error(result)) {
        return error_to_json(core::errors::get_error(result));
    }
    return response_to_json(core::errors::get_value(result));
}

}  // namespace gitmcp::protocol
