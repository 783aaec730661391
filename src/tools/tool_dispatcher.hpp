#pragma once

#include <nlohmann/json.hpp>
#include "protocol/operation_request.hpp"
#include "protocol/tool_contract.hpp"
#include "session/call_journal.hpp"
#include "tools/git_command_adapter.hpp"

namespace gitmcp::tools {

// Routes one request to the matching adapter operation and returns its JSON
// envelope. Every call yields exactly one object with a boolean "success";
// undecodable tool calls come back as {"success": false, "error": ...}.
class ToolDispatcher {
public:
    explicit ToolDispatcher(const GitCommandAdapter& adapter,
                            const session::CallJournal* journal = nullptr);

    nlohmann::json dispatch(const protocol::OperationRequest& request) const;

    // Uses call.id as the correlation id when present.
    nlohmann::json dispatch(const protocol::ToolCall& call) const;

private:
    nlohmann::json run(const std::string& call_id,
                       const protocol::OperationRequest& request) const;

    void record(const std::string& call_id, const std::string& tool,
                const nlohmann::json& arguments,
                const nlohmann::json& response) const;

    const GitCommandAdapter& adapter_;
    const session::CallJournal* journal_;
};

}  // namespace gitmcp::tools
