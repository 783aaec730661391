#include "tools/tool_dispatcher.hpp"

#include <string>
#include <variant>
#include "core/config/call_id.hpp"
#include "core/logging/logger.hpp"
#include "protocol/operation_codec.hpp"

namespace gitmcp::tools {

using nlohmann::json;

namespace {

struct OperationVisitor {
    const GitCommandAdapter& adapter;

    json operator()(const protocol::CloneRequest& request) const {
        return protocol::envelope(adapter.clone(request));
    }
    json operator()(const protocol::CommitRequest& request) const {
        return protocol::envelope(adapter.commit(request));
    }
    json operator()(const protocol::PushRequest& request) const {
        return protocol::envelope(adapter.push(request));
    }
    json operator()(const protocol::StatusRequest& request) const {
        return protocol::envelope(adapter.status(request));
    }
    json operator()(const protocol::BranchListRequest& request) const {
        return protocol::envelope(adapter.branch_list(request));
    }
    json operator()(const protocol::CreateBranchRequest& request) const {
        return protocol::envelope(adapter.create_branch(request));
    }
};

bool succeeded(const json& response) {
    const auto it = response.find("success");
    return it != response.end() && it->is_boolean() && it->get<bool>();
}

}  // namespace

ToolDispatcher::ToolDispatcher(const GitCommandAdapter& adapter,
                               const session::CallJournal* journal)
    : adapter_(adapter), journal_(journal) {}

json ToolDispatcher::dispatch(const protocol::OperationRequest& request) const {
    return run(core::config::generate_call_id(), request);
}

json ToolDispatcher::dispatch(const protocol::ToolCall& call) const {
    const std::string call_id =
        call.id.empty() ? core::config::generate_call_id() : call.id;

    auto decoded = protocol::decode_tool_call(call);
    if (core::errors::is_error(decoded)) {
        const auto& err = core::errors::get_error(decoded);
        core::logging::Logger::get().set_call_id(call_id);
        GITMCP_LOG_ERROR("Rejected tool call '" + call.name + "' [" + err.code +
                         "]: " + err.message);
        const json response = protocol::error_to_json(err);
        record(call_id, call.name, json(call.arguments), response);
        core::logging::Logger::get().clear_call_id();
        return response;
    }

    return run(call_id, core::errors::get_value(decoded));
}

json ToolDispatcher::run(const std::string& call_id,
                         const protocol::OperationRequest& request) const {
    core::logging::Logger::get().set_call_id(call_id);
    const std::string tool = protocol::tool_name(request);
    GITMCP_LOG_INFO("Tool call: " + tool);

    json response = std::visit(OperationVisitor{adapter_}, request);
    GITMCP_LOG_INFO(tool + (succeeded(response) ? " succeeded" : " failed"));

    record(call_id, tool, protocol::arguments_to_json(request), response);
    core::logging::Logger::get().clear_call_id();
    return response;
}

void ToolDispatcher::record(const std::string& call_id, const std::string& tool,
                            const json& arguments, const json& response) const {
    if (journal_ == nullptr) {
        return;
    }
    auto written = journal_->record(call_id, tool, arguments, response);
    if (core::errors::is_error(written)) {
        const auto& err = core::errors::get_error(written);
        GITMCP_LOG_WARN("Failed to journal call [" + err.code + "]: " + err.message);
    }
}

}  // namespace gitmcp::tools
