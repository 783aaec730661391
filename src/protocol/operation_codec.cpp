#include "protocol/operation_codec.hpp"

#include <optional>
#include <vector>

namespace gitmcp::protocol {

using core::errors::ErrorCategory;
using core::errors::GitMcpError;
using core::errors::Result;
using nlohmann::json;

namespace {

GitMcpError missing_argument(const std::string& key) {
    return GitMcpError{ErrorCategory::Input, "Missing required argument: " + key,
                       "missing_argument"};
}

GitMcpError wrong_type(const std::string& key, const std::string& expected) {
    return GitMcpError{ErrorCategory::Input,
                       "Argument '" + key + "' must be " + expected + ".",
                       "invalid_argument_type"};
}

bool is_absent(const json& arguments, const std::string& key) {
    return !arguments.contains(key) || arguments.at(key).is_null();
}

Result<json> parse_arguments(const std::string& text) {
    if (text.find_first_not_of(" \t\r\n") == std::string::npos) {
        return json::object();
    }

    json parsed = json::parse(text, nullptr, false);
    if (parsed.is_discarded()) {
        return GitMcpError{ErrorCategory::Input, "Tool arguments are not valid JSON.",
                           "invalid_arguments"};
    }
    if (!parsed.is_object()) {
        return GitMcpError{ErrorCategory::Input,
                           "Tool arguments must be a JSON object.",
                           "invalid_arguments"};
    }
    return parsed;
}

Result<std::string> required_string(const json& arguments, const std::string& key) {
    if (is_absent(arguments, key)) {
        return missing_argument(key);
    }
    const auto& value = arguments.at(key);
    if (!value.is_string()) {
        return wrong_type(key, "a string");
    }
    return value.get<std::string>();
}

Result<std::optional<std::string>> optional_string(const json& arguments,
                                                   const std::string& key) {
    if (is_absent(arguments, key)) {
        return std::optional<std::string>{};
    }
    const auto& value = arguments.at(key);
    if (!value.is_string()) {
        return wrong_type(key, "a string");
    }
    return std::optional<std::string>{value.get<std::string>()};
}

Result<std::optional<bool>> optional_bool(const json& arguments, const std::string& key) {
    if (is_absent(arguments, key)) {
        return std::optional<bool>{};
    }
    const auto& value = arguments.at(key);
    if (!value.is_boolean()) {
        return wrong_type(key, "a boolean");
    }
    return std::optional<bool>{value.get<bool>()};
}

Result<std::optional<std::vector<std::string>>> optional_string_list(
    const json& arguments, const std::string& key) {
    if (is_absent(arguments, key)) {
        return std::optional<std::vector<std::string>>{};
    }
    const auto& value = arguments.at(key);
    if (!value.is_array()) {
        return wrong_type(key, "an array of strings");
    }

    std::vector<std::string> items;
    items.reserve(value.size());
    for (const auto& item : value) {
        if (!item.is_string()) {
            return wrong_type(key, "an array of strings");
        }
        items.push_back(item.get<std::string>());
    }
    return std::optional<std::vector<std::string>>{std::move(items)};
}

Result<OperationRequest> decode_clone(const json& arguments) {
    auto url = required_string(arguments, "repository_url");
    if (core::errors::is_error(url)) {
        return core::errors::get_error(url);
    }
    auto destination = optional_string(arguments, "destination");
    if (core::errors::is_error(destination)) {
        return core::errors::get_error(destination);
    }
    return OperationRequest{CloneRequest{core::errors::get_value(url),
                                         core::errors::get_value(destination)}};
}

Result<OperationRequest> decode_commit(const json& arguments) {
    auto message = required_string(arguments, "message");
    if (core::errors::is_error(message)) {
        return core::errors::get_error(message);
    }
    auto files = optional_string_list(arguments, "files");
    if (core::errors::is_error(files)) {
        return core::errors::get_error(files);
    }
    return OperationRequest{CommitRequest{core::errors::get_value(message),
                                          core::errors::get_value(files)}};
}

Result<OperationRequest> decode_push(const json& arguments) {
    auto remote = optional_string(arguments, "remote");
    if (core::errors::is_error(remote)) {
        return core::errors::get_error(remote);
    }
    auto branch = optional_string(arguments, "branch");
    if (core::errors::is_error(branch)) {
        return core::errors::get_error(branch);
    }
    return OperationRequest{PushRequest{core::errors::get_value(remote),
                                        core::errors::get_value(branch)}};
}

Result<OperationRequest> decode_create_branch(const json& arguments) {
    auto name = required_string(arguments, "branch_name");
    if (core::errors::is_error(name)) {
        return core::errors::get_error(name);
    }
    auto checkout = optional_bool(arguments, "checkout");
    if (core::errors::is_error(checkout)) {
        return core::errors::get_error(checkout);
    }
    return OperationRequest{CreateBranchRequest{core::errors::get_value(name),
                                                core::errors::get_value(checkout)}};
}

struct ToolNameVisitor {
    std::string operator()(const CloneRequest&) const { return tool_names::kClone; }
    std::string operator()(const CommitRequest&) const { return tool_names::kCommit; }
    std::string operator()(const PushRequest&) const { return tool_names::kPush; }
    std::string operator()(const StatusRequest&) const { return tool_names::kStatus; }
    std::string operator()(const BranchListRequest&) const {
        return tool_names::kBranchList;
    }
    std::string operator()(const CreateBranchRequest&) const {
        return tool_names::kCreateBranch;
    }
};

struct ArgumentsVisitor {
    json operator()(const CloneRequest& request) const {
        json arguments;
        arguments["repository_url"] = request.repository_url;
        if (request.destination.has_value()) {
            arguments["destination"] = request.destination.value();
        }
        return arguments;
    }

    json operator()(const CommitRequest& request) const {
        json arguments;
        arguments["message"] = request.message;
        if (request.files.has_value()) {
            arguments["files"] = request.files.value();
        }
        return arguments;
    }

    json operator()(const PushRequest& request) const {
        json arguments = json::object();
        if (request.remote.has_value()) {
            arguments["remote"] = request.remote.value();
        }
        if (request.branch.has_value()) {
            arguments["branch"] = request.branch.value();
        }
        return arguments;
    }

    json operator()(const StatusRequest&) const { return json::object(); }

    json operator()(const BranchListRequest&) const { return json::object(); }

    json operator()(const CreateBranchRequest& request) const {
        json arguments;
        arguments["branch_name"] = request.branch_name;
        if (request.checkout.has_value()) {
            arguments["checkout"] = request.checkout.value();
        }
        return arguments;
    }
};

}  // namespace

Result<OperationRequest> decode_tool_call(const ToolCall& call) {
    auto parsed = parse_arguments(call.arguments);
    if (core::errors::is_error(parsed)) {
        return core::errors::get_error(parsed);
    }
    const json& arguments = core::errors::get_value(parsed);

    if (call.name == tool_names::kClone) {
        return decode_clone(arguments);
    }
    if (call.name == tool_names::kCommit) {
        return decode_commit(arguments);
    }
    if (call.name == tool_names::kPush) {
        return decode_push(arguments);
    }
    if (call.name == tool_names::kStatus) {
        return OperationRequest{StatusRequest{}};
    }
    if (call.name == tool_names::kBranchList) {
        return OperationRequest{BranchListRequest{}};
    }
    if (call.name == tool_names::kCreateBranch) {
        return decode_create_branch(arguments);
    }

    std::string available;
    for (const char* name : tool_names::kAll) {
        available += available.empty() ? name : std::string(", ") + name;
    }
    return GitMcpError{ErrorCategory::Input, "Unknown tool: " + call.name,
                       "unknown_tool", "Available tools: " + available + "."};
}

std::string tool_name(const OperationRequest& request) {
    return std::visit(ToolNameVisitor{}, request);
}

json arguments_to_json(const OperationRequest& request) {
    return std::visit(ArgumentsVisitor{}, request);
}

json response_to_json(const CloneResponse& response) {
    json payload;
    payload["success"] = response.success;
    payload["output"] = response.output;
    payload["error"] = response.error;
    return payload;
}

json response_to_json(const CommitResponse& response) {
    json payload;
    payload["success"] = response.success;
    payload["commit_message"] = response.commit_message;
    payload["output"] = response.output;
    return payload;
}

json response_to_json(const PushResponse& response) {
    json payload;
    payload["success"] = response.success;
    payload["output"] = response.output;
    payload["error"] = response.error;
    return payload;
}

json response_to_json(const StatusResponse& response) {
    json payload;
    payload["success"] = response.success;
    payload["status"] = response.status;
    payload["clean"] = response.clean;
    return payload;
}

json response_to_json(const BranchListResponse& response) {
    json payload;
    payload["success"] = response.success;
    payload["branches"] = response.branches;
    return payload;
}

json response_to_json(const CreateBranchResponse& response) {
    json payload;
    payload["success"] = response.success;
    payload["branch"] = response.branch;
    payload["checked_out"] = response.checked_out;
    return payload;
}

json error_to_json(const GitMcpError& error) {
    json payload;
    payload["success"] = false;
    payload["error"] = error.message;
    return payload;
}

}  // namespace gitmcp::protocol
