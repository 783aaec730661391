#include "session/call_journal.hpp"

#include <chrono>
#include <cstdint>
#include <fstream>
#include <system_error>
#include <utility>

namespace gitmcp::session {

using core::errors::ErrorCategory;
using core::errors::GitMcpError;
using nlohmann::json;

namespace {

std::int64_t now_unix_ms() {
    const auto now = std::chrono::system_clock::now();
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                        now.time_since_epoch())
                        .count();
    return static_cast<std::int64_t>(ms);
}

}  // namespace

CallJournal::CallJournal(std::filesystem::path journal_path)
    : journal_path_(std::move(journal_path)) {}

core::errors::Result<std::filesystem::path> CallJournal::append_event(
    const std::string& event_json) const {
    if (journal_path_.empty()) {
        return GitMcpError{ErrorCategory::Input, "Journal path cannot be empty.",
                           "invalid_journal_path"};
    }

    std::error_code ec;
    const auto parent = journal_path_.parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            return GitMcpError{ErrorCategory::Internal,
                               "Unable to create journal directory: " + parent.string(),
                               "journal_dir_create_failed"};
        }
    }

    std::ofstream out(journal_path_, std::ios::app);
    if (!out.is_open()) {
        return GitMcpError{ErrorCategory::Internal,
                           "Unable to open journal file: " + journal_path_.string(),
                           "journal_open_failed"};
    }

    out << event_json << "\n";
    if (!out.good()) {
        return GitMcpError{ErrorCategory::Internal,
                           "Unable to write journal entry: " + journal_path_.string(),
                           "journal_write_failed"};
    }

    return journal_path_;
}

core::errors::Result<std::filesystem::path> CallJournal::record(
    const std::string& call_id, const std::string& tool, const json& arguments,
    const json& response) const {
    if (call_id.empty()) {
        return GitMcpError{ErrorCategory::Input, "Call ID cannot be empty.",
                           "invalid_call_id"};
    }

    json event;
    event["ts_unix_ms"] = now_unix_ms();
    event["call_id"] = call_id;
    event["tool"] = tool;
    event["arguments"] = arguments;
    event["response"] = response;
    // git output is not guaranteed to be UTF-8.
    return append_event(event.dump(-1, ' ', false, json::error_handler_t::replace));
}

}  // namespace gitmcp::session
