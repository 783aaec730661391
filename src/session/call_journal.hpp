#pragma once

#include <filesystem>
#include <string>
#include <nlohmann/json.hpp>
#include "core/errors/gitmcp_errors.hpp"

namespace gitmcp::session {

// Append-only JSONL record of dispatched tool calls, one object per line.
class CallJournal {
public:
    explicit CallJournal(std::filesystem::path journal_path);

    core::errors::Result<std::filesystem::path> record(
        const std::string& call_id, const std::string& tool,
        const nlohmann::json& arguments, const nlohmann::json& response) const;

    const std::filesystem::path& path() const { return journal_path_; }

private:
    core::errors::Result<std::filesystem::path> append_event(
        const std::string& event_json) const;

    std::filesystem::path journal_path_;
};

}  // namespace gitmcp::session
