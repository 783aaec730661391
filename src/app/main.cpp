#include <iostream>
#include <memory>
#include <string>
#include <variant>
#include <nlohmann/json.hpp>
#include "app/cli_parser.hpp"
#include "core/errors/gitmcp_errors.hpp"
#include "core/logging/logger.hpp"
#include "process/posix_process_runner.hpp"
#include "session/call_journal.hpp"
#include "tools/git_command_adapter.hpp"
#include "tools/tool_dispatcher.hpp"

int main(int argc, char* argv[]) {
    // 1. Parse CLI input and return normalized input errors
    auto parsed = gitmcp::app::cli::parse_and_validate(argc, argv);
    if (gitmcp::core::errors::is_error(parsed)) {
        const auto& err = gitmcp::core::errors::get_error(parsed);
        GITMCP_LOG_ERROR("Input error [" + err.code + "]: " + err.message);
        if (!err.hint.empty()) {
            GITMCP_LOG_INFO("Hint: " + err.hint);
        }
        return 2;
    }

    const auto& invocation = gitmcp::core::errors::get_value(parsed);
    const auto& config = invocation.config;
    gitmcp::core::logging::Logger::get().set_level(config.log_level);
    GITMCP_LOG_DEBUG("Repository: " + config.adapter.working_directory.string());

    // 2. Wire the adapter onto the real process runner
    gitmcp::process::PosixProcessRunner runner;
    gitmcp::tools::GitCommandAdapter adapter(runner, config.adapter);

    std::unique_ptr<gitmcp::session::CallJournal> journal;
    if (config.journal_path.has_value()) {
        journal = std::make_unique<gitmcp::session::CallJournal>(config.journal_path.value());
        GITMCP_LOG_DEBUG("Journal: " + journal->path().string());
    }
    gitmcp::tools::ToolDispatcher dispatcher(adapter, journal.get());

    // 3. Run the call; the response is the only thing written to stdout
    const nlohmann::json response = std::visit(
        [&dispatcher](const auto& call) { return dispatcher.dispatch(call); },
        invocation.call);

    std::cout << response.dump(2, ' ', false, nlohmann::json::error_handler_t::replace)
              << std::endl;

    const auto success = response.find("success");
    if (success != response.end() && success->is_boolean() && success->get<bool>()) {
        return 0;
    }
    return 1;
}
