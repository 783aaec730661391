#include "cli_parser.hpp"
#include <cstddef>
#include <optional>
#include <system_error>
#include <vector>

namespace gitmcp::app::cli {

    using namespace gitmcp::core::errors;
    using namespace gitmcp::protocol;

    // 1. Raw Options Struct (Internal only)
    struct RawGlobalOptions {
        std::optional<std::string> repo;
        std::optional<std::string> git;
        std::optional<std::string> log_level;
        std::optional<std::string> journal;
        std::optional<std::string> default_remote;
        std::optional<std::string> default_branch;
        bool no_checkout_default = false;
    };

    std::string usage() {
        return "Usage: gitmcp_cli [--repo DIR] [--git PATH] [--log-level debug|info|warn|error]\n"
               "                  [--journal FILE] [--default-remote NAME] [--default-branch NAME]\n"
               "                  [--no-checkout-default] <command> [args]\n"
               "Commands:\n"
               "  clone <url> [destination]\n"
               "  commit --message TEXT [--file PATH]...\n"
               "  push [--remote NAME] [--branch NAME]\n"
               "  status\n"
               "  branches\n"
               "  create-branch <name> [--no-checkout]\n"
               "  call <tool_name> [json_arguments]";
    }

    namespace {

        GitMcpError missing_value(const std::string& flag) {
            return GitMcpError{ErrorCategory::Input, "Missing value for " + flag, "missing_value"};
        }

        GitMcpError unexpected(const std::string& command, const std::string& arg) {
            return GitMcpError{ErrorCategory::Input, "Unexpected argument for " + command + ": " + arg,
                               "unexpected_argument"};
        }

        Result<OperationRequest> parse_clone(const std::vector<std::string>& args) {
            std::vector<std::string> positionals;
            for (const auto& arg : args) {
                if (arg.rfind("--", 0) == 0 || positionals.size() == 2) {
                    return unexpected("clone", arg);
                }
                positionals.push_back(arg);
            }
            if (positionals.empty()) {
                return GitMcpError{ErrorCategory::Input, "clone requires a repository URL", "missing_value",
                                   "Usage: gitmcp_cli clone <url> [destination]"};
            }

            CloneRequest req;
            req.repository_url = positionals[0];
            if (positionals.size() == 2) req.destination = positionals[1];
            return OperationRequest{req};
        }

        Result<OperationRequest> parse_commit(const std::vector<std::string>& args) {
            std::optional<std::string> message;
            std::vector<std::string> files;
            for (size_t i = 0; i < args.size(); ++i) {
                if (args[i] == "--message" || args[i] == "-m") {
                    if (i + 1 < args.size()) message = args[++i];
                    else return missing_value(args[i]);
                } else if (args[i] == "--file") {
                    if (i + 1 < args.size()) files.push_back(args[++i]);
                    else return missing_value("--file");
                } else {
                    return unexpected("commit", args[i]);
                }
            }
            if (!message.has_value()) {
                return GitMcpError{ErrorCategory::Input, "commit requires --message", "missing_required_flag"};
            }

            CommitRequest req;
            req.message = message.value();
            if (!files.empty()) req.files = files;
            return OperationRequest{req};
        }

        Result<OperationRequest> parse_push(const std::vector<std::string>& args) {
            PushRequest req;
            for (size_t i = 0; i < args.size(); ++i) {
                if (args[i] == "--remote") {
                    if (i + 1 < args.size()) req.remote = args[++i];
                    else return missing_value("--remote");
                } else if (args[i] == "--branch") {
                    if (i + 1 < args.size()) req.branch = args[++i];
                    else return missing_value("--branch");
                } else {
                    return unexpected("push", args[i]);
                }
            }
            return OperationRequest{req};
        }

        Result<OperationRequest> parse_create_branch(const std::vector<std::string>& args) {
            CreateBranchRequest req;
            bool have_name = false;
            for (const auto& arg : args) {
                if (arg == "--no-checkout") {
                    req.checkout = false;
                } else if (arg == "--checkout") {
                    req.checkout = true;
                } else if (!have_name && arg.rfind("--", 0) != 0) {
                    req.branch_name = arg;
                    have_name = true;
                } else {
                    return unexpected("create-branch", arg);
                }
            }
            if (!have_name) {
                return GitMcpError{ErrorCategory::Input, "create-branch requires a branch name", "missing_value"};
            }
            return OperationRequest{req};
        }

        Result<ToolCall> parse_call(const std::vector<std::string>& args) {
            if (args.empty()) {
                return GitMcpError{ErrorCategory::Input, "call requires a tool name", "missing_value",
                                   "Usage: gitmcp_cli call <tool_name> [json_arguments]"};
            }
            if (args.size() > 2) {
                return unexpected("call", args[2]);
            }
            ToolCall call;
            call.name = args[0];
            call.arguments = args.size() == 2 ? args[1] : "{}";
            return call;
        }

    } // namespace

    Result<CliInvocation> parse_and_validate(int argc, char* argv[]) {
        std::vector<std::string> args;
        for (int i = 1; i < argc; ++i) { // Start at 1 to skip program name
            args.push_back(argv[i]);
        }

        // 2. Parser Phase: global flags up to the first non-flag token
        RawGlobalOptions raw;
        size_t i = 0;
        for (; i < args.size() && args[i].rfind("--", 0) == 0; ++i) {
            if (args[i] == "--repo") {
                if (i + 1 < args.size()) raw.repo = args[++i];
                else return missing_value("--repo");
            } else if (args[i] == "--git") {
                if (i + 1 < args.size()) raw.git = args[++i];
                else return missing_value("--git");
            } else if (args[i] == "--log-level") {
                if (i + 1 < args.size()) raw.log_level = args[++i];
                else return missing_value("--log-level");
            } else if (args[i] == "--journal") {
                if (i + 1 < args.size()) raw.journal = args[++i];
                else return missing_value("--journal");
            } else if (args[i] == "--default-remote") {
                if (i + 1 < args.size()) raw.default_remote = args[++i];
                else return missing_value("--default-remote");
            } else if (args[i] == "--default-branch") {
                if (i + 1 < args.size()) raw.default_branch = args[++i];
                else return missing_value("--default-branch");
            } else if (args[i] == "--no-checkout-default") {
                raw.no_checkout_default = true;
            } else {
                return GitMcpError{ErrorCategory::Input, "Unknown argument: " + args[i], "unknown_argument"};
            }
        }

        if (i >= args.size()) {
            return GitMcpError{ErrorCategory::Input, "No command provided.", "missing_command", usage()};
        }
        const std::string command = args[i];
        const std::vector<std::string> command_args(args.begin() + static_cast<std::ptrdiff_t>(i) + 1, args.end());

        // 3. Validator Phase: build the config
        CliInvocation invocation;
        auto& config = invocation.config;

        if (raw.git) {
            if (raw.git->empty()) {
                return GitMcpError{ErrorCategory::Input, "--git cannot be empty", "missing_value"};
            }
            config.adapter.git_executable = raw.git.value();
        }
        if (raw.default_remote) config.adapter.defaults.push.remote = raw.default_remote.value();
        if (raw.default_branch) config.adapter.defaults.push.branch = raw.default_branch.value();
        if (raw.no_checkout_default) config.adapter.defaults.create_branch.checkout = false;
        if (raw.journal) config.journal_path = std::filesystem::path(raw.journal.value());

        if (raw.log_level) {
            auto level = core::logging::parse_log_level(raw.log_level.value());
            if (!level.has_value()) {
                return GitMcpError{ErrorCategory::Input, "Invalid log level: " + raw.log_level.value(),
                                   "invalid_log_level", "Use one of: debug, info, warn, error."};
            }
            config.log_level = level.value();
        }

        // Path validation
        std::filesystem::path repo = raw.repo ? std::filesystem::path(raw.repo.value()) : std::filesystem::path(".");
        std::error_code path_ec;
        const bool exists = std::filesystem::exists(repo, path_ec);
        if (path_ec || !exists) {
            return GitMcpError{ErrorCategory::Input, "Repository directory does not exist or is not a directory", "invalid_path"};
        }
        const bool is_dir = std::filesystem::is_directory(repo, path_ec);
        if (path_ec || !is_dir) {
            return GitMcpError{ErrorCategory::Input, "Repository directory does not exist or is not a directory", "invalid_path"};
        }
        std::filesystem::path canonical_path = std::filesystem::canonical(repo, path_ec);
        if (path_ec) {
            return GitMcpError{ErrorCategory::Input, "Failed to canonicalize repository directory", "invalid_path"};
        }
        config.adapter.working_directory = std::move(canonical_path);

        // 4. Command Phase
        if (command == "call") {
            auto call = parse_call(command_args);
            if (is_error(call)) return get_error(call);
            invocation.call = get_value(call);
            return invocation;
        }

        Result<OperationRequest> request = GitMcpError{ErrorCategory::Input, "Unknown command: " + command,
                                                       "unknown_command", usage()};
        if (command == "clone") {
            request = parse_clone(command_args);
        } else if (command == "commit") {
            request = parse_commit(command_args);
        } else if (command == "push") {
            request = parse_push(command_args);
        } else if (command == "status" || command == "branches") {
            if (!command_args.empty()) return unexpected(command, command_args[0]);
            request = command == "status" ? OperationRequest{StatusRequest{}} : OperationRequest{BranchListRequest{}};
        } else if (command == "create-branch") {
            request = parse_create_branch(command_args);
        }

        if (is_error(request)) return get_error(request);
        invocation.call = get_value(request);
        return invocation;
    }

} // namespace gitmcp::app::cli
