#pragma once
#include <string>
#include <variant>

namespace gitmcp::core::errors {

    // 1. Typed error categories
    enum class ErrorCategory {
        Input,      // E.g., a tool call with a missing or mistyped argument
        Execution,  // E.g., git could not be launched, or staging failed
        Internal    // E.g., pipe/fork failure or an unexpected exception
    };

    // The standardized error payload
    struct GitMcpError {
            ErrorCategory category;
            std::string message;
            std::string code = "unknown_error";
            std::string hint = "";              // Helpful tips for the user
        };

    // 2. Propagation strategy: a Result holds either a value of type T, OR a GitMcpError.
    template <typename T>
    using Result = std::variant<T, GitMcpError>;

    // --- Helpers to work with std::variant ---

    template <typename T>
    bool is_error(const Result<T>& result) {
        return std::holds_alternative<GitMcpError>(result);
    }

    template <typename T>
    const GitMcpError& get_error(const Result<T>& result) {
        return std::get<GitMcpError>(result);
    }

    template <typename T>
    const T& get_value(const Result<T>& result) {
        return std::get<T>(result);
    }

    inline std::string to_string(const ErrorCategory category) {
        switch (category) {
            case ErrorCategory::Input:     return "input";
            case ErrorCategory::Execution: return "execution";
            case ErrorCategory::Internal:  return "internal";
            default: return "unknown";
        }
    }

} // namespace gitmcp::core::errors
