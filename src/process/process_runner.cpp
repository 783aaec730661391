#include "process/process_runner.hpp"

#include <sstream>

namespace gitmcp::process {

namespace {

bool needs_quotes(const std::string& value) {
    if (value.empty()) {
        return true;
    }
    for (const char c : value) {
        if (c == ' ' || c == '\t' || c == '\n' || c == '"' || c == '\'') {
            return true;
        }
    }
    return false;
}

}  // namespace

std::string describe(const CommandInvocation& invocation) {
    std::ostringstream out;
    out << invocation.program;
    for (const auto& argument : invocation.arguments) {
        out << ' ';
        if (needs_quotes(argument)) {
            out << '"' << argument << '"';
        } else {
            out << argument;
        }
    }
    return out.str();
}

}  // namespace gitmcp::process
