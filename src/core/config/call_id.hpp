#pragma once
#include <string>
#include <random>
#include <sstream>

namespace gitmcp::core::config {

    // Generates a simple 8-character hex ID prefixed with "call-"
    inline std::string generate_call_id() {
        std::random_device rd;
        std::mt19937 gen(rd());
        std::uniform_int_distribution<> dis(0, 15);

        std::stringstream ss;
        ss << "call-";
        for (int i = 0; i < 8; ++i) {
            ss << std::hex << dis(gen);
        }
        return ss.str();
    }

} // namespace gitmcp::core::config
