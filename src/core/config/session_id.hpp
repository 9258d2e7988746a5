#pragma once
#include <string>
#include <random>
#include <sstream>

namespace mcptools::core::config {

    // Generates an 8-character hex ID prefixed with "mcp-"
    inline std::string generate_session_id() {
        std::random_device rd;
        std::mt19937 gen(rd());
        std::uniform_int_distribution<> dis(0, 15);

        std::stringstream ss;
        ss << "mcp-";
        for (int i = 0; i < 8; ++i) {
            ss << std::hex << dis(gen);
        }
        return ss.str();
    }

} // namespace mcptools::core::config
