#pragma once
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace mcptools::protocol {

    // One unit of tool output. Only text blocks are produced.
    struct ContentBlock {
        std::string type = "text";
        std::string text;
    };

    // What a tool hands back inside a successful tools/call response.
    // is_error flags a business failure; the protocol exchange still succeeded.
    struct ToolCallResult {
        std::vector<ContentBlock> content;
        bool is_error = false;
        std::optional<nlohmann::json> structured;
    };

    // Outcome of one subprocess run. 124 is reserved for timeouts.
    struct CommandResult {
        int status = 0;
        std::string stdout_text;
        std::string stderr_text;
        bool timed_out = false;
        bool truncated = false;
        double duration_ms = 0.0;
    };

    struct ToolDescriptor {
        std::string name;
        std::string description;
        nlohmann::json input_schema;
    };

    ToolCallResult text_result(const std::string& text);
    ToolCallResult error_result(const std::string& text);

    // Serialises payload into a single text block and keeps it as structuredContent.
    ToolCallResult structured_result(const nlohmann::json& payload, bool is_error = false);

    // {status, stdout, stderr}; an error whenever the command exited non-zero.
    ToolCallResult command_result(const CommandResult& command);

    nlohmann::json to_json(const ToolCallResult& result);
    nlohmann::json to_json(const CommandResult& result);
    nlohmann::json to_json(const ToolDescriptor& descriptor);

} // namespace mcptools::protocol
