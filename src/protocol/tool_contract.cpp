#include "protocol/tool_contract.hpp"

namespace mcptools::protocol {

using nlohmann::json;

ToolCallResult text_result(const std::string& text) {
    ToolCallResult result;
    result.content.push_back(ContentBlock{"text", text});
    return result;
}

ToolCallResult error_result(const std::string& text) {
    ToolCallResult result = text_result(text);
    result.is_error = true;
    return result;
}

ToolCallResult structured_result(const json& payload, const bool is_error) {
    ToolCallResult result;
    result.content.push_back(
        ContentBlock{"text", payload.dump(2, ' ', false, json::error_handler_t::replace)});
    result.is_error = is_error;
    result.structured = payload;
    return result;
}

ToolCallResult command_result(const CommandResult& command) {
    return structured_result(to_json(command), command.status != 0);
}

json to_json(const ToolCallResult& result) {
    json content = json::array();
    for (const auto& block : result.content) {
        content.push_back({{"type", block.type}, {"text", block.text}});
    }

    json payload;
    payload["content"] = content;
    payload["isError"] = result.is_error;
    if (result.structured.has_value()) {
        payload["structuredContent"] = result.structured.value();
    }
    return payload;
}

json to_json(const CommandResult& result) {
    json payload;
    payload["status"] = result.status;
    payload["stdout"] = result.stdout_text;
    payload["stderr"] = result.stderr_text;
    if (result.timed_out) {
        payload["timed_out"] = true;
    }
    if (result.truncated) {
        payload["truncated"] = true;
    }
    return payload;
}

json to_json(const ToolDescriptor& descriptor) {
    json payload;
    payload["name"] = descriptor.name;
    payload["description"] = descriptor.description;
    payload["inputSchema"] = descriptor.input_schema;
    return payload;
}

}  // namespace mcptools::protocol
