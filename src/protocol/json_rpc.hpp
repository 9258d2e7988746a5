#pragma once

#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "core/errors/tool_errors.hpp"

namespace mcptools::protocol {

    constexpr const char* kJsonRpcVersion = "2.0";

    // Standard JSON-RPC 2.0 error codes.
    constexpr int kParseError = -32700;
    constexpr int kInvalidRequest = -32600;
    constexpr int kMethodNotFound = -32601;
    constexpr int kInvalidParams = -32602;
    constexpr int kInternalError = -32603;

    // A request carries an id; a notification does not.
    struct RpcMessage {
        std::string method;
        nlohmann::json params = nlohmann::json::object();
        std::optional<nlohmann::json> id;

        bool is_notification() const { return !id.has_value(); }
    };

    core::errors::Result<RpcMessage> parse_message(const nlohmann::json& message);

    nlohmann::json make_result_response(const nlohmann::json& id, const nlohmann::json& result);
    nlohmann::json make_error_response(const nlohmann::json& id, int code,
                                       const std::string& message);
    nlohmann::json make_notification(const std::string& method,
                                     const nlohmann::json& params = nullptr);

} // namespace mcptools::protocol
