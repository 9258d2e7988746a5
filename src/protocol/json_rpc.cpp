#include "protocol/json_rpc.hpp"

namespace mcptools::protocol {

using core::errors::ErrorCategory;
using core::errors::ToolError;
using nlohmann::json;

namespace {

bool is_valid_id(const json& id) {
    return id.is_string() || id.is_number_integer() || id.is_number_unsigned();
}

}  // namespace

core::errors::Result<RpcMessage> parse_message(const json& message) {
    if (!message.is_object()) {
        return ToolError{ErrorCategory::Input, "Message must be a JSON object.",
                         "invalid_message"};
    }

    const auto method_it = message.find("method");
    if (method_it == message.end() || !method_it->is_string()) {
        return ToolError{ErrorCategory::Input, "Message has no string method.",
                         "missing_method"};
    }

    RpcMessage parsed;
    parsed.method = method_it->get<std::string>();

    const auto params_it = message.find("params");
    if (params_it != message.end() && (params_it->is_object() || params_it->is_array())) {
        parsed.params = *params_it;
    }

    const auto id_it = message.find("id");
    if (id_it != message.end()) {
        if (!is_valid_id(*id_it)) {
            return ToolError{ErrorCategory::Input,
                             "Request id must be a string or an integer.",
                             "invalid_request_id"};
        }
        parsed.id = *id_it;
    }

    return parsed;
}

json make_result_response(const json& id, const json& result) {
    return json{{"jsonrpc", kJsonRpcVersion}, {"id", id}, {"result", result}};
}

json make_error_response(const json& id, const int code, const std::string& message) {
    return json{{"jsonrpc", kJsonRpcVersion},
                {"id", id},
                {"error", {{"code", code}, {"message", message}}}};
}

json make_notification(const std::string& method, const json& params) {
    return json{{"jsonrpc", kJsonRpcVersion}, {"method", method}, {"params", params}};
}

}  // namespace mcptools::protocol
