#include "server/dispatcher.hpp"

#include <exception>
#include <utility>
#include "core/logging/logger.hpp"

namespace mcptools::server {

using nlohmann::json;
using protocol::make_error_response;
using protocol::make_result_response;

Dispatcher::Dispatcher(ServerIdentity identity, std::string protocol_version,
                       const ToolRegistry& registry, LineTransport& transport,
                       AsyncLane& lane)
    : identity_(std::move(identity)),
      protocol_version_(std::move(protocol_version)),
      registry_(registry),
      transport_(transport),
      lane_(lane) {}

int Dispatcher::serve() {
    MCPTOOLS_LOG_INFO(identity_.name + " ready with " + std::to_string(registry_.size()) +
                      " tools; waiting for messages on stdin.");
    while (auto line = transport_.read_line()) {
        handle_line(line.value());
    }
    MCPTOOLS_LOG_INFO("End of input; waiting for in-flight calls.");
    lane_.wait_idle();
    return 0;
}

void Dispatcher::handle_line(const std::string& line) {
    auto parsed = LineTransport::parse_line(line);
    if (!parsed.has_value()) {
        MCPTOOLS_LOG_DEBUG("Dropping unparseable line (" + std::to_string(line.size()) +
                           " bytes).");
        return;
    }

    auto message = protocol::parse_message(parsed.value());
    if (core::errors::is_error(message)) {
        const auto& err = core::errors::get_error(message);
        MCPTOOLS_LOG_DEBUG("Dropping message [" + err.code + "]: " + err.message);
        return;
    }

    const auto& rpc = core::errors::get_value(message);
    if (rpc.is_notification()) {
        MCPTOOLS_LOG_DEBUG("Notification: " + rpc.method);
        return;
    }

    try {
        route(rpc);
    } catch (const std::exception& ex) {
        MCPTOOLS_LOG_ERROR("Dispatch of " + rpc.method + " failed: " + ex.what());
        transport_.write_message(
            make_error_response(rpc.id.value(), protocol::kInternalError, ex.what()));
    }
}

void Dispatcher::route(const protocol::RpcMessage& message) {
    const json& id = message.id.value();

    if (message.method == "initialize") {
        transport_.write_message(make_result_response(id, handle_initialize()));
        initialized_.store(true);
        transport_.write_message(protocol::make_notification("notifications/initialized"));
        return;
    }
    if (message.method == "ping") {
        transport_.write_message(make_result_response(id, json::object()));
        return;
    }
    if (message.method == "tools/list") {
        transport_.write_message(make_result_response(id, handle_tools_list()));
        return;
    }
    if (message.method == "tools/call") {
        handle_tools_call(id, message.params);
        return;
    }

    transport_.write_message(make_error_response(id, protocol::kMethodNotFound,
                                                 "Method not implemented: " + message.method));
}

json Dispatcher::handle_initialize() const {
    json server_info;
    server_info["name"] = identity_.name;
    server_info["version"] = identity_.version;
    server_info["title"] = identity_.title;

    json result;
    result["protocolVersion"] = protocol_version_;
    result["serverInfo"] = server_info;
    result["capabilities"] = {{"tools", {{"listChanged", false}}}};
    if (!identity_.instructions.empty()) {
        result["instructions"] = identity_.instructions;
    }
    return result;
}

json Dispatcher::handle_tools_list() const {
    json tools = json::array();
    for (const auto& descriptor : registry_.descriptors()) {
        tools.push_back(protocol::to_json(descriptor));
    }
    return json{{"tools", tools}};
}

void Dispatcher::handle_tools_call(const json& id, const json& params) {
    if (!params.is_object() || !params.contains("name") || !params["name"].is_string()) {
        transport_.write_message(make_error_response(id, protocol::kInvalidParams,
                                                     "Missing or invalid 'name' in tools/call"));
        return;
    }

    const std::string name = params["name"].get<std::string>();
    const ToolDefinition* tool = registry_.find(name);
    if (tool == nullptr) {
        transport_.write_message(
            make_error_response(id, protocol::kMethodNotFound, "Unknown tool: " + name));
        return;
    }

    if (!initialized_.load() && !warned_before_initialize_) {
        warned_before_initialize_ = true;
        MCPTOOLS_LOG_WARN("tools/call received before initialize; serving it anyway.");
    }

    json arguments = json::object();
    const auto args_it = params.find("arguments");
    if (args_it != params.end() && !args_it->is_null()) {
        arguments = *args_it;
    }

    if (tool->lane == ExecutionLane::Suspending) {
        lane_.submit([this, tool, id, arguments]() {
            transport_.write_message(invoke_tool(*tool, id, arguments));
        });
        return;
    }

    transport_.write_message(invoke_tool(*tool, id, arguments));
}

json Dispatcher::invoke_tool(const ToolDefinition& tool, const json& id,
                             const json& arguments) const {
    const std::string& name = tool.descriptor.name;
    try {
        auto params = tool.decode(arguments);
        if (core::errors::is_error(params)) {
            const auto& err = core::errors::get_error(params);
            MCPTOOLS_LOG_DEBUG("Rejected arguments for " + name + " [" + err.code + "]: " +
                               err.message);
            return make_result_response(
                id, protocol::to_json(protocol::error_result("Invalid arguments for " + name +
                                                             ": " + err.message)));
        }

        MCPTOOLS_LOG_DEBUG("Calling " + name);
        const protocol::ToolCallResult result = tool.handler(core::errors::get_value(params));
        if (result.is_error) {
            MCPTOOLS_LOG_INFO(name + " reported a tool error.");
        }
        return make_result_response(id, protocol::to_json(result));
    } catch (const std::exception& ex) {
        MCPTOOLS_LOG_ERROR(name + " raised: " + ex.what());
        return make_error_response(id, protocol::kInternalError,
                                   std::string("Tool ") + name + " failed: " + ex.what());
    }
}

}  // namespace mcptools::server
