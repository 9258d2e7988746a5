#pragma once

#include <atomic>
#include <string>
#include <nlohmann/json.hpp>
#include "protocol/json_rpc.hpp"
#include "server/async_lane.hpp"
#include "server/line_transport.hpp"
#include "server/tool_registry.hpp"

namespace mcptools::server {

    struct ServerIdentity {
        std::string name;
        std::string version = "0.1.0";
        std::string title;
        std::string instructions;
    };

    // Routes one JSON-RPC message at a time: initialize, ping, tools/list and
    // tools/call. Writes exactly one response per request and none for
    // notifications.
    class Dispatcher {
    public:
        Dispatcher(ServerIdentity identity, std::string protocol_version,
                   const ToolRegistry& registry, LineTransport& transport, AsyncLane& lane);

        // Reads until end of input, then waits for in-flight async calls.
        int serve();

        // Handles one raw input line. Unparseable lines are dropped.
        void handle_line(const std::string& line);

        bool initialized() const { return initialized_.load(); }

    private:
        void route(const protocol::RpcMessage& message);
        nlohmann::json handle_initialize() const;
        nlohmann::json handle_tools_list() const;
        void handle_tools_call(const nlohmann::json& id, const nlohmann::json& params);
        nlohmann::json invoke_tool(const ToolDefinition& tool, const nlohmann::json& id,
                                   const nlohmann::json& arguments) const;

        ServerIdentity identity_;
        std::string protocol_version_;
        const ToolRegistry& registry_;
        LineTransport& transport_;
        AsyncLane& lane_;
        std::atomic<bool> initialized_{false};
        bool warned_before_initialize_ = false;
    };

} // namespace mcptools::server
