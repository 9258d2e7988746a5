#pragma once

#include <cstddef>
#include <functional>
#include <string>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors/tool_errors.hpp"
#include "protocol/tool_contract.hpp"
#include "protocol/tool_params.hpp"

namespace mcptools::server {

    // Blocking tools run on the dispatcher thread and hold up further input.
    // Suspending tools run on the async lane while input keeps flowing.
    enum class ExecutionLane {
        Blocking,
        Suspending
    };

    using ParamDecoder =
        std::function<core::errors::Result<protocol::ToolParams>(const nlohmann::json&)>;
    using ToolHandler = std::function<protocol::ToolCallResult(const protocol::ToolParams&)>;

    struct ToolDefinition {
        protocol::ToolDescriptor descriptor;
        ExecutionLane lane = ExecutionLane::Blocking;
        ParamDecoder decode;
        ToolHandler handler;
    };

    // Static per-server tool table. Built once at startup, read-only afterwards.
    class ToolRegistry {
    public:
        // Rejects duplicate names. Returns the registry size on success.
        core::errors::Result<std::size_t> add(ToolDefinition definition);

        const ToolDefinition* find(const std::string& name) const;
        std::vector<protocol::ToolDescriptor> descriptors() const;
        std::size_t size() const { return tools_.size(); }

    private:
        std::vector<ToolDefinition> tools_;
    };

    // Wraps a handler written against its own parameter record. Arguments are
    // validated against the descriptor's schema before `decode` runs.
    template <typename Params>
    ToolDefinition make_tool(protocol::ToolDescriptor descriptor, const ExecutionLane lane,
                             std::function<Params(const nlohmann::json&)> decode,
                             std::function<protocol::ToolCallResult(const Params&)> handler) {
        ToolDefinition definition;
        definition.lane = lane;

        const nlohmann::json schema = descriptor.input_schema;
        definition.decode = [schema, decode](const nlohmann::json& arguments)
            -> core::errors::Result<protocol::ToolParams> {
            auto problem = protocol::validate_arguments(schema, arguments);
            if (problem.has_value()) {
                return core::errors::ToolError{core::errors::ErrorCategory::Input,
                                               problem.value(), "invalid_arguments"};
            }
            return protocol::ToolParams{decode(arguments)};
        };
        definition.handler = [handler](const protocol::ToolParams& params) {
            return handler(std::get<Params>(params));
        };
        definition.descriptor = std::move(descriptor);
        return definition;
    }

} // namespace mcptools::server
