#include "server/tool_registry.hpp"

#include <algorithm>

namespace mcptools::server {

using core::errors::ErrorCategory;
using core::errors::ToolError;

core::errors::Result<std::size_t> ToolRegistry::add(ToolDefinition definition) {
    if (definition.descriptor.name.empty()) {
        return ToolError{ErrorCategory::Internal, "Tool name cannot be empty.",
                         "invalid_tool_name"};
    }
    if (!definition.decode || !definition.handler) {
        return ToolError{ErrorCategory::Internal,
                         "Tool has no handler: " + definition.descriptor.name,
                         "missing_tool_handler"};
    }
    if (find(definition.descriptor.name) != nullptr) {
        return ToolError{ErrorCategory::Internal,
                         "Duplicate tool name: " + definition.descriptor.name,
                         "duplicate_tool"};
    }

    tools_.push_back(std::move(definition));
    return tools_.size();
}

const ToolDefinition* ToolRegistry::find(const std::string& name) const {
    const auto it = std::find_if(tools_.begin(), tools_.end(), [&name](const ToolDefinition& tool) {
        return tool.descriptor.name == name;
    });
    return it == tools_.end() ? nullptr : &(*it);
}

std::vector<protocol::ToolDescriptor> ToolRegistry::descriptors() const {
    std::vector<protocol::ToolDescriptor> out;
    out.reserve(tools_.size());
    for (const auto& tool : tools_) {
        out.push_back(tool.descriptor);
    }
    return out;
}

}  // namespace mcptools::server
