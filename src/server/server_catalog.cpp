#include "server/server_catalog.hpp"

#include <utility>
#include <vector>
#include "core/logging/logger.hpp"
#include "tools/build_runner.hpp"
#include "tools/code_index.hpp"
#include "tools/git_inspector.hpp"
#include "tools/static_analysis.hpp"
#include "tools/todo_manager.hpp"
#include "tools/web_search.hpp"

namespace mcptools::server {

using core::config::ServerKind;
using core::errors::ErrorCategory;
using core::errors::ToolError;

namespace {

bool includes(const ServerKind selected, const ServerKind family) {
    return selected == ServerKind::All || selected == family;
}

core::errors::Result<std::size_t> add_all(ToolRegistry& registry,
                                          std::vector<ToolDefinition> definitions) {
    for (auto& definition : definitions) {
        auto added = registry.add(std::move(definition));
        if (core::errors::is_error(added)) {
            return core::errors::get_error(added);
        }
    }
    return registry.size();
}

}  // namespace

ServerIdentity identity_for(const ServerKind kind) {
    ServerIdentity identity;
    switch (kind) {
        case ServerKind::WebSearch:
            identity.name = "mcp-websearch-simple";
            identity.title = "Web Search (Simple)";
            break;
        case ServerKind::CodeIndex:
            identity.name = "mcp-codeindex";
            identity.title = "Code Index";
            identity.instructions =
                "Use code.search to locate snippets, then code.read to fetch exact ranges.";
            break;
        case ServerKind::Build:
            identity.name = "mcp-build";
            identity.title = "Build & Test";
            identity.instructions =
                "Use build.detect to choose strategy; use build.run and test.run to execute.";
            break;
        case ServerKind::Git:
            identity.name = "mcp-git";
            identity.title = "Git Tools";
            break;
        case ServerKind::Todo:
            identity.name = "mcp-todo";
            identity.title = "TODO Manager";
            break;
        case ServerKind::Static:
            identity.name = "mcp-static";
            identity.title = "Static Analysis";
            break;
        case ServerKind::All:
            identity.name = "mcptools";
            identity.title = "MCP Tools";
            identity.instructions =
                "Use code.search to locate snippets, then code.read to fetch exact ranges. "
                "Use build.detect to choose strategy; use build.run and test.run to execute.";
            break;
    }
    return identity;
}

core::errors::Result<ToolRegistry> build_registry(const core::config::ServerConfig& config,
                                                  const ToolDependencies& deps) {
    if (!deps.executor) {
        return ToolError{ErrorCategory::Internal, "No subprocess executor provided.",
                         "missing_dependency"};
    }
    const auto& root = config.workspace_root;
    const auto& executor = *deps.executor;

    ToolRegistry registry;
    std::vector<std::vector<ToolDefinition>> families;

    if (includes(config.server, ServerKind::WebSearch)) {
        if (!deps.http) {
            return ToolError{ErrorCategory::Internal, "No HTTP client provided.",
                             "missing_dependency"};
        }
        families.push_back(tools::make_web_search_tools(
            std::make_shared<tools::WebSearch>(config.credentials, deps.http)));
    }
    if (includes(config.server, ServerKind::CodeIndex)) {
        families.push_back(
            tools::make_code_index_tools(std::make_shared<tools::CodeIndex>(root, executor)));
    }
    if (includes(config.server, ServerKind::Build)) {
        families.push_back(
            tools::make_build_tools(std::make_shared<tools::BuildRunner>(root, executor)));
    }
    if (includes(config.server, ServerKind::Git)) {
        families.push_back(
            tools::make_git_tools(std::make_shared<tools::GitInspector>(root, executor)));
    }
    if (includes(config.server, ServerKind::Todo)) {
        families.push_back(
            tools::make_todo_tools(std::make_shared<tools::TodoManager>(root)));
    }
    if (includes(config.server, ServerKind::Static)) {
        families.push_back(tools::make_static_tools(
            std::make_shared<tools::StaticAnalysis>(root, executor)));
    }

    for (auto& family : families) {
        auto added = add_all(registry, std::move(family));
        if (core::errors::is_error(added)) {
            return core::errors::get_error(added);
        }
    }

    MCPTOOLS_LOG_DEBUG("registered " + std::to_string(registry.size()) + " tool(s) for " +
                       core::config::to_string(config.server));
    return registry;
}

}  // namespace mcptools::server
