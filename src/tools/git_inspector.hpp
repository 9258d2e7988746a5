#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <vector>
#include "protocol/tool_contract.hpp"
#include "protocol/tool_params.hpp"
#include "runtime/subprocess_executor.hpp"
#include "server/tool_registry.hpp"

namespace mcptools::tools {

    // Read-only git queries. Output is passed through unchanged.
    class GitInspector {
    public:
        GitInspector(std::filesystem::path workspace_root,
                     const runtime::SubprocessExecutor& executor);

        protocol::ToolCallResult status() const;
        protocol::ToolCallResult diff(const protocol::GitDiffParams& params) const;

    private:
        protocol::ToolCallResult run_git(std::vector<std::string> args) const;

        std::filesystem::path workspace_root_;
        const runtime::SubprocessExecutor& executor_;
    };

    std::vector<server::ToolDefinition> make_git_tools(std::shared_ptr<const GitInspector> git);

} // namespace mcptools::tools
