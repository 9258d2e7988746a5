#pragma once

#include <filesystem>
#include <memory>
#include <vector>
#include "policy/path_guard.hpp"
#include "protocol/tool_contract.hpp"
#include "protocol/tool_params.hpp"
#include "runtime/subprocess_executor.hpp"
#include "server/tool_registry.hpp"

namespace mcptools::tools {

    // code.search and code.read, confined to the working root.
    class CodeIndex {
    public:
        CodeIndex(std::filesystem::path workspace_root,
                  const runtime::SubprocessExecutor& executor);

        protocol::ToolCallResult search(const protocol::CodeSearchParams& params) const;
        protocol::ToolCallResult read(const protocol::CodeReadParams& params) const;

    private:
        std::filesystem::path workspace_root_;
        policy::PathGuard path_guard_;
        const runtime::SubprocessExecutor& executor_;
    };

    std::vector<server::ToolDefinition> make_code_index_tools(std::shared_ptr<const CodeIndex> index);

} // namespace mcptools::tools
