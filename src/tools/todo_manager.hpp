#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <vector>
#include "core/errors/tool_errors.hpp"
#include "policy/path_guard.hpp"
#include "protocol/tool_contract.hpp"
#include "protocol/tool_params.hpp"
#include "server/tool_registry.hpp"

namespace mcptools::tools {

    // Markdown checklist files in the working root.
    class TodoManager {
    public:
        explicit TodoManager(std::filesystem::path workspace_root);

        protocol::ToolCallResult scan() const;
        protocol::ToolCallResult read(const protocol::TodoFileParams& params) const;
        protocol::ToolCallResult update(const protocol::TodoUpdateParams& params) const;
        protocol::ToolCallResult next(const protocol::TodoNextParams& params) const;

        // Sorted TODO file names directly under the root.
        core::errors::Result<std::vector<std::string>> list_todo_files() const;

    private:
        core::errors::Result<std::string> read_text(const std::string& path,
                                                    std::filesystem::path& resolved) const;
        core::errors::Result<std::size_t> write_text(const std::filesystem::path& path,
                                                     const std::string& text) const;

        std::filesystem::path workspace_root_;
        policy::PathGuard path_guard_;
    };

    std::vector<server::ToolDefinition> make_todo_tools(std::shared_ptr<const TodoManager> manager);

} // namespace mcptools::tools
