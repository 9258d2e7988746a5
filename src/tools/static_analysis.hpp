#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <vector>
#include "protocol/tool_contract.hpp"
#include "runtime/subprocess_executor.hpp"
#include "server/tool_registry.hpp"

namespace mcptools::tools {

    enum class StaticAction {
        Lint,
        Format
    };

    // One command of a lint or format pass, labelled for the report.
    struct PlannedCommand {
        std::string tool;
        runtime::CommandSpec spec;
    };

    // Any subset of rust, node and python may be present at once.
    std::vector<std::string> detect_static_kinds(const std::filesystem::path& root);

    std::vector<PlannedCommand> plan_static_commands(const std::filesystem::path& root,
                                                     StaticAction action);

    class StaticAnalysis {
    public:
        StaticAnalysis(std::filesystem::path workspace_root,
                       const runtime::SubprocessExecutor& executor);

        protocol::ToolCallResult detect() const;

        // Runs every planned command in order and reports {results: [...]}.
        protocol::ToolCallResult run(StaticAction action) const;

    private:
        std::filesystem::path workspace_root_;
        const runtime::SubprocessExecutor& executor_;
    };

    std::vector<server::ToolDefinition> make_static_tools(std::shared_ptr<const StaticAnalysis> analysis);

} // namespace mcptools::tools
