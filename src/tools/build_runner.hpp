#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "protocol/tool_contract.hpp"
#include "protocol/tool_params.hpp"
#include "runtime/subprocess_executor.hpp"
#include "server/tool_registry.hpp"

namespace mcptools::tools {

    enum class BuildAction {
        Build,
        Test
    };

    // Project kinds found in `root`, in dispatch priority order:
    // rust, node, go, python, make.
    std::vector<std::string> detect_build_kinds(const std::filesystem::path& root);

    // Command for the first detected kind, or nullopt when nothing is detected.
    // A non-empty target or filter is appended as the last argument.
    std::optional<runtime::CommandSpec> plan_build_command(const std::filesystem::path& root,
                                                           BuildAction action,
                                                           const std::string& target);

    class BuildRunner {
    public:
        BuildRunner(std::filesystem::path workspace_root,
                    const runtime::SubprocessExecutor& executor);

        protocol::ToolCallResult detect() const;
        protocol::ToolCallResult run(BuildAction action,
                                     const protocol::BuildTargetParams& params) const;

    private:
        std::filesystem::path workspace_root_;
        const runtime::SubprocessExecutor& executor_;
    };

    std::vector<server::ToolDefinition> make_build_tools(std::shared_ptr<const BuildRunner> runner);

} // namespace mcptools::tools
