#include "tools/git_inspector.hpp"

#include <utility>
#include <nlohmann/json.hpp>

namespace mcptools::tools {

using nlohmann::json;

GitInspector::GitInspector(std::filesystem::path workspace_root,
                           const runtime::SubprocessExecutor& executor)
    : workspace_root_(std::move(workspace_root)), executor_(executor) {}

protocol::ToolCallResult GitInspector::run_git(std::vector<std::string> args) const {
    runtime::CommandSpec spec;
    spec.program = "git";
    spec.args = std::move(args);
    spec.working_directory = workspace_root_;
    return protocol::command_result(executor_.run(spec));
}

protocol::ToolCallResult GitInspector::status() const {
    return run_git({"status", "--porcelain=v1"});
}

protocol::ToolCallResult GitInspector::diff(const protocol::GitDiffParams& params) const {
    if (params.staged) {
        return run_git({"diff", "--staged"});
    }
    return run_git({"diff"});
}

std::vector<server::ToolDefinition> make_git_tools(std::shared_ptr<const GitInspector> git) {
    const json status_schema = {
        {"type", "object"}, {"properties", json::object()}, {"additionalProperties", false}};
    const json diff_schema = {{"type", "object"},
                              {"properties", {{"staged", {{"type", "boolean"}}}}},
                              {"additionalProperties", false}};

    std::vector<server::ToolDefinition> tools;
    tools.push_back(server::make_tool<protocol::NoParams>(
        {"git.status", "Show repository status", status_schema}, server::ExecutionLane::Blocking,
        protocol::decode_no_params, [git](const protocol::NoParams&) { return git->status(); }));
    tools.push_back(server::make_tool<protocol::GitDiffParams>(
        {"git.diff", "Show diff (staged+unstaged)", diff_schema},
        server::ExecutionLane::Blocking, protocol::decode_git_diff,
        [git](const protocol::GitDiffParams& params) { return git->diff(params); }));
    return tools;
}

}  // namespace mcptools::tools
