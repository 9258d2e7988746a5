#include "tools/static_analysis.hpp"

#include <system_error>
#include <utility>
#include <nlohmann/json.hpp>
#include "core/logging/logger.hpp"

namespace mcptools::tools {

using nlohmann::json;

namespace {

bool has_marker(const std::filesystem::path& root, const char* name) {
    std::error_code ec;
    return std::filesystem::exists(root / name, ec);
}

PlannedCommand planned(const std::filesystem::path& root, std::string tool, std::string program,
                       std::vector<std::string> args) {
    PlannedCommand command;
    command.tool = std::move(tool);
    command.spec.program = std::move(program);
    command.spec.args = std::move(args);
    command.spec.working_directory = root;
    return command;
}

bool contains(const std::vector<std::string>& kinds, const char* kind) {
    for (const auto& item : kinds) {
        if (item == kind) {
            return true;
        }
    }
    return false;
}

}  // namespace

std::vector<std::string> detect_static_kinds(const std::filesystem::path& root) {
    std::vector<std::string> kinds;
    if (has_marker(root, "Cargo.toml")) {
        kinds.emplace_back("rust");
    }
    if (has_marker(root, "package.json")) {
        kinds.emplace_back("node");
    }
    if (has_marker(root, "pyproject.toml") || has_marker(root, "setup.cfg") ||
        has_marker(root, "setup.py")) {
        kinds.emplace_back("python");
    }
    return kinds;
}

std::vector<PlannedCommand> plan_static_commands(const std::filesystem::path& root,
                                                 const StaticAction action) {
    const auto kinds = detect_static_kinds(root);
    std::vector<PlannedCommand> commands;

    if (action == StaticAction::Lint) {
        if (contains(kinds, "rust")) {
            commands.push_back(
                planned(root, "cargo clippy", "cargo", {"clippy", "--", "-D", "warnings"}));
        }
        if (contains(kinds, "node")) {
            if (has_marker(root, "node_modules/.bin/eslint")) {
                commands.push_back(planned(root, "eslint", "node",
                                           {"node_modules/.bin/eslint", ".", "--max-warnings",
                                            "0"}));
            } else {
                commands.push_back(planned(root, "npm run lint", "npm", {"run", "lint"}));
            }
        }
        // flake8 needs a config-bearing project; setup.py alone is skipped.
        if (contains(kinds, "python") &&
            (has_marker(root, "pyproject.toml") || has_marker(root, "setup.cfg"))) {
            commands.push_back(planned(root, "flake8", "flake8", {"."}));
        }
        return commands;
    }

    if (contains(kinds, "rust")) {
        commands.push_back(planned(root, "cargo fmt", "cargo", {"fmt"}));
    }
    if (contains(kinds, "node")) {
        if (has_marker(root, "node_modules/.bin/prettier")) {
            commands.push_back(planned(root, "prettier", "node",
                                       {"node_modules/.bin/prettier", "--write", "."}));
        } else {
            commands.push_back(planned(root, "npm run format", "npm", {"run", "format"}));
        }
    }
    if (contains(kinds, "python")) {
        commands.push_back(planned(root, "black", "black", {"."}));
    }
    return commands;
}

StaticAnalysis::StaticAnalysis(std::filesystem::path workspace_root,
                               const runtime::SubprocessExecutor& executor)
    : workspace_root_(std::move(workspace_root)), executor_(executor) {}

protocol::ToolCallResult StaticAnalysis::detect() const {
    json payload;
    payload["types"] = detect_static_kinds(workspace_root_);
    return protocol::structured_result(payload);
}

protocol::ToolCallResult StaticAnalysis::run(const StaticAction action) const {
    json results = json::array();
    bool any_failed = false;
    for (const auto& command : plan_static_commands(workspace_root_, action)) {
        MCPTOOLS_LOG_INFO("static: " + runtime::to_display_string(command.spec));
        const auto outcome = executor_.run(command.spec);
        json entry = protocol::to_json(outcome);
        entry["tool"] = command.tool;
        results.push_back(entry);
        any_failed = any_failed || outcome.status != 0;
    }

    json payload;
    payload["results"] = results;
    return protocol::structured_result(payload, any_failed);
}

std::vector<server::ToolDefinition> make_static_tools(std::shared_ptr<const StaticAnalysis> analysis) {
    const json empty_schema = {
        {"type", "object"}, {"properties", json::object()}, {"additionalProperties", false}};

    std::vector<server::ToolDefinition> tools;
    tools.push_back(server::make_tool<protocol::NoParams>(
        {"static.detect", "Detects project languages for static tooling", empty_schema},
        server::ExecutionLane::Blocking, protocol::decode_no_params,
        [analysis](const protocol::NoParams&) { return analysis->detect(); }));
    tools.push_back(server::make_tool<protocol::NoParams>(
        {"lint.code", "Run linters across detected languages", empty_schema},
        server::ExecutionLane::Blocking, protocol::decode_no_params,
        [analysis](const protocol::NoParams&) { return analysis->run(StaticAction::Lint); }));
    tools.push_back(server::make_tool<protocol::NoParams>(
        {"format.code", "Run code formatters across detected languages", empty_schema},
        server::ExecutionLane::Blocking, protocol::decode_no_params,
        [analysis](const protocol::NoParams&) { return analysis->run(StaticAction::Format); }));
    return tools;
}

}  // namespace mcptools::tools
