#include "tools/build_runner.hpp"

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

runtime::CommandSpec make_spec(const std::filesystem::path& root, std::string program,
                               std::vector<std::string> args, const std::string& target) {
    runtime::CommandSpec spec;
    spec.program = std::move(program);
    spec.args = std::move(args);
    if (!target.empty()) {
        spec.args.push_back(target);
    }
    spec.working_directory = root;
    return spec;
}

}  // namespace

std::vector<std::string> detect_build_kinds(const std::filesystem::path& root) {
    std::vector<std::string> kinds;
    if (has_marker(root, "Cargo.toml")) {
        kinds.emplace_back("rust");
    }
    if (has_marker(root, "package.json")) {
        kinds.emplace_back("node");
    }
    if (has_marker(root, "go.mod")) {
        kinds.emplace_back("go");
    }
    if (has_marker(root, "pyproject.toml") || has_marker(root, "setup.py")) {
        kinds.emplace_back("python");
    }
    if (has_marker(root, "Makefile")) {
        kinds.emplace_back("make");
    }
    return kinds;
}

std::optional<runtime::CommandSpec> plan_build_command(const std::filesystem::path& root,
                                                       const BuildAction action,
                                                       const std::string& target) {
    const auto kinds = detect_build_kinds(root);
    if (kinds.empty()) {
        return std::nullopt;
    }

    const bool build = action == BuildAction::Build;
    const std::string& kind = kinds.front();
    if (kind == "rust") {
        return make_spec(root, "cargo", {build ? "build" : "test"}, target);
    }
    if (kind == "node") {
        if (has_marker(root, "pnpm-lock.yaml")) {
            return make_spec(root, "pnpm",
                             build ? std::vector<std::string>{"run", "build"}
                                   : std::vector<std::string>{"test"},
                             target);
        }
        return make_spec(root, "npm", {"run", build ? "build" : "test"}, target);
    }
    if (kind == "go") {
        return make_spec(root, "go", {build ? "build" : "test", "./..."}, target);
    }
    if (kind == "python") {
        if (!build) {
            return make_spec(root, "pytest", {}, target);
        }
        if (has_marker(root, "pyproject.toml")) {
            return make_spec(root, "python3", {"-m", "build"}, target);
        }
        return make_spec(root, "python3", {"setup.py", "sdist", "bdist_wheel"}, target);
    }
    return make_spec(root, "make", {build ? "build" : "test"}, target);
}

BuildRunner::BuildRunner(std::filesystem::path workspace_root,
                         const runtime::SubprocessExecutor& executor)
    : workspace_root_(std::move(workspace_root)), executor_(executor) {}

protocol::ToolCallResult BuildRunner::detect() const {
    json payload;
    payload["types"] = detect_build_kinds(workspace_root_);
    return protocol::structured_result(payload);
}

protocol::ToolCallResult BuildRunner::run(const BuildAction action,
                                          const protocol::BuildTargetParams& params) const {
    const auto spec = plan_build_command(workspace_root_, action, params.target);
    if (!spec.has_value()) {
        protocol::CommandResult none;
        none.status = 2;
        none.stderr_text = "no supported project type detected";
        return protocol::command_result(none);
    }

    MCPTOOLS_LOG_INFO(std::string(action == BuildAction::Build ? "build.run" : "test.run") +
                      ": " + runtime::to_display_string(spec.value()));
    const auto result = executor_.run(spec.value());
    if (result.status != 0) {
        MCPTOOLS_LOG_WARN(spec->program + " exited with status " + std::to_string(result.status));
    }
    return protocol::command_result(result);
}

std::vector<server::ToolDefinition> make_build_tools(std::shared_ptr<const BuildRunner> runner) {
    const json empty_schema = {
        {"type", "object"}, {"properties", json::object()}, {"additionalProperties", false}};
    const json build_schema = {
        {"type", "object"},
        {"properties",
         {{"target", {{"type", "string"}, {"description", "optional target or script"}}}}},
        {"additionalProperties", false}};
    const json test_schema = {
        {"type", "object"},
        {"properties",
         {{"filter", {{"type", "string"}, {"description", "test filter if supported"}}}}},
        {"additionalProperties", false}};

    std::vector<server::ToolDefinition> tools;
    tools.push_back(server::make_tool<protocol::NoParams>(
        {"build.detect", "Detects project type", empty_schema}, server::ExecutionLane::Blocking,
        protocol::decode_no_params,
        [runner](const protocol::NoParams&) { return runner->detect(); }));
    tools.push_back(server::make_tool<protocol::BuildTargetParams>(
        {"build.run", "Run a build for the project", build_schema},
        server::ExecutionLane::Blocking,
        [](const json& arguments) { return protocol::decode_build_target(arguments, "target"); },
        [runner](const protocol::BuildTargetParams& params) {
            return runner->run(BuildAction::Build, params);
        }));
    tools.push_back(server::make_tool<protocol::BuildTargetParams>(
        {"test.run", "Run tests for the project", test_schema}, server::ExecutionLane::Blocking,
        [](const json& arguments) { return protocol::decode_build_target(arguments, "filter"); },
        [runner](const protocol::BuildTargetParams& params) {
            return runner->run(BuildAction::Test, params);
        }));
    return tools;
}

}  // namespace mcptools::tools
