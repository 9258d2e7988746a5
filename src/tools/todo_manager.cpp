#include "tools/todo_manager.hpp"

#include <algorithm>
#include <fstream>
#include <iterator>
#include <sstream>
#include <system_error>
#include <utility>
#include <nlohmann/json.hpp>
#include "core/logging/logger.hpp"
#include "tools/todo_list.hpp"

namespace mcptools::tools {

using core::errors::ErrorCategory;
using core::errors::ToolError;
using nlohmann::json;

namespace {

json task_to_json(const TodoTask& task) {
    json payload;
    payload["title"] = task.title;
    payload["done"] = task.done;
    payload["priority"] = task.priority.has_value() ? json(task.priority.value()) : json(nullptr);
    return payload;
}

json tasks_to_json(const std::vector<TodoTask>& tasks) {
    json list = json::array();
    for (const auto& task : tasks) {
        list.push_back(task_to_json(task));
    }
    return list;
}

protocol::ToolCallResult failure(const ToolError& error) {
    MCPTOOLS_LOG_WARN("todo [" + error.code + "]: " + error.message);
    return protocol::error_result(error.message);
}

}  // namespace

TodoManager::TodoManager(std::filesystem::path workspace_root)
    : workspace_root_(std::move(workspace_root)), path_guard_(workspace_root_) {}

core::errors::Result<std::vector<std::string>> TodoManager::list_todo_files() const {
    std::error_code ec;
    std::filesystem::directory_iterator it(workspace_root_, ec);
    if (ec) {
        return ToolError{ErrorCategory::Execution,
                         "Unable to list directory: " + workspace_root_.string(),
                         "todo_scan_failed"};
    }

    std::vector<std::string> files;
    for (const auto& entry : it) {
        const std::string name = entry.path().filename().string();
        if (is_todo_file_name(name) && entry.is_regular_file(ec) && !ec) {
            files.push_back(name);
        }
    }
    std::sort(files.begin(), files.end());
    return files;
}

core::errors::Result<std::string> TodoManager::read_text(const std::string& path,
                                                         std::filesystem::path& resolved) const {
    auto guarded = path_guard_.validate_path_in_workspace(path);
    if (core::errors::is_error(guarded)) {
        return core::errors::get_error(guarded);
    }
    resolved = core::errors::get_value(guarded);

    std::error_code ec;
    if (!std::filesystem::is_regular_file(resolved, ec) || ec) {
        return ToolError{ErrorCategory::Input, "cannot read file: " + path, "todo_read_failed"};
    }
    std::ifstream in(resolved, std::ios::binary);
    if (!in.is_open()) {
        return ToolError{ErrorCategory::Input, "cannot read file: " + path, "todo_read_failed"};
    }
    std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) {
        return ToolError{ErrorCategory::Execution, "cannot read file: " + path,
                         "todo_read_failed"};
    }
    return text;
}

core::errors::Result<std::size_t> TodoManager::write_text(const std::filesystem::path& path,
                                                          const std::string& text) const {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        return ToolError{ErrorCategory::Execution, "write failed: " + path.string(),
                         "todo_write_failed"};
    }
    out << text;
    out.flush();
    if (!out.good()) {
        return ToolError{ErrorCategory::Execution, "write failed: " + path.string(),
                         "todo_write_failed"};
    }
    return text.size();
}

protocol::ToolCallResult TodoManager::scan() const {
    auto files = list_todo_files();
    if (core::errors::is_error(files)) {
        return failure(core::errors::get_error(files));
    }
    json payload;
    payload["files"] = core::errors::get_value(files);
    return protocol::structured_result(payload);
}

protocol::ToolCallResult TodoManager::read(const protocol::TodoFileParams& params) const {
    std::filesystem::path resolved;
    auto text = read_text(params.path, resolved);
    if (core::errors::is_error(text)) {
        return failure(core::errors::get_error(text));
    }

    const auto document = parse_todo_document(core::errors::get_value(text));
    json payload;
    payload["tasks"] = tasks_to_json(document.tasks);
    payload["skipped"] = document.skipped_lines;
    return protocol::structured_result(payload);
}

protocol::ToolCallResult TodoManager::update(const protocol::TodoUpdateParams& params) const {
    std::filesystem::path resolved;
    auto text = read_text(params.path, resolved);
    if (core::errors::is_error(text)) {
        return failure(core::errors::get_error(text));
    }

    auto document = parse_todo_document(core::errors::get_value(text));
    std::size_t updated = 0;
    json unmatched = json::array();
    for (const auto& change : params.updates) {
        const std::string wanted = normalize_title(change.title);
        const auto it = std::find_if(
            document.tasks.begin(), document.tasks.end(),
            [&wanted](const TodoTask& task) { return normalize_title(task.title) == wanted; });
        if (it == document.tasks.end()) {
            unmatched.push_back(change.title);
            continue;
        }
        it->done = change.done;
        ++updated;
    }

    const std::string header =
        params.header.has_value() && !params.header->empty() ? params.header.value()
                                                             : document.header;
    auto written = write_text(resolved, render_todo_document(header, document.tasks));
    if (core::errors::is_error(written)) {
        return failure(core::errors::get_error(written));
    }

    MCPTOOLS_LOG_INFO("todo.update " + params.path + ": " + std::to_string(updated) +
                      " task(s) updated");
    json payload;
    payload["ok"] = true;
    payload["updated"] = updated;
    payload["unmatched"] = unmatched;
    return protocol::structured_result(payload);
}

protocol::ToolCallResult TodoManager::next(const protocol::TodoNextParams& params) const {
    std::filesystem::path resolved;
    auto text = read_text(params.path, resolved);
    if (core::errors::is_error(text)) {
        return failure(core::errors::get_error(text));
    }

    const auto document = parse_todo_document(core::errors::get_value(text));
    json payload;
    payload["next"] = tasks_to_json(next_tasks(document.tasks, params.limit));
    return protocol::structured_result(payload);
}

std::vector<server::ToolDefinition> make_todo_tools(std::shared_ptr<const TodoManager> manager) {
    const json scan_schema = {
        {"type", "object"}, {"properties", json::object()}, {"additionalProperties", false}};
    const json read_schema = {{"type", "object"},
                              {"properties", {{"path", {{"type", "string"}}}}},
                              {"required", {"path"}},
                              {"additionalProperties", false}};
    const json update_schema = {
        {"type", "object"},
        {"properties",
         {{"path", {{"type", "string"}}},
          {"updates",
           {{"type", "array"},
            {"items",
             {{"type", "object"},
              {"properties", {{"title", {{"type", "string"}}}, {"done", {{"type", "boolean"}}}}},
              {"required", {"title", "done"}},
              {"additionalProperties", false}}}}},
          {"header", {{"type", "string"}}}}},
        {"required", {"path", "updates"}},
        {"additionalProperties", false}};
    const json next_schema = {
        {"type", "object"},
        {"properties", {{"path", {{"type", "string"}}}, {"limit", {{"type", "number"}}}}},
        {"required", {"path"}},
        {"additionalProperties", false}};

    std::vector<server::ToolDefinition> tools;
    tools.push_back(server::make_tool<protocol::NoParams>(
        {"todo.scan", "List TODO.md and TODO_*.md files in the current directory", scan_schema},
        server::ExecutionLane::Blocking, protocol::decode_no_params,
        [manager](const protocol::NoParams&) { return manager->scan(); }));
    tools.push_back(server::make_tool<protocol::TodoFileParams>(
        {"todo.read", "Read and parse tasks from a TODO file", read_schema},
        server::ExecutionLane::Blocking, protocol::decode_todo_file,
        [manager](const protocol::TodoFileParams& params) { return manager->read(params); }));
    tools.push_back(server::make_tool<protocol::TodoUpdateParams>(
        {"todo.update", "Update task statuses in a TODO file (by title match)", update_schema},
        server::ExecutionLane::Blocking, protocol::decode_todo_update,
        [manager](const protocol::TodoUpdateParams& params) { return manager->update(params); }));
    tools.push_back(server::make_tool<protocol::TodoNextParams>(
        {"todo.next", "Propose next tasks from a TODO file", next_schema},
        server::ExecutionLane::Blocking, protocol::decode_todo_next,
        [manager](const protocol::TodoNextParams& params) { return manager->next(params); }));
    return tools;
}

}  // namespace mcptools::tools
