#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace mcptools::tools {

    // `- [ ] title` or `- [x] title`, optionally indented.
    struct TodoTask {
        std::string title;
        bool done = false;
        std::optional<std::string> priority;  // from a `[prio:<alnum>]` tag
    };

    struct ProseLine {
        std::string text;
    };

    // Starts like a checkbox but does not follow the grammar.
    struct MalformedTask {
        std::string text;
        std::string reason;
    };

    using TodoLine = std::variant<TodoTask, ProseLine, MalformedTask>;

    TodoLine parse_todo_line(const std::string& line);

    struct TodoDocument {
        // Text before the first checkbox line, trailing whitespace removed.
        std::string header;
        std::vector<TodoTask> tasks;
        // 1-based numbers of malformed checkbox lines.
        std::vector<std::size_t> skipped_lines;
    };

    TodoDocument parse_todo_document(const std::string& markdown);

    // Header, blank line, then one checkbox line per task. Prose between tasks is not kept.
    std::string render_todo_document(const std::string& header, const std::vector<TodoTask>& tasks);

    // Unfinished tasks ordered P1, P2, then the rest; stable within each group.
    std::vector<TodoTask> next_tasks(const std::vector<TodoTask>& tasks, std::size_t limit);

    // Collapses whitespace runs to a single space and trims both ends.
    std::string normalize_title(const std::string& title);

    // TODO.md or TODO_*.md, case-insensitive.
    bool is_todo_file_name(const std::string& name);

} // namespace mcptools::tools
