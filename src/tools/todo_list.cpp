#include "tools/todo_list.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace mcptools::tools {

namespace {

bool is_space(const char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

std::string to_upper(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](const unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return text;
}

std::string trim_right(std::string text) {
    while (!text.empty() && is_space(text.back())) {
        text.pop_back();
    }
    return text;
}

std::optional<std::string> extract_priority(const std::string& title) {
    constexpr const char* kTag = "[prio:";
    std::size_t from = 0;
    while (true) {
        const auto start = title.find(kTag, from);
        if (start == std::string::npos) {
            return std::nullopt;
        }
        const std::size_t value_start = start + 6;
        std::size_t pos = value_start;
        while (pos < title.size() && std::isalnum(static_cast<unsigned char>(title[pos])) != 0) {
            ++pos;
        }
        if (pos > value_start && pos < title.size() && title[pos] == ']') {
            return title.substr(value_start, pos - value_start);
        }
        from = start + 1;
    }
}

int priority_rank(const TodoTask& task) {
    const std::string priority = to_upper(task.priority.value_or(""));
    if (priority == "P1") {
        return 0;
    }
    if (priority == "P2") {
        return 1;
    }
    return 2;
}

bool is_checkbox_line(const std::string& line) {
    const auto first = line.find_first_not_of(" \t");
    return first != std::string::npos && line.compare(first, 3, "- [") == 0;
}

}  // namespace

TodoLine parse_todo_line(const std::string& line) {
    if (!is_checkbox_line(line)) {
        return ProseLine{line};
    }

    const std::size_t marker_pos = line.find("- [") + 3;
    if (marker_pos + 1 >= line.size() || line[marker_pos + 1] != ']') {
        return MalformedTask{line, "unterminated checkbox"};
    }
    const char marker = line[marker_pos];
    if (marker != ' ' && marker != 'x' && marker != 'X') {
        return MalformedTask{line, std::string("unknown checkbox marker '") + marker + "'"};
    }

    const std::size_t after = marker_pos + 2;
    if (after >= line.size() || !is_space(line[after])) {
        return MalformedTask{line, "missing space after checkbox"};
    }
    const auto title_start = line.find_first_not_of(" \t", after);
    if (title_start == std::string::npos) {
        return MalformedTask{line, "missing title"};
    }

    TodoTask task;
    task.title = trim_right(line.substr(title_start));
    task.done = marker != ' ';
    task.priority = extract_priority(task.title);
    return task;
}

TodoDocument parse_todo_document(const std::string& markdown) {
    TodoDocument document;
    std::istringstream in(markdown);
    std::string line;
    std::string header;
    bool in_header = true;
    std::size_t line_no = 0;

    while (std::getline(in, line)) {
        ++line_no;
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (in_header && is_checkbox_line(line)) {
            in_header = false;
        }
        if (in_header) {
            header += line + "\n";
            continue;
        }

        const TodoLine parsed = parse_todo_line(line);
        if (const auto* task = std::get_if<TodoTask>(&parsed)) {
            document.tasks.push_back(*task);
        } else if (std::holds_alternative<MalformedTask>(parsed)) {
            document.skipped_lines.push_back(line_no);
        }
    }

    document.header = trim_right(header);
    return document;
}

std::string render_todo_document(const std::string& header, const std::vector<TodoTask>& tasks) {
    std::string out;
    const std::string trimmed = trim_right(header);
    if (!trimmed.empty()) {
        out += trimmed + "\n\n";
    }
    for (const auto& task : tasks) {
        out += std::string("- [") + (task.done ? "x" : " ") + "] " + task.title + "\n";
    }
    return out;
}

std::vector<TodoTask> next_tasks(const std::vector<TodoTask>& tasks, const std::size_t limit) {
    std::vector<TodoTask> open;
    for (const auto& task : tasks) {
        if (!task.done) {
            open.push_back(task);
        }
    }
    std::stable_sort(open.begin(), open.end(), [](const TodoTask& a, const TodoTask& b) {
        return priority_rank(a) < priority_rank(b);
    });
    if (open.size() > limit) {
        open.resize(limit);
    }
    return open;
}

std::string normalize_title(const std::string& title) {
    std::string out;
    bool pending_space = false;
    for (const char c : title) {
        if (is_space(c)) {
            pending_space = !out.empty();
            continue;
        }
        if (pending_space) {
            out.push_back(' ');
            pending_space = false;
        }
        out.push_back(c);
    }
    return out;
}

bool is_todo_file_name(const std::string& name) {
    const std::string upper = to_upper(name);
    if (upper == "TODO.MD") {
        return true;
    }
    return upper.size() >= 8 && upper.compare(0, 5, "TODO_") == 0 &&
           upper.compare(upper.size() - 3, 3, ".MD") == 0;
}

}  // namespace mcptools::tools
