#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <variant>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "core/config/session_id.hpp"
#include "protocol/tool_params.hpp"
#include "tools/todo_list.hpp"
#include "tools/todo_manager.hpp"

namespace {

using namespace mcptools::tools;
using mcptools::protocol::TodoFileParams;
using mcptools::protocol::TodoNextParams;
using mcptools::protocol::TodoUpdateParams;
using nlohmann::json;

class TempWorkspace {
public:
    TempWorkspace() {
        root_ = std::filesystem::current_path() /
                (".tmp_todo_" + mcptools::core::config::generate_session_id());
        std::filesystem::create_directories(root_);
    }

    ~TempWorkspace() {
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
    }

    const std::filesystem::path& root() const { return root_; }

    void write(const std::string& name, const std::string& content) const {
        std::ofstream out(root_ / name, std::ios::binary);
        out << content;
    }

    std::string read(const std::string& name) const {
        std::ifstream in(root_ / name, std::ios::binary);
        std::stringstream buffer;
        buffer << in.rdbuf();
        return buffer.str();
    }

private:
    std::filesystem::path root_;
};

TEST(TodoLineTest, ParsesOpenAndDoneTasks) {
    const auto open = parse_todo_line("- [ ] Write docs [prio:P2]");
    ASSERT_TRUE(std::holds_alternative<TodoTask>(open));
    EXPECT_EQ(std::get<TodoTask>(open).title, "Write docs [prio:P2]");
    EXPECT_FALSE(std::get<TodoTask>(open).done);
    EXPECT_EQ(std::get<TodoTask>(open).priority.value_or(""), "P2");

    const auto done = parse_todo_line("    - [X]   Ship release  ");
    ASSERT_TRUE(std::holds_alternative<TodoTask>(done));
    EXPECT_EQ(std::get<TodoTask>(done).title, "Ship release");
    EXPECT_TRUE(std::get<TodoTask>(done).done);
    EXPECT_FALSE(std::get<TodoTask>(done).priority.has_value());
}

TEST(TodoLineTest, ClassifiesProseAndMalformedLines) {
    EXPECT_TRUE(std::holds_alternative<ProseLine>(parse_todo_line("# Plan")));
    EXPECT_TRUE(std::holds_alternative<ProseLine>(parse_todo_line("- plain bullet")));
    EXPECT_TRUE(std::holds_alternative<MalformedTask>(parse_todo_line("- [~] maybe")));
    EXPECT_TRUE(std::holds_alternative<MalformedTask>(parse_todo_line("- [x]no-space")));
    EXPECT_TRUE(std::holds_alternative<MalformedTask>(parse_todo_line("- [ ]")));
}

TEST(TodoDocumentTest, SplitsHeaderAndRecordsSkippedLines) {
    const auto document = parse_todo_document(
        "# Sprint\r\nNotes here.\r\n\r\n- [ ] One\r\n- [?] Broken\r\nprose\r\n- [x] Two\r\n");
    EXPECT_EQ(document.header, "# Sprint\nNotes here.");
    ASSERT_EQ(document.tasks.size(), 2u);
    EXPECT_EQ(document.tasks[0].title, "One");
    EXPECT_TRUE(document.tasks[1].done);
    EXPECT_EQ(document.skipped_lines, (std::vector<std::size_t>{5}));
}

TEST(TodoDocumentTest, RendersHeaderBlankLineAndTasks) {
    std::vector<TodoTask> tasks(2);
    tasks[0].title = "One";
    tasks[1].title = "Two";
    tasks[1].done = true;
    EXPECT_EQ(render_todo_document("# Plan\n\n", tasks), "# Plan\n\n- [ ] One\n- [x] Two\n");
    EXPECT_EQ(render_todo_document("", tasks), "- [ ] One\n- [x] Two\n");
}

TEST(TodoNextTest, OrdersByPriorityAndHonoursLimit) {
    const auto document = parse_todo_document(
        "- [ ] plain one\n"
        "- [ ] second [prio:P2]\n"
        "- [x] finished [prio:P1]\n"
        "- [ ] urgent [prio:p1]\n"
        "- [ ] plain two\n");

    const auto next = next_tasks(document.tasks, 2);
    ASSERT_EQ(next.size(), 2u);
    EXPECT_EQ(next[0].title, "urgent [prio:p1]");
    EXPECT_EQ(next[1].title, "second [prio:P2]");

    const auto all = next_tasks(document.tasks, 50);
    ASSERT_EQ(all.size(), 4u);
    EXPECT_EQ(all[2].title, "plain one");
    EXPECT_EQ(all[3].title, "plain two");
}

TEST(TodoNamesTest, MatchesTodoFilesCaseInsensitively) {
    EXPECT_TRUE(is_todo_file_name("TODO.md"));
    EXPECT_TRUE(is_todo_file_name("todo_backend.MD"));
    EXPECT_TRUE(is_todo_file_name("TODO_.md"));
    EXPECT_FALSE(is_todo_file_name("TODO.txt"));
    EXPECT_FALSE(is_todo_file_name("MYTODO.md"));
    EXPECT_EQ(normalize_title("  a \t b\n c "), "a b c");
}

TEST(TodoManagerTest, ScanListsSortedTodoFiles) {
    TempWorkspace workspace;
    workspace.write("TODO_zeta.md", "");
    workspace.write("TODO.md", "");
    workspace.write("README.md", "");

    TodoManager manager(workspace.root());
    const auto result = manager.scan();
    ASSERT_FALSE(result.is_error);
    EXPECT_EQ(result.structured.value()["files"], json::array({"TODO.md", "TODO_zeta.md"}));
}

TEST(TodoManagerTest, ReadReportsTasksAndSkippedLines) {
    TempWorkspace workspace;
    workspace.write("TODO.md", "# T\n- [ ] a [prio:P1]\n- [!] bad\n");

    TodoManager manager(workspace.root());
    const auto result = manager.read(TodoFileParams{"TODO.md"});
    ASSERT_FALSE(result.is_error);
    const json& payload = result.structured.value();
    ASSERT_EQ(payload["tasks"].size(), 1u);
    EXPECT_EQ(payload["tasks"][0]["priority"], "P1");
    EXPECT_EQ(payload["skipped"], json::array({3}));
}

TEST(TodoManagerTest, UpdateRewritesFileAndReportsUnmatched) {
    TempWorkspace workspace;
    workspace.write("TODO.md", "# Plan\n\n- [ ] Write   parser\nstray prose\n- [ ] Ship\n");

    TodoManager manager(workspace.root());
    TodoUpdateParams params;
    params.path = "TODO.md";
    params.updates = {{"Write parser", true}, {"Missing task", true}};

    const auto result = manager.update(params);
    ASSERT_FALSE(result.is_error);
    const json& payload = result.structured.value();
    EXPECT_EQ(payload["ok"], true);
    EXPECT_EQ(payload["updated"], 1);
    EXPECT_EQ(payload["unmatched"], json::array({"Missing task"}));
    EXPECT_EQ(workspace.read("TODO.md"), "# Plan\n\n- [x] Write   parser\n- [ ] Ship\n");
}

TEST(TodoManagerTest, UpdateUsesExplicitHeader) {
    TempWorkspace workspace;
    workspace.write("TODO_api.md", "old header\n- [x] Done thing\n");

    TodoManager manager(workspace.root());
    TodoUpdateParams params;
    params.path = "TODO_api.md";
    params.updates = {{"Done thing", false}};
    params.header = "# API";

    ASSERT_FALSE(manager.update(params).is_error);
    EXPECT_EQ(workspace.read("TODO_api.md"), "# API\n\n- [ ] Done thing\n");
}

TEST(TodoManagerTest, NextReturnsPrioritisedOpenTasks) {
    TempWorkspace workspace;
    workspace.write("TODO.md", "- [ ] later\n- [ ] soon [prio:P2]\n- [ ] now [prio:P1]\n");

    TodoManager manager(workspace.root());
    TodoNextParams params;
    params.path = "TODO.md";
    params.limit = 2;

    const auto result = manager.next(params);
    ASSERT_FALSE(result.is_error);
    const json& next = result.structured.value()["next"];
    ASSERT_EQ(next.size(), 2u);
    EXPECT_EQ(next[0]["title"], "now [prio:P1]");
    EXPECT_EQ(next[1]["title"], "soon [prio:P2]");
}

TEST(TodoManagerTest, MissingOrOutsideFilesAreToolErrors) {
    TempWorkspace workspace;
    TodoManager manager(workspace.root());
    EXPECT_TRUE(manager.read(TodoFileParams{"TODO.md"}).is_error);
    EXPECT_TRUE(manager.read(TodoFileParams{"../../etc/passwd"}).is_error);
}

}  // namespace
