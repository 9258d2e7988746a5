#include <filesystem>
#include <fstream>
#include <string>
#include <utility>
#include <vector>
#include <gtest/gtest.h>
#include "core/config/session_id.hpp"
#include "runtime/subprocess_executor.hpp"

namespace {

using mcptools::runtime::CommandSpec;
using mcptools::runtime::SubprocessExecutor;

class TempWorkspace {
public:
    TempWorkspace() {
        root_ = std::filesystem::current_path() /
                (".tmp_subprocess_" + mcptools::core::config::generate_session_id());
        std::filesystem::create_directories(root_);
    }

    ~TempWorkspace() {
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
    }

    const std::filesystem::path& root() const { return root_; }

private:
    std::filesystem::path root_;
};

CommandSpec make_spec(std::string program, std::vector<std::string> args) {
    CommandSpec spec;
    spec.program = std::move(program);
    spec.args = std::move(args);
    return spec;
}

TEST(SubprocessExecutorTest, CapturesStdout) {
    SubprocessExecutor executor;
    const auto result = executor.run(make_spec("echo", {"hello", "world"}));
    EXPECT_EQ(result.status, 0);
    EXPECT_EQ(result.stdout_text, "hello world\n");
    EXPECT_FALSE(result.timed_out);
    EXPECT_FALSE(result.truncated);
}

TEST(SubprocessExecutorTest, CapturesStderrAndExitStatus) {
    SubprocessExecutor executor;
    const auto result = executor.run(make_spec("sh", {"-c", "echo oops >&2; exit 3"}));
    EXPECT_EQ(result.status, 3);
    EXPECT_EQ(result.stderr_text, "oops\n");
}

TEST(SubprocessExecutorTest, ArgumentsAreNotShellInterpreted) {
    SubprocessExecutor executor;
    const auto result = executor.run(make_spec("echo", {"a; echo injected", "$(id)"}));
    EXPECT_EQ(result.status, 0);
    EXPECT_EQ(result.stdout_text, "a; echo injected $(id)\n");
}

TEST(SubprocessExecutorTest, RunsInWorkingDirectory) {
    TempWorkspace workspace;
    auto spec = make_spec("pwd", {});
    spec.working_directory = workspace.root();

    SubprocessExecutor executor;
    const auto result = executor.run(spec);
    ASSERT_EQ(result.status, 0);
    EXPECT_EQ(std::filesystem::path(result.stdout_text.substr(0, result.stdout_text.size() - 1)),
              std::filesystem::canonical(workspace.root()));
}

TEST(SubprocessExecutorTest, StdinIsEmpty) {
    SubprocessExecutor executor;
    const auto result = executor.run(make_spec("cat", {}));
    EXPECT_EQ(result.status, 0);
    EXPECT_TRUE(result.stdout_text.empty());
}

TEST(SubprocessExecutorTest, TimeoutKillsProcessAndReturns124) {
    SubprocessExecutor executor;
    auto spec = make_spec("sleep", {"5"});
    spec.timeout_ms = 200;

    const auto result = executor.run(spec);
    EXPECT_EQ(result.status, SubprocessExecutor::kTimeoutStatus);
    EXPECT_TRUE(result.timed_out);
    EXPECT_NE(result.stderr_text.find("timed out"), std::string::npos);
    EXPECT_LT(result.duration_ms, 4000.0);
}

TEST(SubprocessExecutorTest, TimeoutCoversBackgroundProcessHoldingPipes) {
    SubprocessExecutor executor(500);
    const auto result = executor.run(make_spec("sh", {"-c", "sleep 6 & echo started"}));
    EXPECT_EQ(result.status, SubprocessExecutor::kTimeoutStatus);
    EXPECT_TRUE(result.timed_out);
    EXPECT_NE(result.stdout_text.find("started"), std::string::npos);
    EXPECT_LT(result.duration_ms, 4000.0);
}

TEST(SubprocessExecutorTest, MissingProgramReportsSpawnFailure) {
    SubprocessExecutor executor;
    const auto result = executor.run(make_spec("definitely-not-a-real-program-xyz", {}));
    EXPECT_EQ(result.status, SubprocessExecutor::kSpawnFailureStatus);
    EXPECT_NE(result.stderr_text.find("failed to start"), std::string::npos);
}

TEST(SubprocessExecutorTest, MissingWorkingDirectoryReportsSpawnFailure) {
    SubprocessExecutor executor;
    auto spec = make_spec("echo", {"x"});
    spec.working_directory = "/nonexistent/mcptools/dir";
    const auto result = executor.run(spec);
    EXPECT_EQ(result.status, SubprocessExecutor::kSpawnFailureStatus);
    EXPECT_NE(result.stderr_text.find("working directory"), std::string::npos);
}

TEST(SubprocessExecutorTest, OutputBeyondCapIsDroppedAndFlagged) {
    SubprocessExecutor executor(SubprocessExecutor::kDefaultTimeoutMs, 1024);
    const auto result = executor.run(make_spec("sh", {"-c", "head -c 200000 /dev/zero | tr '\\0' a"}));
    EXPECT_EQ(result.status, 0);
    EXPECT_EQ(result.stdout_text.size(), 1024u);
    EXPECT_TRUE(result.truncated);
}

TEST(SubprocessExecutorTest, SignalDeathMapsTo128PlusSignal) {
    SubprocessExecutor executor;
    const auto result = executor.run(make_spec("sh", {"-c", "kill -TERM $$"}));
    EXPECT_EQ(result.status, 128 + 15);
}

TEST(SubprocessExecutorTest, IsAvailableProbesVersion) {
    SubprocessExecutor executor;
    EXPECT_FALSE(executor.is_available("definitely-not-a-real-program-xyz"));
}

TEST(SubprocessExecutorTest, DisplayStringJoinsArguments) {
    EXPECT_EQ(mcptools::runtime::to_display_string(make_spec("git", {"diff", "--staged"})),
              "git diff --staged");
}

}  // namespace
