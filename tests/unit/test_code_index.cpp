#include <filesystem>
#include <fstream>
#include <set>
#include <string>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "core/config/session_id.hpp"
#include "protocol/tool_params.hpp"
#include "runtime/subprocess_executor.hpp"
#include "tools/code_index.hpp"

namespace {

using mcptools::protocol::CodeReadParams;
using mcptools::protocol::CodeSearchParams;
using mcptools::runtime::SubprocessExecutor;
using mcptools::tools::CodeIndex;
using nlohmann::json;

class TempWorkspace {
public:
    TempWorkspace() {
        // Outside any checkout so ripgrep applies no parent ignore rules.
        root_ = std::filesystem::temp_directory_path() /
                ("mcptools_code_index_" + mcptools::core::config::generate_session_id());
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

void write_file(const std::filesystem::path& path, const std::string& content) {
    std::filesystem::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary);
    out << content;
}

CodeReadParams read_params(const std::string& path) {
    CodeReadParams params;
    params.path = path;
    return params;
}

TEST(CodeIndexTest, SearchFindsMatchesRecursively) {
    TempWorkspace workspace;
    write_file(workspace.root() / "a.cpp", "int needle = 1;\n");
    write_file(workspace.root() / "sub/b.cpp", "// nothing\nneedle and more\n");
    write_file(workspace.root() / "sub/c.cpp", "no match here\n");

    SubprocessExecutor executor;
    CodeIndex index(workspace.root(), executor);
    CodeSearchParams params;
    params.query = "needle";
    params.context = 0;

    const auto result = index.search(params);
    ASSERT_FALSE(result.is_error);
    ASSERT_TRUE(result.structured.has_value());

    const json& payload = result.structured.value();
    EXPECT_FALSE(payload["truncated"].get<bool>());
    std::set<std::string> files;
    for (const auto& match : payload["results"]) {
        files.insert(match["file"].get<std::string>());
    }
    EXPECT_EQ(files, (std::set<std::string>{"a.cpp", "sub/b.cpp"}));
}

TEST(CodeIndexTest, SearchHonoursGlobsAndLimit) {
    TempWorkspace workspace;
    write_file(workspace.root() / "a.cpp", "needle\nneedle\nneedle\n");
    write_file(workspace.root() / "notes.md", "needle\n");

    SubprocessExecutor executor;
    CodeIndex index(workspace.root(), executor);
    CodeSearchParams params;
    params.query = "needle";
    params.globs = {"*.cpp"};
    params.max_results = 2;
    params.context = 0;

    const auto result = index.search(params);
    ASSERT_FALSE(result.is_error);
    const json& payload = result.structured.value();
    ASSERT_EQ(payload["results"].size(), 2u);
    EXPECT_TRUE(payload["truncated"].get<bool>());
    for (const auto& match : payload["results"]) {
        EXPECT_EQ(match["file"], "a.cpp");
    }
}

TEST(CodeIndexTest, SearchWithNoMatchesIsNotAnError) {
    TempWorkspace workspace;
    write_file(workspace.root() / "a.txt", "hello\n");

    SubprocessExecutor executor;
    CodeIndex index(workspace.root(), executor);
    CodeSearchParams params;
    params.query = "absent-token";

    const auto result = index.search(params);
    ASSERT_FALSE(result.is_error);
    EXPECT_TRUE(result.structured.value()["results"].empty());
}

TEST(CodeIndexTest, SearchRejectsBlankQuery) {
    TempWorkspace workspace;
    SubprocessExecutor executor;
    CodeIndex index(workspace.root(), executor);
    CodeSearchParams params;
    params.query = "   ";

    const auto result = index.search(params);
    EXPECT_TRUE(result.is_error);
    ASSERT_EQ(result.content.size(), 1u);
    EXPECT_EQ(result.content[0].text, "empty query");
}

TEST(CodeIndexTest, ReadReturnsLineRange) {
    TempWorkspace workspace;
    write_file(workspace.root() / "five.txt", "l1\nl2\nl3\nl4\nl5\n");

    SubprocessExecutor executor;
    CodeIndex index(workspace.root(), executor);
    auto params = read_params("five.txt");
    params.start = 2;
    params.end = 3;

    const auto result = index.read(params);
    ASSERT_FALSE(result.is_error);
    const json& payload = result.structured.value();
    EXPECT_EQ(payload["content"], "l2\nl3");
    EXPECT_EQ(payload["start"], 2);
    EXPECT_EQ(payload["end"], 3);
    EXPECT_FALSE(payload["truncated"].get<bool>());
}

TEST(CodeIndexTest, ReadRangeDefaultsEndAndClampsStart) {
    TempWorkspace workspace;
    write_file(workspace.root() / "five.txt", "l1\nl2\nl3\nl4\nl5\n");

    SubprocessExecutor executor;
    CodeIndex index(workspace.root(), executor);
    auto params = read_params("five.txt");
    params.start = -4;

    const auto result = index.read(params);
    ASSERT_FALSE(result.is_error);
    const json& payload = result.structured.value();
    EXPECT_EQ(payload["start"], 1);
    EXPECT_EQ(payload["end"], 200);
    EXPECT_EQ(payload["content"], "l1\nl2\nl3\nl4\nl5");
}

TEST(CodeIndexTest, ReadWithHugeEndReadsToEndOfFile) {
    TempWorkspace workspace;
    write_file(workspace.root() / "five.txt", "l1\nl2\nl3\nl4\nl5\n");

    SubprocessExecutor executor;
    CodeIndex index(workspace.root(), executor);
    const auto params = mcptools::protocol::decode_code_read(
        json{{"path", "five.txt"}, {"start", 2}, {"end", 1e19}});

    const auto result = index.read(params);
    ASSERT_FALSE(result.is_error);
    EXPECT_EQ(result.structured.value()["content"], "l2\nl3\nl4\nl5");
}

TEST(CodeIndexTest, ReadWholeFileTruncatesAtMaxBytes) {
    TempWorkspace workspace;
    write_file(workspace.root() / "big.txt", std::string(3000, 'a'));

    SubprocessExecutor executor;
    CodeIndex index(workspace.root(), executor);
    auto params = read_params("big.txt");
    params.max_bytes = 1024;

    const auto result = index.read(params);
    ASSERT_FALSE(result.is_error);
    const json& payload = result.structured.value();
    EXPECT_EQ(payload["content"].get<std::string>().size(), 1024u);
    EXPECT_TRUE(payload["truncated"].get<bool>());
}

TEST(CodeIndexTest, ReadDoesNotSplitUtf8Sequence) {
    TempWorkspace workspace;
    // 1023 ASCII bytes then a two-byte character straddling the cap.
    write_file(workspace.root() / "utf8.txt", std::string(1023, 'a') + "\xC3\xA9" + "tail");

    SubprocessExecutor executor;
    CodeIndex index(workspace.root(), executor);
    auto params = read_params("utf8.txt");
    params.max_bytes = 1024;

    const auto result = index.read(params);
    ASSERT_FALSE(result.is_error);
    EXPECT_EQ(result.structured.value()["content"].get<std::string>().size(), 1023u);
}

TEST(CodeIndexTest, ReadRejectsPathOutsideWorkspace) {
    TempWorkspace workspace;
    SubprocessExecutor executor;
    CodeIndex index(workspace.root(), executor);

    const auto result = index.read(read_params("../../etc/passwd"));
    EXPECT_TRUE(result.is_error);
    EXPECT_NE(result.content[0].text.find("invalid path"), std::string::npos);
}

TEST(CodeIndexTest, ReadRejectsMissingAndBinaryFiles) {
    TempWorkspace workspace;
    write_file(workspace.root() / "blob.bin", std::string("ab\0cd", 5));

    SubprocessExecutor executor;
    CodeIndex index(workspace.root(), executor);
    EXPECT_TRUE(index.read(read_params("missing.txt")).is_error);
    EXPECT_TRUE(index.read(read_params("blob.bin")).is_error);
}

}  // namespace
