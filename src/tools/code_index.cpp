#include "tools/code_index.hpp"

#include <algorithm>
#include <fstream>
#include <sstream>
#include <string>
#include <system_error>
#include <utility>
#include <nlohmann/json.hpp>
#include "core/logging/logger.hpp"
#include "tools/match_parser.hpp"

namespace mcptools::tools {

using nlohmann::json;
using protocol::ToolCallResult;

namespace {

constexpr long long kDefaultRangeLines = 200;

bool is_probably_binary(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        return false;
    }

    constexpr std::size_t kProbeSize = 1024;
    char buffer[kProbeSize];
    in.read(buffer, static_cast<std::streamsize>(kProbeSize));
    const std::streamsize read_bytes = in.gcount();
    for (std::streamsize i = 0; i < read_bytes; ++i) {
        if (buffer[i] == '\0') {
            return true;
        }
    }
    return false;
}

// Longest prefix of at most max_bytes that does not split a UTF-8 sequence.
std::string utf8_prefix(const std::string& text, std::size_t max_bytes) {
    if (text.size() <= max_bytes) {
        return text;
    }
    std::size_t cut = max_bytes;
    while (cut > 0 && (static_cast<unsigned char>(text[cut]) & 0xC0) == 0x80) {
        --cut;
    }
    return text.substr(0, cut);
}

json match_to_json(const CodeMatch& match) {
    json payload;
    payload["file"] = match.file;
    payload["line"] = match.line;
    payload["column"] = match.column;
    payload["preview"] = match.preview;
    if (!match.context.empty()) {
        json context = json::array();
        for (const auto& line : match.context) {
            context.push_back({{"line", line.line}, {"text", line.text}});
        }
        payload["context"] = context;
    }
    return payload;
}

}  // namespace

CodeIndex::CodeIndex(std::filesystem::path workspace_root,
                     const runtime::SubprocessExecutor& executor)
    : workspace_root_(std::move(workspace_root)),
      path_guard_(workspace_root_),
      executor_(executor) {}

ToolCallResult CodeIndex::search(const protocol::CodeSearchParams& params) const {
    const auto first = params.query.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return protocol::error_result("empty query");
    }
    const auto last = params.query.find_last_not_of(" \t\r\n");
    const std::string query = params.query.substr(first, last - first + 1);

    runtime::CommandSpec spec;
    spec.working_directory = workspace_root_;
    spec.timeout_ms = 60 * 1000;

    const bool use_rg = executor_.is_available("rg", workspace_root_);
    if (use_rg) {
        spec.program = "rg";
        spec.args = {"--color", "never", "--line-number", "--column",
                     "-C" + std::to_string(params.context), "-S"};
        for (const auto& glob : params.globs) {
            spec.args.push_back("-g");
            spec.args.push_back(glob);
        }
    } else {
        spec.program = "grep";
        spec.args = {"-R", "-n", "-H", "-C" + std::to_string(params.context)};
        for (const auto& glob : params.globs) {
            spec.args.push_back("--include");
            spec.args.push_back(glob);
        }
    }
    spec.args.push_back("-e");
    spec.args.push_back(query);
    spec.args.push_back(".");

    const auto command = executor_.run(spec);
    const MatchSet set =
        collect_matches(command.stdout_text, use_rg, params.max_results, params.context);

    // rg and grep exit 1 for "no matches" and 2 for real errors.
    if (set.matches.empty() && command.status >= 2) {
        return protocol::error_result("Search failed (" + spec.program + " exit " +
                                      std::to_string(command.status) + "): " +
                                      command.stderr_text);
    }

    json results = json::array();
    for (const auto& match : set.matches) {
        results.push_back(match_to_json(match));
    }

    json payload;
    payload["engine"] = spec.program;
    payload["results"] = results;
    payload["truncated"] = set.truncated || command.truncated;
    if (set.skipped_lines > 0) {
        payload["skipped_lines"] = set.skipped_lines;
    }
    return protocol::structured_result(payload);
}

ToolCallResult CodeIndex::read(const protocol::CodeReadParams& params) const {
    auto resolved = path_guard_.validate_path_in_workspace(params.path);
    if (core::errors::is_error(resolved)) {
        const auto& err = core::errors::get_error(resolved);
        MCPTOOLS_LOG_WARN("code.read rejected [" + err.code + "]: " + err.message);
        return protocol::error_result("invalid path: " + err.message);
    }
    const std::filesystem::path file_path = core::errors::get_value(resolved);

    std::error_code ec;
    if (!std::filesystem::exists(file_path, ec) || ec) {
        return protocol::error_result("not a file: " + params.path + " does not exist");
    }
    if (!std::filesystem::is_regular_file(file_path, ec) || ec) {
        return protocol::error_result("not a file: " + params.path);
    }
    if (is_probably_binary(file_path)) {
        return protocol::error_result("Refusing to read binary file: " + params.path);
    }

    std::ifstream in(file_path, std::ios::binary);
    if (!in.is_open()) {
        return protocol::error_result("Failed to open file: " + params.path);
    }

    json payload;
    payload["path"] = params.path;

    if (params.start.has_value() || params.end.has_value()) {
        const long long start = std::max<long long>(1, params.start.value_or(1));
        const long long end = std::max<long long>(
            start, params.end.value_or(start + kDefaultRangeLines - 1));

        std::string slice;
        std::string line;
        long long line_no = 0;
        bool first_line = true;
        while (line_no < end && std::getline(in, line)) {
            ++line_no;
            if (line_no < start) {
                continue;
            }
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            if (!first_line) {
                slice.push_back('\n');
            }
            slice += line;
            first_line = false;
        }
        if (in.bad()) {
            return protocol::error_result("I/O error while reading file: " + params.path);
        }

        const std::string content = utf8_prefix(slice, params.max_bytes);
        payload["content"] = content;
        payload["start"] = start;
        payload["end"] = end;
        payload["truncated"] = content.size() < slice.size();
        return protocol::structured_result(payload);
    }

    // One byte past the cap tells whether the file is longer.
    std::string buffer(params.max_bytes + 1, '\0');
    in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
    if (in.bad()) {
        return protocol::error_result("I/O error while reading file: " + params.path);
    }
    buffer.resize(static_cast<std::size_t>(in.gcount()));

    const std::string content = utf8_prefix(buffer, params.max_bytes);
    payload["content"] = content;
    payload["truncated"] = content.size() < buffer.size();
    return protocol::structured_result(payload);
}

std::vector<server::ToolDefinition> make_code_index_tools(std::shared_ptr<const CodeIndex> index) {
    std::vector<server::ToolDefinition> tools;

    json search_schema = {
        {"type", "object"},
        {"properties",
         {{"q", {{"type", "string"}, {"description", "Query string (regex supported by rg/grep)"}}},
          {"globs",
           {{"type", "array"},
            {"items", {{"type", "string"}}},
            {"description", "Optional include globs (e.g., src/**/*.rs)"}}},
          {"max_results",
           {{"type", "number"}, {"description", "Maximum matches to return (default 50)"}}},
          {"context",
           {{"type", "number"}, {"description", "Lines of context before/after (default 1)"}}}}},
        {"required", {"q"}},
        {"additionalProperties", false}};
    tools.push_back(server::make_tool<protocol::CodeSearchParams>(
        {"code.search", "Search repository files using ripgrep if available (fallback to grep).",
         search_schema},
        server::ExecutionLane::Blocking, protocol::decode_code_search,
        [index](const protocol::CodeSearchParams& params) { return index->search(params); }));

    json read_schema = {
        {"type", "object"},
        {"properties",
         {{"path", {{"type", "string"}, {"description", "Relative file path"}}},
          {"start", {{"type", "number"}, {"description", "1-based start line (optional)"}}},
          {"end", {{"type", "number"}, {"description", "1-based end line inclusive (optional)"}}},
          {"max_bytes",
           {{"type", "number"}, {"description", "Maximum bytes to return (default 64KiB)"}}}}},
        {"required", {"path"}},
        {"additionalProperties", false}};
    tools.push_back(server::make_tool<protocol::CodeReadParams>(
        {"code.read", "Read a file or a line range within the current project.", read_schema},
        server::ExecutionLane::Blocking, protocol::decode_code_read,
        [index](const protocol::CodeReadParams& params) { return index->read(params); }));

    return tools;
}

}  // namespace mcptools::tools
