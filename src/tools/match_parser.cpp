#include "tools/match_parser.hpp"

#include <cctype>
#include <sstream>

namespace mcptools::tools {

namespace {

constexpr std::size_t kMaxPreviewLength = 240;

std::string trim_preview(const std::string& text) {
    if (text.size() <= kMaxPreviewLength) {
        return text;
    }
    return text.substr(0, kMaxPreviewLength) + "...";
}

std::string strip_dot_slash(std::string file) {
    if (file.rfind("./", 0) == 0) {
        file.erase(0, 2);
    }
    return file;
}

// Reads a run of digits starting at pos followed by `delimiter`.
// On success pos points just past the delimiter.
bool read_number(const std::string& line, std::size_t& pos, const char delimiter,
                 long& value) {
    const std::size_t begin = pos;
    std::size_t cursor = pos;
    while (cursor < line.size() && std::isdigit(static_cast<unsigned char>(line[cursor])) != 0) {
        ++cursor;
    }
    if (cursor == begin || cursor >= line.size() || line[cursor] != delimiter ||
        cursor - begin > 9) {
        return false;
    }
    value = std::stol(line.substr(begin, cursor - begin));
    pos = cursor + 1;
    return true;
}

// Finds the leftmost `file<d>N<d>[M<d>]` split, mirroring a lazy regex.
bool split_fields(const std::string& line, const char delimiter, const bool with_column,
                  std::string& file, long& line_no, long& column, std::string& text) {
    for (std::size_t sep = line.find(delimiter, 1); sep != std::string::npos;
         sep = line.find(delimiter, sep + 1)) {
        std::size_t pos = sep + 1;
        long parsed_line = 0;
        if (!read_number(line, pos, delimiter, parsed_line)) {
            continue;
        }
        long parsed_column = 1;
        if (with_column && !read_number(line, pos, delimiter, parsed_column)) {
            continue;
        }
        file = line.substr(0, sep);
        line_no = parsed_line;
        column = parsed_column;
        text = line.substr(pos);
        return true;
    }
    return false;
}

}  // namespace

MatchLine parse_match_line(const std::string& line, const bool with_column) {
    if (line == "--") {
        return SeparatorLine{};
    }

    std::string file;
    std::string text;
    long line_no = 0;
    long column = 1;
    if (split_fields(line, ':', with_column, file, line_no, column, text)) {
        return CodeMatch{strip_dot_slash(file), line_no, column, trim_preview(text), {}};
    }
    if (split_fields(line, '-', false, file, line_no, column, text)) {
        return ContextLine{strip_dot_slash(file), line_no, trim_preview(text)};
    }
    return ParseFailure{line, "not a match, context or separator line"};
}

MatchSet collect_matches(const std::string& output, const bool with_column,
                         const std::size_t max_matches, const int context) {
    MatchSet set;
    std::vector<ContextLine> pending;
    std::istringstream in(output);
    std::string raw;

    while (std::getline(in, raw)) {
        if (!raw.empty() && raw.back() == '\r') {
            raw.pop_back();
        }
        if (raw.empty()) {
            continue;
        }

        MatchLine parsed = parse_match_line(raw, with_column);
        if (auto* match = std::get_if<CodeMatch>(&parsed)) {
            if (set.matches.size() >= max_matches) {
                set.truncated = true;
                break;
            }
            for (auto& line : pending) {
                if (line.file == match->file) {
                    match->context.push_back(std::move(line));
                }
            }
            pending.clear();
            set.matches.push_back(std::move(*match));
            continue;
        }
        if (auto* context_line = std::get_if<ContextLine>(&parsed)) {
            if (!set.matches.empty()) {
                CodeMatch& last = set.matches.back();
                if (last.file == context_line->file && context_line->line > last.line &&
                    context_line->line - last.line <= context) {
                    last.context.push_back(std::move(*context_line));
                    continue;
                }
            }
            pending.push_back(std::move(*context_line));
            continue;
        }
        if (std::holds_alternative<SeparatorLine>(parsed)) {
            pending.clear();
            continue;
        }
        ++set.skipped_lines;
    }

    return set;
}

}  // namespace mcptools::tools
