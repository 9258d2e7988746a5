#pragma once

#include <cstddef>
#include <string>
#include <variant>
#include <vector>

namespace mcptools::tools {

    struct ContextLine {
        std::string file;
        long line = 0;
        std::string text;
    };

    struct CodeMatch {
        std::string file;
        long line = 0;
        long column = 1;
        std::string preview;
        std::vector<ContextLine> context;
    };

    // `--` between non-adjacent context groups.
    struct SeparatorLine {};

    struct ParseFailure {
        std::string line;
        std::string reason;
    };

    using MatchLine = std::variant<CodeMatch, ContextLine, SeparatorLine, ParseFailure>;

    // Parses one line of `rg --line-number --column` (with_column) or
    // `grep -n -H` output. Match lines use ':' separators, context lines '-'.
    MatchLine parse_match_line(const std::string& line, bool with_column);

    struct MatchSet {
        std::vector<CodeMatch> matches;
        bool truncated = false;
        std::size_t skipped_lines = 0;
    };

    // Groups context lines with the match they surround and stops after
    // max_matches. `context` is the -C width the output was produced with.
    MatchSet collect_matches(const std::string& output, bool with_column,
                             std::size_t max_matches, int context);

} // namespace mcptools::tools
