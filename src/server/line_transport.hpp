#pragma once

#include <iosfwd>
#include <mutex>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace mcptools::server {

    // Newline-delimited JSON over a pair of streams. Reads happen on one
    // thread; writes may come from any thread and never interleave.
    class LineTransport {
    public:
        LineTransport(std::istream& in, std::ostream& out);

        // Next non-empty line without its terminator, or nullopt at end of input.
        std::optional<std::string> read_line();

        // Serialises to one line and flushes. Invalid UTF-8 is replaced.
        void write_message(const nlohmann::json& message);

        // Parses a line; nullopt when it is not valid JSON.
        static std::optional<nlohmann::json> parse_line(const std::string& line);

    private:
        std::istream& in_;
        std::ostream& out_;
        std::mutex write_mutex_;
    };

} // namespace mcptools::server
