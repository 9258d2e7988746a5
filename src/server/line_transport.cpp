#include "server/line_transport.hpp"

#include <istream>
#include <ostream>

namespace mcptools::server {

using nlohmann::json;

LineTransport::LineTransport(std::istream& in, std::ostream& out) : in_(in), out_(out) {}

std::optional<std::string> LineTransport::read_line() {
    std::string line;
    while (std::getline(in_, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.find_first_not_of(" \t") == std::string::npos) {
            continue;
        }
        return line;
    }
    return std::nullopt;
}

void LineTransport::write_message(const json& message) {
    const std::string serialized =
        message.dump(-1, ' ', false, json::error_handler_t::replace);
    std::lock_guard<std::mutex> lock(write_mutex_);
    out_ << serialized << '\n';
    out_.flush();
}

std::optional<json> LineTransport::parse_line(const std::string& line) {
    json parsed = json::parse(line, nullptr, false);
    if (parsed.is_discarded()) {
        return std::nullopt;
    }
    return parsed;
}

}  // namespace mcptools::server
