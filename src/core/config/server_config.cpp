#include "core/config/server_config.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <system_error>

namespace mcptools::core::config {

using errors::ErrorCategory;
using errors::ToolError;

namespace {

std::string lowercase(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

std::optional<logging::LogLevel> parse_log_level(const std::string& value) {
    const std::string lowered = lowercase(value);
    if (lowered == "debug") {
        return logging::LogLevel::DEBUG;
    }
    if (lowered == "info") {
        return logging::LogLevel::INFO;
    }
    if (lowered == "warn" || lowered == "warning") {
        return logging::LogLevel::WARN;
    }
    if (lowered == "error") {
        return logging::LogLevel::ERROR;
    }
    return std::nullopt;
}

}  // namespace

std::optional<ServerKind> parse_server_kind(const std::string& name) {
    const std::string lowered = lowercase(name);
    if (lowered == "websearch") {
        return ServerKind::WebSearch;
    }
    if (lowered == "codeindex") {
        return ServerKind::CodeIndex;
    }
    if (lowered == "build") {
        return ServerKind::Build;
    }
    if (lowered == "git") {
        return ServerKind::Git;
    }
    if (lowered == "todo") {
        return ServerKind::Todo;
    }
    if (lowered == "static") {
        return ServerKind::Static;
    }
    if (lowered == "all") {
        return ServerKind::All;
    }
    return std::nullopt;
}

std::string to_string(const ServerKind kind) {
    switch (kind) {
        case ServerKind::WebSearch:
            return "websearch";
        case ServerKind::CodeIndex:
            return "codeindex";
        case ServerKind::Build:
            return "build";
        case ServerKind::Git:
            return "git";
        case ServerKind::Todo:
            return "todo";
        case ServerKind::Static:
            return "static";
        case ServerKind::All:
            return "all";
        default:
            return "unknown";
    }
}

EnvLookup process_environment() {
    return [](const std::string& name) -> std::optional<std::string> {
        const char* value = std::getenv(name.c_str());
        if (value == nullptr || value[0] == '\0') {
            return std::nullopt;
        }
        return std::string(value);
    };
}

errors::Result<ServerConfig> load_server_config(const LaunchOptions& options, const EnvLookup& env) {
    ServerConfig config;
    config.server = options.server;

    if (auto version = env("MCP_SCHEMA_VERSION")) {
        config.protocol_version = *version;
    }

    config.credentials.serpapi_key = env("SERPAPI_KEY");
    config.credentials.google_api_key = env("GOOGLE_API_KEY");
    config.credentials.google_cse_id = env("GOOGLE_CSE_ID");

    if (auto level = env("MCPTOOLS_LOG_LEVEL")) {
        auto parsed = parse_log_level(*level);
        if (!parsed.has_value()) {
            return ToolError{ErrorCategory::Input, "Invalid MCPTOOLS_LOG_LEVEL: " + *level,
                             "invalid_log_level", "Use debug, info, warn or error."};
        }
        config.log_level = *parsed;
    }
    if (options.verbose) {
        config.log_level = logging::LogLevel::DEBUG;
    }

    if (options.timeout_ms) {
        config.command_timeout_ms = *options.timeout_ms;
    }
    if (options.max_output_bytes) {
        config.output_cap_bytes = *options.max_output_bytes;
    }

    std::error_code ec;
    if (options.working_directory) {
        config.workspace_root = *options.working_directory;
    } else {
        config.workspace_root = std::filesystem::current_path(ec);
        if (ec) {
            return ToolError{ErrorCategory::Internal,
                             "Unable to determine the current directory: " + ec.message(),
                             "invalid_path"};
        }
    }

    return config;
}

}  // namespace mcptools::core::config
