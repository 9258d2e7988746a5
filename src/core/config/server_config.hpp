#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include "core/errors/tool_errors.hpp"
#include "core/logging/logger.hpp"

namespace mcptools::core::config {

    constexpr const char* kDefaultProtocolVersion = "2025-06-18";

    enum class ServerKind {
        WebSearch,
        CodeIndex,
        Build,
        Git,
        Todo,
        Static,
        All
    };

    std::optional<ServerKind> parse_server_kind(const std::string& name);
    std::string to_string(ServerKind kind);

    // Command-line input, before the environment is consulted.
    struct LaunchOptions {
        ServerKind server = ServerKind::All;
        std::optional<std::filesystem::path> working_directory;
        std::optional<std::uint32_t> timeout_ms;
        std::optional<std::size_t> max_output_bytes;
        bool verbose = false;
    };

    // Two alternative credential sets, one per search engine.
    struct SearchCredentials {
        std::optional<std::string> serpapi_key;
        std::optional<std::string> google_api_key;
        std::optional<std::string> google_cse_id;

        bool has_google() const { return google_api_key.has_value() && google_cse_id.has_value(); }
        bool has_serpapi() const { return serpapi_key.has_value(); }
    };

    // Built once at startup and passed to every handler that needs it.
    struct ServerConfig {
        ServerKind server = ServerKind::All;
        std::string protocol_version = kDefaultProtocolVersion;
        std::filesystem::path workspace_root;
        SearchCredentials credentials;
        std::uint32_t command_timeout_ms = 10 * 60 * 1000;
        std::uint32_t http_timeout_ms = 30 * 1000;
        std::size_t output_cap_bytes = 8 * 1024 * 1024;
        std::size_t max_in_flight = 4;
        logging::LogLevel log_level = logging::LogLevel::INFO;
    };

    // Returns the variable's value, or nullopt when unset or empty.
    using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

    EnvLookup process_environment();

    errors::Result<ServerConfig> load_server_config(const LaunchOptions& options, const EnvLookup& env);

} // namespace mcptools::core::config
