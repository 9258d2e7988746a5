#include "cli_parser.hpp"
#include <charconv>
#include <cstdint>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

namespace mcptools::app::cli {

    using namespace mcptools::core::errors;
    using mcptools::core::config::LaunchOptions;

    constexpr const char* kUsage =
        "Usage: mcptools <websearch|codeindex|build|git|todo|static|all> "
        "[--cwd DIR] [--timeout-ms N] [--max-output-bytes N] [--verbose]";

    // Raw option strings, before validation
    struct RawCliOptions {
        std::optional<std::string> cwd;
        std::optional<std::string> timeout_ms;
        std::optional<std::string> max_output_bytes;
        bool verbose = false;
    };

    namespace {

        // Exception-free integer parsing with inclusive bounds
        template <typename T>
        Result<T> parse_bounded(const std::string& flag, const std::string& text, T low, T high) {
            T value = 0;
            const char* begin = text.data();
            const char* end = text.data() + text.size();
            auto [ptr, ec] = std::from_chars(begin, end, value);
            if (ec != std::errc() || ptr != end) {
                return ToolError{ErrorCategory::Input, "Invalid number for " + flag, "invalid_integer", "Provide a positive integer."};
            }
            if (value < low || value > high) {
                return ToolError{ErrorCategory::Input, flag + " out of bounds", "bounds_error",
                                 "Must be between " + std::to_string(low) + " and " + std::to_string(high) + "."};
            }
            return value;
        }

    } // namespace

    Result<LaunchOptions> parse_and_validate(int argc, char* argv[]) {
        if (argc < 2) {
            return ToolError{ErrorCategory::Input, "No server provided.", "missing_command", kUsage};
        }

        const std::string command = argv[1];
        auto server = mcptools::core::config::parse_server_kind(command);
        if (!server.has_value()) {
            return ToolError{ErrorCategory::Input, "Unknown server: " + command, "unknown_command", kUsage};
        }

        RawCliOptions raw;
        std::vector<std::string> args;
        for (int i = 2; i < argc; ++i) {
            args.push_back(argv[i]);
        }

        for (size_t i = 0; i < args.size(); ++i) {
            if (args[i] == "--cwd") {
                if (i + 1 < args.size()) raw.cwd = args[++i];
                else return ToolError{ErrorCategory::Input, "Missing value for --cwd", "missing_value"};
            } else if (args[i] == "--timeout-ms") {
                if (i + 1 < args.size()) raw.timeout_ms = args[++i];
                else return ToolError{ErrorCategory::Input, "Missing value for --timeout-ms", "missing_value"};
            } else if (args[i] == "--max-output-bytes") {
                if (i + 1 < args.size()) raw.max_output_bytes = args[++i];
                else return ToolError{ErrorCategory::Input, "Missing value for --max-output-bytes", "missing_value"};
            } else if (args[i] == "--verbose") {
                raw.verbose = true;
            } else {
                return ToolError{ErrorCategory::Input, "Unknown argument: " + args[i], "unknown_argument", kUsage};
            }
        }

        LaunchOptions options;
        options.server = server.value();
        options.verbose = raw.verbose;

        if (raw.timeout_ms) {
            auto timeout = parse_bounded<std::uint32_t>("--timeout-ms", raw.timeout_ms.value(), 1, 24u * 60u * 60u * 1000u);
            if (is_error(timeout)) {
                return get_error(timeout);
            }
            options.timeout_ms = get_value(timeout);
        }

        if (raw.max_output_bytes) {
            auto cap = parse_bounded<std::size_t>("--max-output-bytes", raw.max_output_bytes.value(), 1024, std::size_t{1} << 30);
            if (is_error(cap)) {
                return get_error(cap);
            }
            options.max_output_bytes = get_value(cap);
        }

        if (raw.cwd) {
            std::filesystem::path p(raw.cwd.value());
            std::error_code path_ec;
            const bool exists = std::filesystem::exists(p, path_ec);
            if (path_ec || !exists) {
                return ToolError{ErrorCategory::Input, "Working directory does not exist or is not a directory", "invalid_path"};
            }

            const bool is_dir = std::filesystem::is_directory(p, path_ec);
            if (path_ec || !is_dir) {
                return ToolError{ErrorCategory::Input, "Working directory does not exist or is not a directory", "invalid_path"};
            }

            std::filesystem::path canonical_path = std::filesystem::canonical(p, path_ec);
            if (path_ec) {
                return ToolError{ErrorCategory::Input, "Failed to canonicalize working directory", "invalid_path"};
            }
            options.working_directory = std::move(canonical_path);
        }

        return options;
    }

} // namespace mcptools::app::cli
