#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>
#include "protocol/tool_contract.hpp"

namespace mcptools::runtime {

    // A program plus discrete arguments. Never interpreted by a shell.
    struct CommandSpec {
        std::string program;
        std::vector<std::string> args;
        std::filesystem::path working_directory = ".";
        std::uint32_t timeout_ms = 0;  // 0 selects the executor default
    };

    std::string to_display_string(const CommandSpec& spec);

    class SubprocessExecutor {
    public:
        static constexpr int kTimeoutStatus = 124;
        static constexpr int kSpawnFailureStatus = 1;
        static constexpr std::size_t kDefaultOutputCapBytes = 8 * 1024 * 1024;
        static constexpr std::uint32_t kDefaultTimeoutMs = 10 * 60 * 1000;

        explicit SubprocessExecutor(std::uint32_t default_timeout_ms = kDefaultTimeoutMs,
                                    std::size_t output_cap_bytes = kDefaultOutputCapBytes);

        // Runs to completion or timeout. Failures are reported in the result,
        // never thrown.
        protocol::CommandResult run(const CommandSpec& spec) const;

        // True when `program --version` starts and exits with status 0.
        bool is_available(const std::string& program,
                          const std::filesystem::path& working_directory = ".") const;

        std::size_t output_cap_bytes() const { return output_cap_bytes_; }
        std::uint32_t default_timeout_ms() const { return default_timeout_ms_; }

    private:
        std::uint32_t default_timeout_ms_;
        std::size_t output_cap_bytes_;
    };

} // namespace mcptools::runtime
