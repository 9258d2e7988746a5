#pragma once
#include "core/config/server_config.hpp"
#include "core/errors/tool_errors.hpp"

namespace mcptools::app::cli {
    mcptools::core::errors::Result<mcptools::core::config::LaunchOptions> parse_and_validate(int argc, char* argv[]);
} // namespace mcptools::app::cli
