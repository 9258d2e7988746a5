#pragma once

#include <memory>
#include "core/config/server_config.hpp"
#include "core/errors/tool_errors.hpp"
#include "net/http_client.hpp"
#include "runtime/subprocess_executor.hpp"
#include "server/dispatcher.hpp"
#include "server/tool_registry.hpp"

namespace mcptools::server {

    // Shared collaborators. They must outlive every registry built from them.
    struct ToolDependencies {
        std::shared_ptr<const runtime::SubprocessExecutor> executor;
        std::shared_ptr<const net::HttpClient> http;
    };

    ServerIdentity identity_for(core::config::ServerKind kind);

    // Registers the tool families that make up `config.server`.
    core::errors::Result<ToolRegistry> build_registry(const core::config::ServerConfig& config,
                                                      const ToolDependencies& deps);

} // namespace mcptools::server
