#include <iostream>
#include <memory>
#include <string>
#include "app/cli_parser.hpp"
#include "core/config/server_config.hpp"
#include "core/config/session_id.hpp"
#include "core/errors/tool_errors.hpp"
#include "core/logging/logger.hpp"
#include "net/http_client.hpp"
#include "runtime/subprocess_executor.hpp"
#include "server/async_lane.hpp"
#include "server/dispatcher.hpp"
#include "server/line_transport.hpp"
#include "server/server_catalog.hpp"

namespace {

void report_input_error(const mcptools::core::errors::ToolError& err) {
    MCPTOOLS_LOG_ERROR("Input error [" + err.code + "]: " + err.message);
    if (!err.hint.empty()) {
        MCPTOOLS_LOG_INFO("Hint: " + err.hint);
    }
}

}  // namespace

int main(int argc, char* argv[]) {
    using namespace mcptools;

    core::logging::Logger::get().set_session_id(core::config::generate_session_id());

    auto parsed = app::cli::parse_and_validate(argc, argv);
    if (core::errors::is_error(parsed)) {
        report_input_error(core::errors::get_error(parsed));
        return 2;
    }

    auto loaded = core::config::load_server_config(core::errors::get_value(parsed),
                                                   core::config::process_environment());
    if (core::errors::is_error(loaded)) {
        report_input_error(core::errors::get_error(loaded));
        return 2;
    }
    const auto& config = core::errors::get_value(loaded);

    const server::ServerIdentity identity = server::identity_for(config.server);
    core::logging::Logger::get().set_server_name(identity.name);
    core::logging::Logger::get().set_level(config.log_level);
    MCPTOOLS_LOG_DEBUG("workspace root: " + config.workspace_root.string());

    net::ensure_curl_initialized();

    server::ToolDependencies deps;
    deps.executor = std::make_shared<runtime::SubprocessExecutor>(config.command_timeout_ms,
                                                                  config.output_cap_bytes);
    deps.http = std::make_shared<net::CurlHttpClient>(config.http_timeout_ms);

    auto registry = server::build_registry(config, deps);
    if (core::errors::is_error(registry)) {
        const auto& err = core::errors::get_error(registry);
        MCPTOOLS_LOG_ERROR("Failed to register tools [" + err.code + "]: " + err.message);
        return 3;
    }

    std::ios::sync_with_stdio(false);
    server::LineTransport transport(std::cin, std::cout);
    server::AsyncLane lane(config.max_in_flight);
    server::Dispatcher dispatcher(identity, config.protocol_version,
                                  core::errors::get_value(registry), transport, lane);
    return dispatcher.serve();
}
