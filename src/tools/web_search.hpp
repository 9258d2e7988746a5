#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "core/config/server_config.hpp"
#include "core/errors/tool_errors.hpp"
#include "net/http_client.hpp"
#include "protocol/tool_contract.hpp"
#include "protocol/tool_params.hpp"
#include "server/tool_registry.hpp"

namespace mcptools::tools {

    struct SearchHit {
        std::string title;
        std::string link;
        std::string snippet;
    };

    inline constexpr const char* kGoogleCseEngine = "google_cse";
    inline constexpr const char* kSerpApiEngine = "serpapi";

    // search.query over Google Custom Search and SerpAPI.
    class WebSearch {
    public:
        WebSearch(core::config::SearchCredentials credentials,
                  std::shared_ptr<const net::HttpClient> http);

        protocol::ToolCallResult query(const protocol::SearchQueryParams& params) const;

        // Configured engines in preference order.
        std::vector<std::string> engines() const;
        std::string description() const;

        core::errors::Result<std::vector<SearchHit>> google_cse(
            const std::string& query, int num, const std::optional<std::string>& date_restrict) const;
        core::errors::Result<std::vector<SearchHit>> serpapi(const std::string& query, int num) const;

    private:
        core::errors::Result<std::vector<SearchHit>> run_engine(
            const std::string& engine, const std::string& query,
            const protocol::SearchQueryParams& params) const;

        core::config::SearchCredentials credentials_;
        std::shared_ptr<const net::HttpClient> http_;
    };

    // "1. title\n   link\n   snippet" blocks joined by blank lines.
    std::string format_hits(const std::vector<SearchHit>& hits, std::size_t limit);

    std::vector<server::ToolDefinition> make_web_search_tools(std::shared_ptr<const WebSearch> search);

} // namespace mcptools::tools
