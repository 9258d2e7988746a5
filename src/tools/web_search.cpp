#include "tools/web_search.hpp"

#include <utility>
#include <nlohmann/json.hpp>
#include "core/logging/logger.hpp"

namespace mcptools::tools {

using core::errors::ErrorCategory;
using core::errors::Result;
using core::errors::ToolError;
using nlohmann::json;

namespace {

constexpr const char* kGoogleCseUrl = "https://www.googleapis.com/customsearch/v1";
constexpr const char* kSerpApiUrl = "https://serpapi.com/search.json";

std::string string_member(const json& object, const char* key) {
    if (!object.is_object()) {
        return {};
    }
    const auto it = object.find(key);
    if (it == object.end() || !it->is_string()) {
        return {};
    }
    return it->get<std::string>();
}

std::vector<SearchHit> collect_hits(const json& body, const char* list_key) {
    std::vector<SearchHit> hits;
    const auto it = body.find(list_key);
    if (it == body.end() || !it->is_array()) {
        return hits;
    }
    for (const auto& item : *it) {
        hits.push_back(SearchHit{string_member(item, "title"), string_member(item, "link"),
                                 string_member(item, "snippet")});
    }
    return hits;
}

ToolError provider_error(const std::string& message, const std::string& code) {
    return ToolError{ErrorCategory::Provider, message, code};
}

}  // namespace

WebSearch::WebSearch(core::config::SearchCredentials credentials,
                     std::shared_ptr<const net::HttpClient> http)
    : credentials_(std::move(credentials)), http_(std::move(http)) {}

std::vector<std::string> WebSearch::engines() const {
    std::vector<std::string> configured;
    if (credentials_.has_google()) {
        configured.emplace_back(kGoogleCseEngine);
    }
    if (credentials_.has_serpapi()) {
        configured.emplace_back(kSerpApiEngine);
    }
    return configured;
}

std::string WebSearch::description() const {
    const auto configured = engines();
    if (configured.empty()) {
        return "Web search (no API keys detected). Set GOOGLE_API_KEY+GOOGLE_CSE_ID or SERPAPI_KEY.";
    }
    std::string text = "Web search using: ";
    for (std::size_t i = 0; i < configured.size(); ++i) {
        if (i > 0) {
            text += ", ";
        }
        text += configured[i];
    }
    return text + ".";
}

Result<std::vector<SearchHit>> WebSearch::google_cse(
    const std::string& query, const int num,
    const std::optional<std::string>& date_restrict) const {
    net::QueryParams params = {{"key", credentials_.google_api_key.value_or("")},
                               {"cx", credentials_.google_cse_id.value_or("")},
                               {"q", query},
                               {"num", std::to_string(num)}};
    if (date_restrict.has_value()) {
        params.emplace_back("dateRestrict", date_restrict.value());
    }

    auto fetched = http_->get(net::build_url(kGoogleCseUrl, params));
    if (core::errors::is_error(fetched)) {
        return core::errors::get_error(fetched);
    }
    const auto& response = core::errors::get_value(fetched);
    const json body = json::parse(response.body, nullptr, false);

    if (!response.ok()) {
        std::string message;
        std::string reasons;
        if (body.is_object() && body.contains("error") && body["error"].is_object()) {
            const json& error = body["error"];
            message = string_member(error, "message");
            if (error.contains("errors") && error["errors"].is_array()) {
                for (const auto& entry : error["errors"]) {
                    const auto reason = string_member(entry, "reason");
                    if (reason.empty()) {
                        continue;
                    }
                    reasons += reasons.empty() ? reason : ", " + reason;
                }
            }
        }
        if (message.empty()) {
            message = std::to_string(response.status);
        }
        std::string text = "Google CSE HTTP " + std::to_string(response.status) + ": " + message;
        if (!reasons.empty()) {
            text += " (reason: " + reasons + ")";
        }
        return provider_error(text, "google_cse_http_error");
    }

    if (!body.is_object()) {
        return provider_error("Google CSE returned a malformed response body",
                              "google_cse_malformed_body");
    }
    if (body.contains("error") && !body["error"].is_null()) {
        std::string message = string_member(body["error"], "message");
        return provider_error("Google CSE error: " + (message.empty() ? "unknown" : message),
                              "google_cse_error");
    }
    return collect_hits(body, "items");
}

Result<std::vector<SearchHit>> WebSearch::serpapi(const std::string& query, const int num) const {
    const net::QueryParams params = {{"engine", "google"},
                                     {"q", query},
                                     {"api_key", credentials_.serpapi_key.value_or("")},
                                     {"num", std::to_string(num)}};

    auto fetched = http_->get(net::build_url(kSerpApiUrl, params));
    if (core::errors::is_error(fetched)) {
        return core::errors::get_error(fetched);
    }
    const auto& response = core::errors::get_value(fetched);
    const json body = json::parse(response.body, nullptr, false);

    if (!response.ok()) {
        std::string message = body.is_object() ? string_member(body, "error") : std::string();
        if (message.empty()) {
            message = std::to_string(response.status);
        }
        return provider_error("SerpAPI HTTP " + std::to_string(response.status) + ": " + message,
                              "serpapi_http_error");
    }

    if (!body.is_object()) {
        return provider_error("SerpAPI returned a malformed response body",
                              "serpapi_malformed_body");
    }
    if (body.contains("error") && !body["error"].is_null()) {
        const json& error = body["error"];
        return provider_error("SerpAPI error: " +
                                  (error.is_string() ? error.get<std::string>() : error.dump()),
                              "serpapi_error");
    }
    return collect_hits(body, "organic_results");
}

Result<std::vector<SearchHit>> WebSearch::run_engine(
    const std::string& engine, const std::string& query,
    const protocol::SearchQueryParams& params) const {
    if (engine == kSerpApiEngine) {
        if (!credentials_.has_serpapi()) {
            return std::vector<SearchHit>{};
        }
        return serpapi(query, params.num);
    }
    if (!credentials_.has_google()) {
        return std::vector<SearchHit>{};
    }
    return google_cse(query, params.num, params.date_restrict);
}

protocol::ToolCallResult WebSearch::query(const protocol::SearchQueryParams& params) const {
    if (params.query.find_first_not_of(" \t\r\n") == std::string::npos) {
        return protocol::error_result("Search error: missing query (provide `q` or `query`)");
    }

    const auto configured = engines();
    if (configured.empty()) {
        return protocol::error_result(
            "No search engine configured. Provide SERPAPI_KEY or GOOGLE_API_KEY+GOOGLE_CSE_ID.");
    }

    const std::string primary = params.engine.value_or(configured.front());
    const std::string secondary = primary == kSerpApiEngine ? kGoogleCseEngine : kSerpApiEngine;

    std::string query_text = params.query;
    if (params.site.has_value()) {
        query_text += " site:" + params.site.value();
    }

    MCPTOOLS_LOG_DEBUG("search.query engine=" + primary + " num=" + std::to_string(params.num));

    std::string used = primary;
    auto hits = run_engine(primary, query_text, params);
    if (!core::errors::is_error(hits) && core::errors::get_value(hits).empty()) {
        MCPTOOLS_LOG_DEBUG("search.query falling back to " + secondary);
        used = secondary;
        hits = run_engine(secondary, query_text, params);
    }

    if (core::errors::is_error(hits)) {
        const auto& err = core::errors::get_error(hits);
        MCPTOOLS_LOG_WARN("search.query failed [" + err.code + "]: " + err.message);
        return protocol::error_result("Search error: " + err.message);
    }

    const auto& found = core::errors::get_value(hits);
    if (found.empty()) {
        return protocol::text_result("No results.");
    }

    const std::size_t limit = static_cast<std::size_t>(params.num);
    json results = json::array();
    for (std::size_t i = 0; i < found.size() && i < limit; ++i) {
        results.push_back(
            {{"title", found[i].title}, {"link", found[i].link}, {"snippet", found[i].snippet}});
    }

    auto result = protocol::text_result(format_hits(found, limit));
    result.structured = json{{"engine", used}, {"results", results}};
    return result;
}

std::string format_hits(const std::vector<SearchHit>& hits, const std::size_t limit) {
    std::string text;
    for (std::size_t i = 0; i < hits.size() && i < limit; ++i) {
        if (i > 0) {
            text += "\n\n";
        }
        text += std::to_string(i + 1) + ". " + hits[i].title + "\n   " + hits[i].link + "\n   " +
                hits[i].snippet;
    }
    return text;
}

std::vector<server::ToolDefinition> make_web_search_tools(std::shared_ptr<const WebSearch> search) {
    const json schema = {
        {"type", "object"},
        {"properties",
         {{"q", {{"type", "string"}, {"description", "Query string (alias: query)"}}},
          {"query", {{"type", "string"}, {"description", "Query string (alias of q)"}}},
          {"num",
           {{"type", "number"}, {"description", "Max results (default 5, Google allows 1-10)"}}},
          {"max_results", {{"type", "number"}, {"description", "Alias of `num` (1-10 for Google)"}}},
          {"site", {{"type", "string"}, {"description", "Optional site: filter (e.g., ai.google)"}}},
          {"engine",
           {{"type", "string"},
            {"enum", {"serpapi", "google_cse", "google"}},
            {"description", "serpapi|google_cse|google"}}},
          {"dateRestrict",
           {{"type", "string"}, {"description", "Google dateRestrict (e.g., d7, m1, y1)"}}}}},
        {"required", json::array()},
        {"additionalProperties", false}};

    std::vector<server::ToolDefinition> tools;
    tools.push_back(server::make_tool<protocol::SearchQueryParams>(
        {"search.query", search->description(), schema}, server::ExecutionLane::Suspending,
        protocol::decode_search_query,
        [search](const protocol::SearchQueryParams& params) { return search->query(params); }));
    return tools;
}

}  // namespace mcptools::tools
