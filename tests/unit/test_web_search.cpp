#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "core/config/server_config.hpp"
#include "net/http_client.hpp"
#include "protocol/tool_params.hpp"
#include "tools/web_search.hpp"

namespace {

using mcptools::core::config::SearchCredentials;
using mcptools::core::errors::ErrorCategory;
using mcptools::core::errors::Result;
using mcptools::core::errors::ToolError;
using mcptools::net::HttpClient;
using mcptools::net::HttpResponse;
using mcptools::protocol::SearchQueryParams;
using mcptools::tools::WebSearch;
using nlohmann::json;

// Replays scripted responses in order and records every requested URL.
class ScriptedHttpClient : public HttpClient {
public:
    void push(long status, const std::string& body) {
        responses_.push_back(HttpResponse{status, body});
    }

    void push_failure(const std::string& message) {
        failures_.push_back(message);
    }

    Result<HttpResponse> get(const std::string& url) const override {
        std::lock_guard<std::mutex> lock(mutex_);
        urls_.push_back(url);
        if (!failures_.empty()) {
            const std::string message = failures_.front();
            failures_.pop_front();
            return ToolError{ErrorCategory::Provider, message, "http_transport_failed"};
        }
        if (responses_.empty()) {
            return HttpResponse{200, "{}"};
        }
        HttpResponse response = responses_.front();
        responses_.pop_front();
        return response;
    }

    std::vector<std::string> urls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return urls_;
    }

private:
    mutable std::mutex mutex_;
    mutable std::deque<HttpResponse> responses_;
    mutable std::deque<std::string> failures_;
    mutable std::vector<std::string> urls_;
};

SearchCredentials google_only() {
    SearchCredentials credentials;
    credentials.google_api_key = "gkey";
    credentials.google_cse_id = "cx1";
    return credentials;
}

SearchCredentials both_engines() {
    SearchCredentials credentials = google_only();
    credentials.serpapi_key = "skey";
    return credentials;
}

SearchQueryParams query(const std::string& text) {
    SearchQueryParams params;
    params.query = text;
    return params;
}

std::string google_items(int count) {
    json items = json::array();
    for (int i = 1; i <= count; ++i) {
        items.push_back({{"title", "T" + std::to_string(i)},
                         {"link", "https://example.com/" + std::to_string(i)},
                         {"snippet", "S" + std::to_string(i)}});
    }
    return json{{"items", items}}.dump();
}

TEST(WebSearchTest, FormatsGoogleResults) {
    auto http = std::make_shared<ScriptedHttpClient>();
    http->push(200, google_items(2));
    WebSearch search(google_only(), http);

    const auto result = search.query(query("rust async"));
    ASSERT_FALSE(result.is_error);
    EXPECT_EQ(result.content[0].text,
              "1. T1\n   https://example.com/1\n   S1\n\n2. T2\n   https://example.com/2\n   S2");
    EXPECT_EQ(result.structured.value()["engine"], "google_cse");

    const auto urls = http->urls();
    ASSERT_EQ(urls.size(), 1u);
    EXPECT_EQ(urls[0].rfind("https://www.googleapis.com/customsearch/v1?", 0), 0u);
    EXPECT_NE(urls[0].find("key=gkey"), std::string::npos);
    EXPECT_NE(urls[0].find("cx=cx1"), std::string::npos);
    EXPECT_NE(urls[0].find("q=rust%20async"), std::string::npos);
    EXPECT_NE(urls[0].find("num=5"), std::string::npos);
}

TEST(WebSearchTest, SendsClampedNumAndSiteFilter) {
    auto http = std::make_shared<ScriptedHttpClient>();
    http->push(200, google_items(1));
    WebSearch search(google_only(), http);

    auto params = query("mcp");
    params.num = 10;
    params.site = "example.org";
    params.date_restrict = "d7";
    ASSERT_FALSE(search.query(params).is_error);

    const auto url = http->urls().at(0);
    EXPECT_NE(url.find("num=10"), std::string::npos);
    EXPECT_NE(url.find("q=mcp%20site%3Aexample.org"), std::string::npos);
    EXPECT_NE(url.find("dateRestrict=d7"), std::string::npos);
}

TEST(WebSearchTest, LimitsOutputToNum) {
    auto http = std::make_shared<ScriptedHttpClient>();
    http->push(200, google_items(4));
    WebSearch search(google_only(), http);

    auto params = query("x");
    params.num = 2;
    const auto result = search.query(params);
    ASSERT_FALSE(result.is_error);
    EXPECT_EQ(result.structured.value()["results"].size(), 2u);
    EXPECT_EQ(result.content[0].text.find("3. "), std::string::npos);
}

TEST(WebSearchTest, FallsBackToSerpApiOnEmptyGoogleResults) {
    auto http = std::make_shared<ScriptedHttpClient>();
    http->push(200, R"({"items": []})");
    http->push(200, R"({"organic_results": [{"title": "Serp", "link": "https://s.example", "snippet": "hit"}]})");
    WebSearch search(both_engines(), http);

    const auto result = search.query(query("fallback"));
    ASSERT_FALSE(result.is_error);
    EXPECT_EQ(result.content[0].text, "1. Serp\n   https://s.example\n   hit");
    EXPECT_EQ(result.structured.value()["engine"], "serpapi");

    const auto urls = http->urls();
    ASSERT_EQ(urls.size(), 2u);
    EXPECT_EQ(urls[1].rfind("https://serpapi.com/search.json?", 0), 0u);
    EXPECT_NE(urls[1].find("engine=google"), std::string::npos);
    EXPECT_NE(urls[1].find("api_key=skey"), std::string::npos);
}

TEST(WebSearchTest, ExplicitEngineWithoutKeysFallsBack) {
    auto http = std::make_shared<ScriptedHttpClient>();
    http->push(200, google_items(1));
    WebSearch search(google_only(), http);

    auto params = query("x");
    params.engine = "serpapi";
    const auto result = search.query(params);
    ASSERT_FALSE(result.is_error);

    const auto urls = http->urls();
    ASSERT_EQ(urls.size(), 1u);
    EXPECT_NE(urls[0].find("googleapis.com"), std::string::npos);
    EXPECT_EQ(result.structured.value()["engine"], "google_cse");
}

TEST(WebSearchTest, NoResultsIsPlainText) {
    auto http = std::make_shared<ScriptedHttpClient>();
    http->push(200, R"({"items": []})");
    WebSearch search(google_only(), http);

    const auto result = search.query(query("nothing"));
    EXPECT_FALSE(result.is_error);
    EXPECT_EQ(result.content[0].text, "No results.");
}

TEST(WebSearchTest, ReportsGoogleHttpErrorWithReasons) {
    auto http = std::make_shared<ScriptedHttpClient>();
    http->push(403, R"({"error": {"message": "Daily Limit Exceeded", "errors": [{"reason": "dailyLimitExceeded"}]}})");
    WebSearch search(both_engines(), http);

    const auto result = search.query(query("x"));
    EXPECT_TRUE(result.is_error);
    EXPECT_EQ(result.content[0].text,
              "Search error: Google CSE HTTP 403: Daily Limit Exceeded (reason: dailyLimitExceeded)");
    EXPECT_EQ(http->urls().size(), 1u);
}

TEST(WebSearchTest, ReportsSerpApiBodyError) {
    auto http = std::make_shared<ScriptedHttpClient>();
    http->push(200, R"({"error": "Invalid API key."})");
    SearchCredentials credentials;
    credentials.serpapi_key = "bad";
    WebSearch search(credentials, http);

    const auto result = search.query(query("x"));
    EXPECT_TRUE(result.is_error);
    EXPECT_EQ(result.content[0].text, "Search error: SerpAPI error: Invalid API key.");
}

TEST(WebSearchTest, ReportsTransportFailure) {
    auto http = std::make_shared<ScriptedHttpClient>();
    http->push_failure("Timeout was reached");
    WebSearch search(google_only(), http);

    const auto result = search.query(query("x"));
    EXPECT_TRUE(result.is_error);
    EXPECT_EQ(result.content[0].text, "Search error: Timeout was reached");
}

TEST(WebSearchTest, RequiresQuery) {
    auto http = std::make_shared<ScriptedHttpClient>();
    WebSearch search(google_only(), http);

    const auto result = search.query(query("  "));
    EXPECT_TRUE(result.is_error);
    EXPECT_EQ(result.content[0].text, "Search error: missing query (provide `q` or `query`)");
    EXPECT_TRUE(http->urls().empty());
}

TEST(WebSearchTest, RequiresConfiguredEngine) {
    auto http = std::make_shared<ScriptedHttpClient>();
    WebSearch search(SearchCredentials{}, http);

    const auto result = search.query(query("x"));
    EXPECT_TRUE(result.is_error);
    EXPECT_EQ(result.content[0].text,
              "No search engine configured. Provide SERPAPI_KEY or GOOGLE_API_KEY+GOOGLE_CSE_ID.");
}

TEST(WebSearchTest, DescriptionListsConfiguredEngines) {
    auto http = std::make_shared<ScriptedHttpClient>();
    EXPECT_EQ(WebSearch(both_engines(), http).description(),
              "Web search using: google_cse, serpapi.");
    EXPECT_EQ(WebSearch(SearchCredentials{}, http).description(),
              "Web search (no API keys detected). Set GOOGLE_API_KEY+GOOGLE_CSE_ID or SERPAPI_KEY.");
}

TEST(HttpClientTest, BuildUrlEncodesComponents) {
    EXPECT_EQ(mcptools::net::url_encode("a b&c=d/é"), "a%20b%26c%3Dd%2F%C3%A9");
    EXPECT_EQ(mcptools::net::build_url("https://h/p", {{"q", "x y"}, {"n", "1"}}),
              "https://h/p?q=x%20y&n=1");
}

}  // namespace
