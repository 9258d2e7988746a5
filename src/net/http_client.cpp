#include "net/http_client.hpp"

#include <curl/curl.h>
#include <cctype>
#include <memory>
#include <mutex>
#include <string>
#include "core/logging/logger.hpp"

namespace mcptools::net {

using core::errors::ErrorCategory;
using core::errors::ToolError;

namespace {

// Response bodies larger than this are cut off.
constexpr std::size_t kMaxBodyBytes = 16 * 1024 * 1024;

size_t write_body(char* contents, size_t size, size_t nmemb, void* userdata) {
    auto* body = static_cast<std::string*>(userdata);
    const size_t total = size * nmemb;
    if (body->size() + total > kMaxBodyBytes) {
        return 0;
    }
    body->append(contents, total);
    return total;
}

struct CurlHandleDeleter {
    void operator()(CURL* handle) const { curl_easy_cleanup(handle); }
};

}  // namespace

void ensure_curl_initialized() {
    static std::once_flag once;
    std::call_once(once, []() { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

std::string url_encode(const std::string& value) {
    static const char kHex[] = "0123456789ABCDEF";
    std::string encoded;
    encoded.reserve(value.size() * 3);
    for (const char c : value) {
        const auto byte = static_cast<unsigned char>(c);
        if (std::isalnum(byte) != 0 || c == '-' || c == '_' || c == '.' || c == '~') {
            encoded.push_back(c);
        } else {
            encoded.push_back('%');
            encoded.push_back(kHex[byte >> 4]);
            encoded.push_back(kHex[byte & 0x0F]);
        }
    }
    return encoded;
}

std::string build_url(const std::string& base, const QueryParams& params) {
    std::string url = base;
    char separator = '?';
    for (const auto& [key, value] : params) {
        url.push_back(separator);
        url += url_encode(key);
        url.push_back('=');
        url += url_encode(value);
        separator = '&';
    }
    return url;
}

CurlHttpClient::CurlHttpClient(const std::uint32_t timeout_ms) : timeout_ms_(timeout_ms) {
    ensure_curl_initialized();
}

core::errors::Result<HttpResponse> CurlHttpClient::get(const std::string& url) const {
    std::unique_ptr<CURL, CurlHandleDeleter> handle(curl_easy_init());
    if (!handle) {
        return ToolError{ErrorCategory::Internal, "Failed to initialise HTTP client.",
                         "http_init_failed"};
    }

    HttpResponse response;
    curl_easy_setopt(handle.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(handle.get(), CURLOPT_WRITEFUNCTION, write_body);
    curl_easy_setopt(handle.get(), CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(handle.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(handle.get(), CURLOPT_MAXREDIRS, 5L);
    curl_easy_setopt(handle.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(handle.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_ms_));
    curl_easy_setopt(handle.get(), CURLOPT_USERAGENT, "mcptools/0.1");

    const CURLcode code = curl_easy_perform(handle.get());
    if (code != CURLE_OK) {
        const std::string code_name =
            code == CURLE_OPERATION_TIMEDOUT ? "http_timeout" : "http_transport_failed";
        return ToolError{ErrorCategory::Provider,
                         std::string("HTTP request failed: ") + curl_easy_strerror(code),
                         code_name};
    }

    curl_easy_getinfo(handle.get(), CURLINFO_RESPONSE_CODE, &response.status);
    MCPTOOLS_LOG_DEBUG("HTTP GET status=" + std::to_string(response.status) +
                       " bytes=" + std::to_string(response.body.size()));
    return response;
}

}  // namespace mcptools::net
