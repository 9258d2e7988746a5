#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <vector>
#include "core/errors/tool_errors.hpp"

namespace mcptools::net {

    struct HttpResponse {
        long status = 0;
        std::string body;

        bool ok() const { return status >= 200 && status < 300; }
    };

    using QueryParams = std::vector<std::pair<std::string, std::string>>;

    // Percent-encodes a query component (RFC 3986 unreserved characters kept).
    std::string url_encode(const std::string& value);

    // Builds `base?k=v&...` with every key and value encoded.
    std::string build_url(const std::string& base, const QueryParams& params);

    // Blocking HTTP GET. Transport failures are errors; any HTTP status is a response.
    class HttpClient {
    public:
        virtual ~HttpClient() = default;
        virtual core::errors::Result<HttpResponse> get(const std::string& url) const = 0;
    };

    class CurlHttpClient : public HttpClient {
    public:
        explicit CurlHttpClient(std::uint32_t timeout_ms = 30000);

        core::errors::Result<HttpResponse> get(const std::string& url) const override;

    private:
        std::uint32_t timeout_ms_;
    };

    // Performs curl_global_init once per process.
    void ensure_curl_initialized();

} // namespace mcptools::net
