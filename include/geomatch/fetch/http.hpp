#pragma once

#include <expected>
#include <functional>
#include <string>
#include <string_view>

namespace geomatch::fetch {

struct HttpResponse {
    long status = 0;
    std::string body;
};

/// Blocking GET. Must be callable from several threads at once.
using HttpGet = std::function<std::expected<HttpResponse, std::string>(const std::string& url)>;

struct HttpOptions {
    long connect_timeout_ms = 10'000;
    long timeout_ms = 30'000;
    std::string user_agent = "geomatch/1.0";
};

/// libcurl transport. Every call uses its own easy handle.
[[nodiscard]] auto make_curl_http_get(HttpOptions options = {}) -> HttpGet;

/// Percent-encode `text` for use as a query parameter value.
[[nodiscard]] auto url_escape(std::string_view text) -> std::string;

}  // namespace geomatch::fetch
