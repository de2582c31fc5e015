#include <geomatch/fetch/http.hpp>

#include <curl/curl.h>
#include <fmt/core.h>

#include <memory>
#include <mutex>
#include <stdexcept>
#include <utility>

namespace geomatch::fetch {

namespace {

using EasyHandle = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;

void ensure_curl_initialized() {
    static std::once_flag once;
    std::call_once(once, [] {
        if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
            throw std::runtime_error("curl_global_init failed");
        }
    });
}

auto make_easy_handle() -> EasyHandle {
    ensure_curl_initialized();
    return EasyHandle(curl_easy_init(), &curl_easy_cleanup);
}

auto append_body(char* data, std::size_t size, std::size_t nmemb, void* userdata) -> std::size_t {
    auto* body = static_cast<std::string*>(userdata);
    body->append(data, size * nmemb);
    return size * nmemb;
}

auto curl_get(const HttpOptions& options, const std::string& url)
    -> std::expected<HttpResponse, std::string> {
    auto handle = make_easy_handle();
    if (handle == nullptr) {
        return std::unexpected("curl_easy_init failed");
    }

    HttpResponse response;
    CURL* curl = handle.get();
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, &append_body);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, options.connect_timeout_ms);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, options.timeout_ms);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, options.user_agent.c_str());

    const CURLcode code = curl_easy_perform(curl);
    if (code != CURLE_OK) {
        return std::unexpected(fmt::format("GET failed: {}", curl_easy_strerror(code)));
    }
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status);
    return response;
}

}  // namespace

auto make_curl_http_get(HttpOptions options) -> HttpGet {
    return [options = std::move(options)](const std::string& url) { return curl_get(options, url); };
}

auto url_escape(std::string_view text) -> std::string {
    auto handle = make_easy_handle();
    if (handle == nullptr) {
        throw std::runtime_error("curl_easy_init failed");
    }
    char* escaped = curl_easy_escape(handle.get(), text.data(), static_cast<int>(text.size()));
    if (escaped == nullptr) {
        throw std::runtime_error("curl_easy_escape failed");
    }
    std::string out(escaped);
    curl_free(escaped);
    return out;
}

}  // namespace geomatch::fetch
