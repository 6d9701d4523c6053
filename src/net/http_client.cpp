#include "include/http_client.hpp"
#include "include/interrupts.hpp"
#include "include/config.hpp"

#include <format>
#include <stdexcept>

#include <curl/curl.h>

namespace {

size_t discard_body(void*, size_t size, size_t nmemb, void*) noexcept {
    return size * nmemb;
}

}

HttpClient::HttpClient() : handle_(curl_easy_init(), curl_easy_cleanup) {
    if (!handle_) throw std::runtime_error("Failed to create curl handle");
}

std::expected<void, std::string> HttpClient::probe(std::string_view host,
                                                   IpVersion version,
                                                   std::chrono::seconds timeout) {
    curl_easy_reset(handle_.get());

    const std::string url = std::format("http://{}/", host);
    const long resolve = version == IpVersion::V4 ? CURL_IPRESOLVE_V4 : CURL_IPRESOLVE_V6;
    const long seconds = static_cast<long>(timeout.count());
    const std::string user_agent = std::format("{}/{}", Config::APP_NAME, Config::APP_VERSION);

    curl_easy_setopt(handle_.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(handle_.get(), CURLOPT_NOBODY, 1L);
    curl_easy_setopt(handle_.get(), CURLOPT_IPRESOLVE, resolve);
    curl_easy_setopt(handle_.get(), CURLOPT_WRITEFUNCTION, discard_body);
    curl_easy_setopt(handle_.get(), CURLOPT_TIMEOUT, seconds);
    curl_easy_setopt(handle_.get(), CURLOPT_CONNECTTIMEOUT, seconds);
    curl_easy_setopt(handle_.get(), CURLOPT_USERAGENT, user_agent.c_str());
    curl_easy_setopt(handle_.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(handle_.get(), CURLOPT_FORBID_REUSE, 1L);

    curl_easy_setopt(handle_.get(), CURLOPT_XFERINFOFUNCTION,
        +[](void*, curl_off_t, curl_off_t, curl_off_t, curl_off_t) -> int {
                return interrupted() ? 1 : 0;
        });
    curl_easy_setopt(handle_.get(), CURLOPT_NOPROGRESS, 0L);

    CURLcode res = curl_easy_perform(handle_.get());
    if (res != CURLE_OK) {
        return std::unexpected(std::format("Network error: {}", curl_easy_strerror(res)));
    }
    return {};
}
