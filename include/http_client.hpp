#pragma once

#include <chrono>
#include <expected>
#include <memory>
#include <string>
#include <string_view>

typedef void CURL;

enum class IpVersion { V4, V6 };

class HttpClient {
public:
    HttpClient();
    ~HttpClient() = default;

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    // HEAD request to http://<host>/ forced onto one address family.
    std::expected<void, std::string> probe(std::string_view host,
                                           IpVersion version,
                                           std::chrono::seconds timeout);

private:
    std::unique_ptr<CURL, void(*)(CURL*)> handle_;
};
