/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#include "include/platform.hpp"
#include "include/utils.hpp"

#include <string>

namespace netcheck {

namespace {

constexpr std::string_view kRouteMarker = "default via";
constexpr std::string_view kIpconfigLabel = "Default Gateway";

// "Default", "Gateway" and at least one value token.
constexpr std::size_t kIpconfigMinTokens = 3;

}  // namespace

std::optional<std::string> parse_route_gateway(std::string_view output) {
    for (auto line : split_lines(output)) {
        if (!line.starts_with(kRouteMarker)) continue;

        auto parts = split_whitespace(line);
        if (parts.size() >= 3) {
            return std::string(parts[2]);
        }
    }
    return std::nullopt;
}

std::optional<std::string> parse_ipconfig_gateway(std::string_view output) {
    for (auto line : split_lines(output)) {
        if (line.find(kIpconfigLabel) == std::string_view::npos) continue;

        auto parts = split_whitespace(line);
        if (parts.size() < kIpconfigMinTokens) continue;

        auto last = parts.back();
        // "Default Gateway . . . :" with nothing after the separator.
        if (last.ends_with(':')) continue;

        return std::string(last);
    }
    return std::nullopt;
}

std::vector<std::string> PosixPlatform::ping_arguments(const std::string& host, int count) const {
    return {"-c", std::to_string(count), host};
}

std::string PosixPlatform::gateway_command() const {
    return "ip";
}

std::vector<std::string> PosixPlatform::gateway_arguments() const {
    return {"route"};
}

std::optional<std::string> PosixPlatform::parse_gateway(std::string_view output) const {
    return parse_route_gateway(output);
}

std::vector<std::string> WindowsPlatform::ping_arguments(const std::string& host,
                                                         int count) const {
    return {"-n", std::to_string(count), host};
}

std::string WindowsPlatform::gateway_command() const {
    return "ipconfig";
}

std::vector<std::string> WindowsPlatform::gateway_arguments() const {
    return {};
}

std::optional<std::string> WindowsPlatform::parse_gateway(std::string_view output) const {
    return parse_ipconfig_gateway(output);
}

std::optional<std::string> WindowsPlatform::logon_server_variable() const {
    return "LOGONSERVER";
}

OsFamily detect_os_family() noexcept {
#if defined(_WIN32)
    return OsFamily::Windows;
#else
    return OsFamily::Posix;
#endif
}

std::unique_ptr<Platform> make_platform(OsFamily family) {
    switch (family) {
        case OsFamily::Windows:
            return std::make_unique<WindowsPlatform>();
        case OsFamily::Posix:
            break;
    }
    return std::make_unique<PosixPlatform>();
}

}  // namespace netcheck
