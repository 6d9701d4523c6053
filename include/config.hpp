#pragma once

#include <cstddef>
#include <string_view>

namespace Config {
    constexpr std::string_view APP_NAME = "netcheck";
    constexpr std::string_view APP_VERSION = "1.2.0";
    constexpr std::string_view DEFAULT_CONFIG_PATH = "config.json";
    constexpr std::string_view LOGGER_NAME = "netcheck";

    constexpr std::size_t TERM_WIDTH = 78;
    constexpr int APP_INFO_LABEL_WIDTH = 18;
    constexpr int UI_SPINNER_DELAY_MS = 150;

    constexpr std::size_t MAX_PIPE_OUTPUT = 10 * 1024 * 1024;
    constexpr int PIPE_POLL_SLICE_MS = 100;
    constexpr int TERMINATE_GRACE_MS = 1000;

    constexpr std::string_view IPV4_PROBE_HOST = "ipv4.google.com";
    constexpr std::string_view IPV6_PROBE_HOST = "ipv6.google.com";

    constexpr std::string_view NOT_AVAILABLE = "N/A";
    constexpr std::string_view NOT_CHECKED = "Not checked";
    constexpr std::string_view GATEWAY_NOT_FOUND = "Gateway not found";
}
