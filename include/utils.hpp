/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#pragma once

#include <algorithm>
#include <cstddef>
#include <print>
#include <string>
#include <string_view>
#include <vector>
#include <sys/ioctl.h>
#include <unistd.h>

#include "config.hpp"

inline std::size_t get_term_width() {
    struct winsize w;
    if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &w) == 0 && w.ws_col > 0) {
        return std::min(static_cast<std::size_t>(w.ws_col), Config::TERM_WIDTH);
    }
    return Config::TERM_WIDTH;
}

inline bool stdout_is_terminal() {
    return ::isatty(STDOUT_FILENO) == 1;
}

inline void print_line() {
    std::size_t width = get_term_width();
    std::println("{:-<{}}", "", width);
}

inline void print_centered_header(std::string_view text) {
    std::size_t width = get_term_width();
    std::size_t text_len = text.length();

    if (text_len >= width - 2) {
        std::println("{}", text);
        return;
    }

    std::size_t remaining = width - text_len - 2;
    std::size_t left_pad = remaining / 2;
    std::size_t right_pad = remaining - left_pad;

    std::println("{0:-<{1}} {2} {0:-<{3}}", "", left_pad, text, right_pad);
}

[[nodiscard]] constexpr std::string_view trim_sv(std::string_view str) noexcept {
    auto first = str.find_first_not_of(" \t\n\r\v\f");
    if (first == std::string_view::npos)
        return {};
    auto last = str.find_last_not_of(" \t\n\r\v\f");
    return str.substr(first, last - first + 1);
}

// Tokens point into `str`; it must outlive the result.
[[nodiscard]] inline std::vector<std::string_view> split_whitespace(std::string_view str) {
    std::vector<std::string_view> tokens;
    constexpr std::string_view blanks = " \t\n\r\v\f";

    std::size_t pos = str.find_first_not_of(blanks);
    while (pos != std::string_view::npos) {
        std::size_t end = str.find_first_of(blanks, pos);
        tokens.push_back(str.substr(pos, end == std::string_view::npos ? end : end - pos));
        pos = str.find_first_not_of(blanks, end);
    }
    return tokens;
}

// Splits on '\n' and strips a trailing '\r' so CRLF output parses the same.
[[nodiscard]] inline std::vector<std::string_view> split_lines(std::string_view text) {
    std::vector<std::string_view> lines;
    while (!text.empty()) {
        auto nl = text.find('\n');
        std::string_view line = text.substr(0, nl);
        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }
        lines.push_back(line);
        if (nl == std::string_view::npos) break;
        text.remove_prefix(nl + 1);
    }
    return lines;
}
