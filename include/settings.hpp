/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#pragma once

#include <chrono>
#include <cstddef>
#include <expected>
#include <filesystem>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace netcheck::core {

struct NetworkSettings {
    int ping_count = 1;
    int timeout_sec = 5;
    std::vector<std::string> dns_servers{"google.com", "8.8.8.8"};
    bool check_connectivity = false;

    [[nodiscard]] std::chrono::seconds timeout() const {
        return std::chrono::seconds(timeout_sec);
    }
};

struct LoggingSettings {
    std::string level = "INFO";
    std::string file = "netcheck.log";
    std::size_t max_bytes = 1048576;
    std::size_t backup_count = 3;
};

struct AppSettings {
    NetworkSettings network;
    LoggingSettings logging;
};

// JSON file of sections ("network", "logging") merged key-by-key over defaults.
class SettingsStore {
    std::filesystem::path path_;
    nlohmann::json data_;

   public:
    explicit SettingsStore(std::filesystem::path path);

    static nlohmann::json defaults();
    static nlohmann::json merge_with_defaults(const nlohmann::json& loaded);

    // A missing file is created with defaults. On any error the store still
    // holds usable defaults and the message is returned for display.
    std::expected<void, std::string> load();
    std::expected<void, std::string> save() const;

    // Invalid values fall back to their defaults; one warning per fallback.
    [[nodiscard]] AppSettings snapshot(std::vector<std::string>& warnings) const;

    [[nodiscard]] const nlohmann::json& document() const noexcept {
        return data_;
    }

    [[nodiscard]] const std::filesystem::path& path() const noexcept {
        return path_;
    }
};

}  // namespace netcheck::core
