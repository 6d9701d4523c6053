/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#include "include/settings.hpp"

#include <algorithm>
#include <cerrno>
#include <format>
#include <fstream>
#include <limits>
#include <string_view>
#include <system_error>
#include <utility>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace netcheck::core {

namespace {

const json& section_of(const json& doc,
                       std::string_view name,
                       std::vector<std::string>& warnings) {
    static const json empty = json::object();

    auto it = doc.find(std::string(name));
    if (it == doc.end()) return empty;
    if (!it->is_object()) {
        warnings.push_back(std::format("Section '{}' is not an object, using defaults", name));
        return empty;
    }
    return *it;
}

template <typename T>
void read_positive(const json& section,
                   std::string_view section_name,
                   std::string_view key,
                   T& target,
                   std::vector<std::string>& warnings) {
    auto it = section.find(std::string(key));
    if (it == section.end()) return;

    if (it->is_number_integer()) {
        auto value = it->get<long long>();
        if (value > 0 && static_cast<unsigned long long>(value) <=
                             static_cast<unsigned long long>(std::numeric_limits<T>::max())) {
            target = static_cast<T>(value);
            return;
        }
    }
    warnings.push_back(std::format(
        "{}.{} must be a positive integer, using default {}", section_name, key, target));
}

void read_bool(const json& section,
               std::string_view section_name,
               std::string_view key,
               bool& target,
               std::vector<std::string>& warnings) {
    auto it = section.find(std::string(key));
    if (it == section.end()) return;

    if (it->is_boolean()) {
        target = it->get<bool>();
        return;
    }
    warnings.push_back(std::format(
        "{}.{} must be true or false, using default {}", section_name, key, target));
}

void read_string(const json& section,
                 std::string_view section_name,
                 std::string_view key,
                 std::string& target,
                 std::vector<std::string>& warnings) {
    auto it = section.find(std::string(key));
    if (it == section.end()) return;

    if (it->is_string() && !it->get_ref<const std::string&>().empty()) {
        target = it->get<std::string>();
        return;
    }
    warnings.push_back(std::format(
        "{}.{} must be a non-empty string, using default '{}'", section_name, key, target));
}

void read_server_list(const json& section,
                      std::vector<std::string>& target,
                      std::vector<std::string>& warnings) {
    auto it = section.find("dns_servers");
    if (it == section.end()) return;

    auto valid = [](const json& v) {
        return v.is_string() && !v.get_ref<const std::string&>().empty();
    };
    if (!it->is_array() || it->empty() || !std::all_of(it->begin(), it->end(), valid)) {
        warnings.push_back(
            "network.dns_servers must be a non-empty list of hostnames, using defaults");
        return;
    }

    std::vector<std::string> servers;
    for (const auto& entry : *it) {
        auto name = entry.get<std::string>();
        if (std::find(servers.begin(), servers.end(), name) != servers.end()) {
            warnings.push_back(std::format("Ignoring duplicate DNS server '{}'", name));
            continue;
        }
        servers.push_back(std::move(name));
    }
    target = std::move(servers);
}

}  // namespace

SettingsStore::SettingsStore(fs::path path) : path_(std::move(path)), data_(defaults()) {}

json SettingsStore::defaults() {
    const NetworkSettings network;
    const LoggingSettings logging;

    return json{
        {"network",
         {
             {"ping_count", network.ping_count},
             {"timeout", network.timeout_sec},
             {"dns_servers", network.dns_servers},
             {"check_connectivity", network.check_connectivity},
         }},
        {"logging",
         {
             {"level", logging.level},
             {"file", logging.file},
             {"max_bytes", logging.max_bytes},
             {"backup_count", logging.backup_count},
         }},
    };
}

json SettingsStore::merge_with_defaults(const json& loaded) {
    json merged = defaults();
    if (!loaded.is_object()) return merged;

    for (const auto& item : loaded.items()) {
        auto it = merged.find(item.key());
        if (it != merged.end() && it->is_object() && item.value().is_object()) {
            it->update(item.value());
        } else {
            merged[item.key()] = item.value();
        }
    }
    return merged;
}

std::expected<void, std::string> SettingsStore::load() {
    data_ = defaults();

    std::error_code ec;
    if (!fs::exists(path_, ec)) {
        auto saved = save();
        if (!saved) {
            return std::unexpected(std::format("Could not save config file: {}", saved.error()));
        }
        return {};
    }

    std::ifstream in(path_);
    if (!in) {
        return std::unexpected(std::format("Could not load config file '{}': {}",
                                           path_.string(),
                                           std::system_category().message(errno)));
    }

    json loaded;
    try {
        loaded = json::parse(in);
    } catch (const json::parse_error& e) {
        return std::unexpected(
            std::format("Could not load config file '{}': {}", path_.string(), e.what()));
    }

    if (!loaded.is_object()) {
        return std::unexpected(std::format(
            "Could not load config file '{}': top level must be an object", path_.string()));
    }

    data_ = merge_with_defaults(loaded);
    return {};
}

std::expected<void, std::string> SettingsStore::save() const {
    std::ofstream out(path_, std::ios::trunc);
    if (!out) {
        return std::unexpected(std::format(
            "Cannot write '{}': {}", path_.string(), std::system_category().message(errno)));
    }

    out << data_.dump(2) << '\n';
    if (!out) {
        return std::unexpected(std::format("Cannot write '{}'", path_.string()));
    }
    return {};
}

AppSettings SettingsStore::snapshot(std::vector<std::string>& warnings) const {
    AppSettings settings;

    const auto& network = section_of(data_, "network", warnings);
    read_positive(network, "network", "ping_count", settings.network.ping_count, warnings);
    read_positive(network, "network", "timeout", settings.network.timeout_sec, warnings);
    read_server_list(network, settings.network.dns_servers, warnings);
    read_bool(network,
              "network",
              "check_connectivity",
              settings.network.check_connectivity,
              warnings);

    const auto& logging = section_of(data_, "logging", warnings);
    read_string(logging, "logging", "level", settings.logging.level, warnings);
    read_string(logging, "logging", "file", settings.logging.file, warnings);
    read_positive(logging, "logging", "max_bytes", settings.logging.max_bytes, warnings);
    read_positive(logging, "logging", "backup_count", settings.logging.backup_count, warnings);

    return settings;
}

}  // namespace netcheck::core
