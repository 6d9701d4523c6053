// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at https://mozilla.org/MPL/2.0/.
// Copyright (c) 2025 Alfie Ardinata.

#pragma once

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "config.hpp"

namespace netcheck {

struct DnsResult {
    std::string hostname;
    std::string outcome;
    bool resolved = false;
};

struct DiagnosticReport {
    std::string platform;
    std::string ip_address{Config::NOT_AVAILABLE};
    std::string interface_name{Config::NOT_AVAILABLE};
    std::string logon_server{Config::NOT_AVAILABLE};
    std::optional<std::string> gateway;
    std::string gateway_ping{Config::NOT_CHECKED};
    bool gateway_reachable = false;
    std::vector<DnsResult> dns_results;  // configured order
    std::string ipv4_connectivity{Config::NOT_CHECKED};
    std::string ipv6_connectivity{Config::NOT_CHECKED};
};

// Keys follow report order; a missing gateway is JSON null.
nlohmann::ordered_json to_json(const DiagnosticReport& report);

}  // namespace netcheck
