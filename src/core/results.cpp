#include "include/results.hpp"

namespace netcheck {

nlohmann::ordered_json to_json(const DiagnosticReport& report) {
    nlohmann::ordered_json dns = nlohmann::ordered_json::object();
    for (const auto& entry : report.dns_results) {
        dns[entry.hostname] = entry.outcome;
    }

    nlohmann::ordered_json doc;
    doc["platform"] = report.platform;
    doc["ip"] = report.ip_address;
    doc["interface"] = report.interface_name;
    doc["logon_server"] = report.logon_server;
    doc["gateway"] = report.gateway ? nlohmann::ordered_json(*report.gateway)
                                   : nlohmann::ordered_json(nullptr);
    doc["gateway_ping"] = report.gateway_ping;
    doc["gateway_reachable"] = report.gateway_reachable;
    doc["dns_results"] = std::move(dns);
    doc["connectivity"] = {
        {"ipv4", report.ipv4_connectivity},
        {"ipv6", report.ipv6_connectivity},
    };
    return doc;
}

}  // namespace netcheck
