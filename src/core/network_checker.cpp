/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#include "include/network_checker.hpp"

#include <exception>
#include <format>
#include <utility>

#include <spdlog/spdlog.h>

#include "include/config.hpp"
#include "include/interrupts.hpp"

namespace netcheck {

namespace {

class SpinnerScope {
    const SpinnerCallback& cb_;
    std::string_view label_;
    bool active_ = false;

public:
    SpinnerScope(const SpinnerCallback& cb, std::string_view label) : cb_(cb), label_(label) {
        active_ = static_cast<bool>(cb_);
        if (active_) cb_(SpinnerEvent::Start, label_);
    }

    ~SpinnerScope() {
        if (active_) cb_(SpinnerEvent::Stop, label_);
    }

    SpinnerScope(const SpinnerScope&) = delete;
    SpinnerScope& operator=(const SpinnerScope&) = delete;
};

std::string describe_dns(const ProbeOutcome& outcome, std::chrono::seconds timeout) {
    if (outcome) {
        return *outcome;
    }

    const auto& error = outcome.error();
    switch (error.kind) {
        case ProbeErrorKind::Timeout:
            return std::format("DNS timeout after {} seconds", timeout.count());
        case ProbeErrorKind::ResolutionError:
            return std::format("DNS resolution failed: {}", error.message);
        case ProbeErrorKind::NotFound:
        case ProbeErrorKind::Unknown:
            break;
    }
    return std::format("DNS error: {}", error.message);
}

}  // namespace

NetworkChecker::NetworkChecker(core::NetworkSettings settings,
                               const Platform& platform,
                               CommandRunner& runner,
                               NetworkStack& stack,
                               std::shared_ptr<spdlog::logger> log,
                               HttpClient* http)
    : settings_(std::move(settings)),
      platform_(platform),
      facts_(stack, platform, log),
      gateway_(runner, platform, log),
      ping_(runner, platform, log),
      http_(http),
      log_(std::move(log)) {}

template <typename Fn>
std::optional<std::string> NetworkChecker::run_step(std::string_view label, Fn&& step) const {
    try {
        SpinnerScope spinner(spinner_cb_, label);
        std::forward<Fn>(step)();
        return std::nullopt;
    } catch (const std::exception& e) {
        log_->error("{} failed: {}", label, e.what());
        return std::string(e.what());
    } catch (...) {
        log_->error("{} failed: unknown error", label);
        return std::string("unknown error");
    }
}

std::string NetworkChecker::connectivity(std::string_view host, IpVersion version) const {
    const auto family = version == IpVersion::V4 ? "IPv4" : "IPv6";

    auto result = http_->probe(host, version, settings_.timeout());
    if (!result) {
        log_->warn("{} connectivity check against {} failed: {}", family, host, result.error());
        return "Offline";
    }

    log_->info("{} connectivity check against {} succeeded", family, host);
    return "Online";
}

DiagnosticReport NetworkChecker::run_all_checks(std::stop_token stop) const {
    log_->info("Starting network diagnostics on {} platform", platform_.name());

    DiagnosticReport report;
    report.platform = std::string(platform_.name());
    const auto timeout = settings_.timeout();
    auto cancelled = [&] { return stop.stop_requested() || interrupted(); };

    run_step("Resolving local address", [&] {
        auto local = facts_.resolve_local_address();
        report.ip_address = std::move(local.ip);
        report.interface_name = std::move(local.interface_name);
    });

    run_step("Reading logon server", [&] { report.logon_server = facts_.resolve_logon_server(); });

    run_step("Discovering default gateway", [&] { report.gateway = gateway_.discover(timeout, stop); });

    if (report.gateway) {
        const auto& gateway = *report.gateway;
        auto error = run_step(std::format("Pinging {}", gateway), [&] {
            report.gateway_ping =
                ping_.ping(gateway, settings_.ping_count, timeout, stop, &report.gateway_reachable);
        });
        if (error) {
            report.gateway_ping = std::format("Ping error: {}", *error);
        }
    } else {
        report.gateway_ping = std::string(Config::GATEWAY_NOT_FOUND);
    }

    report.dns_results.reserve(settings_.dns_servers.size());
    for (const auto& server : settings_.dns_servers) {
        DnsResult entry{server, std::string(Config::NOT_CHECKED), false};
        if (cancelled()) {
            report.dns_results.push_back(std::move(entry));
            continue;
        }

        auto error = run_step(std::format("Resolving {}", server), [&] {
            auto outcome = facts_.resolve_dns(server, timeout, stop);
            entry.resolved = outcome.has_value();
            entry.outcome = describe_dns(outcome, timeout);
        });
        if (error) {
            entry.outcome = std::format("DNS error: {}", *error);
        }

        report.dns_results.push_back(std::move(entry));
    }

    if (settings_.check_connectivity && http_ != nullptr && !cancelled()) {
        run_step("Checking IPv4 connectivity", [&] {
            report.ipv4_connectivity = connectivity(Config::IPV4_PROBE_HOST, IpVersion::V4);
        });
        run_step("Checking IPv6 connectivity", [&] {
            report.ipv6_connectivity = connectivity(Config::IPV6_PROBE_HOST, IpVersion::V6);
        });
    }

    if (cancelled()) {
        log_->warn("Network diagnostics cancelled, remaining checks skipped");
    } else {
        log_->info("Network diagnostics completed");
    }
    return report;
}

}  // namespace netcheck
