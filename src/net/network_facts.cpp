/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#include "include/network_facts.hpp"

#include <algorithm>
#include <array>
#include <cerrno>
#include <condition_variable>
#include <cstdlib>
#include <format>
#include <mutex>
#include <system_error>
#include <thread>
#include <utility>

#include <arpa/inet.h>
#include <ifaddrs.h>
#include <netdb.h>
#include <netinet/in.h>

#include <spdlog/spdlog.h>

#include "include/interrupts.hpp"

namespace netcheck {

namespace {

// Owned jointly by the caller and the worker; whichever lets go last frees it,
// so a timed-out caller can return while the lookup is still running.
struct LookupState {
    std::mutex mutex;
    std::condition_variable_any done_cv;
    bool done = false;
    int rc = 0;
    int sys_errno = 0;
    std::string address;
};

void run_lookup(std::shared_ptr<LookupState> state, std::string hostname) {
    struct addrinfo hints = {};
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_STREAM;

    struct addrinfo* raw = nullptr;
    int rc = ::getaddrinfo(hostname.c_str(), nullptr, &hints, &raw);
    int sys_errno = errno;
    std::unique_ptr<struct addrinfo, decltype(&::freeaddrinfo)> list(raw, ::freeaddrinfo);

    std::string address;
    if (rc == 0) {
        for (auto* ai = list.get(); ai != nullptr; ai = ai->ai_next) {
            if (ai->ai_family != AF_INET || ai->ai_addr == nullptr) continue;

            std::array<char, INET_ADDRSTRLEN> buf{};
            const auto* sin = reinterpret_cast<const struct sockaddr_in*>(ai->ai_addr);
            if (::inet_ntop(AF_INET, &sin->sin_addr, buf.data(), buf.size()) != nullptr) {
                address = buf.data();
                break;
            }
        }
        if (address.empty()) {
            rc = EAI_NONAME;
        }
    }

    {
        std::lock_guard lock(state->mutex);
        state->rc = rc;
        state->sys_errno = sys_errno;
        state->address = std::move(address);
        state->done = true;
    }
    state->done_cv.notify_all();
}

std::string sockaddr_to_string(const struct sockaddr* addr) {
    std::array<char, INET6_ADDRSTRLEN> buf{};
    const void* src = nullptr;

    if (addr->sa_family == AF_INET) {
        src = &reinterpret_cast<const struct sockaddr_in*>(addr)->sin_addr;
    } else if (addr->sa_family == AF_INET6) {
        src = &reinterpret_cast<const struct sockaddr_in6*>(addr)->sin6_addr;
    } else {
        return {};
    }

    if (::inet_ntop(addr->sa_family, src, buf.data(), static_cast<socklen_t>(buf.size())) ==
        nullptr) {
        return {};
    }
    return buf.data();
}

}  // namespace

bool is_loopback_v4(std::string_view address) noexcept {
    struct in_addr parsed {};
    std::array<char, INET_ADDRSTRLEN> buf{};
    if (address.size() >= buf.size()) return false;

    std::copy(address.begin(), address.end(), buf.begin());
    if (::inet_pton(AF_INET, buf.data(), &parsed) != 1) return false;

    return (ntohl(parsed.s_addr) >> 24) == 127;
}

std::optional<InterfaceAddress> select_primary_address(std::span<const InterfaceAddress> addresses) {
    for (const auto& entry : addresses) {
        if (entry.family == AF_INET && !is_loopback_v4(entry.address)) {
            return entry;
        }
    }
    return std::nullopt;
}

std::expected<std::vector<InterfaceAddress>, std::string> SystemNetworkStack::interface_addresses() {
    struct ifaddrs* raw = nullptr;
    if (::getifaddrs(&raw) == -1) {
        return std::unexpected(
            std::format("getifaddrs failed: {}", std::system_category().message(errno)));
    }
    std::unique_ptr<struct ifaddrs, decltype(&::freeifaddrs)> list(raw, ::freeifaddrs);

    std::vector<InterfaceAddress> addresses;
    for (auto* ifa = list.get(); ifa != nullptr; ifa = ifa->ifa_next) {
        if (ifa->ifa_addr == nullptr || ifa->ifa_name == nullptr) continue;

        std::string text = sockaddr_to_string(ifa->ifa_addr);
        if (text.empty()) continue;

        addresses.push_back({ifa->ifa_name, ifa->ifa_addr->sa_family, std::move(text)});
    }
    return addresses;
}

std::optional<std::string> SystemNetworkStack::environment(const std::string& name) const {
    const char* value = std::getenv(name.c_str());
    if (value == nullptr) return std::nullopt;
    return std::string(value);
}

ProbeOutcome SystemNetworkStack::resolve(const std::string& hostname,
                                         std::chrono::seconds timeout,
                                         std::stop_token stop) {
    using clock = std::chrono::steady_clock;
    const auto deadline = clock::now() + timeout;
    auto cancelled = [&] { return stop.stop_requested() || interrupted(); };

    if (cancelled()) {
        return probe_failure(ProbeErrorKind::Unknown, "lookup cancelled");
    }

    auto state = std::make_shared<LookupState>();

    try {
        std::thread(run_lookup, state, hostname).detach();
    } catch (const std::system_error& e) {
        return probe_failure(ProbeErrorKind::Unknown,
                             std::format("Failed to start lookup: {}", e.what()));
    }

    // Wake every slice so a signal is noticed even without a stop request.
    std::unique_lock lock(state->mutex);
    while (!state->done) {
        const auto slice_end =
            std::min(deadline, clock::now() + std::chrono::milliseconds(Config::PIPE_POLL_SLICE_MS));
        if (state->done_cv.wait_until(lock, stop, slice_end, [&] { return state->done; })) {
            break;
        }
        if (cancelled()) {
            return probe_failure(ProbeErrorKind::Unknown, "lookup cancelled");
        }
        if (clock::now() >= deadline) {
            return probe_failure(ProbeErrorKind::Timeout,
                                 std::format("no answer within {} seconds", timeout.count()));
        }
    }

    switch (state->rc) {
        case 0:
            return state->address;
        case EAI_SYSTEM:
            return probe_failure(ProbeErrorKind::Unknown,
                                 std::system_category().message(state->sys_errno));
        case EAI_MEMORY:
            return probe_failure(ProbeErrorKind::Unknown, ::gai_strerror(state->rc));
        default:
            return probe_failure(ProbeErrorKind::ResolutionError, ::gai_strerror(state->rc));
    }
}

NetworkFacts::NetworkFacts(NetworkStack& stack,
                           const Platform& platform,
                           std::shared_ptr<spdlog::logger> log)
    : stack_(stack), platform_(platform), log_(std::move(log)) {}

LocalAddress NetworkFacts::resolve_local_address() const {
    auto addresses = stack_.interface_addresses();
    if (!addresses) {
        log_->error("Error enumerating interfaces: {}", addresses.error());
        return {};
    }

    auto primary = select_primary_address(*addresses);
    if (!primary) {
        log_->warn("No non-loopback IPv4 address found");
        return {};
    }

    log_->info("Found IP {} on interface {}", primary->address, primary->interface_name);
    return LocalAddress{primary->address, primary->interface_name};
}

std::string NetworkFacts::resolve_logon_server() const {
    auto variable = platform_.logon_server_variable();
    if (!variable) {
        return std::string(Config::NOT_AVAILABLE);
    }

    auto value = stack_.environment(*variable);
    if (!value || value->empty()) {
        log_->warn("{} is not set", *variable);
        return std::string(Config::NOT_AVAILABLE);
    }

    log_->info("Logon server: {}", *value);
    return *value;
}

ProbeOutcome NetworkFacts::resolve_dns(const std::string& hostname,
                                       std::chrono::seconds timeout,
                                       std::stop_token stop) const {
    log_->debug("Resolving DNS for {}", hostname);

    auto outcome = stack_.resolve(hostname, timeout, stop);
    if (outcome) {
        log_->info("DNS resolution for {}: {}", hostname, *outcome);
    } else {
        log_->error("DNS query for {} failed ({}): {}",
                    hostname,
                    kind_name(outcome.error().kind),
                    outcome.error().message);
    }
    return outcome;
}

}  // namespace netcheck
