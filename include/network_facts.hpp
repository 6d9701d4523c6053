/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#pragma once

#include <chrono>
#include <expected>
#include <memory>
#include <optional>
#include <span>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

#include <sys/socket.h>

#include "config.hpp"
#include "platform.hpp"
#include "probe_outcome.hpp"

namespace spdlog {
class logger;
}

namespace netcheck {

struct InterfaceAddress {
    std::string interface_name;
    int family = AF_UNSPEC;
    std::string address;
};

struct LocalAddress {
    std::string ip{Config::NOT_AVAILABLE};
    std::string interface_name{Config::NOT_AVAILABLE};
};

[[nodiscard]] bool is_loopback_v4(std::string_view address) noexcept;

// First IPv4 address outside 127.0.0.0/8, in the order given.
[[nodiscard]] std::optional<InterfaceAddress> select_primary_address(
    std::span<const InterfaceAddress> addresses);

// OS queries that need no child process.
class NetworkStack {
   public:
    virtual ~NetworkStack() = default;

    // Order is whatever the OS reports and may differ between runs.
    virtual std::expected<std::vector<InterfaceAddress>, std::string> interface_addresses() = 0;

    virtual std::optional<std::string> environment(const std::string& name) const = 0;

    // IPv4 forward lookup bounded by this call's own deadline.
    virtual ProbeOutcome resolve(const std::string& hostname,
                                 std::chrono::seconds timeout,
                                 std::stop_token stop = {}) = 0;
};

class SystemNetworkStack final : public NetworkStack {
   public:
    std::expected<std::vector<InterfaceAddress>, std::string> interface_addresses() override;
    std::optional<std::string> environment(const std::string& name) const override;
    ProbeOutcome resolve(const std::string& hostname,
                         std::chrono::seconds timeout,
                         std::stop_token stop = {}) override;
};

class NetworkFacts {
    NetworkStack& stack_;
    const Platform& platform_;
    std::shared_ptr<spdlog::logger> log_;

   public:
    NetworkFacts(NetworkStack& stack,
                 const Platform& platform,
                 std::shared_ptr<spdlog::logger> log);

    LocalAddress resolve_local_address() const;
    std::string resolve_logon_server() const;
    ProbeOutcome resolve_dns(const std::string& hostname,
                             std::chrono::seconds timeout,
                             std::stop_token stop = {}) const;
};

}  // namespace netcheck
