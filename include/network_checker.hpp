/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>

#include "command_runner.hpp"
#include "http_client.hpp"
#include "network_facts.hpp"
#include "network_probes.hpp"
#include "platform.hpp"
#include "results.hpp"
#include "settings.hpp"

enum class SpinnerEvent { Start, Stop };
using SpinnerCallback = std::function<void(SpinnerEvent, std::string_view)>;

namespace netcheck {

class NetworkChecker {
    core::NetworkSettings settings_;
    const Platform& platform_;
    NetworkFacts facts_;
    GatewayLocator gateway_;
    PingProbe ping_;
    HttpClient* http_;
    std::shared_ptr<spdlog::logger> log_;
    SpinnerCallback spinner_cb_;

    template <typename Fn>
    std::optional<std::string> run_step(std::string_view label, Fn&& step) const;

    std::string connectivity(std::string_view host, IpVersion version) const;

   public:
    // `http` may be null, in which case connectivity stays "Not checked".
    NetworkChecker(core::NetworkSettings settings,
                   const Platform& platform,
                   CommandRunner& runner,
                   NetworkStack& stack,
                   std::shared_ptr<spdlog::logger> log,
                   HttpClient* http = nullptr);

    void set_spinner_callback(SpinnerCallback cb) {
        spinner_cb_ = std::move(cb);
    }

    // Total: every field of the report is filled in, whatever fails.
    DiagnosticReport run_all_checks(std::stop_token stop = {}) const;
};

}  // namespace netcheck
