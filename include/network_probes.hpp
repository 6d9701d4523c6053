/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>

#include "command_runner.hpp"
#include "platform.hpp"

namespace spdlog {
class logger;
}

namespace netcheck {

class GatewayLocator {
    CommandRunner& runner_;
    const Platform& platform_;
    std::shared_ptr<spdlog::logger> log_;

   public:
    GatewayLocator(CommandRunner& runner,
                   const Platform& platform,
                   std::shared_ptr<spdlog::logger> log);

    // Absent when nothing matched or the inspection command failed.
    std::optional<std::string> discover(std::chrono::seconds timeout,
                                        std::stop_token stop = {}) const;
};

class PingProbe {
    CommandRunner& runner_;
    const Platform& platform_;
    std::shared_ptr<spdlog::logger> log_;

   public:
    PingProbe(CommandRunner& runner,
              const Platform& platform,
              std::shared_ptr<spdlog::logger> log);

    // Raw ping output on success, otherwise a one-line description of the failure.
    std::string ping(const std::string& host,
                     int count,
                     std::chrono::seconds timeout,
                     std::stop_token stop = {},
                     bool* reachable = nullptr) const;
};

}  // namespace netcheck
