/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#pragma once

#include <chrono>
#include <stop_token>
#include <string>
#include <vector>

#include "probe_outcome.hpp"
#include "shell_pipe.hpp"

namespace netcheck {

class CommandRunner {
   public:
    virtual ~CommandRunner() = default;

    // Spawns exactly one child. A nonzero exit status is still a success here;
    // errors are Timeout, NotFound (binary missing) or Unknown.
    virtual ProbeResult<ProcessOutput> run(const std::string& command,
                                           const std::vector<std::string>& args,
                                           std::chrono::seconds timeout,
                                           std::stop_token stop = {}) = 0;
};

class ProcessRunner final : public CommandRunner {
   public:
    ProbeResult<ProcessOutput> run(const std::string& command,
                                   const std::vector<std::string>& args,
                                   std::chrono::seconds timeout,
                                   std::stop_token stop = {}) override;
};

}  // namespace netcheck
