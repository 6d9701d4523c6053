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
#include <stop_token>
#include <string>
#include <vector>

#include <sys/types.h>

#include "file_descriptor.hpp"

struct ProcessOutput {
    std::string stdout_text;
    std::string stderr_text;
    int exit_code = -1;
};

enum class PipeError { TimedOut, Cancelled };

// Runs argv[0] found through PATH with no shell in between. Throws
// std::system_error when the child cannot be started; an exec failure carries
// the errno reported by the child (ENOENT for a missing binary).
class ShellPipe {
    FileDescriptor stdout_fd_;
    FileDescriptor stderr_fd_;
    pid_t pid_ = -1;

    void terminate() noexcept;

   public:
    explicit ShellPipe(const std::vector<std::string>& args);

    ~ShellPipe();

    ShellPipe(const ShellPipe&) = delete;
    ShellPipe& operator=(const ShellPipe&) = delete;

    // Collects both streams until the child exits. On timeout or cancellation
    // the child is killed and reaped before returning.
    std::expected<ProcessOutput, PipeError> read_all(
        std::chrono::milliseconds timeout = std::chrono::milliseconds(60000),
        std::stop_token stop = {});

    [[nodiscard]] pid_t pid() const noexcept {
        return pid_;
    }
};
