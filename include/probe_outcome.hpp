/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#pragma once

#include <expected>
#include <string>
#include <string_view>
#include <utility>

namespace netcheck {

enum class ProbeErrorKind {
    Timeout,
    NotFound,
    ResolutionError,
    Unknown
};

struct ProbeError {
    ProbeErrorKind kind = ProbeErrorKind::Unknown;
    std::string message;
};

template <typename T>
using ProbeResult = std::expected<T, ProbeError>;

// Payload is the probe's displayable answer (an address, captured output, ...).
using ProbeOutcome = ProbeResult<std::string>;

inline std::unexpected<ProbeError> probe_failure(ProbeErrorKind kind, std::string message) {
    return std::unexpected(ProbeError{kind, std::move(message)});
}

std::string_view kind_name(ProbeErrorKind kind) noexcept;

}  // namespace netcheck
