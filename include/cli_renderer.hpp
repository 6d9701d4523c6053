/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#pragma once

#include "network_checker.hpp"
#include "results.hpp"

namespace CliRenderer {
void render_report(const netcheck::DiagnosticReport& report);
void render_json(const netcheck::DiagnosticReport& report);
SpinnerCallback make_spinner_callback();
}  // namespace CliRenderer
