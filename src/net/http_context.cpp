/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#include "include/http_context.hpp"

#include <mutex>
#include <stdexcept>

#include <curl/curl.h>

namespace {
std::mutex init_mutex;
int reference_count = 0;
}  // namespace

HttpContext::HttpContext() {
    std::lock_guard<std::mutex> lock(init_mutex);

    if (reference_count == 0) {
        if (curl_global_init(CURL_GLOBAL_DEFAULT) != 0) {
            throw std::runtime_error("Failed to initialize libcurl globally");
        }
    }

    ++reference_count;
}

HttpContext::~HttpContext() {
    std::lock_guard<std::mutex> lock(init_mutex);

    if (--reference_count == 0) {
        curl_global_cleanup();
    }
}
