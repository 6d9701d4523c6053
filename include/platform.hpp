/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace netcheck {

enum class OsFamily { Posix, Windows };

// Everything that differs between OS families: command names, flag spelling
// and how to scrape the gateway out of the inspection command's output.
// One instance is picked at startup and shared read-only by the probes.
class Platform {
   public:
    virtual ~Platform() = default;

    [[nodiscard]] virtual OsFamily family() const noexcept = 0;
    [[nodiscard]] virtual std::string_view name() const noexcept = 0;

    [[nodiscard]] virtual std::string ping_command() const {
        return "ping";
    }
    [[nodiscard]] virtual std::vector<std::string> ping_arguments(const std::string& host,
                                                                  int count) const = 0;

    [[nodiscard]] virtual std::string gateway_command() const = 0;
    [[nodiscard]] virtual std::vector<std::string> gateway_arguments() const = 0;
    [[nodiscard]] virtual std::optional<std::string> parse_gateway(std::string_view output) const = 0;

    // Environment variable naming the logon server, where the concept exists.
    [[nodiscard]] virtual std::optional<std::string> logon_server_variable() const {
        return std::nullopt;
    }
};

class PosixPlatform : public Platform {
   public:
    OsFamily family() const noexcept override {
        return OsFamily::Posix;
    }
    std::string_view name() const noexcept override {
        return "posix";
    }
    std::vector<std::string> ping_arguments(const std::string& host, int count) const override;
    std::string gateway_command() const override;
    std::vector<std::string> gateway_arguments() const override;
    std::optional<std::string> parse_gateway(std::string_view output) const override;
};

class WindowsPlatform : public Platform {
   public:
    OsFamily family() const noexcept override {
        return OsFamily::Windows;
    }
    std::string_view name() const noexcept override {
        return "windows";
    }
    std::vector<std::string> ping_arguments(const std::string& host, int count) const override;
    std::string gateway_command() const override;
    std::vector<std::string> gateway_arguments() const override;
    std::optional<std::string> parse_gateway(std::string_view output) const override;
    std::optional<std::string> logon_server_variable() const override;
};

// `ip route`: first line starting with "default via", third token.
std::optional<std::string> parse_route_gateway(std::string_view output);

// `ipconfig`: first line containing "Default Gateway" whose last token is a value.
std::optional<std::string> parse_ipconfig_gateway(std::string_view output);

OsFamily detect_os_family() noexcept;
std::unique_ptr<Platform> make_platform(OsFamily family);

}  // namespace netcheck
