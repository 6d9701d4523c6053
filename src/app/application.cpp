/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#include "include/application.hpp"

#include <chrono>
#include <filesystem>
#include <format>
#include <optional>
#include <print>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

#include <spdlog/spdlog.h>

#include "include/cli_renderer.hpp"
#include "include/color.hpp"
#include "include/command_runner.hpp"
#include "include/config.hpp"
#include "include/http_client.hpp"
#include "include/http_context.hpp"
#include "include/interrupts.hpp"
#include "include/logging.hpp"
#include "include/network_checker.hpp"
#include "include/network_facts.hpp"
#include "include/platform.hpp"
#include "include/settings.hpp"
#include "include/utils.hpp"

namespace fs = std::filesystem;
using namespace std::chrono;

void Application::show_help(const std::string& app_name) const {
    std::println("Usage: {} [options]", app_name);
    std::println("");
    std::println("Options:");
    std::println("  -c, --config <path>     Configuration file (default: {})",
                 Config::DEFAULT_CONFIG_PATH);
    std::println("  -j, --json              Print the report as JSON");
    std::println("  -h, --help              Show this help message");
    std::println("  -v, --version           Show version information");
    std::println("");
    std::println("Examples:");
    std::println("  {}                   # Run all network checks", app_name);
    std::println("  {} --json            # Machine-readable report", app_name);
}

void Application::show_version() const {
    std::println("{} v{}", Config::APP_NAME, Config::APP_VERSION);
    std::println("Licensed under the Mozilla Public License 2.0");
}

void Application::show_warning(std::string_view message) const {
    std::println(stderr, "{}", Color::colorize(std::format("Warning: {}", message), Color::YELLOW));
}

int Application::run(int argc, char* argv[]) {
    try {
        SignalGuard signal_guard;
        Color::enabled = stdout_is_terminal();

        std::string app_name{Config::APP_NAME};
        if (argc > 0) {
            app_name = fs::path(argv[0]).filename().string();
            if (app_name.empty())
                app_name = Config::APP_NAME;
        }

        std::string config_path{Config::DEFAULT_CONFIG_PATH};
        bool json_output = false;

        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];

            if (arg == "-h" || arg == "--help") {
                show_help(app_name);
                return 0;
            } else if (arg == "-v" || arg == "--version") {
                show_version();
                return 0;
            } else if (arg == "-j" || arg == "--json") {
                json_output = true;
            } else if (arg == "-c" || arg == "--config") {
                if (i + 1 >= argc) {
                    std::println(stderr,
                                 "{}",
                                 Color::colorize(std::format("Error: '{}' needs a file path", arg),
                                                 Color::RED));
                    return 1;
                }
                config_path = argv[++i];
            } else {
                std::println(
                    stderr,
                    "{}",
                    Color::colorize(std::format("Error: Unknown option '{}'", arg), Color::RED));
                show_help(app_name);
                return 1;
            }
        }

        if (json_output) {
            Color::enabled = false;
        }

        netcheck::core::SettingsStore store(config_path);
        if (auto loaded = store.load(); !loaded) {
            show_warning(loaded.error());
            show_warning("Using default configuration");
        }

        std::vector<std::string> warnings;
        auto settings = store.snapshot(warnings);
        auto logger = netcheck::core::setup_logging(settings.logging, warnings);
        for (const auto& warning : warnings) {
            show_warning(warning);
            logger->warn("{}", warning);
        }

        auto platform = netcheck::make_platform(netcheck::detect_os_family());
        netcheck::ProcessRunner runner;
        netcheck::SystemNetworkStack stack;

        std::optional<HttpContext> http_context;
        std::optional<HttpClient> http;
        if (settings.network.check_connectivity) {
            try {
                http_context.emplace();
                http.emplace();
            } catch (const std::exception& e) {
                logger->error("HTTP client unavailable: {}", e.what());
                show_warning(std::format("Connectivity check disabled: {}", e.what()));
            }
        }

        netcheck::NetworkChecker checker(
            settings.network, *platform, runner, stack, logger, http ? &*http : nullptr);

        auto start_time = steady_clock::now();

        if (!json_output) {
            print_centered_header(std::format("Network Checker (v{})", Config::APP_VERSION));
            std::println(" {:<{}} : {}", "Config", Config::APP_INFO_LABEL_WIDTH, store.path().string());
            std::println(" {:<{}} : {}", "Log File", Config::APP_INFO_LABEL_WIDTH, settings.logging.file);
            print_line();

            if (stdout_is_terminal()) {
                checker.set_spinner_callback(CliRenderer::make_spinner_callback());
            }
        }

        // Signals only set a flag; this turns it into a stop request so waits wake at once.
        std::stop_source stop_source;
        std::jthread interrupt_watch([&stop_source](std::stop_token st) {
            while (!st.stop_requested()) {
                if (interrupted()) {
                    stop_source.request_stop();
                    return;
                }
                std::this_thread::sleep_for(milliseconds(Config::PIPE_POLL_SLICE_MS));
            }
        });

        auto report = checker.run_all_checks(stop_source.get_token());
        interrupt_watch.request_stop();

        if (json_output) {
            CliRenderer::render_json(report);
        } else {
            CliRenderer::render_report(report);
            print_line();
            double elapsed_sec = duration<double>(steady_clock::now() - start_time).count();
            std::println(" Finished in        : {:.1f} sec", elapsed_sec);
        }

        spdlog::shutdown();
        return interrupted() ? 130 : 0;

    } catch (const std::exception& e) {
        std::println(
            stderr, "\n{}", Color::colorize(std::format("Fatal Error: {}", e.what()), Color::RED));
        return 1;
    }
}
