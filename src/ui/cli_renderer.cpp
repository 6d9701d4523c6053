#include "include/cli_renderer.hpp"

#include <chrono>
#include <format>
#include <iostream>
#include <memory>
#include <print>
#include <string>
#include <string_view>
#include <thread>

#include "include/color.hpp"
#include "include/config.hpp"
#include "include/utils.hpp"

namespace CliRenderer {

namespace {

class UiSpinner {
    std::jthread worker_;
    std::string text_;

public:
    void start(std::string_view text) {
        stop();
        text_ = text;

        worker_ = std::jthread([this](std::stop_token st) {
            static constexpr std::string_view frames = "|/-\\";
            std::size_t idx = 0;

            while (!st.stop_requested()) {
                std::print("\r {} {}", text_, frames[idx++ % frames.size()]);
                std::cout.flush();

                std::this_thread::sleep_for(std::chrono::milliseconds(Config::UI_SPINNER_DELAY_MS));
            }

            std::print("\r{}\r", std::string(text_.size() + 3, ' '));
            std::cout.flush();
        });
    }

    void stop() {
        worker_ = std::jthread();
    }
};

std::string_view status_color(std::string_view status) {
    if (status == "Online") return Color::GREEN;
    if (status == "Offline") return Color::RED;
    return Color::YELLOW;
}

void print_field(std::string_view label, std::string_view value, std::string_view color) {
    std::println(" {:<{}} : {}", label, Config::APP_INFO_LABEL_WIDTH, Color::colorize(value, color));
}

void print_value_or_na(std::string_view label, std::string_view value) {
    print_field(label, value, value == Config::NOT_AVAILABLE ? Color::YELLOW : Color::CYAN);
}

}

void render_report(const netcheck::DiagnosticReport& report) {
    std::println(" -> {}", Color::colorize("Local Host", Color::BOLD));
    print_field("Platform", report.platform, Color::CYAN);
    print_value_or_na("IP Address", report.ip_address);
    print_value_or_na("Interface", report.interface_name);
    print_value_or_na("Logon Server", report.logon_server);

    std::println("\n -> {}", Color::colorize("Gateway", Color::BOLD));
    if (report.gateway) {
        print_field("Default Gateway", *report.gateway, Color::CYAN);
    } else {
        print_field("Default Gateway", Config::GATEWAY_NOT_FOUND, Color::RED);
    }

    if (report.gateway_reachable) {
        print_field("Ping", "\u2713 Reachable", Color::GREEN);
        for (auto line : split_lines(report.gateway_ping)) {
            if (trim_sv(line).empty()) continue;
            std::println("   {}", line);
        }
    } else {
        print_field("Ping", trim_sv(report.gateway_ping), Color::RED);
    }

    std::println("\n -> {}", Color::colorize("DNS", Color::BOLD));
    for (const auto& entry : report.dns_results) {
        print_field(entry.hostname, entry.outcome, entry.resolved ? Color::GREEN : Color::RED);
    }

    std::println("\n -> {}", Color::colorize("Internet", Color::BOLD));
    print_field("IPv4", report.ipv4_connectivity, status_color(report.ipv4_connectivity));
    print_field("IPv6", report.ipv6_connectivity, status_color(report.ipv6_connectivity));
}

void render_json(const netcheck::DiagnosticReport& report) {
    std::println("{}", netcheck::to_json(report).dump(2));
}

SpinnerCallback make_spinner_callback() {
    auto spinner = std::make_shared<UiSpinner>();
    return [spinner](SpinnerEvent ev, std::string_view label) {
        switch (ev) {
            case SpinnerEvent::Start:
                spinner->start(label);
                break;
            case SpinnerEvent::Stop:
                spinner->stop();
                break;
        }
    };
}

}
