#include "include/network_probes.hpp"

#include <format>
#include <utility>

#include <spdlog/spdlog.h>

namespace netcheck {

GatewayLocator::GatewayLocator(CommandRunner& runner,
                               const Platform& platform,
                               std::shared_ptr<spdlog::logger> log)
    : runner_(runner), platform_(platform), log_(std::move(log)) {}

std::optional<std::string> GatewayLocator::discover(std::chrono::seconds timeout,
                                                    std::stop_token stop) const {
    const auto command = platform_.gateway_command();
    auto result = runner_.run(command, platform_.gateway_arguments(), timeout, stop);

    if (!result) {
        log_->error("Error getting default gateway via '{}' ({}): {}",
                    command,
                    kind_name(result.error().kind),
                    result.error().message);
        return std::nullopt;
    }

    if (result->exit_code != 0) {
        log_->warn("'{}' exited with code {}, scanning its output anyway",
                   command,
                   result->exit_code);
    }

    auto gateway = platform_.parse_gateway(result->stdout_text);
    if (!gateway) {
        log_->warn("Default gateway not found");
        return std::nullopt;
    }

    log_->info("Found default gateway: {}", *gateway);
    return gateway;
}

PingProbe::PingProbe(CommandRunner& runner,
                     const Platform& platform,
                     std::shared_ptr<spdlog::logger> log)
    : runner_(runner), platform_(platform), log_(std::move(log)) {}

std::string PingProbe::ping(const std::string& host,
                            int count,
                            std::chrono::seconds timeout,
                            std::stop_token stop,
                            bool* reachable) const {
    if (reachable) *reachable = false;

    // A leading '-' would be read as an option by ping.
    if (host.empty() || host.front() == '-') {
        log_->error("Refusing to ping invalid host '{}'", host);
        return std::format("Ping error: invalid host '{}'", host);
    }

    const auto command = platform_.ping_command();
    const auto args = platform_.ping_arguments(host, count);
    log_->debug("Executing {} with {} argument(s) for {}", command, args.size(), host);

    auto result = runner_.run(command, args, timeout, stop);
    if (!result) {
        const auto& error = result.error();
        switch (error.kind) {
            case ProbeErrorKind::Timeout: {
                auto msg = std::format("Ping timeout after {} seconds", timeout.count());
                log_->error("Ping to {}: {}", host, msg);
                return msg;
            }
            case ProbeErrorKind::NotFound:
                log_->error("Ping command not found");
                return "Ping command not found";
            case ProbeErrorKind::ResolutionError:
            case ProbeErrorKind::Unknown:
                break;
        }
        auto msg = std::format("Ping error: {}", error.message);
        log_->error("Ping to {}: {}", host, msg);
        return msg;
    }

    if (result->exit_code != 0) {
        log_->warn("Ping to {} failed with return code {}", host, result->exit_code);
        return std::format("Ping failed (return code: {})", result->exit_code);
    }

    log_->info("Ping to {} successful", host);
    if (reachable) *reachable = true;
    return std::move(result->stdout_text);
}

}  // namespace netcheck
