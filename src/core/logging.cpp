#include "include/logging.hpp"
#include "include/config.hpp"

#include <algorithm>
#include <cctype>
#include <format>

#include <spdlog/sinks/null_sink.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace netcheck::core {

std::expected<spdlog::level::level_enum, std::string> parse_log_level(std::string_view name) {
    std::string lowered(name);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });

    if (lowered == "off") return spdlog::level::off;
    if (lowered == "fatal") return spdlog::level::critical;

    // from_str maps anything it does not know to "off".
    auto level = spdlog::level::from_str(lowered);
    if (level == spdlog::level::off) {
        return std::unexpected(std::format("Unknown log level '{}', using INFO", name));
    }
    return level;
}

std::shared_ptr<spdlog::logger> setup_logging(const LoggingSettings& settings,
                                              std::vector<std::string>& warnings) {
    auto level = parse_log_level(settings.level);
    if (!level) {
        warnings.push_back(level.error());
        level = spdlog::level::info;
    }

    spdlog::sink_ptr sink;
    try {
        sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            settings.file, settings.max_bytes, settings.backup_count);
    } catch (const spdlog::spdlog_ex& e) {
        warnings.push_back(std::format(
            "Could not open log file '{}': {}. Logging warnings to stderr", settings.file, e.what()));
        sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        if (*level < spdlog::level::warn) {
            level = spdlog::level::warn;
        }
    }

    auto logger = std::make_shared<spdlog::logger>(std::string(Config::LOGGER_NAME), sink);
    logger->set_level(*level);
    logger->set_pattern("%Y-%m-%d %H:%M:%S,%e - %n - %l - %v");
    logger->flush_on(spdlog::level::warn);

    spdlog::set_default_logger(logger);
    return logger;
}

std::shared_ptr<spdlog::logger> null_logger() {
    return std::make_shared<spdlog::logger>(std::string(Config::LOGGER_NAME),
                                            std::make_shared<spdlog::sinks::null_sink_mt>());
}

}  // namespace netcheck::core
