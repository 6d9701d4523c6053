#pragma once

#include <expected>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <spdlog/common.h>
#include <spdlog/logger.h>

#include "settings.hpp"

namespace netcheck::core {

// Accepts spdlog names and the usual upper-case spellings (INFO, WARNING, ...).
std::expected<spdlog::level::level_enum, std::string> parse_log_level(std::string_view name);

// Rotating file logger named after the app; falls back to stderr when the file
// cannot be opened. Problems are appended to `warnings`, never thrown.
std::shared_ptr<spdlog::logger> setup_logging(const LoggingSettings& settings,
                                              std::vector<std::string>& warnings);

// Logger that drops everything, for callers that do not care.
std::shared_ptr<spdlog::logger> null_logger();

}  // namespace netcheck::core
