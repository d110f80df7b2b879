#pragma once
#include <memory>
#include <string>
#include <spdlog/spdlog.h>

namespace toolwire::logging {

/// Name of the diagnostic logger. Its sink is stderr: stdout carries protocol frames.
constexpr const char* LOGGER_NAME = "toolwire";

/// The library's logger, created on first use with a stderr sink. The library
/// never logs through spdlog's default logger, which writes to stdout.
std::shared_ptr<spdlog::logger> logger();

/// Set the level of the "toolwire" logger and make it spdlog's default logger.
/// Safe to call more than once; later calls only change the level.
std::shared_ptr<spdlog::logger> init(const std::string& level = "info");

/// Parse a spdlog level name ("trace" .. "critical", "off").
/// Throws ConfigError for anything else.
spdlog::level::level_enum parse_level(const std::string& name);

} // namespace toolwire::logging
