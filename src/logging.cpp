#include "toolwire/logging.hpp"
#include "toolwire/error.hpp"
#include <algorithm>
#include <cctype>
#include <mutex>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace toolwire::logging {

spdlog::level::level_enum parse_level(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    auto level = spdlog::level::from_str(lower);
    if (level == spdlog::level::off && lower != "off") {
        throw ConfigError("Unknown log level: " + name);
    }
    return level;
}

std::shared_ptr<spdlog::logger> logger() {
    static std::mutex mutex;
    std::lock_guard<std::mutex> lock(mutex);
    auto log = spdlog::get(LOGGER_NAME);
    if (!log) {
        log = spdlog::stderr_color_mt(LOGGER_NAME);
        log->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
    }
    return log;
}

std::shared_ptr<spdlog::logger> init(const std::string& level) {
    auto lvl = parse_level(level);
    auto log = logger();
    log->set_level(lvl);
    spdlog::set_default_logger(log);
    return log;
}

} // namespace toolwire::logging
