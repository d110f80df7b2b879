#include "toolwire/settings.hpp"
#include "toolwire/error.hpp"
#include "toolwire/logging.hpp"
#include <charconv>
#include <cstdlib>
#include <fstream>

namespace toolwire {

namespace {

std::optional<std::string> getenv_opt(const char* key) {
    if (const char* v = std::getenv(key)) return std::string(v);
    return std::nullopt;
}

std::size_t parse_count(const std::string& key, const std::string& text, std::size_t min) {
    std::size_t value = 0;
    const char* first = text.data();
    const char* last = first + text.size();
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (text.empty() || ec != std::errc() || ptr != last) {
        throw ConfigError(key + ": expected a non-negative integer, got '" + text + "'");
    }
    if (value < min) {
        throw ConfigError(key + ": must be at least " + std::to_string(min));
    }
    return value;
}

std::size_t json_count(const nlohmann::json& j, const std::string& key, std::size_t min) {
    const auto& v = j.at(key);
    if (!v.is_number_unsigned() && !(v.is_number_integer() && v.get<int64_t>() >= 0)) {
        throw ConfigError(key + ": expected a non-negative integer");
    }
    auto value = v.get<std::size_t>();
    if (value < min) {
        throw ConfigError(key + ": must be at least " + std::to_string(min));
    }
    return value;
}

std::string checked_level(const std::string& level) {
    logging::parse_level(level);
    return level;
}

} // anonymous namespace

Settings Settings::from_env() {
    Settings s;
    if (auto v = getenv_opt("TOOLWIRE_LOG_LEVEL")) {
        s.log_level = checked_level(*v);
    }
    if (auto v = getenv_opt("TOOLWIRE_FRAMING")) {
        s.framing = framing_from_string(*v);
    }
    if (auto v = getenv_opt("TOOLWIRE_MAX_FRAME_BYTES")) {
        s.max_frame_bytes = parse_count("TOOLWIRE_MAX_FRAME_BYTES", *v, 1);
    }
    if (auto v = getenv_opt("TOOLWIRE_DRAIN_TIMEOUT_MS")) {
        s.drain_timeout = std::chrono::milliseconds(parse_count("TOOLWIRE_DRAIN_TIMEOUT_MS", *v, 0));
    }
    if (auto v = getenv_opt("TOOLWIRE_PAGE_SIZE")) {
        s.page_size = parse_count("TOOLWIRE_PAGE_SIZE", *v, 1);
    }
    if (auto v = getenv_opt("TOOLWIRE_MAX_IN_FLIGHT")) {
        s.max_in_flight = parse_count("TOOLWIRE_MAX_IN_FLIGHT", *v, 0);
    }
    return s;
}

Settings Settings::from_json(const nlohmann::json& j) {
    if (!j.is_object()) throw ConfigError("Configuration must be a JSON object");
    Settings s;
    try {
        if (j.contains("log_level"))
            s.log_level = checked_level(j.at("log_level").get<std::string>());
        if (j.contains("framing"))
            s.framing = framing_from_string(j.at("framing").get<std::string>());
        if (j.contains("max_frame_bytes"))
            s.max_frame_bytes = json_count(j, "max_frame_bytes", 1);
        if (j.contains("drain_timeout_ms"))
            s.drain_timeout = std::chrono::milliseconds(json_count(j, "drain_timeout_ms", 0));
        if (j.contains("page_size"))
            s.page_size = json_count(j, "page_size", 1);
        if (j.contains("max_in_flight"))
            s.max_in_flight = json_count(j, "max_in_flight", 0);
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError(std::string("Invalid configuration: ") + e.what());
    }
    return s;
}

Settings Settings::from_file(const std::string& path) {
    std::ifstream in(path);
    if (!in) throw ConfigError("Cannot open config file: " + path);
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(in);
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigError("Malformed config file " + path + ": " + e.what());
    }
    return from_json(j);
}

Settings& Settings::merge(const Settings& other) {
    if (other.log_level) log_level = other.log_level;
    if (other.framing) framing = other.framing;
    if (other.max_frame_bytes) max_frame_bytes = other.max_frame_bytes;
    if (other.drain_timeout) drain_timeout = other.drain_timeout;
    if (other.page_size) page_size = other.page_size;
    if (other.max_in_flight) max_in_flight = other.max_in_flight;
    return *this;
}

void Settings::apply(Server::Options& opts) const {
    if (framing) opts.framing = *framing;
    if (max_frame_bytes) opts.max_frame_bytes = *max_frame_bytes;
    if (drain_timeout) opts.drain_timeout = *drain_timeout;
    if (page_size) opts.page_size = *page_size;
    if (max_in_flight) opts.max_in_flight = *max_in_flight;
}

std::string Settings::effective_log_level() const {
    return log_level.value_or("info");
}

} // namespace toolwire
