#pragma once
#include "framer.hpp"
#include "server.hpp"
#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace toolwire {

/// Deployment overrides for a Server. Unset fields keep the Options defaults.
///
/// Environment:            Config file key:
///   TOOLWIRE_LOG_LEVEL          log_level
///   TOOLWIRE_FRAMING            framing            ("line" | "content-length")
///   TOOLWIRE_MAX_FRAME_BYTES    max_frame_bytes
///   TOOLWIRE_DRAIN_TIMEOUT_MS   drain_timeout_ms
///   TOOLWIRE_PAGE_SIZE          page_size
///   TOOLWIRE_MAX_IN_FLIGHT      max_in_flight      (0 disables the cap)
struct Settings {
    std::optional<std::string> log_level;
    std::optional<Framing> framing;
    std::optional<std::size_t> max_frame_bytes;
    std::optional<std::chrono::milliseconds> drain_timeout;
    std::optional<std::size_t> page_size;
    std::optional<std::size_t> max_in_flight;

    /// All loaders throw ConfigError on invalid values.
    static Settings from_env();
    static Settings from_json(const nlohmann::json& j);
    static Settings from_file(const std::string& path);

    /// Fields set in `other` take precedence.
    Settings& merge(const Settings& other);

    void apply(Server::Options& opts) const;

    /// Level for toolwire::logging::init(); "info" unless overridden.
    [[nodiscard]] std::string effective_log_level() const;
};

} // namespace toolwire
