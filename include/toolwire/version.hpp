#pragma once
#include <array>
#include <string_view>

namespace toolwire {

constexpr std::string_view LIBRARY_VERSION     = "0.3.0";
constexpr std::string_view PROTOCOL_VERSION    = "2025-06-18";
constexpr std::string_view JSONRPC_VERSION     = "2.0";

/// Protocol revisions the server can speak, newest first.
constexpr std::array<std::string_view, 3> SUPPORTED_PROTOCOL_VERSIONS = {
    "2025-06-18", "2025-03-26", "2024-11-05"
};

} // namespace toolwire
