#pragma once
#include "types.hpp"
#include "json_rpc.hpp"
#include <mutex>
#include <optional>
#include <string>

namespace toolwire {

/// Lifecycle of one connection. Transitions only move forward.
enum class SessionState {
    Uninitialized,
    Negotiating,
    Ready,
    Draining,
    Closed
};

std::string to_string(SessionState s);

class Session {
public:
    Session() = default;

    [[nodiscard]] SessionState state() const;

    /// Move to `next` if it lies ahead of the current state.
    /// Returns false and leaves the state unchanged otherwise.
    bool advance(SessionState next);

    /// Requests other than initialize are served only when Ready.
    [[nodiscard]] bool is_ready() const { return state() == SessionState::Ready; }
    [[nodiscard]] bool is_shutting_down() const;

    /// Handle the initialize request: validate params, agree on a protocol
    /// version and capabilities, and move to Negotiating.
    /// Throws ProtocolError (InvalidParams for bad params, InvalidRequest if
    /// the session was already initialized); the state is then unchanged.
    InitializeResult negotiate(const nlohmann::json& params,
                               const ServerCapabilities& server_caps,
                               const Implementation& server_info,
                               const std::optional<std::string>& instructions);

    /// The client's initialized notification: Negotiating -> Ready.
    bool confirm();

    // Agreed values (valid once negotiate() succeeded).
    [[nodiscard]] std::string protocol_version() const;
    [[nodiscard]] ClientCapabilities client_capabilities() const;
    [[nodiscard]] ServerCapabilities server_capabilities() const;
    [[nodiscard]] std::optional<Implementation> client_info() const;

    /// The requested version when supported, otherwise the latest one.
    static std::string negotiate_version(const std::string& requested);

    /// Keep only what both sides declare. `supported` is the shape the server
    /// understands: objects intersect key-wise and booleans are AND-ed.
    static nlohmann::json intersect_capabilities(const nlohmann::json& offered,
                                                 const nlohmann::json& supported);

    /// Client capabilities this server understands.
    static const nlohmann::json& supported_client_capabilities();

private:
    mutable std::mutex mutex_;
    SessionState state_{SessionState::Uninitialized};
    std::string protocol_version_;
    ClientCapabilities client_caps_;
    ServerCapabilities server_caps_;
    std::optional<Implementation> client_info_;
};

} // namespace toolwire
