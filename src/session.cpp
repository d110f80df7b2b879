#include "toolwire/session.hpp"
#include "toolwire/error.hpp"
#include "toolwire/version.hpp"
#include "toolwire/logging.hpp"
#include <algorithm>

namespace toolwire {

std::string to_string(SessionState s) {
    switch (s) {
        case SessionState::Uninitialized: return "uninitialized";
        case SessionState::Negotiating:   return "negotiating";
        case SessionState::Ready:         return "ready";
        case SessionState::Draining:      return "draining";
        case SessionState::Closed:        return "closed";
    }
    return "unknown";
}

SessionState Session::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

bool Session::advance(SessionState next) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (next <= state_) return false;
    logging::logger()->debug("Session {} -> {}", to_string(state_), to_string(next));
    state_ = next;
    return true;
}

bool Session::is_shutting_down() const {
    return state() >= SessionState::Draining;
}

InitializeResult Session::negotiate(const nlohmann::json& params,
                                    const ServerCapabilities& server_caps,
                                    const Implementation& server_info,
                                    const std::optional<std::string>& instructions) {
    InitializeRequest req;
    try {
        if (!params.is_object()) throw std::invalid_argument("params must be an object");
        from_json(params, req);
    } catch (const nlohmann::json::exception& e) {
        throw ProtocolError(error::InvalidParams, std::string("Invalid initialize params: ") + e.what());
    } catch (const std::invalid_argument& e) {
        throw ProtocolError(error::InvalidParams, std::string("Invalid initialize params: ") + e.what());
    }

    InitializeResult result;
    result.protocol_version = negotiate_version(req.protocol_version);
    result.capabilities = server_caps;
    result.server_info = server_info;
    result.instructions = instructions;

    ClientCapabilities agreed;
    from_json(intersect_capabilities(req.capabilities, supported_client_capabilities()), agreed);

    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ != SessionState::Uninitialized) {
        throw ProtocolError(error::InvalidRequest, "Session already initialized");
    }
    state_ = SessionState::Negotiating;
    protocol_version_ = result.protocol_version;
    client_caps_ = std::move(agreed);
    server_caps_ = server_caps;
    client_info_ = req.client_info;

    logging::logger()->info("Initialized by {} {} (protocol {})",
                 client_info_ ? client_info_->name : std::string("unknown client"),
                 client_info_ ? client_info_->version : std::string(),
                 protocol_version_);
    return result;
}

bool Session::confirm() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ != SessionState::Negotiating) return false;
    state_ = SessionState::Ready;
    logging::logger()->debug("Session negotiating -> ready");
    return true;
}

std::string Session::protocol_version() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return protocol_version_;
}

ClientCapabilities Session::client_capabilities() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return client_caps_;
}

ServerCapabilities Session::server_capabilities() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return server_caps_;
}

std::optional<Implementation> Session::client_info() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return client_info_;
}

std::string Session::negotiate_version(const std::string& requested) {
    auto it = std::find(SUPPORTED_PROTOCOL_VERSIONS.begin(), SUPPORTED_PROTOCOL_VERSIONS.end(),
                        requested);
    if (it != SUPPORTED_PROTOCOL_VERSIONS.end()) return requested;
    return std::string(PROTOCOL_VERSION);
}

nlohmann::json Session::intersect_capabilities(const nlohmann::json& offered,
                                               const nlohmann::json& supported) {
    nlohmann::json agreed = nlohmann::json::object();
    if (!offered.is_object() || !supported.is_object()) return agreed;

    for (const auto& [key, theirs] : offered.items()) {
        auto ours = supported.find(key);
        if (ours == supported.end()) continue;
        if (ours->is_object() && theirs.is_object()) {
            agreed[key] = intersect_capabilities(theirs, *ours);
        } else if (ours->is_boolean() && theirs.is_boolean()) {
            agreed[key] = ours->get<bool>() && theirs.get<bool>();
        }
        // Mismatched shapes are dropped.
    }
    return agreed;
}

const nlohmann::json& Session::supported_client_capabilities() {
    static const nlohmann::json caps = {
        {"roots", {{"listChanged", true}}},
        {"sampling", nlohmann::json::object()},
        {"elicitation", nlohmann::json::object()}
    };
    return caps;
}

} // namespace toolwire
