#pragma once
#include "types.hpp"
#include "json_rpc.hpp"
#include "request_context.hpp"
#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>
#include <variant>

namespace toolwire {

using HandlerResult = std::variant<nlohmann::json, JsonRpcError>;
using RequestHandler = std::function<HandlerResult(const nlohmann::json& params,
                                                   RequestContext& ctx)>;
using NotificationHandler = std::function<void(const nlohmann::json& params)>;

/// Method table for requests and notifications, with capability gating.
class Router {
public:
    /// Register a request handler for a method.
    void on_request(const std::string& method, RequestHandler handler);

    /// Register a notification handler.
    void on_notification(const std::string& method, NotificationHandler handler);

    /// Set required server capability for a method (enforced by resolve()).
    void require_capability(const std::string& method, const std::string& capability);

    /// Provide the negotiated server capabilities for gating.
    void set_capabilities(const ServerCapabilities& server_caps);

    [[nodiscard]] bool has_handler(const std::string& method) const;

    /// Find the handler for a request method. Returns MethodNotFound for an
    /// unknown method and InvalidRequest when its capability is not advertised.
    [[nodiscard]] std::variant<RequestHandler, JsonRpcError> resolve(const std::string& method) const;

    /// Run a request handler, converting any exception into an error.
    static HandlerResult invoke(const RequestHandler& handler, const nlohmann::json& params,
                                RequestContext& ctx);

    /// Deliver a notification. Returns false if no handler is registered.
    bool notify(const JsonRpcNotification& notif) const;

private:
    bool check_capability(const std::string& method) const;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, RequestHandler> request_handlers_;
    std::unordered_map<std::string, NotificationHandler> notification_handlers_;
    std::unordered_map<std::string, std::string> capability_requirements_;
    ServerCapabilities server_caps_;
};

} // namespace toolwire
