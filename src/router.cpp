#include "toolwire/router.hpp"
#include "toolwire/error.hpp"
#include "toolwire/logging.hpp"

namespace toolwire {

void Router::on_request(const std::string& method, RequestHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    request_handlers_[method] = std::move(handler);
}

void Router::on_notification(const std::string& method, NotificationHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    notification_handlers_[method] = std::move(handler);
}

void Router::require_capability(const std::string& method, const std::string& capability) {
    std::lock_guard<std::mutex> lock(mutex_);
    capability_requirements_[method] = capability;
}

void Router::set_capabilities(const ServerCapabilities& server_caps) {
    std::lock_guard<std::mutex> lock(mutex_);
    server_caps_ = server_caps;
}

bool Router::has_handler(const std::string& method) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return request_handlers_.count(method) > 0 || notification_handlers_.count(method) > 0;
}

bool Router::check_capability(const std::string& method) const {
    auto req_it = capability_requirements_.find(method);
    if (req_it == capability_requirements_.end()) return true;
    return server_caps_.has(req_it->second);
}

std::variant<RequestHandler, JsonRpcError> Router::resolve(const std::string& method) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = request_handlers_.find(method);
    if (it == request_handlers_.end()) {
        return JsonRpcError{error::MethodNotFound, "Method not found: " + method, std::nullopt};
    }
    if (!check_capability(method)) {
        return JsonRpcError{error::InvalidRequest, "Capability not supported: " + method,
                            std::nullopt};
    }
    return it->second;
}

HandlerResult Router::invoke(const RequestHandler& handler, const nlohmann::json& params,
                             RequestContext& ctx) {
    try {
        return handler(params, ctx);
    } catch (const CancelledError& e) {
        return JsonRpcError{error::RequestCancelled, e.what(), std::nullopt};
    } catch (const ProtocolError& e) {
        return e.to_error();
    } catch (const ApplicationError& e) {
        return e.to_error();
    } catch (const nlohmann::json::exception& e) {
        // Built-in handlers read params with at()/get(); a shape mismatch lands here.
        return JsonRpcError{error::InvalidParams, std::string("Invalid params: ") + e.what(),
                            std::nullopt};
    } catch (const std::exception& e) {
        return JsonRpcError{error::InternalError, e.what(), std::nullopt};
    }
}

bool Router::notify(const JsonRpcNotification& notif) const {
    NotificationHandler handler;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = notification_handlers_.find(notif.method);
        if (it == notification_handlers_.end()) return false;
        handler = it->second;
    }
    // Call handler WITHOUT holding the lock
    try {
        handler(notif.params ? *notif.params : nlohmann::json::object());
    } catch (const std::exception& e) {
        // Notifications have no response channel.
        logging::logger()->warn("Notification handler for '{}' failed: {}", notif.method, e.what());
    }
    return true;
}

} // namespace toolwire
