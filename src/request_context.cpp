#include "toolwire/request_context.hpp"
#include "toolwire/error.hpp"
#include <atomic>
#include <condition_variable>
#include <mutex>

namespace toolwire {

// ---- CancellationToken ----

struct CancellationToken::State {
    std::atomic<bool> cancelled{false};
    std::mutex mutex;
    std::condition_variable cv;
};

CancellationToken::CancellationToken()
    : state_(std::make_shared<State>()) {
}

void CancellationToken::cancel() noexcept {
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->cancelled = true;
    }
    state_->cv.notify_all();
}

bool CancellationToken::is_cancelled() const noexcept {
    return state_->cancelled.load();
}

bool CancellationToken::wait_for(std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(state_->mutex);
    return state_->cv.wait_for(lock, timeout, [this] { return state_->cancelled.load(); });
}

// ---- RequestContext ----

RequestContext::RequestContext(RequestId id, std::string method, CancellationToken token,
                               std::optional<nlohmann::json> progress_token, Hooks hooks)
    : id_(std::move(id)), method_(std::move(method)), token_(std::move(token)),
      progress_token_(std::move(progress_token)), hooks_(std::move(hooks)) {
}

RequestContext RequestContext::detached(RequestId id, std::string method) {
    return RequestContext(std::move(id), std::move(method), CancellationToken{},
                          std::nullopt, Hooks{});
}

void RequestContext::throw_if_cancelled() const {
    if (token_.is_cancelled()) throw CancelledError();
}

bool RequestContext::report_progress(double progress, std::optional<double> total,
                                     std::optional<std::string> message) {
    if (!progress_token_) return false;
    nlohmann::json params = {
        {"progressToken", *progress_token_},
        {"progress", progress}
    };
    if (total) params["total"] = *total;
    if (message) params["message"] = *message;
    return notify("notifications/progress", std::move(params));
}

bool RequestContext::log(LogLevel level, const std::string& logger, const nlohmann::json& data) {
    if (hooks_.log_enabled && !hooks_.log_enabled(level)) return false;
    nlohmann::json params = {
        {"level", level},
        {"logger", logger},
        {"data", data}
    };
    return notify("notifications/message", std::move(params));
}

bool RequestContext::notify(const std::string& method, std::optional<nlohmann::json> params) {
    if (!hooks_.emit) return false;
    return hooks_.emit(JsonRpcNotification{method, std::move(params)});
}

} // namespace toolwire
