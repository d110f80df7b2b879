#include "toolwire/dispatcher.hpp"
#include "toolwire/error.hpp"
#include "toolwire/logging.hpp"
#include <condition_variable>
#include <map>
#include <system_error>
#include <vector>

namespace toolwire {

/// One accepted request. `mutex` serializes the request's own output so its
/// notifications are queued before its Response and nothing follows it.
struct Dispatcher::Pending {
    RequestId id;
    std::string method;
    std::chrono::steady_clock::time_point issued_at;
    CancellationToken token;

    std::mutex mutex;
    bool done{false};
};

// Shared with worker threads, which may outlive the Dispatcher after a drain
// timeout. Lock order: Pending::mutex, then State::mutex.
struct Dispatcher::State {
    OutboundWriter* writer;

    mutable std::mutex mutex;
    std::condition_variable cv;
    std::map<RequestId, std::shared_ptr<Pending>> table;
    std::size_t running{0};  // handlers that have not returned yet
    bool draining{false};

    std::atomic<LogLevel> min_log_level{LogLevel::Info};

    explicit State(OutboundWriter* w) : writer(w) {}
};

namespace {

std::optional<nlohmann::json> progress_token_of(const nlohmann::json& params) {
    if (!params.is_object()) return std::nullopt;
    auto meta = params.find("_meta");
    if (meta == params.end() || !meta->is_object()) return std::nullopt;
    auto token = meta->find("progressToken");
    if (token == meta->end()) return std::nullopt;
    if (!token->is_string() && !token->is_number_integer()) return std::nullopt;
    return *token;
}

} // anonymous namespace

Dispatcher::Dispatcher(const Router& router, OutboundWriter& writer, std::size_t max_in_flight)
    : router_(router), max_in_flight_(max_in_flight), state_(std::make_shared<State>(&writer)) {
}

Dispatcher::~Dispatcher() {
    abandon();
    reap_workers(true);
}

bool Dispatcher::finish(const std::shared_ptr<State>& state,
                        const std::shared_ptr<Pending>& pending, JsonRpcResponse resp) {
    std::lock_guard<std::mutex> req_lock(pending->mutex);
    if (pending->done) return false;
    pending->done = true;
    {
        std::lock_guard<std::mutex> lock(state->mutex);
        auto it = state->table.find(pending->id);
        if (it != state->table.end() && it->second == pending) {
            state->table.erase(it);
        }
    }
    state->cv.notify_all();

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - pending->issued_at);
    logging::logger()->debug("Request {} ({}) finished in {} ms{}", to_string(pending->id), pending->method,
                  elapsed.count(), resp.error ? " with error" : "");

    state->writer->enqueue(std::move(resp));
    return true;
}

bool Dispatcher::submit(const JsonRpcRequest& req) {
    reap_workers(false);

    auto resolved = router_.resolve(req.method);
    if (auto* err = std::get_if<JsonRpcError>(&resolved)) {
        // Still refuse duplicates of a pending id with the more specific error.
        if (is_pending(req.id)) {
            reject(req.id, JsonRpcError{error::DuplicateRequestId,
                                        "Duplicate request id: " + to_string(req.id), std::nullopt});
        } else {
            reject(req.id, *err);
        }
        return false;
    }
    RequestHandler handler = std::get<RequestHandler>(std::move(resolved));

    auto pending = std::make_shared<Pending>();
    pending->id = req.id;
    pending->method = req.method;
    pending->issued_at = std::chrono::steady_clock::now();

    std::optional<JsonRpcError> rejection;
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (state_->draining) {
            rejection = JsonRpcError{error::ShuttingDown, "Server is shutting down", std::nullopt};
        } else if (state_->table.count(req.id) > 0) {
            rejection = JsonRpcError{error::DuplicateRequestId,
                                     "Duplicate request id: " + to_string(req.id), std::nullopt};
        } else if (max_in_flight_ > 0 && state_->running >= max_in_flight_) {
            rejection = JsonRpcError{error::ServerBusy,
                                     "Too many requests in flight (limit " +
                                         std::to_string(max_in_flight_) + ")",
                                     std::nullopt};
        } else {
            state_->table.emplace(req.id, pending);
            ++state_->running;
        }
    }
    if (rejection) {
        reject(req.id, std::move(*rejection));
        return false;
    }

    std::shared_ptr<State> state = state_;
    nlohmann::json params = req.params ? *req.params : nlohmann::json::object();
    auto progress_token = progress_token_of(params);

    RequestContext::Hooks hooks;
    hooks.emit = [state, pending](JsonRpcNotification notif) {
        std::lock_guard<std::mutex> req_lock(pending->mutex);
        if (pending->done) return false;
        return state->writer->enqueue(std::move(notif));
    };
    hooks.log_enabled = [state](LogLevel level) {
        return level >= state->min_log_level.load();
    };

    auto finished = std::make_shared<std::atomic<bool>>(false);
    auto body = [state, pending, handler = std::move(handler), params = std::move(params),
                 progress_token, hooks = std::move(hooks), finished]() mutable {
        RequestContext ctx(pending->id, pending->method, pending->token,
                           std::move(progress_token), std::move(hooks));
        HandlerResult result = Router::invoke(handler, params, ctx);
        // Release the slot before the Response can reach the client.
        {
            std::lock_guard<std::mutex> lock(state->mutex);
            --state->running;
        }

        JsonRpcResponse resp;
        if (auto* err = std::get_if<JsonRpcError>(&result)) {
            resp = JsonRpcResponse::failure(pending->id, std::move(*err));
        } else {
            resp = JsonRpcResponse::success(pending->id, std::get<nlohmann::json>(std::move(result)));
        }
        // A no-op if the request was cancelled or abandoned meanwhile.
        finish(state, pending, std::move(resp));
        finished->store(true);
    };

    try {
        std::lock_guard<std::mutex> lock(workers_mutex_);
        workers_.push_back(Worker{std::thread(std::move(body)), finished});
    } catch (const std::system_error& e) {
        logging::logger()->error("Unable to start worker for request {}: {}", to_string(req.id), e.what());
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            --state_->running;
        }
        finish(state_, pending, JsonRpcResponse::failure(
            req.id, JsonRpcError{error::InternalError, "Unable to start request worker", std::nullopt}));
        return false;
    }
    return true;
}

void Dispatcher::reject(std::optional<RequestId> id, JsonRpcError err) {
    logging::logger()->debug("Rejecting request {}: {} ({})", id ? to_string(*id) : "null",
                  err.message, err.code);
    state_->writer->enqueue(JsonRpcResponse::failure(std::move(id), std::move(err)));
}

bool Dispatcher::cancel(const RequestId& id, const std::string& reason) {
    std::shared_ptr<Pending> pending;
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        auto it = state_->table.find(id);
        if (it == state_->table.end()) return false;
        pending = it->second;
    }
    pending->token.cancel();

    std::optional<nlohmann::json> data;
    if (!reason.empty()) data = nlohmann::json{{"reason", reason}};
    bool sent = finish(state_, pending, JsonRpcResponse::failure(
        id, JsonRpcError{error::RequestCancelled, "Request cancelled", std::move(data)}));
    if (sent) logging::logger()->debug("Cancelled request {}", to_string(id));
    return sent;
}

void Dispatcher::begin_drain() {
    std::lock_guard<std::mutex> lock(state_->mutex);
    state_->draining = true;
}

bool Dispatcher::drain(std::chrono::milliseconds timeout) {
    begin_drain();

    std::vector<RequestId> stragglers;
    {
        std::unique_lock<std::mutex> lock(state_->mutex);
        bool idle = state_->cv.wait_for(lock, timeout, [this] { return state_->table.empty(); });
        if (!idle) {
            for (const auto& [id, pending] : state_->table) stragglers.push_back(id);
        }
    }

    if (!stragglers.empty()) {
        logging::logger()->warn("Drain timeout after {} ms, force-cancelling {} request(s)",
                     timeout.count(), stragglers.size());
    }
    for (const auto& id : stragglers) {
        cancel(id, "drain timeout");
    }
    reap_workers(true);
    return stragglers.empty();
}

void Dispatcher::abandon() {
    std::map<RequestId, std::shared_ptr<Pending>> table;
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->draining = true;
        table.swap(state_->table);
    }
    state_->cv.notify_all();

    if (!table.empty()) {
        logging::logger()->warn("Abandoning {} pending request(s)", table.size());
    }
    for (auto& [id, pending] : table) {
        std::lock_guard<std::mutex> req_lock(pending->mutex);
        pending->done = true;
        pending->token.cancel();
    }
}

void Dispatcher::reap_workers(bool detach_running) {
    std::lock_guard<std::mutex> lock(workers_mutex_);
    for (auto it = workers_.begin(); it != workers_.end();) {
        if (it->finished->load()) {
            if (it->thread.joinable()) it->thread.join();
            it = workers_.erase(it);
        } else if (detach_running) {
            // The handler ignored cancellation; its output is already severed.
            it->thread.detach();
            it = workers_.erase(it);
        } else {
            ++it;
        }
    }
}

std::size_t Dispatcher::pending_count() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->table.size();
}

std::size_t Dispatcher::running_count() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->running;
}

bool Dispatcher::is_pending(const RequestId& id) const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->table.count(id) > 0;
}

bool Dispatcher::is_draining() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->draining;
}

void Dispatcher::set_min_log_level(LogLevel level) {
    state_->min_log_level = level;
}

LogLevel Dispatcher::min_log_level() const {
    return state_->min_log_level.load();
}

} // namespace toolwire
