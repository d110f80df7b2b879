#pragma once
#include "json_rpc.hpp"
#include "router.hpp"
#include "outbound_writer.hpp"
#include "request_context.hpp"
#include <atomic>
#include <chrono>
#include <list>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace toolwire {

/// Tracks in-flight requests and runs each one on its own worker thread.
///
/// Every accepted request ends in exactly one Response: the handler's result,
/// its error, or RequestCancelled. Notifications emitted by a handler are
/// queued before that request's Response. Intake rejections (duplicate id,
/// shutting down, unknown method) are answered immediately and never tracked.
class Dispatcher {
public:
    /// `max_in_flight` caps handlers running at once (0 means no cap). A
    /// request over the cap is answered with ServerBusy. A cancelled handler
    /// keeps its slot until it actually returns.
    Dispatcher(const Router& router, OutboundWriter& writer, std::size_t max_in_flight = 0);
    ~Dispatcher();

    Dispatcher(const Dispatcher&) = delete;
    Dispatcher& operator=(const Dispatcher&) = delete;

    /// Accept a request and start its handler. Returns false if it was rejected.
    bool submit(const JsonRpcRequest& req);

    /// Answer a request that is not tracked (pre-ready, malformed, ...).
    void reject(std::optional<RequestId> id, JsonRpcError err);

    /// Cancel a pending request: set its flag and send RequestCancelled now.
    /// Unknown or already-completed ids are ignored (returns false).
    bool cancel(const RequestId& id, const std::string& reason = {});

    /// Reject every request submitted from now on with ShuttingDown.
    void begin_drain();

    /// Wait up to `timeout` for pending requests, then force-cancel the rest.
    /// Returns true if every request finished on its own.
    bool drain(std::chrono::milliseconds timeout);

    /// Sever every pending request without sending Responses.
    void abandon();

    [[nodiscard]] std::size_t pending_count() const;
    [[nodiscard]] std::size_t running_count() const;
    [[nodiscard]] bool is_pending(const RequestId& id) const;
    [[nodiscard]] bool is_draining() const;

    /// Threshold for notifications/message (logging/setLevel).
    void set_min_log_level(LogLevel level);
    [[nodiscard]] LogLevel min_log_level() const;

private:
    struct Pending;
    struct State;

    struct Worker {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> finished;
    };

    static bool finish(const std::shared_ptr<State>& state, const std::shared_ptr<Pending>& pending,
                       JsonRpcResponse resp);
    void reap_workers(bool detach_running);

    const Router& router_;
    const std::size_t max_in_flight_;
    std::shared_ptr<State> state_;
    std::mutex workers_mutex_;
    std::list<Worker> workers_;
};

} // namespace toolwire
