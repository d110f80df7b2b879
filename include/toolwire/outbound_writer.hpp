#pragma once
#include "json_rpc.hpp"
#include "error.hpp"
#include "transport/transport.hpp"
#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>

namespace toolwire {

/// The only component that writes to the transport.
///
/// Producers on any thread hand over complete messages; one consumer thread
/// serializes them and writes one frame per message, in the order they were
/// enqueued. The writer never reorders. Producers that need an ordering
/// between their own messages enqueue them in that order.
class OutboundWriter {
public:
    using ErrorCallback = std::function<void(const TransportError&)>;

    explicit OutboundWriter(ITransport& transport);
    ~OutboundWriter();

    OutboundWriter(const OutboundWriter&) = delete;
    OutboundWriter& operator=(const OutboundWriter&) = delete;

    /// Launch the consumer thread. `on_error` runs on that thread if a write fails.
    void start(ErrorCallback on_error = nullptr);

    /// Queue a message. Returns false if the writer was closed, aborted or failed.
    bool enqueue(JsonRpcMessage msg);

    /// Stop accepting messages, write everything already queued and join.
    void close();

    /// Stop accepting messages, discard what is queued and join.
    void abort();

    [[nodiscard]] bool failed() const noexcept { return failed_; }
    [[nodiscard]] std::size_t frames_written() const noexcept { return frames_written_; }

private:
    void write_loop();
    void stop(bool discard);

    ITransport& transport_;
    ErrorCallback on_error_;

    std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<JsonRpcMessage> queue_;
    bool accepting_{false};
    bool stopping_{false};

    std::atomic<bool> failed_{false};
    std::atomic<std::size_t> frames_written_{0};
    std::thread thread_;
};

} // namespace toolwire
