#pragma once
#include "transport.hpp"
#include "../framer.hpp"
#include <atomic>
#include <memory>
#include <mutex>

namespace toolwire {

/// StreamTransport frames messages over a pair of POSIX file descriptors.
/// The read loop runs on the thread that calls start(); writes happen on
/// whichever thread owns the outbound side.
class StreamTransport : public ITransport {
public:
    struct Options {
        Framing framing = Framing::Line;
        std::size_t max_frame_bytes = DEFAULT_MAX_FRAME_BYTES;
    };

    /// Create transport using system stdin/stdout.
    StreamTransport();
    explicit StreamTransport(Options opts);

    /// Create transport using specified file descriptors. The descriptors stay
    /// owned by the caller.
    StreamTransport(int read_fd, int write_fd);
    StreamTransport(int read_fd, int write_fd, Options opts);

    ~StreamTransport() override;

    StreamTransport(const StreamTransport&) = delete;
    StreamTransport& operator=(const StreamTransport&) = delete;

    void start(FrameCallback on_frame) override;
    void write_frame(std::string_view payload) override;
    void shutdown() override;
    bool is_connected() const override;

private:
    void read_loop(const FrameCallback& on_frame);

    int read_fd_;
    int write_fd_;
    std::unique_ptr<IFramer> framer_;

    std::atomic<bool> running_{false};
    std::atomic<bool> connected_{false};
    std::atomic<bool> shutdown_requested_{false};

    std::mutex write_mutex_;
    int wakeup_pipe_[2]{-1, -1};  // interrupts poll() in the read loop
};

} // namespace toolwire
