#include "toolwire/transport/stream_transport.hpp"
#include "toolwire/error.hpp"
#include "toolwire/logging.hpp"
#include <unistd.h>
#include <fcntl.h>
#include <poll.h>
#include <cerrno>
#include <cstring>
#include <string>

namespace toolwire {

StreamTransport::StreamTransport()
    : StreamTransport(Options{}) {
}

StreamTransport::StreamTransport(Options opts)
    : StreamTransport(STDIN_FILENO, STDOUT_FILENO, opts) {
}

StreamTransport::StreamTransport(int read_fd, int write_fd)
    : StreamTransport(read_fd, write_fd, Options{}) {
}

StreamTransport::StreamTransport(int read_fd, int write_fd, Options opts)
    : read_fd_(read_fd), write_fd_(write_fd),
      framer_(make_framer(opts.framing, opts.max_frame_bytes)) {
    if (::pipe(wakeup_pipe_) < 0) {
        throw TransportError(std::string("Failed to create wakeup pipe: ") + std::strerror(errno));
    }
    int flags = ::fcntl(wakeup_pipe_[1], F_GETFL, 0);
    ::fcntl(wakeup_pipe_[1], F_SETFL, flags | O_NONBLOCK);
}

StreamTransport::~StreamTransport() {
    shutdown();
    if (wakeup_pipe_[0] >= 0) ::close(wakeup_pipe_[0]);
    if (wakeup_pipe_[1] >= 0) ::close(wakeup_pipe_[1]);
}

void StreamTransport::start(FrameCallback on_frame) {
    // shutdown() before start() means there is nothing to read.
    if (shutdown_requested_.load()) return;
    if (running_.exchange(true)) {
        throw TransportError("Transport already started");
    }
    connected_ = true;
    try {
        read_loop(on_frame);
    } catch (...) {
        connected_ = false;
        running_ = false;
        throw;
    }
    connected_ = false;
    running_ = false;
}

void StreamTransport::read_loop(const FrameCallback& on_frame) {
    std::string buffer;
    buffer.reserve(4096);
    std::string payload;
    std::string frame_error;
    char chunk[4096];

    while (running_) {
        struct pollfd fds[2];
        fds[0].fd = read_fd_;
        fds[0].events = POLLIN;
        fds[0].revents = 0;
        fds[1].fd = wakeup_pipe_[0];
        fds[1].events = POLLIN;
        fds[1].revents = 0;

        int ret = ::poll(fds, 2, -1);
        if (ret < 0) {
            if (errno == EINTR) continue;
            throw TransportError(std::string("poll failed: ") + std::strerror(errno));
        }

        // Wakeup pipe has data: shutdown() was called, exit cleanly
        if (fds[1].revents & POLLIN) return;

        if (!(fds[0].revents & (POLLIN | POLLHUP | POLLERR))) continue;

        ssize_t n = ::read(read_fd_, chunk, sizeof(chunk));
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) continue;
            throw TransportError(std::string("Read error: ") + std::strerror(errno));
        }
        if (n == 0) {
            if (!framer_->is_idle(buffer)) {
                throw TransportError("Stream closed mid-frame (" +
                                     std::to_string(buffer.size()) + " bytes pending)");
            }
            logging::logger()->debug("transport: EOF on input stream");
            return;
        }

        buffer.append(chunk, static_cast<size_t>(n));

        while (running_) {
            auto status = framer_->try_decode(buffer, payload, frame_error);
            if (status == FrameStatus::NeedMore) break;
            if (status == FrameStatus::Invalid) {
                throw TransportError("Malformed frame: " + frame_error);
            }
            on_frame(std::move(payload));
            payload.clear();
        }
    }
}

void StreamTransport::write_frame(std::string_view payload) {
    std::string frame;
    frame.reserve(payload.size() + 32);
    framer_->encode(payload, frame);

    std::lock_guard<std::mutex> lock(write_mutex_);
    const char* data = frame.data();
    size_t remaining = frame.size();
    while (remaining > 0) {
        ssize_t written = ::write(write_fd_, data, remaining);
        if (written < 0) {
            if (errno == EINTR) continue;
            throw TransportError(std::string("Write error: ") + std::strerror(errno));
        }
        data += written;
        remaining -= static_cast<size_t>(written);
    }
}

void StreamTransport::shutdown() {
    if (shutdown_requested_.exchange(true)) return;
    running_ = false;
    connected_ = false;
    if (wakeup_pipe_[1] >= 0) {
        char b = 1;
        // A full pipe already holds a pending wakeup.
        if (::write(wakeup_pipe_[1], &b, 1) < 0 && errno != EAGAIN) {
            logging::logger()->warn("transport: wakeup write failed: {}", std::strerror(errno));
        }
    }
}

bool StreamTransport::is_connected() const {
    return connected_;
}

} // namespace toolwire
