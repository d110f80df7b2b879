#pragma once
#include <functional>
#include <string>
#include <string_view>

namespace toolwire {

/// Receives each complete frame payload, in stream order, on the reader thread.
using FrameCallback = std::function<void(std::string payload)>;

/// A bidirectional byte stream with one reader and one writer.
class ITransport {
public:
    virtual ~ITransport() = default;

    /// Run the read loop on the calling thread until the peer closes the
    /// stream at a frame boundary or shutdown() is called.
    /// Throws TransportError on a malformed or truncated frame or a read failure.
    virtual void start(FrameCallback on_frame) = 0;

    /// Write one payload as a complete frame. Only the outbound writer calls this.
    /// Throws TransportError when the stream can no longer be written.
    virtual void write_frame(std::string_view payload) = 0;

    /// Stop the read loop. Writing remains possible until destruction.
    virtual void shutdown() = 0;

    /// False once the read side reached EOF or was shut down.
    [[nodiscard]] virtual bool is_connected() const = 0;
};

} // namespace toolwire
