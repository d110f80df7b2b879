#pragma once
#include <cstddef>
#include <memory>
#include <string>
#include <string_view>

namespace toolwire {

enum class FrameStatus {
    NeedMore,   // no complete frame yet, nothing consumed
    Framed,     // one payload extracted and consumed from the buffer
    Invalid     // boundary is corrupt; the stream cannot be resynchronised
};

enum class Framing {
    Line,           // newline-delimited JSON
    ContentLength   // "Content-Length: N\r\n\r\n" headers
};

constexpr std::size_t DEFAULT_MAX_FRAME_BYTES = 4 * 1024 * 1024;

/// Splits a byte stream into message payloads and wraps payloads for writing.
/// Knows nothing about what the payloads contain. Not thread-safe: a framer
/// belongs to the single reader (decode) or the single writer (encode).
class IFramer {
public:
    virtual ~IFramer() = default;

    /// Append the on-wire form of one payload to `out`.
    virtual void encode(std::string_view payload, std::string& out) const = 0;

    /// Try to extract one payload from the front of `buffer`.
    /// On Invalid, `error` describes the corruption.
    virtual FrameStatus try_decode(std::string& buffer, std::string& payload,
                                   std::string& error) = 0;

    /// True if the bytes left at EOF are only inter-frame whitespace.
    [[nodiscard]] virtual bool is_idle(std::string_view buffer) const;
};

class LineFramer : public IFramer {
public:
    explicit LineFramer(std::size_t max_frame_bytes = DEFAULT_MAX_FRAME_BYTES)
        : max_frame_bytes_(max_frame_bytes) {}

    void encode(std::string_view payload, std::string& out) const override;

    /// Between calls the caller may only append to `buffer`; bytes already
    /// searched for a newline are not searched again.
    FrameStatus try_decode(std::string& buffer, std::string& payload,
                           std::string& error) override;

private:
    std::size_t max_frame_bytes_;
    std::size_t scanned_ = 0;  // prefix of the buffer known to hold no '\n'
};

class ContentLengthFramer : public IFramer {
public:
    explicit ContentLengthFramer(std::size_t max_frame_bytes = DEFAULT_MAX_FRAME_BYTES)
        : max_frame_bytes_(max_frame_bytes) {}

    void encode(std::string_view payload, std::string& out) const override;
    FrameStatus try_decode(std::string& buffer, std::string& payload,
                           std::string& error) override;

private:
    std::size_t max_frame_bytes_;
};

[[nodiscard]] std::unique_ptr<IFramer> make_framer(Framing framing,
                                                   std::size_t max_frame_bytes = DEFAULT_MAX_FRAME_BYTES);

[[nodiscard]] std::string framing_to_string(Framing framing);
[[nodiscard]] Framing framing_from_string(const std::string& s);

} // namespace toolwire
