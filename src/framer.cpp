#include "toolwire/framer.hpp"
#include "toolwire/error.hpp"
#include <simdjson.h>
#include <algorithm>
#include <cctype>
#include <charconv>
#include <optional>

namespace toolwire {

namespace {

bool is_blank(std::string_view s) {
    return std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c) != 0; });
}

std::string_view trim(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
    return s;
}

bool iequals(std::string_view a, std::string_view b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](unsigned char x, unsigned char y) {
               return std::tolower(x) == std::tolower(y);
           });
}

bool valid_utf8(std::string_view payload) {
    return simdjson::validate_utf8(payload.data(), payload.size());
}

} // anonymous namespace

bool IFramer::is_idle(std::string_view buffer) const {
    return is_blank(buffer);
}

// ---- LineFramer ----

void LineFramer::encode(std::string_view payload, std::string& out) const {
    out.append(payload);
    out.push_back('\n');
}

FrameStatus LineFramer::try_decode(std::string& buffer, std::string& payload,
                                   std::string& error) {
    if (scanned_ > buffer.size()) scanned_ = 0;
    while (true) {
        size_t nl = buffer.find('\n', scanned_);
        if (nl == std::string::npos) {
            scanned_ = buffer.size();
            if (buffer.size() > max_frame_bytes_) {
                error = "Frame exceeds " + std::to_string(max_frame_bytes_) + " bytes";
                return FrameStatus::Invalid;
            }
            return FrameStatus::NeedMore;
        }
        scanned_ = 0;

        std::string_view line(buffer.data(), nl);
        if (!line.empty() && line.back() == '\r') line.remove_suffix(1);

        if (line.size() > max_frame_bytes_) {
            error = "Frame exceeds " + std::to_string(max_frame_bytes_) + " bytes";
            return FrameStatus::Invalid;
        }
        if (is_blank(line)) {
            buffer.erase(0, nl + 1);
            continue;
        }
        if (!valid_utf8(line)) {
            error = "Frame is not valid UTF-8";
            return FrameStatus::Invalid;
        }
        payload.assign(line.data(), line.size());
        buffer.erase(0, nl + 1);
        return FrameStatus::Framed;
    }
}

// ---- ContentLengthFramer ----

void ContentLengthFramer::encode(std::string_view payload, std::string& out) const {
    out.append("Content-Length: ");
    out.append(std::to_string(payload.size()));
    out.append("\r\n\r\n");
    out.append(payload);
}

FrameStatus ContentLengthFramer::try_decode(std::string& buffer, std::string& payload,
                                            std::string& error) {
    // Tolerate blank lines between frames.
    size_t start = 0;
    while (start < buffer.size() && (buffer[start] == '\r' || buffer[start] == '\n')) ++start;
    if (start > 0) buffer.erase(0, start);

    static constexpr std::string_view sep = "\r\n\r\n";
    size_t header_end = buffer.find(sep);
    if (header_end == std::string::npos) {
        // Headers are small; an unterminated block this large is garbage.
        if (buffer.size() > 8192) {
            error = "Header block not terminated";
            return FrameStatus::Invalid;
        }
        return FrameStatus::NeedMore;
    }

    std::string_view headers(buffer.data(), header_end);
    std::optional<size_t> content_length;
    size_t pos = 0;
    while (pos <= headers.size()) {
        size_t eol = headers.find("\r\n", pos);
        if (eol == std::string_view::npos) eol = headers.size();
        std::string_view line = headers.substr(pos, eol - pos);
        pos = eol + 2;
        if (line.empty()) continue;

        size_t colon = line.find(':');
        if (colon == std::string_view::npos) {
            error = "Malformed header line: " + std::string(line);
            return FrameStatus::Invalid;
        }
        std::string_view name = trim(line.substr(0, colon));
        std::string_view value = trim(line.substr(colon + 1));
        if (!iequals(name, "Content-Length")) continue;

        size_t len = 0;
        auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), len);
        if (ec != std::errc() || ptr != value.data() + value.size() || value.empty()) {
            error = "Invalid Content-Length: " + std::string(value);
            return FrameStatus::Invalid;
        }
        if (len > max_frame_bytes_) {
            error = "Content-Length " + std::to_string(len) + " exceeds " +
                    std::to_string(max_frame_bytes_) + " bytes";
            return FrameStatus::Invalid;
        }
        content_length = len;
    }

    if (!content_length) {
        error = "Missing Content-Length header";
        return FrameStatus::Invalid;
    }

    size_t body_start = header_end + sep.size();
    if (buffer.size() - body_start < *content_length) {
        return FrameStatus::NeedMore;
    }

    std::string_view body(buffer.data() + body_start, *content_length);
    if (!valid_utf8(body)) {
        error = "Frame is not valid UTF-8";
        return FrameStatus::Invalid;
    }
    payload.assign(body.data(), body.size());
    buffer.erase(0, body_start + *content_length);
    return FrameStatus::Framed;
}

// ---- Factory ----

std::unique_ptr<IFramer> make_framer(Framing framing, std::size_t max_frame_bytes) {
    switch (framing) {
        case Framing::ContentLength:
            return std::make_unique<ContentLengthFramer>(max_frame_bytes);
        case Framing::Line:
        default:
            return std::make_unique<LineFramer>(max_frame_bytes);
    }
}

std::string framing_to_string(Framing framing) {
    return framing == Framing::ContentLength ? "content-length" : "line";
}

Framing framing_from_string(const std::string& s) {
    if (s == "line" || s == "ndjson") return Framing::Line;
    if (s == "content-length" || s == "lsp") return Framing::ContentLength;
    throw ConfigError("Unknown framing: " + s);
}

} // namespace toolwire
