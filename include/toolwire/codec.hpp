#pragma once
#include "json_rpc.hpp"
#include "error.hpp"
#include <string>
#include <string_view>

namespace toolwire {

/// Converts between frame payloads and JsonRpcMessage values.
/// The codec never sees frame boundaries; a payload is one complete message.
class Codec {
public:
    /// Decode one payload.
    /// Throws ParseError with code ParseError when the payload is not JSON, or
    /// InvalidRequest when it is JSON but not a well-formed message. The
    /// request id is attached to the exception whenever it could be read.
    [[nodiscard]] static JsonRpcMessage parse(std::string_view raw);

    /// Encode a message to compact JSON.
    [[nodiscard]] static std::string serialize(const JsonRpcMessage& msg);

private:
    static JsonRpcMessage parse_object(const nlohmann::json& j);
};

} // namespace toolwire
