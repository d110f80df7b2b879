#pragma once
#include "json_rpc.hpp"
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace toolwire {

namespace error {
    constexpr int ParseError           = -32700;
    constexpr int InvalidRequest       = -32600;
    constexpr int MethodNotFound       = -32601;
    constexpr int InvalidParams        = -32602;
    constexpr int InternalError        = -32603;
    constexpr int ServerNotInitialized = -32002;
    constexpr int ResourceNotFound     = -32004;
    constexpr int DuplicateRequestId   = -32005;
    constexpr int ShuttingDown         = -32006;
    constexpr int ServerBusy           = -32007;
    constexpr int RequestCancelled     = -32800;
} // namespace error

class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Fatal: the byte stream or a frame boundary is broken. Ends the session.
class TransportError : public Error {
public:
    using Error::Error;
};

/// An intact frame that does not decode into a valid message.
/// Carries the id when it could still be recovered from the frame.
class ParseError : public Error {
public:
    int code;
    std::optional<RequestId> id;

    ParseError(int code, const std::string& msg, std::optional<RequestId> id = std::nullopt)
        : Error(msg), code(code), id(std::move(id)) {}
};

/// Non-fatal protocol violation, answered with an error Response.
class ProtocolError : public Error {
public:
    int code;
    std::optional<nlohmann::json> data;

    ProtocolError(int code, const std::string& msg,
                  std::optional<nlohmann::json> data = std::nullopt)
        : Error(msg), code(code), data(std::move(data)) {}

    [[nodiscard]] JsonRpcError to_error() const {
        return JsonRpcError{code, what(), data};
    }
};

/// Arguments rejected by a JSON schema. Every violation is listed.
class ValidationError : public ProtocolError {
public:
    std::vector<std::string> errors;

    ValidationError(const std::string& msg, std::vector<std::string> errs)
        : ProtocolError(error::InvalidParams, msg, nlohmann::json{{"errors", errs}}),
          errors(std::move(errs)) {}
};

/// A registered handler's own failure, forwarded to the client as-is.
class ApplicationError : public Error {
public:
    int code;
    std::optional<nlohmann::json> data;

    explicit ApplicationError(const std::string& msg, int code = error::InternalError,
                              std::optional<nlohmann::json> data = std::nullopt)
        : Error(msg), code(code), data(std::move(data)) {}

    [[nodiscard]] JsonRpcError to_error() const {
        return JsonRpcError{code, what(), data};
    }
};

class CancelledError : public Error {
public:
    CancelledError() : Error("Request cancelled") {}
    using Error::Error;
};

class RegistryError : public Error {
public:
    using Error::Error;
};

class ConfigError : public Error {
public:
    using Error::Error;
};

} // namespace toolwire
