#pragma once
#include "json_rpc.hpp"
#include "types.hpp"
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace toolwire {

/// Shared cooperative-cancellation flag. Copies observe the same state.
class CancellationToken {
public:
    CancellationToken();

    /// Set the flag and wake every wait_for(). Idempotent.
    void cancel() noexcept;
    [[nodiscard]] bool is_cancelled() const noexcept;

    /// Sleep for up to `timeout`, returning early (true) if cancelled.
    bool wait_for(std::chrono::milliseconds timeout) const;

private:
    struct State;
    std::shared_ptr<State> state_;
};

/// Per-invocation context handed to request handlers.
///
/// Notifications emitted through the context are ordered before the
/// request's own Response. Once the Response has been sent (or the request
/// was cancelled or abandoned) emissions are dropped and return false.
class RequestContext {
public:
    struct Hooks {
        std::function<bool(JsonRpcNotification)> emit;
        std::function<bool(LogLevel)> log_enabled;
    };

    RequestContext(RequestId id, std::string method, CancellationToken token,
                   std::optional<nlohmann::json> progress_token, Hooks hooks);

    /// Context with no peer attached. Emissions are dropped.
    static RequestContext detached(RequestId id, std::string method = {});

    [[nodiscard]] const RequestId& id() const noexcept { return id_; }
    [[nodiscard]] const std::string& method() const noexcept { return method_; }
    [[nodiscard]] const CancellationToken& token() const noexcept { return token_; }

    [[nodiscard]] bool is_cancelled() const noexcept { return token_.is_cancelled(); }

    /// Throws CancelledError if the request was cancelled.
    void throw_if_cancelled() const;

    /// Emit notifications/progress. Only sent when the caller supplied a
    /// progress token in params._meta.progressToken.
    bool report_progress(double progress, std::optional<double> total = std::nullopt,
                         std::optional<std::string> message = std::nullopt);

    /// Emit notifications/message if `level` passes the client's logging/setLevel.
    bool log(LogLevel level, const std::string& logger, const nlohmann::json& data);

    /// Emit an arbitrary notification correlated with this request.
    bool notify(const std::string& method, std::optional<nlohmann::json> params = std::nullopt);

private:
    RequestId id_;
    std::string method_;
    CancellationToken token_;
    std::optional<nlohmann::json> progress_token_;
    Hooks hooks_;
};

} // namespace toolwire
