#pragma once
#include "types.hpp"
#include "json_rpc.hpp"
#include "framer.hpp"
#include "registry.hpp"
#include "session.hpp"
#include "version.hpp"
#include "transport/transport.hpp"
#include <chrono>
#include <memory>
#include <optional>
#include <string>

namespace toolwire {

/// A tool server bound to one connection.
///
/// Register tools, resources and prompts, then call serve(). serve() runs the
/// read loop on the calling thread and returns the process exit status: 0 after
/// a clean shutdown (shutdown request, exit notification or EOF), 1 after a
/// fatal transport failure.
class Server {
public:
    struct Options {
        Implementation server_info{"toolwire", std::nullopt, std::string(LIBRARY_VERSION)};
        std::optional<std::string> instructions;
        std::chrono::milliseconds drain_timeout{5000};
        size_t page_size = 50;
        Framing framing = Framing::Line;
        size_t max_frame_bytes = DEFAULT_MAX_FRAME_BYTES;
        /// Requests whose handlers may run at once; more get ServerBusy. 0 disables the cap.
        size_t max_in_flight = 64;
    };

    Server();
    explicit Server(Options opts);
    ~Server();

    // Non-copyable, non-movable
    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;

    // ---- Registration ----
    // Throw RegistryError on duplicates. Once the session is Ready the
    // matching list_changed notification is sent.
    void add_tool(ToolDefinition def, ToolHandler handler);
    void add_resource(ResourceDefinition def, ResourceReadHandler handler);
    void add_resource_template(ResourceTemplate tmpl, ResourceReadHandler handler);
    void add_prompt(PromptDefinition def, PromptGetHandler handler);

    // ---- Logging ----
    /// Send notifications/message if the session is Ready and `level` passes
    /// the client's logging/setLevel threshold.
    void log(LogLevel level, const std::string& logger, const nlohmann::json& data);

    // ---- Transport ----
    int serve(std::unique_ptr<ITransport> transport);
    int serve_stdio();

    /// Begin a drain as if the client had sent exit. Safe from any thread.
    void shutdown();

    [[nodiscard]] SessionState state() const;
    [[nodiscard]] const Registry& registry() const;
    [[nodiscard]] const Options& options() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace toolwire
