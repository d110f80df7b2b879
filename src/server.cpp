#include "toolwire/server.hpp"
#include "toolwire/codec.hpp"
#include "toolwire/dispatcher.hpp"
#include "toolwire/error.hpp"
#include "toolwire/outbound_writer.hpp"
#include "toolwire/router.hpp"
#include "toolwire/transport/stream_transport.hpp"
#include "toolwire/logging.hpp"

#include <atomic>
#include <csignal>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace toolwire {

namespace {

std::optional<std::string> cursor_of(const nlohmann::json& params) {
    if (params.contains("cursor") && !params.at("cursor").is_null()) {
        return params.at("cursor").get<std::string>();
    }
    return std::nullopt;
}

template <typename T>
nlohmann::json page_to_json(const char* key, const Page<T>& page) {
    nlohmann::json result = {{key, page.items}};
    if (page.next_cursor) result["nextCursor"] = *page.next_cursor;
    return result;
}

} // anonymous namespace

// ----------- Server::Impl -----------

struct Server::Impl {
    Options opts;
    std::shared_ptr<Registry> registry;
    Router router;
    Session session;

    // Live only while serve() runs. The reader thread uses them without the
    // lock; other threads must hold io_mutex.
    mutable std::mutex io_mutex;
    ITransport* transport{nullptr};
    OutboundWriter* writer{nullptr};
    Dispatcher* dispatcher{nullptr};

    std::mutex drainer_mutex;
    std::thread drainer;
    bool drain_started{false};

    std::atomic<bool> served{false};
    std::atomic<bool> fatal{false};

    explicit Impl(Options o)
        : opts(std::move(o)), registry(std::make_shared<Registry>(opts.page_size)) {}

    // Build server capabilities from what's registered
    ServerCapabilities build_capabilities() const {
        ServerCapabilities caps;
        if (registry->has_tools()) {
            caps.tools = nlohmann::json{{"listChanged", true}};
        }
        if (registry->has_resources()) {
            caps.resources = nlohmann::json{{"listChanged", true}};
        }
        if (registry->has_prompts()) {
            caps.prompts = nlohmann::json{{"listChanged", true}};
        }
        caps.logging = nlohmann::json::object();
        return caps;
    }

    void setup_handlers() {
        auto reg = registry;

        // ping
        router.on_request("ping", [](const nlohmann::json&, RequestContext&) -> HandlerResult {
            return nlohmann::json::object();
        });

        // tools/list
        router.on_request("tools/list", [reg](const nlohmann::json& params, RequestContext&) -> HandlerResult {
            return page_to_json("tools", reg->list_tools(cursor_of(params)));
        });
        router.require_capability("tools/list", "tools");

        // tools/call
        router.on_request("tools/call", [reg](const nlohmann::json& params, RequestContext& ctx) -> HandlerResult {
            std::string name = params.at("name").get<std::string>();
            nlohmann::json arguments = params.value("arguments", nlohmann::json::object());
            if (arguments.is_null()) arguments = nlohmann::json::object();

            CallToolResult result = reg->call_tool(name, arguments, ctx);
            nlohmann::json j;
            to_json(j, result);
            return j;
        });
        router.require_capability("tools/call", "tools");

        // resources/list
        router.on_request("resources/list", [reg](const nlohmann::json& params, RequestContext&) -> HandlerResult {
            return page_to_json("resources", reg->list_resources(cursor_of(params)));
        });
        router.require_capability("resources/list", "resources");

        // resources/templates/list
        router.on_request("resources/templates/list", [reg](const nlohmann::json& params, RequestContext&) -> HandlerResult {
            return page_to_json("resourceTemplates", reg->list_resource_templates(cursor_of(params)));
        });
        router.require_capability("resources/templates/list", "resources");

        // resources/read
        router.on_request("resources/read", [reg](const nlohmann::json& params, RequestContext& ctx) -> HandlerResult {
            std::string uri = params.at("uri").get<std::string>();
            auto contents = reg->read_resource(uri, ctx);
            return nlohmann::json{{"contents", contents}};
        });
        router.require_capability("resources/read", "resources");

        // prompts/list
        router.on_request("prompts/list", [reg](const nlohmann::json& params, RequestContext&) -> HandlerResult {
            return page_to_json("prompts", reg->list_prompts(cursor_of(params)));
        });
        router.require_capability("prompts/list", "prompts");

        // prompts/get
        router.on_request("prompts/get", [reg](const nlohmann::json& params, RequestContext& ctx) -> HandlerResult {
            std::string name = params.at("name").get<std::string>();
            nlohmann::json arguments = params.value("arguments", nlohmann::json::object());
            auto result = reg->get_prompt(name, arguments, ctx);
            nlohmann::json j;
            to_json(j, result);
            return j;
        });
        router.require_capability("prompts/get", "prompts");

        // logging/setLevel
        router.on_request("logging/setLevel", [this](const nlohmann::json& params, RequestContext&) -> HandlerResult {
            LogLevel level;
            try {
                from_json(params.at("level"), level);
            } catch (const std::invalid_argument& e) {
                return JsonRpcError{error::InvalidParams, e.what(), std::nullopt};
            }
            std::lock_guard<std::mutex> lock(io_mutex);
            if (dispatcher) dispatcher->set_min_log_level(level);
            return nlohmann::json::object();
        });
        router.require_capability("logging/setLevel", "logging");

        // Notifications run on the reader thread, while serve() holds the dispatcher.

        auto on_initialized = [this](const nlohmann::json&) {
            if (!session.confirm()) {
                logging::logger()->warn("Ignoring initialized notification in state {}",
                             to_string(session.state()));
            }
        };
        router.on_notification("notifications/initialized", on_initialized);
        router.on_notification("initialized", on_initialized);

        router.on_notification("notifications/cancelled", [this](const nlohmann::json& params) {
            cancel_from(params, "requestId");
        });
        router.on_notification("$/cancelRequest", [this](const nlohmann::json& params) {
            cancel_from(params, "id");
        });

        auto on_exit = [this](const nlohmann::json&) {
            begin_shutdown(std::nullopt);
        };
        router.on_notification("exit", on_exit);
        router.on_notification("notifications/exit", on_exit);
    }

    void cancel_from(const nlohmann::json& params, const char* key) {
        RequestId id;
        try {
            from_json(params.at(key), id);
        } catch (const std::exception& e) {
            logging::logger()->warn("Ignoring cancel notification without a valid '{}': {}", key, e.what());
            return;
        }
        std::string reason;
        if (params.contains("reason") && params.at("reason").is_string()) {
            reason = params.at("reason").get<std::string>();
        }
        if (dispatcher && !dispatcher->cancel(id, reason)) {
            logging::logger()->debug("Cancel for unknown or completed request {}", to_string(id));
        }
    }

    void on_frame(const std::string& frame) {
        JsonRpcMessage msg;
        try {
            msg = Codec::parse(frame);
        } catch (const ParseError& e) {
            logging::logger()->warn("Rejecting frame: {}", e.what());
            dispatcher->reject(e.id, JsonRpcError{e.code, e.what(), std::nullopt});
            return;
        }

        if (auto* req = std::get_if<JsonRpcRequest>(&msg)) {
            on_request(*req);
        } else if (auto* notif = std::get_if<JsonRpcNotification>(&msg)) {
            if (!router.notify(*notif)) {
                logging::logger()->debug("Ignoring notification {}", notif->method);
            }
        } else if (auto* resp = std::get_if<JsonRpcResponse>(&msg)) {
            // The server issues no requests of its own.
            logging::logger()->debug("Ignoring response for id {}",
                          resp->id ? to_string(*resp->id) : std::string("null"));
        }
    }

    void on_request(const JsonRpcRequest& req) {
        if (session.is_shutting_down()) {
            dispatcher->reject(req.id, JsonRpcError{error::ShuttingDown, "Server is shutting down", std::nullopt});
            return;
        }
        if (req.method == "initialize") {
            handle_initialize(req);
            return;
        }
        if (!session.is_ready()) {
            dispatcher->reject(req.id, JsonRpcError{error::ServerNotInitialized,
                                                    "Server not initialized", std::nullopt});
            return;
        }
        if (req.method == "shutdown") {
            logging::logger()->info("Shutdown requested");
            begin_shutdown(req.id);
            return;
        }
        dispatcher->submit(req);
    }

    void handle_initialize(const JsonRpcRequest& req) {
        try {
            ServerCapabilities caps = build_capabilities();
            InitializeResult result = session.negotiate(
                req.params ? *req.params : nlohmann::json::object(),
                caps, opts.server_info, opts.instructions);
            router.set_capabilities(result.capabilities);

            nlohmann::json j;
            to_json(j, result);
            writer->enqueue(JsonRpcResponse::success(req.id, std::move(j)));
        } catch (const ProtocolError& e) {
            dispatcher->reject(req.id, e.to_error());
        }
    }

    // Start the drain once. A shutdown request gets its Response after the
    // drain; then the read loop is stopped.
    void begin_shutdown(std::optional<RequestId> reply_to) {
        std::lock_guard<std::mutex> io_lock(io_mutex);
        std::lock_guard<std::mutex> lock(drainer_mutex);
        if (drain_started || !dispatcher) return;
        drain_started = true;

        session.advance(SessionState::Draining);
        dispatcher->begin_drain();

        drainer = std::thread([this, reply_to, d = dispatcher, w = writer, t = transport] {
            bool clean = d->drain(opts.drain_timeout);
            logging::logger()->info("Drain finished{}", clean ? "" : " after force-cancelling stragglers");
            if (reply_to) {
                w->enqueue(JsonRpcResponse::success(*reply_to, nlohmann::json::object()));
            }
            t->shutdown();
        });
    }

    void join_drainer() {
        std::lock_guard<std::mutex> lock(drainer_mutex);
        if (drainer.joinable()) drainer.join();
    }

    void notify_list_changed(const char* capability, const char* method) {
        if (!session.is_ready() || !session.server_capabilities().has(capability)) return;
        std::lock_guard<std::mutex> lock(io_mutex);
        if (writer) writer->enqueue(JsonRpcNotification{method, std::nullopt});
    }
};

// ----------- Server -----------

Server::Server() : Server(Options{}) {}

Server::Server(Options opts)
    : impl_(std::make_unique<Impl>(std::move(opts))) {
    impl_->setup_handlers();
}

Server::~Server() {
    if (impl_) {
        impl_->join_drainer();
    }
}

void Server::add_tool(ToolDefinition def, ToolHandler handler) {
    impl_->registry->register_tool(std::move(def), std::move(handler));
    impl_->notify_list_changed("tools", "notifications/tools/list_changed");
}

void Server::add_resource(ResourceDefinition def, ResourceReadHandler handler) {
    impl_->registry->register_resource(std::move(def), std::move(handler));
    impl_->notify_list_changed("resources", "notifications/resources/list_changed");
}

void Server::add_resource_template(ResourceTemplate tmpl, ResourceReadHandler handler) {
    impl_->registry->register_resource_template(std::move(tmpl), std::move(handler));
    impl_->notify_list_changed("resources", "notifications/resources/list_changed");
}

void Server::add_prompt(PromptDefinition def, PromptGetHandler handler) {
    impl_->registry->register_prompt(std::move(def), std::move(handler));
    impl_->notify_list_changed("prompts", "notifications/prompts/list_changed");
}

void Server::log(LogLevel level, const std::string& logger, const nlohmann::json& data) {
    if (!impl_->session.is_ready()) return;
    std::lock_guard<std::mutex> lock(impl_->io_mutex);
    if (!impl_->writer || !impl_->dispatcher) return;
    if (level < impl_->dispatcher->min_log_level()) return;

    nlohmann::json params = {
        {"level", level},
        {"logger", logger},
        {"data", data}
    };
    impl_->writer->enqueue(JsonRpcNotification{"notifications/message", std::move(params)});
}

int Server::serve(std::unique_ptr<ITransport> transport) {
    if (!transport) throw Error("Server::serve() requires a transport");
    if (impl_->served.exchange(true)) {
        throw Error("Server::serve() may only be called once per Server");
    }

    OutboundWriter writer(*transport);
    Dispatcher dispatcher(impl_->router, writer, impl_->opts.max_in_flight);
    {
        std::lock_guard<std::mutex> lock(impl_->io_mutex);
        impl_->transport = transport.get();
        impl_->writer = &writer;
        impl_->dispatcher = &dispatcher;
    }

    writer.start([this](const TransportError& e) {
        logging::logger()->error("Outbound stream failed: {}", e.what());
        impl_->fatal = true;
        std::lock_guard<std::mutex> lock(impl_->io_mutex);
        if (impl_->transport) impl_->transport->shutdown();
    });

    logging::logger()->info("Serving {} {}", impl_->opts.server_info.name, impl_->opts.server_info.version);
    try {
        transport->start([this](std::string frame) { impl_->on_frame(frame); });
    } catch (const TransportError& e) {
        logging::logger()->critical("Transport failure: {}", e.what());
        impl_->fatal = true;
    }

    int status = 0;
    if (impl_->fatal) {
        impl_->session.advance(SessionState::Closed);
        dispatcher.abandon();
        writer.abort();
        impl_->join_drainer();
        status = 1;
    } else {
        // EOF or exit: the same drain as shutdown, minus the Response.
        impl_->begin_shutdown(std::nullopt);
        impl_->join_drainer();
        impl_->session.advance(SessionState::Closed);
        writer.close();
        status = writer.failed() ? 1 : 0;
    }

    {
        std::lock_guard<std::mutex> lock(impl_->io_mutex);
        impl_->transport = nullptr;
        impl_->writer = nullptr;
        impl_->dispatcher = nullptr;
    }
    logging::logger()->info("Session closed with status {}", status);
    return status;
}

int Server::serve_stdio() {
    // A vanished client must surface as a write error, not kill the process.
    std::signal(SIGPIPE, SIG_IGN);
    StreamTransport::Options topts;
    topts.framing = impl_->opts.framing;
    topts.max_frame_bytes = impl_->opts.max_frame_bytes;
    return serve(std::make_unique<StreamTransport>(topts));
}

void Server::shutdown() {
    impl_->begin_shutdown(std::nullopt);
}

SessionState Server::state() const {
    return impl_->session.state();
}

const Registry& Server::registry() const {
    return *impl_->registry;
}

const Server::Options& Server::options() const {
    return impl_->opts;
}

} // namespace toolwire
