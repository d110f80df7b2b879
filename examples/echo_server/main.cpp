/// Echo server - minimal toolwire server demonstrating tool registration.
/// Usage: ./echo_server
/// Communicates over stdio (newline-delimited JSON-RPC).

#include <toolwire/toolwire.hpp>

int main() {
    toolwire::logging::init("warn");

    toolwire::Server::Options opts;
    opts.server_info = {"echo-server", std::nullopt, "1.0.0"};
    opts.instructions = "A simple echo server that returns whatever you send it.";

    toolwire::Server server{std::move(opts)};

    // Register the echo tool
    toolwire::ToolDefinition echo_tool;
    echo_tool.name = "echo";
    echo_tool.description = "Echo the input text back to the caller";
    echo_tool.input_schema = {
        {"type", "object"},
        {"properties", {
            {"text", {{"type", "string"}, {"description", "The text to echo"}}}
        }},
        {"required", {"text"}}
    };

    server.add_tool(echo_tool, [](const nlohmann::json& args, toolwire::RequestContext&) {
        return toolwire::CallToolResult::text(args.at("text").get<std::string>());
    });

    // Serve over stdio - blocks until shutdown, exit or EOF
    return server.serve_stdio();
}
