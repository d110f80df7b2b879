/// Demo server exercising every toolwire feature.
/// Usage: ./demo_server [--config settings.json]
///
/// Settings come from the optional JSON file, overridden by TOOLWIRE_* environment
/// variables. Diagnostics go to stderr; stdout carries protocol frames only.

#include <toolwire/toolwire.hpp>
#include <chrono>
#include <cstring>
#include <iostream>

namespace {

toolwire::Settings load_settings(int argc, char** argv) {
    toolwire::Settings settings;
    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            settings = toolwire::Settings::from_file(argv[++i]);
        } else {
            throw toolwire::ConfigError(std::string("Unknown argument: ") + argv[i]);
        }
    }
    settings.merge(toolwire::Settings::from_env());
    return settings;
}

void register_tools(toolwire::Server& server) {
    toolwire::ToolDefinition echo;
    echo.name = "echo";
    echo.description = "Echo text back";
    echo.input_schema = {
        {"type", "object"},
        {"properties", {{"text", {{"type", "string"}}}}},
        {"required", {"text"}}
    };
    server.add_tool(echo, [](const nlohmann::json& args, toolwire::RequestContext&) {
        return toolwire::CallToolResult::text(args.at("text").get<std::string>());
    });

    // Long-running tool: reports progress and stops early when cancelled.
    toolwire::ToolDefinition sleep;
    sleep.name = "sleep";
    sleep.description = "Sleep for a number of steps of 100 ms";
    sleep.input_schema = {
        {"type", "object"},
        {"properties", {{"steps", {{"type", "integer"}, {"minimum", 1}, {"maximum", 600}}}}},
        {"required", {"steps"}}
    };
    sleep.output_schema = nlohmann::json{
        {"type", "object"},
        {"properties", {{"slept_ms", {{"type", "integer"}}}}},
        {"required", {"slept_ms"}}
    };
    server.add_tool(sleep, [](const nlohmann::json& args, toolwire::RequestContext& ctx) {
        int steps = args.at("steps").get<int>();
        for (int i = 1; i <= steps; ++i) {
            if (ctx.token().wait_for(std::chrono::milliseconds(100))) {
                throw toolwire::CancelledError();
            }
            ctx.report_progress(i, steps);
        }
        ctx.log(toolwire::LogLevel::Debug, "sleep", nlohmann::json{{"steps", steps}});
        auto result = toolwire::CallToolResult::text("Slept " + std::to_string(steps * 100) + " ms");
        result.structured_content = nlohmann::json{{"slept_ms", steps * 100}};
        return result;
    });
}

void register_resources(toolwire::Server& server) {
    toolwire::ResourceDefinition status;
    status.uri = "app://status";
    status.name = "status";
    status.mime_type = "application/json";
    server.add_resource(status, [&server](const std::string& uri, const toolwire::UriVariables&,
                                          toolwire::RequestContext&) {
        nlohmann::json body = {
            {"state", toolwire::to_string(server.state())},
            {"version", std::string(toolwire::LIBRARY_VERSION)}
        };
        return std::vector<toolwire::ResourceContent>{
            toolwire::ResourceContent{uri, std::string("application/json"), body.dump(), std::nullopt}};
    });

    toolwire::ResourceTemplate greeting;
    greeting.uri_template = "greeting://{name}";
    greeting.name = "greeting";
    greeting.mime_type = "text/plain";
    server.add_resource_template(greeting, [](const std::string& uri, const toolwire::UriVariables& vars,
                                              toolwire::RequestContext&) {
        return std::vector<toolwire::ResourceContent>{
            toolwire::ResourceContent{uri, std::string("text/plain"),
                                      "Hello, " + vars.at("name") + "!", std::nullopt}};
    });
}

void register_prompts(toolwire::Server& server) {
    toolwire::PromptDefinition summarize;
    summarize.name = "summarize";
    summarize.description = "Summarize a text";
    summarize.arguments = {{"text", std::string("Text to summarize"), true},
                           {"style", std::string("bullet or prose"), false}};
    server.add_prompt(summarize, [](const nlohmann::json& args, toolwire::RequestContext&) {
        toolwire::GetPromptResult result;
        std::string style = args.value("style", std::string("prose"));
        result.messages.push_back({"user", toolwire::TextContent{
            "Summarize as " + style + ":\n" + args.at("text").get<std::string>()}});
        return result;
    });
}

} // namespace

int main(int argc, char** argv) {
    toolwire::Server::Options opts;
    opts.server_info = {"toolwire-demo", std::string("toolwire demo server"),
                        std::string(toolwire::LIBRARY_VERSION)};
    opts.instructions = "Try tools/call with 'sleep' and cancel it.";

    try {
        auto settings = load_settings(argc, argv);
        toolwire::logging::init(settings.effective_log_level());
        settings.apply(opts);
    } catch (const toolwire::ConfigError& e) {
        std::cerr << "demo_server: " << e.what() << "\n";
        return 2;
    }

    toolwire::Server server{std::move(opts)};
    register_tools(server);
    register_resources(server);
    register_prompts(server);

    return server.serve_stdio();
}
