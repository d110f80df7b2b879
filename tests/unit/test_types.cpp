#include <gtest/gtest.h>
#include "toolwire/types.hpp"
#include <nlohmann/json.hpp>

using namespace toolwire;

// ---- Content ----

TEST(TextContent, SerializeDeserialize) {
    TextContent tc{"Hello, world!"};

    nlohmann::json j;
    to_json(j, tc);
    EXPECT_EQ(j["type"], "text");
    EXPECT_EQ(j["text"], "Hello, world!");

    TextContent tc2;
    from_json(j, tc2);
    EXPECT_EQ(tc2, tc);
}

TEST(EmbeddedResource, TextResource) {
    EmbeddedResource er;
    er.uri = "file:///data/config.json";
    er.mime_type = "application/json";
    er.text = "{\"key\": \"value\"}";

    nlohmann::json j;
    to_json(j, er);
    EXPECT_EQ(j["type"], "resource");
    EXPECT_EQ(j["resource"]["uri"], er.uri);
    EXPECT_FALSE(j["resource"].contains("blob"));

    EmbeddedResource er2;
    from_json(j, er2);
    EXPECT_EQ(er2, er);
}

TEST(Content, VariantDispatchesOnType) {
    Content c;
    from_json(nlohmann::json{{"type", "image"}, {"data", "AA=="}, {"mimeType", "image/png"}}, c);
    ASSERT_TRUE(std::holds_alternative<ImageContent>(c));
    EXPECT_EQ(std::get<ImageContent>(c).mime_type, "image/png");
}

TEST(Content, UnknownType) {
    Content c;
    EXPECT_THROW(from_json(nlohmann::json{{"type", "unknown_type"}}, c), std::invalid_argument);
}

// ---- Tools ----

TEST(ToolDefinition, DefaultSchemaIsObject) {
    ToolDefinition td;
    td.name = "noop";
    nlohmann::json j;
    to_json(j, td);
    EXPECT_EQ(j["inputSchema"], (nlohmann::json{{"type", "object"}}));
    EXPECT_FALSE(j.contains("outputSchema"));
}

TEST(ToolDefinition, SerializeDeserialize) {
    ToolDefinition td;
    td.name = "get_weather";
    td.title = "Weather";
    td.description = "Get weather for a location";
    td.input_schema = {
        {"type", "object"},
        {"properties", {{"location", {{"type", "string"}}}}},
        {"required", {"location"}}
    };
    td.output_schema = nlohmann::json{{"type", "object"}};

    nlohmann::json j;
    to_json(j, td);
    EXPECT_EQ(j["name"], "get_weather");
    EXPECT_TRUE(j.contains("inputSchema"));
    EXPECT_TRUE(j.contains("outputSchema"));

    ToolDefinition td2;
    from_json(j, td2);
    EXPECT_EQ(td2, td);
}

TEST(CallToolResult, TextHelperAndFlags) {
    auto r = CallToolResult::text("done");
    r.structured_content = nlohmann::json{{"n", 1}};

    nlohmann::json j;
    to_json(j, r);
    EXPECT_EQ(j["content"][0]["text"], "done");
    EXPECT_EQ(j["structuredContent"]["n"], 1);
    EXPECT_FALSE(j.contains("isError"));

    r.is_error = true;
    to_json(j, r);
    EXPECT_EQ(j["isError"], true);
}

// ---- Resources and prompts ----

TEST(ResourceTemplate, UsesUriTemplateKey) {
    ResourceTemplate rt;
    rt.uri_template = "db://{schema}/tables/{table}";
    rt.name = "table";

    nlohmann::json j;
    to_json(j, rt);
    EXPECT_EQ(j["uriTemplate"], rt.uri_template);

    ResourceTemplate rt2;
    from_json(j, rt2);
    EXPECT_EQ(rt2, rt);
}

TEST(PromptDefinition, ArgumentsSerialize) {
    PromptDefinition pd;
    pd.name = "review";
    pd.arguments.push_back(PromptArgument{"code", std::string("Code to review"), true});

    nlohmann::json j;
    to_json(j, pd);
    EXPECT_EQ(j["arguments"][0]["name"], "code");
    EXPECT_EQ(j["arguments"][0]["required"], true);

    PromptDefinition pd2;
    from_json(j, pd2);
    EXPECT_EQ(pd2, pd);
}

TEST(GetPromptResult, MessagesCarryContent) {
    GetPromptResult r;
    r.messages.push_back(PromptMessage{"user", TextContent{"hi"}});

    nlohmann::json j;
    to_json(j, r);
    EXPECT_EQ(j["messages"][0]["role"], "user");
    EXPECT_EQ(j["messages"][0]["content"]["type"], "text");
}

// ---- Capabilities and handshake ----

TEST(ServerCapabilities, HasReportsAdvertised) {
    ServerCapabilities caps;
    caps.tools = nlohmann::json{{"listChanged", true}};
    EXPECT_TRUE(caps.has("tools"));
    EXPECT_FALSE(caps.has("prompts"));
    EXPECT_FALSE(caps.has("bogus"));

    nlohmann::json j;
    to_json(j, caps);
    EXPECT_TRUE(j.contains("tools"));
    EXPECT_FALSE(j.contains("prompts"));
}

TEST(InitializeRequest, ParsesOptionalFields) {
    InitializeRequest req;
    from_json(nlohmann::json{{"protocolVersion", "2025-03-26"},
                             {"clientInfo", {{"name", "c"}, {"version", "1"}}}}, req);
    EXPECT_EQ(req.protocol_version, "2025-03-26");
    EXPECT_TRUE(req.capabilities.is_object());
    ASSERT_TRUE(req.client_info.has_value());
    EXPECT_EQ(req.client_info->name, "c");
}

TEST(InitializeRequest, RejectsNonObjectCapabilities) {
    InitializeRequest req;
    EXPECT_THROW(from_json(nlohmann::json{{"protocolVersion", "x"}, {"capabilities", 3}}, req),
                 std::invalid_argument);
}

TEST(InitializeResult, SerializeDeserialize) {
    InitializeResult r;
    r.protocol_version = "2025-06-18";
    r.capabilities.logging = nlohmann::json::object();
    r.server_info = Implementation{"srv", std::nullopt, "1.0"};
    r.instructions = "be nice";

    nlohmann::json j;
    to_json(j, r);
    EXPECT_EQ(j["serverInfo"]["name"], "srv");

    InitializeResult r2;
    from_json(j, r2);
    EXPECT_EQ(r2, r);
}

// ---- LogLevel ----

TEST(LogLevel, StringRoundTripAndOrdering) {
    EXPECT_EQ(log_level_to_string(LogLevel::Warning), "warning");
    EXPECT_EQ(log_level_from_string("emergency"), LogLevel::Emergency);
    EXPECT_THROW(log_level_from_string("verbose"), std::invalid_argument);
    EXPECT_LT(LogLevel::Debug, LogLevel::Error);
}
