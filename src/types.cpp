#include "toolwire/types.hpp"
#include <stdexcept>

namespace toolwire {

namespace {

template <typename T>
void set_optional(const nlohmann::json& j, const char* key, std::optional<T>& out) {
    if (j.contains(key) && !j.at(key).is_null()) out = j.at(key).get<T>();
}

} // anonymous namespace

// ---------- Content ----------

void to_json(nlohmann::json& j, const TextContent& t) {
    j = {{"type", "text"}, {"text", t.text}};
}

void from_json(const nlohmann::json& j, TextContent& t) {
    t.text = j.at("text").get<std::string>();
}

void to_json(nlohmann::json& j, const ImageContent& t) {
    j = {{"type", "image"}, {"data", t.data}, {"mimeType", t.mime_type}};
}

void from_json(const nlohmann::json& j, ImageContent& t) {
    t.data = j.at("data").get<std::string>();
    t.mime_type = j.at("mimeType").get<std::string>();
}

void to_json(nlohmann::json& j, const EmbeddedResource& t) {
    nlohmann::json resource = {{"uri", t.uri}};
    if (t.mime_type) resource["mimeType"] = *t.mime_type;
    if (t.text) resource["text"] = *t.text;
    if (t.blob) resource["blob"] = *t.blob;
    j = {{"type", "resource"}, {"resource", resource}};
}

void from_json(const nlohmann::json& j, EmbeddedResource& t) {
    const auto& r = j.at("resource");
    t.uri = r.at("uri").get<std::string>();
    set_optional(r, "mimeType", t.mime_type);
    set_optional(r, "text", t.text);
    set_optional(r, "blob", t.blob);
}

void to_json(nlohmann::json& j, const Content& c) {
    std::visit([&j](const auto& v) { to_json(j, v); }, c);
}

void from_json(const nlohmann::json& j, Content& c) {
    const std::string type = j.at("type").get<std::string>();
    if (type == "text") {
        c = j.get<TextContent>();
    } else if (type == "image") {
        c = j.get<ImageContent>();
    } else if (type == "resource") {
        c = j.get<EmbeddedResource>();
    } else {
        throw std::invalid_argument("Unknown content type: " + type);
    }
}

// ---------- Tool ----------

void to_json(nlohmann::json& j, const ToolDefinition& t) {
    j = {{"name", t.name}, {"inputSchema", t.input_schema}};
    if (t.title) j["title"] = *t.title;
    if (t.description) j["description"] = *t.description;
    if (t.output_schema) j["outputSchema"] = *t.output_schema;
    if (t.annotations) j["annotations"] = *t.annotations;
}

void from_json(const nlohmann::json& j, ToolDefinition& t) {
    t.name = j.at("name").get<std::string>();
    t.input_schema = j.at("inputSchema");
    set_optional(j, "title", t.title);
    set_optional(j, "description", t.description);
    if (j.contains("outputSchema")) t.output_schema = j.at("outputSchema");
    if (j.contains("annotations")) t.annotations = j.at("annotations");
}

void to_json(nlohmann::json& j, const CallToolResult& t) {
    j = nlohmann::json::object();
    j["content"] = nlohmann::json::array();
    for (const auto& c : t.content) {
        nlohmann::json cj;
        to_json(cj, c);
        j["content"].push_back(std::move(cj));
    }
    if (t.structured_content) j["structuredContent"] = *t.structured_content;
    if (t.is_error) j["isError"] = true;
}

void from_json(const nlohmann::json& j, CallToolResult& t) {
    t.content.clear();
    if (j.contains("content")) {
        for (const auto& cj : j.at("content")) {
            Content c;
            from_json(cj, c);
            t.content.push_back(std::move(c));
        }
    }
    if (j.contains("structuredContent")) t.structured_content = j.at("structuredContent");
    t.is_error = j.value("isError", false);
}

// ---------- Resource ----------

void to_json(nlohmann::json& j, const ResourceDefinition& t) {
    j = {{"uri", t.uri}, {"name", t.name}};
    if (t.title) j["title"] = *t.title;
    if (t.description) j["description"] = *t.description;
    if (t.mime_type) j["mimeType"] = *t.mime_type;
}

void from_json(const nlohmann::json& j, ResourceDefinition& t) {
    t.uri = j.at("uri").get<std::string>();
    t.name = j.at("name").get<std::string>();
    set_optional(j, "title", t.title);
    set_optional(j, "description", t.description);
    set_optional(j, "mimeType", t.mime_type);
}

void to_json(nlohmann::json& j, const ResourceTemplate& t) {
    j = {{"uriTemplate", t.uri_template}, {"name", t.name}};
    if (t.title) j["title"] = *t.title;
    if (t.description) j["description"] = *t.description;
    if (t.mime_type) j["mimeType"] = *t.mime_type;
}

void from_json(const nlohmann::json& j, ResourceTemplate& t) {
    t.uri_template = j.at("uriTemplate").get<std::string>();
    t.name = j.at("name").get<std::string>();
    set_optional(j, "title", t.title);
    set_optional(j, "description", t.description);
    set_optional(j, "mimeType", t.mime_type);
}

void to_json(nlohmann::json& j, const ResourceContent& t) {
    j = {{"uri", t.uri}};
    if (t.mime_type) j["mimeType"] = *t.mime_type;
    if (t.text) j["text"] = *t.text;
    if (t.blob) j["blob"] = *t.blob;
}

void from_json(const nlohmann::json& j, ResourceContent& t) {
    t.uri = j.at("uri").get<std::string>();
    set_optional(j, "mimeType", t.mime_type);
    set_optional(j, "text", t.text);
    set_optional(j, "blob", t.blob);
}

// ---------- Prompt ----------

void to_json(nlohmann::json& j, const PromptArgument& t) {
    j = {{"name", t.name}, {"required", t.required}};
    if (t.description) j["description"] = *t.description;
}

void from_json(const nlohmann::json& j, PromptArgument& t) {
    t.name = j.at("name").get<std::string>();
    set_optional(j, "description", t.description);
    t.required = j.value("required", false);
}

void to_json(nlohmann::json& j, const PromptDefinition& t) {
    j = {{"name", t.name}, {"arguments", t.arguments}};
    if (t.title) j["title"] = *t.title;
    if (t.description) j["description"] = *t.description;
}

void from_json(const nlohmann::json& j, PromptDefinition& t) {
    t.name = j.at("name").get<std::string>();
    set_optional(j, "title", t.title);
    set_optional(j, "description", t.description);
    if (j.contains("arguments")) t.arguments = j.at("arguments").get<std::vector<PromptArgument>>();
}

void to_json(nlohmann::json& j, const PromptMessage& t) {
    nlohmann::json content;
    to_json(content, t.content);
    j = {{"role", t.role}, {"content", content}};
}

void from_json(const nlohmann::json& j, PromptMessage& t) {
    t.role = j.at("role").get<std::string>();
    from_json(j.at("content"), t.content);
}

void to_json(nlohmann::json& j, const GetPromptResult& t) {
    j = {{"messages", t.messages}};
    if (t.description) j["description"] = *t.description;
}

void from_json(const nlohmann::json& j, GetPromptResult& t) {
    set_optional(j, "description", t.description);
    t.messages = j.at("messages").get<std::vector<PromptMessage>>();
}

// ---------- Capabilities ----------

bool ServerCapabilities::has(const std::string& capability) const {
    if (capability == "tools") return tools.has_value();
    if (capability == "resources") return resources.has_value();
    if (capability == "prompts") return prompts.has_value();
    if (capability == "logging") return logging.has_value();
    if (capability == "experimental") return experimental.has_value();
    return false;
}

void to_json(nlohmann::json& j, const ServerCapabilities& t) {
    j = nlohmann::json::object();
    if (t.tools) j["tools"] = *t.tools;
    if (t.resources) j["resources"] = *t.resources;
    if (t.prompts) j["prompts"] = *t.prompts;
    if (t.logging) j["logging"] = *t.logging;
    if (t.experimental) j["experimental"] = *t.experimental;
}

void from_json(const nlohmann::json& j, ServerCapabilities& t) {
    if (j.contains("tools")) t.tools = j.at("tools");
    if (j.contains("resources")) t.resources = j.at("resources");
    if (j.contains("prompts")) t.prompts = j.at("prompts");
    if (j.contains("logging")) t.logging = j.at("logging");
    if (j.contains("experimental")) t.experimental = j.at("experimental");
}

void to_json(nlohmann::json& j, const ClientCapabilities& t) {
    j = nlohmann::json::object();
    if (t.roots) j["roots"] = *t.roots;
    if (t.sampling) j["sampling"] = *t.sampling;
    if (t.elicitation) j["elicitation"] = *t.elicitation;
    if (t.experimental) j["experimental"] = *t.experimental;
}

void from_json(const nlohmann::json& j, ClientCapabilities& t) {
    if (j.contains("roots")) t.roots = j.at("roots");
    if (j.contains("sampling")) t.sampling = j.at("sampling");
    if (j.contains("elicitation")) t.elicitation = j.at("elicitation");
    if (j.contains("experimental")) t.experimental = j.at("experimental");
}

void to_json(nlohmann::json& j, const Implementation& t) {
    j = {{"name", t.name}, {"version", t.version}};
    if (t.title) j["title"] = *t.title;
}

void from_json(const nlohmann::json& j, Implementation& t) {
    t.name = j.at("name").get<std::string>();
    t.version = j.at("version").get<std::string>();
    set_optional(j, "title", t.title);
}

void from_json(const nlohmann::json& j, InitializeRequest& t) {
    t.protocol_version = j.at("protocolVersion").get<std::string>();
    if (j.contains("capabilities")) {
        if (!j.at("capabilities").is_object()) {
            throw std::invalid_argument("capabilities must be an object");
        }
        t.capabilities = j.at("capabilities");
    }
    if (j.contains("clientInfo")) t.client_info = j.at("clientInfo").get<Implementation>();
}

void to_json(nlohmann::json& j, const InitializeResult& t) {
    j = {
        {"protocolVersion", t.protocol_version},
        {"capabilities", t.capabilities},
        {"serverInfo", t.server_info}
    };
    if (t.instructions) j["instructions"] = *t.instructions;
}

void from_json(const nlohmann::json& j, InitializeResult& t) {
    t.protocol_version = j.at("protocolVersion").get<std::string>();
    t.capabilities = j.at("capabilities").get<ServerCapabilities>();
    t.server_info = j.at("serverInfo").get<Implementation>();
    set_optional(j, "instructions", t.instructions);
}

// ---------- LogLevel ----------

std::string log_level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::Debug:     return "debug";
        case LogLevel::Info:      return "info";
        case LogLevel::Notice:    return "notice";
        case LogLevel::Warning:   return "warning";
        case LogLevel::Error:     return "error";
        case LogLevel::Critical:  return "critical";
        case LogLevel::Alert:     return "alert";
        case LogLevel::Emergency: return "emergency";
    }
    return "info";
}

LogLevel log_level_from_string(const std::string& s) {
    if (s == "debug")     return LogLevel::Debug;
    if (s == "info")      return LogLevel::Info;
    if (s == "notice")    return LogLevel::Notice;
    if (s == "warning")   return LogLevel::Warning;
    if (s == "error")     return LogLevel::Error;
    if (s == "critical")  return LogLevel::Critical;
    if (s == "alert")     return LogLevel::Alert;
    if (s == "emergency") return LogLevel::Emergency;
    throw std::invalid_argument("Unknown log level: " + s);
}

void to_json(nlohmann::json& j, LogLevel level) {
    j = log_level_to_string(level);
}

void from_json(const nlohmann::json& j, LogLevel& level) {
    level = log_level_from_string(j.get<std::string>());
}

} // namespace toolwire
