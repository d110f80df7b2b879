#include "toolwire/registry.hpp"
#include "toolwire/error.hpp"
#include "toolwire/schema.hpp"
#include <algorithm>
#include <charconv>
#include <functional>
#include <stdexcept>

namespace toolwire {

namespace {

// Run an external handler, translating its failures. Our own exception types
// already carry a code and pass through unchanged.
template <typename Fn>
auto invoke_handler(Fn&& fn) -> decltype(fn()) {
    try {
        return fn();
    } catch (const CancelledError&) {
        throw;
    } catch (const ProtocolError&) {
        throw;
    } catch (const ApplicationError&) {
        throw;
    } catch (const std::exception& e) {
        throw ApplicationError(e.what());
    }
}

void check_schema_or_throw(const nlohmann::json& schema, const std::string& what) {
    try {
        schema::check_schema(schema);
    } catch (const std::invalid_argument& e) {
        throw RegistryError(what + ": " + e.what());
    }
}

} // anonymous namespace

// ---------- UriTemplate ----------

UriTemplate::UriTemplate(const std::string& pattern) : pattern_(pattern) {
    size_t pos = 0;
    while (pos < pattern.size()) {
        size_t open = pattern.find('{', pos);
        if (open == std::string::npos) {
            segments_.push_back({false, pattern.substr(pos)});
            break;
        }
        if (open > pos) {
            segments_.push_back({false, pattern.substr(pos, open - pos)});
        }
        size_t close = pattern.find('}', open);
        if (close == std::string::npos) {
            throw RegistryError("Unterminated variable in URI template: " + pattern);
        }
        std::string name = pattern.substr(open + 1, close - open - 1);
        if (name.empty() || name.find('{') != std::string::npos) {
            throw RegistryError("Invalid variable in URI template: " + pattern);
        }
        if (!segments_.empty() && segments_.back().is_variable) {
            throw RegistryError("Adjacent variables in URI template: " + pattern);
        }
        segments_.push_back({true, std::move(name)});
        pos = close + 1;
    }
}

std::optional<UriVariables> UriTemplate::match(const std::string& uri) const {
    UriVariables vars;

    // Backtracking over variable extents; variables never span '/'.
    // A (segment, position) pair that failed once fails again, so each is
    // explored at most once.
    const size_t width = uri.size() + 1;
    std::vector<bool> failed(segments_.size() * width, false);
    std::function<bool(size_t, size_t)> step = [&](size_t seg, size_t pos) -> bool {
        if (seg == segments_.size()) return pos == uri.size();
        if (failed[seg * width + pos]) return false;
        const auto& s = segments_[seg];
        if (!s.is_variable) {
            if (uri.compare(pos, s.text.size(), s.text) == 0
                && step(seg + 1, pos + s.text.size())) {
                return true;
            }
        } else {
            for (size_t end = pos + 1; end <= uri.size() && uri[end - 1] != '/'; ++end) {
                if (step(seg + 1, end)) {
                    vars[s.text] = uri.substr(pos, end - pos);
                    return true;
                }
            }
        }
        failed[seg * width + pos] = true;
        return false;
    };

    if (!step(0, 0)) return std::nullopt;
    return vars;
}

// ---------- Registry ----------

Registry::Registry(size_t page_size) : page_size_(page_size == 0 ? 1 : page_size) {}

void Registry::register_tool(ToolDefinition def, ToolHandler handler) {
    if (def.name.empty()) throw RegistryError("Tool name must not be empty");
    if (!handler) throw RegistryError("Tool '" + def.name + "' has no handler");
    check_schema_or_throw(def.input_schema, "Tool '" + def.name + "' inputSchema");
    if (def.output_schema) {
        check_schema_or_throw(*def.output_schema, "Tool '" + def.name + "' outputSchema");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (tool_index_.count(def.name)) {
        throw RegistryError("Tool already registered: " + def.name);
    }
    std::string name = def.name;
    auto entry = std::make_shared<const ToolEntry>(ToolEntry{std::move(def), std::move(handler)});
    tools_.push_back(entry);
    tool_index_.emplace(std::move(name), std::move(entry));
}

void Registry::register_resource(ResourceDefinition def, ResourceReadHandler handler) {
    if (def.uri.empty()) throw RegistryError("Resource URI must not be empty");
    if (!handler) throw RegistryError("Resource '" + def.uri + "' has no handler");

    std::lock_guard<std::mutex> lock(mutex_);
    if (resource_index_.count(def.uri)) {
        throw RegistryError("Resource already registered: " + def.uri);
    }
    std::string uri = def.uri;
    auto entry = std::make_shared<const ResourceEntry>(
        ResourceEntry{std::move(def), std::move(handler)});
    resources_.push_back(entry);
    resource_index_.emplace(std::move(uri), std::move(entry));
}

void Registry::register_resource_template(ResourceTemplate tmpl, ResourceReadHandler handler) {
    if (!handler) throw RegistryError("Resource template '" + tmpl.uri_template + "' has no handler");
    UriTemplate matcher(tmpl.uri_template);

    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& t : templates_) {
        if (t->def.uri_template == tmpl.uri_template) {
            throw RegistryError("Resource template already registered: " + tmpl.uri_template);
        }
    }
    templates_.push_back(std::make_shared<const TemplateEntry>(
        TemplateEntry{std::move(tmpl), std::move(matcher), std::move(handler)}));
}

void Registry::register_prompt(PromptDefinition def, PromptGetHandler handler) {
    if (def.name.empty()) throw RegistryError("Prompt name must not be empty");
    if (!handler) throw RegistryError("Prompt '" + def.name + "' has no handler");

    std::lock_guard<std::mutex> lock(mutex_);
    if (prompt_index_.count(def.name)) {
        throw RegistryError("Prompt already registered: " + def.name);
    }
    std::string name = def.name;
    auto entry = std::make_shared<const PromptEntry>(PromptEntry{std::move(def), std::move(handler)});
    prompts_.push_back(entry);
    prompt_index_.emplace(std::move(name), std::move(entry));
}

// ---------- Discovery ----------

template <typename Entry, typename Def>
Page<Def> Registry::page(const std::vector<std::shared_ptr<const Entry>>& entries,
                         const std::optional<std::string>& cursor) const {
    size_t start = 0;
    if (cursor) {
        const char* first = cursor->data();
        const char* last = first + cursor->size();
        auto [ptr, ec] = std::from_chars(first, last, start);
        if (cursor->empty() || ec != std::errc() || ptr != last) {
            throw ProtocolError(error::InvalidParams, "Invalid cursor: " + *cursor);
        }
    }

    Page<Def> result;
    if (start >= entries.size()) return result;
    size_t end = std::min(start + page_size_, entries.size());
    result.items.reserve(end - start);
    for (size_t i = start; i < end; ++i) {
        result.items.push_back(entries[i]->def);
    }
    if (end < entries.size()) result.next_cursor = std::to_string(end);
    return result;
}

Page<ToolDefinition> Registry::list_tools(const std::optional<std::string>& cursor) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return page<ToolEntry, ToolDefinition>(tools_, cursor);
}

Page<ResourceDefinition> Registry::list_resources(const std::optional<std::string>& cursor) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return page<ResourceEntry, ResourceDefinition>(resources_, cursor);
}

Page<ResourceTemplate> Registry::list_resource_templates(const std::optional<std::string>& cursor) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return page<TemplateEntry, ResourceTemplate>(templates_, cursor);
}

Page<PromptDefinition> Registry::list_prompts(const std::optional<std::string>& cursor) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return page<PromptEntry, PromptDefinition>(prompts_, cursor);
}

std::optional<ToolDefinition> Registry::find_tool(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tool_index_.find(name);
    if (it == tool_index_.end()) return std::nullopt;
    return it->second->def;
}

bool Registry::has_tools() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return !tools_.empty();
}

bool Registry::has_resources() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return !resources_.empty() || !templates_.empty();
}

bool Registry::has_prompts() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return !prompts_.empty();
}

// ---------- Invocation ----------

CallToolResult Registry::call_tool(const std::string& name, const nlohmann::json& arguments,
                                   RequestContext& ctx) const {
    std::shared_ptr<const ToolEntry> entry;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = tool_index_.find(name);
        if (it != tool_index_.end()) entry = it->second;
    }
    if (!entry) {
        throw ProtocolError(error::InvalidParams, "Unknown tool: " + name);
    }

    schema::validate(entry->def.input_schema, arguments);

    CallToolResult result = invoke_handler([&] { return entry->handler(arguments, ctx); });

    if (entry->def.output_schema && !result.is_error) {
        if (!result.structured_content) {
            throw ApplicationError("Tool '" + name + "' declares an outputSchema but returned no structuredContent");
        }
        auto errors = schema::collect_errors(*entry->def.output_schema, *result.structured_content);
        if (!errors.empty()) {
            throw ApplicationError("Tool '" + name + "' returned output that does not match its outputSchema",
                                   error::InternalError, nlohmann::json{{"errors", errors}});
        }
    }
    return result;
}

std::vector<ResourceContent> Registry::read_resource(const std::string& uri,
                                                     RequestContext& ctx) const {
    ResourceReadHandler handler;
    UriVariables vars;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = resource_index_.find(uri);
        if (it != resource_index_.end()) {
            handler = it->second->handler;
        } else {
            for (const auto& t : templates_) {
                if (auto m = t->matcher.match(uri)) {
                    handler = t->handler;
                    vars = std::move(*m);
                    break;
                }
            }
        }
    }
    if (!handler) {
        throw ProtocolError(error::ResourceNotFound, "Resource not found: " + uri,
                            nlohmann::json{{"uri", uri}});
    }
    return invoke_handler([&] { return handler(uri, vars, ctx); });
}

GetPromptResult Registry::get_prompt(const std::string& name, const nlohmann::json& arguments,
                                     RequestContext& ctx) const {
    std::shared_ptr<const PromptEntry> entry;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = prompt_index_.find(name);
        if (it != prompt_index_.end()) entry = it->second;
    }
    if (!entry) {
        throw ProtocolError(error::InvalidParams, "Unknown prompt: " + name);
    }

    if (!arguments.is_null() && !arguments.is_object()) {
        throw ProtocolError(error::InvalidParams, "Prompt arguments must be an object");
    }
    nlohmann::json args = arguments.is_null() ? nlohmann::json::object() : arguments;
    for (const auto& [key, value] : args.items()) {
        if (!value.is_string()) {
            throw ProtocolError(error::InvalidParams,
                                "Prompt argument '" + key + "' must be a string");
        }
    }
    for (const auto& arg : entry->def.arguments) {
        if (arg.required && !args.contains(arg.name)) {
            throw ProtocolError(error::InvalidParams,
                                "Missing required argument: " + arg.name);
        }
    }

    return invoke_handler([&] { return entry->handler(args, ctx); });
}

} // namespace toolwire
