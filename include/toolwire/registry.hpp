#pragma once
#include "types.hpp"
#include "request_context.hpp"
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace toolwire {

/// Handler signatures for external collaborators. A handler signals failure
/// by throwing: ApplicationError to control the code/data sent to the client,
/// CancelledError to acknowledge cancellation, anything else becomes an
/// InternalError.
using ToolHandler = std::function<CallToolResult(const nlohmann::json& arguments,
                                                 RequestContext& ctx)>;
using ResourceReadHandler = std::function<std::vector<ResourceContent>(
    const std::string& uri, const UriVariables& variables, RequestContext& ctx)>;
using PromptGetHandler = std::function<GetPromptResult(const nlohmann::json& arguments,
                                                       RequestContext& ctx)>;

template <typename T>
struct Page {
    std::vector<T> items;
    std::optional<std::string> next_cursor;
};

/// Matches URIs against an RFC 6570 level-1 template ("file://{dir}/{name}").
/// A variable matches one or more characters other than '/'.
class UriTemplate {
public:
    explicit UriTemplate(const std::string& pattern);

    [[nodiscard]] std::optional<UriVariables> match(const std::string& uri) const;
    [[nodiscard]] const std::string& pattern() const noexcept { return pattern_; }

private:
    struct Segment {
        bool is_variable;
        std::string text;  // literal text or variable name
    };

    std::string pattern_;
    std::vector<Segment> segments_;
};

/// Descriptors of every invocable capability, keyed by name (or URI).
///
/// Descriptors are immutable once registered and registration of a duplicate
/// key fails. All operations are safe to call from any thread; listings are
/// consistent snapshots.
class Registry {
public:
    explicit Registry(size_t page_size = 50);

    // ---- Registration ----
    void register_tool(ToolDefinition def, ToolHandler handler);
    void register_resource(ResourceDefinition def, ResourceReadHandler handler);
    void register_resource_template(ResourceTemplate tmpl, ResourceReadHandler handler);
    void register_prompt(PromptDefinition def, PromptGetHandler handler);

    // ---- Discovery ----
    [[nodiscard]] Page<ToolDefinition> list_tools(const std::optional<std::string>& cursor = std::nullopt) const;
    [[nodiscard]] Page<ResourceDefinition> list_resources(const std::optional<std::string>& cursor = std::nullopt) const;
    [[nodiscard]] Page<ResourceTemplate> list_resource_templates(const std::optional<std::string>& cursor = std::nullopt) const;
    [[nodiscard]] Page<PromptDefinition> list_prompts(const std::optional<std::string>& cursor = std::nullopt) const;

    [[nodiscard]] std::optional<ToolDefinition> find_tool(const std::string& name) const;
    [[nodiscard]] bool has_tools() const;
    [[nodiscard]] bool has_resources() const;
    [[nodiscard]] bool has_prompts() const;

    // ---- Invocation ----

    /// Validate `arguments` against the tool's input schema, then run it.
    /// Throws ProtocolError (InvalidParams) for an unknown tool, ValidationError
    /// for bad arguments (the handler is not called), ApplicationError for
    /// handler failures and CancelledError when the handler was cancelled.
    CallToolResult call_tool(const std::string& name, const nlohmann::json& arguments,
                             RequestContext& ctx) const;

    /// Throws ProtocolError (ResourceNotFound) when no resource or template matches.
    std::vector<ResourceContent> read_resource(const std::string& uri, RequestContext& ctx) const;

    /// Throws ProtocolError (InvalidParams) for an unknown prompt or bad arguments.
    GetPromptResult get_prompt(const std::string& name, const nlohmann::json& arguments,
                               RequestContext& ctx) const;

private:
    struct ToolEntry {
        ToolDefinition def;
        ToolHandler handler;
    };
    struct ResourceEntry {
        ResourceDefinition def;
        ResourceReadHandler handler;
    };
    struct TemplateEntry {
        ResourceTemplate def;
        UriTemplate matcher;
        ResourceReadHandler handler;
    };
    struct PromptEntry {
        PromptDefinition def;
        PromptGetHandler handler;
    };

    template <typename Entry, typename Def>
    Page<Def> page(const std::vector<std::shared_ptr<const Entry>>& entries,
                   const std::optional<std::string>& cursor) const;

    size_t page_size_;
    mutable std::mutex mutex_;
    std::vector<std::shared_ptr<const ToolEntry>> tools_;
    std::unordered_map<std::string, std::shared_ptr<const ToolEntry>> tool_index_;
    std::vector<std::shared_ptr<const ResourceEntry>> resources_;
    std::unordered_map<std::string, std::shared_ptr<const ResourceEntry>> resource_index_;
    std::vector<std::shared_ptr<const TemplateEntry>> templates_;
    std::vector<std::shared_ptr<const PromptEntry>> prompts_;
    std::unordered_map<std::string, std::shared_ptr<const PromptEntry>> prompt_index_;
};

} // namespace toolwire
