#pragma once
#include "toolwire/content.hpp"
#include "toolwire/types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace toolwire::tools
{

/// Behavioral hints attached to a tool definition (all optional).
struct ToolAnnotations
{
    std::optional<std::string> title;
    std::optional<bool> read_only_hint;
    std::optional<bool> destructive_hint;
    std::optional<bool> idempotent_hint;
    std::optional<bool> open_world_hint;
    /// Keys not modelled above, passed through untouched.
    Json extra = Json::object();
};

/// Tool catalog entry as exchanged by tools/list.
struct ToolDefinition
{
    std::string name;
    std::string description;
    Json input_schema = default_input_schema();
    std::optional<std::string> title;
    std::optional<ToolAnnotations> annotations;

    static Json default_input_schema()
    {
        return Json{{"type", "object"}, {"properties", Json::object()}};
    }
};

/// A single tool invocation. The correlation id is not part of tools/call;
/// it links the call to the LLM's tool request id.
struct ToolCall
{
    std::string name;
    Json arguments = Json::object();
    std::optional<std::string> correlation_id;
};

/// Outcome of a tool invocation. `content` is never empty.
struct ToolResult
{
    std::vector<ContentBlock> content;
    bool is_error{false};
    std::string tool_name;
    std::optional<std::string> correlation_id;

    /// Text blocks (and embedded resource text) joined with newlines.
    std::string text() const
    {
        return flatten_text(content);
    }

    /// Text to feed back into a conversation; error results are prefixed.
    std::string to_llm_text() const
    {
        return is_error ? "Error: " + text() : text();
    }
};

/// Placeholder used when an executor or a peer produces no content.
inline constexpr const char* EMPTY_RESULT_TEXT = "(empty result)";

ToolResult make_error_result(const ToolCall& call, const std::string& message);

void to_json(Json& j, const ToolAnnotations& a);
void from_json(const Json& j, ToolAnnotations& a);
void to_json(Json& j, const ToolDefinition& t);
void from_json(const Json& j, ToolDefinition& t);

/// tools/call params: {name, arguments?}
Json to_call_params(const ToolCall& call);
/// tools/call result: {content, isError?}; isError is omitted when false.
Json to_call_result(const ToolResult& result);
/// Parse a tools/call result; an empty content array gets the placeholder.
ToolResult parse_call_result(const Json& j, const ToolCall& call);

} // namespace toolwire::tools
