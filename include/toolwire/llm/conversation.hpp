#pragma once
#include "toolwire/tools/tool.hpp"
#include "toolwire/types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace toolwire::llm
{

enum class Role
{
    System,
    User,
    Assistant,
    Tool
};

const char* to_string(Role role);
/// @throws ValidationError for unknown role names
Role role_from_string(const std::string& s);

/// A tool invocation requested by the model.
struct ToolRequest
{
    std::string id;
    std::string name;
    Json arguments = Json::object();
};

/// One conversation entry. Conversations are only ever appended to.
struct Message
{
    Role role{Role::User};
    std::optional<std::string> text;
    /// Assistant messages: tools the model asked for, in its order.
    std::vector<ToolRequest> tool_calls;
    /// Tool messages: id of the request this result answers.
    std::optional<std::string> tool_result_for;
    /// Tool messages: name of the tool that produced the result.
    std::optional<std::string> tool_name;
    bool is_error{false};

    static Message system(std::string text);
    static Message user(std::string text);
    static Message assistant(std::string text);
    static Message tool_request(std::optional<std::string> text, std::vector<ToolRequest> calls);
    /// Bridges a ToolResult into the conversation (error text is prefixed).
    static Message tool_result(const tools::ToolResult& result);
};

using Conversation = std::vector<Message>;

/// What the completion service returned for one request.
struct Completion
{
    std::string text;
    std::vector<ToolRequest> tool_requests;

    bool has_tool_requests() const
    {
        return !tool_requests.empty();
    }
};

/// Black-box LLM completion service.
class CompletionModel
{
  public:
    virtual ~CompletionModel() = default;

    /// @param conversation full message history, oldest first
    /// @param tools bridged tool schema; an empty array disables tool use
    virtual Completion complete(const Conversation& conversation, const Json& tools) = 0;
};

void to_json(Json& j, const ToolRequest& r);
void from_json(const Json& j, ToolRequest& r);
void to_json(Json& j, const Message& m);

} // namespace toolwire::llm
