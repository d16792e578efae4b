#include "toolwire/llm/conversation.hpp"

#include "toolwire/exceptions.hpp"

namespace toolwire::llm
{

const char* to_string(Role role)
{
    switch (role)
    {
    case Role::System:
        return "system";
    case Role::User:
        return "user";
    case Role::Assistant:
        return "assistant";
    case Role::Tool:
        return "tool";
    }
    return "user";
}

Role role_from_string(const std::string& s)
{
    if (s == "system")
        return Role::System;
    if (s == "user")
        return Role::User;
    if (s == "assistant")
        return Role::Assistant;
    if (s == "tool")
        return Role::Tool;
    throw ValidationError("unknown role: " + s);
}

Message Message::system(std::string text)
{
    Message m;
    m.role = Role::System;
    m.text = std::move(text);
    return m;
}

Message Message::user(std::string text)
{
    Message m;
    m.role = Role::User;
    m.text = std::move(text);
    return m;
}

Message Message::assistant(std::string text)
{
    Message m;
    m.role = Role::Assistant;
    m.text = std::move(text);
    return m;
}

Message Message::tool_request(std::optional<std::string> text, std::vector<ToolRequest> calls)
{
    Message m;
    m.role = Role::Assistant;
    if (text && !text->empty())
        m.text = std::move(text);
    m.tool_calls = std::move(calls);
    return m;
}

Message Message::tool_result(const tools::ToolResult& result)
{
    Message m;
    m.role = Role::Tool;
    m.text = result.to_llm_text();
    m.tool_result_for = result.correlation_id;
    m.tool_name = result.tool_name;
    m.is_error = result.is_error;
    return m;
}

void to_json(Json& j, const ToolRequest& r)
{
    j = Json{{"id", r.id}, {"name", r.name}, {"arguments", r.arguments}};
}

void from_json(const Json& j, ToolRequest& r)
{
    r.id = string_or(j, "id");
    r.name = j.at("name").get<std::string>();
    r.arguments = j.contains("arguments") && j["arguments"].is_object() ? j["arguments"]
                                                                        : Json::object();
}

// Neutral debug form; providers get their shape from a dialect.
void to_json(Json& j, const Message& m)
{
    j = Json{{"role", to_string(m.role)}};
    if (m.text)
        j["text"] = *m.text;
    if (!m.tool_calls.empty())
        j["tool_calls"] = m.tool_calls;
    if (m.tool_result_for)
        j["tool_result_for"] = *m.tool_result_for;
    if (m.tool_name)
        j["tool_name"] = *m.tool_name;
    if (m.is_error)
        j["is_error"] = true;
}

} // namespace toolwire::llm
