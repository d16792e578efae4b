#include "toolwire/llm/dialect.hpp"

#include "toolwire/exceptions.hpp"

namespace toolwire::llm
{

namespace
{

Json object_schema(const Json& schema)
{
    Json out = schema.is_object() ? schema : Json::object();
    if (!out.contains("type"))
        out["type"] = "object";
    return out;
}

// OpenAI carries arguments as a JSON-encoded string; some compatible
// servers send an object instead.
Json parse_arguments(const Json& raw)
{
    if (raw.is_object())
        return raw;
    if (!raw.is_string())
        return Json::object();
    Json parsed = Json::parse(raw.get<std::string>(), nullptr, /*allow_exceptions=*/false);
    return parsed.is_object() ? parsed : Json::object();
}

bool has_tools(const Json& tools)
{
    return tools.is_array() && !tools.empty();
}

} // namespace

// =============================================================================
// OpenAI
// =============================================================================

Json OpenAiDialect::tool_spec(const tools::ToolDefinition& tool) const
{
    Json fn = {{"name", tool.name}, {"parameters", object_schema(tool.input_schema)}};
    if (!tool.description.empty())
        fn["description"] = tool.description;
    return Json{{"type", "function"}, {"function", std::move(fn)}};
}

Json OpenAiDialect::render_request(const Conversation& conversation, const Json& tools) const
{
    Json messages = Json::array();
    for (const auto& msg : conversation)
    {
        switch (msg.role)
        {
        case Role::Tool:
            messages.push_back(Json{{"role", "tool"},
                                    {"tool_call_id", msg.tool_result_for.value_or("")},
                                    {"content", msg.text.value_or("")}});
            break;
        case Role::Assistant:
        {
            Json out = {{"role", "assistant"}};
            if (msg.text)
                out["content"] = *msg.text;
            else
                out["content"] = nullptr;
            if (!msg.tool_calls.empty())
            {
                Json tool_calls = Json::array();
                for (const auto& call : msg.tool_calls)
                {
                    tool_calls.push_back(Json{
                        {"id", call.id},
                        {"type", "function"},
                        {"function", Json{{"name", call.name}, {"arguments", call.arguments.dump()}}},
                    });
                }
                out["tool_calls"] = std::move(tool_calls);
            }
            messages.push_back(std::move(out));
            break;
        }
        default:
            messages.push_back(Json{{"role", to_string(msg.role)}, {"content", msg.text.value_or("")}});
            break;
        }
    }

    Json body = {{"messages", std::move(messages)}};
    if (has_tools(tools))
        body["tools"] = tools;
    return body;
}

Completion OpenAiDialect::parse_completion(const Json& response) const
{
    if (!response.is_object() || !response.contains("choices") || !response["choices"].is_array() ||
        response["choices"].empty())
        throw ValidationError("OpenAI response missing choices");

    const auto& choice = response["choices"][0];
    if (!choice.is_object() || !choice.contains("message") || !choice["message"].is_object())
        throw ValidationError("OpenAI response missing message");

    const auto& msg = choice["message"];
    Completion completion;
    if (msg.contains("content") && msg["content"].is_string())
        completion.text = msg["content"].get<std::string>();

    if (msg.contains("tool_calls") && msg["tool_calls"].is_array())
    {
        for (const auto& tc : msg["tool_calls"])
        {
            if (!tc.is_object() || !tc.contains("function") || !tc["function"].is_object())
                continue;
            const auto& fn = tc["function"];
            std::string name = string_or(fn, "name");
            if (name.empty())
                continue;
            ToolRequest request;
            request.id = string_or(tc, "id");
            request.name = std::move(name);
            request.arguments = parse_arguments(fn.contains("arguments") ? fn["arguments"] : Json());
            completion.tool_requests.push_back(std::move(request));
        }
    }
    return completion;
}

// =============================================================================
// Anthropic
// =============================================================================

Json AnthropicDialect::tool_spec(const tools::ToolDefinition& tool) const
{
    Json out = {{"name", tool.name}, {"input_schema", object_schema(tool.input_schema)}};
    if (!tool.description.empty())
        out["description"] = tool.description;
    return out;
}

Json AnthropicDialect::render_request(const Conversation& conversation, const Json& tools) const
{
    std::string system;
    Json messages = Json::array();

    for (const auto& msg : conversation)
    {
        if (msg.role == Role::System)
        {
            if (!system.empty())
                system += "\n\n";
            system += msg.text.value_or("");
            continue;
        }

        if (msg.role == Role::Tool)
        {
            Json block = {{"type", "tool_result"},
                          {"tool_use_id", msg.tool_result_for.value_or("")},
                          {"content", msg.text.value_or("")}};
            if (msg.is_error)
                block["is_error"] = true;
            // Results answering one assistant turn share a single user message
            if (!messages.empty() && messages.back()["role"] == "user" &&
                messages.back()["content"].is_array() && !messages.back()["content"].empty() &&
                string_or(messages.back()["content"].back(), "type") == "tool_result")
            {
                messages.back()["content"].push_back(std::move(block));
            }
            else
            {
                messages.push_back(Json{{"role", "user"}, {"content", Json::array({block})}});
            }
            continue;
        }

        Json blocks = Json::array();
        if (msg.text && !msg.text->empty())
            blocks.push_back(Json{{"type", "text"}, {"text", *msg.text}});
        for (const auto& call : msg.tool_calls)
        {
            blocks.push_back(Json{{"type", "tool_use"},
                                  {"id", call.id},
                                  {"name", call.name},
                                  {"input", call.arguments}});
        }
        // An empty content list is rejected by the API; the turn carries nothing
        if (blocks.empty())
            continue;
        messages.push_back(Json{{"role", to_string(msg.role)}, {"content", std::move(blocks)}});
    }

    Json body = {{"messages", std::move(messages)}};
    if (!system.empty())
        body["system"] = system;
    if (has_tools(tools))
        body["tools"] = tools;
    return body;
}

Completion AnthropicDialect::parse_completion(const Json& response) const
{
    if (!response.is_object())
        throw ValidationError("Anthropic response not an object");
    if (!response.contains("content") || !response["content"].is_array())
        throw ValidationError("Anthropic response missing content");

    Completion completion;
    for (const auto& block : response["content"])
    {
        if (!block.is_object())
            continue;
        std::string type = string_or(block, "type");
        if (type == "text")
        {
            if (!completion.text.empty())
                completion.text += "\n";
            completion.text += string_or(block, "text");
        }
        else if (type == "tool_use")
        {
            ToolRequest request;
            request.id = string_or(block, "id");
            request.name = string_or(block, "name");
            if (request.name.empty())
                continue;
            request.arguments = block.contains("input") && block["input"].is_object()
                                    ? block["input"]
                                    : Json::object();
            completion.tool_requests.push_back(std::move(request));
        }
    }
    return completion;
}

std::unique_ptr<LlmDialect> make_dialect(const std::string& name)
{
    if (name == "openai")
        return std::make_unique<OpenAiDialect>();
    if (name == "anthropic")
        return std::make_unique<AnthropicDialect>();
    throw NotFoundError("unknown LLM dialect: " + name);
}

} // namespace toolwire::llm
