#include "toolwire/tools/tool.hpp"

#include "toolwire/exceptions.hpp"

namespace toolwire::tools
{

namespace
{
void read_hint(const Json& j, const char* key, std::optional<bool>& out)
{
    auto it = j.find(key);
    if (it != j.end() && it->is_boolean())
        out = it->get<bool>();
}
} // namespace

ToolResult make_error_result(const ToolCall& call, const std::string& message)
{
    ToolResult result;
    result.content.push_back(make_text(message));
    result.is_error = true;
    result.tool_name = call.name;
    result.correlation_id = call.correlation_id;
    return result;
}

void to_json(Json& j, const ToolAnnotations& a)
{
    j = a.extra.is_object() ? a.extra : Json::object();
    if (a.title)
        j["title"] = *a.title;
    if (a.read_only_hint)
        j["readOnlyHint"] = *a.read_only_hint;
    if (a.destructive_hint)
        j["destructiveHint"] = *a.destructive_hint;
    if (a.idempotent_hint)
        j["idempotentHint"] = *a.idempotent_hint;
    if (a.open_world_hint)
        j["openWorldHint"] = *a.open_world_hint;
}

void from_json(const Json& j, ToolAnnotations& a)
{
    a = ToolAnnotations{};
    if (!j.is_object())
        return;
    for (auto it = j.begin(); it != j.end(); ++it)
    {
        const std::string& key = it.key();
        if (key == "title" && it->is_string())
            a.title = it->get<std::string>();
        else if (key != "readOnlyHint" && key != "destructiveHint" && key != "idempotentHint" &&
                 key != "openWorldHint")
            a.extra[key] = *it;
    }
    read_hint(j, "readOnlyHint", a.read_only_hint);
    read_hint(j, "destructiveHint", a.destructive_hint);
    read_hint(j, "idempotentHint", a.idempotent_hint);
    read_hint(j, "openWorldHint", a.open_world_hint);
}

void to_json(Json& j, const ToolDefinition& t)
{
    j = Json{{"name", t.name}, {"inputSchema", t.input_schema}};
    if (!t.description.empty())
        j["description"] = t.description;
    if (t.title)
        j["title"] = *t.title;
    if (t.annotations)
        j["annotations"] = *t.annotations;
}

void from_json(const Json& j, ToolDefinition& t)
{
    t.name = j.at("name").get<std::string>();
    if (t.name.empty())
        throw ValidationError("tool name must not be empty");
    t.description = j.contains("description") && j["description"].is_string()
                        ? j["description"].get<std::string>()
                        : std::string();
    if (j.contains("inputSchema") && j["inputSchema"].is_object())
        t.input_schema = j["inputSchema"];
    else
        t.input_schema = ToolDefinition::default_input_schema();
    if (j.contains("title") && j["title"].is_string())
        t.title = j["title"].get<std::string>();
    if (j.contains("annotations") && j["annotations"].is_object())
        t.annotations = j["annotations"].get<ToolAnnotations>();
}

Json to_call_params(const ToolCall& call)
{
    return Json{{"name", call.name},
                {"arguments", call.arguments.is_null() ? Json::object() : call.arguments}};
}

Json to_call_result(const ToolResult& result)
{
    Json j = {{"content", content_to_json(result.content)}};
    if (result.is_error)
        j["isError"] = true;
    return j;
}

ToolResult parse_call_result(const Json& j, const ToolCall& call)
{
    if (!j.is_object())
        throw ValidationError("tools/call result must be an object");

    ToolResult result;
    result.tool_name = call.name;
    result.correlation_id = call.correlation_id;
    if (j.contains("content"))
        result.content = content_from_json(j["content"]);
    if (result.content.empty())
        result.content.push_back(make_text(EMPTY_RESULT_TEXT));
    auto is_error = j.find("isError");
    result.is_error = is_error != j.end() && is_error->is_boolean() && is_error->get<bool>();
    return result;
}

} // namespace toolwire::tools
