#include "toolwire/protocol/lifecycle.hpp"

namespace toolwire::protocol
{

namespace
{
void put_optional(Json& j, const char* key, const std::optional<Json>& value)
{
    if (value)
        j[key] = *value;
}

std::optional<Json> get_optional(const Json& j, const char* key)
{
    auto it = j.find(key);
    if (it == j.end() || it->is_null())
        return std::nullopt;
    return *it;
}
} // namespace

void to_json(Json& j, const ClientCapabilities& c)
{
    j = Json::object();
    put_optional(j, "roots", c.roots);
    put_optional(j, "sampling", c.sampling);
    put_optional(j, "experimental", c.experimental);
}

void from_json(const Json& j, ClientCapabilities& c)
{
    c.roots = get_optional(j, "roots");
    c.sampling = get_optional(j, "sampling");
    c.experimental = get_optional(j, "experimental");
}

void to_json(Json& j, const ServerCapabilities& c)
{
    j = Json::object();
    put_optional(j, "tools", c.tools);
    put_optional(j, "resources", c.resources);
    put_optional(j, "prompts", c.prompts);
    put_optional(j, "logging", c.logging);
    put_optional(j, "experimental", c.experimental);
}

void from_json(const Json& j, ServerCapabilities& c)
{
    c.tools = get_optional(j, "tools");
    c.resources = get_optional(j, "resources");
    c.prompts = get_optional(j, "prompts");
    c.logging = get_optional(j, "logging");
    c.experimental = get_optional(j, "experimental");
}

void to_json(Json& j, const InitializeParams& p)
{
    j = Json{{"protocolVersion", p.protocol_version},
             {"capabilities", p.capabilities},
             {"clientInfo", p.client_info}};
}

void from_json(const Json& j, InitializeParams& p)
{
    p.protocol_version = string_or(j, "protocolVersion");
    if (j.contains("capabilities") && j["capabilities"].is_object())
        p.capabilities = j["capabilities"].get<ClientCapabilities>();
    if (j.contains("clientInfo") && j["clientInfo"].is_object())
        p.client_info = j["clientInfo"].get<Implementation>();
}

void to_json(Json& j, const InitializeResult& r)
{
    j = Json{{"protocolVersion", r.protocol_version},
             {"capabilities", r.capabilities},
             {"serverInfo", r.server_info}};
    if (r.instructions)
        j["instructions"] = *r.instructions;
}

void from_json(const Json& j, InitializeResult& r)
{
    r.protocol_version = string_or(j, "protocolVersion");
    if (j.contains("capabilities") && j["capabilities"].is_object())
        r.capabilities = j["capabilities"].get<ServerCapabilities>();
    if (j.contains("serverInfo") && j["serverInfo"].is_object())
        r.server_info = j["serverInfo"].get<Implementation>();
    if (j.contains("instructions") && j["instructions"].is_string())
        r.instructions = j["instructions"].get<std::string>();
}

void to_json(Json& j, const CancelledParams& p)
{
    j = Json{{"requestId", p.request_id}};
    if (p.reason)
        j["reason"] = *p.reason;
}

void from_json(const Json& j, CancelledParams& p)
{
    auto id = j.find("requestId");
    p.request_id = id != j.end() ? *id : Json(nullptr);
    if (j.contains("reason") && j["reason"].is_string())
        p.reason = j["reason"].get<std::string>();
}

} // namespace toolwire::protocol
