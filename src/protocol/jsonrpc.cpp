#include "toolwire/protocol/jsonrpc.hpp"

#include "toolwire/exceptions.hpp"

namespace toolwire::protocol
{

namespace
{
bool is_valid_id(const Json& id)
{
    return id.is_string() || id.is_number_integer();
}
} // namespace

void to_json(Json& j, const Request& r)
{
    j = Json{{"jsonrpc", JSONRPC_VERSION}, {"id", r.id}, {"method", r.method}};
    if (r.params)
        j["params"] = *r.params;
}

void to_json(Json& j, const Notification& n)
{
    j = Json{{"jsonrpc", JSONRPC_VERSION}, {"method", n.method}};
    if (n.params)
        j["params"] = *n.params;
}

void to_json(Json& j, const Response& r)
{
    j = Json{{"jsonrpc", JSONRPC_VERSION}, {"id", r.id}, {"result", r.result}};
}

void to_json(Json& j, const ErrorObject& e)
{
    j = Json{{"code", e.code}, {"message", e.message}};
    if (e.data)
        j["data"] = *e.data;
}

void to_json(Json& j, const ErrorResponse& r)
{
    j = Json{{"jsonrpc", JSONRPC_VERSION}, {"id", r.id}, {"error", r.error}};
}

bool is_notification(const Json& j)
{
    if (!j.is_object())
        return false;
    auto it = j.find("id");
    return it == j.end() || it->is_null();
}

Json recover_id(const Json& j)
{
    if (!j.is_object())
        return nullptr;
    auto it = j.find("id");
    if (it == j.end() || !is_valid_id(*it))
        return nullptr;
    return *it;
}

Message parse_message(const Json& j)
{
    if (!j.is_object())
        throw ValidationError("message must be a JSON object");

    auto version = j.find("jsonrpc");
    if (version == j.end() || !version->is_string() || version->get<std::string>() != "2.0")
        throw ValidationError("jsonrpc must be \"2.0\"");

    auto method = j.find("method");
    if (method != j.end())
    {
        if (!method->is_string())
            throw ValidationError("method must be a string");

        std::optional<Json> params;
        auto p = j.find("params");
        if (p != j.end() && !p->is_null())
            params = *p;

        if (is_notification(j))
            return Notification{method->get<std::string>(), std::move(params)};

        const Json& id = j.at("id");
        if (!is_valid_id(id))
            throw ValidationError("id must be a string or integer");
        return Request{method->get<std::string>(), std::move(params), id};
    }

    Json id = j.contains("id") ? j["id"] : Json(nullptr);
    if (!id.is_null() && !is_valid_id(id))
        throw ValidationError("id must be a string or integer");

    if (j.contains("result"))
        return Response{j["result"], id};

    if (j.contains("error"))
    {
        const Json& e = j["error"];
        if (!e.is_object() || !e.contains("code") || !e["code"].is_number_integer())
            throw ValidationError("error must be an object with an integer code");
        ErrorObject error;
        error.code = e["code"].get<int>();
        error.message = string_or(e, "message");
        if (e.contains("data"))
            error.data = e["data"];
        return ErrorResponse{std::move(error), id};
    }

    throw ValidationError("message has neither method, result nor error");
}

std::string error_code_name(int code)
{
    switch (code)
    {
    case PARSE_ERROR:
        return "Parse error";
    case INVALID_REQUEST:
        return "Invalid request";
    case METHOD_NOT_FOUND:
        return "Method not found";
    case INVALID_PARAMS:
        return "Invalid params";
    case INTERNAL_ERROR:
        return "Internal error";
    default:
        return "Error " + std::to_string(code);
    }
}

} // namespace toolwire::protocol
