#pragma once
#include "toolwire/types.hpp"

#include <optional>
#include <string>
#include <variant>

namespace toolwire::protocol
{

// Standard JSON-RPC error codes
inline constexpr int PARSE_ERROR = -32700;
inline constexpr int INVALID_REQUEST = -32600;
inline constexpr int METHOD_NOT_FOUND = -32601;
inline constexpr int INVALID_PARAMS = -32602;
inline constexpr int INTERNAL_ERROR = -32603;

/// Request: carries a correlation id and expects exactly one response.
struct Request
{
    std::string method;
    std::optional<Json> params;
    Json id; // string or integer
};

/// Notification: no id, never answered.
struct Notification
{
    std::string method;
    std::optional<Json> params;
};

struct Response
{
    Json result;
    Json id;
};

struct ErrorObject
{
    int code{INTERNAL_ERROR};
    std::string message;
    std::optional<Json> data;
};

struct ErrorResponse
{
    ErrorObject error;
    Json id; // null when the request id could not be recovered
};

using Message = std::variant<Request, Notification, Response, ErrorResponse>;

void to_json(Json& j, const Request& r);
void to_json(Json& j, const Notification& n);
void to_json(Json& j, const Response& r);
void to_json(Json& j, const ErrorObject& e);
void to_json(Json& j, const ErrorResponse& r);

/// Classify a decoded JSON value as one of the four envelope kinds.
/// @throws ValidationError when the value is not a JSON-RPC 2.0 message
Message parse_message(const Json& j);

/// Best-effort id recovery from a possibly invalid message (null if none).
Json recover_id(const Json& j);

/// True when the value is an object without an id (absent or null).
bool is_notification(const Json& j);

inline Json make_response(const Json& id, Json result)
{
    return Response{std::move(result), id};
}

inline Json make_error(const Json& id, int code, const std::string& message)
{
    return ErrorResponse{ErrorObject{code, message, std::nullopt}, id};
}

std::string error_code_name(int code);

} // namespace toolwire::protocol
