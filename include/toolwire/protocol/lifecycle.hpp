#pragma once
#include "toolwire/types.hpp"
#include "toolwire/version.hpp"

#include <optional>
#include <string>

namespace toolwire::protocol
{

struct ClientCapabilities
{
    std::optional<Json> roots;
    std::optional<Json> sampling;
    std::optional<Json> experimental;
};

struct ServerCapabilities
{
    std::optional<Json> tools;
    std::optional<Json> resources;
    std::optional<Json> prompts;
    std::optional<Json> logging;
    std::optional<Json> experimental;
};

/// Params of the initialize request (client -> server).
struct InitializeParams
{
    std::string protocol_version{PROTOCOL_VERSION};
    ClientCapabilities capabilities;
    Implementation client_info{"toolwire", VERSION_STRING};
};

/// Result of the initialize request (server -> client).
struct InitializeResult
{
    std::string protocol_version{PROTOCOL_VERSION};
    ServerCapabilities capabilities;
    Implementation server_info{"toolwire-server", VERSION_STRING};
    std::optional<std::string> instructions;
};

/// Params of notifications/cancelled.
struct CancelledParams
{
    Json request_id;
    std::optional<std::string> reason;
};

void to_json(Json& j, const ClientCapabilities& c);
void from_json(const Json& j, ClientCapabilities& c);
void to_json(Json& j, const ServerCapabilities& c);
void from_json(const Json& j, ServerCapabilities& c);
void to_json(Json& j, const InitializeParams& p);
void from_json(const Json& j, InitializeParams& p);
void to_json(Json& j, const InitializeResult& r);
void from_json(const Json& j, InitializeResult& r);
void to_json(Json& j, const CancelledParams& p);
void from_json(const Json& j, CancelledParams& p);

} // namespace toolwire::protocol
