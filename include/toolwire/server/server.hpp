#pragma once
#include "toolwire/protocol/jsonrpc.hpp"
#include "toolwire/protocol/lifecycle.hpp"
#include "toolwire/settings.hpp"
#include "toolwire/tools/registry.hpp"
#include "toolwire/types.hpp"
#include "toolwire/util/log.hpp"

#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace toolwire::server
{

enum class SessionPhase
{
    NotInitialized,
    Initialized, ///< initialize answered, waiting for notifications/initialized
    Ready,
    Terminated
};

const char* to_string(SessionPhase phase);

/// Per-connection state. One server instance serves one session.
struct SessionState
{
    SessionPhase phase{SessionPhase::NotInitialized};
    std::optional<Implementation> client_info;
    protocol::ClientCapabilities client_capabilities;
    std::string protocol_version;
};

struct ServerOptions
{
    Implementation info{"toolwire-server", VERSION_STRING};
    std::optional<std::string> instructions;
    /// Deadline applied to every tools/call (0 = none).
    std::chrono::milliseconds tool_timeout{0};

    static ServerOptions from_settings(const Settings& settings);
};

/// MCP request dispatcher for one session over a tool registry.
///
/// Handles initialize, notifications/initialized, ping, tools/list,
/// tools/call and notifications/cancelled. handle() and handle_message()
/// never throw; protocol failures become error envelopes and tool failures
/// become ToolResult data.
///
/// cancel() may be called from another thread while handle() runs a
/// tools/call; everything else expects a single dispatching thread.
class McpServer
{
  public:
    explicit McpServer(tools::ToolRegistry& registry, ServerOptions options = {});

    /// @return the response envelope, or std::nullopt for notifications and
    ///         ignored messages
    std::optional<Json> handle(const Json& message);

    /// Raw line in, raw line out. Undecodable input yields a PARSE_ERROR
    /// envelope with a null id.
    std::optional<std::string> handle_message(const std::string& raw);

    /// Cancel an in-flight tools/call by its request id.
    /// @return true if a running request matched
    bool cancel(const Json& request_id, const std::string& reason);

    /// Close the session; later requests are rejected with INVALID_REQUEST.
    void terminate();

    SessionState session() const;

    tools::ToolRegistry& registry()
    {
        return registry_;
    }
    const ServerOptions& options() const
    {
        return options_;
    }

  private:
    std::optional<Json> handle_request(const protocol::Request& request);
    void handle_notification(const protocol::Notification& notification);

    Json handle_initialize(const protocol::Request& request);
    Json handle_tools_list(const protocol::Request& request);
    Json handle_tools_call(const protocol::Request& request);

    tools::ToolRegistry& registry_;
    ServerOptions options_;
    util::log::Logger logger_{"toolwire.server"};

    mutable std::mutex mutex_; // guards session_ and in_flight_
    SessionState session_;
    /// Running tools/call tokens keyed by the dumped request id.
    std::unordered_map<std::string, tools::CancellationToken> in_flight_;
};

} // namespace toolwire::server
