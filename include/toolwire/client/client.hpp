#pragma once
#include "toolwire/exceptions.hpp"
#include "toolwire/protocol/lifecycle.hpp"
#include "toolwire/settings.hpp"
#include "toolwire/tools/registry.hpp"
#include "toolwire/tools/source.hpp"
#include "toolwire/types.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace toolwire::client
{

struct ClientOptions
{
    /// Read deadline per request (0 = wait forever).
    std::chrono::milliseconds request_timeout{30000};
    /// Time between SIGTERM and SIGKILL on disconnect.
    std::chrono::milliseconds shutdown_grace{5000};
    /// Extra variables set in the child's environment.
    std::map<std::string, std::string> environment;
    std::string working_directory;
    Implementation client_info{"toolwire", VERSION_STRING};
    protocol::ClientCapabilities capabilities;
    /// Child stderr is appended here when set, otherwise inherited.
    std::optional<std::filesystem::path> stderr_log;

    static ClientOptions from_settings(const Settings& settings);
};

/// MCP client over a spawned child process speaking newline-delimited
/// JSON-RPC on its stdin/stdout.
///
/// Usage:
///   StdioClient client("my-server", {"--flag"});
///   client.connect();
///   auto tools = client.list_tools();
///   auto result = client.call_tool("echo", {{"text", "hi"}});
///   client.disconnect();  // also run by the destructor
///
/// Transport failures raise TransportError, JSON-RPC error payloads raise
/// ProtocolError, and tool failures come back as ToolResult data. One
/// request is outstanding at a time; the client is not thread-safe.
class StdioClient
{
  public:
    StdioClient(std::string command, std::vector<std::string> args = {},
                ClientOptions options = {});
    ~StdioClient();

    StdioClient(const StdioClient&) = delete;
    StdioClient& operator=(const StdioClient&) = delete;

    /// Spawn the child and run the initialize handshake. On failure the
    /// child is torn down before the exception propagates.
    /// @throws TransportError, ProtocolError
    protocol::InitializeResult connect();

    /// Close stdin, give the child the grace period, then SIGKILL.
    /// Idempotent; never throws.
    void disconnect();

    bool is_connected() const;

    /// One tools/list page.
    tools::ListResult list_tools(const std::optional<std::string>& cursor);
    /// Whole catalog, following nextCursor until exhausted.
    std::vector<tools::ToolDefinition> list_tools();

    tools::ToolResult call_tool(const tools::ToolCall& call);
    tools::ToolResult call_tool(const std::string& name, const Json& arguments = Json::object());

    /// @return false on any failure instead of raising
    bool ping();

    /// Send notifications/cancelled for an earlier request id.
    void cancel(const Json& request_id, const std::string& reason = "cancelled");

    /// Raw request: returns the "result" member of the response.
    /// @throws TransportError, ProtocolError
    Json request(const std::string& method, const Json& params = Json::object());

    /// Raw notification (no response expected).
    void notify(const std::string& method, const std::optional<Json>& params = std::nullopt);

    /// Id used by the most recent request (0 before the first one).
    int64_t last_request_id() const
    {
        return next_id_;
    }

    const Implementation& server_info() const;
    const protocol::ServerCapabilities& server_capabilities() const;
    const std::optional<std::string>& instructions() const;

  private:
    struct Impl;

    void write_line(const std::string& line);
    Json read_response(int64_t id);
    const protocol::InitializeResult& require_initialized() const;

    std::string command_;
    std::vector<std::string> args_;
    ClientOptions options_;
    std::unique_ptr<Impl> impl_;
    int64_t next_id_{0};
    std::optional<protocol::InitializeResult> init_result_;
};

/// Exposes a connected client's tools to the agent loop.
///
/// The catalog is fetched lazily and cached until refresh().
class RemoteToolSource : public tools::ToolSource
{
  public:
    explicit RemoteToolSource(StdioClient& client) : client_(client) {}

    std::vector<tools::ToolDefinition> list_definitions() override;

    /// Tool failures are data; transport and protocol errors propagate.
    tools::ToolResult invoke(const tools::ToolCall& call) override;

    void refresh();

  private:
    StdioClient& client_;
    std::optional<std::vector<tools::ToolDefinition>> cache_;
};

} // namespace toolwire::client
