#include "toolwire/client/client.hpp"

#include "../internal/line_reader.hpp"
#include "../internal/process.hpp"
#include "toolwire/protocol/jsonrpc.hpp"
#include "toolwire/util/log.hpp"

#include <algorithm>
#include <csignal>
#include <mutex>
#include <set>
#include <thread>

namespace toolwire::client
{

namespace
{

const util::log::Logger& logger()
{
    static const util::log::Logger instance("toolwire.client");
    return instance;
}

// Writes to a dead child must surface as EPIPE, not kill the process
void ignore_sigpipe()
{
    static std::once_flag once;
    std::call_once(once, []() { std::signal(SIGPIPE, SIG_IGN); });
}

// Ids only grow, so a smaller integer id answers a request that already timed out
bool is_stale(const Json& response_id, int64_t current)
{
    return response_id.is_number_integer() && response_id.get<int64_t>() < current;
}

std::string preview(const std::string& line)
{
    return line.size() > 200 ? line.substr(0, 200) + "..." : line;
}

} // namespace

struct StdioClient::Impl
{
    process::Process process;
    std::unique_ptr<internal::LineReader> reader;
};

ClientOptions ClientOptions::from_settings(const Settings& settings)
{
    ClientOptions options;
    options.request_timeout = std::chrono::milliseconds(settings.request_timeout_ms);
    options.shutdown_grace = std::chrono::milliseconds(settings.shutdown_grace_ms);
    return options;
}

StdioClient::StdioClient(std::string command, std::vector<std::string> args, ClientOptions options)
    : command_(std::move(command)), args_(std::move(args)), options_(std::move(options))
{
}

StdioClient::~StdioClient()
{
    disconnect();
}

bool StdioClient::is_connected() const
{
    return impl_ != nullptr && init_result_.has_value();
}

protocol::InitializeResult StdioClient::connect()
{
    if (is_connected())
        return *init_result_;
    disconnect();
    ignore_sigpipe();

    auto executable = process::find_executable(command_);
    if (!executable)
        throw TransportError(TransportErrorKind::SpawnFailed, "command not found: " + command_);

    process::ProcessOptions spawn_options;
    spawn_options.environment = options_.environment;
    spawn_options.working_directory = options_.working_directory;
    if (options_.stderr_log)
        spawn_options.stderr_path = options_.stderr_log->string();

    impl_ = std::make_unique<Impl>();
    try
    {
        impl_->process.spawn(*executable, args_, spawn_options);
        impl_->reader = std::make_unique<internal::LineReader>(impl_->process.stdout_pipe());
    }
    catch (const process::ProcessError& e)
    {
        impl_.reset();
        throw TransportError(TransportErrorKind::SpawnFailed, e.what());
    }
    logger().debug("spawned " + command_ + " (pid " + std::to_string(impl_->process.pid()) + ")");

    try
    {
        protocol::InitializeParams params;
        params.client_info = options_.client_info;
        params.capabilities = options_.capabilities;

        Json result = request("initialize", params);
        if (!result.is_object() || !result.contains("protocolVersion") ||
            !result["protocolVersion"].is_string())
            throw TransportError(TransportErrorKind::MalformedResponse,
                                 "initialize result lacks protocolVersion");
        protocol::InitializeResult init;
        try
        {
            init = result.get<protocol::InitializeResult>();
        }
        catch (const Json::exception& e)
        {
            throw TransportError(TransportErrorKind::MalformedResponse,
                                 std::string("invalid initialize result: ") + e.what());
        }

        if (init.protocol_version != params.protocol_version)
            logger().warning("server answered protocol version " + init.protocol_version +
                             ", requested " + params.protocol_version);

        init_result_ = init;
        notify("notifications/initialized");
        logger().info("connected to " + init.server_info.name + " " + init.server_info.version);
        return init;
    }
    catch (...)
    {
        disconnect();
        throw;
    }
}

void StdioClient::disconnect()
{
    if (!impl_)
        return;

    auto& proc = impl_->process;
    try
    {
        if (impl_->reader)
            impl_->reader.reset();
        if (proc.pid() > 0 && !proc.try_wait())
        {
            proc.close_stdin();
            proc.terminate();

            auto deadline = std::chrono::steady_clock::now() + options_.shutdown_grace;
            while (!proc.try_wait() && std::chrono::steady_clock::now() < deadline)
                std::this_thread::sleep_for(std::chrono::milliseconds(10));

            if (!proc.try_wait())
            {
                logger().warning(command_ + " ignored SIGTERM; killing");
                proc.kill();
                proc.wait();
            }
        }
    }
    catch (const process::ProcessError& e)
    {
        logger().warning(std::string("disconnect: ") + e.what());
    }

    impl_.reset();
    init_result_.reset();
}

void StdioClient::write_line(const std::string& line)
{
    if (!impl_)
        throw TransportError(TransportErrorKind::NotConnected, "client is not connected");
    try
    {
        impl_->process.stdin_pipe().write(line + "\n");
    }
    catch (const process::ProcessError& e)
    {
        throw TransportError(TransportErrorKind::BrokenPipe,
                             std::string("write to server failed: ") + e.what());
    }
}

Json StdioClient::request(const std::string& method, const Json& params)
{
    if (!impl_)
        throw TransportError(TransportErrorKind::NotConnected, "client is not connected");

    int64_t id = ++next_id_;
    protocol::Request envelope{method, params, id};
    write_line(Json(envelope).dump());
    return read_response(id);
}

void StdioClient::notify(const std::string& method, const std::optional<Json>& params)
{
    write_line(Json(protocol::Notification{method, params}).dump());
}

Json StdioClient::read_response(int64_t id)
{
    using clock = std::chrono::steady_clock;
    bool bounded = options_.request_timeout.count() > 0;
    auto deadline = clock::now() + options_.request_timeout;

    for (;;)
    {
        std::optional<std::chrono::milliseconds> wait;
        if (bounded)
        {
            auto remaining =
                std::chrono::duration_cast<std::chrono::milliseconds>(deadline - clock::now());
            wait = std::max(remaining, std::chrono::milliseconds(0));
        }

        std::string line;
        internal::ReadStatus status;
        try
        {
            status = impl_->reader->read_line(line, wait);
        }
        catch (const process::ProcessError& e)
        {
            throw TransportError(TransportErrorKind::Closed,
                                 std::string("read from server failed: ") + e.what());
        }

        if (status == internal::ReadStatus::Timeout)
            throw TransportError(TransportErrorKind::Timeout,
                                 "no response to request " + std::to_string(id) + " within " +
                                     std::to_string(options_.request_timeout.count()) + " ms");

        if (status == internal::ReadStatus::Eof)
        {
            // Give an exiting child a moment to be reaped for a better diagnosis
            std::optional<int> code;
            for (int i = 0; i < 10 && !code; ++i)
            {
                code = impl_->process.try_wait();
                if (!code)
                    std::this_thread::sleep_for(std::chrono::milliseconds(10));
            }
            if (code)
                throw TransportError(TransportErrorKind::ProcessExited,
                                     "server exited with code " + std::to_string(*code) +
                                         " before answering request " + std::to_string(id));
            throw TransportError(TransportErrorKind::Closed,
                                 "server closed its output before answering request " +
                                     std::to_string(id));
        }

        if (line.find_first_not_of(" \t\r") == std::string::npos)
            continue;

        Json raw = Json::parse(line, nullptr, /*allow_exceptions=*/false);
        if (raw.is_discarded())
            throw TransportError(TransportErrorKind::MalformedResponse,
                                 "unparsable response: " + preview(line));

        protocol::Message message;
        try
        {
            message = protocol::parse_message(raw);
        }
        catch (const ValidationError& e)
        {
            throw TransportError(TransportErrorKind::MalformedResponse,
                                 std::string("invalid JSON-RPC message: ") + e.what());
        }
        catch (const Json::exception& e)
        {
            throw TransportError(TransportErrorKind::MalformedResponse,
                                 std::string("invalid JSON-RPC message: ") + e.what());
        }

        if (auto* notification = std::get_if<protocol::Notification>(&message))
        {
            logger().debug("server notification " + notification->method);
            continue;
        }

        if (auto* incoming = std::get_if<protocol::Request>(&message))
        {
            // Server-initiated requests: only ping is supported
            Json reply = incoming->method == "ping"
                             ? protocol::make_response(incoming->id, Json::object())
                             : protocol::make_error(incoming->id, protocol::METHOD_NOT_FOUND,
                                                    "Method '" + incoming->method +
                                                        "' not supported by client");
            write_line(reply.dump());
            continue;
        }

        if (auto* response = std::get_if<protocol::Response>(&message))
        {
            if (is_stale(response->id, id))
            {
                logger().warning("dropping late response to request " + response->id.dump());
                continue;
            }
            if (response->id != Json(id))
                throw TransportError(TransportErrorKind::MalformedResponse,
                                     "response id " + response->id.dump() +
                                         " does not match request id " + std::to_string(id));
            return std::move(response->result);
        }

        auto& error = std::get<protocol::ErrorResponse>(message);
        if (is_stale(error.id, id))
        {
            logger().warning("dropping late error response to request " + error.id.dump());
            continue;
        }
        if (!error.id.is_null() && error.id != Json(id))
            throw TransportError(TransportErrorKind::MalformedResponse,
                                 "error response id " + error.id.dump() +
                                     " does not match request id " + std::to_string(id));
        throw ProtocolError(error.error.code, error.error.message,
                            error.error.data.value_or(Json(nullptr)));
    }
}

tools::ListResult StdioClient::list_tools(const std::optional<std::string>& cursor)
{
    Json params = Json::object();
    if (cursor)
        params["cursor"] = *cursor;
    Json result = request("tools/list", params);

    if (!result.is_object() || !result.contains("tools") || !result["tools"].is_array())
        throw TransportError(TransportErrorKind::MalformedResponse,
                             "tools/list result lacks a tools array");

    tools::ListResult page;
    try
    {
        for (const auto& item : result["tools"])
            page.tools.push_back(item.get<tools::ToolDefinition>());
    }
    catch (const Json::exception& e)
    {
        throw TransportError(TransportErrorKind::MalformedResponse,
                             std::string("invalid tool definition: ") + e.what());
    }
    catch (const ValidationError& e)
    {
        throw TransportError(TransportErrorKind::MalformedResponse,
                             std::string("invalid tool definition: ") + e.what());
    }
    if (result.contains("nextCursor") && result["nextCursor"].is_string())
        page.next_cursor = result["nextCursor"].get<std::string>();
    return page;
}

std::vector<tools::ToolDefinition> StdioClient::list_tools()
{
    std::vector<tools::ToolDefinition> all;
    std::set<std::string> seen;
    std::optional<std::string> cursor;
    do
    {
        auto page = list_tools(cursor);
        all.insert(all.end(), std::make_move_iterator(page.tools.begin()),
                   std::make_move_iterator(page.tools.end()));
        cursor = std::move(page.next_cursor);
        if (cursor && !seen.insert(*cursor).second)
            throw TransportError(TransportErrorKind::MalformedResponse,
                                 "tools/list repeated cursor " + *cursor);
    } while (cursor);
    return all;
}

tools::ToolResult StdioClient::call_tool(const tools::ToolCall& call)
{
    Json result = request("tools/call", tools::to_call_params(call));
    try
    {
        return tools::parse_call_result(result, call);
    }
    catch (const ValidationError& e)
    {
        throw TransportError(TransportErrorKind::MalformedResponse,
                             std::string("invalid tools/call result: ") + e.what());
    }
    catch (const Json::exception& e)
    {
        throw TransportError(TransportErrorKind::MalformedResponse,
                             std::string("invalid tools/call result: ") + e.what());
    }
}

tools::ToolResult StdioClient::call_tool(const std::string& name, const Json& arguments)
{
    return call_tool(tools::ToolCall{name, arguments, std::nullopt});
}

bool StdioClient::ping()
{
    try
    {
        request("ping", Json::object());
        return true;
    }
    catch (const Error& e)
    {
        logger().debug(std::string("ping failed: ") + e.what());
        return false;
    }
}

void StdioClient::cancel(const Json& request_id, const std::string& reason)
{
    notify("notifications/cancelled", Json(protocol::CancelledParams{request_id, reason}));
}

const protocol::InitializeResult& StdioClient::require_initialized() const
{
    if (!init_result_)
        throw TransportError(TransportErrorKind::NotConnected, "client is not connected");
    return *init_result_;
}

const Implementation& StdioClient::server_info() const
{
    return require_initialized().server_info;
}

const protocol::ServerCapabilities& StdioClient::server_capabilities() const
{
    return require_initialized().capabilities;
}

const std::optional<std::string>& StdioClient::instructions() const
{
    return require_initialized().instructions;
}

std::vector<tools::ToolDefinition> RemoteToolSource::list_definitions()
{
    if (!cache_)
        cache_ = client_.list_tools();
    return *cache_;
}

tools::ToolResult RemoteToolSource::invoke(const tools::ToolCall& call)
{
    return client_.call_tool(call);
}

void RemoteToolSource::refresh()
{
    cache_.reset();
}

} // namespace toolwire::client
