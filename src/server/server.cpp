#include "toolwire/server/server.hpp"

#include "toolwire/exceptions.hpp"

namespace toolwire::server
{

namespace
{

std::string dump_safe(const Json& j)
{
    return j.dump(-1, ' ', false, Json::error_handler_t::replace);
}

// Removes an in-flight entry on every exit path of a tools/call
class InFlightGuard
{
  public:
    InFlightGuard(std::mutex& mutex, std::unordered_map<std::string, tools::CancellationToken>& map,
                  std::string key)
        : mutex_(mutex), map_(map), key_(std::move(key))
    {
    }
    ~InFlightGuard()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        map_.erase(key_);
    }

  private:
    std::mutex& mutex_;
    std::unordered_map<std::string, tools::CancellationToken>& map_;
    std::string key_;
};

} // namespace

const char* to_string(SessionPhase phase)
{
    switch (phase)
    {
    case SessionPhase::NotInitialized:
        return "not_initialized";
    case SessionPhase::Initialized:
        return "initialized";
    case SessionPhase::Ready:
        return "ready";
    case SessionPhase::Terminated:
        return "terminated";
    }
    return "unknown";
}

ServerOptions ServerOptions::from_settings(const Settings& settings)
{
    ServerOptions options;
    options.tool_timeout = std::chrono::milliseconds(settings.tool_timeout_ms);
    return options;
}

McpServer::McpServer(tools::ToolRegistry& registry, ServerOptions options)
    : registry_(registry), options_(std::move(options))
{
}

SessionState McpServer::session() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return session_;
}

std::optional<std::string> McpServer::handle_message(const std::string& raw)
{
    Json message = Json::parse(raw, nullptr, /*allow_exceptions=*/false);
    if (message.is_discarded())
    {
        logger_.warning("unparsable input: " + raw.substr(0, 200));
        return dump_safe(protocol::make_error(nullptr, protocol::PARSE_ERROR, "Parse error"));
    }

    auto response = handle(message);
    if (!response)
        return std::nullopt;
    return dump_safe(*response);
}

std::optional<Json> McpServer::handle(const Json& message)
{
    try
    {
        protocol::Message parsed;
        try
        {
            parsed = protocol::parse_message(message);
        }
        catch (const ValidationError& e)
        {
            logger_.warning(std::string("invalid request: ") + e.what());
            return protocol::make_error(protocol::recover_id(message), protocol::INVALID_REQUEST,
                                        std::string("Invalid request: ") + e.what());
        }

        if (auto* request = std::get_if<protocol::Request>(&parsed))
            return handle_request(*request);

        if (auto* notification = std::get_if<protocol::Notification>(&parsed))
        {
            handle_notification(*notification);
            return std::nullopt;
        }

        logger_.debug("ignoring response message with id " + protocol::recover_id(message).dump());
        return std::nullopt;
    }
    catch (const std::exception& e)
    {
        logger_.error(std::string("internal error: ") + e.what());
        return protocol::make_error(protocol::recover_id(message), protocol::INTERNAL_ERROR,
                                    e.what());
    }
}

std::optional<Json> McpServer::handle_request(const protocol::Request& request)
{
    const Json& id = request.id;
    SessionPhase phase;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        phase = session_.phase;
    }
    if (phase == SessionPhase::Terminated)
        return protocol::make_error(id, protocol::INVALID_REQUEST, "Session terminated");

    if (request.params && !request.params->is_object())
        return protocol::make_error(id, protocol::INVALID_PARAMS, "params must be an object");

    const std::string& method = request.method;
    try
    {
        if (method == "initialize")
            return protocol::make_response(id, handle_initialize(request));

        if (method == "ping")
            return protocol::make_response(id, Json::object());

        if (method == "tools/list" || method == "tools/call")
        {
            if (phase != SessionPhase::Ready)
                logger_.warning(method + " received in phase " + to_string(phase));
            if (method == "tools/list")
                return protocol::make_response(id, handle_tools_list(request));
            return protocol::make_response(id, handle_tools_call(request));
        }

        return protocol::make_error(id, protocol::METHOD_NOT_FOUND,
                                    "Method '" + method + "' not found");
    }
    catch (const ValidationError& e)
    {
        return protocol::make_error(id, protocol::INVALID_PARAMS, e.what());
    }
    catch (const std::exception& e)
    {
        logger_.error(method + " failed: " + e.what());
        return protocol::make_error(id, protocol::INTERNAL_ERROR, e.what());
    }
}

Json McpServer::handle_initialize(const protocol::Request& request)
{
    Json params = request.params.value_or(Json::object());
    if (!params.contains("protocolVersion") || !params["protocolVersion"].is_string())
        throw ValidationError("Missing protocolVersion");
    auto init = params.get<protocol::InitializeParams>();

    std::string version = init.protocol_version;
    if (!is_supported_protocol_version(version))
    {
        logger_.warning("client requested unsupported protocol version '" + version +
                        "', answering with " + PROTOCOL_VERSION);
        version = PROTOCOL_VERSION;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (session_.phase != SessionPhase::NotInitialized)
            logger_.info("re-initialize from phase " + std::string(to_string(session_.phase)));
        session_.phase = SessionPhase::Initialized;
        session_.client_info = init.client_info;
        session_.client_capabilities = init.capabilities;
        session_.protocol_version = version;
    }
    logger_.info("initialize from " + init.client_info.name + " " + init.client_info.version +
                 " (protocol " + version + ")");

    protocol::InitializeResult result;
    result.protocol_version = version;
    result.capabilities.tools = Json{{"listChanged", true}};
    result.server_info = options_.info;
    result.instructions = options_.instructions;
    return result;
}

Json McpServer::handle_tools_list(const protocol::Request& request)
{
    std::optional<std::string> cursor;
    if (request.params && request.params->contains("cursor"))
    {
        const Json& c = (*request.params)["cursor"];
        if (c.is_string())
            cursor = c.get<std::string>();
        else if (!c.is_null())
            throw ValidationError("cursor must be a string");
    }

    auto page = registry_.list(cursor);
    Json tools = Json::array();
    for (const auto& def : page.tools)
        tools.push_back(Json(def));

    Json result = {{"tools", std::move(tools)}};
    if (page.next_cursor)
        result["nextCursor"] = *page.next_cursor;
    return result;
}

Json McpServer::handle_tools_call(const protocol::Request& request)
{
    Json params = request.params.value_or(Json::object());
    if (!params.contains("name") || !params["name"].is_string() ||
        params["name"].get<std::string>().empty())
        throw ValidationError("Missing tool name");

    tools::ToolCall call;
    call.name = params["name"].get<std::string>();
    if (params.contains("arguments") && !params["arguments"].is_null())
    {
        if (!params["arguments"].is_object())
            throw ValidationError("arguments must be an object");
        call.arguments = params["arguments"];
    }

    tools::CancellationToken token;
    std::string key = request.id.dump();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        in_flight_[key] = token;
    }
    InFlightGuard guard(mutex_, in_flight_, key);

    tools::ToolResult result =
        registry_.call(call, tools::CallOptions{token, options_.tool_timeout});
    if (result.is_error)
        logger_.info("tool '" + call.name + "' returned an error: " + result.text());
    return tools::to_call_result(result);
}

void McpServer::handle_notification(const protocol::Notification& notification)
{
    const std::string& method = notification.method;

    if (method == "notifications/initialized")
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (session_.phase == SessionPhase::Initialized)
            session_.phase = SessionPhase::Ready;
        else
            logger_.warning("initialized notification in phase " +
                            std::string(to_string(session_.phase)));
        return;
    }

    if (method == "notifications/cancelled")
    {
        protocol::CancelledParams params;
        if (notification.params && notification.params->is_object())
            params = notification.params->get<protocol::CancelledParams>();
        std::string reason = params.reason.value_or("cancelled");
        if (params.request_id.is_null())
        {
            logger_.warning("cancel notification without requestId");
            return;
        }
        if (cancel(params.request_id, reason))
            logger_.info("cancelled request " + params.request_id.dump() + ": " + reason);
        else
            logger_.info("cancel for request " + params.request_id.dump() +
                         " which is not running: " + reason);
        return;
    }

    logger_.debug("ignoring notification " + method);
}

bool McpServer::cancel(const Json& request_id, const std::string& reason)
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = in_flight_.find(request_id.dump());
    if (it == in_flight_.end())
        return false;
    it->second.cancel(reason);
    return true;
}

void McpServer::terminate()
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (session_.phase == SessionPhase::Terminated)
        return;
    session_.phase = SessionPhase::Terminated;
    for (auto& [id, token] : in_flight_)
        token.cancel("session terminated");
    logger_.info("session terminated");
}

} // namespace toolwire::server
