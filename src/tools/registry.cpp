#include "toolwire/tools/registry.hpp"

#include "toolwire/exceptions.hpp"
#include "toolwire/llm/dialect.hpp"
#include "toolwire/util/json_schema.hpp"
#include "toolwire/util/log.hpp"
#include "toolwire/util/pagination.hpp"

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <thread>

namespace toolwire::tools
{

namespace
{

const util::log::Logger& logger()
{
    static const util::log::Logger instance("toolwire.tools");
    return instance;
}

// Worker-side poll interval while waiting on a cancellable call
constexpr std::chrono::milliseconds kPollSlice{10};

Json normalize_schema(const std::string& tool, Json schema)
{
    if (!schema.is_object())
        return ToolDefinition::default_input_schema();
    if (!util::schema::is_object_schema(schema))
        throw ValidationError("input schema of '" + tool + "' must describe an object");
    if (!schema.contains("type"))
        schema["type"] = "object";
    if (schema["type"] == "object" && !schema.contains("properties"))
        schema["properties"] = Json::object();
    return schema;
}

CommandOutcome execute_guarded(const ToolCommand& command, const Json& arguments,
                               const CancellationToken& token)
{
    try
    {
        return command.execute(arguments, token);
    }
    catch (const std::exception& e)
    {
        return ExecutionError{e.what()};
    }
    catch (...)
    {
        return ExecutionError{"unknown exception"};
    }
}

ToolResult to_result(const ToolCall& tool_call, CommandOutcome outcome)
{
    if (auto* failure = std::get_if<ExecutionError>(&outcome))
        return make_error_result(tool_call, "Execution error: " + failure->message);

    ToolResult result;
    result.content = std::move(std::get<std::vector<ContentBlock>>(outcome));
    if (result.content.empty())
        result.content.push_back(make_text(EMPTY_RESULT_TEXT));
    result.tool_name = tool_call.name;
    result.correlation_id = tool_call.correlation_id;
    return result;
}

// Completion slot shared between a call and its worker
struct PendingOutcome
{
    std::mutex mutex;
    std::condition_variable cv;
    bool done{false};
    CommandOutcome outcome;
};

} // namespace

class ToolRegistry::Workers
{
  public:
    ~Workers()
    {
        std::vector<Worker> remaining;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            remaining.swap(workers_);
        }
        if (!remaining.empty())
            logger().debug("waiting for " + std::to_string(remaining.size()) + " tool worker(s)");
        for (auto& worker : remaining)
        {
            worker.token.cancel("registry destroyed");
            worker.thread.join();
        }
    }

    void launch(CancellationToken token, std::function<void()> body)
    {
        auto finished = std::make_shared<std::atomic<bool>>(false);
        std::lock_guard<std::mutex> lock(mutex_);
        reap_locked();
        std::thread thread(
            [finished, body = std::move(body)]()
            {
                body();
                finished->store(true);
            });
        workers_.push_back(Worker{std::move(thread), std::move(finished), std::move(token)});
    }

    size_t pending()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        reap_locked();
        return workers_.size();
    }

  private:
    struct Worker
    {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> finished;
        CancellationToken token;
    };

    // The finished flag is the thread's last action, so these joins return at once
    void reap_locked()
    {
        auto done = std::partition(workers_.begin(), workers_.end(),
                                   [](const Worker& w) { return !w.finished->load(); });
        for (auto it = done; it != workers_.end(); ++it)
            it->thread.join();
        workers_.erase(done, workers_.end());
    }

    std::mutex mutex_;
    std::vector<Worker> workers_;
};

ToolRegistry::ToolRegistry(int page_size)
    : page_size_(page_size), workers_(std::make_unique<Workers>())
{
}

ToolRegistry::~ToolRegistry() = default;

size_t ToolRegistry::pending_workers() const
{
    return workers_->pending();
}

void ToolRegistry::register_tool(ToolDefinition definition, std::shared_ptr<ToolCommand> command)
{
    if (definition.name.empty())
        throw ValidationError("tool name must not be empty");
    if (!command)
        throw ValidationError("tool '" + definition.name + "' has no command");

    definition.input_schema =
        normalize_schema(definition.name, std::move(definition.input_schema));
    std::string name = definition.name;

    auto it = entries_.find(name);
    if (it != entries_.end())
    {
        logger().debug("replacing tool '" + name + "'");
        it->second = Entry{std::move(definition), std::move(command)};
        return;
    }
    entries_.emplace(name, Entry{std::move(definition), std::move(command)});
    order_.push_back(std::move(name));
}

void ToolRegistry::register_tool(ToolDefinition definition, FunctionCommand::Fn fn)
{
    register_tool(std::move(definition), make_command(std::move(fn)));
}

bool ToolRegistry::unregister_tool(const std::string& name)
{
    if (entries_.erase(name) == 0)
        return false;
    order_.erase(std::remove(order_.begin(), order_.end(), name), order_.end());
    return true;
}

std::optional<ToolDefinition> ToolRegistry::get(const std::string& name) const
{
    auto it = entries_.find(name);
    if (it == entries_.end())
        return std::nullopt;
    return it->second.definition;
}

std::vector<ToolDefinition> ToolRegistry::definitions() const
{
    std::vector<ToolDefinition> out;
    out.reserve(order_.size());
    for (const auto& name : order_)
        out.push_back(entries_.at(name).definition);
    return out;
}

ListResult ToolRegistry::list(const std::optional<std::string>& cursor) const
{
    auto page = util::pagination::paginate_sequence(definitions(), cursor, page_size_);
    return ListResult{std::move(page.items), std::move(page.next_cursor)};
}

ToolResult ToolRegistry::call(const ToolCall& tool_call, const CallOptions& options) const
{
    auto it = entries_.find(tool_call.name);
    if (it == entries_.end())
        return make_error_result(tool_call, "Tool '" + tool_call.name + "' not found");

    logger().debug("calling tool '" + tool_call.name + "'");
    return run_command(it->second, tool_call, options);
}

ToolResult ToolRegistry::run_command(const Entry& entry, const ToolCall& tool_call,
                                     const CallOptions& options) const
{
    Json arguments = tool_call.arguments.is_null() ? Json::object() : tool_call.arguments;
    try
    {
        util::schema::validate(entry.definition.input_schema, arguments);
    }
    catch (const ValidationError& e)
    {
        return make_error_result(tool_call, std::string("Invalid arguments: ") + e.what());
    }

    bool bounded = options.timeout.count() > 0;
    if (!options.token && !bounded)
        return to_result(tool_call, execute_guarded(*entry.command, arguments, CancellationToken{}));

    CancellationToken token = options.token.value_or(CancellationToken{});
    auto cancelled = [&]()
    {
        return make_error_result(tool_call,
                                 "Tool '" + tool_call.name + "' was cancelled: " + token.reason());
    };
    if (token.is_cancelled())
        return cancelled();

    auto pending = std::make_shared<PendingOutcome>();
    std::shared_ptr<ToolCommand> command = entry.command;
    workers_->launch(token,
                     [pending, command, arguments, token]()
                     {
                         auto outcome = execute_guarded(*command, arguments, token);
                         std::lock_guard<std::mutex> lock(pending->mutex);
                         pending->outcome = std::move(outcome);
                         pending->done = true;
                         pending->cv.notify_all();
                     });

    auto deadline = std::chrono::steady_clock::now() + options.timeout;
    std::unique_lock<std::mutex> lock(pending->mutex);
    while (!pending->done)
    {
        if (token.is_cancelled())
        {
            logger().info("tool '" + tool_call.name + "' cancelled: " + token.reason());
            return cancelled();
        }
        auto wait = kPollSlice;
        if (bounded)
        {
            auto now = std::chrono::steady_clock::now();
            if (now >= deadline)
            {
                std::string message = "Tool '" + tool_call.name + "' timed out after " +
                                      std::to_string(options.timeout.count()) + " ms";
                token.cancel("timed out");
                logger().warning(message);
                return make_error_result(tool_call, message);
            }
            wait = std::min(wait, std::chrono::duration_cast<std::chrono::milliseconds>(
                                      deadline - now + std::chrono::milliseconds(1)));
        }
        pending->cv.wait_for(lock, wait);
    }
    return to_result(tool_call, std::move(pending->outcome));
}

Json ToolRegistry::to_llm_schema(const llm::LlmDialect& dialect) const
{
    Json tools = Json::array();
    for (const auto& name : order_)
        tools.push_back(dialect.tool_spec(entries_.at(name).definition));
    return tools;
}

} // namespace toolwire::tools
