#pragma once
#include "toolwire/tools/command.hpp"
#include "toolwire/tools/source.hpp"
#include "toolwire/tools/tool.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace toolwire::llm
{
class LlmDialect;
}

namespace toolwire::tools
{

/// Per-call execution controls.
struct CallOptions
{
    /// Cancels the call when flipped by another thread.
    std::optional<CancellationToken> token;
    /// Deadline for the executor (0 = none).
    std::chrono::milliseconds timeout{0};
};

/// One page of tools/list output.
struct ListResult
{
    std::vector<ToolDefinition> tools;
    std::optional<std::string> next_cursor;
};

/// Owns the tool catalog: definitions plus their commands.
///
/// Registration is last-write-wins and keeps the original listing position
/// of an overwritten name. call() never throws: unknown tools, invalid
/// arguments, executor failures, timeouts and cancellations all come back as
/// ToolResult with is_error set, so the caller (usually an LLM) can react.
///
/// Calls with a token or timeout run on worker threads owned by the registry.
/// A worker that outlives its call (timed out, cancelled) is joined once it
/// finishes; destroying the registry cancels outstanding workers and waits
/// for them.
///
/// Not synchronized: mutate the catalog only while no call is running.
class ToolRegistry : public ToolSource
{
  public:
    /// @param page_size tools/list page size; 0 returns a single page
    explicit ToolRegistry(int page_size = 0);
    ~ToolRegistry() override;

    ToolRegistry(const ToolRegistry&) = delete;
    ToolRegistry& operator=(const ToolRegistry&) = delete;

    void register_tool(ToolDefinition definition, std::shared_ptr<ToolCommand> command);
    void register_tool(ToolDefinition definition, FunctionCommand::Fn fn);

    /// @return true if an entry with this name existed
    bool unregister_tool(const std::string& name);

    bool contains(const std::string& name) const
    {
        return entries_.count(name) > 0;
    }
    size_t size() const
    {
        return order_.size();
    }
    const std::vector<std::string>& names() const
    {
        return order_;
    }
    std::optional<ToolDefinition> get(const std::string& name) const;

    /// Full live catalog in registration order.
    std::vector<ToolDefinition> definitions() const;

    /// One page of the catalog starting at `cursor`.
    ListResult list(const std::optional<std::string>& cursor = std::nullopt) const;

    ToolResult call(const ToolCall& tool_call, const CallOptions& options) const;
    ToolResult call(const ToolCall& tool_call) const
    {
        return call(tool_call, CallOptions{std::nullopt, default_timeout_});
    }

    /// Project every entry into the function-calling schema of `dialect`.
    Json to_llm_schema(const llm::LlmDialect& dialect) const;

    void set_page_size(int page_size)
    {
        page_size_ = page_size;
    }
    int page_size() const
    {
        return page_size_;
    }
    void set_default_timeout(std::chrono::milliseconds timeout)
    {
        default_timeout_ = timeout;
    }

    /// Worker threads not yet joined (running, or finished since the last call)
    size_t pending_workers() const;

    // ToolSource
    std::vector<ToolDefinition> list_definitions() override
    {
        return definitions();
    }
    ToolResult invoke(const ToolCall& tool_call) override
    {
        return call(tool_call);
    }

  private:
    struct Entry
    {
        ToolDefinition definition;
        std::shared_ptr<ToolCommand> command;
    };

    ToolResult run_command(const Entry& entry, const ToolCall& tool_call,
                           const CallOptions& options) const;

    class Workers;

    std::unordered_map<std::string, Entry> entries_;
    std::vector<std::string> order_;
    int page_size_{0};
    std::chrono::milliseconds default_timeout_{0};
    std::unique_ptr<Workers> workers_;
};

} // namespace toolwire::tools
