#pragma once
#include "toolwire/llm/conversation.hpp"
#include "toolwire/llm/dialect.hpp"
#include "toolwire/tools/source.hpp"

#include <functional>
#include <string>

namespace toolwire::agent
{

struct LoopOptions
{
    /// Tool-dispatch rounds before the forced tools-disabled completion.
    int max_rounds{5};
};

struct LoopOutcome
{
    std::string text;
    int rounds{0};     ///< Rounds in which tools were dispatched
    int tool_calls{0}; ///< Total tool executions
    bool exhausted{false};
};

/// Called after each tool execution with the 1-based round number.
using ToolCallObserver =
    std::function<void(int round, const tools::ToolCall& call, const tools::ToolResult& result)>;

/// Drives "ask model -> run requested tools -> feed results back" until the
/// model answers without tool requests or the round budget runs out. After
/// the budget is spent one more completion is made with tools disabled and
/// its text is returned as-is.
///
/// Tool calls of one round execute in the order the model listed them and
/// their result messages are appended in that same order. Exceptions from
/// the model or from a remote tool source abort the run.
class AgentLoop
{
  public:
    /// @throws ValidationError if options.max_rounds <= 0
    AgentLoop(llm::CompletionModel& model, tools::ToolSource& tools, const llm::LlmDialect& dialect,
              LoopOptions options = {});

    /// Runs on a caller-owned conversation. Tool request and tool result
    /// messages are appended to it; the final answer is only returned.
    LoopOutcome run(llm::Conversation& conversation);

    /// Convenience: builds [system?, user] and runs on it.
    LoopOutcome run(const std::string& system_prompt, const std::string& user_prompt);

    void set_observer(ToolCallObserver observer)
    {
        observer_ = std::move(observer);
    }

    const LoopOptions& options() const
    {
        return options_;
    }

  private:
    Json bridged_tools();

    llm::CompletionModel& model_;
    tools::ToolSource& tools_;
    const llm::LlmDialect& dialect_;
    LoopOptions options_;
    ToolCallObserver observer_;
};

} // namespace toolwire::agent
