#pragma once
#include "toolwire/content.hpp"
#include "toolwire/types.hpp"

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <variant>
#include <vector>

namespace toolwire::tools
{

/// Shared cancellation flag. Copies observe the same state.
class CancellationToken
{
  public:
    CancellationToken() : state_(std::make_shared<State>()) {}

    /// First reason wins; later calls are no-ops.
    void cancel(const std::string& reason = "cancelled")
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (state_->cancelled.load())
            return;
        state_->reason = reason;
        state_->cancelled.store(true);
    }

    bool is_cancelled() const
    {
        return state_->cancelled.load();
    }

    std::string reason() const
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        return state_->reason;
    }

  private:
    struct State
    {
        std::atomic<bool> cancelled{false};
        std::mutex mutex;
        std::string reason;
    };
    std::shared_ptr<State> state_;
};

/// Failure reported by a command as data rather than by throwing.
struct ExecutionError
{
    std::string message;
};

using CommandOutcome = std::variant<std::vector<ContentBlock>, ExecutionError>;

/// One tool's executor. Arguments have already been validated against the
/// tool's declared input schema when execute() runs.
class ToolCommand
{
  public:
    virtual ~ToolCommand() = default;

    /// Long-running commands should poll `token` and return early once it
    /// is cancelled; the caller has already reported the cancellation.
    virtual CommandOutcome execute(const Json& arguments,
                                   const CancellationToken& token) const = 0;
};

/// Adapts a plain `Json(const Json&)` function into a ToolCommand.
///
/// Output mapping: string -> one text block; object with a "content" array
/// -> those blocks; null -> no blocks; anything else -> its JSON dump.
class FunctionCommand : public ToolCommand
{
  public:
    using Fn = std::function<Json(const Json&)>;

    explicit FunctionCommand(Fn fn) : fn_(std::move(fn)) {}

    CommandOutcome execute(const Json& arguments, const CancellationToken& token) const override;

    static std::vector<ContentBlock> to_content(const Json& output);

  private:
    Fn fn_;
};

inline std::shared_ptr<ToolCommand> make_command(FunctionCommand::Fn fn)
{
    return std::make_shared<FunctionCommand>(std::move(fn));
}

} // namespace toolwire::tools
