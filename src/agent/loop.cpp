#include "toolwire/agent/loop.hpp"

#include "toolwire/exceptions.hpp"
#include "toolwire/util/log.hpp"

namespace toolwire::agent
{

namespace
{
const util::log::Logger& logger()
{
    static const util::log::Logger instance("toolwire.agent");
    return instance;
}
} // namespace

AgentLoop::AgentLoop(llm::CompletionModel& model, tools::ToolSource& tools,
                     const llm::LlmDialect& dialect, LoopOptions options)
    : model_(model), tools_(tools), dialect_(dialect), options_(options)
{
    if (options_.max_rounds <= 0)
        throw ValidationError("AgentLoop: max_rounds must be > 0");
}

Json AgentLoop::bridged_tools()
{
    Json specs = Json::array();
    for (const auto& def : tools_.list_definitions())
        specs.push_back(dialect_.tool_spec(def));
    return specs;
}

LoopOutcome AgentLoop::run(llm::Conversation& conversation)
{
    LoopOutcome outcome;

    for (int round = 1; round <= options_.max_rounds; ++round)
    {
        llm::Completion completion = model_.complete(conversation, bridged_tools());
        if (!completion.has_tool_requests())
        {
            outcome.text = std::move(completion.text);
            return outcome;
        }

        for (size_t i = 0; i < completion.tool_requests.size(); ++i)
        {
            auto& request = completion.tool_requests[i];
            if (request.id.empty())
                request.id = "call_" + std::to_string(round) + "_" + std::to_string(i);
        }
        conversation.push_back(
            llm::Message::tool_request(completion.text, completion.tool_requests));

        logger().debug("round " + std::to_string(round) + ": " +
                       std::to_string(completion.tool_requests.size()) + " tool request(s)");

        for (const auto& request : completion.tool_requests)
        {
            tools::ToolCall call{request.name, request.arguments, request.id};
            tools::ToolResult result = tools_.invoke(call);
            result.correlation_id = request.id;
            if (result.tool_name.empty())
                result.tool_name = request.name;
            ++outcome.tool_calls;
            if (observer_)
                observer_(round, call, result);
            conversation.push_back(llm::Message::tool_result(result));
        }
        outcome.rounds = round;
    }

    logger().warning("tool round budget of " + std::to_string(options_.max_rounds) +
                     " exhausted; requesting final answer without tools");
    llm::Completion final_completion = model_.complete(conversation, Json::array());
    if (final_completion.has_tool_requests())
        logger().warning("ignoring tool requests in the final tools-disabled completion");
    outcome.text = std::move(final_completion.text);
    outcome.exhausted = true;
    return outcome;
}

LoopOutcome AgentLoop::run(const std::string& system_prompt, const std::string& user_prompt)
{
    llm::Conversation conversation;
    if (!system_prompt.empty())
        conversation.push_back(llm::Message::system(system_prompt));
    conversation.push_back(llm::Message::user(user_prompt));
    return run(conversation);
}

} // namespace toolwire::agent
