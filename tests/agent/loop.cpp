/// @file loop.cpp
/// @brief Agentic tool loop driven by a scripted completion model

#include "toolwire/agent/loop.hpp"
#include "toolwire/exceptions.hpp"
#include "toolwire/tools/registry.hpp"

#include <cassert>
#include <deque>
#include <functional>
#include <iostream>
#include <stdexcept>

using namespace toolwire;
using namespace toolwire::agent;
using namespace toolwire::llm;

namespace
{

// Replays a fixed script; records every request it was given
class ScriptedModel : public CompletionModel
{
  public:
    using Step = std::function<Completion(int call_index)>;

    explicit ScriptedModel(Step step) : step_(std::move(step)) {}

    Completion complete(const Conversation& conversation, const Json& tools) override
    {
        calls.push_back({conversation.size(), tools});
        return step_(static_cast<int>(calls.size()) - 1);
    }

    struct Call
    {
        size_t conversation_size;
        Json tools;
    };
    std::vector<Call> calls;

  private:
    Step step_;
};

Completion requesting(std::vector<ToolRequest> requests, std::string text = {})
{
    Completion c;
    c.text = std::move(text);
    c.tool_requests = std::move(requests);
    return c;
}

Completion answer(const std::string& text)
{
    Completion c;
    c.text = text;
    return c;
}

struct Fixture
{
    tools::ToolRegistry registry;
    std::vector<std::string> executed;

    Fixture()
    {
        tools::ToolDefinition search;
        search.name = "search";
        search.input_schema = Json{{"type", "object"},
                                   {"properties", Json{{"q", Json{{"type", "string"}}}}}};
        registry.register_tool(search,
                               [this](const Json& in)
                               {
                                   std::string q = in.value("q", "");
                                   executed.push_back(q);
                                   return Json("results for " + q);
                               });
    }
};

} // namespace

void test_three_rounds_then_answer()
{
    std::cout << "  test_three_rounds_then_answer... " << std::flush;
    Fixture fx;
    ScriptedModel model(
        [](int i)
        {
            if (i < 3)
                return requesting({ToolRequest{"r" + std::to_string(i), "search",
                                               Json{{"q", "q" + std::to_string(i)}}}});
            return answer("done");
        });
    OpenAiDialect dialect;
    AgentLoop loop(model, fx.registry, dialect);

    Conversation conversation = {Message::user("research")};
    auto outcome = loop.run(conversation);

    assert(outcome.text == "done");
    assert(outcome.rounds == 3);
    assert(outcome.tool_calls == 3);
    assert(!outcome.exhausted);
    assert((fx.executed == std::vector<std::string>{"q0", "q1", "q2"}));

    // user + 3 x (assistant request, tool result); the answer is not appended
    assert(conversation.size() == 7);
    int requests = 0;
    int results = 0;
    for (size_t i = 1; i < conversation.size(); i += 2)
    {
        assert(conversation[i].role == Role::Assistant);
        assert(conversation[i].tool_calls.size() == 1);
        assert(conversation[i + 1].role == Role::Tool);
        assert(conversation[i + 1].tool_result_for == conversation[i].tool_calls[0].id);
        ++requests;
        ++results;
    }
    assert(requests == 3 && results == 3);
    assert(conversation[2].text == std::optional<std::string>("results for q0"));

    // Every round offered the tools
    assert(model.calls.size() == 4);
    for (const auto& call : model.calls)
        assert(call.tools.size() == 1);
    std::cout << "PASSED\n";
}

void test_budget_exhaustion_forces_final_answer()
{
    std::cout << "  test_budget_exhaustion_forces_final_answer... " << std::flush;
    Fixture fx;
    ScriptedModel model(
        [](int)
        {
            return requesting({ToolRequest{"", "search", Json{{"q", "again"}}}}, "still thinking");
        });
    OpenAiDialect dialect;
    AgentLoop loop(model, fx.registry, dialect, LoopOptions{5});

    auto outcome = loop.run("system prompt", "go");
    assert(outcome.exhausted);
    assert(outcome.rounds == 5);
    assert(outcome.tool_calls == 5);
    assert(fx.executed.size() == 5);
    // The final call is made with tools disabled and its text returned verbatim
    assert(model.calls.size() == 6);
    assert(model.calls.back().tools.is_array() && model.calls.back().tools.empty());
    assert(outcome.text == "still thinking");
    std::cout << "PASSED\n";
}

void test_parallel_requests_keep_order_and_get_ids()
{
    std::cout << "  test_parallel_requests_keep_order_and_get_ids... " << std::flush;
    Fixture fx;
    ScriptedModel model(
        [](int i)
        {
            if (i == 0)
                return requesting({ToolRequest{"", "search", Json{{"q", "a"}}},
                                   ToolRequest{"keep", "search", Json{{"q", "b"}}},
                                   ToolRequest{"", "missing_tool", Json::object()}});
            return answer("ok");
        });
    AnthropicDialect dialect;
    AgentLoop loop(model, fx.registry, dialect);

    std::vector<std::pair<int, std::string>> observed;
    loop.set_observer([&observed](int round, const tools::ToolCall& call, const tools::ToolResult&)
                      { observed.emplace_back(round, call.name); });

    Conversation conversation = {Message::user("x")};
    auto outcome = loop.run(conversation);
    assert(outcome.text == "ok");
    assert(outcome.tool_calls == 3);

    const auto& request = conversation[1];
    assert(request.tool_calls[0].id == "call_1_0");
    assert(request.tool_calls[1].id == "keep");
    assert(request.tool_calls[2].id == "call_1_2");
    assert(conversation[2].tool_result_for == std::optional<std::string>("call_1_0"));
    assert(conversation[3].tool_result_for == std::optional<std::string>("keep"));
    // Unknown tools come back as error results, not exceptions
    assert(conversation[4].is_error);
    assert(conversation[4].text->rfind("Error: ", 0) == 0);

    assert(observed.size() == 3);
    assert(observed[2] == std::make_pair(1, std::string("missing_tool")));
    std::cout << "PASSED\n";
}

void test_invalid_options_and_model_errors()
{
    std::cout << "  test_invalid_options_and_model_errors... " << std::flush;
    Fixture fx;
    ScriptedModel failing([](int) -> Completion { throw std::runtime_error("provider down"); });
    OpenAiDialect dialect;

    bool rejected = false;
    try
    {
        AgentLoop bad(failing, fx.registry, dialect, LoopOptions{0});
    }
    catch (const ValidationError&)
    {
        rejected = true;
    }
    assert(rejected);

    AgentLoop loop(failing, fx.registry, dialect);
    bool propagated = false;
    try
    {
        loop.run("", "hi");
    }
    catch (const std::runtime_error& e)
    {
        propagated = std::string(e.what()) == "provider down";
    }
    assert(propagated);
    // No system message was added for an empty system prompt
    assert(failing.calls.size() == 1 && failing.calls[0].conversation_size == 1);
    std::cout << "PASSED\n";
}

int main()
{
    std::cout << "Agent loop tests\n";
    test_three_rounds_then_answer();
    test_budget_exhaustion_forces_final_answer();
    test_parallel_requests_keep_order_and_get_ids();
    test_invalid_options_and_model_errors();
    std::cout << "All agent loop tests passed\n";
    return 0;
}
