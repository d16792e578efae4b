/// @file dialect.cpp
/// @brief Provider function-calling projections

#include "toolwire/exceptions.hpp"
#include "toolwire/llm/dialect.hpp"

#include <cassert>
#include <iostream>

using namespace toolwire;
using namespace toolwire::llm;

static Conversation sample_conversation()
{
    Conversation c;
    c.push_back(Message::system("be brief"));
    c.push_back(Message::user("weather?"));
    c.push_back(Message::tool_request(std::nullopt,
                                      {ToolRequest{"call_a", "lookup", Json{{"city", "Oslo"}}},
                                       ToolRequest{"call_b", "lookup", Json{{"city", "Rome"}}}}));
    tools::ToolResult ok;
    ok.content = {make_text("cold")};
    ok.tool_name = "lookup";
    ok.correlation_id = "call_a";
    c.push_back(Message::tool_result(ok));
    tools::ToolResult failed;
    failed.content = {make_text("service down")};
    failed.is_error = true;
    failed.tool_name = "lookup";
    failed.correlation_id = "call_b";
    c.push_back(Message::tool_result(failed));
    return c;
}

void test_openai_render()
{
    std::cout << "  test_openai_render... " << std::flush;
    OpenAiDialect dialect;
    tools::ToolDefinition def;
    def.name = "lookup";
    def.description = "Look something up";
    Json tools = Json::array({dialect.tool_spec(def)});
    assert(tools[0]["function"]["description"] == "Look something up");
    assert(tools[0]["function"]["parameters"]["type"] == "object");

    Json body = dialect.render_request(sample_conversation(), tools);
    const Json& msgs = body["messages"];
    assert(msgs.size() == 5);
    assert(msgs[0]["role"] == "system");
    assert(msgs[2]["role"] == "assistant");
    assert(msgs[2]["content"].is_null());
    assert(msgs[2]["tool_calls"].size() == 2);
    // Arguments travel as a JSON string
    assert(msgs[2]["tool_calls"][0]["function"]["arguments"].is_string());
    assert(Json::parse(msgs[2]["tool_calls"][0]["function"]["arguments"].get<std::string>()) ==
           (Json{{"city", "Oslo"}}));
    assert(msgs[3]["role"] == "tool");
    assert(msgs[3]["tool_call_id"] == "call_a");
    assert(msgs[4]["content"] == "Error: service down");
    assert(body["tools"] == tools);

    Json no_tools = dialect.render_request(sample_conversation(), Json::array());
    assert(!no_tools.contains("tools"));
    std::cout << "PASSED\n";
}

void test_openai_parse()
{
    std::cout << "  test_openai_parse... " << std::flush;
    OpenAiDialect dialect;
    Json response = {
        {"choices",
         Json::array({Json{{"message",
                            {{"role", "assistant"},
                             {"content", nullptr},
                             {"tool_calls",
                              Json::array({Json{{"id", "c1"},
                                                {"type", "function"},
                                                {"function",
                                                 {{"name", "lookup"}, {"arguments", "{\"q\":1}"}}}},
                                           Json{{"id", "c2"},
                                                {"type", "function"},
                                                {"function",
                                                 {{"name", "lookup"}, {"arguments", "not json"}}}}})}}}}})}};
    auto completion = dialect.parse_completion(response);
    assert(completion.text.empty());
    assert(completion.tool_requests.size() == 2);
    assert(completion.tool_requests[0].id == "c1");
    assert(completion.tool_requests[0].arguments == (Json{{"q", 1}}));
    assert(completion.tool_requests[1].arguments == Json::object());

    auto plain = dialect.parse_completion(
        Json{{"choices", Json::array({Json{{"message", {{"content", "hello"}}}}})}});
    assert(plain.text == "hello");
    assert(!plain.has_tool_requests());

    bool threw = false;
    try
    {
        dialect.parse_completion(Json{{"choices", Json::array()}});
    }
    catch (const ValidationError&)
    {
        threw = true;
    }
    assert(threw);
    std::cout << "PASSED\n";
}

void test_anthropic_render()
{
    std::cout << "  test_anthropic_render... " << std::flush;
    AnthropicDialect dialect;
    tools::ToolDefinition def;
    def.name = "lookup";
    Json spec = dialect.tool_spec(def);
    assert(spec["name"] == "lookup");
    assert(spec["input_schema"]["type"] == "object");
    assert(!spec.contains("description"));

    Json body = dialect.render_request(sample_conversation(), Json::array({spec}));
    assert(body["system"] == "be brief");
    const Json& msgs = body["messages"];
    // user, assistant(tool_use x2), user(tool_result x2)
    assert(msgs.size() == 3);
    assert(msgs[1]["content"][0]["type"] == "tool_use");
    assert(msgs[1]["content"][1]["input"]["city"] == "Rome");
    assert(msgs[2]["role"] == "user");
    assert(msgs[2]["content"].size() == 2);
    assert(msgs[2]["content"][0]["tool_use_id"] == "call_a");
    assert(!msgs[2]["content"][0].contains("is_error"));
    assert(msgs[2]["content"][1]["is_error"] == true);
    assert(body["tools"].size() == 1);
    std::cout << "PASSED\n";
}

void test_anthropic_skips_empty_turns()
{
    std::cout << "  test_anthropic_skips_empty_turns... " << std::flush;
    AnthropicDialect dialect;
    Conversation c;
    c.push_back(Message::user("hello"));
    c.push_back(Message::assistant(""));
    c.push_back(Message::user(""));
    c.push_back(Message::user("again"));

    Json body = dialect.render_request(c, Json::array());
    const Json& msgs = body["messages"];
    assert(msgs.size() == 2);
    for (const auto& m : msgs)
        assert(!m["content"].empty());
    assert(msgs[1]["content"][0]["text"] == "again");
    assert(!body.contains("tools"));
    std::cout << "PASSED\n";
}

void test_anthropic_parse()
{
    std::cout << "  test_anthropic_parse... " << std::flush;
    AnthropicDialect dialect;
    Json response = {{"content",
                      Json::array({Json{{"type", "text"}, {"text", "Let me check."}},
                                   Json{{"type", "tool_use"},
                                        {"id", "tu_1"},
                                        {"name", "lookup"},
                                        {"input", {{"city", "Oslo"}}}}})}};
    auto completion = dialect.parse_completion(response);
    assert(completion.text == "Let me check.");
    assert(completion.tool_requests.size() == 1);
    assert(completion.tool_requests[0].id == "tu_1");
    assert(completion.tool_requests[0].arguments["city"] == "Oslo");
    std::cout << "PASSED\n";
}

void test_make_dialect()
{
    std::cout << "  test_make_dialect... " << std::flush;
    assert(make_dialect("openai")->name() == "openai");
    assert(make_dialect("anthropic")->name() == "anthropic");
    bool threw = false;
    try
    {
        make_dialect("llama");
    }
    catch (const NotFoundError&)
    {
        threw = true;
    }
    assert(threw);
    assert(role_from_string("tool") == Role::Tool);
    std::cout << "PASSED\n";
}

int main()
{
    std::cout << "LLM dialect tests\n";
    test_openai_render();
    test_openai_parse();
    test_anthropic_render();
    test_anthropic_skips_empty_turns();
    test_anthropic_parse();
    test_make_dialect();
    std::cout << "All dialect tests passed\n";
    return 0;
}
