/// @file registry.cpp
/// @brief Tool catalog registration, listing and dispatch

#include "toolwire/exceptions.hpp"
#include "toolwire/llm/dialect.hpp"
#include "toolwire/tools/registry.hpp"

#include <cassert>
#include <iostream>
#include <set>
#include <stdexcept>

using namespace toolwire;
using namespace toolwire::tools;

static ToolDefinition def(const std::string& name, Json schema = ToolDefinition::default_input_schema())
{
    ToolDefinition d;
    d.name = name;
    d.description = name + " tool";
    d.input_schema = std::move(schema);
    return d;
}

static Json echo_schema()
{
    return Json{{"type", "object"},
                {"properties", Json{{"text", Json{{"type", "string"}}}}},
                {"required", Json::array({"text"})}};
}

void test_list_matches_registered_names()
{
    std::cout << "  test_list_matches_registered_names... " << std::flush;
    ToolRegistry registry;
    std::vector<std::string> names = {"zeta", "alpha", "mid"};
    for (const auto& n : names)
        registry.register_tool(def(n, echo_schema()), [](const Json&) { return Json("ok"); });

    auto page = registry.list();
    assert(!page.next_cursor.has_value());
    assert(page.tools.size() == names.size());
    for (size_t i = 0; i < names.size(); ++i)
    {
        // Registration order is listing order
        assert(page.tools[i].name == names[i]);
        Json wire = page.tools[i];
        std::string dumped = wire["inputSchema"].dump();
        assert(Json::parse(dumped).dump() == dumped);
        assert(Json::parse(Json(page.tools[i]).dump()).get<ToolDefinition>().input_schema ==
               page.tools[i].input_schema);
    }
    std::cout << "PASSED\n";
}

void test_reregister_replaces_in_place()
{
    std::cout << "  test_reregister_replaces_in_place... " << std::flush;
    ToolRegistry registry;
    registry.register_tool(def("echo", echo_schema()), [](const Json&) { return Json("first"); });
    registry.register_tool(def("other"), [](const Json&) { return Json("other"); });
    registry.register_tool(def("echo", echo_schema()), [](const Json&) { return Json("second"); });

    assert(registry.size() == 2);
    assert(registry.names().front() == "echo");
    auto result = registry.call(ToolCall{"echo", Json{{"text", "x"}}, std::nullopt});
    assert(!result.is_error);
    assert(result.text() == "second");
    std::cout << "PASSED\n";
}

void test_missing_tool_is_error_result()
{
    std::cout << "  test_missing_tool_is_error_result... " << std::flush;
    ToolRegistry registry;
    auto empty = registry.call(ToolCall{"missing", Json::object(), std::string("c1")});
    assert(empty.is_error);
    assert(empty.text() == "Tool 'missing' not found");
    assert(empty.tool_name == "missing");
    assert(empty.correlation_id == std::optional<std::string>("c1"));

    registry.register_tool(def("present"), [](const Json&) { return Json("ok"); });
    auto still = registry.call(ToolCall{"missing", Json::object(), std::nullopt});
    assert(still.is_error);
    assert(still.content.size() == 1);
    std::cout << "PASSED\n";
}

void test_throwing_executor_is_captured()
{
    std::cout << "  test_throwing_executor_is_captured... " << std::flush;
    ToolRegistry registry;
    registry.register_tool(def("boom"),
                           [](const Json&) -> Json { throw std::runtime_error("kaboom"); });
    registry.register_tool(def("odd"), [](const Json&) -> Json { throw 42; });

    auto result = registry.call(ToolCall{"boom", Json::object(), std::nullopt});
    assert(result.is_error);
    assert(result.content.size() == 1);
    assert(result.text().find("kaboom") != std::string::npos);

    auto odd = registry.call(ToolCall{"odd", Json::object(), std::nullopt});
    assert(odd.is_error);
    assert(odd.text() == "Execution error: unknown exception");
    std::cout << "PASSED\n";
}

void test_argument_validation()
{
    std::cout << "  test_argument_validation... " << std::flush;
    ToolRegistry registry;
    bool ran = false;
    registry.register_tool(def("echo", echo_schema()),
                           [&ran](const Json& in)
                           {
                               ran = true;
                               return in.at("text");
                           });

    auto missing = registry.call(ToolCall{"echo", Json::object(), std::nullopt});
    assert(missing.is_error);
    assert(missing.text() == "Invalid arguments: missing required: text");

    auto wrong = registry.call(ToolCall{"echo", Json{{"text", 5}}, std::nullopt});
    assert(wrong.is_error);
    assert(!ran);

    // Null arguments are treated as an empty object
    registry.register_tool(def("noargs"), [](const Json& in) { return Json(in.is_object()); });
    auto null_args = registry.call(ToolCall{"noargs", nullptr, std::nullopt});
    assert(!null_args.is_error);
    assert(null_args.text() == "true");
    std::cout << "PASSED\n";
}

void test_empty_output_gets_placeholder()
{
    std::cout << "  test_empty_output_gets_placeholder... " << std::flush;
    ToolRegistry registry;
    registry.register_tool(def("quiet"), [](const Json&) { return Json(nullptr); });
    auto result = registry.call(ToolCall{"quiet", Json::object(), std::nullopt});
    assert(!result.is_error);
    assert(result.content.size() == 1);
    assert(result.text() == EMPTY_RESULT_TEXT);
    std::cout << "PASSED\n";
}

void test_registration_rejects_bad_definitions()
{
    std::cout << "  test_registration_rejects_bad_definitions... " << std::flush;
    ToolRegistry registry;
    int rejected = 0;
    try
    {
        registry.register_tool(def(""), [](const Json&) { return Json(); });
    }
    catch (const ValidationError&)
    {
        ++rejected;
    }
    try
    {
        registry.register_tool(def("arr", Json{{"type", "array"}}), [](const Json&) { return Json(); });
    }
    catch (const ValidationError&)
    {
        ++rejected;
    }
    try
    {
        registry.register_tool(def("nobody"), std::shared_ptr<ToolCommand>());
    }
    catch (const ValidationError&)
    {
        ++rejected;
    }
    assert(rejected == 3);
    assert(registry.size() == 0);

    // A non-object schema falls back to the empty object schema
    registry.register_tool(def("loose", Json("whatever")), [](const Json&) { return Json(); });
    assert(registry.get("loose")->input_schema == ToolDefinition::default_input_schema());
    std::cout << "PASSED\n";
}

void test_unregister()
{
    std::cout << "  test_unregister... " << std::flush;
    ToolRegistry registry;
    registry.register_tool(def("a"), [](const Json&) { return Json("a"); });
    registry.register_tool(def("b"), [](const Json&) { return Json("b"); });
    assert(registry.unregister_tool("a"));
    assert(!registry.unregister_tool("a"));
    assert(!registry.contains("a"));
    assert(registry.names() == std::vector<std::string>{"b"});
    assert(registry.call(ToolCall{"a", Json::object(), std::nullopt}).is_error);
    std::cout << "PASSED\n";
}

void test_paginated_listing()
{
    std::cout << "  test_paginated_listing... " << std::flush;
    ToolRegistry registry(2);
    for (const char* n : {"t1", "t2", "t3", "t4", "t5"})
        registry.register_tool(def(n), [](const Json&) { return Json(); });

    std::vector<std::string> seen;
    std::optional<std::string> cursor;
    int pages = 0;
    do
    {
        auto page = registry.list(cursor);
        for (const auto& t : page.tools)
            seen.push_back(t.name);
        cursor = page.next_cursor;
        ++pages;
    } while (cursor);
    assert(pages == 3);
    assert(seen == registry.names());

    bool threw = false;
    try
    {
        registry.list(std::string("not-a-cursor"));
    }
    catch (const ValidationError&)
    {
        threw = true;
    }
    assert(threw);
    std::cout << "PASSED\n";
}

void test_annotations_round_trip()
{
    std::cout << "  test_annotations_round_trip... " << std::flush;
    ToolDefinition d = def("annotated");
    d.title = "Annotated Tool";
    ToolAnnotations hints;
    hints.read_only_hint = true;
    hints.open_world_hint = false;
    hints.extra = Json{{"x-vendor", "kept"}};
    d.annotations = hints;

    Json wire = d;
    assert(wire["annotations"]["readOnlyHint"] == true);
    assert(wire["annotations"]["openWorldHint"] == false);
    assert(!wire["annotations"].contains("destructiveHint"));
    assert(wire["annotations"]["x-vendor"] == "kept");

    auto back = wire.get<ToolDefinition>();
    assert(back.title == std::optional<std::string>("Annotated Tool"));
    assert(back.annotations->read_only_hint == std::optional<bool>(true));
    assert(back.annotations->extra["x-vendor"] == "kept");
    assert(Json(back) == wire);
    std::cout << "PASSED\n";
}

void test_llm_schema_projection()
{
    std::cout << "  test_llm_schema_projection... " << std::flush;
    ToolRegistry registry;
    registry.register_tool(def("echo", echo_schema()), [](const Json& in) { return in.at("text"); });

    llm::OpenAiDialect openai;
    Json specs = registry.to_llm_schema(openai);
    assert(specs.size() == 1);
    assert(specs[0]["type"] == "function");
    assert(specs[0]["function"]["name"] == "echo");
    assert(specs[0]["function"]["parameters"] == echo_schema());

    llm::AnthropicDialect anthropic;
    Json a = registry.to_llm_schema(anthropic);
    assert(a[0]["input_schema"] == echo_schema());
    std::cout << "PASSED\n";
}

int main()
{
    std::cout << "Tool registry tests\n";
    test_list_matches_registered_names();
    test_reregister_replaces_in_place();
    test_missing_tool_is_error_result();
    test_throwing_executor_is_captured();
    test_argument_validation();
    test_empty_output_gets_placeholder();
    test_registration_rejects_bad_definitions();
    test_unregister();
    test_paginated_listing();
    test_annotations_round_trip();
    test_llm_schema_projection();
    std::cout << "All tool registry tests passed\n";
    return 0;
}
