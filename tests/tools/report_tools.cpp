/// @file report_tools.cpp
/// @brief Built-in research/report tool set

#include "toolwire/builtin/report_tools.hpp"

#include <cassert>
#include <iostream>

using namespace toolwire;
using namespace toolwire::tools;

static ToolResult call(const ToolRegistry& registry, const std::string& name, Json args)
{
    return registry.call(ToolCall{name, std::move(args), std::nullopt});
}

static bool contains(const std::string& haystack, const std::string& needle)
{
    return haystack.find(needle) != std::string::npos;
}

int main()
{
    ToolRegistry registry;
    auto workspace = builtin::register_report_tools(registry);
    assert(workspace);

    assert((registry.names() == std::vector<std::string>{"web_search", "file_read", "file_write",
                                                         "analyze_data", "fact_check"}));
    assert(registry.get("web_search")->annotations->read_only_hint == std::optional<bool>(true));
    assert(registry.get("file_write")->annotations->destructive_hint == std::optional<bool>(true));

    // web_search
    {
        auto r = call(registry, "web_search", Json{{"query", "solar power"}, {"max_results", 2}});
        assert(!r.is_error);
        assert(contains(r.text(), "Web search results for 'solar power'"));
        assert(contains(r.text(), "2. "));
        assert(!contains(r.text(), "3. "));

        auto bad = call(registry, "web_search", Json{{"query", "x"}, {"max_results", 0}});
        assert(bad.is_error);
        assert(contains(bad.text(), "max_results"));

        auto missing = call(registry, "web_search", Json::object());
        assert(missing.is_error);
        assert(contains(missing.text(), "Invalid arguments"));
    }

    // file_write then file_read share the workspace
    {
        auto miss = call(registry, "file_read", Json{{"file_path", "notes.md"}});
        assert(miss.is_error);
        assert(contains(miss.text(), "file not found in workspace: notes.md"));

        auto w = call(registry, "file_write", Json{{"file_path", "notes.md"}, {"content", "hello"}});
        assert(!w.is_error);
        assert(w.text() == "Successfully wrote 5 characters to notes.md");
        assert(workspace->size() == 1);

        auto r = call(registry, "file_read", Json{{"file_path", "notes.md"}});
        assert(!r.is_error);
        assert(r.text() == "hello");
    }

    // analyze_data
    {
        auto stats = call(registry, "analyze_data",
                          Json{{"data", "3 4 5"}, {"analysis_type", "statistics"}});
        assert(!stats.is_error);
        assert(contains(stats.text(), "Numeric values: 3"));
        assert(contains(stats.text(), "Mean: 4.00"));

        auto sentiment = call(registry, "analyze_data",
                              Json{{"data", "great growth, minor risk"}, {"analysis_type", "sentiment"}});
        assert(contains(sentiment.text(), "Overall: positive"));

        auto bad_type = call(registry, "analyze_data", Json{{"data", "x"}, {"analysis_type", "magic"}});
        assert(bad_type.is_error);

        auto summary = call(registry, "analyze_data", Json{{"data", "one\ntwo"}});
        assert(contains(summary.text(), "Data Analysis (summary)"));
        assert(contains(summary.text(), "Lines: 2"));
    }

    // fact_check
    {
        auto r = call(registry, "fact_check", Json{{"claim", "water is wet"}});
        assert(!r.is_error);
        assert(contains(r.text(), "Claim: \"water is wet\""));
        assert(contains(r.text(), "UNVERIFIED"));
    }

    std::cout << "report tools tests passed\n";
    return 0;
}
