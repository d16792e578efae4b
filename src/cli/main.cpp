#include "toolwire/builtin/report_tools.hpp"
#include "toolwire/client/client.hpp"
#include "toolwire/exceptions.hpp"
#include "toolwire/llm/dialect.hpp"
#include "toolwire/server/server.hpp"
#include "toolwire/server/stdio_server.hpp"
#include "toolwire/settings.hpp"
#include "toolwire/tools/registry.hpp"
#include "toolwire/version.hpp"

#include <cerrno>
#include <chrono>
#include <climits>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace
{

static int usage(int exit_code = 1)
{
    std::ostream& out = exit_code == 0 ? std::cout : std::cerr;
    out << "toolwire " << toolwire::VERSION_STRING << "\n";
    out << "Usage:\n";
    out << "  toolwire --help | --version\n";
    out << "  toolwire serve   [--page-size <n>] [--tool-timeout-ms <n>] [--instructions <text>]\n";
    out << "  toolwire schema  [--dialect openai|anthropic]\n";
    out << "  toolwire list    --stdio <command> [--stdio-arg <arg>]... [--timeout-ms <n>] [--pretty]\n";
    out << "  toolwire call    <tool> [--args <json>] --stdio <command> [--stdio-arg <arg>]...\n";
    out << "                   [--timeout-ms <n>] [--pretty]\n";
    out << "\n";
    out << "serve runs an MCP stdio server exposing the built-in report tools.\n";
    out << "Settings are read from TOOLWIRE_* environment variables.\n";
    return exit_code;
}

static std::optional<std::string> consume_flag_value(std::vector<std::string>& args,
                                                     const std::string& flag)
{
    for (size_t i = 0; i + 1 < args.size(); ++i)
    {
        if (args[i] == flag)
        {
            std::string value = args[i + 1];
            args.erase(args.begin() + static_cast<long long>(i),
                       args.begin() + static_cast<long long>(i) + 2);
            return value;
        }
    }
    return std::nullopt;
}

static std::vector<std::string> consume_flag_values(std::vector<std::string>& args,
                                                    const std::string& flag)
{
    std::vector<std::string> values;
    while (auto v = consume_flag_value(args, flag))
        values.push_back(*v);
    return values;
}

static bool consume_flag(std::vector<std::string>& args, const std::string& flag)
{
    for (size_t i = 0; i < args.size(); ++i)
    {
        if (args[i] == flag)
        {
            args.erase(args.begin() + static_cast<long long>(i));
            return true;
        }
    }
    return false;
}

/// @throws toolwire::ValidationError for non-numeric or negative input
static int parse_count(const std::string& flag, const std::string& s)
{
    char* end = nullptr;
    errno = 0;
    long v = std::strtol(s.c_str(), &end, 10);
    if (s.empty() || errno != 0 || *end != '\0' || v < 0 || v > INT_MAX)
        throw toolwire::ValidationError(flag + " expects a non-negative integer, got '" + s + "'");
    return static_cast<int>(v);
}

static void reject_leftovers(const std::vector<std::string>& args)
{
    if (!args.empty())
        throw toolwire::ValidationError("unexpected argument: " + args.front());
}

static void print_json(const toolwire::Json& j, bool pretty)
{
    std::cout << (pretty ? j.dump(2) : j.dump()) << "\n";
}

static int run_serve(std::vector<std::string> args, toolwire::Settings settings)
{
    if (auto v = consume_flag_value(args, "--page-size"))
        settings.tools_page_size = parse_count("--page-size", *v);
    if (auto v = consume_flag_value(args, "--tool-timeout-ms"))
        settings.tool_timeout_ms = parse_count("--tool-timeout-ms", *v);
    auto instructions = consume_flag_value(args, "--instructions");
    reject_leftovers(args);

    toolwire::tools::ToolRegistry registry(settings.tools_page_size);
    toolwire::builtin::register_report_tools(registry);

    auto options = toolwire::server::ServerOptions::from_settings(settings);
    options.instructions = instructions;
    toolwire::server::McpServer server(registry, options);
    toolwire::server::StdioServer stdio(server);
    return stdio.run() ? 0 : 1;
}

static int run_schema(std::vector<std::string> args)
{
    std::string dialect_name = consume_flag_value(args, "--dialect").value_or("openai");
    reject_leftovers(args);

    auto dialect = toolwire::llm::make_dialect(dialect_name);
    toolwire::tools::ToolRegistry registry;
    toolwire::builtin::register_report_tools(registry);
    print_json(registry.to_llm_schema(*dialect), true);
    return 0;
}

struct StdioTarget
{
    std::string command;
    std::vector<std::string> args;
    toolwire::client::ClientOptions options;
    bool pretty{false};
};

static StdioTarget parse_target(std::vector<std::string>& args, const toolwire::Settings& settings)
{
    StdioTarget target;
    auto command = consume_flag_value(args, "--stdio");
    if (!command)
        throw toolwire::ValidationError("missing --stdio <command>");
    target.command = *command;
    target.args = consume_flag_values(args, "--stdio-arg");
    target.options = toolwire::client::ClientOptions::from_settings(settings);
    if (auto v = consume_flag_value(args, "--timeout-ms"))
        target.options.request_timeout = std::chrono::milliseconds(parse_count("--timeout-ms", *v));
    target.pretty = consume_flag(args, "--pretty");
    return target;
}

static int run_list(std::vector<std::string> args, const toolwire::Settings& settings)
{
    StdioTarget target = parse_target(args, settings);
    reject_leftovers(args);

    toolwire::client::StdioClient client(target.command, target.args, target.options);
    client.connect();
    toolwire::Json tools = toolwire::Json::array();
    for (const auto& def : client.list_tools())
        tools.push_back(toolwire::Json(def));
    client.disconnect();
    print_json(toolwire::Json{{"tools", tools}}, target.pretty);
    return 0;
}

static int run_call(std::vector<std::string> args, const toolwire::Settings& settings)
{
    if (args.empty() || args.front().rfind("--", 0) == 0)
        throw toolwire::ValidationError("missing tool name");
    std::string tool = args.front();
    args.erase(args.begin());

    toolwire::Json arguments = toolwire::Json::object();
    if (auto raw = consume_flag_value(args, "--args"))
    {
        arguments = toolwire::Json::parse(*raw, nullptr, /*allow_exceptions=*/false);
        if (!arguments.is_object())
            throw toolwire::ValidationError("--args must be a JSON object");
    }
    StdioTarget target = parse_target(args, settings);
    reject_leftovers(args);

    toolwire::client::StdioClient client(target.command, target.args, target.options);
    client.connect();
    auto result = client.call_tool(tool, arguments);
    client.disconnect();
    print_json(toolwire::tools::to_call_result(result), target.pretty);
    return result.is_error ? 2 : 0;
}

} // namespace

int main(int argc, char** argv)
{
    if (argc < 2)
        return usage();

    std::string cmd = argv[1];
    if (cmd == "--help" || cmd == "-h")
        return usage(0);
    if (cmd == "--version")
    {
        std::cout << toolwire::VERSION_STRING << "\n";
        return 0;
    }

    std::vector<std::string> args(argv + 2, argv + argc);
    try
    {
        auto settings = toolwire::Settings::from_env();
        settings.apply_logging();

        if (cmd == "serve")
            return run_serve(std::move(args), settings);
        if (cmd == "schema")
            return run_schema(std::move(args));
        if (cmd == "list")
            return run_list(std::move(args), settings);
        if (cmd == "call")
            return run_call(std::move(args), settings);
    }
    catch (const toolwire::TransportError& e)
    {
        std::cerr << "Transport error (" << toolwire::to_string(e.kind()) << "): " << e.what()
                  << "\n";
        return 1;
    }
    catch (const toolwire::ProtocolError& e)
    {
        std::cerr << "Server error " << e.code() << ": " << e.what() << "\n";
        return 1;
    }
    catch (const std::exception& e)
    {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return usage();
}
