// Demo MCP server over stdio. Integration tests spawn it as a child process.
//
//   toolwire_example_stdio_server [--page-size N] [--tool-timeout-ms N] [--instructions TEXT]

#include "toolwire/server/server.hpp"
#include "toolwire/server/stdio_server.hpp"
#include "toolwire/settings.hpp"
#include "toolwire/tools/registry.hpp"

#include <chrono>
#include <cstdlib>
#include <string>
#include <thread>

namespace
{

using toolwire::Json;
using namespace toolwire::tools;

// Sleeps in small slices so cancellation and timeouts end it early
class SlowCommand : public ToolCommand
{
  public:
    CommandOutcome execute(const Json& arguments, const CancellationToken& token) const override
    {
        auto total = std::chrono::milliseconds(arguments.value("sleep_ms", 1000));
        auto deadline = std::chrono::steady_clock::now() + total;
        while (std::chrono::steady_clock::now() < deadline)
        {
            if (token.is_cancelled())
                return ExecutionError{"interrupted: " + token.reason()};
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        return std::vector<toolwire::ContentBlock>{
            toolwire::make_text("slept " + std::to_string(total.count()) + " ms")};
    }
};

void register_demo_tools(ToolRegistry& registry)
{
    ToolDefinition echo;
    echo.name = "echo";
    echo.description = "Return the given text unchanged";
    echo.input_schema = Json{{"type", "object"},
                             {"properties", Json{{"text", Json{{"type", "string"}}}}},
                             {"required", Json::array({"text"})}};
    registry.register_tool(echo, [](const Json& in) { return in.at("text"); });

    ToolDefinition add;
    add.name = "add";
    add.description = "Add two numbers";
    add.input_schema = Json{
        {"type", "object"},
        {"properties", Json{{"a", Json{{"type", "number"}}}, {"b", Json{{"type", "number"}}}}},
        {"required", Json::array({"a", "b"})}};
    registry.register_tool(add,
                           [](const Json& in) -> Json
                           {
                               double sum = in.at("a").get<double>() + in.at("b").get<double>();
                               // MCP-style content array
                               return Json{{"content", Json::array({Json{{"type", "text"},
                                                                         {"text", Json(sum).dump()}}})}};
                           });

    ToolDefinition slow;
    slow.name = "slow";
    slow.description = "Wait for sleep_ms milliseconds";
    slow.input_schema = Json{{"type", "object"},
                             {"properties", Json{{"sleep_ms", Json{{"type", "integer"}}}}}};
    registry.register_tool(slow, std::make_shared<SlowCommand>());

    ToolDefinition fail;
    fail.name = "fail";
    fail.description = "Always fails";
    registry.register_tool(fail,
                           [](const Json&) -> Json { throw std::runtime_error("deliberate failure"); });
}

} // namespace

int main(int argc, char** argv)
{
    auto settings = toolwire::Settings::from_env();
    settings.apply_logging();

    toolwire::server::ServerOptions options;
    options.info = toolwire::Implementation{"demo_stdio", "0.1.0"};
    int page_size = 0;
    for (int i = 1; i + 1 < argc; i += 2)
    {
        std::string flag = argv[i];
        if (flag == "--page-size")
            page_size = std::atoi(argv[i + 1]);
        else if (flag == "--tool-timeout-ms")
            options.tool_timeout = std::chrono::milliseconds(std::atoi(argv[i + 1]));
        else if (flag == "--instructions")
            options.instructions = argv[i + 1];
    }

    ToolRegistry registry(page_size);
    register_demo_tools(registry);

    toolwire::server::McpServer server(registry, options);
    toolwire::server::StdioServer stdio(server);
    return stdio.run() ? 0 : 1;
}
