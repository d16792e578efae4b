/// @file stdio_server.cpp
/// @brief StdioServer over in-process pipes: ordering, cancellation and EOF drain

#include "internal/line_reader.hpp"
#include "internal/process.hpp"
#include "toolwire/server/server.hpp"
#include "toolwire/server/stdio_server.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <thread>
#include <unistd.h>

using namespace toolwire;
using namespace std::chrono_literals;

namespace
{

class SlowCommand : public tools::ToolCommand
{
  public:
    tools::CommandOutcome execute(const Json& arguments,
                                  const tools::CancellationToken& token) const override
    {
        auto deadline =
            std::chrono::steady_clock::now() + std::chrono::milliseconds(arguments.value("ms", 5000));
        while (std::chrono::steady_clock::now() < deadline)
        {
            if (token.is_cancelled())
                return tools::ExecutionError{"interrupted"};
            std::this_thread::sleep_for(2ms);
        }
        return std::vector<ContentBlock>{make_text("done")};
    }
};

// Both ends of the server's input and output
struct Wiring
{
    int to_server[2];
    int from_server[2];

    Wiring()
    {
        int a = pipe(to_server);
        int b = pipe(from_server);
        assert(a == 0 && b == 0);
    }
};

void register_tools(tools::ToolRegistry& registry)
{
    tools::ToolDefinition slow;
    slow.name = "slow";
    registry.register_tool(slow, std::make_shared<SlowCommand>());

    tools::ToolDefinition echo;
    echo.name = "echo";
    registry.register_tool(echo, [](const Json& in) { return in.value("text", ""); });
}

Json next_message(internal::LineReader& reader)
{
    std::string line;
    auto status = reader.read_line(line, 5000ms);
    assert(status == internal::ReadStatus::Line);
    return Json::parse(line);
}

} // namespace

void test_cancel_while_queueing()
{
    std::cout << "  test_cancel_while_queueing... " << std::flush;
    Wiring w;
    tools::ToolRegistry registry;
    register_tools(registry);
    server::McpServer server(registry);
    server::StdioServer stdio(server, w.to_server[0], w.from_server[1]);
    assert(stdio.start_async());
    assert(!stdio.start_async());

    auto in = process::WritePipe::adopt(w.to_server[1], true);
    auto out = process::ReadPipe::adopt(w.from_server[0], true);
    internal::LineReader reader(out);

    in.write(R"({"jsonrpc":"2.0","id":1,"method":"initialize","params":{"protocolVersion":"2025-11-25","capabilities":{},"clientInfo":{"name":"t","version":"1"}}})"
             "\n");
    assert(next_message(reader)["id"] == 1);
    in.write(R"({"jsonrpc":"2.0","method":"notifications/initialized"})"
             "\n");

    auto start = std::chrono::steady_clock::now();
    in.write(R"({"jsonrpc":"2.0","id":2,"method":"tools/call","params":{"name":"slow","arguments":{"ms":5000}}})"
             "\n");
    in.write(R"({"jsonrpc":"2.0","id":3,"method":"ping"})"
             "\n");
    std::this_thread::sleep_for(50ms);
    in.write(R"({"jsonrpc":"2.0","method":"notifications/cancelled","params":{"requestId":2,"reason":"stop"}})"
             "\n");

    // The cancelled call is answered first, then the queued ping
    Json first = next_message(reader);
    assert(first["id"] == 2);
    assert(first["result"]["isError"] == true);
    assert(first["result"]["content"][0]["text"] == "Tool 'slow' was cancelled: stop");
    assert(std::chrono::steady_clock::now() - start < 3000ms);

    Json second = next_message(reader);
    assert(second["id"] == 3);
    assert(second["result"] == Json::object());

    // EOF on input ends the loop and the session
    in.close();
    for (int i = 0; i < 500 && stdio.running(); ++i)
        std::this_thread::sleep_for(10ms);
    assert(!stdio.running());
    stdio.stop();
    assert(server.session().phase == server::SessionPhase::Terminated);

    ::close(w.from_server[1]);
    std::string line;
    assert(reader.read_line(line, 5000ms) == internal::ReadStatus::Eof);
    ::close(w.to_server[0]);
    std::cout << "PASSED\n";
}

void test_eof_drains_pending_requests()
{
    std::cout << "  test_eof_drains_pending_requests... " << std::flush;
    Wiring w;
    tools::ToolRegistry registry;
    register_tools(registry);
    server::McpServer server(registry);

    {
        auto in = process::WritePipe::adopt(w.to_server[1], true);
        in.write(R"({"jsonrpc":"2.0","id":"a","method":"tools/call","params":{"name":"slow","arguments":{"ms":100}}})"
                 "\n"
                 R"({"jsonrpc":"2.0","id":"b","method":"tools/call","params":{"name":"echo","arguments":{"text":"hi"}}})"
                 "\n"
                 "\n"
                 "not json\n");
        // Closed here: the server sees EOF while the first call runs
    }

    server::StdioServer stdio(server, w.to_server[0], w.from_server[1]);
    bool ok = stdio.run();
    assert(ok);
    ::close(w.from_server[1]);

    auto out = process::ReadPipe::adopt(w.from_server[0], true);
    internal::LineReader reader(out);
    Json a = next_message(reader);
    assert(a["id"] == "a");
    assert(a["result"]["content"][0]["text"] == "done");
    Json b = next_message(reader);
    assert(b["id"] == "b");
    assert(b["result"]["content"][0]["text"] == "hi");
    Json c = next_message(reader);
    assert(c["id"].is_null());
    assert(c["error"]["code"] == protocol::PARSE_ERROR);
    std::string line;
    assert(reader.read_line(line, 1000ms) == internal::ReadStatus::Eof);

    ::close(w.to_server[0]);
    std::cout << "PASSED\n";
}

int main()
{
    std::cout << "Stdio server tests\n";
    test_cancel_while_queueing();
    test_eof_drains_pending_requests();
    std::cout << "All stdio server tests passed\n";
    return 0;
}
