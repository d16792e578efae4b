/// @file tests/main_header/compile_test.cpp
/// @brief Compile test for the umbrella toolwire.hpp header
///
/// Including just <toolwire.hpp> gives access to every public component.

#include "toolwire.hpp"

#include <cassert>
#include <iostream>

using namespace toolwire;

int main()
{
    std::cout << "=== Main Header Compile Test ===" << std::endl;

    std::cout << "test_version_constants..." << std::endl;
    {
        std::string expected = std::to_string(VERSION_MAJOR) + "." + std::to_string(VERSION_MINOR) +
                               "." + std::to_string(VERSION_PATCH);
        assert(expected == VERSION_STRING);
    }
    std::cout << "  PASSED" << std::endl;

    std::cout << "test_server_stack_accessible..." << std::endl;
    {
        tools::ToolRegistry registry;
        auto workspace = builtin::register_report_tools(registry);
        server::McpServer srv(registry);
        assert(srv.session().phase == server::SessionPhase::NotInitialized);
        assert(srv.options().info.version == VERSION_STRING);
        (void)sizeof(server::StdioServer);
    }
    std::cout << "  PASSED" << std::endl;

    std::cout << "test_client_types_accessible..." << std::endl;
    {
        client::StdioClient client("unused");
        assert(!client.is_connected());
        (void)sizeof(client::RemoteToolSource);
    }
    std::cout << "  PASSED" << std::endl;

    std::cout << "test_agent_types_accessible..." << std::endl;
    {
        agent::LoopOptions options;
        assert(options.max_rounds == 5);
        auto dialect = llm::make_dialect("openai");
        assert(dialect != nullptr);
    }
    std::cout << "  PASSED" << std::endl;

    std::cout << "\n=== All tests PASSED ===" << std::endl;
    return 0;
}
