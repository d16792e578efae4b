#pragma once
#include "toolwire/server/server.hpp"

#include <atomic>
#include <thread>

namespace toolwire::server
{

/**
 * Newline-delimited JSON-RPC transport over a pair of file descriptors
 * (stdin/stdout by default).
 *
 * Usage:
 *   tools::ToolRegistry registry;
 *   McpServer server(registry);
 *   StdioServer stdio(server);
 *   stdio.run();  // Blocking - runs until EOF or stop() is called
 *
 * Requests are executed one at a time in arrival order. While a tools/call
 * runs, input keeps being read: notifications/cancelled is applied to the
 * in-flight request at once and every other message is queued. Only
 * protocol output is written to the output descriptor; logs go to stderr.
 */
class StdioServer
{
  public:
    /// The descriptors are borrowed and never closed.
    explicit StdioServer(McpServer& server, int in_fd = 0, int out_fd = 1);

    ~StdioServer();

    StdioServer(const StdioServer&) = delete;
    StdioServer& operator=(const StdioServer&) = delete;

    /**
     * Serve until EOF on the input descriptor or stop().
     *
     * On EOF the request in progress is finished and answered, then the
     * session is terminated.
     *
     * @return false if the server was already running or the output broke
     */
    bool run();

    /// Run on a background thread. @return false if already running
    bool start_async();

    /// Ask the loop to exit and join the background thread, if any.
    /// Safe to call multiple times.
    void stop();

    bool running() const
    {
        return running_.load();
    }

  private:
    bool run_loop();

    McpServer& server_;
    int in_fd_;
    int out_fd_;
    std::atomic<bool> running_{false};
    std::atomic<bool> stop_requested_{false};
    std::thread thread_;
};

} // namespace toolwire::server
