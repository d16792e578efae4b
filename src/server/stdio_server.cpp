#include "toolwire/server/stdio_server.hpp"

#include "../internal/line_reader.hpp"
#include "../internal/process.hpp"
#include "toolwire/util/log.hpp"

#include <chrono>
#include <deque>
#include <future>
#include <string>

namespace toolwire::server
{

namespace
{

const util::log::Logger& logger()
{
    static const util::log::Logger instance("toolwire.stdio");
    return instance;
}

// Input poll interval; bounds how long stop() waits for the loop
constexpr std::chrono::milliseconds kPollInterval{50};

bool is_blank(const std::string& line)
{
    return line.find_first_not_of(" \t\r") == std::string::npos;
}

std::string method_of(const std::string& line)
{
    Json j = Json::parse(line, nullptr, /*allow_exceptions=*/false);
    if (!j.is_object() || !j.contains("method") || !j["method"].is_string())
        return {};
    return j["method"].get<std::string>();
}

} // namespace

StdioServer::StdioServer(McpServer& server, int in_fd, int out_fd)
    : server_(server), in_fd_(in_fd), out_fd_(out_fd)
{
}

StdioServer::~StdioServer()
{
    stop();
}

bool StdioServer::run_loop()
{
    auto in = process::ReadPipe::adopt(in_fd_, /*owned=*/false);
    auto out = process::WritePipe::adopt(out_fd_, /*owned=*/false);
    internal::LineReader reader(in);

    std::deque<std::string> queue;
    bool eof = false;
    bool ok = true;

    // Reads one input line; cancellations bypass the queue
    auto pump = [&](std::chrono::milliseconds wait)
    {
        std::string line;
        switch (reader.read_line(line, wait))
        {
        case internal::ReadStatus::Eof:
            eof = true;
            return;
        case internal::ReadStatus::Timeout:
            return;
        case internal::ReadStatus::Line:
            break;
        }
        if (is_blank(line))
            return;
        if (method_of(line) != "notifications/cancelled")
        {
            queue.push_back(std::move(line));
            return;
        }
        // Notifications are never answered
        server_.handle_message(line);
    };

    try
    {
        while (!stop_requested_)
        {
            if (queue.empty())
            {
                if (eof)
                    break;
                pump(kPollInterval);
                continue;
            }

            std::string line = std::move(queue.front());
            queue.pop_front();

            std::optional<std::string> response;
            if (method_of(line) == "tools/call")
            {
                auto pending = std::async(std::launch::async,
                                          [this, line]() { return server_.handle_message(line); });
                while (pending.wait_for(std::chrono::milliseconds(0)) != std::future_status::ready)
                {
                    if (stop_requested_)
                    {
                        server_.terminate();
                        pending.wait();
                        break;
                    }
                    if (eof)
                    {
                        pending.wait();
                        break;
                    }
                    pump(std::chrono::milliseconds(10));
                }
                response = pending.get();
            }
            else
            {
                response = server_.handle_message(line);
            }

            if (response)
                out.write(*response + "\n");
        }
    }
    catch (const process::BrokenPipeError& e)
    {
        logger().error(std::string("output closed: ") + e.what());
        ok = false;
    }
    catch (const process::ProcessError& e)
    {
        logger().error(std::string("stdio failure: ") + e.what());
        ok = false;
    }

    if (eof)
        logger().info("input closed");
    server_.terminate();
    running_ = false;
    return ok;
}

bool StdioServer::run()
{
    if (running_)
        return false;

    running_ = true;
    stop_requested_ = false;
    return run_loop();
}

bool StdioServer::start_async()
{
    if (running_)
        return false;

    running_ = true;
    stop_requested_ = false;

    thread_ = std::thread([this]() { run_loop(); });

    return true;
}

void StdioServer::stop()
{
    stop_requested_ = true;

    if (thread_.joinable())
        thread_.join();
}

} // namespace toolwire::server
