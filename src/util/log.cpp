#include "toolwire/util/log.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace toolwire::util::log
{

namespace
{

std::atomic<Level> g_level{Level::Info};

std::mutex& sink_mutex()
{
    static std::mutex m;
    return m;
}

std::string timestamp()
{
    using clock = std::chrono::system_clock;
    auto now = clock::now();
    std::time_t t = clock::to_time_t(now);
    auto ms =
        std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() %
        1000;
    std::tm tm;
    gmtime_r(&t, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0')
        << ms << 'Z';
    return oss.str();
}

// stdout is reserved for protocol traffic, so the default sink is stderr
void stderr_sink(Level level, const std::string& logger, const std::string& message)
{
    std::cerr << timestamp() << ' ' << to_string(level) << ' ' << logger << ": " << message
              << std::endl;
}

Sink& sink()
{
    static Sink s = stderr_sink;
    return s;
}

} // namespace

const char* to_string(Level level)
{
    switch (level)
    {
    case Level::Debug:
        return "DEBUG";
    case Level::Info:
        return "INFO";
    case Level::Warning:
        return "WARNING";
    case Level::Error:
        return "ERROR";
    }
    return "INFO";
}

Level level_from_string(const std::string& name)
{
    std::string upper = name;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (upper == "DEBUG")
        return Level::Debug;
    if (upper == "WARNING" || upper == "WARN")
        return Level::Warning;
    if (upper == "ERROR" || upper == "CRITICAL")
        return Level::Error;
    return Level::Info;
}

void set_level(Level level)
{
    g_level.store(level);
}

Level level()
{
    return g_level.load();
}

void set_sink(Sink s)
{
    std::lock_guard<std::mutex> lock(sink_mutex());
    sink() = s ? std::move(s) : Sink(stderr_sink);
}

void reset_sink()
{
    set_sink(nullptr);
}

bool Logger::enabled(Level level) const
{
    return static_cast<int>(level) >= static_cast<int>(g_level.load());
}

void Logger::log(Level level, const std::string& message) const
{
    if (!enabled(level))
        return;
    std::lock_guard<std::mutex> lock(sink_mutex());
    sink()(level, name_, message);
}

} // namespace toolwire::util::log
