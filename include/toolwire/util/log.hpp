#pragma once
#include <functional>
#include <string>

namespace toolwire::util::log
{

enum class Level
{
    Debug,
    Info,
    Warning,
    Error
};

const char* to_string(Level level);

/// Case-insensitive; "WARN" is accepted. Unknown names map to Info.
Level level_from_string(const std::string& name);

/// Receives every record at or above the threshold.
using Sink = std::function<void(Level level, const std::string& logger, const std::string& message)>;

/// Process-wide threshold. Records below it are dropped before formatting.
void set_level(Level level);
Level level();

/// Replace the output sink (default writes one line per record to stderr).
void set_sink(Sink sink);
void reset_sink();

/// Named logger handle; cheap to copy.
class Logger
{
  public:
    explicit Logger(std::string name) : name_(std::move(name)) {}

    void log(Level level, const std::string& message) const;

    void debug(const std::string& message) const
    {
        log(Level::Debug, message);
    }
    void info(const std::string& message) const
    {
        log(Level::Info, message);
    }
    void warning(const std::string& message) const
    {
        log(Level::Warning, message);
    }
    void error(const std::string& message) const
    {
        log(Level::Error, message);
    }

    bool enabled(Level level) const;

    const std::string& name() const
    {
        return name_;
    }

  private:
    std::string name_;
};

} // namespace toolwire::util::log
