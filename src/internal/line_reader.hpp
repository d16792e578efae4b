#pragma once

#include "process.hpp"

#include <chrono>
#include <optional>
#include <string>

namespace toolwire::internal
{

enum class ReadStatus
{
    Line,
    Timeout,
    Eof
};

/// Buffered newline framing on top of a ReadPipe.
///
/// A trailing "\r" is stripped from each line. A final line without a
/// newline is returned before Eof is reported.
class LineReader
{
  public:
    static constexpr size_t kDefaultMaxLine = 16 * 1024 * 1024;

    explicit LineReader(process::ReadPipe& pipe, size_t max_line = kDefaultMaxLine)
        : pipe_(pipe), max_line_(max_line)
    {
    }

    /// @param timeout std::nullopt blocks until a line or EOF arrives
    /// @throws process::ProcessError on read failure or an oversized line
    ReadStatus read_line(std::string& line,
                         std::optional<std::chrono::milliseconds> timeout = std::nullopt);

  private:
    bool take_line(std::string& line);

    process::ReadPipe& pipe_;
    size_t max_line_;
    std::string buffer_;
    bool eof_{false};
};

} // namespace toolwire::internal
