#include "line_reader.hpp"

namespace toolwire::internal
{

bool LineReader::take_line(std::string& line)
{
    auto pos = buffer_.find('\n');
    if (pos == std::string::npos)
        return false;
    line.assign(buffer_, 0, pos);
    buffer_.erase(0, pos + 1);
    if (!line.empty() && line.back() == '\r')
        line.pop_back();
    return true;
}

ReadStatus LineReader::read_line(std::string& line,
                                 std::optional<std::chrono::milliseconds> timeout)
{
    using clock = std::chrono::steady_clock;
    auto deadline = timeout ? clock::now() + *timeout : clock::time_point::max();

    char chunk[4096];
    for (;;)
    {
        if (take_line(line))
            return ReadStatus::Line;

        if (eof_)
        {
            if (buffer_.empty())
                return ReadStatus::Eof;
            line.swap(buffer_);
            buffer_.clear();
            return ReadStatus::Line;
        }

        if (!pipe_.is_open())
        {
            eof_ = true;
            continue;
        }

        int wait_ms = -1;
        if (timeout)
        {
            auto remaining =
                std::chrono::duration_cast<std::chrono::milliseconds>(deadline - clock::now());
            if (remaining.count() < 0)
                return ReadStatus::Timeout;
            wait_ms = static_cast<int>(remaining.count());
        }
        if (!pipe_.has_data(wait_ms))
        {
            if (timeout && clock::now() >= deadline)
                return ReadStatus::Timeout;
            continue;
        }

        size_t n = pipe_.read(chunk, sizeof(chunk));
        if (n == 0)
        {
            eof_ = true;
            continue;
        }
        buffer_.append(chunk, n);
        if (buffer_.size() > max_line_ && buffer_.find('\n') == std::string::npos)
            throw process::ProcessError("line exceeds " + std::to_string(max_line_) + " bytes");
    }
}

} // namespace toolwire::internal
