// Child processes and descriptor I/O for the stdio client and server (POSIX)

#pragma once

#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace toolwire::process
{

struct ProcessHandle;
struct PipeHandle;

/// Raised when a descriptor or child-process operation fails
class ProcessError : public std::runtime_error
{
  public:
    explicit ProcessError(const std::string& message) : std::runtime_error(message) {}
};

/// Write side whose reader has gone away (EPIPE)
class BrokenPipeError : public ProcessError
{
  public:
    using ProcessError::ProcessError;
};

/// Readable descriptor: a child's stdout or an adopted fd
class ReadPipe
{
  public:
    ReadPipe();
    ~ReadPipe();

    ReadPipe(const ReadPipe&) = delete;
    ReadPipe& operator=(const ReadPipe&) = delete;
    ReadPipe(ReadPipe&&) noexcept;
    ReadPipe& operator=(ReadPipe&&) noexcept;

    /// Wrap an existing descriptor. With owned=false close() leaves it open.
    static ReadPipe adopt(int fd, bool owned);

    /// @return bytes read, 0 on EOF
    size_t read(char* buffer, size_t size);

    /// Wait until data (or EOF) is readable
    /// @param timeout_ms 0 polls, negative blocks
    bool has_data(int timeout_ms = 0);

    void close();
    bool is_open() const;

  private:
    friend class Process;
    std::unique_ptr<PipeHandle> handle_;
};

/// Writable descriptor: a child's stdin or an adopted fd
class WritePipe
{
  public:
    WritePipe();
    ~WritePipe();

    WritePipe(const WritePipe&) = delete;
    WritePipe& operator=(const WritePipe&) = delete;
    WritePipe(WritePipe&&) noexcept;
    WritePipe& operator=(WritePipe&&) noexcept;

    static WritePipe adopt(int fd, bool owned);

    /// Write everything, resuming after short writes
    /// @throws BrokenPipeError when the reader closed its end
    size_t write(const char* data, size_t size);
    size_t write(const std::string& data);

    void close();
    bool is_open() const;

  private:
    friend class Process;
    std::unique_ptr<PipeHandle> handle_;
};

struct ProcessOptions
{
    std::string working_directory;
    /// Added to (or overriding) the inherited environment
    std::map<std::string, std::string> environment;
    /// Child stderr is appended to this file when set, otherwise inherited
    std::string stderr_path;
};

/// Child process with its stdin and stdout connected to pipes.
/// Destroying a running Process kills and reaps it.
class Process
{
  public:
    Process();
    ~Process();

    Process(const Process&) = delete;
    Process& operator=(const Process&) = delete;

    /// @throws ProcessError if the pipes cannot be created or exec fails
    void spawn(const std::string& executable, const std::vector<std::string>& args,
               const ProcessOptions& options = {});

    WritePipe& stdin_pipe();
    ReadPipe& stdout_pipe();

    /// Signal EOF to the child; no-op if already closed
    void close_stdin();

    /// Reap without blocking. @return exit code (128+signal when killed)
    std::optional<int> try_wait();

    /// Block until the child exits
    int wait();

    /// SIGTERM
    void terminate();
    /// SIGKILL
    void kill();

    int pid() const;

  private:
    std::unique_ptr<ProcessHandle> handle_;
    WritePipe stdin_;
    ReadPipe stdout_;
};

/// Resolve `name` through PATH; names containing '/' are checked as paths
std::optional<std::string> find_executable(const std::string& name);

} // namespace toolwire::process
