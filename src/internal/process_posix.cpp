// POSIX implementation of child processes and descriptor I/O

#include "process.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

namespace toolwire::process
{

struct PipeHandle
{
    int fd = -1;
    bool owned = true;

    void release()
    {
        if (fd >= 0 && owned)
            ::close(fd);
        fd = -1;
    }

    ~PipeHandle()
    {
        release();
    }
};

struct ProcessHandle
{
    pid_t pid = 0;
    std::optional<int> exit_code;
};

namespace
{

std::string errno_text(int err = errno)
{
    return std::strerror(err);
}

// Both ends of a pipe(2), closed on scope exit unless taken
struct FdPair
{
    int read_end = -1;
    int write_end = -1;

    ~FdPair()
    {
        drop(read_end);
        drop(write_end);
    }

    bool open()
    {
        int fds[2];
        if (::pipe(fds) != 0)
            return false;
        read_end = fds[0];
        write_end = fds[1];
        return true;
    }

    static void drop(int& fd)
    {
        if (fd >= 0)
            ::close(fd);
        fd = -1;
    }

    static int take(int& fd)
    {
        int out = fd;
        fd = -1;
        return out;
    }
};

void set_cloexec(int fd)
{
    ::fcntl(fd, F_SETFD, FD_CLOEXEC);
}

// Runs in the forked child: report errno to the parent and exit
[[noreturn]] void child_fail(int report_fd)
{
    int err = errno;
    ssize_t ignored = ::write(report_fd, &err, sizeof(err));
    (void)ignored;
    _exit(127);
}

int exit_code_of(int status)
{
    if (WIFEXITED(status))
        return WEXITSTATUS(status);
    if (WIFSIGNALED(status))
        return 128 + WTERMSIG(status);
    return -1;
}

} // namespace

// -----------------------------------------------------------------------------
// ReadPipe
// -----------------------------------------------------------------------------

ReadPipe::ReadPipe() : handle_(std::make_unique<PipeHandle>()) {}
ReadPipe::~ReadPipe() = default;
ReadPipe::ReadPipe(ReadPipe&&) noexcept = default;
ReadPipe& ReadPipe::operator=(ReadPipe&&) noexcept = default;

ReadPipe ReadPipe::adopt(int fd, bool owned)
{
    ReadPipe pipe;
    pipe.handle_->fd = fd;
    pipe.handle_->owned = owned;
    return pipe;
}

size_t ReadPipe::read(char* buffer, size_t size)
{
    if (!is_open())
        throw ProcessError("read on a closed descriptor");

    for (;;)
    {
        ssize_t n = ::read(handle_->fd, buffer, size);
        if (n >= 0)
            return static_cast<size_t>(n);
        if (errno == EINTR)
            continue;
        if (errno == EAGAIN || errno == EWOULDBLOCK)
            return 0;
        throw ProcessError("read failed: " + errno_text());
    }
}

bool ReadPipe::has_data(int timeout_ms)
{
    if (!is_open())
        return false;

    pollfd pfd{handle_->fd, POLLIN, 0};
    for (;;)
    {
        int ready = ::poll(&pfd, 1, timeout_ms < 0 ? -1 : timeout_ms);
        if (ready >= 0)
            return ready > 0 && (pfd.revents & (POLLIN | POLLHUP | POLLERR)) != 0;
        // Callers keep their own deadline, so a retry may overshoot slightly
        if (errno != EINTR)
            throw ProcessError("poll failed: " + errno_text());
    }
}

void ReadPipe::close()
{
    if (handle_)
        handle_->release();
}

bool ReadPipe::is_open() const
{
    return handle_ && handle_->fd >= 0;
}

// -----------------------------------------------------------------------------
// WritePipe
// -----------------------------------------------------------------------------

WritePipe::WritePipe() : handle_(std::make_unique<PipeHandle>()) {}
WritePipe::~WritePipe() = default;
WritePipe::WritePipe(WritePipe&&) noexcept = default;
WritePipe& WritePipe::operator=(WritePipe&&) noexcept = default;

WritePipe WritePipe::adopt(int fd, bool owned)
{
    WritePipe pipe;
    pipe.handle_->fd = fd;
    pipe.handle_->owned = owned;
    return pipe;
}

size_t WritePipe::write(const char* data, size_t size)
{
    if (!is_open())
        throw ProcessError("write on a closed descriptor");

    size_t done = 0;
    while (done < size)
    {
        ssize_t n = ::write(handle_->fd, data + done, size - done);
        if (n >= 0)
        {
            done += static_cast<size_t>(n);
            continue;
        }
        if (errno == EINTR)
            continue;
        if (errno == EPIPE)
            throw BrokenPipeError("reader closed its end of the pipe");
        throw ProcessError("write failed: " + errno_text());
    }
    return done;
}

size_t WritePipe::write(const std::string& data)
{
    return write(data.data(), data.size());
}

void WritePipe::close()
{
    if (handle_)
        handle_->release();
}

bool WritePipe::is_open() const
{
    return handle_ && handle_->fd >= 0;
}

// -----------------------------------------------------------------------------
// Process
// -----------------------------------------------------------------------------

Process::Process() : handle_(std::make_unique<ProcessHandle>()) {}

Process::~Process()
{
    stdin_.close();
    stdout_.close();
    if (handle_->pid > 0 && !handle_->exit_code)
    {
        ::kill(handle_->pid, SIGKILL);
        int status = 0;
        while (::waitpid(handle_->pid, &status, 0) < 0 && errno == EINTR)
        {
        }
    }
}

void Process::spawn(const std::string& executable, const std::vector<std::string>& args,
                    const ProcessOptions& options)
{
    if (handle_->pid > 0)
        throw ProcessError("process already spawned");

    FdPair in;
    FdPair out;
    FdPair report; // carries errno from a failed exec
    if (!in.open() || !out.open() || !report.open())
        throw ProcessError("pipe failed: " + errno_text());

    // Parent ends must not leak into the child or its descendants
    set_cloexec(in.write_end);
    set_cloexec(out.read_end);
    set_cloexec(report.write_end);

    // Built before fork: the child may only make async-signal-safe calls
    std::vector<char*> argv;
    argv.push_back(const_cast<char*>(executable.c_str()));
    for (const auto& arg : args)
        argv.push_back(const_cast<char*>(arg.c_str()));
    argv.push_back(nullptr);

    pid_t pid = ::fork();
    if (pid < 0)
        throw ProcessError("fork failed: " + errno_text());

    if (pid == 0)
    {
        if (::dup2(in.read_end, STDIN_FILENO) < 0 || ::dup2(out.write_end, STDOUT_FILENO) < 0)
            child_fail(report.write_end);

        if (!options.stderr_path.empty())
        {
            int log_fd = ::open(options.stderr_path.c_str(), O_WRONLY | O_CREAT | O_APPEND, 0644);
            if (log_fd < 0 || ::dup2(log_fd, STDERR_FILENO) < 0)
                child_fail(report.write_end);
        }

        if (!options.working_directory.empty() && ::chdir(options.working_directory.c_str()) != 0)
            child_fail(report.write_end);

        for (const auto& [key, value] : options.environment)
            ::setenv(key.c_str(), value.c_str(), 1);

        // The parent may ignore SIGPIPE; the child starts with the default
        ::signal(SIGPIPE, SIG_DFL);

        ::execvp(executable.c_str(), argv.data());
        child_fail(report.write_end);
    }

    FdPair::drop(report.write_end);
    FdPair::drop(in.read_end);
    FdPair::drop(out.write_end);

    int child_errno = 0;
    ssize_t got;
    do
    {
        got = ::read(report.read_end, &child_errno, sizeof(child_errno));
    } while (got < 0 && errno == EINTR);

    if (got > 0)
    {
        int status = 0;
        ::waitpid(pid, &status, 0);
        throw ProcessError("cannot execute '" + executable + "': " + errno_text(child_errno));
    }

    stdin_ = WritePipe::adopt(FdPair::take(in.write_end), true);
    stdout_ = ReadPipe::adopt(FdPair::take(out.read_end), true);
    handle_->pid = pid;
    handle_->exit_code.reset();
}

WritePipe& Process::stdin_pipe()
{
    if (!stdin_.is_open())
        throw ProcessError("child stdin is closed");
    return stdin_;
}

ReadPipe& Process::stdout_pipe()
{
    if (!stdout_.is_open())
        throw ProcessError("child stdout is closed");
    return stdout_;
}

void Process::close_stdin()
{
    stdin_.close();
}

std::optional<int> Process::try_wait()
{
    if (handle_->pid <= 0 || handle_->exit_code)
        return handle_->exit_code;

    int status = 0;
    pid_t result = ::waitpid(handle_->pid, &status, WNOHANG);
    if (result == 0)
        return std::nullopt;
    if (result < 0)
        throw ProcessError("waitpid failed: " + errno_text());

    handle_->exit_code = exit_code_of(status);
    return handle_->exit_code;
}

int Process::wait()
{
    if (handle_->pid <= 0)
        throw ProcessError("no child process");
    if (handle_->exit_code)
        return *handle_->exit_code;

    int status = 0;
    pid_t result;
    do
    {
        result = ::waitpid(handle_->pid, &status, 0);
    } while (result < 0 && errno == EINTR);
    if (result < 0)
        throw ProcessError("waitpid failed: " + errno_text());

    handle_->exit_code = exit_code_of(status);
    return *handle_->exit_code;
}

void Process::terminate()
{
    if (handle_->pid > 0 && !handle_->exit_code)
        ::kill(handle_->pid, SIGTERM);
}

void Process::kill()
{
    if (handle_->pid > 0 && !handle_->exit_code)
        ::kill(handle_->pid, SIGKILL);
}

int Process::pid() const
{
    return static_cast<int>(handle_->pid);
}

// -----------------------------------------------------------------------------
// PATH lookup
// -----------------------------------------------------------------------------

std::optional<std::string> find_executable(const std::string& name)
{
    namespace fs = std::filesystem;

    auto runnable = [](const fs::path& p)
    {
        std::error_code ec;
        return fs::is_regular_file(p, ec) && ::access(p.c_str(), X_OK) == 0;
    };

    if (name.empty())
        return std::nullopt;
    if (name.find('/') != std::string::npos)
        return runnable(name) ? std::optional<std::string>(fs::absolute(name).string())
                              : std::nullopt;

    const char* path = std::getenv("PATH");
    if (!path)
        return std::nullopt;

    std::string dirs(path);
    size_t start = 0;
    for (;;)
    {
        size_t end = dirs.find(':', start);
        std::string dir = dirs.substr(start, end == std::string::npos ? end : end - start);
        if (!dir.empty() && runnable(fs::path(dir) / name))
            return (fs::path(dir) / name).string();
        if (end == std::string::npos)
            return std::nullopt;
        start = end + 1;
    }
}

} // namespace toolwire::process
