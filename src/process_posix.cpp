// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT
//
// Process management code borrowed from claude-agent-sdk-cpp:
// https://github.com/0xeb/claude-agent-sdk-cpp
// See: src/internal/subprocess/process_posix.cpp

// POSIX implementation of subprocess management (Linux and macOS)

#include <cstring>
#include <errno.h>
#include <fcntl.h>
#include <mutex>
#include <signal.h>
#include <sys/wait.h>
#include <thread>
#include <toolchat/process.hpp>
#include <unistd.h>
#include <utility>

extern "C" char** environ;

namespace toolchat
{

// =============================================================================
// Platform-specific handle structures
// =============================================================================

struct PipeHandle
{
    int fd = -1;

    ~PipeHandle()
    {
        if (fd >= 0)
            ::close(fd);
    }
};

struct ProcessHandle
{
    pid_t pid = 0;
    bool running = false;
    int exit_code = -1;
};

namespace
{

std::string errno_message(int err = errno)
{
    return std::strerror(err);
}

/// Both ends of a pipe, closed on destruction unless released
struct PipePair
{
    int read_fd = -1;
    int write_fd = -1;

    PipePair() = default;
    PipePair(const PipePair&) = delete;
    PipePair& operator=(const PipePair&) = delete;

    ~PipePair()
    {
        close_read();
        close_write();
    }

    /// Create the pipe with close-on-exec set on both ends, so the fds of one
    /// server never leak into another server's child
    void open(const char* what)
    {
        int fds[2] = {-1, -1};
        if (::pipe(fds) != 0)
            throw ProcessError(std::string("Failed to create ") + what + " pipe: " + errno_message());
        read_fd = fds[0];
        write_fd = fds[1];
        ::fcntl(read_fd, F_SETFD, FD_CLOEXEC);
        ::fcntl(write_fd, F_SETFD, FD_CLOEXEC);
    }

    int release_read()
    {
        return std::exchange(read_fd, -1);
    }

    int release_write()
    {
        return std::exchange(write_fd, -1);
    }

    void close_read()
    {
        if (read_fd >= 0)
            ::close(std::exchange(read_fd, -1));
    }

    void close_write()
    {
        if (write_fd >= 0)
            ::close(std::exchange(write_fd, -1));
    }
};

/// Writing to a pipe whose reader exited must surface as EPIPE, not kill us
void ignore_sigpipe()
{
    static std::once_flag once;
    std::call_once(once, [] { ::signal(SIGPIPE, SIG_IGN); });
}

/// Build the child's environment before fork(), since the child may only call
/// async-signal-safe functions
std::vector<std::string> build_environment(const ProcessOptions& options)
{
    std::map<std::string, std::string> merged;
    if (options.inherit_environment && environ)
    {
        for (char** entry = environ; *entry; ++entry)
        {
            std::string kv(*entry);
            auto eq = kv.find('=');
            if (eq != std::string::npos)
                merged[kv.substr(0, eq)] = kv.substr(eq + 1);
        }
    }
    for (const auto& [key, value] : options.environment)
        merged[key] = value;

    std::vector<std::string> result;
    result.reserve(merged.size());
    for (const auto& [key, value] : merged)
        result.push_back(key + "=" + value);
    return result;
}

[[noreturn]] void child_fail(int error_fd)
{
    int err = errno;
    (void)::write(error_fd, &err, sizeof(err));
    _exit(127);
}

int decode_wait_status(int status)
{
    if (WIFEXITED(status))
        return WEXITSTATUS(status);
    if (WIFSIGNALED(status))
        return 128 + WTERMSIG(status);
    return -1;
}

} // namespace

// =============================================================================
// ReadPipe
// =============================================================================

ReadPipe::ReadPipe() : handle_(std::make_unique<PipeHandle>()) {}

ReadPipe::~ReadPipe()
{
    close();
}

ReadPipe::ReadPipe(ReadPipe&&) noexcept = default;
ReadPipe& ReadPipe::operator=(ReadPipe&&) noexcept = default;

size_t ReadPipe::read(char* buffer, size_t size)
{
    if (!is_open())
        throw ProcessError("Pipe is not open");

    while (true)
    {
        ssize_t n = ::read(handle_->fd, buffer, size);
        if (n >= 0)
            return static_cast<size_t>(n);
        if (errno != EINTR)
            throw ProcessError("Read failed: " + errno_message());
    }
}

std::string ReadPipe::read_line(size_t max_size)
{
    std::string line;
    char ch;
    while (line.size() < max_size && read(&ch, 1) == 1)
    {
        line.push_back(ch);
        if (ch == '\n')
            break;
    }
    return line;
}

void ReadPipe::close()
{
    if (handle_ && handle_->fd >= 0)
        ::close(std::exchange(handle_->fd, -1));
}

bool ReadPipe::is_open() const
{
    return handle_ && handle_->fd >= 0;
}

// =============================================================================
// WritePipe
// =============================================================================

WritePipe::WritePipe() : handle_(std::make_unique<PipeHandle>()) {}

WritePipe::~WritePipe()
{
    close();
}

WritePipe::WritePipe(WritePipe&&) noexcept = default;
WritePipe& WritePipe::operator=(WritePipe&&) noexcept = default;

size_t WritePipe::write(const char* data, size_t size)
{
    if (!is_open())
        throw ProcessError("Pipe is not open");

    size_t total = 0;
    while (total < size)
    {
        ssize_t n = ::write(handle_->fd, data + total, size - total);
        if (n < 0)
        {
            if (errno == EINTR)
                continue;
            if (errno == EPIPE)
                throw ProcessError("Broken pipe (process closed stdin)");
            throw ProcessError("Write failed: " + errno_message());
        }
        total += static_cast<size_t>(n);
    }
    return total;
}

size_t WritePipe::write(const std::string& data)
{
    return write(data.data(), data.size());
}

void WritePipe::close()
{
    if (handle_ && handle_->fd >= 0)
        ::close(std::exchange(handle_->fd, -1));
}

bool WritePipe::is_open() const
{
    return handle_ && handle_->fd >= 0;
}

// =============================================================================
// Process
// =============================================================================

Process::Process()
    : handle_(std::make_unique<ProcessHandle>()), stdin_(std::make_unique<WritePipe>()),
      stdout_(std::make_unique<ReadPipe>()), stderr_(std::make_unique<ReadPipe>())
{
}

Process::~Process()
{
    if (stdin_)
        stdin_->close();
    if (stdout_)
        stdout_->close();
    if (stderr_)
        stderr_->close();

    if (handle_ && handle_->running)
    {
        try
        {
            shutdown();
        }
        catch (const ProcessError&)
        {
            // Child already reaped elsewhere
        }
    }
}

Process::Process(Process&&) noexcept = default;
Process& Process::operator=(Process&&) noexcept = default;

void Process::spawn(
    const std::string& executable,
    const std::vector<std::string>& args,
    const ProcessOptions& options
)
{
    if (handle_->running)
        throw ProcessError("Process already spawned");

    ignore_sigpipe();

    PipePair in, out, err, exec_error;
    if (options.redirect_stdin)
        in.open("stdin");
    if (options.redirect_stdout)
        out.open("stdout");
    if (options.redirect_stderr)
        err.open("stderr");
    exec_error.open("error");

    std::vector<std::string> env_storage = build_environment(options);
    std::vector<char*> envp;
    envp.reserve(env_storage.size() + 1);
    for (auto& entry : env_storage)
        envp.push_back(entry.data());
    envp.push_back(nullptr);

    std::vector<char*> argv;
    argv.reserve(args.size() + 2);
    argv.push_back(const_cast<char*>(executable.c_str()));
    for (const auto& arg : args)
        argv.push_back(const_cast<char*>(arg.c_str()));
    argv.push_back(nullptr);

    pid_t pid = ::fork();
    if (pid < 0)
        throw ProcessError("Failed to fork process: " + errno_message());

    if (pid == 0)
    {
        // Child: dup2 clears FD_CLOEXEC on the standard descriptors
        if (options.redirect_stdin && ::dup2(in.read_fd, STDIN_FILENO) < 0)
            child_fail(exec_error.write_fd);
        if (options.redirect_stdout && ::dup2(out.write_fd, STDOUT_FILENO) < 0)
            child_fail(exec_error.write_fd);
        if (options.redirect_stderr && ::dup2(err.write_fd, STDERR_FILENO) < 0)
            child_fail(exec_error.write_fd);

        if (!options.working_directory.empty() && ::chdir(options.working_directory.c_str()) != 0)
            child_fail(exec_error.write_fd);

        environ = envp.data();
        ::execvp(executable.c_str(), argv.data());
        child_fail(exec_error.write_fd);
    }

    // Parent: a successful exec closes the error pipe without writing to it
    exec_error.close_write();
    int child_errno = 0;
    ssize_t error_bytes;
    do
    {
        error_bytes = ::read(exec_error.read_fd, &child_errno, sizeof(child_errno));
    } while (error_bytes < 0 && errno == EINTR);

    if (error_bytes > 0)
    {
        ::waitpid(pid, nullptr, 0);
        throw ProcessError(
            "Failed to execute '" + executable + "': " + errno_message(child_errno)
        );
    }

    if (options.redirect_stdin)
        stdin_->handle_->fd = in.release_write();
    if (options.redirect_stdout)
        stdout_->handle_->fd = out.release_read();
    if (options.redirect_stderr)
        stderr_->handle_->fd = err.release_read();

    handle_->pid = pid;
    handle_->running = true;
    handle_->exit_code = -1;
}

WritePipe& Process::stdin_pipe()
{
    if (!stdin_ || !stdin_->is_open())
        throw ProcessError("stdin pipe not available");
    return *stdin_;
}

ReadPipe& Process::stdout_pipe()
{
    if (!stdout_ || !stdout_->is_open())
        throw ProcessError("stdout pipe not available");
    return *stdout_;
}

ReadPipe& Process::stderr_pipe()
{
    if (!stderr_ || !stderr_->is_open())
        throw ProcessError("stderr pipe not available");
    return *stderr_;
}

void Process::close_stdin()
{
    if (stdin_)
        stdin_->close();
}

bool Process::is_running() const
{
    if (!handle_ || handle_->pid == 0 || !handle_->running)
        return false;

    // Signal 0 probes for existence; an unreaped zombie still counts
    if (::kill(handle_->pid, 0) == 0)
        return true;
    return errno != ESRCH;
}

std::optional<int> Process::try_wait()
{
    if (!handle_ || handle_->pid == 0 || !handle_->running)
        return handle_ ? handle_->exit_code : -1;

    int status = 0;
    pid_t result = ::waitpid(handle_->pid, &status, WNOHANG);
    if (result == 0)
        return std::nullopt;
    if (result < 0)
        throw ProcessError("waitpid failed: " + errno_message());

    handle_->exit_code = decode_wait_status(status);
    handle_->running = false;
    return handle_->exit_code;
}

int Process::wait()
{
    if (!handle_ || handle_->pid == 0 || !handle_->running)
        return handle_ ? handle_->exit_code : -1;

    int status = 0;
    pid_t result;
    do
    {
        result = ::waitpid(handle_->pid, &status, 0);
    } while (result < 0 && errno == EINTR);

    if (result != handle_->pid)
        throw ProcessError("waitpid failed: " + errno_message());

    handle_->exit_code = decode_wait_status(status);
    handle_->running = false;
    return handle_->exit_code;
}

void Process::terminate()
{
    if (handle_ && handle_->pid > 0 && handle_->running)
        ::kill(handle_->pid, SIGTERM);
}

void Process::kill()
{
    if (handle_ && handle_->pid > 0 && handle_->running)
        ::kill(handle_->pid, SIGKILL);
}

int Process::shutdown(std::chrono::milliseconds grace)
{
    if (!handle_ || handle_->pid == 0)
        return -1;
    if (!handle_->running)
        return handle_->exit_code;

    terminate();

    auto deadline = std::chrono::steady_clock::now() + grace;
    while (std::chrono::steady_clock::now() < deadline)
    {
        if (auto code = try_wait())
            return *code;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }

    kill();
    return wait();
}

int Process::pid() const
{
    return handle_ ? static_cast<int>(handle_->pid) : 0;
}

} // namespace toolchat
