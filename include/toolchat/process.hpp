// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#pragma once

/// @file process.hpp
/// @brief POSIX child process management for tool servers

#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace toolchat
{

struct ProcessHandle;
struct PipeHandle;

/// Exception thrown when process operations fail
class ProcessError : public std::runtime_error
{
  public:
    explicit ProcessError(const std::string& message) : std::runtime_error(message) {}
};

// =============================================================================
// Pipes
// =============================================================================

/// Read end of a pipe connected to a child's stdout or stderr
class ReadPipe
{
  public:
    ReadPipe();
    ~ReadPipe();

    ReadPipe(const ReadPipe&) = delete;
    ReadPipe& operator=(const ReadPipe&) = delete;
    ReadPipe(ReadPipe&&) noexcept;
    ReadPipe& operator=(ReadPipe&&) noexcept;

    /// Read up to size bytes, blocking until data or EOF
    /// @return Number of bytes read, 0 on EOF
    /// @throws ProcessError on read failure
    size_t read(char* buffer, size_t size);

    /// Read a line including the trailing newline; partial line on EOF
    std::string read_line(size_t max_size = 4096);

    void close();
    bool is_open() const;

  private:
    friend class Process;
    std::unique_ptr<PipeHandle> handle_;
};

/// Write end of a pipe connected to a child's stdin
class WritePipe
{
  public:
    WritePipe();
    ~WritePipe();

    WritePipe(const WritePipe&) = delete;
    WritePipe& operator=(const WritePipe&) = delete;
    WritePipe(WritePipe&&) noexcept;
    WritePipe& operator=(WritePipe&&) noexcept;

    /// Write all bytes
    /// @throws ProcessError on failure (including a closed reader)
    size_t write(const char* data, size_t size);
    size_t write(const std::string& data);

    void close();
    bool is_open() const;

  private:
    friend class Process;
    std::unique_ptr<PipeHandle> handle_;
};

// =============================================================================
// Process
// =============================================================================

/// Options for spawning a subprocess
struct ProcessOptions
{
    /// Working directory (empty = inherit)
    std::string working_directory;

    /// Variables set on top of (or instead of) the parent environment
    std::map<std::string, std::string> environment;

    bool inherit_environment = true;
    bool redirect_stdin = true;
    bool redirect_stdout = true;
    bool redirect_stderr = false;
};

/// A spawned child process with optional piped standard streams
///
/// The destructor closes the pipes and terminates the child if it is still
/// running, so an owning object never leaks a process.
///
/// @code
/// Process proc;
/// proc.spawn("cat", {});
/// proc.stdin_pipe().write("hello\n");
/// std::string line = proc.stdout_pipe().read_line();
/// proc.shutdown();
/// @endcode
class Process
{
  public:
    Process();
    ~Process();

    Process(const Process&) = delete;
    Process& operator=(const Process&) = delete;
    Process(Process&&) noexcept;
    Process& operator=(Process&&) noexcept;

    /// Spawn a new process, searching PATH for the executable
    /// @throws ProcessError if pipes cannot be created or exec fails
    void spawn(
        const std::string& executable,
        const std::vector<std::string>& args,
        const ProcessOptions& options = {}
    );

    /// @throws ProcessError if stdin was not redirected or is closed
    WritePipe& stdin_pipe();
    /// @throws ProcessError if stdout was not redirected or is closed
    ReadPipe& stdout_pipe();
    /// @throws ProcessError if stderr was not redirected or is closed
    ReadPipe& stderr_pipe();

    /// Close the child's stdin so it sees EOF; no-op if not redirected
    void close_stdin();

    bool is_running() const;

    /// Non-blocking wait; exit code if terminated, nullopt if still running
    std::optional<int> try_wait();

    /// Blocking wait for termination; signals map to 128 + signo
    int wait();

    /// Send SIGTERM
    void terminate();

    /// Send SIGKILL
    void kill();

    /// SIGTERM, wait up to `grace`, then SIGKILL and reap
    /// @return Exit code, or -1 if nothing was spawned
    int shutdown(std::chrono::milliseconds grace = std::chrono::milliseconds{2000});

    /// Process ID, or 0 if not spawned
    int pid() const;

  private:
    std::unique_ptr<ProcessHandle> handle_;
    std::unique_ptr<WritePipe> stdin_;
    std::unique_ptr<ReadPipe> stdout_;
    std::unique_ptr<ReadPipe> stderr_;
};

} // namespace toolchat
