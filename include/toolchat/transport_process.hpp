// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#pragma once

#include <atomic>
#include <chrono>
#include <mutex>
#include <string>
#include <thread>
#include <toolchat/process.hpp>
#include <toolchat/transport.hpp>
#include <vector>

namespace toolchat
{

// =============================================================================
// ChildProcessTransport - Transport over a tool server's stdio
// =============================================================================

/// Transport that owns a spawned tool server and talks to its stdin/stdout
///
/// The child's stderr is drained on a background thread and logged at debug
/// level, tagged with the server name, so a chatty server can never block on a
/// full stderr pipe.
///
/// close() shuts the child down (SIGTERM, then SIGKILL after the grace period).
/// A read() blocked in another thread then observes EOF.
class ChildProcessTransport : public ITransport
{
  public:
    /// Spawn `command` and connect to its stdio
    /// @throws ProcessError if the process cannot be started
    ChildProcessTransport(
        std::string server_name,
        const std::string& command,
        const std::vector<std::string>& args,
        ProcessOptions options = {}
    );

    ~ChildProcessTransport() override;

    // Non-copyable, non-movable (owns threads)
    ChildProcessTransport(const ChildProcessTransport&) = delete;
    ChildProcessTransport& operator=(const ChildProcessTransport&) = delete;
    ChildProcessTransport(ChildProcessTransport&&) = delete;
    ChildProcessTransport& operator=(ChildProcessTransport&&) = delete;

    size_t read(char* buffer, size_t size) override;
    void write(const char* data, size_t size) override;
    void close() override;
    bool is_open() const override
    {
        return open_;
    }

    using ITransport::write;

    const std::string& server_name() const
    {
        return server_name_;
    }

    int pid() const
    {
        return process_.pid();
    }

    /// How long close() waits after SIGTERM before SIGKILL
    void set_shutdown_grace(std::chrono::milliseconds grace)
    {
        grace_ = grace;
    }

  private:
    void drain_stderr();

    std::string server_name_;
    Process process_;
    std::thread stderr_thread_;
    std::atomic<bool> open_;
    std::mutex close_mutex_;
    std::chrono::milliseconds grace_{2000};
};

} // namespace toolchat
