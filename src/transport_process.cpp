// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#include <toolchat/log.hpp>
#include <toolchat/transport_process.hpp>

namespace toolchat
{

ChildProcessTransport::ChildProcessTransport(
    std::string server_name,
    const std::string& command,
    const std::vector<std::string>& args,
    ProcessOptions options
)
    : server_name_(std::move(server_name)), open_(false)
{
    options.redirect_stdin = true;
    options.redirect_stdout = true;
    options.redirect_stderr = true;

    process_.spawn(command, args, options);
    open_ = true;
    log::get()->debug("Spawned tool server {} (pid {})", server_name_, process_.pid());

    stderr_thread_ = std::thread([this] { drain_stderr(); });
}

ChildProcessTransport::~ChildProcessTransport()
{
    close();
    if (stderr_thread_.joinable())
        stderr_thread_.join();
}

size_t ChildProcessTransport::read(char* buffer, size_t size)
{
    if (!open_)
        throw ConnectionClosedError();

    try
    {
        return process_.stdout_pipe().read(buffer, size);
    }
    catch (const ProcessError& e)
    {
        open_ = false;
        throw TransportError(e.what());
    }
}

void ChildProcessTransport::write(const char* data, size_t size)
{
    if (!open_)
        throw ConnectionClosedError();

    try
    {
        process_.stdin_pipe().write(data, size);
    }
    catch (const ProcessError& e)
    {
        open_ = false;
        throw ConnectionClosedError(std::string("Write to tool server failed: ") + e.what());
    }
}

void ChildProcessTransport::close()
{
    std::lock_guard<std::mutex> lock(close_mutex_);
    open_ = false;

    // The stdout pipe stays open until destruction: a reader may still be
    // blocked on it and sees EOF once the child is gone.
    process_.close_stdin();

    try
    {
        if (process_.is_running())
        {
            int code = process_.shutdown(grace_);
            log::get()->debug("Tool server {} exited with code {}", server_name_, code);
        }
    }
    catch (const ProcessError& e)
    {
        log::get()->warn("Failed to stop tool server {}: {}", server_name_, e.what());
    }
}

void ChildProcessTransport::drain_stderr()
{
    try
    {
        auto& pipe = process_.stderr_pipe();
        while (true)
        {
            auto line = pipe.read_line();
            if (line.empty())
                break;
            while (!line.empty() && (line.back() == '\n' || line.back() == '\r'))
                line.pop_back();
            log::get()->debug("[{}] {}", server_name_, line);
        }
    }
    catch (const ProcessError& e)
    {
        log::get()->debug("Stopped reading stderr of {}: {}", server_name_, e.what());
    }
}

} // namespace toolchat
