// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#pragma once

/// @file session.hpp
/// @brief ToolServerSession: one MCP connection to an external tool server

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <stdexcept>
#include <string>
#include <toolchat/config.hpp>
#include <toolchat/jsonrpc.hpp>
#include <toolchat/types.hpp>
#include <vector>

namespace toolchat
{

/// Lifecycle of a tool server session
enum class SessionState
{
    Created,
    Initializing,
    Ready,
    Closed,
};

const char* to_string(SessionState state);

/// Thrown by requests issued while the session is not Ready
class ServerNotReadyError : public std::runtime_error
{
  public:
    ServerNotReadyError(const std::string& server, SessionState state)
        : std::runtime_error("Tool server " + server + " is not ready (" + to_string(state) + ")"),
          state_(state)
    {
    }

    SessionState state() const
    {
        return state_;
    }

  private:
    SessionState state_;
};

/// Creates the transport for a (re-)initialization
using TransportFactory = std::function<std::unique_ptr<ITransport>()>;

/// Observes state transitions, e.g. to show "loading" / "ready" per server
using StateListener = std::function<void(const std::string& server, SessionState state)>;

struct SessionOptions
{
    /// Timeout for each request, including the handshake
    std::chrono::milliseconds timeout{kDefaultServerTimeoutMs};
    Framing framing = Framing::NewlineDelimited;
};

/// One connection to an external tool server
///
/// The session owns its RPC client (and through it the transport and the
/// server process). init() performs the handshake:
///
///   initialize -> notifications/initialized -> tools/list -> prompts/list
///
/// List-changed notifications only mark the cached lists as stale; callers
/// decide when to refresh_tools() / refresh_prompts().
///
/// @code
/// auto session = ToolServerSession::from_config("git", config);
/// session->init();
/// for (const auto& tool : session->tools())
///     std::cout << tool.name << "\n";
/// auto result = session->request("tools/call", {{"name", "status"}, {"arguments", json::object()}});
/// @endcode
class ToolServerSession
{
  public:
    ToolServerSession(std::string name, TransportFactory factory, SessionOptions options = {});
    ~ToolServerSession();

    ToolServerSession(const ToolServerSession&) = delete;
    ToolServerSession& operator=(const ToolServerSession&) = delete;

    /// Session that launches the configured command with `${env:NAME}`
    /// substituted into its environment. Substitution happens on every
    /// launch, so a re-init() picks up changed variables.
    static std::shared_ptr<ToolServerSession> from_config(
        const std::string& name, const ToolServerConfig& config, EnvLookup lookup = process_env_lookup()
    );

    const std::string& name() const
    {
        return name_;
    }

    SessionState state() const
    {
        return state_.load();
    }

    std::chrono::milliseconds timeout() const
    {
        return options_.timeout;
    }

    void set_state_listener(StateListener listener);

    /// Connect and perform the handshake. No-op when already Ready.
    /// On failure the session stays Initializing and init() may be retried.
    /// @throws JsonRpcError, TransportError or ProcessError on failure
    void init();

    /// Send a request and wait for the result
    /// @throws ServerNotReadyError if not Ready
    /// @throws JsonRpcError on error response, timeout or close
    json request(const std::string& method, const json& params = nullptr);

    /// Send a request without waiting; the call can be cancelled by ID
    /// @throws ServerNotReadyError if not Ready
    PendingCall request_async(const std::string& method, const json& params = nullptr);

    /// Cancel an in-flight request issued through request_async()
    bool cancel(int64_t request_id, const std::string& reason = {});

    /// @throws ServerNotReadyError if not Ready
    void notify(const std::string& method, const json& params = nullptr);

    /// Capabilities from the last successful handshake
    std::optional<ServerCapabilities> capabilities() const;

    std::vector<ToolSpec> tools() const;
    std::vector<PromptSpec> prompts() const;

    bool tools_out_of_date() const
    {
        return tools_out_of_date_;
    }
    bool prompts_out_of_date() const
    {
        return prompts_out_of_date_;
    }

    /// Re-fetch the tool list and clear the stale flag
    std::vector<ToolSpec> refresh_tools();

    /// Re-fetch the prompt list and clear the stale flag
    std::vector<PromptSpec> refresh_prompts();

    /// Disconnect and stop the server process
    void close();

  private:
    void set_state(SessionState state);
    void install_handlers(JsonRpcClient& client);
    std::shared_ptr<JsonRpcClient> ready_client() const;
    std::shared_ptr<JsonRpcClient> take_client();
    json list_all(JsonRpcClient& client, const std::string& method, const std::string& key);

    std::string name_;
    TransportFactory factory_;
    SessionOptions options_;

    std::mutex lifecycle_mutex_;
    mutable std::mutex client_mutex_;
    std::shared_ptr<JsonRpcClient> client_;
    std::atomic<SessionState> state_;

    mutable std::shared_mutex cache_mutex_;
    std::optional<ServerCapabilities> capabilities_;
    std::vector<ToolSpec> tools_;
    std::vector<PromptSpec> prompts_;

    std::atomic<bool> tools_out_of_date_;
    std::atomic<bool> prompts_out_of_date_;

    std::mutex listener_mutex_;
    StateListener state_listener_;
};

} // namespace toolchat
