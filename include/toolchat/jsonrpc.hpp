// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#pragma once

/// @file jsonrpc.hpp
/// @brief JSON-RPC 2.0 messages and a bidirectional client over a framed transport

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <toolchat/transport.hpp>
#include <toolchat/types.hpp>
#include <type_traits>
#include <variant>

namespace toolchat
{

// =============================================================================
// Errors
// =============================================================================

/// Error codes carried in error responses and in JsonRpcError
enum class JsonRpcErrorCode : int
{
    ParseError = -32700,
    InvalidRequest = -32600,
    MethodNotFound = -32601,
    InvalidParams = -32602,
    InternalError = -32603,
    ServerError = -32000,

    // Never sent on the wire: how a pending request ended locally
    RequestCancelled = -32800,
    ConnectionClosed = -32801,
    Timeout = -32802,
};

/// A request that failed: error response from the peer, timeout,
/// cancellation or loss of the connection
class JsonRpcError : public std::runtime_error
{
  public:
    JsonRpcError(JsonRpcErrorCode code, const std::string& message, json data = nullptr)
        : std::runtime_error(message), code_(code), data_(std::move(data))
    {
    }

    JsonRpcErrorCode code() const
    {
        return code_;
    }

    /// Optional `data` member of the error object
    const json& data() const
    {
        return data_;
    }

  private:
    JsonRpcErrorCode code_;
    json data_;
};

// =============================================================================
// Wire Messages
// =============================================================================

/// Request IDs may be strings or integers; ours are always integers
using JsonRpcId = std::variant<std::string, int64_t>;

/// @throws JsonRpcError (InvalidRequest) unless `j` is a string or an integer
JsonRpcId parse_id(const json& j);

json id_value(const JsonRpcId& id);

std::string to_string(const JsonRpcId& id);

/// A request, or a notification when there is no id
struct JsonRpcRequest
{
    std::string method;
    json params;
    std::optional<JsonRpcId> id;

    bool is_notification() const
    {
        return !id;
    }
};

struct JsonRpcErrorObject
{
    int code = 0;
    std::string message;
    json data;
};

/// Exactly one of result and error is set on a well-formed response
struct JsonRpcResponse
{
    JsonRpcId id;
    std::optional<json> result;
    std::optional<JsonRpcErrorObject> error;

    bool is_error() const
    {
        return error.has_value();
    }
};

void to_json(json& j, const JsonRpcRequest& r);
void from_json(const json& j, JsonRpcRequest& r);
void to_json(json& j, const JsonRpcErrorObject& e);
void from_json(const json& j, JsonRpcErrorObject& e);
void to_json(json& j, const JsonRpcResponse& r);
void from_json(const json& j, JsonRpcResponse& r);

/// What an incoming message is, judged by its members alone
enum class MessageKind
{
    Request,
    Notification,
    Response,
    Unknown,
};

MessageKind classify_message(const json& message);

// =============================================================================
// Pending Requests
// =============================================================================

/// Promise of one outgoing request, resolved at most once
struct PendingRequest
{
    std::promise<json> promise;
    /// time_point::max() when the request never times out
    std::chrono::steady_clock::time_point deadline = std::chrono::steady_clock::time_point::max();

    static std::shared_ptr<PendingRequest> with_timeout(std::chrono::milliseconds timeout)
    {
        auto pending = std::make_shared<PendingRequest>();
        if (timeout.count() > 0)
            pending->deadline = std::chrono::steady_clock::now() + timeout;
        return pending;
    }
};

/// An in-flight request: its ID (for cancel()) and the future for its result
struct PendingCall
{
    int64_t id = 0;
    std::future<json> future;
};

// =============================================================================
// JSON-RPC Client
// =============================================================================

/// Handler for incoming notifications
using NotificationHandler = std::function<void(const std::string& method, const json& params)>;

/// Handler for incoming requests (returns response result or throws)
using RequestHandler = std::function<json(const std::string& method, const json& params)>;

/// Called once when the peer closes the stream
using CloseHandler = std::function<void()>;

/// JSON-RPC 2.0 client with bidirectional communication
///
/// Features:
/// - Send requests and await responses (with per-request timeout)
/// - Cancel an in-flight request (`notifications/cancelled`)
/// - Send notifications (fire-and-forget)
/// - Route incoming notifications by method, with a fallback handler
/// - Handle incoming requests (server-to-client calls); `ping` is answered by default
/// - Background read loop with automatic dispatch
///
/// Malformed frames and messages of unknown shape are logged and dropped.
/// When the stream closes every pending request fails with ConnectionClosed.
class JsonRpcClient
{
  public:
    /// @param transport The underlying transport (takes ownership)
    explicit JsonRpcClient(
        std::unique_ptr<ITransport> transport, Framing framing = Framing::NewlineDelimited
    );

    ~JsonRpcClient();

    // Non-copyable, non-movable (due to mutex/thread)
    JsonRpcClient(const JsonRpcClient&) = delete;
    JsonRpcClient& operator=(const JsonRpcClient&) = delete;
    JsonRpcClient(JsonRpcClient&&) = delete;
    JsonRpcClient& operator=(JsonRpcClient&&) = delete;

    /// Start the background read and timeout threads
    void start();

    /// Stop the client, close the transport and fail pending requests
    void stop();

    bool is_running() const
    {
        return running_;
    }

    /// Register a handler for one notification method (replaces any previous one)
    void on_notification(const std::string& method, NotificationHandler handler);

    /// Handler for notifications without a method-specific handler
    void set_notification_handler(NotificationHandler handler);

    void set_request_handler(RequestHandler handler);
    void set_close_handler(CloseHandler handler);

    /// Send a request
    /// @param timeout Request timeout (0 = no timeout)
    /// @return Future that resolves to the result or throws JsonRpcError
    /// @throws JsonRpcError (ConnectionClosed) if the client is not running
    std::future<json> invoke(
        const std::string& method,
        const json& params = nullptr,
        std::chrono::milliseconds timeout = std::chrono::milliseconds{30000}
    );

    /// Same as invoke(), also yielding the request ID for cancel()
    PendingCall invoke_with_id(
        const std::string& method,
        const json& params = nullptr,
        std::chrono::milliseconds timeout = std::chrono::milliseconds{30000}
    );

    /// Send a request and wait for the response
    template <typename T = json>
    T invoke_sync(
        const std::string& method,
        const json& params = nullptr,
        std::chrono::milliseconds timeout = std::chrono::milliseconds{30000}
    )
    {
        auto call = invoke_with_id(method, params, timeout);

        if (timeout.count() > 0)
        {
            auto status = call.future.wait_for(timeout);
            // A response that lands in the meantime has already claimed the slot
            if (status == std::future_status::timeout &&
                fail_pending_request(call.id, JsonRpcErrorCode::Timeout, "Request timed out"))
                throw JsonRpcError(JsonRpcErrorCode::Timeout, "Request timed out");
        }

        auto result = call.future.get();

        if constexpr (std::is_same_v<T, json>)
            return result;
        else
            return result.get<T>();
    }

    /// Abandon a pending request: its future fails with RequestCancelled and
    /// the server is sent `notifications/cancelled`
    /// @return false if the request was no longer pending
    bool cancel(int64_t id, const std::string& reason = {});

    /// Send a notification (no response expected)
    void notify(const std::string& method, const json& params = nullptr);

    void send_response(const JsonRpcId& id, const json& result);

    void send_error_response(
        const JsonRpcId& id, int code, const std::string& message, const json& data = nullptr
    );

    /// Number of requests awaiting a response
    size_t pending_count() const;

  private:
    void timeout_loop();
    void read_loop();
    void dispatch_message(const json& message);
    void handle_response(const json& message);
    void handle_notification(const JsonRpcRequest& request);
    void handle_request(const JsonRpcRequest& request);
    void send_message(const json& message);

    /// Remove a slot and fail it; returns false if it was not pending
    bool fail_pending_request(int64_t id, JsonRpcErrorCode code, const std::string& message);
    void fail_all_pending(JsonRpcErrorCode code, const std::string& message);

    std::unique_ptr<ITransport> transport_;
    MessageFramer framer_;
    std::atomic<int64_t> next_id_;
    std::atomic<bool> running_;
    std::atomic<bool> started_;

    std::thread read_thread_;
    std::thread timeout_thread_;
    std::mutex write_mutex_;

    mutable std::mutex pending_mutex_;
    std::condition_variable pending_cv_;
    std::map<int64_t, std::shared_ptr<PendingRequest>> pending_requests_;

    std::mutex handlers_mutex_;
    std::map<std::string, NotificationHandler> notification_handlers_;
    NotificationHandler fallback_notification_handler_;
    RequestHandler request_handler_;
    CloseHandler close_handler_;
};

} // namespace toolchat
