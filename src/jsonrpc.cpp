// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#include <algorithm>
#include <toolchat/jsonrpc.hpp>
#include <toolchat/log.hpp>
#include <vector>

namespace toolchat
{

namespace
{

void reject(PendingRequest& pending, JsonRpcError error)
{
    try
    {
        pending.promise.set_exception(std::make_exception_ptr(std::move(error)));
    }
    catch (const std::future_error&)
    {
        // Already satisfied
    }
}

} // namespace

// =============================================================================
// Wire Messages
// =============================================================================

JsonRpcId parse_id(const json& j)
{
    if (j.is_string())
        return j.get<std::string>();
    if (j.is_number_integer())
        return j.get<int64_t>();
    throw JsonRpcError(JsonRpcErrorCode::InvalidRequest, "JSON-RPC id must be a string or an integer");
}

json id_value(const JsonRpcId& id)
{
    if (auto* n = std::get_if<int64_t>(&id))
        return *n;
    return std::get<std::string>(id);
}

std::string to_string(const JsonRpcId& id)
{
    if (auto* n = std::get_if<int64_t>(&id))
        return std::to_string(*n);
    return "\"" + std::get<std::string>(id) + "\"";
}

void to_json(json& j, const JsonRpcRequest& r)
{
    j = json{{"jsonrpc", "2.0"}, {"method", r.method}};
    if (r.id)
        j["id"] = id_value(*r.id);
    if (!r.params.is_null())
        j["params"] = r.params;
}

void from_json(const json& j, JsonRpcRequest& r)
{
    j.at("method").get_to(r.method);
    r.params = j.value("params", json());
    r.id.reset();
    if (auto it = j.find("id"); it != j.end() && !it->is_null())
        r.id = parse_id(*it);
}

void to_json(json& j, const JsonRpcErrorObject& e)
{
    j = json{{"code", e.code}, {"message", e.message}};
    if (!e.data.is_null())
        j["data"] = e.data;
}

void from_json(const json& j, JsonRpcErrorObject& e)
{
    j.at("code").get_to(e.code);
    e.message = j.value("message", "");
    e.data = j.value("data", json());
}

void to_json(json& j, const JsonRpcResponse& r)
{
    j = json{{"jsonrpc", "2.0"}, {"id", id_value(r.id)}};
    if (r.error)
        j["error"] = *r.error;
    else
        j["result"] = r.result.value_or(nullptr);
}

void from_json(const json& j, JsonRpcResponse& r)
{
    r.id = parse_id(j.at("id"));
    r.result.reset();
    r.error.reset();
    if (auto it = j.find("error"); it != j.end() && !it->is_null())
        r.error = it->get<JsonRpcErrorObject>();
    else
        r.result = j.value("result", json());
}

MessageKind classify_message(const json& message)
{
    if (!message.is_object())
        return MessageKind::Unknown;

    bool has_id = message.contains("id") && !message.at("id").is_null();
    if (message.contains("method"))
        return has_id ? MessageKind::Request : MessageKind::Notification;
    if (has_id && (message.contains("result") || message.contains("error")))
        return MessageKind::Response;
    return MessageKind::Unknown;
}

// =============================================================================
// JsonRpcClient
// =============================================================================

JsonRpcClient::JsonRpcClient(std::unique_ptr<ITransport> transport, Framing framing)
    : transport_(std::move(transport)), framer_(*transport_, framing), next_id_(1), running_(false),
      started_(false)
{
}

JsonRpcClient::~JsonRpcClient()
{
    stop();
}

void JsonRpcClient::start()
{
    if (started_.exchange(true))
        return; // Already started

    running_ = true;
    read_thread_ = std::thread([this] { read_loop(); });
    timeout_thread_ = std::thread([this] { timeout_loop(); });
}

void JsonRpcClient::stop()
{
    running_ = false;
    pending_cv_.notify_all();

    // Close transport to unblock read
    if (started_ && transport_)
        transport_->close();

    if (read_thread_.joinable())
        read_thread_.join();

    if (timeout_thread_.joinable())
        timeout_thread_.join();

    fail_all_pending(JsonRpcErrorCode::ConnectionClosed, "Connection closed");
}

void JsonRpcClient::on_notification(const std::string& method, NotificationHandler handler)
{
    std::lock_guard<std::mutex> lock(handlers_mutex_);
    notification_handlers_[method] = std::move(handler);
}

void JsonRpcClient::set_notification_handler(NotificationHandler handler)
{
    std::lock_guard<std::mutex> lock(handlers_mutex_);
    fallback_notification_handler_ = std::move(handler);
}

void JsonRpcClient::set_request_handler(RequestHandler handler)
{
    std::lock_guard<std::mutex> lock(handlers_mutex_);
    request_handler_ = std::move(handler);
}

void JsonRpcClient::set_close_handler(CloseHandler handler)
{
    std::lock_guard<std::mutex> lock(handlers_mutex_);
    close_handler_ = std::move(handler);
}

std::future<json> JsonRpcClient::invoke(
    const std::string& method, const json& params, std::chrono::milliseconds timeout
)
{
    return invoke_with_id(method, params, timeout).future;
}

PendingCall JsonRpcClient::invoke_with_id(
    const std::string& method, const json& params, std::chrono::milliseconds timeout
)
{
    if (!running_)
        throw JsonRpcError(JsonRpcErrorCode::ConnectionClosed, "Connection closed");

    auto id = next_id_++;

    auto pending = PendingRequest::with_timeout(timeout);
    auto future = pending->promise.get_future();

    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        pending_requests_[id] = pending;
    }
    pending_cv_.notify_all();

    // The reader may have failed all pending requests before the insert above
    if (!running_)
    {
        fail_pending_request(id, JsonRpcErrorCode::ConnectionClosed, "Connection closed");
        return {id, std::move(future)};
    }

    JsonRpcRequest request{method, params, JsonRpcId{id}};
    log::get()->trace("-> {} (id {})", method, id);

    try
    {
        send_message(json(request));
    }
    catch (...)
    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        pending_requests_.erase(id);
        throw;
    }

    return {id, std::move(future)};
}

bool JsonRpcClient::cancel(int64_t id, const std::string& reason)
{
    if (!fail_pending_request(id, JsonRpcErrorCode::RequestCancelled, "Request cancelled"))
        return false;

    if (!running_)
        return true;

    json params = {{"requestId", id}};
    if (!reason.empty())
        params["reason"] = reason;

    try
    {
        notify("notifications/cancelled", params);
    }
    catch (const TransportError& e)
    {
        log::get()->warn("Failed to send cancellation for request {}: {}", id, e.what());
    }
    return true;
}

void JsonRpcClient::notify(const std::string& method, const json& params)
{
    JsonRpcRequest request{method, params, std::nullopt};
    log::get()->trace("-> {} (notification)", method);
    send_message(json(request));
}

void JsonRpcClient::send_response(const JsonRpcId& id, const json& result)
{
    JsonRpcResponse response{id, result, std::nullopt};
    send_message(json(response));
}

void JsonRpcClient::send_error_response(
    const JsonRpcId& id, int code, const std::string& message, const json& data
)
{
    JsonRpcResponse response{id, std::nullopt, JsonRpcErrorObject{code, message, data}};
    send_message(json(response));
}

size_t JsonRpcClient::pending_count() const
{
    std::lock_guard<std::mutex> lock(pending_mutex_);
    return pending_requests_.size();
}

void JsonRpcClient::timeout_loop()
{
    using clock = std::chrono::steady_clock;

    while (running_)
    {
        std::vector<std::pair<int64_t, std::shared_ptr<PendingRequest>>> expired;
        auto now = clock::now();
        auto next_deadline = clock::time_point::max();

        {
            std::unique_lock<std::mutex> lock(pending_mutex_);
            for (auto it = pending_requests_.begin(); it != pending_requests_.end();)
            {
                const auto& pending = it->second;
                if (pending->deadline <= now)
                {
                    expired.emplace_back(it->first, pending);
                    it = pending_requests_.erase(it);
                }
                else
                {
                    next_deadline = std::min(next_deadline, pending->deadline);
                    ++it;
                }
            }

            if (expired.empty())
            {
                if (!running_)
                    break;
                if (next_deadline == clock::time_point::max())
                {
                    pending_cv_.wait_for(
                        lock, std::chrono::milliseconds(250), [this] { return !running_.load(); }
                    );
                }
                else
                {
                    pending_cv_.wait_until(lock, next_deadline, [this] { return !running_.load(); });
                }
                continue;
            }
        }

        for (auto& [id, pending] : expired)
        {
            log::get()->debug("Request {} timed out", id);
            reject(*pending, JsonRpcError(JsonRpcErrorCode::Timeout, "Request timed out"));
        }
    }
}

bool JsonRpcClient::fail_pending_request(
    int64_t id, JsonRpcErrorCode code, const std::string& message
)
{
    std::shared_ptr<PendingRequest> pending;
    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        auto it = pending_requests_.find(id);
        if (it == pending_requests_.end())
            return false;
        pending = it->second;
        pending_requests_.erase(it);
    }
    reject(*pending, JsonRpcError(code, message));
    return true;
}

void JsonRpcClient::send_message(const json& message)
{
    std::lock_guard<std::mutex> lock(write_mutex_);
    framer_.write_message(message.dump());
}

void JsonRpcClient::read_loop()
{
    while (running_)
    {
        std::string frame;
        try
        {
            frame = framer_.read_message();
        }
        catch (const ConnectionClosedError&)
        {
            break;
        }
        catch (const TransportError& e)
        {
            if (running_)
                log::get()->error("Transport read failed: {}", e.what());
            break;
        }

        json message;
        try
        {
            message = json::parse(frame);
        }
        catch (const json::parse_error& e)
        {
            log::get()->warn("Dropping malformed frame: {}", e.what());
            continue;
        }

        try
        {
            dispatch_message(message);
        }
        catch (const json::exception& e)
        {
            log::get()->warn("Dropping invalid JSON-RPC message: {}", e.what());
        }
        catch (const JsonRpcError& e)
        {
            log::get()->warn("Dropping invalid JSON-RPC message: {}", e.what());
        }
        catch (const TransportError& e)
        {
            log::get()->warn("Failed to answer server request: {}", e.what());
        }
    }

    // Only a close initiated by the peer reports through the close handler
    bool closed_by_peer = running_.exchange(false);
    pending_cv_.notify_all();
    fail_all_pending(JsonRpcErrorCode::ConnectionClosed, "Connection closed");

    if (!closed_by_peer)
        return;

    log::get()->debug("Peer closed the connection");
    CloseHandler handler;
    {
        std::lock_guard<std::mutex> lock(handlers_mutex_);
        handler = close_handler_;
    }
    if (handler)
    {
        try
        {
            handler();
        }
        catch (const std::exception& e)
        {
            log::get()->error("Close handler threw: {}", e.what());
        }
    }
}

void JsonRpcClient::dispatch_message(const json& message)
{
    if (!message.is_object())
    {
        log::get()->warn("Dropping non-object JSON-RPC message");
        return;
    }

    switch (classify_message(message))
    {
    case MessageKind::Response:
        handle_response(message);
        return;
    case MessageKind::Notification:
        handle_notification(message.get<JsonRpcRequest>());
        return;
    case MessageKind::Request:
        handle_request(message.get<JsonRpcRequest>());
        return;
    case MessageKind::Unknown:
        break;
    }

    log::get()->warn("Dropping JSON-RPC message of unknown shape: {}", message.dump());
}

void JsonRpcClient::handle_response(const json& message)
{
    auto response = message.get<JsonRpcResponse>();

    auto* int_id = std::get_if<int64_t>(&response.id);
    if (!int_id)
    {
        // String IDs are never used for our outgoing requests
        log::get()->warn("Dropping response with unexpected string id");
        return;
    }

    std::shared_ptr<PendingRequest> pending;
    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        auto it = pending_requests_.find(*int_id);
        if (it == pending_requests_.end())
        {
            // Late response after a timeout or cancellation
            log::get()->debug("Dropping response for unknown request {}", *int_id);
            return;
        }
        pending = it->second;
        pending_requests_.erase(it);
    }

    if (response.is_error())
    {
        auto& err = *response.error;
        reject(*pending, JsonRpcError(static_cast<JsonRpcErrorCode>(err.code), err.message, err.data));
    }
    else
    {
        pending->promise.set_value(response.result.value_or(nullptr));
    }
}

void JsonRpcClient::handle_notification(const JsonRpcRequest& request)
{
    NotificationHandler handler;
    {
        std::lock_guard<std::mutex> lock(handlers_mutex_);
        auto it = notification_handlers_.find(request.method);
        handler = it != notification_handlers_.end() ? it->second : fallback_notification_handler_;
    }

    if (!handler)
    {
        log::get()->warn("Dropping unhandled notification {}", request.method);
        return;
    }

    try
    {
        handler(request.method, request.params);
    }
    catch (const std::exception& e)
    {
        log::get()->error("Notification handler for {} threw: {}", request.method, e.what());
    }
}

void JsonRpcClient::handle_request(const JsonRpcRequest& request)
{
    RequestHandler handler;
    {
        std::lock_guard<std::mutex> lock(handlers_mutex_);
        handler = request_handler_;
    }

    if (!handler)
    {
        if (request.method == "ping")
        {
            send_response(*request.id, json::object());
            return;
        }
        send_error_response(
            *request.id,
            static_cast<int>(JsonRpcErrorCode::MethodNotFound),
            "Method not found: " + request.method
        );
        return;
    }

    try
    {
        auto result = handler(request.method, request.params);
        send_response(*request.id, result);
    }
    catch (const JsonRpcError& e)
    {
        send_error_response(*request.id, static_cast<int>(e.code()), e.what(), e.data());
    }
    catch (const TransportError&)
    {
        throw;
    }
    catch (const std::exception& e)
    {
        send_error_response(*request.id, static_cast<int>(JsonRpcErrorCode::InternalError), e.what());
    }
}

void JsonRpcClient::fail_all_pending(JsonRpcErrorCode code, const std::string& message)
{
    std::vector<std::shared_ptr<PendingRequest>> to_fail;
    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        to_fail.reserve(pending_requests_.size());
        for (auto& [id, pending] : pending_requests_)
            to_fail.push_back(pending);
        pending_requests_.clear();
    }
    for (auto& pending : to_fail)
        reject(*pending, JsonRpcError(code, message));
}

} // namespace toolchat
