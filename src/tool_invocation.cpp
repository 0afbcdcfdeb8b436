// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#include <toolchat/log.hpp>
#include <toolchat/tool_invocation.hpp>

namespace toolchat
{

namespace
{

template <class... Ts>
struct Overloaded : Ts...
{
    using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

json call_params(const McpToolCall& call)
{
    return json{{"name", call.orig_name}, {"arguments", call.arguments}};
}

/// Redact the data of every `{"type": "image"}` object, at any depth
void redact_images(json& value)
{
    if (value.is_object())
    {
        auto type = value.find("type");
        auto data = value.find("data");
        if (type != value.end() && *type == "image" && data != value.end() && data->is_string())
            *data = redacted_image_text(data->get_ref<const std::string&>().size());
    }
    if (value.is_structured())
    {
        for (auto& child : value)
            redact_images(child);
    }
}

} // namespace

const char* to_string(InvocationErrorKind kind)
{
    switch (kind)
    {
    case InvocationErrorKind::Protocol:
        return "protocol";
    case InvocationErrorKind::Timeout:
        return "timeout";
    case InvocationErrorKind::Transport:
        return "transport";
    case InvocationErrorKind::NotReady:
        return "not ready";
    case InvocationErrorKind::Cancelled:
        return "cancelled";
    }
    return "unknown";
}

std::string InvokeOutput::as_text() const
{
    return std::visit(
        Overloaded{
            [](const TextOutput& o) { return o.text; },
            [](const JsonOutput& o) { return o.value.dump(2, ' ', false, json::error_handler_t::replace); },
            [](const ImagesOutput& o) { return std::to_string(o.images.size()) + " image(s)"; },
            [](const MixedOutput& o) { return o.text; },
        },
        output
    );
}

std::string redacted_image_text(size_t data_size)
{
    return "Redacted base64 encoded string of an image of size " + std::to_string(data_size);
}

InvokeOutput map_tool_call_result(const json& result)
{
    ToolCallResult parsed;
    try
    {
        parsed = result.get<ToolCallResult>();
    }
    catch (const json::exception& e)
    {
        log::get()->warn("Tool call result deserialization failed: {}", e.what());
        auto raw = result;
        redact_images(raw);
        return InvokeOutput{JsonOutput{std::move(raw)}};
    }

    for (auto& block : parsed.content)
    {
        if (auto* image = std::get_if<ImageContent>(&block))
            image->data = redacted_image_text(image->data.size());
    }

    return InvokeOutput{JsonOutput{json(parsed)}, parsed.is_error};
}

ToolInvocationError to_invocation_error(const JsonRpcError& error)
{
    switch (error.code())
    {
    case JsonRpcErrorCode::Timeout:
        return ToolInvocationError(InvocationErrorKind::Timeout, error.what());
    case JsonRpcErrorCode::ConnectionClosed:
        return ToolInvocationError(InvocationErrorKind::Transport, error.what());
    case JsonRpcErrorCode::RequestCancelled:
        return ToolInvocationError(InvocationErrorKind::Cancelled, error.what());
    default:
        return ToolInvocationError(InvocationErrorKind::Protocol, error.what(), error.data());
    }
}

InvokeOutput invoke_tool(ToolServerSession& session, const McpToolCall& call)
{
    try
    {
        return map_tool_call_result(session.request("tools/call", call_params(call)));
    }
    catch (const ServerNotReadyError& e)
    {
        throw ToolInvocationError(InvocationErrorKind::NotReady, e.what());
    }
    catch (const JsonRpcError& e)
    {
        throw to_invocation_error(e);
    }
    catch (const TransportError& e)
    {
        throw ToolInvocationError(InvocationErrorKind::Transport, e.what());
    }
}

// =============================================================================
// ToolInvocation
// =============================================================================

ToolInvocation::ToolInvocation(
    std::shared_ptr<ToolServerSession> session, PendingCall call, std::string tool_name
)
    : session_(std::move(session)), call_(std::move(call)), tool_name_(std::move(tool_name))
{
}

ToolInvocation ToolInvocation::start(std::shared_ptr<ToolServerSession> session, const McpToolCall& call)
{
    try
    {
        auto pending = session->request_async("tools/call", call_params(call));
        log::get()->debug("Invoking {} on {} (request {})", call.orig_name, session->name(), pending.id);
        return ToolInvocation(std::move(session), std::move(pending), call.name);
    }
    catch (const ServerNotReadyError& e)
    {
        throw ToolInvocationError(InvocationErrorKind::NotReady, e.what());
    }
    catch (const JsonRpcError& e)
    {
        throw to_invocation_error(e);
    }
    catch (const TransportError& e)
    {
        throw ToolInvocationError(InvocationErrorKind::Transport, e.what());
    }
}

InvokeOutput ToolInvocation::wait()
{
    try
    {
        return map_tool_call_result(call_.future.get());
    }
    catch (const JsonRpcError& e)
    {
        throw to_invocation_error(e);
    }
}

bool ToolInvocation::cancel(const std::string& reason)
{
    bool cancelled = session_->cancel(call_.id, reason);
    if (cancelled)
        log::get()->info("Cancelled {} (request {})", tool_name_, call_.id);
    return cancelled;
}

// =============================================================================
// Recording Outcomes
// =============================================================================

ToolUseResult to_tool_use_result(const std::string& tool_use_id, const InvokeOutput& output)
{
    auto block = std::visit(
        Overloaded{
            [](const TextOutput& o) -> ToolUseResultBlock { return TextBlock{o.text}; },
            [](const JsonOutput& o) -> ToolUseResultBlock { return JsonBlock{o.value}; },
            [](const ImagesOutput&) -> ToolUseResultBlock { return TextBlock{"See images data supplied"}; },
            [](const MixedOutput& o) -> ToolUseResultBlock { return TextBlock{o.text}; },
        },
        output.output
    );

    return ToolUseResult{
        tool_use_id,
        {std::move(block)},
        output.is_error ? ToolResultStatus::Error : ToolResultStatus::Success
    };
}

ToolUseResult to_tool_use_result(const std::string& tool_use_id, const std::exception& error)
{
    return ToolUseResult{
        tool_use_id,
        {TextBlock{std::string("An error occurred processing the tool: \n") + error.what()}},
        ToolResultStatus::Error
    };
}

} // namespace toolchat
