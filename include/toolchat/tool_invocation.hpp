// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#pragma once

/// @file tool_invocation.hpp
/// @brief Calling a server tool and normalizing the outcome

#include <memory>
#include <stdexcept>
#include <string>
#include <toolchat/jsonrpc.hpp>
#include <toolchat/message.hpp>
#include <toolchat/session.hpp>
#include <toolchat/types.hpp>
#include <variant>
#include <vector>

namespace toolchat
{

// =============================================================================
// Errors
// =============================================================================

/// Why an invocation produced no output
enum class InvocationErrorKind
{
    /// The server answered with a JSON-RPC error
    Protocol,
    /// No response within the server's timeout
    Timeout,
    /// The connection to the server is gone
    Transport,
    /// The session has not completed its handshake
    NotReady,
    /// The user cancelled the call
    Cancelled,
};

const char* to_string(InvocationErrorKind kind);

class ToolInvocationError : public std::runtime_error
{
  public:
    ToolInvocationError(InvocationErrorKind kind, const std::string& message, json data = nullptr)
        : std::runtime_error(message), kind_(kind), data_(std::move(data))
    {
    }

    InvocationErrorKind kind() const
    {
        return kind_;
    }

    /// `data` of a JSON-RPC error response, if any
    const json& data() const
    {
        return data_;
    }

  private:
    InvocationErrorKind kind_;
    json data_;
};

// =============================================================================
// Call and Output
// =============================================================================

/// One requested call of a server tool. Not retried.
struct McpToolCall
{
    /// Name as exposed to the model
    std::string name;
    /// Name the server knows the tool by
    std::string orig_name;
    json arguments = json::object();
};

struct TextOutput
{
    std::string text;
};

struct JsonOutput
{
    json value;
};

struct ImagesOutput
{
    std::vector<ImageBlock> images;
};

struct MixedOutput
{
    std::string text;
    std::vector<ImageBlock> images;
};

using OutputKind = std::variant<TextOutput, JsonOutput, ImagesOutput, MixedOutput>;

/// Normalized output of a tool
struct InvokeOutput
{
    OutputKind output;

    /// The server flagged the result with `isError`
    bool is_error = false;

    /// Text form, as shown to users
    std::string as_text() const;
};

/// Text replacing base64 image data before it can reach the history
std::string redacted_image_text(size_t data_size);

/// Map a `tools/call` result to an output
///
/// A result in ToolCallResult shape is returned as JSON with image data
/// redacted. Anything else passes through as is, except that image blocks
/// found anywhere in it are still redacted.
InvokeOutput map_tool_call_result(const json& result);

/// Map a failed request onto an invocation error kind
ToolInvocationError to_invocation_error(const JsonRpcError& error);

// =============================================================================
// Invocation
// =============================================================================

/// Call a tool and wait for its output
/// @throws ToolInvocationError on any failure
InvokeOutput invoke_tool(ToolServerSession& session, const McpToolCall& call);

/// An in-flight tool call that can be waited on or cancelled
///
/// @code
/// auto call = ToolInvocation::start(session, {"git___status", "status", {}});
/// // from a UI thread:  call.cancel("user pressed ctrl-c");
/// auto output = call.wait();
/// @endcode
class ToolInvocation
{
  public:
    /// Send `tools/call`
    /// @throws ToolInvocationError if the session is not ready or the send fails
    static ToolInvocation start(std::shared_ptr<ToolServerSession> session, const McpToolCall& call);

    ToolInvocation(ToolInvocation&&) = default;
    ToolInvocation& operator=(ToolInvocation&&) = default;
    ToolInvocation(const ToolInvocation&) = delete;
    ToolInvocation& operator=(const ToolInvocation&) = delete;

    /// Block until the call resolves
    /// @throws ToolInvocationError on error response, timeout, close or cancellation
    InvokeOutput wait();

    /// Abandon the call; wait() then throws a Cancelled error.
    /// The server process keeps running.
    /// @return false if the call had already resolved
    bool cancel(const std::string& reason = {});

    int64_t request_id() const
    {
        return call_.id;
    }

    const std::string& tool_name() const
    {
        return tool_name_;
    }

  private:
    ToolInvocation(std::shared_ptr<ToolServerSession> session, PendingCall call, std::string tool_name);

    std::shared_ptr<ToolServerSession> session_;
    PendingCall call_;
    std::string tool_name_;
};

// =============================================================================
// Recording Outcomes
// =============================================================================

/// Successful output as a tool result
ToolUseResult to_tool_use_result(const std::string& tool_use_id, const InvokeOutput& output);

/// Failure as an error-status tool result carrying the message
ToolUseResult to_tool_use_result(const std::string& tool_use_id, const std::exception& error);

} // namespace toolchat
