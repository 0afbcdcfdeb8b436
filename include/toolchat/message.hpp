// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#pragma once

/// @file message.hpp
/// @brief User and assistant turns of a conversation, and their truncation

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <toolchat/types.hpp>
#include <variant>
#include <vector>

namespace toolchat
{

/// Sent instead of a tool result whose content is empty
inline constexpr std::string_view kToolResultPlaceholder = "<tool result redacted>";

/// Content of the synthetic result recorded for a cancelled tool use
inline constexpr std::string_view kCancelledToolUseText = "Tool use was cancelled by the user";

inline constexpr std::string_view kContextEntryStartHeader = "--- CONTEXT ENTRY BEGIN ---\n";
inline constexpr std::string_view kContextEntryEndHeader = "--- CONTEXT ENTRY END ---\n\n";
inline constexpr std::string_view kUserEntryStartHeader = "--- USER MESSAGE BEGIN ---\n";
inline constexpr std::string_view kUserEntryEndHeader = "--- USER MESSAGE END ---\n\n";

// =============================================================================
// Tool Use Results
// =============================================================================

enum class ToolResultStatus
{
    Success,
    Error,
};

struct JsonBlock
{
    json value;
};

struct TextBlock
{
    std::string text;
};

/// One content block of a tool result: structured JSON or text
using ToolUseResultBlock = std::variant<JsonBlock, TextBlock>;

/// Result of one tool use, in the order the tool produced its blocks
struct ToolUseResult
{
    std::string tool_use_id;
    std::vector<ToolUseResultBlock> content;
    ToolResultStatus status = ToolResultStatus::Success;

    /// No blocks, or only empty text blocks
    bool is_empty() const;
};

/// Serialized with the placeholder in place of empty content
void to_json(json& j, const ToolUseResult& r);

/// Truncate every block of every result so the total fits `max_bytes`
///
/// The ceiling is split evenly across the results and each result's share
/// evenly across its blocks. A JSON block that exceeds its share is replaced
/// by its truncated serialization. A block that cannot be serialized is left
/// as it is and logged.
void truncate_tool_use_results(
    std::vector<ToolUseResult>& results, size_t max_bytes, std::string_view suffix
);

// =============================================================================
// User Message
// =============================================================================

/// Image attached to a user turn
struct ImageBlock
{
    /// png, jpeg, gif or webp
    std::string format;
    /// Base64 encoded bytes
    std::string bytes;
};

void to_json(json& j, const ImageBlock& image);

/// Environment the message was written in
struct EnvState
{
    std::string operating_system;
    std::optional<std::string> current_working_directory;

    /// Current OS and working directory (truncated to kMaxCurrentWorkingDirectoryLen)
    static EnvState capture();
};

void to_json(json& j, const EnvState& env);

struct PromptContent
{
    std::string prompt;
};

struct CancelledToolUsesContent
{
    /// Prompt the user typed while cancelling, if any
    std::optional<std::string> prompt;
    std::vector<ToolUseResult> tool_use_results;
};

struct ToolUseResultsContent
{
    std::vector<ToolUseResult> tool_use_results;
};

using UserMessageContent = std::variant<PromptContent, CancelledToolUsesContent, ToolUseResultsContent>;

/// A user turn: a prompt, tool results, or results of cancelled tool uses
class UserMessage
{
  public:
    static UserMessage from_prompt(std::string prompt);

    /// Each ID gets an error result saying the user cancelled it
    static UserMessage from_cancelled_tool_uses(
        std::optional<std::string> prompt, const std::vector<std::string>& tool_use_ids
    );

    static UserMessage from_tool_use_results(
        std::vector<ToolUseResult> results, std::vector<ImageBlock> images = {}
    );

    const UserMessageContent& content() const
    {
        return content_;
    }

    /// The prompt text, if this turn has one
    std::optional<std::string> prompt() const;

    /// Tool results, or nullptr for a plain prompt
    const std::vector<ToolUseResult>* tool_use_results() const;
    bool has_tool_use_results() const
    {
        return tool_use_results() != nullptr;
    }

    const std::string& additional_context() const
    {
        return additional_context_;
    }
    void set_additional_context(std::string context)
    {
        additional_context_ = std::move(context);
    }

    const EnvState& env_state() const
    {
        return env_state_;
    }

    std::chrono::system_clock::time_point timestamp() const
    {
        return timestamp_;
    }

    const std::vector<ImageBlock>& images() const
    {
        return images_;
    }

    /// Shrink the content to at most `max_bytes`
    ///
    /// A prompt is cut with kTruncatedSuffix. A prompt with tool results gets
    /// half the budget, the results the other half. Results alone share the
    /// whole budget. Re-truncating to the same or a larger ceiling changes
    /// nothing.
    void truncate_safe(size_t max_bytes);

    /// Turn tool results into a plain prompt of their joined text
    ///
    /// Used when the results cannot be sent as results, e.g. after the
    /// matching tool use was dropped from history.
    void replace_content_with_tool_use_results();

    /// Text sent to the backend: additional context, then the timestamp
    /// header and the delimited prompt
    std::string content_with_context() const;

    /// JSON history entry (`userInputMessage`)
    json to_history_entry() const;

  private:
    explicit UserMessage(UserMessageContent content, std::vector<ImageBlock> images = {});

    std::string additional_context_;
    EnvState env_state_;
    UserMessageContent content_;
    std::chrono::system_clock::time_point timestamp_;
    std::vector<ImageBlock> images_;
};

/// UTC timestamp with millisecond precision, e.g. 2025-08-08T17:43:28.672Z
std::string format_utc_timestamp(std::chrono::system_clock::time_point time);

// =============================================================================
// Assistant Message
// =============================================================================

/// A tool use requested by the model
struct AssistantToolUse
{
    std::string id;
    /// Name as exposed to the model
    std::string name;
    /// Name the owning server knows the tool by
    std::string orig_name;
    /// Arguments as the model produced them
    json args;
    /// Arguments passed to the tool
    json orig_args;
};

struct AssistantResponse
{
    std::optional<std::string> message_id;
    std::string content;
};

struct AssistantToolUseResponse
{
    std::optional<std::string> message_id;
    std::string content;
    std::vector<AssistantToolUse> tool_uses;
};

/// An assistant turn: plain text or text with tool uses
class AssistantMessage
{
  public:
    static AssistantMessage response(std::optional<std::string> message_id, std::string content)
    {
        return AssistantMessage(AssistantResponse{std::move(message_id), std::move(content)});
    }

    static AssistantMessage tool_use(
        std::optional<std::string> message_id,
        std::string content,
        std::vector<AssistantToolUse> tool_uses
    )
    {
        return AssistantMessage(
            AssistantToolUseResponse{std::move(message_id), std::move(content), std::move(tool_uses)}
        );
    }

    std::optional<std::string> message_id() const;
    const std::string& content() const;

    /// Tool uses, or nullptr for a plain response
    const std::vector<AssistantToolUse>* tool_uses() const;

    /// JSON history entry (`assistantResponseMessage`)
    json to_history_entry() const;

  private:
    using Variant = std::variant<AssistantResponse, AssistantToolUseResponse>;

    explicit AssistantMessage(Variant message) : message_(std::move(message)) {}

    Variant message_;
};

} // namespace toolchat
