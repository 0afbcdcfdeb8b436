// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#pragma once

/// @file conversation.hpp
/// @brief Conversation history kept within the backend's context budget

#include <algorithm>
#include <deque>
#include <optional>
#include <string>
#include <toolchat/message.hpp>
#include <toolchat/types.hpp>
#include <toolchat/util.hpp>
#include <variant>
#include <vector>

namespace toolchat
{

/// Size limits applied to a conversation
struct ConversationLimits
{
    size_t max_user_message_bytes = kMaxUserMessageSize;
    size_t context_window_tokens = kContextWindowSize;
    size_t max_history_len = kMaxConversationStateHistoryLen;
    size_t context_files_max_tokens = kContextFilesMaxSize;

    /// Byte ceiling for a single user message
    size_t ceiling() const
    {
        return std::min(max_user_message_bytes, TokenCounter::token_to_chars(context_window_tokens));
    }
};

using HistoryEntry = std::variant<UserMessage, AssistantMessage>;

/// Ordered user and assistant turns of one conversation
///
/// Every appended user message is truncated to the ceiling. Tool results
/// must answer tool uses of the preceding assistant turns, each exactly once;
/// violations throw std::invalid_argument and leave the history unchanged.
class ConversationState
{
  public:
    explicit ConversationState(std::string conversation_id, ConversationLimits limits = {});

    const std::string& conversation_id() const
    {
        return conversation_id_;
    }

    const ConversationLimits& limits() const
    {
        return limits_;
    }

    const std::deque<HistoryEntry>& history() const
    {
        return history_;
    }

    /// IDs of tool uses still waiting for a result, in request order
    const std::vector<std::string>& outstanding_tool_uses() const
    {
        return outstanding_tool_uses_;
    }

    /// Append a typed prompt. Hidden Unicode characters are stripped and the
    /// retained context files become the message's additional context.
    /// @throws std::invalid_argument while tool uses are outstanding
    void append_user_prompt(const std::string& prompt);

    /// Append a user message after validating its tool results
    /// @throws std::invalid_argument on an unknown or repeated tool use ID, or
    ///         a prompt while tool uses are outstanding
    void append_user_message(UserMessage message);

    /// Append results for outstanding tool uses
    void append_tool_use_results(std::vector<ToolUseResult> results);

    /// @throws std::invalid_argument if tool uses of an earlier turn are unanswered
    void append_assistant_message(AssistantMessage message);

    /// Record every outstanding tool use as cancelled by the user
    /// @param prompt Text the user typed instead, if any
    /// @return Number of tool uses abandoned
    size_t abandon_tool_uses(std::optional<std::string> prompt = std::nullopt);

    /// Replace the context files; the largest are dropped until the rest
    /// fit the context file token budget
    /// @return The dropped files
    std::vector<ContextFile> set_context_files(std::vector<ContextFile> files);

    const std::vector<ContextFile>& context_files() const
    {
        return context_files_;
    }

    /// History as sent to the backend
    json serialize_history() const;

    /// Rough token count of the serialized history
    size_t estimated_tokens() const;

  private:
    std::string render_context_files() const;
    void enforce_history_limit();

    std::string conversation_id_;
    ConversationLimits limits_;
    std::deque<HistoryEntry> history_;
    std::vector<std::string> outstanding_tool_uses_;
    std::vector<ContextFile> context_files_;
};

} // namespace toolchat
