// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#include <algorithm>
#include <set>
#include <stdexcept>
#include <toolchat/conversation.hpp>
#include <toolchat/log.hpp>

namespace toolchat
{

ConversationState::ConversationState(std::string conversation_id, ConversationLimits limits)
    : conversation_id_(std::move(conversation_id)), limits_(limits)
{
}

void ConversationState::append_user_prompt(const std::string& prompt)
{
    auto message = UserMessage::from_prompt(sanitize_unicode_tags(prompt));
    message.set_additional_context(render_context_files());
    append_user_message(std::move(message));
}

void ConversationState::append_user_message(UserMessage message)
{
    const auto* results = message.tool_use_results();
    if (!results && !outstanding_tool_uses_.empty())
        throw std::invalid_argument("Cannot append a prompt while tool uses are outstanding");

    auto remaining = outstanding_tool_uses_;
    if (results)
    {
        std::set<std::string> seen;
        for (const auto& result : *results)
        {
            if (!seen.insert(result.tool_use_id).second)
                throw std::invalid_argument("Duplicate result for tool use " + result.tool_use_id);

            auto it = std::find(remaining.begin(), remaining.end(), result.tool_use_id);
            if (it == remaining.end())
                throw std::invalid_argument("No outstanding tool use with id " + result.tool_use_id);
            remaining.erase(it);
        }
    }

    message.truncate_safe(limits_.ceiling());

    outstanding_tool_uses_ = std::move(remaining);
    history_.emplace_back(std::move(message));
    enforce_history_limit();
}

void ConversationState::append_tool_use_results(std::vector<ToolUseResult> results)
{
    append_user_message(UserMessage::from_tool_use_results(std::move(results)));
}

void ConversationState::append_assistant_message(AssistantMessage message)
{
    if (!outstanding_tool_uses_.empty())
    {
        throw std::invalid_argument(
            "Assistant turn while " + std::to_string(outstanding_tool_uses_.size()) +
            " tool uses are unanswered"
        );
    }

    if (const auto* uses = message.tool_uses())
    {
        for (const auto& use : *uses)
            outstanding_tool_uses_.push_back(use.id);
    }

    history_.emplace_back(std::move(message));
    enforce_history_limit();
}

size_t ConversationState::abandon_tool_uses(std::optional<std::string> prompt)
{
    if (outstanding_tool_uses_.empty())
    {
        if (prompt)
            append_user_prompt(*prompt);
        return 0;
    }

    if (prompt)
        prompt = sanitize_unicode_tags(*prompt);

    auto count = outstanding_tool_uses_.size();
    append_user_message(UserMessage::from_cancelled_tool_uses(std::move(prompt), outstanding_tool_uses_));
    log::get()->debug("Abandoned {} tool uses in {}", count, conversation_id_);
    return count;
}

std::vector<ContextFile> ConversationState::set_context_files(std::vector<ContextFile> files)
{
    auto dropped = drop_matched_context_files(files, limits_.context_files_max_tokens);
    for (const auto& [name, content] : dropped)
        log::get()->warn("Dropping context file {}: over the context file budget", name);
    context_files_ = std::move(files);
    return dropped;
}

std::string ConversationState::render_context_files() const
{
    if (context_files_.empty())
        return {};

    std::string rendered(kContextEntryStartHeader);
    for (const auto& [name, content] : context_files_)
        rendered += "[" + name + "]\n" + content + "\n";
    rendered += kContextEntryEndHeader;
    return rendered;
}

void ConversationState::enforce_history_limit()
{
    if (history_.size() <= limits_.max_history_len)
        return;

    while (history_.size() > limits_.max_history_len)
        history_.pop_front();

    // History must open with a user turn
    while (!history_.empty() && std::holds_alternative<AssistantMessage>(history_.front()))
        history_.pop_front();

    // Results whose tool uses were dropped are kept as plain text
    if (!history_.empty())
    {
        auto& front = std::get<UserMessage>(history_.front());
        if (front.has_tool_use_results())
            front.replace_content_with_tool_use_results();
    }
}

json ConversationState::serialize_history() const
{
    json entries = json::array();
    for (const auto& entry : history_)
        entries.push_back(std::visit([](const auto& m) { return m.to_history_entry(); }, entry));
    return entries;
}

size_t ConversationState::estimated_tokens() const
{
    return TokenCounter::count_tokens(
        serialize_history().dump(-1, ' ', false, json::error_handler_t::replace)
    );
}

} // namespace toolchat
