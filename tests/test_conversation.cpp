// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#include <gtest/gtest.h>
#include <stdexcept>
#include <toolchat/conversation.hpp>

using namespace toolchat;

namespace
{

AssistantToolUse tool_use(const std::string& id, const std::string& name = "fs_read")
{
    return AssistantToolUse{id, name, name, json::object(), json::object()};
}

AssistantMessage assistant_with_uses(std::vector<std::string> ids)
{
    std::vector<AssistantToolUse> uses;
    for (auto& id : ids)
        uses.push_back(tool_use(id));
    return AssistantMessage::tool_use(std::nullopt, "Using tools", std::move(uses));
}

ToolUseResult text_result(const std::string& id, const std::string& text)
{
    return ToolUseResult{id, {TextBlock{text}}, ToolResultStatus::Success};
}

const UserMessage& user_at(const ConversationState& state, size_t index)
{
    return std::get<UserMessage>(state.history().at(index));
}

} // namespace

// =============================================================================
// Budget
// =============================================================================

TEST(ConversationLimitsTest, CeilingIsSmallerOfBytesAndWindow)
{
    ConversationLimits defaults;
    EXPECT_EQ(defaults.ceiling(), 400000u);

    ConversationLimits small_window;
    small_window.context_window_tokens = 1000;
    EXPECT_EQ(small_window.ceiling(), 3000u);
}

TEST(ConversationStateTest, ResultsShareCeilingEvenly)
{
    ConversationLimits limits;
    limits.max_user_message_bytes = 5000;
    ConversationState state("c1", limits);

    state.append_user_prompt("run both");
    state.append_assistant_message(assistant_with_uses({"big", "small"}));
    state.append_tool_use_results({
        text_result("big", std::string(9000, 'b')),
        text_result("small", std::string(100, 's')),
    });

    const auto* results = user_at(state, 2).tool_use_results();
    ASSERT_NE(results, nullptr);

    const auto& big = std::get<TextBlock>((*results)[0].content[0]).text;
    const auto& small = std::get<TextBlock>((*results)[1].content[0]).text;
    EXPECT_LE(big.size(), 2500u);
    EXPECT_EQ(big.substr(big.size() - kTruncatedSuffix.size()), kTruncatedSuffix);
    EXPECT_EQ(small, std::string(100, 's'));
}

TEST(ConversationStateTest, LongPromptIsTruncated)
{
    ConversationLimits limits;
    limits.max_user_message_bytes = 1000;
    ConversationState state("c1", limits);

    state.append_user_prompt(std::string(4000, 'x'));

    EXPECT_EQ(user_at(state, 0).prompt()->size(), 1000u);
}

TEST(ConversationStateTest, PromptIsSanitized)
{
    ConversationState state("c1");
    state.append_user_prompt("visible\xF3\xA0\x80\x81 text");

    EXPECT_EQ(user_at(state, 0).prompt(), "visible text");
}

// =============================================================================
// Tool Use Bookkeeping
// =============================================================================

TEST(ConversationStateTest, TracksOutstandingToolUses)
{
    ConversationState state("c1");
    state.append_user_prompt("read two files");
    state.append_assistant_message(assistant_with_uses({"t1", "t2"}));

    EXPECT_EQ(state.outstanding_tool_uses(), (std::vector<std::string>{"t1", "t2"}));

    state.append_tool_use_results({text_result("t2", "two")});
    EXPECT_EQ(state.outstanding_tool_uses(), (std::vector<std::string>{"t1"}));

    state.append_tool_use_results({text_result("t1", "one")});
    EXPECT_TRUE(state.outstanding_tool_uses().empty());

    state.append_assistant_message(AssistantMessage::response(std::nullopt, "Done"));
    EXPECT_EQ(state.history().size(), 5u);
}

TEST(ConversationStateTest, RejectsUnknownToolUseId)
{
    ConversationState state("c1");
    state.append_user_prompt("go");
    state.append_assistant_message(assistant_with_uses({"t1"}));

    EXPECT_THROW(state.append_tool_use_results({text_result("nope", "x")}), std::invalid_argument);
    EXPECT_EQ(state.history().size(), 2u);
    EXPECT_EQ(state.outstanding_tool_uses().size(), 1u);
}

TEST(ConversationStateTest, RejectsDuplicateResult)
{
    ConversationState state("c1");
    state.append_user_prompt("go");
    state.append_assistant_message(assistant_with_uses({"t1", "t2"}));

    EXPECT_THROW(
        state.append_tool_use_results({text_result("t1", "a"), text_result("t1", "b")}), std::invalid_argument
    );
    EXPECT_EQ(state.history().size(), 2u);

    state.append_tool_use_results({text_result("t1", "a")});
    EXPECT_THROW(state.append_tool_use_results({text_result("t1", "again")}), std::invalid_argument);
}

TEST(ConversationStateTest, ResultsWithoutToolUseRejected)
{
    ConversationState state("c1");
    state.append_user_prompt("hi");
    state.append_assistant_message(AssistantMessage::response(std::nullopt, "hello"));

    EXPECT_THROW(state.append_tool_use_results({text_result("t1", "x")}), std::invalid_argument);
}

TEST(ConversationStateTest, PromptWhileToolUsesOutstandingRejected)
{
    ConversationState state("c1");
    state.append_user_prompt("go");
    state.append_assistant_message(assistant_with_uses({"t1"}));

    EXPECT_THROW(state.append_user_prompt("never mind"), std::invalid_argument);
    EXPECT_THROW(
        state.append_assistant_message(AssistantMessage::response(std::nullopt, "x")), std::invalid_argument
    );
}

TEST(ConversationStateTest, AbandonRecordsCancelledResults)
{
    ConversationState state("c1");
    state.append_user_prompt("go");
    state.append_assistant_message(assistant_with_uses({"t1", "t2"}));

    EXPECT_EQ(state.abandon_tool_uses(std::string("do something else")), 2u);
    EXPECT_TRUE(state.outstanding_tool_uses().empty());

    const auto& message = user_at(state, 2);
    EXPECT_EQ(message.prompt(), "do something else");
    const auto* results = message.tool_use_results();
    ASSERT_NE(results, nullptr);
    ASSERT_EQ(results->size(), 2u);
    for (const auto& result : *results)
    {
        EXPECT_EQ(result.status, ToolResultStatus::Error);
        EXPECT_EQ(std::get<TextBlock>(result.content[0]).text, kCancelledToolUseText);
    }
}

TEST(ConversationStateTest, AbandonWithNothingOutstanding)
{
    ConversationState state("c1");
    EXPECT_EQ(state.abandon_tool_uses(), 0u);
    EXPECT_TRUE(state.history().empty());

    EXPECT_EQ(state.abandon_tool_uses(std::string("plain prompt")), 0u);
    ASSERT_EQ(state.history().size(), 1u);
    EXPECT_EQ(user_at(state, 0).prompt(), "plain prompt");
}

// =============================================================================
// History Limit
// =============================================================================

TEST(ConversationStateTest, HistoryLimitKeepsUserTurnFirst)
{
    ConversationLimits limits;
    limits.max_history_len = 4;
    ConversationState state("c1", limits);

    state.append_user_prompt("first");
    state.append_assistant_message(assistant_with_uses({"t1"}));
    state.append_tool_use_results({text_result("t1", "out1")});
    state.append_assistant_message(AssistantMessage::response(std::nullopt, "ok"));
    state.append_user_prompt("second");

    // Oldest prompt and the orphaned tool use are gone; their results became text
    ASSERT_EQ(state.history().size(), 3u);
    const auto& front = user_at(state, 0);
    EXPECT_FALSE(front.has_tool_use_results());
    EXPECT_EQ(front.prompt(), "out1");

    state.append_assistant_message(assistant_with_uses({"t2"}));
    state.append_tool_use_results({text_result("t2", "out2")});

    ASSERT_LE(state.history().size(), 4u);
    EXPECT_TRUE(std::holds_alternative<UserMessage>(state.history().front()));
    EXPECT_EQ(user_at(state, 0).prompt(), "second");
}

TEST(ConversationStateTest, DefaultHistoryCap)
{
    ConversationState state("c1");
    for (int i = 0; i < 200; ++i)
    {
        state.append_user_prompt("q" + std::to_string(i));
        state.append_assistant_message(AssistantMessage::response(std::nullopt, "a"));
    }

    EXPECT_LE(state.history().size(), kMaxConversationStateHistoryLen);
    EXPECT_TRUE(std::holds_alternative<UserMessage>(state.history().front()));
}

// =============================================================================
// Context Files and Serialization
// =============================================================================

TEST(ConversationStateTest, ContextFilesBecomeAdditionalContext)
{
    ConversationLimits limits;
    limits.context_files_max_tokens = 100;
    ConversationState state("c1", limits);

    auto dropped = state.set_context_files({
        {"README.md", "Project readme"},
        {"huge.log", std::string(3000, 'l')},
    });

    ASSERT_EQ(dropped.size(), 1u);
    EXPECT_EQ(dropped[0].first, "huge.log");
    ASSERT_EQ(state.context_files().size(), 1u);

    state.append_user_prompt("summarize");
    const auto& context = user_at(state, 0).additional_context();
    EXPECT_EQ(context.find(kContextEntryStartHeader), 0u);
    EXPECT_NE(context.find("[README.md]\nProject readme"), std::string::npos);

    auto content = user_at(state, 0).content_with_context();
    EXPECT_LT(content.find("Project readme"), content.find("summarize"));
}

TEST(ConversationStateTest, SerializeHistory)
{
    ConversationState state("c1");
    state.append_user_prompt("hi");
    state.append_assistant_message(assistant_with_uses({"t1"}));
    state.append_tool_use_results({ToolUseResult{"t1", {}, ToolResultStatus::Success}});

    auto history = state.serialize_history();
    ASSERT_EQ(history.size(), 3u);
    EXPECT_TRUE(history[0].contains("userInputMessage"));
    EXPECT_EQ(history[1]["assistantResponseMessage"]["toolUses"][0]["toolUseId"], "t1");

    const auto& results = history[2]["userInputMessage"]["userInputMessageContext"]["toolResults"];
    EXPECT_EQ(results[0]["content"][0]["text"], std::string(kToolResultPlaceholder));

    EXPECT_GT(state.estimated_tokens(), 0u);
}
