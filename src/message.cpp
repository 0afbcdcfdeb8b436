// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#include <cstdio>
#include <ctime>
#include <filesystem>
#include <system_error>
#include <toolchat/log.hpp>
#include <toolchat/message.hpp>
#include <toolchat/util.hpp>

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

const char* operating_system_name()
{
#if defined(__APPLE__)
    return "macos";
#elif defined(__linux__)
    return "linux";
#elif defined(_WIN32)
    return "windows";
#elif defined(__FreeBSD__)
    return "freebsd";
#else
    return "unknown";
#endif
}

const char* to_string(ToolResultStatus status)
{
    return status == ToolResultStatus::Success ? "success" : "error";
}

/// Serialized text of a block; nullopt (logged) if a JSON block cannot be dumped
std::optional<std::string> block_text(const ToolUseResultBlock& block)
{
    if (auto* text = std::get_if<TextBlock>(&block))
        return text->text;

    try
    {
        return std::get<JsonBlock>(block).value.dump();
    }
    catch (const json::type_error& e)
    {
        log::get()->error("Failed to serialize tool result: {}", e.what());
        return std::nullopt;
    }
}

} // namespace

// =============================================================================
// Tool Use Results
// =============================================================================

bool ToolUseResult::is_empty() const
{
    for (const auto& block : content)
    {
        auto* text = std::get_if<TextBlock>(&block);
        if (!text || !text->text.empty())
            return false;
    }
    return true;
}

void to_json(json& j, const ToolUseResult& r)
{
    json content = json::array();
    if (r.is_empty())
    {
        content.push_back({{"text", std::string(kToolResultPlaceholder)}});
    }
    else
    {
        for (const auto& block : r.content)
        {
            std::visit(
                Overloaded{
                    [&](const JsonBlock& b) { content.push_back({{"json", b.value}}); },
                    [&](const TextBlock& b) { content.push_back({{"text", b.text}}); },
                },
                block
            );
        }
    }

    j = json{{"toolUseId", r.tool_use_id}, {"content", std::move(content)}, {"status", to_string(r.status)}};
}

void truncate_tool_use_results(
    std::vector<ToolUseResult>& results, size_t max_bytes, std::string_view suffix
)
{
    if (results.empty())
        return;

    size_t share = max_bytes / results.size();
    for (auto& result : results)
    {
        if (result.content.empty())
            continue;

        size_t block_share = share / result.content.size();
        for (auto& block : result.content)
        {
            if (auto* text = std::get_if<TextBlock>(&block))
            {
                truncate_safe_in_place(text->text, block_share, suffix);
                continue;
            }

            std::string serialized;
            try
            {
                serialized = std::get<JsonBlock>(block).value.dump();
            }
            catch (const json::type_error& e)
            {
                log::get()->warn("Unable to truncate JSON tool result: {}", e.what());
                continue;
            }

            if (serialized.size() > block_share)
            {
                truncate_safe_in_place(serialized, block_share, suffix);
                block = TextBlock{std::move(serialized)};
            }
        }
    }
}

// =============================================================================
// User Message
// =============================================================================

void to_json(json& j, const ImageBlock& image)
{
    j = json{{"format", image.format}, {"source", {{"bytes", image.bytes}}}};
}

EnvState EnvState::capture()
{
    EnvState env;
    env.operating_system = operating_system_name();

    std::error_code ec;
    auto cwd = std::filesystem::current_path(ec);
    if (ec)
    {
        log::get()->error("Attempted to fetch the current directory but it did not exist: {}", ec.message());
        return env;
    }

    env.current_working_directory =
        std::string(truncate_safe(cwd.string(), kMaxCurrentWorkingDirectoryLen));
    return env;
}

void to_json(json& j, const EnvState& env)
{
    j = json{{"operatingSystem", env.operating_system}};
    if (env.current_working_directory)
        j["currentWorkingDirectory"] = *env.current_working_directory;
}

UserMessage::UserMessage(UserMessageContent content, std::vector<ImageBlock> images)
    : env_state_(EnvState::capture()), content_(std::move(content)),
      timestamp_(std::chrono::system_clock::now()), images_(std::move(images))
{
}

UserMessage UserMessage::from_prompt(std::string prompt)
{
    return UserMessage(PromptContent{std::move(prompt)});
}

UserMessage UserMessage::from_cancelled_tool_uses(
    std::optional<std::string> prompt, const std::vector<std::string>& tool_use_ids
)
{
    std::vector<ToolUseResult> results;
    results.reserve(tool_use_ids.size());
    for (const auto& id : tool_use_ids)
    {
        results.push_back(ToolUseResult{
            id, {TextBlock{std::string(kCancelledToolUseText)}}, ToolResultStatus::Error
        });
    }
    return UserMessage(CancelledToolUsesContent{std::move(prompt), std::move(results)});
}

UserMessage UserMessage::from_tool_use_results(
    std::vector<ToolUseResult> results, std::vector<ImageBlock> images
)
{
    return UserMessage(ToolUseResultsContent{std::move(results)}, std::move(images));
}

std::optional<std::string> UserMessage::prompt() const
{
    return std::visit(
        Overloaded{
            [](const PromptContent& c) -> std::optional<std::string> { return c.prompt; },
            [](const CancelledToolUsesContent& c) { return c.prompt; },
            [](const ToolUseResultsContent&) -> std::optional<std::string> { return std::nullopt; },
        },
        content_
    );
}

const std::vector<ToolUseResult>* UserMessage::tool_use_results() const
{
    return std::visit(
        Overloaded{
            [](const PromptContent&) -> const std::vector<ToolUseResult>* { return nullptr; },
            [](const CancelledToolUsesContent& c) { return &c.tool_use_results; },
            [](const ToolUseResultsContent& c) { return &c.tool_use_results; },
        },
        content_
    );
}

void UserMessage::truncate_safe(size_t max_bytes)
{
    std::visit(
        Overloaded{
            [&](PromptContent& c) { truncate_safe_in_place(c.prompt, max_bytes, kTruncatedSuffix); },
            [&](CancelledToolUsesContent& c)
            {
                if (c.prompt)
                {
                    truncate_safe_in_place(*c.prompt, max_bytes / 2, kTruncatedSuffix);
                    truncate_tool_use_results(c.tool_use_results, max_bytes / 2, kTruncatedSuffix);
                }
                else
                {
                    truncate_tool_use_results(c.tool_use_results, max_bytes, kTruncatedSuffix);
                }
            },
            [&](ToolUseResultsContent& c)
            { truncate_tool_use_results(c.tool_use_results, max_bytes, kTruncatedSuffix); },
        },
        content_
    );
}

void UserMessage::replace_content_with_tool_use_results()
{
    const auto* results = tool_use_results();
    if (!results)
        return;

    std::string joined;
    bool first = true;
    for (const auto& result : *results)
    {
        for (const auto& block : result.content)
        {
            if (!first)
                joined += ' ';
            first = false;
            joined += block_text(block).value_or("");
        }
    }

    if (joined.empty())
        joined = kToolResultPlaceholder;

    content_ = PromptContent{std::string(toolchat::truncate_safe(joined, kMaxUserMessageSize))};
}

std::string UserMessage::content_with_context() const
{
    std::string rendered;
    if (auto text = prompt())
    {
        std::string with_timestamp;
        with_timestamp += kContextEntryStartHeader;
        with_timestamp += "Current UTC time: " + format_utc_timestamp(timestamp_);
        with_timestamp += kContextEntryEndHeader;
        with_timestamp += kUserEntryStartHeader;
        with_timestamp += *text;
        with_timestamp += kUserEntryEndHeader;

        rendered = additional_context_.empty() ? with_timestamp
                                               : additional_context_ + "\n" + with_timestamp;
    }
    else
    {
        rendered = additional_context_;
    }

    const char* whitespace = " \t\r\n";
    auto begin = rendered.find_first_not_of(whitespace);
    if (begin == std::string::npos)
        return {};
    auto end = rendered.find_last_not_of(whitespace);
    return rendered.substr(begin, end - begin + 1);
}

json UserMessage::to_history_entry() const
{
    json context = {{"envState", env_state_}};
    if (const auto* results = tool_use_results())
        context["toolResults"] = *results;

    json message = {{"content", content_with_context()}, {"userInputMessageContext", std::move(context)}};
    if (!images_.empty())
        message["images"] = images_;

    return json{{"userInputMessage", std::move(message)}};
}

std::string format_utc_timestamp(std::chrono::system_clock::time_point time)
{
    auto millis =
        std::chrono::duration_cast<std::chrono::milliseconds>(time.time_since_epoch()).count() % 1000;
    if (millis < 0)
        millis += 1000;
    std::time_t seconds = std::chrono::system_clock::to_time_t(time);

    std::tm utc{};
    gmtime_r(&seconds, &utc);

    char date[32];
    std::strftime(date, sizeof(date), "%Y-%m-%dT%H:%M:%S", &utc);

    char buffer[48];
    std::snprintf(buffer, sizeof(buffer), "%s.%03dZ", date, static_cast<int>(millis));
    return buffer;
}

// =============================================================================
// Assistant Message
// =============================================================================

std::optional<std::string> AssistantMessage::message_id() const
{
    return std::visit([](const auto& m) { return m.message_id; }, message_);
}

const std::string& AssistantMessage::content() const
{
    return std::visit([](const auto& m) -> const std::string& { return m.content; }, message_);
}

const std::vector<AssistantToolUse>* AssistantMessage::tool_uses() const
{
    if (auto* m = std::get_if<AssistantToolUseResponse>(&message_))
        return &m->tool_uses;
    return nullptr;
}

json AssistantMessage::to_history_entry() const
{
    json message = {{"content", content()}};
    if (auto id = message_id())
        message["messageId"] = *id;

    if (const auto* uses = tool_uses())
    {
        json list = json::array();
        for (const auto& use : *uses)
            list.push_back({{"toolUseId", use.id}, {"name", use.name}, {"input", use.args}});
        message["toolUses"] = std::move(list);
    }

    return json{{"assistantResponseMessage", std::move(message)}};
}

} // namespace toolchat
