// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#pragma once

#include <concepts>
#include <cstddef>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace toolchat
{

// =============================================================================
// Type Aliases
// =============================================================================

/// JSON type alias for cleaner API
using json = nlohmann::json;

// =============================================================================
// Protocol Constants
// =============================================================================

/// MCP protocol revision requested during the handshake
inline constexpr const char* kMcpProtocolVersion = "2024-11-05";

/// Client name and version reported in the initialize request
inline constexpr const char* kClientName = "toolchat";
inline constexpr const char* kVersion = "0.1.0";

/// Separates server and tool name in a qualified tool identity (`@server/tool`).
/// Not a valid character in either a server name or a sanitized tool name.
inline constexpr char kServerToolDelimiter = '/';

// =============================================================================
// Limits
// =============================================================================

/// Backend-imposed limits; the actual service limits are roughly twice these
inline constexpr size_t kMaxToolResponseSize = 400'000;
inline constexpr size_t kMaxUserMessageSize = 400'000;

/// Context window of the backend model, in tokens
inline constexpr size_t kContextWindowSize = 200'000;

/// Maximum number of history entries sent with a request
inline constexpr size_t kMaxConversationStateHistoryLen = 250;

inline constexpr size_t kMaxCurrentWorkingDirectoryLen = 256;

/// Token budget for context files attached to a conversation
inline constexpr size_t kContextFilesMaxSize = 150'000;

inline constexpr size_t kMaxImagesPerRequest = 10;
inline constexpr size_t kMaxImageSize = 10 * 1024 * 1024;

// =============================================================================
// Server Capabilities
// =============================================================================

/// Capabilities a tool server advertised in its initialize result
struct ServerCapabilities
{
    std::string protocol_version;
    std::string server_name;
    std::string server_version;
    bool has_tools = false;
    bool has_prompts = false;
    bool has_resources = false;
    bool tools_list_changed = false;
    bool prompts_list_changed = false;
    /// The raw `capabilities` object
    json raw = json::object();
};

void from_json(const json& j, ServerCapabilities& c);

/// A tool as listed by `tools/list`
struct ToolSpec
{
    std::string name;
    std::string description;
    json input_schema = json::object();
};

inline void to_json(json& j, const ToolSpec& t)
{
    j = json{{"name", t.name}, {"description", t.description}, {"inputSchema", t.input_schema}};
}

inline void from_json(const json& j, ToolSpec& t)
{
    j.at("name").get_to(t.name);
    t.description = j.value("description", "");
    if (j.contains("inputSchema") && j.at("inputSchema").is_object())
        t.input_schema = j.at("inputSchema");
}

struct PromptArgument
{
    std::string name;
    std::optional<std::string> description;
    bool required = false;
};

/// A prompt as listed by `prompts/list`
struct PromptSpec
{
    std::string name;
    std::optional<std::string> description;
    std::vector<PromptArgument> arguments;
};

inline void from_json(const json& j, PromptArgument& a)
{
    j.at("name").get_to(a.name);
    if (j.contains("description") && j.at("description").is_string())
        a.description = j.at("description").get<std::string>();
    a.required = j.value("required", false);
}

inline void from_json(const json& j, PromptSpec& p)
{
    j.at("name").get_to(p.name);
    if (j.contains("description") && j.at("description").is_string())
        p.description = j.at("description").get<std::string>();
    if (j.contains("arguments") && j.at("arguments").is_array())
        p.arguments = j.at("arguments").get<std::vector<PromptArgument>>();
}

// =============================================================================
// Tool Call Result (tools/call response)
// =============================================================================

struct TextContent
{
    std::string text;
};

struct ImageContent
{
    /// Base64 image data (or its redaction)
    std::string data;
    std::string mime_type;
};

struct ResourceContent
{
    json resource;
};

/// One content block of a tool call result
using MessageContent = std::variant<TextContent, ImageContent, ResourceContent>;

/// Structured result of `tools/call`
struct ToolCallResult
{
    std::vector<MessageContent> content;
    bool is_error = false;
};

/// @throws json::exception if the block has an unknown type or missing fields
void from_json(const json& j, MessageContent& c);
template <typename T>
    requires std::same_as<T, MessageContent>
void to_json(json& j, const T& c);
extern template void to_json<MessageContent>(json& j, const MessageContent& c);

/// @throws json::exception if `content` is missing or malformed
void from_json(const json& j, ToolCallResult& r);
void to_json(json& j, const ToolCallResult& r);

} // namespace toolchat
