// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#pragma once

/// @file config.hpp
/// @brief Tool server and agent configuration

#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <toolchat/types.hpp>
#include <vector>

namespace toolchat
{

/// Exception thrown when configuration cannot be loaded or parsed
class ConfigError : public std::runtime_error
{
  public:
    explicit ConfigError(const std::string& message) : std::runtime_error(message) {}
};

/// Default per-request timeout for a tool server, in milliseconds
inline constexpr int64_t kDefaultServerTimeoutMs = 120 * 1000;

// =============================================================================
// Tool Server Configuration
// =============================================================================

/// How to launch one external tool server
struct ToolServerConfig
{
    /// Executable, resolved through PATH
    std::string command;

    std::vector<std::string> args;

    /// Environment overrides; values may contain `${env:NAME}` references
    std::optional<std::map<std::string, std::string>> env;

    /// Timeout for each request in milliseconds
    int64_t timeout_ms = kDefaultServerTimeoutMs;

    /// Skip this server when loading tools
    bool disabled = false;
};

void to_json(json& j, const ToolServerConfig& c);
void from_json(const json& j, ToolServerConfig& c);

// =============================================================================
// Agent Configuration
// =============================================================================

/// Agent policy and tool servers
///
/// JSON shape:
/// @code
/// {
///   "name": "default",
///   "mcpServers": { "git": { "command": "git-mcp", "args": [] } },
///   "allowedTools": ["fs_read", "@git", "@fetch/get"],
///   "toolsSettings": { "use_aws": { "allowedServices": ["s3"] } }
/// }
/// @endcode
struct AgentConfig
{
    std::string name = "default";
    std::map<std::string, ToolServerConfig> mcp_servers;

    /// Built-in tool names, `@server` or `@server/tool`
    std::set<std::string> allowed_tools;

    /// Per-tool settings keyed the same way as allowed_tools
    std::map<std::string, json> tools_settings;
};

void to_json(json& j, const AgentConfig& c);
void from_json(const json& j, AgentConfig& c);

/// Parse agent configuration text
/// @throws ConfigError on malformed JSON or invalid fields
AgentConfig parse_agent_config(const std::string& text);

/// Load the server map from a file with a top-level `mcpServers` object
/// @throws ConfigError if the file is unreadable, malformed or lacks `mcpServers`
std::map<std::string, ToolServerConfig> load_mcp_server_config(const std::string& path);

// =============================================================================
// Environment Substitution
// =============================================================================

/// Lookup used for `${env:NAME}`; returns nullopt for unset variables
using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

/// Lookup against the current process environment
EnvLookup process_env_lookup();

/// Replace every `${env:NAME}` with the variable's value.
/// An unset variable is replaced by `${NAME}`.
std::string substitute_env_vars(const std::string& input, const EnvLookup& lookup);

/// Apply substitute_env_vars to every value of the map
void process_env_vars(std::map<std::string, std::string>& vars, const EnvLookup& lookup);

} // namespace toolchat
