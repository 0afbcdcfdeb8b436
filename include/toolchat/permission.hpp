// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#pragma once

/// @file permission.hpp
/// @brief Allow / deny / ask decisions for tool invocations

#include <map>
#include <optional>
#include <set>
#include <string>
#include <toolchat/config.hpp>
#include <toolchat/types.hpp>

namespace toolchat
{

/// Outcome of permission evaluation. Deny is a decision, not an error.
enum class PermissionDecision
{
    Allow,
    Deny,
    Ask,
};

const char* to_string(PermissionDecision decision);

/// Identity of a tool as written in allow-lists
struct ToolIdentity
{
    /// Owning tool server; empty for built-in tools
    std::optional<std::string> server;
    std::string tool;

    static ToolIdentity builtin(std::string tool)
    {
        return ToolIdentity{std::nullopt, std::move(tool)};
    }

    static ToolIdentity mcp(std::string server, std::string tool)
    {
        return ToolIdentity{std::move(server), std::move(tool)};
    }

    /// `@server/tool` for server tools, the plain name for built-ins
    std::string qualified() const;

    /// `@server` wildcard entry, or nullopt for built-ins
    std::optional<std::string> server_wildcard() const;
};

/// The parts of an agent configuration that govern permissions
struct AgentPolicy
{
    std::set<std::string> allowed_tools;
    std::map<std::string, json> tools_settings;

    static AgentPolicy from_config(const AgentConfig& config)
    {
        return AgentPolicy{config.allowed_tools, config.tools_settings};
    }

    /// Listed exactly, or its server is listed as `@server`
    bool is_allowed(const ToolIdentity& identity) const;

    /// Settings block keyed by the qualified identity, if any
    const json* settings_for(const ToolIdentity& identity) const;
};

/// One invocation to be gated
struct PermissionRequest
{
    ToolIdentity identity;

    /// Sub-resource the call touches (for example a cloud service name)
    std::optional<std::string> resource;

    /// Intrinsic default: read-only calls are allowed, mutating ones ask
    bool read_only = false;
};

/// Decide whether an invocation may run
///
/// 1. Allow-listed with a settings block: a sub-resource in `deniedServices`
///    is denied, one in `allowedServices` is allowed, anything else asks.
///    A settings block that does not parse asks.
/// 2. Allow-listed without settings: allowed.
/// 3. Otherwise: allowed when read-only, else ask.
///
/// Deterministic and free of side effects.
PermissionDecision evaluate_permission(const PermissionRequest& request, const AgentPolicy& policy);

} // namespace toolchat
