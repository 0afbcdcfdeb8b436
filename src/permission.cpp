// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#include <algorithm>
#include <toolchat/log.hpp>
#include <toolchat/permission.hpp>
#include <vector>

namespace toolchat
{

namespace
{

/// Sub-resource allow/deny lists of a settings block
struct ResourceSettings
{
    std::vector<std::string> allowed_services;
    std::vector<std::string> denied_services;
};

void from_json(const json& j, ResourceSettings& s)
{
    j.at("allowedServices").get_to(s.allowed_services);
    j.at("deniedServices").get_to(s.denied_services);
}

bool contains(const std::vector<std::string>& list, const std::string& value)
{
    return std::find(list.begin(), list.end(), value) != list.end();
}

} // namespace

const char* to_string(PermissionDecision decision)
{
    switch (decision)
    {
    case PermissionDecision::Allow:
        return "allow";
    case PermissionDecision::Deny:
        return "deny";
    case PermissionDecision::Ask:
        return "ask";
    }
    return "unknown";
}

std::string ToolIdentity::qualified() const
{
    if (!server)
        return tool;
    return "@" + *server + kServerToolDelimiter + tool;
}

std::optional<std::string> ToolIdentity::server_wildcard() const
{
    if (!server)
        return std::nullopt;
    return "@" + *server;
}

bool AgentPolicy::is_allowed(const ToolIdentity& identity) const
{
    if (allowed_tools.count(identity.qualified()))
        return true;
    auto wildcard = identity.server_wildcard();
    return wildcard && allowed_tools.count(*wildcard);
}

const json* AgentPolicy::settings_for(const ToolIdentity& identity) const
{
    auto it = tools_settings.find(identity.qualified());
    return it != tools_settings.end() ? &it->second : nullptr;
}

PermissionDecision evaluate_permission(const PermissionRequest& request, const AgentPolicy& policy)
{
    bool allowed = policy.is_allowed(request.identity);
    const json* settings = policy.settings_for(request.identity);

    if (settings && allowed)
    {
        ResourceSettings parsed;
        try
        {
            parsed = settings->get<ResourceSettings>();
        }
        catch (const json::exception& e)
        {
            log::get()->error(
                "Failed to parse tool settings for {}: {}", request.identity.qualified(), e.what()
            );
            return PermissionDecision::Ask;
        }

        if (request.resource && contains(parsed.denied_services, *request.resource))
            return PermissionDecision::Deny;
        if (request.resource && contains(parsed.allowed_services, *request.resource))
            return PermissionDecision::Allow;
        return PermissionDecision::Ask;
    }

    if (allowed)
        return PermissionDecision::Allow;

    return request.read_only ? PermissionDecision::Allow : PermissionDecision::Ask;
}

} // namespace toolchat
