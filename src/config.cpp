// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#include <cstdlib>
#include <fstream>
#include <sstream>
#include <toolchat/config.hpp>

namespace toolchat
{

void to_json(json& j, const ToolServerConfig& c)
{
    j = json{{"command", c.command}, {"args", c.args}, {"timeout", c.timeout_ms}};
    if (c.env)
        j["env"] = *c.env;
    if (c.disabled)
        j["disabled"] = true;
}

void from_json(const json& j, ToolServerConfig& c)
{
    j.at("command").get_to(c.command);
    c.args = j.value("args", std::vector<std::string>{});
    if (j.contains("env") && !j.at("env").is_null())
        c.env = j.at("env").get<std::map<std::string, std::string>>();
    c.timeout_ms = j.value("timeout", kDefaultServerTimeoutMs);
    c.disabled = j.value("disabled", false);
}

void to_json(json& j, const AgentConfig& c)
{
    j = json{
        {"name", c.name},
        {"mcpServers", c.mcp_servers},
        {"allowedTools", c.allowed_tools},
        {"toolsSettings", c.tools_settings},
    };
}

void from_json(const json& j, AgentConfig& c)
{
    c.name = j.value("name", "default");
    if (j.contains("mcpServers"))
        c.mcp_servers = j.at("mcpServers").get<std::map<std::string, ToolServerConfig>>();
    if (j.contains("allowedTools"))
        c.allowed_tools = j.at("allowedTools").get<std::set<std::string>>();
    if (j.contains("toolsSettings"))
        c.tools_settings = j.at("toolsSettings").get<std::map<std::string, json>>();
}

AgentConfig parse_agent_config(const std::string& text)
{
    try
    {
        return json::parse(text).get<AgentConfig>();
    }
    catch (const json::exception& e)
    {
        throw ConfigError(std::string("Invalid agent config: ") + e.what());
    }
}

std::map<std::string, ToolServerConfig> load_mcp_server_config(const std::string& path)
{
    std::ifstream file(path);
    if (!file)
        throw ConfigError("Cannot open MCP config file: " + path);

    std::stringstream contents;
    contents << file.rdbuf();

    json document;
    try
    {
        document = json::parse(contents.str());
    }
    catch (const json::parse_error& e)
    {
        throw ConfigError("Malformed MCP config " + path + ": " + e.what());
    }

    if (!document.is_object() || !document.contains("mcpServers"))
        throw ConfigError("MCP config " + path + " has no \"mcpServers\" object");

    try
    {
        return document.at("mcpServers").get<std::map<std::string, ToolServerConfig>>();
    }
    catch (const json::exception& e)
    {
        throw ConfigError("Invalid server entry in " + path + ": " + e.what());
    }
}

EnvLookup process_env_lookup()
{
    return [](const std::string& name) -> std::optional<std::string>
    {
        if (const char* value = std::getenv(name.c_str()))
            return std::string(value);
        return std::nullopt;
    };
}

std::string substitute_env_vars(const std::string& input, const EnvLookup& lookup)
{
    static const std::string kOpen = "${env:";

    std::string out;
    out.reserve(input.size());

    size_t pos = 0;
    while (pos < input.size())
    {
        auto start = input.find(kOpen, pos);
        if (start == std::string::npos)
            break;

        auto name_begin = start + kOpen.size();
        auto close = input.find('}', name_begin);
        // `${env:}` has no name and is left alone, like an unterminated reference
        if (close == std::string::npos || close == name_begin)
        {
            out.append(input, pos, name_begin - pos);
            pos = name_begin;
            continue;
        }

        out.append(input, pos, start - pos);
        auto name = input.substr(name_begin, close - name_begin);
        if (auto value = lookup(name))
            out += *value;
        else
            out += "${" + name + "}";
        pos = close + 1;
    }

    out.append(input, pos, std::string::npos);
    return out;
}

void process_env_vars(std::map<std::string, std::string>& vars, const EnvLookup& lookup)
{
    for (auto& [key, value] : vars)
        value = substitute_env_vars(value, lookup);
}

} // namespace toolchat
