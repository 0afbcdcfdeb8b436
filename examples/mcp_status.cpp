// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

/// @file mcp_status.cpp
/// @brief Load an agent config, start its tool servers and list their tools
///
/// Usage: mcp_status <agent.json> [tool-name [json-args]]
///
/// With a tool name, the tool is also run once. Tool uses that need consent
/// are confirmed on stdin.

#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <toolchat/toolchat.hpp>

namespace
{

std::string read_file(const std::string& path)
{
    std::ifstream file(path);
    if (!file)
        throw toolchat::ConfigError("Cannot open " + path);
    std::stringstream contents;
    contents << file.rdbuf();
    return contents.str();
}

bool confirm(const toolchat::ToolIdentity& identity, const toolchat::AssistantToolUse& use)
{
    std::cout << "Allow " << identity.qualified() << " with " << use.args.dump() << "? [y/N] ";
    std::string answer;
    std::getline(std::cin, answer);
    return answer == "y" || answer == "Y";
}

} // namespace

int main(int argc, char** argv)
{
    if (argc < 2)
    {
        std::cerr << "Usage: " << argv[0] << " <agent.json> [tool-name [json-args]]\n";
        return 2;
    }

    try
    {
        toolchat::log::set_level("info");

        auto config = toolchat::parse_agent_config(read_file(argv[1]));
        toolchat::ToolManager tools(config);
        auto failures = tools.load_servers();

        std::cout << "=== Agent " << config.name << " ===\n\n";
        for (const auto& name : tools.server_names())
        {
            auto session = tools.session(name);
            auto caps = session->capabilities();
            std::cout << name << ": " << toolchat::to_string(session->state());
            if (caps)
                std::cout << " (" << caps->server_name << " " << caps->server_version << ", protocol "
                          << caps->protocol_version << ")";
            std::cout << "\n";
        }
        for (const auto& [name, error] : failures)
            std::cout << name << ": failed: " << error << "\n";

        std::cout << "\nTools:\n";
        for (const auto& spec : tools.tool_specs())
            std::cout << "  " << spec.name << "  " << spec.description << "\n";

        if (argc >= 3)
        {
            toolchat::AssistantToolUse use;
            use.id = "tooluse_cli";
            use.name = argv[2];
            use.args = argc >= 4 ? toolchat::json::parse(argv[3]) : toolchat::json::object();
            if (!tools.resolve_tool_use(use))
                std::cout << "\nUnknown tool " << use.name << "\n";

            auto result = tools.run_tool_use(use, confirm);
            std::cout << "\n" << toolchat::json(result).dump(2) << "\n";
        }

        tools.shutdown();
        return failures.empty() ? 0 : 1;
    }
    catch (const std::exception& e)
    {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
