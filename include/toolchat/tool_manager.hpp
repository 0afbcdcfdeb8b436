// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#pragma once

/// @file tool_manager.hpp
/// @brief ToolManager: every tool an agent can call, behind model-facing names

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <toolchat/builtin_tools.hpp>
#include <toolchat/config.hpp>
#include <toolchat/message.hpp>
#include <toolchat/permission.hpp>
#include <toolchat/session.hpp>
#include <toolchat/types.hpp>
#include <vector>

namespace toolchat
{

/// Separator between server and tool in model-facing names
inline constexpr const char* kNamespaceDelimiter = "___";

/// Longest tool name the backend accepts
inline constexpr size_t kMaxToolNameLen = 64;

/// Creates (but does not initialize) the session for one configured server
using SessionFactory =
    std::function<std::shared_ptr<ToolServerSession>(const std::string& name, const ToolServerConfig& config)>;

/// Asked when a tool use needs the user's consent; return true to run it
using AskCallback = std::function<bool(const ToolIdentity& identity, const AssistantToolUse& use)>;

/// Where a model-facing tool name leads
struct ResolvedTool
{
    /// Owning server; nullopt for built-in tools
    std::optional<std::string> server;
    /// Name the server (or the built-in registry) knows the tool by
    std::string orig_name;

    bool is_builtin() const
    {
        return !server.has_value();
    }

    ToolIdentity identity() const
    {
        return server ? ToolIdentity::mcp(*server, orig_name) : ToolIdentity::builtin(orig_name);
    }
};

/// Model-facing name for a server tool: `server___tool` restricted to
/// `[A-Za-z0-9_-]`, starting with a letter, at most kMaxToolNameLen bytes
std::string sanitize_tool_name(const std::string& server, const std::string& tool);

/// Owns the sessions of one agent and runs the tool uses the model asks for
///
/// @code
/// ToolManager tools(parse_agent_config(text));
/// for (const auto& [server, error] : tools.load_servers())
///     std::cerr << server << " failed: " << error << "\n";
/// auto catalogue = tools.tool_specs();
/// // ... model replies with a tool use ...
/// auto result = tools.run_tool_use(use, [](const ToolIdentity& id, const AssistantToolUse&) {
///     return confirm("Run " + id.qualified() + "?");
/// });
/// conversation.append_tool_use_results({result});
/// @endcode
class ToolManager
{
  public:
    explicit ToolManager(AgentConfig config, SessionFactory factory = {});
    ~ToolManager();

    ToolManager(const ToolManager&) = delete;
    ToolManager& operator=(const ToolManager&) = delete;

    /// Create and initialize every enabled server concurrently
    /// @return Servers that failed to initialize, with the error message
    std::map<std::string, std::string> load_servers();

    /// Session for a server that initialized, or nullptr
    std::shared_ptr<ToolServerSession> session(const std::string& server) const;

    std::vector<std::string> server_names() const;

    const AgentPolicy& policy() const
    {
        return policy_;
    }

    /// Catalogue for the backend: built-in tools then server tools under
    /// their model-facing names. Stale tool lists are refreshed first.
    std::vector<ToolSpec> tool_specs();

    /// Look up a model-facing name from the last tool_specs() call
    std::optional<ResolvedTool> resolve(const std::string& model_name) const;

    /// Fill orig_name and orig_args of a tool use the model produced
    /// @return false if the name is unknown
    bool resolve_tool_use(AssistantToolUse& use) const;

    /// Permission decision for a tool use, without running it
    PermissionDecision evaluate(const AssistantToolUse& use) const;

    /// Resolve, gate, invoke and record one tool use
    ///
    /// Never throws for tool failures: unknown tools, denials, refusals and
    /// invocation errors all come back as error-status results.
    ToolUseResult run_tool_use(const AssistantToolUse& use, const AskCallback& ask = {});

    /// Close every session
    void shutdown();

  private:
    ToolUseResult run_builtin(const AssistantToolUse& use, const ResolvedTool& tool);

    AgentConfig config_;
    AgentPolicy policy_;
    SessionFactory factory_;

    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<ToolServerSession>> sessions_;
    std::map<std::string, ResolvedTool> tool_names_;
};

} // namespace toolchat
