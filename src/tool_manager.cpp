// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#include <cctype>
#include <future>
#include <stdexcept>
#include <toolchat/log.hpp>
#include <toolchat/tool_invocation.hpp>
#include <toolchat/tool_manager.hpp>

namespace toolchat
{

namespace
{

bool is_name_char(char c)
{
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-';
}

ToolUseResult error_result(const std::string& tool_use_id, const std::string& message)
{
    return ToolUseResult{tool_use_id, {TextBlock{message}}, ToolResultStatus::Error};
}

const json& effective_args(const AssistantToolUse& use)
{
    return use.orig_args.is_null() ? use.args : use.orig_args;
}

} // namespace

std::string sanitize_tool_name(const std::string& server, const std::string& tool)
{
    std::string raw = server + kNamespaceDelimiter + tool;
    std::string name;
    for (char c : raw)
    {
        if (is_name_char(c))
            name.push_back(c);
    }

    size_t first = 0;
    while (first < name.size() && !std::isalpha(static_cast<unsigned char>(name[first])))
        ++first;
    name.erase(0, first);

    if (name.empty())
        name = "tool";
    if (name.size() > kMaxToolNameLen)
        name.resize(kMaxToolNameLen);
    return name;
}

// =============================================================================
// ToolManager
// =============================================================================

ToolManager::ToolManager(AgentConfig config, SessionFactory factory)
    : config_(std::move(config)), policy_(AgentPolicy::from_config(config_)), factory_(std::move(factory))
{
    if (!factory_)
        factory_ = [](const std::string& name, const ToolServerConfig& server_config)
        { return ToolServerSession::from_config(name, server_config); };
}

ToolManager::~ToolManager()
{
    shutdown();
}

std::map<std::string, std::string> ToolManager::load_servers()
{
    std::map<std::string, std::future<std::shared_ptr<ToolServerSession>>> loading;
    for (const auto& [name, server] : config_.mcp_servers)
    {
        if (server.disabled)
        {
            log::get()->info("Skipping disabled tool server {}", name);
            continue;
        }

        loading.emplace(name, std::async(std::launch::async, [this, name = name, server = server] {
            auto session = factory_(name, server);
            session->init();
            return session;
        }));
    }

    std::map<std::string, std::string> failures;
    for (auto& [name, future] : loading)
    {
        try
        {
            auto session = future.get();
            std::lock_guard<std::mutex> lock(mutex_);
            sessions_[name] = std::move(session);
        }
        catch (const std::exception& e)
        {
            log::get()->error("Tool server {} failed to initialize: {}", name, e.what());
            failures.emplace(name, e.what());
        }
    }

    log::get()->info("Loaded {} of {} tool servers", loading.size() - failures.size(), loading.size());
    return failures;
}

std::shared_ptr<ToolServerSession> ToolManager::session(const std::string& server) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(server);
    return it == sessions_.end() ? nullptr : it->second;
}

std::vector<std::string> ToolManager::server_names() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> names;
    for (const auto& [name, session] : sessions_)
        names.push_back(name);
    return names;
}

std::vector<ToolSpec> ToolManager::tool_specs()
{
    std::map<std::string, std::shared_ptr<ToolServerSession>> sessions;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        sessions = sessions_;
    }

    std::vector<ToolSpec> specs = {UseAws::spec()};
    std::map<std::string, ResolvedTool> names = {{UseAws::kName, ResolvedTool{std::nullopt, UseAws::kName}}};

    for (const auto& [server, session] : sessions)
    {
        std::vector<ToolSpec> tools;
        if (session->tools_out_of_date())
        {
            try
            {
                tools = session->refresh_tools();
            }
            catch (const std::runtime_error& e)
            {
                log::get()->warn("Could not refresh tools of {}, using cached list: {}", server, e.what());
                tools = session->tools();
            }
        }
        else
        {
            tools = session->tools();
        }

        for (auto& tool : tools)
        {
            auto name = sanitize_tool_name(server, tool.name);
            if (names.count(name))
            {
                auto base = name;
                for (int n = 2; names.count(name); ++n)
                {
                    auto suffix = "_" + std::to_string(n);
                    name = base.substr(0, kMaxToolNameLen - suffix.size()) + suffix;
                }
            }
            if (name != tool.name)
                log::get()->debug("Exposing {}/{} as {}", server, tool.name, name);

            names.emplace(name, ResolvedTool{server, tool.name});
            tool.name = name;
            specs.push_back(std::move(tool));
        }
    }

    std::lock_guard<std::mutex> lock(mutex_);
    tool_names_ = std::move(names);
    return specs;
}

std::optional<ResolvedTool> ToolManager::resolve(const std::string& model_name) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tool_names_.find(model_name);
    if (it != tool_names_.end())
        return it->second;
    if (model_name == UseAws::kName)
        return ResolvedTool{std::nullopt, UseAws::kName};
    return std::nullopt;
}

bool ToolManager::resolve_tool_use(AssistantToolUse& use) const
{
    auto resolved = resolve(use.name);
    if (!resolved)
        return false;

    use.orig_name = resolved->orig_name;
    if (use.orig_args.is_null())
        use.orig_args = use.args;
    return true;
}

PermissionDecision ToolManager::evaluate(const AssistantToolUse& use) const
{
    auto resolved = resolve(use.name);
    if (!resolved)
        throw std::invalid_argument("Unknown tool " + use.name);

    if (resolved->is_builtin())
        return effective_args(use).get<UseAws>().eval_perm(policy_);

    return evaluate_permission(PermissionRequest{resolved->identity()}, policy_);
}

ToolUseResult ToolManager::run_tool_use(const AssistantToolUse& use, const AskCallback& ask)
{
    auto resolved = resolve(use.name);
    if (!resolved)
    {
        log::get()->warn("Model asked for unknown tool {}", use.name);
        return error_result(use.id, "The tool \"" + use.name + "\" does not exist");
    }

    PermissionDecision decision;
    try
    {
        decision = evaluate(use);
    }
    catch (const json::exception& e)
    {
        return to_tool_use_result(use.id, e);
    }

    auto identity = resolved->identity();
    log::get()->debug("Permission for {}: {}", identity.qualified(), to_string(decision));

    if (decision == PermissionDecision::Deny)
        return error_result(use.id, "Tool use of " + identity.qualified() + " was denied by the agent configuration");
    if (decision == PermissionDecision::Ask && !(ask && ask(identity, use)))
        return error_result(use.id, "Tool use of " + identity.qualified() + " was rejected by the user");

    if (resolved->is_builtin())
        return run_builtin(use, *resolved);

    auto owner = session(*resolved->server);
    if (!owner)
        return error_result(use.id, "Tool server " + *resolved->server + " is not loaded");

    try
    {
        auto output = invoke_tool(*owner, McpToolCall{use.name, resolved->orig_name, effective_args(use)});
        return to_tool_use_result(use.id, output);
    }
    catch (const ToolInvocationError& e)
    {
        log::get()->warn("{} failed ({}): {}", identity.qualified(), to_string(e.kind()), e.what());
        return to_tool_use_result(use.id, e);
    }
}

ToolUseResult ToolManager::run_builtin(const AssistantToolUse& use, const ResolvedTool& tool)
{
    try
    {
        auto aws = effective_args(use).get<UseAws>();
        return to_tool_use_result(use.id, aws.invoke());
    }
    catch (const json::exception& e)
    {
        return to_tool_use_result(use.id, e);
    }
    catch (const ToolExecutionError& e)
    {
        log::get()->warn("{} failed: {}", tool.orig_name, e.what());
        return to_tool_use_result(use.id, e);
    }
}

void ToolManager::shutdown()
{
    std::map<std::string, std::shared_ptr<ToolServerSession>> sessions;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        sessions.swap(sessions_);
        tool_names_.clear();
    }

    for (auto& [name, session] : sessions)
    {
        log::get()->debug("Closing tool server {}", name);
        session->close();
    }
}

} // namespace toolchat
