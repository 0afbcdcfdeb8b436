// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#include "fake_server.hpp"

#include <gtest/gtest.h>
#include <mutex>
#include <thread>
#include <toolchat/tool_manager.hpp>

using namespace toolchat;
using toolchat::test::FakeServerHarness;
using toolchat::test::FakeToolServer;
using toolchat::test::tool_json;

namespace
{

/// One in-memory fake server per configured server name
class Servers
{
  public:
    FakeServerHarness& operator[](const std::string& name)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& slot = harnesses_[name];
        if (!slot)
            slot = std::make_unique<FakeServerHarness>();
        return *slot;
    }

    SessionFactory factory()
    {
        return [this](const std::string& name, const ToolServerConfig& config)
        {
            SessionOptions options;
            options.timeout = std::chrono::milliseconds(config.timeout_ms);
            return std::make_shared<ToolServerSession>(name, (*this)[name].factory(), options);
        };
    }

  private:
    std::mutex mutex_;
    std::map<std::string, std::unique_ptr<FakeServerHarness>> harnesses_;
};

AgentConfig agent_with(std::vector<std::string> servers, std::set<std::string> allowed = {})
{
    AgentConfig config;
    for (const auto& name : servers)
    {
        ToolServerConfig server;
        server.command = name + "-mcp";
        server.timeout_ms = 500;
        config.mcp_servers[name] = server;
    }
    config.allowed_tools = std::move(allowed);
    return config;
}

AssistantToolUse use_of(const std::string& name, json args = json::object())
{
    return AssistantToolUse{"tu-1", name, "", std::move(args), nullptr};
}

std::string result_text(const ToolUseResult& result)
{
    return std::get<TextBlock>(result.content.at(0)).text;
}

void serve_git(FakeToolServer& server)
{
    server.set_tools(json::array({tool_json("status", "Show status"), tool_json("log")}));
    server.handle("tools/call", [](const json& params) {
        return json{{"content", {{{"type", "text"}, {"text", "ran " + params["name"].get<std::string>()}}}}};
    });
}

} // namespace

// =============================================================================
// Tool Names
// =============================================================================

TEST(SanitizeToolNameTest, JoinsWithDelimiter)
{
    EXPECT_EQ(sanitize_tool_name("git", "status"), "git___status");
}

TEST(SanitizeToolNameTest, DropsInvalidCharacters)
{
    EXPECT_EQ(sanitize_tool_name("my.server", "read file!"), "myserver___readfile");
    EXPECT_EQ(sanitize_tool_name("web-fetch", "get_url"), "web-fetch___get_url");
}

TEST(SanitizeToolNameTest, StartsWithLetter)
{
    EXPECT_EQ(sanitize_tool_name("1st", "tool"), "st___tool");
    EXPECT_EQ(sanitize_tool_name("", ""), "tool");
}

TEST(SanitizeToolNameTest, CapsLength)
{
    auto name = sanitize_tool_name("srv", std::string(100, 'x'));
    EXPECT_EQ(name.size(), kMaxToolNameLen);
    EXPECT_EQ(name.rfind("srv___", 0), 0u);
}

// =============================================================================
// Loading
// =============================================================================

TEST(ToolManagerTest, LoadsServersAndReportsFailures)
{
    Servers servers;
    servers["git"].configure = serve_git;
    servers["broken"].configure = [](FakeToolServer& server) {
        server.handle("initialize", [](const json&) -> json {
            throw JsonRpcError(JsonRpcErrorCode::InternalError, "cannot start");
        });
    };

    auto config = agent_with({"git", "broken", "off"});
    config.mcp_servers["off"].disabled = true;

    ToolManager manager(config, servers.factory());
    auto failures = manager.load_servers();

    ASSERT_EQ(failures.size(), 1u);
    EXPECT_NE(failures.at("broken").find("cannot start"), std::string::npos);
    EXPECT_EQ(manager.server_names(), (std::vector<std::string>{"git"}));
    EXPECT_NE(manager.session("git"), nullptr);
    EXPECT_EQ(manager.session("broken"), nullptr);
    EXPECT_EQ(manager.session("off"), nullptr);
    EXPECT_EQ(servers["off"].connections(), 0u);
}

TEST(ToolManagerTest, ToolSpecsListBuiltinsThenServerTools)
{
    Servers servers;
    servers["git"].configure = serve_git;

    ToolManager manager(agent_with({"git"}), servers.factory());
    manager.load_servers();
    auto specs = manager.tool_specs();

    ASSERT_EQ(specs.size(), 3u);
    EXPECT_EQ(specs[0].name, UseAws::kName);
    EXPECT_EQ(specs[1].name, "git___status");
    EXPECT_EQ(specs[1].description, "Show status");
    EXPECT_EQ(specs[2].name, "git___log");

    auto resolved = manager.resolve("git___status");
    ASSERT_TRUE(resolved.has_value());
    EXPECT_EQ(resolved->server, "git");
    EXPECT_EQ(resolved->orig_name, "status");
    EXPECT_FALSE(manager.resolve("git___missing").has_value());
}

TEST(ToolManagerTest, CollidingNamesGetSuffix)
{
    Servers servers;
    servers["git"].configure = [](FakeToolServer& server) {
        server.set_tools(json::array({tool_json("st@tus"), tool_json("sttus")}));
    };

    ToolManager manager(agent_with({"git"}), servers.factory());
    manager.load_servers();
    auto specs = manager.tool_specs();

    ASSERT_EQ(specs.size(), 3u);
    EXPECT_EQ(specs[1].name, "git___sttus");
    EXPECT_EQ(specs[2].name, "git___sttus_2");
    EXPECT_EQ(manager.resolve("git___sttus_2")->orig_name, "sttus");
}

TEST(ToolManagerTest, StaleToolListsRefreshed)
{
    Servers servers;
    servers["git"].configure = [](FakeToolServer& server) { server.set_tools(json::array({tool_json("status")})); };

    ToolManager manager(agent_with({"git"}), servers.factory());
    manager.load_servers();
    EXPECT_EQ(manager.tool_specs().size(), 2u);

    auto& server = servers["git"].last();
    server.set_tools(json::array({tool_json("status"), tool_json("diff")}));
    server.notify("notifications/tools/list_changed");

    auto session = manager.session("git");
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
    while (!session->tools_out_of_date() && std::chrono::steady_clock::now() < deadline)
        std::this_thread::sleep_for(std::chrono::milliseconds(10));

    auto specs = manager.tool_specs();
    ASSERT_EQ(specs.size(), 3u);
    EXPECT_EQ(specs[2].name, "git___diff");
}

TEST(ToolManagerTest, ResolveToolUseFillsOriginals)
{
    Servers servers;
    servers["git"].configure = serve_git;

    ToolManager manager(agent_with({"git"}), servers.factory());
    manager.load_servers();
    manager.tool_specs();

    auto use = use_of("git___log", {{"limit", 3}});
    ASSERT_TRUE(manager.resolve_tool_use(use));
    EXPECT_EQ(use.orig_name, "log");
    EXPECT_EQ(use.orig_args["limit"], 3);

    auto unknown = use_of("nope");
    EXPECT_FALSE(manager.resolve_tool_use(unknown));
}

// =============================================================================
// Running Tool Uses
// =============================================================================

TEST(ToolManagerTest, AllowedServerToolRuns)
{
    Servers servers;
    servers["git"].configure = serve_git;

    ToolManager manager(agent_with({"git"}, {"@git"}), servers.factory());
    manager.load_servers();
    manager.tool_specs();

    bool asked = false;
    auto result = manager.run_tool_use(use_of("git___status"), [&](const ToolIdentity&, const AssistantToolUse&) {
        asked = true;
        return false;
    });

    EXPECT_FALSE(asked);
    EXPECT_EQ(result.tool_use_id, "tu-1");
    EXPECT_EQ(result.status, ToolResultStatus::Success);
    EXPECT_EQ(std::get<JsonBlock>(result.content[0]).value["content"][0]["text"], "ran status");
}

TEST(ToolManagerTest, UnlistedServerToolAsks)
{
    Servers servers;
    servers["git"].configure = serve_git;

    ToolManager manager(agent_with({"git"}), servers.factory());
    manager.load_servers();
    manager.tool_specs();
    EXPECT_EQ(manager.evaluate(use_of("git___status")), PermissionDecision::Ask);

    std::string asked_for;
    auto approve = [&](const ToolIdentity& identity, const AssistantToolUse&) {
        asked_for = identity.qualified();
        return true;
    };
    auto result = manager.run_tool_use(use_of("git___status"), approve);
    EXPECT_EQ(asked_for, "@git/status");
    EXPECT_EQ(result.status, ToolResultStatus::Success);

    auto refused = manager.run_tool_use(use_of("git___status"), [](auto&, auto&) { return false; });
    EXPECT_EQ(refused.status, ToolResultStatus::Error);
    EXPECT_NE(result_text(refused).find("rejected by the user"), std::string::npos);

    auto no_callback = manager.run_tool_use(use_of("git___status"));
    EXPECT_EQ(no_callback.status, ToolResultStatus::Error);
}

TEST(ToolManagerTest, DeniedBuiltinNeverRuns)
{
    auto config = agent_with({}, {"use_aws"});
    config.tools_settings["use_aws"] = {{"allowedServices", {"s3"}}, {"deniedServices", {"iam"}}};
    ToolManager manager(config);

    auto use = use_of(
        "use_aws",
        {{"service_name", "iam"}, {"operation_name", "list-users"}, {"region", "us-east-1"}, {"label", "Users"}}
    );
    EXPECT_EQ(manager.evaluate(use), PermissionDecision::Deny);

    auto result = manager.run_tool_use(use);
    EXPECT_EQ(result.status, ToolResultStatus::Error);
    EXPECT_NE(result_text(result).find("denied"), std::string::npos);
}

TEST(ToolManagerTest, MalformedBuiltinArgumentsBecomeErrorResult)
{
    ToolManager manager(agent_with({}));
    auto result = manager.run_tool_use(use_of("use_aws", {{"service_name", "s3"}}));

    EXPECT_EQ(result.status, ToolResultStatus::Error);
    EXPECT_NE(result_text(result).find("An error occurred processing the tool"), std::string::npos);
}

TEST(ToolManagerTest, UnknownToolBecomesErrorResult)
{
    ToolManager manager(agent_with({}));
    auto result = manager.run_tool_use(use_of("fs_write"));

    EXPECT_EQ(result.status, ToolResultStatus::Error);
    EXPECT_EQ(result_text(result), "The tool \"fs_write\" does not exist");
    EXPECT_THROW(manager.evaluate(use_of("fs_write")), std::invalid_argument);
}

TEST(ToolManagerTest, ServerErrorBecomesErrorResult)
{
    Servers servers;
    servers["git"].configure = [](FakeToolServer& server) {
        server.set_tools(json::array({tool_json("push")}));
        server.handle("tools/call", [](const json&) -> json {
            throw JsonRpcError(JsonRpcErrorCode::InternalError, "remote rejected");
        });
    };

    ToolManager manager(agent_with({"git"}, {"@git"}), servers.factory());
    manager.load_servers();
    manager.tool_specs();

    auto result = manager.run_tool_use(use_of("git___push"));
    EXPECT_EQ(result.status, ToolResultStatus::Error);
    EXPECT_NE(result_text(result).find("remote rejected"), std::string::npos);
}

TEST(ToolManagerTest, ShutdownClosesSessions)
{
    Servers servers;
    servers["git"].configure = serve_git;

    ToolManager manager(agent_with({"git"}, {"@git"}), servers.factory());
    manager.load_servers();
    manager.tool_specs();
    auto session = manager.session("git");

    manager.shutdown();

    EXPECT_EQ(session->state(), SessionState::Closed);
    EXPECT_TRUE(manager.server_names().empty());
    auto result = manager.run_tool_use(use_of("git___status"));
    EXPECT_EQ(result.status, ToolResultStatus::Error);
}
