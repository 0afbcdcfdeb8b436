// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#include "fake_server.hpp"

#include <gtest/gtest.h>
#include <toolchat/tool_invocation.hpp>

using namespace toolchat;
using toolchat::test::FakeServerHarness;
using toolchat::test::FakeToolServer;

namespace
{

std::shared_ptr<ToolServerSession> ready_session(FakeServerHarness& harness, int timeout_ms = 1000)
{
    SessionOptions options;
    options.timeout = std::chrono::milliseconds(timeout_ms);
    auto session = std::make_shared<ToolServerSession>("fs", harness.factory(), options);
    session->init();
    return session;
}

json text_content(const std::string& text)
{
    return json{{"type", "text"}, {"text", text}};
}

} // namespace

// =============================================================================
// Result Mapping
// =============================================================================

TEST(MapToolCallResultTest, RedactsImageData)
{
    std::string data(1024, 'A');
    json result = {
        {"content", {text_content("here"), {{"type", "image"}, {"data", data}, {"mimeType", "image/png"}}}},
    };

    auto output = map_tool_call_result(result);

    ASSERT_TRUE(std::holds_alternative<JsonOutput>(output.output));
    const auto& value = std::get<JsonOutput>(output.output).value;
    EXPECT_EQ(value["content"][0]["text"], "here");
    EXPECT_EQ(value["content"][1]["data"], redacted_image_text(1024));
    EXPECT_EQ(value["content"][1]["mimeType"], "image/png");
    EXPECT_EQ(value.dump().find(data), std::string::npos);
    EXPECT_FALSE(output.is_error);
}

TEST(MapToolCallResultTest, IsErrorFlagCarried)
{
    auto output = map_tool_call_result({{"content", {text_content("no such file")}}, {"isError", true}});
    EXPECT_TRUE(output.is_error);
    EXPECT_EQ(to_tool_use_result("t1", output).status, ToolResultStatus::Error);
}

TEST(MapToolCallResultTest, UnrecognizedShapePassesThrough)
{
    json odd = {{"rows", {1, 2, 3}}};
    auto output = map_tool_call_result(odd);
    EXPECT_EQ(std::get<JsonOutput>(output.output).value, odd);

    json unknown_block = {{"content", {{{"type", "audio"}, {"data", "..."}}}}};
    EXPECT_EQ(std::get<JsonOutput>(map_tool_call_result(unknown_block).output).value, unknown_block);
}

TEST(MapToolCallResultTest, RedactsImagesBesideUnknownBlocks)
{
    std::string data(2048, 'B');
    json result = {
        {"content",
         {{{"type", "image"}, {"data", data}, {"mimeType", "image/png"}},
          {{"type", "audio"}, {"data", "UklGRg=="}, {"mimeType", "audio/wav"}},
          {{"type", "image"}, {"data", data}}}},
    };

    auto output = map_tool_call_result(result);
    const auto& value = std::get<JsonOutput>(output.output).value;

    EXPECT_EQ(value.dump().find(data), std::string::npos);
    EXPECT_EQ(value["content"][0]["data"], redacted_image_text(2048));
    EXPECT_EQ(value["content"][1]["data"], "UklGRg==");
    EXPECT_EQ(value["content"][2]["data"], redacted_image_text(2048));

    EXPECT_EQ(json(to_tool_use_result("t1", output)).dump().find(data), std::string::npos);
}

TEST(ToInvocationErrorTest, MapsCodesToKinds)
{
    EXPECT_EQ(to_invocation_error(JsonRpcError(JsonRpcErrorCode::Timeout, "t")).kind(), InvocationErrorKind::Timeout);
    EXPECT_EQ(
        to_invocation_error(JsonRpcError(JsonRpcErrorCode::ConnectionClosed, "c")).kind(),
        InvocationErrorKind::Transport
    );
    EXPECT_EQ(
        to_invocation_error(JsonRpcError(JsonRpcErrorCode::RequestCancelled, "x")).kind(),
        InvocationErrorKind::Cancelled
    );

    auto protocol = to_invocation_error(JsonRpcError(JsonRpcErrorCode::InvalidParams, "bad", json{{"field", "path"}}));
    EXPECT_EQ(protocol.kind(), InvocationErrorKind::Protocol);
    EXPECT_EQ(protocol.data()["field"], "path");
    EXPECT_STREQ(protocol.what(), "bad");
}

TEST(ToToolUseResultTest, OutputKinds)
{
    auto text = to_tool_use_result("a", InvokeOutput{TextOutput{"plain"}});
    EXPECT_EQ(std::get<TextBlock>(text.content[0]).text, "plain");
    EXPECT_EQ(text.status, ToolResultStatus::Success);

    auto structured = to_tool_use_result("b", InvokeOutput{JsonOutput{{{"k", 1}}}});
    EXPECT_EQ(std::get<JsonBlock>(structured.content[0]).value["k"], 1);

    auto images = to_tool_use_result("c", InvokeOutput{ImagesOutput{{ImageBlock{"png", "x"}}}});
    EXPECT_EQ(std::get<TextBlock>(images.content[0]).text, "See images data supplied");
}

TEST(ToToolUseResultTest, ErrorCarriesMessage)
{
    ToolInvocationError error(InvocationErrorKind::Timeout, "Request timed out");
    auto result = to_tool_use_result("t9", error);

    EXPECT_EQ(result.tool_use_id, "t9");
    EXPECT_EQ(result.status, ToolResultStatus::Error);
    EXPECT_NE(std::get<TextBlock>(result.content[0]).text.find("Request timed out"), std::string::npos);
}

// =============================================================================
// Invoking Server Tools
// =============================================================================

TEST(InvokeToolTest, SendsOriginalNameAndArguments)
{
    FakeServerHarness harness;
    harness.configure = [](FakeToolServer& server) {
        server.handle("tools/call", [](const json& params) {
            return json{{"content", {text_content("read " + params["arguments"]["path"].get<std::string>())}}};
        });
    };
    auto session = ready_session(harness);

    auto output = invoke_tool(*session, {"fs___read_file", "read_file", {{"path", "/tmp/a"}}});

    auto calls = harness.last().wait_for("tools/call");
    ASSERT_EQ(calls.size(), 1u);
    EXPECT_EQ(calls[0]["params"]["name"], "read_file");
    EXPECT_EQ(std::get<JsonOutput>(output.output).value["content"][0]["text"], "read /tmp/a");
}

TEST(InvokeToolTest, ErrorResponseIsProtocolError)
{
    FakeServerHarness harness;
    harness.configure = [](FakeToolServer& server) {
        server.handle("tools/call", [](const json&) -> json {
            throw JsonRpcError(JsonRpcErrorCode::InvalidParams, "missing path");
        });
    };
    auto session = ready_session(harness);

    try
    {
        invoke_tool(*session, {"fs___read_file", "read_file", json::object()});
        FAIL() << "expected ToolInvocationError";
    }
    catch (const ToolInvocationError& e)
    {
        EXPECT_EQ(e.kind(), InvocationErrorKind::Protocol);
        EXPECT_NE(std::string(e.what()).find("missing path"), std::string::npos);
    }
}

TEST(InvokeToolTest, SilentServerTimesOut)
{
    FakeServerHarness harness;
    harness.configure = [](FakeToolServer& server) { server.ignore("tools/call"); };
    auto session = ready_session(harness, 150);

    try
    {
        invoke_tool(*session, {"fs___slow", "slow", json::object()});
        FAIL() << "expected ToolInvocationError";
    }
    catch (const ToolInvocationError& e)
    {
        EXPECT_EQ(e.kind(), InvocationErrorKind::Timeout);
    }
    EXPECT_EQ(session->state(), SessionState::Ready);
}

TEST(InvokeToolTest, SessionNotReady)
{
    FakeServerHarness harness;
    ToolServerSession session("fs", harness.factory());

    try
    {
        invoke_tool(session, {"fs___read_file", "read_file", json::object()});
        FAIL() << "expected ToolInvocationError";
    }
    catch (const ToolInvocationError& e)
    {
        EXPECT_EQ(e.kind(), InvocationErrorKind::NotReady);
    }
}

TEST(ToolInvocationTest, CancelResolvesWaitAndNotifiesServer)
{
    FakeServerHarness harness;
    harness.configure = [](FakeToolServer& server) { server.ignore("tools/call"); };
    auto session = ready_session(harness);

    auto call = ToolInvocation::start(session, {"fs___slow", "slow", json::object()});
    EXPECT_EQ(call.tool_name(), "fs___slow");
    harness.last().wait_for("tools/call");

    EXPECT_TRUE(call.cancel("user interrupted"));
    EXPECT_FALSE(call.cancel());

    try
    {
        call.wait();
        FAIL() << "expected ToolInvocationError";
    }
    catch (const ToolInvocationError& e)
    {
        EXPECT_EQ(e.kind(), InvocationErrorKind::Cancelled);
    }

    auto cancels = harness.last().wait_for("notifications/cancelled");
    ASSERT_EQ(cancels.size(), 1u);
    EXPECT_EQ(cancels[0]["params"]["requestId"], call.request_id());
    EXPECT_EQ(cancels[0]["params"]["reason"], "user interrupted");

    // The server keeps running after a cancellation
    EXPECT_EQ(session->state(), SessionState::Ready);
}

TEST(ToolInvocationTest, WaitReturnsOutput)
{
    FakeServerHarness harness;
    harness.configure = [](FakeToolServer& server) {
        server.handle("tools/call", [](const json&) { return json{{"content", {text_content("done")}}}; });
    };
    auto session = ready_session(harness);

    auto call = ToolInvocation::start(session, {"fs___x", "x", json::object()});
    auto output = call.wait();

    EXPECT_EQ(std::get<JsonOutput>(output.output).value["content"][0]["text"], "done");
    EXPECT_FALSE(call.cancel());
}
