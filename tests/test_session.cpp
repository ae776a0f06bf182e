//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_session.cpp
// Purpose: ToolServerSession handshake, calls and failure mapping against the scripted tool server
//==========================================================================================================

#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <future>
#include <string>
#include <thread>

#include "mcphost/ProcessTransport.hpp"
#include "mcphost/ToolServerSession.h"
#include "mcphost/errors/Errors.h"

using namespace mcphost;

namespace {

std::unique_ptr<ToolServerSession> makeSession(std::vector<std::string> args = {}) {
    CommandSpec cmd;
    cmd.program = MCPHOST_FAKE_SERVER_PATH;
    cmd.args = std::move(args);
    ProcessTransport::Options opts;
    opts.shutdownGrace = std::chrono::milliseconds(500);
    return std::make_unique<ToolServerSession>(std::make_unique<ProcessTransport>(cmd, std::map<std::string, std::string>{}, opts));
}

Implementation hostInfo() {
    return Implementation("mcphost-tests", "0.0.1");
}

JSONValue argsWith(const std::string& key, JSONValue v) {
    JSONValue::Object o;
    json::set(o, key, std::move(v));
    return JSONValue(std::move(o));
}

bool hasTool(const std::vector<Tool>& tools, const std::string& name) {
    return std::any_of(tools.begin(), tools.end(), [&name](const Tool& t) { return t.name == name; });
}

} // namespace

TEST(ToolServerSessionTest, OpenNegotiatesAndListsTools) {
    auto session = makeSession({"--name=scripted"});
    auto tools = session->Open(hostInfo(), std::chrono::seconds(10));
    EXPECT_TRUE(hasTool(tools, "echo"));
    EXPECT_TRUE(hasTool(tools, "add"));
    auto info = session->GetServerInfo();
    EXPECT_EQ(info.serverInfo.name, "scripted");
    EXPECT_TRUE(info.toolsListChanged);
    EXPECT_TRUE(session->IsConnected());
    session->Close();
    EXPECT_FALSE(session->IsConnected());
}

TEST(ToolServerSessionTest, CallReturnsResult) {
    auto session = makeSession();
    session->Open(hostInfo(), std::chrono::seconds(10));
    JSONValue::Object a;
    json::set(a, "a", static_cast<int64_t>(2));
    json::set(a, "b", static_cast<int64_t>(40));
    JSONValue result = session->CallTool("add", JSONValue(std::move(a)), std::chrono::seconds(5));
    EXPECT_NE(serializeJSONValue(result).find("\"42\""), std::string::npos);
    session->Close();
}

TEST(ToolServerSessionTest, IsErrorResultBecomesToolErrorWithPayload) {
    auto session = makeSession();
    session->Open(hostInfo(), std::chrono::seconds(10));
    try {
        session->CallTool("fail", argsWith("message", JSONValue("disk full")), std::chrono::seconds(5));
        FAIL() << "expected ToolError";
    } catch (const HostError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::ToolError);
        EXPECT_EQ(std::string(e.what()), "disk full");
        ASSERT_TRUE(e.data().has_value());
        EXPECT_EQ(json::getBool(*e.data(), "isError"), std::optional<bool>(true));
    }
    // the instance keeps serving after a tool-level failure
    EXPECT_NO_THROW(session->CallTool("echo", argsWith("text", JSONValue("ok")), std::chrono::seconds(5)));
    session->Close();
}

TEST(ToolServerSessionTest, RpcErrorKeepsCodeAndData) {
    auto session = makeSession();
    session->Open(hostInfo(), std::chrono::seconds(10));
    try {
        session->CallTool("rpc_error", JSONValue(JSONValue::Object{}), std::chrono::seconds(5));
        FAIL() << "expected ToolError";
    } catch (const HostError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::ToolError);
        EXPECT_EQ(e.rpcCode().value_or(0), -32001);
        ASSERT_TRUE(e.data().has_value());
        const JSONValue* data = json::getObject(*e.data(), "data");
        ASSERT_NE(data, nullptr);
        EXPECT_EQ(json::getString(*data, "detail").value_or(""), "scripted failure");
    }
    session->Close();
}

TEST(ToolServerSessionTest, HangingInitializeIsHandshakeTimeout) {
    auto session = makeSession({"--mode=hang-init"});
    const auto begin = std::chrono::steady_clock::now();
    try {
        session->Open(hostInfo(), std::chrono::milliseconds(300));
        FAIL() << "expected HandshakeTimeout";
    } catch (const HostError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::HandshakeTimeout);
    }
    EXPECT_LT(std::chrono::steady_clock::now() - begin, std::chrono::seconds(5));
    session->Close();
}

TEST(ToolServerSessionTest, ExitDuringStartupCarriesDiagnostics) {
    auto session = makeSession({"--mode=exit-on-start"});
    try {
        session->Open(hostInfo(), std::chrono::seconds(5));
        FAIL() << "expected TransportDisconnected";
    } catch (const HostError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::TransportDisconnected);
    }
    EXPECT_NE(session->GetDiagnostics().find("missing configuration"), std::string::npos);
}

TEST(ToolServerSessionTest, CallTimeoutDoesNotKillServer) {
    auto session = makeSession();
    session->Open(hostInfo(), std::chrono::seconds(10));
    try {
        session->CallTool("sleep", argsWith("ms", JSONValue(static_cast<int64_t>(1000))), std::chrono::milliseconds(150));
        FAIL() << "expected CallTimeout";
    } catch (const HostError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::CallTimeout);
    }
    EXPECT_TRUE(session->IsConnected());
    EXPECT_NO_THROW(session->Ping(std::chrono::seconds(5)));
    session->Close();
}

TEST(ToolServerSessionTest, UnansweredPingTimesOut) {
    auto session = makeSession({"--mode=no-ping"});
    session->Open(hostInfo(), std::chrono::seconds(10));
    try {
        session->Ping(std::chrono::milliseconds(200));
        FAIL() << "expected CallTimeout";
    } catch (const HostError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::CallTimeout);
    }
    session->Close();
}

TEST(ToolServerSessionTest, CrashInvokesDisconnectHandler) {
    auto session = makeSession();
    std::promise<DisconnectInfo> lost;
    std::atomic<bool> fired{false};
    session->SetDisconnectHandler([&](const DisconnectInfo& info) {
        if (!fired.exchange(true)) lost.set_value(info);
    });
    session->Open(hostInfo(), std::chrono::seconds(10));
    EXPECT_THROW(session->CallTool("crash", JSONValue(JSONValue::Object{}), std::chrono::seconds(5)), HostError);
    auto f = lost.get_future();
    ASSERT_EQ(f.wait_for(std::chrono::seconds(5)), std::future_status::ready);
    EXPECT_FALSE(f.get().locallyInitiated);
    EXPECT_FALSE(session->IsConnected());
}

TEST(ToolServerSessionTest, ListChangedNotificationTriggersHandler) {
    auto session = makeSession();
    std::promise<void> changed;
    std::atomic<bool> fired{false};
    session->SetToolsChangedHandler([&]() {
        if (!fired.exchange(true)) changed.set_value();
    });
    session->Open(hostInfo(), std::chrono::seconds(10));
    session->CallTool("grow", JSONValue(JSONValue::Object{}), std::chrono::seconds(5));
    auto f = changed.get_future();
    ASSERT_EQ(f.wait_for(std::chrono::seconds(5)), std::future_status::ready);
    EXPECT_TRUE(hasTool(session->ListTools(std::chrono::seconds(5)), "extra"));
    session->Close();
}

TEST(ToolServerSessionParse, ToolsPageWithCursor) {
    JSONValue page = parseJSONValue(
        R"({"tools":[{"name":"a","description":"A","inputSchema":{"type":"object"}},{"name":"b"}],"nextCursor":"c2"})");
    std::optional<std::string> cursor;
    auto tools = ParseToolsPage(page, cursor);
    ASSERT_EQ(tools.size(), 2u);
    EXPECT_EQ(tools[0].description, "A");
    EXPECT_EQ(cursor.value_or(""), "c2");
}

TEST(ToolServerSessionParse, ToolsPageWithoutArrayIsToolError) {
    std::optional<std::string> cursor;
    try {
        ParseToolsPage(parseJSONValue(R"({"items":[]})"), cursor);
        FAIL() << "expected ToolError";
    } catch (const HostError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::ToolError);
    }
}
