//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_process_transport.cpp
// Purpose: ProcessTransport against the scripted tool server child process
//==========================================================================================================

#include <gtest/gtest.h>

#include <chrono>
#include <csignal>
#include <future>
#include <string>
#include <thread>

#include "mcphost/JSONRPCTypes.h"
#include "mcphost/ProcessTransport.hpp"
#include "mcphost/errors/Errors.h"

using namespace mcphost;

namespace {

CommandSpec fakeServer(std::vector<std::string> args = {}) {
    CommandSpec cmd;
    cmd.program = MCPHOST_FAKE_SERVER_PATH;
    cmd.args = std::move(args);
    return cmd;
}

std::unique_ptr<JSONRPCRequest> pingRequest() {
    return std::make_unique<JSONRPCRequest>(JSONRPCId(std::string("p")), "ping");
}

std::unique_ptr<JSONRPCRequest> callRequest(const std::string& tool, JSONValue args) {
    JSONValue::Object params;
    json::set(params, "name", tool);
    json::set(params, "arguments", std::move(args));
    return std::make_unique<JSONRPCRequest>(JSONRPCId(std::string("c")), "tools/call", JSONValue(std::move(params)));
}

} // namespace

TEST(ProcessTransport, PingRoundTrip) {
    ProcessTransport t(fakeServer(), {});
    ASSERT_NO_THROW(t.Start().get());
    EXPECT_TRUE(t.IsConnected());
    EXPECT_TRUE(t.GetProcessId().has_value());
    auto resp = t.SendRequest(pingRequest()).get();
    ASSERT_TRUE(resp);
    EXPECT_FALSE(resp->IsError());
    t.Close().get();
    EXPECT_FALSE(t.IsConnected());
}

TEST(ProcessTransport, MissingProgramIsSpawnFailed) {
    CommandSpec cmd;
    cmd.program = "/nonexistent/definitely-not-a-tool-server";
    ProcessTransport t(cmd, {});
    try {
        t.Start().get();
        FAIL() << "expected SpawnFailed";
    } catch (const HostError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::SpawnFailed);
        EXPECT_NE(std::string(e.what()).find("definitely-not-a-tool-server"), std::string::npos);
    }
}

TEST(ProcessTransport, EnvironmentOverlayReachesChild) {
    ProcessTransport t(fakeServer(), {{"MCPHOST_TEST_VALUE", "overlay-42"}});
    t.Start().get();
    JSONValue::Object args;
    json::set(args, "name", "MCPHOST_TEST_VALUE");
    auto resp = t.SendRequest(callRequest("env", JSONValue(std::move(args)))).get();
    ASSERT_TRUE(resp && resp->result);
    EXPECT_NE(serializeJSONValue(*resp->result).find("overlay-42"), std::string::npos);
    t.Close().get();
}

TEST(ProcessTransport, ArgumentsArePassedVerbatim) {
    ProcessTransport t(fakeServer({"--name=x", "two words"}), {});
    t.Start().get();
    auto resp = t.SendRequest(callRequest("argv", JSONValue(JSONValue::Object{}))).get();
    ASSERT_TRUE(resp && resp->result);
    EXPECT_NE(serializeJSONValue(*resp->result).find("--name=x two words"), std::string::npos);
    t.Close().get();
}

TEST(ProcessTransport, CrashFailsPendingAndReportsExit) {
    ProcessTransport t(fakeServer({"--exit-code=7"}), {});
    std::promise<DisconnectInfo> disconnected;
    t.SetDisconnectHandler([&disconnected](const DisconnectInfo& info) { disconnected.set_value(info); });
    t.Start().get();

    auto fut = t.SendRequest(callRequest("crash", JSONValue(JSONValue::Object{})));
    try {
        fut.get();
        FAIL() << "expected TransportDisconnected";
    } catch (const HostError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::TransportDisconnected);
    }
    auto infoFut = disconnected.get_future();
    ASSERT_EQ(infoFut.wait_for(std::chrono::seconds(5)), std::future_status::ready);
    DisconnectInfo info = infoFut.get();
    EXPECT_FALSE(info.locallyInitiated);
    EXPECT_EQ(info.exitCode.value_or(-1), 7);
    EXPECT_NE(info.diagnostics.find("crashing on request"), std::string::npos);
    EXPECT_FALSE(t.IsConnected());
}

TEST(ProcessTransport, StderrNoiseDoesNotBlockProtocol) {
    ProcessTransport::Options opts;
    opts.stderrCapacity = 1024;
    ProcessTransport t(fakeServer({"--stderr-bytes=262144"}), {}, opts);
    t.Start().get();
    auto resp = t.SendRequest(pingRequest()).get();
    ASSERT_TRUE(resp);
    EXPECT_LE(t.GetDiagnostics().size(), 1024u);
    t.Close().get();
}

TEST(ProcessTransport, RequestTimeoutLeavesServerRunning) {
    ProcessTransport t(fakeServer(), {});
    t.Start().get();
    JSONValue::Object args;
    json::set(args, "ms", static_cast<int64_t>(1500));
    RequestOptions ro;
    ro.timeout = std::chrono::milliseconds(200);
    auto fut = t.SendRequest(callRequest("sleep", JSONValue(std::move(args))), ro);
    try {
        fut.get();
        FAIL() << "expected CallTimeout";
    } catch (const HostError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::CallTimeout);
    }
    EXPECT_TRUE(t.IsConnected());
    // the sleeping call finishes first, then the ping is answered
    RequestOptions slow;
    slow.timeout = std::chrono::seconds(5);
    auto resp = t.SendRequest(pingRequest(), slow).get();
    EXPECT_TRUE(resp && !resp->IsError());
    t.Close().get();
}

TEST(ProcessTransport, TerminatingTimeoutStopsServer) {
    ProcessTransport t(fakeServer(), {});
    std::promise<DisconnectInfo> disconnected;
    t.SetDisconnectHandler([&disconnected](const DisconnectInfo& info) { disconnected.set_value(info); });
    t.Start().get();
    RequestOptions ro;
    ro.timeout = std::chrono::milliseconds(200);
    ro.terminateOnTimeout = true;
    JSONValue::Object args;
    json::set(args, "ms", static_cast<int64_t>(5000));
    auto fut = t.SendRequest(callRequest("sleep", JSONValue(std::move(args))), ro);
    try {
        fut.get();
        FAIL() << "expected CallTimeout";
    } catch (const HostError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::CallTimeout);
    }

    auto infoFut = disconnected.get_future();
    ASSERT_EQ(infoFut.wait_for(std::chrono::seconds(5)), std::future_status::ready);
    DisconnectInfo info = infoFut.get();
    EXPECT_FALSE(info.locallyInitiated);
    EXPECT_EQ(info.signal.value_or(0), SIGTERM);
    EXPECT_FALSE(t.IsConnected());
    EXPECT_FALSE(t.GetProcessId().has_value());

    // nothing is left to signal after the child was reaped
    EXPECT_THROW(t.SendRequest(pingRequest(), ro).get(), HostError);
    t.Close().get();
}

TEST(ProcessTransport, ContentLengthFraming) {
    ProcessTransport::Options opts;
    opts.framing = FramingMode::ContentLength;
    ProcessTransport t(fakeServer({"--content-length"}), {}, opts);
    t.Start().get();
    auto resp = t.SendRequest(pingRequest()).get();
    EXPECT_TRUE(resp && !resp->IsError());
    t.Close().get();
}

TEST(ProcessTransport, CloseIsLocallyInitiated) {
    ProcessTransport t(fakeServer(), {});
    std::promise<bool> local;
    t.SetDisconnectHandler([&local](const DisconnectInfo& info) { local.set_value(info.locallyInitiated); });
    t.Start().get();
    t.Close().get();
    auto f = local.get_future();
    ASSERT_EQ(f.wait_for(std::chrono::seconds(5)), std::future_status::ready);
    EXPECT_TRUE(f.get());
    // second close is a no-op
    EXPECT_NO_THROW(t.Close().get());
}

TEST(ProcessTransport, CancelDiscardsLocallyWithoutKillingServer) {
    ProcessTransport t(fakeServer(), {});
    t.Start().get();
    JSONValue::Object args;
    json::set(args, "ms", static_cast<int64_t>(500));
    auto fut = t.SendRequest(callRequest("sleep", JSONValue(std::move(args))));
    EXPECT_TRUE(t.CancelRequest("c"));
    EXPECT_FALSE(t.CancelRequest("c"));
    EXPECT_THROW(fut.get(), HostError);
    EXPECT_TRUE(t.IsConnected());
    // the late response to "c" is dropped; the server keeps answering
    RequestOptions slow;
    slow.timeout = std::chrono::seconds(5);
    auto resp = t.SendRequest(pingRequest(), slow).get();
    EXPECT_TRUE(resp && !resp->IsError());
    t.Close().get();
}
