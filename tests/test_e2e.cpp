//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_e2e.cpp
// Purpose: Manager, router and process launcher driving real child processes
//==========================================================================================================

#include <gtest/gtest.h>

#include <chrono>
#include <functional>
#include <string>
#include <thread>

#include "TempDir.h"
#include "mcphost/ToolRouter.h"
#include "mcphost/ToolServerManager.h"
#include "mcphost/credentials/CredentialStore.h"

using namespace mcphost;
using namespace std::chrono_literals;

namespace {

ServerConfig fakeServerConfig(const std::string& id, const std::string& name, const std::string& flags = "") {
    ServerConfig cfg;
    cfg.id = id;
    cfg.name = name;
    cfg.package.kind = PackageKind::Binary;
    cfg.package.identifier = MCPHOST_FAKE_SERVER_PATH;
    if (!flags.empty()) {
        PackageArgument mode;
        mode.kind = PackageArgument::Kind::Positional;
        mode.name = "flags";
        cfg.packageArgs.push_back(mode);
        SetPackageArgValue(cfg, "flags", JSONValue(flags));
    }
    return cfg;
}

bool waitFor(const std::function<bool()>& pred, std::chrono::milliseconds timeout = 10s) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(20ms);
    }
    return pred();
}

class EndToEndTest : public ::testing::Test {
protected:
    void SetUp() override {
        store = std::make_unique<CredentialStore>(dir.path());
        ManagerOptions opts;
        opts.backgroundSupervisor = false;
        opts.restartDelay = 50ms;
        opts.handshakeTimeout = 10s;
        opts.callTimeout = 10s;
        manager = std::make_unique<ToolServerManager>(*store, std::make_shared<DefaultTransportLauncher>(500ms),
                                                      &router, opts);
        router.SetDispatcher(manager.get());
    }

    void TearDown() override { manager->ShutdownAll(); }

    std::string textOf(const JSONValue& result) {
        const JSONValue::Array* content = json::getArray(result, "content");
        if (!content || content->empty() || !content->front()) return std::string();
        return json::getString(*content->front(), "text").value_or("");
    }

    testutil::TempDir dir;
    std::unique_ptr<CredentialStore> store;
    ToolRouter router;
    std::unique_ptr<ToolServerManager> manager;
};

} // namespace

TEST_F(EndToEndTest, TwoServersShareOneNamespace) {
    manager->AddConfig(fakeServerConfig("11111111-aaaa", "Alpha"));
    manager->AddConfig(fakeServerConfig("22222222-bbbb", "Beta"));
    auto results = manager->StartAll();
    ASSERT_EQ(results.size(), 2u);
    EXPECT_TRUE(results[0].ok) << results[0].error;
    EXPECT_TRUE(results[1].ok) << results[1].error;
    EXPECT_EQ(manager->GetAggregateStatus(), AggregateStatus::AllHealthy);

    const std::string prompt = router.DescribeForPrompt();
    EXPECT_NE(prompt.find("- alpha.echo"), std::string::npos);
    EXPECT_NE(prompt.find("- beta.add"), std::string::npos);

    JSONValue::Object args;
    json::set(args, "a", static_cast<int64_t>(40));
    json::set(args, "b", static_cast<int64_t>(2));
    EXPECT_EQ(textOf(router.Call("beta.add", JSONValue(std::move(args)), 0ms)), "42");

    manager->ShutdownAll();
    EXPECT_EQ(manager->GetStatus("11111111-aaaa").state, InstanceState::Stopped);
    EXPECT_FALSE(manager->HasActiveInstances());
}

TEST_F(EndToEndTest, StoredSecretReachesChildEnvironment) {
    ServerConfig cfg = fakeServerConfig("33333333-cccc", "Keys");
    cfg.authMethod = AuthMethod::ApiKey;
    EnvVarRequirement key;
    key.name = "MCPHOST_E2E_KEY";
    key.required = true;
    key.secret = true;
    cfg.envVars.push_back(key);
    SetSettingsEnvValue(cfg, "MCPHOST_E2E_REGION", "eu-west-1");
    store->Store(cfg.id, "MCPHOST_E2E_KEY", "sk-e2e");
    manager->AddConfig(cfg);

    JSONValue::Object a1;
    json::set(a1, "name", "MCPHOST_E2E_KEY");
    EXPECT_EQ(textOf(router.Call("keys.env", JSONValue(std::move(a1)), 0ms)), "sk-e2e");
}

TEST_F(EndToEndTest, StartupExitKeepsDiagnostics) {
    manager->AddConfig(fakeServerConfig("44444444-dddd", "Broken", "--mode=exit-on-start"));
    auto results = manager->StartAll();
    ASSERT_EQ(results.size(), 1u);
    EXPECT_FALSE(results[0].ok);
    EXPECT_EQ(results[0].errorKind, std::optional<ErrorKind>(ErrorKind::TransportDisconnected));
    auto st = manager->GetStatus("44444444-dddd");
    EXPECT_EQ(st.state, InstanceState::Error);
    EXPECT_NE(st.diagnostics.find("missing configuration"), std::string::npos);
    EXPECT_EQ(manager->GetAggregateStatus(), AggregateStatus::AllFailed);
}

TEST_F(EndToEndTest, MissingExecutableIsSpawnFailed) {
    ServerConfig cfg = fakeServerConfig("55555555-eeee", "Ghost");
    cfg.package.identifier = "/nonexistent/ghost-tool-server";
    manager->AddConfig(cfg);
    try {
        manager->EnsureRunning(cfg.id);
        FAIL() << "expected SpawnFailed";
    } catch (const HostError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::SpawnFailed);
    }
}

TEST_F(EndToEndTest, CrashedServerIsRestarted) {
    manager->AddConfig(fakeServerConfig("66666666-ffff", "Flaky"));
    manager->EnsureRunning("66666666-ffff");
    try {
        router.Call("flaky.crash", JSONValue(JSONValue::Object{}), 0ms);
        FAIL() << "expected TransportDisconnected";
    } catch (const HostError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::TransportDisconnected);
    }
    ASSERT_TRUE(waitFor([&] {
        auto st = manager->GetStatus("66666666-ffff");
        return st.state == InstanceState::Running && st.restartCount == 1;
    }));
    JSONValue::Object args;
    json::set(args, "text", "back");
    EXPECT_EQ(textOf(router.Call("flaky.echo", JSONValue(std::move(args)), 0ms)), "back");
}
