//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: examples/host_demo/main.cpp
// Purpose: Loads a server configuration file, starts every enabled tool server and optionally calls one
//          capability. Usage: mcphost_demo <servers.json> [prefixed.tool '{"arg":1}']
//==========================================================================================================

#include <iostream>
#include <memory>
#include <string>
#include <variant>

#include "logging/Logger.h"
#include "mcphost/ToolRouter.h"
#include "mcphost/ToolServerManager.h"
#include "mcphost/auth/HttpClient.hpp"
#include "mcphost/auth/OAuthFlow.hpp"
#include "mcphost/auth/TokenEndpoint.hpp"
#include "mcphost/config/ConfigCodec.h"
#include "mcphost/credentials/CredentialStore.h"
#include "mcphost/errors/Errors.h"
#include "mcphost/events/EventBus.h"

int main(int argc, char** argv) {
    using namespace mcphost;
    Logger::setLogLevel(LogLevel::LOG_INFO_LEVEL);

    if (argc < 2) {
        std::cerr << "usage: " << argv[0] << " <servers.json> [prefixed.tool [json-arguments]]" << std::endl;
        return 2;
    }

    std::vector<ServerConfig> configs;
    try {
        configs = LoadServerConfigs(argv[1]);
    } catch (const HostError& e) {
        std::cerr << "config: " << e.what() << std::endl;
        return 1;
    }

    HostEventBus events;
    events.Subscribe([](const HostEvent& ev) {
        if (const auto* s = std::get_if<InstanceStateChanged>(&ev)) {
            std::cout << "[event] " << s->name << ": " << ToString(s->from) << " -> " << ToString(s->to);
            if (!s->error.empty()) std::cout << " (" << s->error << ")";
            std::cout << std::endl;
        }
    });

    CredentialStore store(CredentialStore::DefaultRoot());
    // OAuth servers get their stored token refreshed before each start.
    auth::OAuthManager oauth(store, std::make_shared<auth::HttpTokenEndpoint>(std::make_shared<auth::BeastHttpClient>()));
    ToolRouter router;
    ToolServerManager manager(store, std::make_shared<DefaultTransportLauncher>(), &router,
                              ManagerOptions::FromEnvironment(), &events);
    router.SetDispatcher(&manager);
    manager.SetTokenRefresher(&oauth);

    for (auto& cfg : configs) {
        try {
            manager.AddConfig(std::move(cfg));
        } catch (const HostError& e) {
            LOG_ERROR("Skipping configuration: {}", e.what());
        }
    }

    for (const auto& r : manager.StartAll()) {
        std::cout << (r.ok ? "started  " : "failed   ") << r.name;
        if (!r.ok) std::cout << ": " << r.error;
        std::cout << std::endl;
    }
    std::cout << "aggregate: " << ToString(manager.GetAggregateStatus()) << std::endl;
    std::cout << "capabilities:\n" << router.DescribeForPrompt();

    int rc = 0;
    if (argc >= 3) {
        try {
            JSONValue args = argc >= 4 ? parseJSONValue(argv[3]) : JSONValue(JSONValue::Object{});
            JSONValue result = router.Call(argv[2], args, std::chrono::milliseconds(0));
            std::cout << serializeJSONValue(result) << std::endl;
        } catch (const HostError& e) {
            std::cerr << ToString(e.kind()) << ": " << e.what() << std::endl;
            rc = 1;
        } catch (const std::runtime_error& e) {
            std::cerr << "arguments: " << e.what() << std::endl;
            rc = 2;
        }
    }

    manager.ShutdownAll();
    return rc;
}
