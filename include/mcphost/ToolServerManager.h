//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ToolServerManager.h
// Purpose: Owns every configured tool server instance and drives its lifecycle
//==========================================================================================================

#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "mcphost/Protocol.h"
#include "mcphost/Status.h"
#include "mcphost/ToolRouter.h"
#include "mcphost/Transport.h"
#include "mcphost/config/ServerConfig.h"
#include "mcphost/events/EventBus.h"

namespace mcphost {

class CredentialStore;
namespace auth { class ITokenRefresher; }

//==========================================================================================================
// ManagerOptions
// Purpose: Lifecycle tunables. FromEnvironment() applies MCPHOST_* overrides (milliseconds) on top of the
//          defaults.
//==========================================================================================================
struct ManagerOptions {
    std::chrono::milliseconds idleTimeout{std::chrono::minutes(30)};
    std::chrono::milliseconds healthCheckInterval{std::chrono::seconds(60)};
    std::chrono::milliseconds healthCheckWindow{std::chrono::seconds(10)};
    std::chrono::milliseconds handshakeTimeout{std::chrono::seconds(30)};
    std::chrono::milliseconds callTimeout{std::chrono::seconds(60)};
    std::chrono::milliseconds restartDelay{std::chrono::milliseconds(500)};
    std::chrono::milliseconds maintenanceInterval{std::chrono::seconds(5)};
    unsigned int maxRestartAttempts{3};
    // Run RunMaintenance() on a background thread every maintenanceInterval.
    bool backgroundSupervisor{true};
    Implementation clientInfo;

    ManagerOptions();
    static ManagerOptions FromEnvironment();
};

// Outcome of one instance in StartAll().
struct StartResult {
    std::string id;
    std::string name;
    bool ok{false};
    std::optional<ErrorKind> errorKind;
    std::string error;
};

//==========================================================================================================
// ToolServerManager
// Purpose: Arena of instances keyed by config id. Starts servers lazily, restarts crashed ones up to
//          maxRestartAttempts, evicts idle ones, pings running ones and republishes the router snapshot
//          on every transition.
// Notes:
//   - Starts, restarts and stops never hold the manager lock while talking to a process.
//   - Events are published on the optional bus after the lock is released.
//==========================================================================================================
class ToolServerManager : public IInstanceDispatcher {
public:
    using Clock = std::function<std::chrono::steady_clock::time_point()>;

    ToolServerManager(CredentialStore& store, std::shared_ptr<ITransportLauncher> launcher,
                      ICapabilitySink* sink, ManagerOptions options = ManagerOptions(),
                      HostEventBus* events = nullptr);
    ~ToolServerManager() override;

    ToolServerManager(const ToolServerManager&) = delete;
    ToolServerManager& operator=(const ToolServerManager&) = delete;

    void SetTokenRefresher(auth::ITokenRefresher* refresher);
    void SetClock(Clock clock);

    ///////////////////////////////////////// Configurations ///////////////////////////////////////////
    //==========================================================================================================
    // AddConfig
    // Purpose: Registers a configuration in Idle state. Nothing is spawned.
    // Notes:
    //   Throws HostError{ConfigError} on invariant violations or a duplicate id.
    //==========================================================================================================
    void AddConfig(ServerConfig cfg);

    // Replaces the configuration with the same id; a running instance is stopped, counters reset.
    void UpdateConfig(ServerConfig cfg);

    // Stops the instance, forgets it and purges its credentials and token.
    void DeleteConfig(const std::string& id);

    void SetEnabled(const std::string& id, bool enabled);

    std::optional<ServerConfig> GetConfig(const std::string& id) const;
    std::vector<ServerConfig> GetConfigs() const;

    ///////////////////////////////////////// Lifecycle ///////////////////////////////////////////
    //==========================================================================================================
    // EnsureRunning
    // Purpose: Starts the instance when it is not running and waits for the outcome. Concurrent callers
    //          share one start.
    // Notes:
    //   Throws HostError with the start failure (ValidationError, CredentialError, SpawnFailed,
    //   HandshakeTimeout, ...), or the recorded error when the instance is in Error, or
    //   InstanceUnavailable for unknown or disabled ids.
    //==========================================================================================================
    void EnsureRunning(const std::string& id);

    // Starts every enabled instance in parallel; one result per instance, never throws.
    std::vector<StartResult> StartAll();

    void Stop(const std::string& id);

    // Resets the restart counter and starts again.
    void Restart(const std::string& id);

    // Stops everything (grace periods overlap) and joins background work.
    void ShutdownAll();

    ///////////////////////////////////////// Maintenance ///////////////////////////////////////////
    // Idle eviction plus, when due, the health check.
    void RunMaintenance();

    // Stops running instances idle for at least idleTimeout with no call in flight. Returns how many.
    std::size_t EvictIdle();

    // Pings every running instance without in-flight calls; failures count as crashes.
    void CheckHealth();

    ///////////////////////////////////////// Status ///////////////////////////////////////////
    InstanceStatus GetStatus(const std::string& id) const;
    std::vector<InstanceStatus> GetAllStatuses() const;
    AggregateStatus GetAggregateStatus() const;
    bool HasActiveInstances() const;
    std::size_t ActiveCount() const;

    ///////////////////////////////////////// IInstanceDispatcher ///////////////////////////////////////////
    //==========================================================================================================
    // Dispatch
    // Purpose: Runs one capability on an instance, starting it first when idle or evicted.
    // Notes:
    //   Throws RoutingError when the instance does not expose localName, and otherwise whatever the
    //   start or the call reports.
    //==========================================================================================================
    JSONValue Dispatch(const std::string& instanceId, const std::string& localName,
                       const JSONValue& arguments, std::chrono::milliseconds timeout) override;

private:
    class Impl;
    std::shared_ptr<Impl> pImpl;
};

} // namespace mcphost
