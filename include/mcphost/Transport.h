//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Transport.h
// Purpose: Transport interfaces between the host and one tool server
//==========================================================================================================

#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <string>

namespace mcphost {

// Forward declarations
class JSONRPCRequest;
class JSONRPCResponse;
class JSONRPCNotification;
struct ServerConfig;
struct LaunchSpec;

// Per-request options
struct RequestOptions {
    std::chrono::milliseconds timeout{std::chrono::seconds(30)};
    // Also kill the server when the request times out. Off by default: a timeout discards only the request.
    bool terminateOnTimeout{false};
};

// Why and how a transport lost its peer
struct DisconnectInfo {
    std::string reason;
    std::optional<int> exitCode;
    std::optional<int> signal;
    std::string diagnostics;       // captured stderr tail, may be empty
    bool locallyInitiated{false};  // true when Close() caused it
};

//==========================================================================================================
// ITransport
// Purpose: Correlated request/response channel to one tool server.
// Notes:
//   - Server error responses resolve the future normally with response->error set.
//   - Transport failures resolve the future with HostError (TransportDisconnected, CallTimeout).
//==========================================================================================================
class ITransport {
public:
    virtual ~ITransport() = default;

    /////////////////////////////////////////// Connection lifecycle ///////////////////////////////////////////
    //==========================================================================================================
    // Starts the transport (spawns the process or prepares the connection).
    // Returns:
    //   A future that completes when the transport is running, or carries HostError{SpawnFailed}.
    //==========================================================================================================
    virtual std::future<void> Start() = 0;

    //==========================================================================================================
    // Closes the transport. Pending requests fail with TransportDisconnected.
    // Returns:
    //   A future that completes when the transport and any child process are gone.
    //==========================================================================================================
    virtual std::future<void> Close() = 0;

    virtual bool IsConnected() const = 0;
    virtual std::string GetSessionId() const = 0;

    /////////////////////////////////////////// Message sending ///////////////////////////////////////////
    //==========================================================================================================
    // Sends a JSON-RPC request and returns a future for the response.
    // Args:
    //   request: Request to send. A locally unique id is assigned when none is set.
    //   options: Timeout and timeout behaviour.
    // Returns:
    //   Future resolving to the response.
    //==========================================================================================================
    virtual std::future<std::unique_ptr<JSONRPCResponse>> SendRequest(
        std::unique_ptr<JSONRPCRequest> request, const RequestOptions& options = RequestOptions{}) = 0;

    virtual std::future<void> SendNotification(std::unique_ptr<JSONRPCNotification> notification) = 0;

    //==========================================================================================================
    // Discards a pending request locally. The server is not touched; a late response is dropped.
    // Returns:
    //   true when the id was pending.
    //==========================================================================================================
    virtual bool CancelRequest(const std::string& requestId) = 0;

    /////////////////////////////////////////// Handlers ///////////////////////////////////////////
    using NotificationHandler = std::function<void(std::unique_ptr<JSONRPCNotification>)>;
    virtual void SetNotificationHandler(NotificationHandler handler) = 0;

    using ErrorHandler = std::function<void(const std::string& error)>;
    virtual void SetErrorHandler(ErrorHandler handler) = 0;

    // Invoked at most once per transport, from a transport thread.
    using DisconnectHandler = std::function<void(const DisconnectInfo& info)>;
    virtual void SetDisconnectHandler(DisconnectHandler handler) = 0;

    // Captured diagnostic output (stderr tail for process transports).
    virtual std::string GetDiagnostics() const = 0;
};

//==========================================================================================================
// ITransportLauncher
// Purpose: Creates the transport for a prepared configuration; the manager's seam for tests.
//==========================================================================================================
class ITransportLauncher {
public:
    virtual ~ITransportLauncher() = default;

    //==========================================================================================================
    // Creates a transport that has not been started yet.
    // Args:
    //   config: Configuration being launched.
    //   launch: Command/environment or url/headers built for it.
    //==========================================================================================================
    virtual std::unique_ptr<ITransport> CreateTransport(const ServerConfig& config, const LaunchSpec& launch) = 0;
};

// Process transports for standard-stream servers, HTTP transports for network servers.
class DefaultTransportLauncher : public ITransportLauncher {
public:
    // Grace period from MCPHOST_SHUTDOWN_GRACE_MS, 5 s when unset.
    DefaultTransportLauncher();
    explicit DefaultTransportLauncher(std::chrono::milliseconds grace) : shutdownGrace(grace) {}

    std::unique_ptr<ITransport> CreateTransport(const ServerConfig& config, const LaunchSpec& launch) override;

private:
    std::chrono::milliseconds shutdownGrace{std::chrono::seconds(5)};
};

} // namespace mcphost
