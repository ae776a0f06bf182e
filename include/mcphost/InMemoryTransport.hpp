//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: InMemoryTransport.hpp
// Purpose: In-process transport bound to a request handler, for tests and embedded tool servers
//==========================================================================================================
#pragma once

#include <functional>
#include <memory>
#include <string>

#include "mcphost/Transport.h"

namespace mcphost {

//==========================================================================================================
// InMemoryTransport
// Purpose: ITransport whose peer is a C++ callable. Requests are served on their own threads so a slow
//          handler never delays other requests, and the transport applies the same timeout, cancellation
//          and disconnect semantics as the process transport.
// Notes:
//   - A handler returning nullptr produces no response (the request can only time out).
//   - SimulateExit() behaves like the peer process dying: pending requests fail with
//     TransportDisconnected and the disconnect handler fires with locallyInitiated == false.
//==========================================================================================================
class InMemoryTransport : public ITransport {
public:
    using RequestHandler = std::function<std::unique_ptr<JSONRPCResponse>(const JSONRPCRequest&)>;
    using NotificationSink = std::function<void(const JSONRPCNotification&)>;

    explicit InMemoryTransport(RequestHandler handler);
    ~InMemoryTransport() override;

    InMemoryTransport(const InMemoryTransport&) = delete;
    InMemoryTransport& operator=(const InMemoryTransport&) = delete;

    ////////////////////////////////////////// ITransport //////////////////////////////////////////
    std::future<void> Start() override;
    std::future<void> Close() override;
    bool IsConnected() const override;
    std::string GetSessionId() const override;

    std::future<std::unique_ptr<JSONRPCResponse>> SendRequest(
        std::unique_ptr<JSONRPCRequest> request, const RequestOptions& options = RequestOptions{}) override;
    std::future<void> SendNotification(std::unique_ptr<JSONRPCNotification> notification) override;
    bool CancelRequest(const std::string& requestId) override;

    void SetNotificationHandler(NotificationHandler handler) override;
    void SetErrorHandler(ErrorHandler handler) override;
    void SetDisconnectHandler(DisconnectHandler handler) override;
    std::string GetDiagnostics() const override;

    ////////////////////////////////////////// Peer side //////////////////////////////////////////
    // Receives notifications the host sends (e.g. notifications/initialized).
    void SetNotificationSink(NotificationSink sink);

    // Makes Start() fail with HostError{SpawnFailed} carrying the message.
    void FailStart(const std::string& message);

    // Delivers a server-initiated notification to the host.
    void PushNotification(std::unique_ptr<JSONRPCNotification> notification);

    // Simulates the peer going away with the given exit code and diagnostic text.
    void SimulateExit(int exitCode, const std::string& diagnostics = std::string());

private:
    class Impl;
    std::shared_ptr<Impl> pImpl; // shared with in-flight handler threads
};

} // namespace mcphost
