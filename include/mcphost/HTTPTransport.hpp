//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: HTTPTransport.hpp
// Purpose: JSON-RPC transport to network tool servers over HTTP POST (Boost.Beast coroutines)
//==========================================================================================================

#pragma once

#include <map>
#include <memory>
#include <string>
#include <vector>

#include "mcphost/Transport.h"
#include "mcphost/auth/HttpClient.hpp"

namespace mcphost {

//==========================================================================================================
// HTTPTransport
// Purpose: Client side of the streamable HTTP binding. Each request is one POST to the server URL; the
//          reply is either a JSON body or an SSE stream carrying the response (and any notifications).
// Notes:
//   - Static headers (Authorization: Bearer ..., X-<NAME>) come from the launch spec.
//   - Mcp-Session-Id returned by the server is echoed on later requests. A 404 on a live session means
//     the server dropped it: the transport disconnects so the supervisor can start over.
//   - 401/403 replies fail the request with CredentialError describing the WWW-Authenticate challenge.
//==========================================================================================================
class HTTPTransport : public ITransport {
public:
    struct Options {
        auth::HttpClientOptions http;
    };

    HTTPTransport(std::string url, std::map<std::string, std::string> headers);
    HTTPTransport(std::string url, std::map<std::string, std::string> headers, Options options);
    ~HTTPTransport() override;

    HTTPTransport(const HTTPTransport&) = delete;
    HTTPTransport& operator=(const HTTPTransport&) = delete;

    ////////////////////////////////////////// ITransport //////////////////////////////////////////
    //==========================================================================================================
    // Validates the URL, prepares TLS and starts the I/O thread. No network traffic happens here.
    // Returns:
    //   Ready future; carries HostError{SpawnFailed} for unusable URLs or trust store settings.
    //==========================================================================================================
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

    // Last HTTP status and WWW-Authenticate header seen, for diagnostics.
    std::string GetDiagnostics() const override;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

namespace sse {
// Data payloads of the events in a text/event-stream body; multi-line data fields are joined with '\n'.
std::vector<std::string> ExtractEventData(const std::string& stream);
} // namespace sse

} // namespace mcphost
