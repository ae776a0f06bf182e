//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ToolServerSession.h
// Purpose: Client side of the MCP conversation with one tool server (handshake, tools, calls, ping)
//==========================================================================================================

#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "mcphost/Protocol.h"
#include "mcphost/Transport.h"

namespace mcphost {

//==========================================================================================================
// ToolServerSession
// Purpose: Owns a transport and speaks the MCP methods the host needs over it. All calls block the caller
//          for at most their timeout and report failures as HostError.
//==========================================================================================================
class ToolServerSession {
public:
    using ToolsChangedHandler = std::function<void()>;

    explicit ToolServerSession(std::unique_ptr<ITransport> transport);
    ~ToolServerSession();

    ToolServerSession(const ToolServerSession&) = delete;
    ToolServerSession& operator=(const ToolServerSession&) = delete;

    //==========================================================================================================
    // Open
    // Purpose: Starts the transport, performs initialize + notifications/initialized and fetches the tool list.
    // Args:
    //   clientInfo: Host name and version announced to the server.
    //   timeout: Budget for the whole handshake.
    // Returns:
    //   The tools the server exposes.
    // Notes:
    //   Throws HostError: SpawnFailed (transport start), HandshakeTimeout (no answer within the budget),
    //   TransportDisconnected (server exited during the handshake), ToolError (server rejected initialize).
    //==========================================================================================================
    std::vector<Tool> Open(const Implementation& clientInfo, std::chrono::milliseconds timeout);

    // Re-fetches tools/list following nextCursor pages.
    std::vector<Tool> ListTools(std::chrono::milliseconds timeout);

    //==========================================================================================================
    // CallTool
    // Purpose: Invokes tools/call.
    // Returns:
    //   The call result object (content, structuredContent, ...).
    // Notes:
    //   A JSON-RPC error or a result flagged isError throws HostError{ToolError} whose data() holds the
    //   server's payload unchanged. A timeout discards the request locally, tells the server it was
    //   cancelled and throws HostError{CallTimeout}.
    //==========================================================================================================
    JSONValue CallTool(const std::string& name, const JSONValue& arguments, std::chrono::milliseconds timeout);

    // Liveness check; throws CallTimeout or TransportDisconnected.
    void Ping(std::chrono::milliseconds timeout);

    void Close();
    bool IsConnected() const;
    std::string GetDiagnostics() const;
    InitializeResult GetServerInfo() const;

    // Register before Open(); invoked on a transport thread.
    void SetDisconnectHandler(ITransport::DisconnectHandler handler);
    void SetToolsChangedHandler(ToolsChangedHandler handler);

    ITransport& GetTransport() { return *transport; }

private:
    std::unique_ptr<JSONRPCResponse> request(const std::string& method, std::optional<JSONValue> params,
                                             std::chrono::milliseconds timeout, bool notifyOnTimeout);

    std::unique_ptr<ITransport> transport;
    mutable std::mutex infoMutex;
    InitializeResult serverInfo;
    ToolsChangedHandler toolsChangedHandler;
};

// Parses a tools/list result page; returns the tools and stores nextCursor when present.
std::vector<Tool> ParseToolsPage(const JSONValue& result, std::optional<std::string>& nextCursor);

// Parses an initialize result.
InitializeResult ParseInitializeResult(const JSONValue& result);

} // namespace mcphost
