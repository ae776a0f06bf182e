//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ProcessTransport.hpp
// Purpose: Transport that spawns a tool server child process and talks JSON-RPC over its standard streams
//==========================================================================================================
#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>

#include "mcphost/CommandBuilder.h"
#include "mcphost/ContentFramer.h"
#include "mcphost/Transport.h"

namespace mcphost {

//==========================================================================================================
// ProcessTransport
// Purpose: Owns one child process. The child runs in its own session (process group) so shutdown reaches
//          launcher wrappers such as npx or uvx together with the real server.
// Notes:
//   - Child environment: parent environment with the overlay applied on top.
//   - stderr is kept in a bounded ring buffer (GetDiagnostics()).
//   - stdout EOF fails every pending request with TransportDisconnected right away, then the child is
//     reaped and the disconnect handler fires once.
//==========================================================================================================
class ProcessTransport : public ITransport {
public:
    struct Options {
        FramingMode framing{FramingMode::NewlineDelimited};
        std::size_t stderrCapacity{16 * 1024};
        std::chrono::milliseconds shutdownGrace{std::chrono::seconds(5)};
        std::size_t maxMessageBytes{4 * 1024 * 1024};
        std::size_t writeQueueMaxBytes{8 * 1024 * 1024};
        std::optional<std::string> workingDirectory;
    };

    ProcessTransport(CommandSpec command, std::map<std::string, std::string> environment);
    ProcessTransport(CommandSpec command, std::map<std::string, std::string> environment, Options options);
    ~ProcessTransport() override;

    ProcessTransport(const ProcessTransport&) = delete;
    ProcessTransport& operator=(const ProcessTransport&) = delete;

    ////////////////////////////////////////// ITransport //////////////////////////////////////////
    //==========================================================================================================
    // Spawns the child and starts the reader, writer and timeout threads.
    // Returns:
    //   Ready future; carries HostError{SpawnFailed} when the program cannot be executed.
    //==========================================================================================================
    std::future<void> Start() override;

    //==========================================================================================================
    // Closes stdin, sends SIGTERM to the process group, waits up to Options::shutdownGrace, then SIGKILL.
    //==========================================================================================================
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

    // Child pid while the process is alive.
    std::optional<int> GetProcessId() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace mcphost
