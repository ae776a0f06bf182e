//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Protocol.h
// Purpose: MCP protocol data structures and constants used by the host side of a session
//==========================================================================================================

#pragma once

#include "JSONRPCTypes.h"
#include <string>
#include <vector>
#include <optional>

namespace mcphost {
///////////////////////////////////////// Protocol constants ///////////////////////////////////////////
// MCP protocol version requested in initialize
constexpr const char* PROTOCOL_VERSION = "2025-06-18";

///////////////////////////////////////// Implementation ///////////////////////////////////////////
// Implementation information (clientInfo / serverInfo)
struct Implementation {
    std::string name;
    std::string version;

    Implementation() = default;
    Implementation(std::string name, std::string version)
        : name(std::move(name)), version(std::move(version)) {}
};

///////////////////////////////////////// Tools ///////////////////////////////////////////
struct Tool {
    std::string name;
    std::string description;
    JSONValue inputSchema;  // JSON Schema for tool parameters

    Tool() = default;
    Tool(std::string name, std::string description, JSONValue inputSchema = JSONValue{})
        : name(std::move(name)), description(std::move(description)), inputSchema(std::move(inputSchema)) {}
};

// Parsed initialize result
struct InitializeResult {
    std::string protocolVersion;
    Implementation serverInfo;
    bool toolsListChanged = false;
    std::optional<std::string> instructions;
};

///////////////////////////////////////// Method names ///////////////////////////////////////////
namespace Methods {
    constexpr const char* Initialize = "initialize";
    constexpr const char* ListTools = "tools/list";
    constexpr const char* CallTool = "tools/call";
    constexpr const char* Ping = "ping";

    constexpr const char* Initialized = "notifications/initialized";
    constexpr const char* ToolListChanged = "notifications/tools/list_changed";
    constexpr const char* Cancelled = "notifications/cancelled";
}

} // namespace mcphost
