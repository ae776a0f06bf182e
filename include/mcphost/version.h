//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: version.h
// Purpose: Public version API for the tool server host library (semantic version helpers).
//==========================================================================================================
#pragma once

#include <string>

namespace mcphost {

//==========================================================================================================
// VersionInfo
// Purpose: Semantic version components.
// Fields:
//   major, minor, patch: Version components.
//==========================================================================================================
struct VersionInfo {
    int major;
    int minor;
    int patch;
};

//==========================================================================================================
// getVersion
// Purpose: Returns the library semantic version components.
// Returns:
//   VersionInfo {major, minor, patch}
//==========================================================================================================
VersionInfo getVersion();

//==========================================================================================================
// getVersionString
// Purpose: Returns the semantic version string; also sent as clientInfo.version during the handshake.
// Returns:
//   std::string formatted as "MAJOR.MINOR.PATCH"
//==========================================================================================================
std::string getVersionString();

// Client name announced to tool servers.
constexpr const char* CLIENT_NAME = "mcphost";

// "mcphost/MAJOR.MINOR.PATCH", sent as User-Agent to catalogs and token endpoints.
std::string getUserAgent();

} // namespace mcphost
