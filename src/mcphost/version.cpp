//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: version.cpp
// Purpose: Version helpers; components come from the build (project VERSION in CMakeLists.txt).
//==========================================================================================================
#include "mcphost/version.h"

#include <format>

#ifndef MCPHOST_VERSION_MAJOR
#error "MCPHOST_VERSION_MAJOR must be defined by the build"
#endif

namespace mcphost {

VersionInfo getVersion() {
    return VersionInfo{MCPHOST_VERSION_MAJOR, MCPHOST_VERSION_MINOR, MCPHOST_VERSION_PATCH};
}

std::string getVersionString() {
    const VersionInfo v = getVersion();
    return std::format("{}.{}.{}", v.major, v.minor, v.patch);
}

std::string getUserAgent() {
    return std::format("{}/{}", CLIENT_NAME, getVersionString());
}

} // namespace mcphost
