//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: TokenRefresher.hpp
// Purpose: Hook the manager calls before starting an instance that uses delegated authorization
//==========================================================================================================
#pragma once

namespace mcphost {

struct ServerConfig;

namespace auth {

class ITokenRefresher {
public:
    virtual ~ITokenRefresher() = default;

    //==========================================================================================================
    // Makes sure the stored token for cfg is usable, refreshing it when expired.
    // Throws CredentialError when there is no token or it cannot be refreshed.
    //==========================================================================================================
    virtual void EnsureFreshToken(const ServerConfig& cfg) = 0;
};

} // namespace auth
} // namespace mcphost
