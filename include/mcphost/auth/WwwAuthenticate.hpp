//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: WwwAuthenticate.hpp
// Purpose: Parser for HTTP WWW-Authenticate Bearer challenges returned by network tool servers
//==========================================================================================================

#pragma once

#include <optional>
#include <string>
#include <unordered_map>

namespace mcphost::auth {

//==========================================================================================================
// WwwAuthChallenge
// Purpose: One parsed Bearer challenge.
// Fields:
//   scheme: Always "bearer" (lower-case) when parsing succeeds.
//   params: Parameter map with lower-cased keys and unquoted values (realm, error, error_description,
//           scope, resource_metadata, ...).
//==========================================================================================================
struct WwwAuthChallenge {
    std::string scheme;
    std::unordered_map<std::string, std::string> params;

    std::optional<std::string> Param(const std::string& key) const;
};

//==========================================================================================================
// ParseBearerChallenge
// Purpose: Parses a WWW-Authenticate header value of the Bearer scheme.
// Args:
//   header: Raw header value, e.g. `Bearer realm="mcp", error="invalid_token"`.
// Returns:
//   The challenge, or std::nullopt for other schemes and malformed input (unterminated quotes).
//==========================================================================================================
std::optional<WwwAuthChallenge> ParseBearerChallenge(const std::string& header);

//==========================================================================================================
// DescribeChallenge
// Purpose: Human-readable summary for error messages ("invalid_token: The access token expired").
//==========================================================================================================
std::string DescribeChallenge(const WwwAuthChallenge& challenge);

} // namespace mcphost::auth
