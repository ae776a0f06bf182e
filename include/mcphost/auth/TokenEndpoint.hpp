//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: TokenEndpoint.hpp
// Purpose: OAuth 2.0 token endpoint client (authorization-code exchange with PKCE, refresh)
//==========================================================================================================
#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "mcphost/auth/HttpClient.hpp"
#include "mcphost/config/ServerConfig.h"

namespace mcphost::auth {

struct TokenResponse {
    std::string accessToken;
    std::string tokenType{"Bearer"};
    std::optional<std::string> refreshToken;
    std::optional<int64_t> expiresIn;  // seconds
    std::optional<std::string> scope;
    std::optional<std::string> identity;
};

class ITokenEndpoint {
public:
    virtual ~ITokenEndpoint() = default;

    //==========================================================================================================
    // ExchangeCode
    // Purpose: grant_type=authorization_code with the PKCE verifier.
    // Notes:
    //   Throws HostError{OAuthError} when the endpoint refuses or is unreachable.
    //==========================================================================================================
    virtual TokenResponse ExchangeCode(const OAuthSettings& settings, const std::string& code,
                                       const std::string& codeVerifier) = 0;

    // grant_type=refresh_token; throws HostError{OAuthError}.
    virtual TokenResponse Refresh(const OAuthSettings& settings, const std::string& refreshToken) = 0;
};

// POSTs application/x-www-form-urlencoded bodies through an IHttpClient.
class HttpTokenEndpoint : public ITokenEndpoint {
public:
    explicit HttpTokenEndpoint(std::shared_ptr<IHttpClient> http);

    TokenResponse ExchangeCode(const OAuthSettings& settings, const std::string& code,
                               const std::string& codeVerifier) override;
    TokenResponse Refresh(const OAuthSettings& settings, const std::string& refreshToken) override;

private:
    TokenResponse post(const std::string& tokenUrl, const std::vector<HeaderKV>& fields);

    std::shared_ptr<IHttpClient> http;
};

// "k1=v1&k2=v2" with form encoding (space as '+').
std::string EncodeForm(const std::vector<HeaderKV>& fields);

//==========================================================================================================
// ParseTokenResponse
// Purpose: Parses a token endpoint JSON body.
// Notes:
//   Throws HostError{OAuthError} when the body carries "error" or lacks access_token.
//==========================================================================================================
TokenResponse ParseTokenResponse(const std::string& body);

} // namespace mcphost::auth
