//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: OAuthFlow.hpp
// Purpose: Browser-based delegated authorization (authorization code + PKCE) per tool server instance
//==========================================================================================================
#pragma once

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>

#include "mcphost/auth/TokenEndpoint.hpp"
#include "mcphost/auth/TokenRefresher.hpp"
#include "mcphost/config/ServerConfig.h"

namespace mcphost {
class CredentialStore;
}

namespace mcphost::auth {

enum class OAuthState { NotConnected, Authorizing, Connected, Error, Timeout };

const char* ToString(OAuthState state);

struct OAuthStatus {
    OAuthState state{OAuthState::NotConnected};
    std::string identity;  // Connected
    std::string message;   // Error
};

struct OAuthOptions {
    std::chrono::milliseconds callbackTimeout{std::chrono::minutes(2)};
    std::chrono::seconds refreshSkew{std::chrono::seconds(60)};
    // Used when the configuration has no redirect uri.
    std::string defaultRedirectUri{"mcphost://oauth/callback"};
    // Receives the authorization url; defaults to OpenInBrowser.
    std::function<void(const std::string&)> openBrowser;
    std::function<std::chrono::steady_clock::time_point()> steadyClock;
    std::function<std::chrono::system_clock::time_point()> wallClock;
};

struct AuthorizationRequest {
    std::string instanceId;
    std::string url;
    std::string state;
};

//==========================================================================================================
// OAuthManager
// Purpose: Tracks one authorization flow per instance: NotConnected -> Authorizing -> Connected | Error |
//          Timeout. Tokens are persisted through the CredentialStore only.
//==========================================================================================================
class OAuthManager : public ITokenRefresher {
public:
    OAuthManager(CredentialStore& store, std::shared_ptr<ITokenEndpoint> endpoint, OAuthOptions options = OAuthOptions{});

    //==========================================================================================================
    // BeginAuthorization
    // Purpose: Issues a fresh CSRF state and PKCE verifier, builds the authorization url and opens it.
    // Notes:
    //   Restarting replaces an earlier pending flow for the same instance. Throws HostError{ConfigError}
    //   when the configuration lacks OAuth settings.
    //==========================================================================================================
    AuthorizationRequest BeginAuthorization(const ServerConfig& cfg);

    //==========================================================================================================
    // HandleCallback
    // Purpose: Completes the flow from the redirect url ("...?code=...&state=..." or "...?error=...").
    // Returns:
    //   Connected status on success.
    // Notes:
    //   Throws CsrfStateMismatch when state differs from the issued one, OAuthError for provider errors,
    //   late callbacks and exchange failures. The flow is left in Error (or Timeout).
    //==========================================================================================================
    OAuthStatus HandleCallback(const std::string& instanceId, const std::string& callbackUrl);

    // Routes by state to the pending flow (or the only one pending).
    OAuthStatus HandleCallback(const std::string& callbackUrl);

    // Moves Authorizing flows older than callbackTimeout to Timeout. Returns how many.
    std::size_t CheckTimeouts();

    //==========================================================================================================
    // EnsureFreshToken
    // Purpose: Refreshes the stored token when it expires within refreshSkew.
    // Notes:
    //   Throws CredentialError when no token is stored or an expired one has no refresh token; refresh
    //   failures surface as HostError{OAuthError}.
    //==========================================================================================================
    void EnsureFreshToken(const ServerConfig& cfg) override;

    // Forgets the flow and deletes the stored token.
    void Disconnect(const std::string& instanceId);

    // A pending flow past callbackTimeout is moved to Timeout before it is reported.
    OAuthStatus GetStatus(const std::string& instanceId);

private:
    struct Flow {
        OAuthStatus status;
        std::string state;
        std::string verifier;
        OAuthSettings settings;
        std::chrono::steady_clock::time_point startedAt;
    };

    OAuthStatus fail(const std::string& instanceId, OAuthState state, const std::string& message);
    // Caller holds mutex. True when the flow was Authorizing and has just been moved to Timeout.
    bool expireLocked(const std::string& instanceId, Flow& flow, std::chrono::steady_clock::time_point now);

    CredentialStore& store;
    std::shared_ptr<ITokenEndpoint> endpoint;
    OAuthOptions opts;
    std::mutex mutex;
    std::map<std::string, Flow> flows;
};

// base64url without padding.
std::string Base64UrlEncode(const unsigned char* data, std::size_t len);

// base64url of `bytes` bytes from RAND_bytes; throws OAuthError when the RNG fails.
std::string RandomUrlToken(std::size_t bytes = 32);

// base64url(SHA-256(verifier)).
std::string PkceChallengeS256(const std::string& verifier);

bool ConstantTimeEquals(const std::string& a, const std::string& b);

// Query parameters of a url (or a bare query string), percent-decoded.
std::map<std::string, std::string> ParseQuery(const std::string& urlOrQuery);

// Hands the url to xdg-open (override with $MCPHOST_BROWSER); throws std::runtime_error on spawn failure.
void OpenInBrowser(const std::string& url);

} // namespace mcphost::auth
