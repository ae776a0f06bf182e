//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: OAuthFlow.cpp
// Purpose: Authorization-code + PKCE flows, CSRF state checks, token persistence and refresh
//==========================================================================================================

#include <cerrno>
#include <cstring>
#include <format>
#include <thread>
#include <vector>

#include <spawn.h>
#include <sys/wait.h>

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <openssl/sha.h>

#include "env/EnvVars.h"
#include "logging/Logger.h"
#include "mcphost/auth/OAuthFlow.hpp"
#include "mcphost/credentials/CredentialStore.h"
#include "mcphost/errors/Errors.h"

namespace mcphost::auth {

const char* ToString(OAuthState state) {
    switch (state) {
        case OAuthState::NotConnected: return "NotConnected";
        case OAuthState::Authorizing: return "Authorizing";
        case OAuthState::Connected: return "Connected";
        case OAuthState::Error: return "Error";
        case OAuthState::Timeout: return "Timeout";
    }
    return "Unknown";
}

std::string Base64UrlEncode(const unsigned char* data, std::size_t len) {
    std::string out(4 * ((len + 2) / 3) + 1, '\0');
    const int n = ::EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out.data()), data, static_cast<int>(len));
    out.resize(static_cast<std::size_t>(n));
    while (!out.empty() && out.back() == '=') out.pop_back();
    for (auto& c : out) {
        if (c == '+') c = '-';
        else if (c == '/') c = '_';
    }
    return out;
}

std::string RandomUrlToken(std::size_t bytes) {
    std::vector<unsigned char> buf(bytes);
    if (::RAND_bytes(buf.data(), static_cast<int>(buf.size())) != 1) {
        throw HostError(ErrorKind::OAuthError, "Secure random generator failed");
    }
    return Base64UrlEncode(buf.data(), buf.size());
}

std::string PkceChallengeS256(const std::string& verifier) {
    unsigned char digest[SHA256_DIGEST_LENGTH];
    ::SHA256(reinterpret_cast<const unsigned char*>(verifier.data()), verifier.size(), digest);
    return Base64UrlEncode(digest, sizeof(digest));
}

bool ConstantTimeEquals(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) return false;
    return ::CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}

std::map<std::string, std::string> ParseQuery(const std::string& urlOrQuery) {
    std::map<std::string, std::string> out;
    std::string q = urlOrQuery;
    if (auto qm = q.find('?'); qm != std::string::npos) q = q.substr(qm + 1);
    if (auto hash = q.find('#'); hash != std::string::npos) q = q.substr(0, hash);
    std::size_t pos = 0;
    while (pos <= q.size()) {
        std::size_t amp = q.find('&', pos);
        if (amp == std::string::npos) amp = q.size();
        const std::string pair = q.substr(pos, amp - pos);
        if (!pair.empty()) {
            const auto eq = pair.find('=');
            const std::string key = UrlDecode(pair.substr(0, eq));
            const std::string value = eq == std::string::npos ? std::string() : UrlDecode(pair.substr(eq + 1));
            out.emplace(key, value);
        }
        pos = amp + 1;
    }
    return out;
}

void OpenInBrowser(const std::string& url) {
    const std::string browser = GetEnvOrDefault("MCPHOST_BROWSER", "xdg-open");
    std::vector<char*> argv{const_cast<char*>(browser.c_str()), const_cast<char*>(url.c_str()), nullptr};
    pid_t pid = -1;
    const int rc = ::posix_spawnp(&pid, browser.c_str(), nullptr, nullptr, argv.data(), environ);
    if (rc != 0) {
        throw std::runtime_error(std::format("Failed to launch {}: {}", browser, std::strerror(rc)));
    }
    std::thread([pid]() {
        int status = 0;
        while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
        }
    }).detach();
}

OAuthManager::OAuthManager(CredentialStore& s, std::shared_ptr<ITokenEndpoint> e, OAuthOptions o)
    : store(s), endpoint(std::move(e)), opts(std::move(o)) {
    if (!opts.openBrowser) opts.openBrowser = OpenInBrowser;
    if (!opts.steadyClock) opts.steadyClock = []() { return std::chrono::steady_clock::now(); };
    if (!opts.wallClock) opts.wallClock = []() { return std::chrono::system_clock::now(); };
}

AuthorizationRequest OAuthManager::BeginAuthorization(const ServerConfig& cfg) {
    FUNC_SCOPE();
    if (cfg.authMethod != AuthMethod::OAuth || !cfg.oauth) {
        throw HostError(ErrorKind::ConfigError, "Server '" + cfg.name + "' is not configured for OAuth");
    }
    OAuthSettings settings = *cfg.oauth;
    if (settings.authorizationUrl.empty() || settings.clientId.empty()) {
        throw HostError(ErrorKind::ConfigError,
                        "Server '" + cfg.name + "' needs an authorization url and client id before connecting");
    }
    if (settings.redirectUri.empty()) settings.redirectUri = opts.defaultRedirectUri;

    Flow flow;
    flow.state = RandomUrlToken(32);
    flow.verifier = RandomUrlToken(32);
    flow.settings = settings;
    flow.startedAt = opts.steadyClock();
    flow.status.state = OAuthState::Authorizing;

    std::string scopes;
    for (const auto& s : settings.scopes) {
        if (!scopes.empty()) scopes += ' ';
        scopes += s;
    }
    std::vector<HeaderKV> params{
        {"response_type", "code"},
        {"client_id", settings.clientId},
        {"redirect_uri", settings.redirectUri},
        {"state", flow.state},
        {"code_challenge", PkceChallengeS256(flow.verifier)},
        {"code_challenge_method", "S256"},
    };
    if (!scopes.empty()) params.emplace_back("scope", scopes);

    AuthorizationRequest req;
    req.instanceId = cfg.id;
    req.state = flow.state;
    req.url = settings.authorizationUrl + (settings.authorizationUrl.find('?') == std::string::npos ? "?" : "&") +
              EncodeForm(params);
    {
        std::lock_guard<std::mutex> lk(mutex);
        flows[cfg.id] = std::move(flow);
    }
    LOG_INFO("OAuth: authorization started for '{}'", cfg.name);
    try {
        opts.openBrowser(req.url);
    } catch (const std::exception& e) {
        LOG_WARN("OAuth: could not open a browser ({}); open the authorization url manually", e.what());
    }
    return req;
}

OAuthStatus OAuthManager::fail(const std::string& instanceId, OAuthState state, const std::string& message) {
    std::lock_guard<std::mutex> lk(mutex);
    auto it = flows.find(instanceId);
    if (it == flows.end()) return OAuthStatus{state, std::string(), message};
    it->second.status = OAuthStatus{state, std::string(), message};
    it->second.state.clear();
    it->second.verifier.clear();
    return it->second.status;
}

OAuthStatus OAuthManager::HandleCallback(const std::string& instanceId, const std::string& callbackUrl) {
    FUNC_SCOPE();
    const auto params = ParseQuery(callbackUrl);
    std::string issuedState;
    std::string verifier;
    OAuthSettings settings;
    {
        std::lock_guard<std::mutex> lk(mutex);
        auto it = flows.find(instanceId);
        if (it == flows.end() || it->second.status.state != OAuthState::Authorizing) {
            throw HostError(ErrorKind::OAuthError, "No authorization in progress for instance " + instanceId);
        }
        Flow& flow = it->second;
        if (expireLocked(instanceId, flow, opts.steadyClock())) {
            throw HostError(ErrorKind::OAuthError, "Authorization callback arrived after the timeout");
        }
        issuedState = flow.state;
        verifier = flow.verifier;
        settings = flow.settings;
    }

    // Nothing in the callback is trusted, provider errors included, until its state matches.
    auto state = params.find("state");
    if (state == params.end() || !ConstantTimeEquals(state->second, issuedState)) {
        LOG_WARN("OAuth: state mismatch on callback for {}", instanceId);
        fail(instanceId, OAuthState::Error, "state mismatch");
        throw HostError(ErrorKind::CsrfStateMismatch, "Authorization callback state does not match the issued state");
    }
    if (auto err = params.find("error"); err != params.end()) {
        std::string message = err->second;
        if (auto desc = params.find("error_description"); desc != params.end()) message += ": " + desc->second;
        fail(instanceId, OAuthState::Error, message);
        throw HostError(ErrorKind::OAuthError, "Authorization denied: " + message);
    }
    auto code = params.find("code");
    if (code == params.end() || code->second.empty()) {
        fail(instanceId, OAuthState::Error, "callback without code");
        throw HostError(ErrorKind::OAuthError, "Authorization callback carries no code");
    }

    TokenResponse token;
    try {
        token = endpoint->ExchangeCode(settings, code->second, verifier);
    } catch (const HostError& e) {
        fail(instanceId, OAuthState::Error, e.what());
        throw;
    }

    OAuthTokenRecord record;
    record.accessToken = token.accessToken;
    record.tokenType = token.tokenType;
    record.refreshToken = token.refreshToken;
    if (token.expiresIn) {
        const auto now = std::chrono::duration_cast<std::chrono::seconds>(opts.wallClock().time_since_epoch()).count();
        record.expiresAt = now + *token.expiresIn;
    }
    record.scope = token.scope;
    record.identity = token.identity;
    try {
        store.StoreOAuthToken(instanceId, record);
    } catch (const HostError& e) {
        fail(instanceId, OAuthState::Error, e.what());
        throw;
    }

    std::lock_guard<std::mutex> lk(mutex);
    Flow& flow = flows[instanceId];
    flow.status = OAuthStatus{OAuthState::Connected, token.identity.value_or(std::string()), std::string()};
    flow.state.clear();
    flow.verifier.clear();
    LOG_INFO("OAuth: instance {} connected", instanceId);
    return flow.status;
}

OAuthStatus OAuthManager::HandleCallback(const std::string& callbackUrl) {
    const auto params = ParseQuery(callbackUrl);
    const auto state = params.find("state");
    std::string target;
    {
        std::lock_guard<std::mutex> lk(mutex);
        std::vector<std::string> authorizing;
        for (const auto& kv : flows) {
            if (kv.second.status.state != OAuthState::Authorizing) continue;
            authorizing.push_back(kv.first);
            if (state != params.end() && ConstantTimeEquals(state->second, kv.second.state)) {
                target = kv.first;
            }
        }
        if (target.empty() && authorizing.size() == 1) target = authorizing.front();
    }
    if (target.empty()) {
        throw HostError(ErrorKind::OAuthError, "Authorization callback does not belong to a pending authorization");
    }
    return HandleCallback(target, callbackUrl);
}

std::size_t OAuthManager::CheckTimeouts() {
    const auto now = opts.steadyClock();
    std::lock_guard<std::mutex> lk(mutex);
    std::size_t n = 0;
    for (auto& kv : flows) {
        if (expireLocked(kv.first, kv.second, now)) ++n;
    }
    return n;
}

bool OAuthManager::expireLocked(const std::string& instanceId, Flow& flow,
                                std::chrono::steady_clock::time_point now) {
    if (flow.status.state != OAuthState::Authorizing || now - flow.startedAt < opts.callbackTimeout) return false;
    flow.status = OAuthStatus{OAuthState::Timeout, std::string(), "authorization timed out"};
    flow.state.clear();
    flow.verifier.clear();
    LOG_WARN("OAuth: authorization for {} timed out", instanceId);
    return true;
}

void OAuthManager::EnsureFreshToken(const ServerConfig& cfg) {
    auto record = store.LoadOAuthToken(cfg.id);
    if (!record) {
        throw CredentialError(CredentialErrorCode::NotFound,
                              "Server '" + cfg.name + "' is not connected: no OAuth token stored");
    }
    if (!record->IsExpired(opts.wallClock(), opts.refreshSkew)) return;
    if (!record->refreshToken || record->refreshToken->empty()) {
        throw CredentialError(CredentialErrorCode::NotFound,
                              "OAuth token for '" + cfg.name + "' expired and cannot be refreshed; reconnect");
    }
    if (!cfg.oauth) {
        throw CredentialError(CredentialErrorCode::NotFound, "Server '" + cfg.name + "' has no OAuth settings");
    }
    LOG_INFO("OAuth: refreshing token for '{}'", cfg.name);
    TokenResponse token = endpoint->Refresh(*cfg.oauth, *record->refreshToken);

    OAuthTokenRecord next;
    next.accessToken = token.accessToken;
    next.tokenType = token.tokenType;
    next.refreshToken = token.refreshToken ? token.refreshToken : record->refreshToken;
    if (token.expiresIn) {
        const auto now = std::chrono::duration_cast<std::chrono::seconds>(opts.wallClock().time_since_epoch()).count();
        next.expiresAt = now + *token.expiresIn;
    }
    next.scope = token.scope ? token.scope : record->scope;
    next.identity = token.identity ? token.identity : record->identity;
    store.StoreOAuthToken(cfg.id, next);
}

void OAuthManager::Disconnect(const std::string& instanceId) {
    {
        std::lock_guard<std::mutex> lk(mutex);
        flows.erase(instanceId);
    }
    store.DeleteOAuthToken(instanceId);
    LOG_INFO("OAuth: instance {} disconnected", instanceId);
}

OAuthStatus OAuthManager::GetStatus(const std::string& instanceId) {
    const auto now = opts.steadyClock();
    {
        std::lock_guard<std::mutex> lk(mutex);
        auto it = flows.find(instanceId);
        if (it != flows.end()) {
            expireLocked(instanceId, it->second, now);
            return it->second.status;
        }
    }
    if (auto record = store.LoadOAuthToken(instanceId)) {
        return OAuthStatus{OAuthState::Connected, record->identity.value_or(std::string()), std::string()};
    }
    return OAuthStatus{};
}

} // namespace mcphost::auth
