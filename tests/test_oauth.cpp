//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_oauth.cpp
// Purpose: Authorization-code flow, CSRF state checks, timeouts, token refresh and the token endpoint client
//==========================================================================================================

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <mutex>
#include <string>
#include <vector>

#include "TempDir.h"
#include "mcphost/auth/OAuthFlow.hpp"
#include "mcphost/auth/TokenEndpoint.hpp"
#include "mcphost/credentials/CredentialStore.h"
#include "mcphost/errors/Errors.h"

using namespace mcphost;
using namespace mcphost::auth;
using namespace std::chrono_literals;

namespace {

class ScriptedTokenEndpoint : public ITokenEndpoint {
public:
    TokenResponse ExchangeCode(const OAuthSettings&, const std::string& code, const std::string& verifier) override {
        std::lock_guard<std::mutex> lk(mutex);
        exchangedCode = code;
        exchangedVerifier = verifier;
        if (refuse) throw HostError(ErrorKind::OAuthError, "invalid_grant");
        TokenResponse r;
        r.accessToken = "access-1";
        r.refreshToken = "refresh-1";
        r.expiresIn = 3600;
        r.identity = "octocat";
        return r;
    }

    TokenResponse Refresh(const OAuthSettings&, const std::string& refreshToken) override {
        std::lock_guard<std::mutex> lk(mutex);
        ++refreshes;
        usedRefreshToken = refreshToken;
        TokenResponse r;
        r.accessToken = "access-2";
        r.expiresIn = 3600;
        return r;
    }

    std::mutex mutex;
    bool refuse{false};
    std::string exchangedCode;
    std::string exchangedVerifier;
    std::string usedRefreshToken;
    int refreshes{0};
};

class CapturingHttpClient : public IHttpClient {
public:
    HttpResponse Send(const HttpRequest& request) override {
        last = request;
        return reply;
    }
    HttpRequest last;
    HttpResponse reply;
};

ServerConfig oauthConfig(const std::string& id = "inst-1") {
    ServerConfig cfg;
    cfg.id = id;
    cfg.name = "Calendar";
    cfg.package.kind = PackageKind::Npm;
    cfg.package.identifier = "@acme/calendar";
    cfg.authMethod = AuthMethod::OAuth;
    OAuthSettings s;
    s.clientId = "client-abc";
    s.authorizationUrl = "https://auth.example.com/authorize";
    s.tokenUrl = "https://auth.example.com/token";
    s.redirectUri = "http://127.0.0.1:8765/callback";
    s.scopes = {"calendar.read", "calendar.write"};
    cfg.oauth = s;
    return cfg;
}

class OAuthTest : public ::testing::Test {
protected:
    void SetUp() override {
        store = std::make_unique<CredentialStore>(dir.path());
        endpoint = std::make_shared<ScriptedTokenEndpoint>();
        OAuthOptions opts;
        opts.callbackTimeout = 2min;
        opts.openBrowser = [this](const std::string& url) { opened.push_back(url); };
        opts.steadyClock = [this]() { return steadyBase + std::chrono::milliseconds(steadyOffsetMs.load()); };
        opts.wallClock = [this]() { return wallNow; };
        oauth = std::make_unique<OAuthManager>(*store, endpoint, opts);
    }

    std::string callback(const std::string& state, const std::string& code = "code-xyz") {
        return "http://127.0.0.1:8765/callback?code=" + code + "&state=" + state;
    }

    testutil::TempDir dir;
    std::unique_ptr<CredentialStore> store;
    std::shared_ptr<ScriptedTokenEndpoint> endpoint;
    std::unique_ptr<OAuthManager> oauth;
    std::vector<std::string> opened;
    const std::chrono::steady_clock::time_point steadyBase = std::chrono::steady_clock::now();
    std::atomic<long long> steadyOffsetMs{0};
    std::chrono::system_clock::time_point wallNow{std::chrono::seconds(1700000000)};
};

} // namespace

TEST_F(OAuthTest, AuthorizationUrlCarriesStateAndPkce) {
    AuthorizationRequest req = oauth->BeginAuthorization(oauthConfig());
    ASSERT_EQ(opened.size(), 1u);
    EXPECT_EQ(opened[0], req.url);
    EXPECT_EQ(req.url.rfind("https://auth.example.com/authorize?", 0), 0u);

    auto q = ParseQuery(req.url);
    EXPECT_EQ(q["response_type"], "code");
    EXPECT_EQ(q["client_id"], "client-abc");
    EXPECT_EQ(q["redirect_uri"], "http://127.0.0.1:8765/callback");
    EXPECT_EQ(q["state"], req.state);
    EXPECT_EQ(q["code_challenge_method"], "S256");
    EXPECT_EQ(q["scope"], "calendar.read calendar.write");
    EXPECT_EQ(q["code_challenge"].size(), 43u);
    EXPECT_GE(req.state.size(), 43u);
    EXPECT_EQ(oauth->GetStatus("inst-1").state, OAuthState::Authorizing);
}

TEST_F(OAuthTest, MatchingCallbackExchangesAndStoresToken) {
    AuthorizationRequest req = oauth->BeginAuthorization(oauthConfig());
    OAuthStatus st = oauth->HandleCallback("inst-1", callback(req.state));
    EXPECT_EQ(st.state, OAuthState::Connected);
    EXPECT_EQ(st.identity, "octocat");
    EXPECT_EQ(endpoint->exchangedCode, "code-xyz");

    // the verifier sent to the token endpoint hashes to the challenge in the url
    auto q = ParseQuery(req.url);
    EXPECT_EQ(PkceChallengeS256(endpoint->exchangedVerifier), q["code_challenge"]);

    auto token = store->LoadOAuthToken("inst-1");
    ASSERT_TRUE(token.has_value());
    EXPECT_EQ(token->accessToken, "access-1");
    EXPECT_EQ(token->expiresAt.value_or(0), 1700000000 + 3600);
}

TEST_F(OAuthTest, StateMismatchIsRejectedWithoutExchange) {
    oauth->BeginAuthorization(oauthConfig());
    try {
        oauth->HandleCallback("inst-1", callback("forged-state"));
        FAIL() << "expected CsrfStateMismatch";
    } catch (const HostError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::CsrfStateMismatch);
    }
    EXPECT_TRUE(endpoint->exchangedCode.empty());
    EXPECT_FALSE(store->LoadOAuthToken("inst-1").has_value());
    EXPECT_EQ(oauth->GetStatus("inst-1").state, OAuthState::Error);
}

TEST_F(OAuthTest, RestartInvalidatesEarlierState) {
    AuthorizationRequest first = oauth->BeginAuthorization(oauthConfig());
    AuthorizationRequest second = oauth->BeginAuthorization(oauthConfig());
    EXPECT_NE(first.state, second.state);
    EXPECT_THROW(oauth->HandleCallback("inst-1", callback(first.state)), HostError);
}

TEST_F(OAuthTest, ProviderErrorMovesFlowToError) {
    AuthorizationRequest req = oauth->BeginAuthorization(oauthConfig());
    try {
        oauth->HandleCallback("inst-1", "http://127.0.0.1:8765/callback?error=access_denied&state=" + req.state);
        FAIL() << "expected OAuthError";
    } catch (const HostError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::OAuthError);
        EXPECT_NE(std::string(e.what()).find("access_denied"), std::string::npos);
    }
    auto st = oauth->GetStatus("inst-1");
    EXPECT_EQ(st.state, OAuthState::Error);
    EXPECT_EQ(st.message, "access_denied");
}

TEST_F(OAuthTest, RefusedExchangeMovesFlowToError) {
    endpoint->refuse = true;
    AuthorizationRequest req = oauth->BeginAuthorization(oauthConfig());
    EXPECT_THROW(oauth->HandleCallback("inst-1", callback(req.state)), HostError);
    EXPECT_EQ(oauth->GetStatus("inst-1").state, OAuthState::Error);
}

TEST_F(OAuthTest, LateCallbackTimesOut) {
    AuthorizationRequest req = oauth->BeginAuthorization(oauthConfig());
    steadyOffsetMs = std::chrono::duration_cast<std::chrono::milliseconds>(2min).count();
    EXPECT_THROW(oauth->HandleCallback("inst-1", callback(req.state)), HostError);
    EXPECT_EQ(oauth->GetStatus("inst-1").state, OAuthState::Timeout);
    EXPECT_TRUE(endpoint->exchangedCode.empty());
}

TEST_F(OAuthTest, StatusReportsTimeoutOnceCallbackWindowPasses) {
    AuthorizationRequest req = oauth->BeginAuthorization(oauthConfig());
    steadyOffsetMs = 119'999;
    EXPECT_EQ(oauth->GetStatus("inst-1").state, OAuthState::Authorizing);
    steadyOffsetMs = 120'000;
    auto st = oauth->GetStatus("inst-1");
    EXPECT_EQ(st.state, OAuthState::Timeout);
    EXPECT_EQ(st.message, "authorization timed out");

    // The issued state is gone with the flow.
    steadyOffsetMs = 0;
    EXPECT_THROW(oauth->HandleCallback("inst-1", callback(req.state)), HostError);
    EXPECT_TRUE(endpoint->exchangedCode.empty());
}

TEST_F(OAuthTest, ProviderErrorWithForgedStateIsStateMismatch) {
    oauth->BeginAuthorization(oauthConfig());
    try {
        oauth->HandleCallback("inst-1", "http://127.0.0.1:8765/callback?error=access_denied&state=forged-state");
        FAIL() << "expected CsrfStateMismatch";
    } catch (const HostError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::CsrfStateMismatch);
        EXPECT_EQ(std::string(e.what()).find("access_denied"), std::string::npos);
    }
    auto st = oauth->GetStatus("inst-1");
    EXPECT_EQ(st.state, OAuthState::Error);
    EXPECT_EQ(st.message, "state mismatch");
}

TEST_F(OAuthTest, CheckTimeoutsSweepsPendingFlows) {
    oauth->BeginAuthorization(oauthConfig("a"));
    steadyOffsetMs = 60'000;
    oauth->BeginAuthorization(oauthConfig("b"));
    steadyOffsetMs = 120'000;
    EXPECT_EQ(oauth->CheckTimeouts(), 1u);
    EXPECT_EQ(oauth->GetStatus("a").state, OAuthState::Timeout);
    EXPECT_EQ(oauth->GetStatus("b").state, OAuthState::Authorizing);
}

TEST_F(OAuthTest, CallbackRoutedByState) {
    oauth->BeginAuthorization(oauthConfig("a"));
    AuthorizationRequest b = oauth->BeginAuthorization(oauthConfig("b"));
    OAuthStatus st = oauth->HandleCallback(callback(b.state));
    EXPECT_EQ(st.state, OAuthState::Connected);
    EXPECT_EQ(oauth->GetStatus("a").state, OAuthState::Authorizing);
    EXPECT_TRUE(store->LoadOAuthToken("b").has_value());
}

TEST_F(OAuthTest, MissingSettingsIsConfigError) {
    ServerConfig cfg = oauthConfig();
    cfg.oauth->clientId.clear();
    try {
        oauth->BeginAuthorization(cfg);
        FAIL() << "expected ConfigError";
    } catch (const HostError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::ConfigError);
    }
}

TEST_F(OAuthTest, EnsureFreshTokenRefreshesNearExpiry) {
    const ServerConfig cfg = oauthConfig();
    OAuthTokenRecord rec;
    rec.accessToken = "old";
    rec.refreshToken = "refresh-1";
    rec.identity = "octocat";
    rec.expiresAt = 1700000000 + 30;  // inside the 60 s skew
    store->StoreOAuthToken(cfg.id, rec);

    oauth->EnsureFreshToken(cfg);
    EXPECT_EQ(endpoint->refreshes, 1);
    EXPECT_EQ(endpoint->usedRefreshToken, "refresh-1");
    auto next = store->LoadOAuthToken(cfg.id);
    ASSERT_TRUE(next.has_value());
    EXPECT_EQ(next->accessToken, "access-2");
    EXPECT_EQ(next->refreshToken.value_or(""), "refresh-1");
    EXPECT_EQ(next->identity.value_or(""), "octocat");

    // fresh token: no second refresh
    oauth->EnsureFreshToken(cfg);
    EXPECT_EQ(endpoint->refreshes, 1);
}

TEST_F(OAuthTest, EnsureFreshTokenWithoutTokenIsCredentialError) {
    EXPECT_THROW(oauth->EnsureFreshToken(oauthConfig()), CredentialError);

    OAuthTokenRecord rec;
    rec.accessToken = "old";
    rec.expiresAt = 1600000000;
    store->StoreOAuthToken("inst-1", rec);
    EXPECT_THROW(oauth->EnsureFreshToken(oauthConfig()), CredentialError);
}

TEST_F(OAuthTest, DisconnectDeletesToken) {
    AuthorizationRequest req = oauth->BeginAuthorization(oauthConfig());
    oauth->HandleCallback("inst-1", callback(req.state));
    oauth->Disconnect("inst-1");
    EXPECT_FALSE(store->LoadOAuthToken("inst-1").has_value());
    EXPECT_EQ(oauth->GetStatus("inst-1").state, OAuthState::NotConnected);
}

TEST(OAuthHelpers, PkceKnownVector) {
    // RFC 7636 appendix B
    EXPECT_EQ(PkceChallengeS256("dBjftJeZ4CVP-mB92K27uhbUJU1p1r_wW1gFWFOEjXk"),
              "E9Melhoa2OwvFrEMTJguCHaoeK1t8URWbuGJSstw-cM");
}

TEST(OAuthHelpers, ParseQueryDecodes) {
    auto q = ParseQuery("https://x/cb?code=a%2Fb&state=s+1&flag#frag");
    EXPECT_EQ(q["code"], "a/b");
    EXPECT_EQ(q["state"], "s 1");
    EXPECT_EQ(q.count("flag"), 1u);
    EXPECT_TRUE(ConstantTimeEquals("abc", "abc"));
    EXPECT_FALSE(ConstantTimeEquals("abc", "abd"));
    EXPECT_FALSE(ConstantTimeEquals("abc", "ab"));
}

TEST(TokenEndpointTest, ParseTokenResponse) {
    TokenResponse r = ParseTokenResponse(
        R"({"access_token":"at","token_type":"bearer","refresh_token":"rt","expires_in":3600,"email":"me@example.com"})");
    EXPECT_EQ(r.accessToken, "at");
    EXPECT_EQ(r.refreshToken.value_or(""), "rt");
    EXPECT_EQ(r.expiresIn.value_or(0), 3600);
    EXPECT_EQ(r.identity.value_or(""), "me@example.com");

    EXPECT_THROW(ParseTokenResponse(R"({"error":"invalid_grant"})"), HostError);
    EXPECT_THROW(ParseTokenResponse(R"({"token_type":"bearer"})"), HostError);
    EXPECT_THROW(ParseTokenResponse("not json"), HostError);
}

TEST(TokenEndpointTest, ExchangePostsFormBody) {
    auto http = std::make_shared<CapturingHttpClient>();
    http->reply.status = 200;
    http->reply.body = R"({"access_token":"at"})";
    HttpTokenEndpoint endpoint(http);
    OAuthSettings s = *oauthConfig().oauth;
    TokenResponse r = endpoint.ExchangeCode(s, "the code", "verifier-1");
    EXPECT_EQ(r.accessToken, "at");
    EXPECT_EQ(http->last.method, "POST");
    EXPECT_EQ(http->last.url, "https://auth.example.com/token");
    EXPECT_NE(http->last.body.find("grant_type=authorization_code"), std::string::npos);
    EXPECT_NE(http->last.body.find("code=the+code"), std::string::npos);
    EXPECT_NE(http->last.body.find("code_verifier=verifier-1"), std::string::npos);

    http->reply.status = 400;
    http->reply.body = R"({"error":"invalid_grant","error_description":"code expired"})";
    try {
        endpoint.ExchangeCode(s, "c", "v");
        FAIL() << "expected OAuthError";
    } catch (const HostError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::OAuthError);
        EXPECT_NE(std::string(e.what()).find("code expired"), std::string::npos);
    }
}
