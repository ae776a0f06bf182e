//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: TokenEndpoint.cpp
// Purpose: Form-encoded token requests and token response parsing
//==========================================================================================================

#include <format>
#include <sstream>

#include "logging/Logger.h"
#include "mcphost/auth/TokenEndpoint.hpp"
#include "mcphost/errors/Errors.h"

namespace mcphost::auth {

namespace {
std::string urlEncodeForm(const std::string& s) {
    std::ostringstream oss;
    for (unsigned char c : s) {
        if ((c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '-' || c == '_' || c == '.' || c == '~') {
            oss << static_cast<char>(c);
        } else if (c == ' ') {
            oss << '+';
        } else {
            const char* hex = "0123456789ABCDEF";
            oss << '%' << hex[(c >> 4) & 0xFu] << hex[c & 0xFu];
        }
    }
    return oss.str();
}

std::string joinScopes(const std::vector<std::string>& scopes) {
    std::string out;
    for (const auto& s : scopes) {
        if (!out.empty()) out += ' ';
        out += s;
    }
    return out;
}
} // namespace

std::string EncodeForm(const std::vector<HeaderKV>& fields) {
    std::string out;
    for (const auto& kv : fields) {
        if (!out.empty()) out += '&';
        out += urlEncodeForm(kv.first) + "=" + urlEncodeForm(kv.second);
    }
    return out;
}

TokenResponse ParseTokenResponse(const std::string& body) {
    JSONValue v;
    try {
        v = parseJSONValue(body);
    } catch (const std::exception& e) {
        throw HostError(ErrorKind::OAuthError, std::format("Token endpoint sent an unreadable body: {}", e.what()));
    }
    if (auto err = json::getString(v, "error")) {
        std::string message = "Token endpoint refused the request: " + *err;
        if (auto desc = json::getString(v, "error_description")) {
            message += " (" + *desc + ")";
        }
        throw HostError(ErrorKind::OAuthError, message);
    }
    auto access = json::getString(v, "access_token");
    if (!access || access->empty()) {
        throw HostError(ErrorKind::OAuthError, "Token endpoint response has no access_token");
    }
    TokenResponse r;
    r.accessToken = *access;
    r.tokenType = json::getString(v, "token_type").value_or("Bearer");
    r.refreshToken = json::getString(v, "refresh_token");
    r.expiresIn = json::getInt(v, "expires_in");
    r.scope = json::getString(v, "scope");
    for (const char* key : {"identity", "email", "user", "sub"}) {
        if (auto id = json::getString(v, key); id && !id->empty()) {
            r.identity = *id;
            break;
        }
    }
    return r;
}

HttpTokenEndpoint::HttpTokenEndpoint(std::shared_ptr<IHttpClient> client) : http(std::move(client)) {}

TokenResponse HttpTokenEndpoint::ExchangeCode(const OAuthSettings& settings, const std::string& code,
                                              const std::string& codeVerifier) {
    FUNC_SCOPE();
    std::vector<HeaderKV> fields{
        {"grant_type", "authorization_code"},
        {"code", code},
        {"redirect_uri", settings.redirectUri},
        {"client_id", settings.clientId},
        {"code_verifier", codeVerifier},
    };
    return post(settings.tokenUrl, fields);
}

TokenResponse HttpTokenEndpoint::Refresh(const OAuthSettings& settings, const std::string& refreshToken) {
    FUNC_SCOPE();
    std::vector<HeaderKV> fields{
        {"grant_type", "refresh_token"},
        {"refresh_token", refreshToken},
        {"client_id", settings.clientId},
    };
    if (!settings.scopes.empty()) {
        fields.emplace_back("scope", joinScopes(settings.scopes));
    }
    return post(settings.tokenUrl, fields);
}

TokenResponse HttpTokenEndpoint::post(const std::string& tokenUrl, const std::vector<HeaderKV>& fields) {
    if (tokenUrl.empty()) {
        throw HostError(ErrorKind::OAuthError, "No token endpoint configured");
    }
    HttpRequest req;
    req.method = "POST";
    req.url = tokenUrl;
    req.headers = {{"Content-Type", "application/x-www-form-urlencoded"}, {"Accept", "application/json"}};
    req.body = EncodeForm(fields);

    HttpResponse resp;
    try {
        resp = http->Send(req);
    } catch (const std::exception& e) {
        throw HostError(ErrorKind::OAuthError, std::format("Token endpoint unreachable: {}", e.what()));
    }
    LOG_DEBUG("Token endpoint answered HTTP {} ({} bytes)", resp.status, resp.body.size());
    if (!resp.Ok()) {
        // OAuth error bodies are JSON too; prefer their description
        try {
            ParseTokenResponse(resp.body);
        } catch (const HostError& e) {
            throw HostError(ErrorKind::OAuthError, std::format("HTTP {}: {}", resp.status, e.what()));
        }
        throw HostError(ErrorKind::OAuthError, std::format("Token endpoint returned HTTP {}", resp.status));
    }
    return ParseTokenResponse(resp.body);
}

} // namespace mcphost::auth
