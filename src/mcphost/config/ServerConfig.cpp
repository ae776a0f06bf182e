//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ServerConfig.cpp
// Purpose: ServerConfig invariants, settings accessors and enum string mapping
//==========================================================================================================

#include "mcphost/config/ServerConfig.h"

#include <algorithm>
#include <cctype>

#include "mcphost/credentials/CredentialStore.h"
#include "mcphost/errors/Errors.h"

namespace mcphost {

namespace {
std::string lower(const std::string& s) {
    std::string out = s;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

JSONValue::Object& ensureObjectMember(JSONValue& parent, const std::string& key) {
    if (!parent.isObject()) {
        parent = JSONValue(JSONValue::Object{});
    }
    auto& obj = std::get<JSONValue::Object>(parent.value);
    auto it = obj.find(key);
    if (it == obj.end() || !it->second || !it->second->isObject()) {
        obj[key] = std::make_shared<JSONValue>(JSONValue::Object{});
        it = obj.find(key);
    }
    return std::get<JSONValue::Object>(it->second->value);
}
} // namespace

void ValidateConfigInvariants(const ServerConfig& cfg) {
    if (cfg.id.empty()) {
        throw HostError(ErrorKind::ConfigError, "Server config has an empty id");
    }
    // the id names the instance's credential directory
    if (!CredentialStore::IsValidComponent(cfg.id)) {
        throw HostError(ErrorKind::ConfigError, "Server config id '" + cfg.id + "' may only use letters, digits, '.', '_' and '-'");
    }
    const std::string who = cfg.name.empty() ? cfg.id : cfg.name;
    if (cfg.authMethod == AuthMethod::KeyFile) {
        if (!cfg.keyFilePath.has_value() || cfg.keyFilePath->empty()) {
            throw HostError(ErrorKind::ConfigError, "Server '" + who + "' uses key-file auth without a key file path");
        }
    } else if (cfg.keyFilePath.has_value()) {
        throw HostError(ErrorKind::ConfigError, "Server '" + who + "' has a key file path but auth method is " +
                        std::string(ToString(cfg.authMethod)));
    }
    if (cfg.authMethod == AuthMethod::OAuth) {
        if (!cfg.oauth.has_value()) {
            throw HostError(ErrorKind::ConfigError, "Server '" + who + "' uses OAuth without OAuth settings");
        }
    } else if (cfg.oauth.has_value()) {
        throw HostError(ErrorKind::ConfigError, "Server '" + who + "' has OAuth settings but auth method is " +
                        std::string(ToString(cfg.authMethod)));
    }
    if (cfg.transport == TransportKind::Http && (!cfg.url.has_value() || cfg.url->empty())) {
        throw HostError(ErrorKind::ConfigError, "Server '" + who + "' uses the network transport without a url");
    }
    if (!cfg.settings.isObject()) {
        throw HostError(ErrorKind::ConfigError, "Server '" + who + "' settings must be a JSON object");
    }
}

const JSONValue* FindPackageArgValue(const ServerConfig& cfg, const std::string& name) {
    const JSONValue* args = json::getObject(cfg.settings, "package_args");
    if (!args) return nullptr;
    const JSONValue* v = json::member(*args, name);
    if (!v || v->isNull()) return nullptr;
    return v;
}

std::optional<std::string> FindSettingsEnvValue(const ServerConfig& cfg, const std::string& name) {
    const JSONValue* env = json::getObject(cfg.settings, "env");
    if (!env) return std::nullopt;
    const JSONValue* v = json::member(*env, name);
    if (!v) return std::nullopt;
    return json::scalarToString(*v);
}

void SetPackageArgValue(ServerConfig& cfg, const std::string& name, JSONValue value) {
    json::set(ensureObjectMember(cfg.settings, "package_args"), name, std::move(value));
}

void SetSettingsEnvValue(ServerConfig& cfg, const std::string& name, const std::string& value) {
    json::set(ensureObjectMember(cfg.settings, "env"), name, value);
}

const char* ToString(PackageKind kind) {
    switch (kind) {
        case PackageKind::Npm: return "npm";
        case PackageKind::Pypi: return "pypi";
        case PackageKind::Docker: return "docker";
        case PackageKind::Binary: return "binary";
        case PackageKind::Http: return "http";
    }
    return "npm";
}

const char* ToString(TransportKind kind) {
    switch (kind) {
        case TransportKind::Stdio: return "stdio";
        case TransportKind::Http: return "http";
    }
    return "stdio";
}

const char* ToString(AuthMethod method) {
    switch (method) {
        case AuthMethod::None: return "none";
        case AuthMethod::ApiKey: return "api_key";
        case AuthMethod::KeyFile: return "keyfile";
        case AuthMethod::OAuth: return "oauth";
    }
    return "none";
}

std::optional<PackageKind> PackageKindFromString(const std::string& s) {
    const std::string v = lower(s);
    if (v == "npm") return PackageKind::Npm;
    if (v == "pypi") return PackageKind::Pypi;
    if (v == "docker" || v == "oci") return PackageKind::Docker;
    if (v == "binary") return PackageKind::Binary;
    if (v == "http") return PackageKind::Http;
    return std::nullopt;
}

std::optional<TransportKind> TransportKindFromString(const std::string& s) {
    const std::string v = lower(s);
    if (v == "stdio") return TransportKind::Stdio;
    if (v == "http" || v == "streamable-http" || v == "sse") return TransportKind::Http;
    return std::nullopt;
}

std::optional<AuthMethod> AuthMethodFromString(const std::string& s) {
    const std::string v = lower(s);
    if (v == "none") return AuthMethod::None;
    if (v == "api_key" || v == "apikey") return AuthMethod::ApiKey;
    if (v == "keyfile" || v == "key_file") return AuthMethod::KeyFile;
    if (v == "oauth") return AuthMethod::OAuth;
    return std::nullopt;
}

} // namespace mcphost
