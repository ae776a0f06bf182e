//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: CommandBuilder.cpp
// Purpose: Turns a ServerConfig into an argv vector, an environment overlay and request headers
//==========================================================================================================

#include "mcphost/CommandBuilder.h"

#include <chrono>
#include <format>

#include "logging/Logger.h"
#include "mcphost/credentials/CredentialStore.h"
#include "mcphost/errors/Errors.h"

namespace mcphost {

namespace {

std::string trim(const std::string& s) {
    const char* ws = " \t\r\n";
    const auto b = s.find_first_not_of(ws);
    if (b == std::string::npos) return std::string();
    const auto e = s.find_last_not_of(ws);
    return s.substr(b, e - b + 1);
}

std::string displayName(const ServerConfig& cfg) {
    return cfg.name.empty() ? cfg.id : cfg.name;
}

// True when the explicit value renders to at least one non-blank token.
bool hasExplicitValue(const JSONValue* v) {
    if (!v) return false;
    if (v->isArray()) {
        for (const auto& item : std::get<JSONValue::Array>(v->value)) {
            if (!item) continue;
            auto s = json::scalarToString(*item);
            if (s && !trim(*s).empty()) return true;
        }
        return false;
    }
    auto s = json::scalarToString(*v);
    return s.has_value() && !trim(*s).empty();
}

// Value tokens for one argument: explicit value first, declared default otherwise.
std::vector<std::string> argumentValues(const ServerConfig& cfg, const PackageArgument& arg) {
    std::vector<std::string> out;
    const JSONValue* v = FindPackageArgValue(cfg, arg.name);
    const bool named = arg.kind == PackageArgument::Kind::Named;
    if (!v) {
        if (arg.defaultValue && !trim(*arg.defaultValue).empty()) {
            if (named) return SplitCommaList(*arg.defaultValue);
            out.push_back(*arg.defaultValue);
        }
        return out;
    }
    if (v->isObject()) {
        throw HostError(ErrorKind::ValidationError,
                        std::format("Package argument '{}' of server '{}' must be a string, number, boolean or list",
                                    arg.name, displayName(cfg)));
    }
    if (v->isArray()) {
        for (const auto& item : std::get<JSONValue::Array>(v->value)) {
            if (!item || item->isNull()) continue;
            std::optional<std::string> s = json::scalarToString(*item);
            if (!s) {
                throw HostError(ErrorKind::ValidationError,
                                std::format("Package argument '{}' of server '{}' contains a non-scalar list item",
                                            arg.name, displayName(cfg)));
            }
            const std::string t = trim(*s);
            if (!t.empty()) out.push_back(named ? t : *s);
        }
        return out;
    }
    auto s = json::scalarToString(*v);
    if (!s) return out;
    if (named) return SplitCommaList(*s);
    if (!trim(*s).empty()) out.push_back(*s);
    return out;
}

std::optional<std::string> loadOptionalSecret(const CredentialStore& store, const ServerConfig& cfg,
                                              const EnvVarRequirement& var) {
    try {
        return store.Load(cfg.id, var.name);
    } catch (const CredentialError& e) {
        if (e.code() == CredentialErrorCode::NotFound && !var.required) {
            return std::nullopt;
        }
        if (e.code() == CredentialErrorCode::NotFound) {
            throw CredentialError(CredentialErrorCode::NotFound,
                                  std::format("Required secret {} is not set for server '{}'", var.name, displayName(cfg)));
        }
        throw;
    }
}

OAuthTokenRecord requireOAuthToken(const CredentialStore& store, const ServerConfig& cfg) {
    auto token = store.LoadOAuthToken(cfg.id);
    if (!token) {
        throw CredentialError(CredentialErrorCode::NotFound,
                              std::format("Server '{}' is not connected: no OAuth token stored", displayName(cfg)));
    }
    // a refresher runs before Prepare; anything still expired here must not reach the server
    if (token->IsExpired(std::chrono::system_clock::now())) {
        throw CredentialError(CredentialErrorCode::Expired,
                              std::format("Server '{}' has an expired OAuth token; reconnect it", displayName(cfg)));
    }
    return *token;
}

// Name the key file content is bound to: first secret variable, else first variable, else API_KEY.
std::string keyFileVariable(const ServerConfig& cfg) {
    for (const auto& v : cfg.envVars) {
        if (v.secret) return v.name;
    }
    if (!cfg.envVars.empty()) return cfg.envVars.front().name;
    return "API_KEY";
}

bool isDeclaredSecret(const ServerConfig& cfg, const std::string& name) {
    for (const auto& v : cfg.envVars) {
        if (v.name == name) return v.secret;
    }
    return false;
}

// Non-secret values from settings.env; required declared variables must be present.
// With ApiKey auth a declared variable absent from settings may have been saved in the store instead.
std::map<std::string, std::string> plainEnvironment(const ServerConfig& cfg, const CredentialStore& store) {
    std::map<std::string, std::string> env;
    if (const JSONValue* settingsEnv = json::getObject(cfg.settings, "env")) {
        for (const auto& kv : std::get<JSONValue::Object>(settingsEnv->value)) {
            if (!kv.second || isDeclaredSecret(cfg, kv.first)) continue;
            auto s = json::scalarToString(*kv.second);
            if (s) env[kv.first] = *s;
        }
    }
    for (const auto& v : cfg.envVars) {
        if (v.secret) continue;
        auto it = env.find(v.name);
        if (cfg.authMethod == AuthMethod::ApiKey && (it == env.end() || trim(it->second).empty()) &&
            store.Exists(cfg.id, v.name)) {
            env[v.name] = store.Load(cfg.id, v.name);
            it = env.find(v.name);
        }
        if (!v.required) continue;
        if (it == env.end() || trim(it->second).empty()) {
            throw HostError(ErrorKind::ValidationError,
                            std::format("Missing required environment variable {} for server '{}'", v.name, displayName(cfg)));
        }
    }
    return env;
}

} // namespace

std::vector<std::string> SplitCommaList(const std::string& value) {
    std::vector<std::string> out;
    std::size_t start = 0;
    while (start <= value.size()) {
        std::size_t comma = value.find(',', start);
        if (comma == std::string::npos) comma = value.size();
        std::string seg = trim(value.substr(start, comma - start));
        if (!seg.empty()) out.push_back(std::move(seg));
        start = comma + 1;
    }
    return out;
}

void ValidateArguments(const ServerConfig& cfg) {
    for (const auto& arg : cfg.packageArgs) {
        if (!arg.required) continue;
        if (!hasExplicitValue(FindPackageArgValue(cfg, arg.name))) {
            throw HostError(ErrorKind::ValidationError,
                            std::format("Missing required package argument: {}", arg.name));
        }
    }
}

CommandSpec BuildCommand(const ServerConfig& cfg) {
    const auto& pkg = cfg.package;
    if (pkg.kind == PackageKind::Http) {
        throw HostError(ErrorKind::ValidationError,
                        std::format("Server '{}' is a network package and has no launch command", displayName(cfg)));
    }
    if (trim(pkg.identifier).empty()) {
        throw HostError(ErrorKind::ValidationError,
                        std::format("Server '{}' has an empty package identifier", displayName(cfg)));
    }
    auto hint = [&pkg](const char* fallback) {
        return (pkg.runtimeHint && !trim(*pkg.runtimeHint).empty()) ? trim(*pkg.runtimeHint) : std::string(fallback);
    };

    CommandSpec cmd;
    switch (pkg.kind) {
        case PackageKind::Npm:
            cmd.program = hint("npx");
            cmd.args = {"-y", pkg.identifier};
            break;
        case PackageKind::Pypi:
            cmd.program = hint("uvx");
            cmd.args = {pkg.identifier};
            break;
        case PackageKind::Docker:
            cmd.program = hint("docker");
            cmd.args = {"run", "-i", "--rm"};
            for (const auto& v : cfg.envVars) {
                cmd.args.push_back("-e");
                cmd.args.push_back(v.name);
            }
            cmd.args.push_back(pkg.identifier);
            break;
        case PackageKind::Binary:
            cmd.program = pkg.identifier;
            break;
        case PackageKind::Http:
            break;
    }

    for (const auto& arg : cfg.packageArgs) {
        const auto values = argumentValues(cfg, arg);
        if (arg.kind == PackageArgument::Kind::Named) {
            for (const auto& v : values) {
                cmd.args.push_back("--" + arg.name);
                cmd.args.push_back(v);
            }
        } else {
            cmd.args.insert(cmd.args.end(), values.begin(), values.end());
        }
    }
    return cmd;
}

std::map<std::string, std::string> BuildEnvironment(const ServerConfig& cfg, const CredentialStore& store) {
    std::map<std::string, std::string> env = plainEnvironment(cfg, store);

    switch (cfg.authMethod) {
        case AuthMethod::None:
            break;
        case AuthMethod::ApiKey:
            for (const auto& v : cfg.envVars) {
                if (!v.secret) continue;
                if (auto secret = loadOptionalSecret(store, cfg, v)) {
                    env[v.name] = *secret;
                }
            }
            break;
        case AuthMethod::KeyFile:
            env[keyFileVariable(cfg)] = CredentialStore::ReadKeyFile(cfg.keyFilePath.value_or(""));
            break;
        case AuthMethod::OAuth: {
            if (cfg.transport == TransportKind::Http) {
                break;  // carried in the Authorization header
            }
            const OAuthTokenRecord token = requireOAuthToken(store, cfg);
            bool bound = false;
            for (const auto& v : cfg.envVars) {
                if (!v.secret) continue;
                env[v.name] = token.accessToken;
                bound = true;
            }
            if (!bound) {
                env["OAUTH_ACCESS_TOKEN"] = token.accessToken;
            }
            break;
        }
    }
    LOG_DEBUG("Resolved {} environment variable(s) for server '{}'", env.size(), displayName(cfg));
    return env;
}

std::map<std::string, std::string> BuildHeaders(const ServerConfig& cfg, const CredentialStore& store) {
    std::map<std::string, std::string> headers;
    for (const auto& kv : plainEnvironment(cfg, store)) {
        headers["X-" + kv.first] = kv.second;
    }
    switch (cfg.authMethod) {
        case AuthMethod::None:
            break;
        case AuthMethod::ApiKey: {
            bool primary = true;
            for (const auto& v : cfg.envVars) {
                if (!v.secret) continue;
                auto secret = loadOptionalSecret(store, cfg, v);
                if (!secret) continue;
                if (primary) {
                    headers["Authorization"] = "Bearer " + *secret;
                    primary = false;
                } else {
                    headers["X-" + v.name] = *secret;
                }
            }
            break;
        }
        case AuthMethod::KeyFile:
            headers["Authorization"] = "Bearer " + CredentialStore::ReadKeyFile(cfg.keyFilePath.value_or(""));
            break;
        case AuthMethod::OAuth: {
            const OAuthTokenRecord token = requireOAuthToken(store, cfg);
            headers["Authorization"] = "Bearer " + token.accessToken;
            break;
        }
    }
    return headers;
}

LaunchSpec Prepare(const ServerConfig& cfg, const CredentialStore& store) {
    ValidateConfigInvariants(cfg);
    ValidateArguments(cfg);

    LaunchSpec spec;
    if (cfg.transport == TransportKind::Http) {
        spec.url = cfg.url;
        spec.headers = BuildHeaders(cfg, store);
        return spec;
    }
    spec.command = BuildCommand(cfg);
    spec.environment = BuildEnvironment(cfg, store);
    return spec;
}

} // namespace mcphost
