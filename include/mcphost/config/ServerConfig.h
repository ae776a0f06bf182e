//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ServerConfig.h
// Purpose: Tool server configuration model (origin, package, transport, auth, env vars, arguments)
//==========================================================================================================

#pragma once

#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "mcphost/JSONRPCTypes.h"

namespace mcphost {

///////////////////////////////////////// Origin ///////////////////////////////////////////
// Entry taken from the official registry
struct OfficialSource {
    std::string name;
    std::string version;
};

// Entry taken from a community catalog (Smithery)
struct CommunitySource {
    std::string qualifiedName;
};

// Entry typed in by the user
struct ManualSource {
    std::string url;
};

using ConfigSource = std::variant<OfficialSource, CommunitySource, ManualSource>;

///////////////////////////////////////// Package ///////////////////////////////////////////
enum class PackageKind { Npm, Pypi, Docker, Binary, Http };
enum class TransportKind { Stdio, Http };
enum class AuthMethod { None, ApiKey, KeyFile, OAuth };

struct PackageDescriptor {
    PackageKind kind{PackageKind::Npm};
    std::string identifier;
    std::optional<std::string> runtimeHint;  // launcher override, e.g. "bunx" instead of "npx"
};

struct EnvVarRequirement {
    std::string name;
    bool required{false};
    bool secret{false};
    std::optional<std::string> description;
};

struct PackageArgument {
    enum class Kind { Named, Positional };
    Kind kind{Kind::Named};
    std::string name;
    std::optional<std::string> description;
    bool required{false};
    std::optional<std::string> defaultValue;
};

struct OAuthSettings {
    std::string clientId;
    std::string authorizationUrl;
    std::string tokenUrl;
    std::string redirectUri;
    std::vector<std::string> scopes;
};

//==========================================================================================================
// ServerConfig
// Purpose: One configured tool server. The id is a UUID string fixed at creation.
// Notes:
//   settings is an open JSON object; "package_args" maps argument names to values and "env" maps
//   non-secret environment variable names to values.
//==========================================================================================================
struct ServerConfig {
    std::string id;
    std::string name;
    bool enabled{true};
    ConfigSource source{ManualSource{}};
    PackageDescriptor package;
    TransportKind transport{TransportKind::Stdio};
    AuthMethod authMethod{AuthMethod::None};
    std::vector<EnvVarRequirement> envVars;
    std::vector<PackageArgument> packageArgs;
    std::optional<std::string> keyFilePath;
    std::optional<OAuthSettings> oauth;
    std::optional<std::string> url;  // endpoint for network transports
    JSONValue settings{JSONValue::Object{}};
};

//==========================================================================================================
// ValidateConfigInvariants
// Purpose: Checks the structural invariants of a configuration.
// Throws:
//   HostError{ConfigError} when the id is empty, a key-file path is present without KeyFile auth (or
//   missing with it), an oauth block is present without OAuth auth (or missing with it), or a network
//   transport has no url.
//==========================================================================================================
void ValidateConfigInvariants(const ServerConfig& cfg);

// Looks up settings.package_args.<name>; nullptr when absent.
const JSONValue* FindPackageArgValue(const ServerConfig& cfg, const std::string& name);

// Looks up settings.env.<name> as text; nullopt when absent or not a scalar.
std::optional<std::string> FindSettingsEnvValue(const ServerConfig& cfg, const std::string& name);

// Sets settings.package_args.<name>.
void SetPackageArgValue(ServerConfig& cfg, const std::string& name, JSONValue value);

// Sets settings.env.<name>.
void SetSettingsEnvValue(ServerConfig& cfg, const std::string& name, const std::string& value);

const char* ToString(PackageKind kind);
const char* ToString(TransportKind kind);
const char* ToString(AuthMethod method);

std::optional<PackageKind> PackageKindFromString(const std::string& s);
std::optional<TransportKind> TransportKindFromString(const std::string& s);
std::optional<AuthMethod> AuthMethodFromString(const std::string& s);

} // namespace mcphost
