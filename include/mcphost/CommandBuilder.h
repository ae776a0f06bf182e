//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: CommandBuilder.h
// Purpose: Turns a ServerConfig into an argv vector, an environment overlay and request headers
//==========================================================================================================

#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "mcphost/config/ServerConfig.h"

namespace mcphost {

class CredentialStore;

// Program plus discrete argument tokens. Never joined into a shell string.
struct CommandSpec {
    std::string program;
    std::vector<std::string> args;
};

// Everything needed to launch or connect to one tool server.
struct LaunchSpec {
    std::optional<CommandSpec> command;             // standard-stream servers
    std::map<std::string, std::string> environment; // overlay on the parent environment
    std::map<std::string, std::string> headers;     // network servers
    std::optional<std::string> url;                 // network servers
};

//==========================================================================================================
// ValidateArguments
// Purpose: Ensures every required package argument has an explicit, non-blank value in
//          settings.package_args. A declared default does not count as a supplied value.
// Throws:
//   HostError{ValidationError} naming the first offending argument.
//==========================================================================================================
void ValidateArguments(const ServerConfig& cfg);

//==========================================================================================================
// BuildCommand
// Purpose: Builds the launcher command for a standard-stream server.
// Notes:
//   Npm    -> <hint|npx> -y <identifier> ...
//   Pypi   -> <hint|uvx> <identifier> ...
//   Docker -> <hint|docker> run -i --rm [-e NAME]... <identifier> ...
//   Binary -> <identifier> ...
//   Named arguments become "--name value"; comma separated values expand into repeated pairs with empty
//   segments dropped. Positional arguments are appended verbatim.
// Throws:
//   HostError{ValidationError} for Http packages, empty identifiers or object-valued arguments.
//==========================================================================================================
CommandSpec BuildCommand(const ServerConfig& cfg);

//==========================================================================================================
// BuildEnvironment
// Purpose: Resolves the environment overlay for a standard-stream server from settings.env and the
//          credential store according to the auth method.
// Throws:
//   CredentialError when a required secret, key file or OAuth token cannot be read.
//   HostError{ValidationError} when a required non-secret variable has no value.
//==========================================================================================================
std::map<std::string, std::string> BuildEnvironment(const ServerConfig& cfg, const CredentialStore& store);

// Request headers for a network server: Authorization: Bearer for the primary credential, X-<NAME> for
// other variables.
std::map<std::string, std::string> BuildHeaders(const ServerConfig& cfg, const CredentialStore& store);

// Invariants, argument validation, then command/environment or url/headers depending on the transport.
LaunchSpec Prepare(const ServerConfig& cfg, const CredentialStore& store);

// Splits on ',', trims each segment and drops empty ones.
std::vector<std::string> SplitCommaList(const std::string& value);

} // namespace mcphost
