//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ConfigCodec.h
// Purpose: JSON encoding of server configurations and the on-disk configuration document
//==========================================================================================================

#pragma once

#include <string>
#include <vector>

#include "mcphost/JSONRPCTypes.h"
#include "mcphost/config/ServerConfig.h"

namespace mcphost {

// Current version written into {"version":N,"servers":[...]}
constexpr int64_t CONFIG_DOCUMENT_VERSION = 1;

JSONValue EncodeServerConfig(const ServerConfig& cfg);

//==========================================================================================================
// DecodeServerConfig
// Purpose: Builds a ServerConfig from its JSON form and validates its invariants.
// Throws:
//   HostError{ConfigError} on missing fields, unknown enum strings or invariant violations.
//==========================================================================================================
ServerConfig DecodeServerConfig(const JSONValue& value);

std::string EncodeConfigDocument(const std::vector<ServerConfig>& configs);
std::vector<ServerConfig> DecodeConfigDocument(const std::string& text);

//==========================================================================================================
// LoadServerConfigs / SaveServerConfigs
// Purpose: Read and write the configuration document file. A missing file loads as an empty list.
//          Saving writes a sibling temp file and renames it over the target.
// Throws:
//   HostError{ConfigError} on malformed content or I/O failure.
//==========================================================================================================
std::vector<ServerConfig> LoadServerConfigs(const std::string& path);
void SaveServerConfigs(const std::string& path, const std::vector<ServerConfig>& configs);

} // namespace mcphost
