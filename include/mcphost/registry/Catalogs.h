//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Catalogs.h
// Purpose: HTTP catalogs: the official MCP registry and the Smithery community catalog
//==========================================================================================================

#pragma once

#include <memory>
#include <string>
#include <vector>

#include "mcphost/auth/HttpClient.hpp"
#include "mcphost/registry/Catalog.h"

namespace mcphost::registry {

inline constexpr const char* kOfficialRegistryUrl = "https://registry.modelcontextprotocol.io/v0.1/servers";
inline constexpr const char* kSmitheryRegistryUrl = "https://registry.smithery.ai/servers";
inline constexpr const char* kSmitheryServerUrl = "https://server.smithery.ai/";

//==========================================================================================================
// OfficialRegistryCatalog
// Purpose: GET <base>?search=<q>&limit=100. Duplicate names (older versions) are collapsed to the first.
//==========================================================================================================
class OfficialRegistryCatalog : public ICatalog {
public:
    explicit OfficialRegistryCatalog(std::shared_ptr<auth::IHttpClient> http,
                                     std::string baseUrl = kOfficialRegistryUrl);

    CatalogOrigin Origin() const override { return CatalogOrigin::Official; }
    std::string Name() const override { return "official"; }
    std::vector<SearchResult> Search(const std::string& query) override;

private:
    std::shared_ptr<auth::IHttpClient> http;
    std::string baseUrl;
};

//==========================================================================================================
// SmitheryCatalog
// Purpose: GET <base>?q=<q> with "Authorization: Bearer <key>".
// Args:
//   keyOrPath: The API key itself, or a path to a file holding it ("/", "~/" or "./" prefix).
//==========================================================================================================
class SmitheryCatalog : public ICatalog {
public:
    SmitheryCatalog(std::shared_ptr<auth::IHttpClient> http, std::string keyOrPath,
                    std::string baseUrl = kSmitheryRegistryUrl);

    CatalogOrigin Origin() const override { return CatalogOrigin::Community; }
    std::string Name() const override { return "smithery"; }
    std::vector<SearchResult> Search(const std::string& query) override;

private:
    std::shared_ptr<auth::IHttpClient> http;
    std::string keyOrPath;
    std::string baseUrl;
};

// Parses an official registry listing ({"servers":[{"server":{...},"_meta":{...}}]}).
std::vector<SearchResult> ParseOfficialRegistryResponse(const JSONValue& body);

// Parses a Smithery listing ({"servers":[{qualifiedName, displayName, ...}], "pagination":{...}}).
std::vector<SearchResult> ParseSmitheryResponse(const JSONValue& body);

//==========================================================================================================
// ResolveCatalogKey
// Purpose: Returns the key itself, or the trimmed content of the key file when keyOrPath looks like a
//          path. "~/" expands to $HOME.
// Notes:
//   Throws CredentialError when the file cannot be read or the key is empty.
//==========================================================================================================
std::string ResolveCatalogKey(const std::string& keyOrPath);

} // namespace mcphost::registry
