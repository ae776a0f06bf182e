//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Catalog.h
// Purpose: Catalog search results and the interface every tool server catalog implements
//==========================================================================================================

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "mcphost/config/ServerConfig.h"

namespace mcphost::registry {

enum class CatalogOrigin { Official, Community };

inline const char* ToString(CatalogOrigin origin) {
    return origin == CatalogOrigin::Official ? "official" : "community";
}

// Installable package advertised by a catalog entry.
struct CatalogPackage {
    PackageKind kind{PackageKind::Npm};
    std::string identifier;
    TransportKind transport{TransportKind::Stdio};
    std::optional<std::string> version;
};

//==========================================================================================================
// SearchResult
// Purpose: One catalog entry with everything ToServerConfig() needs.
// Fields:
//   name: Catalog name ("io.github.owner/server", or the community qualified name).
//   label: Human readable title.
//   originTag: Catalog that produced the entry ("official", "smithery", ...).
//   popularity: Use count where the catalog reports one, else 0.
//   remoteUrl: Hosted endpoint for entries without an installable package.
//==========================================================================================================
struct SearchResult {
    std::string name;
    std::string label;
    std::string description;
    CatalogOrigin origin{CatalogOrigin::Official};
    std::string originTag;
    std::string version;
    bool verified{false};
    std::int64_t popularity{0};
    std::optional<CatalogPackage> package;
    std::vector<EnvVarRequirement> envVars;
    std::vector<PackageArgument> packageArgs;
    std::optional<std::string> remoteUrl;
    AuthMethod authMethod{AuthMethod::None};
    std::optional<std::string> qualifiedName;
    std::optional<std::string> repositoryUrl;
};

class ICatalog {
public:
    virtual ~ICatalog() = default;

    virtual CatalogOrigin Origin() const = 0;
    virtual std::string Name() const = 0;

    //==========================================================================================================
    // Search
    // Purpose: Queries the catalog. An empty query lists the catalog's first page.
    // Notes:
    //   Throws HostError{RegistryUnavailable} on network failures, non-2xx replies and unparsable bodies.
    //==========================================================================================================
    virtual std::vector<SearchResult> Search(const std::string& query) = 0;
};

} // namespace mcphost::registry
