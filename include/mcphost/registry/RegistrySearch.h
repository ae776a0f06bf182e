//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: RegistrySearch.h
// Purpose: Parallel search across catalogs, merging, and conversion of results to configurations
//==========================================================================================================

#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include "mcphost/config/ServerConfig.h"
#include "mcphost/registry/Catalog.h"

namespace mcphost::registry {

struct RegistrySearchOptions {
    std::chrono::milliseconds perCatalogTimeout{std::chrono::seconds(10)};
    // Entry kept when two catalogs list the same server.
    CatalogOrigin authoritative{CatalogOrigin::Official};
};

struct CatalogFailure {
    std::string catalog;
    std::string message;
    bool timedOut{false};
};

// Merged results; partial is set when at least one catalog failed or timed out.
struct SearchOutcome {
    std::vector<SearchResult> results;
    bool partial{false};
    std::vector<CatalogFailure> failures;
};

class RegistrySearch {
public:
    explicit RegistrySearch(std::vector<std::shared_ptr<ICatalog>> catalogs,
                            RegistrySearchOptions options = RegistrySearchOptions{});

    //==========================================================================================================
    // Search
    // Purpose: Queries every catalog in parallel, each bounded by perCatalogTimeout, then merges and sorts.
    // Notes:
    //   Never throws for catalog failures; they are reported in SearchOutcome::failures.
    //==========================================================================================================
    SearchOutcome Search(const std::string& query) const;

private:
    std::vector<std::shared_ptr<ICatalog>> catalogs;
    RegistrySearchOptions opts;
};

// Last '/' segment, lower-cased, non-alphanumerics dropped.
std::string NormalizeName(const std::string& name);

//==========================================================================================================
// MergeResults
// Purpose: Drops duplicates by NormalizeName (the authoritative origin wins, otherwise the first seen) and
//          sorts verified first, then popularity descending, then label.
//==========================================================================================================
std::vector<SearchResult> MergeResults(const std::vector<std::vector<SearchResult>>& perCatalog,
                                       CatalogOrigin authoritative = CatalogOrigin::Official);

// CLIENT_ID plus secret CLIENT_SECRET -> OAuth; a secret TOKEN/API_KEY/_KEY/_PAT -> ApiKey; else None.
AuthMethod DetectAuthMethod(const std::vector<EnvVarRequirement>& envVars);

//==========================================================================================================
// ToServerConfig
// Purpose: Builds a new configuration (fresh UUID) from a search result. Packages win over remotes.
// Notes:
//   OAuth results get an empty oauth block that the user completes before first start.
//   Throws HostError{ConfigError} when the entry has neither a package nor a remote url.
//==========================================================================================================
ServerConfig ToServerConfig(const SearchResult& result);

// Random (version 4) UUID text.
std::string NewInstanceId();

} // namespace mcphost::registry
