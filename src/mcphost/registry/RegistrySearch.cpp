//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: RegistrySearch.cpp
// Purpose: Parallel catalog search, result merging and configuration conversion
//==========================================================================================================

#include <algorithm>
#include <cctype>
#include <format>
#include <future>
#include <thread>
#include <unordered_map>

#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>

#include "logging/Logger.h"
#include "mcphost/errors/Errors.h"
#include "mcphost/registry/RegistrySearch.h"

namespace mcphost::registry {

namespace {

bool contains(const std::string& haystack, const char* needle) {
    return haystack.find(needle) != std::string::npos;
}

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

} // namespace

std::string NewInstanceId() {
    static thread_local boost::uuids::random_generator gen;
    return boost::uuids::to_string(gen());
}

std::string NormalizeName(const std::string& name) {
    const auto slash = name.rfind('/');
    const std::string tail = slash == std::string::npos ? name : name.substr(slash + 1);
    std::string out;
    out.reserve(tail.size());
    for (unsigned char c : tail) {
        if (std::isalnum(c)) out.push_back(static_cast<char>(std::tolower(c)));
    }
    return out;
}

AuthMethod DetectAuthMethod(const std::vector<EnvVarRequirement>& envVars) {
    const bool clientId = std::any_of(envVars.begin(), envVars.end(),
                                      [](const EnvVarRequirement& v) { return contains(v.name, "CLIENT_ID"); });
    const bool clientSecret = std::any_of(envVars.begin(), envVars.end(), [](const EnvVarRequirement& v) {
        return v.secret && contains(v.name, "CLIENT_SECRET");
    });
    if (clientId && clientSecret) return AuthMethod::OAuth;

    const bool secretToken = std::any_of(envVars.begin(), envVars.end(), [](const EnvVarRequirement& v) {
        return v.secret && (contains(v.name, "TOKEN") || contains(v.name, "API_KEY") || contains(v.name, "_KEY") ||
                            contains(v.name, "_PAT"));
    });
    return secretToken ? AuthMethod::ApiKey : AuthMethod::None;
}

std::vector<SearchResult> MergeResults(const std::vector<std::vector<SearchResult>>& perCatalog,
                                       CatalogOrigin authoritative) {
    std::vector<SearchResult> merged;
    std::unordered_map<std::string, std::size_t> indexByKey;
    for (const auto& batch : perCatalog) {
        for (const auto& r : batch) {
            std::string key = NormalizeName(r.name);
            if (key.empty()) key = lower(r.name);
            auto it = indexByKey.find(key);
            if (it == indexByKey.end()) {
                indexByKey.emplace(key, merged.size());
                merged.push_back(r);
                continue;
            }
            SearchResult& kept = merged[it->second];
            if (kept.origin != authoritative && r.origin == authoritative) {
                kept = r;
            }
        }
    }
    std::stable_sort(merged.begin(), merged.end(), [](const SearchResult& a, const SearchResult& b) {
        if (a.verified != b.verified) return a.verified;
        if (a.popularity != b.popularity) return a.popularity > b.popularity;
        return lower(a.label) < lower(b.label);
    });
    return merged;
}

RegistrySearch::RegistrySearch(std::vector<std::shared_ptr<ICatalog>> list, RegistrySearchOptions options)
    : catalogs(std::move(list)), opts(options) {}

SearchOutcome RegistrySearch::Search(const std::string& query) const {
    FUNC_SCOPE();
    using Batch = std::vector<SearchResult>;
    struct Pending {
        std::string name;
        std::future<Batch> future;
    };
    std::vector<Pending> pending;
    pending.reserve(catalogs.size());
    for (const auto& catalog : catalogs) {
        if (!catalog) continue;
        auto promise = std::make_shared<std::promise<Batch>>();
        Pending p{catalog->Name(), promise->get_future()};
        // Detached so a catalog stuck past its deadline never holds up the caller.
        std::thread([promise, catalog, query]() {
            try {
                promise->set_value(catalog->Search(query));
            } catch (...) {
                promise->set_exception(std::current_exception());
            }
        }).detach();
        pending.push_back(std::move(p));
    }

    const auto deadline = std::chrono::steady_clock::now() + opts.perCatalogTimeout;
    SearchOutcome outcome;
    std::vector<Batch> batches;
    for (auto& p : pending) {
        if (p.future.wait_until(deadline) != std::future_status::ready) {
            LOG_WARN("Catalog '{}' did not answer within {}ms", p.name, opts.perCatalogTimeout.count());
            outcome.failures.push_back(CatalogFailure{p.name, "timed out", true});
            continue;
        }
        try {
            batches.push_back(p.future.get());
        } catch (const std::exception& e) {
            LOG_WARN("Catalog '{}' failed: {}", p.name, e.what());
            outcome.failures.push_back(CatalogFailure{p.name, e.what(), false});
        }
    }
    outcome.partial = !outcome.failures.empty();
    outcome.results = MergeResults(batches, opts.authoritative);
    LOG_INFO("Registry search '{}': {} results{}", query, outcome.results.size(), outcome.partial ? " (partial)" : "");
    return outcome;
}

ServerConfig ToServerConfig(const SearchResult& result) {
    ServerConfig cfg;
    cfg.id = NewInstanceId();
    cfg.name = result.label.empty() ? result.name : result.label;
    cfg.enabled = true;

    if (result.package) {
        const CatalogPackage& pkg = *result.package;
        if (result.origin == CatalogOrigin::Community) {
            cfg.source = CommunitySource{result.qualifiedName.value_or(result.name)};
        } else {
            cfg.source = OfficialSource{result.name, result.version};
        }
        cfg.package.kind = pkg.kind;
        cfg.package.identifier = pkg.identifier;
        switch (pkg.kind) {
            case PackageKind::Npm: cfg.package.runtimeHint = "npx"; break;
            case PackageKind::Pypi: cfg.package.runtimeHint = "uvx"; break;
            case PackageKind::Docker: cfg.package.runtimeHint = "docker"; break;
            case PackageKind::Binary:
            case PackageKind::Http: break;
        }
        cfg.transport = pkg.transport;
        cfg.envVars = result.envVars;
        cfg.packageArgs = result.packageArgs;
        cfg.authMethod = DetectAuthMethod(result.envVars);
        if (cfg.transport == TransportKind::Http) {
            if (!result.remoteUrl) {
                throw HostError(ErrorKind::ConfigError,
                                std::format("Catalog entry '{}' has a network package but no url", result.name));
            }
            cfg.url = result.remoteUrl;
        }
    } else if (result.remoteUrl) {
        if (result.origin == CatalogOrigin::Community) {
            cfg.source = CommunitySource{result.qualifiedName.value_or(result.name)};
        } else {
            cfg.source = ManualSource{*result.remoteUrl};
        }
        cfg.package.kind = PackageKind::Http;
        cfg.package.identifier = *result.remoteUrl;
        cfg.transport = TransportKind::Http;
        cfg.url = result.remoteUrl;
        cfg.authMethod = result.authMethod;
    } else {
        throw HostError(ErrorKind::ConfigError,
                        std::format("Catalog entry '{}' has neither an installable package nor a remote url", result.name));
    }

    if (cfg.authMethod == AuthMethod::OAuth) {
        cfg.oauth = OAuthSettings{};
    }
    ValidateConfigInvariants(cfg);
    return cfg;
}

} // namespace mcphost::registry
