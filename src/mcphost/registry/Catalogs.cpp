//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Catalogs.cpp
// Purpose: Official registry and Smithery catalog clients and their response parsers
//==========================================================================================================

#include <format>
#include <unordered_set>

#include "env/EnvVars.h"
#include "logging/Logger.h"
#include "mcphost/credentials/CredentialStore.h"
#include "mcphost/errors/Errors.h"
#include "mcphost/registry/Catalogs.h"
#include "mcphost/registry/RegistrySearch.h"

namespace mcphost::registry {

namespace {

constexpr const char* kOfficialMetaKey = "io.modelcontextprotocol.registry/official";

std::string trim(const std::string& s) {
    const auto b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return std::string();
    const auto e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

std::optional<PackageKind> packageKindFromRegistryType(const std::string& t) {
    if (t == "npm") return PackageKind::Npm;
    if (t == "pypi") return PackageKind::Pypi;
    if (t == "oci" || t == "docker") return PackageKind::Docker;
    return std::nullopt;
}

std::optional<TransportKind> transportFromType(const std::string& t) {
    if (t == "stdio") return TransportKind::Stdio;
    if (t == "http" || t == "streamable-http") return TransportKind::Http;
    return std::nullopt;
}

std::vector<EnvVarRequirement> parseEnvVars(const JSONValue& pkg) {
    std::vector<EnvVarRequirement> out;
    const JSONValue::Array* arr = json::getArray(pkg, "environmentVariables");
    if (!arr) return out;
    for (const auto& item : *arr) {
        if (!item || !item->isObject()) continue;
        auto name = json::getString(*item, "name");
        if (!name || name->empty()) continue;
        EnvVarRequirement v;
        v.name = *name;
        v.required = json::getBool(*item, "isRequired").value_or(false);
        v.secret = json::getBool(*item, "isSecret").value_or(false);
        v.description = json::getString(*item, "description");
        out.push_back(std::move(v));
    }
    return out;
}

std::vector<PackageArgument> parsePackageArgs(const JSONValue& pkg) {
    std::vector<PackageArgument> out;
    const JSONValue::Array* arr = json::getArray(pkg, "packageArguments");
    if (!arr) arr = json::getArray(pkg, "package_arguments");
    if (!arr) return out;
    for (const auto& item : *arr) {
        if (!item || !item->isObject()) continue;
        auto name = json::getString(*item, "name");
        if (!name || name->empty()) continue;
        PackageArgument a;
        a.kind = json::getString(*item, "type").value_or("positional") == "named" ? PackageArgument::Kind::Named
                                                                                  : PackageArgument::Kind::Positional;
        a.name = *name;
        a.description = json::getString(*item, "description");
        a.required = json::getBool(*item, "isRequired").value_or(false);
        if (const JSONValue* d = json::member(*item, "default")) {
            a.defaultValue = json::scalarToString(*d);
        }
        out.push_back(std::move(a));
    }
    return out;
}

std::string lastSegment(const std::string& name) {
    const auto slash = name.rfind('/');
    return slash == std::string::npos ? name : name.substr(slash + 1);
}

JSONValue fetchJson(auth::IHttpClient& http, const std::string& catalog, const std::string& url,
                    std::vector<auth::HeaderKV> headers) {
    auth::HttpRequest req;
    req.method = "GET";
    req.url = url;
    req.headers = std::move(headers);
    req.headers.emplace_back("Accept", "application/json");

    auth::HttpResponse resp;
    try {
        resp = http.Send(req);
    } catch (const std::exception& e) {
        throw HostError(ErrorKind::RegistryUnavailable, std::format("{} catalog unreachable: {}", catalog, e.what()));
    }
    if (!resp.Ok()) {
        throw HostError(ErrorKind::RegistryUnavailable, std::format("{} catalog returned HTTP {}", catalog, resp.status));
    }
    try {
        return parseJSONValue(resp.body);
    } catch (const std::exception& e) {
        throw HostError(ErrorKind::RegistryUnavailable, std::format("{} catalog sent an unreadable body: {}", catalog, e.what()));
    }
}

} // namespace

std::vector<SearchResult> ParseOfficialRegistryResponse(const JSONValue& body) {
    const JSONValue::Array* servers = json::getArray(body, "servers");
    if (!servers) {
        throw HostError(ErrorKind::RegistryUnavailable, "official catalog response has no servers array");
    }
    std::vector<SearchResult> out;
    std::unordered_set<std::string> seen;
    for (const auto& wrapper : *servers) {
        if (!wrapper || !wrapper->isObject()) continue;
        const JSONValue* server = json::getObject(*wrapper, "server");
        if (!server) server = wrapper.get();
        auto name = json::getString(*server, "name");
        if (!name || name->empty()) continue;

        const JSONValue* official = nullptr;
        if (const JSONValue* meta = json::getObject(*wrapper, "_meta")) {
            official = json::getObject(*meta, kOfficialMetaKey);
        }
        if (official && json::getBool(*official, "isLatest") == std::optional<bool>(false)) continue;
        if (!seen.insert(*name).second) continue;

        SearchResult r;
        r.name = *name;
        r.label = json::getString(*server, "title").value_or(lastSegment(*name));
        r.description = json::getString(*server, "description").value_or("");
        r.origin = CatalogOrigin::Official;
        r.originTag = "official";
        r.version = json::getString(*server, "version").value_or("");
        r.verified = official && json::getString(*official, "status").value_or("") == "active";
        if (const JSONValue* repo = json::getObject(*server, "repository")) {
            r.repositoryUrl = json::getString(*repo, "url");
        }

        if (const JSONValue::Array* packages = json::getArray(*server, "packages")) {
            for (const auto& pkg : *packages) {
                if (!pkg || !pkg->isObject()) continue;
                auto kind = packageKindFromRegistryType(json::getString(*pkg, "registryType").value_or(""));
                std::string transportType = "stdio";
                if (const JSONValue* t = json::getObject(*pkg, "transport")) {
                    transportType = json::getString(*t, "type").value_or("stdio");
                    if (auto url = json::getString(*t, "url")) r.remoteUrl = *url;
                }
                auto transport = transportFromType(transportType);
                auto identifier = json::getString(*pkg, "identifier");
                if (!kind || !transport || !identifier) {
                    LOG_DEBUG("Catalog entry {}: skipping unsupported package", *name);
                    continue;
                }
                CatalogPackage p;
                p.kind = *kind;
                p.identifier = *identifier;
                p.transport = *transport;
                p.version = json::getString(*pkg, "version");
                r.package = std::move(p);
                r.envVars = parseEnvVars(*pkg);
                r.packageArgs = parsePackageArgs(*pkg);
                break;
            }
        }
        if (const JSONValue::Array* remotes = json::getArray(*server, "remotes")) {
            for (const auto& remote : *remotes) {
                if (!remote || !remote->isObject()) continue;
                if (!transportFromType(json::getString(*remote, "type").value_or(""))) continue;
                if (auto url = json::getString(*remote, "url"); url && !r.remoteUrl) {
                    r.remoteUrl = *url;
                    break;
                }
            }
        }
        r.authMethod = DetectAuthMethod(r.envVars);
        out.push_back(std::move(r));
    }
    return out;
}

std::vector<SearchResult> ParseSmitheryResponse(const JSONValue& body) {
    const JSONValue::Array* servers = json::getArray(body, "servers");
    if (!servers) {
        throw HostError(ErrorKind::RegistryUnavailable, "smithery catalog response has no servers array");
    }
    std::vector<SearchResult> out;
    for (const auto& s : *servers) {
        if (!s || !s->isObject()) continue;
        auto qualified = json::getString(*s, "qualifiedName");
        if (!qualified || qualified->empty()) continue;
        SearchResult r;
        r.name = *qualified;
        r.qualifiedName = *qualified;
        r.label = json::getString(*s, "displayName").value_or(*qualified);
        r.description = json::getString(*s, "description").value_or("");
        r.origin = CatalogOrigin::Community;
        r.originTag = "smithery";
        r.version = "latest";
        r.verified = json::getBool(*s, "verified").value_or(false);
        r.popularity = json::getInt(*s, "useCount").value_or(0);
        r.repositoryUrl = json::getString(*s, "homepage");
        if (json::getBool(*s, "remote").value_or(false)) {
            // hosted community servers authorize through the catalog's OAuth
            r.remoteUrl = std::string(kSmitheryServerUrl) + *qualified;
            r.authMethod = AuthMethod::OAuth;
        }
        out.push_back(std::move(r));
    }
    return out;
}

std::string ResolveCatalogKey(const std::string& keyOrPath) {
    const std::string trimmed = trim(keyOrPath);
    std::string key = trimmed;
    const bool isPath = trimmed.starts_with("/") || trimmed.starts_with("~/") || trimmed.starts_with("./");
    if (isPath) {
        std::string path = trimmed;
        if (trimmed.starts_with("~/")) {
            const std::string home = GetEnvOrDefault("HOME", "");
            if (home.empty()) {
                throw CredentialError(CredentialErrorCode::NotFound, "Cannot expand ~ in catalog key path: HOME is not set");
            }
            path = home + trimmed.substr(1);
        }
        key = CredentialStore::ReadKeyFile(path);
    }
    if (key.empty()) {
        throw CredentialError(CredentialErrorCode::NotFound, "Catalog API key is empty");
    }
    return key;
}

OfficialRegistryCatalog::OfficialRegistryCatalog(std::shared_ptr<auth::IHttpClient> client, std::string url)
    : http(std::move(client)), baseUrl(std::move(url)) {}

std::vector<SearchResult> OfficialRegistryCatalog::Search(const std::string& query) {
    FUNC_SCOPE();
    std::string url = baseUrl + "?";
    if (!query.empty()) {
        url += "search=" + auth::UrlEncode(query) + "&";
    }
    url += "limit=100";
    auto results = ParseOfficialRegistryResponse(fetchJson(*http, Name(), url, {}));
    LOG_DEBUG("official catalog: {} results for '{}'", results.size(), query);
    return results;
}

SmitheryCatalog::SmitheryCatalog(std::shared_ptr<auth::IHttpClient> client, std::string key, std::string url)
    : http(std::move(client)), keyOrPath(std::move(key)), baseUrl(std::move(url)) {}

std::vector<SearchResult> SmitheryCatalog::Search(const std::string& query) {
    FUNC_SCOPE();
    std::string key;
    try {
        key = ResolveCatalogKey(keyOrPath);
    } catch (const CredentialError& e) {
        throw HostError(ErrorKind::RegistryUnavailable, std::format("smithery catalog key unavailable: {}", e.what()));
    }
    const std::string url = baseUrl + "?q=" + auth::UrlEncode(query);
    auto results = ParseSmitheryResponse(fetchJson(*http, Name(), url, {{"Authorization", "Bearer " + key}}));
    LOG_DEBUG("smithery catalog: {} results for '{}' (key {})", results.size(), query, Logger::redact(key));
    return results;
}

} // namespace mcphost::registry
