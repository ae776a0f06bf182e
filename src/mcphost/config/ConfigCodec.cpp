//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ConfigCodec.cpp
// Purpose: JSON encoding of server configurations and the on-disk configuration document
//==========================================================================================================

#include "mcphost/config/ConfigCodec.h"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>

#include "logging/Logger.h"
#include "mcphost/errors/Errors.h"

namespace mcphost {

namespace {

[[noreturn]] void configError(const std::string& msg) {
    throw HostError(ErrorKind::ConfigError, msg);
}

std::string requireString(const JSONValue& obj, const std::string& key, const std::string& where) {
    auto v = json::getString(obj, key);
    if (!v) configError(std::format("{}: missing string field '{}'", where, key));
    return *v;
}

std::optional<std::string> optString(const JSONValue& obj, const std::string& key) {
    return json::getString(obj, key);
}

JSONValue encodeSource(const ConfigSource& source) {
    JSONValue::Object o;
    std::visit([&o](const auto& s) {
        using T = std::decay_t<decltype(s)>;
        if constexpr (std::is_same_v<T, OfficialSource>) {
            json::set(o, "type", "official");
            json::set(o, "name", s.name);
            json::set(o, "version", s.version);
        } else if constexpr (std::is_same_v<T, CommunitySource>) {
            json::set(o, "type", "community");
            json::set(o, "qualified_name", s.qualifiedName);
        } else {
            json::set(o, "type", "manual");
            json::set(o, "url", s.url);
        }
    }, source);
    return JSONValue(std::move(o));
}

ConfigSource decodeSource(const JSONValue& v, const std::string& where) {
    const std::string type = requireString(v, "type", where + ".source");
    if (type == "official") {
        return OfficialSource{requireString(v, "name", where + ".source"), optString(v, "version").value_or("")};
    }
    if (type == "community") {
        return CommunitySource{requireString(v, "qualified_name", where + ".source")};
    }
    if (type == "manual") {
        return ManualSource{optString(v, "url").value_or("")};
    }
    configError(std::format("{}.source: unknown type '{}'", where, type));
}

} // namespace

JSONValue EncodeServerConfig(const ServerConfig& cfg) {
    JSONValue::Object o;
    json::set(o, "id", cfg.id);
    json::set(o, "name", cfg.name);
    json::set(o, "enabled", cfg.enabled);
    json::set(o, "source", encodeSource(cfg.source));

    JSONValue::Object pkg;
    json::set(pkg, "type", ToString(cfg.package.kind));
    json::set(pkg, "identifier", cfg.package.identifier);
    if (cfg.package.runtimeHint) json::set(pkg, "runtime_hint", *cfg.package.runtimeHint);
    json::set(o, "package", JSONValue(std::move(pkg)));

    json::set(o, "transport", ToString(cfg.transport));
    json::set(o, "auth_type", ToString(cfg.authMethod));

    JSONValue::Array envs;
    for (const auto& e : cfg.envVars) {
        JSONValue::Object eo;
        json::set(eo, "name", e.name);
        json::set(eo, "required", e.required);
        json::set(eo, "secret", e.secret);
        if (e.description) json::set(eo, "description", *e.description);
        envs.push_back(std::make_shared<JSONValue>(std::move(eo)));
    }
    json::set(o, "env_vars", JSONValue(std::move(envs)));

    JSONValue::Array args;
    for (const auto& a : cfg.packageArgs) {
        JSONValue::Object ao;
        json::set(ao, "type", a.kind == PackageArgument::Kind::Named ? "named" : "positional");
        json::set(ao, "name", a.name);
        json::set(ao, "required", a.required);
        if (a.description) json::set(ao, "description", *a.description);
        if (a.defaultValue) json::set(ao, "default", *a.defaultValue);
        args.push_back(std::make_shared<JSONValue>(std::move(ao)));
    }
    json::set(o, "package_args", JSONValue(std::move(args)));

    if (cfg.keyFilePath) json::set(o, "keyfile_path", *cfg.keyFilePath);
    if (cfg.oauth) {
        JSONValue::Object oa;
        json::set(oa, "client_id", cfg.oauth->clientId);
        json::set(oa, "authorization_url", cfg.oauth->authorizationUrl);
        json::set(oa, "token_url", cfg.oauth->tokenUrl);
        json::set(oa, "redirect_uri", cfg.oauth->redirectUri);
        JSONValue::Array scopes;
        for (const auto& s : cfg.oauth->scopes) scopes.push_back(std::make_shared<JSONValue>(s));
        json::set(oa, "scopes", JSONValue(std::move(scopes)));
        json::set(o, "oauth", JSONValue(std::move(oa)));
    }
    if (cfg.url) json::set(o, "url", *cfg.url);
    json::set(o, "settings", cfg.settings);
    return JSONValue(std::move(o));
}

ServerConfig DecodeServerConfig(const JSONValue& value) {
    if (!value.isObject()) configError("server config must be a JSON object");
    ServerConfig cfg;
    cfg.id = requireString(value, "id", "server");
    const std::string where = "server '" + cfg.id + "'";
    cfg.name = optString(value, "name").value_or(cfg.id);
    cfg.enabled = json::getBool(value, "enabled").value_or(true);

    if (const JSONValue* src = json::getObject(value, "source")) {
        cfg.source = decodeSource(*src, where);
    }

    const JSONValue* pkg = json::getObject(value, "package");
    if (!pkg) configError(where + ": missing package");
    const std::string pkgType = requireString(*pkg, "type", where + ".package");
    auto kind = PackageKindFromString(pkgType);
    if (!kind) configError(std::format("{}: unknown package type '{}'", where, pkgType));
    cfg.package.kind = *kind;
    cfg.package.identifier = optString(*pkg, "identifier").value_or("");
    cfg.package.runtimeHint = optString(*pkg, "runtime_hint");

    const std::string transport = optString(value, "transport").value_or("stdio");
    auto tk = TransportKindFromString(transport);
    if (!tk) configError(std::format("{}: unknown transport '{}'", where, transport));
    cfg.transport = *tk;

    const std::string auth = optString(value, "auth_type").value_or("none");
    auto am = AuthMethodFromString(auth);
    if (!am) configError(std::format("{}: unknown auth_type '{}'", where, auth));
    cfg.authMethod = *am;

    if (const auto* envs = json::getArray(value, "env_vars")) {
        for (const auto& e : *envs) {
            if (!e || !e->isObject()) configError(where + ": env_vars entries must be objects");
            EnvVarRequirement req;
            req.name = requireString(*e, "name", where + ".env_vars");
            req.required = json::getBool(*e, "required").value_or(false);
            req.secret = json::getBool(*e, "secret").value_or(false);
            req.description = optString(*e, "description");
            cfg.envVars.push_back(std::move(req));
        }
    }

    if (const auto* args = json::getArray(value, "package_args")) {
        for (const auto& a : *args) {
            if (!a || !a->isObject()) configError(where + ": package_args entries must be objects");
            PackageArgument arg;
            const std::string type = optString(*a, "type").value_or("named");
            if (type == "named") {
                arg.kind = PackageArgument::Kind::Named;
            } else if (type == "positional") {
                arg.kind = PackageArgument::Kind::Positional;
            } else {
                configError(std::format("{}: unknown package argument type '{}'", where, type));
            }
            arg.name = requireString(*a, "name", where + ".package_args");
            arg.required = json::getBool(*a, "required").value_or(false);
            arg.description = optString(*a, "description");
            arg.defaultValue = optString(*a, "default");
            cfg.packageArgs.push_back(std::move(arg));
        }
    }

    cfg.keyFilePath = optString(value, "keyfile_path");
    if (const JSONValue* oa = json::getObject(value, "oauth")) {
        OAuthSettings s;
        s.clientId = requireString(*oa, "client_id", where + ".oauth");
        s.authorizationUrl = requireString(*oa, "authorization_url", where + ".oauth");
        s.tokenUrl = requireString(*oa, "token_url", where + ".oauth");
        s.redirectUri = optString(*oa, "redirect_uri").value_or("");
        if (const auto* scopes = json::getArray(*oa, "scopes")) {
            for (const auto& sc : *scopes) {
                if (sc && sc->isString()) s.scopes.push_back(std::get<std::string>(sc->value));
            }
        }
        cfg.oauth = std::move(s);
    }
    cfg.url = optString(value, "url");
    if (const JSONValue* settings = json::getObject(value, "settings")) {
        cfg.settings = *settings;
    }

    ValidateConfigInvariants(cfg);
    return cfg;
}

std::string EncodeConfigDocument(const std::vector<ServerConfig>& configs) {
    JSONValue::Object doc;
    json::set(doc, "version", CONFIG_DOCUMENT_VERSION);
    JSONValue::Array servers;
    for (const auto& c : configs) {
        servers.push_back(std::make_shared<JSONValue>(EncodeServerConfig(c)));
    }
    json::set(doc, "servers", JSONValue(std::move(servers)));
    return serializeJSONValue(JSONValue(std::move(doc)));
}

std::vector<ServerConfig> DecodeConfigDocument(const std::string& text) {
    JSONValue doc;
    try {
        doc = parseJSONValue(text);
    } catch (const std::exception& e) {
        configError(std::string("configuration document is not valid JSON: ") + e.what());
    }
    const auto version = json::getInt(doc, "version");
    if (!version) configError("configuration document has no version");
    if (*version > CONFIG_DOCUMENT_VERSION) {
        configError(std::format("configuration document version {} is newer than supported version {}",
                                *version, CONFIG_DOCUMENT_VERSION));
    }
    std::vector<ServerConfig> out;
    const auto* servers = json::getArray(doc, "servers");
    if (!servers) return out;
    for (const auto& s : *servers) {
        if (!s) continue;
        ServerConfig cfg = DecodeServerConfig(*s);
        for (const auto& existing : out) {
            if (existing.id == cfg.id) configError("duplicate server id '" + cfg.id + "'");
        }
        out.push_back(std::move(cfg));
    }
    return out;
}

std::vector<ServerConfig> LoadServerConfigs(const std::string& path) {
    std::ifstream in(path, std::ios::in | std::ios::binary);
    if (!in.is_open()) {
        std::error_code ec;
        if (!std::filesystem::exists(path, ec)) {
            LOG_INFO("Config file {} not found; starting with no servers", path);
            return {};
        }
        configError("cannot open config file " + path);
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    auto configs = DecodeConfigDocument(ss.str());
    LOG_INFO("Loaded {} server config(s) from {}", configs.size(), path);
    return configs;
}

void SaveServerConfigs(const std::string& path, const std::vector<ServerConfig>& configs) {
    const std::string tmp = path + ".tmp";
    {
        std::ofstream out(tmp, std::ios::out | std::ios::trunc | std::ios::binary);
        if (!out.is_open()) configError("cannot write config file " + tmp);
        out << EncodeConfigDocument(configs) << '\n';
        out.flush();
        if (!out) configError("failed writing config file " + tmp);
    }
    std::error_code ec;
    std::filesystem::rename(tmp, path, ec);
    if (ec) {
        std::filesystem::remove(tmp, ec);
        configError("cannot replace config file " + path);
    }
    LOG_DEBUG("Saved {} server config(s) to {}", configs.size(), path);
}

} // namespace mcphost
