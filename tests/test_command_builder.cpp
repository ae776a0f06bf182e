//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_command_builder.cpp
// Purpose: Tests for launch command, environment and header resolution
//==========================================================================================================

#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "TempDir.h"
#include "mcphost/CommandBuilder.h"
#include "mcphost/credentials/CredentialStore.h"
#include "mcphost/errors/Errors.h"

using namespace mcphost;

namespace {

ServerConfig npmConfig(const std::string& identifier) {
    ServerConfig cfg;
    cfg.id = "inst-1";
    cfg.name = "Test";
    cfg.package.kind = PackageKind::Npm;
    cfg.package.identifier = identifier;
    return cfg;
}

PackageArgument namedArg(const std::string& name, bool required = false) {
    PackageArgument a;
    a.kind = PackageArgument::Kind::Named;
    a.name = name;
    a.required = required;
    return a;
}

PackageArgument positionalArg(const std::string& name) {
    PackageArgument a;
    a.kind = PackageArgument::Kind::Positional;
    a.name = name;
    return a;
}

EnvVarRequirement envVar(const std::string& name, bool required, bool secret) {
    EnvVarRequirement v;
    v.name = name;
    v.required = required;
    v.secret = secret;
    return v;
}

} // namespace

TEST(CommandBuilderTest, NpmUsesNpxWithPackage) {
    auto cmd = BuildCommand(npmConfig("@modelcontextprotocol/server-filesystem"));
    EXPECT_EQ(cmd.program, "npx");
    EXPECT_EQ(cmd.args, (std::vector<std::string>{"-y", "@modelcontextprotocol/server-filesystem"}));
}

TEST(CommandBuilderTest, RuntimeHintOverridesLauncher) {
    auto cfg = npmConfig("pkg");
    cfg.package.runtimeHint = "bunx";
    EXPECT_EQ(BuildCommand(cfg).program, "bunx");
}

TEST(CommandBuilderTest, PypiUsesUvx) {
    ServerConfig cfg = npmConfig("mcp-server-time");
    cfg.package.kind = PackageKind::Pypi;
    auto cmd = BuildCommand(cfg);
    EXPECT_EQ(cmd.program, "uvx");
    EXPECT_EQ(cmd.args, (std::vector<std::string>{"mcp-server-time"}));
}

TEST(CommandBuilderTest, DockerForwardsDeclaredVariablesByName) {
    ServerConfig cfg = npmConfig("ghcr.io/acme/server:1");
    cfg.package.kind = PackageKind::Docker;
    cfg.envVars = {envVar("TOKEN", false, true)};
    auto cmd = BuildCommand(cfg);
    EXPECT_EQ(cmd.program, "docker");
    EXPECT_EQ(cmd.args, (std::vector<std::string>{"run", "-i", "--rm", "-e", "TOKEN", "ghcr.io/acme/server:1"}));
}

TEST(CommandBuilderTest, BinaryRunsIdentifierDirectly) {
    ServerConfig cfg = npmConfig("/usr/local/bin/tool-server");
    cfg.package.kind = PackageKind::Binary;
    auto cmd = BuildCommand(cfg);
    EXPECT_EQ(cmd.program, "/usr/local/bin/tool-server");
    EXPECT_TRUE(cmd.args.empty());
}

TEST(CommandBuilderTest, CommaListExpandsIntoRepeatedNamedFlags) {
    ServerConfig cfg = npmConfig("pkg");
    cfg.packageArgs = {namedArg("allowed-dir")};
    SetPackageArgValue(cfg, "allowed-dir", JSONValue(" /tmp , /home/u ,, "));
    auto cmd = BuildCommand(cfg);
    EXPECT_EQ(cmd.args, (std::vector<std::string>{"-y", "pkg", "--allowed-dir", "/tmp", "--allowed-dir", "/home/u"}));
}

TEST(CommandBuilderTest, ArrayValueExpandsAndScalarsAreStringified) {
    ServerConfig cfg = npmConfig("pkg");
    cfg.packageArgs = {namedArg("port"), namedArg("verbose"), positionalArg("root")};
    SetPackageArgValue(cfg, "port", JSONValue(static_cast<int64_t>(8080)));
    SetPackageArgValue(cfg, "verbose", JSONValue(true));
    JSONValue::Array roots;
    roots.push_back(std::make_shared<JSONValue>("/a"));
    roots.push_back(std::make_shared<JSONValue>("/b"));
    SetPackageArgValue(cfg, "root", JSONValue(std::move(roots)));
    auto cmd = BuildCommand(cfg);
    EXPECT_EQ(cmd.args, (std::vector<std::string>{"-y", "pkg", "--port", "8080", "--verbose", "true", "/a", "/b"}));
}

TEST(CommandBuilderTest, DefaultUsedWhenNoExplicitValue) {
    ServerConfig cfg = npmConfig("pkg");
    auto a = namedArg("mode");
    a.defaultValue = "fast";
    cfg.packageArgs = {a};
    auto cmd = BuildCommand(cfg);
    EXPECT_EQ(cmd.args, (std::vector<std::string>{"-y", "pkg", "--mode", "fast"}));
}

TEST(CommandBuilderTest, ObjectValueIsRejected) {
    ServerConfig cfg = npmConfig("pkg");
    cfg.packageArgs = {namedArg("opts")};
    SetPackageArgValue(cfg, "opts", JSONValue(JSONValue::Object{}));
    try {
        BuildCommand(cfg);
        FAIL() << "expected ValidationError";
    } catch (const HostError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::ValidationError);
    }
}

TEST(CommandBuilderTest, MissingRequiredArgumentNamesIt) {
    ServerConfig cfg = npmConfig("pkg");
    auto a = namedArg("workspace", true);
    a.defaultValue = "/ignored";
    cfg.packageArgs = {a};
    try {
        ValidateArguments(cfg);
        FAIL() << "expected ValidationError";
    } catch (const HostError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::ValidationError);
        EXPECT_NE(std::string(e.what()).find("workspace"), std::string::npos);
    }
}

TEST(CommandBuilderTest, BlankRequiredArgumentIsMissing) {
    ServerConfig cfg = npmConfig("pkg");
    cfg.packageArgs = {namedArg("workspace", true)};
    SetPackageArgValue(cfg, "workspace", JSONValue("   "));
    EXPECT_THROW(ValidateArguments(cfg), HostError);
    SetPackageArgValue(cfg, "workspace", JSONValue("/w"));
    EXPECT_NO_THROW(ValidateArguments(cfg));
}

TEST(CommandBuilderTest, SplitCommaListDropsEmptySegments) {
    EXPECT_EQ(SplitCommaList("a, b,,c ,"), (std::vector<std::string>{"a", "b", "c"}));
    EXPECT_TRUE(SplitCommaList(" , ").empty());
}

TEST(CommandBuilderEnvTest, StoredSecretsBecomeExactlyTheDeclaredVariables) {
    testutil::TempDir dir;
    CredentialStore store(dir.path());
    ServerConfig cfg = npmConfig("aws-server");
    cfg.authMethod = AuthMethod::ApiKey;
    cfg.envVars = {envVar("AWS_ACCESS_KEY_ID", true, true), envVar("AWS_SECRET_ACCESS_KEY", true, true)};
    store.Store(cfg.id, "AWS_ACCESS_KEY_ID", "AKIAEXAMPLE");
    store.Store(cfg.id, "AWS_SECRET_ACCESS_KEY", "s3cr3t\n");

    auto env = BuildEnvironment(cfg, store);
    ASSERT_EQ(env.size(), 2u);
    EXPECT_EQ(env.at("AWS_ACCESS_KEY_ID"), "AKIAEXAMPLE");
    EXPECT_EQ(env.at("AWS_SECRET_ACCESS_KEY"), "s3cr3t");
}

TEST(CommandBuilderEnvTest, MissingRequiredSecretIsCredentialError) {
    testutil::TempDir dir;
    CredentialStore store(dir.path());
    ServerConfig cfg = npmConfig("pkg");
    cfg.authMethod = AuthMethod::ApiKey;
    cfg.envVars = {envVar("API_TOKEN", true, true)};
    try {
        BuildEnvironment(cfg, store);
        FAIL() << "expected CredentialError";
    } catch (const CredentialError& e) {
        EXPECT_EQ(e.code(), CredentialErrorCode::NotFound);
        EXPECT_NE(std::string(e.what()).find("API_TOKEN"), std::string::npos);
    }
}

TEST(CommandBuilderEnvTest, OptionalSecretMayBeAbsent) {
    testutil::TempDir dir;
    CredentialStore store(dir.path());
    ServerConfig cfg = npmConfig("pkg");
    cfg.authMethod = AuthMethod::ApiKey;
    cfg.envVars = {envVar("API_TOKEN", false, true)};
    EXPECT_TRUE(BuildEnvironment(cfg, store).empty());
}

TEST(CommandBuilderEnvTest, PlainRequiredVariableComesFromSettings) {
    testutil::TempDir dir;
    CredentialStore store(dir.path());
    ServerConfig cfg = npmConfig("pkg");
    cfg.envVars = {envVar("REGION", true, false)};
    EXPECT_THROW(BuildEnvironment(cfg, store), HostError);
    SetSettingsEnvValue(cfg, "REGION", "eu-west-1");
    auto env = BuildEnvironment(cfg, store);
    EXPECT_EQ(env.at("REGION"), "eu-west-1");
}

TEST(CommandBuilderEnvTest, ApiKeyPlainVariableFallsBackToStoredValue) {
    testutil::TempDir dir;
    CredentialStore store(dir.path());
    ServerConfig cfg = npmConfig("pkg");
    cfg.authMethod = AuthMethod::ApiKey;
    cfg.envVars = {envVar("API_TOKEN", true, true), envVar("REGION", true, false), envVar("TEAM", false, false)};
    store.Store(cfg.id, "API_TOKEN", "tok");
    EXPECT_THROW(BuildEnvironment(cfg, store), HostError);

    store.Store(cfg.id, "REGION", "eu-west-1");
    store.Store(cfg.id, "TEAM", "infra");
    auto env = BuildEnvironment(cfg, store);
    EXPECT_EQ(env.at("API_TOKEN"), "tok");
    EXPECT_EQ(env.at("REGION"), "eu-west-1");
    EXPECT_EQ(env.at("TEAM"), "infra");

    // settings.env still wins over the stored copy
    SetSettingsEnvValue(cfg, "REGION", "us-east-2");
    EXPECT_EQ(BuildEnvironment(cfg, store).at("REGION"), "us-east-2");
}

TEST(CommandBuilderEnvTest, KeyFileBindsToFirstSecretVariable) {
    testutil::TempDir dir;
    CredentialStore store(dir.path());
    ServerConfig cfg = npmConfig("pkg");
    cfg.authMethod = AuthMethod::KeyFile;
    cfg.keyFilePath = dir.write("key.txt", "  abc123 \n");
    cfg.envVars = {envVar("LOG_LEVEL", false, false), envVar("SERVICE_KEY", true, true)};
    auto env = BuildEnvironment(cfg, store);
    EXPECT_EQ(env.at("SERVICE_KEY"), "abc123");
}

TEST(CommandBuilderEnvTest, OAuthStdioInjectsAccessToken) {
    testutil::TempDir dir;
    CredentialStore store(dir.path());
    ServerConfig cfg = npmConfig("pkg");
    cfg.authMethod = AuthMethod::OAuth;
    cfg.oauth = OAuthSettings{};
    EXPECT_THROW(BuildEnvironment(cfg, store), CredentialError);

    OAuthTokenRecord rec;
    rec.accessToken = "at-1";
    store.StoreOAuthToken(cfg.id, rec);
    auto env = BuildEnvironment(cfg, store);
    EXPECT_EQ(env.at("OAUTH_ACCESS_TOKEN"), "at-1");
}

TEST(CommandBuilderEnvTest, ExpiredOAuthTokenIsNeverInjected) {
    testutil::TempDir dir;
    CredentialStore store(dir.path());
    ServerConfig cfg = npmConfig("pkg");
    cfg.authMethod = AuthMethod::OAuth;
    cfg.oauth = OAuthSettings{};
    OAuthTokenRecord rec;
    rec.accessToken = "at-old";
    rec.refreshToken = "rt-1";
    rec.expiresAt = 1600000000;
    store.StoreOAuthToken(cfg.id, rec);
    try {
        BuildEnvironment(cfg, store);
        FAIL() << "expected CredentialError";
    } catch (const CredentialError& e) {
        EXPECT_EQ(e.code(), CredentialErrorCode::Expired);
        EXPECT_EQ(std::string(e.what()).find("at-old"), std::string::npos);
    }
}

TEST(CommandBuilderEnvTest, HttpPrepareCarriesBearerHeader) {
    testutil::TempDir dir;
    CredentialStore store(dir.path());
    ServerConfig cfg;
    cfg.id = "remote-1";
    cfg.name = "Remote";
    cfg.package.kind = PackageKind::Http;
    cfg.package.identifier = "https://tools.example.com/mcp";
    cfg.transport = TransportKind::Http;
    cfg.url = "https://tools.example.com/mcp";
    cfg.authMethod = AuthMethod::ApiKey;
    cfg.envVars = {envVar("API_KEY", true, true)};
    store.Store(cfg.id, "API_KEY", "k-1");

    auto spec = Prepare(cfg, store);
    EXPECT_FALSE(spec.command.has_value());
    ASSERT_TRUE(spec.url.has_value());
    EXPECT_EQ(*spec.url, "https://tools.example.com/mcp");
    EXPECT_EQ(spec.headers.at("Authorization"), "Bearer k-1");
}

TEST(CommandBuilderEnvTest, NetworkHeadersSplitPrimaryAndExtraSecrets) {
    testutil::TempDir dir;
    CredentialStore store(dir.path());
    ServerConfig cfg = npmConfig("unused");
    cfg.transport = TransportKind::Http;
    cfg.authMethod = AuthMethod::ApiKey;
    cfg.envVars = {envVar("API_TOKEN", true, true), envVar("WORKSPACE_KEY", false, true),
                   envVar("REGION", false, false)};
    SetSettingsEnvValue(cfg, "REGION", "us-east-1");
    store.Store(cfg.id, "API_TOKEN", "tok-1");
    store.Store(cfg.id, "WORKSPACE_KEY", "ws-9");

    auto headers = BuildHeaders(cfg, store);
    ASSERT_EQ(headers.size(), 3u);
    EXPECT_EQ(headers.at("Authorization"), "Bearer tok-1");
    EXPECT_EQ(headers.at("X-WORKSPACE_KEY"), "ws-9");
    EXPECT_EQ(headers.at("X-REGION"), "us-east-1");
}

TEST(CommandBuilderEnvTest, NetworkHeadersForOAuthUseStoredToken) {
    testutil::TempDir dir;
    CredentialStore store(dir.path());
    ServerConfig cfg = npmConfig("unused");
    cfg.transport = TransportKind::Http;
    cfg.authMethod = AuthMethod::OAuth;
    cfg.oauth = OAuthSettings{};
    EXPECT_THROW(BuildHeaders(cfg, store), CredentialError);

    OAuthTokenRecord rec;
    rec.accessToken = "at-7";
    store.StoreOAuthToken(cfg.id, rec);
    EXPECT_EQ(BuildHeaders(cfg, store).at("Authorization"), "Bearer at-7");
}
