//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: tests/test_www_authenticate.cpp
// Purpose: Unit tests for the WWW-Authenticate Bearer challenge parser
//==========================================================================================================

#include <gtest/gtest.h>

#include <string>

#include "mcphost/auth/WwwAuthenticate.hpp"

using namespace mcphost::auth;

TEST(WwwAuthenticate, ParseBearerWithResourceMetadataAndScope) {
    const std::string h =
        "Bearer resource_metadata=\"https://tools.example.com/.well-known/oauth-protected-resource\", scope=\"repo read:org\"";
    auto c = ParseBearerChallenge(h);
    ASSERT_TRUE(c.has_value());
    EXPECT_EQ(c->scheme, "bearer");
    EXPECT_EQ(c->Param("resource_metadata").value_or(""),
              "https://tools.example.com/.well-known/oauth-protected-resource");
    EXPECT_EQ(c->Param("scope").value_or(""), "repo read:org");
}

TEST(WwwAuthenticate, ParseBearerWithoutParams) {
    auto c = ParseBearerChallenge("Bearer");
    ASSERT_TRUE(c.has_value());
    EXPECT_TRUE(c->params.empty());
    EXPECT_EQ(DescribeChallenge(*c), "unauthorized");
}

TEST(WwwAuthenticate, SchemeAndKeysAreCaseInsensitive) {
    auto c = ParseBearerChallenge("  bEaReR Realm=tools ,ERROR=invalid_token");
    ASSERT_TRUE(c.has_value());
    EXPECT_EQ(c->Param("realm").value_or(""), "tools");
    EXPECT_EQ(c->Param("error").value_or(""), "invalid_token");
}

TEST(WwwAuthenticate, RejectNonBearerScheme) {
    EXPECT_FALSE(ParseBearerChallenge("Basic realm=\"X\"").has_value());
    EXPECT_FALSE(ParseBearerChallenge("").has_value());
}

TEST(WwwAuthenticate, HandleQuotedEscapes) {
    auto c = ParseBearerChallenge(R"(Bearer error="insufficient_scope", error_description="need \"repo\" scope")");
    ASSERT_TRUE(c.has_value());
    EXPECT_EQ(c->Param("error").value_or(""), "insufficient_scope");
    EXPECT_EQ(c->Param("error_description").value_or(""), "need \"repo\" scope");
    EXPECT_EQ(DescribeChallenge(*c), "insufficient_scope: need \"repo\" scope");
}

TEST(WwwAuthenticate, UnterminatedQuoteIsMalformed) {
    EXPECT_FALSE(ParseBearerChallenge(R"(Bearer error="invalid_token)").has_value());
}

TEST(WwwAuthenticate, DescribeIncludesResourceMetadata) {
    auto c = ParseBearerChallenge(
        "Bearer error=\"invalid_token\", error_description=\"The access token expired\", "
        "resource_metadata=\"https://tools.example.com/meta\"");
    ASSERT_TRUE(c.has_value());
    EXPECT_EQ(DescribeChallenge(*c),
              "invalid_token: The access token expired (resource metadata: https://tools.example.com/meta)");
}
