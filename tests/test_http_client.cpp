//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_http_client.cpp
// Purpose: URL helpers, response header lookup and SSE payload extraction
//==========================================================================================================

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <vector>

#include "mcphost/HTTPTransport.hpp"
#include "mcphost/auth/HttpClient.hpp"

using namespace mcphost;

TEST(HttpClientUrl, ParseDefaultsPortAndTarget) {
    auto u = auth::ParseUrl("https://registry.modelcontextprotocol.io");
    EXPECT_EQ(u.scheme, "https");
    EXPECT_EQ(u.host, "registry.modelcontextprotocol.io");
    EXPECT_EQ(u.port, "443");
    EXPECT_EQ(u.target, "/");

    auto q = auth::ParseUrl("HTTP://localhost:8080?search=git");
    EXPECT_EQ(q.scheme, "http");
    EXPECT_EQ(q.port, "8080");
    EXPECT_EQ(q.target, "/?search=git");
}

TEST(HttpClientUrl, ParseIpv6AndUserinfo) {
    auto u = auth::ParseUrl("http://user:pw@[::1]:9000/mcp");
    EXPECT_EQ(u.host, "::1");
    EXPECT_EQ(u.port, "9000");
    EXPECT_EQ(u.target, "/mcp");
}

TEST(HttpClientUrl, RejectUnsupportedOrHostless) {
    EXPECT_THROW(auth::ParseUrl("ftp://example.com/x"), std::invalid_argument);
    EXPECT_THROW(auth::ParseUrl("example.com/x"), std::invalid_argument);
    EXPECT_THROW(auth::ParseUrl("https:///path"), std::invalid_argument);
}

TEST(HttpClientUrl, EncodeAndDecode) {
    EXPECT_EQ(auth::UrlEncode("a b&c=d/\xC3\xA9"), "a%20b%26c%3Dd%2F%C3%A9");
    EXPECT_EQ(auth::UrlEncode("safe-_.~"), "safe-_.~");
    EXPECT_EQ(auth::UrlDecode("a+b%20c%2fd"), "a b c/d");
    EXPECT_EQ(auth::UrlDecode("100%"), "100%");
}

TEST(HttpClientResponse, HeaderLookupIsCaseInsensitive) {
    auth::HttpResponse res;
    res.status = 401;
    res.headers = {{"Content-Type", "application/json"}, {"WWW-Authenticate", "Bearer"}};
    EXPECT_EQ(res.Header("www-authenticate").value_or(""), "Bearer");
    EXPECT_FALSE(res.Header("Location").has_value());
    EXPECT_FALSE(res.Ok());
    res.status = 204;
    EXPECT_TRUE(res.Ok());
}

TEST(SseExtract, JoinsMultiLineDataAndSkipsOtherFields) {
    const std::string stream =
        "event: message\r\n"
        "id: 1\r\n"
        "data: {\"a\":\r\n"
        "data: 1}\r\n"
        "\r\n"
        ": keep-alive comment\n"
        "\n"
        "data:{\"b\":2}\n";
    std::vector<std::string> events = sse::ExtractEventData(stream);
    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(events[0], "{\"a\":\n1}");
    EXPECT_EQ(events[1], "{\"b\":2}");
}

TEST(SseExtract, EmptyStreamHasNoEvents) {
    EXPECT_TRUE(sse::ExtractEventData("").empty());
    EXPECT_TRUE(sse::ExtractEventData("\n\n: ping\n\n").empty());
}
