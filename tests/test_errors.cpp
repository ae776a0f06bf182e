//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_errors.cpp
// Purpose: GoogleTests for HostError and the JSON-RPC error mapping helpers
//==========================================================================================================

#include <gtest/gtest.h>
#include "mcphost/JSONRPCTypes.h"
#include "mcphost/errors/Errors.h"
#include "mcphost/Status.h"

using namespace mcphost;

TEST(Errors, KindNames) {
    EXPECT_STREQ(ToString(ErrorKind::ValidationError), "ValidationError");
    EXPECT_STREQ(ToString(ErrorKind::MaxRestartsExceeded), "MaxRestartsExceeded");
    EXPECT_STREQ(ToString(ErrorKind::CsrfStateMismatch), "CsrfStateMismatch");
    EXPECT_STREQ(ToString(CredentialErrorCode::PermissionDenied), "PermissionDenied");
}

TEST(Errors, CredentialErrorIsHostError) {
    try {
        throw CredentialError(CredentialErrorCode::NotFound, "secret TOKEN not found for instance a");
    } catch (const HostError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::CredentialError);
        EXPECT_FALSE(e.data().has_value());
        EXPECT_FALSE(e.rpcCode().has_value());
    }
}

TEST(Errors, FromErrorValue_Valid) {
    JSONValue::Object dataObj; dataObj["foo"] = std::make_shared<JSONValue>(std::string("bar"));
    JSONValue::Object errObj;
    errObj["code"] = std::make_shared<JSONValue>(static_cast<int64_t>(JSONRPCErrorCodes::MethodNotFound));
    errObj["message"] = std::make_shared<JSONValue>(std::string("Method not found"));
    errObj["data"] = std::make_shared<JSONValue>(JSONValue{dataObj});

    JSONValue errVal{errObj};
    auto parsed = errors::rpcErrorFromValue(errVal);
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->code, JSONRPCErrorCodes::MethodNotFound);
    EXPECT_EQ(parsed->message, std::string("Method not found"));
    ASSERT_TRUE(parsed->data.has_value());
    EXPECT_EQ(json::getString(*parsed->data, "foo").value_or(""), "bar");
}

TEST(Errors, FromErrorValue_InvalidShape) {
    // Not an object
    JSONValue notObj{nullptr};
    EXPECT_FALSE(errors::rpcErrorFromValue(notObj).has_value());

    // Missing code
    JSONValue::Object missCode; missCode["message"] = std::make_shared<JSONValue>(std::string("m"));
    EXPECT_FALSE(errors::rpcErrorFromValue(JSONValue{missCode}).has_value());

    // Missing message
    JSONValue::Object missMsg; missMsg["code"] = std::make_shared<JSONValue>(static_cast<int64_t>(-1));
    EXPECT_FALSE(errors::rpcErrorFromValue(JSONValue{missMsg}).has_value());

    // Wrong types
    JSONValue::Object wrongTypes;
    wrongTypes["code"] = std::make_shared<JSONValue>(std::string("-32601"));
    wrongTypes["message"] = std::make_shared<JSONValue>(static_cast<int64_t>(123));
    EXPECT_FALSE(errors::rpcErrorFromValue(JSONValue{wrongTypes}).has_value());
}

TEST(Errors, FromResponseKeepsServerPayload) {
    JSONValue::Object data;
    json::set(data, "detail", "quota exceeded");
    auto resp = CreateErrorResponse(std::string("1"), -32001, "tool failed", JSONValue(data));
    ASSERT_TRUE(resp != nullptr);
    HostError e = errors::hostErrorFromResponse(*resp);
    EXPECT_EQ(e.kind(), ErrorKind::ToolError);
    EXPECT_EQ(std::string(e.what()), "tool failed");
    ASSERT_TRUE(e.rpcCode().has_value());
    EXPECT_EQ(*e.rpcCode(), -32001);
    ASSERT_TRUE(e.data().has_value());
    const JSONValue* d = json::getObject(*e.data(), "data");
    ASSERT_NE(d, nullptr);
    EXPECT_EQ(json::getString(*d, "detail").value_or(""), "quota exceeded");
}

TEST(Errors, FromResponseMalformedError) {
    JSONRPCResponse resp(std::string("2"), JSONValue(std::string("boom")), true);
    HostError e = errors::hostErrorFromResponse(resp, ErrorKind::HandshakeTimeout);
    EXPECT_EQ(e.kind(), ErrorKind::HandshakeTimeout);
    EXPECT_FALSE(e.rpcCode().has_value());
    EXPECT_NE(std::string(e.what()).find("malformed"), std::string::npos);
}

TEST(Errors, AggregateStatusIgnoresDisabled) {
    InstanceStatus ok; ok.state = InstanceState::Running;
    InstanceStatus bad; bad.state = InstanceState::Error;
    InstanceStatus off; off.state = InstanceState::Error; off.enabled = false;
    EXPECT_EQ(Aggregate({}), AggregateStatus::NoServers);
    EXPECT_EQ(Aggregate({off}), AggregateStatus::NoServers);
    EXPECT_EQ(Aggregate({ok, off}), AggregateStatus::AllHealthy);
    EXPECT_EQ(Aggregate({ok, bad}), AggregateStatus::PartialFailure);
    EXPECT_EQ(Aggregate({bad, off}), AggregateStatus::AllFailed);
}

TEST(Errors, StatusDisplayNames) {
    InstanceStatus s;
    s.state = InstanceState::Starting;
    EXPECT_EQ(s.DisplayName(), "Starting...");
    s.restartCount = 1;
    EXPECT_EQ(s.DisplayName(), "Restarting...");
    s.enabled = false;
    EXPECT_EQ(s.DisplayName(), "Disabled");
}
