//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Errors.h
// Purpose: Typed host errors and JSON-RPC error mapping helpers
//==========================================================================================================

#pragma once

#include <optional>
#include <stdexcept>
#include <string>

#include "mcphost/JSONRPCTypes.h"

namespace mcphost {

// Failure categories surfaced by the tool server host.
enum class ErrorKind {
    ValidationError,
    SpawnFailed,
    HandshakeTimeout,
    TransportDisconnected,
    ToolError,
    CallTimeout,
    MaxRestartsExceeded,
    CredentialError,
    CsrfStateMismatch,
    RegistryUnavailable,
    RoutingError,
    ConfigError,
    OAuthError,
    InstanceUnavailable
};

inline const char* ToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::ValidationError: return "ValidationError";
        case ErrorKind::SpawnFailed: return "SpawnFailed";
        case ErrorKind::HandshakeTimeout: return "HandshakeTimeout";
        case ErrorKind::TransportDisconnected: return "TransportDisconnected";
        case ErrorKind::ToolError: return "ToolError";
        case ErrorKind::CallTimeout: return "CallTimeout";
        case ErrorKind::MaxRestartsExceeded: return "MaxRestartsExceeded";
        case ErrorKind::CredentialError: return "CredentialError";
        case ErrorKind::CsrfStateMismatch: return "CsrfStateMismatch";
        case ErrorKind::RegistryUnavailable: return "RegistryUnavailable";
        case ErrorKind::RoutingError: return "RoutingError";
        case ErrorKind::ConfigError: return "ConfigError";
        case ErrorKind::OAuthError: return "OAuthError";
        case ErrorKind::InstanceUnavailable: return "InstanceUnavailable";
    }
    return "Unknown";
}

//==========================================================================================================
// HostError
// Purpose: Exception type for every failure the host reports. Carries the kind, the tool server's error
//          payload verbatim when there is one, and the JSON-RPC code when the failure came off the wire.
//==========================================================================================================
class HostError : public std::runtime_error {
public:
    HostError(ErrorKind kind, const std::string& message,
              std::optional<JSONValue> data = std::nullopt,
              std::optional<int> rpcCode = std::nullopt)
        : std::runtime_error(message), kind_(kind), data_(std::move(data)), rpcCode_(rpcCode) {}

    ErrorKind kind() const { return kind_; }
    const std::optional<JSONValue>& data() const { return data_; }
    std::optional<int> rpcCode() const { return rpcCode_; }

private:
    ErrorKind kind_;
    std::optional<JSONValue> data_;
    std::optional<int> rpcCode_;
};

enum class CredentialErrorCode { NotFound, PermissionDenied, InvalidName, Expired, Io };

inline const char* ToString(CredentialErrorCode code) {
    switch (code) {
        case CredentialErrorCode::NotFound: return "NotFound";
        case CredentialErrorCode::PermissionDenied: return "PermissionDenied";
        case CredentialErrorCode::InvalidName: return "InvalidName";
        case CredentialErrorCode::Expired: return "Expired";
        case CredentialErrorCode::Io: return "Io";
    }
    return "Unknown";
}

// Credential failures; messages name the instance and variable, never the secret.
class CredentialError : public HostError {
public:
    CredentialError(CredentialErrorCode code, const std::string& message)
        : HostError(ErrorKind::CredentialError, message), code_(code) {}

    CredentialErrorCode code() const { return code_; }

private:
    CredentialErrorCode code_;
};

namespace errors {

// Typed view of a JSON-RPC error object { code, message, data? }.
struct RpcError {
    int code{0};
    std::string message;
    std::optional<JSONValue> data;
};

// Parse a JSON-RPC error object. Returns std::nullopt when code/message are missing.
inline std::optional<RpcError> rpcErrorFromValue(const JSONValue& errVal) {
    auto code = json::getInt(errVal, "code");
    auto message = json::getString(errVal, "message");
    if (!code || !message) {
        return std::nullopt;
    }
    RpcError e;
    e.code = static_cast<int>(*code);
    e.message = *message;
    if (const JSONValue* d = json::member(errVal, "data")) {
        e.data = *d;
    }
    return e;
}

//==========================================================================================================
// hostErrorFromResponse
// Purpose: Map an error response coming back from a tool server to a HostError.
// Args:
//   response: Response that carries an error object.
//   kind: Kind to report (ToolError for capability calls, HandshakeTimeout/SpawnFailed callers choose).
// Returns:
//   HostError whose data() holds the full error object as sent by the server.
//==========================================================================================================
inline HostError hostErrorFromResponse(const JSONRPCResponse& response, ErrorKind kind = ErrorKind::ToolError) {
    const JSONValue errVal = response.error.has_value() ? response.error.value() : JSONValue(nullptr);
    auto parsed = rpcErrorFromValue(errVal);
    if (!parsed) {
        return HostError(kind, "Tool server returned a malformed error: " + serializeJSONValue(errVal), errVal);
    }
    return HostError(kind, parsed->message, errVal, parsed->code);
}

} // namespace errors
} // namespace mcphost
