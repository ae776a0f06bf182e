//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: JSONRPCTypes.h
// Purpose: JSON value model and JSON-RPC 2.0 message types used on the tool server wire
//==========================================================================================================

#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace mcphost {

//==========================================================================================================
// JSONValue
// Purpose: JSON representation backed by std::variant and shared_ptr graphs.
// Fields:
//   Array: vector<shared_ptr<JSONValue>> representing a JSON array.
//   Object: unordered_map<string, shared_ptr<JSONValue>> representing a JSON object.
//   value: variant holding nullptr, bool, int64_t, double, string, Array, or Object.
//==========================================================================================================
struct JSONValue {
    using Array = std::vector<std::shared_ptr<JSONValue>>;
    using Object = std::unordered_map<std::string, std::shared_ptr<JSONValue>>;

    std::variant<
        std::nullptr_t,
        bool,
        int64_t,
        double,
        std::string,
        Array,
        Object
    > value;

    JSONValue();
    JSONValue(const JSONValue&);
    JSONValue(JSONValue&&) noexcept;
    JSONValue& operator=(const JSONValue&);
    JSONValue& operator=(JSONValue&&) noexcept;
    ~JSONValue();

    explicit JSONValue(std::nullptr_t);
    explicit JSONValue(bool v);
    explicit JSONValue(int64_t v);
    explicit JSONValue(double v);
    explicit JSONValue(const char* s);
    explicit JSONValue(const std::string& s);
    explicit JSONValue(std::string&& s);
    explicit JSONValue(const Array& a);
    explicit JSONValue(Array&& a);
    explicit JSONValue(const Object& o);
    explicit JSONValue(Object&& o);

    auto& get() { return value; }
    const auto& get() const { return value; }

    bool isNull() const { return std::holds_alternative<std::nullptr_t>(value); }
    bool isObject() const { return std::holds_alternative<Object>(value); }
    bool isArray() const { return std::holds_alternative<Array>(value); }
    bool isString() const { return std::holds_alternative<std::string>(value); }
};

//==========================================================================================================
// parseJSONValue / serializeJSONValue
// Purpose: Full recursive JSON parser and compact serializer.
// Notes:
//   parseJSONValue throws std::runtime_error on malformed input or trailing garbage.
//   serializeJSONValue emits object members in key order so output is stable.
//==========================================================================================================
JSONValue parseJSONValue(const std::string& json);
std::string serializeJSONValue(const JSONValue& value);

//==========================================================================================================
// json helpers
// Purpose: Small typed accessors over JSONValue objects; each returns std::nullopt / nullptr when the
//          member is missing or has a different type.
//==========================================================================================================
namespace json {

const JSONValue* member(const JSONValue& obj, const std::string& key);
std::optional<std::string> getString(const JSONValue& obj, const std::string& key);
std::optional<bool> getBool(const JSONValue& obj, const std::string& key);
std::optional<int64_t> getInt(const JSONValue& obj, const std::string& key);
const JSONValue::Array* getArray(const JSONValue& obj, const std::string& key);
const JSONValue* getObject(const JSONValue& obj, const std::string& key);

void set(JSONValue::Object& obj, const std::string& key, JSONValue v);
void set(JSONValue::Object& obj, const std::string& key, const std::string& s);
void set(JSONValue::Object& obj, const std::string& key, const char* s);
void set(JSONValue::Object& obj, const std::string& key, bool b);
void set(JSONValue::Object& obj, const std::string& key, int64_t n);

// Renders scalars as text (strings verbatim, numbers/bools formatted); nullopt for null/array/object.
std::optional<std::string> scalarToString(const JSONValue& v);

} // namespace json

//==========================================================================================================
// JSONRPCId
// Purpose: JSON-RPC 2.0 id variant: string, integer, or null.
//==========================================================================================================
using JSONRPCId = std::variant<std::string, int64_t, std::nullptr_t>;

// Canonical string key for an id (strings verbatim, integers in decimal, null -> "").
std::string idToString(const JSONRPCId& id);
bool idIsSet(const JSONRPCId& id);

//==========================================================================================================
// JSONRPCMessage
// Purpose: Abstract base for JSON-RPC 2.0 messages providing serialization APIs.
//==========================================================================================================
class JSONRPCMessage {
public:
    std::string jsonrpc = "2.0";

    virtual ~JSONRPCMessage() = default;
    virtual std::string Serialize() const = 0;
    virtual bool Deserialize(const std::string& json) = 0;
};

//==========================================================================================================
// JSONRPCRequest
// Purpose: JSON-RPC 2.0 request message with id, method, and optional params.
//==========================================================================================================
class JSONRPCRequest : public JSONRPCMessage {
public:
    JSONRPCId id;
    std::string method;
    std::optional<JSONValue> params;

    JSONRPCRequest() = default;
    JSONRPCRequest(JSONRPCId id, std::string method, std::optional<JSONValue> params = std::nullopt)
        : id(std::move(id)), method(std::move(method)), params(std::move(params)) {}

    std::string Serialize() const override;
    bool Deserialize(const std::string& json) override;
    bool FromValue(const JSONValue& v);
};

//==========================================================================================================
// JSONRPCResponse
// Purpose: JSON-RPC 2.0 response message carrying either result or error.
//==========================================================================================================
class JSONRPCResponse : public JSONRPCMessage {
public:
    JSONRPCId id;
    std::optional<JSONValue> result;
    std::optional<JSONValue> error;

    JSONRPCResponse() = default;
    JSONRPCResponse(JSONRPCId id, JSONValue result)
        : id(std::move(id)), result(std::move(result)) {}
    JSONRPCResponse(JSONRPCId id, JSONValue error, bool /*isError*/)
        : id(std::move(id)), error(std::move(error)) {}

    std::string Serialize() const override;
    bool Deserialize(const std::string& json) override;
    bool FromValue(const JSONValue& v);

    bool IsError() const { return error.has_value(); }
};

//==========================================================================================================
// JSONRPCNotification
// Purpose: JSON-RPC 2.0 notification (no id, no response).
//==========================================================================================================
class JSONRPCNotification : public JSONRPCMessage {
public:
    std::string method;
    std::optional<JSONValue> params;

    JSONRPCNotification() = default;
    JSONRPCNotification(std::string method, std::optional<JSONValue> params = std::nullopt)
        : method(std::move(method)), params(std::move(params)) {}

    std::string Serialize() const override;
    bool Deserialize(const std::string& json) override;
    bool FromValue(const JSONValue& v);
};

//==========================================================================================================
// JSONRPCMessageKind / classifyMessage
// Purpose: Decide which message shape a parsed frame carries (method+id -> request, method only ->
//          notification, result/error -> response).
//==========================================================================================================
enum class JSONRPCMessageKind { Request, Response, Notification, Invalid };
JSONRPCMessageKind classifyMessage(const JSONValue& v);

//==========================================================================================================
// JSONRPCErrorCodes
// Purpose: Standard JSON-RPC error codes. Tool servers may use the -32000..-32099 range freely; those
//          codes are passed through on HostError::rpcCode().
//==========================================================================================================
namespace JSONRPCErrorCodes {
    constexpr int ParseError = -32700;
    constexpr int InvalidRequest = -32600;
    constexpr int MethodNotFound = -32601;
    constexpr int InvalidParams = -32602;
    constexpr int InternalError = -32603;
}

//==========================================================================================================
// CreateErrorObject / CreateErrorResponse
// Purpose: Build { code, message, data? } error objects and wrap them into responses.
//==========================================================================================================
JSONValue CreateErrorObject(int code, const std::string& message,
                            const std::optional<JSONValue>& data = std::nullopt);

std::unique_ptr<JSONRPCResponse> CreateErrorResponse(
    const JSONRPCId& id, int code, const std::string& message,
    const std::optional<JSONValue>& data = std::nullopt);

} // namespace mcphost
