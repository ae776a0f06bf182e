//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: JSONParser.cpp
// Purpose: JSON parser/serializer and JSON-RPC message (de)serialization using only the std library
//==========================================================================================================

#include <algorithm>
#include <cmath>
#include <cctype>
#include <format>
#include <iomanip>
#include <sstream>
#include <stdexcept>

#include "logging/Logger.h"
#include "mcphost/JSONRPCTypes.h"

namespace mcphost {

//----------------------------------------------------------------------------------------------------------
// JSONValue special members (out-of-line definitions)
//----------------------------------------------------------------------------------------------------------
JSONValue::JSONValue() : value(nullptr) {}
JSONValue::JSONValue(const JSONValue&) = default;
JSONValue::JSONValue(JSONValue&&) noexcept = default;
JSONValue& JSONValue::operator=(const JSONValue&) = default;
JSONValue& JSONValue::operator=(JSONValue&&) noexcept = default;
JSONValue::~JSONValue() {}

JSONValue::JSONValue(std::nullptr_t) : value(nullptr) {}
JSONValue::JSONValue(bool v) : value(v) {}
JSONValue::JSONValue(int64_t v) : value(v) {}
JSONValue::JSONValue(double v) : value(v) {}
JSONValue::JSONValue(const char* s) : value(std::string(s ? s : "")) {}
JSONValue::JSONValue(const std::string& s) : value(s) {}
JSONValue::JSONValue(std::string&& s) : value(std::move(s)) {}
JSONValue::JSONValue(const Array& a) : value(a) {}
JSONValue::JSONValue(Array&& a) : value(std::move(a)) {}
JSONValue::JSONValue(const Object& o) : value(o) {}
JSONValue::JSONValue(Object&& o) : value(std::move(o)) {}

// -------------------------------
// Recursive descent JSON parser
// -------------------------------
namespace {
constexpr int MaxDepth = 256;

struct JsonParser {
    const std::string& s;
    std::size_t i{0};
    int depth{0};

    explicit JsonParser(const std::string& str) : s(str) {}

    [[noreturn]] void fail(const char* what) const {
        throw std::runtime_error(std::format("JSON parse error at offset {}: {}", i, what));
    }

    void skipWs() {
        while (i < s.size()) {
            char c = s[i];
            if (c == ' ' || c == '\t' || c == '\r' || c == '\n') { ++i; } else { break; }
        }
    }

    bool match(char c) {
        skipWs();
        if (i < s.size() && s[i] == c) { ++i; return true; }
        return false;
    }

    unsigned int parseHex4() {
        if (i + 4 > s.size()) fail("truncated unicode escape");
        unsigned int code = 0;
        for (int k = 0; k < 4; ++k) {
            char h = s[i++];
            code <<= 4;
            if (h >= '0' && h <= '9') code += static_cast<unsigned int>(h - '0');
            else if (h >= 'a' && h <= 'f') code += 10u + static_cast<unsigned int>(h - 'a');
            else if (h >= 'A' && h <= 'F') code += 10u + static_cast<unsigned int>(h - 'A');
            else fail("invalid hex digit in unicode escape");
        }
        return code;
    }

    static void appendUtf8(std::string& out, unsigned int code) {
        if (code <= 0x7F) {
            out.push_back(static_cast<char>(code));
        } else if (code <= 0x7FF) {
            out.push_back(static_cast<char>(0xC0 | ((code >> 6) & 0x1F)));
            out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
        } else if (code <= 0xFFFF) {
            out.push_back(static_cast<char>(0xE0 | ((code >> 12) & 0x0F)));
            out.push_back(static_cast<char>(0x80 | ((code >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
        } else {
            out.push_back(static_cast<char>(0xF0 | ((code >> 18) & 0x07)));
            out.push_back(static_cast<char>(0x80 | ((code >> 12) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | ((code >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
        }
    }

    std::string parseString() {
        skipWs();
        if (i >= s.size() || s[i] != '"') fail("expected '\"' at string start");
        ++i;
        std::string out;
        while (true) {
            if (i >= s.size()) fail("unterminated string");
            char c = s[i++];
            if (c == '"') break;
            if (c != '\\') {
                out.push_back(c);
                continue;
            }
            if (i >= s.size()) fail("invalid escape");
            char e = s[i++];
            switch (e) {
                case '"': out.push_back('"'); break;
                case '\\': out.push_back('\\'); break;
                case '/': out.push_back('/'); break;
                case 'b': out.push_back('\b'); break;
                case 'f': out.push_back('\f'); break;
                case 'n': out.push_back('\n'); break;
                case 'r': out.push_back('\r'); break;
                case 't': out.push_back('\t'); break;
                case 'u': {
                    unsigned int code = parseHex4();
                    // Combine UTF-16 surrogate pairs; a lone surrogate becomes U+FFFD
                    if (code >= 0xD800 && code <= 0xDBFF) {
                        if (i + 6 <= s.size() && s[i] == '\\' && s[i + 1] == 'u') {
                            i += 2;
                            unsigned int low = parseHex4();
                            if (low >= 0xDC00 && low <= 0xDFFF) {
                                code = 0x10000 + ((code - 0xD800) << 10) + (low - 0xDC00);
                            } else {
                                code = 0xFFFD;
                            }
                        } else {
                            code = 0xFFFD;
                        }
                    } else if (code >= 0xDC00 && code <= 0xDFFF) {
                        code = 0xFFFD;
                    }
                    appendUtf8(out, code);
                    break;
                }
                default: fail("unknown escape");
            }
        }
        return out;
    }

    JSONValue parseNumber() {
        skipWs();
        std::size_t start = i;
        if (i < s.size() && s[i] == '-') ++i;
        std::size_t digitsStart = i;
        while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
        if (i == digitsStart) fail("invalid number");
        bool isFloat = false;
        if (i < s.size() && s[i] == '.') {
            isFloat = true; ++i;
            while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
        }
        if (i < s.size() && (s[i] == 'e' || s[i] == 'E')) {
            isFloat = true; ++i;
            if (i < s.size() && (s[i] == '-' || s[i] == '+')) ++i;
            while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
        }
        std::string num = s.substr(start, i - start);
        if (!isFloat) {
            try {
                return JSONValue(static_cast<int64_t>(std::stoll(num)));
            } catch (const std::out_of_range&) {
                // falls through to double for integers beyond int64
            }
        }
        try {
            return JSONValue(std::stod(num));
        } catch (const std::exception&) {
            fail("number out of range");
        }
    }

    JSONValue parseArray() {
        if (!match('[')) fail("expected '['");
        if (++depth > MaxDepth) fail("nesting too deep");
        JSONValue::Array arr;
        if (match(']')) { --depth; return JSONValue(std::move(arr)); }
        while (true) {
            arr.push_back(std::make_shared<JSONValue>(parseValue()));
            if (match(']')) break;
            if (!match(',')) fail("expected ',' in array");
        }
        --depth;
        return JSONValue(std::move(arr));
    }

    JSONValue parseObject() {
        if (!match('{')) fail("expected '{'");
        if (++depth > MaxDepth) fail("nesting too deep");
        JSONValue::Object obj;
        if (match('}')) { --depth; return JSONValue(std::move(obj)); }
        while (true) {
            std::string key = parseString();
            if (!match(':')) fail("expected ':' after key");
            obj[key] = std::make_shared<JSONValue>(parseValue());
            if (match('}')) break;
            if (!match(',')) fail("expected ',' in object");
        }
        --depth;
        return JSONValue(std::move(obj));
    }

    JSONValue parseValue() {
        skipWs();
        if (i >= s.size()) fail("unexpected end of input");
        char c = s[i];
        if (c == '"') return JSONValue(parseString());
        if (c == '{') return parseObject();
        if (c == '[') return parseArray();
        if (s.compare(i, 4, "true") == 0) { i += 4; return JSONValue(true); }
        if (s.compare(i, 5, "false") == 0) { i += 5; return JSONValue(false); }
        if (s.compare(i, 4, "null") == 0) { i += 4; return JSONValue(nullptr); }
        if (c == '-' || std::isdigit(static_cast<unsigned char>(c))) return parseNumber();
        fail("unexpected character");
    }
};

void appendEscaped(std::string& out, const std::string& v) {
    out.push_back('"');
    for (char c : v) {
        switch (c) {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\b': out += "\\b"; break;
            case '\f': out += "\\f"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    out += std::format("\\u{:04x}", static_cast<unsigned int>(static_cast<unsigned char>(c)));
                } else {
                    out.push_back(c);
                }
                break;
        }
    }
    out.push_back('"');
}

void serializeInto(std::string& out, const JSONValue& value) {
    std::visit([&out](const auto& v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) {
            out += "null";
        } else if constexpr (std::is_same_v<T, bool>) {
            out += v ? "true" : "false";
        } else if constexpr (std::is_same_v<T, int64_t>) {
            out += std::to_string(v);
        } else if constexpr (std::is_same_v<T, double>) {
            if (std::isfinite(v)) {
                out += std::format("{}", v);
            } else {
                out += "null";
            }
        } else if constexpr (std::is_same_v<T, std::string>) {
            appendEscaped(out, v);
        } else if constexpr (std::is_same_v<T, JSONValue::Array>) {
            out.push_back('[');
            for (std::size_t k = 0; k < v.size(); ++k) {
                if (k > 0) out.push_back(',');
                if (v[k]) { serializeInto(out, *v[k]); } else { out += "null"; }
            }
            out.push_back(']');
        } else if constexpr (std::is_same_v<T, JSONValue::Object>) {
            std::vector<const std::string*> keys;
            keys.reserve(v.size());
            for (const auto& kv : v) keys.push_back(&kv.first);
            std::sort(keys.begin(), keys.end(), [](const std::string* a, const std::string* b) { return *a < *b; });
            out.push_back('{');
            bool first = true;
            for (const std::string* key : keys) {
                if (!first) out.push_back(',');
                first = false;
                appendEscaped(out, *key);
                out.push_back(':');
                const auto& val = v.at(*key);
                if (val) { serializeInto(out, *val); } else { out += "null"; }
            }
            out.push_back('}');
        }
    }, value.get());
}

JSONValue idToValue(const JSONRPCId& id) {
    return std::visit([](const auto& v) -> JSONValue {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::string>) { return JSONValue(v); }
        else if constexpr (std::is_same_v<T, int64_t>) { return JSONValue(v); }
        else { return JSONValue(nullptr); }
    }, id);
}

bool idFromValue(const JSONValue* v, JSONRPCId& out) {
    if (!v) { out = nullptr; return false; }
    if (std::holds_alternative<std::string>(v->value)) { out = std::get<std::string>(v->value); return true; }
    if (std::holds_alternative<int64_t>(v->value)) { out = std::get<int64_t>(v->value); return true; }
    if (std::holds_alternative<double>(v->value)) { out = static_cast<int64_t>(std::get<double>(v->value)); return true; }
    out = nullptr;
    return v->isNull();
}
} // namespace

JSONValue parseJSONValue(const std::string& text) {
    JsonParser p(text);
    JSONValue v = p.parseValue();
    p.skipWs();
    if (p.i != text.size()) {
        p.fail("trailing characters after JSON value");
    }
    return v;
}

std::string serializeJSONValue(const JSONValue& value) {
    std::string out;
    serializeInto(out, value);
    return out;
}

//----------------------------------------------------------------------------------------------------------
// json helpers
//----------------------------------------------------------------------------------------------------------
namespace json {

const JSONValue* member(const JSONValue& obj, const std::string& key) {
    if (!obj.isObject()) return nullptr;
    const auto& o = std::get<JSONValue::Object>(obj.value);
    auto it = o.find(key);
    if (it == o.end() || !it->second) return nullptr;
    return it->second.get();
}

std::optional<std::string> getString(const JSONValue& obj, const std::string& key) {
    const JSONValue* v = member(obj, key);
    if (!v || !v->isString()) return std::nullopt;
    return std::get<std::string>(v->value);
}

std::optional<bool> getBool(const JSONValue& obj, const std::string& key) {
    const JSONValue* v = member(obj, key);
    if (!v || !std::holds_alternative<bool>(v->value)) return std::nullopt;
    return std::get<bool>(v->value);
}

std::optional<int64_t> getInt(const JSONValue& obj, const std::string& key) {
    const JSONValue* v = member(obj, key);
    if (!v) return std::nullopt;
    if (std::holds_alternative<int64_t>(v->value)) return std::get<int64_t>(v->value);
    if (std::holds_alternative<double>(v->value)) return static_cast<int64_t>(std::get<double>(v->value));
    return std::nullopt;
}

const JSONValue::Array* getArray(const JSONValue& obj, const std::string& key) {
    const JSONValue* v = member(obj, key);
    if (!v || !v->isArray()) return nullptr;
    return &std::get<JSONValue::Array>(v->value);
}

const JSONValue* getObject(const JSONValue& obj, const std::string& key) {
    const JSONValue* v = member(obj, key);
    if (!v || !v->isObject()) return nullptr;
    return v;
}

void set(JSONValue::Object& obj, const std::string& key, JSONValue v) {
    obj[key] = std::make_shared<JSONValue>(std::move(v));
}
void set(JSONValue::Object& obj, const std::string& key, const std::string& s) { set(obj, key, JSONValue(s)); }
void set(JSONValue::Object& obj, const std::string& key, const char* s) { set(obj, key, JSONValue(s)); }
void set(JSONValue::Object& obj, const std::string& key, bool b) { set(obj, key, JSONValue(b)); }
void set(JSONValue::Object& obj, const std::string& key, int64_t n) { set(obj, key, JSONValue(n)); }

std::optional<std::string> scalarToString(const JSONValue& v) {
    if (v.isString()) return std::get<std::string>(v.value);
    if (std::holds_alternative<bool>(v.value)) return std::string(std::get<bool>(v.value) ? "true" : "false");
    if (std::holds_alternative<int64_t>(v.value)) return std::to_string(std::get<int64_t>(v.value));
    if (std::holds_alternative<double>(v.value)) return std::format("{}", std::get<double>(v.value));
    return std::nullopt;
}

} // namespace json

std::string idToString(const JSONRPCId& id) {
    return std::visit([](const auto& v) -> std::string {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::string>) { return v; }
        else if constexpr (std::is_same_v<T, int64_t>) { return std::to_string(v); }
        else { return std::string(); }
    }, id);
}

bool idIsSet(const JSONRPCId& id) {
    if (std::holds_alternative<std::string>(id)) return !std::get<std::string>(id).empty();
    return std::holds_alternative<int64_t>(id);
}

JSONRPCMessageKind classifyMessage(const JSONValue& v) {
    if (!v.isObject()) return JSONRPCMessageKind::Invalid;
    const bool hasMethod = json::getString(v, "method").has_value();
    const bool hasId = json::member(v, "id") != nullptr;
    if (hasMethod && hasId) return JSONRPCMessageKind::Request;
    if (hasMethod) return JSONRPCMessageKind::Notification;
    if (json::member(v, "result") || json::member(v, "error")) return JSONRPCMessageKind::Response;
    return JSONRPCMessageKind::Invalid;
}

//----------------------------------------------------------------------------------------------------------
// JSON-RPC messages
//----------------------------------------------------------------------------------------------------------
std::string JSONRPCRequest::Serialize() const {
    JSONValue::Object o;
    json::set(o, "jsonrpc", jsonrpc);
    json::set(o, "id", idToValue(id));
    json::set(o, "method", method);
    if (params.has_value()) {
        json::set(o, "params", params.value());
    }
    return serializeJSONValue(JSONValue(std::move(o)));
}

bool JSONRPCRequest::FromValue(const JSONValue& v) {
    auto m = json::getString(v, "method");
    if (!m) return false;
    method = *m;
    idFromValue(json::member(v, "id"), id);
    if (const JSONValue* p = json::member(v, "params")) {
        params = *p;
    }
    return true;
}

bool JSONRPCRequest::Deserialize(const std::string& text) {
    try {
        return FromValue(parseJSONValue(text));
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to deserialize JSONRPCRequest: {}", e.what());
        return false;
    }
}

std::string JSONRPCResponse::Serialize() const {
    JSONValue::Object o;
    json::set(o, "jsonrpc", jsonrpc);
    json::set(o, "id", idToValue(id));
    if (error.has_value()) {
        json::set(o, "error", error.value());
    } else {
        json::set(o, "result", result.has_value() ? result.value() : JSONValue(JSONValue::Object{}));
    }
    return serializeJSONValue(JSONValue(std::move(o)));
}

bool JSONRPCResponse::FromValue(const JSONValue& v) {
    if (!v.isObject()) return false;
    idFromValue(json::member(v, "id"), id);
    const JSONValue* r = json::member(v, "result");
    const JSONValue* e = json::member(v, "error");
    if (!r && !e) return false;
    if (r) result = *r;
    if (e) error = *e;
    return true;
}

bool JSONRPCResponse::Deserialize(const std::string& text) {
    try {
        return FromValue(parseJSONValue(text));
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to deserialize JSONRPCResponse: {}", e.what());
        return false;
    }
}

std::string JSONRPCNotification::Serialize() const {
    JSONValue::Object o;
    json::set(o, "jsonrpc", jsonrpc);
    json::set(o, "method", method);
    if (params.has_value()) {
        json::set(o, "params", params.value());
    }
    return serializeJSONValue(JSONValue(std::move(o)));
}

bool JSONRPCNotification::FromValue(const JSONValue& v) {
    auto m = json::getString(v, "method");
    if (!m) return false;
    method = *m;
    if (const JSONValue* p = json::member(v, "params")) {
        params = *p;
    }
    return true;
}

bool JSONRPCNotification::Deserialize(const std::string& text) {
    try {
        return FromValue(parseJSONValue(text));
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to deserialize JSONRPCNotification: {}", e.what());
        return false;
    }
}

JSONValue CreateErrorObject(int code, const std::string& message,
                            const std::optional<JSONValue>& data) {
    JSONValue::Object errorObj;
    json::set(errorObj, "code", static_cast<int64_t>(code));
    json::set(errorObj, "message", message);
    if (data.has_value()) {
        json::set(errorObj, "data", data.value());
    }
    return JSONValue(std::move(errorObj));
}

std::unique_ptr<JSONRPCResponse> CreateErrorResponse(
    const JSONRPCId& id, int code, const std::string& message,
    const std::optional<JSONValue>& data) {
    auto response = std::make_unique<JSONRPCResponse>();
    response->id = id;
    response->error = CreateErrorObject(code, message, data);
    return response;
}

} // namespace mcphost
