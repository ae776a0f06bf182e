//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: WwwAuthenticate.cpp
// Purpose: Parser for HTTP WWW-Authenticate Bearer challenges returned by network tool servers
//==========================================================================================================

#include "mcphost/auth/WwwAuthenticate.hpp"

#include <cctype>

namespace mcphost::auth {

namespace {
std::string toLower(std::string s) {
    for (auto& c : s) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return s;
}

void skipSpaces(const std::string& s, size_t& i) {
    while (i < s.size() && (s[i] == ' ' || s[i] == '\t')) {
        ++i;
    }
}

bool parseToken(const std::string& s, size_t& i, std::string& out) {
    out.clear();
    size_t start = i;
    while (i < s.size()) {
        char ch = s[i];
        if (ch == ' ' || ch == '\t' || ch == '=' || ch == ',' || ch == '"') {
            break;
        }
        ++i;
    }
    if (i == start) {
        return false;
    }
    out = s.substr(start, i - start);
    return true;
}

bool parseQuoted(const std::string& s, size_t& i, std::string& out) {
    out.clear();
    if (i >= s.size() || s[i] != '"') {
        return false;
    }
    ++i;
    while (i < s.size()) {
        char ch = s[i];
        if (ch == '\\') {
            if (i + 1 >= s.size()) {
                return false;
            }
            out.push_back(s[i + 1]);
            i += 2;
            continue;
        }
        if (ch == '"') {
            ++i;
            return true;
        }
        out.push_back(ch);
        ++i;
    }
    return false; // unterminated
}

std::string parseBareValue(const std::string& s, size_t& i) {
    size_t start = i;
    while (i < s.size() && s[i] != ',') {
        ++i;
    }
    size_t end = i;
    while (end > start && (s[end - 1] == ' ' || s[end - 1] == '\t')) {
        --end;
    }
    return s.substr(start, end - start);
}
} // namespace

std::optional<std::string> WwwAuthChallenge::Param(const std::string& key) const {
    auto it = params.find(key);
    if (it == params.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<WwwAuthChallenge> ParseBearerChallenge(const std::string& header) {
    WwwAuthChallenge out;
    size_t i = 0;
    skipSpaces(header, i);

    std::string scheme;
    if (!parseToken(header, i, scheme) || toLower(scheme) != "bearer") {
        return std::nullopt;
    }
    out.scheme = "bearer";

    while (i < header.size()) {
        skipSpaces(header, i);
        if (i < header.size() && header[i] == ',') {
            ++i;
            continue;
        }
        std::string key;
        if (!parseToken(header, i, key)) {
            break;
        }
        key = toLower(key);
        skipSpaces(header, i);
        if (i >= header.size() || header[i] != '=') {
            out.params[key] = std::string();
            continue;
        }
        ++i;
        skipSpaces(header, i);
        std::string value;
        if (i < header.size() && header[i] == '"') {
            if (!parseQuoted(header, i, value)) {
                return std::nullopt;
            }
        } else {
            value = parseBareValue(header, i);
        }
        out.params[key] = std::move(value);
    }
    return out;
}

std::string DescribeChallenge(const WwwAuthChallenge& challenge) {
    std::string out = challenge.Param("error").value_or("unauthorized");
    if (auto desc = challenge.Param("error_description"); desc && !desc->empty()) {
        out += ": " + *desc;
    }
    if (auto meta = challenge.Param("resource_metadata"); meta && !meta->empty()) {
        out += " (resource metadata: " + *meta + ")";
    }
    return out;
}

} // namespace mcphost::auth
