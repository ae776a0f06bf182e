//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: EnvVars.h
// Purpose: Helpers to read environment variables safely and to build child-process environments.
//==========================================================================================================
#pragma once
#include <chrono>
#include <cstdlib>
#include <map>
#include <string>
#include <vector>

extern "C" char** environ;

//==========================================================================================================
// GetEnvOrDefault
// Purpose: Returns the value of the environment variable or a provided default when unset/empty.
// Args:
//   name: C-string name of the environment variable. When null or empty, returns defaultValue.
//   defaultValue: Value to return when the variable is not set.
// Returns:
//   std::string with the environment value (when set) or defaultValue otherwise.
//==========================================================================================================
inline std::string GetEnvOrDefault(const char* name, const std::string& defaultValue) {
    if (name == nullptr || *name == '\0') {
        return defaultValue;
    }
    const char* v = std::getenv(name);
    return (v && *v) ? std::string(v) : defaultValue;
}

//==========================================================================================================
// GetEnvMillisOrDefault
// Purpose: Reads a millisecond duration from the environment; unset or malformed values yield the default.
//==========================================================================================================
inline std::chrono::milliseconds GetEnvMillisOrDefault(const char* name, std::chrono::milliseconds defaultValue) {
    const std::string v = GetEnvOrDefault(name, "");
    if (v.empty()) return defaultValue;
    try {
        long long ms = std::stoll(v);
        if (ms < 0) return defaultValue;
        return std::chrono::milliseconds(ms);
    } catch (const std::exception&) {
        return defaultValue;
    }
}

//==========================================================================================================
// BuildChildEnvironment
// Purpose: Snapshot of the current process environment with the overlay applied on top.
// Args:
//   overlay: Variables that replace or extend the inherited ones.
// Returns:
//   "NAME=value" strings ready to be handed to execve/execvpe.
//==========================================================================================================
inline std::vector<std::string> BuildChildEnvironment(const std::map<std::string, std::string>& overlay) {
    std::map<std::string, std::string> merged;
    for (char** e = environ; e && *e; ++e) {
        std::string entry(*e);
        auto eq = entry.find('=');
        if (eq == std::string::npos || eq == 0) continue;
        merged[entry.substr(0, eq)] = entry.substr(eq + 1);
    }
    for (const auto& kv : overlay) {
        merged[kv.first] = kv.second;
    }
    std::vector<std::string> out;
    out.reserve(merged.size());
    for (const auto& kv : merged) {
        out.push_back(kv.first + "=" + kv.second);
    }
    return out;
}
