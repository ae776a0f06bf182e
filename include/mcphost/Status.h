//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Status.h
// Purpose: Instance lifecycle states, status snapshots and the aggregate health summary
//==========================================================================================================

#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "mcphost/errors/Errors.h"

namespace mcphost {

// Per-instance lifecycle state.
enum class InstanceState { Idle, Starting, Running, Error, Stopped };

inline const char* ToString(InstanceState state) {
    switch (state) {
        case InstanceState::Idle: return "Idle";
        case InstanceState::Starting: return "Starting";
        case InstanceState::Running: return "Running";
        case InstanceState::Error: return "Error";
        case InstanceState::Stopped: return "Stopped";
    }
    return "Unknown";
}

//==========================================================================================================
// InstanceStatus
// Purpose: Point-in-time copy of one instance's state for status queries and UIs.
// Fields:
//   state/enabled: Lifecycle state; disabled configs report Stopped with enabled == false.
//   errorKind/lastError: Why the instance is in Error (or why the last attempt failed).
//   restartCount: Automatic restarts since the last manual start/reset.
//   startedAt/lastUsed: Steady-clock stamps of the running process; empty when not running.
//   diagnostics: Captured stderr tail of the last failed process.
//==========================================================================================================
struct InstanceStatus {
    std::string id;
    std::string name;
    std::string prefix;  // capability prefix the router uses for this instance
    InstanceState state{InstanceState::Idle};
    bool enabled{true};
    std::optional<ErrorKind> errorKind;
    std::string lastError;
    unsigned int restartCount{0};
    std::optional<std::chrono::steady_clock::time_point> startedAt;
    std::optional<std::chrono::steady_clock::time_point> lastUsed;
    std::size_t toolCount{0};
    std::string diagnostics;

    bool IsRunning() const { return state == InstanceState::Running; }
    bool IsError() const { return state == InstanceState::Error; }

    // Short label for menus ("Starting...", "Disabled", ...).
    std::string DisplayName() const {
        if (!enabled) return "Disabled";
        switch (state) {
            case InstanceState::Idle: return "Idle";
            case InstanceState::Starting: return restartCount > 0 ? "Restarting..." : "Starting...";
            case InstanceState::Running: return "Running";
            case InstanceState::Error: return "Error";
            case InstanceState::Stopped: return "Stopped";
        }
        return "Unknown";
    }
};

enum class AggregateStatus { AllHealthy, PartialFailure, AllFailed, NoServers };

inline const char* ToString(AggregateStatus s) {
    switch (s) {
        case AggregateStatus::AllHealthy: return "AllHealthy";
        case AggregateStatus::PartialFailure: return "PartialFailure";
        case AggregateStatus::AllFailed: return "AllFailed";
        case AggregateStatus::NoServers: return "NoServers";
    }
    return "Unknown";
}

//==========================================================================================================
// Aggregate
// Purpose: Summarises enabled instances: none -> NoServers, all in Error -> AllFailed, some in Error ->
//          PartialFailure, otherwise AllHealthy. Idle instances count as healthy since they start on use.
//==========================================================================================================
inline AggregateStatus Aggregate(const std::vector<InstanceStatus>& statuses) {
    std::size_t enabled = 0;
    std::size_t errors = 0;
    for (const auto& s : statuses) {
        if (!s.enabled) continue;
        ++enabled;
        if (s.IsError()) ++errors;
    }
    if (enabled == 0) return AggregateStatus::NoServers;
    if (errors == enabled) return AggregateStatus::AllFailed;
    if (errors > 0) return AggregateStatus::PartialFailure;
    return AggregateStatus::AllHealthy;
}

} // namespace mcphost
