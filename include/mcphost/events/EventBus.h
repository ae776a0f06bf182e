//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: EventBus.h
// Purpose: Typed in-process publish/subscribe channel and the host's lifecycle events
//==========================================================================================================

#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <variant>
#include <vector>

#include "logging/Logger.h"
#include "mcphost/Status.h"

namespace mcphost {

//==========================================================================================================
// EventBus
// Purpose: Delivers each published event to every subscriber registered at the time of Publish.
// Notes:
//   - Handlers run synchronously on the publishing thread, outside the bus lock, so a handler may
//     subscribe or unsubscribe. A handler that throws is logged and skipped.
//   - Publishers must not hold their own locks while publishing.
//==========================================================================================================
template <typename Event>
class EventBus {
public:
    using Handler = std::function<void(const Event&)>;
    using SubscriptionId = std::uint64_t;

    SubscriptionId Subscribe(Handler handler) {
        std::lock_guard<std::mutex> lk(mutex_);
        const SubscriptionId id = ++nextId_;
        handlers_.emplace(id, std::move(handler));
        return id;
    }

    bool Unsubscribe(SubscriptionId id) {
        std::lock_guard<std::mutex> lk(mutex_);
        return handlers_.erase(id) > 0;
    }

    // Returns the number of subscribers the event was delivered to.
    std::size_t Publish(const Event& event) {
        std::vector<Handler> snapshot;
        {
            std::lock_guard<std::mutex> lk(mutex_);
            snapshot.reserve(handlers_.size());
            for (const auto& kv : handlers_) {
                snapshot.push_back(kv.second);
            }
        }
        std::size_t delivered = 0;
        for (const auto& h : snapshot) {
            try {
                h(event);
                ++delivered;
            } catch (const std::exception& e) {
                LOG_ERROR("EventBus: subscriber threw: {}", e.what());
            }
        }
        return delivered;
    }

    std::size_t SubscriberCount() const {
        std::lock_guard<std::mutex> lk(mutex_);
        return handlers_.size();
    }

private:
    mutable std::mutex mutex_;
    std::map<SubscriptionId, Handler> handlers_;
    SubscriptionId nextId_{0};
};

///////////////////////////////////////// Host events ///////////////////////////////////////////
struct InstanceStateChanged {
    std::string id;
    std::string name;
    InstanceState from;
    InstanceState to;
    std::string error; // set when entering Error
};

struct CapabilitiesChanged {
    std::string id;
    std::vector<std::string> tools; // local names; empty when the instance stopped
};

struct ToolCallCompleted {
    std::string id;
    std::string tool;
    bool success{false};
    std::int64_t durationMs{0};
};

struct ConfigDeleted {
    std::string id;
    std::string name;
};

using HostEvent = std::variant<InstanceStateChanged, CapabilitiesChanged, ToolCallCompleted, ConfigDeleted>;
using HostEventBus = EventBus<HostEvent>;

} // namespace mcphost
