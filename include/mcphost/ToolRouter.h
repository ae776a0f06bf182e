//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ToolRouter.h
// Purpose: Collision-free capability namespace over all running tool servers, and call dispatch
//==========================================================================================================

#pragma once

#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "mcphost/Protocol.h"

namespace mcphost {

//==========================================================================================================
// CapabilityDescriptor
// Purpose: One capability as the agent sees it.
// Fields:
//   prefixedName: "<prefix><separator><localName>", unique across instances.
//   localName: Name the tool server itself uses.
//   instanceId: Owning instance.
//==========================================================================================================
struct CapabilityDescriptor {
    std::string prefixedName;
    std::string localName;
    std::string instanceId;
    std::string description;
    JSONValue inputSchema;
};

//==========================================================================================================
// InstanceView
// Purpose: What the manager publishes per instance. Dormant views (running == false) belong to instances
//          stopped by idle eviction: they keep their prefix and stay callable (the call restarts them) but
//          are not listed.
//          prefix is the name reserved for the instance by its owner. It stays the same whichever other
//          instances are running; when empty the router derives one from displayName.
//==========================================================================================================
struct InstanceView {
    std::string id;
    std::string displayName;
    std::vector<Tool> tools;
    bool running{true};
    std::string prefix;
};

// Receives the manager's instance table on every lifecycle transition.
class ICapabilitySink {
public:
    virtual ~ICapabilitySink() = default;
    virtual void Publish(std::vector<InstanceView> views) = 0;
};

// Forwards a call to the owning instance (starting it when needed).
class IInstanceDispatcher {
public:
    virtual ~IInstanceDispatcher() = default;
    virtual JSONValue Dispatch(const std::string& instanceId, const std::string& localName,
                               const JSONValue& arguments, std::chrono::milliseconds timeout) = 0;
};

//==========================================================================================================
// ToolRouter
// Purpose: Holds an immutable snapshot (prefix -> instance, prefixed name -> descriptor) that the manager
//          replaces wholesale, so readers never see a half-applied transition.
//==========================================================================================================
class ToolRouter : public ICapabilitySink {
public:
    explicit ToolRouter(std::string separator = ".");

    void SetDispatcher(IInstanceDispatcher* dispatcher);

    //==========================================================================================================
    // Publish
    // Purpose: Rebuilds the snapshot. Reserved prefixes are taken as given; the others are derived in view
    //          order with ReservePrefix.
    //==========================================================================================================
    void Publish(std::vector<InstanceView> views) override;

    // Capabilities of running instances, in publish order.
    std::vector<CapabilityDescriptor> List() const;

    // "- <prefixed>: <description>" per line; empty when nothing is running.
    std::string DescribeForPrompt() const;

    //==========================================================================================================
    // Call
    // Purpose: Splits prefixedName on the first separator and forwards the local name to the owner.
    // Notes:
    //   Throws HostError{RoutingError} without dispatching when the name has no separator, the prefix is
    //   unknown, or the capability does not belong to the instance the prefix names. Other failures
    //   (CallTimeout, TransportDisconnected, ToolError, ...) come from the dispatcher unchanged.
    //==========================================================================================================
    JSONValue Call(const std::string& prefixedName, const JSONValue& arguments,
                   std::chrono::milliseconds timeout) const;

    // Instance id the prefix currently maps to.
    std::optional<std::string> ResolvePrefix(const std::string& prefix) const;

    // Prefix assigned to an instance id.
    std::optional<std::string> PrefixFor(const std::string& instanceId) const;

    const std::string& Separator() const { return separator; }

    // Lower-case; anything outside [a-z0-9_-] becomes '_'; runs collapsed; trimmed; empty -> "server".
    static std::string SanitizePrefix(const std::string& displayName);

    //==========================================================================================================
    // ReservePrefix
    // Purpose: Picks the prefix for a new instance: the sanitized display name, or, when another instance
    //          already holds it, that name plus "_<first 8 chars of id>".
    //==========================================================================================================
    static std::string ReservePrefix(const std::string& displayName, const std::string& instanceId,
                                     const std::set<std::string>& taken);

private:
    struct Entry {
        CapabilityDescriptor descriptor;
        bool running{true};
    };
    struct Snapshot {
        std::map<std::string, std::string> instanceByPrefix;
        std::map<std::string, std::string> prefixByInstance;
        std::map<std::string, Entry> byName;
        std::vector<std::string> order;
    };

    std::shared_ptr<const Snapshot> current() const;

    std::string separator;
    mutable std::mutex mutex;
    std::shared_ptr<const Snapshot> snapshot;
    IInstanceDispatcher* dispatcher{nullptr};
};

} // namespace mcphost
