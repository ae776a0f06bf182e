//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ToolRouter.cpp
// Purpose: Capability namespace and call routing across running tool servers
//==========================================================================================================

#include <cctype>

#include "logging/Logger.h"
#include "mcphost/ToolRouter.h"
#include "mcphost/errors/Errors.h"

namespace mcphost {

ToolRouter::ToolRouter(std::string sep)
    : separator(std::move(sep)), snapshot(std::make_shared<const Snapshot>()) {
    if (separator.empty()) {
        throw std::invalid_argument("ToolRouter separator must not be empty");
    }
}

void ToolRouter::SetDispatcher(IInstanceDispatcher* d) {
    std::lock_guard<std::mutex> lk(mutex);
    dispatcher = d;
}

std::string ToolRouter::SanitizePrefix(const std::string& displayName) {
    std::string out;
    out.reserve(displayName.size());
    for (unsigned char c : displayName) {
        char lc = static_cast<char>(std::tolower(c));
        bool keep = (lc >= 'a' && lc <= 'z') || (lc >= '0' && lc <= '9') || lc == '-' || lc == '_';
        if (!keep) lc = '_';
        if (lc == '_' && !out.empty() && out.back() == '_') continue;
        out.push_back(lc);
    }
    while (!out.empty() && (out.front() == '_' || out.front() == '-')) out.erase(out.begin());
    while (!out.empty() && (out.back() == '_' || out.back() == '-')) out.pop_back();
    if (out.empty()) out = "server";
    return out;
}

std::shared_ptr<const ToolRouter::Snapshot> ToolRouter::current() const {
    std::lock_guard<std::mutex> lk(mutex);
    return snapshot;
}

std::string ToolRouter::ReservePrefix(const std::string& displayName, const std::string& instanceId,
                                      const std::set<std::string>& taken) {
    std::string prefix = SanitizePrefix(displayName);
    if (!taken.count(prefix)) return prefix;
    prefix += "_" + instanceId.substr(0, 8);
    // ids are unique; a second clash means two ids share their first 8 characters
    std::size_t n = 2;
    const std::string base = prefix;
    while (taken.count(prefix)) {
        prefix = base + "_" + std::to_string(n++);
    }
    return prefix;
}

void ToolRouter::Publish(std::vector<InstanceView> views) {
    auto next = std::make_shared<Snapshot>();
    std::set<std::string> taken;
    for (const auto& view : views) {
        if (!view.prefix.empty()) taken.insert(view.prefix);
    }
    for (auto& view : views) {
        std::string prefix = view.prefix;
        if (prefix.empty()) {
            prefix = ReservePrefix(view.displayName, view.id, taken);
            taken.insert(prefix);
        } else if (next->instanceByPrefix.count(prefix)) {
            LOG_WARN("Prefix '{}' reserved twice; ignoring instance {}", prefix, view.id);
            continue;
        }
        next->instanceByPrefix[prefix] = view.id;
        next->prefixByInstance[view.id] = prefix;

        for (auto& tool : view.tools) {
            Entry entry;
            entry.descriptor.prefixedName = prefix + separator + tool.name;
            entry.descriptor.localName = tool.name;
            entry.descriptor.instanceId = view.id;
            entry.descriptor.description = tool.description;
            entry.descriptor.inputSchema = tool.inputSchema;
            entry.running = view.running;
            if (next->byName.count(entry.descriptor.prefixedName)) {
                LOG_WARN("Duplicate capability '{}' from instance {}; keeping the first", entry.descriptor.prefixedName, view.id);
                continue;
            }
            next->order.push_back(entry.descriptor.prefixedName);
            next->byName.emplace(entry.descriptor.prefixedName, std::move(entry));
        }
    }
    LOG_DEBUG("Router published: {} instances, {} capabilities", next->instanceByPrefix.size(), next->order.size());
    std::lock_guard<std::mutex> lk(mutex);
    snapshot = std::move(next);
}

std::vector<CapabilityDescriptor> ToolRouter::List() const {
    auto snap = current();
    std::vector<CapabilityDescriptor> out;
    out.reserve(snap->order.size());
    for (const auto& name : snap->order) {
        const auto& entry = snap->byName.at(name);
        if (entry.running) {
            out.push_back(entry.descriptor);
        }
    }
    return out;
}

std::string ToolRouter::DescribeForPrompt() const {
    std::string out;
    for (const auto& cap : List()) {
        out += "- " + cap.prefixedName;
        if (!cap.description.empty()) {
            out += ": " + cap.description;
        }
        out += "\n";
    }
    return out;
}

std::optional<std::string> ToolRouter::ResolvePrefix(const std::string& prefix) const {
    auto snap = current();
    auto it = snap->instanceByPrefix.find(prefix);
    if (it == snap->instanceByPrefix.end()) return std::nullopt;
    return it->second;
}

std::optional<std::string> ToolRouter::PrefixFor(const std::string& instanceId) const {
    auto snap = current();
    auto it = snap->prefixByInstance.find(instanceId);
    if (it == snap->prefixByInstance.end()) return std::nullopt;
    return it->second;
}

JSONValue ToolRouter::Call(const std::string& prefixedName, const JSONValue& arguments,
                           std::chrono::milliseconds timeout) const {
    FUNC_SCOPE();
    const auto pos = prefixedName.find(separator);
    if (pos == std::string::npos || pos == 0) {
        throw HostError(ErrorKind::RoutingError, "Capability name '" + prefixedName + "' has no server prefix");
    }
    const std::string prefix = prefixedName.substr(0, pos);
    const std::string localName = prefixedName.substr(pos + separator.size());

    IInstanceDispatcher* target = nullptr;
    std::shared_ptr<const Snapshot> snap;
    {
        std::lock_guard<std::mutex> lk(mutex);
        target = dispatcher;
        snap = snapshot;
    }
    auto inst = snap->instanceByPrefix.find(prefix);
    if (inst == snap->instanceByPrefix.end()) {
        throw HostError(ErrorKind::RoutingError, "No running tool server has prefix '" + prefix + "'");
    }
    auto entry = snap->byName.find(prefixedName);
    if (entry == snap->byName.end() || entry->second.descriptor.instanceId != inst->second) {
        throw HostError(ErrorKind::RoutingError,
                        "Tool server '" + prefix + "' has no capability '" + localName + "'");
    }
    if (!target) {
        throw HostError(ErrorKind::RoutingError, "No dispatcher attached to the router");
    }
    return target->Dispatch(inst->second, localName, arguments, timeout);
}

} // namespace mcphost
