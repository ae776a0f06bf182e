//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ToolServerManager.cpp
// Purpose: Instance arena, lazy start, crash restart, idle eviction, health checks and dispatch
//==========================================================================================================

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <format>
#include <future>
#include <list>
#include <mutex>
#include <set>
#include <thread>
#include <unordered_map>

#include "env/EnvVars.h"
#include "logging/Logger.h"
#include "mcphost/CommandBuilder.h"
#include "mcphost/ToolServerManager.h"
#include "mcphost/ToolServerSession.h"
#include "mcphost/auth/TokenRefresher.hpp"
#include "mcphost/credentials/CredentialStore.h"
#include "mcphost/version.h"

namespace mcphost {

using SteadyClock = std::chrono::steady_clock;

ManagerOptions::ManagerOptions() : clientInfo(CLIENT_NAME, getVersionString()) {}

ManagerOptions ManagerOptions::FromEnvironment() {
    ManagerOptions o;
    o.idleTimeout = GetEnvMillisOrDefault("MCPHOST_IDLE_TIMEOUT_MS", o.idleTimeout);
    o.healthCheckInterval = GetEnvMillisOrDefault("MCPHOST_HEALTH_INTERVAL_MS", o.healthCheckInterval);
    o.healthCheckWindow = GetEnvMillisOrDefault("MCPHOST_HEALTH_WINDOW_MS", o.healthCheckWindow);
    o.handshakeTimeout = GetEnvMillisOrDefault("MCPHOST_HANDSHAKE_TIMEOUT_MS", o.handshakeTimeout);
    o.callTimeout = GetEnvMillisOrDefault("MCPHOST_CALL_TIMEOUT_MS", o.callTimeout);
    o.restartDelay = GetEnvMillisOrDefault("MCPHOST_RESTART_DELAY_MS", o.restartDelay);
    const std::string maxRestarts = GetEnvOrDefault("MCPHOST_MAX_RESTARTS", "");
    if (!maxRestarts.empty()) {
        try {
            o.maxRestartAttempts = static_cast<unsigned int>(std::stoul(maxRestarts));
        } catch (const std::exception&) {
            LOG_WARN("Ignoring malformed MCPHOST_MAX_RESTARTS='{}'", maxRestarts);
        }
    }
    return o;
}

namespace {

// Detached-style worker threads that are still joined on shutdown.
class TaskGroup {
public:
    ~TaskGroup() { JoinAll(); }

    void Spawn(std::function<void()> fn) {
        std::lock_guard<std::mutex> lk(mutex);
        reapLocked();
        auto done = std::make_shared<std::atomic<bool>>(false);
        std::thread t([fn = std::move(fn), done]() {
            try {
                fn();
            } catch (const std::exception& e) {
                LOG_ERROR("Manager task failed: {}", e.what());
            }
            done->store(true);
        });
        entries.push_back(Entry{std::move(t), std::move(done)});
    }

    void Reap() {
        std::lock_guard<std::mutex> lk(mutex);
        reapLocked();
    }

    void JoinAll() {
        while (true) {
            std::list<Entry> batch;
            {
                std::lock_guard<std::mutex> lk(mutex);
                batch.swap(entries);
            }
            if (batch.empty()) return;
            for (auto& e : batch) {
                if (e.thread.joinable()) e.thread.join();
            }
        }
    }

private:
    struct Entry {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    void reapLocked() {
        for (auto it = entries.begin(); it != entries.end();) {
            if (it->done->load()) {
                if (it->thread.joinable()) it->thread.join();
                it = entries.erase(it);
            } else {
                ++it;
            }
        }
    }

    std::mutex mutex;
    std::list<Entry> entries;
};

std::vector<std::string> toolNames(const std::vector<Tool>& tools) {
    std::vector<std::string> names;
    names.reserve(tools.size());
    for (const auto& t : tools) names.push_back(t.name);
    return names;
}

std::string describeExit(const DisconnectInfo& info) {
    std::string out = info.reason;
    if (info.exitCode) out += std::format(" (exit code {})", *info.exitCode);
    if (info.signal) out += std::format(" (signal {})", *info.signal);
    return out;
}

bool retryableAfterCrash(ErrorKind kind) {
    return kind == ErrorKind::SpawnFailed || kind == ErrorKind::HandshakeTimeout ||
           kind == ErrorKind::TransportDisconnected;
}

void closeSession(const std::shared_ptr<ToolServerSession>& session) {
    if (!session) return;
    try {
        session->Close();
    } catch (const std::exception& e) {
        LOG_WARN("Closing tool server session failed: {}", e.what());
    }
}

} // namespace

class ToolServerManager::Impl : public std::enable_shared_from_this<ToolServerManager::Impl> {
public:
    struct Slot {
        ServerConfig config;
        std::string prefix;           // router prefix, fixed while the config exists
        InstanceState state{InstanceState::Idle};
        std::shared_ptr<ToolServerSession> session;
        std::vector<Tool> tools;
        bool dormant{false};          // stopped by idle eviction, restarted on next use
        bool lostDuringStart{false};  // peer went away between Open() returning and Running
        std::uint64_t generation{0};
        unsigned int restartCount{0};
        std::optional<SteadyClock::time_point> startedAt;
        std::optional<SteadyClock::time_point> lastUsed;
        std::size_t inFlight{0};
        std::shared_future<void> startFuture;
        std::optional<ErrorKind> errorKind;
        std::string lastError;
        std::string diagnostics;
    };

    struct StartTicket {
        std::string id;
        ServerConfig config;
        std::uint64_t generation{0};
        std::shared_ptr<std::promise<void>> promise;
        bool isRestart{false};
    };

    using Events = std::vector<HostEvent>;

    Impl(CredentialStore& s, std::shared_ptr<ITransportLauncher> l, ICapabilitySink* k, ManagerOptions o,
         HostEventBus* e)
        : store(s), launcher(std::move(l)), sink(k), opts(std::move(o)), events(e),
          clock([]() { return SteadyClock::now(); }) {
        lastHealthCheck = clock();
    }

    SteadyClock::time_point now() const {
        std::lock_guard<std::mutex> lk(clockMutex);
        return clock();
    }

    void emit(const Events& evs) {
        if (!events) return;
        for (const auto& ev : evs) {
            events->Publish(ev);
        }
    }

    Slot& findLocked(const std::string& id, ErrorKind kind) {
        auto it = slots.find(id);
        if (it == slots.end()) {
            throw HostError(kind, "Unknown tool server id '" + id + "'");
        }
        return it->second;
    }

    void setStateLocked(Slot& s, InstanceState to, Events& evs, const std::string& error = std::string()) {
        if (s.state == to) return;
        InstanceStateChanged ev{s.config.id, s.config.name, s.state, to, error};
        LOG_INFO("Tool server '{}' {} -> {}", s.config.name, ToString(s.state), ToString(to));
        s.state = to;
        evs.emplace_back(std::move(ev));
    }

    // Prefixes held by every config except `except`, whatever their state.
    std::set<std::string> prefixesInUseLocked(const std::string& except) const {
        std::set<std::string> taken;
        for (const auto& kv : slots) {
            if (kv.first != except) taken.insert(kv.second.prefix);
        }
        return taken;
    }

    void publishLocked() {
        if (!sink) return;
        std::vector<InstanceView> views;
        for (const auto& id : order) {
            const Slot& s = slots.at(id);
            if (!s.config.enabled) continue;
            const bool running = s.state == InstanceState::Running && s.session;
            const bool dormant = s.state == InstanceState::Stopped && s.dormant;
            if (!running && !dormant) continue;
            views.push_back(InstanceView{s.config.id, s.config.name, s.tools, running, s.prefix});
        }
        sink->Publish(std::move(views));
    }

    //==========================================================================================================
    // Moves the instance out of Running/Starting. The returned session must be closed outside the lock.
    //==========================================================================================================
    std::shared_ptr<ToolServerSession> stopLocked(Slot& s, InstanceState target, bool dormant, Events& evs) {
        auto old = std::move(s.session);
        s.session.reset();
        ++s.generation;
        const bool hadTools = !s.tools.empty();
        if (!dormant) s.tools.clear();
        s.dormant = dormant;
        s.startedAt.reset();
        setStateLocked(s, target, evs);
        if (hadTools) {
            evs.emplace_back(CapabilitiesChanged{s.config.id, {}});
        }
        return old;
    }

    StartTicket beginStartLocked(Slot& s, bool isRestart, Events& evs) {
        StartTicket t;
        t.id = s.config.id;
        t.config = s.config;
        t.generation = ++s.generation;
        t.promise = std::make_shared<std::promise<void>>();
        t.isRestart = isRestart;
        s.startFuture = t.promise->get_future().share();
        s.lostDuringStart = false;
        setStateLocked(s, InstanceState::Starting, evs);
        return t;
    }

    // Blocks until the process is ready or the start failed; never throws.
    void runStart(StartTicket ticket) {
        std::shared_ptr<ToolServerSession> session;
        std::vector<Tool> tools;
        try {
            const ServerConfig& cfg = ticket.config;
            LOG_INFO("Starting tool server '{}' ({})", cfg.name, cfg.id);
            auth::ITokenRefresher* tokens = nullptr;
            {
                std::lock_guard<std::mutex> lk(mutex);
                tokens = refresher;
            }
            if (cfg.authMethod == AuthMethod::OAuth && tokens) {
                tokens->EnsureFreshToken(cfg);
            }
            LaunchSpec launch = Prepare(cfg, store);
            auto transport = launcher->CreateTransport(cfg, launch);
            if (!transport) {
                throw HostError(ErrorKind::SpawnFailed, "No transport available for '" + cfg.name + "'");
            }
            session = std::make_shared<ToolServerSession>(std::move(transport));
            std::weak_ptr<Impl> weak = weak_from_this();
            const std::string id = ticket.id;
            const std::uint64_t gen = ticket.generation;
            session->SetDisconnectHandler([weak, id, gen](const DisconnectInfo& info) {
                if (info.locallyInitiated) return;
                if (auto self = weak.lock()) {
                    self->handleCrash(id, gen, "tool server exited: " + describeExit(info), info.diagnostics);
                }
            });
            session->SetToolsChangedHandler([weak, id, gen]() {
                if (auto self = weak.lock()) {
                    self->refreshTools(id, gen);
                }
            });
            tools = session->Open(opts.clientInfo, opts.handshakeTimeout);
        } catch (const HostError& e) {
            failStart(std::move(ticket), session, e);
            return;
        } catch (const std::exception& e) {
            failStart(std::move(ticket), session, HostError(ErrorKind::SpawnFailed, e.what()));
            return;
        }
        finishStart(std::move(ticket), std::move(session), std::move(tools));
    }

    void finishStart(StartTicket ticket, std::shared_ptr<ToolServerSession> session, std::vector<Tool> tools) {
        Events evs;
        bool accepted = false;
        bool lost = false;
        {
            std::lock_guard<std::mutex> lk(mutex);
            auto it = slots.find(ticket.id);
            if (it != slots.end() && it->second.generation == ticket.generation && !shuttingDown) {
                Slot& s = it->second;
                if (s.lostDuringStart || !session->IsConnected()) {
                    lost = true;
                } else {
                    const auto t = now();
                    s.session = session;
                    s.tools = std::move(tools);
                    s.startedAt = t;
                    s.lastUsed = t;
                    s.dormant = false;
                    s.errorKind.reset();
                    s.lastError.clear();
                    s.diagnostics.clear();
                    setStateLocked(s, InstanceState::Running, evs);
                    evs.emplace_back(CapabilitiesChanged{s.config.id, toolNames(s.tools)});
                    publishLocked();
                    accepted = true;
                }
            }
        }
        if (lost) {
            std::optional<JSONValue> data;
            const std::string diag = session->GetDiagnostics();
            if (!diag.empty()) data = JSONValue(diag);
            failStart(std::move(ticket), session,
                      HostError(ErrorKind::TransportDisconnected, "Tool server exited right after the handshake",
                                std::move(data)));
            return;
        }
        if (!accepted) {
            closeSession(session);
            ticket.promise->set_exception(std::make_exception_ptr(HostError(
                ErrorKind::InstanceUnavailable, "Tool server '" + ticket.config.name + "' was stopped while starting")));
            return;
        }
        ticket.promise->set_value();
        emit(evs);
    }

    void failStart(StartTicket ticket, const std::shared_ptr<ToolServerSession>& session, const HostError& err) {
        std::string diagnostics;
        if (session) {
            diagnostics = session->GetDiagnostics();
            closeSession(session);
        }
        LOG_WARN("Tool server '{}' failed to start: {} ({})", ticket.config.name, err.what(), ToString(err.kind()));

        Events evs;
        std::optional<StartTicket> retry;
        std::optional<HostError> outcome;
        {
            std::lock_guard<std::mutex> lk(mutex);
            auto it = slots.find(ticket.id);
            if (it == slots.end() || it->second.generation != ticket.generation || shuttingDown) {
                outcome = err;
            } else {
                Slot& s = it->second;
                s.diagnostics = diagnostics;
                if (ticket.isRestart && retryableAfterCrash(err.kind()) && s.restartCount < opts.maxRestartAttempts) {
                    ++s.restartCount;
                    StartTicket next;
                    next.id = ticket.id;
                    next.config = s.config;
                    next.generation = ++s.generation;
                    next.promise = ticket.promise;
                    next.isRestart = true;
                    retry = std::move(next);
                    s.lastError = err.what();
                } else {
                    ErrorKind kind = err.kind();
                    std::string message = err.what();
                    if (ticket.isRestart && retryableAfterCrash(err.kind())) {
                        kind = ErrorKind::MaxRestartsExceeded;
                        message = std::format("Tool server '{}' failed {} restart attempts: {}", s.config.name,
                                              s.restartCount, err.what());
                    }
                    s.errorKind = kind;
                    s.lastError = message;
                    s.tools.clear();
                    s.dormant = false;
                    ++s.generation;
                    setStateLocked(s, InstanceState::Error, evs, message);
                    publishLocked();
                    outcome = HostError(kind, message, err.data(), err.rpcCode());
                }
            }
        }
        emit(evs);
        if (retry) {
            scheduleRestart(std::move(*retry), nullptr);
            return;
        }
        ticket.promise->set_exception(std::make_exception_ptr(*outcome));
    }

    //==========================================================================================================
    // handleCrash
    // Purpose: Running instance lost its peer (or failed a health check). Restarts it after restartDelay
    //          while the counter allows, otherwise parks it in Error.
    // Notes:
    //   Called from transport threads; all blocking work is pushed to a task.
    //==========================================================================================================
    void handleCrash(const std::string& id, std::uint64_t gen, const std::string& reason,
                     const std::string& diagnostics) {
        Events evs;
        std::shared_ptr<ToolServerSession> old;
        std::optional<StartTicket> ticket;
        {
            std::lock_guard<std::mutex> lk(mutex);
            auto it = slots.find(id);
            if (it == slots.end() || it->second.generation != gen || shuttingDown) return;
            Slot& s = it->second;
            if (s.state == InstanceState::Starting) {
                s.lostDuringStart = true;
                return;
            }
            if (s.state != InstanceState::Running) return;

            LOG_WARN("Tool server '{}' crashed: {}", s.config.name, reason);
            old = std::move(s.session);
            s.session.reset();
            s.tools.clear();
            s.startedAt.reset();
            s.diagnostics = diagnostics;
            s.lastError = reason;
            evs.emplace_back(CapabilitiesChanged{id, {}});
            if (s.restartCount >= opts.maxRestartAttempts) {
                ++s.generation;
                s.errorKind = ErrorKind::MaxRestartsExceeded;
                s.lastError = std::format("Tool server '{}' crashed after {} restarts: {}", s.config.name,
                                          s.restartCount, reason);
                setStateLocked(s, InstanceState::Error, evs, s.lastError);
            } else {
                ++s.restartCount;
                ticket = beginStartLocked(s, true, evs);
            }
            publishLocked();
        }
        emit(evs);
        if (ticket) {
            scheduleRestart(std::move(*ticket), std::move(old));
        } else if (old) {
            tasks.Spawn([old]() { closeSession(old); });
        }
    }

    void scheduleRestart(StartTicket ticket, std::shared_ptr<ToolServerSession> old) {
        auto t = std::make_shared<StartTicket>(std::move(ticket));
        tasks.Spawn([this, t, old]() {
            closeSession(old);
            if (sleepInterruptible(opts.restartDelay)) {
                t->promise->set_exception(std::make_exception_ptr(
                    HostError(ErrorKind::InstanceUnavailable, "Host is shutting down")));
                return;
            }
            runStart(std::move(*t));
        });
    }

    void refreshTools(const std::string& id, std::uint64_t gen) {
        tasks.Spawn([this, id, gen]() {
            std::shared_ptr<ToolServerSession> session;
            {
                std::lock_guard<std::mutex> lk(mutex);
                auto it = slots.find(id);
                if (it == slots.end() || it->second.generation != gen || it->second.state != InstanceState::Running) return;
                session = it->second.session;
            }
            if (!session) return;
            std::vector<Tool> tools;
            try {
                tools = session->ListTools(opts.callTimeout);
            } catch (const HostError& e) {
                LOG_WARN("Refreshing tools of {} failed: {}", id, e.what());
                return;
            }
            Events evs;
            {
                std::lock_guard<std::mutex> lk(mutex);
                auto it = slots.find(id);
                if (it == slots.end() || it->second.generation != gen || it->second.state != InstanceState::Running) return;
                it->second.tools = tools;
                evs.emplace_back(CapabilitiesChanged{id, toolNames(tools)});
                publishLocked();
            }
            emit(evs);
        });
    }

    // Returns true when shutdown interrupted the wait.
    bool sleepInterruptible(std::chrono::milliseconds d) {
        std::unique_lock<std::mutex> lk(supMutex);
        return supCv.wait_for(lk, d, [this]() { return supStop; });
    }

    void supervise() {
        LOG_DEBUG("Manager supervisor running (interval={}ms)", opts.maintenanceInterval.count());
        while (!sleepInterruptible(opts.maintenanceInterval)) {
            try {
                runMaintenance();
            } catch (const std::exception& e) {
                LOG_ERROR("Manager maintenance failed: {}", e.what());
            }
        }
    }

    ///////////////////////////////////////// Operations ///////////////////////////////////////////
    void ensureRunning(const std::string& id) {
        std::shared_future<void> fut;
        std::optional<StartTicket> ticket;
        Events evs;
        {
            std::lock_guard<std::mutex> lk(mutex);
            if (shuttingDown) {
                throw HostError(ErrorKind::InstanceUnavailable, "Host is shutting down");
            }
            Slot& s = findLocked(id, ErrorKind::InstanceUnavailable);
            if (!s.config.enabled) {
                throw HostError(ErrorKind::InstanceUnavailable, "Tool server '" + s.config.name + "' is disabled");
            }
            switch (s.state) {
                case InstanceState::Running:
                    return;
                case InstanceState::Error:
                    throw HostError(s.errorKind.value_or(ErrorKind::InstanceUnavailable), s.lastError);
                case InstanceState::Starting:
                    fut = s.startFuture;
                    break;
                case InstanceState::Idle:
                case InstanceState::Stopped:
                    ticket = beginStartLocked(s, false, evs);
                    fut = s.startFuture;
                    break;
            }
        }
        emit(evs);
        if (ticket) {
            runStart(std::move(*ticket));
        }
        fut.get();
    }

    std::size_t evictIdle() {
        Events evs;
        std::vector<std::shared_ptr<ToolServerSession>> olds;
        {
            std::lock_guard<std::mutex> lk(mutex);
            const auto t = now();
            for (const auto& id : order) {
                Slot& s = slots.at(id);
                if (s.state != InstanceState::Running || s.inFlight > 0 || !s.lastUsed) continue;
                if (t - *s.lastUsed < opts.idleTimeout) continue;
                LOG_INFO("Evicting idle tool server '{}'", s.config.name);
                olds.push_back(stopLocked(s, InstanceState::Stopped, true, evs));
            }
            if (!olds.empty()) publishLocked();
        }
        emit(evs);
        for (auto& o : olds) closeSession(o);
        return olds.size();
    }

    void checkHealth() {
        struct Target {
            std::string id;
            std::uint64_t generation;
            std::shared_ptr<ToolServerSession> session;
        };
        std::vector<Target> targets;
        {
            std::lock_guard<std::mutex> lk(mutex);
            lastHealthCheck = now();
            for (const auto& id : order) {
                const Slot& s = slots.at(id);
                if (s.state == InstanceState::Running && s.session && s.inFlight == 0) {
                    targets.push_back(Target{id, s.generation, s.session});
                }
            }
        }
        std::vector<std::future<std::optional<std::string>>> pings;
        pings.reserve(targets.size());
        for (const auto& target : targets) {
            pings.push_back(std::async(std::launch::async, [this, session = target.session]() -> std::optional<std::string> {
                try {
                    session->Ping(opts.healthCheckWindow);
                    return std::nullopt;
                } catch (const HostError& e) {
                    return std::string(e.what());
                }
            }));
        }
        for (std::size_t i = 0; i < targets.size(); ++i) {
            auto failure = pings[i].get();
            if (failure) {
                handleCrash(targets[i].id, targets[i].generation, "health check failed: " + *failure,
                            targets[i].session->GetDiagnostics());
            }
        }
    }

    void runMaintenance() {
        if (shuttingDown) return;
        evictIdle();
        bool due = false;
        {
            std::lock_guard<std::mutex> lk(mutex);
            due = now() - lastHealthCheck >= opts.healthCheckInterval;
        }
        if (due) checkHealth();
        tasks.Reap();
    }

    void shutdownAll() {
        if (shuttingDown.exchange(true)) {
            tasks.JoinAll();
            return;
        }
        {
            std::lock_guard<std::mutex> lk(supMutex);
            supStop = true;
        }
        supCv.notify_all();
        if (supervisor.joinable()) supervisor.join();

        Events evs;
        std::vector<std::shared_ptr<ToolServerSession>> olds;
        {
            std::lock_guard<std::mutex> lk(mutex);
            for (const auto& id : order) {
                Slot& s = slots.at(id);
                if (s.state == InstanceState::Running || s.state == InstanceState::Starting || s.dormant) {
                    auto old = stopLocked(s, InstanceState::Stopped, false, evs);
                    if (old) olds.push_back(std::move(old));
                }
            }
            publishLocked();
        }
        emit(evs);
        if (!olds.empty()) {
            LOG_INFO("Shutting down {} tool server(s)", olds.size());
        }
        std::vector<std::future<void>> closing;
        for (auto& o : olds) {
            closing.push_back(std::async(std::launch::async, [o]() { closeSession(o); }));
        }
        for (auto& f : closing) f.get();
        tasks.JoinAll();
    }

    InstanceStatus statusLocked(const Slot& s) const {
        InstanceStatus st;
        st.id = s.config.id;
        st.name = s.config.name;
        st.prefix = s.prefix;
        st.state = s.state;
        st.enabled = s.config.enabled;
        st.errorKind = s.errorKind;
        st.lastError = s.lastError;
        st.restartCount = s.restartCount;
        st.startedAt = s.startedAt;
        if (s.state == InstanceState::Running) {
            st.lastUsed = s.lastUsed;
            st.toolCount = s.tools.size();
        }
        st.diagnostics = s.diagnostics;
        return st;
    }

    CredentialStore& store;
    std::shared_ptr<ITransportLauncher> launcher;
    ICapabilitySink* sink;
    ManagerOptions opts;
    HostEventBus* events;
    auth::ITokenRefresher* refresher{nullptr};

    mutable std::mutex clockMutex;
    Clock clock;

    mutable std::mutex mutex;
    std::unordered_map<std::string, Slot> slots;
    std::vector<std::string> order;
    SteadyClock::time_point lastHealthCheck;
    std::atomic<bool> shuttingDown{false};

    std::mutex supMutex;
    std::condition_variable supCv;
    bool supStop{false};
    std::thread supervisor;

    TaskGroup tasks;
};

ToolServerManager::ToolServerManager(CredentialStore& store, std::shared_ptr<ITransportLauncher> launcher,
                                     ICapabilitySink* sink, ManagerOptions options, HostEventBus* events)
    : pImpl(std::make_shared<Impl>(store, std::move(launcher), sink, std::move(options), events)) {
    if (!pImpl->launcher) {
        throw std::invalid_argument("ToolServerManager requires a transport launcher");
    }
    if (pImpl->opts.backgroundSupervisor) {
        Impl* impl = pImpl.get();
        pImpl->supervisor = std::thread([impl]() { impl->supervise(); });
    }
}

ToolServerManager::~ToolServerManager() {
    pImpl->shutdownAll();
}

void ToolServerManager::SetTokenRefresher(auth::ITokenRefresher* refresher) {
    std::lock_guard<std::mutex> lk(pImpl->mutex);
    pImpl->refresher = refresher;
}

void ToolServerManager::SetClock(Clock clock) {
    std::lock_guard<std::mutex> lk(pImpl->clockMutex);
    pImpl->clock = std::move(clock);
}

void ToolServerManager::AddConfig(ServerConfig cfg) {
    ValidateConfigInvariants(cfg);
    std::lock_guard<std::mutex> lk(pImpl->mutex);
    if (pImpl->slots.count(cfg.id)) {
        throw HostError(ErrorKind::ConfigError, "A tool server with id '" + cfg.id + "' already exists");
    }
    Impl::Slot slot;
    slot.prefix = ToolRouter::ReservePrefix(cfg.name, cfg.id, pImpl->prefixesInUseLocked(cfg.id));
    slot.state = cfg.enabled ? InstanceState::Idle : InstanceState::Stopped;
    const std::string id = cfg.id;
    slot.config = std::move(cfg);
    pImpl->order.push_back(id);
    pImpl->slots.emplace(id, std::move(slot));
    LOG_DEBUG("Added tool server config {} as '{}'", id, pImpl->slots.at(id).prefix);
}

void ToolServerManager::UpdateConfig(ServerConfig cfg) {
    ValidateConfigInvariants(cfg);
    Impl::Events evs;
    std::shared_ptr<ToolServerSession> old;
    {
        std::lock_guard<std::mutex> lk(pImpl->mutex);
        Impl::Slot& s = pImpl->findLocked(cfg.id, ErrorKind::ConfigError);
        const InstanceState target = cfg.enabled ? InstanceState::Idle : InstanceState::Stopped;
        old = pImpl->stopLocked(s, target, false, evs);
        if (cfg.name != s.config.name) {
            s.prefix = ToolRouter::ReservePrefix(cfg.name, cfg.id, pImpl->prefixesInUseLocked(cfg.id));
        }
        s.config = std::move(cfg);
        s.restartCount = 0;
        s.errorKind.reset();
        s.lastError.clear();
        s.diagnostics.clear();
        pImpl->publishLocked();
    }
    pImpl->emit(evs);
    closeSession(old);
}

void ToolServerManager::DeleteConfig(const std::string& id) {
    Impl::Events evs;
    std::shared_ptr<ToolServerSession> old;
    {
        std::lock_guard<std::mutex> lk(pImpl->mutex);
        Impl::Slot& s = pImpl->findLocked(id, ErrorKind::ConfigError);
        old = pImpl->stopLocked(s, InstanceState::Stopped, false, evs);
        evs.emplace_back(ConfigDeleted{id, s.config.name});
        pImpl->slots.erase(id);
        pImpl->order.erase(std::remove(pImpl->order.begin(), pImpl->order.end(), id), pImpl->order.end());
        pImpl->publishLocked();
    }
    closeSession(old);
    LOG_INFO("Deleted tool server config {}", id);
    pImpl->emit(evs);
    try {
        pImpl->store.PurgeInstance(id);
    } catch (const CredentialError& e) {
        // the config is already gone; leftover files are only reported
        LOG_ERROR("Deleted tool server {} but its credentials remain: {}", id, e.what());
    }
}

void ToolServerManager::SetEnabled(const std::string& id, bool enabled) {
    Impl::Events evs;
    std::shared_ptr<ToolServerSession> old;
    {
        std::lock_guard<std::mutex> lk(pImpl->mutex);
        Impl::Slot& s = pImpl->findLocked(id, ErrorKind::ConfigError);
        s.config.enabled = enabled;
        if (!enabled) {
            old = pImpl->stopLocked(s, InstanceState::Stopped, false, evs);
        } else if (s.state == InstanceState::Stopped || s.state == InstanceState::Error) {
            s.restartCount = 0;
            s.errorKind.reset();
            s.lastError.clear();
            s.dormant = false;
            s.tools.clear();
            pImpl->setStateLocked(s, InstanceState::Idle, evs);
        }
        pImpl->publishLocked();
    }
    pImpl->emit(evs);
    closeSession(old);
}

std::optional<ServerConfig> ToolServerManager::GetConfig(const std::string& id) const {
    std::lock_guard<std::mutex> lk(pImpl->mutex);
    auto it = pImpl->slots.find(id);
    if (it == pImpl->slots.end()) return std::nullopt;
    return it->second.config;
}

std::vector<ServerConfig> ToolServerManager::GetConfigs() const {
    std::lock_guard<std::mutex> lk(pImpl->mutex);
    std::vector<ServerConfig> out;
    out.reserve(pImpl->order.size());
    for (const auto& id : pImpl->order) out.push_back(pImpl->slots.at(id).config);
    return out;
}

void ToolServerManager::EnsureRunning(const std::string& id) {
    FUNC_SCOPE();
    pImpl->ensureRunning(id);
}

std::vector<StartResult> ToolServerManager::StartAll() {
    std::vector<std::pair<std::string, std::string>> targets;
    {
        std::lock_guard<std::mutex> lk(pImpl->mutex);
        for (const auto& id : pImpl->order) {
            const auto& s = pImpl->slots.at(id);
            if (s.config.enabled) targets.emplace_back(id, s.config.name);
        }
    }
    std::vector<std::future<void>> starts;
    starts.reserve(targets.size());
    for (const auto& t : targets) {
        starts.push_back(std::async(std::launch::async, [impl = pImpl, id = t.first]() { impl->ensureRunning(id); }));
    }
    std::vector<StartResult> results;
    results.reserve(targets.size());
    for (std::size_t i = 0; i < targets.size(); ++i) {
        StartResult r;
        r.id = targets[i].first;
        r.name = targets[i].second;
        try {
            starts[i].get();
            r.ok = true;
        } catch (const HostError& e) {
            r.errorKind = e.kind();
            r.error = e.what();
        } catch (const std::exception& e) {
            r.errorKind = ErrorKind::SpawnFailed;
            r.error = e.what();
        }
        results.push_back(std::move(r));
    }
    return results;
}

void ToolServerManager::Stop(const std::string& id) {
    Impl::Events evs;
    std::shared_ptr<ToolServerSession> old;
    {
        std::lock_guard<std::mutex> lk(pImpl->mutex);
        Impl::Slot& s = pImpl->findLocked(id, ErrorKind::InstanceUnavailable);
        if (s.state == InstanceState::Idle || s.state == InstanceState::Error) return;
        old = pImpl->stopLocked(s, InstanceState::Stopped, false, evs);
        pImpl->publishLocked();
    }
    pImpl->emit(evs);
    closeSession(old);
}

void ToolServerManager::Restart(const std::string& id) {
    Impl::Events evs;
    std::shared_ptr<ToolServerSession> old;
    {
        std::lock_guard<std::mutex> lk(pImpl->mutex);
        Impl::Slot& s = pImpl->findLocked(id, ErrorKind::InstanceUnavailable);
        old = pImpl->stopLocked(s, InstanceState::Idle, false, evs);
        s.restartCount = 0;
        s.errorKind.reset();
        s.lastError.clear();
        pImpl->publishLocked();
    }
    pImpl->emit(evs);
    closeSession(old);
    pImpl->ensureRunning(id);
}

void ToolServerManager::ShutdownAll() {
    pImpl->shutdownAll();
}

void ToolServerManager::RunMaintenance() {
    pImpl->runMaintenance();
}

std::size_t ToolServerManager::EvictIdle() {
    return pImpl->evictIdle();
}

void ToolServerManager::CheckHealth() {
    pImpl->checkHealth();
}

InstanceStatus ToolServerManager::GetStatus(const std::string& id) const {
    std::lock_guard<std::mutex> lk(pImpl->mutex);
    return pImpl->statusLocked(pImpl->findLocked(id, ErrorKind::InstanceUnavailable));
}

std::vector<InstanceStatus> ToolServerManager::GetAllStatuses() const {
    std::lock_guard<std::mutex> lk(pImpl->mutex);
    std::vector<InstanceStatus> out;
    out.reserve(pImpl->order.size());
    for (const auto& id : pImpl->order) out.push_back(pImpl->statusLocked(pImpl->slots.at(id)));
    return out;
}

AggregateStatus ToolServerManager::GetAggregateStatus() const {
    return Aggregate(GetAllStatuses());
}

bool ToolServerManager::HasActiveInstances() const {
    std::lock_guard<std::mutex> lk(pImpl->mutex);
    for (const auto& kv : pImpl->slots) {
        if (kv.second.state == InstanceState::Running || kv.second.state == InstanceState::Starting) return true;
    }
    return false;
}

std::size_t ToolServerManager::ActiveCount() const {
    std::lock_guard<std::mutex> lk(pImpl->mutex);
    std::size_t n = 0;
    for (const auto& kv : pImpl->slots) {
        if (kv.second.state == InstanceState::Running) ++n;
    }
    return n;
}

JSONValue ToolServerManager::Dispatch(const std::string& instanceId, const std::string& localName,
                                      const JSONValue& arguments, std::chrono::milliseconds timeout) {
    FUNC_SCOPE();
    Impl& impl = *pImpl;
    if (timeout.count() <= 0) timeout = impl.opts.callTimeout;

    // Stamps last-used, checks the capability and takes an in-flight reference; nullptr when not running.
    auto acquire = [&]() -> std::shared_ptr<ToolServerSession> {
        std::lock_guard<std::mutex> lk(impl.mutex);
        Impl::Slot& s = impl.findLocked(instanceId, ErrorKind::InstanceUnavailable);
        s.lastUsed = impl.now();
        if (s.state != InstanceState::Running || !s.session) return nullptr;
        const bool known = std::any_of(s.tools.begin(), s.tools.end(),
                                       [&](const Tool& t) { return t.name == localName; });
        if (!known) {
            throw HostError(ErrorKind::RoutingError,
                            "Tool server '" + s.config.name + "' has no capability '" + localName + "'");
        }
        ++s.inFlight;
        return s.session;
    };

    auto session = acquire();
    if (!session) {
        impl.ensureRunning(instanceId);
        session = acquire();
        if (!session) {
            throw HostError(ErrorKind::InstanceUnavailable, "Tool server " + instanceId + " is not running");
        }
    }

    const auto started = SteadyClock::now();
    auto release = [&](bool success) {
        const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(SteadyClock::now() - started).count();
        {
            std::lock_guard<std::mutex> lk(impl.mutex);
            auto it = impl.slots.find(instanceId);
            if (it != impl.slots.end()) {
                if (it->second.inFlight > 0) --it->second.inFlight;
                it->second.lastUsed = impl.now();
            }
        }
        impl.emit(Impl::Events{ToolCallCompleted{instanceId, localName, success, static_cast<std::int64_t>(ms)}});
    };

    try {
        JSONValue result = session->CallTool(localName, arguments, timeout);
        release(true);
        return result;
    } catch (const std::exception&) {
        release(false);
        throw;
    }
}

} // namespace mcphost
