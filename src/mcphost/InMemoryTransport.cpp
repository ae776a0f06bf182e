//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: InMemoryTransport.cpp
// Purpose: In-memory transport implementation
//==========================================================================================================

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <future>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <thread>
#include <unordered_map>

#include "logging/Logger.h"
#include "mcphost/InMemoryTransport.hpp"
#include "mcphost/JSONRPCTypes.h"
#include "mcphost/errors/Errors.h"

namespace mcphost {

class InMemoryTransport::Impl {
public:
    struct Pending {
        std::promise<std::unique_ptr<JSONRPCResponse>> promise;
        std::chrono::steady_clock::time_point deadline;
    };

    InMemoryTransport::RequestHandler requestHandler;
    InMemoryTransport::NotificationSink notificationSink;
    std::optional<std::string> startFailure;

    std::atomic<bool> connected{false};
    std::atomic<bool> started{false};
    std::atomic<bool> disconnectFired{false};
    std::string sessionId;

    mutable std::mutex handlerMutex;
    ITransport::NotificationHandler notificationHandler;
    ITransport::ErrorHandler errorHandler;
    ITransport::DisconnectHandler disconnectHandler;

    std::mutex requestMutex;
    std::condition_variable cvTimeout;
    std::unordered_map<std::string, Pending> pendingRequests;
    std::atomic<unsigned int> requestCounter{0u};
    std::atomic<bool> timeoutRunning{false};
    std::thread timeoutThread;

    mutable std::mutex diagMutex;
    std::string diagnostics;

    explicit Impl(InMemoryTransport::RequestHandler handler) : requestHandler(std::move(handler)) {
        std::random_device rd;
        std::mt19937 gen(rd());
        std::uniform_int_distribution<> dis(1000, 9999);
        sessionId = "memory-" + std::to_string(dis(gen));
    }

    std::string generateRequestId() { return "mem-req-" + std::to_string(++requestCounter); }

    void deliverResponse(const std::string& idStr, std::unique_ptr<JSONRPCResponse> resp) {
        if (!connected.load()) {
            return;
        }
        std::lock_guard<std::mutex> lock(requestMutex);
        auto it = pendingRequests.find(idStr);
        if (it == pendingRequests.end()) {
            LOG_DEBUG("InMemoryTransport: dropping late response for {}", idStr);
            return;
        }
        it->second.promise.set_value(std::move(resp));
        pendingRequests.erase(it);
    }

    void failAll(const std::string& message) {
        std::lock_guard<std::mutex> lock(requestMutex);
        for (auto& [idStr, pending] : pendingRequests) {
            pending.promise.set_exception(std::make_exception_ptr(
                HostError(ErrorKind::TransportDisconnected, message)));
        }
        pendingRequests.clear();
    }

    void fireDisconnect(DisconnectInfo info) {
        if (disconnectFired.exchange(true)) return;
        ITransport::DisconnectHandler handler;
        {
            std::lock_guard<std::mutex> lk(handlerMutex);
            handler = disconnectHandler;
        }
        if (handler) {
            handler(info);
        }
    }

    void startTimeouts() {
        timeoutRunning = true;
        timeoutThread = std::thread([this]() {
            std::unique_lock<std::mutex> lock(requestMutex);
            while (timeoutRunning.load()) {
                cvTimeout.wait_for(lock, std::chrono::milliseconds(10));
                const auto now = std::chrono::steady_clock::now();
                for (auto it = pendingRequests.begin(); it != pendingRequests.end();) {
                    if (it->second.deadline <= now) {
                        it->second.promise.set_exception(std::make_exception_ptr(
                            HostError(ErrorKind::CallTimeout, "Request " + it->first + " timed out")));
                        it = pendingRequests.erase(it);
                    } else {
                        ++it;
                    }
                }
            }
        });
    }

    void stopTimeouts() {
        timeoutRunning = false;
        cvTimeout.notify_all();
        if (timeoutThread.joinable() && timeoutThread.get_id() != std::this_thread::get_id()) {
            timeoutThread.join();
        }
    }
};

InMemoryTransport::InMemoryTransport(RequestHandler handler)
    : pImpl(std::make_shared<Impl>(std::move(handler))) {
    FUNC_SCOPE();
}

InMemoryTransport::~InMemoryTransport() {
    FUNC_SCOPE();
    pImpl->connected = false;
    pImpl->stopTimeouts();
    pImpl->failAll("Transport closed");
}

std::future<void> InMemoryTransport::Start() {
    FUNC_SCOPE();
    std::promise<void> promise;
    if (pImpl->startFailure) {
        promise.set_exception(std::make_exception_ptr(HostError(ErrorKind::SpawnFailed, *pImpl->startFailure)));
        return promise.get_future();
    }
    if (!pImpl->started.exchange(true)) {
        pImpl->connected = true;
        pImpl->startTimeouts();
    }
    promise.set_value();
    return promise.get_future();
}

std::future<void> InMemoryTransport::Close() {
    FUNC_SCOPE();
    const bool wasConnected = pImpl->connected.exchange(false);
    pImpl->stopTimeouts();
    pImpl->failAll("Transport closed");
    if (wasConnected) {
        DisconnectInfo info;
        info.reason = "transport closed";
        info.locallyInitiated = true;
        pImpl->fireDisconnect(info);
    }
    std::promise<void> promise;
    promise.set_value();
    return promise.get_future();
}

bool InMemoryTransport::IsConnected() const {
    return pImpl->connected.load();
}

std::string InMemoryTransport::GetSessionId() const {
    return pImpl->sessionId;
}

std::future<std::unique_ptr<JSONRPCResponse>> InMemoryTransport::SendRequest(
    std::unique_ptr<JSONRPCRequest> request, const RequestOptions& options) {
    FUNC_SCOPE();
    std::promise<std::unique_ptr<JSONRPCResponse>> promise;
    auto future = promise.get_future();
    if (!pImpl->connected.load()) {
        promise.set_exception(std::make_exception_ptr(
            HostError(ErrorKind::TransportDisconnected, "Peer not connected")));
        return future;
    }
    if (!idIsSet(request->id)) {
        request->id = pImpl->generateRequestId();
    }
    const std::string idStr = idToString(request->id);
    {
        std::lock_guard<std::mutex> lock(pImpl->requestMutex);
        Impl::Pending pending;
        pending.promise = std::move(promise);
        pending.deadline = std::chrono::steady_clock::now() + options.timeout;
        pImpl->pendingRequests[idStr] = std::move(pending);
    }
    // Round-trip through the wire format so handlers see exactly what a real server would.
    JSONRPCRequest copy;
    if (!copy.Deserialize(request->Serialize())) {
        copy = *request;
    }
    std::thread([impl = pImpl, idStr, req = std::move(copy)]() {
        std::unique_ptr<JSONRPCResponse> resp;
        try {
            resp = impl->requestHandler(req);
        } catch (const std::exception& e) {
            LOG_ERROR("InMemoryTransport: request handler exception: {}", e.what());
            resp = CreateErrorResponse(req.id, JSONRPCErrorCodes::InternalError, e.what());
        }
        if (!resp) {
            return;
        }
        resp->id = req.id;
        impl->deliverResponse(idStr, std::move(resp));
    }).detach();
    return future;
}

std::future<void> InMemoryTransport::SendNotification(std::unique_ptr<JSONRPCNotification> notification) {
    FUNC_SCOPE();
    std::promise<void> promise;
    if (!pImpl->connected.load()) {
        promise.set_exception(std::make_exception_ptr(
            HostError(ErrorKind::TransportDisconnected, "Peer not connected")));
        return promise.get_future();
    }
    InMemoryTransport::NotificationSink sink;
    {
        std::lock_guard<std::mutex> lk(pImpl->handlerMutex);
        sink = pImpl->notificationSink;
    }
    if (sink) {
        sink(*notification);
    }
    promise.set_value();
    return promise.get_future();
}

bool InMemoryTransport::CancelRequest(const std::string& requestId) {
    std::lock_guard<std::mutex> lock(pImpl->requestMutex);
    auto it = pImpl->pendingRequests.find(requestId);
    if (it == pImpl->pendingRequests.end()) {
        return false;
    }
    it->second.promise.set_exception(std::make_exception_ptr(
        HostError(ErrorKind::CallTimeout, "Request " + requestId + " was cancelled")));
    pImpl->pendingRequests.erase(it);
    return true;
}

void InMemoryTransport::SetNotificationHandler(NotificationHandler handler) {
    std::lock_guard<std::mutex> lk(pImpl->handlerMutex);
    pImpl->notificationHandler = std::move(handler);
}

void InMemoryTransport::SetErrorHandler(ErrorHandler handler) {
    std::lock_guard<std::mutex> lk(pImpl->handlerMutex);
    pImpl->errorHandler = std::move(handler);
}

void InMemoryTransport::SetDisconnectHandler(DisconnectHandler handler) {
    std::lock_guard<std::mutex> lk(pImpl->handlerMutex);
    pImpl->disconnectHandler = std::move(handler);
}

std::string InMemoryTransport::GetDiagnostics() const {
    std::lock_guard<std::mutex> lk(pImpl->diagMutex);
    return pImpl->diagnostics;
}

void InMemoryTransport::SetNotificationSink(NotificationSink sink) {
    std::lock_guard<std::mutex> lk(pImpl->handlerMutex);
    pImpl->notificationSink = std::move(sink);
}

void InMemoryTransport::FailStart(const std::string& message) {
    pImpl->startFailure = message;
}

void InMemoryTransport::PushNotification(std::unique_ptr<JSONRPCNotification> notification) {
    if (!pImpl->connected.load()) {
        return;
    }
    ITransport::NotificationHandler handler;
    {
        std::lock_guard<std::mutex> lk(pImpl->handlerMutex);
        handler = pImpl->notificationHandler;
    }
    if (handler) {
        handler(std::move(notification));
    }
}

void InMemoryTransport::SimulateExit(int exitCode, const std::string& diagnostics) {
    FUNC_SCOPE();
    {
        std::lock_guard<std::mutex> lk(pImpl->diagMutex);
        pImpl->diagnostics = diagnostics;
    }
    if (!pImpl->connected.exchange(false)) {
        return;
    }
    LOG_INFO("InMemoryTransport: simulated exit with code {}", exitCode);
    std::string message = "Tool server disconnected: exited with code " + std::to_string(exitCode);
    if (!diagnostics.empty()) {
        message += "\nstderr:\n" + diagnostics;
    }
    pImpl->failAll(message);
    DisconnectInfo info;
    info.reason = "tool server exited";
    info.exitCode = exitCode;
    info.diagnostics = diagnostics;
    info.locallyInitiated = false;
    pImpl->fireDisconnect(info);
}

} // namespace mcphost
