//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: HTTPTransport.cpp
// Purpose: JSON-RPC over HTTP POST for network tool servers (JSON and SSE replies)
//==========================================================================================================

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <format>
#include <mutex>
#include <random>
#include <thread>
#include <unordered_map>
#include <utility>

#include <boost/asio.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/ssl.hpp>

#include "logging/Logger.h"
#include "mcphost/HTTPTransport.hpp"
#include "mcphost/JSONRPCTypes.h"
#include "mcphost/Protocol.h"
#include "mcphost/auth/WwwAuthenticate.hpp"
#include "mcphost/errors/Errors.h"

namespace mcphost {
namespace net = boost::asio;

namespace sse {
std::vector<std::string> ExtractEventData(const std::string& stream) {
    std::vector<std::string> events;
    std::string data;
    bool haveData = false;
    std::size_t pos = 0;
    auto flush = [&]() {
        if (haveData) {
            events.push_back(data);
        }
        data.clear();
        haveData = false;
    };
    while (pos <= stream.size()) {
        std::size_t eol = stream.find('\n', pos);
        std::string line = stream.substr(pos, eol == std::string::npos ? std::string::npos : eol - pos);
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.empty()) {
            flush();
        } else if (line.rfind("data:", 0) == 0) {
            std::string value = line.substr(5);
            if (!value.empty() && value.front() == ' ') {
                value.erase(0, 1);
            }
            if (haveData) {
                data.push_back('\n');
            }
            data += value;
            haveData = true;
        }
        if (eol == std::string::npos) {
            break;
        }
        pos = eol + 1;
    }
    flush();
    return events;
}
} // namespace sse

class HTTPTransport::Impl {
public:
    struct Pending {
        std::promise<std::unique_ptr<JSONRPCResponse>> promise;
        std::chrono::steady_clock::time_point deadline;
    };

    std::string url;
    auth::UrlParts parts;
    std::map<std::string, std::string> headers;
    HTTPTransport::Options opts;
    std::string sessionLabel;

    std::atomic<bool> started{false};
    std::atomic<bool> connected{false};
    std::atomic<bool> disconnectFired{false};

    std::unique_ptr<net::ssl::context> sslCtx; // outlives the io_context and any suspended request
    net::io_context ioc;
    std::unique_ptr<net::executor_work_guard<net::io_context::executor_type>> workGuard;
    std::thread ioThread;

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

    mutable std::mutex stateMutex;
    std::string mcpSessionId;
    int lastStatus{0};
    std::string lastChallenge;

    Impl(std::string u, std::map<std::string, std::string> h, HTTPTransport::Options o)
        : url(std::move(u)), headers(std::move(h)), opts(std::move(o)) {
        std::random_device rd;
        std::mt19937 gen(rd());
        std::uniform_int_distribution<> dis(1000, 9999);
        sessionLabel = "http-" + std::to_string(dis(gen));
    }

    std::string generateRequestId() { return "http-req-" + std::to_string(++requestCounter); }

    auth::HttpRequest buildRequest(std::string body) {
        auth::HttpRequest req;
        req.method = "POST";
        req.url = url;
        req.body = std::move(body);
        req.headers.emplace_back("Content-Type", "application/json");
        req.headers.emplace_back("Accept", "application/json, text/event-stream");
        req.headers.emplace_back("MCP-Protocol-Version", PROTOCOL_VERSION);
        {
            std::lock_guard<std::mutex> lk(stateMutex);
            if (!mcpSessionId.empty()) {
                req.headers.emplace_back("Mcp-Session-Id", mcpSessionId);
            }
        }
        for (const auto& kv : headers) {
            req.headers.emplace_back(kv.first, kv.second);
        }
        return req;
    }

    void reportError(const std::string& msg) {
        ITransport::ErrorHandler handler;
        {
            std::lock_guard<std::mutex> lk(handlerMutex);
            handler = errorHandler;
        }
        if (handler) handler(msg);
    }

    void failRequest(const std::string& idStr, std::exception_ptr error) {
        std::lock_guard<std::mutex> lk(requestMutex);
        auto it = pendingRequests.find(idStr);
        if (it == pendingRequests.end()) {
            return;
        }
        it->second.promise.set_exception(error);
        pendingRequests.erase(it);
    }

    void failAll(const std::string& message) {
        std::lock_guard<std::mutex> lk(requestMutex);
        for (auto& [idStr, pending] : pendingRequests) {
            pending.promise.set_exception(std::make_exception_ptr(
                HostError(ErrorKind::TransportDisconnected, message)));
        }
        pendingRequests.clear();
    }

    void fireDisconnect(const std::string& reason, bool local) {
        if (disconnectFired.exchange(true)) return;
        DisconnectInfo info;
        info.reason = reason;
        info.locallyInitiated = local;
        info.diagnostics = diagnostics();
        ITransport::DisconnectHandler handler;
        {
            std::lock_guard<std::mutex> lk(handlerMutex);
            handler = disconnectHandler;
        }
        if (handler) {
            try {
                handler(info);
            } catch (const std::exception& e) {
                LOG_ERROR("HTTPTransport: disconnect handler threw: {}", e.what());
            }
        }
    }

    std::string diagnostics() const {
        std::lock_guard<std::mutex> lk(stateMutex);
        if (lastStatus == 0) {
            return std::string();
        }
        std::string out = "last HTTP status " + std::to_string(lastStatus);
        if (!lastChallenge.empty()) {
            out += "; WWW-Authenticate: " + lastChallenge;
        }
        return out;
    }

    //==========================================================================================================
    // checkStatus
    // Purpose: Records session state from the reply and converts failure statuses into an exception.
    // Returns:
    //   nullptr when the reply carries JSON-RPC content to dispatch.
    //==========================================================================================================
    std::exception_ptr checkStatus(const auth::HttpResponse& res) {
        bool hadSession = false;
        {
            std::lock_guard<std::mutex> lk(stateMutex);
            lastStatus = res.status;
            hadSession = !mcpSessionId.empty();
            if (auto sid = res.Header("Mcp-Session-Id"); sid && !sid->empty()) {
                mcpSessionId = *sid;
            }
        }
        if (res.status == 401 || res.status == 403) {
            std::string description = "HTTP " + std::to_string(res.status);
            if (auto header = res.Header("WWW-Authenticate")) {
                {
                    std::lock_guard<std::mutex> lk(stateMutex);
                    lastChallenge = *header;
                }
                if (auto challenge = auth::ParseBearerChallenge(*header)) {
                    description += ": " + auth::DescribeChallenge(*challenge);
                }
            }
            LOG_WARN("HTTPTransport: tool server rejected credentials ({})", description);
            return std::make_exception_ptr(CredentialError(CredentialErrorCode::PermissionDenied,
                                                           "Tool server rejected credentials: " + description));
        }
        if (res.status == 404 && hadSession) {
            LOG_WARN("HTTPTransport: session expired on server");
            connected = false;
            return std::make_exception_ptr(HostError(ErrorKind::TransportDisconnected, "Tool server session expired"));
        }
        if (!res.Ok()) {
            return std::make_exception_ptr(HostError(ErrorKind::TransportDisconnected,
                std::format("Tool server replied with HTTP {}", res.status)));
        }
        return nullptr;
    }

    void dispatchValue(const JSONValue& value) {
        if (value.isArray()) {
            for (const auto& item : std::get<JSONValue::Array>(value.value)) {
                if (item) dispatchValue(*item);
            }
            return;
        }
        switch (classifyMessage(value)) {
            case JSONRPCMessageKind::Response: {
                JSONRPCResponse response;
                if (!response.FromValue(value)) break;
                const std::string idStr = idToString(response.id);
                std::lock_guard<std::mutex> lk(requestMutex);
                auto it = pendingRequests.find(idStr);
                if (it == pendingRequests.end()) {
                    LOG_DEBUG("HTTPTransport: dropping response for unknown or cancelled id {}", idStr);
                    break;
                }
                it->second.promise.set_value(std::make_unique<JSONRPCResponse>(std::move(response)));
                pendingRequests.erase(it);
                break;
            }
            case JSONRPCMessageKind::Notification: {
                auto note = std::make_unique<JSONRPCNotification>();
                if (!note->FromValue(value)) break;
                ITransport::NotificationHandler handler;
                {
                    std::lock_guard<std::mutex> lk(handlerMutex);
                    handler = notificationHandler;
                }
                if (handler) handler(std::move(note));
                break;
            }
            case JSONRPCMessageKind::Request:
                LOG_DEBUG("HTTPTransport: ignoring server request on a reply stream");
                break;
            case JSONRPCMessageKind::Invalid:
                LOG_WARN("HTTPTransport: ignoring message that is not JSON-RPC");
                break;
        }
    }

    void dispatchBody(const auth::HttpResponse& res) {
        std::vector<std::string> payloads;
        auto contentType = res.Header("Content-Type").value_or("");
        if (contentType.find("text/event-stream") != std::string::npos) {
            payloads = sse::ExtractEventData(res.body);
        } else if (!res.body.empty()) {
            payloads.push_back(res.body);
        }
        for (const auto& p : payloads) {
            try {
                dispatchValue(parseJSONValue(p));
            } catch (const std::exception& e) {
                LOG_WARN("HTTPTransport: ignoring malformed reply payload: {}", e.what());
            }
        }
    }

    void onRequestDone(const std::string& idStr, std::exception_ptr eptr, const auth::HttpResponse& res) {
        if (eptr) {
            std::string what = "network error";
            try {
                std::rethrow_exception(eptr);
            } catch (const std::exception& e) {
                what = e.what();
            }
            reportError("HTTPTransport: " + what);
            failRequest(idStr, std::make_exception_ptr(
                HostError(ErrorKind::TransportDisconnected, "HTTP request failed: " + what)));
            return;
        }
        if (auto statusError = checkStatus(res)) {
            failRequest(idStr, statusError);
            if (!connected.load()) {
                failAll("Tool server session expired");
                fireDisconnect("tool server session expired", false);
            }
            return;
        }
        dispatchBody(res);
        failRequest(idStr, std::make_exception_ptr(
            HostError(ErrorKind::TransportDisconnected, "HTTP reply did not contain a response for " + idStr)));
    }

    void startTimeouts() {
        timeoutRunning = true;
        timeoutThread = std::thread([this]() {
            std::unique_lock<std::mutex> lock(requestMutex);
            while (timeoutRunning.load()) {
                cvTimeout.wait_for(lock, std::chrono::milliseconds(20));
                const auto now = std::chrono::steady_clock::now();
                for (auto it = pendingRequests.begin(); it != pendingRequests.end();) {
                    if (it->second.deadline <= now) {
                        LOG_WARN("HTTPTransport: request {} timed out", it->first);
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

    void shutdown() {
        if (!started.exchange(false)) return;
        connected = false;
        timeoutRunning = false;
        cvTimeout.notify_all();
        if (timeoutThread.joinable()) {
            timeoutThread.join();
        }
        if (workGuard) {
            workGuard->reset();
            workGuard.reset();
        }
        ioc.stop();
        if (ioThread.joinable()) {
            if (ioThread.get_id() == std::this_thread::get_id()) {
                ioThread.detach();
            } else {
                ioThread.join();
            }
        }
        failAll("Transport closed");
        fireDisconnect("transport closed", true);
    }
};

HTTPTransport::HTTPTransport(std::string url, std::map<std::string, std::string> headers)
    : HTTPTransport(std::move(url), std::move(headers), Options{}) {}

HTTPTransport::HTTPTransport(std::string url, std::map<std::string, std::string> headers, Options options)
    : pImpl(std::make_unique<Impl>(std::move(url), std::move(headers), std::move(options))) {}

HTTPTransport::~HTTPTransport() {
    pImpl->shutdown();
}

std::future<void> HTTPTransport::Start() {
    FUNC_SCOPE();
    std::promise<void> ready;
    auto fut = ready.get_future();
    if (pImpl->started.load()) {
        ready.set_value();
        return fut;
    }
    try {
        pImpl->parts = auth::ParseUrl(pImpl->url);
        if (pImpl->parts.scheme == "https") {
            pImpl->sslCtx = auth::MakeTlsContext(pImpl->opts.http);
        }
    } catch (const std::exception& e) {
        LOG_ERROR("HTTPTransport: cannot use tool server URL: {}", e.what());
        ready.set_exception(std::make_exception_ptr(
            HostError(ErrorKind::SpawnFailed, std::string("Cannot use tool server URL: ") + e.what())));
        return fut;
    }
    pImpl->workGuard = std::make_unique<net::executor_work_guard<net::io_context::executor_type>>(
        net::make_work_guard(pImpl->ioc));
    pImpl->ioThread = std::thread([this]() {
        try {
            pImpl->ioc.run();
        } catch (const std::exception& e) {
            LOG_ERROR("HTTPTransport: I/O loop stopped: {}", e.what());
            pImpl->reportError(e.what());
        }
    });
    pImpl->startTimeouts();
    pImpl->started = true;
    pImpl->connected = true;
    LOG_INFO("HTTPTransport: ready for {}://{}:{}", pImpl->parts.scheme, pImpl->parts.host, pImpl->parts.port);
    ready.set_value();
    return fut;
}

std::future<void> HTTPTransport::Close() {
    FUNC_SCOPE();
    pImpl->shutdown();
    std::promise<void> done;
    done.set_value();
    return done.get_future();
}

bool HTTPTransport::IsConnected() const {
    return pImpl->connected.load();
}

std::string HTTPTransport::GetSessionId() const {
    std::lock_guard<std::mutex> lk(pImpl->stateMutex);
    return pImpl->mcpSessionId.empty() ? pImpl->sessionLabel : pImpl->mcpSessionId;
}

std::future<std::unique_ptr<JSONRPCResponse>> HTTPTransport::SendRequest(
    std::unique_ptr<JSONRPCRequest> request, const RequestOptions& options) {
    FUNC_SCOPE();
    std::promise<std::unique_ptr<JSONRPCResponse>> promise;
    auto fut = promise.get_future();
    if (!pImpl->connected.load()) {
        promise.set_exception(std::make_exception_ptr(
            HostError(ErrorKind::TransportDisconnected, "Tool server is not connected")));
        return fut;
    }
    if (!idIsSet(request->id)) {
        request->id = pImpl->generateRequestId();
    }
    const std::string idStr = idToString(request->id);
    {
        std::lock_guard<std::mutex> lk(pImpl->requestMutex);
        Impl::Pending pending;
        pending.promise = std::move(promise);
        pending.deadline = std::chrono::steady_clock::now() + options.timeout;
        pImpl->pendingRequests[idStr] = std::move(pending);
    }
    auth::HttpClientOptions httpOpts = pImpl->opts.http;
    httpOpts.readTimeout = std::max(httpOpts.readTimeout, options.timeout);
    net::co_spawn(pImpl->ioc,
        auth::coSendHttp(pImpl->parts, pImpl->buildRequest(request->Serialize()), httpOpts, pImpl->sslCtx.get()),
        [impl = pImpl.get(), idStr](std::exception_ptr eptr, auth::HttpResponse res) {
            impl->onRequestDone(idStr, eptr, res);
        });
    return fut;
}

std::future<void> HTTPTransport::SendNotification(std::unique_ptr<JSONRPCNotification> notification) {
    FUNC_SCOPE();
    auto done = std::make_shared<std::promise<void>>();
    auto fut = done->get_future();
    if (!pImpl->connected.load()) {
        done->set_exception(std::make_exception_ptr(
            HostError(ErrorKind::TransportDisconnected, "Tool server is not connected")));
        return fut;
    }
    net::co_spawn(pImpl->ioc,
        auth::coSendHttp(pImpl->parts, pImpl->buildRequest(notification->Serialize()), pImpl->opts.http,
                         pImpl->sslCtx.get()),
        [impl = pImpl.get(), done](std::exception_ptr eptr, auth::HttpResponse res) {
            if (eptr) {
                std::string what = "network error";
                try {
                    std::rethrow_exception(eptr);
                } catch (const std::exception& e) {
                    what = e.what();
                }
                done->set_exception(std::make_exception_ptr(
                    HostError(ErrorKind::TransportDisconnected, "HTTP notification failed: " + what)));
                return;
            }
            if (auto statusError = impl->checkStatus(res)) {
                done->set_exception(statusError);
                return;
            }
            done->set_value();
        });
    return fut;
}

bool HTTPTransport::CancelRequest(const std::string& requestId) {
    std::lock_guard<std::mutex> lk(pImpl->requestMutex);
    auto it = pImpl->pendingRequests.find(requestId);
    if (it == pImpl->pendingRequests.end()) {
        return false;
    }
    it->second.promise.set_exception(std::make_exception_ptr(
        HostError(ErrorKind::CallTimeout, "Request " + requestId + " was cancelled")));
    pImpl->pendingRequests.erase(it);
    return true;
}

void HTTPTransport::SetNotificationHandler(NotificationHandler handler) {
    std::lock_guard<std::mutex> lk(pImpl->handlerMutex);
    pImpl->notificationHandler = std::move(handler);
}

void HTTPTransport::SetErrorHandler(ErrorHandler handler) {
    std::lock_guard<std::mutex> lk(pImpl->handlerMutex);
    pImpl->errorHandler = std::move(handler);
}

void HTTPTransport::SetDisconnectHandler(DisconnectHandler handler) {
    std::lock_guard<std::mutex> lk(pImpl->handlerMutex);
    pImpl->disconnectHandler = std::move(handler);
}

std::string HTTPTransport::GetDiagnostics() const {
    return pImpl->diagnostics();
}

} // namespace mcphost
