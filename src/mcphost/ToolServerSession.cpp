//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ToolServerSession.cpp
// Purpose: MCP handshake, tool listing, tool calls and ping over an ITransport
//==========================================================================================================

#include <algorithm>
#include <atomic>
#include <format>
#include <future>

#include "logging/Logger.h"
#include "mcphost/JSONRPCTypes.h"
#include "mcphost/ToolServerSession.h"
#include "mcphost/errors/Errors.h"

namespace mcphost {

namespace {
constexpr std::chrono::milliseconds kResolveSlack{2000};
constexpr int kMaxToolPages = 100;

std::atomic<int64_t> gNextRequestId{0};

std::chrono::milliseconds remainingUntil(std::chrono::steady_clock::time_point deadline) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
    return std::max(left, std::chrono::milliseconds(1));
}

std::string firstTextContent(const JSONValue& result) {
    const JSONValue::Array* content = json::getArray(result, "content");
    if (!content) return std::string();
    for (const auto& item : *content) {
        if (!item) continue;
        if (json::getString(*item, "type").value_or("") == "text") {
            return json::getString(*item, "text").value_or("");
        }
    }
    return std::string();
}
} // namespace

std::vector<Tool> ParseToolsPage(const JSONValue& result, std::optional<std::string>& nextCursor) {
    std::vector<Tool> tools;
    nextCursor.reset();
    const JSONValue::Array* arr = json::getArray(result, "tools");
    if (!arr) {
        throw HostError(ErrorKind::ToolError, "tools/list result has no tools array", result);
    }
    for (const auto& item : *arr) {
        if (!item || !item->isObject()) continue;
        auto name = json::getString(*item, "name");
        if (!name || name->empty()) {
            LOG_WARN("Session: skipping tool without a name");
            continue;
        }
        Tool t;
        t.name = *name;
        t.description = json::getString(*item, "description").value_or("");
        if (const JSONValue* schema = json::getObject(*item, "inputSchema")) {
            t.inputSchema = *schema;
        } else {
            JSONValue::Object o;
            json::set(o, "type", "object");
            t.inputSchema = JSONValue(std::move(o));
        }
        tools.push_back(std::move(t));
    }
    if (const JSONValue* cur = json::member(result, "nextCursor")) {
        if (auto s = json::scalarToString(*cur); s && !s->empty()) {
            nextCursor = *s;
        }
    }
    return tools;
}

InitializeResult ParseInitializeResult(const JSONValue& result) {
    InitializeResult out;
    out.protocolVersion = json::getString(result, "protocolVersion").value_or("");
    if (const JSONValue* info = json::getObject(result, "serverInfo")) {
        out.serverInfo.name = json::getString(*info, "name").value_or("");
        out.serverInfo.version = json::getString(*info, "version").value_or("");
    }
    if (const JSONValue* caps = json::getObject(result, "capabilities")) {
        if (const JSONValue* tools = json::getObject(*caps, "tools")) {
            out.toolsListChanged = json::getBool(*tools, "listChanged").value_or(false);
        }
    }
    out.instructions = json::getString(result, "instructions");
    return out;
}

ToolServerSession::ToolServerSession(std::unique_ptr<ITransport> t) : transport(std::move(t)) {
    FUNC_SCOPE();
    transport->SetNotificationHandler([this](std::unique_ptr<JSONRPCNotification> note) {
        if (!note) return;
        if (note->method == Methods::ToolListChanged) {
            ToolsChangedHandler handler;
            {
                std::lock_guard<std::mutex> lk(infoMutex);
                handler = toolsChangedHandler;
            }
            if (handler) handler();
        } else {
            LOG_DEBUG("Session: ignoring notification {}", note->method);
        }
    });
}

ToolServerSession::~ToolServerSession() {
    FUNC_SCOPE();
    Close();
}

std::unique_ptr<JSONRPCResponse> ToolServerSession::request(const std::string& method,
                                                            std::optional<JSONValue> params,
                                                            std::chrono::milliseconds timeout,
                                                            bool notifyOnTimeout) {
    auto req = std::make_unique<JSONRPCRequest>();
    const int64_t id = ++gNextRequestId;
    req->id = id;
    req->method = method;
    req->params = std::move(params);
    const std::string idStr = std::to_string(id);

    RequestOptions opts;
    opts.timeout = timeout;
    auto fut = transport->SendRequest(std::move(req), opts);
    try {
        if (fut.wait_for(timeout + kResolveSlack) != std::future_status::ready) {
            transport->CancelRequest(idStr);
            throw HostError(ErrorKind::CallTimeout, std::format("{} timed out after {} ms", method, timeout.count()));
        }
        auto resp = fut.get();
        if (!resp) {
            throw HostError(ErrorKind::TransportDisconnected, method + " produced no response");
        }
        return resp;
    } catch (const HostError& e) {
        if (e.kind() == ErrorKind::CallTimeout && notifyOnTimeout && transport->IsConnected()) {
            JSONValue::Object p;
            json::set(p, "requestId", id);
            json::set(p, "reason", "timeout");
            try {
                transport->SendNotification(std::make_unique<JSONRPCNotification>(
                    Methods::Cancelled, JSONValue(std::move(p))));
            } catch (const std::exception& ne) {
                LOG_DEBUG("Session: cancel notification failed: {}", ne.what());
            }
        }
        throw;
    }
}

std::vector<Tool> ToolServerSession::Open(const Implementation& clientInfo, std::chrono::milliseconds timeout) {
    FUNC_SCOPE();
    const auto deadline = std::chrono::steady_clock::now() + timeout;

    auto started = transport->Start();
    if (started.wait_for(remainingUntil(deadline)) != std::future_status::ready) {
        throw HostError(ErrorKind::HandshakeTimeout, "Transport did not start in time");
    }
    started.get();

    JSONValue::Object params;
    json::set(params, "protocolVersion", PROTOCOL_VERSION);
    json::set(params, "capabilities", JSONValue(JSONValue::Object{}));
    JSONValue::Object ci;
    json::set(ci, "name", clientInfo.name);
    json::set(ci, "version", clientInfo.version);
    json::set(params, "clientInfo", JSONValue(std::move(ci)));

    std::unique_ptr<JSONRPCResponse> resp;
    try {
        resp = request(Methods::Initialize, JSONValue(std::move(params)), remainingUntil(deadline), false);
    } catch (const HostError& e) {
        if (e.kind() == ErrorKind::CallTimeout) {
            throw HostError(ErrorKind::HandshakeTimeout,
                            std::format("Tool server did not answer initialize within {} ms", timeout.count()));
        }
        throw;
    }
    if (resp->IsError()) {
        HostError err = errors::hostErrorFromResponse(*resp, ErrorKind::ToolError);
        throw HostError(ErrorKind::ToolError, std::string("initialize rejected: ") + err.what(), err.data(), err.rpcCode());
    }
    if (!resp->result || !resp->result->isObject()) {
        throw HostError(ErrorKind::ToolError, "initialize returned no result object");
    }
    InitializeResult info = ParseInitializeResult(*resp->result);
    LOG_INFO("Session: initialized '{}' {} (protocol {})", info.serverInfo.name, info.serverInfo.version,
             info.protocolVersion);
    {
        std::lock_guard<std::mutex> lk(infoMutex);
        serverInfo = info;
    }

    auto sent = transport->SendNotification(std::make_unique<JSONRPCNotification>(Methods::Initialized));
    if (sent.wait_for(remainingUntil(deadline)) != std::future_status::ready) {
        throw HostError(ErrorKind::HandshakeTimeout, "notifications/initialized was not delivered in time");
    }
    sent.get();

    try {
        return ListTools(remainingUntil(deadline));
    } catch (const HostError& e) {
        if (e.kind() == ErrorKind::CallTimeout) {
            throw HostError(ErrorKind::HandshakeTimeout,
                            std::format("Tool server did not list its tools within {} ms", timeout.count()));
        }
        throw;
    }
}

std::vector<Tool> ToolServerSession::ListTools(std::chrono::milliseconds timeout) {
    FUNC_SCOPE();
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    std::vector<Tool> all;
    std::optional<std::string> cursor;
    for (int page = 0; page < kMaxToolPages; ++page) {
        std::optional<JSONValue> params;
        if (cursor) {
            JSONValue::Object p;
            json::set(p, "cursor", *cursor);
            params = JSONValue(std::move(p));
        }
        auto resp = request(Methods::ListTools, std::move(params), remainingUntil(deadline), false);
        if (resp->IsError()) {
            throw errors::hostErrorFromResponse(*resp, ErrorKind::ToolError);
        }
        if (!resp->result) {
            throw HostError(ErrorKind::ToolError, "tools/list returned no result");
        }
        auto tools = ParseToolsPage(*resp->result, cursor);
        all.insert(all.end(), std::make_move_iterator(tools.begin()), std::make_move_iterator(tools.end()));
        if (!cursor) {
            return all;
        }
    }
    LOG_WARN("Session: tools/list paging stopped after {} pages", kMaxToolPages);
    return all;
}

JSONValue ToolServerSession::CallTool(const std::string& name, const JSONValue& arguments,
                                      std::chrono::milliseconds timeout) {
    FUNC_SCOPE();
    JSONValue::Object params;
    json::set(params, "name", name);
    json::set(params, "arguments", arguments.isNull() ? JSONValue(JSONValue::Object{}) : arguments);
    LOG_DEBUG("Session: calling tool {}", name);
    auto resp = request(Methods::CallTool, JSONValue(std::move(params)), timeout, true);
    if (resp->IsError()) {
        throw errors::hostErrorFromResponse(*resp, ErrorKind::ToolError);
    }
    if (!resp->result) {
        throw HostError(ErrorKind::ToolError, "tools/call returned no result");
    }
    if (json::getBool(*resp->result, "isError").value_or(false)) {
        std::string text = firstTextContent(*resp->result);
        throw HostError(ErrorKind::ToolError, text.empty() ? "Tool '" + name + "' reported an error" : text,
                        *resp->result);
    }
    return *resp->result;
}

void ToolServerSession::Ping(std::chrono::milliseconds timeout) {
    auto resp = request(Methods::Ping, std::nullopt, timeout, false);
    if (resp->IsError()) {
        // A server that answers at all is alive, even if it does not implement ping.
        LOG_DEBUG("Session: ping answered with an error object");
    }
}

void ToolServerSession::Close() {
    if (transport) {
        transport->Close().wait();
    }
}

bool ToolServerSession::IsConnected() const {
    return transport && transport->IsConnected();
}

std::string ToolServerSession::GetDiagnostics() const {
    return transport ? transport->GetDiagnostics() : std::string();
}

InitializeResult ToolServerSession::GetServerInfo() const {
    std::lock_guard<std::mutex> lk(infoMutex);
    return serverInfo;
}

void ToolServerSession::SetDisconnectHandler(ITransport::DisconnectHandler handler) {
    transport->SetDisconnectHandler(std::move(handler));
}

void ToolServerSession::SetToolsChangedHandler(ToolsChangedHandler handler) {
    std::lock_guard<std::mutex> lk(infoMutex);
    toolsChangedHandler = std::move(handler);
}

} // namespace mcphost
