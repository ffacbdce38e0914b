//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ToolServer.cpp
// Purpose: Tool-host MCP server implementation
//==========================================================================================================

#include "websearch/ToolServer.h"

#include <atomic>
#include <condition_variable>
#include <map>
#include <mutex>
#include <set>
#include <thread>
#include <unordered_map>

#include <fmt/format.h>

#include "logging/Logger.h"
#include "websearch/errors/Errors.h"
#include "websearch/validation/Validators.h"

namespace websearch {

class ToolServer::Impl {
public:
    Implementation serverInfo;
    std::unique_ptr<ITransport> transport;

    std::mutex registryMutex;
    std::map<std::string, std::pair<Tool, ToolHandler>> tools;

    // Cancellation: stop sources of running calls, plus ids cancelled before their call started
    std::mutex cancelMutex;
    std::unordered_map<std::string, std::shared_ptr<std::stop_source>> stopSources;
    std::set<std::string> cancelledIds;

    mutable std::mutex stateMutex;
    std::condition_variable stateCv;
    std::size_t inFlight{0};
    bool closed{false};
    std::atomic<bool> initialized{false};

    explicit Impl(Implementation info) : serverInfo(std::move(info)) {}

    // RAII helper to register/unregister a stop_source for a request id
    struct StopSourceGuard {
        Impl* self;
        std::string id;
        std::shared_ptr<std::stop_source> src;
        StopSourceGuard(Impl* s, std::string reqId) : self(s), id(std::move(reqId)), src(std::make_shared<std::stop_source>()) {
            std::lock_guard<std::mutex> lk(self->cancelMutex);
            if (self->cancelledIds.erase(id) > 0) {
                src->request_stop();
            }
            self->stopSources[id] = src;
        }
        ~StopSourceGuard() {
            std::lock_guard<std::mutex> lk(self->cancelMutex);
            self->stopSources.erase(id);
        }
    };

    void send(const Message& message) {
        try {
            transport->Send(message);
        } catch (const errors::SessionClosedError& e) {
            LOG_WARN("ToolServer: dropping {} ({})", messageKindName(message), e.what());
        }
    }

    void reply(const JSONRPCId& id, JSONValue result) {
        send(JSONRPCResponse(id, std::move(result)));
    }

    void replyError(const JSONRPCId& id, int code, const std::string& message) {
        send(JSONRPCResponse(id, CreateErrorObject(code, message), true));
    }

    void handleInitialize(const JSONRPCRequest& req) {
        std::string requested;
        if (req.params.has_value()) {
            requested = getStringMember(req.params.value(), "protocolVersion").value_or("");
        }
        // Echo a version we support, otherwise offer our own
        const std::string version = isSupportedProtocolVersion(requested) ? requested : std::string(PROTOCOL_VERSION);

        JSONValue::Object toolsCap;
        setMember(toolsCap, "listChanged", JSONValue(false));
        JSONValue::Object caps;
        setMember(caps, "tools", JSONValue(std::move(toolsCap)));
        JSONValue::Object info;
        setMember(info, "name", JSONValue(serverInfo.name));
        setMember(info, "version", JSONValue(serverInfo.version));
        JSONValue::Object result;
        setMember(result, "protocolVersion", JSONValue(version));
        setMember(result, "capabilities", JSONValue(std::move(caps)));
        setMember(result, "serverInfo", JSONValue(std::move(info)));
        LOG_INFO("ToolServer: initialize (client protocol {}, answering {})", requested, version);
        reply(req.id, JSONValue(std::move(result)));
    }

    void handleListTools(const JSONRPCRequest& req) {
        JSONValue::Array arr;
        {
            std::lock_guard<std::mutex> lock(registryMutex);
            for (const auto& [name, entry] : tools) {
                const Tool& t = entry.first;
                JSONValue::Object o;
                setMember(o, "name", JSONValue(t.name));
                setMember(o, "description", JSONValue(t.description));
                setMember(o, "inputSchema", t.inputSchema.isNull() ? JSONValue(JSONValue::Object{}) : t.inputSchema);
                arr.push_back(std::make_shared<JSONValue>(JSONValue(std::move(o))));
            }
        }
        JSONValue::Object result;
        setMember(result, "tools", JSONValue(std::move(arr)));
        reply(req.id, JSONValue(std::move(result)));
    }

    void runToolCall(const JSONRPCRequest& req) {
        LOG_DEBUG("Handling tools/call request");
        std::string name;
        JSONValue arguments{JSONValue::Object{}};
        if (req.params.has_value()) {
            name = getStringMember(req.params.value(), "name").value_or("");
            if (const JSONValue* a = req.params->find("arguments")) {
                arguments = *a;
            }
        }
        if (name.empty()) {
            replyError(req.id, JSONRPCErrorCodes::InvalidParams, "Invalid params: missing tool name");
            return;
        }
        ToolHandler handler;
        {
            std::lock_guard<std::mutex> lock(registryMutex);
            auto it = tools.find(name);
            if (it != tools.end()) handler = it->second.second;
        }
        if (!handler) {
            replyError(req.id, JSONRPCErrorCodes::ToolNotFound, fmt::format("Tool not found: {}", name));
            return;
        }

        StopSourceGuard guard{this, idToString(req.id)};
        CallToolResult tr;
        try {
            auto fut = handler(arguments, guard.src->get_token());
            tr = fut.get();
        } catch (const std::exception& e) {
            LOG_ERROR("ToolServer: tool '{}' threw: {}", name, e.what());
            replyError(req.id, JSONRPCErrorCodes::InternalError, e.what());
            return;
        }
        if (guard.src->stop_requested()) {
            replyError(req.id, JSONRPCErrorCodes::InternalError, "Cancelled");
            return;
        }
        JSONValue result = toJSONValue(tr);
        if (!validation::validateCallToolResultJson(result)) {
            LOG_ERROR("ToolServer: tool '{}' produced an invalid result shape", name);
            replyError(req.id, JSONRPCErrorCodes::InternalError, "Invalid tool result shape");
            return;
        }
        reply(req.id, std::move(result));
    }

    void startToolCall(JSONRPCRequest req) {
        {
            std::lock_guard<std::mutex> lock(stateMutex);
            ++inFlight;
        }
        std::thread([this, req = std::move(req)]() {
            try {
                runToolCall(req);
            } catch (const std::exception& e) {
                LOG_ERROR("ToolServer: tools/call failed: {}", e.what());
            }
            // Nothing touches *this after the notification
            std::lock_guard<std::mutex> lock(stateMutex);
            --inFlight;
            stateCv.notify_all();
        }).detach();
    }

    void handleCancelled(const JSONRPCNotification& note) {
        if (!note.params.has_value()) return;
        const JSONValue* rid = note.params->find("requestId");
        if (rid == nullptr) return;
        std::string idStr;
        if (rid->isString()) idStr = std::get<std::string>(rid->value);
        else if (rid->isInteger()) idStr = std::to_string(std::get<int64_t>(rid->value));
        else return;
        LOG_INFO("ToolServer: cancellation requested for {}", idStr);
        std::lock_guard<std::mutex> lk(cancelMutex);
        auto it = stopSources.find(idStr);
        if (it != stopSources.end()) {
            it->second->request_stop();
        } else {
            cancelledIds.insert(idStr);
        }
    }

    void onMessage(Message message) {
        if (auto* req = std::get_if<JSONRPCRequest>(&message)) {
            if (req->method == Methods::Initialize) {
                handleInitialize(*req);
            } else if (req->method == Methods::Ping) {
                reply(req->id, JSONValue(JSONValue::Object{}));
            } else if (req->method == Methods::ListTools) {
                handleListTools(*req);
            } else if (req->method == Methods::CallTool) {
                startToolCall(std::move(*req));
            } else {
                replyError(req->id, JSONRPCErrorCodes::MethodNotFound, fmt::format("Method not found: {}", req->method));
            }
        } else if (auto* note = std::get_if<JSONRPCNotification>(&message)) {
            if (note->method == Methods::Initialized) {
                initialized.store(true);
            } else if (note->method == Methods::Cancelled) {
                handleCancelled(*note);
            } else {
                LOG_DEBUG("ToolServer: ignoring notification {}", note->method);
            }
        } else {
            LOG_DEBUG("ToolServer: ignoring unexpected response");
        }
    }

    void cancelAll() {
        std::lock_guard<std::mutex> lk(cancelMutex);
        for (auto& [id, src] : stopSources) {
            src->request_stop();
        }
    }

    void onClosed(const std::string& reason) {
        LOG_INFO("ToolServer: client disconnected ({})", reason);
        cancelAll();
        std::lock_guard<std::mutex> lock(stateMutex);
        closed = true;
        stateCv.notify_all();
    }

    void waitForCalls() {
        std::unique_lock<std::mutex> lock(stateMutex);
        stateCv.wait(lock, [this]() { return inFlight == 0; });
    }
};

ToolServer::ToolServer(Implementation serverInfo) : pImpl(std::make_unique<Impl>(std::move(serverInfo))) {}

ToolServer::~ToolServer() {
    Stop();
}

void ToolServer::RegisterTool(const Tool& tool, ToolHandler handler) {
    std::lock_guard<std::mutex> lock(pImpl->registryMutex);
    pImpl->tools[tool.name] = std::make_pair(tool, std::move(handler));
}

std::future<void> ToolServer::Start(std::unique_ptr<ITransport> transport) {
    FUNC_SCOPE();
    if (!transport) {
        throw errors::InvalidArgumentError("tool server requires a transport");
    }
    pImpl->transport = std::move(transport);
    Impl* impl = pImpl.get();
    pImpl->transport->SetMessageHandler([impl](Message m) { impl->onMessage(std::move(m)); });
    pImpl->transport->SetErrorHandler([](const std::string& err) { LOG_WARN("ToolServer: transport error: {}", err); });
    pImpl->transport->SetCloseHandler([impl](const std::string& reason) { impl->onClosed(reason); });
    LOG_INFO("ToolServer: {} {} starting", pImpl->serverInfo.name, pImpl->serverInfo.version);
    return pImpl->transport->Start();
}

void ToolServer::Stop() {
    if (!pImpl->transport) {
        return;
    }
    pImpl->cancelAll();
    pImpl->transport->Close().get();
    pImpl->waitForCalls();
}

void ToolServer::WaitUntilClosed() {
    {
        std::unique_lock<std::mutex> lock(pImpl->stateMutex);
        pImpl->stateCv.wait(lock, [this]() { return pImpl->closed; });
    }
    pImpl->waitForCalls();
}

bool ToolServer::IsInitialized() const { return pImpl->initialized.load(); }

std::size_t ToolServer::InFlight() const {
    std::lock_guard<std::mutex> lock(pImpl->stateMutex);
    return pImpl->inFlight;
}

} // namespace websearch
