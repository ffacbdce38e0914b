//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Session.cpp
// Purpose: Session Client implementation (handshake, pending-call table, inbound message routing)
//==========================================================================================================

#include <atomic>
#include <future>
#include <map>
#include <mutex>
#include <vector>

#include <fmt/format.h>

#include "env/EnvVars.h"
#include "logging/Logger.h"
#include "websearch/Session.h"
#include "websearch/errors/Errors.h"

namespace websearch {

namespace {
std::atomic<std::uint64_t> sessionCounter{0};

std::string joinLines(const std::vector<std::string>& parts) {
    std::string out;
    for (const auto& p : parts) {
        if (!out.empty()) out.push_back('\n');
        out += p;
    }
    return out;
}
} // namespace

const char* toString(SessionState state) {
    switch (state) {
        case SessionState::Uninitialized: return "uninitialized";
        case SessionState::Handshaking: return "handshaking";
        case SessionState::Ready: return "ready";
        case SessionState::Closed: return "closed";
    }
    return "unknown";
}

class Session::Impl {
public:
    struct Pending {
        std::promise<JSONRPCResponse> promise;
        std::shared_future<JSONRPCResponse> future;
        std::string method;
        bool resolved{false};  // guarded by Impl::mutex
    };

    SessionOptions options;
    std::string id;

    mutable std::mutex mutex;
    SessionState state{SessionState::Uninitialized};
    std::map<int64_t, std::shared_ptr<Pending>> pending;
    int64_t nextId{1};
    std::optional<Implementation> serverInfo;
    std::optional<std::string> protocolVersion;
    std::string closeReason;
    Session::NotificationHandler notificationHandler;

    // Declared last: destroyed first, while the state its handlers touch is still alive.
    std::unique_ptr<ITransport> transport;

    Impl(std::unique_ptr<ITransport> t, SessionOptions o)
        : options(std::move(o)), id("session-" + std::to_string(++sessionCounter)), transport(std::move(t)) {}

    //==========================================================================================================
    // markClosed
    // Purpose: Transition to Closed and fail every unresolved pending call. Returns false if already Closed.
    //==========================================================================================================
    bool markClosed(const std::string& reason) {
        std::vector<std::shared_ptr<Pending>> toFail;
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (state == SessionState::Closed) {
                return false;
            }
            state = SessionState::Closed;
            closeReason = reason;
            for (auto& [reqId, p] : pending) {
                if (!p->resolved) {
                    p->resolved = true;
                    toFail.push_back(p);
                }
            }
        }
        if (!toFail.empty()) {
            LOG_WARN("Session {}: closing with {} pending call(s) ({})", id, toFail.size(), reason);
        } else {
            LOG_INFO("Session {}: closed ({})", id, reason);
        }
        for (auto& p : toFail) {
            p->promise.set_exception(std::make_exception_ptr(
                errors::SessionClosedError(fmt::format("session closed before '{}' completed: {}", p->method, reason))));
        }
        return true;
    }

    std::string closedMessage() const {
        return closeReason.empty() ? std::string("session is closed") : "session is closed: " + closeReason;
    }

    int64_t sendRequest(const std::string& method, std::optional<JSONValue> params, bool requireReady) {
        int64_t reqId;
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (state == SessionState::Closed) {
                throw errors::SessionClosedError(closedMessage());
            }
            if (requireReady && state != SessionState::Ready) {
                throw errors::SessionNotReadyError(fmt::format("session is {}", toString(state)));
            }
            reqId = nextId++;
            auto p = std::make_shared<Pending>();
            p->future = p->promise.get_future().share();
            p->method = method;
            pending[reqId] = std::move(p);
        }
        try {
            transport->Send(JSONRPCRequest(reqId, method, std::move(params)));
        } catch (const errors::SessionClosedError&) {
            std::lock_guard<std::mutex> lock(mutex);
            pending.erase(reqId);
            throw;
        }
        LOG_DEBUG("Session {}: sent {} id={}", id, method, reqId);
        return reqId;
    }

    JSONRPCResponse awaitResponse(int64_t reqId, std::chrono::steady_clock::time_point deadline) {
        std::shared_ptr<Pending> p;
        {
            std::lock_guard<std::mutex> lock(mutex);
            auto it = pending.find(reqId);
            if (it == pending.end()) {
                if (state == SessionState::Closed) {
                    throw errors::SessionClosedError(closedMessage());
                }
                throw errors::InvalidArgumentError(fmt::format("no pending request with id {}", reqId));
            }
            p = it->second;
        }
        if (p->future.wait_until(deadline) != std::future_status::ready) {
            std::lock_guard<std::mutex> lock(mutex);
            if (!p->resolved) {
                p->resolved = true;
                pending.erase(reqId);
                LOG_WARN("Session {}: request {} ({}) timed out", id, reqId, p->method);
                throw errors::TimeoutError(fmt::format("'{}' (id {}) timed out", p->method, reqId));
            }
        }
        {
            std::lock_guard<std::mutex> lock(mutex);
            pending.erase(reqId);
        }
        return p->future.get();
    }

    static std::optional<int64_t> numericId(const JSONRPCId& rid) {
        if (const auto* i = std::get_if<int64_t>(&rid)) {
            return *i;
        }
        if (const auto* s = std::get_if<std::string>(&rid)) {
            if (auto v = ParseUnsigned(*s)) {
                return static_cast<int64_t>(*v);
            }
        }
        return std::nullopt;
    }

    void onResponse(JSONRPCResponse response) {
        auto rid = numericId(response.id);
        if (!rid.has_value()) {
            if (response.IsError()) {
                auto err = errors::mcpErrorFromResponse(response);
                LOG_WARN("Session {}: error response without request id: {}", id, err ? err->message : std::string("?"));
            } else {
                LOG_WARN("Session {}: discarding response with id {}", id, idToString(response.id));
            }
            return;
        }
        std::shared_ptr<Pending> p;
        {
            std::lock_guard<std::mutex> lock(mutex);
            auto it = pending.find(rid.value());
            if (it == pending.end() || it->second->resolved) {
                LOG_WARN("Session {}: discarding stale response for id {}", id, rid.value());
                return;
            }
            p = it->second;
            p->resolved = true;
        }
        p->promise.set_value(std::move(response));
    }

    void onRequest(const JSONRPCRequest& request) {
        JSONRPCResponse reply;
        if (request.method == Methods::Ping) {
            reply = JSONRPCResponse(request.id, JSONValue(JSONValue::Object{}));
        } else {
            LOG_DEBUG("Session {}: rejecting server request '{}'", id, request.method);
            reply = JSONRPCResponse(request.id,
                                    CreateErrorObject(JSONRPCErrorCodes::MethodNotFound,
                                                      fmt::format("Method not found: {}", request.method)),
                                    true);
        }
        try {
            transport->Send(reply);
        } catch (const errors::SessionClosedError& e) {
            LOG_WARN("Session {}: could not answer '{}': {}", id, request.method, e.what());
        }
    }

    void onNotification(const JSONRPCNotification& note) {
        if (note.method == Methods::Log) {
            const JSONValue* params = note.params ? &note.params.value() : nullptr;
            auto level = params ? getStringMember(*params, "level") : std::nullopt;
            const JSONValue* data = params ? params->find("data") : nullptr;
            std::string text = data == nullptr ? std::string()
                             : data->isString() ? std::get<std::string>(data->value) : serializeJSONValue(*data);
            LOG_INFO("Session {}: tool host log [{}] {}", id, level.value_or("info"), text);
        }
        Session::NotificationHandler handler;
        {
            std::lock_guard<std::mutex> lock(mutex);
            handler = notificationHandler;
        }
        if (handler) {
            handler(note);
        }
    }

    void onMessage(Message message) {
        if (auto* resp = std::get_if<JSONRPCResponse>(&message)) {
            onResponse(std::move(*resp));
        } else if (auto* req = std::get_if<JSONRPCRequest>(&message)) {
            onRequest(*req);
        } else {
            onNotification(std::get<JSONRPCNotification>(message));
        }
    }
};

Session::Session(std::unique_ptr<ITransport> transport, SessionOptions options)
    : pImpl(std::make_unique<Impl>(std::move(transport), std::move(options))) {
    if (!pImpl->transport) {
        throw errors::InvalidArgumentError("session requires a transport");
    }
    Impl* impl = pImpl.get();
    pImpl->transport->SetMessageHandler([impl](Message m) { impl->onMessage(std::move(m)); });
    pImpl->transport->SetErrorHandler([impl](const std::string& err) {
        LOG_WARN("Session {}: transport error: {}", impl->id, err);
    });
    pImpl->transport->SetCloseHandler([impl](const std::string& reason) { impl->markClosed(reason); });
}

Session::~Session() {
    Close("session destroyed");
    pImpl->transport.reset();
}

void Session::Initialize() {
    FUNC_SCOPE();
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        switch (pImpl->state) {
            case SessionState::Ready:
                return;
            case SessionState::Closed:
                throw errors::SessionClosedError(pImpl->closedMessage());
            case SessionState::Handshaking:
                throw errors::SessionNotReadyError("handshake already in progress");
            case SessionState::Uninitialized:
                pImpl->state = SessionState::Handshaking;
                break;
        }
    }

    auto fail = [this](const std::string& msg) {
        LOG_ERROR("Session {}: handshake failed: {}", pImpl->id, msg);
        Close("handshake failed");
        throw errors::HandshakeError(msg);
    };

    try {
        pImpl->transport->Start().get();
    } catch (const errors::SpawnError& e) {
        Close(std::string("spawn failed: ") + e.what());
        throw;
    } catch (const std::exception& e) {
        fail(fmt::format("transport failed to start: {}", e.what()));
    }

    JSONValue::Object clientInfo;
    setMember(clientInfo, "name", JSONValue(pImpl->options.clientInfo.name));
    setMember(clientInfo, "version", JSONValue(pImpl->options.clientInfo.version));
    JSONValue::Object params;
    setMember(params, "protocolVersion", JSONValue(PROTOCOL_VERSION));
    setMember(params, "capabilities", JSONValue(JSONValue::Object{}));
    setMember(params, "clientInfo", JSONValue(std::move(clientInfo)));

    const auto timeout = pImpl->options.startupTimeout;
    JSONRPCResponse resp;
    try {
        int64_t reqId = pImpl->sendRequest(Methods::Initialize, JSONValue(std::move(params)), false);
        resp = pImpl->awaitResponse(reqId, std::chrono::steady_clock::now() + timeout);
    } catch (const errors::TimeoutError&) {
        fail(fmt::format("tool host did not answer initialize within {} ms", static_cast<long long>(timeout.count())));
    } catch (const errors::SessionClosedError& e) {
        fail(fmt::format("tool host closed the connection during the handshake: {}", e.what()));
    }

    if (resp.IsError()) {
        auto err = errors::mcpErrorFromResponse(resp);
        fail(fmt::format("initialize rejected: {}", err ? err->message : std::string("malformed error")));
    }
    const JSONValue& result = resp.result.value();
    auto version = getStringMember(result, "protocolVersion");
    if (!version.has_value()) {
        fail("initialize result has no protocolVersion");
    }
    if (!isSupportedProtocolVersion(version.value())) {
        fail(fmt::format("unsupported protocol version '{}'", version.value()));
    }
    std::optional<Implementation> info;
    if (const JSONValue* si = result.find("serverInfo")) {
        info = Implementation(getStringMember(*si, "name").value_or(""), getStringMember(*si, "version").value_or(""));
    }

    try {
        pImpl->transport->Send(JSONRPCNotification(Methods::Initialized, JSONValue(JSONValue::Object{})));
    } catch (const errors::SessionClosedError& e) {
        fail(fmt::format("could not send initialized notification: {}", e.what()));
    }

    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        if (pImpl->state != SessionState::Handshaking) {
            throw errors::HandshakeError(pImpl->closedMessage());
        }
        pImpl->serverInfo = info;
        pImpl->protocolVersion = version;
        pImpl->state = SessionState::Ready;
    }
    LOG_INFO("Session {} ready (server={} {}, protocol={}, transport={})", pImpl->id,
             info ? info->name : std::string("?"), info ? info->version : std::string("?"),
             version.value(), pImpl->transport->GetSessionId());
}

int64_t Session::Send(const std::string& method, std::optional<JSONValue> params) {
    return pImpl->sendRequest(method, std::move(params), true);
}

JSONRPCResponse Session::AwaitResponse(int64_t id, std::chrono::steady_clock::time_point deadline) {
    return pImpl->awaitResponse(id, deadline);
}

JSONRPCResponse Session::Request(const std::string& method, std::optional<JSONValue> params,
                                 std::optional<std::chrono::milliseconds> timeout) {
    const auto limit = timeout.value_or(pImpl->options.requestTimeout);
    int64_t id = Send(method, std::move(params));
    try {
        return AwaitResponse(id, std::chrono::steady_clock::now() + limit);
    } catch (const errors::TimeoutError&) {
        // Let the tool host stop working on it; its late reply is discarded either way
        if (method != Methods::Initialize && IsReady()) {
            JSONValue::Object cancel;
            setMember(cancel, "requestId", JSONValue(static_cast<int64_t>(id)));
            setMember(cancel, "reason", JSONValue("timeout"));
            try {
                Notify(Methods::Cancelled, JSONValue(std::move(cancel)));
            } catch (const errors::BridgeError& e) {
                LOG_DEBUG("Session: could not send cancellation for {}: {}", id, e.what());
            }
        }
        throw;
    }
}

ToolResult Session::CallTool(const ToolCall& call, std::chrono::milliseconds timeout) {
    FUNC_SCOPE();
    JSONValue::Object params;
    setMember(params, "name", JSONValue(call.Name()));
    setMember(params, "arguments", call.ArgumentsObject());
    JSONRPCResponse resp = Request(Methods::CallTool, JSONValue(std::move(params)), timeout);

    if (resp.IsError()) {
        auto err = errors::mcpErrorFromResponse(resp);
        if (!err.has_value()) {
            return ToolResult::Failure(errors::makeError(JSONRPCErrorCodes::InternalError,
                                                         "malformed error object in tools/call response",
                                                         resp.error));
        }
        return ToolResult::Failure(std::move(err.value()));
    }

    const JSONValue& result = resp.result.value();
    const JSONValue* content = result.find("content");
    if (content == nullptr || !content->isArray()) {
        throw errors::ProtocolError(errors::ProtocolErrorKind::Malformed, "tools/call result has no content array");
    }
    CallToolResult r;
    for (const auto& item : std::get<JSONValue::Array>(content->value)) {
        if (item) r.content.push_back(*item);
    }
    if (const JSONValue* sc = result.find("structuredContent")) {
        r.structuredContent = *sc;
    }
    r.isError = getBoolMember(result, "isError").value_or(false);
    if (r.isError) {
        std::string message = joinLines(typed::collectText(r.content));
        if (message.empty()) {
            message = "tool reported an error";
        }
        return ToolResult::Failure(errors::makeError(JSONRPCErrorCodes::ToolExecutionFailed, message, toJSONValue(r)));
    }
    return ToolResult::Success(std::move(r));
}

std::vector<Tool> Session::ListTools(std::optional<std::chrono::milliseconds> timeout) {
    JSONRPCResponse resp = Request(Methods::ListTools, JSONValue(JSONValue::Object{}), timeout);
    if (resp.IsError()) {
        auto err = errors::mcpErrorFromResponse(resp);
        throw errors::ToolExecutionError(err.value_or(
            errors::makeError(JSONRPCErrorCodes::InternalError, "malformed error object in tools/list response")));
    }
    std::vector<Tool> tools;
    const JSONValue* arr = resp.result->find("tools");
    if (arr == nullptr || !arr->isArray()) {
        throw errors::ProtocolError(errors::ProtocolErrorKind::Malformed, "tools/list result has no tools array");
    }
    for (const auto& t : std::get<JSONValue::Array>(arr->value)) {
        if (!t) continue;
        auto name = getStringMember(*t, "name");
        if (!name) continue;
        Tool tool(name.value(), getStringMember(*t, "description").value_or(""));
        if (const JSONValue* schema = t->find("inputSchema")) {
            tool.inputSchema = *schema;
        }
        tools.push_back(std::move(tool));
    }
    return tools;
}

void Session::Notify(const std::string& method, std::optional<JSONValue> params) {
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        if (pImpl->state == SessionState::Closed) {
            throw errors::SessionClosedError(pImpl->closedMessage());
        }
        if (pImpl->state != SessionState::Ready) {
            throw errors::SessionNotReadyError(fmt::format("session is {}", toString(pImpl->state)));
        }
    }
    pImpl->transport->Send(JSONRPCNotification(method, std::move(params)));
}

void Session::Close(const std::string& reason) {
    pImpl->markClosed(reason);
    if (pImpl->transport) {
        pImpl->transport->Close().get();
    }
}

SessionState Session::State() const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    return pImpl->state;
}

bool Session::IsReady() const { return State() == SessionState::Ready; }

std::size_t Session::PendingCount() const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    std::size_t n = 0;
    for (const auto& [id, p] : pImpl->pending) {
        if (!p->resolved) ++n;
    }
    return n;
}

std::optional<Implementation> Session::ServerInfo() const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    return pImpl->serverInfo;
}

std::optional<std::string> Session::NegotiatedProtocolVersion() const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    return pImpl->protocolVersion;
}

std::string Session::CloseReason() const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    return pImpl->closeReason;
}

std::string Session::Id() const { return pImpl->id; }

void Session::SetNotificationHandler(NotificationHandler handler) {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    pImpl->notificationHandler = std::move(handler);
}

} // namespace websearch
