//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ToolInvoker.cpp
// Purpose: Tool Invoker implementation
//==========================================================================================================

#include "websearch/ToolInvoker.h"

#include <fmt/format.h>

#include "logging/Logger.h"
#include "websearch/errors/Errors.h"

namespace websearch {

ToolInvoker::ToolInvoker(TransportFactoryFn transportFactory, ToolInvokerOptions options)
    : transportFactory_(std::move(transportFactory)), options_(std::move(options)) {
    if (!transportFactory_) {
        throw errors::InvalidArgumentError("tool invoker requires a transport factory");
    }
}

ToolInvoker::~ToolInvoker() {
    Close();
}

void ToolInvoker::recordError(const std::string& message) {
    std::lock_guard<std::mutex> lock(stateMutex_);
    lastError_ = message;
}

std::shared_ptr<Session> ToolInvoker::acquire() {
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        if (session_ && session_->IsReady()) {
            return session_;
        }
    }

    std::lock_guard<std::mutex> init(initMutex_);
    std::shared_ptr<Session> stale;
    std::uint64_t generation = 0;
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        // Another caller may have finished the spawn while we waited
        if (session_ && session_->IsReady()) {
            return session_;
        }
        stale = std::move(session_);
        generation = closeGeneration_;
    }
    if (stale) {
        stale->Close("replaced by a new session");
    }

    std::unique_ptr<ITransport> transport = transportFactory_();
    if (!transport) {
        throw errors::SpawnError("transport factory produced no transport");
    }
    auto fresh = std::make_shared<Session>(std::move(transport), options_.session);
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        ++sessionsStarted_;
    }
    LOG_INFO("ToolInvoker: starting {}", fresh->Id());
    try {
        fresh->Initialize();
    } catch (const errors::BridgeError& e) {
        recordError(e.what());
        throw;
    }
    std::unique_lock<std::mutex> lock(stateMutex_);
    if (closeGeneration_ != generation) {
        // Close() ran during the handshake; it could not see this session, so stop it here
        lastError_ = "tool invoker closed while the session was starting";
        lock.unlock();
        fresh->Close("tool invoker closed");
        throw errors::SessionClosedError("tool invoker closed while the session was starting");
    }
    session_ = fresh;
    lastError_.clear();
    return fresh;
}

void ToolInvoker::retire(const std::shared_ptr<Session>& session, const std::string& reason) {
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        if (session_ == session) {
            session_.reset();
        }
        lastError_ = reason;
    }
    session->Close(reason);
}

ToolResult ToolInvoker::Invoke(const std::string& toolName, ToolCall::Arguments arguments,
                               std::chrono::milliseconds timeout) {
    return Invoke(ToolCall(toolName, std::move(arguments)), timeout);
}

ToolResult ToolInvoker::Invoke(const ToolCall& call) {
    return Invoke(call, options_.defaultTimeout);
}

ToolResult ToolInvoker::Invoke(const ToolCall& call, std::chrono::milliseconds timeout) {
    FUNC_SCOPE();
    if (call.Name().empty()) {
        throw errors::InvalidArgumentError("tool name must not be empty");
    }
    if (timeout.count() <= 0) {
        throw errors::InvalidArgumentError("timeout must be positive");
    }
    ArgumentValidator validator;
    {
        std::lock_guard<std::mutex> lock(validatorsMutex_);
        auto it = validators_.find(call.Name());
        if (it != validators_.end()) {
            validator = it->second;
        }
    }
    if (validator) {
        validator(call);
    }

    int recoveries = 0;
    while (true) {
        std::shared_ptr<Session> session = acquire();
        try {
            ToolResult result = session->CallTool(call, timeout);
            if (!result.IsSuccess()) {
                LOG_WARN("ToolInvoker: tool '{}' failed (code={}): {}", call.Name(),
                         result.GetFailure().code, result.GetFailure().message);
                throw errors::ToolExecutionError(result.GetFailure());
            }
            return result;
        } catch (const errors::SessionClosedError& e) {
            retire(session, e.what());
            if (recoveries >= options_.maxRecoveries) {
                LOG_ERROR("ToolInvoker: '{}' failed after {} recovery attempt(s): {}", call.Name(), recoveries, e.what());
                throw;
            }
            ++recoveries;
            LOG_WARN("ToolInvoker: session lost during '{}' ({}); retrying on a fresh session", call.Name(), e.what());
        }
    }
}

void ToolInvoker::RegisterArgumentValidator(const std::string& toolName, ArgumentValidator validator) {
    std::lock_guard<std::mutex> lock(validatorsMutex_);
    validators_[toolName] = std::move(validator);
}

void ToolInvoker::Warmup() {
    (void)acquire();
}

bool ToolInvoker::IsReady() const {
    std::lock_guard<std::mutex> lock(stateMutex_);
    return session_ && session_->IsReady();
}

SessionState ToolInvoker::State() const {
    std::lock_guard<std::mutex> lock(stateMutex_);
    return session_ ? session_->State() : SessionState::Uninitialized;
}

void ToolInvoker::Close() {
    std::shared_ptr<Session> current;
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        current = std::move(session_);
        ++closeGeneration_;
    }
    if (current) {
        current->Close("tool invoker closed");
    }
}

std::uint64_t ToolInvoker::SessionsStarted() const {
    std::lock_guard<std::mutex> lock(stateMutex_);
    return sessionsStarted_;
}

std::string ToolInvoker::LastError() const {
    std::lock_guard<std::mutex> lock(stateMutex_);
    return lastError_;
}

} // namespace websearch
