//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ToolInvoker.h
// Purpose: Tool Invoker - lazily started, shared session with bounded recovery after session loss
//==========================================================================================================

#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>

#include "websearch/Session.h"

namespace websearch {

using TransportFactoryFn = std::function<std::unique_ptr<ITransport>()>;
using ArgumentValidator = std::function<void(const ToolCall&)>;

struct ToolInvokerOptions {
    SessionOptions session;
    std::chrono::milliseconds defaultTimeout{30000};
    // Fresh sessions tried after a SessionClosedError, per call.
    int maxRecoveries{1};
};

//==========================================================================================================
// ToolInvoker
// Purpose: Runs tool calls on one long-lived session, created on first use (or by Warmup()).
// Notes:
//   - Concurrent first callers share a single spawn.
//   - errors::SessionClosedError retires the session, starts one fresh session and retries the call once.
//     Timeouts, tool errors, spawn and handshake failures are surfaced without retry.
//   - A failed tool result is raised as errors::ToolExecutionError; Invoke() only returns successes.
//==========================================================================================================
class ToolInvoker {
public:
    explicit ToolInvoker(TransportFactoryFn transportFactory, ToolInvokerOptions options = {});
    ~ToolInvoker();

    ToolInvoker(const ToolInvoker&) = delete;
    ToolInvoker& operator=(const ToolInvoker&) = delete;

    //==========================================================================================================
    // Invoke
    // Purpose: Validates the call, ensures a Ready session and performs tools/call.
    // Args:
    //   toolName / call: Tool to run; must not be empty.
    //   timeout: Per-attempt deadline; must be positive.
    // Returns:
    //   Successful ToolResult.
    // Throws:
    //   errors::InvalidArgumentError (nothing is sent), errors::ToolExecutionError, errors::TimeoutError,
    //   errors::SpawnError, errors::HandshakeError, errors::SessionClosedError (after the retry),
    //   errors::ProtocolError.
    //==========================================================================================================
    ToolResult Invoke(const std::string& toolName, ToolCall::Arguments arguments, std::chrono::milliseconds timeout);
    ToolResult Invoke(const ToolCall& call, std::chrono::milliseconds timeout);
    ToolResult Invoke(const ToolCall& call);

    // Replaces any validator registered for the tool.
    void RegisterArgumentValidator(const std::string& toolName, ArgumentValidator validator);

    // Establishes the session now instead of on first Invoke(). Throws like Invoke().
    void Warmup();

    bool IsReady() const;
    // State of the current session; Uninitialized when there is none.
    SessionState State() const;

    // Retires the current session (stopping its tool host). The next Invoke() starts exactly one new one.
    // A session still handshaking is stopped as well; its Invoke()/Warmup() fails with SessionClosedError.
    void Close();

    std::uint64_t SessionsStarted() const;
    // Message of the most recent session-level failure; empty when none.
    std::string LastError() const;

private:
    std::shared_ptr<Session> acquire();
    void retire(const std::shared_ptr<Session>& session, const std::string& reason);
    void recordError(const std::string& message);

    TransportFactoryFn transportFactory_;
    ToolInvokerOptions options_;

    mutable std::mutex stateMutex_;
    std::mutex initMutex_;  // serializes session creation
    std::shared_ptr<Session> session_;
    std::uint64_t sessionsStarted_{0};
    std::uint64_t closeGeneration_{0};  // bumped by Close()
    std::string lastError_;

    mutable std::mutex validatorsMutex_;
    std::map<std::string, ArgumentValidator> validators_;
};

} // namespace websearch
