//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Session.h
// Purpose: Session Client - handshake, request/response correlation and lifecycle of one tool-host link
//==========================================================================================================

#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "websearch/Protocol.h"
#include "websearch/ToolResult.h"
#include "websearch/Transport.h"

namespace websearch {

//==========================================================================================================
// SessionState
// Purpose: Uninitialized -> Handshaking -> Ready -> Closed. Closed is terminal; a session is never reused.
//==========================================================================================================
enum class SessionState {
    Uninitialized,
    Handshaking,
    Ready,
    Closed
};

const char* toString(SessionState state);

struct SessionOptions {
    Implementation clientInfo{"websearch-bridge", "1.0.0"};
    std::chrono::milliseconds startupTimeout{10000};
    std::chrono::milliseconds requestTimeout{30000};
};

//==========================================================================================================
// Session
// Purpose: Owns one transport (normally a tool-host process) and correlates requests with responses.
// Notes:
//   - Request ids are positive integers, unique and increasing within the session.
//   - Every pending call resolves exactly once: with its response, with errors::TimeoutError, or with
//     errors::SessionClosedError when the transport closes (e.g. the tool host exits).
//   - A response for an id that is not pending is logged and discarded.
//   - Thread-safe: many callers may Send/AwaitResponse concurrently.
//==========================================================================================================
class Session {
public:
    using NotificationHandler = std::function<void(const JSONRPCNotification&)>;

    explicit Session(std::unique_ptr<ITransport> transport, SessionOptions options = {});
    ~Session();

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    //==========================================================================================================
    // Initialize
    // Purpose: Starts the transport, performs the initialize handshake and sends notifications/initialized.
    // Throws:
    //   errors::SpawnError when the transport (tool host) cannot be started.
    //   errors::HandshakeError on timeout, error response, closure during the handshake, or an
    //     unsupported protocol version. The session is Closed afterwards.
    //   errors::SessionClosedError when called on a closed session.
    // Notes:
    //   Returns immediately when the session is already Ready.
    //==========================================================================================================
    void Initialize();

    //==========================================================================================================
    // Send
    // Purpose: Allocates an id, registers the pending slot, and writes the request.
    // Returns:
    //   The request id to pass to AwaitResponse().
    // Throws:
    //   errors::SessionNotReadyError unless Ready; errors::SessionClosedError when Closed or the write fails.
    //==========================================================================================================
    int64_t Send(const std::string& method, std::optional<JSONValue> params = std::nullopt);

    //==========================================================================================================
    // AwaitResponse
    // Purpose: Blocks until the response for id arrives or the deadline passes.
    // Throws:
    //   errors::TimeoutError (the slot is released; a late response is discarded),
    //   errors::SessionClosedError when the session closes first,
    //   errors::InvalidArgumentError when id is not a pending request of this session.
    //==========================================================================================================
    JSONRPCResponse AwaitResponse(int64_t id, std::chrono::steady_clock::time_point deadline);

    // Send() + AwaitResponse() with the given timeout (requestTimeout when unset).
    JSONRPCResponse Request(const std::string& method, std::optional<JSONValue> params = std::nullopt,
                            std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    //==========================================================================================================
    // CallTool
    // Purpose: tools/call round trip, mapped to a ToolResult.
    // Returns:
    //   Success with the content items, or Failure for an error response or a result with isError=true.
    // Throws:
    //   errors::ProtocolError(Malformed) when the result lacks a content array; transport errors as Send().
    //==========================================================================================================
    ToolResult CallTool(const ToolCall& call, std::chrono::milliseconds timeout);

    std::vector<Tool> ListTools(std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    void Notify(const std::string& method, std::optional<JSONValue> params = std::nullopt);

    //==========================================================================================================
    // Close
    // Purpose: Fails all pending calls with errors::SessionClosedError and closes the transport. Idempotent.
    //==========================================================================================================
    void Close(const std::string& reason = "session closed");

    SessionState State() const;
    bool IsReady() const;
    std::size_t PendingCount() const;
    std::optional<Implementation> ServerInfo() const;
    std::optional<std::string> NegotiatedProtocolVersion() const;
    // Why the session closed; empty while open.
    std::string CloseReason() const;
    std::string Id() const;

    void SetNotificationHandler(NotificationHandler handler);

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace websearch
