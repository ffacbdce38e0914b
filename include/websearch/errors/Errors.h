//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Errors.h
// Purpose: Typed JSON-RPC error structures and the bridge failure taxonomy (exceptions)
//==========================================================================================================

#pragma once

#include <optional>
#include <stdexcept>
#include <string>

#include "websearch/JSONRPCTypes.h"

namespace websearch {
namespace errors {

// Categorization of common JSON-RPC and MCP error codes.
enum class ErrorCategory {
    JsonRpcParse,
    JsonRpcInvalidRequest,
    JsonRpcMethodNotFound,
    JsonRpcInvalidParams,
    JsonRpcInternal,
    McpInvalidRequestId,
    McpMethodNotAllowed,
    McpResourceNotFound,
    McpToolNotFound,
    McpPromptNotFound,
    McpToolExecution,
    Unknown
};

// Typed error representation of a JSON-RPC error object or a tool-reported failure.
struct McpError {
    int code{0};
    std::string message;
    std::optional<JSONValue> data;
    ErrorCategory category{ErrorCategory::Unknown};
};

// Map a JSON-RPC/MCP numeric error code to an ErrorCategory.
//
// Args:
//   code: The integer error code (JSON-RPC standard or MCP-specific).
//
// Returns:
//   ErrorCategory corresponding to the code, or Unknown when unmapped.
inline ErrorCategory errorCategoryFromCode(int code) {
    switch (code) {
        case JSONRPCErrorCodes::ParseError: return ErrorCategory::JsonRpcParse;
        case JSONRPCErrorCodes::InvalidRequest: return ErrorCategory::JsonRpcInvalidRequest;
        case JSONRPCErrorCodes::MethodNotFound: return ErrorCategory::JsonRpcMethodNotFound;
        case JSONRPCErrorCodes::InvalidParams: return ErrorCategory::JsonRpcInvalidParams;
        case JSONRPCErrorCodes::InternalError: return ErrorCategory::JsonRpcInternal;
        case JSONRPCErrorCodes::InvalidRequestId: return ErrorCategory::McpInvalidRequestId;
        case JSONRPCErrorCodes::MethodNotAllowed: return ErrorCategory::McpMethodNotAllowed;
        case JSONRPCErrorCodes::ResourceNotFound: return ErrorCategory::McpResourceNotFound;
        case JSONRPCErrorCodes::ToolNotFound: return ErrorCategory::McpToolNotFound;
        case JSONRPCErrorCodes::PromptNotFound: return ErrorCategory::McpPromptNotFound;
        case JSONRPCErrorCodes::ToolExecutionFailed: return ErrorCategory::McpToolExecution;
        default: return ErrorCategory::Unknown;
    }
}

// Convert a JSON-RPC error object (shape: { code, message, data? }) to McpError.
// Returns std::nullopt when the input is not a valid error object.
inline std::optional<McpError> mcpErrorFromErrorValue(const JSONValue& errVal) {
    if (!errVal.isObject()) {
        return std::nullopt;
    }
    auto code = getIntegerMember(errVal, "code");
    auto message = getStringMember(errVal, "message");
    if (!code.has_value() || !message.has_value()) {
        return std::nullopt;
    }
    McpError e;
    e.code = static_cast<int>(code.value());
    e.message = std::move(message.value());
    if (const JSONValue* data = errVal.find("data")) {
        e.data = *data;
    }
    e.category = errorCategoryFromCode(e.code);
    return e;
}

// Extract McpError from a JSONRPCResponse if it carries an error.
inline std::optional<McpError> mcpErrorFromResponse(const JSONRPCResponse& response) {
    if (!response.error.has_value()) {
        return std::nullopt;
    }
    return mcpErrorFromErrorValue(response.error.value());
}

// Shorthand builder used by request handlers.
inline McpError makeError(int code, std::string message, std::optional<JSONValue> data = std::nullopt) {
    McpError e;
    e.code = code;
    e.message = std::move(message);
    e.data = std::move(data);
    e.category = errorCategoryFromCode(code);
    return e;
}

//==========================================================================================================
// BridgeErrorKind
// Purpose: Failure taxonomy of the process-managed protocol bridge.
//==========================================================================================================
enum class BridgeErrorKind {
    Spawn,            // tool host could not be launched
    Protocol,         // malformed or oversized frame, or a result violating the protocol shape
    Handshake,        // initialize failed, timed out or negotiated an unsupported version
    SessionNotReady,  // request attempted before the session reached Ready
    Timeout,          // per-call deadline expired
    ToolExecution,    // tool host reported a failure for the call
    SessionClosed,    // transport closed or the tool host exited
    InvalidArgument   // caller input rejected before touching the session
};

inline const char* toString(BridgeErrorKind kind) {
    switch (kind) {
        case BridgeErrorKind::Spawn: return "spawn_error";
        case BridgeErrorKind::Protocol: return "protocol_error";
        case BridgeErrorKind::Handshake: return "handshake_error";
        case BridgeErrorKind::SessionNotReady: return "session_not_ready";
        case BridgeErrorKind::Timeout: return "timeout";
        case BridgeErrorKind::ToolExecution: return "tool_error";
        case BridgeErrorKind::SessionClosed: return "session_closed";
        case BridgeErrorKind::InvalidArgument: return "invalid_argument";
    }
    return "unknown";
}

//==========================================================================================================
// BridgeError
// Purpose: Base exception for every failure surfaced by the bridge.
// Methods:
//   kind(): Taxonomy entry.
//   retryable(): True for failures a caller may reasonably retry later.
//==========================================================================================================
class BridgeError : public std::runtime_error {
public:
    BridgeError(BridgeErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    BridgeErrorKind kind() const noexcept { return kind_; }

    bool retryable() const noexcept {
        return kind_ == BridgeErrorKind::SessionNotReady ||
               kind_ == BridgeErrorKind::Timeout ||
               kind_ == BridgeErrorKind::SessionClosed;
    }

private:
    BridgeErrorKind kind_;
};

class SpawnError : public BridgeError {
public:
    explicit SpawnError(const std::string& message, int errnoValue = 0)
        : BridgeError(BridgeErrorKind::Spawn, message), errno_(errnoValue) {}
    int errnoValue() const noexcept { return errno_; }

private:
    int errno_;
};

enum class ProtocolErrorKind {
    Malformed,
    FrameTooLarge
};

class ProtocolError : public BridgeError {
public:
    ProtocolError(ProtocolErrorKind kind, const std::string& message)
        : BridgeError(BridgeErrorKind::Protocol, message), protocolKind_(kind) {}
    ProtocolErrorKind protocolKind() const noexcept { return protocolKind_; }

private:
    ProtocolErrorKind protocolKind_;
};

class HandshakeError : public BridgeError {
public:
    explicit HandshakeError(const std::string& message)
        : BridgeError(BridgeErrorKind::Handshake, message) {}
};

class SessionNotReadyError : public BridgeError {
public:
    explicit SessionNotReadyError(const std::string& message)
        : BridgeError(BridgeErrorKind::SessionNotReady, message) {}
};

class TimeoutError : public BridgeError {
public:
    explicit TimeoutError(const std::string& message)
        : BridgeError(BridgeErrorKind::Timeout, message) {}
};

class SessionClosedError : public BridgeError {
public:
    explicit SessionClosedError(const std::string& message)
        : BridgeError(BridgeErrorKind::SessionClosed, message) {}
};

class InvalidArgumentError : public BridgeError {
public:
    explicit InvalidArgumentError(const std::string& message)
        : BridgeError(BridgeErrorKind::InvalidArgument, message) {}
};

// Carries the tool host's failure descriptor verbatim.
class ToolExecutionError : public BridgeError {
public:
    explicit ToolExecutionError(McpError error)
        : BridgeError(BridgeErrorKind::ToolExecution, error.message), error_(std::move(error)) {}
    const McpError& error() const noexcept { return error_; }
    int code() const noexcept { return error_.code; }

private:
    McpError error_;
};

} // namespace errors
} // namespace websearch
