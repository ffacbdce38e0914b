//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Transport.h
// Purpose: Message-level transport interfaces shared by the bridge session and the tool host
//==========================================================================================================

#pragma once

#include <cstdint>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <string>

#include "websearch/MessageCodec.h"

namespace websearch {

//==========================================================================================================
// ITransport
// Purpose: Bidirectional carrier of protocol messages over one connection.
// Notes:
//   - Handlers are invoked on the transport's reader thread; they must not call Close() and then wait
//     for the reader to finish.
//   - The close handler fires exactly once, whether the close was requested locally, the peer hung up,
//     or a protocol error made the stream unusable.
//==========================================================================================================
class ITransport {
public:
    virtual ~ITransport() = default;

    /////////////////////////////////////////// Connection lifecycle ///////////////////////////////////////////
    //==========================================================================================================
    // Starts the transport I/O loop.
    // Returns:
    //   A future that completes when the transport is running, or holds the startup failure
    //   (errors::SpawnError for process-backed transports).
    //==========================================================================================================
    virtual std::future<void> Start() = 0;

    //==========================================================================================================
    // Closes the transport and releases resources. Idempotent.
    // Returns:
    //   A future that completes when the transport has closed.
    //==========================================================================================================
    virtual std::future<void> Close() = 0;

    virtual bool IsConnected() const = 0;

    // Diagnostic identifier (e.g. "stdio-3f2a...", "process-4711").
    virtual std::string GetSessionId() const = 0;

    /////////////////////////////////////////// Message sending ///////////////////////////////////////////
    //==========================================================================================================
    // Send
    // Purpose: Encodes and writes one message. Writes from several threads are serialized.
    // Throws:
    //   errors::SessionClosedError when the transport is closed or the write fails.
    //==========================================================================================================
    virtual void Send(const Message& message) = 0;

    /////////////////////////////////////////// Handlers ///////////////////////////////////////////
    using MessageHandler = std::function<void(Message message)>;
    using ErrorHandler = std::function<void(const std::string& error)>;
    using CloseHandler = std::function<void(const std::string& reason)>;

    virtual void SetMessageHandler(MessageHandler handler) = 0;
    virtual void SetErrorHandler(ErrorHandler handler) = 0;
    virtual void SetCloseHandler(CloseHandler handler) = 0;

    // Total framed bytes written so far.
    virtual std::uint64_t BytesWritten() const = 0;
};

//==========================================================================================================
// Transport factory interface
// Purpose: Factory for creating transports from configuration strings.
//==========================================================================================================
class ITransportFactory {
public:
    virtual ~ITransportFactory() = default;

    //==========================================================================================================
    // Creates a transport instance using the provided configuration.
    // Args:
    //   config: "key=value" pairs separated by ';' or whitespace (e.g. "framing=newline;write_timeout_ms=5000").
    // Returns:
    //   A unique_ptr to a newly created ITransport.
    //==========================================================================================================
    virtual std::unique_ptr<ITransport> CreateTransport(const std::string& config) = 0;
};

// Splits a factory configuration string into key/value pairs. Tokens without '=' are ignored.
std::map<std::string, std::string> parseTransportConfig(const std::string& config);

} // namespace websearch
