//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: StdioTransport.hpp
// Purpose: Concrete stdio/pipe based transport
//==========================================================================================================
#pragma once

#include "websearch/Transport.h"
#include <memory>
#include <cstdint>

namespace websearch {

//==========================================================================================================
// StdioTransport
// Purpose: Protocol messages over a pair of file descriptors: the process's own stdin/stdout (tool host
//          side) or the pipes of a child process (bridge side).
// Notes:
//   - A malformed or oversized frame closes the transport ("protocol error: ..."); the stream is not
//     resynchronized.
//==========================================================================================================
class StdioTransport : public ITransport {
public:
    // Uses fds 0/1, not owned.
    StdioTransport();
    // Uses the given fds; closes them on Close() when ownsFds is true.
    StdioTransport(int readFd, int writeFd, bool ownsFds = false);
    virtual ~StdioTransport();

    ////////////////////////////////////////// ITransport //////////////////////////////////////////
    std::future<void> Start() override;
    std::future<void> Close() override;
    bool IsConnected() const override;
    std::string GetSessionId() const override;
    void Send(const Message& message) override;
    void SetMessageHandler(MessageHandler handler) override;
    void SetErrorHandler(ErrorHandler handler) override;
    void SetCloseHandler(CloseHandler handler) override;
    std::uint64_t BytesWritten() const override;

    // Must be called before Start().
    void SetFraming(FramingKind framing);
    void SetMaxFrameBytes(std::size_t maxBytes);

    //==========================================================================================================
    // SetWriteTimeoutMs
    // Purpose: Per-frame write timeout.
    // Args:
    //   timeoutMs: Milliseconds to allow for writing a frame before error/close (0 waits forever).
    //==========================================================================================================
    void SetWriteTimeoutMs(uint64_t timeoutMs);

    //==========================================================================================================
    // SetIdleReadTimeoutMs
    // Purpose: If > 0, emit an error and close when no bytes arrive for the given duration.
    //==========================================================================================================
    void SetIdleReadTimeoutMs(uint64_t timeoutMs);

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
    friend struct StdioTransportTestHooks;
};

//==========================================================================================================
// StdioTransportFactory
// Purpose: Factory for creating stdio transports on fds 0/1.
//   Keys: framing, write_timeout_ms, max_frame_bytes, idle_read_timeout_ms
//==========================================================================================================
class StdioTransportFactory : public ITransportFactory {
public:
    std::unique_ptr<ITransport> CreateTransport(const std::string& config) override;
};

struct StdioTransportTestHooks {
    // Runs bytes through the reader's decode/dispatch path without touching the fds.
    static void feed(StdioTransport& t, const std::string& bytes);
    static bool isConnected(const StdioTransport& t);
};

} // namespace websearch
