//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ProcessTransport.hpp
// Purpose: Transport that owns a tool-host subprocess and talks to it over its stdio pipes
//==========================================================================================================
#pragma once

#include <chrono>
#include <memory>

#include "websearch/ContentFramer.h"
#include "websearch/ProcessSupervisor.hpp"
#include "websearch/Transport.h"

namespace websearch {

struct ProcessTransportOptions {
    FramingKind framing = FramingKind::NewlineDelimited;
    std::size_t maxFrameBytes = DefaultMaxFrameBytes;
    std::uint64_t writeTimeoutMs = 10000;
    std::chrono::milliseconds stopGrace{5000};
};

//==========================================================================================================
// ProcessTransport
// Purpose: Start() spawns the child (errors::SpawnError surfaces through the returned future); the
//          child's exit closes the transport with reason "tool host exited: ...". Close() stops the
//          child (SIGTERM, then SIGKILL after the grace period).
//==========================================================================================================
class ProcessTransport : public ITransport {
public:
    ProcessTransport(ProcessSpec spec, ProcessTransportOptions options = {});
    ~ProcessTransport() override;

    std::future<void> Start() override;
    std::future<void> Close() override;
    bool IsConnected() const override;
    std::string GetSessionId() const override;
    void Send(const Message& message) override;
    void SetMessageHandler(MessageHandler handler) override;
    void SetErrorHandler(ErrorHandler handler) override;
    void SetCloseHandler(CloseHandler handler) override;
    std::uint64_t BytesWritten() const override;

    // -1 before Start() and after the child has been reaped.
    int ChildPid() const;
    // Final status once the child has been stopped or exited.
    std::optional<ExitStatus> LastExitStatus() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

//==========================================================================================================
// ProcessTransportFactory
// Purpose: Creates process transports for a fixed ProcessSpec.
//   Keys: framing, write_timeout_ms, max_frame_bytes, stderr (log|discard|inherit), grace_ms
//==========================================================================================================
class ProcessTransportFactory : public ITransportFactory {
public:
    explicit ProcessTransportFactory(ProcessSpec spec) : spec_(std::move(spec)) {}
    std::unique_ptr<ITransport> CreateTransport(const std::string& config) override;

private:
    ProcessSpec spec_;
};

} // namespace websearch
