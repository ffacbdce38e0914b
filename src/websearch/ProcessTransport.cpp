//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ProcessTransport.cpp
// Purpose: Subprocess-backed transport (process supervision + stdio pipes)
//==========================================================================================================

#include <atomic>
#include <mutex>
#include <optional>
#include <thread>

#include "env/EnvVars.h"
#include "logging/Logger.h"
#include "websearch/ProcessTransport.hpp"
#include "websearch/StdioTransport.hpp"
#include "websearch/errors/Errors.h"

namespace websearch {

class ProcessTransport::Impl {
public:
    ProcessSpec spec;
    ProcessTransportOptions options;

    mutable std::mutex mutex;
    std::unique_ptr<ChildProcess> child;
    std::unique_ptr<StdioTransport> stdio;
    std::optional<ExitStatus> lastStatus;

    std::atomic<bool> started{false};
    std::atomic<bool> shutDown{false};
    std::atomic<bool> stopWatch{false};
    std::thread watchThread;

    ITransport::MessageHandler messageHandler;
    ITransport::ErrorHandler errorHandler;
    ITransport::CloseHandler closeHandler;

    Impl(ProcessSpec s, ProcessTransportOptions o) : spec(std::move(s)), options(o) {}

    ~Impl() {
        shutdown("transport destroyed");
        if (watchThread.joinable()) {
            if (watchThread.get_id() == std::this_thread::get_id()) {
                watchThread.detach();
            } else {
                watchThread.join();
            }
        }
        // The stdio reader uses the child's fds, so it goes first
        stdio.reset();
        child.reset();
    }

    void stopChild() {
        if (!child) return;
        ExitStatus st = ProcessSupervisor::Stop(*child, options.stopGrace);
        std::lock_guard<std::mutex> lock(mutex);
        lastStatus = st;
    }

    //==========================================================================================================
    // shutdown
    // Purpose: One-shot close: stream first, then listeners, then the child. Never joins the calling thread.
    //==========================================================================================================
    void shutdown(const std::string& reason) {
        if (shutDown.exchange(true)) {
            return;
        }
        stopWatch.store(true);
        if (stdio) {
            stdio->Close().get();
        }
        if (started.load()) {
            LOG_INFO("ProcessTransport: closing ({})", reason);
            if (closeHandler) {
                closeHandler(reason);
            }
        }
        stopChild();
    }

    void onStreamClosed(const std::string& reason) {
        std::string effective = reason;
        // EOF normally means the child is exiting; report the exit when it follows promptly
        if (child && reason == "end of stream") {
            auto fut = child->ExitFuture();
            if (fut.wait_for(std::chrono::milliseconds(200)) == std::future_status::ready) {
                effective = "tool host exited: " + fut.get().Describe();
            }
        }
        shutdown(effective);
    }

    void startWatch() {
        auto exitFuture = ProcessSupervisor::Watch(*child);
        watchThread = std::thread([this, exitFuture]() {
            while (!stopWatch.load()) {
                if (exitFuture.wait_for(std::chrono::milliseconds(50)) == std::future_status::ready) {
                    shutdown("tool host exited: " + exitFuture.get().Describe());
                    return;
                }
            }
        });
    }
};

ProcessTransport::ProcessTransport(ProcessSpec spec, ProcessTransportOptions options)
    : pImpl(std::make_unique<Impl>(std::move(spec), options)) {}

ProcessTransport::~ProcessTransport() = default;

std::future<void> ProcessTransport::Start() {
    FUNC_SCOPE();
    std::promise<void> ready;
    if (pImpl->shutDown.load()) {
        ready.set_exception(std::make_exception_ptr(errors::SessionClosedError("transport already closed")));
        return ready.get_future();
    }
    if (pImpl->started.load()) {
        ready.set_value();
        return ready.get_future();
    }

    std::unique_ptr<ChildProcess> child;
    try {
        child = ProcessSupervisor::Start(pImpl->spec);
    } catch (const errors::SpawnError&) {
        ready.set_exception(std::current_exception());
        return ready.get_future();
    }

    auto stdio = std::make_unique<StdioTransport>(child->StdoutFd(), child->StdinFd(), false);
    stdio->SetFraming(pImpl->options.framing);
    stdio->SetMaxFrameBytes(pImpl->options.maxFrameBytes);
    stdio->SetWriteTimeoutMs(pImpl->options.writeTimeoutMs);
    stdio->SetMessageHandler([this](Message m) {
        if (pImpl->messageHandler) pImpl->messageHandler(std::move(m));
    });
    stdio->SetErrorHandler([this](const std::string& err) {
        if (pImpl->errorHandler) pImpl->errorHandler(err);
    });
    stdio->SetCloseHandler([this](const std::string& reason) { pImpl->onStreamClosed(reason); });

    pImpl->child = std::move(child);
    pImpl->stdio = std::move(stdio);
    pImpl->started.store(true);

    try {
        pImpl->stdio->Start().get();
    } catch (const std::exception& e) {
        LOG_ERROR("ProcessTransport: failed to start stdio pipes: {}", e.what());
        pImpl->shutdown(std::string("failed to start pipes: ") + e.what());
        ready.set_exception(std::make_exception_ptr(
            errors::SpawnError(std::string("failed to attach to tool host: ") + e.what())));
        return ready.get_future();
    }
    pImpl->startWatch();
    ready.set_value();
    return ready.get_future();
}

std::future<void> ProcessTransport::Close() {
    FUNC_SCOPE();
    pImpl->shutdown("closed locally");
    // A concurrent shutdown may still be stopping the child; Stop() waits for it either way
    pImpl->stopChild();
    std::promise<void> done;
    done.set_value();
    return done.get_future();
}

bool ProcessTransport::IsConnected() const {
    return !pImpl->shutDown.load() && pImpl->stdio && pImpl->stdio->IsConnected();
}

std::string ProcessTransport::GetSessionId() const {
    int pid = ChildPid();
    return pid > 0 ? "process-" + std::to_string(pid) : std::string("process");
}

void ProcessTransport::Send(const Message& message) {
    if (pImpl->shutDown.load() || !pImpl->stdio) {
        throw errors::SessionClosedError("tool host transport is closed");
    }
    pImpl->stdio->Send(message);
}

void ProcessTransport::SetMessageHandler(MessageHandler handler) { pImpl->messageHandler = std::move(handler); }
void ProcessTransport::SetErrorHandler(ErrorHandler handler) { pImpl->errorHandler = std::move(handler); }
void ProcessTransport::SetCloseHandler(CloseHandler handler) { pImpl->closeHandler = std::move(handler); }

std::uint64_t ProcessTransport::BytesWritten() const {
    return pImpl->stdio ? pImpl->stdio->BytesWritten() : 0u;
}

int ProcessTransport::ChildPid() const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    if (!pImpl->child || pImpl->lastStatus.has_value()) {
        return -1;
    }
    return pImpl->child->Pid();
}

std::optional<ExitStatus> ProcessTransport::LastExitStatus() const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    return pImpl->lastStatus;
}

std::unique_ptr<ITransport> ProcessTransportFactory::CreateTransport(const std::string& config) {
    ProcessSpec spec = spec_;
    ProcessTransportOptions options;
    for (const auto& [key, val] : parseTransportConfig(config)) {
        if (key == "framing") {
            if (auto f = parseFramingKind(val)) {
                options.framing = *f;
            } else {
                LOG_WARN("ProcessTransportFactory: unknown framing '{}'", val);
            }
        } else if (key == "write_timeout_ms") {
            if (auto v = ParseUnsigned(val)) options.writeTimeoutMs = *v;
        } else if (key == "max_frame_bytes") {
            if (auto v = ParseUnsigned(val); v && *v > 0) options.maxFrameBytes = static_cast<std::size_t>(*v);
        } else if (key == "grace_ms") {
            if (auto v = ParseUnsigned(val)) options.stopGrace = std::chrono::milliseconds(*v);
        } else if (key == "stderr") {
            if (val == "log") spec.stderrMode = StderrMode::Log;
            else if (val == "discard") spec.stderrMode = StderrMode::Discard;
            else if (val == "inherit") spec.stderrMode = StderrMode::Inherit;
            else LOG_WARN("ProcessTransportFactory: unknown stderr mode '{}'", val);
        }
    }
    return std::make_unique<ProcessTransport>(std::move(spec), options);
}

} // namespace websearch
