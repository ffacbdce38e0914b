//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: StdioTransport.cpp
// Purpose: stdio/pipe transport implementation
//==========================================================================================================

#include <unistd.h>
#include <fcntl.h>
#include <errno.h>
#include <poll.h>
#include <sys/eventfd.h>

#include <atomic>
#include <chrono>
#include <cstring>
#include <future>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <thread>

#include "env/EnvVars.h"
#include "logging/Logger.h"
#include "websearch/StdioTransport.hpp"
#include "websearch/errors/Errors.h"

namespace websearch {

namespace {
void setNonBlocking(int fd) {
    int flags = ::fcntl(fd, F_GETFL, 0);
    if (flags >= 0 && (flags & O_NONBLOCK) == 0) {
        if (::fcntl(fd, F_SETFL, flags | O_NONBLOCK) != 0) {
            LOG_WARN("StdioTransport: failed to set O_NONBLOCK on fd {} (errno={} msg={})", fd, errno, ::strerror(errno));
        }
    }
}
} // namespace

class StdioTransport::Impl {
public:
    int readFd{STDIN_FILENO};
    int writeFd{STDOUT_FILENO};
    bool ownsFds{false};
    int wakeEventFd{-1};

    std::atomic<bool> started{false};
    std::atomic<bool> connected{false};
    std::atomic<bool> closing{false};
    std::atomic<std::uint64_t> bytesWritten{0};
    std::string sessionId;

    FramingKind framing{FramingKind::NewlineDelimited};
    std::size_t maxFrameBytes{DefaultMaxFrameBytes};
    MessageCodec codec;
    std::chrono::milliseconds writeTimeout{10000};
    std::chrono::milliseconds idleReadTimeout{0};

    ITransport::MessageHandler messageHandler;
    ITransport::ErrorHandler errorHandler;
    ITransport::CloseHandler closeHandler;

    std::mutex writeMutex;
    std::thread readerThread;

    Impl() {
        std::random_device rd;
        std::mt19937_64 gen(rd());
        std::uniform_int_distribution<std::uint32_t> dis;
        sessionId = "stdio-" + std::to_string(dis(gen));
    }

    ~Impl() {
        closeInternal("transport destroyed");
        if (readerThread.joinable()) {
            if (readerThread.get_id() == std::this_thread::get_id()) {
                readerThread.detach();
            } else {
                readerThread.join();
            }
        }
        if (wakeEventFd >= 0) {
            ::close(wakeEventFd);
            wakeEventFd = -1;
        }
    }

    void reportError(const std::string& msg) {
        if (errorHandler) {
            errorHandler(msg);
        }
    }

    void wake() {
        if (wakeEventFd < 0) return;
        std::uint64_t one = 1;
        ssize_t w;
        do {
            w = ::write(wakeEventFd, &one, sizeof(one));
        } while (w < 0 && errno == EINTR);
        if (w < 0 && errno != EAGAIN) {
            LOG_WARN("StdioTransport: eventfd write failed (errno={} msg={})", errno, ::strerror(errno));
        }
    }

    //==========================================================================================================
    // closeInternal
    // Purpose: One-shot teardown. Safe from the reader thread, a writer, or an external caller.
    //==========================================================================================================
    void closeInternal(const std::string& reason) {
        bool expected = false;
        if (!closing.compare_exchange_strong(expected, true)) {
            return;
        }
        connected.store(false);
        wake();
        {
            // Waits for an in-flight write to finish or time out
            std::lock_guard<std::mutex> lock(writeMutex);
        }
        if (readerThread.joinable() && readerThread.get_id() != std::this_thread::get_id()) {
            readerThread.join();
        }
        if (ownsFds) {
            if (readFd >= 0) { ::close(readFd); readFd = -1; }
            if (writeFd >= 0) { ::close(writeFd); writeFd = -1; }
        }
        if (started.load()) {
            LOG_INFO("StdioTransport: {} closed ({})", sessionId, reason);
            if (closeHandler) {
                closeHandler(reason);
            }
        }
    }

    void deliver(Message message) {
        LOG_DEBUG("StdioTransport: received {}", messageKindName(message));
        if (!messageHandler) {
            return;
        }
        try {
            messageHandler(std::move(message));
        } catch (const std::exception& e) {
            LOG_ERROR("StdioTransport: message handler exception: {}", e.what());
            reportError(std::string("message handler exception: ") + e.what());
        }
    }

    // Returns false when the stream had to be closed.
    bool processBytes(const char* data, std::size_t n) {
        codec.Feed(data, n);
        while (true) {
            std::optional<Message> next;
            try {
                next = codec.Next();
            } catch (const errors::ProtocolError& e) {
                LOG_ERROR("StdioTransport: {}", e.what());
                reportError(e.what());
                closeInternal(std::string("protocol error: ") + e.what());
                return false;
            }
            if (!next.has_value()) {
                return true;
            }
            deliver(std::move(next.value()));
        }
    }

    void readerLoop() {
        char buf[8192];
        while (connected.load()) {
            struct pollfd pfds[2];
            pfds[0].fd = readFd; pfds[0].events = POLLIN; pfds[0].revents = 0;
            pfds[1].fd = wakeEventFd; pfds[1].events = POLLIN; pfds[1].revents = 0;
            int waitMs = idleReadTimeout.count() > 0 ? static_cast<int>(idleReadTimeout.count()) : -1;
            int rc = ::poll(pfds, 2, waitMs);
            if (rc < 0) {
                if (errno == EINTR) continue;
                LOG_ERROR("StdioTransport: poll failed (errno={} msg={})", errno, ::strerror(errno));
                reportError("StdioTransport: poll failed");
                closeInternal("poll failed");
                return;
            }
            if (rc == 0) {
                LOG_ERROR("StdioTransport: idle read timeout ({} ms)", static_cast<long long>(idleReadTimeout.count()));
                reportError("StdioTransport: idle read timeout");
                closeInternal("idle read timeout");
                return;
            }
            if (pfds[1].revents != 0) {
                return;
            }
            if (pfds[0].revents == 0) {
                continue;
            }
            ssize_t n = ::read(readFd, buf, sizeof(buf));
            if (n == 0) {
                LOG_INFO("StdioTransport: EOF on input");
                closeInternal("end of stream");
                return;
            }
            if (n < 0) {
                if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) continue;
                LOG_ERROR("StdioTransport: read error (errno={} msg={})", errno, ::strerror(errno));
                reportError("StdioTransport: read error");
                closeInternal("read error");
                return;
            }
            if (!processBytes(buf, static_cast<std::size_t>(n))) {
                return;
            }
        }
    }

    // Caller holds writeMutex. Returns an error description on failure.
    std::optional<std::string> writeAll(const std::string& frame) {
        const auto deadline = std::chrono::steady_clock::now() + writeTimeout;
        std::size_t off = 0;
        while (off < frame.size()) {
            ssize_t n = ::write(writeFd, frame.data() + off, frame.size() - off);
            if (n > 0) {
                off += static_cast<std::size_t>(n);
                continue;
            }
            if (n < 0 && errno == EINTR) continue;
            if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
                int waitMs = -1;
                if (writeTimeout.count() > 0) {
                    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                        deadline - std::chrono::steady_clock::now());
                    if (remaining.count() <= 0) {
                        return std::string("write timeout");
                    }
                    waitMs = static_cast<int>(remaining.count());
                }
                struct pollfd pfd{};
                pfd.fd = writeFd;
                pfd.events = POLLOUT;
                int rc = ::poll(&pfd, 1, waitMs);
                if (rc < 0 && errno != EINTR) {
                    return std::string("poll failed: ") + ::strerror(errno);
                }
                if (rc == 0) {
                    return std::string("write timeout");
                }
                if (rc > 0 && (pfd.revents & (POLLERR | POLLHUP)) != 0 && (pfd.revents & POLLOUT) == 0) {
                    return std::string("peer closed the stream");
                }
                continue;
            }
            return std::string("write error: ") + ::strerror(errno);
        }
        bytesWritten.fetch_add(frame.size());
        return std::nullopt;
    }
};

StdioTransport::StdioTransport() : pImpl(std::make_unique<Impl>()) { FUNC_SCOPE(); }

StdioTransport::StdioTransport(int readFd, int writeFd, bool ownsFds) : pImpl(std::make_unique<Impl>()) {
    FUNC_SCOPE();
    pImpl->readFd = readFd;
    pImpl->writeFd = writeFd;
    pImpl->ownsFds = ownsFds;
}

StdioTransport::~StdioTransport() { FUNC_SCOPE(); }

std::future<void> StdioTransport::Start() {
    FUNC_SCOPE();
    std::promise<void> ready;
    if (pImpl->closing.load()) {
        ready.set_exception(std::make_exception_ptr(errors::SessionClosedError("transport already closed")));
        return ready.get_future();
    }
    if (pImpl->started.exchange(true)) {
        ready.set_value();
        return ready.get_future();
    }
    pImpl->wakeEventFd = ::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (pImpl->wakeEventFd < 0) {
        int err = errno;
        LOG_ERROR("StdioTransport: failed to create eventfd (errno={} msg={})", err, ::strerror(err));
        pImpl->started.store(false);
        ready.set_exception(std::make_exception_ptr(
            std::runtime_error(std::string("eventfd failed: ") + ::strerror(err))));
        return ready.get_future();
    }
    setNonBlocking(pImpl->readFd);
    setNonBlocking(pImpl->writeFd);
    LOG_INFO("Starting StdioTransport {} (framing={})", pImpl->sessionId, toString(pImpl->framing));
    pImpl->connected.store(true);
    pImpl->readerThread = std::thread([this]() { pImpl->readerLoop(); });
    ready.set_value();
    return ready.get_future();
}

std::future<void> StdioTransport::Close() {
    FUNC_SCOPE();
    pImpl->closeInternal("closed locally");
    std::promise<void> done;
    done.set_value();
    return done.get_future();
}

bool StdioTransport::IsConnected() const { return pImpl->connected.load(); }
std::string StdioTransport::GetSessionId() const { return pImpl->sessionId; }
std::uint64_t StdioTransport::BytesWritten() const { return pImpl->bytesWritten.load(); }

void StdioTransport::Send(const Message& message) {
    FUNC_SCOPE();
    const std::string frame = pImpl->codec.Encode(message);
    std::optional<std::string> failure;
    {
        std::lock_guard<std::mutex> lock(pImpl->writeMutex);
        if (!pImpl->connected.load()) {
            throw errors::SessionClosedError("transport is closed");
        }
        LOG_DEBUG("Sending framed {} ({} bytes)", messageKindName(message), frame.size());
        failure = pImpl->writeAll(frame);
    }
    if (failure.has_value()) {
        LOG_ERROR("StdioTransport: {}", failure.value());
        pImpl->reportError("StdioTransport: " + failure.value());
        pImpl->closeInternal(failure.value());
        throw errors::SessionClosedError("transport write failed: " + failure.value());
    }
}

void StdioTransport::SetMessageHandler(MessageHandler handler) { pImpl->messageHandler = std::move(handler); }
void StdioTransport::SetErrorHandler(ErrorHandler handler) { pImpl->errorHandler = std::move(handler); }
void StdioTransport::SetCloseHandler(CloseHandler handler) { pImpl->closeHandler = std::move(handler); }

void StdioTransport::SetFraming(FramingKind framing) {
    pImpl->framing = framing;
    pImpl->codec = MessageCodec(framing, pImpl->maxFrameBytes);
}

void StdioTransport::SetMaxFrameBytes(std::size_t maxBytes) {
    pImpl->maxFrameBytes = maxBytes;
    pImpl->codec = MessageCodec(pImpl->framing, maxBytes);
}

void StdioTransport::SetWriteTimeoutMs(uint64_t timeoutMs) {
    pImpl->writeTimeout = std::chrono::milliseconds(timeoutMs);
}

void StdioTransport::SetIdleReadTimeoutMs(uint64_t timeoutMs) {
    pImpl->idleReadTimeout = std::chrono::milliseconds(timeoutMs);
}

void StdioTransportTestHooks::feed(StdioTransport& t, const std::string& bytes) {
    (void)t.pImpl->processBytes(bytes.data(), bytes.size());
}

bool StdioTransportTestHooks::isConnected(const StdioTransport& t) {
    return t.pImpl->connected.load();
}

std::unique_ptr<ITransport> StdioTransportFactory::CreateTransport(const std::string& config) {
    auto t = std::make_unique<StdioTransport>();
    for (const auto& [key, val] : parseTransportConfig(config)) {
        if (key == "framing") {
            if (auto f = parseFramingKind(val)) {
                t->SetFraming(*f);
            } else {
                LOG_WARN("StdioTransportFactory: unknown framing '{}'", val);
            }
        } else if (key == "write_timeout_ms") {
            if (auto v = ParseUnsigned(val)) t->SetWriteTimeoutMs(*v);
        } else if (key == "max_frame_bytes") {
            if (auto v = ParseUnsigned(val); v && *v > 0) t->SetMaxFrameBytes(static_cast<std::size_t>(*v));
        } else if (key == "idle_read_timeout_ms") {
            if (auto v = ParseUnsigned(val)) t->SetIdleReadTimeoutMs(*v);
        }
    }
    return t;
}

} // namespace websearch
