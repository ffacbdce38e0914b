//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: InMemoryTransport.cpp
// Purpose: In-memory transport implementation
//==========================================================================================================

#include <atomic>
#include <condition_variable>
#include <deque>
#include <future>
#include <mutex>
#include <optional>
#include <random>
#include <stop_token>
#include <string>
#include <thread>

#include "logging/Logger.h"
#include "websearch/InMemoryTransport.hpp"
#include "websearch/errors/Errors.h"

namespace websearch {

class InMemoryTransport::Impl {
public:
    // Shared by both ends; an end unregisters itself before it is destroyed.
    struct Link {
        std::mutex mutex;
        Impl* ends[2] = {nullptr, nullptr};
    };

    std::atomic<bool> connected{false};
    std::atomic<bool> closing{false};
    std::atomic<bool> started{false};
    std::atomic<std::uint64_t> bytesWritten{0};
    std::string sessionId;
    ITransport::MessageHandler messageHandler;
    ITransport::ErrorHandler errorHandler;
    ITransport::CloseHandler closeHandler;

    std::shared_ptr<Link> link;
    int side{0};

    // nullopt is the "peer closed" marker
    std::deque<std::optional<std::string>> queue;
    std::mutex queueMutex;
    std::condition_variable queueCondition;
    std::jthread processingThread;

    Impl() {
        std::random_device rd;
        std::mt19937 gen(rd());
        std::uniform_int_distribution<> dis(1000, 9999);
        sessionId = "memory-" + std::to_string(dis(gen));
    }

    ~Impl() {
        closeInternal("transport destroyed");
        if (link) {
            std::lock_guard<std::mutex> lock(link->mutex);
            link->ends[side] = nullptr;
        }
        if (processingThread.joinable()) {
            processingThread.request_stop();
            queueCondition.notify_all();
            if (processingThread.get_id() == std::this_thread::get_id()) {
                processingThread.detach();
            } else {
                processingThread.join();
            }
        }
    }

    void enqueue(std::optional<std::string> item) {
        {
            std::lock_guard<std::mutex> lock(queueMutex);
            queue.push_back(std::move(item));
        }
        queueCondition.notify_one();
    }

    // Returns false when the peer is gone or closed.
    bool sendToPeer(std::optional<std::string> item) {
        if (!link) return false;
        std::lock_guard<std::mutex> lock(link->mutex);
        Impl* peer = link->ends[1 - side];
        if (peer == nullptr || (item.has_value() && !peer->connected.load())) {
            return false;
        }
        peer->enqueue(std::move(item));
        return true;
    }

    void closeInternal(const std::string& reason) {
        bool expected = false;
        if (!closing.compare_exchange_strong(expected, true)) {
            return;
        }
        connected.store(false);
        (void)sendToPeer(std::nullopt);
        if (processingThread.joinable() && processingThread.get_id() != std::this_thread::get_id()) {
            processingThread.request_stop();
            queueCondition.notify_all();
            processingThread.join();
        }
        if (started.load()) {
            LOG_INFO("InMemoryTransport: {} closed ({})", sessionId, reason);
            if (closeHandler) {
                closeHandler(reason);
            }
        }
    }

    void process(const std::string& text) {
        Message message;
        try {
            message = MessageCodec::Decode(text);
        } catch (const errors::ProtocolError& e) {
            LOG_ERROR("InMemoryTransport: {}", e.what());
            if (errorHandler) errorHandler(e.what());
            closeInternal(std::string("protocol error: ") + e.what());
            return;
        }
        if (!messageHandler) return;
        try {
            messageHandler(std::move(message));
        } catch (const std::exception& e) {
            LOG_ERROR("InMemoryTransport: message handler exception: {}", e.what());
            if (errorHandler) errorHandler(std::string("message handler exception: ") + e.what());
        }
    }

    void startProcessing() {
        processingThread = std::jthread([this](std::stop_token st) {
            while (!st.stop_requested()) {
                std::optional<std::string> item;
                {
                    std::unique_lock<std::mutex> lock(queueMutex);
                    queueCondition.wait(lock, [this, &st]() { return !queue.empty() || st.stop_requested(); });
                    if (st.stop_requested()) {
                        break;
                    }
                    item = std::move(queue.front());
                    queue.pop_front();
                }
                if (!item.has_value()) {
                    closeInternal("peer closed");
                    return;
                }
                process(item.value());
                if (!connected.load()) {
                    return;
                }
            }
        });
    }
};

InMemoryTransport::InMemoryTransport() : pImpl(std::make_unique<Impl>()) { FUNC_SCOPE(); }
InMemoryTransport::~InMemoryTransport() { FUNC_SCOPE(); }

std::pair<std::unique_ptr<InMemoryTransport>, std::unique_ptr<InMemoryTransport>> InMemoryTransport::CreatePair() {
    FUNC_SCOPE();
    auto client = std::make_unique<InMemoryTransport>();
    auto server = std::make_unique<InMemoryTransport>();
    auto link = std::make_shared<Impl::Link>();
    link->ends[0] = client->pImpl.get();
    link->ends[1] = server->pImpl.get();
    client->pImpl->link = link;
    client->pImpl->side = 0;
    server->pImpl->link = link;
    server->pImpl->side = 1;
    return std::make_pair(std::move(client), std::move(server));
}

std::future<void> InMemoryTransport::Start() {
    FUNC_SCOPE();
    std::promise<void> promise;
    if (pImpl->closing.load()) {
        promise.set_exception(std::make_exception_ptr(errors::SessionClosedError("transport already closed")));
        return promise.get_future();
    }
    if (!pImpl->started.exchange(true)) {
        LOG_INFO("Starting InMemoryTransport {}", pImpl->sessionId);
        pImpl->connected.store(true);
        pImpl->startProcessing();
    }
    promise.set_value();
    return promise.get_future();
}

std::future<void> InMemoryTransport::Close() {
    FUNC_SCOPE();
    pImpl->closeInternal("closed locally");
    std::promise<void> promise; promise.set_value(); return promise.get_future();
}

bool InMemoryTransport::IsConnected() const { return pImpl->connected.load(); }
std::string InMemoryTransport::GetSessionId() const { return pImpl->sessionId; }
std::uint64_t InMemoryTransport::BytesWritten() const { return pImpl->bytesWritten.load(); }

void InMemoryTransport::Send(const Message& message) {
    if (!pImpl->connected.load()) {
        throw errors::SessionClosedError("transport is closed");
    }
    std::string serialized = MessageCodec::Serialize(message);
    LOG_DEBUG("Sending in-memory {}: {}", messageKindName(message), serialized);
    const std::size_t size = serialized.size();
    if (!pImpl->sendToPeer(std::move(serialized))) {
        throw errors::SessionClosedError("peer not connected");
    }
    pImpl->bytesWritten.fetch_add(size);
}

void InMemoryTransport::SetMessageHandler(MessageHandler handler) { pImpl->messageHandler = std::move(handler); }
void InMemoryTransport::SetErrorHandler(ErrorHandler handler) { pImpl->errorHandler = std::move(handler); }
void InMemoryTransport::SetCloseHandler(CloseHandler handler) { pImpl->closeHandler = std::move(handler); }

} // namespace websearch
