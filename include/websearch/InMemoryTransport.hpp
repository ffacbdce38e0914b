//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: InMemoryTransport.hpp
// Purpose: In-process paired transport (bridge and tool host in one process, mainly for tests)
//==========================================================================================================
#pragma once

#include "websearch/Transport.h"

#include <memory>
#include <utility>

namespace websearch {

//==========================================================================================================
// InMemoryTransport
// Purpose: One end of a connected pair. Messages go through the same serialization as the wire.
// Notes:
//   - Closing one end closes the other one with reason "peer closed" (delivered on the peer's own
//     thread).
//==========================================================================================================
class InMemoryTransport : public ITransport {
public:
    InMemoryTransport();
    ~InMemoryTransport() override;

    //==========================================================================================================
    // CreatePair
    // Purpose: Creates two connected transports.
    // Returns:
    //   (client end, server end)
    //==========================================================================================================
    static std::pair<std::unique_ptr<InMemoryTransport>, std::unique_ptr<InMemoryTransport>> CreatePair();

    std::future<void> Start() override;
    std::future<void> Close() override;
    bool IsConnected() const override;
    std::string GetSessionId() const override;
    void Send(const Message& message) override;
    void SetMessageHandler(MessageHandler handler) override;
    void SetErrorHandler(ErrorHandler handler) override;
    void SetCloseHandler(CloseHandler handler) override;
    std::uint64_t BytesWritten() const override;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace websearch
