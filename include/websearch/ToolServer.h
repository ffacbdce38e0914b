//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ToolServer.h
// Purpose: Tool-host side MCP server (initialize, ping, tools/list, tools/call, cancellation)
//==========================================================================================================

#pragma once

#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <stop_token>

#include "websearch/Protocol.h"
#include "websearch/Transport.h"

namespace websearch {

// Async, cancellable tool handler. The stop_token is triggered by notifications/cancelled or shutdown.
using ToolHandler = std::function<std::future<CallToolResult>(const JSONValue& arguments, std::stop_token)>;

//==========================================================================================================
// ToolServer
// Purpose: Serves registered tools to one client over one transport.
// Notes:
//   - initialize/ping/tools/list are answered on the transport's reader thread; each tools/call runs on
//     its own thread so cancellation notifications are processed while a call is in progress.
//   - Unknown methods are answered with MethodNotFound, unknown tools with ToolNotFound, handler
//     exceptions with InternalError.
//==========================================================================================================
class ToolServer {
public:
    explicit ToolServer(Implementation serverInfo);
    ~ToolServer();

    ToolServer(const ToolServer&) = delete;
    ToolServer& operator=(const ToolServer&) = delete;

    // Must be called before Start().
    void RegisterTool(const Tool& tool, ToolHandler handler);

    //==========================================================================================================
    // Start
    // Purpose: Takes ownership of the transport, wires handlers and starts it.
    // Returns:
    //   Future completing when the transport is running.
    //==========================================================================================================
    std::future<void> Start(std::unique_ptr<ITransport> transport);

    // Cancels running calls, closes the transport and waits for in-flight calls to return.
    void Stop();

    // Blocks until the client disconnects (or Stop() is called).
    void WaitUntilClosed();

    bool IsInitialized() const;
    std::size_t InFlight() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace websearch
