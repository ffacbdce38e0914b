//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_stdio_transport.cpp
// Purpose: StdioTransport over pipes: delivery, writing, end of stream and protocol errors
//==========================================================================================================

#include <gtest/gtest.h>

#include <chrono>
#include <future>
#include <mutex>
#include <string>
#include <vector>

#include <fcntl.h>
#include <poll.h>
#include <unistd.h>

#include "websearch/StdioTransport.hpp"
#include "websearch/errors/Errors.h"

using namespace websearch;
using namespace std::chrono_literals;

namespace {

struct Pipes {
    int toTransport[2]{-1, -1};    // test writes [1], transport reads [0]
    int fromTransport[2]{-1, -1};  // transport writes [1], test reads [0]

    Pipes() {
        EXPECT_EQ(::pipe2(toTransport, O_CLOEXEC), 0);
        EXPECT_EQ(::pipe2(fromTransport, O_CLOEXEC), 0);
    }
    ~Pipes() {
        for (int fd : {toTransport[1], fromTransport[0]}) {
            if (fd >= 0) ::close(fd);
        }
    }
    void write(const std::string& bytes) const {
        ASSERT_EQ(::write(toTransport[1], bytes.data(), bytes.size()), static_cast<ssize_t>(bytes.size()));
    }
    void closeWriter() {
        ::close(toTransport[1]);
        toTransport[1] = -1;
    }
    std::string read(std::chrono::milliseconds timeout) const {
        struct pollfd pfd{fromTransport[0], POLLIN, 0};
        if (::poll(&pfd, 1, static_cast<int>(timeout.count())) <= 0) return {};
        char buf[4096];
        ssize_t n = ::read(fromTransport[0], buf, sizeof(buf));
        return n > 0 ? std::string(buf, static_cast<std::size_t>(n)) : std::string();
    }
};

} // namespace

TEST(StdioTransport, DeliversDecodedMessages) {
    Pipes p;
    StdioTransport t(p.toTransport[0], p.fromTransport[1], true);
    std::promise<Message> got;
    t.SetMessageHandler([&](Message m) { got.set_value(std::move(m)); });
    t.Start().get();

    p.write("{\"jsonrpc\":\"2.0\",\"id\":1,\"re");
    p.write("sult\":{\"ok\":true}}\n");
    auto fut = got.get_future();
    ASSERT_EQ(fut.wait_for(2s), std::future_status::ready);
    Message m = fut.get();
    ASSERT_TRUE(std::holds_alternative<JSONRPCResponse>(m));
    EXPECT_EQ(getBoolMember(std::get<JSONRPCResponse>(m).result.value(), "ok"), std::optional<bool>(true));
    t.Close().get();
}

TEST(StdioTransport, SendWritesOneFramePerMessage) {
    Pipes p;
    StdioTransport t(p.toTransport[0], p.fromTransport[1], true);
    t.Start().get();
    t.Send(JSONRPCNotification("notifications/initialized"));
    const std::string frame = p.read(2000ms);
    EXPECT_EQ(frame, "{\"jsonrpc\":\"2.0\",\"method\":\"notifications/initialized\"}\n");
    EXPECT_EQ(t.BytesWritten(), frame.size());
    t.Close().get();
}

TEST(StdioTransport, ContentLengthFramingOnBothDirections) {
    Pipes p;
    StdioTransport t(p.toTransport[0], p.fromTransport[1], true);
    t.SetFraming(FramingKind::ContentLength);
    std::promise<Message> got;
    t.SetMessageHandler([&](Message m) { got.set_value(std::move(m)); });
    t.Start().get();

    const std::string body = "{\"jsonrpc\":\"2.0\",\"method\":\"ping\",\"id\":\"a\"}";
    p.write("Content-Length: " + std::to_string(body.size()) + "\r\n\r\n" + body);
    auto fut = got.get_future();
    ASSERT_EQ(fut.wait_for(2s), std::future_status::ready);
    EXPECT_TRUE(std::holds_alternative<JSONRPCRequest>(fut.get()));

    t.Send(JSONRPCResponse(std::string("a"), JSONValue(JSONValue::Object{})));
    EXPECT_EQ(p.read(2000ms).rfind("Content-Length: ", 0), 0u);
    t.Close().get();
}

TEST(StdioTransport, EndOfStreamClosesAndSendFails) {
    Pipes p;
    StdioTransport t(p.toTransport[0], p.fromTransport[1], true);
    std::promise<std::string> closed;
    t.SetCloseHandler([&](const std::string& reason) { closed.set_value(reason); });
    t.Start().get();

    p.closeWriter();
    auto fut = closed.get_future();
    ASSERT_EQ(fut.wait_for(2s), std::future_status::ready);
    EXPECT_EQ(fut.get(), "end of stream");
    EXPECT_FALSE(t.IsConnected());
    EXPECT_THROW(t.Send(JSONRPCNotification("x")), errors::SessionClosedError);
}

TEST(StdioTransport, MalformedFrameClosesWithProtocolError) {
    Pipes p;
    StdioTransport t(p.toTransport[0], p.fromTransport[1], true);
    std::promise<std::string> closed;
    std::vector<std::string> errorsSeen;
    std::mutex m;
    t.SetErrorHandler([&](const std::string& e) { std::lock_guard<std::mutex> lk(m); errorsSeen.push_back(e); });
    t.SetCloseHandler([&](const std::string& reason) { closed.set_value(reason); });
    t.Start().get();

    p.write("this is not json\n");
    auto fut = closed.get_future();
    ASSERT_EQ(fut.wait_for(2s), std::future_status::ready);
    EXPECT_EQ(fut.get().rfind("protocol error: ", 0), 0u);
    std::lock_guard<std::mutex> lk(m);
    EXPECT_FALSE(errorsSeen.empty());
}

TEST(StdioTransport, CloseIsIdempotentAndFiresHandlerOnce) {
    Pipes p;
    StdioTransport t(p.toTransport[0], p.fromTransport[1], true);
    int calls = 0;
    t.SetCloseHandler([&](const std::string&) { ++calls; });
    t.Start().get();
    t.Close().get();
    t.Close().get();
    EXPECT_EQ(calls, 1);
    EXPECT_THROW(t.Start().get(), errors::SessionClosedError);
}

TEST(StdioTransport, TestHookFeedsDecodePath) {
    StdioTransport t;
    std::vector<std::string> methods;
    t.SetMessageHandler([&](Message m) {
        if (auto* n = std::get_if<JSONRPCNotification>(&m)) methods.push_back(n->method);
    });
    StdioTransportTestHooks::feed(t, "{\"jsonrpc\":\"2.0\",\"method\":\"a\"}\n\n{\"jsonrpc\":\"2.0\",\"method\":\"b\"}\n");
    EXPECT_EQ(methods, (std::vector<std::string>{"a", "b"}));
}

TEST(StdioTransportFactory, AppliesConfigKeys) {
    auto parsed = parseTransportConfig("framing=content-length; write_timeout_ms=50;bogus");
    EXPECT_EQ(parsed.at("framing"), "content-length");
    EXPECT_EQ(parsed.at("write_timeout_ms"), "50");
    EXPECT_EQ(parsed.count("bogus"), 0u);

    StdioTransportFactory f;
    auto t = f.CreateTransport("framing=content-length;max_frame_bytes=1024");
    ASSERT_NE(t, nullptr);
    EXPECT_FALSE(t->IsConnected());
}
