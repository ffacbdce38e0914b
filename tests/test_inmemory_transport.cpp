//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_inmemory_transport.cpp
// Purpose: InMemoryTransport basic tests
//==========================================================================================================

#include <gtest/gtest.h>
#include "websearch/Transport.h"
#include "websearch/InMemoryTransport.hpp"
#include "websearch/JSONRPCTypes.h"
#include "websearch/Protocol.h"
#include "websearch/errors/Errors.h"
#include <future>
#include <chrono>

using namespace websearch;

TEST(InMemoryTransport, RequestAndResponseCrossThePair) {
    auto pair = InMemoryTransport::CreatePair();
    auto client = std::move(pair.first);
    auto server = std::move(pair.second);

    // Server: answer any request with { message: "ok" }
    InMemoryTransport* serverPtr = server.get();
    server->SetMessageHandler([serverPtr](Message m) {
        if (auto* req = std::get_if<JSONRPCRequest>(&m)) {
            JSONValue::Object obj;
            setMember(obj, "message", JSONValue("ok"));
            serverPtr->Send(JSONRPCResponse(req->id, JSONValue(obj)));
        }
    });
    std::promise<JSONRPCResponse> got;
    client->SetMessageHandler([&got](Message m) {
        if (auto* resp = std::get_if<JSONRPCResponse>(&m)) got.set_value(*resp);
    });

    server->Start().get();
    client->Start().get();

    client->Send(JSONRPCRequest(static_cast<int64_t>(1), "test/echo", JSONValue(JSONValue::Object{})));
    auto fut = got.get_future();
    ASSERT_EQ(fut.wait_for(std::chrono::seconds(2)), std::future_status::ready);
    JSONRPCResponse resp = fut.get();
    ASSERT_FALSE(resp.IsError());
    EXPECT_EQ(idToString(resp.id), "1");
    EXPECT_EQ(getStringMember(resp.result.value(), "message"), std::optional<std::string>("ok"));
    EXPECT_GT(client->BytesWritten(), 0u);

    client->Close().get();
    server->Close().get();
}

TEST(InMemoryTransport, SendFailsWhenPeerNotStarted) {
    auto pair = InMemoryTransport::CreatePair();
    auto client = std::move(pair.first);
    client->Start().get();
    EXPECT_THROW(client->Send(JSONRPCNotification("notify/ping")), errors::SessionClosedError);
    EXPECT_EQ(client->BytesWritten(), 0u);
    client->Close().get();
}

TEST(InMemoryTransport, PeerCloseClosesOtherEnd) {
    auto pair = InMemoryTransport::CreatePair();
    auto client = std::move(pair.first);
    auto server = std::move(pair.second);

    std::promise<std::string> reason;
    client->SetCloseHandler([&reason](const std::string& r) { reason.set_value(r); });
    server->Start().get();
    client->Start().get();

    server->Close().get();
    auto fut = reason.get_future();
    ASSERT_EQ(fut.wait_for(std::chrono::seconds(2)), std::future_status::ready);
    EXPECT_EQ(fut.get(), "peer closed");
    EXPECT_FALSE(client->IsConnected());
    EXPECT_THROW(client->Send(JSONRPCNotification("late")), errors::SessionClosedError);
}

TEST(InMemoryTransport, NotificationRouting) {
    auto pair = InMemoryTransport::CreatePair();
    auto client = std::move(pair.first);
    auto server = std::move(pair.second);

    std::promise<std::string> methodPromise;
    auto methodFuture = methodPromise.get_future();
    server->SetMessageHandler([&](Message m) {
        if (auto* note = std::get_if<JSONRPCNotification>(&m)) methodPromise.set_value(note->method);
    });

    server->Start().get();
    client->Start().get();

    JSONValue::Object obj;
    setMember(obj, "x", JSONValue(static_cast<int64_t>(1)));
    client->Send(JSONRPCNotification("notify/ping", JSONValue(obj)));

    ASSERT_EQ(methodFuture.wait_for(std::chrono::seconds(2)), std::future_status::ready);
    EXPECT_EQ(methodFuture.get(), std::string("notify/ping"));

    client->Close().get();
    server->Close().get();
}
