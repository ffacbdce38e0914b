//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_tool_invoker.cpp
// Purpose: ToolInvoker over in-process tool servers: validation, lazy start, recovery, tool errors
//==========================================================================================================

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <future>
#include <mutex>
#include <thread>
#include <vector>

#include "websearch/InMemoryTransport.hpp"
#include "websearch/ToolInvoker.h"
#include "websearch/ToolServer.h"
#include "websearch/errors/Errors.h"
#include "websearch/typed/Content.h"
#include "websearch/validation/Validators.h"

using namespace websearch;
using namespace std::chrono_literals;

namespace {

std::future<CallToolResult> ready(CallToolResult r) {
    std::promise<CallToolResult> p;
    p.set_value(std::move(r));
    return p.get_future();
}

class ToolInvokerTest : public ::testing::Test {
protected:
    // Hosts outlive the invoker (declared first, destroyed last)
    std::mutex hostsMutex;
    std::vector<std::unique_ptr<ToolServer>> hosts;
    std::atomic<int> factoryCalls{0};
    // Client end handed to the most recent session; owned by that session
    std::atomic<ITransport*> lastClient{nullptr};

    std::unique_ptr<ITransport> makeHost() {
        ++factoryCalls;
        auto [client, server] = InMemoryTransport::CreatePair();
        auto host = std::make_unique<ToolServer>(Implementation{"in-process", "1.0"});
        host->RegisterTool(Tool("web_search", "echo"), [](const JSONValue& args, std::stop_token) {
            CallToolResult r;
            const std::string q = getStringMember(args, "query").value_or("");
            const int64_t n = getIntegerMember(args, "max_results").value_or(5);
            for (int64_t i = 1; i <= n; ++i) {
                r.content.push_back(typed::makeText(q + " #" + std::to_string(i)));
            }
            return ready(std::move(r));
        });
        host->RegisterTool(Tool("failing", "always fails"), [](const JSONValue&, std::stop_token) {
            CallToolResult r;
            r.content.push_back(typed::makeText("quota exhausted"));
            r.isError = true;
            return ready(std::move(r));
        });
        host->Start(std::move(server)).get();
        std::lock_guard<std::mutex> lock(hostsMutex);
        hosts.push_back(std::move(host));
        lastClient.store(client.get());
        return std::move(client);
    }

    ToolInvokerOptions options() const {
        ToolInvokerOptions o;
        o.session.startupTimeout = 2000ms;
        o.session.requestTimeout = 2000ms;
        o.defaultTimeout = 2000ms;
        return o;
    }

    void stopHost(std::size_t index) {
        std::lock_guard<std::mutex> lock(hostsMutex);
        hosts.at(index)->Stop();
    }
};

ToolCall::Arguments searchArgs(const std::string& query, int64_t maxResults) {
    ToolCall::Arguments a;
    a["query"] = JSONValue(query);
    a["max_results"] = JSONValue(maxResults);
    return a;
}

} // namespace

TEST_F(ToolInvokerTest, InvokesOnLazilyStartedSession) {
    ToolInvoker invoker([this]() { return makeHost(); }, options());
    EXPECT_FALSE(invoker.IsReady());
    EXPECT_EQ(invoker.State(), SessionState::Uninitialized);

    ToolResult r = invoker.Invoke("web_search", searchArgs("rust ownership", 5), 2000ms);
    ASSERT_TRUE(r.IsSuccess());
    ASSERT_EQ(r.Texts().size(), 5u);
    EXPECT_EQ(r.Texts()[0], "rust ownership #1");
    EXPECT_TRUE(invoker.IsReady());
    EXPECT_EQ(invoker.SessionsStarted(), 1u);

    // The second call reuses the session
    invoker.Invoke("web_search", searchArgs("again", 1), 2000ms);
    EXPECT_EQ(invoker.SessionsStarted(), 1u);
}

TEST_F(ToolInvokerTest, InvalidArgumentsAreRejectedBeforeAnySession) {
    ToolInvoker invoker([this]() { return makeHost(); }, options());
    invoker.RegisterArgumentValidator("web_search", validation::MakeWebSearchArgumentValidator(20));

    EXPECT_THROW(invoker.Invoke("web_search", searchArgs("rust", 0), 2000ms), errors::InvalidArgumentError);
    EXPECT_THROW(invoker.Invoke("web_search", searchArgs("   ", 3), 2000ms), errors::InvalidArgumentError);
    EXPECT_THROW(invoker.Invoke("web_search", searchArgs(std::string(501, 'q'), 3), 2000ms),
                 errors::InvalidArgumentError);
    EXPECT_THROW(invoker.Invoke("", {}, 2000ms), errors::InvalidArgumentError);
    EXPECT_THROW(invoker.Invoke("web_search", searchArgs("ok", 3), 0ms), errors::InvalidArgumentError);

    EXPECT_EQ(factoryCalls.load(), 0);
    EXPECT_EQ(invoker.SessionsStarted(), 0u);
}

TEST_F(ToolInvokerTest, InvalidArgumentsWriteNothingToALiveSession) {
    ToolInvoker invoker([this]() { return makeHost(); }, options());
    invoker.RegisterArgumentValidator("web_search", validation::MakeWebSearchArgumentValidator(20));
    invoker.Warmup();
    ITransport* client = lastClient.load();
    ASSERT_NE(client, nullptr);
    const std::uint64_t afterHandshake = client->BytesWritten();
    EXPECT_GT(afterHandshake, 0u);

    EXPECT_THROW(invoker.Invoke("web_search", searchArgs("rust ownership", 0), 2000ms), errors::InvalidArgumentError);
    EXPECT_THROW(invoker.Invoke("web_search", searchArgs("", 5), 2000ms), errors::InvalidArgumentError);
    EXPECT_THROW(invoker.Invoke("web_search", searchArgs("ok", 3), 0ms), errors::InvalidArgumentError);

    EXPECT_EQ(client->BytesWritten(), afterHandshake);
    EXPECT_TRUE(invoker.IsReady());
    EXPECT_EQ(invoker.SessionsStarted(), 1u);
}

TEST_F(ToolInvokerTest, ConcurrentFirstCallersShareOneSpawn) {
    ToolInvoker invoker([this]() { return makeHost(); }, options());
    std::vector<std::future<std::size_t>> calls;
    for (int i = 0; i < 6; ++i) {
        calls.push_back(std::async(std::launch::async, [&invoker, i]() {
            return invoker.Invoke("web_search", searchArgs("q" + std::to_string(i), 2), 2000ms).Texts().size();
        }));
    }
    for (auto& f : calls) {
        EXPECT_EQ(f.get(), 2u);
    }
    EXPECT_EQ(factoryCalls.load(), 1);
}

TEST_F(ToolInvokerTest, CloseThenInvokeStartsExactlyOneNewSession) {
    ToolInvoker invoker([this]() { return makeHost(); }, options());
    invoker.Warmup();
    EXPECT_EQ(invoker.SessionsStarted(), 1u);

    invoker.Close();
    EXPECT_FALSE(invoker.IsReady());

    EXPECT_TRUE(invoker.Invoke("web_search", searchArgs("after close", 1), 2000ms).IsSuccess());
    EXPECT_EQ(invoker.SessionsStarted(), 2u);
}

TEST_F(ToolInvokerTest, LostSessionIsReplacedOnNextCall) {
    ToolInvoker invoker([this]() { return makeHost(); }, options());
    invoker.Warmup();
    stopHost(0);

    // The peer close reaches the session asynchronously; either way the call lands on a fresh host
    ToolResult r = invoker.Invoke("web_search", searchArgs("recovered", 2), 2000ms);
    EXPECT_EQ(r.Texts().size(), 2u);
    EXPECT_EQ(invoker.SessionsStarted(), 2u);
    EXPECT_TRUE(invoker.IsReady());
}

TEST_F(ToolInvokerTest, ToolFailureRaisesToolExecutionError) {
    ToolInvoker invoker([this]() { return makeHost(); }, options());
    try {
        invoker.Invoke("failing", {}, 2000ms);
        FAIL() << "expected ToolExecutionError";
    } catch (const errors::ToolExecutionError& e) {
        EXPECT_EQ(e.code(), JSONRPCErrorCodes::ToolExecutionFailed);
        EXPECT_STREQ(e.what(), "quota exhausted");
    }
    // A tool error does not cost the session
    EXPECT_TRUE(invoker.IsReady());
    EXPECT_EQ(invoker.SessionsStarted(), 1u);
}

TEST_F(ToolInvokerTest, UnknownToolSurfacesAsToolExecutionError) {
    ToolInvoker invoker([this]() { return makeHost(); }, options());
    try {
        invoker.Invoke("no_such_tool", {}, 2000ms);
        FAIL() << "expected ToolExecutionError";
    } catch (const errors::ToolExecutionError& e) {
        EXPECT_EQ(e.code(), JSONRPCErrorCodes::ToolNotFound);
    }
}

TEST_F(ToolInvokerTest, FactoryFailureIsReportedAndRecorded) {
    ToolInvoker invoker([]() -> std::unique_ptr<ITransport> { return nullptr; }, options());
    EXPECT_THROW(invoker.Warmup(), errors::SpawnError);
    EXPECT_FALSE(invoker.IsReady());
}

TEST(ToolInvoker, RequiresFactory) {
    EXPECT_THROW(ToolInvoker(TransportFactoryFn{}), errors::InvalidArgumentError);
}

TEST_F(ToolInvokerTest, CloseDuringStartupStopsTheStartingSession) {
    std::promise<void> entered;
    std::promise<void> release;
    std::shared_future<void> released = release.get_future().share();
    std::atomic<bool> first{true};
    ToolInvoker invoker([this, &entered, released, &first]() {
        if (first.exchange(false)) {
            entered.set_value();
            released.wait();
        }
        return makeHost();
    }, options());

    auto warm = std::async(std::launch::async, [&invoker]() { invoker.Warmup(); });
    ASSERT_EQ(entered.get_future().wait_for(2s), std::future_status::ready);
    invoker.Close();
    release.set_value();

    EXPECT_THROW(warm.get(), errors::SessionClosedError);
    EXPECT_FALSE(invoker.IsReady());
    EXPECT_EQ(invoker.State(), SessionState::Uninitialized);

    ToolServer* host = nullptr;
    {
        std::lock_guard<std::mutex> lock(hostsMutex);
        ASSERT_EQ(hosts.size(), 1u);
        host = hosts[0].get();
    }
    auto hostClosed = std::async(std::launch::async, [host]() { host->WaitUntilClosed(); });
    EXPECT_EQ(hostClosed.wait_for(2s), std::future_status::ready);
    host->Stop();

    EXPECT_TRUE(invoker.Invoke("web_search", searchArgs("after close", 1), 2000ms).IsSuccess());
    EXPECT_EQ(invoker.SessionsStarted(), 2u);
}
