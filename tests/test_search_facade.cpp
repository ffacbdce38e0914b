//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_search_facade.cpp
// Purpose: HTTP façade status mapping and routing, end to end through an in-process tool host
//==========================================================================================================

#include <gtest/gtest.h>

#include <chrono>
#include <cstdint>
#include <future>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include "websearch/InMemoryTransport.hpp"
#include "websearch/SearchFacade.h"
#include "websearch/ToolServer.h"
#include "websearch/WebSearchTool.h"

using namespace websearch;
using namespace std::chrono_literals;

namespace {

class ScriptedProvider : public ISearchProvider {
public:
    std::mutex mutex;
    ProviderReply reply{200, "{\"organic\":[{\"title\":\"Rust\",\"snippet\":\"Ownership\",\"link\":\"https://doc.rust-lang.org\"}]}"};
    std::chrono::milliseconds delay{0};

    ProviderReply Post(const std::string&, std::int64_t) override {
        ProviderReply r;
        std::chrono::milliseconds d;
        {
            std::lock_guard<std::mutex> lock(mutex);
            r = reply;
            d = delay;
        }
        if (d.count() > 0) std::this_thread::sleep_for(d);
        return r;
    }
};

class SearchFacadeTest : public ::testing::Test {
protected:
    std::shared_ptr<ScriptedProvider> provider = std::make_shared<ScriptedProvider>();
    WebSearchTool tool{provider, 20, std::chrono::seconds(30)};
    std::mutex hostsMutex;
    std::vector<std::unique_ptr<ToolServer>> hosts;
    ToolInvoker invoker{[this]() { return makeHost(); }, invokerOptions()};

    static ToolInvokerOptions invokerOptions() {
        ToolInvokerOptions o;
        o.session.startupTimeout = 2000ms;
        o.session.requestTimeout = 2000ms;
        return o;
    }

    std::unique_ptr<ITransport> makeHost() {
        auto [client, server] = InMemoryTransport::CreatePair();
        auto host = std::make_unique<ToolServer>(Implementation{"in-process", "1.0"});
        host->RegisterTool(tool.Describe(), tool.Handler());
        host->Start(std::move(server)).get();
        std::lock_guard<std::mutex> lock(hostsMutex);
        hosts.push_back(std::move(host));
        return std::move(client);
    }

    static HttpRequest post(const std::string& body) {
        HttpRequest r;
        r.method = "POST";
        r.target = r.path = "/search";
        r.body = body;
        return r;
    }

    void TearDown() override { invoker.Close(); }
};

JSONValue parsed(const HttpReply& r) { return parseJSONValue(r.body); }

namespace beast = boost::beast;
namespace http = beast::http;
using tcp = boost::asio::ip::tcp;

// One blocking request/response over a fresh connection
http::response<http::string_body> roundTrip(std::uint16_t port, http::verb verb, const std::string& target,
                                            const std::string& body) {
    boost::asio::io_context ioc;
    tcp::resolver resolver(ioc);
    beast::tcp_stream stream(ioc);
    stream.connect(resolver.resolve("127.0.0.1", std::to_string(port)));
    http::request<http::string_body> req{verb, target, 11};
    req.set(http::field::host, "127.0.0.1");
    req.set(http::field::content_type, "application/json");
    req.body() = body;
    req.prepare_payload();
    http::write(stream, req);
    beast::flat_buffer buffer;
    http::response<http::string_body> res;
    http::read(stream, buffer, res);
    beast::error_code ec;
    stream.socket().shutdown(tcp::socket::shutdown_both, ec);
    return res;
}

HTTPServer::Options loopback(unsigned ioThreads) {
    HTTPServer::Options opts;
    opts.address = "127.0.0.1";
    opts.port = "0";
    opts.threads = ioThreads;
    return opts;
}

} // namespace

TEST_F(SearchFacadeTest, SuccessfulSearch) {
    SearchFacade facade(invoker);
    HttpReply r = facade.HandleSearch(post("{\"query\":\"rust ownership\",\"max_results\":5}"));
    ASSERT_EQ(r.status, 200u) << r.body;
    EXPECT_EQ(r.contentType, "application/json");
    JSONValue v = parsed(r);
    EXPECT_EQ(getStringMember(v, "status"), std::optional<std::string>("success"));
    const auto& results = std::get<JSONValue::Array>(v.find("results")->value);
    ASSERT_EQ(results.size(), 1u);
    EXPECT_EQ(getStringMember(*results[0], "title"), std::optional<std::string>("Rust"));
    EXPECT_EQ(getIntegerMember(*results[0], "rank"), std::optional<int64_t>(1));
    EXPECT_EQ(getStringMember(*v.find("metadata"), "query"), std::optional<std::string>("rust ownership"));
}

TEST_F(SearchFacadeTest, MalformedBodyIs400) {
    SearchFacade facade(invoker);
    EXPECT_EQ(facade.HandleSearch(post("not json")).status, 400u);
    EXPECT_EQ(facade.HandleSearch(post("[1,2]")).status, 400u);
    EXPECT_EQ(invoker.SessionsStarted(), 0u);
}

TEST_F(SearchFacadeTest, InvalidArgumentsAre422WithoutSpawning) {
    SearchFacade facade(invoker);
    HttpReply zero = facade.HandleSearch(post("{\"query\":\"rust\",\"max_results\":0}"));
    EXPECT_EQ(zero.status, 422u);
    EXPECT_EQ(getStringMember(parsed(zero), "error_type"), std::optional<std::string>("invalid_argument"));
    EXPECT_EQ(facade.HandleSearch(post("{\"query\":\"\"}")).status, 422u);
    EXPECT_EQ(facade.HandleSearch(post("{\"max_results\":3}")).status, 422u);
    EXPECT_EQ(facade.HandleSearch(post("{\"query\":\"q\",\"max_results\":21}")).status, 422u);
    EXPECT_EQ(invoker.SessionsStarted(), 0u);
}

TEST_F(SearchFacadeTest, ProviderFailureIs502WithErrorType) {
    {
        std::lock_guard<std::mutex> lock(provider->mutex);
        provider->reply = ProviderReply{429, ""};
    }
    SearchFacade facade(invoker);
    HttpReply r = facade.HandleSearch(post("{\"query\":\"rust\"}"));
    EXPECT_EQ(r.status, 502u);
    JSONValue v = parsed(r);
    EXPECT_EQ(getStringMember(v, "status"), std::optional<std::string>("error"));
    EXPECT_EQ(getStringMember(v, "error_type"), std::optional<std::string>("api_error"));
    EXPECT_EQ(getStringMember(v, "details"), std::optional<std::string>("API rate limit exceeded"));
}

TEST_F(SearchFacadeTest, SlowToolIs504) {
    {
        std::lock_guard<std::mutex> lock(provider->mutex);
        provider->delay = 800ms;
    }
    FacadeOptions opts;
    opts.timeout = 200ms;
    SearchFacade facade(invoker, opts);
    HttpReply r = facade.HandleSearch(post("{\"query\":\"slow\"}"));
    EXPECT_EQ(r.status, 504u);
    EXPECT_EQ(getStringMember(parsed(r), "error_type"), std::optional<std::string>("timeout"));
}

TEST_F(SearchFacadeTest, SpawnFailureIs500) {
    ToolInvoker broken([]() -> std::unique_ptr<ITransport> { return nullptr; });
    SearchFacade facade(broken);
    HttpReply r = facade.HandleSearch(post("{\"query\":\"rust\"}"));
    EXPECT_EQ(r.status, 500u);
    EXPECT_EQ(getStringMember(parsed(r), "error_type"), std::optional<std::string>("spawn_error"));
}

TEST_F(SearchFacadeTest, HealthFollowsSessionState) {
    SearchFacade facade(invoker);
    JSONValue before = parsed(facade.HandleHealth(HttpRequest{}));
    EXPECT_EQ(getStringMember(before, "status"), std::optional<std::string>("unhealthy"));
    EXPECT_EQ(getBoolMember(before, "mcp_server_running"), std::optional<bool>(false));
    EXPECT_TRUE(getStringMember(before, "error").has_value());

    invoker.Warmup();
    JSONValue after = parsed(facade.HandleHealth(HttpRequest{}));
    EXPECT_EQ(getStringMember(after, "status"), std::optional<std::string>("healthy"));
    EXPECT_EQ(after.find("error"), nullptr);
}

TEST_F(SearchFacadeTest, RootListsEndpoints) {
    SearchFacade facade(invoker);
    JSONValue v = parsed(facade.HandleRoot(HttpRequest{}));
    EXPECT_EQ(getStringMember(v, "message"), std::optional<std::string>("MCP Web Search Client"));
    ASSERT_NE(v.find("endpoints"), nullptr);
    EXPECT_EQ(getStringMember(*v.find("endpoints"), "search"), std::optional<std::string>("POST /search"));
}

TEST_F(SearchFacadeTest, RoutesOverHttp) {
    SearchFacade facade(invoker);
    HTTPServer server(loopback(2));
    facade.RegisterRoutes(server);
    server.Start().get();
    const std::uint16_t port = server.BoundPort();
    ASSERT_NE(port, 0);

    auto found = roundTrip(port, http::verb::post, "/search", "{\"query\":\"rust ownership\",\"max_results\":3}");
    EXPECT_EQ(found.result_int(), 200u);
    EXPECT_EQ(getStringMember(parseJSONValue(found.body()), "status"), std::optional<std::string>("success"));

    EXPECT_EQ(roundTrip(port, http::verb::get, "/health", "").result_int(), 200u);
    EXPECT_EQ(roundTrip(port, http::verb::get, "/nope", "").result_int(), 404u);
    EXPECT_EQ(roundTrip(port, http::verb::get, "/search", "").result_int(), 405u);

    server.Stop().get();
}

// More slow searches than I/O threads must not hold up /health
TEST_F(SearchFacadeTest, HealthAnswersWhileSearchesAreInFlight) {
    {
        std::lock_guard<std::mutex> lock(provider->mutex);
        provider->delay = 1500ms;
    }
    SearchFacade facade(invoker);
    invoker.Warmup();
    HTTPServer::Options opts = loopback(1);
    opts.handlerThreads = 4;
    HTTPServer server(opts);
    facade.RegisterRoutes(server);
    server.Start().get();
    const std::uint16_t port = server.BoundPort();

    std::vector<std::future<unsigned>> searches;
    for (int i = 0; i < 2; ++i) {
        searches.push_back(std::async(std::launch::async, [port]() {
            return roundTrip(port, http::verb::post, "/search", "{\"query\":\"slow\"}").result_int();
        }));
    }
    std::this_thread::sleep_for(300ms);

    const auto started = std::chrono::steady_clock::now();
    auto health = roundTrip(port, http::verb::get, "/health", "");
    const auto elapsed = std::chrono::steady_clock::now() - started;
    EXPECT_EQ(health.result_int(), 200u);
    EXPECT_EQ(getBoolMember(parseJSONValue(health.body()), "mcp_server_running"), std::optional<bool>(true));
    EXPECT_LT(std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count(), 500);

    for (auto& s : searches) {
        EXPECT_EQ(s.get(), 200u);
    }
    server.Stop().get();
}

TEST(HTTPServerOptions, ParsesListenUris) {
    auto plain = HTTPServer::OptionsFromUri("http://127.0.0.1:9000");
    EXPECT_EQ(plain.scheme, "http");
    EXPECT_EQ(plain.address, "127.0.0.1");
    EXPECT_EQ(plain.port, "9000");

    auto tls = HTTPServer::OptionsFromUri("https://[::1]:8443?cert=c.pem&key=k.pem");
    EXPECT_EQ(tls.scheme, "https");
    EXPECT_EQ(tls.address, "::1");
    EXPECT_EQ(tls.port, "8443");
    EXPECT_EQ(tls.certFile, "c.pem");
    EXPECT_EQ(tls.keyFile, "k.pem");

    EXPECT_EQ(HTTPServer::OptionsFromUri("0.0.0.0").port, "8000");
}
