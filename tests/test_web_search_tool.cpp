//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_web_search_tool.cpp
// Purpose: web_search result shaping and provider failure classification with a fake provider
//==========================================================================================================

#include <gtest/gtest.h>

#include <memory>
#include <stdexcept>
#include <stop_token>

#include "websearch/WebSearchTool.h"
#include "websearch/typed/Content.h"

using namespace websearch;

namespace {

class FakeProvider : public ISearchProvider {
public:
    enum class Mode { Reply, Timeout, Network };

    Mode mode = Mode::Reply;
    ProviderReply reply{200, "{\"organic\":[]}"};
    int calls = 0;
    std::string lastQuery;
    std::int64_t lastNum = 0;

    ProviderReply Post(const std::string& query, std::int64_t num) override {
        ++calls;
        lastQuery = query;
        lastNum = num;
        switch (mode) {
            case Mode::Timeout:
                throw ProviderTimeout("deadline");
            case Mode::Network:
                throw std::runtime_error("connection refused");
            case Mode::Reply:
                break;
        }
        return reply;
    }
};

JSONValue args(const std::string& query, std::optional<int64_t> maxResults = std::nullopt) {
    JSONValue::Object o;
    setMember(o, "query", JSONValue(query));
    if (maxResults.has_value()) setMember(o, "max_results", JSONValue(maxResults.value()));
    return JSONValue(std::move(o));
}

std::string organicBody(int count) {
    std::string body = "{\"organic\":[";
    for (int i = 1; i <= count; ++i) {
        if (i > 1) body += ",";
        body += "{\"title\":\"T" + std::to_string(i) + "\",\"snippet\":\"S" + std::to_string(i) +
                "\",\"link\":\"https://example.com/" + std::to_string(i) + "\"}";
    }
    return body + "]}";
}

const JSONValue& structured(const CallToolResult& r) {
    EXPECT_TRUE(r.structuredContent.has_value());
    return r.structuredContent.value();
}

class WebSearchToolTest : public ::testing::Test {
protected:
    std::shared_ptr<FakeProvider> provider = std::make_shared<FakeProvider>();
    WebSearchTool tool{provider, 20, std::chrono::seconds(30)};
};

} // namespace

TEST(WebSearchToolParse, DefaultsSkippingAndRank) {
    JSONValue body = parseJSONValue(
        "{\"organic\":["
        "{\"title\":\"A\",\"snippet\":\"first\",\"link\":\"https://a.example\"},"
        "{\"title\":\"B\",\"link\":\"ftp://b.example\"},"
        "{\"link\":\"http://c.example\"},"
        "{\"title\":\"D\",\"snippet\":\"no link\"}"
        "]}");
    auto results = WebSearchTool::ParseOrganic(body);
    ASSERT_EQ(results.size(), 2u);
    EXPECT_EQ(results[0].title, "A");
    EXPECT_EQ(results[0].rank, 1);
    EXPECT_EQ(results[1].title, "No title");
    EXPECT_EQ(results[1].snippet, "No description");
    EXPECT_EQ(results[1].url, "http://c.example");
    EXPECT_EQ(results[1].rank, 3);
}

TEST(WebSearchToolParse, MissingOrganicIsEmptyNonListThrows) {
    EXPECT_TRUE(WebSearchTool::ParseOrganic(parseJSONValue("{}")).empty());
    EXPECT_TRUE(WebSearchTool::ParseOrganic(parseJSONValue("{\"organic\":null}")).empty());
    EXPECT_THROW(WebSearchTool::ParseOrganic(parseJSONValue("{\"organic\":\"x\"}")), std::runtime_error);
}

TEST_F(WebSearchToolTest, DescribeAdvertisesSchema) {
    Tool t = tool.Describe();
    EXPECT_EQ(t.name, "web_search");
    const JSONValue* props = t.inputSchema.find("properties");
    ASSERT_NE(props, nullptr);
    const JSONValue* max = props->find("max_results");
    ASSERT_NE(max, nullptr);
    EXPECT_EQ(getIntegerMember(*max, "maximum"), std::optional<int64_t>(20));
    EXPECT_EQ(getIntegerMember(*max, "default"), std::optional<int64_t>(10));
    const JSONValue* query = props->find("query");
    ASSERT_NE(query, nullptr);
    EXPECT_EQ(getIntegerMember(*query, "maxLength"), std::optional<int64_t>(500));
}

TEST_F(WebSearchToolTest, SuccessCarriesResultsAndMetadata) {
    provider->reply = ProviderReply{200, organicBody(8)};
    CallToolResult r = tool.Execute(args("rust ownership", 5));
    EXPECT_FALSE(r.isError);
    EXPECT_EQ(provider->lastQuery, "rust ownership");
    EXPECT_EQ(provider->lastNum, 5);

    const JSONValue& sc = structured(r);
    EXPECT_EQ(getStringMember(sc, "status"), std::optional<std::string>("success"));
    const JSONValue* results = sc.find("results");
    ASSERT_NE(results, nullptr);
    const auto& items = std::get<JSONValue::Array>(results->value);
    ASSERT_EQ(items.size(), 5u);
    EXPECT_EQ(getIntegerMember(*items[4], "rank"), std::optional<int64_t>(5));
    EXPECT_EQ(getStringMember(*items[0], "url"), std::optional<std::string>("https://example.com/1"));

    const JSONValue* md = sc.find("metadata");
    ASSERT_NE(md, nullptr);
    EXPECT_EQ(getStringMember(*md, "query"), std::optional<std::string>("rust ownership"));
    EXPECT_EQ(getIntegerMember(*md, "total_results"), std::optional<int64_t>(5));
    EXPECT_EQ(getStringMember(*md, "api_provider"), std::optional<std::string>("serper"));
    ASSERT_TRUE(getIntegerMember(*md, "response_time_ms").has_value());

    // The text item is the same payload serialized
    ASSERT_EQ(r.content.size(), 1u);
    EXPECT_EQ(parseJSONValue(typed::getText(r.content[0]).value()), sc);
}

TEST_F(WebSearchToolTest, DefaultResultCountIsTen) {
    provider->reply = ProviderReply{200, organicBody(15)};
    CallToolResult r = tool.Execute(args("defaults"));
    EXPECT_EQ(provider->lastNum, 10);
    EXPECT_EQ(getIntegerMember(*structured(r).find("metadata"), "total_results"), std::optional<int64_t>(10));
}

TEST_F(WebSearchToolTest, RateLimitIsApiError) {
    provider->reply = ProviderReply{429, "slow down"};
    CallToolResult r = tool.Execute(args("q"));
    EXPECT_TRUE(r.isError);
    EXPECT_EQ(getStringMember(structured(r), "error_type"), std::optional<std::string>("api_error"));
    EXPECT_EQ(getStringMember(structured(r), "details"), std::optional<std::string>("API rate limit exceeded"));
    EXPECT_EQ(getStringMember(structured(r), "status"), std::optional<std::string>("error"));
}

TEST_F(WebSearchToolTest, OtherStatusIsApiErrorWithBody) {
    provider->reply = ProviderReply{500, "upstream broke"};
    CallToolResult r = tool.Execute(args("q"));
    EXPECT_TRUE(r.isError);
    EXPECT_EQ(getStringMember(structured(r), "details"), std::optional<std::string>("API error 500: upstream broke"));
}

TEST_F(WebSearchToolTest, TimeoutAndNetworkFailures) {
    provider->mode = FakeProvider::Mode::Timeout;
    CallToolResult t = tool.Execute(args("q"));
    EXPECT_TRUE(t.isError);
    EXPECT_EQ(getStringMember(structured(t), "error_type"), std::optional<std::string>("timeout"));
    EXPECT_EQ(getStringMember(structured(t), "details"), std::optional<std::string>("Request timed out after 30 seconds"));

    provider->mode = FakeProvider::Mode::Network;
    CallToolResult n = tool.Execute(args("q"));
    EXPECT_TRUE(n.isError);
    EXPECT_EQ(getStringMember(structured(n), "error_type"), std::optional<std::string>("search_error"));
    EXPECT_EQ(getStringMember(structured(n), "details"), std::optional<std::string>("Network error: connection refused"));
}

TEST_F(WebSearchToolTest, UnparsableBodyIsSearchError) {
    provider->reply = ProviderReply{200, "<html>"};
    CallToolResult r = tool.Execute(args("q"));
    EXPECT_TRUE(r.isError);
    EXPECT_EQ(getStringMember(structured(r), "error_type"), std::optional<std::string>("search_error"));
}

TEST_F(WebSearchToolTest, InvalidArgumentsNeverReachProvider) {
    CallToolResult r = tool.Execute(args("q", 0));
    EXPECT_TRUE(r.isError);
    EXPECT_EQ(getStringMember(structured(r), "error_type"), std::optional<std::string>("internal_error"));
    EXPECT_EQ(provider->calls, 0);
}

TEST_F(WebSearchToolTest, CancelledBeforeProviderCall) {
    std::stop_source src;
    src.request_stop();
    CallToolResult r = tool.Execute(args("q"), src.get_token());
    EXPECT_TRUE(r.isError);
    EXPECT_EQ(provider->calls, 0);
}
