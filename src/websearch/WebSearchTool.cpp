//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: WebSearchTool.cpp
// Purpose: web_search tool implementation
//==========================================================================================================

#include "websearch/WebSearchTool.h"

#include <algorithm>
#include <future>

#include <fmt/format.h>

#include "logging/Logger.h"
#include "websearch/errors/Errors.h"
#include "websearch/typed/Content.h"
#include "websearch/validation/Validators.h"

namespace websearch {

namespace {

constexpr std::int64_t DefaultMaxResults = 10;

// isError result carrying { error, details, status:"error", error_type } as text and structuredContent
CallToolResult failure(const std::string& error, const std::string& details, const std::string& type) {
    JSONValue::Object obj;
    setMember(obj, "error", JSONValue(error));
    setMember(obj, "details", JSONValue(details));
    setMember(obj, "status", JSONValue("error"));
    setMember(obj, "error_type", JSONValue(type));
    JSONValue payload(std::move(obj));
    LOG_WARN("web_search: {} ({}): {}", error, type, details);

    CallToolResult r;
    r.content.push_back(typed::makeText(serializeJSONValue(payload)));
    r.structuredContent = std::move(payload);
    r.isError = true;
    return r;
}

bool isHttpLink(const std::string& link) {
    return link.rfind("http://", 0) == 0 || link.rfind("https://", 0) == 0;
}

} // namespace

WebSearchTool::WebSearchTool(std::shared_ptr<ISearchProvider> provider, std::int64_t maxResultsCap,
                             std::chrono::seconds timeout)
    : provider_(std::move(provider)), maxResultsCap_(maxResultsCap), timeout_(timeout) {}

Tool WebSearchTool::Describe() const {
    JSONValue::Object query;
    setMember(query, "type", JSONValue("string"));
    setMember(query, "description", JSONValue("Search query"));
    setMember(query, "minLength", JSONValue(static_cast<int64_t>(1)));
    setMember(query, "maxLength", JSONValue(static_cast<int64_t>(validation::MaxQueryCodePoints)));

    JSONValue::Object maxResults;
    setMember(maxResults, "type", JSONValue("integer"));
    setMember(maxResults, "description", JSONValue("Maximum number of results to return"));
    setMember(maxResults, "minimum", JSONValue(static_cast<int64_t>(1)));
    setMember(maxResults, "maximum", JSONValue(static_cast<int64_t>(maxResultsCap_)));
    setMember(maxResults, "default", JSONValue(static_cast<int64_t>(std::min(DefaultMaxResults, maxResultsCap_))));

    JSONValue::Object props;
    setMember(props, "query", JSONValue(std::move(query)));
    setMember(props, "max_results", JSONValue(std::move(maxResults)));

    JSONValue::Array required;
    required.push_back(std::make_shared<JSONValue>(JSONValue("query")));

    JSONValue::Object schema;
    setMember(schema, "type", JSONValue("object"));
    setMember(schema, "properties", JSONValue(std::move(props)));
    setMember(schema, "required", JSONValue(std::move(required)));

    return Tool(Name, "Search the web and return ranked results (title, snippet, url)", JSONValue(std::move(schema)));
}

std::vector<SearchResult> WebSearchTool::ParseOrganic(const JSONValue& body) {
    std::vector<SearchResult> out;
    const JSONValue* organic = body.find("organic");
    if (organic == nullptr || organic->isNull()) {
        return out;
    }
    if (!organic->isArray()) {
        throw std::runtime_error("provider field 'organic' is not a list");
    }
    const auto& items = std::get<JSONValue::Array>(organic->value);
    for (std::size_t i = 0; i < items.size(); ++i) {
        if (!items[i] || !items[i]->isObject()) continue;
        const JSONValue& item = *items[i];
        std::string link = getStringMember(item, "link").value_or("");
        if (!isHttpLink(link)) {
            LOG_DEBUG("web_search: skipping organic entry {} without http(s) link", i + 1);
            continue;
        }
        SearchResult r;
        r.title = getStringMember(item, "title").value_or("No title");
        r.snippet = getStringMember(item, "snippet").value_or("No description");
        r.url = std::move(link);
        r.rank = static_cast<std::int64_t>(i + 1);
        out.push_back(std::move(r));
    }
    return out;
}

CallToolResult WebSearchTool::Execute(const JSONValue& arguments, std::stop_token stop) const {
    FUNC_SCOPE();
    ToolCall::Arguments args;
    if (arguments.isObject()) {
        for (const auto& [k, v] : std::get<JSONValue::Object>(arguments.value)) {
            if (v) args[k] = *v;
        }
    }
    ToolCall call(Name, std::move(args));
    try {
        validation::validateWebSearchArguments(call, maxResultsCap_);
    } catch (const errors::InvalidArgumentError& e) {
        return failure("Unexpected error occurred", e.what(), "internal_error");
    }

    const std::string query = std::get<std::string>(call.Argument("query")->value);
    std::int64_t requested = DefaultMaxResults;
    if (const JSONValue* m = call.Argument("max_results"); m != nullptr && m->isInteger()) {
        requested = std::get<int64_t>(m->value);
    }
    const std::int64_t num = std::min(requested, maxResultsCap_);

    if (stop.stop_requested()) {
        return failure("Search request cancelled", "Cancelled before the provider was called", "internal_error");
    }

    LOG_INFO("web_search: query='{}' num={}", query, num);
    const auto started = std::chrono::steady_clock::now();
    ProviderReply reply;
    try {
        reply = provider_->Post(query, num);
    } catch (const ProviderTimeout&) {
        return failure("Search request timed out", fmt::format("Request timed out after {} seconds", timeout_.count()), "timeout");
    } catch (const std::runtime_error& e) {
        return failure("Search error occurred", fmt::format("Network error: {}", e.what()), "search_error");
    }
    const auto elapsedMs = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started).count();

    if (reply.status == 429) {
        return failure("API error occurred", "API rate limit exceeded", "api_error");
    }
    if (reply.status != 200) {
        return failure("API error occurred", fmt::format("API error {}: {}", reply.status, reply.body), "api_error");
    }

    std::vector<SearchResult> results;
    try {
        results = ParseOrganic(parseJSONValue(reply.body));
    } catch (const std::runtime_error& e) {
        return failure("Search error occurred", fmt::format("Invalid response from search provider: {}", e.what()), "search_error");
    }
    if (static_cast<std::int64_t>(results.size()) > num) {
        results.resize(static_cast<std::size_t>(num));
    }

    JSONValue::Array items;
    for (const auto& r : results) {
        JSONValue::Object o;
        setMember(o, "title", JSONValue(r.title));
        setMember(o, "snippet", JSONValue(r.snippet));
        setMember(o, "url", JSONValue(r.url));
        setMember(o, "rank", JSONValue(static_cast<int64_t>(r.rank)));
        items.push_back(std::make_shared<JSONValue>(JSONValue(std::move(o))));
    }
    JSONValue::Object metadata;
    setMember(metadata, "query", JSONValue(query));
    setMember(metadata, "total_results", JSONValue(static_cast<int64_t>(items.size())));
    setMember(metadata, "response_time_ms", JSONValue(static_cast<int64_t>(elapsedMs)));
    setMember(metadata, "api_provider", JSONValue("serper"));
    JSONValue::Object obj;
    setMember(obj, "results", JSONValue(std::move(items)));
    setMember(obj, "metadata", JSONValue(std::move(metadata)));
    setMember(obj, "status", JSONValue("success"));
    JSONValue payload(std::move(obj));

    LOG_INFO("web_search: {} results in {} ms", results.size(), elapsedMs);
    CallToolResult out;
    out.content.push_back(typed::makeText(serializeJSONValue(payload)));
    out.structuredContent = std::move(payload);
    return out;
}

ToolHandler WebSearchTool::Handler() const {
    return [this](const JSONValue& arguments, std::stop_token stop) -> std::future<CallToolResult> {
        return std::async(std::launch::async, [this, arguments, stop]() { return Execute(arguments, stop); });
    };
}

} // namespace websearch
