//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: SearchFacade.cpp
// Purpose: Search façade request handling and error-to-status mapping
//==========================================================================================================

#include "websearch/SearchFacade.h"

#include <algorithm>

#include "logging/Logger.h"
#include "websearch/errors/Errors.h"
#include "websearch/typed/Content.h"
#include "websearch/validation/Validators.h"
#include "websearch/version.h"

namespace websearch {

namespace {

HttpReply jsonReply(unsigned status, JSONValue::Object obj) {
    return HttpReply{status, serializeJSONValue(JSONValue(std::move(obj)))};
}

// { status:"error", error, error_type, details?, results:[], metadata:{} }
HttpReply searchError(unsigned status, const std::string& message, const std::string& type,
                      const std::optional<std::string>& details = std::nullopt) {
    JSONValue::Object obj;
    setMember(obj, "status", JSONValue("error"));
    setMember(obj, "error", JSONValue(message));
    setMember(obj, "error_type", JSONValue(type));
    if (details.has_value()) {
        setMember(obj, "details", JSONValue(details.value()));
    }
    setMember(obj, "results", JSONValue(JSONValue::Array{}));
    setMember(obj, "metadata", JSONValue(JSONValue::Object{}));
    return jsonReply(status, std::move(obj));
}

// Structured search payload of a tool result: structuredContent, else the first text item as JSON.
std::optional<JSONValue> searchPayload(const CallToolResult& r) {
    if (r.structuredContent.has_value() && r.structuredContent->isObject()) {
        return r.structuredContent;
    }
    auto text = typed::firstText(r);
    if (!text.has_value()) {
        return std::nullopt;
    }
    try {
        JSONValue v = parseJSONValue(text.value());
        if (v.isObject()) {
            return v;
        }
    } catch (const std::runtime_error& e) {
        LOG_DEBUG("SearchFacade: text content is not JSON ({})", e.what());
    }
    return std::nullopt;
}

} // namespace

SearchFacade::SearchFacade(ToolInvoker& invoker, FacadeOptions options)
    : invoker_(invoker), options_(std::move(options)) {
    invoker_.RegisterArgumentValidator(options_.toolName,
                                       validation::MakeWebSearchArgumentValidator(options_.maxResultsCap));
}

void SearchFacade::RegisterRoutes(HTTPServer& server) {
    server.Route("POST", "/search", [this](const HttpRequest& r) { return HandleSearch(r); });
    server.Route("GET", "/health", [this](const HttpRequest& r) { return HandleHealth(r); });
    server.Route("GET", "/", [this](const HttpRequest& r) { return HandleRoot(r); });
}

HttpReply SearchFacade::HandleSearch(const HttpRequest& request) {
    JSONValue body;
    try {
        body = parseJSONValue(request.body);
    } catch (const std::runtime_error& e) {
        return searchError(400, std::string("Request body is not valid JSON: ") + e.what(), "invalid_request");
    }
    if (!body.isObject()) {
        return searchError(400, "Request body must be a JSON object", "invalid_request");
    }

    ToolCall::Arguments args;
    if (const JSONValue* q = body.find("query")) {
        args["query"] = *q;
    }
    if (const JSONValue* m = body.find("max_results"); m != nullptr && !m->isNull()) {
        args["max_results"] = *m;
    } else {
        args["max_results"] = JSONValue(static_cast<int64_t>(std::min(options_.defaultMaxResults, options_.maxResultsCap)));
    }
    const std::string query = getStringMember(body, "query").value_or("");

    try {
        ToolResult result = invoker_.Invoke(ToolCall(options_.toolName, std::move(args)), options_.timeout);
        const CallToolResult& content = result.Content();

        if (auto payload = searchPayload(content)) {
            if (getStringMember(*payload, "status") == std::optional<std::string>("error")) {
                return searchError(502, getStringMember(*payload, "error").value_or("Search error occurred"),
                                   getStringMember(*payload, "error_type").value_or("search_error"),
                                   getStringMember(*payload, "details"));
            }
            if (payload->find("results") != nullptr) {
                JSONValue::Object obj = std::get<JSONValue::Object>(payload->value);
                setMember(obj, "status", JSONValue("success"));
                return jsonReply(200, std::move(obj));
            }
        }

        // Not the structured search payload: hand back the raw content items
        JSONValue::Array items;
        for (const auto& item : content.content) {
            items.push_back(std::make_shared<JSONValue>(item));
        }
        JSONValue::Object metadata;
        setMember(metadata, "query", JSONValue(query));
        setMember(metadata, "total_results", JSONValue(static_cast<int64_t>(items.size())));
        JSONValue::Object obj;
        setMember(obj, "results", JSONValue(std::move(items)));
        setMember(obj, "metadata", JSONValue(std::move(metadata)));
        setMember(obj, "status", JSONValue("success"));
        return jsonReply(200, std::move(obj));
    } catch (const errors::InvalidArgumentError& e) {
        return searchError(422, e.what(), "invalid_argument");
    } catch (const errors::ToolExecutionError& e) {
        // Provider failures carry { error, details, error_type } as structuredContent of the result
        const JSONValue* sc = e.error().data.has_value() ? e.error().data->find("structuredContent") : nullptr;
        if (sc == nullptr) {
            return searchError(502, e.what(), "tool_error");
        }
        return searchError(502, getStringMember(*sc, "error").value_or(e.what()),
                           getStringMember(*sc, "error_type").value_or("tool_error"),
                           getStringMember(*sc, "details"));
    } catch (const errors::SessionNotReadyError& e) {
        return searchError(503, e.what(), errors::toString(e.kind()));
    } catch (const errors::TimeoutError& e) {
        return searchError(504, e.what(), errors::toString(e.kind()));
    } catch (const errors::BridgeError& e) {
        LOG_ERROR("SearchFacade: search failed ({}): {}", errors::toString(e.kind()), e.what());
        return searchError(500, e.what(), errors::toString(e.kind()));
    } catch (const std::exception& e) {
        LOG_ERROR("SearchFacade: unexpected error: {}", e.what());
        return searchError(500, "Unexpected error occurred", "internal_error", std::string(e.what()));
    }
}

HttpReply SearchFacade::HandleHealth(const HttpRequest&) const {
    JSONValue::Object obj;
    const bool ready = invoker_.IsReady();
    setMember(obj, "status", JSONValue(ready ? "healthy" : "unhealthy"));
    setMember(obj, "mcp_server_running", JSONValue(ready));
    if (!ready) {
        std::string last = invoker_.LastError();
        setMember(obj, "error", JSONValue(last.empty() ? std::string("MCP server is not responding") : last));
    }
    return jsonReply(200, std::move(obj));
}

HttpReply SearchFacade::HandleRoot(const HttpRequest&) const {
    JSONValue::Object endpoints;
    setMember(endpoints, "search", JSONValue("POST /search"));
    setMember(endpoints, "health", JSONValue("GET /health"));
    JSONValue::Object obj;
    setMember(obj, "message", JSONValue("MCP Web Search Client"));
    setMember(obj, "version", JSONValue(getVersionString()));
    setMember(obj, "endpoints", JSONValue(std::move(endpoints)));
    return jsonReply(200, std::move(obj));
}

} // namespace websearch
