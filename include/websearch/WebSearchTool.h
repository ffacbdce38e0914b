//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: WebSearchTool.h
// Purpose: The tool host's web_search tool: argument handling, provider call, result shaping
//==========================================================================================================

#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <stop_token>
#include <string>
#include <vector>

#include "websearch/Protocol.h"
#include "websearch/SerperClient.hpp"
#include "websearch/ToolServer.h"

namespace websearch {

struct SearchResult {
    std::string title;
    std::string snippet;
    std::string url;
    std::int64_t rank{0};
};

//==========================================================================================================
// WebSearchTool
// Purpose: Implements web_search on top of an ISearchProvider.
// Notes:
//   - Provider failures are returned as isError results whose structuredContent is
//     { error, details, status:"error", error_type } with error_type one of
//     timeout | api_error | search_error | internal_error. Nothing is retried.
//==========================================================================================================
class WebSearchTool {
public:
    static constexpr const char* Name = "web_search";

    WebSearchTool(std::shared_ptr<ISearchProvider> provider, std::int64_t maxResultsCap,
                  std::chrono::seconds timeout);

    Tool Describe() const;

    CallToolResult Execute(const JSONValue& arguments, std::stop_token stop = {}) const;

    // Adapter for ToolServer::RegisterTool.
    ToolHandler Handler() const;

    //==========================================================================================================
    // ParseOrganic
    // Purpose: Extracts ranked results from a provider body's "organic" list.
    // Returns:
    //   Results with an http(s) link, rank = 1-based position in the provider list.
    // Throws:
    //   std::runtime_error if "organic" is present but not a list.
    //==========================================================================================================
    static std::vector<SearchResult> ParseOrganic(const JSONValue& body);

private:
    std::shared_ptr<ISearchProvider> provider_;
    std::int64_t maxResultsCap_;
    std::chrono::seconds timeout_;
};

} // namespace websearch
