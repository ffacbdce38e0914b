//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: SearchFacade.h
// Purpose: HTTP front door mapping /search, /health and / onto the Tool Invoker
//==========================================================================================================

#pragma once

#include <chrono>
#include <cstdint>
#include <string>

#include "websearch/HTTPServer.hpp"
#include "websearch/ToolInvoker.h"

namespace websearch {

struct FacadeOptions {
    std::string toolName{"web_search"};
    std::int64_t defaultMaxResults{10};
    std::int64_t maxResultsCap{20};
    std::chrono::milliseconds timeout{30000};
};

//==========================================================================================================
// SearchFacade
// Purpose: Translates HTTP requests into tool invocations and bridge errors into HTTP statuses:
//   400 body not a JSON object, 422 invalid arguments, 502 tool/provider error, 503 session not ready,
//   504 timeout, 500 anything else.
// Notes:
//   - Registers the web_search argument validator on the invoker it is given.
//==========================================================================================================
class SearchFacade {
public:
    SearchFacade(ToolInvoker& invoker, FacadeOptions options = {});

    void RegisterRoutes(HTTPServer& server);

    HttpReply HandleSearch(const HttpRequest& request);
    HttpReply HandleHealth(const HttpRequest& request) const;
    HttpReply HandleRoot(const HttpRequest& request) const;

private:
    ToolInvoker& invoker_;
    FacadeOptions options_;
};

} // namespace websearch
