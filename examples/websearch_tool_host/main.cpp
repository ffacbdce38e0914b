//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: main.cpp
// Purpose: MCP stdio tool host exposing web_search backed by Serper
//==========================================================================================================

#include <chrono>
#include <cstdint>
#include <exception>
#include <memory>
#include <string>

#include "env/EnvVars.h"
#include "logging/Logger.h"
#include "websearch/SerperClient.hpp"
#include "websearch/StdioTransport.hpp"
#include "websearch/ToolServer.h"
#include "websearch/WebSearchTool.h"
#include "websearch/version.h"

using namespace websearch;

int main() {
    FUNC_SCOPE();
    // stdout carries protocol frames only
    Logger::setStdioMode(true);
    Logger::setLogLevelFromString(GetEnvOrDefault("LOG_LEVEL", "INFO"));

    const std::string apiKey = GetEnvOrDefault("SERPER_API_KEY", "");
    if (apiKey.empty()) {
        LOG_FATAL("SERPER_API_KEY environment variable is required");
    }

    std::uint64_t timeoutSec = 30;
    if (auto v = ParseUnsigned(GetEnvOrDefault("REQUEST_TIMEOUT", "30")); v.has_value() && v.value() > 0) {
        timeoutSec = v.value();
    } else {
        LOG_WARN("Ignoring invalid REQUEST_TIMEOUT");
    }
    std::uint64_t maxResults = 20;
    if (auto v = ParseUnsigned(GetEnvOrDefault("MAX_RESULTS", "20")); v.has_value() && v.value() > 0) {
        maxResults = v.value();
    } else {
        LOG_WARN("Ignoring invalid MAX_RESULTS");
    }

    SerperClient::Options providerOptions;
    providerOptions.endpoint = GetEnvOrDefault("SERPER_ENDPOINT", providerOptions.endpoint);
    providerOptions.apiKey = apiKey;
    providerOptions.timeout = std::chrono::seconds(timeoutSec);

    std::shared_ptr<ISearchProvider> provider;
    try {
        provider = std::make_shared<SerperClient>(providerOptions);
    } catch (const std::exception& e) {
        LOG_FATAL("Invalid search provider configuration: {}", e.what());
    }
    WebSearchTool tool(provider, static_cast<std::int64_t>(maxResults), std::chrono::seconds(timeoutSec));

    ToolServer server(Implementation{"websearch-tool-host", getVersionString()});
    server.RegisterTool(tool.Describe(), tool.Handler());

    // Same config string as the bridge side so both ends agree on framing; process-only keys are ignored
    StdioTransportFactory factory;
    auto transport = factory.CreateTransport(GetEnvOrDefault("WEBSEARCH_TRANSPORT", "framing=newline"));
    try {
        server.Start(std::move(transport)).get();
    } catch (const std::exception& e) {
        LOG_FATAL("Tool host failed to start: {}", e.what());
    }
    LOG_INFO("websearch tool host {} serving on stdio", getVersionString());
    server.WaitUntilClosed();
    server.Stop();
    LOG_INFO("websearch tool host exiting");
    return 0;
}
