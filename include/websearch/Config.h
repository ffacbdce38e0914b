//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Config.h
// Purpose: Startup configuration of the bridge and the tool host (environment and .env file)
//==========================================================================================================

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "websearch/ProcessSupervisor.hpp"
#include "websearch/ToolInvoker.h"

namespace websearch {

//==========================================================================================================
// BridgeConfig
// Purpose: Values read once at startup. Malformed numbers are logged and the default is kept.
//==========================================================================================================
struct BridgeConfig {
    std::optional<std::string> serperApiKey;
    std::chrono::seconds requestTimeout{30};
    std::int64_t maxResults{20};
    std::string logLevel{"INFO"};
    std::string logFile;  // empty: console only
    std::string listenUri{"http://0.0.0.0:8000"};
    std::optional<std::uint16_t> port;  // PORT, overrides the port of listenUri
    unsigned httpThreads{4};
    unsigned handlerThreads{32};  // route handlers (tool calls) run here, off the I/O threads
    std::string toolHost{"websearch_tool_host"};
    std::vector<std::string> toolHostArgs;
    std::string transportConfig{"framing=newline"};
    std::chrono::milliseconds startupTimeout{10000};
    std::string serperEndpoint{"https://google.serper.dev/search"};

    static BridgeConfig FromEnvironment();

    // Tool-host launch description; provider settings are forwarded through its environment.
    ProcessSpec ToolHostSpec() const;
    ToolInvokerOptions InvokerOptions() const;
};

//==========================================================================================================
// LoadDotEnv
// Purpose: Loads KEY=VALUE lines ('#' comments, optional "export ", optional quotes) into the environment.
// Args:
//   path: File to read; a missing file is not an error.
//   overrideExisting: When false, variables already set are left untouched.
// Returns:
//   Number of variables set.
//==========================================================================================================
std::size_t LoadDotEnv(const std::string& path, bool overrideExisting = false);

// Splits on whitespace; double quotes group a single argument.
std::vector<std::string> SplitArgs(const std::string& text);

} // namespace websearch
