//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Config.cpp
// Purpose: Environment-driven configuration
//==========================================================================================================

#include "websearch/Config.h"

#include <cstdlib>
#include <fstream>

#include "env/EnvVars.h"
#include "logging/Logger.h"
#include "websearch/version.h"

namespace websearch {

namespace {
std::string trim(const std::string& s) {
    auto b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return std::string();
    auto e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

// Reads a positive integer variable; keeps fallback (with a warning) when unset or malformed.
std::uint64_t readPositive(const char* name, std::uint64_t fallback) {
    const std::string raw = GetEnvOrDefault(name, "");
    if (raw.empty()) {
        return fallback;
    }
    auto v = ParseUnsigned(trim(raw));
    if (!v.has_value() || v.value() == 0) {
        LOG_WARN("Config: ignoring invalid {}='{}' (using {})", name, raw, fallback);
        return fallback;
    }
    return v.value();
}
} // namespace

BridgeConfig BridgeConfig::FromEnvironment() {
    BridgeConfig c;
    const std::string key = GetEnvOrDefault("SERPER_API_KEY", "");
    if (!key.empty()) {
        c.serperApiKey = key;
    }
    c.requestTimeout = std::chrono::seconds(readPositive("REQUEST_TIMEOUT", 30));
    c.maxResults = static_cast<std::int64_t>(readPositive("MAX_RESULTS", 20));
    c.logLevel = GetEnvOrDefault("LOG_LEVEL", "INFO");
    c.logFile = GetEnvOrDefault("WEBSEARCH_LOG_FILE", "");
    c.listenUri = GetEnvOrDefault("WEBSEARCH_LISTEN", c.listenUri);
    if (!GetEnvOrDefault("PORT", "").empty()) {
        std::uint64_t p = readPositive("PORT", 8000);
        if (p > 65535) {
            LOG_WARN("Config: ignoring out-of-range PORT={}", p);
        } else {
            c.port = static_cast<std::uint16_t>(p);
        }
    }
    c.httpThreads = static_cast<unsigned>(readPositive("WEBSEARCH_HTTP_THREADS", 4));
    c.handlerThreads = static_cast<unsigned>(readPositive("WEBSEARCH_HANDLER_THREADS", 32));
    c.toolHost = GetEnvOrDefault("WEBSEARCH_TOOL_HOST", c.toolHost);
    c.toolHostArgs = SplitArgs(GetEnvOrDefault("WEBSEARCH_TOOL_HOST_ARGS", ""));
    c.transportConfig = GetEnvOrDefault("WEBSEARCH_TRANSPORT", c.transportConfig);
    c.startupTimeout = std::chrono::milliseconds(readPositive("WEBSEARCH_STARTUP_TIMEOUT_MS", 10000));
    c.serperEndpoint = GetEnvOrDefault("SERPER_ENDPOINT", c.serperEndpoint);
    return c;
}

ProcessSpec BridgeConfig::ToolHostSpec() const {
    ProcessSpec spec;
    spec.executable = toolHost;
    spec.args = toolHostArgs;
    spec.inheritEnvironment = true;
    if (serperApiKey.has_value()) {
        spec.env.emplace_back("SERPER_API_KEY", serperApiKey.value());
    }
    spec.env.emplace_back("REQUEST_TIMEOUT", std::to_string(requestTimeout.count()));
    spec.env.emplace_back("MAX_RESULTS", std::to_string(maxResults));
    spec.env.emplace_back("LOG_LEVEL", logLevel);
    spec.env.emplace_back("SERPER_ENDPOINT", serperEndpoint);
    return spec;
}

ToolInvokerOptions BridgeConfig::InvokerOptions() const {
    ToolInvokerOptions o;
    o.session.clientInfo = Implementation("websearch-bridge", getVersionString());
    o.session.startupTimeout = startupTimeout;
    o.session.requestTimeout = std::chrono::duration_cast<std::chrono::milliseconds>(requestTimeout);
    o.defaultTimeout = o.session.requestTimeout;
    return o;
}

std::size_t LoadDotEnv(const std::string& path, bool overrideExisting) {
    std::ifstream in(path);
    if (!in) {
        LOG_DEBUG("Config: no {} file", path);
        return 0;
    }
    std::size_t loaded = 0;
    std::string line;
    std::size_t lineNo = 0;
    while (std::getline(in, line)) {
        ++lineNo;
        std::string s = trim(line);
        if (s.empty() || s[0] == '#') continue;
        if (s.rfind("export ", 0) == 0) {
            s = trim(s.substr(7));
        }
        auto eq = s.find('=');
        if (eq == std::string::npos || eq == 0) {
            LOG_WARN("Config: {}:{}: expected KEY=VALUE", path, lineNo);
            continue;
        }
        std::string name = trim(s.substr(0, eq));
        std::string value = trim(s.substr(eq + 1));
        if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') && value.back() == value.front()) {
            value = value.substr(1, value.size() - 2);
        } else if (auto hash = value.find(" #"); hash != std::string::npos) {
            value = trim(value.substr(0, hash));
        }
        if (!overrideExisting && std::getenv(name.c_str()) != nullptr) {
            continue;
        }
        if (::setenv(name.c_str(), value.c_str(), 1) == 0) {
            ++loaded;
        }
    }
    LOG_INFO("Config: loaded {} variable(s) from {}", loaded, path);
    return loaded;
}

std::vector<std::string> SplitArgs(const std::string& text) {
    std::vector<std::string> out;
    std::string current;
    bool inQuotes = false;
    bool hasToken = false;
    for (char c : text) {
        if (c == '"') {
            inQuotes = !inQuotes;
            hasToken = true;
        } else if (!inQuotes && (c == ' ' || c == '\t' || c == '\n')) {
            if (hasToken) {
                out.push_back(current);
                current.clear();
                hasToken = false;
            }
        } else {
            current.push_back(c);
            hasToken = true;
        }
    }
    if (hasToken) {
        out.push_back(current);
    }
    return out;
}

} // namespace websearch
