//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Protocol.h
// Purpose: MCP protocol data structures, method names and tool call value types
//==========================================================================================================

#pragma once

#include "websearch/JSONRPCTypes.h"

#include <array>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace websearch {
//==========================================================================================================
// MCP Protocol types and constants
// Purpose: Shared protocol structures and method names used by both the bridge and the tool host.
//==========================================================================================================
///////////////////////////////////////// Protocol constants ///////////////////////////////////////////
// Version proposed by the bridge in initialize
constexpr const char* PROTOCOL_VERSION = "2025-11-25";

// Versions the bridge accepts from a tool host, newest first
constexpr std::array<const char*, 4> SUPPORTED_PROTOCOL_VERSIONS = {
    "2025-11-25", "2025-06-18", "2025-03-26", "2024-11-05"
};

bool isSupportedProtocolVersion(const std::string& version);

///////////////////////////////////////// Implementation ///////////////////////////////////////////
// Implementation information (clientInfo / serverInfo)
struct Implementation {
    std::string name;
    std::string version;

    Implementation() = default;
    Implementation(std::string name, std::string version)
        : name(std::move(name)), version(std::move(version)) {}
};

///////////////////////////////////////// Tools ///////////////////////////////////////////
struct Tool {
    std::string name;
    std::string description;
    JSONValue inputSchema;  // JSON Schema for tool parameters

    Tool() = default;
    Tool(std::string name, std::string description, JSONValue inputSchema = JSONValue{})
        : name(std::move(name)), description(std::move(description)),
          inputSchema(std::move(inputSchema)) {}
};

struct CallToolResult {
    std::vector<JSONValue> content;  // Array of content items
    std::optional<JSONValue> structuredContent;
    bool isError = false;
};

// Builds the wire form { content: [...], structuredContent?, isError }.
JSONValue toJSONValue(const CallToolResult& result);

//==========================================================================================================
// ToolCall
// Purpose: Immutable (tool name, ordered argument mapping) pair handed to the Tool Invoker.
//==========================================================================================================
class ToolCall {
public:
    using Arguments = std::map<std::string, JSONValue>;

    ToolCall(std::string name, Arguments arguments = {})
        : name_(std::move(name)), arguments_(std::move(arguments)) {}

    const std::string& Name() const { return name_; }

    // nullptr when the argument is absent
    const JSONValue* Argument(const std::string& key) const;

    // Arguments rendered as a JSON object for tools/call params.
    JSONValue ArgumentsObject() const;

private:
    std::string name_;
    Arguments arguments_;
};

///////////////////////////////////////// Methods ///////////////////////////////////////////
namespace Methods {
    constexpr const char* Initialize = "initialize";
    constexpr const char* Ping = "ping";
    constexpr const char* ListTools = "tools/list";
    constexpr const char* CallTool = "tools/call";
    constexpr const char* Initialized = "notifications/initialized";
    constexpr const char* Cancelled = "notifications/cancelled";
    constexpr const char* Progress = "notifications/progress";
    constexpr const char* Log = "notifications/message";
}

} // namespace websearch
