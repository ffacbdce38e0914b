//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Protocol.cpp
// Purpose: Protocol helpers (version checks, tool call and result rendering)
//==========================================================================================================

#include "websearch/Protocol.h"

namespace websearch {

bool isSupportedProtocolVersion(const std::string& version) {
    for (const char* v : SUPPORTED_PROTOCOL_VERSIONS) {
        if (version == v) {
            return true;
        }
    }
    return false;
}

JSONValue toJSONValue(const CallToolResult& result) {
    JSONValue::Object obj;
    JSONValue::Array content;
    content.reserve(result.content.size());
    for (const auto& item : result.content) {
        content.push_back(std::make_shared<JSONValue>(item));
    }
    setMember(obj, "content", JSONValue(std::move(content)));
    if (result.structuredContent.has_value()) {
        setMember(obj, "structuredContent", result.structuredContent.value());
    }
    setMember(obj, "isError", JSONValue(result.isError));
    return JSONValue(std::move(obj));
}

const JSONValue* ToolCall::Argument(const std::string& key) const {
    auto it = arguments_.find(key);
    return it == arguments_.end() ? nullptr : &it->second;
}

JSONValue ToolCall::ArgumentsObject() const {
    JSONValue::Object obj;
    for (const auto& [key, value] : arguments_) {
        setMember(obj, key, value);
    }
    return JSONValue(std::move(obj));
}

} // namespace websearch
