//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Content.h
// Purpose: Helpers for constructing and extracting text content items of tool results
//==========================================================================================================

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "websearch/Protocol.h"

namespace websearch {
namespace typed {

//------------------------------ Builders ------------------------------
inline JSONValue makeText(const std::string& text) {
    JSONValue::Object obj;
    setMember(obj, "type", JSONValue(std::string("text")));
    setMember(obj, "text", JSONValue(text));
    return JSONValue{std::move(obj)};
}

//------------------------------ Inspectors ------------------------------
inline bool isText(const JSONValue& v) {
    return getStringMember(v, "type") == std::optional<std::string>("text");
}

inline std::optional<std::string> getText(const JSONValue& v) {
    if (!isText(v)) return std::nullopt;
    return getStringMember(v, "text");
}

inline std::vector<std::string> collectText(const std::vector<JSONValue>& arr) {
    std::vector<std::string> out;
    out.reserve(arr.size());
    for (const auto& v : arr) {
        auto t = getText(v);
        if (t.has_value()) out.push_back(t.value());
    }
    return out;
}

inline std::optional<std::string> firstText(const CallToolResult& r) {
    auto v = collectText(r.content);
    if (v.empty()) return std::nullopt;
    return v.front();
}

} // namespace typed
} // namespace websearch
