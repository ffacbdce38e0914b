//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Validators.h
// Purpose: Validators for tool result shapes and web_search call arguments
//==========================================================================================================

#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>

#include <fmt/format.h>

#include "websearch/Protocol.h"
#include "websearch/errors/Errors.h"

namespace websearch {
namespace validation {

constexpr std::size_t MaxQueryCodePoints = 500;

//------------------------------ Primitive content checks ------------------------------
inline bool isTextContentItem(const JSONValue& v) {
    return getStringMember(v, "type") == std::optional<std::string>("text") &&
           getStringMember(v, "text").has_value();
}

// Every item must be an object carrying a string "type"; non-text items are allowed.
inline bool validateCallToolResultJson(const JSONValue& v) {
    const JSONValue* content = v.find("content");
    if (content == nullptr || !content->isArray()) return false;
    for (const auto& p : std::get<JSONValue::Array>(content->value)) {
        if (!p || !getStringMember(*p, "type").has_value()) return false;
        if (getStringMember(*p, "type") == std::optional<std::string>("text") && !isTextContentItem(*p)) return false;
    }
    return true;
}

// Number of code points in well-formed UTF-8 (continuation bytes are not counted).
inline std::size_t utf8Length(const std::string& s) {
    std::size_t n = 0;
    for (unsigned char c : s) {
        if ((c & 0xC0u) != 0x80u) ++n;
    }
    return n;
}

//==========================================================================================================
// validateWebSearchArguments
// Purpose: Checks web_search arguments before anything is sent to a tool host.
//   query: string, 1..500 code points after trimming surrounding whitespace.
//   max_results: optional integer in [1, cap].
// Throws:
//   errors::InvalidArgumentError describing the first violation.
//==========================================================================================================
inline void validateWebSearchArguments(const ToolCall& call, std::int64_t cap) {
    const JSONValue* query = call.Argument("query");
    if (query == nullptr) {
        throw errors::InvalidArgumentError("missing required argument 'query'");
    }
    if (!query->isString()) {
        throw errors::InvalidArgumentError("argument 'query' must be a string");
    }
    const std::string& q = std::get<std::string>(query->value);
    auto first = q.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        throw errors::InvalidArgumentError("argument 'query' must not be empty");
    }
    if (utf8Length(q) > MaxQueryCodePoints) {
        throw errors::InvalidArgumentError(
            fmt::format("argument 'query' exceeds {} characters", MaxQueryCodePoints));
    }
    if (const JSONValue* max = call.Argument("max_results"); max != nullptr && !max->isNull()) {
        if (!max->isInteger()) {
            throw errors::InvalidArgumentError("argument 'max_results' must be an integer");
        }
        std::int64_t v = std::get<std::int64_t>(max->value);
        if (v < 1 || v > cap) {
            throw errors::InvalidArgumentError(
                fmt::format("argument 'max_results' must be between 1 and {}", cap));
        }
    }
}

inline std::function<void(const ToolCall&)> MakeWebSearchArgumentValidator(std::int64_t cap) {
    return [cap](const ToolCall& call) { validateWebSearchArguments(call, cap); };
}

} // namespace validation
} // namespace websearch
