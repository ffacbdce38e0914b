//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ToolResult.h
// Purpose: Outcome of one tool invocation (content items or a structured error)
//==========================================================================================================

#pragma once

#include <string>
#include <variant>
#include <vector>

#include "websearch/Protocol.h"
#include "websearch/errors/Errors.h"
#include "websearch/typed/Content.h"

namespace websearch {

class ToolResult {
public:
    static ToolResult Success(CallToolResult result) { return ToolResult(std::move(result)); }
    static ToolResult Failure(errors::McpError error) { return ToolResult(std::move(error)); }

    bool IsSuccess() const { return std::holds_alternative<CallToolResult>(value_); }

    // Precondition: IsSuccess()
    const CallToolResult& Content() const { return std::get<CallToolResult>(value_); }
    // Precondition: !IsSuccess()
    const errors::McpError& GetFailure() const { return std::get<errors::McpError>(value_); }

    // Text of every text content item, in order. Empty for failures.
    std::vector<std::string> Texts() const {
        if (!IsSuccess()) return {};
        return typed::collectText(Content().content);
    }

private:
    explicit ToolResult(CallToolResult r) : value_(std::move(r)) {}
    explicit ToolResult(errors::McpError e) : value_(std::move(e)) {}

    std::variant<CallToolResult, errors::McpError> value_;
};

} // namespace websearch
