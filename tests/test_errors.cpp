//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_errors.cpp
// Purpose: GoogleTests for the bridge error taxonomy and JSON-RPC error mapping helpers
//==========================================================================================================

#include <gtest/gtest.h>

#include "websearch/JSONRPCTypes.h"
#include "websearch/ToolResult.h"
#include "websearch/errors/Errors.h"

using namespace websearch;

TEST(Errors, CategoryMapping) {
    using errors::ErrorCategory;
    EXPECT_EQ(errors::errorCategoryFromCode(JSONRPCErrorCodes::ParseError), ErrorCategory::JsonRpcParse);
    EXPECT_EQ(errors::errorCategoryFromCode(JSONRPCErrorCodes::MethodNotFound), ErrorCategory::JsonRpcMethodNotFound);
    EXPECT_EQ(errors::errorCategoryFromCode(JSONRPCErrorCodes::InvalidParams), ErrorCategory::JsonRpcInvalidParams);
    EXPECT_EQ(errors::errorCategoryFromCode(JSONRPCErrorCodes::ToolNotFound), ErrorCategory::McpToolNotFound);
    EXPECT_EQ(errors::errorCategoryFromCode(JSONRPCErrorCodes::ToolExecutionFailed), ErrorCategory::McpToolExecution);
    EXPECT_EQ(errors::errorCategoryFromCode(12345), ErrorCategory::Unknown);
}

TEST(Errors, KindNamesAndRetryability) {
    EXPECT_STREQ(errors::toString(errors::BridgeErrorKind::Timeout), "timeout");
    EXPECT_STREQ(errors::toString(errors::BridgeErrorKind::ToolExecution), "tool_error");
    EXPECT_STREQ(errors::toString(errors::BridgeErrorKind::InvalidArgument), "invalid_argument");

    EXPECT_TRUE(errors::TimeoutError("t").retryable());
    EXPECT_TRUE(errors::SessionClosedError("c").retryable());
    EXPECT_TRUE(errors::SessionNotReadyError("n").retryable());
    EXPECT_FALSE(errors::HandshakeError("h").retryable());
    EXPECT_FALSE(errors::InvalidArgumentError("i").retryable());
    EXPECT_FALSE(errors::ToolExecutionError(errors::makeError(-1, "x")).retryable());
    EXPECT_FALSE(errors::SpawnError("s", 2).retryable());
}

TEST(Errors, HierarchyIsCatchableAsBridgeError) {
    try {
        throw errors::ProtocolError(errors::ProtocolErrorKind::FrameTooLarge, "big");
    } catch (const errors::BridgeError& e) {
        EXPECT_EQ(e.kind(), errors::BridgeErrorKind::Protocol);
        EXPECT_STREQ(e.what(), "big");
    }
    errors::SpawnError spawn("no such file", 2);
    EXPECT_EQ(spawn.errnoValue(), 2);
}

TEST(Errors, FromErrorValue_Valid) {
    JSONValue::Object dataObj;
    setMember(dataObj, "foo", JSONValue("bar"));
    JSONValue errVal = CreateErrorObject(JSONRPCErrorCodes::MethodNotFound, "Method not found", JSONValue(dataObj));

    auto parsed = errors::mcpErrorFromErrorValue(errVal);
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->code, JSONRPCErrorCodes::MethodNotFound);
    EXPECT_EQ(parsed->message, "Method not found");
    EXPECT_EQ(parsed->category, errors::ErrorCategory::JsonRpcMethodNotFound);
    ASSERT_TRUE(parsed->data.has_value());
    EXPECT_EQ(getStringMember(parsed->data.value(), "foo"), std::optional<std::string>("bar"));
}

TEST(Errors, FromErrorValue_InvalidShape) {
    EXPECT_FALSE(errors::mcpErrorFromErrorValue(JSONValue(nullptr)).has_value());

    JSONValue::Object missCode;
    setMember(missCode, "message", JSONValue("m"));
    EXPECT_FALSE(errors::mcpErrorFromErrorValue(JSONValue(missCode)).has_value());

    JSONValue::Object wrongTypes;
    setMember(wrongTypes, "code", JSONValue("-32601"));
    setMember(wrongTypes, "message", JSONValue(static_cast<int64_t>(123)));
    EXPECT_FALSE(errors::mcpErrorFromErrorValue(JSONValue(wrongTypes)).has_value());
}

TEST(Errors, FromResponse) {
    auto resp = CreateErrorResponse(std::string("1"), JSONRPCErrorCodes::InvalidParams, "bad args");
    ASSERT_TRUE(resp != nullptr);
    auto parsed = errors::mcpErrorFromResponse(*resp);
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->code, JSONRPCErrorCodes::InvalidParams);
    EXPECT_EQ(parsed->message, "bad args");
    EXPECT_FALSE(parsed->data.has_value());

    JSONRPCResponse ok(static_cast<int64_t>(1), JSONValue(JSONValue::Object{}));
    EXPECT_FALSE(errors::mcpErrorFromResponse(ok).has_value());
}

TEST(Errors, ToolExecutionErrorCarriesErrorVerbatim) {
    errors::McpError e = errors::makeError(JSONRPCErrorCodes::ToolExecutionFailed, "provider down", JSONValue("d"));
    errors::ToolExecutionError ex(e);
    EXPECT_EQ(ex.code(), JSONRPCErrorCodes::ToolExecutionFailed);
    EXPECT_STREQ(ex.what(), "provider down");
    ASSERT_TRUE(ex.error().data.has_value());
    EXPECT_EQ(ex.error().data.value(), JSONValue("d"));
}

TEST(ToolResultTest, SuccessExposesTextsFailureExposesError) {
    CallToolResult r;
    r.content.push_back(typed::makeText("one"));
    r.content.push_back(typed::makeText("two"));
    ToolResult ok = ToolResult::Success(r);
    ASSERT_TRUE(ok.IsSuccess());
    EXPECT_EQ(ok.Texts(), (std::vector<std::string>{"one", "two"}));

    ToolResult bad = ToolResult::Failure(errors::makeError(-1, "nope"));
    EXPECT_FALSE(bad.IsSuccess());
    EXPECT_EQ(bad.GetFailure().message, "nope");
    EXPECT_TRUE(bad.Texts().empty());
}
