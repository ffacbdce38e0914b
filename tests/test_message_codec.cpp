//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_message_codec.cpp
// Purpose: Tests for MessageCodec classification, partial input and error reporting
//==========================================================================================================

#include <gtest/gtest.h>

#include <string>

#include "websearch/MessageCodec.h"
#include "websearch/errors/Errors.h"

using namespace websearch;

TEST(MessageCodecTest, ClassifiesRequestNotificationAndResponse) {
    Message req = MessageCodec::Decode(R"({"jsonrpc":"2.0","id":1,"method":"tools/list"})");
    EXPECT_TRUE(std::holds_alternative<JSONRPCRequest>(req));
    Message note = MessageCodec::Decode(R"({"jsonrpc":"2.0","method":"notifications/initialized"})");
    EXPECT_TRUE(std::holds_alternative<JSONRPCNotification>(note));
    Message resp = MessageCodec::Decode(R"({"jsonrpc":"2.0","id":"7","result":{}})");
    ASSERT_TRUE(std::holds_alternative<JSONRPCResponse>(resp));
    EXPECT_EQ(idToString(std::get<JSONRPCResponse>(resp).id), "7");
    EXPECT_STREQ(messageKindName(resp), "response");
}

TEST(MessageCodecTest, EncodeThenDecodeAcrossPartialReads) {
    MessageCodec codec;
    JSONValue::Object params;
    setMember(params, "name", JSONValue("web_search"));
    const std::string bytes = codec.Encode(JSONRPCRequest(static_cast<int64_t>(3), "tools/call", JSONValue(std::move(params))));
    ASSERT_EQ(bytes.back(), '\n');

    // Byte-at-a-time delivery
    std::optional<Message> got;
    for (std::size_t i = 0; i < bytes.size(); ++i) {
        codec.Feed(bytes.data() + i, 1);
        got = codec.Next();
        if (i + 1 < bytes.size()) {
            EXPECT_FALSE(got.has_value());
        }
    }
    ASSERT_TRUE(got.has_value());
    const auto& req = std::get<JSONRPCRequest>(got.value());
    EXPECT_EQ(req.method, "tools/call");
    EXPECT_EQ(std::get<int64_t>(req.id), 3);
    EXPECT_EQ(getStringMember(req.params.value(), "name"), std::optional<std::string>("web_search"));
    EXPECT_EQ(codec.Buffered(), 0u);
}

TEST(MessageCodecTest, ContentLengthFramingCarriesTwoFramesInOneRead) {
    MessageCodec codec(FramingKind::ContentLength);
    std::string bytes = codec.Encode(JSONRPCNotification("notifications/initialized"));
    bytes += codec.Encode(JSONRPCResponse(static_cast<int64_t>(1), JSONValue(JSONValue::Object{})));
    codec.Feed(bytes);
    auto first = codec.Next();
    auto second = codec.Next();
    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());
    EXPECT_TRUE(std::holds_alternative<JSONRPCNotification>(first.value()));
    EXPECT_TRUE(std::holds_alternative<JSONRPCResponse>(second.value()));
    EXPECT_FALSE(codec.Next().has_value());
}

TEST(MessageCodecTest, MalformedFrameThrowsAndIsDropped) {
    MessageCodec codec;
    codec.Feed("not json\n{\"jsonrpc\":\"2.0\",\"method\":\"x\"}\n");
    try {
        (void)codec.Next();
        FAIL() << "expected ProtocolError";
    } catch (const errors::ProtocolError& e) {
        EXPECT_EQ(e.protocolKind(), errors::ProtocolErrorKind::Malformed);
        EXPECT_EQ(e.kind(), errors::BridgeErrorKind::Protocol);
    }
    auto next = codec.Next();
    ASSERT_TRUE(next.has_value());
    EXPECT_TRUE(std::holds_alternative<JSONRPCNotification>(next.value()));
}

TEST(MessageCodecTest, NonObjectAndShapelessFramesAreMalformed) {
    EXPECT_THROW(MessageCodec::Decode("[1,2]"), errors::ProtocolError);
    EXPECT_THROW(MessageCodec::Decode(R"({"jsonrpc":"2.0"})"), errors::ProtocolError);
}

TEST(MessageCodecTest, OversizeFrameIsFrameTooLarge) {
    MessageCodec codec(FramingKind::NewlineDelimited, 16);
    EXPECT_EQ(codec.Framing(), FramingKind::NewlineDelimited);
    EXPECT_EQ(codec.MaxFrameBytes(), 16u);
    codec.Feed(std::string(64, 'x') + "\n");
    try {
        (void)codec.Next();
        FAIL() << "expected ProtocolError";
    } catch (const errors::ProtocolError& e) {
        EXPECT_EQ(e.protocolKind(), errors::ProtocolErrorKind::FrameTooLarge);
    }
}

TEST(MessageCodecTest, SerializedPayloadHasNoRawNewline) {
    JSONValue::Object params;
    setMember(params, "text", JSONValue("line one\nline two"));
    const std::string s = MessageCodec::Serialize(JSONRPCNotification("notifications/message", JSONValue(std::move(params))));
    EXPECT_EQ(s.find('\n'), std::string::npos);
}
