//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_content_framer.cpp
// Purpose: Tests for the newline and Content-Length framers
//==========================================================================================================

#include <gtest/gtest.h>

#include <string>

#include "websearch/ContentFramer.h"

using websearch::IContentFramer;

TEST(NewlineFramerTest, EncodeAppendsSingleNewline) {
    auto framer = websearch::MakeNewlineFramer();
    EXPECT_EQ(framer->encode("{\"a\":1}"), std::string("{\"a\":1}\n"));
}

TEST(NewlineFramerTest, DecodesFramesInOrder) {
    auto framer = websearch::MakeNewlineFramer();
    std::string buffer = "{\"a\":1}\n{\"b\":2}\n{\"c\"";
    auto first = framer->tryDecode(buffer);
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first.value(), "{\"a\":1}");
    auto second = framer->tryDecode(buffer);
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(second.value(), "{\"b\":2}");
    EXPECT_FALSE(framer->tryDecode(buffer).has_value());
    EXPECT_EQ(buffer, std::string("{\"c\""));
}

TEST(NewlineFramerTest, SkipsBlankLinesAndStripsCarriageReturn) {
    auto framer = websearch::MakeNewlineFramer();
    std::string buffer = "\n  \r\n{}\r\n";
    auto decoded = framer->tryDecode(buffer);
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded.value(), "{}");
    EXPECT_TRUE(buffer.empty());
}

TEST(NewlineFramerTest, BlankLinesOnlyAreConsumed) {
    auto framer = websearch::MakeNewlineFramer();
    std::string buffer = "\n\n";
    EXPECT_FALSE(framer->tryDecode(buffer).has_value());
    EXPECT_TRUE(buffer.empty());
}

TEST(NewlineFramerTest, OversizeLineIsDroppedThroughItsNewline) {
    auto framer = websearch::MakeNewlineFramer(4);
    std::string buffer = "abcdef\n{}\n";
    auto ex = framer->tryDecodeEx(buffer);
    EXPECT_EQ(ex.status, IContentFramer::DecodeStatus::BodyTooLarge);
    EXPECT_EQ(ex.bytesConsumed, 7u);
    EXPECT_FALSE(framer->tryDecode(buffer).has_value());
    auto next = framer->tryDecode(buffer);
    ASSERT_TRUE(next.has_value());
    EXPECT_EQ(next.value(), "{}");
}

TEST(NewlineFramerTest, UnterminatedOversizeLineIsReported) {
    auto framer = websearch::MakeNewlineFramer(4);
    auto ex = framer->tryDecodeEx("abcdefgh");
    EXPECT_EQ(ex.status, IContentFramer::DecodeStatus::BodyTooLarge);
    EXPECT_EQ(ex.bytesConsumed, 8u);
}

TEST(NewlineFramerTest, LineAtLimitIsAccepted) {
    auto framer = websearch::MakeNewlineFramer(4);
    auto ex = framer->tryDecodeEx("abcd\n");
    EXPECT_EQ(ex.status, IContentFramer::DecodeStatus::Ok);
    ASSERT_TRUE(ex.payload.has_value());
    EXPECT_EQ(ex.payload.value(), "abcd");
}

TEST(ContentLengthFramerTest, EncodeProducesExpectedHeader) {
    auto framer = websearch::MakeContentLengthFramer(1024);
    EXPECT_EQ(framer->encode("{}"), std::string("Content-Length: 2\r\n\r\n{}"));
}

TEST(ContentLengthFramerTest, PartialBodyWaitsForMoreBytes) {
    auto framer = websearch::MakeContentLengthFramer(1024);
    std::string buffer = "Content-Length: 7\r\n\r\n{\"a\"";
    EXPECT_FALSE(framer->tryDecode(buffer).has_value());
    EXPECT_EQ(buffer, std::string("Content-Length: 7\r\n\r\n{\"a\""));
    buffer += ":1}";
    auto decoded = framer->tryDecode(buffer);
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded.value(), "{\"a\":1}");
    EXPECT_TRUE(buffer.empty());
}

TEST(ContentLengthFramerTest, HeaderNameIsCaseInsensitive) {
    auto framer = websearch::MakeContentLengthFramer(1024);
    std::string buffer = "content-type: application/json\r\ncontent-length: 2\r\n\r\n{}";
    auto decoded = framer->tryDecode(buffer);
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded.value(), "{}");
}

TEST(ContentLengthFramerTest, BodyTooLargeAboveBoundary) {
    auto framer = websearch::MakeContentLengthFramer(4);
    auto ok = framer->tryDecodeEx("Content-Length: 4\r\n\r\nabcd");
    EXPECT_EQ(ok.status, IContentFramer::DecodeStatus::Ok);
    auto big = framer->tryDecodeEx("Content-Length: 5\r\n\r\nabcde");
    EXPECT_EQ(big.status, IContentFramer::DecodeStatus::BodyTooLarge);
    EXPECT_FALSE(big.payload.has_value());
    EXPECT_GT(big.bytesConsumed, 0u);
}

TEST(ContentLengthFramerTest, InvalidAndMissingLengthAreInvalidHeader) {
    auto framer = websearch::MakeContentLengthFramer(1024);
    EXPECT_EQ(framer->tryDecodeEx("Content-Length: abc\r\n\r\n{}").status, IContentFramer::DecodeStatus::InvalidHeader);
    EXPECT_EQ(framer->tryDecodeEx("X-Other: 1\r\n\r\n{}").status, IContentFramer::DecodeStatus::InvalidHeader);
}

TEST(ContentLengthFramerTest, IncompleteHeaderConsumesNothing) {
    auto framer = websearch::MakeContentLengthFramer(1024);
    auto ex = framer->tryDecodeEx("Content-Leng");
    EXPECT_EQ(ex.status, IContentFramer::DecodeStatus::Incomplete);
    EXPECT_EQ(ex.bytesConsumed, 0u);
}

TEST(FramingKindTest, ParsesNamesAndAliases) {
    EXPECT_EQ(websearch::parseFramingKind("newline"), websearch::FramingKind::NewlineDelimited);
    EXPECT_EQ(websearch::parseFramingKind("content-length"), websearch::FramingKind::ContentLength);
    EXPECT_EQ(websearch::parseFramingKind("lsp"), websearch::FramingKind::ContentLength);
    EXPECT_FALSE(websearch::parseFramingKind("bogus").has_value());
    EXPECT_STREQ(websearch::toString(websearch::FramingKind::ContentLength), "content-length");
}
