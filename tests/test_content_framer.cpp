//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_content_framer.cpp
// Purpose: Tests for ContentFramer
//==========================================================================================================

#include <gtest/gtest.h>

#include <string>

#include "mcphost/ContentFramer.h"

using mcphost::IContentFramer;

TEST(NewlineFramerTest, EncodeAppendsSingleNewline) {
    auto framer = mcphost::MakeNewlineFramer(1024);
    EXPECT_EQ(framer->encode("{\"a\":1}"), std::string("{\"a\":1}\n"));
}

TEST(NewlineFramerTest, EncodeStripsEmbeddedLineBreaks) {
    auto framer = mcphost::MakeNewlineFramer(1024);
    EXPECT_EQ(framer->encode("{\r\n}"), std::string("{}\n"));
}

TEST(NewlineFramerTest, DecodeSplitsLinesAndReportsConsumed) {
    auto framer = mcphost::MakeNewlineFramer(1024);
    std::string buffer = "{\"id\":1}\n{\"id\":2}\r\n{\"id\"";
    auto first = framer->tryDecodeEx(buffer);
    ASSERT_EQ(first.status, IContentFramer::DecodeStatus::Ok);
    EXPECT_EQ(*first.payload, "{\"id\":1}");
    buffer.erase(0, first.bytesConsumed);

    auto second = framer->tryDecodeEx(buffer);
    ASSERT_EQ(second.status, IContentFramer::DecodeStatus::Ok);
    EXPECT_EQ(*second.payload, "{\"id\":2}");
    buffer.erase(0, second.bytesConsumed);

    auto third = framer->tryDecodeEx(buffer);
    EXPECT_EQ(third.status, IContentFramer::DecodeStatus::Incomplete);
    EXPECT_EQ(third.bytesConsumed, 0u);
}

TEST(NewlineFramerTest, BlankLinesAreSkipped) {
    auto framer = mcphost::MakeNewlineFramer(1024);
    std::string buffer = "\n  \r\n{}\n";
    auto ex = framer->tryDecodeEx(buffer);
    ASSERT_EQ(ex.status, IContentFramer::DecodeStatus::Ok);
    EXPECT_EQ(*ex.payload, "{}");
    EXPECT_EQ(ex.bytesConsumed, buffer.size());
}

TEST(NewlineFramerTest, OverlongLineIsDiscarded) {
    auto framer = mcphost::MakeNewlineFramer(4);
    std::string buffer = "abcdef\n{}\n";
    auto ex = framer->tryDecodeEx(buffer);
    EXPECT_EQ(ex.status, IContentFramer::DecodeStatus::BodyTooLarge);
    EXPECT_EQ(ex.bytesConsumed, 7u);
    buffer.erase(0, ex.bytesConsumed);
    auto next = framer->tryDecodeEx(buffer);
    ASSERT_EQ(next.status, IContentFramer::DecodeStatus::Ok);
    EXPECT_EQ(*next.payload, "{}");
}

TEST(NewlineFramerTest, UnterminatedOverlongBufferIsDropped) {
    auto framer = mcphost::MakeNewlineFramer(4);
    std::string buffer = "abcdefgh";
    auto ex = framer->tryDecodeEx(buffer);
    EXPECT_EQ(ex.status, IContentFramer::DecodeStatus::BodyTooLarge);
    EXPECT_EQ(ex.bytesConsumed, buffer.size());
}

TEST(ContentLengthFramerTest, EncodeProducesExpectedHeader) {
    auto framer = mcphost::MakeContentLengthFramer(1024);
    const std::string payload = "{}";
    const std::string frame = framer->encode(payload);
    EXPECT_EQ(frame, std::string("Content-Length: 2\r\n\r\n{}"));
}

TEST(ContentLengthFramerTest, TryDecodeExOkAtBoundary) {
    auto framer = mcphost::MakeContentLengthFramer(4);
    const std::string payload = "abcd";
    std::string buffer = std::string("Content-Length: 4\r\n\r\n") + payload;
    auto ex = framer->tryDecodeEx(buffer);
    EXPECT_EQ(ex.status, IContentFramer::DecodeStatus::Ok);
    ASSERT_TRUE(ex.payload.has_value());
    EXPECT_EQ(ex.payload.value(), payload);
    EXPECT_EQ(ex.bytesConsumed, buffer.size());
}

TEST(ContentLengthFramerTest, TryDecodeExBodyTooLargeAboveBoundary) {
    auto framer = mcphost::MakeContentLengthFramer(4);
    std::string buffer = "Content-Length: 5\r\n\r\nabcde";
    auto ex = framer->tryDecodeEx(buffer);
    EXPECT_EQ(ex.status, IContentFramer::DecodeStatus::BodyTooLarge);
    EXPECT_FALSE(ex.payload.has_value());
    EXPECT_GT(ex.bytesConsumed, 0u);
}

TEST(ContentLengthFramerTest, TryDecodeExInvalidHeader) {
    auto framer = mcphost::MakeContentLengthFramer(1024);
    std::string buffer = "Content-Length: abc\r\n\r\n{}";
    auto ex = framer->tryDecodeEx(buffer);
    EXPECT_EQ(ex.status, IContentFramer::DecodeStatus::InvalidHeader);
    EXPECT_FALSE(ex.payload.has_value());
    EXPECT_GT(ex.bytesConsumed, 0u);
}

TEST(ContentLengthFramerTest, TryDecodeExIncompleteHeader) {
    auto framer = mcphost::MakeContentLengthFramer(1024);
    std::string buffer = "Content-Length: 10\r\n";
    auto ex = framer->tryDecodeEx(buffer);
    EXPECT_EQ(ex.status, IContentFramer::DecodeStatus::Incomplete);
    EXPECT_EQ(ex.bytesConsumed, 0u);
}

TEST(ContentLengthFramerTest, TryDecodeExIncompleteBody) {
    auto framer = mcphost::MakeContentLengthFramer(1024);
    std::string buffer = "Content-Length: 10\r\n\r\n{\"a\"";
    auto ex = framer->tryDecodeEx(buffer);
    EXPECT_EQ(ex.status, IContentFramer::DecodeStatus::Incomplete);
    EXPECT_EQ(ex.bytesConsumed, 0u);
}

TEST(ContentLengthFramerTest, DecodeMultipleFramesSequentially) {
    auto framer = mcphost::MakeContentLengthFramer(1024);
    std::string buffer = framer->encode("{\"a\":1}") + framer->encode("{\"b\":2}");
    auto first = framer->tryDecodeEx(buffer);
    ASSERT_EQ(first.status, IContentFramer::DecodeStatus::Ok);
    EXPECT_EQ(*first.payload, "{\"a\":1}");
    buffer.erase(0, first.bytesConsumed);
    auto second = framer->tryDecodeEx(buffer);
    ASSERT_EQ(second.status, IContentFramer::DecodeStatus::Ok);
    EXPECT_EQ(*second.payload, "{\"b\":2}");
    EXPECT_EQ(second.bytesConsumed, buffer.size());
}

TEST(ContentLengthFramerTest, TryDecodeExZeroLengthOk) {
    auto framer = mcphost::MakeContentLengthFramer(1024);
    std::string buffer = "Content-Length: 0\r\n\r\n";
    auto ex = framer->tryDecodeEx(buffer);
    EXPECT_EQ(ex.status, IContentFramer::DecodeStatus::Ok);
    ASSERT_TRUE(ex.payload.has_value());
    EXPECT_TRUE(ex.payload->empty());
}

TEST(ContentLengthFramerTest, TryDecodeExGarbageThenHeaderInvalidHeader) {
    auto framer = mcphost::MakeContentLengthFramer(1024);
    std::string buffer = "XContent-Length: 2\r\n\r\n{}";
    auto ex = framer->tryDecodeEx(buffer);
    EXPECT_EQ(ex.status, IContentFramer::DecodeStatus::InvalidHeader);
    EXPECT_FALSE(ex.payload.has_value());
    EXPECT_GT(ex.bytesConsumed, 0u);
}

TEST(FramerFactoryTest, ModeSelectsFraming) {
    auto nl = mcphost::MakeFramer(mcphost::FramingMode::NewlineDelimited, 64);
    auto cl = mcphost::MakeFramer(mcphost::FramingMode::ContentLength, 64);
    EXPECT_EQ(nl->encode("{}"), "{}\n");
    EXPECT_EQ(cl->encode("{}"), "Content-Length: 2\r\n\r\n{}");
}
