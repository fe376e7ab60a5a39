#include "transport/WebSocketFrameCodec.h"
#include <gtest/gtest.h>
#include <string>

using namespace TEB;

TEST(WebSocketFrameCodecTest, AcceptKeyMatchesRfcSample) {
    EXPECT_EQ(WebSocketFrameCodec::computeAcceptKey("dGhlIHNhbXBsZSBub25jZQ=="), "s3pPLMBiTxaQ9kYGzzhZRbK+xOo=");
}

TEST(WebSocketFrameCodecTest, DecodesMaskedClientFrame) {
    WebSocketFrameCodec codec;
    const std::string wire = WebSocketFrameCodec::encode(WebSocketOpcode::Text, "{\"method\":\"onEnd\"}", 0x37FA213Du);

    auto frames = codec.feed(wire.data(), wire.size());

    ASSERT_EQ(frames.size(), 1u);
    EXPECT_EQ(frames[0].opcode, WebSocketOpcode::Text);
    EXPECT_EQ(frames[0].payload, "{\"method\":\"onEnd\"}");
    EXPECT_FALSE(codec.hasError());
}

TEST(WebSocketFrameCodecTest, ServerFramesAreUnmasked) {
    const std::string wire = WebSocketFrameCodec::encode(WebSocketOpcode::Text, "hi");
    ASSERT_EQ(wire.size(), 4u);
    EXPECT_EQ(static_cast<uint8_t>(wire[0]), 0x81);
    EXPECT_EQ(static_cast<uint8_t>(wire[1]), 0x02);
    EXPECT_EQ(wire.substr(2), "hi");
}

TEST(WebSocketFrameCodecTest, RejectsUnmaskedClientFrame) {
    WebSocketFrameCodec codec;
    const std::string wire = WebSocketFrameCodec::encode(WebSocketOpcode::Text, "{}");

    EXPECT_TRUE(codec.feed(wire.data(), wire.size()).empty());
    EXPECT_TRUE(codec.hasError());
}

TEST(WebSocketFrameCodecTest, ExtendedLengthsRoundTrip) {
    WebSocketFrameCodec codec(false);
    const std::string medium(300, 'm');
    const std::string large(70000, 'l');
    const std::string wire =
        WebSocketFrameCodec::encode(WebSocketOpcode::Text, medium) + WebSocketFrameCodec::encode(WebSocketOpcode::Text, large);

    auto frames = codec.feed(wire.data(), wire.size());

    ASSERT_EQ(frames.size(), 2u);
    EXPECT_EQ(frames[0].payload, medium);
    EXPECT_EQ(frames[1].payload, large);
}

TEST(WebSocketFrameCodecTest, FrameArrivingByteByByte) {
    WebSocketFrameCodec codec;
    const std::string wire = WebSocketFrameCodec::encode(WebSocketOpcode::Text, "{\"a\":1}", 0x01020304u);

    std::vector<WebSocketFrame> frames;
    for (char byte : wire) {
        auto decoded = codec.feed(&byte, 1);
        frames.insert(frames.end(), decoded.begin(), decoded.end());
    }

    ASSERT_EQ(frames.size(), 1u);
    EXPECT_EQ(frames[0].payload, "{\"a\":1}");
}

TEST(WebSocketFrameCodecTest, ReassemblesFragmentsAroundControlFrame) {
    WebSocketFrameCodec codec(false);
    // First fragment: Text without FIN
    std::string wire = WebSocketFrameCodec::encode(WebSocketOpcode::Text, "{\"a\":");
    wire[0] = static_cast<char>(0x01);
    wire += WebSocketFrameCodec::encode(WebSocketOpcode::Ping, "p");
    wire += WebSocketFrameCodec::encode(WebSocketOpcode::Continuation, "1}");

    auto frames = codec.feed(wire.data(), wire.size());

    ASSERT_EQ(frames.size(), 2u);
    EXPECT_EQ(frames[0].opcode, WebSocketOpcode::Ping);
    EXPECT_EQ(frames[1].opcode, WebSocketOpcode::Text);
    EXPECT_EQ(frames[1].payload, "{\"a\":1}");
}

TEST(WebSocketFrameCodecTest, ContinuationWithoutStartIsError) {
    WebSocketFrameCodec codec(false);
    const std::string wire = WebSocketFrameCodec::encode(WebSocketOpcode::Continuation, "x");

    codec.feed(wire.data(), wire.size());

    EXPECT_TRUE(codec.hasError());
}

TEST(WebSocketFrameCodecTest, ReservedBitsAreError) {
    WebSocketFrameCodec codec(false);
    std::string wire = WebSocketFrameCodec::encode(WebSocketOpcode::Text, "x");
    wire[0] = static_cast<char>(static_cast<uint8_t>(wire[0]) | 0x40);

    codec.feed(wire.data(), wire.size());

    EXPECT_TRUE(codec.hasError());
}
