/**
 * @file wire_codec_test.cpp
 * @brief Unit tests for the length-prefixed JSON framing
 */

#include "p2lan/WireCodec.h"
#include "p2lan/config.h"
#include <gtest/gtest.h>

#include <string>
#include <vector>

using namespace P2Lan;

namespace {

std::vector<uint8_t> rawFrame(const std::string& payload) {
    const auto len = static_cast<uint32_t>(payload.size());
    std::vector<uint8_t> frame = {
        static_cast<uint8_t>(len >> 24), static_cast<uint8_t>(len >> 16),
        static_cast<uint8_t>(len >> 8), static_cast<uint8_t>(len)
    };
    frame.insert(frame.end(), payload.begin(), payload.end());
    return frame;
}

WireMessage sampleMessage() {
    return WireMessage::make(MessageType::PairingRequest, "alice", "bob",
                             {{"requestId", "pair_1"}, {"displayName", "Alice"}, {"trustUser", true}});
}

}  // namespace

TEST(WireCodecTest, HeaderIsBigEndianPayloadLength) {
    std::vector<uint8_t> frame;
    std::string err;
    ASSERT_TRUE(encodeFrame(sampleMessage(), frame, err)) << err;

    ASSERT_GT(frame.size(), FRAME_HEADER_SIZE);
    const uint32_t declared = (static_cast<uint32_t>(frame[0]) << 24) |
                              (static_cast<uint32_t>(frame[1]) << 16) |
                              (static_cast<uint32_t>(frame[2]) << 8) |
                              static_cast<uint32_t>(frame[3]);
    EXPECT_EQ(declared, frame.size() - FRAME_HEADER_SIZE);

    const std::string payload(frame.begin() + FRAME_HEADER_SIZE, frame.end());
    const auto j = nlohmann::json::parse(payload);
    EXPECT_EQ(j["type"], "pairing_request");
    EXPECT_EQ(j["fromUserId"], "alice");
    EXPECT_EQ(j["toUserId"], "bob");
    EXPECT_EQ(j["data"]["requestId"], "pair_1");
}

TEST(WireCodecTest, DecoderReassemblesByteByByte) {
    std::vector<uint8_t> frame;
    std::string err;
    ASSERT_TRUE(encodeFrame(sampleMessage(), frame, err)) << err;

    FrameDecoder decoder;
    for (size_t i = 0; i + 1 < frame.size(); ++i) {
        decoder.feed(&frame[i], 1);
        EXPECT_EQ(decoder.next().status, DecodeStatus::IncompleteFrame);
    }
    decoder.feed(&frame.back(), 1);

    auto result = decoder.next();
    ASSERT_EQ(result.status, DecodeStatus::Ok) << result.error;
    EXPECT_EQ(result.message, sampleMessage());
    EXPECT_EQ(decoder.bufferedBytes(), 0u);
}

TEST(WireCodecTest, SeveralFramesInOneRead) {
    std::vector<uint8_t> stream;
    for (int i = 0; i < 3; ++i) {
        std::vector<uint8_t> frame;
        std::string err;
        auto msg = WireMessage::make(MessageType::DataChunkAck, "a", "b",
                                     {{"taskId", "t"}, {"receivedBytes", i}});
        ASSERT_TRUE(encodeFrame(msg, frame, err)) << err;
        stream.insert(stream.end(), frame.begin(), frame.end());
    }

    FrameDecoder decoder;
    decoder.feed(stream.data(), stream.size());
    for (int i = 0; i < 3; ++i) {
        auto result = decoder.next();
        ASSERT_EQ(result.status, DecodeStatus::Ok);
        EXPECT_EQ(result.message.type, MessageType::DataChunkAck);
        EXPECT_EQ(result.message.data["receivedBytes"], i);
    }
    EXPECT_EQ(decoder.next().status, DecodeStatus::IncompleteFrame);
}

TEST(WireCodecTest, MalformedFrameIsConsumedAndStreamContinues) {
    std::vector<uint8_t> stream = rawFrame("{not json");
    auto good = rawFrame(R"({"type":"heartbeat","fromUserId":"a","toUserId":"b","data":{}})");
    stream.insert(stream.end(), good.begin(), good.end());

    FrameDecoder decoder;
    decoder.feed(stream.data(), stream.size());

    auto bad = decoder.next();
    EXPECT_EQ(bad.status, DecodeStatus::MalformedFrame);
    EXPECT_FALSE(bad.error.empty());

    auto next = decoder.next();
    ASSERT_EQ(next.status, DecodeStatus::Ok);
    EXPECT_EQ(next.message.type, MessageType::Heartbeat);
}

TEST(WireCodecTest, EnvelopeFieldsAreRequired) {
    EXPECT_EQ(decodePayload(R"([1,2,3])").status, DecodeStatus::MalformedFrame);
    EXPECT_EQ(decodePayload(R"({"fromUserId":"a","data":{}})").status, DecodeStatus::MalformedFrame);
    EXPECT_EQ(decodePayload(R"({"type":"heartbeat","data":{}})").status, DecodeStatus::MalformedFrame);
    EXPECT_EQ(decodePayload(R"({"type":"heartbeat","fromUserId":"a","data":"x"})").status,
              DecodeStatus::MalformedFrame);

    // toUserId may be omitted
    auto ok = decodePayload(R"({"type":"heartbeat","fromUserId":"a","data":{}})");
    ASSERT_EQ(ok.status, DecodeStatus::Ok);
    EXPECT_TRUE(ok.message.toUserId.empty());
}

TEST(WireCodecTest, UnknownTypeKeepsRawTag) {
    auto result = decodePayload(R"({"type":"future_feature","fromUserId":"a","toUserId":"b","data":{"x":1}})");
    ASSERT_EQ(result.status, DecodeStatus::Ok);
    EXPECT_EQ(result.message.type, MessageType::Unknown);
    EXPECT_EQ(result.message.rawType, "future_feature");

    // Re-encoding forwards the original tag
    EXPECT_EQ(result.message.toJson()["type"], "future_feature");
}

TEST(WireCodecTest, OversizedLengthCorruptsStreamUntilReset) {
    const uint8_t header[4] = {0xFF, 0xFF, 0xFF, 0xFF};
    FrameDecoder decoder;
    decoder.feed(header, sizeof(header));
    EXPECT_EQ(decoder.next().status, DecodeStatus::CorruptStream);

    auto good = rawFrame(R"({"type":"heartbeat","fromUserId":"a","data":{}})");
    decoder.feed(good.data(), good.size());
    EXPECT_EQ(decoder.next().status, DecodeStatus::CorruptStream);

    decoder.reset();
    decoder.feed(good.data(), good.size());
    EXPECT_EQ(decoder.next().status, DecodeStatus::Ok);
}

TEST(WireCodecTest, EncodeRejectsPayloadAboveFrameLimit) {
    auto msg = WireMessage::make(MessageType::DataChunk, "a", "b",
                                 {{"data", std::string(MAX_FRAME_SIZE + 1, 'A')}});
    std::vector<uint8_t> frame;
    std::string err;
    EXPECT_FALSE(encodeFrame(msg, frame, err));
    EXPECT_FALSE(err.empty());
}

TEST(WireCodecTest, EveryKnownTagMapsBothWays) {
    for (int i = 0; i < static_cast<int>(MessageType::Unknown); ++i) {
        const auto type = static_cast<MessageType>(i);
        const std::string tag = messageTypeToString(type);
        EXPECT_NE(tag, "unknown");
        EXPECT_EQ(messageTypeFromString(tag), type) << tag;
    }
    EXPECT_EQ(messageTypeFromString("PAIRING_REQUEST"), MessageType::Unknown);
}
