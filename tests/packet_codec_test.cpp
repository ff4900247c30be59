#include "core/errors.hpp"
#include "protocol/packet_codec.hpp"
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

using protocol::EmotionOverride;
using protocol::JanusPacket;
using protocol::Mode;
using protocol::PacketCodec;

namespace {

JanusPacket semantic_packet(const std::string& text) {
    JanusPacket packet;
    packet.mode = Mode::Semantic;
    packet.text = text;
    packet.avg_pitch_hz = 182.5f;
    packet.avg_energy = 0.0734f;
    return packet;
}

}

TEST(PacketCodecTest, SemanticPacketRoundTrips) {
    JanusPacket packet = semantic_packet("Meet me at the north gate.");
    packet.start_ms = 1200;
    packet.end_ms = 3400;

    EXPECT_EQ(PacketCodec::decode(PacketCodec::encode(packet)), packet);
}

TEST(PacketCodecTest, OverrideAndEachModeRoundTrip) {
    JanusPacket urgent = semantic_packet("Run!");
    urgent.emotion_override = EmotionOverride::Panicked;
    EXPECT_EQ(PacketCodec::decode(PacketCodec::encode(urgent)), urgent);

    JanusPacket text_only;
    text_only.mode = Mode::TextOnly;
    text_only.text = "no prosody here";
    EXPECT_EQ(PacketCodec::decode(PacketCodec::encode(text_only)), text_only);

    JanusPacket morse;
    morse.mode = Mode::Morse;
    morse.text = "SOS";
    EXPECT_EQ(PacketCodec::decode(PacketCodec::encode(morse)), morse);
}

TEST(PacketCodecTest, NonAsciiTextSurvives) {
    JanusPacket packet;
    packet.mode = Mode::TextOnly;
    packet.text = "Grüße, ça va? 你好";
    EXPECT_EQ(PacketCodec::decode(PacketCodec::encode(packet)).text, packet.text);
}

TEST(PacketCodecTest, ShortSemanticPacketFitsInSixtyFourBytes) {
    // 40 bytes of text, both prosody fields, no timing.
    const std::string text = "The convoy leaves at dawn, stay ready...";
    ASSERT_EQ(text.size(), 40u);

    const auto bytes = PacketCodec::encode(semantic_packet(text));
    EXPECT_LE(bytes.size(), 64u);
}

TEST(PacketCodecTest, AbsentFieldsAreLeftOut) {
    JanusPacket packet;
    packet.mode = Mode::TextOnly;
    packet.text = "hi";

    const auto map = nlohmann::json::from_msgpack(PacketCodec::encode(packet));
    EXPECT_EQ(map.size(), 2u);
    EXPECT_EQ(map.at("m"), 1);
    EXPECT_EQ(map.at("t"), "hi");
    EXPECT_FALSE(map.contains("f"));
    EXPECT_FALSE(map.contains("o"));
}

TEST(PacketCodecTest, ProsodyIsWrittenAsFloat32) {
    JanusPacket packet = semantic_packet("x");
    const auto bytes = PacketCodec::encode(packet);

    // 0xca is the MessagePack float32 marker; float64 would be 0xcb.
    size_t float32_markers = 0;
    for (uint8_t byte : bytes) {
        if (byte == 0xca) float32_markers++;
        EXPECT_NE(byte, 0xcb);
    }
    EXPECT_EQ(float32_markers, 2u);
}

TEST(PacketCodecTest, EmptyAndGarbageInputThrowDecodeError) {
    EXPECT_THROW(PacketCodec::decode(std::vector<uint8_t>{}), core::DecodeError);
    EXPECT_THROW(PacketCodec::decode(std::vector<uint8_t>{0xc1}), core::DecodeError);
    EXPECT_THROW(PacketCodec::decode(nullptr, 4), core::DecodeError);
}

TEST(PacketCodecTest, TruncatedPacketThrowsDecodeError) {
    auto bytes = PacketCodec::encode(semantic_packet("cut short"));
    bytes.resize(bytes.size() - 3);
    EXPECT_THROW(PacketCodec::decode(bytes), core::DecodeError);
}

TEST(PacketCodecTest, RejectsNonMapRootAndBadMode) {
    EXPECT_THROW(PacketCodec::decode(nlohmann::json::to_msgpack(nlohmann::json::array({0, "x"}))),
                 core::DecodeError);
    EXPECT_THROW(PacketCodec::decode(nlohmann::json::to_msgpack({{"t", "no mode"}})),
                 core::DecodeError);
    EXPECT_THROW(PacketCodec::decode(nlohmann::json::to_msgpack({{"m", 7}})), core::DecodeError);
    EXPECT_THROW(PacketCodec::decode(nlohmann::json::to_msgpack({{"m", "semantic"}})),
                 core::DecodeError);
}

TEST(PacketCodecTest, RejectsWrongTypedKnownFields) {
    EXPECT_THROW(PacketCodec::decode(nlohmann::json::to_msgpack({{"m", 0}, {"t", 12}})),
                 core::DecodeError);
    EXPECT_THROW(PacketCodec::decode(nlohmann::json::to_msgpack({{"m", 0}, {"f", "high"}})),
                 core::DecodeError);
    EXPECT_THROW(PacketCodec::decode(nlohmann::json::to_msgpack({{"m", 0}, {"o", 1}})),
                 core::DecodeError);
}

TEST(PacketCodecTest, RejectsNumbersThatDoNotFit) {
    using nlohmann::json;
    EXPECT_THROW(PacketCodec::decode(json::to_msgpack({{"m", 0}, {"t", "x"}, {"s", 1e300}})),
                 core::DecodeError);
    EXPECT_THROW(PacketCodec::decode(json::to_msgpack({{"m", 0}, {"e", -1e19}})), core::DecodeError);
    EXPECT_THROW(PacketCodec::decode(json::to_msgpack({{"m", 0}, {"e", 18446744073709551615ULL}})),
                 core::DecodeError);
    EXPECT_THROW(PacketCodec::decode(json::to_msgpack({{"m", 0}, {"f", 1e300}})), core::DecodeError);
    EXPECT_THROW(PacketCodec::decode(json::to_msgpack({{"m", 0}, {"r", -1e39}})), core::DecodeError);

    const JanusPacket packet = PacketCodec::decode(json::to_msgpack({{"m", 0}, {"s", 1500.0}, {"f", 99.5}}));
    EXPECT_EQ(packet.start_ms, 1500);
    EXPECT_FLOAT_EQ(*packet.avg_pitch_hz, 99.5f);
}

TEST(PacketCodecTest, RejectsTextThatIsNotUtf8) {
    // {"m": 1, "t": "hi\xff!"} written byte by byte.
    const std::vector<uint8_t> frame{0x82, 0xa1, 'm', 0x01, 0xa1, 't', 0xa4, 'h', 'i', 0xff, '!'};
    EXPECT_THROW(PacketCodec::decode(frame), core::DecodeError);

    const std::vector<uint8_t> truncated{0x82, 0xa1, 'm', 0x01, 0xa1, 't', 0xa3, 'o', 'k', 0xc3};
    EXPECT_THROW(PacketCodec::decode(truncated), core::DecodeError);
}

TEST(PacketCodecTest, IgnoresUnknownKeysAndUnknownEmotions) {
    const auto bytes = nlohmann::json::to_msgpack({
        {"m", 0}, {"t", "hello"}, {"x", "future field"}, {"o", "Ecstatic"}, {"f", 210}
    });

    const JanusPacket packet = PacketCodec::decode(bytes);
    EXPECT_EQ(packet.mode, Mode::Semantic);
    EXPECT_EQ(packet.text, "hello");
    EXPECT_EQ(packet.emotion_override, EmotionOverride::Auto);
    ASSERT_TRUE(packet.avg_pitch_hz.has_value());
    EXPECT_FLOAT_EQ(*packet.avg_pitch_hz, 210.0f);
}

TEST(PacketSummaryTest, CarriesModeAndSize) {
    JanusPacket packet;
    packet.mode = Mode::Morse;
    const auto summary = protocol::summarize(packet, 9, 1700000000000);
    EXPECT_EQ(summary.byte_size, 9u);
    EXPECT_EQ(summary.mode, Mode::Morse);
    EXPECT_EQ(summary.created_at_ms, 1700000000000);
}

TEST(ModeNameTest, NamesMapBothWays) {
    for (Mode mode : {Mode::Semantic, Mode::TextOnly, Mode::Morse}) {
        EXPECT_EQ(protocol::mode_from_name(protocol::mode_name(mode)), mode);
    }
    EXPECT_FALSE(protocol::mode_from_name("telepathy").has_value());
}
