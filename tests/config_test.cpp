#include "app/config.hpp"
#include <cstdio>
#include <fstream>
#include <gtest/gtest.h>
#include <stdexcept>

using nlohmann::json;

namespace {

class TempFile {
public:
    explicit TempFile(const std::string& contents)
        : path_(testing::TempDir() + "janus_config_" +
                testing::UnitTest::GetInstance()->current_test_info()->name() + ".json") {
        std::ofstream out(path_);
        out << contents;
    }
    ~TempFile() { std::remove(path_.c_str()); }

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

}

TEST(ConfigTest, DefaultsDescribeAThreeHundredBaudUdpLink) {
    const auto config = app::default_config();
    EXPECT_EQ(config.transport, network::TransportKind::Udp);
    EXPECT_EQ(config.bitrate_bps, 300u);
    EXPECT_EQ(config.trigger.silence_chunks, 16);
    EXPECT_EQ(config.trigger.max_utterance_ms, 30000);
    EXPECT_FLOAT_EQ(config.vad.energy_threshold, 0.01f);
    EXPECT_EQ(config.whisper.threads, 4);
    EXPECT_FALSE(config.tts_command.empty());
    EXPECT_EQ(config.playback_queue_chunks, 32u);
    EXPECT_EQ(config.sender_backlog_chunks, 1024u);
    EXPECT_EQ(config.initial_mode, protocol::Mode::Semantic);
    EXPECT_EQ(config.initial_emotion, protocol::EmotionOverride::Auto);
}

TEST(ConfigTest, PartialOverrideKeepsOtherDefaults) {
    const auto config = app::parse_config(json{
        {"link", {{"transport", "tcp"}}},
        {"control", {{"mode", "morse"}, {"emotion_override", "panicked"}}},
        {"whisper", {{"model_path", "/opt/models/tiny.bin"}}}
    });
    EXPECT_EQ(config.transport, network::TransportKind::Tcp);
    EXPECT_EQ(config.bitrate_bps, 300u);
    EXPECT_EQ(config.initial_mode, protocol::Mode::Morse);
    EXPECT_EQ(config.initial_emotion, protocol::EmotionOverride::Panicked);
    EXPECT_EQ(config.whisper.model_path, "/opt/models/tiny.bin");
    EXPECT_EQ(config.whisper.language, "en");
}

TEST(ConfigTest, NullFallsBackToTheDefault) {
    const auto config = app::parse_config(json{{"link", {{"bitrate_bps", nullptr}}}});
    EXPECT_EQ(config.bitrate_bps, 300u);
}

TEST(ConfigTest, UnknownKeysAreIgnored) {
    const auto config = app::parse_config(json{{"theme", "dark"}, {"link", {{"bitrate_bps", 1200}}}});
    EXPECT_EQ(config.bitrate_bps, 1200u);
}

TEST(ConfigTest, WrongTypesAreRejected) {
    EXPECT_THROW(app::parse_config(json{{"link", {{"bitrate_bps", "fast"}}}}), std::invalid_argument);
    EXPECT_THROW(app::parse_config(json{{"link", "udp"}}), std::invalid_argument);
    EXPECT_THROW(app::parse_config(json::array()), std::invalid_argument);
    EXPECT_THROW(app::parse_config(json{{"link", {{"bitrate_bps", 2.5}}}}), std::invalid_argument);
}

TEST(ConfigTest, OutOfRangeValuesAreRejected) {
    EXPECT_THROW(app::parse_config(json{{"link", {{"bitrate_bps", 0}}}}), std::invalid_argument);
    EXPECT_THROW(app::parse_config(json{{"vad", {{"energy_threshold", -0.5}}}}), std::invalid_argument);
    EXPECT_THROW(app::parse_config(json{{"link", {{"transport", "carrier-pigeon"}}}}), std::invalid_argument);
    EXPECT_THROW(app::parse_config(json{{"control", {{"mode", "loud"}}}}), std::invalid_argument);
    EXPECT_THROW(app::parse_config(json{{"tts", {{"command", ""}}}}), std::invalid_argument);
}

TEST(ConfigTest, ErrorNamesTheOffendingKey) {
    try {
        app::parse_config(json{{"queues", {{"events", "many"}}}});
        FAIL() << "expected invalid_argument";
    } catch (const std::invalid_argument& e) {
        EXPECT_NE(std::string(e.what()).find("queues.events"), std::string::npos);
    }
}

TEST(ConfigTest, LoadsFromFile) {
    TempFile file(R"({"link": {"bitrate_bps": 2400}, "trigger": {"silence_chunks": 8}})");
    const auto config = app::load_config(file.path());
    EXPECT_EQ(config.bitrate_bps, 2400u);
    EXPECT_EQ(config.trigger.silence_chunks, 8);
    EXPECT_EQ(config.trigger.max_utterance_ms, 30000);
}

TEST(ConfigTest, MissingFileIsARuntimeError) {
    EXPECT_THROW(app::load_config(testing::TempDir() + "janus_no_such_config.json"), std::runtime_error);
}

TEST(ConfigTest, MalformedFileIsAnInvalidArgument) {
    TempFile file("{\"link\": {\"bitrate_bps\": 300,");
    EXPECT_THROW(app::load_config(file.path()), std::invalid_argument);
}
