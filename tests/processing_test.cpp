#include "fakes.hpp"
#include "processing/energy_vad.hpp"
#include "processing/prosody_analyzer.hpp"
#include <gtest/gtest.h>
#include <random>

using processing::EnergyVad;
using processing::ProsodyAnalyzer;
using testing_fakes::silent_chunk;
using testing_fakes::sine_chunk;

TEST(EnergyVadTest, VoicedToneIsSpeechSilenceIsNot) {
    EnergyVad vad(processing::EnergyVadConfig{0.01f, 0.3f, 0});
    EXPECT_TRUE(vad.is_speech(sine_chunk(200.0f, 0.3f)));
    EXPECT_FALSE(vad.is_speech(silent_chunk()));
    EXPECT_FALSE(vad.is_speech(sine_chunk(200.0f, 0.001f)));
}

TEST(EnergyVadTest, HissIsNotSpeech) {
    std::mt19937 rng(7);
    std::uniform_real_distribution<float> noise(-0.3f, 0.3f);
    audio::Samples hiss(audio::FRAMES_PER_CHUNK);
    for (auto& sample : hiss) {
        sample = noise(rng);
    }
    EnergyVad vad(processing::EnergyVadConfig{0.01f, 0.3f, 0});
    EXPECT_GT(EnergyVad::zero_crossing_rate(hiss), 0.3f);
    EXPECT_FALSE(vad.is_speech(hiss));
}

TEST(EnergyVadTest, HangoverBridgesShortPauses) {
    EnergyVad vad(processing::EnergyVadConfig{0.01f, 0.3f, 2});
    EXPECT_TRUE(vad.is_speech(sine_chunk(200.0f, 0.3f)));
    EXPECT_TRUE(vad.is_speech(silent_chunk()));
    EXPECT_TRUE(vad.is_speech(silent_chunk()));
    EXPECT_FALSE(vad.is_speech(silent_chunk()));

    EXPECT_TRUE(vad.is_speech(sine_chunk(200.0f, 0.3f)));
    vad.reset();
    EXPECT_FALSE(vad.is_speech(silent_chunk()));
}

TEST(EnergyVadTest, RmsOfAFullScaleSine) {
    EXPECT_NEAR(EnergyVad::rms(sine_chunk(250.0f, 1.0f, 1600)), 0.7071f, 0.01f);
    EXPECT_EQ(EnergyVad::rms({}), 0.0f);
}

TEST(ProsodyAnalyzerTest, FindsThePitchOfAVoicedTone) {
    ProsodyAnalyzer analyzer;
    for (float f0 : {100.0f, 150.0f, 220.0f, 320.0f}) {
        const auto prosody = analyzer.extract(sine_chunk(f0, 0.2f, 16000));
        ASSERT_TRUE(prosody.has_value()) << f0;
        EXPECT_NEAR(prosody->avg_pitch_hz, f0, f0 * 0.03f) << f0;
        EXPECT_NEAR(prosody->avg_energy, 0.2f * 0.7071f, 0.01f);
    }
}

TEST(ProsodyAnalyzerTest, NothingToReportForSilenceOrEmptyInput) {
    ProsodyAnalyzer analyzer;
    EXPECT_FALSE(analyzer.extract({}).has_value());
    EXPECT_FALSE(analyzer.extract(silent_chunk(16000)).has_value());
    // Shorter than one analysis frame.
    EXPECT_FALSE(analyzer.extract(sine_chunk(150.0f, 0.2f, 512)).has_value());
}

TEST(ProsodyAnalyzerTest, RejectsBadConfiguration) {
    processing::ProsodyConfig config;
    config.min_pitch_hz = 500.0f;
    EXPECT_THROW(ProsodyAnalyzer{config}, std::invalid_argument);
}
