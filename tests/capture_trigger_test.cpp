#include "engine/capture_trigger.hpp"
#include "fakes.hpp"
#include <gtest/gtest.h>

using control::ControlSnapshot;
using engine::CaptureTrigger;
using engine::TriggerState;
using engine::Utterance;
using testing_fakes::silent_chunk;
using testing_fakes::sine_chunk;
using testing_fakes::ThresholdVad;

namespace {

constexpr int CHUNK_MS = audio::FRAMES_PER_CHUNK * 1000 / audio::SAMPLE_RATE;   // 32

ControlSnapshot streaming() {
    ControlSnapshot snapshot;
    snapshot.is_streaming = true;
    return snapshot;
}

ControlSnapshot recording() {
    ControlSnapshot snapshot;
    snapshot.is_recording = true;
    return snapshot;
}

std::vector<Utterance> feed(CaptureTrigger& trigger, const ControlSnapshot& control,
                            const audio::Samples& chunk, int count) {
    std::vector<Utterance> out;
    for (int i = 0; i < count; ++i) {
        if (auto utterance = trigger.on_chunk(control, chunk)) {
            out.push_back(std::move(*utterance));
        }
    }
    return out;
}

}

TEST(CaptureTriggerTest, IdleIgnoresAudio) {
    ThresholdVad vad;
    CaptureTrigger trigger(vad);
    EXPECT_TRUE(feed(trigger, ControlSnapshot{}, sine_chunk(200.0f, 0.3f), 50).empty());
    EXPECT_EQ(trigger.state(), TriggerState::Idle);
    EXPECT_EQ(trigger.buffered_samples(), 0u);
}

TEST(CaptureTriggerTest, SpeechThenSilenceYieldsExactlyOneUtterance) {
    ThresholdVad vad;
    CaptureTrigger trigger(vad);

    const int speech_chunks = 2000 / CHUNK_MS + 1;   // ~2 s
    const int silence_chunks = 1000 / CHUNK_MS + 1;  // ~1 s

    std::vector<Utterance> utterances;
    auto speech = feed(trigger, streaming(), sine_chunk(200.0f, 0.3f), speech_chunks);
    EXPECT_TRUE(speech.empty());
    EXPECT_EQ(trigger.state(), TriggerState::Capturing);

    auto silence = feed(trigger, streaming(), silent_chunk(), silence_chunks);
    ASSERT_EQ(silence.size(), 1u);
    EXPECT_EQ(trigger.state(), TriggerState::StreamingArmed);

    // The utterance closes after exactly the configured run of silent chunks.
    const Utterance& utterance = silence.front();
    EXPECT_EQ(utterance.samples.size(),
              static_cast<size_t>((speech_chunks + 16) * audio::FRAMES_PER_CHUNK));
    EXPECT_EQ(utterance.start_ms, 0);
    EXPECT_EQ(utterance.end_ms, (speech_chunks + 16) * CHUNK_MS);
}

TEST(CaptureTriggerTest, ArmedStreamWaitsForSpeech) {
    ThresholdVad vad;
    CaptureTrigger trigger(vad);
    EXPECT_TRUE(feed(trigger, streaming(), silent_chunk(), 100).empty());
    EXPECT_EQ(trigger.state(), TriggerState::StreamingArmed);
    EXPECT_EQ(trigger.buffered_samples(), 0u);

    feed(trigger, streaming(), sine_chunk(200.0f, 0.3f), 1);
    EXPECT_EQ(trigger.state(), TriggerState::Capturing);
}

TEST(CaptureTriggerTest, ShortPauseDoesNotSplitAnUtterance) {
    ThresholdVad vad;
    CaptureTrigger trigger(vad);
    feed(trigger, streaming(), sine_chunk(200.0f, 0.3f), 10);
    EXPECT_TRUE(feed(trigger, streaming(), silent_chunk(), 15).empty());
    feed(trigger, streaming(), sine_chunk(200.0f, 0.3f), 10);
    EXPECT_EQ(feed(trigger, streaming(), silent_chunk(), 16).size(), 1u);
}

TEST(CaptureTriggerTest, HoldBuffersEverythingUntilReleased) {
    ThresholdVad vad;
    CaptureTrigger trigger(vad);

    const int held_chunks = 3000 / CHUNK_MS;   // ~3 s, half of it silence
    std::vector<Utterance> utterances;
    for (int i = 0; i < held_chunks; ++i) {
        const auto chunk = (i % 2) ? silent_chunk() : sine_chunk(200.0f, 0.3f);
        ASSERT_FALSE(trigger.on_chunk(recording(), chunk).has_value());
    }
    EXPECT_EQ(trigger.state(), TriggerState::Recording);

    auto utterance = trigger.on_chunk(ControlSnapshot{}, silent_chunk());
    ASSERT_TRUE(utterance.has_value());
    EXPECT_EQ(utterance->samples.size(), static_cast<size_t>(held_chunks * audio::FRAMES_PER_CHUNK));
    EXPECT_EQ(utterance->start_ms, 0);
    EXPECT_EQ(utterance->end_ms, held_chunks * CHUNK_MS);
    EXPECT_EQ(trigger.state(), TriggerState::Idle);
}

TEST(CaptureTriggerTest, HoldWinsOverStreaming) {
    ThresholdVad vad;
    CaptureTrigger trigger(vad);

    ControlSnapshot both;
    both.is_recording = true;
    both.is_streaming = true;

    // Silence would end a streamed utterance; under a hold it is kept.
    EXPECT_TRUE(feed(trigger, both, silent_chunk(), 40).empty());
    EXPECT_EQ(trigger.state(), TriggerState::Recording);
    EXPECT_EQ(trigger.buffered_samples(), static_cast<size_t>(40 * audio::FRAMES_PER_CHUNK));

    auto utterance = trigger.on_chunk(streaming(), silent_chunk());
    ASSERT_TRUE(utterance.has_value());
    EXPECT_EQ(trigger.state(), TriggerState::StreamingArmed);
}

TEST(CaptureTriggerTest, StreamingOffMidSentenceFlushesWhatWasSaid) {
    ThresholdVad vad;
    CaptureTrigger trigger(vad);
    feed(trigger, streaming(), sine_chunk(200.0f, 0.3f), 20);

    auto utterance = trigger.on_chunk(ControlSnapshot{}, sine_chunk(200.0f, 0.3f));
    ASSERT_TRUE(utterance.has_value());
    EXPECT_EQ(utterance->samples.size(), static_cast<size_t>(20 * audio::FRAMES_PER_CHUNK));
    EXPECT_EQ(trigger.state(), TriggerState::Idle);
}

TEST(CaptureTriggerTest, LongUtterancesAreCut) {
    ThresholdVad vad;
    engine::TriggerConfig config;
    config.max_utterance_ms = 1000;
    CaptureTrigger trigger(vad, config);

    auto utterances = feed(trigger, streaming(), sine_chunk(200.0f, 0.3f), 64);
    ASSERT_EQ(utterances.size(), 2u);
    EXPECT_GE(utterances[0].samples.size(), 16000u);
    EXPECT_EQ(utterances[1].start_ms, utterances[0].end_ms);
}

TEST(CaptureTriggerTest, ElapsedTimeFollowsTheChunkCounter) {
    ThresholdVad vad;
    CaptureTrigger trigger(vad);
    feed(trigger, ControlSnapshot{}, silent_chunk(), 10);
    EXPECT_EQ(trigger.elapsed_ms(), 10 * CHUNK_MS);
}

TEST(CaptureTriggerTest, UtteranceCarriesTheFlagsThatClosedIt) {
    ThresholdVad vad;
    CaptureTrigger trigger(vad);
    ControlSnapshot hold = recording();
    hold.mode = protocol::Mode::Semantic;
    EXPECT_TRUE(feed(trigger, hold, sine_chunk(200.0f, 0.3f), 5).empty());

    ControlSnapshot release;
    release.mode = protocol::Mode::Morse;
    release.revision = 7;
    auto utterance = trigger.on_chunk(release, silent_chunk());
    ASSERT_TRUE(utterance.has_value());
    EXPECT_EQ(utterance->control.mode, protocol::Mode::Morse);
    EXPECT_FALSE(utterance->control.is_recording);
    EXPECT_EQ(utterance->control.revision, 7u);
}
