#include "core/errors.hpp"
#include "synthesis/process_synthesizer.hpp"
#include <gtest/gtest.h>

using synthesis::ProcessSynthesizer;

TEST(ProcessSynthesizerTest, ReadsRawPcmFromStdout) {
    // Four little-endian samples: 1, 2, -1, 256.
    ProcessSynthesizer synthesizer(R"(printf '\001\000\002\000\377\377\000\001')");
    const auto pcm = synthesizer.synthesize("ignored", synthesis::DefaultVoice{});
    EXPECT_EQ(pcm, (audio::Pcm{1, 2, -1, 256}));
}

TEST(ProcessSynthesizerTest, PlaceholdersAreShellQuoted) {
    ProcessSynthesizer synthesizer("tts --say {text} --style {emotion}");
    const auto command = synthesizer.build_command("it's $HOME; rm -rf /", synthesis::EmotionVoice{
        protocol::EmotionOverride::Panicked});
    EXPECT_EQ(command, R"(tts --say 'it'\''s $HOME; rm -rf /' --style 'Panicked')");
}

TEST(ProcessSynthesizerTest, TextReachesTheCommandVerbatim) {
    // printf echoes the text back as bytes: 6 bytes -> 3 samples.
    ProcessSynthesizer synthesizer("printf %s {text}");
    const auto pcm = synthesizer.synthesize("a'b; c", synthesis::DefaultVoice{});
    ASSERT_EQ(pcm.size(), 3u);
    EXPECT_EQ(pcm[0], static_cast<int16_t>('a' | ('\'' << 8)));
}

TEST(ProcessSynthesizerTest, FailuresBecomeSynthesisErrors) {
    EXPECT_THROW(ProcessSynthesizer("exit 3").synthesize("x", synthesis::DefaultVoice{}),
                 core::SynthesisError);
    EXPECT_THROW(ProcessSynthesizer("true").synthesize("x", synthesis::DefaultVoice{}),
                 core::SynthesisError);
    EXPECT_THROW(ProcessSynthesizer(""), std::invalid_argument);
}
