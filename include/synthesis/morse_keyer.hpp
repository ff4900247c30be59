#ifndef JANUS_SYNTHESIS_MORSE_KEYER_HPP
#define JANUS_SYNTHESIS_MORSE_KEYER_HPP

#include "audio/audio_io.hpp"
#include <string>

namespace synthesis {
    struct MorseTiming {
        int sample_rate = audio::SAMPLE_RATE;
        float tone_hz = 800.0f;
        float amplitude = 0.5f;
        int dot_ms = 100;
        int dash_ms = 300;
        int symbol_gap_ms = 100;
        int letter_gap_ms = 300;
        int word_gap_ms = 700;
    };

    // Keys text as an 800 Hz tone sequence locally; no synthesizer involved.
    class MorseKeyer {
    public:
        explicit MorseKeyer(MorseTiming timing = {});

        audio::Pcm key(const std::string& text) const;

        // ".-" for 'A'; nullptr for characters with no code.
        static const char* pattern(char c);

        const MorseTiming& timing() const { return timing_; }

    private:
        void append_tone(audio::Pcm& out, int duration_ms) const;
        void append_silence(audio::Pcm& out, int duration_ms) const;
        size_t samples_for(int duration_ms) const;

        MorseTiming timing_;
    };
}

#endif
