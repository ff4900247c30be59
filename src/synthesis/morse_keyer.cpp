#include "synthesis/morse_keyer.hpp"
#include <cctype>
#include <cmath>

namespace synthesis {

MorseKeyer::MorseKeyer(MorseTiming timing) : timing_(timing) {}

const char* MorseKeyer::pattern(char c) {
    switch (std::toupper(static_cast<unsigned char>(c))) {
        case 'A': return ".-";      case 'B': return "-...";    case 'C': return "-.-.";
        case 'D': return "-..";     case 'E': return ".";       case 'F': return "..-.";
        case 'G': return "--.";     case 'H': return "....";    case 'I': return "..";
        case 'J': return ".---";    case 'K': return "-.-";     case 'L': return ".-..";
        case 'M': return "--";      case 'N': return "-.";      case 'O': return "---";
        case 'P': return ".--.";    case 'Q': return "--.-";    case 'R': return ".-.";
        case 'S': return "...";     case 'T': return "-";       case 'U': return "..-";
        case 'V': return "...-";    case 'W': return ".--";     case 'X': return "-..-";
        case 'Y': return "-.--";    case 'Z': return "--..";
        case '0': return "-----";   case '1': return ".----";   case '2': return "..---";
        case '3': return "...--";   case '4': return "....-";   case '5': return ".....";
        case '6': return "-....";   case '7': return "--...";   case '8': return "---..";
        case '9': return "----.";
        case '.': return ".-.-.-";  case ',': return "--..--";  case '?': return "..--..";
        case '\'': return ".----."; case '!': return "-.-.--";  case '/': return "-..-.";
        case '(': return "-.--.";   case ')': return "-.--.-";  case '&': return ".-...";
        case ':': return "---...";  case ';': return "-.-.-.";  case '=': return "-...-";
        case '+': return ".-.-.";   case '-': return "-....-";  case '"': return ".-..-.";
        case '@': return ".--.-.";
        default: return nullptr;
    }
}

size_t MorseKeyer::samples_for(int duration_ms) const {
    return static_cast<size_t>(static_cast<int64_t>(timing_.sample_rate) * duration_ms / 1000);
}

void MorseKeyer::append_tone(audio::Pcm& out, int duration_ms) const {
    const size_t count = samples_for(duration_ms);
    const double step = 2.0 * M_PI * timing_.tone_hz / timing_.sample_rate;
    const double scale = 32767.0 * timing_.amplitude;
    for (size_t i = 0; i < count; ++i) {
        out.push_back(static_cast<int16_t>(std::sin(step * static_cast<double>(i)) * scale));
    }
}

void MorseKeyer::append_silence(audio::Pcm& out, int duration_ms) const {
    out.insert(out.end(), samples_for(duration_ms), 0);
}

audio::Pcm MorseKeyer::key(const std::string& text) const {
    audio::Pcm out;
    bool letter_pending = false;   // a letter was keyed and needs a gap before the next
    bool word_break = false;

    for (char c : text) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            word_break = letter_pending;
            continue;
        }
        const char* code = pattern(c);
        if (code == nullptr) {
            continue;
        }

        if (letter_pending) {
            append_silence(out, word_break ? timing_.word_gap_ms : timing_.letter_gap_ms);
        }
        word_break = false;

        for (const char* symbol = code; *symbol != '\0'; ++symbol) {
            if (symbol != code) {
                append_silence(out, timing_.symbol_gap_ms);
            }
            append_tone(out, *symbol == '.' ? timing_.dot_ms : timing_.dash_ms);
        }
        letter_pending = true;
    }
    return out;
}

}
