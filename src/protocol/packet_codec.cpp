#include "protocol/packet_codec.hpp"
#include "core/errors.hpp"
#include "text/utf8.hpp"
#include <cmath>
#include <limits>
#include <nlohmann/json.hpp>
#include <string>

using json = nlohmann::json;

namespace protocol {

namespace {

std::optional<EmotionOverride> emotion_from_wire(const std::string& value) {
    if (value == "Relaxed") return EmotionOverride::Relaxed;
    if (value == "Panicked") return EmotionOverride::Panicked;
    if (value == "Auto") return EmotionOverride::Auto;
    return std::nullopt;
}

[[noreturn]] void out_of_range(const char* key) {
    throw core::DecodeError(std::string("field '") + key + "' is out of range");
}

int64_t read_integer(const json& map, const char* key) {
    const json& value = map.at(key);
    if (value.is_number_unsigned()) {
        if (value.get<uint64_t>() > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
            out_of_range(key);
        }
        return static_cast<int64_t>(value.get<uint64_t>());
    }
    if (value.is_number_integer()) {
        return value.get<int64_t>();
    }
    if (value.is_number_float()) {
        // 2^63 is exact as a double; anything at or past it does not fit.
        const double number = value.get<double>();
        if (!std::isfinite(number) || number < -9223372036854775808.0 || number >= 9223372036854775808.0) {
            out_of_range(key);
        }
        return static_cast<int64_t>(number);
    }
    throw core::DecodeError(std::string("field '") + key + "' is not a number");
}

float read_float(const json& map, const char* key) {
    const json& value = map.at(key);
    if (!value.is_number()) {
        throw core::DecodeError(std::string("field '") + key + "' is not a number");
    }
    const double number = value.get<double>();
    if (!std::isfinite(number) || std::fabs(number) > std::numeric_limits<float>::max()) {
        out_of_range(key);
    }
    return static_cast<float>(number);
}

}

std::vector<uint8_t> PacketCodec::encode(const JanusPacket& packet) {
    json map = json::object();
    map[keys::MODE] = static_cast<uint8_t>(packet.mode);

    if (!packet.text.empty()) {
        map[keys::TEXT] = packet.text;
    }
    if (packet.start_ms) {
        map[keys::START_MS] = *packet.start_ms;
    }
    if (packet.end_ms) {
        map[keys::END_MS] = *packet.end_ms;
    }
    // float -> double is exact, so the MessagePack writer keeps these as float32.
    if (packet.avg_pitch_hz) {
        map[keys::PITCH_HZ] = static_cast<double>(*packet.avg_pitch_hz);
    }
    if (packet.avg_energy) {
        map[keys::ENERGY] = static_cast<double>(*packet.avg_energy);
    }
    if (packet.emotion_override != EmotionOverride::Auto) {
        map[keys::EMOTION] = to_string(packet.emotion_override);
    }

    return json::to_msgpack(map);
}

JanusPacket PacketCodec::decode(const std::vector<uint8_t>& bytes) {
    return decode(bytes.data(), bytes.size());
}

JanusPacket PacketCodec::decode(const uint8_t* data, size_t size) {
    if (data == nullptr || size == 0) {
        throw core::DecodeError("empty frame");
    }

    json map;
    try {
        map = json::from_msgpack(data, data + size);
    } catch (const json::exception& e) {
        throw core::DecodeError(std::string("malformed msgpack: ") + e.what());
    }

    if (!map.is_object()) {
        throw core::DecodeError("packet root is not a map");
    }

    JanusPacket packet;

    auto mode_it = map.find(keys::MODE);
    if (mode_it == map.end() || !mode_it->is_number_integer()) {
        throw core::DecodeError("missing or non-integer mode");
    }
    const int64_t mode = mode_it->get<int64_t>();
    if (mode < 0 || mode > static_cast<int64_t>(Mode::Morse)) {
        throw core::DecodeError("unknown mode " + std::to_string(mode));
    }
    packet.mode = static_cast<Mode>(mode);

    if (map.contains(keys::TEXT)) {
        const json& value = map.at(keys::TEXT);
        if (!value.is_string()) {
            throw core::DecodeError("field 't' is not a string");
        }
        packet.text = value.get<std::string>();
        if (!text::is_valid_utf8(packet.text)) {
            throw core::DecodeError("field 't' is not valid UTF-8");
        }
    }
    if (map.contains(keys::START_MS)) {
        packet.start_ms = read_integer(map, keys::START_MS);
    }
    if (map.contains(keys::END_MS)) {
        packet.end_ms = read_integer(map, keys::END_MS);
    }
    if (map.contains(keys::PITCH_HZ)) {
        packet.avg_pitch_hz = read_float(map, keys::PITCH_HZ);
    }
    if (map.contains(keys::ENERGY)) {
        packet.avg_energy = read_float(map, keys::ENERGY);
    }
    if (map.contains(keys::EMOTION)) {
        const json& emotion = map.at(keys::EMOTION);
        if (!emotion.is_string()) {
            throw core::DecodeError("field 'o' is not a string");
        }
        // Emotions added by newer senders play with the automatic voice.
        packet.emotion_override = emotion_from_wire(emotion.get<std::string>())
                                      .value_or(EmotionOverride::Auto);
    }

    return packet;
}

}
