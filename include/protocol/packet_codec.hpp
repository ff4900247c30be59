#ifndef JANUS_PROTOCOL_PACKET_CODEC_HPP
#define JANUS_PROTOCOL_PACKET_CODEC_HPP

#include "protocol/janus_packet.hpp"
#include <cstdint>
#include <vector>

namespace protocol {
    // MessagePack map keys. Part of the wire contract.
    namespace keys {
        constexpr const char* MODE = "m";
        constexpr const char* TEXT = "t";
        constexpr const char* START_MS = "s";
        constexpr const char* END_MS = "e";
        constexpr const char* PITCH_HZ = "f";
        constexpr const char* ENERGY = "r";
        constexpr const char* EMOTION = "o";
    }

    class PacketCodec {
    public:
        // Optional fields that are absent are left out of the map entirely.
        static std::vector<uint8_t> encode(const JanusPacket& packet);

        // Throws core::DecodeError on anything that is not a valid packet map.
        // Keys it does not know are ignored.
        static JanusPacket decode(const std::vector<uint8_t>& bytes);
        static JanusPacket decode(const uint8_t* data, size_t size);
    };
}

#endif
