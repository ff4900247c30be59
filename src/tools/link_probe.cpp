// src/tools/link_probe.cpp - pushes sample Janus packets through the throttled link

#include "core/errors.hpp"
#include "network/link_simulator.hpp"
#include "network/tcp_transport.hpp"
#include "network/udp_transport.hpp"
#include "protocol/packet_codec.hpp"
#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#define RESET   "\033[0m"
#define RED     "\033[31m"
#define GREEN   "\033[32m"
#define YELLOW  "\033[33m"
#define BLUE    "\033[34m"
#define MAGENTA "\033[35m"
#define CYAN    "\033[36m"

namespace {
    std::atomic<bool> g_stop{false};

    void on_signal(int) {
        g_stop = true;
    }

    std::vector<protocol::JanusPacket> sample_packets() {
        std::vector<protocol::JanusPacket> packets;

        protocol::JanusPacket semantic;
        semantic.mode = protocol::Mode::Semantic;
        semantic.text = "Hello from the other side of the link.";
        semantic.avg_pitch_hz = 182.5f;
        semantic.avg_energy = 0.08f;
        packets.push_back(semantic);

        protocol::JanusPacket urgent;
        urgent.mode = protocol::Mode::Semantic;
        urgent.text = "Get out of the building now!";
        urgent.start_ms = 1200;
        urgent.end_ms = 2900;
        urgent.emotion_override = protocol::EmotionOverride::Panicked;
        packets.push_back(urgent);

        protocol::JanusPacket text_only;
        text_only.mode = protocol::Mode::TextOnly;
        text_only.text = "Plain text, default voice";
        packets.push_back(text_only);

        protocol::JanusPacket morse;
        morse.mode = protocol::Mode::Morse;
        morse.text = "SOS";
        packets.push_back(morse);

        return packets;
    }

    void print_packet(const protocol::JanusPacket& packet, size_t bytes) {
        std::cout << "[" << protocol::to_string(packet.mode) << "] '" << packet.text << "' ("
                  << bytes << " bytes";
        if (packet.avg_pitch_hz) {
            std::cout << ", pitch " << *packet.avg_pitch_hz << " Hz";
        }
        if (packet.avg_energy) {
            std::cout << ", energy " << *packet.avg_energy;
        }
        if (packet.emotion_override != protocol::EmotionOverride::Auto) {
            std::cout << ", " << protocol::to_string(packet.emotion_override);
        }
        std::cout << ")";
    }

    int run_send(const std::string& target_ip, uint16_t port, uint32_t bps, bool tcp) {
        std::cout << CYAN << "Link probe: send" << RESET << std::endl;
        std::cout << "   " << BLUE << "Target: " << target_ip << ":" << port
                  << (tcp ? " (tcp)" : " (udp)") << " @ " << bps << " bps" << RESET << std::endl;

        std::unique_ptr<network::Transport> transport;
        if (tcp) {
            transport = std::make_unique<network::TcpTransport>(target_ip, port);
        } else {
            transport = std::make_unique<network::UdpTransport>(target_ip, port);
        }
        network::LinkSimulator link(*transport, bps);

        const auto packets = sample_packets();
        size_t sent = 0;
        size_t wire_bytes = 0;
        auto start = std::chrono::steady_clock::now();

        for (size_t i = 0; i < packets.size() && !g_stop; ++i) {
            const auto payload = protocol::PacketCodec::encode(packets[i]);
            std::cout << "   " << YELLOW << "#" << (i + 1) << " " << RESET;
            print_packet(packets[i], payload.size());
            std::cout << " ~" << std::chrono::duration_cast<std::chrono::milliseconds>(
                link.transmit_duration(transport->framed_size(payload.size()))).count() << " ms" << std::endl;

            try {
                auto result = link.send(payload, [] { return g_stop.load(); });
                if (result == network::SendResult::Sent) {
                    sent++;
                    wire_bytes += transport->framed_size(payload.size());
                    std::cout << "      " << GREEN << "sent" << RESET << std::endl;
                } else {
                    std::cout << "      " << YELLOW << network::to_string(result) << RESET << std::endl;
                }
            } catch (const core::TransportError& e) {
                std::cout << "      " << RED << "FAILED: " << e.what() << RESET << std::endl;
            }
        }

        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start).count();

        std::cout << "\n" << MAGENTA << "Results:" << RESET << std::endl;
        std::cout << "   Sent: " << sent << "/" << packets.size() << std::endl;
        std::cout << "   Wire bytes: " << wire_bytes << " in " << elapsed << " ms";
        if (elapsed > 0) {
            std::cout << " (" << (wire_bytes * 8 * 1000 / elapsed) << " bps effective)";
        }
        std::cout << std::endl;
        return sent == packets.size() ? 0 : 1;
    }

    int run_listen(uint16_t port, bool tcp) {
        std::cout << CYAN << "Link probe: listen" << RESET << std::endl;

        std::unique_ptr<network::FrameReceiver> receiver;
        if (tcp) {
            receiver = std::make_unique<network::TcpFrameReceiver>(port);
        } else {
            receiver = std::make_unique<network::UdpFrameReceiver>(port);
        }
        std::cout << GREEN << "Listening on port " << receiver->port() << (tcp ? " (tcp)" : " (udp)")
                  << RESET << std::endl;
        std::cout << YELLOW << "Press Ctrl+C to stop" << RESET << std::endl;

        int count = 0;
        int corrupt = 0;
        auto start = std::chrono::steady_clock::now();

        while (!g_stop) {
            std::optional<network::Frame> frame;
            try {
                frame = receiver->receive(std::chrono::milliseconds(200));
            } catch (const core::TransportError& e) {
                std::cerr << RED << "Receive error: " << e.what() << RESET << std::endl;
                continue;
            }
            if (!frame) {
                continue;
            }

            auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - start).count();
            try {
                auto packet = protocol::PacketCodec::decode(*frame);
                count++;
                std::cout << GREEN << "#" << count << " [+" << elapsed << "ms] " << RESET;
                print_packet(packet, frame->size());
                std::cout << std::endl;
            } catch (const core::DecodeError& e) {
                corrupt++;
                std::cout << RED << "corrupt frame (" << frame->size() << " bytes): " << e.what()
                          << RESET << std::endl;
            }
        }

        std::cout << "\n" << MAGENTA << "Session summary:" << RESET << std::endl;
        std::cout << "   Packets: " << count << ", corrupt: " << corrupt << std::endl;
        return 0;
    }

    void print_usage(const char* program_name) {
        std::cout << "\n" << CYAN << "Janus link probe" << RESET << "\n" << std::endl;
        std::cout << YELLOW << "Send sample packets:" << RESET << std::endl;
        std::cout << "  " << program_name << " send <target_ip> <port> [bps] [tcp]" << std::endl;
        std::cout << "\n" << YELLOW << "Decode incoming packets:" << RESET << std::endl;
        std::cout << "  " << program_name << " listen <port> [tcp]" << std::endl;
        std::cout << "\n" << GREEN << "Example:" << RESET << std::endl;
        std::cout << "  " << BLUE << "Computer A: " << RESET << program_name << " listen 9001" << std::endl;
        std::cout << "  " << BLUE << "Computer B: " << RESET << program_name << " send 192.168.1.100 9001 300" << std::endl;
    }
}

int main(int argc, char* argv[]) {
    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);

    try {
        if (argc < 2) {
            print_usage(argv[0]);
            return 1;
        }

        std::string mode = argv[1];
        const bool tcp = std::string(argv[argc - 1]) == "tcp";
        const int positional = tcp ? argc - 1 : argc;

        if (mode == "send" && (positional == 4 || positional == 5)) {
            std::string target_ip = argv[2];
            if (target_ip == "localhost") {
                target_ip = "127.0.0.1";
            }
            auto port = static_cast<uint16_t>(std::stoi(argv[3]));
            uint32_t bps = positional == 5 ? static_cast<uint32_t>(std::stoul(argv[4])) : 300;
            return run_send(target_ip, port, bps, tcp);
        }
        if (mode == "listen" && positional == 3) {
            return run_listen(static_cast<uint16_t>(std::stoi(argv[2])), tcp);
        }

        std::cerr << RED << "Invalid arguments!" << RESET << std::endl;
        print_usage(argv[0]);
        return 1;

    } catch (const std::exception& e) {
        std::cerr << RED << "ERROR: " << e.what() << RESET << std::endl;
        return 1;
    }
}
