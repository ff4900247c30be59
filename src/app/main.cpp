#include "app/application.hpp"
#include "app/config.hpp"
#include <atomic>
#include <cctype>
#include <csignal>
#include <iostream>
#include <string>

std::atomic<bool> g_shutdown_requested{false};

void signal_handler(int) {
    g_shutdown_requested = true;
}

void print_usage(const char* program_name) {
    std::cout << "\nJanus semantic voice link\n" << std::endl;
    std::cout << "Usage: " << program_name << " <target_ip> <send_port> <listen_port> [config.json]\n" << std::endl;
    std::cout << "Examples:" << std::endl;
    std::cout << "  " << program_name << " 127.0.0.1 9001 9002              # local loopback" << std::endl;
    std::cout << "  " << program_name << " 192.168.1.100 5000 5001 janus.json" << std::endl;
    std::cout << "\nUse crossed ports on the two nodes:" << std::endl;
    std::cout << "  node A sends to 9001 and listens on 9002" << std::endl;
    std::cout << "  node B sends to 9002 and listens on 9001" << std::endl;
}

bool validate_port(int port) {
    if (port < 1024 || port > 65535) {
        std::cerr << "ERROR: port must be in 1024-65535, got " << port << std::endl;
        return false;
    }
    return true;
}

bool validate_ip(const std::string& ip) {
    if (ip.empty()) {
        std::cerr << "ERROR: IP address is empty." << std::endl;
        return false;
    }

    size_t dot_count = 0;
    for (char c : ip) {
        if (c == '.') {
            dot_count++;
        } else if (!std::isdigit(static_cast<unsigned char>(c))) {
            std::cerr << "ERROR: invalid IP address: " << ip << std::endl;
            return false;
        }
    }

    if (dot_count != 3) {
        std::cerr << "ERROR: IP address must have four parts: " << ip << std::endl;
        return false;
    }

    return true;
}

int main(int argc, char* argv[]) {
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
    std::signal(SIGHUP, signal_handler);

    std::cout << "Janus v1.0" << std::endl;
    std::cout << "==========" << std::endl;

    if (argc != 4 && argc != 5) {
        print_usage(argv[0]);
        return 1;
    }

    try {
        std::string target_ip = argv[1];
        if (target_ip == "localhost") {
            target_ip = "127.0.0.1";
        }

        int send_port, listen_port;
        try {
            send_port = std::stoi(argv[2]);
            listen_port = std::stoi(argv[3]);
        } catch (const std::exception&) {
            std::cerr << "ERROR: ports must be integers." << std::endl;
            print_usage(argv[0]);
            return 1;
        }

        if (!validate_ip(target_ip)) {
            return 1;
        }
        if (!validate_port(send_port) || !validate_port(listen_port)) {
            return 1;
        }
        if (send_port == listen_port) {
            std::cerr << "ERROR: send and listen ports must differ (both " << send_port << ")." << std::endl;
            return 1;
        }

        app::EngineConfig config = argc == 5 ? app::load_config(argv[4]) : app::default_config();
        config.target_ip = target_ip;
        config.send_port = send_port;
        config.listen_port = listen_port;

        std::cout << "\nTarget: " << target_ip << ":" << send_port << std::endl;
        std::cout << "Listen: port " << listen_port << std::endl;

        std::cout << "\nStarting..." << std::endl;
        app::Application app(std::move(config));

        if (g_shutdown_requested) {
            std::cout << "Shutdown requested during startup." << std::endl;
            return 0;
        }

        app.run(g_shutdown_requested);

    } catch (const std::invalid_argument& e) {
        std::cerr << "ERROR: invalid argument - " << e.what() << std::endl;
        return 1;
    } catch (const std::out_of_range& e) {
        std::cerr << "ERROR: value out of range - " << e.what() << std::endl;
        return 1;
    } catch (const std::runtime_error& e) {
        std::cerr << "RUNTIME ERROR: " << e.what() << std::endl;
        std::cerr << "\nThings to check:" << std::endl;
        std::cerr << "   - an audio input and output device is connected" << std::endl;
        std::cerr << "   - the whisper model path in the config exists" << std::endl;
        std::cerr << "   - no other program is using the listen port" << std::endl;
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "UNEXPECTED ERROR: " << e.what() << std::endl;
        return 3;
    }

    std::cout << "\nExited cleanly." << std::endl;
    return 0;
}
