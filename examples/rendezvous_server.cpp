/**
 * @file rendezvous_server.cpp
 * @brief Standalone rendezvous server for hole punched sessions
 *
 * Hands out session ids to hosts and introduces joiners to them.
 *
 * Usage:
 *   rendezvous_server [port] [bind_address]
 *
 * Examples:
 *   # Dual stack on the default port
 *   rendezvous_server
 *
 *   # IPv4 only on port 9000
 *   rendezvous_server 9000 0.0.0.0
 */

#include "config.h"
#include "logger.h"
#include "rendezvous.h"
#include "socket.h"

#include <iostream>
#include <string>
#include <chrono>
#include <atomic>
#include <thread>
#include <csignal>
#include <cstdlib>

using namespace skyshare;

static std::atomic<bool> g_running{true};

static void signal_handler(int) {
    g_running = false;
}

static void print_usage(const char* program) {
    std::cerr << "Usage: " << program << " [port] [bind_address]\n"
              << "\n"
              << "  port           UDP port to listen on (default " << DEFAULT_RENDEZVOUS_PORT << ")\n"
              << "  bind_address   Local address (default :: for dual stack)\n";
}

int main(int argc, char* argv[]) {
    if (argc > 3) {
        print_usage(argv[0]);
        return 1;
    }

    int port = DEFAULT_RENDEZVOUS_PORT;
    if (argc >= 2) {
        port = std::atoi(argv[1]);
        if (port <= 0 || port > 65535) {
            std::cerr << "Error: invalid port\n";
            return 1;
        }
    }
    std::string bind_address = argc >= 3 ? argv[2] : "::";

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    Logger::getInstance().set_log_level(LogLevel::INFO);

    if (!init_socket_library()) {
        std::cerr << "Error: failed to initialize sockets\n";
        return 1;
    }

    RendezvousServer server;
    std::string error;
    if (!server.start(bind_address, static_cast<uint16_t>(port), error)) {
        std::cerr << "Error: " << error << "\n";
        cleanup_socket_library();
        return 1;
    }

    std::cout << "Rendezvous server listening on port " << server.get_local_port()
              << ". Press Ctrl+C to stop.\n";

    size_t last_count = 0;
    while (g_running) {
        std::this_thread::sleep_for(std::chrono::milliseconds(500));
        size_t count = server.get_session_count();
        if (count != last_count) {
            std::cout << "Active sessions: " << count << "\n";
            last_count = count;
        }
    }

    server.stop();
    cleanup_socket_library();
    return 0;
}
