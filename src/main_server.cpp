/**
* @file
* @brief Server entry point: parses CLI, runs SpeedServer until SIGINT/SIGTERM.
*
* @details
* CLI options
*  - `--udp-port <p>`       : UDP request port (default: 2025).
*  - `--tcp-port <p>`       : TCP listen port (default: 2026).
*  - `--discovery-port <p>` : Port offers are sent to (default: 13117).
*  - `--broadcast <ip>`     : Offer destination (default: 255.255.255.255).
*  - `--interval-ms <n>`    : Offer period (default: 1000).
*  - `--segment <n>`        : UDP payload bytes per segment (default: 1024).
*  - `--metrics-port <p>`   : Loopback HTTP port for /metrics (0 disables; default: 0).
*  - `--verbose | --quiet`  : Debug logging / warnings only.
*  - `<udp_port> <tcp_port>`: Positional form of the two ports.
*
* Exit codes
*  - `0` on normal termination.
*  - `1` if the server cannot start.
*/

#include "speedtest/server.hpp"
#include "speedtest/logger.hpp"
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <thread>
#include <vector>

using namespace speedtest;

// Set by the signal handler; the main thread turns it into a token cancel.
static std::atomic<bool> g_keepRunning{true};

static void handle_signal(int) {
    g_keepRunning = false;
}

int main(int argc, char** argv) {
    ServerConfig cfg;
    std::vector<const char*> positional;
    for (int i = 1; i < argc; i++) {
        if (!std::strcmp(argv[i], "--udp-port") && i + 1 < argc) {
            cfg.udp_port = static_cast<uint16_t>(std::atoi(argv[++i]));
        } else if (!std::strcmp(argv[i], "--tcp-port") && i + 1 < argc) {
            cfg.tcp_port = static_cast<uint16_t>(std::atoi(argv[++i]));
        } else if (!std::strcmp(argv[i], "--discovery-port") && i + 1 < argc) {
            cfg.discovery_port = static_cast<uint16_t>(std::atoi(argv[++i]));
        } else if (!std::strcmp(argv[i], "--broadcast") && i + 1 < argc) {
            cfg.broadcast_ip = argv[++i];
        } else if (!std::strcmp(argv[i], "--interval-ms") && i + 1 < argc) {
            cfg.interval_ms = std::atoi(argv[++i]);
        } else if (!std::strcmp(argv[i], "--segment") && i + 1 < argc) {
            cfg.responder.segment_size = static_cast<size_t>(std::strtoull(argv[++i], nullptr, 10));
        } else if (!std::strcmp(argv[i], "--metrics-port") && i + 1 < argc) {
            cfg.metrics_port = static_cast<uint16_t>(std::atoi(argv[++i]));
        } else if (!std::strcmp(argv[i], "--verbose")) {
            Logger::set_level(LogLevel::Debug);
        } else if (!std::strcmp(argv[i], "--quiet")) {
            Logger::set_level(LogLevel::Warn);
        } else if (!std::strcmp(argv[i], "--help")) {
            std::cout
                << "speedtest_server [<udp_port> <tcp_port>] "
                << "--udp-port <p> --tcp-port <p> --discovery-port <p> "
                << "--broadcast <ip> --interval-ms <n> --segment <n> "
                << "--metrics-port <p> [--verbose|--quiet]\n";
            return 0;
        } else if (argv[i][0] != '-') {
            positional.push_back(argv[i]);
        }
    }
    if (positional.size() >= 2) {
        cfg.udp_port = static_cast<uint16_t>(std::atoi(positional[0]));
        cfg.tcp_port = static_cast<uint16_t>(std::atoi(positional[1]));
    }
    if (cfg.responder.segment_size == 0 || cfg.responder.segment_size > kMaxDatagram - 64) {
        std::cerr << "Server error: --segment must be between 1 and " << (kMaxDatagram - 64) << "\n";
        return 1;
    }

    try {
        SpeedServer server(cfg);
        server.start();

        std::signal(SIGINT,  handle_signal);
        std::signal(SIGTERM, handle_signal);
        while (g_keepRunning) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
        server.stop();
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Server error: " << e.what() << "\n";
        return 1;
    }
}
