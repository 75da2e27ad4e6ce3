/**
* @file
* @brief Client entry point: parses CLI and runs the discover/benchmark/report loop.
*
* @details
* CLI options
*  - `--size <n>`           : Bytes per transfer (prompted if absent).
*  - `--tcp <n>`            : TCP workers (prompted if absent).
*  - `--udp <n>`            : UDP workers (prompted if absent).
*  - `--rounds <n>`         : Stop after n benchmarks (default: 0 = forever).
*  - `--discovery-port <p>` : Port to listen for offers on (default: 13117).
*  - `--timeout-ms <n>`     : Discovery wait window (default: 5000).
*  - `--idle-ms <n>`        : UDP silence that ends a transfer (default: 1000).
*  - `--summary`            : Append per-transport totals to each report.
*  - `--verbose | --quiet`  : Debug logging / warnings only.
*
* Exit codes
*  - `0` when the requested rounds are done or stdin closes.
*  - `1` on a setup error (e.g., the discovery port cannot be bound).
*/

#include "speedtest/client.hpp"
#include "speedtest/logger.hpp"
#include <cstdlib>
#include <cstring>
#include <iostream>

using namespace speedtest;

int main(int argc, char** argv) {
    ClientConfig cfg;
    for (int i = 1; i < argc; i++) {
        if (!std::strcmp(argv[i], "--size") && i + 1 < argc) {
            cfg.file_size = std::strtoull(argv[++i], nullptr, 10);
        } else if (!std::strcmp(argv[i], "--tcp") && i + 1 < argc) {
            cfg.tcp_workers = static_cast<size_t>(std::strtoull(argv[++i], nullptr, 10));
        } else if (!std::strcmp(argv[i], "--udp") && i + 1 < argc) {
            cfg.udp_workers = static_cast<size_t>(std::strtoull(argv[++i], nullptr, 10));
        } else if (!std::strcmp(argv[i], "--rounds") && i + 1 < argc) {
            cfg.rounds = static_cast<size_t>(std::strtoull(argv[++i], nullptr, 10));
        } else if (!std::strcmp(argv[i], "--discovery-port") && i + 1 < argc) {
            cfg.discovery.port = static_cast<uint16_t>(std::atoi(argv[++i]));
        } else if (!std::strcmp(argv[i], "--timeout-ms") && i + 1 < argc) {
            cfg.discovery.timeout_ms = std::atoi(argv[++i]);
        } else if (!std::strcmp(argv[i], "--idle-ms") && i + 1 < argc) {
            cfg.worker.udp_idle_timeout_ms = std::atoi(argv[++i]);
        } else if (!std::strcmp(argv[i], "--summary")) {
            cfg.summary = true;
        } else if (!std::strcmp(argv[i], "--verbose")) {
            Logger::set_level(LogLevel::Debug);
        } else if (!std::strcmp(argv[i], "--quiet")) {
            Logger::set_level(LogLevel::Warn);
        } else if (!std::strcmp(argv[i], "--help")) {
            std::cout << "speedtest_client [--size <n>] [--tcp <n>] [--udp <n>] [--rounds <n>] "
                         "[--discovery-port <p>] [--timeout-ms <n>] [--idle-ms <n>] "
                         "[--summary] [--verbose|--quiet]\n";
            return 0;
        }
    }

    try {
        SpeedClient client(cfg, std::cin, std::cout);
        client.run();
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Client error: " << e.what() << "\n";
        return 1;
    }
}
