#pragma once
#include <atomic>
#include <cstdint>
#include <string>
#include <thread>
#include "speedtest/stats.hpp"

/**
* @file
* @brief Loopback-only HTTP endpoint exposing the server's @ref speedtest::Stats.
*
* @par Usage
* @code
* speedtest::Stats stats;
* speedtest::MetricsHttpServer http(stats, 9100);
* http.start();
* // curl http://127.0.0.1:9100/metrics
* http.stop();
* @endcode
*
* @note The background thread only reads the relaxed counters.
*/

namespace speedtest {

class MetricsHttpServer {
public:
    /**
     * @param stats Live counters; must outlive this object.
     * @param port  TCP port on 127.0.0.1 (0 disables the server).
     */
    MetricsHttpServer(const Stats& stats, uint16_t port);
    ~MetricsHttpServer();

    /// @brief Start the listener thread (no-op when the port is 0).
    void start();

    /// @brief Stop and join; returns within one accept poll.
    void stop();

    /// @brief Current counters in Prometheus text exposition format.
    std::string render() const;

private:
    void run();

    const Stats& stats_;
    uint16_t port_;
    std::thread th_;
    std::atomic<bool> running_{false};
};

} // namespace speedtest
