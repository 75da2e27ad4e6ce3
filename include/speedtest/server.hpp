#pragma once
#include <cstdint>
#include <memory>
#include <string>
#include "speedtest/broadcaster.hpp"
#include "speedtest/cancel.hpp"
#include "speedtest/common.hpp"
#include "speedtest/dispatcher.hpp"
#include "speedtest/metrics_http.hpp"
#include "speedtest/responder.hpp"
#include "speedtest/stats.hpp"

namespace speedtest {

/**
* @brief Server configuration knobs.
*
* @details Port 0 for @ref udp_port or @ref tcp_port binds an ephemeral port;
* the offers then advertise whatever the kernel picked.
*/
struct ServerConfig {
    uint16_t    udp_port        = kDefaultUdpPort;    ///< UDP request port.
    uint16_t    tcp_port        = kDefaultTcpPort;    ///< TCP listen port.
    uint16_t    discovery_port  = kDiscoveryPort;     ///< Offer destination port.
    std::string broadcast_ip    = "255.255.255.255";  ///< Offer destination address.
    int         interval_ms     = kBroadcastInterval; ///< Offer period.
    int         poll_timeout_ms = 100;                ///< Dispatcher poll per socket.
    uint16_t    metrics_port    = 0;                  ///< Loopback /metrics port (0 = disabled).
    ResponderConfig responder;                        ///< Segment size, chunking, timeouts.
};

/**
* @brief The whole server: broadcaster + dispatcher (+ optional /metrics).
*
* @details
* Responsibilities:
*  - Bind the UDP request socket and the TCP listener at construction, so
*    setup errors surface before anything is announced.
*  - Run the broadcaster and the dispatcher on their own threads, both
*    driven by one @ref CancellationToken.
*  - On @ref stop: cancel, let the dispatcher close its sockets and drain
*    in-flight responders, then join the broadcaster.
*/
class SpeedServer {
public:
    /// @throws TransportError if a socket cannot be created or bound.
    explicit SpeedServer(ServerConfig cfg);
    ~SpeedServer();

    void start();

    /// @brief Request shutdown and wait for every server thread (idempotent).
    void stop();

    /// @brief Bound UDP request port.
    uint16_t udp_port() const { return udp_port_; }

    /// @brief Bound TCP listen port.
    uint16_t tcp_port() const { return tcp_port_; }

    const Stats& stats() const { return stats_; }
    CancellationToken token() const { return token_; }

private:
    ServerConfig      cfg_;
    Stats             stats_;
    CancellationToken token_;
    uint16_t          udp_port_{0};
    uint16_t          tcp_port_{0};
    std::unique_ptr<RequestDispatcher> dispatcher_;
    std::unique_ptr<OfferBroadcaster>  broadcaster_;
    std::unique_ptr<MetricsHttpServer> metrics_;
    bool              started_{false};
};

} // namespace speedtest
