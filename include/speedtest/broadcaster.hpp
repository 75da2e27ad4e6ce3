#pragma once
#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <thread>
#include <vector>
#include "speedtest/cancel.hpp"
#include "speedtest/common.hpp"
#include "speedtest/socket.hpp"
#include "speedtest/stats.hpp"

namespace speedtest {

/**
* @brief Where and how often offers go out.
*/
struct BroadcastConfig {
    uint16_t    udp_port       = kDefaultUdpPort;    ///< Advertised request port.
    uint16_t    tcp_port       = kDefaultTcpPort;    ///< Advertised listen port.
    std::string broadcast_ip   = "255.255.255.255";  ///< Destination address.
    uint16_t    discovery_port = kDiscoveryPort;     ///< Destination port.
    int         interval_ms    = kBroadcastInterval; ///< Period between offers.
};

/**
* @brief Periodically announces the server's transfer ports.
*
* @details
* States: Running -> Stopped. While running, one Offer goes to
* @ref BroadcastConfig::broadcast_ip every @ref BroadcastConfig::interval_ms.
* A failed send is logged and the next tick simply tries again. The loop
* sleeps on the shared @ref CancellationToken, so a stop request ends it
* without waiting out the interval.
*/
class OfferBroadcaster {
public:
    /// @throws TransportError if broadcast cannot be enabled or the address is invalid.
    OfferBroadcaster(std::unique_ptr<ISocket> sock, BroadcastConfig cfg,
                     CancellationToken token, Stats* stats = nullptr);
    ~OfferBroadcaster();

    /// @brief Spawn the broadcast thread.
    void start();

    /// @brief Wait for the thread to exit (after the token was cancelled).
    void join();

    /// @brief Run the loop on the caller's thread until the token is cancelled, then close the socket.
    void run();

    /// @brief Send one offer now. @return true if the kernel accepted it.
    bool send_offer();

    uint64_t sent() const { return sent_; }

private:
    std::unique_ptr<ISocket> sock_;
    BroadcastConfig          cfg_;
    CancellationToken        token_;
    Stats*                   stats_;
    sockaddr_in              dest_;
    std::vector<uint8_t>     offer_;
    std::thread              th_;
    std::atomic<uint64_t>    sent_{0};
};

} // namespace speedtest
