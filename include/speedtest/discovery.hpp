#pragma once
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include "speedtest/common.hpp"
#include "speedtest/socket.hpp"

namespace speedtest {

/// @brief What a valid Offer tells the client.
struct ServerOffer {
    std::string ip;        ///< Sender address of the offer datagram.
    uint16_t    udp_port;  ///< Advertised request port.
    uint16_t    tcp_port;  ///< Advertised listen port.
};

struct DiscoveryConfig {
    uint16_t port       = kDiscoveryPort; ///< Well-known offer port to bind.
    int      timeout_ms = 5000;           ///< Wait window per @ref DiscoveryListener::wait_for_offer.
};

/**
* @brief Listens on the discovery port for the first valid Offer.
*
* @details
* The socket is bound once at construction with @c SO_REUSEPORT, so several
* clients on one host can listen side by side, and kept across calls.
* Datagrams that do not decode to an Offer are skipped without ending the
* wait. The first valid Offer wins; later ones are not compared.
*/
class DiscoveryListener {
public:
    /// @throws TransportError if the discovery port cannot be bound.
    DiscoveryListener(std::unique_ptr<ISocket> sock, DiscoveryConfig cfg);

    /**
     * @brief Wait up to @ref DiscoveryConfig::timeout_ms for an Offer.
     * @return The offer, or an empty optional when the window passed without
     *         one (a retryable condition, also used for a failed receive).
     */
    std::optional<ServerOffer> wait_for_offer();

    uint16_t local_port() const { return sock_->local_port(); }

    /// @brief Datagrams skipped because they were not a valid Offer.
    uint64_t skipped() const { return skipped_; }

private:
    std::unique_ptr<ISocket> sock_;
    DiscoveryConfig          cfg_;
    Datagram                 rx_;
    uint64_t                 skipped_{0};
};

} // namespace speedtest
