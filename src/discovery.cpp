/**
* @file
* @brief Client-side discovery: bounded wait for the first valid Offer.
*/

#include "speedtest/discovery.hpp"
#include "speedtest/logger.hpp"
#include "speedtest/wire.hpp"
#include <cerrno>
#include <cstring>
#include <variant>

namespace speedtest {

DiscoveryListener::DiscoveryListener(std::unique_ptr<ISocket> sock, DiscoveryConfig cfg)
: sock_(std::move(sock)), cfg_(cfg) {
    sock_->bind(cfg_.port, true);
}

/**
* @details The window is one deadline for the whole call: junk datagrams are
* skipped but do not restart the clock, so a noisy port still yields a
* timeout after @ref DiscoveryConfig::timeout_ms.
*/
std::optional<ServerOffer> DiscoveryListener::wait_for_offer() {
    const uint64_t deadline = now_ns() + static_cast<uint64_t>(cfg_.timeout_ms) * 1'000'000ull;
    for (;;) {
        const uint64_t now = now_ns();
        if (now >= deadline) return std::nullopt;
        const int left_ms = static_cast<int>((deadline - now + 999'999ull) / 1'000'000ull);

        ssize_t r = sock_->recv_from(rx_, left_ms);
        if (r == 0) return std::nullopt;
        if (r < 0) {
            Logger::warn("discovery", cat("receive failed: ", strerror(errno)));
            return std::nullopt;
        }

        Message msg = decode(rx_.data);
        if (const auto* offer = std::get_if<OfferMessage>(&msg)) {
            ServerOffer out{endpoint_ip(rx_.from), offer->udp_port, offer->tcp_port};
            Logger::info("discovery", cat("Received offer from ", out.ip,
                                          " (udp ", out.udp_port, ", tcp ", out.tcp_port, ")"));
            return out;
        }
        ++skipped_;
        Logger::debug("discovery", cat("skipped ", rx_.data.size(), "-byte datagram from ", to_string(rx_.from)));
    }
}

} // namespace speedtest
