/**
* @file
* @brief Offer broadcaster: one immutable Offer, re-sent every interval until cancelled.
*/

#include "speedtest/broadcaster.hpp"
#include "speedtest/logger.hpp"
#include "speedtest/wire.hpp"
#include <cerrno>
#include <chrono>
#include <cstring>

namespace speedtest {

OfferBroadcaster::OfferBroadcaster(std::unique_ptr<ISocket> sock, BroadcastConfig cfg,
                                   CancellationToken token, Stats* stats)
: sock_(std::move(sock)), cfg_(std::move(cfg)), token_(std::move(token)), stats_(stats),
  dest_(make_endpoint(cfg_.broadcast_ip, cfg_.discovery_port)),
  offer_(encode_offer(OfferMessage{cfg_.udp_port, cfg_.tcp_port})) {
    sock_->enable_broadcast();
}

OfferBroadcaster::~OfferBroadcaster() {
    if (th_.joinable()) {
        token_.request_stop();
        th_.join();
    }
}

void OfferBroadcaster::start() {
    th_ = std::thread(&OfferBroadcaster::run, this);
}

void OfferBroadcaster::join() {
    if (th_.joinable()) th_.join();
}

bool OfferBroadcaster::send_offer() {
    if (!sock_) return false;
    ssize_t r = sock_->send_to(offer_, dest_);
    if (r == 1) {
        sent_.fetch_add(1, std::memory_order_relaxed);
        if (stats_) stats_->inc_offers();
        return true;
    }
    if (r < 0) {
        Logger::warn("offer", cat("broadcast to ", to_string(dest_), " failed: ", strerror(errno)));
    } else {
        Logger::warn("offer", cat("broadcast to ", to_string(dest_), " would block, skipped"));
    }
    return false;
}

void OfferBroadcaster::run() {
    Logger::info("offer", cat("broadcasting udp=", cfg_.udp_port, " tcp=", cfg_.tcp_port,
                              " to ", to_string(dest_), " every ", cfg_.interval_ms, " ms"));
    while (!token_.stop_requested()) {
        send_offer();
        if (token_.wait_for(std::chrono::milliseconds(cfg_.interval_ms))) break;
    }
    sock_.reset();
    Logger::debug("offer", cat("stopped after ", sent(), " offers"));
}

} // namespace speedtest
