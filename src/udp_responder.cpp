/**
* @file
* @brief Segmented UDP transfer: split, number, and stream payload datagrams.
*/

#include "speedtest/responder.hpp"
#include "speedtest/logger.hpp"
#include "speedtest/wire.hpp"
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <vector>

namespace speedtest {

const char* to_string(ResponderStatus s) {
    switch (s) {
        case ResponderStatus::Completed:        return "completed";
        case ResponderStatus::MalformedRequest: return "malformed request";
        case ResponderStatus::PeerClosed:       return "peer closed";
        case ResponderStatus::TransportError:   return "transport error";
        case ResponderStatus::Cancelled:        return "cancelled";
    }
    return "unknown";
}

UdpTransferResponder::UdpTransferResponder(std::unique_ptr<ISocket> sock, const sockaddr_in& client,
                                           uint64_t file_size, ResponderConfig cfg, Stats* stats,
                                           CancellationToken token)
: sock_(std::move(sock)), client_(client), file_size_(file_size), cfg_(cfg), stats_(stats),
  token_(std::move(token)), total_segments_(segment_count(file_size, cfg.segment_size)) {
    if (cfg_.send_batch == 0) cfg_.send_batch = 1;
}

/**
* @details
* Segments are encoded a batch at a time into reused buffers and handed to
* @ref ISocket::send_batch. When the kernel takes only part of a batch the
* rest is resent after @ref ISocket::wait_writable; a send buffer that stays
* full for @ref ResponderConfig::send_stall_ms counts as a transport error.
*/
ResponderStatus UdpTransferResponder::run() {
    const std::string peer = to_string(client_);
    Logger::info("udp", cat(peer, " requested ", file_size_, " bytes => ",
                            total_segments_, " segments"));

    const std::vector<uint8_t> filler(cfg_.segment_size, 'B');
    std::vector<std::vector<uint8_t>> batch;
    batch.reserve(cfg_.send_batch);
    uint64_t next = 0;

    while (next < total_segments_) {
        if (token_.stop_requested()) {
            Logger::info("udp", cat("shutdown: stopped ", peer, " after ", next, " of ",
                                    total_segments_, " segments"));
            return ResponderStatus::Cancelled;
        }
        const size_t n = static_cast<size_t>(
            std::min<uint64_t>(cfg_.send_batch, total_segments_ - next));
        batch.resize(n);
        for (size_t i = 0; i < n; ++i) {
            const uint64_t idx = next + i;
            const size_t len = segment_length(file_size_, cfg_.segment_size, idx);
            encode_payload(total_segments_, idx, filler.data(), len, batch[i]);
        }

        size_t done = 0;
        while (done < n) {
            std::vector<std::vector<uint8_t>> rest;
            const std::vector<std::vector<uint8_t>>* pending = &batch;
            if (done > 0) {
                rest.assign(batch.begin() + static_cast<std::ptrdiff_t>(done), batch.end());
                pending = &rest;
            }
            ssize_t r = sock_->send_batch(*pending, client_);
            if (r < 0) {
                Logger::error("udp", cat("error sending segment ", next + done, " to ", peer,
                                         ": ", strerror(errno)));
                if (stats_) stats_->inc_transport_errors();
                return ResponderStatus::TransportError;
            }
            if (r == 0 && !sock_->wait_writable(cfg_.send_stall_ms)) {
                Logger::error("udp", cat("send buffer stalled at segment ", next + done, " to ", peer));
                if (stats_) stats_->inc_transport_errors();
                return ResponderStatus::TransportError;
            }
            uint64_t payload = 0;
            for (ssize_t i = 0; i < r; ++i) {
                payload += batch[done + static_cast<size_t>(i)].size() - kPayloadHeaderSize;
            }
            done += static_cast<size_t>(r);
            segments_sent_ += static_cast<uint64_t>(r);
            bytes_sent_ += payload;
            if (stats_ && r > 0) {
                stats_->add_segments(static_cast<uint64_t>(r));
                stats_->add_bytes_sent(payload);
            }
        }
        next += n;
    }

    Logger::info("udp", cat("finished sending ", file_size_, " bytes to ", peer));
    return ResponderStatus::Completed;
}

} // namespace speedtest
