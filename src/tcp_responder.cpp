/**
* @file
* @brief TCP transfer: read the decimal size line, stream that many bytes, close.
*/

#include "speedtest/responder.hpp"
#include "speedtest/logger.hpp"
#include "speedtest/wire.hpp"
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <string>
#include <vector>

namespace speedtest {

TcpTransferResponder::TcpTransferResponder(std::unique_ptr<IStream> stream, ResponderConfig cfg, Stats* stats,
                                           CancellationToken token)
: stream_(std::move(stream)), cfg_(cfg), stats_(stats), token_(std::move(token)) {
    if (cfg_.tcp_chunk == 0) cfg_.tcp_chunk = 1;
    if (cfg_.tcp_poll_ms <= 0) cfg_.tcp_poll_ms = 100;
}

/**
* @details Accumulates reads until the first @c '\n'. Bytes after the newline
* are ignored; the protocol has nothing after the size line. Reads wait in
* slices of @ref ResponderConfig::tcp_poll_ms so a shutdown is noticed before
* the request deadline.
*/
ResponderStatus TcpTransferResponder::read_request() {
    const std::string peer = stream_->peer();
    std::string line;
    uint8_t buf[256];
    const uint64_t deadline = now_ns() + static_cast<uint64_t>(cfg_.tcp_timeout_ms) * 1'000'000ull;

    for (;;) {
        if (token_.stop_requested()) return ResponderStatus::Cancelled;
        const uint64_t now = now_ns();
        const int left_ms = now >= deadline ? 0 : static_cast<int>((deadline - now) / 1'000'000ull);
        ssize_t r = stream_->read_some(buf, sizeof(buf), std::min(left_ms, cfg_.tcp_poll_ms));
        if (r == 0) {
            Logger::warn("tcp", cat(peer, " disconnected before sending a size"));
            return ResponderStatus::PeerClosed;
        }
        if (r < 0) {
            if (errno == ETIMEDOUT) {
                if (now_ns() < deadline) continue;
                Logger::warn("tcp", cat(peer, " sent no size line within ", cfg_.tcp_timeout_ms, " ms"));
                if (stats_) stats_->inc_bad_requests();
                return ResponderStatus::MalformedRequest;
            }
            Logger::error("tcp", cat(peer, " read failed: ", strerror(errno)));
            if (stats_) stats_->inc_transport_errors();
            return ResponderStatus::TransportError;
        }
        line.append(reinterpret_cast<const char*>(buf), static_cast<size_t>(r));
        auto nl = line.find('\n');
        if (nl != std::string::npos) {
            line.resize(nl);
            break;
        }
        if (line.size() > cfg_.max_line) {
            Logger::warn("tcp", cat(peer, " size line exceeds ", cfg_.max_line, " bytes"));
            if (stats_) stats_->inc_bad_requests();
            return ResponderStatus::MalformedRequest;
        }
    }

    auto size = parse_size_line(line);
    if (!size) {
        Logger::warn("tcp", cat("invalid file size '", line, "' from ", peer, ", closing"));
        if (stats_) stats_->inc_bad_requests();
        return ResponderStatus::MalformedRequest;
    }
    requested_ = *size;
    return ResponderStatus::Completed;
}

ResponderStatus TcpTransferResponder::run() {
    const std::string peer = stream_->peer();
    ResponderStatus st = read_request();
    if (st != ResponderStatus::Completed) return st;

    Logger::info("tcp", cat(peer, " requested ", requested_, " bytes"));

    const std::vector<uint8_t> filler(cfg_.tcp_chunk, 'A');
    while (bytes_sent_ < requested_) {
        if (token_.stop_requested()) {
            Logger::info("tcp", cat("shutdown: stopped ", peer, " after ", bytes_sent_, " bytes"));
            return ResponderStatus::Cancelled;
        }
        const size_t n = static_cast<size_t>(std::min<uint64_t>(cfg_.tcp_chunk, requested_ - bytes_sent_));
        if (stream_->write_all(filler.data(), n) < 0) {
            Logger::error("tcp", cat("error with ", peer, " after ", bytes_sent_, " bytes: ", strerror(errno)));
            if (stats_) stats_->inc_transport_errors();
            return ResponderStatus::TransportError;
        }
        bytes_sent_ += n;
        if (stats_) stats_->add_bytes_sent(n);
    }

    Logger::info("tcp", cat("done sending ", requested_, " bytes to ", peer));
    return ResponderStatus::Completed;
}

} // namespace speedtest
