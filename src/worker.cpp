/**
* @file
* @brief TCP and UDP download workers, segment tracking.
*/

#include "speedtest/worker.hpp"
#include "speedtest/logger.hpp"
#include <cerrno>
#include <cstring>
#include <variant>
#include <vector>

namespace speedtest {

const char* to_string(Transport t) {
    return t == Transport::Tcp ? "TCP" : "UDP";
}

void SegmentTracker::observe(const PayloadSegment& seg) {
    if (!total_) total_ = seg.total_segments;
    bytes_ += seg.payload.size();
    if (seg.segment_index >= *total_) {
        ++ignored_;
        return;
    }
    if (!received_.insert(seg.segment_index).second) ++duplicates_;
}

double SegmentTracker::delivery_ratio() const {
    if (!total_ || *total_ == 0) return 0.0;
    return static_cast<double>(received_.size()) / static_cast<double>(*total_);
}

StreamConnector tcp_connector(const std::string& ip, uint16_t port, int timeout_ms) {
    return [ip, port, timeout_ms]() -> std::unique_ptr<IStream> {
        return TcpStream::connect(ip, port, timeout_ms);
    };
}

/// \cond INTERNAL
static double seconds_between(uint64_t from_ns, uint64_t to_ns) {
    return to_ns > from_ns ? static_cast<double>(to_ns - from_ns) / 1e9 : 0.0;
}
/// \endcond

TcpTransferWorker::TcpTransferWorker(StreamConnector connect, uint64_t file_size, size_t number, WorkerConfig cfg)
: connect_(std::move(connect)), file_size_(file_size), number_(number), cfg_(cfg) {
    if (cfg_.read_chunk == 0) cfg_.read_chunk = 4096;
}

WorkerResult TcpTransferWorker::run() {
    const std::string tag = cat("tcp-", number_);
    WorkerResult res;
    res.transport = Transport::Tcp;
    res.number = number_;

    const uint64_t start = now_ns();
    uint64_t end = start;
    try {
        auto stream = connect_();
        const std::string line = encode_size_line(file_size_);
        if (stream->write_all(reinterpret_cast<const uint8_t*>(line.data()), line.size()) < 0) {
            throw TransportError(cat("sending request failed: ", strerror(errno)));
        }

        std::vector<uint8_t> buf(cfg_.read_chunk);
        while (res.bytes < file_size_) {
            ssize_t r = stream->read_some(buf.data(), buf.size(), cfg_.tcp_read_timeout_ms);
            if (r == 0) break;
            if (r < 0) {
                res.ok = false;
                res.error = errno == ETIMEDOUT ? "read timed out" : cat("read failed: ", strerror(errno));
                break;
            }
            res.bytes += static_cast<uint64_t>(r);
        }
        end = now_ns();
    } catch (const std::exception& e) {
        end = now_ns();
        res.ok = false;
        res.error = e.what();
    }

    res.seconds = seconds_between(start, end);
    res.bits_per_second = bits_per_second(res.bytes, res.seconds);
    if (!res.ok) {
        Logger::warn(tag, cat("Error: ", res.error, " (", res.bytes, " of ", file_size_, " bytes received)"));
    } else if (res.bytes < file_size_) {
        Logger::warn(tag, cat("connection closed early: ", res.bytes, " of ", file_size_, " bytes"));
    }
    return res;
}

UdpTransferWorker::UdpTransferWorker(std::unique_ptr<ISocket> sock, const sockaddr_in& server,
                                     uint64_t file_size, size_t number, WorkerConfig cfg)
: sock_(std::move(sock)), server_(server), file_size_(file_size), number_(number), cfg_(cfg) {}

WorkerResult UdpTransferWorker::run() {
    const std::string tag = cat("udp-", number_);
    WorkerResult res;
    res.transport = Transport::Udp;
    res.number = number_;

    const uint64_t start = now_ns();
    ssize_t sent = sock_->send_to(encode_request(RequestMessage{file_size_}), server_);
    if (sent != 1) {
        res.ok = false;
        res.error = sent < 0 ? cat("sending request failed: ", strerror(errno)) : "request would block";
        Logger::warn(tag, cat("Error: ", res.error));
        return res;
    }

    SegmentTracker tracker;
    Datagram dg;
    uint64_t last = 0;
    for (;;) {
        ssize_t r = sock_->recv_from(dg, cfg_.udp_idle_timeout_ms);
        if (r == 0) break; // silence: transfer assumed finished
        if (r < 0) {
            res.ok = false;
            res.error = cat("receive failed: ", strerror(errno));
            Logger::warn(tag, cat("Error: ", res.error));
            break;
        }
        Message msg = decode(dg.data);
        const auto* seg = std::get_if<PayloadSegment>(&msg);
        if (!seg) continue;
        tracker.observe(*seg);
        last = now_ns();
    }
    const uint64_t end = tracker.seen_any() ? last : now_ns();

    res.seconds = seconds_between(start, end);
    res.bytes = tracker.payload_bytes();
    res.bits_per_second = bits_per_second(res.bytes, res.seconds);
    res.segments_received = tracker.distinct();
    res.total_segments = tracker.total_segments();
    res.delivery_ratio = tracker.delivery_ratio();
    if (tracker.duplicates() || tracker.ignored()) {
        Logger::debug(tag, cat(tracker.duplicates(), " duplicate and ", tracker.ignored(),
                               " out-of-range segments"));
    }
    return res;
}

} // namespace speedtest
