#pragma once
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <unordered_set>
#include <netinet/in.h>
#include "speedtest/common.hpp"
#include "speedtest/discovery.hpp"
#include "speedtest/socket.hpp"
#include "speedtest/tcp.hpp"
#include "speedtest/wire.hpp"

/**
* @file
* @brief Client-side download workers and their result record.
*
* A worker owns its own socket, measures its own time, and produces exactly
* one @ref speedtest::WorkerResult. Failures are recorded in the result, never
* thrown to the caller, so one worker cannot disturb its siblings.
*/

namespace speedtest {

enum class Transport { Tcp, Udp };

const char* to_string(Transport t);

/**
* @brief Outcome of one timed download.
*/
struct WorkerResult {
    Transport   transport = Transport::Tcp;
    size_t      number = 0;            ///< 1-based position within its transport.
    /**
     * @brief Measured duration. The two transports use different windows:
     * TCP runs from the start of the connect to the last read; UDP runs from
     * the request to the last segment received, so the closing idle timeout
     * is not counted (to the end of the wait when no segment arrived).
     */
    double      seconds = 0.0;
    uint64_t    bytes = 0;             ///< Payload bytes received.
    double      bits_per_second = 0.0; ///< @c bytes*8/seconds, 0 when @c seconds is 0.
    double      delivery_ratio = 0.0;  ///< UDP: distinct segments / total segments (0 if none seen).
    uint64_t    segments_received = 0; ///< UDP: distinct indices.
    uint64_t    total_segments = 0;    ///< UDP: from the first segment seen.
    bool        ok = true;             ///< False if a transport error cut the run short.
    std::string error;                 ///< Reason when @ref ok is false.
};

/// @brief @c bytes*8/seconds, or 0 for a non-positive duration.
inline double bits_per_second(uint64_t bytes, double seconds) {
    return seconds > 0.0 ? static_cast<double>(bytes) * 8.0 / seconds : 0.0;
}

/**
* @brief Bookkeeping for one UDP session on the receiving side.
*
* @details
* - @c total_segments is taken from the first valid segment and never changes.
* - Indices are a set: repeats are counted as duplicates, not deliveries.
* - Indices outside @c [0, total_segments) are ignored, so the distinct count
*   never exceeds the total.
*/
class SegmentTracker {
public:
    void observe(const PayloadSegment& seg);

    bool     seen_any() const { return total_.has_value(); }
    uint64_t total_segments() const { return total_.value_or(0); }
    uint64_t distinct() const { return received_.size(); }
    uint64_t duplicates() const { return duplicates_; }
    uint64_t ignored() const { return ignored_; }
    uint64_t payload_bytes() const { return bytes_; }

    /// @brief distinct / total, 0 when no segment was seen or the total is 0.
    double delivery_ratio() const;

private:
    std::optional<uint64_t>      total_;
    std::unordered_set<uint64_t> received_;
    uint64_t duplicates_{0};
    uint64_t ignored_{0};
    uint64_t bytes_{0};
};

struct WorkerConfig {
    int    connect_timeout_ms  = 5000;            ///< TCP handshake deadline.
    int    tcp_read_timeout_ms = 5000;            ///< Silence that ends a TCP download early.
    int    udp_idle_timeout_ms = kUdpIdleTimeout; ///< Gap that ends a UDP download.
    size_t read_chunk          = 4096;            ///< TCP read size.
};

/// @brief Opens the TCP stream a worker downloads over. May throw @ref TransportError.
using StreamConnector = std::function<std::unique_ptr<IStream>()>;

/// @brief Connector that dials @p ip:@p port with @ref TcpStream::connect.
StreamConnector tcp_connector(const std::string& ip, uint16_t port, int timeout_ms);

/**
* @brief Downloads @c file_size bytes over one TCP connection.
*
* @details Sends @c "<file_size>\n", then reads until @c file_size bytes have
* arrived, the peer closes, or nothing arrives for
* @ref WorkerConfig::tcp_read_timeout_ms. A short read is reported as-is. Time
* runs from the start of the connect to the last read.
*/
class TcpTransferWorker {
public:
    TcpTransferWorker(StreamConnector connect, uint64_t file_size, size_t number, WorkerConfig cfg);

    WorkerResult run();

private:
    StreamConnector connect_;
    uint64_t        file_size_;
    size_t          number_;
    WorkerConfig    cfg_;
};

/**
* @brief Requests @c file_size bytes over UDP and counts the segments that arrive.
*
* @details Sends one Request, then receives until no datagram arrives for
* @ref WorkerConfig::udp_idle_timeout_ms. The protocol has no end-of-stream
* marker, so that silence is taken as the end of the transfer; a sender that
* pauses longer than the timeout will look finished. Time runs from the
* request to the last segment received (to the end of the wait when none
* arrive), so the trailing idle gap does not dilute the rate.
*/
class UdpTransferWorker {
public:
    UdpTransferWorker(std::unique_ptr<ISocket> sock, const sockaddr_in& server,
                      uint64_t file_size, size_t number, WorkerConfig cfg);

    WorkerResult run();

private:
    std::unique_ptr<ISocket> sock_;
    sockaddr_in     server_;
    uint64_t        file_size_;
    size_t          number_;
    WorkerConfig    cfg_;
};

} // namespace speedtest
