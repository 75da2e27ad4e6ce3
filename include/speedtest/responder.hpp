#pragma once
#include <cstdint>
#include <memory>
#include <netinet/in.h>
#include "speedtest/cancel.hpp"
#include "speedtest/common.hpp"
#include "speedtest/socket.hpp"
#include "speedtest/tcp.hpp"
#include "speedtest/stats.hpp"

/**
* @file
* @brief Server-side transfer tasks: one per UDP request, one per TCP connection.
*
* A responder owns its socket or stream for its whole life and shares nothing
* mutable with its siblings except the relaxed counters in @ref speedtest::Stats.
* A failure inside one responder ends that responder only.
*/

namespace speedtest {

/// @brief How a responder ended.
enum class ResponderStatus {
    Completed,        ///< Every requested byte was handed to the kernel.
    MalformedRequest, ///< TCP size line missing, too long, or not a non-negative integer.
    PeerClosed,       ///< The client went away before sending its size line.
    TransportError,   ///< A send or receive failed mid-transfer.
    Cancelled,        ///< Server shutdown stopped the transfer early.
};

const char* to_string(ResponderStatus s);

/**
* @brief Knobs shared by both responder kinds.
*/
struct ResponderConfig {
    size_t segment_size    = kSegmentSize; ///< UDP payload bytes per segment.
    size_t send_batch      = 32;           ///< Segments per @c sendmmsg.
    int    send_stall_ms   = 1000;         ///< Max wait for a full UDP send buffer to drain.
    size_t tcp_chunk       = 1024;         ///< Bytes per TCP write.
    int    tcp_timeout_ms  = 5000;         ///< Deadline for the size line, and per TCP send.
    int    tcp_poll_ms     = 100;          ///< Read slice while waiting for the size line.
    size_t max_line        = 64;           ///< Longest acceptable TCP size line.
};

/**
* @brief Streams @c file_size bytes to one client as numbered UDP segments.
*
* @details
* Sends @c ceil(file_size / segment_size) payload datagrams, indices 0..n-1 in
* order, each carrying filler bytes. No pacing, no retransmission: the kernel
* takes segments as fast as it can and loss is what the client measures. A
* send error abandons the remaining segments of this session only.
*
* The token is checked before every batch; once it is cancelled the remaining
* segments are dropped and @ref run returns @ref ResponderStatus::Cancelled.
*/
class UdpTransferResponder {
public:
    /**
     * @param sock      Socket owned by this session (ephemeral port).
     * @param client    Address the request came from.
     * @param file_size Requested byte count.
     * @param cfg       Segment size and batching.
     * @param stats     Optional server counters (not owned).
     * @param token     Server shutdown signal; a default token is never cancelled.
     */
    UdpTransferResponder(std::unique_ptr<ISocket> sock, const sockaddr_in& client,
                         uint64_t file_size, ResponderConfig cfg, Stats* stats = nullptr,
                         CancellationToken token = {});

    /// @brief Send every segment; blocking, runs on the caller's thread.
    ResponderStatus run();

    uint64_t total_segments() const { return total_segments_; }
    uint64_t segments_sent() const { return segments_sent_; }
    uint64_t payload_bytes_sent() const { return bytes_sent_; }

private:
    std::unique_ptr<ISocket> sock_;
    sockaddr_in     client_;
    uint64_t        file_size_;
    ResponderConfig cfg_;
    Stats*          stats_;
    CancellationToken token_;
    uint64_t        total_segments_;
    uint64_t        segments_sent_{0};
    uint64_t        bytes_sent_{0};
};

/**
* @brief Serves one accepted TCP connection.
*
* @details
* Reads the client's decimal size line (terminated by @c '\n'), then writes
* exactly that many filler bytes in @ref ResponderConfig::tcp_chunk pieces and
* lets the stream close on destruction. A missing newline within
* @ref ResponderConfig::tcp_timeout_ms, an overlong line, or a line that is
* not a non-negative integer ends the connection with
* @ref ResponderStatus::MalformedRequest. The token is checked between read
* slices and between chunks, so shutdown ends the connection with
* @ref ResponderStatus::Cancelled.
*/
class TcpTransferResponder {
public:
    TcpTransferResponder(std::unique_ptr<IStream> stream, ResponderConfig cfg, Stats* stats = nullptr,
                         CancellationToken token = {});

    ResponderStatus run();

    /// @brief Size parsed from the request line (0 until parsed).
    uint64_t requested() const { return requested_; }
    uint64_t bytes_sent() const { return bytes_sent_; }

private:
    ResponderStatus read_request();

    std::unique_ptr<IStream> stream_;
    ResponderConfig cfg_;
    Stats*          stats_;
    CancellationToken token_;
    uint64_t        requested_{0};
    uint64_t        bytes_sent_{0};
};

} // namespace speedtest
