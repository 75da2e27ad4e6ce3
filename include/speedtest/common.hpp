#pragma once
#include <cstdint>
#include <cstddef>
#include <cstdio>
#include <string>
#include <chrono>
#include <stdexcept>

/**
* @file
* @brief Protocol constants and tiny shared utilities for the speedtest tool.
*
* This header defines the numbers both sides of the protocol agree on (magic
* cookie, message tags, well-known ports, default sizes and intervals) plus:
*  - a monotonic nanosecond timestamp provider (@ref speedtest::now_ns),
*  - a human-readable bit-rate formatter (@ref speedtest::human_bps),
*  - the exception type thrown on socket setup failures (@ref speedtest::TransportError).
*
* @note All functions here are thread-safe and lock-free.
*/

namespace speedtest {

/**
* @brief Magic cookie carried in the first four bytes of every datagram.
*
* Receivers silently drop anything whose cookie does not match.
*/
static constexpr uint32_t kMagic = 0xABCDDCBA;

/// @brief Message type tags (fifth byte of every datagram).
enum class MessageType : uint8_t {
    Offer   = 0x2,
    Request = 0x3,
    Payload = 0x4,
};

static constexpr uint16_t kDiscoveryPort     = 13117; ///< Clients listen for offers here.
static constexpr uint16_t kDefaultUdpPort    = 2025;  ///< Server UDP request port.
static constexpr uint16_t kDefaultTcpPort    = 2026;  ///< Server TCP listen port.
static constexpr size_t   kSegmentSize       = 1024;  ///< Payload bytes per UDP segment.
static constexpr int      kBroadcastInterval = 1000;  ///< Offer period (ms).
static constexpr int      kUdpIdleTimeout    = 1000;  ///< Receive gap that ends a UDP download (ms).
static constexpr size_t   kMaxDatagram       = 65536; ///< Receive buffer for one datagram.

/**
* @brief Raised when a socket cannot be created, bound, connected, or configured.
*
* Hot-path I/O does not throw; it returns -1 with @c errno set. This type only
* covers setup, and is always caught at the boundary of the task that owns the
* socket (a worker, a responder, or @c main).
*/
class TransportError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
* @brief Returns a monotonic timestamp in nanoseconds.
*
* @details Uses @c std::chrono::steady_clock so it will not jump backwards if
*          the system wall clock is adjusted (e.g., by NTP). Only differences
*          between two calls are meaningful.
*/
inline uint64_t now_ns() {
    using namespace std::chrono;
    return duration_cast<nanoseconds>(steady_clock::now().time_since_epoch()).count();
}

/**
* @brief Formats a bit rate as a human-readable string.
*
* @param v Rate in bits per second.
* @return e.g. @c "500.00 bps", @c "12.34 Kbps", @c "1.23 Mbps", @c "4.56 Gbps".
*
* @warning Intended for logs, not for machine parsing.
*/
inline std::string human_bps(double v) {
    char buf[64];
    if (v > 1e9) snprintf(buf, sizeof(buf), "%.2f Gbps", v / 1e9);
    else if (v > 1e6) snprintf(buf, sizeof(buf), "%.2f Mbps", v / 1e6);
    else if (v > 1e3) snprintf(buf, sizeof(buf), "%.2f Kbps", v / 1e3);
    else snprintf(buf, sizeof(buf), "%.2f bps", v);
    return std::string(buf);
}

} // namespace speedtest
