#pragma once
#include <atomic>
#include <cstdint>
#include <sstream>
#include <string>

/**
* @file
* @brief Lock-free server counters shared by the broadcaster, dispatcher and responders.
*
* @note The counters use @c memory_order_relaxed because only their values
*       matter, not the ordering between them. A snapshot taken by
*       @ref speedtest::Stats::to_string may mix slightly different instants.
*/

namespace speedtest {

/**
* @brief Server-wide counters.
*
* @par Thread-safety
* Every member is a relaxed atomic; any thread may update or read them.
*
* @code
* speedtest::Stats s;
* s.inc_offers();
* s.add_bytes_sent(1024);
* s.to_string(); // "offers=1 udp_requests=0 tcp_connections=0 segments=0 bytes=1024 ..."
* @endcode
*/
class Stats {
public:
    void inc_offers()            { offers_.fetch_add(1, std::memory_order_relaxed); }
    void inc_udp_requests()      { udp_requests_.fetch_add(1, std::memory_order_relaxed); }
    void inc_tcp_connections()   { tcp_connections_.fetch_add(1, std::memory_order_relaxed); }
    void inc_malformed()         { malformed_.fetch_add(1, std::memory_order_relaxed); }
    void inc_bad_requests()      { bad_requests_.fetch_add(1, std::memory_order_relaxed); }
    void inc_transport_errors()  { transport_errors_.fetch_add(1, std::memory_order_relaxed); }
    void add_segments(uint64_t n){ segments_.fetch_add(n, std::memory_order_relaxed); }
    void add_bytes_sent(uint64_t n) { bytes_sent_.fetch_add(n, std::memory_order_relaxed); }

    /// @brief Responder bookkeeping: +1 when a task starts, -1 when it ends.
    void responder_started()  { active_.fetch_add(1, std::memory_order_relaxed); }
    void responder_finished() { active_.fetch_sub(1, std::memory_order_relaxed); }

    uint64_t offers() const           { return offers_.load(std::memory_order_relaxed); }
    uint64_t udp_requests() const     { return udp_requests_.load(std::memory_order_relaxed); }
    uint64_t tcp_connections() const  { return tcp_connections_.load(std::memory_order_relaxed); }
    uint64_t malformed() const        { return malformed_.load(std::memory_order_relaxed); }
    uint64_t bad_requests() const     { return bad_requests_.load(std::memory_order_relaxed); }
    uint64_t transport_errors() const { return transport_errors_.load(std::memory_order_relaxed); }
    uint64_t segments() const         { return segments_.load(std::memory_order_relaxed); }
    uint64_t bytes_sent() const       { return bytes_sent_.load(std::memory_order_relaxed); }
    int64_t  active_responders() const{ return active_.load(std::memory_order_relaxed); }

    /// @brief One-line snapshot for periodic logs.
    std::string to_string() const {
        std::ostringstream oss;
        oss << "offers=" << offers()
            << " udp_requests=" << udp_requests()
            << " tcp_connections=" << tcp_connections()
            << " segments=" << segments()
            << " bytes=" << bytes_sent()
            << " malformed=" << malformed()
            << " bad_requests=" << bad_requests()
            << " errors=" << transport_errors()
            << " active=" << active_responders();
        return oss.str();
    }

private:
    std::atomic<uint64_t> offers_{0};
    std::atomic<uint64_t> udp_requests_{0};
    std::atomic<uint64_t> tcp_connections_{0};
    std::atomic<uint64_t> malformed_{0};
    std::atomic<uint64_t> bad_requests_{0};
    std::atomic<uint64_t> transport_errors_{0};
    std::atomic<uint64_t> segments_{0};
    std::atomic<uint64_t> bytes_sent_{0};
    std::atomic<int64_t>  active_{0};
};

} // namespace speedtest
