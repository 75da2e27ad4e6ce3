#pragma once
#include <vector>
#include <string>
#include <cstdint>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

/**
* @file
* @brief Datagram socket abstraction (offers, requests, segments) plus a test double.
*
* This header defines:
*  - @ref speedtest::ISocket : the port interface the broadcaster, dispatcher,
*    responders, discovery listener and workers depend on,
*  - @ref speedtest::UdpSocket : the POSIX/Linux implementation,
*  - @ref speedtest::MockSocket : an in-memory test double,
*  - a few IPv4 address helpers.
*
* Core logic receives its sockets by injection, which keeps every protocol
* component testable without a network.
*
* @note Thread-safety: one task owns one socket. No instance is shared across
*       threads.
*/

namespace speedtest {

/// @brief Build an IPv4 endpoint. @throws TransportError on an unparsable address.
sockaddr_in make_endpoint(const std::string& ip, uint16_t port);

/// @brief Dotted-quad address of @p a.
std::string endpoint_ip(const sockaddr_in& a);

/// @brief @c "ip:port" for logs.
std::string to_string(const sockaddr_in& a);

/**
* @brief Address of the interface that routes to the outside world.
*
* @details Connects a throwaway UDP socket (no packet is sent) and reads its
* local address. Falls back to @c "127.0.0.1" on hosts without a route.
*/
std::string primary_ipv4();

/**
* @brief One received datagram and where it came from.
*/
struct Datagram {
    std::vector<uint8_t> data; ///< Exactly the received bytes after a successful receive.
    sockaddr_in from{};        ///< Sender address.
};

/**
* @brief Abstract datagram socket.
*
* @par Return conventions
* Receive and send calls return a **message count**: 1 (or n for batches) on
* success, 0 when nothing happened (receive timeout, send would block), -1 on
* error with @c errno set. Setup calls (@ref bind, @ref enable_broadcast)
* throw @ref TransportError.
*/
class ISocket {
public:
    virtual ~ISocket() = default;

    /// @brief Underlying descriptor, or -1 if not applicable (e.g., @ref MockSocket).
    virtual int fd() const = 0;

    /**
     * @brief Bind to @c INADDR_ANY:@p port (0 picks an ephemeral port).
     * @param reuseport Also request @c SO_REUSEPORT so several listeners on one
     *                  host can share the discovery port.
     */
    virtual void bind(uint16_t port, bool reuseport) = 0;

    /// @brief Allow sends to a broadcast address (@c SO_BROADCAST).
    virtual void enable_broadcast() = 0;

    /// @brief Locally bound port (host order), 0 if unbound.
    virtual uint16_t local_port() const = 0;

    /**
     * @brief Wait up to @p timeout_ms for one datagram.
     * @return 1 with @p out filled, 0 on timeout, -1 on error.
     */
    virtual ssize_t recv_from(Datagram& out, int timeout_ms) = 0;

    /**
     * @brief Send one datagram to @p to.
     * @return 1 if sent, 0 if the socket would block, -1 on error.
     */
    virtual ssize_t send_to(const std::vector<uint8_t>& buf, const sockaddr_in& to) = 0;

    /**
     * @brief Send every buffer in @p bufs to @p to, in order, in as few syscalls as possible.
     * @return Number of datagrams accepted by the kernel (may be short if it
     *         would block), or -1 on error.
     */
    virtual ssize_t send_batch(const std::vector<std::vector<uint8_t>>& bufs,
                               const sockaddr_in& to) = 0;

    /**
     * @brief Wait until the socket can accept another send.
     * @return true if writable, false on timeout or error.
     */
    virtual bool wait_writable(int timeout_ms) = 0;

    /// @brief Hint @c SO_RCVBUF. Default no-op.
    virtual void set_rcvbuf(int bytes);

    /// @brief Hint @c SO_SNDBUF. Default no-op.
    virtual void set_sndbuf(int bytes);
};

/**
* @brief Non-blocking IPv4 UDP socket.
*
* Receives wait in @c poll() so a timeout is always observed. Batch sends use
* @c sendmmsg on Linux and fall back to a @c sendto loop elsewhere.
*/
class UdpSocket : public ISocket {
public:
    UdpSocket();
    ~UdpSocket() override;

    UdpSocket(const UdpSocket&) = delete;
    UdpSocket& operator=(const UdpSocket&) = delete;

    int fd() const override { return sockfd_; }
    void bind(uint16_t port, bool reuseport) override;
    void enable_broadcast() override;
    uint16_t local_port() const override;
    ssize_t recv_from(Datagram& out, int timeout_ms) override;
    ssize_t send_to(const std::vector<uint8_t>& buf, const sockaddr_in& to) override;
    ssize_t send_batch(const std::vector<std::vector<uint8_t>>& bufs,
                       const sockaddr_in& to) override;
    bool wait_writable(int timeout_ms) override;
    void set_rcvbuf(int bytes) override;
    void set_sndbuf(int bytes) override;

private:
    int sockfd_; ///< Owned descriptor.
};

/**
* @brief In-memory test double for @ref ISocket (no real network I/O).
*
* @details
* - @ref recv_from replays datagrams queued with @ref preload_recv, then
*   reports a timeout (0) immediately once the queue is drained.
* - @ref send_to and @ref send_batch record every datagram with its destination.
* - @ref fail_sends_after makes sends fail with -1 after a number of datagrams.
*/
class MockSocket : public ISocket {
public:
    struct Sent {
        std::vector<uint8_t> data;
        sockaddr_in to{};
    };

    int fd() const override { return -1; }
    void bind(uint16_t port, bool) override { port_ = port ? port : 40000; }
    void enable_broadcast() override { broadcast_ = true; }
    uint16_t local_port() const override { return port_; }
    ssize_t recv_from(Datagram& out, int timeout_ms) override;
    ssize_t send_to(const std::vector<uint8_t>& buf, const sockaddr_in& to) override;
    ssize_t send_batch(const std::vector<std::vector<uint8_t>>& bufs,
                       const sockaddr_in& to) override;
    bool wait_writable(int) override { return true; }

    // ---------------------- Test hooks ----------------------

    /// @brief Queue a datagram for a later @ref recv_from, as if sent from @p from.
    void preload_recv(const std::vector<uint8_t>& pkt, const sockaddr_in& from) {
        rx_store_.push_back(Datagram{pkt, from});
    }

    /// @brief Let @p n more datagrams through, then fail every send with -1.
    void fail_sends_after(size_t n) { send_budget_ = static_cast<long long>(n); }

    bool broadcast_enabled() const { return broadcast_; }
    size_t sent_count() const { return tx_store_.size(); }
    const std::vector<Sent>& sent() const { return tx_store_; }

private:
    std::vector<Datagram> rx_store_;
    std::vector<Sent>     tx_store_;
    size_t    recv_cursor_ = 0;
    long long send_budget_ = -1; ///< -1 = unlimited.
    uint16_t  port_ = 0;
    bool      broadcast_ = false;
};

} // namespace speedtest
