/**
* @file
* @brief POSIX/Linux UDP socket implementation and in-memory MockSocket.
*
* @details
*  - `speedtest::UdpSocket`: non-blocking IPv4 UDP socket. Receives wait in
*    `poll()` with a bounded timeout; batch sends use `sendmmsg` when
*    available and fall back to a `sendto` loop otherwise.
*  - `speedtest::MockSocket`: replays preloaded datagrams and captures sent
*    ones for assertions.
*
* Transient `EAGAIN`/`EWOULDBLOCK` map to a return value of 0 messages;
* `EINTR` is retried.
*/

#include "speedtest/socket.hpp"
#include "speedtest/common.hpp"
#include <arpa/inet.h>
#include <poll.h>
#include <fcntl.h>
#include <cerrno>
#include <cstring>
#include <algorithm>

namespace speedtest {

sockaddr_in make_endpoint(const std::string& ip, uint16_t port) {
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    if (inet_pton(AF_INET, ip.c_str(), &addr.sin_addr) != 1)
        throw TransportError("invalid IPv4 address: '" + ip + "'");
    return addr;
}

std::string endpoint_ip(const sockaddr_in& a) {
    char buf[INET_ADDRSTRLEN] = {0};
    inet_ntop(AF_INET, &a.sin_addr, buf, sizeof(buf));
    return std::string(buf);
}

std::string to_string(const sockaddr_in& a) {
    return endpoint_ip(a) + ":" + std::to_string(ntohs(a.sin_port));
}

std::string primary_ipv4() {
    int s = ::socket(AF_INET, SOCK_DGRAM, 0);
    if (s < 0) return "127.0.0.1";
    std::string ip = "127.0.0.1";
    sockaddr_in probe{};
    probe.sin_family = AF_INET;
    probe.sin_port = htons(80);
    inet_pton(AF_INET, "8.8.8.8", &probe.sin_addr);
    if (::connect(s, (sockaddr*)&probe, sizeof(probe)) == 0) {
        sockaddr_in local{};
        socklen_t len = sizeof(local);
        if (getsockname(s, (sockaddr*)&local, &len) == 0) ip = endpoint_ip(local);
    }
    ::close(s);
    return ip;
}

void ISocket::set_rcvbuf(int bytes) {
    (void)bytes; // default no-op; concrete implementations may override
}

void ISocket::set_sndbuf(int bytes) {
    (void)bytes; // default no-op; concrete implementations may override
}

/// \cond INTERNAL
/**
* @brief Create a non-blocking IPv4 UDP socket.
* @throws TransportError if `socket()` fails.
*/
static int make_socket() {
    int s = ::socket(AF_INET, SOCK_DGRAM, 0);
    if (s < 0) throw TransportError("socket() failed: " + std::string(strerror(errno)));
    int flags = fcntl(s, F_GETFL, 0);
    fcntl(s, F_SETFL, flags | O_NONBLOCK);
    return s;
}

/// @brief `poll()` one descriptor, retrying on EINTR. Returns >0 ready, 0 timeout, -1 error.
static int poll_one(int fd, short events, int timeout_ms) {
    pollfd p{};
    p.fd = fd;
    p.events = events;
    for (;;) {
        int r = ::poll(&p, 1, timeout_ms);
        if (r < 0 && errno == EINTR) continue;
        if (r > 0 && (p.revents & (POLLERR | POLLNVAL)) && !(p.revents & events)) {
            errno = EIO;
            return -1;
        }
        return r;
    }
}
/// \endcond

UdpSocket::UdpSocket() : sockfd_(make_socket()) {
    int one = 1;
    setsockopt(sockfd_, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));
}

UdpSocket::~UdpSocket() {
    if (sockfd_ >= 0) ::close(sockfd_);
}

void UdpSocket::bind(uint16_t port, bool reuseport) {
    if (reuseport) {
#ifdef SO_REUSEPORT
        int one = 1;
        setsockopt(sockfd_, SOL_SOCKET, SO_REUSEPORT, &one, sizeof(one));
#endif
    }
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = INADDR_ANY;
    addr.sin_port = htons(port);
    if (::bind(sockfd_, (sockaddr*)&addr, sizeof(addr)) < 0)
        throw TransportError("bind(" + std::to_string(port) + ") failed: " + std::string(strerror(errno)));
}

void UdpSocket::enable_broadcast() {
    int one = 1;
    if (setsockopt(sockfd_, SOL_SOCKET, SO_BROADCAST, &one, sizeof(one)) < 0)
        throw TransportError("SO_BROADCAST failed: " + std::string(strerror(errno)));
}

uint16_t UdpSocket::local_port() const {
    sockaddr_in addr{};
    socklen_t len = sizeof(addr);
    if (getsockname(sockfd_, (sockaddr*)&addr, &len) < 0) return 0;
    return ntohs(addr.sin_port);
}

/**
* @details Waits in `poll()` first so the call never blocks longer than
* @p timeout_ms, then drains exactly one datagram with `recvfrom`. A wakeup
* that finds nothing to read (another reader, spurious readiness) is a timeout.
*/
ssize_t UdpSocket::recv_from(Datagram& out, int timeout_ms) {
    int ready = poll_one(sockfd_, POLLIN, timeout_ms);
    if (ready <= 0) return ready;

    out.data.resize(kMaxDatagram);
    socklen_t alen = sizeof(out.from);
    ssize_t r;
    do {
        r = ::recvfrom(sockfd_, out.data.data(), out.data.size(), 0, (sockaddr*)&out.from, &alen);
    } while (r < 0 && errno == EINTR);
    if (r < 0) {
        out.data.clear();
        if (errno == EAGAIN || errno == EWOULDBLOCK) return 0;
        return -1;
    }
    out.data.resize(static_cast<size_t>(r));
    return 1;
}

ssize_t UdpSocket::send_to(const std::vector<uint8_t>& buf, const sockaddr_in& to) {
    ssize_t r;
    do {
        r = ::sendto(sockfd_, buf.data(), buf.size(), 0, (const sockaddr*)&to, sizeof(to));
    } while (r < 0 && errno == EINTR);
    if (r < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) return 0;
    if (r < 0) return -1;
    return 1;
}

/**
* @details Linux fast-path: one `sendmmsg()` covering the whole batch; the
* kernel may accept fewer messages than offered when the send buffer fills,
* and the caller resumes from the returned count.
*
* Fallback: a `sendto` loop that stops at the first would-block or error.
*/
ssize_t UdpSocket::send_batch(const std::vector<std::vector<uint8_t>>& bufs, const sockaddr_in& to) {
    if (bufs.empty()) return 0;
#if defined(__linux__)
    const size_t n = bufs.size();
    std::vector<iovec> iov(n);
    std::vector<mmsghdr> msgs(n);
    for (size_t i = 0; i < n; i++) {
        iov[i].iov_base = const_cast<uint8_t*>(bufs[i].data());
        iov[i].iov_len  = bufs[i].size();
        std::memset(&msgs[i], 0, sizeof(mmsghdr));
        msgs[i].msg_hdr.msg_iov     = &iov[i];
        msgs[i].msg_hdr.msg_iovlen  = 1;
        msgs[i].msg_hdr.msg_name    = const_cast<sockaddr_in*>(&to);
        msgs[i].msg_hdr.msg_namelen = sizeof(sockaddr_in);
    }
    int r;
    do {
        r = ::sendmmsg(sockfd_, msgs.data(), static_cast<unsigned>(n), 0);
    } while (r < 0 && errno == EINTR);
    if (r < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) return 0;
    if (r < 0) return -1;
    return r;
#else
    ssize_t cnt = 0;
    for (auto& b : bufs) {
        ssize_t r = send_to(b, to);
        if (r < 0) return cnt ? cnt : -1;
        if (r == 0) break;
        cnt++;
    }
    return cnt;
#endif
}

bool UdpSocket::wait_writable(int timeout_ms) {
    return poll_one(sockfd_, POLLOUT, timeout_ms) > 0;
}

void UdpSocket::set_rcvbuf(int bytes) {
    setsockopt(sockfd_, SOL_SOCKET, SO_RCVBUF, &bytes, sizeof(bytes));
}

void UdpSocket::set_sndbuf(int bytes) {
    setsockopt(sockfd_, SOL_SOCKET, SO_SNDBUF, &bytes, sizeof(bytes));
}

ssize_t MockSocket::recv_from(Datagram& out, int) {
    if (recv_cursor_ >= rx_store_.size()) return 0;
    out = rx_store_[recv_cursor_++];
    return 1;
}

ssize_t MockSocket::send_to(const std::vector<uint8_t>& buf, const sockaddr_in& to) {
    if (send_budget_ == 0) {
        errno = EPIPE;
        return -1;
    }
    if (send_budget_ > 0) --send_budget_;
    tx_store_.push_back(Sent{buf, to});
    return 1;
}

ssize_t MockSocket::send_batch(const std::vector<std::vector<uint8_t>>& bufs, const sockaddr_in& to) {
    ssize_t cnt = 0;
    for (auto& b : bufs) {
        if (send_to(b, to) < 0) return cnt ? cnt : -1;
        cnt++;
    }
    return cnt;
}

} // namespace speedtest
