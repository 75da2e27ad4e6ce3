/**
* @file
* @brief POSIX TCP stream/listener and the in-memory MockStream.
*
* Reads wait in `poll()` so a silent peer is observed as a timeout; writes
* use `MSG_NOSIGNAL` so a reset peer surfaces as `EPIPE` rather than killing
* the process.
*/

#include "speedtest/tcp.hpp"
#include "speedtest/common.hpp"
#include "speedtest/socket.hpp"
#include <arpa/inet.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <poll.h>
#include <fcntl.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <algorithm>

namespace speedtest {

/// \cond INTERNAL
static int wait_fd(int fd, short events, int timeout_ms) {
    pollfd p{};
    p.fd = fd;
    p.events = events;
    int r;
    do {
        r = ::poll(&p, 1, timeout_ms);
    } while (r < 0 && errno == EINTR);
    return r;
}

static std::string errno_text() {
    return std::string(strerror(errno));
}
/// \endcond

TcpStream::TcpStream(int fd, std::string peer) : fd_(fd), peer_(std::move(peer)) {}

TcpStream::~TcpStream() {
    if (fd_ >= 0) ::close(fd_);
}

/**
* @details Connects in non-blocking mode so @p timeout_ms bounds the
* handshake, then switches the descriptor back to blocking for the transfer.
*/
std::unique_ptr<TcpStream> TcpStream::connect(const std::string& ip, uint16_t port, int timeout_ms) {
    sockaddr_in addr = make_endpoint(ip, port);
    int s = ::socket(AF_INET, SOCK_STREAM, 0);
    if (s < 0) throw TransportError("socket() failed: " + errno_text());
    auto stream = std::make_unique<TcpStream>(s, to_string(addr));

    int flags = fcntl(s, F_GETFL, 0);
    fcntl(s, F_SETFL, flags | O_NONBLOCK);
    if (::connect(s, (sockaddr*)&addr, sizeof(addr)) < 0) {
        if (errno != EINPROGRESS)
            throw TransportError("connect(" + to_string(addr) + ") failed: " + errno_text());
        int r = wait_fd(s, POLLOUT, timeout_ms);
        if (r == 0) throw TransportError("connect(" + to_string(addr) + ") timed out");
        if (r < 0) throw TransportError("connect(" + to_string(addr) + ") failed: " + errno_text());
        int err = 0;
        socklen_t len = sizeof(err);
        getsockopt(s, SOL_SOCKET, SO_ERROR, &err, &len);
        if (err != 0)
            throw TransportError("connect(" + to_string(addr) + ") failed: " + std::string(strerror(err)));
    }
    fcntl(s, F_SETFL, flags & ~O_NONBLOCK);
    return stream;
}

ssize_t TcpStream::read_some(uint8_t* buf, size_t len, int timeout_ms) {
    int ready = wait_fd(fd_, POLLIN, timeout_ms);
    if (ready == 0) {
        errno = ETIMEDOUT;
        return -1;
    }
    if (ready < 0) return -1;
    ssize_t r;
    do {
        r = ::recv(fd_, buf, len, 0);
    } while (r < 0 && errno == EINTR);
    return r;
}

ssize_t TcpStream::write_all(const uint8_t* data, size_t len) {
    size_t off = 0;
    while (off < len) {
        ssize_t w = ::send(fd_, data + off, len - off, MSG_NOSIGNAL);
        if (w < 0) {
            if (errno == EINTR) continue;
            return -1;
        }
        off += static_cast<size_t>(w);
    }
    return static_cast<ssize_t>(len);
}

void TcpStream::set_send_timeout(int timeout_ms) {
    timeval tv{};
    tv.tv_sec  = timeout_ms / 1000;
    tv.tv_usec = (timeout_ms % 1000) * 1000;
    setsockopt(fd_, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
}

TcpListener::TcpListener(uint16_t port, int backlog) : fd_(::socket(AF_INET, SOCK_STREAM, 0)) {
    if (fd_ < 0) throw TransportError("socket() failed: " + errno_text());
    int one = 1;
    setsockopt(fd_, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = INADDR_ANY;
    addr.sin_port = htons(port);
    if (::bind(fd_, (sockaddr*)&addr, sizeof(addr)) < 0 || ::listen(fd_, backlog) < 0) {
        std::string why = errno_text();
        ::close(fd_);
        fd_ = -1;
        throw TransportError("tcp listen on " + std::to_string(port) + " failed: " + why);
    }
}

TcpListener::~TcpListener() {
    if (fd_ >= 0) ::close(fd_);
}

std::unique_ptr<TcpStream> TcpListener::poll_accept(int timeout_ms) {
    int ready = wait_fd(fd_, POLLIN, timeout_ms);
    if (ready <= 0) {
        if (ready == 0) errno = 0;
        return nullptr;
    }
    sockaddr_in peer{};
    socklen_t plen = sizeof(peer);
    int c;
    do {
        c = ::accept(fd_, (sockaddr*)&peer, &plen);
    } while (c < 0 && errno == EINTR);
    if (c < 0) {
        if (errno == EAGAIN || errno == EWOULDBLOCK) errno = 0;
        return nullptr;
    }
    int one = 1;
    setsockopt(c, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));
    return std::make_unique<TcpStream>(c, to_string(peer));
}

uint16_t TcpListener::local_port() const {
    sockaddr_in addr{};
    socklen_t len = sizeof(addr);
    if (getsockname(fd_, (sockaddr*)&addr, &len) < 0) return 0;
    return ntohs(addr.sin_port);
}

ssize_t MockStream::read_some(uint8_t* buf, size_t len, int) {
    if (cursor_ >= input_.size()) {
        if (hold_open_) {
            errno = ETIMEDOUT;
            return -1;
        }
        return 0;
    }
    size_t n = std::min({len, read_chunk_, input_.size() - cursor_});
    std::memcpy(buf, input_.data() + cursor_, n);
    cursor_ += n;
    return static_cast<ssize_t>(n);
}

ssize_t MockStream::write_all(const uint8_t* data, size_t len) {
    ++write_calls_;
    if (write_budget_ >= 0) {
        if (static_cast<size_t>(write_budget_) < len) {
            output_.append(reinterpret_cast<const char*>(data), static_cast<size_t>(write_budget_));
            write_budget_ = 0;
            errno = EPIPE;
            return -1;
        }
        write_budget_ -= static_cast<long long>(len);
    }
    output_.append(reinterpret_cast<const char*>(data), len);
    return static_cast<ssize_t>(len);
}

} // namespace speedtest
