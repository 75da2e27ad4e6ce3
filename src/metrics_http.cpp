/**
* @file
* @brief Minimal `/metrics` HTTP server (Prometheus-like text format).
*
* @details
* Scope & limitations:
*  - Binds to **127.0.0.1** only.
*  - One request -> one response -> close. The request itself is not parsed.
*  - No TLS, no keep-alive, no routing.
*/

#include "speedtest/metrics_http.hpp"
#include "speedtest/logger.hpp"
#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <sstream>

namespace speedtest {

MetricsHttpServer::MetricsHttpServer(const Stats& stats, uint16_t port)
: stats_(stats), port_(port) {}

MetricsHttpServer::~MetricsHttpServer() { stop(); }

void MetricsHttpServer::start() {
    if (port_ == 0) return;
    running_ = true;
    th_ = std::thread(&MetricsHttpServer::run, this);
}

void MetricsHttpServer::stop() {
    if (th_.joinable()) {
        running_ = false;
        th_.join();
    }
}

/// \cond INTERNAL
static void metric(std::ostringstream& oss, const char* name, const char* type,
                   const char* help, long long value) {
    oss << "# HELP " << name << ' ' << help << "\n";
    oss << "# TYPE " << name << ' ' << type << "\n";
    oss << name << ' ' << value << "\n";
}
/// \endcond

std::string MetricsHttpServer::render() const {
    std::ostringstream oss;
    metric(oss, "speedtest_offers_sent_total", "counter", "Offer broadcasts sent",
           static_cast<long long>(stats_.offers()));
    metric(oss, "speedtest_udp_requests_total", "counter", "UDP transfer requests received",
           static_cast<long long>(stats_.udp_requests()));
    metric(oss, "speedtest_tcp_connections_total", "counter", "TCP connections accepted",
           static_cast<long long>(stats_.tcp_connections()));
    metric(oss, "speedtest_segments_sent_total", "counter", "UDP payload segments sent",
           static_cast<long long>(stats_.segments()));
    metric(oss, "speedtest_bytes_sent_total", "counter", "Payload bytes sent over UDP and TCP",
           static_cast<long long>(stats_.bytes_sent()));
    metric(oss, "speedtest_malformed_datagrams_total", "counter", "Datagrams dropped by the decoder",
           static_cast<long long>(stats_.malformed()));
    metric(oss, "speedtest_malformed_requests_total", "counter", "TCP connections closed for a bad size line",
           static_cast<long long>(stats_.bad_requests()));
    metric(oss, "speedtest_transport_errors_total", "counter", "Transfers aborted by socket errors",
           static_cast<long long>(stats_.transport_errors()));
    metric(oss, "speedtest_active_responders", "gauge", "Responders currently running",
           static_cast<long long>(stats_.active_responders()));
    return oss.str();
}

/**
* @details Accepts with a 200 ms `poll()` so @ref stop is observed promptly.
* Bind or listen failure is logged and the endpoint stays down; the server
* itself keeps running.
*/
void MetricsHttpServer::run() {
    int s = ::socket(AF_INET, SOCK_STREAM, 0);
    if (s < 0) {
        Logger::error("metrics", cat("socket() failed: ", strerror(errno)));
        return;
    }
    int one = 1;
    setsockopt(s, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = htons(port_);
    if (::bind(s, (sockaddr*)&addr, sizeof(addr)) < 0 || ::listen(s, 8) < 0) {
        Logger::error("metrics", cat("cannot listen on 127.0.0.1:", port_, ": ", strerror(errno)));
        ::close(s);
        return;
    }
    Logger::info("metrics", cat("serving http://127.0.0.1:", port_, "/metrics"));

    while (running_) {
        pollfd p{};
        p.fd = s;
        p.events = POLLIN;
        if (::poll(&p, 1, 200) <= 0) continue;
        int c = ::accept(s, nullptr, nullptr);
        if (c < 0) continue;
        std::string body = render();
        std::ostringstream resp;
        resp << "HTTP/1.1 200 OK\r\nContent-Type: text/plain; version=0.0.4\r\nContent-Length: " << body.size()
             << "\r\nConnection: close\r\n\r\n" << body;
        auto out = resp.str();
        if (::send(c, out.data(), out.size(), MSG_NOSIGNAL) < 0) {
            Logger::debug("metrics", cat("send failed: ", strerror(errno)));
        }
        ::close(c);
    }
    ::close(s);
}

} // namespace speedtest
