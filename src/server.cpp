/**
* @file
* @brief SpeedServer wiring: sockets, broadcaster, dispatcher, metrics.
*/

#include "speedtest/server.hpp"
#include "speedtest/logger.hpp"
#include "speedtest/socket.hpp"
#include "speedtest/tcp.hpp"

namespace speedtest {

SpeedServer::SpeedServer(ServerConfig cfg) : cfg_(std::move(cfg)) {
    auto udp = std::make_unique<UdpSocket>();
    udp->bind(cfg_.udp_port, false);
    udp->set_rcvbuf(1 << 20);
    udp_port_ = udp->local_port();

    auto tcp = std::make_unique<TcpListener>(cfg_.tcp_port);
    tcp_port_ = tcp->local_port();

    DispatcherConfig dcfg;
    dcfg.poll_timeout_ms = cfg_.poll_timeout_ms;
    dcfg.responder = cfg_.responder;
    dispatcher_ = std::make_unique<RequestDispatcher>(std::move(udp), std::move(tcp), dcfg, token_, &stats_);

    BroadcastConfig bcfg;
    bcfg.udp_port       = udp_port_;
    bcfg.tcp_port       = tcp_port_;
    bcfg.broadcast_ip   = cfg_.broadcast_ip;
    bcfg.discovery_port = cfg_.discovery_port;
    bcfg.interval_ms    = cfg_.interval_ms;
    broadcaster_ = std::make_unique<OfferBroadcaster>(std::make_unique<UdpSocket>(), bcfg, token_, &stats_);

    if (cfg_.metrics_port) {
        metrics_ = std::make_unique<MetricsHttpServer>(stats_, cfg_.metrics_port);
    }
}

SpeedServer::~SpeedServer() {
    stop();
}

void SpeedServer::start() {
    if (started_) return;
    started_ = true;
    Logger::info("server", cat("Server started, listening on IP address ", primary_ipv4(),
                               " (udp ", udp_port_, ", tcp ", tcp_port_, ")"));
    if (metrics_) metrics_->start();
    dispatcher_->start();
    broadcaster_->start();
}

void SpeedServer::stop() {
    if (!started_) return;
    started_ = false;
    Logger::info("server", "shutting down");
    token_.request_stop();
    dispatcher_->join();
    broadcaster_->join();
    if (metrics_) metrics_->stop();
    Logger::info("server", stats_.to_string());
}

} // namespace speedtest
