/**
* @file
* @brief RequestDispatcher loop and responder thread bookkeeping.
*/

#include "speedtest/dispatcher.hpp"
#include "speedtest/logger.hpp"
#include "speedtest/wire.hpp"
#include <cerrno>
#include <chrono>
#include <cstring>
#include <variant>

namespace speedtest {

/// \cond INTERNAL
namespace {

/// @brief Keeps Stats::active_responders() accurate even if a responder throws.
struct ActiveResponder {
    explicit ActiveResponder(Stats* s) : stats(s) { if (stats) stats->responder_started(); }
    ~ActiveResponder() { if (stats) stats->responder_finished(); }
    Stats* stats;
};

} // namespace
/// \endcond

void ResponderSet::log_task_failure(const std::exception& e) {
    Logger::error("dispatch", cat("responder aborted: ", e.what()));
}

void ResponderSet::log_spawn_failure(const std::exception& e) {
    Logger::error("dispatch", cat("cannot start responder thread: ", e.what()));
}

size_t ResponderSet::reap() {
    for (auto it = tasks_.begin(); it != tasks_.end();) {
        if (it->done->load(std::memory_order_acquire)) {
            it->th.join();
            it = tasks_.erase(it);
        } else {
            ++it;
        }
    }
    return tasks_.size();
}

void ResponderSet::join_all() {
    for (auto& e : tasks_) {
        if (e.th.joinable()) e.th.join();
    }
    tasks_.clear();
}

RequestDispatcher::RequestDispatcher(std::unique_ptr<ISocket> udp, std::unique_ptr<TcpListener> tcp,
                                     DispatcherConfig cfg, CancellationToken token,
                                     Stats* stats, SocketFactory factory, ThreadLauncher launch)
: udp_(std::move(udp)), tcp_(std::move(tcp)), cfg_(cfg), token_(std::move(token)),
  stats_(stats), factory_(std::move(factory)), responders_(std::move(launch)) {
    if (!factory_) {
        factory_ = [] {
            auto s = std::make_unique<UdpSocket>();
            s->set_sndbuf(1 << 20);
            return std::unique_ptr<ISocket>(std::move(s));
        };
    }
}

RequestDispatcher::~RequestDispatcher() {
    if (th_.joinable()) {
        token_.request_stop();
        th_.join();
    }
}

void RequestDispatcher::start() {
    th_ = std::thread(&RequestDispatcher::run, this);
}

void RequestDispatcher::join() {
    if (th_.joinable()) th_.join();
}

bool RequestDispatcher::poll_udp() {
    if (!udp_) return false;
    ssize_t r = udp_->recv_from(rx_, cfg_.poll_timeout_ms);
    if (r == 0) return false;
    if (r < 0) {
        Logger::warn("dispatch", cat("udp receive failed: ", strerror(errno)));
        token_.wait_for(std::chrono::milliseconds(cfg_.poll_timeout_ms));
        return false;
    }

    Message msg = decode(rx_.data);
    const auto* req = std::get_if<RequestMessage>(&msg);
    if (!req) {
        if (stats_) stats_->inc_malformed();
        Logger::debug("dispatch", cat("dropped ", rx_.data.size(), "-byte datagram from ", to_string(rx_.from)));
        return false;
    }

    if (stats_) stats_->inc_udp_requests();
    Logger::info("udp", cat("request from ", to_string(rx_.from), ", file_size=", req->file_size));

    std::unique_ptr<ISocket> sock;
    try {
        sock = factory_();
    } catch (const std::exception& e) {
        Logger::error("udp", cat("cannot open session socket for ", to_string(rx_.from), ": ", e.what()));
        if (stats_) stats_->inc_transport_errors();
        return false;
    }

    auto responder = std::make_unique<UdpTransferResponder>(std::move(sock), rx_.from, req->file_size,
                                                            cfg_.responder, stats_, token_);
    bool spawned = responders_.spawn([responder = std::move(responder), stats = stats_]() {
        ActiveResponder active(stats);
        responder->run();
    });
    if (!spawned && stats_) stats_->inc_transport_errors();
    return spawned;
}

bool RequestDispatcher::poll_tcp() {
    if (!tcp_) return false;
    auto conn = tcp_->poll_accept(cfg_.poll_timeout_ms);
    if (!conn) {
        if (errno != 0) {
            Logger::warn("dispatch", cat("accept failed: ", strerror(errno)));
            token_.wait_for(std::chrono::milliseconds(cfg_.poll_timeout_ms));
        }
        return false;
    }

    if (stats_) stats_->inc_tcp_connections();
    Logger::info("tcp", cat("accepted connection from ", conn->peer()));
    conn->set_send_timeout(cfg_.responder.tcp_timeout_ms);

    auto responder = std::make_unique<TcpTransferResponder>(std::move(conn), cfg_.responder, stats_, token_);
    bool spawned = responders_.spawn([responder = std::move(responder), stats = stats_]() {
        ActiveResponder active(stats);
        responder->run();
    });
    if (!spawned && stats_) stats_->inc_transport_errors();
    return spawned;
}

bool RequestDispatcher::poll_once() {
    responders_.reap();
    bool udp = poll_udp();
    bool tcp = poll_tcp();
    return udp || tcp;
}

void RequestDispatcher::run() {
    Logger::info("dispatch", cat("serving udp=", udp_ ? udp_->local_port() : 0,
                                 " tcp=", tcp_ ? tcp_->local_port() : 0));
    auto last_log = std::chrono::steady_clock::now();
    while (!token_.stop_requested()) {
        poll_once();

        auto now = std::chrono::steady_clock::now();
        if (stats_ && now - last_log >= std::chrono::seconds(1)) {
            Logger::debug("server", stats_->to_string());
            last_log = now;
        }
    }

    udp_.reset();
    tcp_.reset();
    if (responders_.size()) {
        Logger::info("dispatch", cat("waiting for ", responders_.size(), " responder(s) to finish"));
    }
    responders_.join_all();
    Logger::info("dispatch", "stopped");
}

} // namespace speedtest
