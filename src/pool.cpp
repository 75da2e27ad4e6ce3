/**
* @file
* @brief TransferPool: spawn every worker, join every worker.
*/

#include "speedtest/pool.hpp"
#include "speedtest/logger.hpp"
#include <string>
#include <thread>
#include <vector>

namespace speedtest {

TransferPool::TransferPool(PoolConfig cfg, TcpConnect tcp, UdpOpen udp, ThreadLauncher launch)
: cfg_(cfg), tcp_connect_(std::move(tcp)), udp_open_(std::move(udp)), launch_(std::move(launch)) {
    if (!launch_) launch_ = launch_thread;
    if (!tcp_connect_) {
        const int timeout = cfg_.worker.connect_timeout_ms;
        tcp_connect_ = [timeout](const ServerOffer& o) -> std::unique_ptr<IStream> {
            return TcpStream::connect(o.ip, o.tcp_port, timeout);
        };
    }
    if (!udp_open_) {
        udp_open_ = [] {
            auto s = std::make_unique<UdpSocket>();
            s->set_rcvbuf(4 << 20);
            return std::unique_ptr<ISocket>(std::move(s));
        };
    }
}

/// \cond INTERNAL
static WorkerResult failed_result(Transport t, size_t number, std::string error) {
    WorkerResult r;
    r.transport = t;
    r.number = number;
    r.ok = false;
    r.error = std::move(error);
    return r;
}
/// \endcond

/**
* @details Every thread writes only its own slot of the aggregator; the
* slots are read after the last join. A worker that cannot even open its
* socket still fills its slot, with @c ok = false. So does a worker whose
* thread cannot be created: the failure is recorded in its slot and the
* threads already running are still joined.
*/
ResultAggregator TransferPool::run(const ServerOffer& offer) const {
    ResultAggregator agg(cfg_.tcp_workers, cfg_.udp_workers);
    std::vector<std::thread> threads;
    threads.reserve(agg.size());

    Logger::info("client", cat("starting ", cfg_.tcp_workers, " TCP and ", cfg_.udp_workers,
                               " UDP transfer(s) of ", cfg_.file_size, " bytes from ", offer.ip));

    auto launch = [&](Transport t, size_t i, size_t slot, std::function<void()> body) {
        try {
            threads.push_back(launch_(std::move(body)));
        } catch (const std::exception& e) {
            WorkerResult failed = failed_result(t, i, cat("cannot start worker thread: ", e.what()));
            Logger::warn(cat(t == Transport::Tcp ? "tcp-" : "udp-", i), cat("Error: ", failed.error));
            agg.record(slot, std::move(failed));
        }
    };

    for (size_t i = 1; i <= cfg_.tcp_workers; ++i) {
        const size_t slot = agg.slot(Transport::Tcp, i);
        launch(Transport::Tcp, i, slot, [this, &agg, &offer, slot, i] {
            StreamConnector connect = [this, &offer] { return tcp_connect_(offer); };
            TcpTransferWorker worker(connect, cfg_.file_size, i, cfg_.worker);
            agg.record(slot, worker.run());
        });
    }

    for (size_t i = 1; i <= cfg_.udp_workers; ++i) {
        const size_t slot = agg.slot(Transport::Udp, i);
        launch(Transport::Udp, i, slot, [this, &agg, &offer, slot, i] {
            std::string error;
            try {
                sockaddr_in server = make_endpoint(offer.ip, offer.udp_port);
                UdpTransferWorker worker(udp_open_(), server, cfg_.file_size, i, cfg_.worker);
                agg.record(slot, worker.run());
                return;
            } catch (const std::exception& e) {
                error = e.what();
            }
            Logger::warn(cat("udp-", i), cat("Error: ", error));
            agg.record(slot, failed_result(Transport::Udp, i, error));
        });
    }

    for (auto& t : threads) t.join();
    return agg;
}

} // namespace speedtest
