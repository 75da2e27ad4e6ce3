#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include "speedtest/discovery.hpp"
#include "speedtest/launcher.hpp"
#include "speedtest/report.hpp"
#include "speedtest/socket.hpp"
#include "speedtest/tcp.hpp"
#include "speedtest/worker.hpp"

namespace speedtest {

struct PoolConfig {
    uint64_t     file_size   = 0; ///< Bytes each worker requests.
    size_t       tcp_workers = 1;
    size_t       udp_workers = 1;
    WorkerConfig worker;
};

/**
* @brief Fan-out/fan-in of one benchmark run against one server.
*
* @details All TCP and UDP workers start together, one thread each, and the
* pool blocks until every one of them has stored its result. There is no
* deadline on the batch beyond each worker's own timeouts.
*
* The seams are injectable for tests: @ref TcpConnect builds the stream for a
* TCP worker, @ref UdpOpen builds the socket for a UDP worker, and the
* @ref ThreadLauncher starts each worker's thread.
*/
class TransferPool {
public:
    using TcpConnect = std::function<std::unique_ptr<IStream>(const ServerOffer&)>;
    using UdpOpen    = std::function<std::unique_ptr<ISocket>()>;

    explicit TransferPool(PoolConfig cfg, TcpConnect tcp = {}, UdpOpen udp = {},
                          ThreadLauncher launch = launch_thread);

    /// @brief Run every worker against @p offer and wait for all of them.
    ResultAggregator run(const ServerOffer& offer) const;

private:
    PoolConfig cfg_;
    TcpConnect tcp_connect_;
    UdpOpen    udp_open_;
    ThreadLauncher launch_;
};

} // namespace speedtest
