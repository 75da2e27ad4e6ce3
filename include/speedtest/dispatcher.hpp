#pragma once
#include <atomic>
#include <functional>
#include <memory>
#include <stdexcept>
#include <type_traits>
#include <thread>
#include <vector>
#include "speedtest/cancel.hpp"
#include "speedtest/launcher.hpp"
#include "speedtest/responder.hpp"
#include "speedtest/socket.hpp"
#include "speedtest/stats.hpp"
#include "speedtest/tcp.hpp"

/**
* @file
* @brief Server dispatch loop: UDP requests and TCP connections in, one responder thread each out.
*/

namespace speedtest {

/// @brief Creates the private socket a UDP responder sends its segments from.
using SocketFactory = std::function<std::unique_ptr<ISocket>()>;

/**
* @brief Owns the threads of in-flight responders.
*
* @details Threads are never detached: finished ones are reaped by
* @ref reap, and @ref join_all waits for the rest. Responders watch the
* server's token, so after a stop request they end within one batch.
* There is no cap on the number of live tasks.
*/
class ResponderSet {
public:
    explicit ResponderSet(ThreadLauncher launch = launch_thread) : launch_(std::move(launch)) {
        if (!launch_) launch_ = launch_thread;
    }
    ~ResponderSet() { join_all(); }

    ResponderSet(const ResponderSet&) = delete;
    ResponderSet& operator=(const ResponderSet&) = delete;

    /**
     * @brief Run @p task on a new thread. An exception escaping @p task is logged, not rethrown.
     * @return false if the thread could not be created; @p task is then dropped.
     */
    template <typename F>
    bool spawn(F&& task) {
        auto done = std::make_shared<std::atomic<bool>>(false);
        auto body = std::make_shared<std::decay_t<F>>(std::forward<F>(task));
        std::thread th;
        try {
            tasks_.reserve(tasks_.size() + 1);
            th = launch_([done, body]() {
                try {
                    (*body)();
                } catch (const std::exception& e) {
                    log_task_failure(e);
                }
                done->store(true, std::memory_order_release);
            });
        } catch (const std::exception& e) {
            log_spawn_failure(e);
            return false;
        }
        tasks_.push_back(Entry{std::move(th), std::move(done)});
        return true;
    }

    /// @brief Join every finished task. @return Number still running.
    size_t reap();

    /// @brief Join every task, finished or not.
    void join_all();

    size_t size() const { return tasks_.size(); }

private:
    static void log_task_failure(const std::exception& e);
    static void log_spawn_failure(const std::exception& e);

    struct Entry {
        std::thread th;
        std::shared_ptr<std::atomic<bool>> done;
    };
    ThreadLauncher     launch_;
    std::vector<Entry> tasks_;
};

struct DispatcherConfig {
    int             poll_timeout_ms = 100; ///< Wait per socket per iteration.
    ResponderConfig responder;             ///< Passed to every responder.
};

/**
* @brief Demultiplexes UDP Request datagrams and TCP connections.
*
* @details
* Each iteration polls the UDP socket, then the listener, each with
* @ref DispatcherConfig::poll_timeout_ms, so neither starves the other.
* - A datagram that decodes to a Request spawns a @ref UdpTransferResponder
*   for (sender, size) on a fresh socket. Requests are never deduplicated.
* - Anything else on the UDP socket is counted as malformed and dropped.
* - An accepted connection spawns a @ref TcpTransferResponder.
* - If no thread can be started for a request, it is dropped and counted as
*   a transport error; the loop and the other responders carry on.
*
* When the token is cancelled the loop stops accepting work and closes both
* sockets. Every responder shares the token, so the ones still in flight stop
* at their next batch and are joined.
*/
class RequestDispatcher {
public:
    RequestDispatcher(std::unique_ptr<ISocket> udp, std::unique_ptr<TcpListener> tcp,
                      DispatcherConfig cfg, CancellationToken token,
                      Stats* stats = nullptr, SocketFactory factory = {},
                      ThreadLauncher launch = launch_thread);
    ~RequestDispatcher();

    void start();
    void join();

    /// @brief Dispatch until cancelled, then close sockets and drain responders.
    void run();

    /// @brief One poll of each socket. @return true if work was dispatched.
    bool poll_once();

    size_t in_flight() const { return responders_.size(); }

private:
    bool poll_udp();
    bool poll_tcp();

    std::unique_ptr<ISocket>     udp_;
    std::unique_ptr<TcpListener> tcp_;
    DispatcherConfig             cfg_;
    CancellationToken            token_;
    Stats*                       stats_;
    SocketFactory                factory_;
    ResponderSet                 responders_;
    Datagram                     rx_;
    std::thread                  th_;
};

} // namespace speedtest
