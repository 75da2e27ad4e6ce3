#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <iosfwd>
#include <memory>
#include <optional>
#include "speedtest/cancel.hpp"
#include "speedtest/discovery.hpp"
#include "speedtest/pool.hpp"
#include "speedtest/worker.hpp"

/**
* @file
* @brief Client loop: discover a server, run one benchmark, report, repeat.
*/

namespace speedtest {

/**
* @brief Client configuration knobs.
*
* @details Any of @ref file_size, @ref tcp_workers, @ref udp_workers left
* empty is asked for on the input stream after each offer.
*/
struct ClientConfig {
    DiscoveryConfig         discovery;
    WorkerConfig            worker;
    std::optional<uint64_t> file_size;
    std::optional<size_t>   tcp_workers;
    std::optional<size_t>   udp_workers;
    size_t                  rounds = 0;          ///< Benchmarks to run (0 = forever).
    bool                    summary = false;     ///< Append per-transport totals to the report.
    int                     retry_delay_ms = 2000; ///< Pause after invalid input.
};

/// @brief How one pass of the client loop ended.
enum class RoundOutcome {
    Completed,    ///< Benchmark ran and the report was written.
    NoOffer,      ///< Discovery window passed without a valid offer.
    InvalidInput, ///< A prompted value was not a non-negative integer.
    InputClosed,  ///< The input stream ended while prompting.
};

/**
* @brief Drives discovery, the transfer pool and the report, round after round.
*
* @details
* Each round binds a fresh @ref DiscoveryListener, so offers queued during the
* previous benchmark are dropped with the old socket. The report goes to the
* output stream; diagnostics go through @ref Logger.
*/
class SpeedClient {
public:
    using DiscoveryOpen = std::function<std::unique_ptr<ISocket>()>;

    SpeedClient(ClientConfig cfg, std::istream& in, std::ostream& out,
                DiscoveryOpen open = {}, CancellationToken token = {});

    /// @brief One pass: wait for an offer, collect parameters, benchmark, report.
    RoundOutcome run_round();

    /// @brief Loop rounds until @ref ClientConfig::rounds are done, input closes, or the token is cancelled.
    void run();

    /// @brief Results of the last completed benchmark.
    const std::optional<ResultAggregator>& last_results() const { return last_; }

private:
    bool prompt(const char* question, uint64_t& value, RoundOutcome& why);

    ClientConfig      cfg_;
    std::istream&     in_;
    std::ostream&     out_;
    DiscoveryOpen     open_;
    CancellationToken token_;
    std::optional<ResultAggregator> last_;
};

} // namespace speedtest
