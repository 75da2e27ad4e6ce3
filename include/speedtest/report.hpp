#pragma once
#include <cstddef>
#include <string>
#include <vector>
#include "speedtest/worker.hpp"

namespace speedtest {

/// @brief Line printed after every benchmark run.
static constexpr const char* kCompletionMarker = "All transfers complete, listening to offer requests";

/// @brief Totals for one transport.
struct TransportSummary {
    size_t   workers = 0;
    size_t   failed = 0;
    uint64_t bytes = 0;
    double   mean_bits_per_second = 0.0;
    double   mean_delivery_ratio = 0.0; ///< UDP only.
};

/**
* @brief Collects worker results into write-once slots and renders the report.
*
* @details Slots are laid out in submission order: TCP workers first, then
* UDP workers. Each worker thread writes only its own slot through
* @ref record; nothing is read until every worker has been joined, so no
* locking is needed.
*/
class ResultAggregator {
public:
    ResultAggregator(size_t tcp_workers, size_t udp_workers);

    /// @brief Slot index of the @p number-th (1-based) worker of @p t.
    size_t slot(Transport t, size_t number) const;

    /// @brief Store the result of the worker owning @p slot. Call once per slot.
    void record(size_t slot, WorkerResult result);

    const std::vector<WorkerResult>& results() const { return results_; }
    size_t size() const { return results_.size(); }

    TransportSummary summarize(Transport t) const;

    /**
     * @brief One line per worker in slot order, an optional summary block,
     *        then @ref kCompletionMarker.
     */
    std::string render(bool with_summary) const;

private:
    size_t tcp_;
    std::vector<WorkerResult> results_;
};

/// @brief The per-worker report line.
std::string format_result(const WorkerResult& r);

/// @brief The per-transport summary line.
std::string format_summary(Transport t, const TransportSummary& s);

} // namespace speedtest
