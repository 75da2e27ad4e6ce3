/**
* @file
* @brief Result slots and report rendering.
*/

#include "speedtest/report.hpp"
#include <cstdio>
#include <sstream>
#include <stdexcept>

namespace speedtest {

ResultAggregator::ResultAggregator(size_t tcp_workers, size_t udp_workers)
: tcp_(tcp_workers), results_(tcp_workers + udp_workers) {
    for (size_t i = 0; i < results_.size(); ++i) {
        results_[i].transport = i < tcp_ ? Transport::Tcp : Transport::Udp;
        results_[i].number = i < tcp_ ? i + 1 : i - tcp_ + 1;
    }
}

size_t ResultAggregator::slot(Transport t, size_t number) const {
    size_t idx = (t == Transport::Tcp ? 0 : tcp_) + number - 1;
    if (number == 0 || idx >= results_.size() || (t == Transport::Tcp && number > tcp_))
        throw std::out_of_range("no slot for " + std::string(to_string(t)) + " worker #" + std::to_string(number));
    return idx;
}

void ResultAggregator::record(size_t slot, WorkerResult result) {
    results_.at(slot) = std::move(result);
}

TransportSummary ResultAggregator::summarize(Transport t) const {
    TransportSummary s;
    double rate = 0.0, ratio = 0.0;
    for (const auto& r : results_) {
        if (r.transport != t) continue;
        ++s.workers;
        if (!r.ok) ++s.failed;
        s.bytes += r.bytes;
        rate += r.bits_per_second;
        ratio += r.delivery_ratio;
    }
    if (s.workers) {
        s.mean_bits_per_second = rate / static_cast<double>(s.workers);
        s.mean_delivery_ratio = ratio / static_cast<double>(s.workers);
    }
    return s;
}

std::string format_result(const WorkerResult& r) {
    char buf[256];
    if (r.transport == Transport::Tcp) {
        snprintf(buf, sizeof(buf),
                 "TCP transfer #%zu finished, total time: %.2f seconds, total speed: %.2f bits/second, "
                 "bytes received: %llu",
                 r.number, r.seconds, r.bits_per_second, static_cast<unsigned long long>(r.bytes));
    } else {
        snprintf(buf, sizeof(buf),
                 "UDP transfer #%zu finished, total time: %.2f seconds, total speed: %.2f bits/second, "
                 "bytes received: %llu, percentage of packets received successfully: %.2f%%",
                 r.number, r.seconds, r.bits_per_second, static_cast<unsigned long long>(r.bytes),
                 r.delivery_ratio * 100.0);
    }
    std::string line(buf);
    if (!r.ok) line += " (error: " + r.error + ")";
    return line;
}

std::string format_summary(Transport t, const TransportSummary& s) {
    std::ostringstream oss;
    oss << to_string(t) << " summary: " << s.workers << " transfer(s), " << s.failed << " failed, "
        << s.bytes << " bytes, mean speed " << human_bps(s.mean_bits_per_second);
    if (t == Transport::Udp) {
        char pct[32];
        snprintf(pct, sizeof(pct), "%.2f%%", s.mean_delivery_ratio * 100.0);
        oss << ", mean delivery " << pct;
    }
    return oss.str();
}

std::string ResultAggregator::render(bool with_summary) const {
    std::ostringstream oss;
    for (const auto& r : results_) oss << format_result(r) << "\n";
    if (with_summary) {
        for (Transport t : {Transport::Tcp, Transport::Udp}) {
            TransportSummary s = summarize(t);
            if (s.workers) oss << format_summary(t, s) << "\n";
        }
    }
    oss << kCompletionMarker << "\n";
    return oss.str();
}

} // namespace speedtest
