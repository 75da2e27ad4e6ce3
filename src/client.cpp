/**
* @file
* @brief SpeedClient: the discover -> benchmark -> report loop.
*/

#include "speedtest/client.hpp"
#include "speedtest/logger.hpp"
#include "speedtest/socket.hpp"
#include "speedtest/wire.hpp"
#include <chrono>
#include <istream>
#include <ostream>
#include <string>

namespace speedtest {

SpeedClient::SpeedClient(ClientConfig cfg, std::istream& in, std::ostream& out,
                         DiscoveryOpen open, CancellationToken token)
: cfg_(std::move(cfg)), in_(in), out_(out), open_(std::move(open)), token_(std::move(token)) {
    if (!open_) {
        open_ = [] { return std::unique_ptr<ISocket>(std::make_unique<UdpSocket>()); };
    }
}

bool SpeedClient::prompt(const char* question, uint64_t& value, RoundOutcome& why) {
    out_ << question << std::flush;
    std::string line;
    if (!std::getline(in_, line)) {
        why = RoundOutcome::InputClosed;
        return false;
    }
    auto v = parse_size_line(line);
    if (!v) {
        why = RoundOutcome::InvalidInput;
        return false;
    }
    value = *v;
    return true;
}

RoundOutcome SpeedClient::run_round() {
    Logger::info("client", "Client started, listening for offer requests...");
    std::optional<ServerOffer> offer;
    {
        DiscoveryListener listener(open_(), cfg_.discovery);
        offer = listener.wait_for_offer();
    }
    if (!offer) {
        Logger::warn("client", "No offer received, retrying...");
        return RoundOutcome::NoOffer;
    }

    PoolConfig pc;
    pc.worker = cfg_.worker;
    RoundOutcome why = RoundOutcome::Completed;
    uint64_t v = 0;

    if (cfg_.file_size) pc.file_size = *cfg_.file_size;
    else if (prompt("Enter the file size to download (bytes): ", v, why)) pc.file_size = v;
    else return why;

    if (cfg_.tcp_workers) pc.tcp_workers = *cfg_.tcp_workers;
    else if (prompt("Enter the number of TCP connections: ", v, why)) pc.tcp_workers = static_cast<size_t>(v);
    else return why;

    if (cfg_.udp_workers) pc.udp_workers = *cfg_.udp_workers;
    else if (prompt("Enter the number of UDP connections: ", v, why)) pc.udp_workers = static_cast<size_t>(v);
    else return why;

    TransferPool pool(pc);
    last_ = pool.run(*offer);
    out_ << last_->render(cfg_.summary) << std::flush;
    return RoundOutcome::Completed;
}

void SpeedClient::run() {
    size_t done = 0;
    while (!token_.stop_requested()) {
        RoundOutcome r = run_round();
        if (r == RoundOutcome::InputClosed) {
            Logger::info("client", "input closed, exiting");
            return;
        }
        if (r == RoundOutcome::InvalidInput) {
            Logger::warn("client", "Invalid numeric input. Skipping test and listening again...");
            if (token_.wait_for(std::chrono::milliseconds(cfg_.retry_delay_ms))) return;
            continue;
        }
        if (r == RoundOutcome::Completed && cfg_.rounds && ++done >= cfg_.rounds) return;
    }
}

} // namespace speedtest
