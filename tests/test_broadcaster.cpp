/**
 * @file test_broadcaster.cpp
 * @brief Offer broadcaster: message content, cadence, prompt cancellation, best-effort sends.
 */

#include <gtest/gtest.h>
#include <chrono>
#include <memory>
#include <thread>
#include <variant>

#include "speedtest/broadcaster.hpp"
#include "speedtest/cancel.hpp"
#include "speedtest/socket.hpp"
#include "speedtest/stats.hpp"
#include "speedtest/wire.hpp"

using namespace speedtest;
using namespace std::chrono_literals;

TEST(BroadcasterTest, OfferCarriesAdvertisedPorts) {
    auto sock = std::make_unique<MockSocket>();
    MockSocket* raw = sock.get();
    BroadcastConfig cfg;
    cfg.udp_port = 3001;
    cfg.tcp_port = 3002;
    cfg.broadcast_ip = "192.168.1.255";
    CancellationToken token;
    OfferBroadcaster b(std::move(sock), cfg, token);

    EXPECT_TRUE(raw->broadcast_enabled());
    ASSERT_TRUE(b.send_offer());
    ASSERT_EQ(raw->sent_count(), 1u);
    EXPECT_EQ(to_string(raw->sent()[0].to), "192.168.1.255:13117");

    auto msg = decode(raw->sent()[0].data);
    ASSERT_TRUE(std::holds_alternative<OfferMessage>(msg));
    EXPECT_EQ(std::get<OfferMessage>(msg).udp_port, 3001);
    EXPECT_EQ(std::get<OfferMessage>(msg).tcp_port, 3002);
}

TEST(BroadcasterTest, InvalidDestinationFailsAtConstruction) {
    BroadcastConfig cfg;
    cfg.broadcast_ip = "not-an-ip";
    EXPECT_THROW({ OfferBroadcaster b(std::make_unique<MockSocket>(), cfg, CancellationToken{}); }, TransportError);
}

TEST(BroadcasterTest, RepeatsEveryIntervalUntilCancelled) {
    BroadcastConfig cfg;
    cfg.interval_ms = 20;
    CancellationToken token;
    Stats stats;
    OfferBroadcaster b(std::make_unique<MockSocket>(), cfg, token, &stats);
    b.start();
    std::this_thread::sleep_for(150ms);
    token.request_stop();
    b.join();
    EXPECT_GE(b.sent(), 3u);
    EXPECT_EQ(stats.offers(), b.sent());
}

TEST(BroadcasterTest, StopsWithinOnePollQuantum) {
    BroadcastConfig cfg;
    cfg.interval_ms = 10000;
    CancellationToken token;
    OfferBroadcaster b(std::make_unique<MockSocket>(), cfg, token);
    b.start();
    std::this_thread::sleep_for(50ms);
    auto t0 = std::chrono::steady_clock::now();
    token.request_stop();
    b.join();
    EXPECT_LT(std::chrono::steady_clock::now() - t0, 1s);
    EXPECT_EQ(b.sent(), 1u);
}

TEST(BroadcasterTest, SendFailuresDoNotStopTheLoop) {
    auto sock = std::make_unique<MockSocket>();
    sock->fail_sends_after(0);
    BroadcastConfig cfg;
    cfg.interval_ms = 10;
    CancellationToken token;
    OfferBroadcaster b(std::move(sock), cfg, token);
    b.start();
    std::this_thread::sleep_for(60ms);
    token.request_stop();
    b.join();
    EXPECT_EQ(b.sent(), 0u);
    EXPECT_FALSE(b.send_offer());  // socket released after the loop
}

TEST(CancellationTokenTest, CopiesShareState) {
    CancellationToken a;
    CancellationToken b = a;
    EXPECT_FALSE(b.stop_requested());
    a.request_stop();
    EXPECT_TRUE(b.stop_requested());
    EXPECT_TRUE(b.wait_for(1h));
}
