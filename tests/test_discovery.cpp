/**
 * @file test_discovery.cpp
 * @brief Discovery listener: first valid offer wins, junk is skipped, silence is a retryable timeout.
 */

#include <gtest/gtest.h>
#include <chrono>
#include <memory>

#include "speedtest/discovery.hpp"
#include "speedtest/socket.hpp"
#include "speedtest/wire.hpp"

using namespace speedtest;

class DiscoveryTest : public ::testing::Test {
protected:
    std::unique_ptr<MockSocket> sock_ = std::make_unique<MockSocket>();
    DiscoveryConfig cfg_;
    sockaddr_in server_a_ = make_endpoint("10.0.0.1", 13117);
    sockaddr_in server_b_ = make_endpoint("10.0.0.2", 13117);
};

TEST_F(DiscoveryTest, BindsTheDiscoveryPort) {
    DiscoveryListener l(std::move(sock_), cfg_);
    EXPECT_EQ(l.local_port(), kDiscoveryPort);
}

TEST_F(DiscoveryTest, ReturnsAddressAndPortsOfTheOffer) {
    sock_->preload_recv(encode_offer(OfferMessage{2025, 2026}), server_a_);
    DiscoveryListener l(std::move(sock_), cfg_);
    auto offer = l.wait_for_offer();
    ASSERT_TRUE(offer.has_value());
    EXPECT_EQ(offer->ip, "10.0.0.1");
    EXPECT_EQ(offer->udp_port, 2025);
    EXPECT_EQ(offer->tcp_port, 2026);
}

TEST_F(DiscoveryTest, SkipsMalformedAndForeignDatagrams) {
    auto wrong_magic = encode_offer(OfferMessage{1, 1});
    wrong_magic[1] = 0x00;
    sock_->preload_recv(wrong_magic, server_b_);
    sock_->preload_recv({0xAB, 0xCD}, server_b_);
    sock_->preload_recv(encode_request(RequestMessage{10}), server_b_);
    sock_->preload_recv(encode_offer(OfferMessage{5000, 5001}), server_a_);

    DiscoveryListener l(std::move(sock_), cfg_);
    auto offer = l.wait_for_offer();
    ASSERT_TRUE(offer.has_value());
    EXPECT_EQ(offer->ip, "10.0.0.1");
    EXPECT_EQ(offer->udp_port, 5000);
    EXPECT_EQ(l.skipped(), 3u);
}

TEST_F(DiscoveryTest, FirstValidOfferWins) {
    sock_->preload_recv(encode_offer(OfferMessage{1111, 1112}), server_b_);
    sock_->preload_recv(encode_offer(OfferMessage{2222, 2223}), server_a_);
    DiscoveryListener l(std::move(sock_), cfg_);
    auto offer = l.wait_for_offer();
    ASSERT_TRUE(offer.has_value());
    EXPECT_EQ(offer->ip, "10.0.0.2");
    EXPECT_EQ(offer->udp_port, 1111);
}

TEST_F(DiscoveryTest, NoOfferIsARetryableTimeout) {
    sock_->preload_recv({0x00, 0x01, 0x02}, server_a_);
    DiscoveryListener l(std::move(sock_), cfg_);
    EXPECT_FALSE(l.wait_for_offer().has_value());
    EXPECT_FALSE(l.wait_for_offer().has_value());
}

TEST(DiscoveryRealSocketTest, TimesOutWithinTheWindow) {
    auto sock = std::make_unique<UdpSocket>();
    DiscoveryConfig cfg;
    cfg.port = 0;
    cfg.timeout_ms = 100;
    DiscoveryListener l(std::move(sock), cfg);
    auto t0 = std::chrono::steady_clock::now();
    EXPECT_FALSE(l.wait_for_offer().has_value());
    auto elapsed = std::chrono::steady_clock::now() - t0;
    EXPECT_GE(elapsed, std::chrono::milliseconds(90));
    EXPECT_LT(elapsed, std::chrono::seconds(2));
}
