/**
 * @file test_responders.cpp
 * @brief UDP segmented responder over MockSocket, TCP responder over MockStream.
 */

#include <gtest/gtest.h>
#include <chrono>
#include <memory>
#include <thread>
#include <set>
#include <string>
#include <variant>

#include "speedtest/cancel.hpp"
#include "speedtest/responder.hpp"
#include "speedtest/socket.hpp"
#include "speedtest/stats.hpp"
#include "speedtest/tcp.hpp"
#include "speedtest/wire.hpp"

using namespace speedtest;

namespace {

/// MockSocket that requests a stop once @c limit datagrams have gone out.
class StopAfterSocket : public MockSocket {
public:
    StopAfterSocket(CancellationToken token, size_t limit) : token_(std::move(token)), limit_(limit) {}

    ssize_t send_batch(const std::vector<std::vector<uint8_t>>& bufs, const sockaddr_in& to) override {
        ssize_t r = MockSocket::send_batch(bufs, to);
        if (sent_count() >= limit_) token_.request_stop();
        return r;
    }

private:
    CancellationToken token_;
    size_t limit_;
};

/// MockStream that requests a stop after @c limit write calls.
class StopAfterStream : public MockStream {
public:
    StopAfterStream(std::string input, CancellationToken token, size_t limit)
    : MockStream(std::move(input)), token_(std::move(token)), limit_(limit) {}

    ssize_t write_all(const uint8_t* data, size_t len) override {
        ssize_t r = MockStream::write_all(data, len);
        if (write_calls() >= limit_) token_.request_stop();
        return r;
    }

private:
    CancellationToken token_;
    size_t limit_;
};

} // namespace

class UdpResponderTest : public ::testing::Test {
protected:
    void SetUp() override {
        client_ = make_endpoint("10.0.0.7", 40123);
        cfg_.segment_size = 1024;
        cfg_.send_batch = 4;
    }

    /// Runs a responder and returns its socket's captured datagrams.
    std::vector<MockSocket::Sent> serve(uint64_t file_size, ResponderStatus expect = ResponderStatus::Completed,
                                        long long fail_after = -1) {
        auto sock = std::make_unique<MockSocket>();
        MockSocket* raw = sock.get();
        if (fail_after >= 0) raw->fail_sends_after(static_cast<size_t>(fail_after));
        UdpTransferResponder r(std::move(sock), client_, file_size, cfg_, &stats_);
        EXPECT_EQ(r.run(), expect);
        last_segments_sent_ = r.segments_sent();
        return raw->sent();
    }

    sockaddr_in client_{};
    ResponderConfig cfg_;
    Stats stats_;
    uint64_t last_segments_sent_ = 0;
};

TEST_F(UdpResponderTest, ZeroBytesSendsNothing) {
    auto sent = serve(0);
    EXPECT_TRUE(sent.empty());
    EXPECT_EQ(stats_.segments(), 0u);
}

TEST_F(UdpResponderTest, ExactlyOneFullSegment) {
    auto sent = serve(1024);
    ASSERT_EQ(sent.size(), 1u);
    auto msg = decode(sent[0].data);
    ASSERT_TRUE(std::holds_alternative<PayloadSegment>(msg));
    const auto& seg = std::get<PayloadSegment>(msg);
    EXPECT_EQ(seg.total_segments, 1u);
    EXPECT_EQ(seg.segment_index, 0u);
    EXPECT_EQ(seg.payload.size(), 1024u);
}

TEST_F(UdpResponderTest, LastSegmentCarriesRemainder) {
    auto sent = serve(2500);
    ASSERT_EQ(sent.size(), 3u);
    size_t lengths[3];
    for (size_t i = 0; i < 3; ++i) {
        auto msg = decode(sent[i].data);
        ASSERT_TRUE(std::holds_alternative<PayloadSegment>(msg));
        EXPECT_EQ(std::get<PayloadSegment>(msg).total_segments, 3u);
        lengths[i] = std::get<PayloadSegment>(msg).payload.size();
    }
    EXPECT_EQ(lengths[0], 1024u);
    EXPECT_EQ(lengths[1], 1024u);
    EXPECT_EQ(lengths[2], 452u);
    EXPECT_EQ(stats_.bytes_sent(), 2500u);
}

TEST_F(UdpResponderTest, EveryIndexExactlyOnceToTheRequester) {
    const uint64_t size = 1024 * 37 + 5;  // spans several batches
    auto sent = serve(size);
    ASSERT_EQ(sent.size(), 38u);
    std::set<uint64_t> indices;
    for (const auto& s : sent) {
        EXPECT_EQ(to_string(s.to), "10.0.0.7:40123");
        auto msg = decode(s.data);
        ASSERT_TRUE(std::holds_alternative<PayloadSegment>(msg));
        indices.insert(std::get<PayloadSegment>(msg).segment_index);
    }
    EXPECT_EQ(indices.size(), 38u);
    EXPECT_EQ(*indices.begin(), 0u);
    EXPECT_EQ(*indices.rbegin(), 37u);
    EXPECT_EQ(stats_.segments(), 38u);
}

TEST_F(UdpResponderTest, SendErrorAbortsRemainingSegments) {
    auto sent = serve(1024 * 10, ResponderStatus::TransportError, 3);
    EXPECT_EQ(sent.size(), 3u);
    EXPECT_EQ(last_segments_sent_, 3u);
    EXPECT_EQ(stats_.transport_errors(), 1u);
}

TEST(TcpResponderTest, WritesExactlyTheRequestedBytes) {
    auto stream = std::make_unique<MockStream>("5000\n");
    MockStream* raw = stream.get();
    Stats stats;
    ResponderConfig cfg;
    TcpTransferResponder r(std::move(stream), cfg, &stats);
    EXPECT_EQ(r.run(), ResponderStatus::Completed);
    EXPECT_EQ(r.requested(), 5000u);
    EXPECT_EQ(raw->written().size(), 5000u);
    EXPECT_EQ(raw->write_calls(), 5u);  // 1024-byte chunks
    EXPECT_EQ(stats.bytes_sent(), 5000u);
}

TEST(TcpResponderTest, SizeLineMayArriveInPieces) {
    auto stream = std::make_unique<MockStream>("12\r\n");
    stream->set_read_chunk(1);
    MockStream* raw = stream.get();
    TcpTransferResponder r(std::move(stream), ResponderConfig{});
    EXPECT_EQ(r.run(), ResponderStatus::Completed);
    EXPECT_EQ(raw->written(), std::string(12, 'A'));
}

TEST(TcpResponderTest, ZeroBytesWritesNothing) {
    auto stream = std::make_unique<MockStream>("0\n");
    MockStream* raw = stream.get();
    TcpTransferResponder r(std::move(stream), ResponderConfig{});
    EXPECT_EQ(r.run(), ResponderStatus::Completed);
    EXPECT_TRUE(raw->written().empty());
}

TEST(TcpResponderTest, NonNumericLineIsMalformed) {
    auto stream = std::make_unique<MockStream>("lots\n");
    MockStream* raw = stream.get();
    Stats stats;
    TcpTransferResponder r(std::move(stream), ResponderConfig{}, &stats);
    EXPECT_EQ(r.run(), ResponderStatus::MalformedRequest);
    EXPECT_TRUE(raw->written().empty());
    EXPECT_EQ(stats.bad_requests(), 1u);
}

TEST(TcpResponderTest, NegativeSizeIsMalformed) {
    TcpTransferResponder r(std::make_unique<MockStream>("-10\n"), ResponderConfig{});
    EXPECT_EQ(r.run(), ResponderStatus::MalformedRequest);
}

TEST(TcpResponderTest, MissingNewlineTimesOut) {
    auto stream = std::make_unique<MockStream>("100");
    stream->hold_open();
    ResponderConfig cfg;
    cfg.tcp_timeout_ms = 50;
    TcpTransferResponder r(std::move(stream), cfg);
    EXPECT_EQ(r.run(), ResponderStatus::MalformedRequest);
}

TEST(TcpResponderTest, OverlongLineIsMalformed) {
    auto stream = std::make_unique<MockStream>(std::string(200, '1'));
    stream->hold_open();
    TcpTransferResponder r(std::move(stream), ResponderConfig{});
    EXPECT_EQ(r.run(), ResponderStatus::MalformedRequest);
}

TEST(TcpResponderTest, PeerClosingBeforeNewline) {
    TcpTransferResponder r(std::make_unique<MockStream>("10"), ResponderConfig{});
    EXPECT_EQ(r.run(), ResponderStatus::PeerClosed);
}

TEST(TcpResponderTest, WriteErrorStopsThisConnection) {
    auto stream = std::make_unique<MockStream>("10000\n");
    stream->fail_writes_after(3000);
    MockStream* raw = stream.get();
    Stats stats;
    TcpTransferResponder r(std::move(stream), ResponderConfig{}, &stats);
    EXPECT_EQ(r.run(), ResponderStatus::TransportError);
    EXPECT_EQ(r.bytes_sent(), 2048u);
    EXPECT_EQ(raw->written().size(), 3000u);
    EXPECT_EQ(stats.transport_errors(), 1u);
}

TEST_F(UdpResponderTest, ShutdownStopsBetweenBatches) {
    CancellationToken token;
    auto sock = std::make_unique<StopAfterSocket>(token, 8);
    MockSocket* raw = sock.get();
    UdpTransferResponder r(std::move(sock), client_, 1024 * 100, cfg_, &stats_, token);
    EXPECT_EQ(r.run(), ResponderStatus::Cancelled);
    EXPECT_EQ(r.total_segments(), 100u);
    EXPECT_EQ(r.segments_sent(), 8u);  // two batches of four
    EXPECT_EQ(raw->sent_count(), 8u);
    EXPECT_EQ(stats_.transport_errors(), 0u);
}

TEST_F(UdpResponderTest, CancelledBeforeStartSendsNothing) {
    CancellationToken token;
    token.request_stop();
    auto sock = std::make_unique<MockSocket>();
    MockSocket* raw = sock.get();
    UdpTransferResponder r(std::move(sock), client_, 1024 * 10, cfg_, nullptr, token);
    EXPECT_EQ(r.run(), ResponderStatus::Cancelled);
    EXPECT_EQ(raw->sent_count(), 0u);
}

TEST(TcpResponderTest, ShutdownStopsBetweenChunks) {
    CancellationToken token;
    auto stream = std::make_unique<StopAfterStream>("100000\n", token, 2);
    MockStream* raw = stream.get();
    TcpTransferResponder r(std::move(stream), ResponderConfig{}, nullptr, token);
    EXPECT_EQ(r.run(), ResponderStatus::Cancelled);
    EXPECT_EQ(r.bytes_sent(), 2048u);
    EXPECT_EQ(raw->written().size(), 2048u);
}

TEST(TcpResponderTest, ShutdownEndsTheWaitForASizeLine) {
    CancellationToken token;
    auto stream = std::make_unique<MockStream>("12");
    stream->hold_open();
    ResponderConfig cfg;
    cfg.tcp_timeout_ms = 10000;
    TcpTransferResponder r(std::move(stream), cfg, nullptr, token);

    std::thread stopper([token]() mutable {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        token.request_stop();
    });
    auto t0 = std::chrono::steady_clock::now();
    EXPECT_EQ(r.run(), ResponderStatus::Cancelled);
    EXPECT_LT(std::chrono::steady_clock::now() - t0, std::chrono::seconds(2));
    stopper.join();
}
