/**
 * @file test_worker.cpp
 * @brief Segment tracking, TCP/UDP download workers, and the transfer pool over test doubles.
 */

#include <gtest/gtest.h>
#include <atomic>
#include <cmath>
#include <variant>
#include <memory>
#include <string>
#include <system_error>
#include <thread>
#include <vector>

#include "speedtest/pool.hpp"
#include "speedtest/socket.hpp"
#include "speedtest/tcp.hpp"
#include "speedtest/wire.hpp"
#include "speedtest/worker.hpp"

using namespace speedtest;

namespace {

PayloadSegment segment(uint64_t total, uint64_t index, size_t len = 10) {
    static const std::string filler(2048, 'B');
    return PayloadSegment{total, index, std::string_view(filler.data(), len)};
}

std::vector<uint8_t> encoded_segment(uint64_t total, uint64_t index, size_t len) {
    std::vector<uint8_t> payload(len, 'B');
    std::vector<uint8_t> out;
    encode_payload(total, index, payload.data(), payload.size(), out);
    return out;
}

/// MockStream that hands what the worker wrote to the test when it is destroyed.
class RecordingStream : public MockStream {
public:
    RecordingStream(std::string input, std::string& sink) : MockStream(std::move(input)), sink_(sink) {}
    ~RecordingStream() override { sink_ = written(); }

private:
    std::string& sink_;
};

} // namespace

TEST(SegmentTrackerTest, NothingSeenMeansZeroRatio) {
    SegmentTracker t;
    EXPECT_FALSE(t.seen_any());
    EXPECT_EQ(t.delivery_ratio(), 0.0);
    EXPECT_FALSE(std::isnan(t.delivery_ratio()));
}

TEST(SegmentTrackerTest, DuplicatesCountOnce) {
    SegmentTracker t;
    t.observe(segment(4, 0));
    t.observe(segment(4, 1));
    t.observe(segment(4, 1));
    t.observe(segment(4, 3));
    EXPECT_EQ(t.total_segments(), 4u);
    EXPECT_EQ(t.distinct(), 3u);
    EXPECT_EQ(t.duplicates(), 1u);
    EXPECT_DOUBLE_EQ(t.delivery_ratio(), 0.75);
    EXPECT_EQ(t.payload_bytes(), 40u);
}

TEST(SegmentTrackerTest, FirstTotalWinsAndOutOfRangeIsIgnored) {
    SegmentTracker t;
    t.observe(segment(2, 0));
    t.observe(segment(100, 1));
    t.observe(segment(2, 7));
    EXPECT_EQ(t.total_segments(), 2u);
    EXPECT_EQ(t.distinct(), 2u);
    EXPECT_EQ(t.ignored(), 1u);
    EXPECT_DOUBLE_EQ(t.delivery_ratio(), 1.0);
}

TEST(WorkerMathTest, BitsPerSecondGuardsZeroDuration) {
    EXPECT_EQ(bits_per_second(1000, 0.0), 0.0);
    EXPECT_EQ(bits_per_second(0, 2.0), 0.0);
    EXPECT_DOUBLE_EQ(bits_per_second(1000, 2.0), 4000.0);
}

TEST(TcpWorkerTest, SendsSizeLineAndCountsBytes) {
    std::string request;
    StreamConnector connect = [&request]() -> std::unique_ptr<IStream> {
        return std::make_unique<RecordingStream>(std::string(3000, 'A'), request);
    };
    TcpTransferWorker w(connect, 3000, 1, WorkerConfig{});
    WorkerResult r = w.run();
    EXPECT_EQ(request, "3000\n");
    EXPECT_TRUE(r.ok);
    EXPECT_EQ(r.transport, Transport::Tcp);
    EXPECT_EQ(r.number, 1u);
    EXPECT_EQ(r.bytes, 3000u);
    EXPECT_GT(r.seconds, 0.0);
    EXPECT_GT(r.bits_per_second, 0.0);
}

TEST(TcpWorkerTest, StopsAtRequestedSizeEvenIfMoreArrives) {
    StreamConnector connect = []() -> std::unique_ptr<IStream> {
        auto s = std::make_unique<MockStream>(std::string(10000, 'A'));
        s->set_read_chunk(1000);
        return s;
    };
    WorkerResult r = TcpTransferWorker(connect, 2500, 1, WorkerConfig{}).run();
    EXPECT_EQ(r.bytes, 3000u);  // whole reads are counted
}

TEST(TcpWorkerTest, ShortStreamIsReportedNotFailed) {
    StreamConnector connect = []() -> std::unique_ptr<IStream> {
        return std::make_unique<MockStream>(std::string(700, 'A'));
    };
    WorkerResult r = TcpTransferWorker(connect, 5000, 2, WorkerConfig{}).run();
    EXPECT_TRUE(r.ok);
    EXPECT_EQ(r.bytes, 700u);
}

TEST(TcpWorkerTest, ZeroBytesHasZeroRate) {
    StreamConnector connect = []() -> std::unique_ptr<IStream> {
        return std::make_unique<MockStream>();
    };
    WorkerResult r = TcpTransferWorker(connect, 0, 1, WorkerConfig{}).run();
    EXPECT_TRUE(r.ok);
    EXPECT_EQ(r.bytes, 0u);
    EXPECT_EQ(r.bits_per_second, 0.0);
}

TEST(TcpWorkerTest, ConnectFailureIsCapturedInTheResult) {
    StreamConnector connect = []() -> std::unique_ptr<IStream> {
        throw TransportError("connect refused");
    };
    WorkerResult r = TcpTransferWorker(connect, 100, 3, WorkerConfig{}).run();
    EXPECT_FALSE(r.ok);
    EXPECT_EQ(r.error, "connect refused");
    EXPECT_EQ(r.bytes, 0u);
}

TEST(TcpWorkerTest, StalledStreamEndsWithError) {
    StreamConnector connect = []() -> std::unique_ptr<IStream> {
        auto s = std::make_unique<MockStream>(std::string(10, 'A'));
        s->hold_open();
        return s;
    };
    WorkerConfig cfg;
    cfg.tcp_read_timeout_ms = 50;
    WorkerResult r = TcpTransferWorker(connect, 100, 1, cfg).run();
    EXPECT_FALSE(r.ok);
    EXPECT_EQ(r.bytes, 10u);
}

class UdpWorkerTest : public ::testing::Test {
protected:
    sockaddr_in server_ = make_endpoint("10.0.0.1", 2025);
};

TEST_F(UdpWorkerTest, SendsOneRequestAndMeasuresDelivery) {
    auto sock = std::make_unique<MockSocket>();
    sock->preload_recv(encoded_segment(3, 0, 1024), server_);
    sock->preload_recv(encoded_segment(3, 2, 452), server_);
    sock->preload_recv(encoded_segment(3, 2, 452), server_);
    sock->preload_recv({0x01, 0x02, 0x03}, server_);

    WorkerResult r = UdpTransferWorker(std::move(sock), server_, 2500, 1, WorkerConfig{}).run();
    EXPECT_TRUE(r.ok);
    EXPECT_EQ(r.transport, Transport::Udp);
    EXPECT_EQ(r.total_segments, 3u);
    EXPECT_EQ(r.segments_received, 2u);
    EXPECT_NEAR(r.delivery_ratio, 2.0 / 3.0, 1e-9);
    EXPECT_EQ(r.bytes, 1024u + 452u + 452u);
}

TEST_F(UdpWorkerTest, RequestCarriesFileSize) {
    auto sock = std::make_unique<MockSocket>();
    MockSocket* raw = sock.get();
    UdpTransferWorker w(std::move(sock), server_, 123456, 1, WorkerConfig{});
    WorkerResult r = w.run();
    ASSERT_EQ(raw->sent_count(), 1u);
    auto msg = decode(raw->sent()[0].data);
    ASSERT_TRUE(std::holds_alternative<RequestMessage>(msg));
    EXPECT_EQ(std::get<RequestMessage>(msg).file_size, 123456u);
    EXPECT_EQ(to_string(raw->sent()[0].to), "10.0.0.1:2025");
    EXPECT_EQ(r.delivery_ratio, 0.0);
    EXPECT_EQ(r.bits_per_second, 0.0);
}

TEST_F(UdpWorkerTest, RequestSendFailureIsReported) {
    auto sock = std::make_unique<MockSocket>();
    sock->fail_sends_after(0);
    WorkerResult r = UdpTransferWorker(std::move(sock), server_, 10, 4, WorkerConfig{}).run();
    EXPECT_FALSE(r.ok);
    EXPECT_EQ(r.number, 4u);
    EXPECT_EQ(r.bytes, 0u);
    EXPECT_EQ(r.delivery_ratio, 0.0);
}

TEST(TransferPoolTest, ResultsInSubmissionOrderWithoutCrossTalk) {
    const uint64_t size = 4096;
    std::atomic<int> opened_tcp{0};
    std::atomic<int> opened_udp{0};

    TransferPool::TcpConnect tcp = [&](const ServerOffer& o) -> std::unique_ptr<IStream> {
        EXPECT_EQ(o.tcp_port, 2026);
        ++opened_tcp;
        return std::make_unique<MockStream>(std::string(size, 'A'));
    };
    TransferPool::UdpOpen udp = [&]() -> std::unique_ptr<ISocket> {
        ++opened_udp;
        auto s = std::make_unique<MockSocket>();
        sockaddr_in from = make_endpoint("10.0.0.1", 2025);
        for (uint64_t i = 0; i < 4; ++i) s->preload_recv(encoded_segment(4, i, 1024), from);
        return s;
    };

    PoolConfig cfg;
    cfg.file_size = size;
    cfg.tcp_workers = 3;
    cfg.udp_workers = 2;
    TransferPool pool(cfg, tcp, udp);
    ResultAggregator agg = pool.run(ServerOffer{"10.0.0.1", 2025, 2026});

    EXPECT_EQ(opened_tcp.load(), 3);
    EXPECT_EQ(opened_udp.load(), 2);
    const auto& res = agg.results();
    ASSERT_EQ(res.size(), 5u);
    for (size_t i = 0; i < 3; ++i) {
        EXPECT_EQ(res[i].transport, Transport::Tcp);
        EXPECT_EQ(res[i].number, i + 1);
        EXPECT_EQ(res[i].bytes, size);
    }
    for (size_t i = 3; i < 5; ++i) {
        EXPECT_EQ(res[i].transport, Transport::Udp);
        EXPECT_EQ(res[i].number, i - 2);
        EXPECT_EQ(res[i].bytes, size);
        EXPECT_DOUBLE_EQ(res[i].delivery_ratio, 1.0);
    }
}

TEST(TransferPoolTest, FailingWorkerDoesNotAffectSiblings) {
    std::atomic<int> calls{0};
    TransferPool::TcpConnect tcp = [&](const ServerOffer&) -> std::unique_ptr<IStream> {
        if (calls++ == 0) throw TransportError("boom");
        return std::make_unique<MockStream>(std::string(100, 'A'));
    };
    TransferPool::UdpOpen udp = []() -> std::unique_ptr<ISocket> {
        throw TransportError("no sockets left");
    };
    PoolConfig cfg;
    cfg.file_size = 100;
    cfg.tcp_workers = 2;
    cfg.udp_workers = 1;
    ResultAggregator agg = TransferPool(cfg, tcp, udp).run(ServerOffer{"10.0.0.1", 1, 2});

    const auto& res = agg.results();
    ASSERT_EQ(res.size(), 3u);
    int failed_tcp = 0;
    for (size_t i = 0; i < 2; ++i) {
        if (!res[i].ok) {
            ++failed_tcp;
            EXPECT_EQ(res[i].bytes, 0u);
        } else {
            EXPECT_EQ(res[i].bytes, 100u);
        }
    }
    EXPECT_EQ(failed_tcp, 1);
    EXPECT_FALSE(res[2].ok);
    EXPECT_EQ(res[2].error, "no sockets left");
    EXPECT_EQ(res[2].number, 1u);
}

TEST(TransferPoolTest, WorkerWithoutAThreadFailsAlone) {
    int launches = 0;
    ThreadLauncher flaky = [&launches](std::function<void()> body) -> std::thread {
        if (++launches == 2) {
            throw std::system_error(std::make_error_code(std::errc::resource_unavailable_try_again));
        }
        return std::thread(std::move(body));
    };
    TransferPool::TcpConnect tcp = [](const ServerOffer&) -> std::unique_ptr<IStream> {
        return std::make_unique<MockStream>(std::string(500, 'A'));
    };
    TransferPool::UdpOpen udp = []() -> std::unique_ptr<ISocket> { return std::make_unique<MockSocket>(); };

    PoolConfig cfg;
    cfg.file_size = 500;
    cfg.tcp_workers = 3;
    cfg.udp_workers = 1;
    ResultAggregator agg = TransferPool(cfg, tcp, udp, flaky).run(ServerOffer{"10.0.0.1", 1, 2});

    const auto& res = agg.results();
    ASSERT_EQ(res.size(), 4u);
    EXPECT_TRUE(res[0].ok);
    EXPECT_EQ(res[0].bytes, 500u);
    EXPECT_FALSE(res[1].ok);
    EXPECT_EQ(res[1].transport, Transport::Tcp);
    EXPECT_EQ(res[1].number, 2u);
    EXPECT_EQ(res[1].bytes, 0u);
    EXPECT_NE(res[1].error.find("cannot start worker thread"), std::string::npos);
    EXPECT_TRUE(res[2].ok);
    EXPECT_EQ(res[2].bytes, 500u);
    EXPECT_TRUE(res[3].ok);
    EXPECT_EQ(res[3].transport, Transport::Udp);
}

TEST(TransferPoolTest, NoThreadsAtAllStillReportsEverySlot) {
    ThreadLauncher refuse = [](std::function<void()>) -> std::thread {
        throw std::system_error(std::make_error_code(std::errc::resource_unavailable_try_again));
    };
    PoolConfig cfg;
    cfg.file_size = 10;
    cfg.tcp_workers = 2;
    cfg.udp_workers = 2;
    ResultAggregator agg = TransferPool(cfg, {}, {}, refuse).run(ServerOffer{"10.0.0.1", 1, 2});
    ASSERT_EQ(agg.size(), 4u);
    for (const auto& r : agg.results()) EXPECT_FALSE(r.ok);
    EXPECT_EQ(agg.results()[3].number, 2u);
}
