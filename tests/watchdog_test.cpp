// tests/watchdog_test.cpp
// Keepalive probes, miss accounting and shutdown.

#include <gtest/gtest.h>
#include "fake_transport.hpp"
#include "watchdog.hpp"

#include <spdlog/sinks/null_sink.h>

#include <atomic>
#include <stdexcept>

using namespace kratos;
using kratos::testing::FakeConnection;
using kratos::testing::FakeLink;

namespace {

constexpr std::chrono::milliseconds PERIOD{20};

struct WatchdogFixture : public ::testing::Test {
    std::shared_ptr<FakeLink> link = std::make_shared<FakeLink>();
    Transport transport{std::make_unique<FakeConnection>(link)};
    std::shared_ptr<spdlog::logger> log = std::make_shared<spdlog::logger>(
        "watchdog_test", std::make_shared<spdlog::sinks::null_sink_mt>());
    std::atomic<int> miss_calls{0};
    std::atomic<int> dead_calls{0};

    std::unique_ptr<Watchdog> make(ClientConfig::PingMissCallback on_miss = nullptr) {
        if (!on_miss) on_miss = [this] { miss_calls++; };
        auto wd = std::make_unique<Watchdog>(transport, PERIOD, std::move(on_miss), log,
                                             [this] {
                                                 dead_calls++;
                                                 transport.close_connection();
                                             });
        Watchdog* raw = wd.get();
        transport.set_ack_listener([raw] { raw->acknowledge(); });
        return wd;
    }

    void set_auto_pong(bool on) {
        std::lock_guard<std::mutex> lock(link->mutex);
        link->auto_pong = on;
    }
};

} // namespace

TEST_F(WatchdogFixture, AcknowledgedProbesNeverMiss) {
    auto wd = make();
    wd->start();
    ASSERT_TRUE(FakeLink::eventually([&] { return link->pings >= 5; }));
    wd->stop();
    wd->join();
    EXPECT_EQ(wd->missed(), 0u);
    EXPECT_EQ(miss_calls.load(), 0);
}

TEST_F(WatchdogFixture, UnansweredProbesCountOncePerPeriod) {
    set_auto_pong(false);
    auto wd = make();
    wd->start();
    ASSERT_TRUE(FakeLink::eventually([&] { return wd->missed() >= 3; }));
    wd->stop();
    wd->join();

    // Each probe after the first closes one unanswered period.
    EXPECT_EQ(static_cast<int>(wd->missed()), miss_calls.load());
    EXPECT_LE(static_cast<int>(wd->missed()), link->pings.load());
    EXPECT_GE(static_cast<int>(wd->missed()), link->pings.load() - 1);
    EXPECT_EQ(dead_calls.load(), 0);
}

TEST_F(WatchdogFixture, MissIsAdvisory) {
    set_auto_pong(false);
    auto wd = make();
    wd->start();
    ASSERT_TRUE(FakeLink::eventually([&] { return wd->missed() >= 2; }));

    // Still probing, connection untouched.
    EXPECT_TRUE(wd->running());
    EXPECT_FALSE(transport.closed());
    wd->stop();
    wd->join();
}

TEST_F(WatchdogFixture, LateAcknowledgmentStopsMisses) {
    set_auto_pong(false);
    auto wd = make();
    wd->start();
    ASSERT_TRUE(FakeLink::eventually([&] { return wd->missed() >= 1; }));

    set_auto_pong(true);
    link->pong();
    auto settled = wd->missed();
    ASSERT_TRUE(FakeLink::eventually([&] { return link->pings >= 6; }));
    wd->stop();
    wd->join();

    // At most the period in flight when pongs resumed is counted.
    EXPECT_LE(wd->missed(), settled + 1);
}

TEST_F(WatchdogFixture, ThrowingCallbackKeepsMonitoring) {
    set_auto_pong(false);
    auto wd = make([this] {
        miss_calls++;
        throw std::runtime_error("callback failed");
    });
    wd->start();
    ASSERT_TRUE(FakeLink::eventually([&] { return miss_calls >= 3; }));
    wd->stop();
    wd->join();
    EXPECT_EQ(dead_calls.load(), 0);
}

TEST_F(WatchdogFixture, NonStandardThrowKeepsMonitoring) {
    set_auto_pong(false);
    auto wd = make([this] {
        miss_calls++;
        throw 42;
    });
    wd->start();
    ASSERT_TRUE(FakeLink::eventually([&] { return miss_calls >= 3; }));
    EXPECT_TRUE(wd->running());
    wd->stop();
    wd->join();
    EXPECT_EQ(dead_calls.load(), 0);
}

TEST_F(WatchdogFixture, FailedProbeIsFatal) {
    {
        std::lock_guard<std::mutex> lock(link->mutex);
        link->fail_pings = true;
    }
    auto wd = make();
    wd->start();
    ASSERT_TRUE(FakeLink::eventually([&] { return !wd->running(); }));
    wd->join();
    EXPECT_EQ(dead_calls.load(), 1);
    EXPECT_TRUE(transport.closed());
    EXPECT_EQ(wd->missed(), 0u);
}

TEST_F(WatchdogFixture, StopSendsCloseFrame) {
    auto wd = make();
    wd->start();
    EXPECT_TRUE(wd->stop());
    EXPECT_FALSE(wd->stop());
    wd->join();
    EXPECT_FALSE(wd->running());
    EXPECT_EQ(link->closes.load(), 1);
    EXPECT_EQ(dead_calls.load(), 0);
}

TEST_F(WatchdogFixture, StopAfterTransportClosedSkipsClose) {
    auto wd = make();
    wd->start();
    transport.close_connection();
    wd->stop();
    wd->join();
    EXPECT_EQ(link->closes.load(), 0);
}
