// tests/transport_test.cpp
// Serialized writes and shutdown behavior of the client transport.

#include <gtest/gtest.h>
#include "fake_transport.hpp"
#include "transport.hpp"

#include <thread>
#include <vector>

using namespace kratos;
using kratos::testing::FakeConnection;
using kratos::testing::FakeLink;

namespace {

struct TransportFixture : public ::testing::Test {
    std::shared_ptr<FakeLink> link = std::make_shared<FakeLink>();
    Transport transport{std::make_unique<FakeConnection>(link)};
};

} // namespace

TEST_F(TransportFixture, SendFrameWritesBinary) {
    transport.send_frame({1, 2, 3});
    ASSERT_EQ(link->written_count(), 1u);
    EXPECT_EQ(link->written_at(0), (std::vector<uint8_t>{1, 2, 3}));
}

TEST_F(TransportFixture, SendPing) {
    transport.send_ping();
    EXPECT_EQ(link->pings.load(), 1);
}

TEST_F(TransportFixture, ReceiveReturnsQueuedFrame) {
    link->push({9, 8, 7});
    EXPECT_EQ(transport.receive(), (std::vector<uint8_t>{9, 8, 7}));
}

TEST_F(TransportFixture, CloseUnblocksReceive) {
    std::thread reader([this] { EXPECT_THROW(transport.receive(), KratosError); });
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    transport.close_connection();
    reader.join();
    EXPECT_TRUE(transport.closed());
}

TEST_F(TransportFixture, SendAfterCloseIsClosedError) {
    transport.close_connection();
    try {
        transport.send_frame({1});
        FAIL() << "expected throw";
    } catch (const KratosError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::Closed);
    }
    EXPECT_EQ(link->written_count(), 0u);
}

TEST_F(TransportFixture, WriteFailureShutsDown) {
    {
        std::lock_guard<std::mutex> lock(link->mutex);
        link->fail_writes = true;
    }
    try {
        transport.send_frame({1});
        FAIL() << "expected throw";
    } catch (const KratosError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::Write);
    }
    EXPECT_TRUE(transport.closed());
    EXPECT_TRUE(link->is_shut_down());
    EXPECT_THROW(transport.send_frame({1}), KratosError);
}

TEST_F(TransportFixture, SendCloseIsBestEffort) {
    EXPECT_TRUE(transport.send_close());
    EXPECT_EQ(link->closes.load(), 1);
    transport.close_connection();
    EXPECT_FALSE(transport.send_close());
    EXPECT_EQ(link->closes.load(), 1);
}

TEST_F(TransportFixture, CloseConnectionIsIdempotent) {
    transport.close_connection();
    transport.close_connection();
    EXPECT_EQ(link->shutdowns.load(), 1);
}

TEST_F(TransportFixture, ConcurrentWritersAllLand) {
    std::vector<std::thread> writers;
    for (int t = 0; t < 4; t++) {
        writers.emplace_back([this, t] {
            for (int i = 0; i < 50; i++) {
                transport.send_frame({static_cast<uint8_t>(t), static_cast<uint8_t>(i)});
            }
        });
    }
    for (auto& w : writers) w.join();
    EXPECT_EQ(link->written_count(), 200u);
}
