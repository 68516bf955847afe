/**
 * @file test_connection_cleanup.cpp
 * @brief Resource release tests: registry entries, callbacks and close signals
 */

#include <gtest/gtest.h>
#include "../test_infrastructure/test_utilities.h"
#include <tunstack/connection.h>
#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

using namespace tunstack::core;
using namespace tunstack::test;
using tunstack::core::stack::PcbHandle;
using tunstack::core::stack::StackErr;
using tunstack::core::stack::StackGuard;
using tunstack::core::stack::StackLock;

class ConnectionCleanupTest : public ::testing::Test {
protected:
    void SetUp() override {
        env_.SetUp();
    }

    void TearDown() override {
        EXPECT_EQ(env_.stack->lock_violations(), 0u);
        EXPECT_EQ(env_.stack->use_after_free(), 0u);
        EXPECT_EQ(env_.stack->missed_abort_returns(), 0u);
        env_.TearDown();
    }

    FlowTestEnvironment env_;
};

TEST_F(ConnectionCleanupTest, GracefulReleaseDetachesEverything) {
    PcbHandle pcb = nullptr;
    auto conn = env_.accept(&pcb);
    ASSERT_NE(conn, nullptr);
    ConnKey key = conn->key();

    ASSERT_TRUE(conn->close());
    EXPECT_EQ(env_.stack->poll(pcb), StackErr::OK);

    EXPECT_EQ(ConnectionRegistry::instance().find(key), nullptr);
    EXPECT_FALSE(env_.stack->has_callbacks(pcb));
    EXPECT_TRUE(conn->closed().is_triggered());

    // Callbacks already queued against the old argument find nothing
    EXPECT_EQ(env_.stack->poll(pcb), StackErr::OK);
    EXPECT_EQ(env_.stack->record(pcb).abort_calls, 0u);
}

TEST_F(ConnectionCleanupTest, ForcedReleaseDetachesBeforeAbort) {
    PcbHandle pcb = nullptr;
    auto conn = env_.accept(&pcb);
    ASSERT_NE(conn, nullptr);

    conn->abort();
    EXPECT_EQ(env_.stack->poll(pcb), StackErr::ABRT);

    // The engine's abort would have fired the err callback had it still been set
    EXPECT_EQ(env_.handler->close_calls(), 0u);
    EXPECT_EQ(env_.stack->record(pcb).abort_calls, 1u);
    EXPECT_EQ(ConnectionRegistry::instance().size(), 0u);
    EXPECT_TRUE(conn->closed().is_triggered());
}

TEST_F(ConnectionCleanupTest, CloseSignalWakesWaiters) {
    PcbHandle pcb = nullptr;
    auto conn = env_.accept(&pcb);
    ASSERT_NE(conn, nullptr);

    std::atomic<bool> woke{false};
    std::thread waiter([&] {
        conn->closed().wait();
        woke = true;
    });

    EXPECT_FALSE(conn->closed().wait_for(std::chrono::milliseconds(20)));
    EXPECT_FALSE(woke.load());

    env_.stack->fail(pcb, StackErr::RST);
    waiter.join();
    EXPECT_TRUE(woke.load());
    EXPECT_TRUE(conn->closed().wait_for(std::chrono::milliseconds(0)));
}

TEST_F(ConnectionCleanupTest, CloseSignalFiresOnce) {
    CloseSignal signal;
    EXPECT_FALSE(signal.is_triggered());
    EXPECT_TRUE(signal.trigger());
    EXPECT_FALSE(signal.trigger());
    EXPECT_TRUE(signal.is_triggered());
}

// Abort from a handler thread racing an engine error releases exactly once
TEST_F(ConnectionCleanupTest, RacingAbortAndEngineErrorReleaseOnce) {
    constexpr int kRounds = 100;
    for (int i = 0; i < kRounds; ++i) {
        PcbHandle pcb = nullptr;
        auto conn = env_.accept(&pcb, static_cast<uint16_t>(10000 + i));
        ASSERT_NE(conn, nullptr);

        std::thread aborter([&] { conn->abort(); });
        env_.stack->fail(pcb, StackErr::RST);
        aborter.join();

        EXPECT_EQ(conn->get_state(), ConnectionState::ABORTED);
        EXPECT_EQ(env_.stack->record(pcb).abort_calls, 0u);
        EXPECT_TRUE(conn->closed().is_triggered());
    }

    EXPECT_EQ(env_.handler->close_calls(), static_cast<uint32_t>(kRounds));
    EXPECT_EQ(ConnectionRegistry::instance().size(), 0u);
}

TEST_F(ConnectionCleanupTest, AbortAllAtShutdown) {
    std::vector<PcbHandle> pcbs;
    std::vector<std::shared_ptr<TcpConnection>> conns;
    for (uint16_t port = 6000; port < 6003; ++port) {
        PcbHandle pcb = nullptr;
        auto conn = env_.accept(&pcb, port);
        ASSERT_NE(conn, nullptr);
        pcbs.push_back(pcb);
        conns.push_back(conn);
    }

    EXPECT_EQ(ConnectionRegistry::instance().abort_all(), 3u);
    for (const auto& conn : conns) {
        EXPECT_EQ(conn->get_state(), ConnectionState::ABORTING);
    }

    for (auto pcb : pcbs) {
        EXPECT_EQ(env_.stack->poll(pcb), StackErr::ABRT);
        EXPECT_EQ(env_.stack->record(pcb).abort_calls, 1u);
    }
    EXPECT_EQ(ConnectionRegistry::instance().size(), 0u);
    EXPECT_EQ(ConnectionRegistry::instance().abort_all(), 0u);
}

TEST_F(ConnectionCleanupTest, HandlerCanOutliveRelease) {
    PcbHandle pcb = nullptr;
    auto conn = env_.accept(&pcb);
    ASSERT_NE(conn, nullptr);
    conn.reset();

    auto held = env_.handler->last_connection();
    ASSERT_NE(held, nullptr);

    env_.stack->fail(pcb, StackErr::RST);
    EXPECT_EQ(ConnectionRegistry::instance().size(), 0u);

    // Every operation on the released flow stays away from the freed handle
    EXPECT_FALSE(held->write(make_payload(8)));
    EXPECT_TRUE(held->close());
    held->abort();
    EXPECT_TRUE(held->closed().is_triggered());
}

TEST_F(ConnectionCleanupTest, DidCloseMayCallBack) {
    PcbHandle pcb = nullptr;
    auto conn = env_.accept(&pcb);
    ASSERT_NE(conn, nullptr);

    std::atomic<bool> write_failed{false};
    env_.handler->on_did_close([&](const std::shared_ptr<Connection>& c) {
        write_failed = !c->write(make_payload(4));
        c->abort();
    });

    env_.stack->fail(pcb, StackErr::ABRT);
    EXPECT_TRUE(write_failed.load());
    EXPECT_EQ(env_.handler->close_calls(), 1u);
}

TEST_F(ConnectionCleanupTest, ResetDuringConnectIsNotAbortedTwice) {
    env_.handler->on_connect([this](const std::shared_ptr<Connection>& c) {
        auto tcp = std::static_pointer_cast<TcpConnection>(c);
        env_.stack->fail(tcp->native_handle(), StackErr::RST);
    });
    env_.handler->set_connect_result(make_error<void>(TunError::HANDLER_CONNECT_FAILED, "dial failed"));

    PcbHandle pcb = nullptr;
    auto err = env_.stack->open_flow(ipv4(10, 0, 0, 2, 5000), ipv4(1, 1, 1, 1, 443), &pcb);
    EXPECT_EQ(err, StackErr::ABRT);
    EXPECT_EQ(env_.stack->record(pcb).abort_calls, 0u);
    EXPECT_EQ(env_.handler->close_calls(), 1u);
    EXPECT_EQ(ConnectionRegistry::instance().size(), 0u);
}

TEST_F(ConnectionCleanupTest, ResetDuringAcceptedConnectReturnsAbort) {
    std::shared_ptr<Connection> connected;
    env_.handler->on_connect([&](const std::shared_ptr<Connection>& c) {
        connected = c;
        auto tcp = std::static_pointer_cast<TcpConnection>(c);
        env_.stack->fail(tcp->native_handle(), StackErr::RST);
    });

    PcbHandle pcb = nullptr;
    auto err = env_.stack->open_flow(ipv4(10, 0, 0, 2, 5000), ipv4(1, 1, 1, 1, 443), &pcb);
    EXPECT_EQ(err, StackErr::ABRT);
    EXPECT_EQ(env_.stack->record(pcb).abort_calls, 0u);
    EXPECT_EQ(env_.handler->close_calls(), 1u);
    EXPECT_EQ(ConnectionRegistry::instance().size(), 0u);

    ASSERT_NE(connected, nullptr);
    EXPECT_EQ(std::static_pointer_cast<TcpConnection>(connected)->get_state(),
              ConnectionState::ABORTED);
    EXPECT_TRUE(connected->closed().is_triggered());
}

TEST_F(ConnectionCleanupTest, CreateReportsResetDuringAcceptedConnect) {
    PcbHandle pcb = env_.stack->add_pcb(ipv4(10, 0, 0, 2, 5000), ipv4(1, 1, 1, 1, 443));
    env_.handler->on_connect([&](const std::shared_ptr<Connection>&) {
        env_.stack->fail(pcb, StackErr::RST);
    });

    Result<std::shared_ptr<TcpConnection>> created(TunError::INTERNAL_ERROR);
    {
        StackGuard guard(StackLock::instance());
        created = TcpConnection::create(*env_.stack, pcb, env_.handler, ConnectionConfig{});
    }
    ASSERT_FALSE(created);
    EXPECT_EQ(created.error(), TunError::CONNECTION_RESET);
    EXPECT_EQ(env_.handler->connect_calls(), 1u);
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
