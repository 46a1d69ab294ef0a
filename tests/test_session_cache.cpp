#include <gtest/gtest.h>
#include <managers/session_cache.hpp>
#include "mock_transport.hpp"
#include <thread>
#include <vector>

class SessionCacheTest : public ::testing::Test {
protected:
    MockTransportFactory factory;
    std::vector<std::string> messages;
    std::unique_ptr<SessionCache> cache;

    void SetUp() override {
        cache = std::make_unique<SessionCache>(factory, "/home/robot", 3000,
            [this](const std::string& msg) { messages.push_back(msg); });
    }
};

TEST_F(SessionCacheTest, SecondAcquireReusesLiveHandle) {
    auto first = cache->acquire("192.168.133.101");
    ASSERT_TRUE(first.is_ok()) << first.error;
    auto second = cache->acquire("192.168.133.101");
    ASSERT_TRUE(second.is_ok()) << second.error;

    EXPECT_EQ(first.value.get(), second.value.get());
    EXPECT_EQ(factory.stats.handshakes.load(), 1);
    EXPECT_EQ(factory.stats.probes.load(), 1);
    EXPECT_EQ(messages.back(), "Re-using existing connection to 192.168.133.101");
}

TEST_F(SessionCacheTest, NewHandleStartsInRemoteHome) {
    auto h = cache->acquire("ev3dev");
    ASSERT_TRUE(h.is_ok());
    ASSERT_NE(h.value->file_channel(), nullptr);
    EXPECT_EQ(factory.last()->channel().cwd, "/home/robot");
}

TEST_F(SessionCacheTest, DeadHandleIsReplacedWithOneHandshake) {
    auto first = cache->acquire("192.168.133.101");
    ASSERT_TRUE(first.is_ok());
    auto old = factory.last();
    old->alive = false;

    auto second = cache->acquire("192.168.133.101");
    ASSERT_TRUE(second.is_ok()) << second.error;

    EXPECT_NE(first.value.get(), second.value.get());
    EXPECT_EQ(factory.stats.handshakes.load(), 2);
    EXPECT_FALSE(old->is_open());
    EXPECT_EQ(cache->size(), 1u);
}

TEST_F(SessionCacheTest, ClosedHandleIsReplacedWithoutProbing) {
    auto first = cache->acquire("192.168.133.101");
    ASSERT_TRUE(first.is_ok());
    first.value->close();

    auto second = cache->acquire("192.168.133.101");
    ASSERT_TRUE(second.is_ok());
    EXPECT_EQ(factory.stats.probes.load(), 0);
    EXPECT_EQ(factory.stats.handshakes.load(), 2);
}

TEST_F(SessionCacheTest, ConcurrentAcquireHandshakesOnce) {
    constexpr int N = 8;
    std::vector<std::thread> threads;
    std::vector<TransportHandle*> got(N, nullptr);

    for (int i = 0; i < N; i++) {
        threads.emplace_back([&, i]() {
            auto r = cache->acquire("192.168.133.101");
            if (r.is_ok()) got[i] = r.value.get();
        });
    }
    for (auto& t : threads) t.join();

    EXPECT_EQ(factory.stats.handshakes.load(), 1);
    for (int i = 0; i < N; i++) {
        ASSERT_NE(got[i], nullptr);
        EXPECT_EQ(got[i], got[0]);
    }
}

TEST_F(SessionCacheTest, FailedConnectIsNotCached) {
    factory.fail_connect = true;
    auto r = cache->acquire("192.168.133.101");
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::Connection);
    EXPECT_FALSE(cache->contains("192.168.133.101"));
    EXPECT_EQ(cache->size(), 0u);

    factory.fail_connect = false;
    auto retry = cache->acquire("192.168.133.101");
    ASSERT_TRUE(retry.is_ok());
    EXPECT_EQ(factory.stats.handshakes.load(), 1);
}

TEST_F(SessionCacheTest, ChannelFailureClosesHalfBuiltHandle) {
    factory.fail_channel = true;
    auto r = cache->acquire("192.168.133.101");
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::Connection);
    EXPECT_EQ(factory.stats.handle_closes.load(), 1);
    EXPECT_FALSE(cache->contains("192.168.133.101"));
}

TEST_F(SessionCacheTest, AuthFailureAfterStaleProbeIsReturned) {
    ASSERT_TRUE(cache->acquire("192.168.133.101").is_ok());
    factory.last()->alive = false;
    factory.fail_connect = true;

    auto r = cache->acquire("192.168.133.101");
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::Connection);
    EXPECT_EQ(factory.stats.handshakes.load(), 1);
    EXPECT_FALSE(cache->contains("192.168.133.101"));
}

TEST_F(SessionCacheTest, ProbeReportsWhyHandleIsDead) {
    auto h = cache->acquire("192.168.133.101");
    ASSERT_TRUE(h.is_ok());
    EXPECT_TRUE(cache->probe(*h.value).alive());

    factory.last()->alive = false;
    auto dead = cache->probe(*h.value);
    EXPECT_FALSE(dead.alive());
    EXPECT_EQ(dead.reason, "connection reset");
}

TEST_F(SessionCacheTest, EvictClosesAndForgets) {
    ASSERT_TRUE(cache->acquire("a").is_ok());
    ASSERT_TRUE(cache->acquire("b").is_ok());
    EXPECT_EQ(cache->size(), 2u);

    cache->evict("a");
    EXPECT_FALSE(cache->contains("a"));
    EXPECT_TRUE(cache->contains("b"));
    EXPECT_EQ(factory.stats.handle_closes.load(), 1);

    cache->evict("never-seen");
    cache->clear();
    EXPECT_EQ(cache->size(), 0u);
    EXPECT_EQ(factory.stats.handle_closes.load(), 2);
}

TEST_F(SessionCacheTest, EvictedAddressesLeaveNoBookkeeping) {
    for (int i = 0; i < 20; i++) {
        std::string address = "10.0.0." + std::to_string(i);
        ASSERT_TRUE(cache->acquire(address).is_ok());
        cache->evict(address);
    }
    EXPECT_EQ(cache->slot_count(), 0u);

    ASSERT_TRUE(cache->acquire("a").is_ok());
    EXPECT_EQ(cache->slot_count(), 1u);
    cache->clear();
    EXPECT_EQ(cache->slot_count(), 0u);

    factory.fail_connect = true;
    ASSERT_TRUE(cache->acquire("b").is_err());
    EXPECT_EQ(cache->slot_count(), 0u);
}

TEST_F(SessionCacheTest, ProbeIsBoundedByProbeTimeout) {
    SessionCache quick(factory, "/home/robot", 250);
    ASSERT_TRUE(quick.acquire("192.168.133.101").is_ok());
    ASSERT_TRUE(quick.acquire("192.168.133.101").is_ok());
    EXPECT_EQ(factory.stats.probes.load(), 1);
    EXPECT_EQ(factory.last()->last_timeout_ms, 250);
}
