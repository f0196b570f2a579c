#include <gtest/gtest.h>

#include <QHostAddress>
#include <QTcpServer>
#include <atomic>
#include <thread>
#include <vector>

#include "mcphub/supervisor/port_pool.h"

using namespace mcphub;

TEST(PortPool, ClaimIsTestAndSet) {
    PortPool pool(3000, 3010);
    EXPECT_TRUE(pool.claim(3005));
    EXPECT_FALSE(pool.claim(3005));
    EXPECT_TRUE(pool.isClaimed(3005));
    EXPECT_EQ(pool.claimedCount(), 1);
}

TEST(PortPool, ClaimOutOfRange) {
    PortPool pool(3000, 3010);
    EXPECT_FALSE(pool.claim(2999));
    EXPECT_FALSE(pool.claim(3011));
    EXPECT_EQ(pool.claimedCount(), 0);
}

TEST(PortPool, ReleaseAllowsReclaim) {
    PortPool pool(3000, 3010);
    ASSERT_TRUE(pool.claim(3001));
    EXPECT_TRUE(pool.release(3001));
    EXPECT_FALSE(pool.release(3001));
    EXPECT_TRUE(pool.claim(3001));
}

TEST(PortPool, ClaimAnySkipsClaimedPorts) {
    PortPool pool(4000, 4002);
    pool.setAvailabilityProbe({});
    ASSERT_TRUE(pool.claim(4000));
    EXPECT_EQ(pool.claimAny(), 4001);
    EXPECT_EQ(pool.claimAny(), 4002);
    EXPECT_EQ(pool.claimAny(), -1);
}

TEST(PortPool, ClaimAnyConsultsProbe) {
    PortPool pool(5000, 5003);
    pool.setAvailabilityProbe([](int port) { return port == 5002; });
    EXPECT_EQ(pool.claimAny(), 5002);
    EXPECT_EQ(pool.claimAny(), -1);
}

TEST(PortPool, DefaultProbeSkipsBoundPort) {
    QTcpServer blocker;
    ASSERT_TRUE(blocker.listen(QHostAddress::LocalHost, 0));
    const int busy = blocker.serverPort();

    EXPECT_FALSE(PortPool::isPortBindable(busy));

    PortPool pool(busy, busy);
    EXPECT_EQ(pool.claimAny(), -1);
}

TEST(PortPool, ConcurrentClaimsNeverCollide) {
    PortPool pool(6000, 6099);
    pool.setAvailabilityProbe({});

    std::atomic<int> winners{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&pool, &winners]() {
            for (int port = 6000; port <= 6099; ++port) {
                if (pool.claim(port)) {
                    ++winners;
                }
            }
        });
    }
    for (auto& th : threads) {
        th.join();
    }
    EXPECT_EQ(winners.load(), 100);
    EXPECT_EQ(pool.claimedCount(), 100);
}
