/**
 * @file OrderLockRegistryTest.cpp
 * @brief Unit tests for OrderLockRegistry
 */

#include <gtest/gtest.h>
#include "application/OrderLockRegistry.hpp"
#include <atomic>
#include <string>
#include <thread>
#include <vector>

using namespace ordering::application;

class OrderLockRegistryTest : public ::testing::Test {
protected:
    OrderLockRegistry registry_;
};

// ============================================================================
// LIFETIME
// ============================================================================

TEST_F(OrderLockRegistryTest, ReleasedKeys_AreRemoved) {
    for (int i = 0; i < 100000; ++i) {
        auto guard = registry_.acquire("ord-" + std::to_string(i));
    }

    EXPECT_EQ(registry_.size(), 0u);
}

TEST_F(OrderLockRegistryTest, HeldKey_StaysUntilReleased) {
    {
        auto guard = registry_.acquire("ord-1");
        EXPECT_EQ(registry_.size(), 1u);
    }
    EXPECT_EQ(registry_.size(), 0u);
}

// ============================================================================
// MUTUAL EXCLUSION
// ============================================================================

TEST_F(OrderLockRegistryTest, SameKey_NeverHeldByTwoThreads) {
    const int NUM_THREADS = 8;
    const int ITERATIONS = 2000;
    std::atomic<int> inside(0);
    std::atomic<int> maxInside(0);

    std::vector<std::thread> threads;
    for (int t = 0; t < NUM_THREADS; ++t) {
        threads.emplace_back([&]() {
            for (int i = 0; i < ITERATIONS; ++i) {
                auto guard = registry_.acquire("ord-1");
                int now = ++inside;
                int seen = maxInside.load();
                while (now > seen && !maxInside.compare_exchange_weak(seen, now)) {
                }
                --inside;
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(maxInside.load(), 1);
    EXPECT_EQ(registry_.size(), 0u);
}

TEST_F(OrderLockRegistryTest, DifferentKeys_DoNotBlockEachOther) {
    auto first = registry_.acquire("ord-1");
    std::atomic<bool> acquired(false);

    std::thread other([&]() {
        auto second = registry_.acquire("ord-2");
        acquired = true;
    });
    other.join();

    EXPECT_TRUE(acquired.load());
    EXPECT_EQ(registry_.size(), 1u);
}
