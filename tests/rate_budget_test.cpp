/**
 * @file rate_budget_test.cpp
 * @brief Unit tests for the token-bucket RateBudget
 *
 * All tests drive the bucket with a synthetic clock.
 */

#include <gtest/gtest.h>
#include "wharf/RateBudget.h"

#include <chrono>

using namespace Wharf;
using std::chrono::milliseconds;

class RateBudgetTest : public ::testing::Test {
protected:
    RateBudget::Clock::time_point t0 = RateBudget::Clock::now();
};

TEST_F(RateBudgetTest, DefaultBudgetIsUnlimited) {
    RateBudget budget;
    EXPECT_TRUE(budget.isUnlimited());
    EXPECT_EQ(budget.available(t0), RateBudget::UNLIMITED);
    budget.consume(1 << 30);
    EXPECT_EQ(budget.available(t0), RateBudget::UNLIMITED);
}

TEST_F(RateBudgetTest, ZeroRateIsUnlimited) {
    RateBudget budget(0, 4096, t0);
    EXPECT_TRUE(budget.isUnlimited());
    EXPECT_EQ(budget.available(t0), RateBudget::UNLIMITED);
}

TEST_F(RateBudgetTest, StartsFullAtCapacity) {
    RateBudget budget(1000, 5000, t0);
    EXPECT_EQ(budget.capacity(), 5000u);
    EXPECT_EQ(budget.available(t0), 5000u);
}

TEST_F(RateBudgetTest, CapacityDefaultsToOneSecondOfRate) {
    RateBudget budget(2048, 0, t0);
    EXPECT_EQ(budget.capacity(), 2048u);
    EXPECT_EQ(budget.available(t0), 2048u);
}

TEST_F(RateBudgetTest, RefillsProportionallyToElapsedTime) {
    RateBudget budget(1000, 1000, t0);
    budget.consume(1000);
    EXPECT_EQ(budget.available(t0), 0u);

    EXPECT_EQ(budget.available(t0 + milliseconds(250)), 250u);
    EXPECT_EQ(budget.available(t0 + milliseconds(500)), 500u);
}

TEST_F(RateBudgetTest, RefillNeverExceedsCapacity) {
    RateBudget budget(1000, 1500, t0);
    budget.consume(100);
    EXPECT_EQ(budget.available(t0 + milliseconds(10000)), 1500u);
}

TEST_F(RateBudgetTest, ConsumeNeverGoesNegative) {
    RateBudget budget(1000, 1000, t0);
    budget.consume(5000);
    EXPECT_EQ(budget.available(t0), 0u);
    EXPECT_EQ(budget.available(t0 + milliseconds(100)), 100u);
}

TEST_F(RateBudgetTest, EarlierClockReadingAddsNothing) {
    RateBudget budget(1000, 1000, t0 + milliseconds(100));
    budget.consume(1000);
    EXPECT_EQ(budget.available(t0), 0u);
}

TEST_F(RateBudgetTest, ClampUsesStricterBudget) {
    RateBudget perConnection(1000, 800, t0);
    RateBudget global(1000, 300, t0);

    EXPECT_EQ(RateBudget::clamp(10000, &perConnection, &global, t0), 300u);
    EXPECT_EQ(RateBudget::clamp(100, &perConnection, &global, t0), 100u);
    EXPECT_EQ(RateBudget::clamp(10000, &perConnection, nullptr, t0), 800u);
    EXPECT_EQ(RateBudget::clamp(10000, nullptr, nullptr, t0), 10000u);
}

TEST_F(RateBudgetTest, ConsumeAllChargesEveryBudget) {
    RateBudget a(1000, 1000, t0);
    RateBudget b(1000, 1000, t0);

    RateBudget::consumeAll(400, &a, &b);
    EXPECT_EQ(a.available(t0), 600u);
    EXPECT_EQ(b.available(t0), 600u);

    RateBudget::consumeAll(100, &a, nullptr);
    EXPECT_EQ(a.available(t0), 500u);
    EXPECT_EQ(b.available(t0), 600u);
}

TEST_F(RateBudgetTest, ThroughputOverWindowIsBounded) {
    // Over W seconds at most capacity + rate * W bytes may pass.
    const uint64_t rate = 10000;
    const uint64_t capacity = 2000;
    RateBudget budget(rate, capacity, t0);

    uint64_t moved = 0;
    for (int ms = 0; ms <= 3000; ms += 7) {
        const auto now = t0 + milliseconds(ms);
        const uint64_t chunk = RateBudget::clamp(1500, &budget, nullptr, now);
        budget.consume(chunk);
        moved += chunk;
    }

    EXPECT_LE(moved, capacity + rate * 3);
    EXPECT_GE(moved, rate * 3 - 1500);
}
