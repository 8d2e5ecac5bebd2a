#include <gtest/gtest.h>
#include <random>
#include <set>
#include "solvers/TabuPool.h"

TEST(TabuPoolTest, StartsWithEveryCustomerEligible) {
    TabuPool pool(35);
    EXPECT_EQ(pool.bound(), 3);
    EXPECT_EQ(pool.eligible_count(), 34);
    EXPECT_TRUE(pool.tabu().empty());
    EXPECT_FALSE(pool.is_eligible(0));
    EXPECT_TRUE(pool.is_eligible(34));
    EXPECT_TRUE(pool.is_consistent());
}

TEST(TabuPoolTest, TakeRandomDrawsDistinctEligibleCustomers) {
    TabuPool pool(30);
    std::mt19937 gen(2);
    std::set<int> taken;
    for (int k = 0; k < 29; ++k) {
        int c = pool.take_random(gen);
        EXPECT_GE(c, 1);
        EXPECT_LT(c, 30);
        EXPECT_TRUE(taken.insert(c).second);
        EXPECT_FALSE(pool.is_eligible(c));
    }
    EXPECT_EQ(pool.eligible_count(), 0);
    EXPECT_THROW(pool.take_random(gen), std::logic_error);
}

TEST(TabuPoolTest, QueueReleasesOldestBeyondBound) {
    TabuPool pool(30);
    for (int c = 1; c <= 5; ++c) ASSERT_TRUE(pool.take(c));
    pool.push_tabu({1, 2, 3, 4, 5});
    ASSERT_EQ(pool.tabu().size(), 3u);
    EXPECT_EQ(pool.tabu().front(), 3);
    EXPECT_EQ(pool.tabu().back(), 5);
    EXPECT_TRUE(pool.is_eligible(1));
    EXPECT_TRUE(pool.is_eligible(2));
    EXPECT_FALSE(pool.is_eligible(4));
    EXPECT_EQ(pool.eligible_count(), 26);
    EXPECT_TRUE(pool.is_consistent());

    EXPECT_FALSE(pool.take(4));
    EXPECT_FALSE(pool.take(0));
    EXPECT_FALSE(pool.take(30));
}

TEST(TabuPoolTest, SmallInstancesHaveNoTabuMemory) {
    TabuPool pool(5);
    EXPECT_EQ(pool.bound(), 0);
    ASSERT_TRUE(pool.take(2));
    pool.push_tabu({2});
    EXPECT_TRUE(pool.tabu().empty());
    EXPECT_TRUE(pool.is_eligible(2));
}

TEST(TabuPoolTest, ResetMakesEverythingEligible) {
    TabuPool pool(40);
    std::mt19937 gen(8);
    std::vector<int> taken;
    for (int k = 0; k < 4; ++k) taken.push_back(pool.take_random(gen));
    pool.push_tabu(taken);
    EXPECT_EQ(pool.eligible_count(), 35);
    pool.reset();
    EXPECT_EQ(pool.eligible_count(), 39);
    EXPECT_TRUE(pool.tabu().empty());
    EXPECT_TRUE(pool.is_consistent());
}
