#include <gtest/gtest.h>
#include <algorithm>
#include <cmath>
#include <limits>
#include <random>
#include <set>
#include "construct.h"
#include "solvers/Operators.h"
#include "solvers/TabuPool.h"
#include "test_helpers.h"

using test_helpers::line_instance;
using test_helpers::ring_instance;
using test_helpers::two_customer_instance;

TEST(OperatorsTest, RandomRemovalThenBestInsertionRestoresTrivialSolution) {
    VRPInstance inst = two_customer_instance();
    Solution sol = construct::greedy(inst);
    const double before = sol.cost();
    TabuPool pool(inst.num_customers);
    std::mt19937 gen(12);

    RemovedStops removed = operators::remove_random(sol, pool, 2, gen);
    ASSERT_EQ(removed.size(), 2u);
    EXPECT_TRUE(sol.routes[0].empty());
    EXPECT_EQ(sol.cost(), 0.0);

    std::vector<int> routes_used;
    ASSERT_TRUE(operators::reinsert_best(sol, removed, 0.0, gen, &routes_used));
    EXPECT_EQ(routes_used, (std::vector<int>{0, 0}));
    EXPECT_TRUE(sol.is_valid_solution());
    EXPECT_NEAR(sol.cost(), before, 1e-9);
}

TEST(OperatorsTest, RandomRemovalOnlyTakesEligibleCustomers) {
    VRPInstance inst = ring_instance();
    Solution sol = construct::greedy(inst);
    TabuPool pool(inst.num_customers);
    for (int c : {4, 9, 17}) ASSERT_TRUE(pool.take(c));
    pool.push_tabu({4, 9, 17});
    std::mt19937 gen(3);

    RemovedStops removed = operators::remove_random(sol, pool, 100, gen);
    EXPECT_EQ((int)removed.size(), inst.num_customers - 1 - 3);
    for (const auto& entry : removed) {
        EXPECT_NE(entry.first.cust_no, 4);
        EXPECT_NE(entry.first.cust_no, 9);
        EXPECT_NE(entry.first.cust_no, 17);
    }
    EXPECT_EQ(pool.eligible_count(), 0);
}

TEST(OperatorsTest, RemovedStopsRememberTheirRoute) {
    VRPInstance inst = ring_instance();
    Solution before = construct::greedy(inst);
    Solution sol = before;
    TabuPool pool(inst.num_customers);
    std::mt19937 gen(21);
    RemovedStops removed = operators::remove_random(sol, pool, 5, gen);
    for (const auto& entry : removed) {
        EXPECT_EQ(before.route_index_of(entry.first.cust_no), entry.second);
        EXPECT_EQ(sol.route_index_of(entry.first.cust_no), -1);
        EXPECT_EQ(entry.first.demand, inst.demand_of_customer[entry.first.cust_no]);
    }
}

TEST(OperatorsTest, ShawRemovesSeedAndItsNearestEligibleNeighbours) {
    VRPInstance inst = ring_instance();
    Solution sol = construct::greedy(inst);
    TabuPool pool(inst.num_customers);
    std::set<int> tabu{2, 3, 5};
    for (int c : tabu) ASSERT_TRUE(pool.take(c));
    pool.push_tabu({2, 3, 5});
    const std::vector<int> eligible_before = pool.eligible();
    std::mt19937 gen(17);

    RemovedStops removed = operators::remove_shaw(sol, pool, inst, 5, 1.0, 0.0, gen);
    ASSERT_EQ(removed.size(), 5u);
    std::set<int> removed_set;
    for (const auto& entry : removed) {
        EXPECT_EQ(tabu.count(entry.first.cust_no), 0u);
        removed_set.insert(entry.first.cust_no);
    }
    EXPECT_EQ(removed_set.size(), 5u);

    const int seed = removed.front().first.cust_no;
    double farthest_removed = 0.0;
    for (const auto& entry : removed) farthest_removed = std::max(farthest_removed, inst.dist(seed, entry.first.cust_no));
    for (int c : eligible_before) {
        if (removed_set.count(c)) continue;
        EXPECT_GE(inst.dist(seed, c), farthest_removed);
    }
    EXPECT_EQ(pool.eligible_count(), (int)eligible_before.size() - 5);
}

TEST(OperatorsTest, ShawClampsToEligiblePool) {
    VRPInstance inst = two_customer_instance();
    Solution sol = construct::greedy(inst);
    TabuPool pool(inst.num_customers);
    std::mt19937 gen(1);
    RemovedStops removed = operators::remove_shaw(sol, pool, inst, 5, 0.5, 0.5, gen);
    EXPECT_EQ(removed.size(), 2u);
    EXPECT_TRUE(operators::remove_shaw(sol, pool, inst, 5, 0.5, 0.5, gen).empty());
}

TEST(OperatorsTest, RegretIsGapBetweenCheapestAndKthCheapest) {
    VRPInstance inst(2, 10, {0, 1, 1}, {0, 10, 20}, {0, 0, 0});
    Solution sol(inst);
    sol.routes[0].add_stop_to_index(Stop(1, 1), 0);
    const Stop stop(2, 1);
    // Both slots of route 0 add 20, the empty route adds 40.
    EXPECT_NEAR(operators::regret_k(sol, stop, 2), 0.0, 1e-9);
    EXPECT_NEAR(operators::regret_k(sol, stop, 3), 20.0, 1e-9);
    EXPECT_EQ(operators::regret_k(sol, stop, 4), std::numeric_limits<double>::infinity());
}

TEST(OperatorsTest, RegretIgnoresInfeasibleSlots) {
    VRPInstance inst(2, 1, {0, 1, 1}, {0, 10, 20}, {0, 0, 0});
    Solution sol(inst);
    sol.routes[0].add_stop_to_index(Stop(1, 1), 0);
    EXPECT_EQ(operators::regret_k(sol, Stop(2, 1), 2), std::numeric_limits<double>::infinity());
}

TEST(OperatorsTest, RegretRepairPlacesEveryRemovedStop) {
    VRPInstance inst = ring_instance();
    Solution sol = construct::greedy(inst);
    TabuPool pool(inst.num_customers);
    std::mt19937 gen(5);
    for (int round = 0; round < 20; ++round) {
        RemovedStops removed = operators::remove_random(sol, pool, 5, gen);
        std::vector<int> routes_used;
        ASSERT_TRUE(operators::reinsert_regret(sol, removed, 2, 0.02, gen, &routes_used));
        EXPECT_EQ(routes_used.size(), removed.size());
        std::vector<int> cust_nos;
        for (const auto& entry : removed) cust_nos.push_back(entry.first.cust_no);
        pool.push_tabu(cust_nos);
        std::string reason;
        ASSERT_TRUE(sol.is_valid_solution(&reason)) << reason;
    }
}

TEST(OperatorsTest, RegretRepairPlacesHighestRegretFirst) {
    // Route 1 has room for demand 1 only; customer 3 fits nowhere but the empty route.
    VRPInstance inst(2, 5, {0, 4, 1, 5}, {0, -10, -5, 10}, {0, 0, 0, 0});
    Solution sol(inst);
    sol.routes[1].add_stop_to_index(Stop(1, 4), 0);
    const RemovedStops removed{{Stop(2, 1), 1}, {Stop(3, 5), 0}};
    ASSERT_NEAR(operators::regret_k(sol, removed[0].first, 2), 0.0, 1e-9);
    ASSERT_EQ(operators::regret_k(sol, removed[1].first, 2), std::numeric_limits<double>::infinity());

    std::mt19937 gen(1);
    std::vector<int> routes_used;
    ASSERT_TRUE(operators::reinsert_regret(sol, removed, 2, 0.0, gen, &routes_used));
    EXPECT_EQ(routes_used, (std::vector<int>{0, 1}));
    ASSERT_EQ(sol.routes[0].size(), 1);
    EXPECT_EQ(sol.routes[0].first(), 3);
    EXPECT_EQ(sol.routes[1].size(), 2);
    std::string reason;
    EXPECT_TRUE(sol.is_valid_solution(&reason)) << reason;
}

TEST(OperatorsTest, BestSpotPicksCheapestFeasiblePosition) {
    VRPInstance inst = line_instance(2, 10);
    Solution sol(inst);
    sol.routes[1].add_stop_to_index(Stop(1, 1), 0);
    sol.routes[1].add_stop_to_index(Stop(2, 1), 1);
    std::mt19937 gen(2);
    EXPECT_EQ(operators::reinsert_in_best_spot(sol, Stop(3, 1), 0.0, gen), 1);
    EXPECT_EQ(sol.routes[1].index_of_stop(3), 1);
    EXPECT_DOUBLE_EQ(sol.routes[1].cost(), 40.0);
}

TEST(OperatorsTest, BestSpotReportsNoRoom) {
    VRPInstance inst = line_instance(1, 2);
    Solution sol(inst);
    sol.routes[0].add_stop_to_index(Stop(1, 1), 0);
    sol.routes[0].add_stop_to_index(Stop(2, 1), 1);
    std::mt19937 gen(2);
    EXPECT_EQ(operators::reinsert_in_best_spot(sol, Stop(3, 1), 0.0, gen), -1);
    EXPECT_EQ(operators::reinsert_in_best_spot(sol, Stop(3, 1), 1.0, gen), -1);
    RemovedStops removed{{Stop(3, 1), 0}};
    EXPECT_FALSE(operators::reinsert_best(sol, removed, 0.0, gen));
    EXPECT_FALSE(operators::reinsert_regret(sol, removed, 2, 0.0, gen));
}

TEST(OperatorsTest, ExtractCustomer) {
    VRPInstance inst = two_customer_instance();
    Solution sol = construct::greedy(inst);
    RemovedStops out;
    EXPECT_TRUE(operators::extract_customer(sol, 2, out));
    EXPECT_FALSE(operators::extract_customer(sol, 2, out));
    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0].first.cust_no, 2);
    EXPECT_EQ(out[0].second, 0);
}
